#pragma once

#include "engine/TransferBackend.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tmax::engine
{

// Fingerprint-keyed set of the handles the engine is tracking. Keeps
// insertion order so listings and checkpoint requests are deterministic.
class TorrentRegistry
{
  public:
    // Rejects null or invalid handles and fingerprints already present.
    bool insert(TorrentHandlePtr handle);
    TorrentHandlePtr find(std::string const &fingerprint) const;
    // Removes and returns the entry; nullptr if it was not registered.
    TorrentHandlePtr take(std::string const &fingerprint);
    bool contains(std::string const &fingerprint) const;

    std::vector<TorrentHandlePtr> handles() const;
    std::size_t size() const;
    bool empty() const;
    void clear();

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, TorrentHandlePtr> handles_;
    std::vector<std::string> order_;
};

} // namespace tmax::engine
