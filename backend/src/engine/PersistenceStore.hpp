#pragma once

#include "engine/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tmax::engine
{

// Durable storage for checkpoint blobs and the torrent list snapshot.
// Failures are reported through return values; callers log and continue.
class PersistenceStore
{
  public:
    virtual ~PersistenceStore() = default;

    virtual bool write_resume_data(std::string const &fingerprint,
                                   std::vector<std::uint8_t> const &data) = 0;
    virtual std::optional<std::vector<std::uint8_t>>
    read_resume_data(std::string const &fingerprint) = 0;
    virtual bool remove_resume_data(std::string const &fingerprint) = 0;

    virtual bool
    write_torrent_list(std::vector<TorrentListEntry> const &entries) = 0;
    virtual std::optional<std::vector<TorrentListEntry>>
    read_torrent_list() = 0;
};

} // namespace tmax::engine
