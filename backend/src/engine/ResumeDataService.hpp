#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tmax::engine
{

class TransferBackend;
class TorrentRegistry;
class PersistenceStore;

struct SaveReport
{
    std::size_t requested = 0;
    std::size_t outstanding = 0;
    std::size_t written = 0;
    std::size_t failed = 0;
    bool timed_out = false;
};

// Drives the shutdown checkpoint round: request resume data from every
// dirty handle, then collect completions until all are in or the deadline
// passes. Completions may arrive in any order and interleaved with
// unrelated events.
class ResumeDataService
{
  public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kDefaultTimeout{8000};
    static constexpr std::chrono::milliseconds kWaitSlice{1000};

    ResumeDataService(TransferBackend &backend, TorrentRegistry &registry,
                      PersistenceStore &store,
                      std::chrono::milliseconds timeout = kDefaultTimeout);

    SaveReport save_all();

    // Writes a blob only while its handle is registered and valid.
    bool persist(std::string const &fingerprint,
                 std::vector<std::uint8_t> const &data);

  private:
    std::size_t request_checkpoints();

    TransferBackend &backend_;
    TorrentRegistry &registry_;
    PersistenceStore &store_;
    std::chrono::milliseconds timeout_;
};

} // namespace tmax::engine
