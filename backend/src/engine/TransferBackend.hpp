#pragma once

#include "engine/Events.hpp"
#include "engine/Types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tmax::engine
{

// Backend-side life-cycle phase of a torrent.
enum class TransferPhase
{
    Unknown,
    CheckingFiles,
    DownloadingMetadata,
    Downloading,
    Finished,
    Seeding,
    CheckingResumeData,
};

// Raw per-torrent readings; SnapshotBuilder turns them into a
// TorrentSnapshot.
struct HandleStatus
{
    TransferPhase phase = TransferPhase::Unknown;
    bool paused = false;
    std::string error; // empty when healthy
    std::string name;
    std::filesystem::path save_path;
    double progress = 0.0;
    std::int64_t download_rate = 0;
    std::int64_t upload_rate = 0;
    std::int64_t total_wanted = 0;
    std::int64_t total_wanted_done = 0;
    std::int64_t total_upload = 0;
    int num_peers = 0;
    int num_seeds = 0;
};

// One swarm membership owned by the backend. A handle may turn invalid at
// any time (removed from the session) while callers still hold it.
class TorrentHandle
{
  public:
    virtual ~TorrentHandle() = default;

    virtual std::string const &fingerprint() const = 0;
    virtual bool is_valid() const = 0;
    virtual std::string name() const = 0;
    virtual std::filesystem::path save_path() const = 0;
    virtual std::vector<std::string> trackers() const = 0;
    // nullopt once the handle is invalid or the backend cannot report.
    virtual std::optional<HandleStatus> status() const = 0;

    virtual bool need_save_resume_data() const = 0;
    // Asynchronous; completion arrives as CheckpointSaved/FailedEvent.
    virtual void save_resume_data() = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
};

using TorrentHandlePtr = std::shared_ptr<TorrentHandle>;

struct AddTorrentParams
{
    std::optional<std::string> uri;
    std::vector<std::uint8_t> metainfo;
    std::filesystem::path save_path;
    std::vector<std::uint8_t> resume_data;
};

struct TorrentDescriptor
{
    std::string fingerprint;
    std::string name;
};

struct BackendConfig
{
    int listen_port = 6881;
    // Previously saved session state; empty when none was found.
    std::vector<std::uint8_t> session_state;
};

// Port to the peer-to-peer transfer engine. All calls are made from the
// owning thread; the backend's own workers only surface through the event
// queue.
class TransferBackend
{
  public:
    virtual ~TransferBackend() = default;

    virtual void pause() = 0;
    virtual std::vector<std::uint8_t> save_session_state() = 0;
    virtual void add_bootstrap_node(std::string const &host, int port) = 0;

    // Parses uri or metainfo without touching the session.
    virtual std::optional<TorrentDescriptor>
    describe(AddTorrentParams const &params) = 0;
    // Returns nullptr when the backend refuses the torrent.
    virtual TorrentHandlePtr add_torrent(AddTorrentParams const &params) = 0;
    virtual bool remove_torrent(TorrentHandle &handle, bool delete_files) = 0;

    // Blocks for at most timeout; true when events are ready.
    virtual bool wait_for_event(std::chrono::milliseconds timeout) = 0;
    virtual std::vector<BackendEvent> pop_events() = 0;

    virtual void apply_settings(SettingsMap const &settings) = 0;
    virtual std::optional<SettingValue>
    setting(std::string const &name) const = 0;
    virtual std::optional<SessionStats> session_stats() = 0;
};

// Returns nullptr if the session cannot be constructed.
using BackendFactory =
    std::function<std::unique_ptr<TransferBackend>(BackendConfig const &)>;

} // namespace tmax::engine
