#pragma once

#include "engine/Events.hpp"
#include "engine/ResumeDataService.hpp"
#include "engine/TransferBackend.hpp"
#include "engine/Types.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tmax::engine
{

class PersistenceStore;

struct AddTorrentResult
{
    AddTorrentStatus status = AddTorrentStatus::Ok;
    TorrentHandlePtr handle;
    std::string message;

    bool ok() const noexcept { return status == AddTorrentStatus::Ok; }
};

struct BootstrapNode
{
    std::string host;
    int port = 0;
};

std::vector<BootstrapNode> const &default_bootstrap_nodes();

// File under the state directory holding the saved DHT routing state.
constexpr char const *kSessionStateFile = "session.dht";

// Owns the live session and the torrents registered with it. Not
// thread-safe apart from stop(), which may race itself safely.
class TransferEngine
{
  public:
    TransferEngine(BackendFactory factory, PersistenceStore &store,
                   std::chrono::milliseconds checkpoint_timeout =
                       ResumeDataService::kDefaultTimeout);
    ~TransferEngine();

    TransferEngine(TransferEngine const &) = delete;
    TransferEngine &operator=(TransferEngine const &) = delete;

    // Returns false (and stays stopped) if the backend cannot be built.
    bool start(std::filesystem::path const &state_dir, int listen_port);
    // Only the first call after start() does anything.
    void stop(std::filesystem::path const &state_dir);
    bool is_running() const noexcept;

    AddTorrentResult add(std::string const &source,
                         std::filesystem::path const &save_path);
    // Drops the torrent from the registry even if the backend complains.
    bool remove(std::string const &fingerprint, bool delete_files);
    bool pause(std::string const &fingerprint);
    bool resume(std::string const &fingerprint);
    std::vector<TorrentHandlePtr> handles() const;

    void apply_settings(SettingsMap const &settings);
    std::optional<SettingValue> setting(std::string const &name) const;
    std::optional<SessionStats> snapshot_session_stats();
    // One entry per valid registered torrent, in registration order.
    std::vector<TorrentSnapshot> snapshot_torrents() const;

    std::vector<BackendEvent> drain_alerts();
    // Reacts to drained events while the session is running.
    void dispatch(std::vector<BackendEvent> const &events);

    bool persist_torrent_list();
    std::vector<TorrentListEntry> load_torrent_list();

    // Outcome of the checkpoint round of the last stop().
    std::optional<SaveReport> last_save_report() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tmax::engine
