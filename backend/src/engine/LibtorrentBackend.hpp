#pragma once

#include "engine/AlertRouter.hpp"
#include "engine/TransferBackend.hpp"

#include <memory>
#include <string>
#include <vector>

#include <libtorrent/alert.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/torrent_handle.hpp>

namespace tmax::engine
{

class LibtorrentTorrentHandle : public TorrentHandle
{
  public:
    LibtorrentTorrentHandle(libtorrent::torrent_handle handle,
                            std::string fingerprint);

    std::string const &fingerprint() const override { return fingerprint_; }
    bool is_valid() const override;
    std::string name() const override;
    std::filesystem::path save_path() const override;
    std::vector<std::string> trackers() const override;
    std::optional<HandleStatus> status() const override;

    bool need_save_resume_data() const override;
    void save_resume_data() override;
    void pause() override;
    void resume() override;

    libtorrent::torrent_handle const &native() const noexcept
    {
        return handle_;
    }

  private:
    libtorrent::torrent_handle handle_;
    std::string fingerprint_;
};

// TransferBackend over a libtorrent session.
class LibtorrentBackend : public TransferBackend
{
  public:
    // Throws std::system_error if the session cannot be created.
    explicit LibtorrentBackend(BackendConfig const &config);
    ~LibtorrentBackend() override;

    void pause() override;
    std::vector<std::uint8_t> save_session_state() override;
    void add_bootstrap_node(std::string const &host, int port) override;

    std::optional<TorrentDescriptor>
    describe(AddTorrentParams const &params) override;
    TorrentHandlePtr add_torrent(AddTorrentParams const &params) override;
    bool remove_torrent(TorrentHandle &handle, bool delete_files) override;

    bool wait_for_event(std::chrono::milliseconds timeout) override;
    std::vector<BackendEvent> pop_events() override;

    void apply_settings(SettingsMap const &settings) override;
    std::optional<SettingValue>
    setting(std::string const &name) const override;
    std::optional<SessionStats> session_stats() override;

  private:
    void collect_alerts();

    std::unique_ptr<libtorrent::session> session_;
    AlertRouter router_;
    std::vector<libtorrent::alert *> alert_buffer_;
    std::vector<BackendEvent> pending_;
};

// BackendFactory that logs and returns nullptr instead of throwing.
std::unique_ptr<TransferBackend>
make_libtorrent_backend(BackendConfig const &config);

} // namespace tmax::engine
