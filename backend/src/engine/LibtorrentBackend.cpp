#include "engine/LibtorrentBackend.hpp"

#include "engine/LibtorrentUtils.hpp"
#include "engine/SettingsManager.hpp"
#include "utils/Log.hpp"

#include <exception>
#include <iterator>
#include <utility>

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/announce_entry.hpp>
#include <libtorrent/bdecode.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/read_resume_data.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>

namespace tmax::engine
{

namespace
{

TransferPhase to_phase(libtorrent::torrent_status::state_t state)
{
    using state_t = libtorrent::torrent_status::state_t;
    switch (state)
    {
    case state_t::checking_files:
        return TransferPhase::CheckingFiles;
    case state_t::downloading_metadata:
        return TransferPhase::DownloadingMetadata;
    case state_t::downloading:
        return TransferPhase::Downloading;
    case state_t::finished:
        return TransferPhase::Finished;
    case state_t::seeding:
        return TransferPhase::Seeding;
    case state_t::checking_resume_data:
        return TransferPhase::CheckingResumeData;
    default:
        return TransferPhase::Unknown;
    }
}

std::optional<libtorrent::add_torrent_params>
source_params(AddTorrentParams const &params)
{
    libtorrent::error_code ec;
    libtorrent::add_torrent_params atp;
    if (params.uri)
    {
        atp = libtorrent::parse_magnet_uri(*params.uri, ec);
        if (ec)
        {
            TM_LOG_WARN("invalid magnet link: {}", ec.message());
            return std::nullopt;
        }
        return atp;
    }
    if (params.metainfo.empty())
    {
        return std::nullopt;
    }
    auto const *data = reinterpret_cast<char const *>(params.metainfo.data());
    auto node = libtorrent::bdecode(
        libtorrent::span<char const>(
            data, static_cast<std::ptrdiff_t>(params.metainfo.size())),
        ec);
    if (ec)
    {
        TM_LOG_WARN("torrent file is not valid bencoding: {}", ec.message());
        return std::nullopt;
    }
    auto info = std::make_shared<libtorrent::torrent_info>(node, ec);
    if (ec)
    {
        TM_LOG_WARN("invalid torrent file: {}", ec.message());
        return std::nullopt;
    }
    atp.ti = std::move(info);
    return atp;
}

std::optional<libtorrent::add_torrent_params>
resume_params(std::vector<std::uint8_t> const &data)
{
    if (data.empty())
    {
        return std::nullopt;
    }
    libtorrent::error_code ec;
    auto const *bytes = reinterpret_cast<char const *>(data.data());
    auto atp = libtorrent::read_resume_data(
        libtorrent::span<char const>(bytes,
                                     static_cast<std::ptrdiff_t>(data.size())),
        ec);
    if (ec)
    {
        TM_LOG_WARN("ignoring unreadable resume data: {}", ec.message());
        return std::nullopt;
    }
    return atp;
}

} // namespace

LibtorrentTorrentHandle::LibtorrentTorrentHandle(
    libtorrent::torrent_handle handle, std::string fingerprint)
    : handle_(std::move(handle)), fingerprint_(std::move(fingerprint))
{
}

bool LibtorrentTorrentHandle::is_valid() const
{
    return handle_.is_valid();
}

std::string LibtorrentTorrentHandle::name() const
{
    if (!handle_.is_valid())
        return {};
    return handle_.status(libtorrent::torrent_handle::query_name).name;
}

std::filesystem::path LibtorrentTorrentHandle::save_path() const
{
    if (!handle_.is_valid())
        return {};
    return std::filesystem::path(
        handle_.status(libtorrent::torrent_handle::query_save_path).save_path);
}

std::vector<std::string> LibtorrentTorrentHandle::trackers() const
{
    std::vector<std::string> result;
    if (!handle_.is_valid())
        return result;
    for (auto const &entry : handle_.trackers())
    {
        result.push_back(entry.url);
    }
    return result;
}

std::optional<HandleStatus> LibtorrentTorrentHandle::status() const
{
    if (!handle_.is_valid())
        return std::nullopt;
    libtorrent::torrent_status native_status;
    try
    {
        native_status = handle_.status();
    }
    catch (std::exception const &ex)
    {
        TM_LOG_DEBUG("status for {} unavailable: {}", fingerprint_, ex.what());
        return std::nullopt;
    }
    HandleStatus result;
    result.phase = to_phase(native_status.state);
    result.paused = static_cast<bool>(native_status.flags &
                                      libtorrent::torrent_flags::paused);
    if (native_status.errc)
        result.error = native_status.errc.message();
    result.name = native_status.name;
    result.save_path = std::filesystem::path(native_status.save_path);
    result.progress = native_status.progress;
    result.download_rate = native_status.download_rate;
    result.upload_rate = native_status.upload_rate;
    result.total_wanted = native_status.total_wanted;
    result.total_wanted_done = native_status.total_wanted_done;
    result.total_upload = native_status.total_upload;
    result.num_peers = native_status.num_peers;
    result.num_seeds = native_status.num_seeds;
    return result;
}

bool LibtorrentTorrentHandle::need_save_resume_data() const
{
    return handle_.is_valid() && handle_.need_save_resume_data();
}

void LibtorrentTorrentHandle::save_resume_data()
{
    handle_.save_resume_data(libtorrent::torrent_handle::save_info_dict);
}

void LibtorrentTorrentHandle::pause()
{
    handle_.pause(libtorrent::torrent_handle::graceful_pause);
}

void LibtorrentTorrentHandle::resume()
{
    handle_.resume();
}

LibtorrentBackend::LibtorrentBackend(BackendConfig const &config)
{
    auto pack = SettingsManager::build_settings_pack(config.listen_port);
    libtorrent::session_params params(pack);
    if (!config.session_state.empty())
    {
        try
        {
            auto const *data =
                reinterpret_cast<char const *>(config.session_state.data());
            auto saved = libtorrent::read_session_params(
                libtorrent::span<char const>(
                    data,
                    static_cast<std::ptrdiff_t>(config.session_state.size())),
                libtorrent::session_handle::save_dht_state);
            params.dht_state = std::move(saved.dht_state);
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("failed to load session state: {}", ex.what());
        }
    }
    session_ = std::make_unique<libtorrent::session>(std::move(params));
}

LibtorrentBackend::~LibtorrentBackend() = default;

void LibtorrentBackend::pause()
{
    session_->pause();
}

std::vector<std::uint8_t> LibtorrentBackend::save_session_state()
{
    auto state = session_->session_state(
        libtorrent::session_handle::save_dht_state);
    auto buffer = libtorrent::write_session_params_buf(
        state, libtorrent::session_handle::save_dht_state);
    return std::vector<std::uint8_t>(buffer.begin(), buffer.end());
}

void LibtorrentBackend::add_bootstrap_node(std::string const &host, int port)
{
    session_->add_dht_node({host, port});
}

std::optional<TorrentDescriptor>
LibtorrentBackend::describe(AddTorrentParams const &params)
{
    auto atp = source_params(params);
    if (!atp)
    {
        return std::nullopt;
    }
    auto fingerprint = fingerprint_of(*atp);
    if (!fingerprint)
    {
        return std::nullopt;
    }
    TorrentDescriptor descriptor;
    descriptor.fingerprint = std::move(*fingerprint);
    descriptor.name = atp->ti ? atp->ti->name() : atp->name;
    return descriptor;
}

TorrentHandlePtr LibtorrentBackend::add_torrent(AddTorrentParams const &params)
{
    auto source = source_params(params);
    if (!source)
    {
        return nullptr;
    }
    auto fingerprint = fingerprint_of(*source);
    if (!fingerprint)
    {
        return nullptr;
    }

    libtorrent::add_torrent_params atp = std::move(*source);
    if (auto resumed = resume_params(params.resume_data))
    {
        if (fingerprint_of(*resumed) == fingerprint)
        {
            if (!resumed->ti && atp.ti)
                resumed->ti = atp.ti;
            if (resumed->trackers.empty())
                resumed->trackers = atp.trackers;
            if (resumed->name.empty())
                resumed->name = atp.name;
            atp = std::move(*resumed);
        }
        else
        {
            TM_LOG_WARN("{}: resume data belongs to another torrent",
                        *fingerprint);
        }
    }
    atp.save_path = params.save_path.string();

    libtorrent::error_code ec;
    auto handle = session_->add_torrent(std::move(atp), ec);
    if (ec || !handle.is_valid())
    {
        TM_LOG_WARN("{}: session rejected torrent: {}", *fingerprint,
                    ec.message());
        return nullptr;
    }
    return std::make_shared<LibtorrentTorrentHandle>(std::move(handle),
                                                     std::move(*fingerprint));
}

bool LibtorrentBackend::remove_torrent(TorrentHandle &handle, bool delete_files)
{
    auto *native = dynamic_cast<LibtorrentTorrentHandle *>(&handle);
    if (native == nullptr || !native->native().is_valid())
    {
        return false;
    }
    libtorrent::remove_flags_t flags{};
    if (delete_files)
    {
        flags = libtorrent::session_handle::delete_files;
    }
    session_->remove_torrent(native->native(), flags);
    return true;
}

void LibtorrentBackend::collect_alerts()
{
    alert_buffer_.clear();
    session_->pop_alerts(&alert_buffer_);
    auto events = router_.route(alert_buffer_);
    alert_buffer_.clear();
    pending_.insert(pending_.end(), std::make_move_iterator(events.begin()),
                    std::make_move_iterator(events.end()));
}

bool LibtorrentBackend::wait_for_event(std::chrono::milliseconds timeout)
{
    if (!pending_.empty())
    {
        return true;
    }
    if (session_->wait_for_alert(timeout) == nullptr)
    {
        return false;
    }
    collect_alerts();
    return !pending_.empty();
}

std::vector<BackendEvent> LibtorrentBackend::pop_events()
{
    collect_alerts();
    return std::exchange(pending_, {});
}

void LibtorrentBackend::apply_settings(SettingsMap const &settings)
{
    session_->apply_settings(SettingsManager::to_settings_pack(settings));
}

std::optional<SettingValue>
LibtorrentBackend::setting(std::string const &name) const
{
    return SettingsManager::read_setting(session_->get_settings(), name);
}

std::optional<SessionStats> LibtorrentBackend::session_stats()
{
    // The DHT count arrives asynchronously; this reports the previous sample.
    session_->post_session_stats();
    SessionStats stats;
    auto statuses = session_->get_torrent_status(
        [](libtorrent::torrent_status const &) { return true; }, {});
    for (auto const &status : statuses)
    {
        stats.download_rate += status.download_payload_rate;
        stats.upload_rate += status.upload_payload_rate;
        stats.peer_count += status.num_peers;
    }
    stats.dht_node_count = router_.dht_node_count();
    return stats;
}

std::unique_ptr<TransferBackend>
make_libtorrent_backend(BackendConfig const &config)
{
    try
    {
        return std::make_unique<LibtorrentBackend>(config);
    }
    catch (std::exception const &ex)
    {
        TM_LOG_ERROR("failed to start libtorrent session: {}", ex.what());
    }
    return nullptr;
}

} // namespace tmax::engine
