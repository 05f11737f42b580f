#include "engine/AlertRouter.hpp"

#include "engine/LibtorrentUtils.hpp"
#include "utils/Log.hpp"

#include <format>
#include <string>

#include <libtorrent/session_stats.hpp>
#include <libtorrent/write_resume_data.hpp>

namespace tmax::engine
{

namespace
{

std::string format_endpoint(libtorrent::address const &address, int port)
{
    if (address.is_v6())
    {
        return std::format("[{}]:{}", address.to_string(), port);
    }
    return std::format("{}:{}", address.to_string(), port);
}

} // namespace

AlertRouter::AlertRouter()
    : dht_nodes_metric_(libtorrent::find_metric_idx("dht.dht_nodes"))
{
}

std::vector<BackendEvent>
AlertRouter::route(std::vector<libtorrent::alert *> const &alerts)
{
    std::vector<BackendEvent> events;
    for (auto const *alert : alerts)
    {
        if (auto *resume =
                libtorrent::alert_cast<libtorrent::save_resume_data_alert>(
                    alert))
        {
            handle_save_resume_data(*resume, events);
        }
        else if (auto *failed = libtorrent::alert_cast<
                     libtorrent::save_resume_data_failed_alert>(alert))
        {
            handle_save_resume_data_failed(*failed, events);
        }
        else if (auto *finished =
                     libtorrent::alert_cast<libtorrent::torrent_finished_alert>(
                         alert))
        {
            if (auto fingerprint = fingerprint_of(finished->handle))
            {
                events.push_back(TorrentFinishedEvent{
                    *fingerprint, finished->torrent_name()});
            }
        }
        else if (auto *removed =
                     libtorrent::alert_cast<libtorrent::torrent_removed_alert>(
                         alert))
        {
            if (auto fingerprint = fingerprint_of(removed->info_hashes))
            {
                events.push_back(TorrentRemovedEvent{*fingerprint});
            }
        }
        else if (auto *metadata = libtorrent::alert_cast<
                     libtorrent::metadata_received_alert>(alert))
        {
            if (auto fingerprint = fingerprint_of(metadata->handle))
            {
                events.push_back(MetadataReceivedEvent{
                    *fingerprint, metadata->torrent_name()});
            }
        }
        else if (auto *file_error =
                     libtorrent::alert_cast<libtorrent::file_error_alert>(
                         alert))
        {
            if (auto fingerprint = fingerprint_of(file_error->handle))
            {
                events.push_back(TorrentErrorEvent{
                    *fingerprint, file_error->message(), "file"});
            }
        }
        else if (auto *tracker_error =
                     libtorrent::alert_cast<libtorrent::tracker_error_alert>(
                         alert))
        {
            if (auto fingerprint = fingerprint_of(tracker_error->handle))
            {
                auto const *url = tracker_error->tracker_url();
                events.push_back(TorrentErrorEvent{
                    *fingerprint,
                    std::format("{}: {}", url && *url ? url : "<unknown>",
                                tracker_error->message()),
                    "tracker"});
            }
        }
        else if (auto *torrent_error =
                     libtorrent::alert_cast<libtorrent::torrent_error_alert>(
                         alert))
        {
            if (auto fingerprint = fingerprint_of(torrent_error->handle))
            {
                events.push_back(TorrentErrorEvent{
                    *fingerprint, torrent_error->message(), "torrent"});
            }
        }
        else if (auto *listen_ok = libtorrent::alert_cast<
                     libtorrent::listen_succeeded_alert>(alert))
        {
            handle_listen_succeeded(*listen_ok, events);
        }
        else if (auto *listen_failed =
                     libtorrent::alert_cast<libtorrent::listen_failed_alert>(
                         alert))
        {
            handle_listen_failed(*listen_failed, events);
        }
        else if (auto *stats =
                     libtorrent::alert_cast<libtorrent::session_stats_alert>(
                         alert))
        {
            handle_session_stats(*stats);
        }
        else if (auto *portmap =
                     libtorrent::alert_cast<libtorrent::portmap_error_alert>(
                         alert))
        {
            TM_LOG_INFO("portmap failed: {}", portmap->message());
        }
        else if (auto *fastresume = libtorrent::alert_cast<
                     libtorrent::fastresume_rejected_alert>(alert))
        {
            TM_LOG_INFO("fastresume rejected: {}", fastresume->message());
        }
    }
    return events;
}

void AlertRouter::handle_save_resume_data(
    libtorrent::save_resume_data_alert const &alert,
    std::vector<BackendEvent> &out)
{
    auto fingerprint = fingerprint_of(alert.params);
    if (!fingerprint)
    {
        fingerprint = fingerprint_of(alert.handle);
    }
    if (!fingerprint)
    {
        TM_LOG_WARN("resume data without info-hash dropped");
        return;
    }
    auto buffer = libtorrent::write_resume_data_buf(alert.params);
    CheckpointSavedEvent event;
    event.fingerprint = std::move(*fingerprint);
    event.data.assign(buffer.begin(), buffer.end());
    out.push_back(std::move(event));
}

void AlertRouter::handle_save_resume_data_failed(
    libtorrent::save_resume_data_failed_alert const &alert,
    std::vector<BackendEvent> &out)
{
    auto fingerprint = fingerprint_of(alert.handle);
    if (!fingerprint)
    {
        TM_LOG_WARN("save resume data failed: {}", alert.error.message());
        return;
    }
    out.push_back(CheckpointFailedEvent{*fingerprint, alert.error.message()});
}

void AlertRouter::handle_listen_succeeded(
    libtorrent::listen_succeeded_alert const &alert,
    std::vector<BackendEvent> &out)
{
    if (alert.socket_type != libtorrent::socket_type_t::tcp)
        return;
    out.push_back(
        ListenSucceededEvent{format_endpoint(alert.address, alert.port),
                             alert.port});
}

void AlertRouter::handle_listen_failed(
    libtorrent::listen_failed_alert const &alert,
    std::vector<BackendEvent> &out)
{
    if (alert.socket_type != libtorrent::socket_type_t::tcp)
        return;
    out.push_back(ListenFailedEvent{format_endpoint(alert.address, alert.port),
                                    alert.port, alert.message()});
}

void AlertRouter::handle_session_stats(
    libtorrent::session_stats_alert const &alert)
{
    if (dht_nodes_metric_ < 0)
        return;
    auto counters = alert.counters();
    if (dht_nodes_metric_ < counters.size())
    {
        dht_node_count_ = static_cast<int>(counters[dht_nodes_metric_]);
    }
}

} // namespace tmax::engine
