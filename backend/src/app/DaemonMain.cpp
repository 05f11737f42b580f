#include "app/DaemonMain.hpp"

#include "engine/AdaptiveController.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/LibtorrentBackend.hpp"
#include "engine/PersistenceManager.hpp"
#include "engine/SchedulerService.hpp"
#include "engine/SnapshotBuilder.hpp"
#include "engine/TorrentUtils.hpp"
#include "engine/TransferEngine.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/SystemProbe.hpp"
#include "utils/Version.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <exception>
#include <system_error>
#include <thread>

namespace tmax::app
{

namespace
{

constexpr auto kIdleSleep = std::chrono::milliseconds(200);
constexpr auto kConfigFlushInterval = std::chrono::milliseconds(500);
constexpr auto kTorrentListInterval = std::chrono::seconds(60);

constexpr char const kUsage[] =
    "usage: torrentmax-daemon [--state-dir DIR] [--download-dir DIR] "
    "[--port N] [--profile wifi|lan|vpn|auto] [--max-download-rate B] "
    "[--max-upload-rate B] [--run-seconds N] "
    "[magnet-uri | file.torrent]...";

std::optional<int> parse_int(std::string const &value)
{
    int parsed = 0;
    auto const *end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    if (ec != std::errc() || ptr != end)
    {
        return std::nullopt;
    }
    return parsed;
}

std::string const &status_label(tmax::engine::AddTorrentStatus status)
{
    using tmax::engine::AddTorrentStatus;
    static std::string const kOk = "ok";
    static std::string const kNotRunning = "engine not running";
    static std::string const kInvalid = "invalid source";
    static std::string const kNotFound = "not found";
    static std::string const kRejected = "rejected";
    switch (status)
    {
    case AddTorrentStatus::Ok:
        return kOk;
    case AddTorrentStatus::NotRunning:
        return kNotRunning;
    case AddTorrentStatus::InvalidSource:
        return kInvalid;
    case AddTorrentStatus::NotFound:
        return kNotFound;
    case AddTorrentStatus::BackendRejected:
        break;
    }
    return kRejected;
}

void restore_torrents(tmax::engine::TransferEngine &engine,
                      std::filesystem::path const &download_path)
{
    auto entries = engine.load_torrent_list();
    std::size_t restored = 0;
    for (auto const &entry : entries)
    {
        auto uri = tmax::engine::build_magnet_uri(entry.fingerprint, entry.name,
                                                  entry.trackers);
        auto save_path =
            entry.save_path.empty() ? download_path : entry.save_path;
        auto result = engine.add(uri, save_path);
        if (!result.ok())
        {
            TM_LOG_WARN("failed to restore {}: {}", entry.fingerprint,
                        result.message);
            continue;
        }
        ++restored;
    }
    if (!entries.empty())
    {
        TM_LOG_INFO("restored {} of {} torrent(s)", restored, entries.size());
    }
}

void add_startup_sources(tmax::engine::TransferEngine &engine,
                         std::vector<std::string> const &sources,
                         std::filesystem::path const &download_path)
{
    for (auto const &value : sources)
    {
        std::string source = value;
        if (!tmax::engine::is_magnet_uri(source))
        {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(source, ec);
            if (!ec)
            {
                source = absolute.string();
            }
        }
        auto result = engine.add(source, download_path);
        if (result.ok())
        {
            tmax::log::print_status("Added {}", result.handle->fingerprint());
        }
        else
        {
            tmax::log::print_status("Could not add {}: {} ({})", value,
                                    status_label(result.status),
                                    result.message);
        }
    }
}

void log_bottlenecks(std::vector<tmax::engine::Bottleneck> const &bottlenecks)
{
    for (auto const &bottleneck : bottlenecks)
    {
        TM_LOG_INFO("bottleneck [{}] {:.2f}: {} ({})", bottleneck.category,
                    bottleneck.severity, bottleneck.message,
                    bottleneck.suggestion);
    }
}

} // namespace

std::optional<DaemonOptions> parse_arguments(std::vector<std::string> const &args,
                                             std::string &error)
{
    DaemonOptions options;
    for (std::size_t index = 0; index < args.size(); ++index)
    {
        auto const &arg = args[index];
        if (arg.empty())
        {
            continue;
        }
        if (arg == "-h" || arg == "--help")
        {
            options.show_help = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0)
        {
            options.sources.push_back(arg);
            continue;
        }

        std::string name = arg;
        std::optional<std::string> value;
        if (auto eq = arg.find('='); eq != std::string::npos)
        {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }
        else if (index + 1 < args.size() && args[index + 1].rfind("--", 0) != 0)
        {
            value = args[++index];
        }
        if (!value)
        {
            error = "missing value for " + name;
            return std::nullopt;
        }

        if (name == "--state-dir")
        {
            options.state_dir = *value;
        }
        else if (name == "--download-dir")
        {
            options.download_dir = *value;
        }
        else if (name == "--port")
        {
            auto port = parse_int(*value);
            if (!port || *port <= 0 || *port > 65535)
            {
                error = "invalid port: " + *value;
                return std::nullopt;
            }
            options.listen_port = *port;
        }
        else if (name == "--profile")
        {
            if (*value != "auto" && tmax::engine::find_profile(*value) == nullptr)
            {
                error = "unknown profile: " + *value;
                return std::nullopt;
            }
            options.profile = *value;
        }
        else if (name == "--max-download-rate" || name == "--max-upload-rate")
        {
            auto rate = parse_int(*value);
            if (!rate || *rate < 0)
            {
                error = "invalid rate: " + *value;
                return std::nullopt;
            }
            if (name == "--max-download-rate")
                options.max_download_rate = *rate;
            else
                options.max_upload_rate = *rate;
        }
        else if (name == "--run-seconds")
        {
            auto seconds = parse_int(*value);
            if (!seconds || *seconds < 0)
            {
                error = "invalid run time: " + *value;
                return std::nullopt;
            }
            options.run_seconds = *seconds;
        }
        else
        {
            error = "unknown option: " + name;
            return std::nullopt;
        }
    }
    return options;
}

void apply_overrides(DaemonOptions const &options,
                     tmax::engine::ConfigurationService &config)
{
    if (!options.download_dir.empty())
        config.set_download_path(options.download_dir);
    if (options.listen_port)
        config.set_listen_port(*options.listen_port);
    if (options.profile)
    {
        if (*options.profile == "auto")
        {
            config.set_auto_profile(true);
            config.set_manual_profile({});
        }
        else
        {
            config.set_manual_profile(*options.profile);
        }
    }
    if (options.max_download_rate || options.max_upload_rate)
        config.set_rate_limits(options.max_download_rate,
                               options.max_upload_rate);
}

int daemon_main(int argc, char *argv[])
{
    try
    {
        tmax::runtime::install_signal_handlers();

        std::vector<std::string> args;
        for (int index = 1; index < argc; ++index)
        {
            if (argv[index] != nullptr)
                args.emplace_back(argv[index]);
        }
        std::string error;
        auto options = parse_arguments(args, error);
        if (!options)
        {
            std::fprintf(stderr, "%s\n%s\n", error.c_str(), kUsage);
            return 2;
        }
        if (options->show_help)
        {
            tmax::log::print_status("{}\n{}", tmax::version::kDisplayVersion,
                                    kUsage);
            return 0;
        }

        auto state_dir = options->state_dir.empty() ? tmax::utils::data_root()
                                                    : options->state_dir;
        if (auto ensured = tmax::utils::ensure_directory(state_dir))
        {
            state_dir = *ensured;
        }
        else
        {
            tmax::log::print_status("Cannot create state directory {}",
                                    state_dir.string());
            return 1;
        }
        tmax::log::set_log_file((state_dir / "torrentmax.log").string());
        TM_LOG_INFO("{} starting; state directory {}",
                    tmax::version::kDisplayVersion, state_dir.string());

        tmax::engine::PersistenceManager persistence(state_dir /
                                                     "torrentmax.db");

        tmax::engine::EngineSettings defaults;
        defaults.state_dir = state_dir;
        defaults.download_path = tmax::utils::default_download_dir();
        tmax::engine::ConfigurationService config(&persistence, defaults);
        config.load();
        apply_overrides(*options, config);
        config.persist_if_dirty();

        auto settings = config.get();
        auto download_path = settings.download_path;
        if (auto ensured = tmax::utils::ensure_directory(download_path))
        {
            download_path = *ensured;
        }
        else
        {
            TM_LOG_WARN("download directory {} unavailable",
                        download_path.string());
        }
        TM_LOG_INFO("Download path: {}", download_path.string());

        tmax::engine::TransferEngine engine(
            tmax::engine::make_libtorrent_backend, persistence,
            settings.checkpoint_timeout);
        if (!engine.start(state_dir, settings.listen_port))
        {
            tmax::log::print_status("TorrentMax failed to start the session");
            return 1;
        }
        engine.apply_settings(config.rate_limit_settings());

        tmax::sys::SystemProbe probe;
        tmax::engine::AdaptiveController controller(engine, probe);
        if (!settings.manual_profile.empty())
        {
            controller.set_manual_profile(settings.manual_profile);
        }
        else if (settings.auto_profile)
        {
            controller.detect_and_apply();
        }

        restore_torrents(engine, download_path);
        add_startup_sources(engine, options->sources, download_path);
        engine.persist_torrent_list();

        tmax::engine::SchedulerService scheduler;
        scheduler.schedule("alerts", settings.alert_interval,
                           [&engine] { engine.dispatch(engine.drain_alerts()); });
        scheduler.schedule(
            "stats", settings.stats_interval,
            [&]
            {
                auto stats = engine.snapshot_session_stats();
                if (!stats)
                    return;
                auto disk = probe.disk_usage_percent(download_path).value_or(0.0);
                auto cpu = probe.cpu_percent().value_or(0.0);
                TM_LOG_DEBUG("down {} B/s, up {} B/s, {} peers, {} dht nodes, "
                             "disk {:.0f}%, cpu {:.0f}%",
                             stats->download_rate, stats->upload_rate,
                             stats->peer_count, stats->dht_node_count, disk,
                             cpu);
                for (auto const &torrent : engine.snapshot_torrents())
                {
                    TM_LOG_DEBUG("{} [{}] {:.1f}% down {} B/s, eta {}s",
                                 torrent.name,
                                 tmax::engine::to_string(torrent.state),
                                 torrent.progress * 100.0,
                                 torrent.download_rate, torrent.eta_seconds);
                }
                auto bottlenecks =
                    tmax::engine::AdaptiveController::analyze_bottlenecks(
                        *stats, disk, cpu);
                log_bottlenecks(bottlenecks);
                controller.apply_dynamic_adjustments(bottlenecks);
            });
        if (settings.auto_profile && settings.manual_profile.empty())
        {
            scheduler.schedule("network", settings.network_probe_interval,
                               [&controller] { controller.detect_and_apply(); });
        }
        scheduler.schedule("config", kConfigFlushInterval,
                           [&config] { config.persist_if_dirty(); });
        scheduler.schedule("torrent-list", kTorrentListInterval,
                           [&engine] { engine.persist_torrent_list(); });

        auto const started = std::chrono::steady_clock::now();
        tmax::log::print_status("TorrentMax daemon running on port {}; CTRL+C "
                                "to stop.",
                                settings.listen_port);
        while (!tmax::runtime::should_shutdown())
        {
            auto now = std::chrono::steady_clock::now();
            scheduler.tick(now);
            if (options->run_seconds > 0 &&
                now - started >= std::chrono::seconds(options->run_seconds))
            {
                TM_LOG_INFO("Auto shutdown: run-seconds={} reached",
                            options->run_seconds);
                tmax::runtime::request_shutdown();
                break;
            }
            auto sleep = std::min<std::chrono::milliseconds>(
                scheduler.time_until_next_task(
                    std::chrono::steady_clock::now()),
                kIdleSleep);
            std::this_thread::sleep_for(sleep);
        }

        TM_LOG_INFO("Shutdown requested; saving state");
        engine.dispatch(engine.drain_alerts());
        engine.persist_torrent_list();
        config.persist_now();
        engine.stop(state_dir);
        if (auto report = engine.last_save_report())
        {
            TM_LOG_INFO("checkpoints: {} requested, {} written, {} failed, "
                        "{} abandoned",
                        report->requested, report->written, report->failed,
                        report->outstanding);
        }
        tmax::log::print_status("Shutdown complete.");
        return 0;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "TorrentMax daemon failed: %s\n", ex.what());
        TM_LOG_ERROR("TorrentMax daemon failed: {}", ex.what());
    }
    return 1;
}

} // namespace tmax::app
