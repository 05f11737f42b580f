#include "engine/TransferEngine.hpp"

#include "engine/PersistenceStore.hpp"
#include "engine/ResumeDataService.hpp"
#include "engine/SnapshotBuilder.hpp"
#include "engine/TorrentRegistry.hpp"
#include "engine/TorrentUtils.hpp"
#include "utils/Log.hpp"

#include <atomic>
#include <exception>
#include <fstream>
#include <iterator>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace tmax::engine
{

namespace
{

std::vector<std::uint8_t> read_file_bytes(std::filesystem::path const &path,
                                          std::error_code &ec)
{
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return {};
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)),
                                   std::istreambuf_iterator<char>());
    if (input.bad())
    {
        ec = std::make_error_code(std::errc::io_error);
        return {};
    }
    return data;
}

bool write_file_bytes(std::filesystem::path const &path,
                      std::vector<std::uint8_t> const &data)
{
    std::error_code ec;
    if (auto parent = path.parent_path(); !parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
    }
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream output(tmp, std::ios::binary | std::ios::trunc);
        if (!output)
        {
            return false;
        }
        output.write(reinterpret_cast<char const *>(data.data()),
                     static_cast<std::streamsize>(data.size()));
        if (!output)
        {
            return false;
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec)
    {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace

std::vector<BootstrapNode> const &default_bootstrap_nodes()
{
    static std::vector<BootstrapNode> const kNodes = {
        {"router.bittorrent.com", 6881},
        {"router.utorrent.com", 6881},
        {"dht.transmissionbt.com", 6881},
        {"dht.libtorrent.org", 25401},
        {"dht.aelitis.com", 6881},
    };
    return kNodes;
}

enum class EngineState
{
    Stopped,
    Running,
    ShuttingDown_SaveResume,
    ShuttingDown_Release,
};

struct TransferEngine::Impl
{
    BackendFactory factory;
    PersistenceStore &store;
    std::chrono::milliseconds checkpoint_timeout;

    std::unique_ptr<TransferBackend> backend;
    TorrentRegistry registry;
    std::atomic<EngineState> state{EngineState::Stopped};
    std::optional<SaveReport> last_report;

    Impl(BackendFactory f, PersistenceStore &s, std::chrono::milliseconds t)
        : factory(std::move(f)), store(s), checkpoint_timeout(t)
    {
    }

    bool running() const noexcept
    {
        return state.load() == EngineState::Running && backend != nullptr;
    }

    bool start(std::filesystem::path const &state_dir, int listen_port)
    {
        if (state.load() != EngineState::Stopped)
        {
            TM_LOG_WARN("engine already started");
            return running();
        }

        BackendConfig config;
        config.listen_port = listen_port;
        auto state_path = state_dir / kSessionStateFile;
        std::error_code ec;
        if (std::filesystem::exists(state_path, ec))
        {
            config.session_state = read_file_bytes(state_path, ec);
            if (ec)
            {
                TM_LOG_WARN("failed to read session state {}: {}",
                            state_path.string(), ec.message());
                config.session_state.clear();
            }
        }

        try
        {
            backend = factory ? factory(config) : nullptr;
        }
        catch (std::exception const &ex)
        {
            TM_LOG_ERROR("failed to create session: {}", ex.what());
            backend.reset();
        }
        if (!backend)
        {
            TM_LOG_ERROR("transfer session unavailable; engine not running");
            return false;
        }

        for (auto const &node : default_bootstrap_nodes())
        {
            try
            {
                backend->add_bootstrap_node(node.host, node.port);
            }
            catch (std::exception const &ex)
            {
                TM_LOG_WARN("failed to add bootstrap node {}:{}: {}", node.host,
                            node.port, ex.what());
            }
        }
        state.store(EngineState::Running);
        TM_LOG_INFO("engine started on port {}", listen_port);
        return true;
    }

    void stop(std::filesystem::path const &state_dir)
    {
        auto expected = EngineState::Running;
        if (!state.compare_exchange_strong(
                expected, EngineState::ShuttingDown_SaveResume))
        {
            return;
        }
        TM_LOG_INFO("engine stopping");

        try
        {
            backend->pause();
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("failed to pause session: {}", ex.what());
        }

        try
        {
            auto buffer = backend->save_session_state();
            auto path = state_dir / kSessionStateFile;
            if (buffer.empty())
            {
                TM_LOG_DEBUG("no session state to save");
            }
            else if (!write_file_bytes(path, buffer))
            {
                TM_LOG_WARN("failed to write session state {}",
                            path.string());
            }
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("failed to save session state: {}", ex.what());
        }

        try
        {
            ResumeDataService resume(*backend, registry, store,
                                     checkpoint_timeout);
            last_report = resume.save_all();
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("checkpoint round failed: {}", ex.what());
        }

        state.store(EngineState::ShuttingDown_Release);
        registry.clear();
        backend.reset();
        state.store(EngineState::Stopped);
        TM_LOG_INFO("engine stopped");
    }

    AddTorrentResult add(std::string const &source,
                         std::filesystem::path const &save_path)
    {
        if (!running())
        {
            return {AddTorrentStatus::NotRunning, nullptr,
                    "engine is not running"};
        }

        AddTorrentParams params;
        params.save_path = save_path;
        bool const magnet = is_magnet_uri(source);
        if (magnet)
        {
            params.uri = source;
        }
        else
        {
            std::filesystem::path path(source);
            std::error_code ec;
            if (source.empty() || !std::filesystem::is_regular_file(path, ec))
            {
                TM_LOG_WARN("torrent file {} not found", source);
                return {AddTorrentStatus::NotFound, nullptr,
                        "torrent file not found: " + source};
            }
            params.metainfo = read_file_bytes(path, ec);
            if (ec || params.metainfo.empty())
            {
                TM_LOG_WARN("unable to read torrent file {}", source);
                return {AddTorrentStatus::NotFound, nullptr,
                        "unable to read torrent file: " + source};
            }
        }

        std::optional<TorrentDescriptor> descriptor;
        try
        {
            descriptor = backend->describe(params);
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("failed to parse {}: {}", source, ex.what());
        }
        if (!descriptor)
        {
            if (magnet)
            {
                return {AddTorrentStatus::InvalidSource, nullptr,
                        "malformed magnet link"};
            }
            return {AddTorrentStatus::BackendRejected, nullptr,
                    "invalid torrent file: " + source};
        }

        auto fingerprint = canonical_fingerprint(descriptor->fingerprint)
                               .value_or(descriptor->fingerprint);
        if (auto existing = registry.find(fingerprint))
        {
            if (existing->is_valid())
            {
                TM_LOG_INFO("{} already added", fingerprint);
                return {AddTorrentStatus::Ok, existing, "already added"};
            }
            registry.take(fingerprint);
        }

        if (auto resume = store.read_resume_data(fingerprint); resume)
        {
            TM_LOG_DEBUG("{}: attaching {} bytes of resume data", fingerprint,
                         resume->size());
            params.resume_data = std::move(*resume);
        }

        TorrentHandlePtr handle;
        try
        {
            handle = backend->add_torrent(params);
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("{}: add failed: {}", fingerprint, ex.what());
        }
        if (!handle || !handle->is_valid())
        {
            return {AddTorrentStatus::BackendRejected, nullptr,
                    "session rejected torrent " + fingerprint};
        }
        if (!registry.insert(handle))
        {
            TM_LOG_WARN("{}: duplicate registration ignored",
                        handle->fingerprint());
            if (auto existing = registry.find(handle->fingerprint()))
            {
                return {AddTorrentStatus::Ok, existing, "already added"};
            }
            return {AddTorrentStatus::BackendRejected, nullptr,
                    "session returned an unusable handle"};
        }
        TM_LOG_INFO("added {} ({})", handle->fingerprint(),
                    descriptor->name.empty() ? source : descriptor->name);
        return {AddTorrentStatus::Ok, handle, {}};
    }

    bool remove(std::string const &fingerprint, bool delete_files)
    {
        if (!running())
        {
            return false;
        }
        auto handle = registry.take(fingerprint);
        if (!handle)
        {
            TM_LOG_DEBUG("remove: {} not registered", fingerprint);
            return false;
        }
        try
        {
            if (handle->is_valid() &&
                !backend->remove_torrent(*handle, delete_files))
            {
                TM_LOG_WARN("{}: session refused removal", fingerprint);
            }
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("{}: remove failed: {}", fingerprint, ex.what());
        }
        if (delete_files && !store.remove_resume_data(fingerprint))
        {
            TM_LOG_DEBUG("{}: no resume data removed", fingerprint);
        }
        TM_LOG_INFO("removed {}", fingerprint);
        return true;
    }

    void dispatch(std::vector<BackendEvent> const &events)
    {
        for (auto const &event : events)
        {
            std::visit(
                [this](auto const &e)
                {
                    using T = std::decay_t<decltype(e)>;
                    if constexpr (std::is_same_v<T, CheckpointSavedEvent>)
                    {
                        ResumeDataService resume(*backend, registry, store,
                                                 checkpoint_timeout);
                        resume.persist(e.fingerprint, e.data);
                    }
                    else if constexpr (std::is_same_v<T,
                                                      CheckpointFailedEvent>)
                    {
                        TM_LOG_WARN("{}: checkpoint failed: {}", e.fingerprint,
                                    e.message);
                    }
                    else if constexpr (std::is_same_v<T, TorrentErrorEvent>)
                    {
                        TM_LOG_WARN("{}: {} error: {}", e.fingerprint, e.source,
                                    e.message);
                    }
                    else if constexpr (std::is_same_v<T, TorrentFinishedEvent>)
                    {
                        TM_LOG_INFO("{}: finished {}", e.fingerprint, e.name);
                        request_checkpoint(e.fingerprint);
                    }
                    else if constexpr (std::is_same_v<T, TorrentRemovedEvent>)
                    {
                        TM_LOG_DEBUG("{}: removed from session",
                                     e.fingerprint);
                    }
                    else if constexpr (std::is_same_v<T,
                                                      MetadataReceivedEvent>)
                    {
                        TM_LOG_INFO("{}: metadata received for {}",
                                    e.fingerprint, e.name);
                        request_checkpoint(e.fingerprint);
                    }
                    else if constexpr (std::is_same_v<T, ListenSucceededEvent>)
                    {
                        TM_LOG_INFO("listening on {}", e.endpoint);
                    }
                    else if constexpr (std::is_same_v<T, ListenFailedEvent>)
                    {
                        TM_LOG_WARN("listen failed on {}: {}", e.endpoint,
                                    e.message);
                    }
                },
                event);
        }
    }

    void request_checkpoint(std::string const &fingerprint)
    {
        auto handle = registry.find(fingerprint);
        if (!handle || !handle->is_valid())
        {
            return;
        }
        try
        {
            handle->save_resume_data();
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("{}: checkpoint request failed: {}", fingerprint,
                        ex.what());
        }
    }
};

TransferEngine::TransferEngine(BackendFactory factory, PersistenceStore &store,
                               std::chrono::milliseconds checkpoint_timeout)
    : impl_(std::make_unique<Impl>(std::move(factory), store,
                                   checkpoint_timeout))
{
}

TransferEngine::~TransferEngine()
{
    if (impl_ && impl_->state.load() == EngineState::Running)
    {
        TM_LOG_WARN("engine destroyed while running; session state not saved");
    }
}

bool TransferEngine::start(std::filesystem::path const &state_dir,
                           int listen_port)
{
    return impl_->start(state_dir, listen_port);
}

void TransferEngine::stop(std::filesystem::path const &state_dir)
{
    impl_->stop(state_dir);
}

bool TransferEngine::is_running() const noexcept
{
    return impl_->running();
}

AddTorrentResult TransferEngine::add(std::string const &source,
                                     std::filesystem::path const &save_path)
{
    return impl_->add(source, save_path);
}

bool TransferEngine::remove(std::string const &fingerprint, bool delete_files)
{
    auto canonical = canonical_fingerprint(fingerprint);
    if (!canonical)
    {
        TM_LOG_WARN("remove: invalid fingerprint '{}'", fingerprint);
        return false;
    }
    return impl_->remove(*canonical, delete_files);
}

bool TransferEngine::pause(std::string const &fingerprint)
{
    auto canonical = canonical_fingerprint(fingerprint);
    if (!canonical || !impl_->running())
        return false;
    auto handle = impl_->registry.find(*canonical);
    if (!handle || !handle->is_valid())
        return false;
    try
    {
        handle->pause();
    }
    catch (std::exception const &ex)
    {
        TM_LOG_WARN("{}: pause failed: {}", *canonical, ex.what());
        return false;
    }
    return true;
}

bool TransferEngine::resume(std::string const &fingerprint)
{
    auto canonical = canonical_fingerprint(fingerprint);
    if (!canonical || !impl_->running())
        return false;
    auto handle = impl_->registry.find(*canonical);
    if (!handle || !handle->is_valid())
        return false;
    try
    {
        handle->resume();
    }
    catch (std::exception const &ex)
    {
        TM_LOG_WARN("{}: resume failed: {}", *canonical, ex.what());
        return false;
    }
    return true;
}

std::vector<TorrentHandlePtr> TransferEngine::handles() const
{
    return impl_->registry.handles();
}

std::vector<TorrentSnapshot> TransferEngine::snapshot_torrents() const
{
    std::vector<TorrentSnapshot> result;
    if (!impl_->running())
        return result;
    for (auto const &handle : impl_->registry.handles())
    {
        if (!handle->is_valid())
            continue;
        try
        {
            if (auto status = handle->status())
            {
                result.push_back(SnapshotBuilder::build_snapshot(
                    handle->fingerprint(), *status));
            }
        }
        catch (std::exception const &ex)
        {
            TM_LOG_DEBUG("status for {} unavailable: {}",
                         handle->fingerprint(), ex.what());
        }
    }
    return result;
}

void TransferEngine::apply_settings(SettingsMap const &settings)
{
    if (!impl_->running() || settings.empty())
        return;
    try
    {
        impl_->backend->apply_settings(settings);
    }
    catch (std::exception const &ex)
    {
        TM_LOG_WARN("failed to apply settings: {}", ex.what());
    }
}

std::optional<SettingValue>
TransferEngine::setting(std::string const &name) const
{
    if (!impl_->running())
        return std::nullopt;
    try
    {
        return impl_->backend->setting(name);
    }
    catch (std::exception const &ex)
    {
        TM_LOG_WARN("failed to read setting {}: {}", name, ex.what());
    }
    return std::nullopt;
}

std::optional<SessionStats> TransferEngine::snapshot_session_stats()
{
    if (!impl_->running())
        return std::nullopt;
    try
    {
        return impl_->backend->session_stats();
    }
    catch (std::exception const &ex)
    {
        TM_LOG_DEBUG("session stats unavailable: {}", ex.what());
    }
    return std::nullopt;
}

std::vector<BackendEvent> TransferEngine::drain_alerts()
{
    if (!impl_->running())
        return {};
    try
    {
        return impl_->backend->pop_events();
    }
    catch (std::exception const &ex)
    {
        TM_LOG_WARN("failed to drain alerts: {}", ex.what());
    }
    return {};
}

void TransferEngine::dispatch(std::vector<BackendEvent> const &events)
{
    if (!impl_->running())
        return;
    impl_->dispatch(events);
}

bool TransferEngine::persist_torrent_list()
{
    if (!impl_->running())
        return false;
    std::vector<TorrentListEntry> entries;
    for (auto const &handle : impl_->registry.handles())
    {
        try
        {
            if (!handle->is_valid())
                continue;
            TorrentListEntry entry;
            entry.fingerprint = handle->fingerprint();
            entry.save_path = handle->save_path();
            entry.name = handle->name();
            entry.trackers = handle->trackers();
            entries.push_back(std::move(entry));
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("{}: skipped in torrent list: {}",
                        handle->fingerprint(), ex.what());
        }
    }
    if (!impl_->store.write_torrent_list(entries))
    {
        TM_LOG_WARN("failed to save torrent list");
        return false;
    }
    TM_LOG_DEBUG("saved {} torrent(s) to the torrent list", entries.size());
    return true;
}

std::vector<TorrentListEntry> TransferEngine::load_torrent_list()
{
    auto entries = impl_->store.read_torrent_list();
    if (!entries)
    {
        TM_LOG_WARN("failed to load torrent list");
        return {};
    }
    return std::move(*entries);
}

std::optional<SaveReport> TransferEngine::last_save_report() const
{
    return impl_->last_report;
}

} // namespace tmax::engine
