#include "engine/ResumeDataService.hpp"

#include "engine/PersistenceStore.hpp"
#include "engine/TorrentRegistry.hpp"
#include "engine/TransferBackend.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <type_traits>
#include <variant>

namespace tmax::engine
{

ResumeDataService::ResumeDataService(TransferBackend &backend,
                                     TorrentRegistry &registry,
                                     PersistenceStore &store,
                                     std::chrono::milliseconds timeout)
    : backend_(backend), registry_(registry), store_(store), timeout_(timeout)
{
}

std::size_t ResumeDataService::request_checkpoints()
{
    std::size_t requested = 0;
    for (auto const &handle : registry_.handles())
    {
        try
        {
            if (!handle->is_valid() || !handle->need_save_resume_data())
            {
                continue;
            }
            handle->save_resume_data();
            ++requested;
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("{}: checkpoint request failed: {}",
                        handle->fingerprint(), ex.what());
        }
    }
    return requested;
}

SaveReport ResumeDataService::save_all()
{
    SaveReport report;
    std::size_t outstanding = request_checkpoints();
    report.requested = outstanding;
    if (outstanding == 0)
    {
        return report;
    }
    TM_LOG_INFO("waiting for {} checkpoint(s)", outstanding);

    auto const deadline = Clock::now() + timeout_;
    while (outstanding > 0)
    {
        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now());
        if (remaining <= std::chrono::milliseconds::zero())
        {
            TM_LOG_WARN("checkpoint timeout: {} torrent(s) not saved",
                        outstanding);
            report.timed_out = true;
            break;
        }

        bool ready = false;
        try
        {
            ready = backend_.wait_for_event(std::min(remaining, kWaitSlice));
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("waiting for checkpoints failed: {}", ex.what());
        }
        if (!ready)
        {
            continue;
        }

        std::vector<BackendEvent> events;
        try
        {
            events = backend_.pop_events();
        }
        catch (std::exception const &ex)
        {
            TM_LOG_WARN("reading checkpoint events failed: {}", ex.what());
            continue;
        }
        for (auto const &event : events)
        {
            std::visit(
                [&](auto const &e)
                {
                    using T = std::decay_t<decltype(e)>;
                    if constexpr (std::is_same_v<T, CheckpointSavedEvent>)
                    {
                        if (persist(e.fingerprint, e.data))
                        {
                            ++report.written;
                        }
                        if (outstanding > 0)
                        {
                            --outstanding;
                        }
                    }
                    else if constexpr (std::is_same_v<T,
                                                      CheckpointFailedEvent>)
                    {
                        TM_LOG_WARN("{}: checkpoint failed: {}", e.fingerprint,
                                    e.message);
                        ++report.failed;
                        if (outstanding > 0)
                        {
                            --outstanding;
                        }
                    }
                },
                event);
        }
    }
    report.outstanding = outstanding;
    if (!report.timed_out)
    {
        TM_LOG_INFO("checkpoints complete: {} written, {} failed",
                    report.written, report.failed);
    }
    return report;
}

bool ResumeDataService::persist(std::string const &fingerprint,
                                std::vector<std::uint8_t> const &data)
{
    auto handle = registry_.find(fingerprint);
    if (!handle || !handle->is_valid())
    {
        TM_LOG_DEBUG("{}: dropping checkpoint for untracked torrent",
                     fingerprint);
        return false;
    }
    if (data.empty())
    {
        return false;
    }
    if (!store_.write_resume_data(fingerprint, data))
    {
        TM_LOG_WARN("{}: failed to write checkpoint", fingerprint);
        return false;
    }
    return true;
}

} // namespace tmax::engine
