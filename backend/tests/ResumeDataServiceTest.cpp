#include "FakeBackend.hpp"
#include "TestUtils.hpp"

#include "engine/Events.hpp"
#include "engine/ResumeDataService.hpp"
#include "engine/TorrentRegistry.hpp"

#include <chrono>
#include <memory>
#include <vector>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using tmax::engine::CheckpointFailedEvent;
using tmax::engine::CheckpointSavedEvent;
using tmax::engine::ResumeDataService;
using tmax::engine::TorrentRegistry;
using tmax::test::FakeBackend;
using tmax::test::FakeBackendState;
using tmax::test::FakeHandle;
using tmax::test::MemoryStore;
using tmax::test::fingerprint;

namespace
{

struct Fixture
{
    std::shared_ptr<FakeBackendState> state =
        std::make_shared<FakeBackendState>();
    FakeBackend backend{state};
    TorrentRegistry registry;
    MemoryStore store;
    std::vector<std::shared_ptr<FakeHandle>> handles;

    std::shared_ptr<FakeHandle> add(char digit)
    {
        auto handle = std::make_shared<FakeHandle>(
            fingerprint(digit), std::string("torrent-") + digit, "/downloads");
        REQUIRE(registry.insert(handle));
        handles.push_back(handle);
        return handle;
    }
};

CheckpointSavedEvent saved(char digit)
{
    return {fingerprint(digit), {'r', static_cast<std::uint8_t>(digit)}};
}

} // namespace

TEST_CASE("checkpoint round returns at once when nothing needs saving")
{
    Fixture f;
    auto clean = f.add('a');
    clean->needs_save = false;
    auto gone = f.add('b');
    gone->valid = false;

    ResumeDataService service(f.backend, f.registry, f.store, 5s);
    auto const started = std::chrono::steady_clock::now();
    auto report = service.save_all();

    CHECK(report.requested == 0);
    CHECK(report.outstanding == 0);
    CHECK_FALSE(report.timed_out);
    CHECK(clean->save_requests == 0);
    CHECK(gone->save_requests == 0);
    CHECK(std::chrono::steady_clock::now() - started < 500ms);
}

TEST_CASE("two saved and one failed completion drain the round")
{
    Fixture f;
    f.add('a');
    f.add('b');
    f.add('c');
    f.state->push(saved('a'));
    f.state->push(CheckpointFailedEvent{fingerprint('b'), "disk full"});
    f.state->push(saved('c'));

    tmax::test::LogCapture log("checkpoint-drained");
    ResumeDataService service(f.backend, f.registry, f.store, 8s);
    auto const started = std::chrono::steady_clock::now();
    auto report = service.save_all();

    CHECK(report.requested == 3);
    CHECK(report.outstanding == 0);
    CHECK(report.written == 2);
    CHECK(report.failed == 1);
    CHECK_FALSE(report.timed_out);
    CHECK(f.store.resume.size() == 2);
    CHECK(f.store.resume.contains(fingerprint('a')));
    CHECK(f.store.resume.contains(fingerprint('c')));
    CHECK_FALSE(f.store.resume.contains(fingerprint('b')));
    CHECK(std::chrono::steady_clock::now() - started < 2s);
    for (auto const &handle : f.handles)
    {
        CHECK(handle->save_requests == 1);
    }
    CHECK_FALSE(log.contains("checkpoint timeout"));
}

TEST_CASE("missing completions are abandoned at the deadline")
{
    Fixture f;
    f.add('a');
    f.add('b');
    f.add('c');
    f.state->push(saved('b'));

    tmax::test::LogCapture log("checkpoint-abandoned");
    ResumeDataService service(f.backend, f.registry, f.store, 300ms);
    auto const started = std::chrono::steady_clock::now();
    auto report = service.save_all();
    auto const elapsed = std::chrono::steady_clock::now() - started;

    CHECK(report.requested == 3);
    CHECK(report.outstanding == 2);
    CHECK(report.written == 1);
    CHECK(report.timed_out);
    CHECK(elapsed >= 300ms);
    CHECK(elapsed < 2s);
    if (TM_LOGGING_ENABLED)
    {
        CHECK(log.contains("checkpoint timeout: 2 torrent(s) not saved"));
    }
}

TEST_CASE("completions count regardless of order and unrelated events")
{
    Fixture f;
    f.add('a');
    f.add('b');
    f.add('c');
    f.state->push(tmax::engine::ListenSucceededEvent{"0.0.0.0:6881", 6881});
    f.state->push(saved('c'));
    f.state->push(tmax::engine::TorrentErrorEvent{fingerprint('a'), "boom",
                                                  "file"});
    f.state->push_after(100ms, tmax::engine::TorrentFinishedEvent{
                                   fingerprint('b'), "torrent-b"});
    f.state->push_after(150ms, saved('a'));
    f.state->push_after(250ms, CheckpointFailedEvent{fingerprint('b'), "io"});

    ResumeDataService service(f.backend, f.registry, f.store, 3s);
    auto report = service.save_all();

    CHECK(report.outstanding == 0);
    CHECK(report.written == 2);
    CHECK(report.failed == 1);
    CHECK_FALSE(report.timed_out);
}

TEST_CASE("late completions arriving in separate slices are collected")
{
    Fixture f;
    f.add('a');
    f.add('b');
    f.state->push_after(1200ms, saved('a'));
    f.state->push_after(1500ms, saved('b'));

    ResumeDataService service(f.backend, f.registry, f.store, 4s);
    auto report = service.save_all();

    CHECK(report.outstanding == 0);
    CHECK(report.written == 2);
    CHECK_FALSE(report.timed_out);
}

TEST_CASE("checkpoints are not written for handles that became invalid")
{
    Fixture f;
    auto a = f.add('a');
    f.add('b');
    a->on_save_request = [](FakeHandle &handle) { handle.valid = false; };
    f.state->push(saved('a'));
    f.state->push(saved('b'));

    ResumeDataService service(f.backend, f.registry, f.store, 2s);
    auto report = service.save_all();

    CHECK(report.requested == 2);
    CHECK(report.outstanding == 0);
    CHECK(report.written == 1);
    CHECK_FALSE(f.store.resume.contains(fingerprint('a')));
    CHECK(f.store.resume.contains(fingerprint('b')));
}

TEST_CASE("store failures still count as completions")
{
    Fixture f;
    f.add('a');
    f.store.fail_writes = true;
    f.state->push(saved('a'));

    ResumeDataService service(f.backend, f.registry, f.store, 2s);
    auto report = service.save_all();

    CHECK(report.outstanding == 0);
    CHECK(report.written == 0);
    CHECK(f.store.resume_writes == 1);
}

TEST_CASE("extra completions never push the counter below zero")
{
    Fixture f;
    f.add('a');
    f.state->push(saved('a'));
    f.state->push(saved('a'));
    f.state->push(CheckpointFailedEvent{fingerprint('a'), "late"});

    ResumeDataService service(f.backend, f.registry, f.store, 2s);
    auto report = service.save_all();

    CHECK(report.requested == 1);
    CHECK(report.outstanding == 0);
    CHECK_FALSE(report.timed_out);
}
