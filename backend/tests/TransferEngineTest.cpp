#include "FakeBackend.hpp"
#include "TestUtils.hpp"

#include "engine/TransferEngine.hpp"

#include <chrono>
#include <fstream>
#include <memory>
#include <string>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using tmax::engine::AddTorrentStatus;
using tmax::engine::TransferEngine;
using tmax::test::FakeBackendState;
using tmax::test::MemoryStore;
using tmax::test::fake_factory;
using tmax::test::fingerprint;

namespace
{

std::string const kMagnetA =
    "magnet:?xt=urn:btih:aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa&dn=alpha";
std::string const kMagnetB =
    "magnet:?xt=urn:btih:bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb&dn=beta";

struct EngineFixture
{
    std::shared_ptr<FakeBackendState> state =
        std::make_shared<FakeBackendState>();
    MemoryStore store;
    std::filesystem::path root;
    TransferEngine engine;

    explicit EngineFixture(std::string_view tag)
        : root(tmax::test::make_temp_root(tag)),
          engine(fake_factory(state), store, 500ms)
    {
        state->add_source(kMagnetA, fingerprint('a'), "alpha");
        state->add_source(kMagnetB, fingerprint('b'), "beta");
    }

    void start()
    {
        REQUIRE(engine.start(root, 6881));
    }
};

void write_text(std::filesystem::path const &path, std::string const &text)
{
    std::ofstream out(path, std::ios::binary);
    out << text;
}

} // namespace

TEST_CASE("start seeds the bootstrap nodes and reports running")
{
    EngineFixture f("engine-start");
    f.start();

    CHECK(f.engine.is_running());
    REQUIRE(f.state->config);
    CHECK(f.state->config->listen_port == 6881);
    CHECK(f.state->config->session_state.empty());
    REQUIRE(f.state->bootstrap_nodes.size() == 5);
    CHECK(f.state->bootstrap_nodes.front().first == "router.bittorrent.com");
    CHECK(f.state->bootstrap_nodes[3].second == 25401);
    f.engine.stop(f.root);
}

TEST_CASE("start hands previously saved session state to the backend")
{
    EngineFixture f("engine-session-state");
    write_text(f.root / tmax::engine::kSessionStateFile, "saved-dht");
    f.start();

    REQUIRE(f.state->config);
    auto const &bytes = f.state->config->session_state;
    CHECK(std::string(bytes.begin(), bytes.end()) == "saved-dht");
    f.engine.stop(f.root);
}

TEST_CASE("start leaves the engine stopped when the backend cannot be built")
{
    EngineFixture f("engine-start-fail");
    f.state->fail_construct = true;

    CHECK_FALSE(f.engine.start(f.root, 6881));
    CHECK_FALSE(f.engine.is_running());
    auto result = f.engine.add(kMagnetA, f.root);
    CHECK(result.status == AddTorrentStatus::NotRunning);
}

TEST_CASE("operations on a stopped engine are no-ops")
{
    EngineFixture f("engine-not-running");

    auto result = f.engine.add(kMagnetA, f.root);
    CHECK(result.status == AddTorrentStatus::NotRunning);
    CHECK(result.handle == nullptr);
    f.engine.apply_settings({{"connections_limit", 10}});
    CHECK_FALSE(f.engine.snapshot_session_stats());
    CHECK(f.engine.drain_alerts().empty());
    CHECK_FALSE(f.engine.remove(fingerprint('a'), false));
    CHECK_FALSE(f.engine.persist_torrent_list());
    f.engine.stop(f.root);
    CHECK(f.state->pause_calls == 0);
}

TEST_CASE("stop twice has the same effect as stopping once")
{
    EngineFixture f("engine-stop-twice");
    f.start();
    REQUIRE(f.engine.add(kMagnetA, f.root).ok());
    f.state->handles[fingerprint('a')]->needs_save = false;

    f.engine.stop(f.root);
    CHECK_FALSE(f.engine.is_running());
    CHECK(f.state->pause_calls == 1);
    CHECK(f.state->save_state_calls == 1);
    CHECK(f.state->destroyed == 1);
    CHECK(f.engine.handles().empty());
    CHECK(std::filesystem::exists(f.root / tmax::engine::kSessionStateFile));

    f.engine.stop(f.root);
    CHECK(f.state->pause_calls == 1);
    CHECK(f.state->save_state_calls == 1);
    CHECK(f.state->destroyed == 1);
}

TEST_CASE("stop persists checkpoints delivered before the deadline")
{
    EngineFixture f("engine-stop-checkpoints");
    f.start();
    REQUIRE(f.engine.add(kMagnetA, f.root).ok());
    REQUIRE(f.engine.add(kMagnetB, f.root).ok());
    f.state->handles[fingerprint('a')]->on_save_request =
        [state = f.state](tmax::test::FakeHandle &handle)
    {
        state->push(tmax::engine::CheckpointSavedEvent{handle.fingerprint(),
                                                       {'o', 'k'}});
    };

    f.engine.stop(f.root);
    auto report = f.engine.last_save_report();
    REQUIRE(report);
    CHECK(report->requested == 2);
    CHECK(report->written == 1);
    CHECK(report->outstanding == 1);
    CHECK(report->timed_out);
    CHECK(f.store.resume.contains(fingerprint('a')));
}

TEST_CASE("add reports each failure class separately")
{
    EngineFixture f("engine-add-errors");
    f.start();

    SUBCASE("malformed magnet")
    {
        auto result = f.engine.add("magnet:?xt=urn:btih:nothex", f.root);
        CHECK(result.status == AddTorrentStatus::InvalidSource);
    }
    SUBCASE("missing descriptor file")
    {
        auto result =
            f.engine.add((f.root / "missing.torrent").string(), f.root);
        CHECK(result.status == AddTorrentStatus::NotFound);
    }
    SUBCASE("unparseable descriptor file")
    {
        auto path = f.root / "broken.torrent";
        write_text(path, "not bencode");
        auto result = f.engine.add(path.string(), f.root);
        CHECK(result.status == AddTorrentStatus::BackendRejected);
    }
    SUBCASE("backend refuses the torrent")
    {
        f.state->reject_add = true;
        auto result = f.engine.add(kMagnetA, f.root);
        CHECK(result.status == AddTorrentStatus::BackendRejected);
        CHECK(f.engine.handles().empty());
    }
    f.engine.stop(f.root);
}

TEST_CASE("add accepts descriptor files and attaches stored resume data")
{
    EngineFixture f("engine-add-resume");
    auto path = f.root / "gamma.torrent";
    write_text(path, "d4:infoe");
    f.state->add_source("d4:infoe", fingerprint('c'), "gamma");
    f.store.resume[fingerprint('c')] = {'r', 'e', 's'};
    f.start();

    auto result = f.engine.add(path.string(), f.root / "dl");
    REQUIRE(result.ok());
    CHECK(result.handle->fingerprint() == fingerprint('c'));
    REQUIRE(f.state->added.size() == 1);
    auto const &params = f.state->added.front();
    CHECK_FALSE(params.uri);
    CHECK(params.save_path == f.root / "dl");
    CHECK(params.resume_data == std::vector<std::uint8_t>{'r', 'e', 's'});
    f.engine.stop(f.root);
}

TEST_CASE("adding the same torrent twice keeps one registry entry")
{
    EngineFixture f("engine-add-duplicate");
    f.start();

    auto first = f.engine.add(kMagnetA, f.root);
    auto second = f.engine.add(kMagnetA, f.root);
    REQUIRE(first.ok());
    REQUIRE(second.ok());
    CHECK(first.handle == second.handle);
    CHECK(f.engine.handles().size() == 1);
    CHECK(f.state->added.size() == 1);

    f.state->handles[fingerprint('a')]->valid = false;
    auto third = f.engine.add(kMagnetA, f.root);
    REQUIRE(third.ok());
    CHECK(third.handle != first.handle);
    CHECK(f.engine.handles().size() == 1);
    f.engine.stop(f.root);
}

TEST_CASE("remove drops the entry even when the backend fails")
{
    EngineFixture f("engine-remove");
    f.start();
    REQUIRE(f.engine.add(kMagnetA, f.root).ok());
    REQUIRE(f.engine.add(kMagnetB, f.root).ok());
    f.store.resume[fingerprint('b')] = {'x'};

    f.state->remove_throws = true;
    CHECK(f.engine.remove(fingerprint('A'), false));
    CHECK(f.engine.handles().size() == 1);

    f.state->remove_throws = false;
    CHECK(f.engine.remove(fingerprint('b'), true));
    CHECK(f.engine.handles().empty());
    REQUIRE(f.state->removed.size() == 1);
    CHECK(f.state->removed.front().second);
    CHECK_FALSE(f.store.resume.contains(fingerprint('b')));

    CHECK_FALSE(f.engine.remove(fingerprint('b'), false));
    CHECK_FALSE(f.engine.remove("not-a-fingerprint", false));
    f.engine.stop(f.root);
}

TEST_CASE("pause and resume reach the registered handle")
{
    EngineFixture f("engine-pause");
    f.start();
    REQUIRE(f.engine.add(kMagnetA, f.root).ok());

    CHECK(f.engine.pause(fingerprint('a')));
    CHECK(f.state->handles[fingerprint('a')]->paused);
    CHECK(f.engine.resume(fingerprint('a')));
    CHECK_FALSE(f.state->handles[fingerprint('a')]->paused);
    CHECK_FALSE(f.engine.pause(fingerprint('d')));
    f.engine.stop(f.root);
}

TEST_CASE("torrent snapshots follow the registered handles")
{
    EngineFixture f("engine-snapshots");
    CHECK(f.engine.snapshot_torrents().empty());
    f.start();
    REQUIRE(f.engine.add(kMagnetA, f.root).ok());
    REQUIRE(f.engine.add(kMagnetB, f.root).ok());

    auto alpha = f.state->handles[fingerprint('a')];
    alpha->readings.phase = tmax::engine::TransferPhase::Downloading;
    alpha->readings.download_rate = 1000;
    alpha->readings.total_wanted = 5000;
    alpha->readings.total_wanted_done = 1000;
    auto beta = f.state->handles[fingerprint('b')];
    beta->readings.phase = tmax::engine::TransferPhase::Seeding;

    REQUIRE(f.engine.pause(fingerprint('b')));
    auto snapshots = f.engine.snapshot_torrents();
    REQUIRE(snapshots.size() == 2);
    CHECK(snapshots[0].fingerprint == fingerprint('a'));
    CHECK(snapshots[0].name == "alpha");
    CHECK(snapshots[0].state == tmax::engine::TorrentState::Downloading);
    CHECK(snapshots[0].eta_seconds == 4);
    CHECK(snapshots[0].save_path == f.root);
    CHECK(snapshots[1].state == tmax::engine::TorrentState::Paused);

    alpha->status_unavailable = true;
    beta->valid = false;
    CHECK(f.engine.snapshot_torrents().empty());
    f.engine.stop(f.root);
}

TEST_CASE("settings are merged into the live session")
{
    EngineFixture f("engine-settings");
    f.start();

    f.engine.apply_settings({{"connections_limit", 50}});
    f.engine.apply_settings({{"enable_dht", false}});
    CHECK(f.state->applied.size() == 2);
    auto limit = f.engine.setting("connections_limit");
    REQUIRE(limit);
    CHECK(std::get<int>(*limit) == 50);
    auto dht = f.engine.setting("enable_dht");
    REQUIRE(dht);
    CHECK_FALSE(std::get<bool>(*dht));
    f.engine.stop(f.root);
}

TEST_CASE("session stats are best effort")
{
    EngineFixture f("engine-stats");
    f.start();

    f.state->stats = tmax::engine::SessionStats{2048, 1024, 7, 120};
    auto stats = f.engine.snapshot_session_stats();
    REQUIRE(stats);
    CHECK(stats->download_rate == 2048);
    CHECK(stats->peer_count == 7);
    CHECK(stats->dht_node_count == 120);

    f.state->stats_throw = true;
    CHECK_FALSE(f.engine.snapshot_session_stats());
    f.engine.stop(f.root);
}

TEST_CASE("drained checkpoint events are persisted by dispatch")
{
    EngineFixture f("engine-dispatch");
    f.start();
    REQUIRE(f.engine.add(kMagnetA, f.root).ok());

    f.state->push(tmax::engine::CheckpointSavedEvent{fingerprint('a'), {'1'}});
    f.state->push(tmax::engine::CheckpointSavedEvent{fingerprint('e'), {'2'}});
    f.state->push(tmax::engine::MetadataReceivedEvent{fingerprint('a'),
                                                      "alpha"});
    auto events = f.engine.drain_alerts();
    CHECK(events.size() == 3);
    CHECK(f.engine.drain_alerts().empty());

    f.engine.dispatch(events);
    CHECK(f.store.resume.contains(fingerprint('a')));
    CHECK_FALSE(f.store.resume.contains(fingerprint('e')));
    CHECK(f.state->handles[fingerprint('a')]->save_requests == 1);
    f.state->handles[fingerprint('a')]->needs_save = false;
    f.engine.stop(f.root);
}

TEST_CASE("torrent list is saved from live handles and loaded back")
{
    EngineFixture f("engine-torrent-list");
    f.start();
    REQUIRE(f.engine.add(kMagnetA, f.root / "a").ok());
    REQUIRE(f.engine.add(kMagnetB, f.root / "b").ok());
    f.state->handles[fingerprint('b')]->valid = false;

    CHECK(f.engine.persist_torrent_list());
    REQUIRE(f.store.list.size() == 1);
    CHECK(f.store.list.front().fingerprint == fingerprint('a'));
    CHECK(f.store.list.front().name == "alpha");
    CHECK(f.store.list.front().save_path == f.root / "a");

    auto loaded = f.engine.load_torrent_list();
    CHECK(loaded.size() == 1);

    f.store.fail_reads = true;
    CHECK(f.engine.load_torrent_list().empty());
    f.engine.stop(f.root);
}
