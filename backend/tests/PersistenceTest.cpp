#include "TestUtils.hpp"

#include "engine/PersistenceManager.hpp"
#include "utils/StateStore.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using tmax::engine::PersistenceManager;
using tmax::engine::TorrentListEntry;
using tmax::test::fingerprint;

TEST_CASE("resume records survive reopening the database")
{
    auto root = tmax::test::make_temp_root("persistence-resume");
    auto db_path = root / "state.db";
    std::vector<std::uint8_t> const blob{'d', '4', ':', 'a', 'b', 'c', 'd', 'e'};
    {
        PersistenceManager store(db_path);
        REQUIRE(store.is_valid());
        CHECK_FALSE(store.read_resume_data(fingerprint('a')));
        CHECK(store.write_resume_data(fingerprint('a'), blob));
        CHECK(store.write_resume_data(fingerprint('b'), {'x'}));
    }
    {
        PersistenceManager store(db_path);
        REQUIRE(store.is_valid());
        auto loaded = store.read_resume_data(fingerprint('a'));
        REQUIRE(loaded);
        CHECK(*loaded == blob);

        CHECK(store.remove_resume_data(fingerprint('b')));
        CHECK_FALSE(store.read_resume_data(fingerprint('b')));
    }
}

TEST_CASE("latest resume record replaces the previous one")
{
    auto root = tmax::test::make_temp_root("persistence-overwrite");
    PersistenceManager store(root / "state.db");
    REQUIRE(store.is_valid());
    CHECK(store.write_resume_data(fingerprint('c'), {1, 2, 3}));
    CHECK(store.write_resume_data(fingerprint('c'), {4}));
    auto loaded = store.read_resume_data(fingerprint('c'));
    REQUIRE(loaded);
    CHECK(*loaded == std::vector<std::uint8_t>{4});
}

TEST_CASE("torrent list keeps order and trackers")
{
    auto root = tmax::test::make_temp_root("persistence-list");
    auto db_path = root / "state.db";
    {
        PersistenceManager store(db_path);
        REQUIRE(store.is_valid());

        std::vector<TorrentListEntry> entries;
        entries.push_back({fingerprint('f'), root / "downloads", "Second",
                           {"udp://a.example:80", "http://b.example/announce"}});
        entries.push_back({fingerprint('1'), root / "other", "First", {}});
        CHECK(store.write_torrent_list(entries));

        // A shorter list replaces the previous rows entirely.
        entries.pop_back();
        entries.front().name = "Renamed";
        CHECK(store.write_torrent_list(entries));
        entries.push_back({fingerprint('2'), root, "Third", {"udp://c"}});
        CHECK(store.write_torrent_list(entries));
    }

    PersistenceManager store(db_path);
    auto list = store.read_torrent_list();
    REQUIRE(list);
    REQUIRE(list->size() == 2);
    CHECK((*list)[0].fingerprint == fingerprint('f'));
    CHECK((*list)[0].name == "Renamed");
    CHECK((*list)[0].save_path == root / "downloads");
    CHECK((*list)[0].trackers ==
          std::vector<std::string>{"udp://a.example:80",
                                   "http://b.example/announce"});
    CHECK((*list)[1].fingerprint == fingerprint('2'));
    CHECK((*list)[1].trackers == std::vector<std::string>{"udp://c"});
}

TEST_CASE("rows with malformed hashes are skipped on load")
{
    auto root = tmax::test::make_temp_root("persistence-bad-hash");
    auto db_path = root / "state.db";
    {
        tmax::storage::Database database(db_path);
        REQUIRE(database.is_valid());
        std::vector<tmax::storage::TorrentListRow> rows(2);
        rows[0].hash = "not-a-hash";
        rows[0].save_path = root.string();
        rows[1].hash = std::string(40, 'A');
        rows[1].save_path = root.string();
        rows[1].trackers_json = "[\"udp://x\"]";
        REQUIRE(database.replace_torrent_list(rows));
    }

    PersistenceManager store(db_path);
    auto list = store.read_torrent_list();
    REQUIRE(list);
    REQUIRE(list->size() == 1);
    CHECK(list->front().fingerprint == fingerprint('a'));
    CHECK(list->front().trackers == std::vector<std::string>{"udp://x"});
}

TEST_CASE("an unusable database reports failure instead of throwing")
{
    PersistenceManager store{std::filesystem::path{}};
    CHECK_FALSE(store.is_valid());
    CHECK_FALSE(store.write_resume_data(fingerprint('a'), {1}));
    CHECK_FALSE(store.read_resume_data(fingerprint('a')));
    CHECK_FALSE(store.remove_resume_data(fingerprint('a')));
    CHECK_FALSE(store.write_torrent_list({}));
    CHECK_FALSE(store.read_torrent_list());
}
