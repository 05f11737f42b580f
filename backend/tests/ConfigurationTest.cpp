#include "TestUtils.hpp"

#include "engine/ConfigurationService.hpp"
#include "engine/PersistenceManager.hpp"
#include "utils/StateStore.hpp"

#include <chrono>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <variant>

#include <doctest/doctest.h>

using tmax::engine::ConfigurationService;
using tmax::engine::EngineSettings;
using tmax::engine::PersistenceManager;

TEST_CASE("ConfigurationService persists user settings")
{
    auto temp_root = tmax::test::make_temp_root("config");
    auto db_path = temp_root / "state.db";

    EngineSettings defaults;
    defaults.state_dir = temp_root;
    defaults.download_path = temp_root / "downloads";
    {
        PersistenceManager persistence(db_path);
        REQUIRE(persistence.is_valid());

        ConfigurationService config(&persistence, defaults);
        auto initial = config.get();
        CHECK(initial.listen_port == 6881);
        CHECK(initial.download_path == defaults.download_path);
        CHECK_FALSE(config.is_dirty());

        auto const new_path = temp_root / "downloads2";
        config.set_listen_port(51413);
        config.set_download_path(new_path);
        config.set_rate_limits(512000, 64000);
        config.set_manual_profile("lan");
        config.set_auto_profile(false);
        CHECK(config.is_dirty());

        config.persist_if_dirty();
        CHECK_FALSE(config.is_dirty());

        tmax::storage::Database reader(db_path);
        REQUIRE(reader.is_valid());
        auto persisted_port = reader.get_setting("listenPort");
        REQUIRE(persisted_port);
        CHECK(*persisted_port == "51413");
        auto persisted_path = reader.get_setting("downloadPath");
        REQUIRE(persisted_path);
        CHECK(*persisted_path == new_path.string());
    }

    PersistenceManager persistence(db_path);
    ConfigurationService reloaded(&persistence, defaults);
    reloaded.load();
    auto settings = reloaded.get();
    CHECK(settings.listen_port == 51413);
    CHECK(settings.download_path == temp_root / "downloads2");
    CHECK(settings.max_download_rate == 512000);
    CHECK(settings.max_upload_rate == 64000);
    CHECK(settings.manual_profile == "lan");
    CHECK_FALSE(settings.auto_profile);
    CHECK(settings.checkpoint_timeout == std::chrono::milliseconds(8000));
}

TEST_CASE("invalid listen ports are ignored")
{
    ConfigurationService config(nullptr, EngineSettings{});
    config.set_listen_port(0);
    config.set_listen_port(70000);
    CHECK(config.get().listen_port == 6881);
    CHECK_FALSE(config.is_dirty());
}

TEST_CASE("malformed stored values fall back to defaults")
{
    auto temp_root = tmax::test::make_temp_root("config-malformed");
    auto db_path = temp_root / "state.db";
    {
        tmax::storage::Database writer(db_path);
        REQUIRE(writer.is_valid());
        REQUIRE(writer.set_setting("listenPort", "not-a-port"));
        REQUIRE(writer.set_setting("maxUploadRate", "-5"));
        REQUIRE(writer.set_setting("checkpointTimeoutMs", "2500"));
    }

    PersistenceManager persistence(db_path);
    ConfigurationService config(&persistence, EngineSettings{});
    config.load();
    auto settings = config.get();
    CHECK(settings.listen_port == 6881);
    CHECK(settings.max_upload_rate == 0);
    CHECK(settings.checkpoint_timeout == std::chrono::milliseconds(2500));
}

TEST_CASE("stored values that do not fit are not narrowed")
{
    auto temp_root = tmax::test::make_temp_root("config-range");
    auto db_path = temp_root / "state.db";
    {
        tmax::storage::Database writer(db_path);
        REQUIRE(writer.is_valid());
        REQUIRE(writer.set_setting("maxDownloadRate", "5000000000"));
        REQUIRE(writer.set_setting("maxUploadRate", "2147483647"));
        REQUIRE(writer.set_setting("listenPort", "70000"));
        REQUIRE(writer.set_setting("checkpointTimeoutMs", "-100"));
    }

    EngineSettings defaults;
    defaults.max_download_rate = 300;
    PersistenceManager persistence(db_path);
    ConfigurationService config(&persistence, defaults);
    config.load();
    auto settings = config.get();
    CHECK(settings.max_download_rate == 300);
    CHECK(settings.max_upload_rate == std::numeric_limits<int>::max());
    CHECK(settings.listen_port == 6881);
    CHECK(settings.checkpoint_timeout == std::chrono::seconds(8));
}

TEST_CASE("only positive limits become session overrides")
{
    ConfigurationService config(nullptr, EngineSettings{});
    CHECK(config.rate_limit_settings().empty());

    config.set_rate_limits(1024, std::nullopt);
    auto limits = config.rate_limit_settings();
    REQUIRE(limits.size() == 1);
    CHECK(std::get<int>(limits.at("download_rate_limit")) == 1024);

    config.set_rate_limits(std::nullopt, -1);
    CHECK(config.get().max_upload_rate == 0);
    CHECK_FALSE(config.rate_limit_settings().contains("upload_rate_limit"));
}
