#include "FakeBackend.hpp"
#include "TestUtils.hpp"

#include "engine/TorrentRegistry.hpp"

#include <memory>

#include <doctest/doctest.h>

using tmax::engine::TorrentRegistry;
using tmax::test::FakeHandle;
using tmax::test::fingerprint;

namespace
{

std::shared_ptr<FakeHandle> make_handle(char digit)
{
    return std::make_shared<FakeHandle>(fingerprint(digit), "t", "/tmp");
}

} // namespace

TEST_CASE("registry keeps one entry per fingerprint")
{
    TorrentRegistry registry;
    auto first = make_handle('a');
    CHECK(registry.insert(first));
    CHECK_FALSE(registry.insert(make_handle('a')));
    CHECK(registry.size() == 1);
    CHECK(registry.find(fingerprint('a')) == first);
}

TEST_CASE("registry refuses handles that are not usable")
{
    TorrentRegistry registry;
    auto invalid = make_handle('b');
    invalid->valid = false;
    CHECK_FALSE(registry.insert(invalid));
    CHECK_FALSE(registry.insert(nullptr));
    CHECK(registry.empty());
}

TEST_CASE("registry lists handles in insertion order")
{
    TorrentRegistry registry;
    registry.insert(make_handle('c'));
    registry.insert(make_handle('a'));
    registry.insert(make_handle('b'));

    auto handles = registry.handles();
    REQUIRE(handles.size() == 3);
    CHECK(handles[0]->fingerprint() == fingerprint('c'));
    CHECK(handles[1]->fingerprint() == fingerprint('a'));
    CHECK(handles[2]->fingerprint() == fingerprint('b'));

    auto taken = registry.take(fingerprint('a'));
    REQUIRE(taken);
    CHECK_FALSE(registry.contains(fingerprint('a')));
    CHECK(registry.take(fingerprint('a')) == nullptr);
    handles = registry.handles();
    REQUIRE(handles.size() == 2);
    CHECK(handles[1]->fingerprint() == fingerprint('b'));

    CHECK(registry.insert(taken));
    CHECK(registry.handles().back() == taken);

    registry.clear();
    CHECK(registry.empty());
    CHECK(registry.handles().empty());
}

TEST_CASE("entries stay registered after their handle turns invalid")
{
    TorrentRegistry registry;
    auto handle = make_handle('d');
    REQUIRE(registry.insert(handle));
    handle->valid = false;
    CHECK(registry.contains(fingerprint('d')));
    CHECK_FALSE(registry.find(fingerprint('d'))->is_valid());
}
