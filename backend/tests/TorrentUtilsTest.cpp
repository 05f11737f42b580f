#include "engine/TorrentUtils.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using namespace tmax::engine;

TEST_CASE("fingerprints are canonicalised to lower-case hex")
{
    auto upper = canonical_fingerprint("ABCDEF0123456789ABCDEF0123456789ABCDEF01");
    REQUIRE(upper);
    CHECK(*upper == "abcdef0123456789abcdef0123456789abcdef01");

    CHECK_FALSE(canonical_fingerprint(""));
    CHECK_FALSE(canonical_fingerprint("abcdef"));
    CHECK_FALSE(
        canonical_fingerprint("zzcdef0123456789abcdef0123456789abcdef01"));
    CHECK_FALSE(
        canonical_fingerprint("abcdef0123456789abcdef0123456789abcdef0123"));
}

TEST_CASE("raw digests render as fingerprints")
{
    std::vector<std::uint8_t> bytes(20, 0);
    bytes[0] = 0xAB;
    bytes[19] = 0x01;
    auto text = fingerprint_from_bytes(bytes.data(), bytes.size());
    CHECK(text.size() == kFingerprintLength);
    CHECK(text.substr(0, 2) == "ab");
    CHECK(text.substr(38) == "01");
}

TEST_CASE("magnet links are recognised case-insensitively")
{
    CHECK(is_magnet_uri("magnet:?xt=urn:btih:abc"));
    CHECK(is_magnet_uri("MAGNET:?xt=urn:btih:abc"));
    CHECK_FALSE(is_magnet_uri("/tmp/file.torrent"));
    CHECK_FALSE(is_magnet_uri("magne"));
}

TEST_CASE("restore magnets carry name and trackers percent-encoded")
{
    std::string const fp(40, 'e');
    auto uri = build_magnet_uri(
        fp, "My File & more",
        {"udp://tracker.example:80/announce", "", "http://t.example/a?b=c"});
    CHECK(uri ==
          "magnet:?xt=urn:btih:" + fp +
              "&dn=My%20File%20%26%20more"
              "&tr=udp%3A%2F%2Ftracker.example%3A80%2Fannounce"
              "&tr=http%3A%2F%2Ft.example%2Fa%3Fb%3Dc");

    CHECK(build_magnet_uri(fp, "", {}) == "magnet:?xt=urn:btih:" + fp);
}
