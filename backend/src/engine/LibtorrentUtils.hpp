#pragma once

#include "engine/TorrentUtils.hpp"

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/info_hash.hpp>
#include <libtorrent/sha1_hash.hpp>
#include <libtorrent/torrent_handle.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace tmax::engine {

inline bool hash_is_nonzero(libtorrent::sha1_hash const &hash) {
  return !hash.is_all_zeros();
}

// The v1 btih whenever the torrent has one, so hybrid torrents keep the key
// their magnet links and swarms use. v2-only torrents fall back to the
// truncated v2 digest.
inline std::optional<std::string>
fingerprint_of(libtorrent::info_hash_t const &hashes) {
  libtorrent::sha1_hash key;
  if (hashes.has_v1()) {
    key = hashes.v1;
  } else if (hashes.has_v2()) {
    key = hashes.get(libtorrent::protocol_version::V2);
  }
  if (!hash_is_nonzero(key)) {
    return std::nullopt;
  }
  return fingerprint_from_bytes(
      reinterpret_cast<std::uint8_t const *>(key.data()), key.size());
}

inline std::optional<std::string>
fingerprint_of(libtorrent::add_torrent_params const &params) {
  if (auto fingerprint = fingerprint_of(params.info_hashes)) {
    return fingerprint;
  }
  if (params.ti) {
    return fingerprint_of(params.ti->info_hashes());
  }
  return std::nullopt;
}

inline std::optional<std::string>
fingerprint_of(libtorrent::torrent_handle const &handle) {
  if (!handle.is_valid()) {
    return std::nullopt;
  }
  return fingerprint_of(handle.info_hashes());
}

} // namespace tmax::engine
