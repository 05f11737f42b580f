#pragma once

#include "engine/TransferBackend.hpp"
#include "engine/Types.hpp"

#include <cstdint>
#include <string>

namespace tmax::engine
{

class SnapshotBuilder
{
  public:
    // An error wins over the paused flag, which wins over the phase.
    static TorrentState to_state(HandleStatus const &status);

    // Whole seconds until the wanted bytes are done at the current rate;
    // -1 when the rate is zero or nothing is left to fetch.
    static std::int64_t estimate_eta(HandleStatus const &status);

    static TorrentSnapshot build_snapshot(std::string const &fingerprint,
                                          HandleStatus const &status);
};

char const *to_string(TorrentState state);

} // namespace tmax::engine
