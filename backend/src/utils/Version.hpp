#pragma once

#ifndef TM_BUILD_VERSION
#define TM_BUILD_VERSION "1.0.0"
#endif

namespace tmax::version
{

inline constexpr char const kDisplayVersion[] = "TorrentMax " TM_BUILD_VERSION;
inline constexpr char const kUserAgentVersion[] =
    "TorrentMax/" TM_BUILD_VERSION;

} // namespace tmax::version
