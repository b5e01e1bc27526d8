#pragma once

#ifndef RT_BUILD_VERSION
#define RT_BUILD_VERSION "0.0.0-dev"
#endif

namespace rt::version
{

inline constexpr char const kSemanticVersion[] = RT_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] =
    "ReelTorrent " RT_BUILD_VERSION;
inline constexpr char const kUserAgentVersion[] =
    "ReelTorrent/" RT_BUILD_VERSION;

} // namespace rt::version
