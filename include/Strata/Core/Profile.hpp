#pragma once

#include <cstdint>

#include "Base.hpp"

// Tracy zones, only in Release builds compiled with TRACY_ENABLE
#if defined(STRATA_BUILD_RELEASE) && defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    #define STRATA_PROFILE_ZONE_NAMED(name) ZoneScopedN(name)
    #define STRATA_PROFILE_ZONE_NAMED_COLOR(name, color) ZoneScopedNC(name, color)
#else
    #define STRATA_PROFILE_ZONE_NAMED(name)
    #define STRATA_PROFILE_ZONE_NAMED_COLOR(name, color)
#endif

namespace Strata::Profile
{
    constexpr std::uint32_t ColorEntity = 0x88FF00;
    constexpr std::uint32_t ColorComponent = 0x0088FF;
    constexpr std::uint32_t ColorArchetype = 0xFF8800;
    constexpr std::uint32_t ColorQuery = 0x8800FF;
    constexpr std::uint32_t ColorCommands = 0x00DDDD;
}
