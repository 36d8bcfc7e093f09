#pragma once

#include <cstddef>
#include <cstdint>

#include "Base.hpp"

// Override before including Strata, e.g. #define STRATA_MAX_COMPONENTS 256u
#ifndef STRATA_MAX_COMPONENTS
    #define STRATA_MAX_COMPONENTS 128u
#endif

#ifndef STRATA_MAX_RESOURCES
    #define STRATA_MAX_RESOURCES 64u
#endif

namespace Strata
{
    namespace config
    {
        inline constexpr std::size_t MAX_COMPONENTS = STRATA_MAX_COMPONENTS;

        inline constexpr std::size_t MAX_RESOURCES = STRATA_MAX_RESOURCES;

        // Highest usable entity index. The all-ones index is the invalid sentinel.
        inline constexpr std::uint32_t MAX_ENTITY_INDEX = 0xFFFFFFFEu;

        // Minimum byte capacity a column allocates on its first growth
        inline constexpr std::size_t COLUMN_MIN_BYTES = 256;
    }
}
