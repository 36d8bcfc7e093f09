#pragma once

#include <cstdint>

#include "../Core/Base.hpp"

namespace Strata
{
    /**
     * @brief Scope of mutation an access window may perform
     *
     * - ReadOnly: reads component and resource values
     * - DataMut: also mutates values, but no spawn/despawn/insert/remove and no type registration
     * - FullMut: anything, and no other window may be live at the same time
     */
    enum class AccessMode : std::uint8_t
    {
        ReadOnly = 0,
        DataMut = 1,
        FullMut = 2
    };

    STRATA_NODISCARD constexpr AccessMode Merge(AccessMode a, AccessMode b) noexcept
    {
        return a < b ? b : a;
    }

    // True if a window granted `granted` may perform work that needs `required`
    STRATA_NODISCARD constexpr bool Permits(AccessMode granted, AccessMode required) noexcept
    {
        return granted >= required;
    }

    STRATA_NODISCARD constexpr const char* ToString(AccessMode mode) noexcept
    {
        switch (mode)
        {
            case AccessMode::ReadOnly: return "ReadOnly";
            case AccessMode::DataMut: return "DataMut";
            case AccessMode::FullMut: return "FullMut";
        }
        return "Unknown";
    }
}
