#pragma once

#include "Platform.hpp"

#define STRATA_NODISCARD [[nodiscard]]
#define STRATA_LIKELY [[likely]]
#define STRATA_UNLIKELY [[unlikely]]

#if defined(STRATA_COMPILER_MSVC)
    #define STRATA_FORCEINLINE __forceinline
    #define STRATA_NOINLINE __declspec(noinline)
#else
    #define STRATA_FORCEINLINE inline __attribute__((always_inline))
    #define STRATA_NOINLINE __attribute__((noinline))
#endif

// Debug-only assertion. Use STRATA_VERIFY (Core/Contract.hpp) for checks that must hold in every build.
#ifdef STRATA_BUILD_DEBUG
    #include <cassert>
    #define STRATA_ASSERT(condition, message) assert((condition) && (message))
#else
    #define STRATA_ASSERT(condition, message) ((void)0)
#endif
