#pragma once

// Compiler detection
#if defined(_MSC_VER)
    #define STRATA_COMPILER_MSVC 1
#elif defined(__clang__)
    #define STRATA_COMPILER_CLANG 1
#elif defined(__GNUC__)
    #define STRATA_COMPILER_GCC 1
#else
    #error "Unsupported compiler"
#endif

// The build system defines one of these; fall back to NDEBUG otherwise
#if !defined(STRATA_BUILD_DEBUG) && !defined(STRATA_BUILD_RELEASE)
    #if defined(NDEBUG)
        #define STRATA_BUILD_RELEASE 1
    #else
        #define STRATA_BUILD_DEBUG 1
    #endif
#endif
