#pragma once

// Platform Detection
#if defined(_WIN32) || defined(_WIN64)
    #define STRATA_PLATFORM_WINDOWS 1
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#elif defined(__APPLE__) && defined(__MACH__)
    #define STRATA_PLATFORM_APPLE 1
#elif defined(__linux__)
    #define STRATA_PLATFORM_LINUX 1
#elif defined(__unix__)
    #define STRATA_PLATFORM_UNIX 1
#else
    #error "Unknown platform"
#endif

#if defined(STRATA_PLATFORM_APPLE) || defined(STRATA_PLATFORM_LINUX) || defined(STRATA_PLATFORM_UNIX)
    #define STRATA_PLATFORM_POSIX 1
#endif

// Compiler Detection
#if defined(_MSC_VER)
    #define STRATA_COMPILER_MSVC 1
    #define STRATA_COMPILER_VERSION _MSC_VER
#elif defined(__clang__)
    #define STRATA_COMPILER_CLANG 1
    #define STRATA_COMPILER_VERSION (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif defined(__GNUC__) || defined(__GNUG__)
    #define STRATA_COMPILER_GCC 1
    #define STRATA_COMPILER_VERSION (__GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__)
#else
    #error "Unknown compiler"
#endif

// Columns store scalars in native byte order; pointer widths are decoded in place.
#if defined(__BYTE_ORDER__)
    #if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
        #define STRATA_LITTLE_ENDIAN 1
    #elif __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
        #define STRATA_BIG_ENDIAN 1
    #endif
#elif defined(_MSC_VER)
    #define STRATA_LITTLE_ENDIAN 1
#endif

// Build Configuration Detection (set by build system)
#if defined(STRATA_BUILD_DEBUG)
    #define STRATA_BUILD_TYPE "Debug"
#elif defined(STRATA_BUILD_RELEASE)
    #define STRATA_BUILD_TYPE "Release"
#else
    #define STRATA_BUILD_TYPE "Unknown"
#endif

#if __cplusplus < 202002L && !defined(_MSVC_LANG)
    #error "Strata requires C++20 or later"
#endif
