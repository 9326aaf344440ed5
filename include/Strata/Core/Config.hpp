#pragma once

#include <cstddef>
#include <cstdint>

#include "Base.hpp"

#define STRATA_VERSION_MAJOR 0
#define STRATA_VERSION_MINOR 1
#define STRATA_VERSION_PATCH 0

#define STRATA_VERSION ((STRATA_VERSION_MAJOR << 16) | (STRATA_VERSION_MINOR << 8) | STRATA_VERSION_PATCH)

// Largest fixed-size opaque payload a component may declare.
// Usage: #define STRATA_MAX_OPAQUE_SIZE 1024 before including Strata
#ifndef STRATA_MAX_OPAQUE_SIZE
    #define STRATA_MAX_OPAQUE_SIZE 256u
#endif

namespace Strata
{
    namespace config
    {
        inline constexpr std::size_t CACHE_LINE_SIZE = 64;

        // Every column buffer starts on this boundary so whole-column loops vectorize.
        inline constexpr std::size_t COLUMN_ALIGNMENT = CACHE_LINE_SIZE;

        inline constexpr std::size_t COLUMN_MIN_CAPACITY = 64;

        inline constexpr std::size_t COLUMN_GROWTH_FACTOR = 2;

        // Column buffers at least this large are advised towards transparent huge pages.
        inline constexpr std::size_t HUGE_PAGE_THRESHOLD = 1024 * 1024;

        inline constexpr std::size_t MAX_OPAQUE_SIZE = STRATA_MAX_OPAQUE_SIZE;
    }

    inline constexpr int VERSION_MAJOR = STRATA_VERSION_MAJOR;
    inline constexpr int VERSION_MINOR = STRATA_VERSION_MINOR;
    inline constexpr int VERSION_PATCH = STRATA_VERSION_PATCH;
    inline constexpr int VERSION = STRATA_VERSION;

    template<typename T>
    inline constexpr T AlignUp(T value, T alignment) noexcept
    {
        return (value + alignment - 1) & ~(alignment - 1);
    }
}
