#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>

#include "Config.hpp"
#include "Profile.hpp"

#ifdef STRATA_PLATFORM_WINDOWS
    #include <malloc.h>
#else
    #include <sys/mman.h>
#endif

namespace Strata
{
    /**
     * Allocate an aligned block for column data.
     * Large blocks are advised towards transparent huge pages where the kernel
     * supports it; columns of millions of rows are walked linearly every step.
     * Returns nullptr on failure.
     */
    STRATA_FORCEINLINE void* AllocateMemory(std::size_t size, std::size_t alignment = config::COLUMN_ALIGNMENT) noexcept
    {
        if (size == 0)
            return nullptr;

        size = AlignUp(size, alignment);
        void* ptr = nullptr;

        #ifdef STRATA_PLATFORM_WINDOWS
            ptr = _aligned_malloc(size, alignment);
        #else
            if (posix_memalign(&ptr, alignment, size) != 0)
            {
                ptr = nullptr;
            }
            #ifdef MADV_HUGEPAGE
                else if (size >= config::HUGE_PAGE_THRESHOLD)
                {
                    madvise(ptr, size, MADV_HUGEPAGE);
                }
            #endif
        #endif

        STRATA_PROFILE_ALLOC(ptr, size);
        return ptr;
    }

    STRATA_FORCEINLINE void FreeMemory(void* ptr) noexcept
    {
        if (!ptr) return;

        STRATA_PROFILE_FREE(ptr);
        #ifdef STRATA_PLATFORM_WINDOWS
            _aligned_free(ptr);
        #else
            std::free(ptr);
        #endif
    }

    struct MemoryDeleter
    {
        void operator()(std::byte* ptr) const noexcept
        {
            FreeMemory(ptr);
        }
    };

    using AlignedBytes = std::unique_ptr<std::byte[], MemoryDeleter>;

    inline AlignedBytes AllocateBytes(std::size_t size)
    {
        return AlignedBytes(static_cast<std::byte*>(AllocateMemory(size)));
    }
}
