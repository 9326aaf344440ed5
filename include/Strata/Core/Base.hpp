#pragma once

#include "../Platform/Platform.hpp"

#define STRATA_NODISCARD [[nodiscard]]
#define STRATA_UNLIKELY [[unlikely]]

#if defined(STRATA_COMPILER_MSVC)
    #define STRATA_FORCEINLINE __forceinline
#elif defined(STRATA_COMPILER_GCC) || defined(STRATA_COMPILER_CLANG)
    #define STRATA_FORCEINLINE inline __attribute__((always_inline))
#else
    #define STRATA_FORCEINLINE inline
#endif

// Guards the unchecked programmer surface. Compiled out unless STRATA_BUILD_DEBUG is set.
#ifdef STRATA_BUILD_DEBUG
    #include <cassert>
    #define STRATA_ASSERT(condition, message) assert((condition) && (message))
#else
    #define STRATA_ASSERT(condition, message) ((void)0)
#endif
