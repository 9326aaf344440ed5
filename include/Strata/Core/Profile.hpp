#pragma once

#include "Base.hpp"

// Tracy integration - only enabled in Release builds with TRACY_ENABLE
#if defined(STRATA_BUILD_RELEASE) && defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    #define STRATA_PROFILE_ZONE_NAMED(name) ZoneScopedN(name)

    #define STRATA_PROFILE_FUNCTION() ZoneScoped

    // Commit and reorder are the engine's "frames": the caller's turn ends there.
    #define STRATA_PROFILE_FRAME_MARK_NAMED(name) FrameMarkNamed(name)

    #define STRATA_PROFILE_ALLOC(ptr, size) TracyAlloc(ptr, size)
    #define STRATA_PROFILE_FREE(ptr) TracyFree(ptr)

    #define STRATA_PROFILE_PLOT(name, val) TracyPlot(name, val)

    #define STRATA_PROFILE_MESSAGE_LITERAL(text) TracyMessageL(text)
#else
    #define STRATA_PROFILE_ZONE_NAMED(name)

    #define STRATA_PROFILE_FUNCTION()

    #define STRATA_PROFILE_FRAME_MARK_NAMED(name)

    #define STRATA_PROFILE_ALLOC(ptr, size)
    #define STRATA_PROFILE_FREE(ptr)

    #define STRATA_PROFILE_PLOT(name, val)

    #define STRATA_PROFILE_MESSAGE_LITERAL(text)
#endif
