#pragma once

#include <cstdint>
#include <functional>
#include <limits>

#include "../Core/Base.hpp"

namespace Strata
{
    using ArchetypeID = std::uint32_t;
    using ComponentID = std::uint32_t;
    using RowIndex = std::uint32_t;

    inline constexpr ArchetypeID INVALID_ARCHETYPE = std::numeric_limits<ArchetypeID>::max();
    inline constexpr ComponentID INVALID_COMPONENT = std::numeric_limits<ComponentID>::max();

    // NULL is the top of the range, never zero, so row 0 stays a valid reference.
    inline constexpr RowIndex NULL_ROW = std::numeric_limits<RowIndex>::max();

    /**
    * Transient reference to one entity: the archetype it belongs to plus its
    * current row. Valid until the next Commit() or Reorder() touching that
    * archetype; hold an EntityHandle to survive those.
    */
    struct Pointer
    {
        ArchetypeID archetype = INVALID_ARCHETYPE;
        RowIndex row = NULL_ROW;

        constexpr Pointer() noexcept = default;
        constexpr Pointer(ArchetypeID arch, RowIndex r) noexcept : archetype(arch), row(r) {}

        STRATA_NODISCARD static constexpr Pointer Null(ArchetypeID arch) noexcept
        {
            return Pointer(arch, NULL_ROW);
        }

        STRATA_NODISCARD constexpr bool IsNull() const noexcept { return row == NULL_ROW; }
        STRATA_NODISCARD constexpr explicit operator bool() const noexcept { return !IsNull(); }

        constexpr bool operator==(const Pointer& other) const noexcept = default;
    };
}

namespace std
{
    template<>
    struct hash<Strata::Pointer>
    {
        STRATA_NODISCARD std::size_t operator()(const Strata::Pointer& p) const noexcept
        {
            return std::hash<std::uint64_t>{}((static_cast<std::uint64_t>(p.archetype) << 32) | p.row);
        }
    };
}
