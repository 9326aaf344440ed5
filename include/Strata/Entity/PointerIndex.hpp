#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>

#include "../Core/Base.hpp"
#include "Pointer.hpp"

namespace Strata
{
    using StableID = std::uint32_t;
    using Version = std::uint32_t;

    inline constexpr StableID INVALID_STABLE_ID = std::numeric_limits<StableID>::max();

    /**
    * Per-archetype indirection from stable identities to current rows.
    *
    * Every live row owns exactly one identity and every identity in use names
    * exactly one row (rowToId and the slots are inverse maps). Identities are
    * recycled through a free list; releasing one bumps its version so handles
    * minted before the release no longer resolve.
    */
    class PointerIndex
    {
    public:
        static constexpr Version NULL_VERSION = 0;      // never handed out
        static constexpr Version INITIAL_VERSION = 1;

        // Binds a fresh identity to `row`, which must be the next row of the archetype.
        StableID Acquire(RowIndex row)
        {
            STRATA_ASSERT(row == m_rowToId.size(), "Identities are bound to rows in append order");

            StableID id;
            if (!m_freeList.empty())
            {
                id = m_freeList.back();
                m_freeList.pop_back();
                m_slots[id].row = row;
            }
            else
            {
                id = static_cast<StableID>(m_slots.size());
                m_slots.push_back(Slot{row, INITIAL_VERSION});
            }
            m_rowToId.push_back(id);
            return id;
        }

        STRATA_NODISCARD StableID IdAt(RowIndex row) const noexcept
        {
            STRATA_ASSERT(row < m_rowToId.size(), "Row out of range");
            return m_rowToId[row];
        }

        STRATA_NODISCARD Version GetVersion(StableID id) const noexcept
        {
            return id < m_slots.size() ? m_slots[id].version : NULL_VERSION;
        }

        // Current row of (id, version), or NULL_ROW when the identity has been released since.
        STRATA_NODISCARD RowIndex Resolve(StableID id, Version version) const noexcept
        {
            if (id >= m_slots.size()) STRATA_UNLIKELY
                return NULL_ROW;
            const Slot& slot = m_slots[id];
            if (slot.version != version || slot.row == NULL_ROW) STRATA_UNLIKELY
                return NULL_ROW;
            return slot.row;
        }

        STRATA_NODISCARD bool IsAlive(StableID id, Version version) const noexcept
        {
            return Resolve(id, version) != NULL_ROW;
        }

        /**
        * Follows a stable compaction: identities of dropped rows (remap NULL_ROW)
        * are released, survivors are re-pointed at their new row.
        */
        void ApplyCompaction(std::span<const RowIndex> remap, std::size_t newCount)
        {
            STRATA_ASSERT(remap.size() == m_rowToId.size(), "Remap must cover every row");
            for (std::size_t old = 0; old < remap.size(); ++old)
            {
                StableID id = m_rowToId[old];
                RowIndex dst = remap[old];
                if (dst == NULL_ROW)
                {
                    Release(id);
                    continue;
                }
                m_slots[id].row = dst;
                m_rowToId[dst] = id;
            }
            m_rowToId.resize(newCount);
        }

        // New row k is old row order[k].
        void ApplyPermutation(std::span<const RowIndex> order)
        {
            STRATA_ASSERT(order.size() == m_rowToId.size(), "Permutation must cover every row");
            std::vector<StableID> rowToId(order.size());
            for (std::size_t k = 0; k < order.size(); ++k)
            {
                StableID id = m_rowToId[order[k]];
                rowToId[k] = id;
                m_slots[id].row = static_cast<RowIndex>(k);
            }
            m_rowToId = std::move(rowToId);
        }

        void Reserve(std::size_t rows)
        {
            m_rowToId.reserve(rows);
            m_slots.reserve(rows);
        }

        STRATA_NODISCARD std::size_t LiveCount() const noexcept { return m_rowToId.size(); }
        STRATA_NODISCARD std::size_t SlotCount() const noexcept { return m_slots.size(); }
        STRATA_NODISCARD std::size_t FreeCount() const noexcept { return m_freeList.size(); }

    private:
        struct Slot
        {
            RowIndex row;
            Version version;
        };

        void Release(StableID id)
        {
            Slot& slot = m_slots[id];
            slot.row = NULL_ROW;
            ++slot.version;
            if (slot.version == NULL_VERSION) STRATA_UNLIKELY
            {
                slot.version = INITIAL_VERSION;
            }
            m_freeList.push_back(id);
        }

        std::vector<Slot> m_slots;
        std::vector<StableID> m_rowToId;
        std::vector<StableID> m_freeList;
    };
}
