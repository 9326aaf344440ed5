#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Memory.hpp"
#include "../Core/Result.hpp"
#include "../Entity/Pointer.hpp"
#include "../Schema/DataType.hpp"

namespace Strata
{
    /**
    * Contiguous array of fixed-width elements backing one attribute of one
    * archetype. Row i of the archetype is element i of every column.
    *
    * Get/Set are the trusted fast path: no bounds, type or value checks beyond
    * debug assertions. Typed access requires sizeof(T) == ElementSize().
    */
    class Column
    {
    public:
        Column(std::uint32_t elementSize, std::vector<std::byte> initialValue) :
            m_elementSize(elementSize),
            m_initial(std::move(initialValue))
        {
            STRATA_ASSERT(m_elementSize > 0, "Column element size must be non-zero");
            STRATA_ASSERT(m_initial.size() == m_elementSize, "Initial value must match element size");
        }

        Column(Column&&) noexcept = default;
        Column& operator=(Column&&) noexcept = default;
        Column(const Column&) = delete;
        Column& operator=(const Column&) = delete;

        template<typename T>
        STRATA_NODISCARD STRATA_FORCEINLINE const T& Get(RowIndex row) const noexcept
        {
            STRATA_ASSERT(sizeof(T) == m_elementSize, "Type width does not match column");
            STRATA_ASSERT(row < m_size, "Row out of range");
            return reinterpret_cast<const T*>(m_data.get())[row];
        }

        template<typename T>
        STRATA_FORCEINLINE void Set(RowIndex row, const T& value) noexcept
        {
            STRATA_ASSERT(sizeof(T) == m_elementSize, "Type width does not match column");
            STRATA_ASSERT(row < m_size, "Row out of range");
            reinterpret_cast<T*>(m_data.get())[row] = value;
        }

        // Whole-column view for bare-array loops.
        template<typename T>
        STRATA_NODISCARD std::span<T> Data() noexcept
        {
            STRATA_ASSERT(sizeof(T) == m_elementSize, "Type width does not match column");
            return std::span<T>(reinterpret_cast<T*>(m_data.get()), m_size);
        }

        template<typename T>
        STRATA_NODISCARD std::span<const T> Data() const noexcept
        {
            STRATA_ASSERT(sizeof(T) == m_elementSize, "Type width does not match column");
            return std::span<const T>(reinterpret_cast<const T*>(m_data.get()), m_size);
        }

        STRATA_NODISCARD std::byte* GetBytes(RowIndex row) noexcept
        {
            STRATA_ASSERT(row < m_size, "Row out of range");
            return m_data.get() + static_cast<std::size_t>(row) * m_elementSize;
        }

        STRATA_NODISCARD const std::byte* GetBytes(RowIndex row) const noexcept
        {
            STRATA_ASSERT(row < m_size, "Row out of range");
            return m_data.get() + static_cast<std::size_t>(row) * m_elementSize;
        }

        // Pointer columns: decode/encode the stored width, mapping its sentinel to NULL_ROW.
        STRATA_NODISCARD RowIndex GetRow(RowIndex row) const noexcept
        {
            return LoadRowIndex(GetBytes(row), m_elementSize);
        }

        void SetRow(RowIndex row, RowIndex value) noexcept
        {
            StoreRowIndex(GetBytes(row), m_elementSize, value);
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_size; }
        STRATA_NODISCARD std::size_t Capacity() const noexcept { return m_capacity; }
        STRATA_NODISCARD std::uint32_t ElementSize() const noexcept { return m_elementSize; }
        STRATA_NODISCARD std::span<const std::byte> InitialValue() const noexcept { return m_initial; }

        Result<void> Reserve(std::size_t rows)
        {
            if (rows <= m_capacity)
                return OK;

            AlignedBytes grown = AllocateBytes(rows * m_elementSize);
            if (!grown) STRATA_UNLIKELY
                return Err(ErrorCode::AllocationFailed);

            if (m_size > 0)
            {
                std::memcpy(grown.get(), m_data.get(), m_size * m_elementSize);
            }
            m_data = std::move(grown);
            m_capacity = rows;
            return OK;
        }

        // Appends `count` rows holding the initial value.
        Result<void> Append(std::size_t count)
        {
            if (count == 0)
                return OK;

            std::size_t required = m_size + count;
            if (required > m_capacity)
            {
                std::size_t grown = std::max({required, m_capacity * config::COLUMN_GROWTH_FACTOR, config::COLUMN_MIN_CAPACITY});
                if (auto reserved = Reserve(grown); !reserved) STRATA_UNLIKELY
                    return reserved;
            }

            std::byte* dst = m_data.get() + m_size * m_elementSize;
            for (std::size_t i = 0; i < count; ++i)
            {
                std::memcpy(dst + i * m_elementSize, m_initial.data(), m_elementSize);
            }
            m_size = required;
            return OK;
        }

        /**
        * Stable compaction: element `old` moves to remap[old], or is dropped when
        * remap[old] is NULL_ROW. Surviving targets must be increasing, which lets
        * the move run forward in place.
        */
        void Compact(std::span<const RowIndex> remap, std::size_t newSize) noexcept
        {
            STRATA_ASSERT(remap.size() == m_size, "Remap must cover every row");
            std::byte* base = m_data.get();
            for (std::size_t old = 0; old < remap.size(); ++old)
            {
                RowIndex dst = remap[old];
                if (dst == NULL_ROW || dst == old)
                    continue;
                STRATA_ASSERT(dst < old, "Stable compaction only moves rows down");
                std::memcpy(base + static_cast<std::size_t>(dst) * m_elementSize, base + old * m_elementSize, m_elementSize);
            }
            m_size = newSize;
        }

        // Gather in place: new row k takes old row order[k]. Follows each cycle of the permutation once.
        void Permute(std::span<const RowIndex> order)
        {
            STRATA_ASSERT(order.size() == m_size, "Permutation must cover every row");
            std::vector<bool> placed(m_size, false);
            std::vector<std::byte> held(m_elementSize);
            std::byte* base = m_data.get();

            for (std::size_t start = 0; start < m_size; ++start)
            {
                if (placed[start])
                    continue;
                if (order[start] == start)
                {
                    placed[start] = true;
                    continue;
                }

                std::memcpy(held.data(), base + start * m_elementSize, m_elementSize);
                std::size_t k = start;
                while (true)
                {
                    std::size_t next = order[k];
                    placed[k] = true;
                    if (next == start)
                    {
                        std::memcpy(base + k * m_elementSize, held.data(), m_elementSize);
                        break;
                    }
                    std::memcpy(base + k * m_elementSize, base + next * m_elementSize, m_elementSize);
                    k = next;
                }
            }
        }

    private:
        AlignedBytes m_data;
        std::size_t m_size = 0;
        std::size_t m_capacity = 0;
        std::uint32_t m_elementSize;
        std::vector<std::byte> m_initial;
    };
}
