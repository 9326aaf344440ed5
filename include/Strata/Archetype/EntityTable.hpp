#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Result.hpp"
#include "../Entity/Pointer.hpp"
#include "../Entity/PointerIndex.hpp"
#include "../Schema/ComponentDescriptor.hpp"
#include "../Storage/ComponentStorage.hpp"

namespace Strata
{
    /**
    * All rows of one archetype: one storage per component (indexed by the
    * component's slot), the destruction marks and the PointerIndex.
    *
    * Every Column and SparseMatrixColumn holds exactly Size() rows. Rows only
    * disappear through ApplyCompaction and only move through ApplyCompaction
    * or ApplyPermutation; both bump the epoch.
    */
    class EntityTable
    {
    public:
        EntityTable(ArchetypeID id, RowIndex maxRows) : m_id(id), m_maxRows(maxRows) {}

        EntityTable(EntityTable&&) noexcept = default;
        EntityTable& operator=(EntityTable&&) noexcept = default;
        EntityTable(const EntityTable&) = delete;
        EntityTable& operator=(const EntityTable&) = delete;

        // Adds the storage for a newly defined component, backfilling existing rows with its initial value.
        Result<void> AddStorage(const ComponentDescriptor& desc)
        {
            STRATA_ASSERT(desc.slot == m_storages.size(), "Storage slots are assigned in definition order");

            ComponentStorage storage = MakeStorage(desc);
            if (auto reserved = StorageOps::Reserve(storage, m_capacity); !reserved) STRATA_UNLIKELY
                return reserved;
            if (auto filled = StorageOps::Append(storage, m_size); !filled) STRATA_UNLIKELY
                return filled;

            m_storages.push_back(std::move(storage));
            return OK;
        }

        // Appends `count` rows holding initial values. Returns the first new row.
        Result<RowIndex> Create(std::size_t count = 1)
        {
            if (count > static_cast<std::size_t>(m_maxRows) - m_size) STRATA_UNLIKELY
                return Err(ErrorCode::CapacityExceeded);

            std::size_t required = m_size + count;
            if (required > m_capacity)
            {
                std::size_t grown = std::max({required, m_capacity * config::COLUMN_GROWTH_FACTOR, config::COLUMN_MIN_CAPACITY});
                grown = std::min(grown, static_cast<std::size_t>(m_maxRows));
                if (auto reserved = Reserve(grown); !reserved) STRATA_UNLIKELY
                    return Err(reserved.Error());
            }

            for (ComponentStorage& storage : m_storages)
            {
                // Capacity is already reserved, so this does not allocate for columns.
                if (auto appended = StorageOps::Append(storage, count); !appended) STRATA_UNLIKELY
                    return Err(appended.Error());
            }

            RowIndex first = static_cast<RowIndex>(m_size);
            m_marked.resize(required, 0);
            for (std::size_t i = 0; i < count; ++i)
            {
                m_index.Acquire(static_cast<RowIndex>(m_size + i));
            }
            m_size = required;
            return first;
        }

        Result<void> Reserve(std::size_t rows)
        {
            if (rows <= m_capacity)
                return OK;

            for (ComponentStorage& storage : m_storages)
            {
                if (auto reserved = StorageOps::Reserve(storage, rows); !reserved) STRATA_UNLIKELY
                    return reserved;
            }
            m_marked.reserve(rows);
            m_index.Reserve(rows);
            m_capacity = rows;
            return OK;
        }

        // Returns true if the row was not marked before.
        bool Mark(RowIndex row) noexcept
        {
            STRATA_ASSERT(row < m_size, "Row out of range");
            if (m_marked[row])
                return false;
            m_marked[row] = 1;
            ++m_markedCount;
            return true;
        }

        STRATA_NODISCARD bool IsMarked(RowIndex row) const noexcept
        {
            return row < m_size && m_marked[row] != 0;
        }

        STRATA_NODISCARD std::size_t MarkedCount() const noexcept { return m_markedCount; }

        template<typename Func>
        void ForEachLive(Func&& func) const
        {
            for (std::size_t row = 0; row < m_size; ++row)
            {
                if (!m_marked[row])
                    func(static_cast<RowIndex>(row));
            }
        }

        /**
        * Old -> new row map that drops every marked row and keeps survivors in
        * their relative order. Marked rows map to NULL_ROW.
        */
        STRATA_NODISCARD std::vector<RowIndex> BuildCompactionRemap() const
        {
            std::vector<RowIndex> remap(m_size);
            RowIndex next = 0;
            for (std::size_t row = 0; row < m_size; ++row)
            {
                remap[row] = m_marked[row] ? NULL_ROW : next++;
            }
            return remap;
        }

        void ApplyCompaction(std::span<const RowIndex> remap)
        {
            std::size_t newSize = m_size - m_markedCount;
            for (ComponentStorage& storage : m_storages)
            {
                StorageOps::Compact(storage, remap, newSize);
            }
            m_index.ApplyCompaction(remap, newSize);
            m_marked.assign(newSize, 0);
            m_markedCount = 0;
            m_size = newSize;
            ++m_epoch;
        }

        // New row k takes old row order[k]. Marks travel with their rows.
        void ApplyPermutation(std::span<const RowIndex> order)
        {
            for (ComponentStorage& storage : m_storages)
            {
                StorageOps::Permute(storage, order);
            }
            m_index.ApplyPermutation(order);

            std::vector<std::uint8_t> marked(m_size);
            for (std::size_t k = 0; k < m_size; ++k)
            {
                marked[k] = m_marked[order[k]];
            }
            m_marked = std::move(marked);
            ++m_epoch;
        }

        STRATA_NODISCARD ComponentStorage& GetStorage(std::uint32_t slot) noexcept
        {
            STRATA_ASSERT(slot < m_storages.size(), "Storage slot out of range");
            return m_storages[slot];
        }

        STRATA_NODISCARD const ComponentStorage& GetStorage(std::uint32_t slot) const noexcept
        {
            STRATA_ASSERT(slot < m_storages.size(), "Storage slot out of range");
            return m_storages[slot];
        }

        template<typename S>
        STRATA_NODISCARD S& Get(std::uint32_t slot) noexcept
        {
            STRATA_ASSERT(std::holds_alternative<S>(GetStorage(slot)), "Storage kind mismatch");
            return *std::get_if<S>(&GetStorage(slot));
        }

        template<typename S>
        STRATA_NODISCARD const S& Get(std::uint32_t slot) const noexcept
        {
            STRATA_ASSERT(std::holds_alternative<S>(GetStorage(slot)), "Storage kind mismatch");
            return *std::get_if<S>(&GetStorage(slot));
        }

        STRATA_NODISCARD PointerIndex& GetPointerIndex() noexcept { return m_index; }
        STRATA_NODISCARD const PointerIndex& GetPointerIndex() const noexcept { return m_index; }

        STRATA_NODISCARD ArchetypeID GetID() const noexcept { return m_id; }
        STRATA_NODISCARD std::size_t Size() const noexcept { return m_size; }
        STRATA_NODISCARD std::size_t Capacity() const noexcept { return m_capacity; }
        STRATA_NODISCARD std::size_t StorageCount() const noexcept { return m_storages.size(); }
        STRATA_NODISCARD std::uint64_t GetEpoch() const noexcept { return m_epoch; }

        STRATA_NODISCARD RowIndex MaxRows() const noexcept { return m_maxRows; }
        void LimitMaxRows(RowIndex limit) noexcept { m_maxRows = std::min(m_maxRows, limit); }

    private:
        ArchetypeID m_id;
        RowIndex m_maxRows;
        std::size_t m_size = 0;
        std::size_t m_capacity = 0;
        std::size_t m_markedCount = 0;
        std::uint64_t m_epoch = 0;

        std::vector<ComponentStorage> m_storages;
        std::vector<std::uint8_t> m_marked;
        PointerIndex m_index;
    };

    // Owned per archetype, indexed by ArchetypeID. Tables are heap-allocated so handles keep a stable address.
    using TableList = std::vector<std::unique_ptr<EntityTable>>;
}
