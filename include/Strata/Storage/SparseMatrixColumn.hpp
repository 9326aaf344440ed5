#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "../Entity/Pointer.hpp"

namespace Strata
{
    using SparseOffset = std::uint64_t;

    template<typename T>
    struct SparseEntry
    {
        RowIndex target;
        T value;
    };

    // Read-only view of one row of a sparse matrix: parallel (target, value) arrays.
    class SparseRowView
    {
    public:
        SparseRowView(std::span<const RowIndex> targets, const std::byte* values, std::uint32_t valueSize) noexcept :
            m_targets(targets),
            m_values(values),
            m_valueSize(valueSize)
        {}

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_targets.size(); }
        STRATA_NODISCARD bool Empty() const noexcept { return m_targets.empty(); }

        STRATA_NODISCARD RowIndex Target(std::size_t k) const noexcept { return m_targets[k]; }
        STRATA_NODISCARD std::span<const RowIndex> Targets() const noexcept { return m_targets; }

        template<typename T>
        STRATA_NODISCARD T Value(std::size_t k) const noexcept
        {
            STRATA_ASSERT(sizeof(T) == m_valueSize, "Type width does not match sparse values");
            T value;
            std::memcpy(&value, m_values + k * m_valueSize, sizeof(T));
            return value;
        }

        STRATA_NODISCARD const std::byte* ValueBytes(std::size_t k) const noexcept
        {
            return m_values + k * m_valueSize;
        }

    private:
        std::span<const RowIndex> m_targets;
        const std::byte* m_values;
        std::uint32_t m_valueSize;
    };

    /**
    * Compressed-sparse-row storage of per-entity (target row, value) lists.
    *
    * Row i owns the half-open slice [offsets[i], offsets[i+1]) of the targets
    * and values arrays. offsets has RowCount() + 1 entries, never decreases and
    * ends at NonZeroCount(). Every public mutation keeps that invariant; rebuild
    * input that would break it is rejected with DataError and leaves the matrix
    * untouched. A value size of zero is a pure connectivity matrix.
    */
    class SparseMatrixColumn
    {
    public:
        explicit SparseMatrixColumn(std::uint32_t valueSize) : m_offsets{0}, m_valueSize(valueSize) {}

        STRATA_NODISCARD std::size_t RowCount() const noexcept { return m_offsets.size() - 1; }
        STRATA_NODISCARD std::size_t NonZeroCount() const noexcept { return m_targets.size(); }
        STRATA_NODISCARD std::uint32_t ValueSize() const noexcept { return m_valueSize; }

        STRATA_NODISCARD SparseRowView Row(RowIndex row) const noexcept
        {
            STRATA_ASSERT(row < RowCount(), "Row out of range");
            SparseOffset begin = m_offsets[row];
            SparseOffset end = m_offsets[row + 1];
            return SparseRowView(
                std::span<const RowIndex>(m_targets.data() + begin, end - begin),
                m_values.data() + begin * m_valueSize,
                m_valueSize);
        }

        STRATA_NODISCARD std::span<const SparseOffset> Offsets() const noexcept { return m_offsets; }
        STRATA_NODISCARD std::span<const RowIndex> Targets() const noexcept { return m_targets; }
        STRATA_NODISCARD std::span<const std::byte> ValueBytes() const noexcept { return m_values; }

        // Mutable view over all values, e.g. for a weight update pass. Structure stays fixed.
        template<typename T>
        STRATA_NODISCARD std::span<T> Values() noexcept
        {
            STRATA_ASSERT(sizeof(T) == m_valueSize, "Type width does not match sparse values");
            return std::span<T>(reinterpret_cast<T*>(m_values.data()), m_targets.size());
        }

        /**
        * Replace the whole structure from raw CSR arrays.
        * @param targetLimit Row count of the target archetype; every target must be below it.
        */
        Result<void> Rebuild(std::vector<SparseOffset> offsets, std::vector<RowIndex> targets, std::vector<std::byte> values, RowIndex targetLimit)
        {
            if (offsets.size() != m_offsets.size())
                return Err(ErrorCode::DataError, "Row offsets must have one entry per row plus one");
            if (offsets.front() != 0)
                return Err(ErrorCode::DataError, "Row offsets must start at zero");
            for (std::size_t i = 1; i < offsets.size(); ++i)
            {
                if (offsets[i] < offsets[i - 1])
                    return Err(ErrorCode::DataError, "Row offsets must be non-decreasing");
            }
            if (offsets.back() != targets.size())
                return Err(ErrorCode::DataError, "Final row offset must equal the number of entries");
            if (values.size() != targets.size() * m_valueSize)
                return Err(ErrorCode::DataError, "Value array does not match the number of entries");
            if (auto inRange = CheckTargets(targets, targetLimit); !inRange)
                return inRange;

            m_offsets = std::move(offsets);
            m_targets = std::move(targets);
            m_values = std::move(values);
            return OK;
        }

        // Replace the whole structure from one (target, value) list per row.
        template<typename T>
        Result<void> Rebuild(const std::vector<std::vector<SparseEntry<T>>>& rows, RowIndex targetLimit)
        {
            static_assert(std::is_trivially_copyable_v<T>, "Sparse values must be trivially copyable");
            if (sizeof(T) != m_valueSize)
                return Err(ErrorCode::TypeMismatch);
            if (rows.size() != RowCount())
                return Err(ErrorCode::DataError, "Sparse rebuild needs exactly one list per row");

            std::vector<SparseOffset> offsets;
            offsets.reserve(rows.size() + 1);
            offsets.push_back(0);

            std::size_t nnz = 0;
            for (const auto& row : rows)
            {
                nnz += row.size();
                offsets.push_back(nnz);
            }

            std::vector<RowIndex> targets;
            std::vector<std::byte> values(nnz * sizeof(T));
            targets.reserve(nnz);
            std::size_t k = 0;
            for (const auto& row : rows)
            {
                for (const auto& entry : row)
                {
                    targets.push_back(entry.target);
                    std::memcpy(values.data() + k * sizeof(T), &entry.value, sizeof(T));
                    ++k;
                }
            }

            return Rebuild(std::move(offsets), std::move(targets), std::move(values), targetLimit);
        }

        // Connectivity-only rebuild for matrices without values.
        Result<void> Rebuild(const std::vector<std::vector<RowIndex>>& rows, RowIndex targetLimit)
        {
            if (m_valueSize != 0)
                return Err(ErrorCode::TypeMismatch);
            if (rows.size() != RowCount())
                return Err(ErrorCode::DataError, "Sparse rebuild needs exactly one list per row");

            std::vector<SparseOffset> offsets;
            std::vector<RowIndex> targets;
            offsets.reserve(rows.size() + 1);
            offsets.push_back(0);
            for (const auto& row : rows)
            {
                targets.insert(targets.end(), row.begin(), row.end());
                offsets.push_back(targets.size());
            }

            return Rebuild(std::move(offsets), std::move(targets), {}, targetLimit);
        }

        // Replace a single row's entries. O(NonZeroCount()).
        template<typename T>
        Result<void> SetRow(RowIndex row, std::span<const SparseEntry<T>> entries, RowIndex targetLimit)
        {
            static_assert(std::is_trivially_copyable_v<T>, "Sparse values must be trivially copyable");
            if (sizeof(T) != m_valueSize)
                return Err(ErrorCode::TypeMismatch);

            std::vector<RowIndex> targets;
            std::vector<std::byte> values(entries.size() * sizeof(T));
            targets.reserve(entries.size());
            for (std::size_t k = 0; k < entries.size(); ++k)
            {
                targets.push_back(entries[k].target);
                std::memcpy(values.data() + k * sizeof(T), &entries[k].value, sizeof(T));
            }
            return SpliceRow(row, targets, values, targetLimit);
        }

        Result<void> SetRow(RowIndex row, std::span<const RowIndex> targets, RowIndex targetLimit)
        {
            if (m_valueSize != 0)
                return Err(ErrorCode::TypeMismatch);
            return SpliceRow(row, targets, {}, targetLimit);
        }

        void AppendRows(std::size_t count)
        {
            m_offsets.insert(m_offsets.end(), count, m_offsets.back());
        }

        // Keep owner rows whose remap entry is not NULL, in order, at their new index.
        void CompactRows(std::span<const RowIndex> remap, std::size_t newCount)
        {
            STRATA_ASSERT(remap.size() == RowCount(), "Remap must cover every row");
            std::vector<SparseOffset> offsets;
            offsets.reserve(newCount + 1);
            offsets.push_back(0);

            SparseOffset write = 0;
            for (std::size_t row = 0; row < remap.size(); ++row)
            {
                if (remap[row] == NULL_ROW)
                    continue;
                STRATA_ASSERT(remap[row] == offsets.size() - 1, "Compaction must preserve row order");

                for (SparseOffset k = m_offsets[row]; k < m_offsets[row + 1]; ++k, ++write)
                {
                    MoveEntry(k, write);
                }
                offsets.push_back(write);
            }

            STRATA_ASSERT(offsets.size() == newCount + 1, "Compaction row count mismatch");
            m_offsets = std::move(offsets);
            Truncate(write);
        }

        // New row k takes the entries of old row order[k].
        void PermuteRows(std::span<const RowIndex> order)
        {
            STRATA_ASSERT(order.size() == RowCount(), "Permutation must cover every row");
            std::vector<SparseOffset> offsets;
            std::vector<RowIndex> targets;
            std::vector<std::byte> values;
            offsets.reserve(m_offsets.size());
            targets.reserve(m_targets.size());
            values.reserve(m_values.size());
            offsets.push_back(0);

            for (RowIndex old : order)
            {
                SparseOffset begin = m_offsets[old];
                SparseOffset end = m_offsets[old + 1];
                targets.insert(targets.end(), m_targets.begin() + begin, m_targets.begin() + end);
                values.insert(values.end(), m_values.begin() + begin * m_valueSize, m_values.begin() + end * m_valueSize);
                offsets.push_back(targets.size());
            }

            m_offsets = std::move(offsets);
            m_targets = std::move(targets);
            m_values = std::move(values);
        }

        /**
        * Rewrite every target through `remap` (old target row -> new target row).
        * Entries whose target maps to NULL_ROW are removed.
        * @return Number of entries removed.
        */
        std::size_t RemapTargets(std::span<const RowIndex> remap)
        {
            std::size_t dropped = 0;
            SparseOffset write = 0;
            SparseOffset readBegin = 0;
            for (std::size_t row = 0; row + 1 < m_offsets.size(); ++row)
            {
                SparseOffset readEnd = m_offsets[row + 1];
                for (SparseOffset k = readBegin; k < readEnd; ++k)
                {
                    STRATA_ASSERT(m_targets[k] < remap.size(), "Sparse target out of range");
                    RowIndex mapped = remap[m_targets[k]];
                    if (mapped == NULL_ROW)
                    {
                        ++dropped;
                        continue;
                    }
                    MoveEntry(k, write);
                    m_targets[write] = mapped;
                    ++write;
                }
                readBegin = readEnd;
                m_offsets[row + 1] = write;
            }
            Truncate(write);
            return dropped;
        }

    private:
        static Result<void> CheckTargets(std::span<const RowIndex> targets, RowIndex targetLimit)
        {
            for (RowIndex target : targets)
            {
                if (target >= targetLimit)
                    return Err(ErrorCode::DataError, "Sparse target outside the target archetype");
            }
            return OK;
        }

        Result<void> SpliceRow(RowIndex row, std::span<const RowIndex> targets, std::span<const std::byte> values, RowIndex targetLimit)
        {
            if (row >= RowCount())
                return Err(ErrorCode::DataError, "Sparse row out of range");
            if (auto inRange = CheckTargets(targets, targetLimit); !inRange)
                return inRange;

            SparseOffset begin = m_offsets[row];
            SparseOffset end = m_offsets[row + 1];
            std::size_t oldLength = end - begin;

            m_targets.erase(m_targets.begin() + begin, m_targets.begin() + end);
            m_targets.insert(m_targets.begin() + begin, targets.begin(), targets.end());
            m_values.erase(m_values.begin() + begin * m_valueSize, m_values.begin() + end * m_valueSize);
            m_values.insert(m_values.begin() + begin * m_valueSize, values.begin(), values.end());

            for (std::size_t i = row + 1; i < m_offsets.size(); ++i)
            {
                m_offsets[i] = m_offsets[i] - oldLength + targets.size();
            }
            return OK;
        }

        void MoveEntry(SparseOffset from, SparseOffset to) noexcept
        {
            if (from == to)
                return;
            m_targets[to] = m_targets[from];
            if (m_valueSize > 0)
            {
                std::memmove(m_values.data() + to * m_valueSize, m_values.data() + from * m_valueSize, m_valueSize);
            }
        }

        void Truncate(SparseOffset nnz)
        {
            m_targets.resize(nnz);
            m_values.resize(nnz * m_valueSize);
        }

        std::vector<SparseOffset> m_offsets;
        std::vector<RowIndex> m_targets;
        std::vector<std::byte> m_values;
        std::uint32_t m_valueSize;
    };
}
