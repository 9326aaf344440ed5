#pragma once

#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>

#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "../Schema/ComponentDescriptor.hpp"
#include "Column.hpp"
#include "GlobalConstant.hpp"
#include "SparseMatrixColumn.hpp"

namespace Strata
{
    // Backing storage of one component. The active alternative always matches the descriptor's StorageKind.
    using ComponentStorage = std::variant<Column, GlobalConstant, SparseMatrixColumn>;

    STRATA_NODISCARD inline ComponentStorage MakeStorage(const ComponentDescriptor& desc)
    {
        switch (desc.storage)
        {
            case StorageKind::GlobalConstant:
                return ComponentStorage(std::in_place_type<GlobalConstant>, desc.initialValue);
            case StorageKind::SparseMatrix:
                return ComponentStorage(std::in_place_type<SparseMatrixColumn>, desc.ElementSize());
            case StorageKind::Attribute:
            default:
                return ComponentStorage(std::in_place_type<Column>, desc.ElementSize(), desc.initialValue);
        }
    }

    STRATA_NODISCARD inline StorageKind GetStorageKind(const ComponentStorage& storage) noexcept
    {
        switch (storage.index())
        {
            case 0: return StorageKind::Attribute;
            case 1: return StorageKind::GlobalConstant;
            default: return StorageKind::SparseMatrix;
        }
    }

    // Row-structural operations, dispatched per storage kind. Global constants have no rows.
    namespace StorageOps
    {
        inline Result<void> Append(ComponentStorage& storage, std::size_t count)
        {
            return std::visit([count](auto& s) -> Result<void>
            {
                using S = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<S, Column>)
                {
                    return s.Append(count);
                }
                else if constexpr (std::is_same_v<S, SparseMatrixColumn>)
                {
                    s.AppendRows(count);
                    return OK;
                }
                else
                {
                    return OK;
                }
            }, storage);
        }

        inline Result<void> Reserve(ComponentStorage& storage, std::size_t rows)
        {
            if (Column* column = std::get_if<Column>(&storage))
                return column->Reserve(rows);
            return OK;
        }

        inline void Compact(ComponentStorage& storage, std::span<const RowIndex> remap, std::size_t newSize)
        {
            std::visit([&](auto& s)
            {
                using S = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<S, Column>)
                    s.Compact(remap, newSize);
                else if constexpr (std::is_same_v<S, SparseMatrixColumn>)
                    s.CompactRows(remap, newSize);
            }, storage);
        }

        inline void Permute(ComponentStorage& storage, std::span<const RowIndex> order)
        {
            std::visit([&](auto& s)
            {
                using S = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<S, Column>)
                    s.Permute(order);
                else if constexpr (std::is_same_v<S, SparseMatrixColumn>)
                    s.PermuteRows(order);
            }, storage);
        }
    }
}
