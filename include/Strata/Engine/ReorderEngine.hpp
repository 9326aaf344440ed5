#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <span>
#include <type_traits>
#include <vector>

#include "../Archetype/EntityTable.hpp"
#include "../Core/Base.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Schema/SchemaRegistry.hpp"
#include "ReferenceRewriter.hpp"

namespace Strata
{
    /**
    * Permutes the rows of one archetype and keeps every reference into it
    * consistent. Row contents, identities and marks move together; only the
    * row numbers change.
    */
    class ReorderEngine
    {
    public:
        ReorderEngine(const SchemaRegistry& schema, TableList& tables) noexcept :
            m_schema(schema),
            m_tables(tables)
        {}

        // Stable sort of the archetype's rows by key(row). Keys are evaluated once per row.
        template<typename KeyFunc>
        RewriteStats Reorder(ArchetypeID archetype, KeyFunc&& key)
        {
            using Key = std::decay_t<std::invoke_result_t<KeyFunc&, RowIndex>>;

            EntityTable& table = *m_tables[archetype];
            std::vector<Key> keys;
            keys.reserve(table.Size());
            for (RowIndex row = 0; row < table.Size(); ++row)
            {
                keys.push_back(key(row));
            }

            std::vector<RowIndex> order(table.Size());
            std::iota(order.begin(), order.end(), RowIndex(0));
            std::stable_sort(order.begin(), order.end(), [&keys](RowIndex a, RowIndex b)
            {
                return keys[a] < keys[b];
            });

            return Apply(archetype, order);
        }

        /**
        * Sort by the value of a numeric or pointer attribute of the archetype.
        * Pointers order by target row with NULL last, NaN orders last among floats.
        */
        Result<RewriteStats> ReorderBy(ArchetypeID archetype, ComponentID component)
        {
            const ComponentDescriptor* desc = m_schema.GetComponent(component);
            if (!desc || desc->archetype != archetype)
                return Err(ErrorCode::SchemaError, "Component does not belong to the archetype");
            if (desc->storage != StorageKind::Attribute)
                return Err(ErrorCode::TypeMismatch, "Sort key must be a per-row attribute");

            const Column& column = m_tables[archetype]->Get<Column>(desc->slot);
            if (desc->type.IsPointer())
            {
                return Reorder(archetype, [&column](RowIndex row) { return column.GetRow(row); });
            }
            if (desc->type.IsNumeric())
            {
                TypeKind kind = desc->type.kind;
                // NaN sorts with +inf so the key stays a strict weak order.
                return Reorder(archetype, [&column, kind](RowIndex row)
                {
                    double value = LoadAsDouble(column.GetBytes(row), kind);
                    return std::isnan(value) ? std::numeric_limits<double>::infinity() : value;
                });
            }
            return Err(ErrorCode::TypeMismatch, "Sort key must be numeric or a pointer");
        }

        // New row k takes old row order[k]; order must be a permutation of the archetype's rows.
        RewriteStats Apply(ArchetypeID archetype, std::span<const RowIndex> order)
        {
            STRATA_PROFILE_ZONE_NAMED("ReorderEngine::Apply");

            EntityTable& table = *m_tables[archetype];
            STRATA_ASSERT(order.size() == table.Size(), "Permutation must cover every row");

            table.ApplyPermutation(order);

            std::vector<std::vector<RowIndex>> remaps(m_tables.size());
            std::vector<RowIndex>& remap = remaps[archetype];
            remap.resize(order.size());
            for (std::size_t k = 0; k < order.size(); ++k)
            {
                remap[order[k]] = static_cast<RowIndex>(k);
            }

            ReferenceRewriter rewriter(m_schema, m_tables);
            RewriteStats stats = rewriter.Rewrite(remaps);

            STRATA_PROFILE_FRAME_MARK_NAMED("Strata Reorder");
            return stats;
        }

    private:
        const SchemaRegistry& m_schema;
        TableList& m_tables;
    };
}
