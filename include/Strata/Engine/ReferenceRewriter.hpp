#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "../Archetype/EntityTable.hpp"
#include "../Core/Base.hpp"
#include "../Core/Profile.hpp"
#include "../Schema/SchemaRegistry.hpp"

namespace Strata
{
    struct RewriteStats
    {
        std::size_t rewritten = 0;      // pointer slots and sparse targets given a new row
        std::size_t nulled = 0;         // nullable pointers whose target was removed
        std::size_t dropped = 0;        // sparse entries whose target was removed
    };

    /**
    * Applies old -> new row maps of moved archetypes to every reference in the
    * database that targets them.
    *
    * remaps[a] is empty when archetype a did not move; otherwise it has one
    * entry per pre-move row of a, NULL_ROW for removed rows. Owners must already
    * be in their post-move layout, so each stored slot is visited exactly once.
    * Total work is linear in the number of reference slots of the affected
    * components.
    */
    class ReferenceRewriter
    {
    public:
        ReferenceRewriter(const SchemaRegistry& schema, TableList& tables) noexcept :
            m_schema(schema),
            m_tables(tables)
        {}

        RewriteStats Rewrite(const std::vector<std::vector<RowIndex>>& remaps)
        {
            STRATA_PROFILE_ZONE_NAMED("ReferenceRewriter::Rewrite");

            RewriteStats stats;
            for (ArchetypeID target = 0; target < remaps.size(); ++target)
            {
                if (remaps[target].empty())
                    continue;

                for (ComponentID id : m_schema.GetReferencesTo(target))
                {
                    RewriteComponent(*m_schema.GetComponent(id), remaps[target], stats);
                }
            }

            STRATA_PROFILE_PLOT("Strata/RewrittenReferences", static_cast<std::int64_t>(stats.rewritten));
            return stats;
        }

    private:
        void RewriteComponent(const ComponentDescriptor& desc, std::span<const RowIndex> remap, RewriteStats& stats)
        {
            EntityTable& owner = *m_tables[desc.archetype];

            if (desc.storage == StorageKind::SparseMatrix)
            {
                auto& matrix = owner.Get<SparseMatrixColumn>(desc.slot);
                std::size_t dropped = matrix.RemapTargets(remap);
                STRATA_ASSERT(dropped == 0 || desc.AllowsNull(), "Non-nullable sparse entry outlived its target");
                stats.dropped += dropped;
                stats.rewritten += matrix.NonZeroCount();
                return;
            }

            Column& column = owner.Get<Column>(desc.slot);
            for (RowIndex row = 0; row < column.Size(); ++row)
            {
                RowIndex current = column.GetRow(row);
                if (current == NULL_ROW)
                    continue;

                STRATA_ASSERT(current < remap.size(), "Stored pointer outside its target archetype");
                RowIndex mapped = remap[current];
                if (mapped == NULL_ROW)
                {
                    STRATA_ASSERT(desc.AllowsNull(), "Non-nullable pointer outlived its target");
                    ++stats.nulled;
                }
                else
                {
                    ++stats.rewritten;
                }
                column.SetRow(row, mapped);
            }
        }

        const SchemaRegistry& m_schema;
        TableList& m_tables;
    };
}
