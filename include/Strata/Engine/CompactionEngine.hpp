#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../Archetype/EntityTable.hpp"
#include "../Core/Base.hpp"
#include "../Core/Profile.hpp"
#include "../Schema/SchemaRegistry.hpp"
#include "ReferenceRewriter.hpp"

namespace Strata
{
    struct CommitResult
    {
        std::size_t removed = 0;                    // rows removed across all archetypes
        std::size_t cascaded = 0;                   // of those, rows removed because a non-nullable target went away
        std::size_t nulledPointers = 0;
        std::size_t droppedSparseEntries = 0;
        std::size_t rewrittenReferences = 0;
        std::vector<std::size_t> removedPerArchetype;   // indexed by ArchetypeID
    };

    /**
    * Runs one commit: closes the set of marked rows under non-nullable
    * references, compacts every affected archetype and rewrites all pointers
    * into them.
    *
    * The closure is a worklist over (archetype, row). The first time an
    * archetype loses a row, a reverse index (target row -> owner rows) is built
    * for each non-nullable component pointing into it; afterwards every removed
    * row finds its dependents in O(dependents). Each row enters the worklist at
    * most once, so cycles and diamonds terminate and the whole commit is linear
    * in rows plus reference slots.
    */
    class CompactionEngine
    {
    public:
        CompactionEngine(const SchemaRegistry& schema, TableList& tables) noexcept :
            m_schema(schema),
            m_tables(tables)
        {}

        CommitResult Commit()
        {
            STRATA_PROFILE_ZONE_NAMED("CompactionEngine::Commit");

            CommitResult result;
            result.removedPerArchetype.assign(m_tables.size(), 0);

            std::size_t seeded = Seed();
            if (seeded == 0)
                return result;

            CloseOverReferences();

            std::vector<std::vector<RowIndex>> remaps(m_tables.size());
            for (auto& table : m_tables)
            {
                if (table->MarkedCount() == 0)
                    continue;

                ArchetypeID id = table->GetID();
                result.removedPerArchetype[id] = table->MarkedCount();
                result.removed += table->MarkedCount();

                remaps[id] = table->BuildCompactionRemap();
                table->ApplyCompaction(remaps[id]);
            }
            result.cascaded = result.removed - seeded;

            ReferenceRewriter rewriter(m_schema, m_tables);
            RewriteStats stats = rewriter.Rewrite(remaps);
            result.nulledPointers = stats.nulled;
            result.droppedSparseEntries = stats.dropped;
            result.rewrittenReferences = stats.rewritten;

            STRATA_PROFILE_PLOT("Strata/RemovedRows", static_cast<std::int64_t>(result.removed));
            STRATA_PROFILE_PLOT("Strata/CascadedRows", static_cast<std::int64_t>(result.cascaded));
            if (result.cascaded > 0)
            {
                STRATA_PROFILE_MESSAGE_LITERAL("Commit cascaded through non-nullable references");
            }
            STRATA_PROFILE_FRAME_MARK_NAMED("Strata Commit");
            return result;
        }

    private:
        struct WorkItem
        {
            ArchetypeID archetype;
            RowIndex row;
        };

        // CSR map from a target row to the owner rows whose reference names it.
        struct ReverseIndex
        {
            ArchetypeID owner = INVALID_ARCHETYPE;
            std::vector<std::size_t> offsets;
            std::vector<RowIndex> owners;
        };

        std::size_t Seed()
        {
            std::size_t seeded = 0;
            for (auto& table : m_tables)
            {
                if (table->MarkedCount() == 0)
                    continue;

                seeded += table->MarkedCount();
                ArchetypeID id = table->GetID();
                for (RowIndex row = 0; row < table->Size(); ++row)
                {
                    if (table->IsMarked(row))
                        m_worklist.push_back({id, row});
                }
            }
            return seeded;
        }

        void CloseOverReferences()
        {
            STRATA_PROFILE_ZONE_NAMED("CompactionEngine::CloseOverReferences");

            while (!m_worklist.empty())
            {
                WorkItem item = m_worklist.back();
                m_worklist.pop_back();

                for (const ReverseIndex& reverse : GetReverseIndices(item.archetype))
                {
                    EntityTable& owner = *m_tables[reverse.owner];
                    for (std::size_t k = reverse.offsets[item.row]; k < reverse.offsets[item.row + 1]; ++k)
                    {
                        RowIndex ownerRow = reverse.owners[k];
                        if (owner.Mark(ownerRow))
                            m_worklist.push_back({reverse.owner, ownerRow});
                    }
                }
            }
        }

        const std::vector<ReverseIndex>& GetReverseIndices(ArchetypeID target)
        {
            auto it = m_reverse.find(target);
            if (it != m_reverse.end())
                return it->second;

            std::vector<ReverseIndex> indices;
            for (ComponentID id : m_schema.GetReferencesTo(target))
            {
                const ComponentDescriptor& desc = *m_schema.GetComponent(id);
                if (desc.AllowsNull())
                    continue;
                indices.push_back(BuildReverseIndex(desc, m_tables[target]->Size()));
            }
            return m_reverse.emplace(target, std::move(indices)).first->second;
        }

        ReverseIndex BuildReverseIndex(const ComponentDescriptor& desc, std::size_t targetRows) const
        {
            ReverseIndex reverse;
            reverse.owner = desc.archetype;
            reverse.offsets.assign(targetRows + 1, 0);

            const EntityTable& owner = *m_tables[desc.archetype];

            // Two passes over the owner's references: count per target, then scatter.
            auto forEachReference = [&](auto&& visit)
            {
                if (desc.storage == StorageKind::SparseMatrix)
                {
                    const auto& matrix = owner.Get<SparseMatrixColumn>(desc.slot);
                    for (RowIndex row = 0; row < matrix.RowCount(); ++row)
                    {
                        for (RowIndex target : matrix.Row(row).Targets())
                            visit(row, target);
                    }
                }
                else
                {
                    const Column& column = owner.Get<Column>(desc.slot);
                    for (RowIndex row = 0; row < column.Size(); ++row)
                    {
                        RowIndex target = column.GetRow(row);
                        if (target != NULL_ROW)
                            visit(row, target);
                    }
                }
            };

            forEachReference([&](RowIndex, RowIndex target)
            {
                STRATA_ASSERT(target < targetRows, "Reference outside its target archetype");
                ++reverse.offsets[target + 1];
            });
            for (std::size_t i = 1; i < reverse.offsets.size(); ++i)
            {
                reverse.offsets[i] += reverse.offsets[i - 1];
            }

            reverse.owners.resize(reverse.offsets.back());
            std::vector<std::size_t> cursor(reverse.offsets.begin(), reverse.offsets.end() - 1);
            forEachReference([&](RowIndex row, RowIndex target)
            {
                reverse.owners[cursor[target]++] = row;
            });

            return reverse;
        }

        const SchemaRegistry& m_schema;
        TableList& m_tables;
        std::vector<WorkItem> m_worklist;
        std::unordered_map<ArchetypeID, std::vector<ReverseIndex>> m_reverse;
    };
}
