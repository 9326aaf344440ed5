#pragma once

#include <cstdint>

#include "../Archetype/EntityTable.hpp"
#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "Pointer.hpp"
#include "PointerIndex.hpp"

namespace Strata
{
    /**
    * Stable reference to an entity that survives commits and reorders.
    *
    * A handle stores (archetype table, identity, version) and resolves to the
    * entity's current Pointer in O(1). Once a commit removes the entity, the
    * identity's version moves on and every operation reports InvalidHandle.
    * A handle must not outlive the Database that minted it.
    */
    class EntityHandle
    {
    public:
        EntityHandle() noexcept = default;

        EntityHandle(EntityTable* table, StableID id, Version version) noexcept :
            m_table(table),
            m_id(id),
            m_version(version)
        {}

        STRATA_NODISCARD Result<Pointer> Resolve() const
        {
            if (!m_table) STRATA_UNLIKELY
                return Err(ErrorCode::InvalidHandle);

            RowIndex row = m_table->GetPointerIndex().Resolve(m_id, m_version);
            if (row == NULL_ROW) STRATA_UNLIKELY
                return Err(ErrorCode::InvalidHandle);

            return Pointer(m_table->GetID(), row);
        }

        // Marks the entity for destruction at the next commit.
        Result<void> Destroy() const
        {
            auto ptr = Resolve();
            if (!ptr) STRATA_UNLIKELY
                return Err(ptr.Error());

            m_table->Mark(ptr->row);
            return OK;
        }

        STRATA_NODISCARD bool IsValid() const noexcept
        {
            return m_table && m_table->GetPointerIndex().IsAlive(m_id, m_version);
        }

        STRATA_NODISCARD ArchetypeID GetArchetype() const noexcept
        {
            return m_table ? m_table->GetID() : INVALID_ARCHETYPE;
        }

        STRATA_NODISCARD StableID GetID() const noexcept { return m_id; }
        STRATA_NODISCARD Version GetVersion() const noexcept { return m_version; }

        bool operator==(const EntityHandle& other) const noexcept = default;

    private:
        EntityTable* m_table = nullptr;
        StableID m_id = INVALID_STABLE_ID;
        Version m_version = PointerIndex::NULL_VERSION;
    };
}
