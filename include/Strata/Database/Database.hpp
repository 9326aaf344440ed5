#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Archetype/EntityTable.hpp"
#include "../Core/Base.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Engine/CompactionEngine.hpp"
#include "../Engine/ReorderEngine.hpp"
#include "../Engine/ValidationEngine.hpp"
#include "../Entity/EntityHandle.hpp"
#include "../Entity/Pointer.hpp"
#include "../Schema/ComponentDescriptor.hpp"
#include "../Schema/SchemaRegistry.hpp"
#include "../Storage/ComponentStorage.hpp"

namespace Strata
{
    /**
    * Single owner of a schema, one EntityTable per archetype and the engines
    * that operate on them. Every programmer-facing operation lives here.
    *
    * Get/Set and the other raw accessors are the trusted path: they assume a
    * valid Pointer and a component of the right archetype and type, and only
    * assert that in debug builds. The Try* accessors go through an EntityHandle
    * and report every misuse as an Error.
    */
    class Database
    {
    public:
        struct Config
        {
            RowIndex maxRowsPerArchetype = NULL_ROW;    // further capped by narrow pointers into the archetype
            std::size_t initialRowCapacity = 0;         // rows reserved up front in every column
        };

        Database() : Database(Config{}) {}
        explicit Database(const Config& config) : m_config(config) {}

        Database(Database&&) noexcept = default;
        Database& operator=(Database&&) noexcept = default;
        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        // -------------------------------------------------------------------
        // Schema
        // -------------------------------------------------------------------

        Result<ArchetypeID> DefineArchetype(std::string_view name)
        {
            auto table = std::make_unique<EntityTable>(static_cast<ArchetypeID>(m_tables.size()), m_config.maxRowsPerArchetype);
            if (auto reserved = table->Reserve(m_config.initialRowCapacity); !reserved)
                return Err(reserved.Error());

            auto id = m_schema.DefineArchetype(name);
            if (!id)
                return id;

            m_tables.push_back(std::move(table));
            return id;
        }

        /**
        * Registers a component and allocates its storage, backfilling rows that
        * already exist with the definition's initial value (NULL for pointers,
        * empty rows for sparse matrices). On failure nothing is registered.
        */
        Result<ComponentID> DefineComponent(ArchetypeID archetype, const ComponentDefinition& def)
        {
            auto desc = m_schema.MakeDescriptor(archetype, def);
            if (!desc)
                return Err(desc.Error());

            RowIndex capacity = NULL_ROW;
            if (desc->IsReference())
            {
                capacity = desc->type.IsPointer() ? desc->type.PointerCapacity() : NULL_ROW;
                if (m_tables[desc->target]->Size() > capacity)
                    return Err(ErrorCode::SchemaError, "Target archetype holds more rows than the pointer width can address");
            }

            if (auto added = m_tables[archetype]->AddStorage(*desc); !added)
                return Err(added.Error());

            if (desc->IsReference())
            {
                m_tables[desc->target]->LimitMaxRows(capacity);
            }
            return m_schema.Register(std::move(desc).Value());
        }

        // -------------------------------------------------------------------
        // Entity lifecycle
        // -------------------------------------------------------------------

        Result<Pointer> CreateEntity(ArchetypeID archetype)
        {
            return CreateEntities(archetype, 1);
        }

        // Appends `count` entities with initial values. Returns a Pointer to the first one.
        Result<Pointer> CreateEntities(ArchetypeID archetype, std::size_t count)
        {
            if (!m_schema.IsValidArchetype(archetype)) STRATA_UNLIKELY
                return Err(ErrorCode::SchemaError, "Unknown archetype");

            auto first = m_tables[archetype]->Create(count);
            if (!first) STRATA_UNLIKELY
                return Err(first.Error());
            return Pointer(archetype, *first);
        }

        // Marks an entity for removal at the next Commit(). Marking twice is a no-op.
        Result<void> MarkDestroy(Pointer entity)
        {
            if (!Contains(entity)) STRATA_UNLIKELY
                return Err(ErrorCode::InvalidHandle, "Pointer does not name an existing row");

            m_tables[entity.archetype]->Mark(entity.row);
            return OK;
        }

        STRATA_NODISCARD bool IsMarked(Pointer entity) const noexcept
        {
            return Contains(entity) && m_tables[entity.archetype]->IsMarked(entity.row);
        }

        STRATA_NODISCARD bool IsLive(Pointer entity) const noexcept
        {
            return Contains(entity) && !m_tables[entity.archetype]->IsMarked(entity.row);
        }

        /**
        * Removes every marked entity plus everything that depends on one through
        * a non-nullable reference, compacts the affected archetypes and rewrites
        * all pointers into them. Outstanding Pointers into affected archetypes
        * are invalidated; EntityHandles of survivors stay valid.
        */
        CommitResult Commit()
        {
            STRATA_PROFILE_FUNCTION();
            CompactionEngine engine(m_schema, m_tables);
            return engine.Commit();
        }

        // -------------------------------------------------------------------
        // Raw access
        // -------------------------------------------------------------------

        template<typename T>
        STRATA_NODISCARD const T& Get(Pointer entity, ComponentID component) const noexcept
        {
            return GetColumnFor(entity, component).template Get<T>(entity.row);
        }

        template<typename T>
        void Set(Pointer entity, ComponentID component, const T& value) noexcept
        {
            GetColumnFor(entity, component).template Set<T>(entity.row, value);
        }

        // Reads a pointer attribute. A NULL value comes back as Pointer::Null(target).
        STRATA_NODISCARD Pointer GetPointer(Pointer entity, ComponentID component) const noexcept
        {
            const ComponentDescriptor& desc = Descriptor(component);
            return Pointer(desc.target, GetColumnFor(entity, component).GetRow(entity.row));
        }

        void SetPointer(Pointer entity, ComponentID component, Pointer target) noexcept
        {
            STRATA_ASSERT(target.IsNull() || target.archetype == Descriptor(component).target, "Pointer targets the wrong archetype");
            GetColumnFor(entity, component).SetRow(entity.row, target.row);
        }

        template<typename T>
        STRATA_NODISCARD T GetGlobal(ComponentID component) const noexcept
        {
            const ComponentDescriptor& desc = Descriptor(component);
            return m_tables[desc.archetype]->Get<GlobalConstant>(desc.slot).template Get<T>();
        }

        template<typename T>
        void SetGlobal(ComponentID component, const T& value) noexcept
        {
            const ComponentDescriptor& desc = Descriptor(component);
            m_tables[desc.archetype]->Get<GlobalConstant>(desc.slot).template Set<T>(value);
        }

        // Whole-column span over every row, marked ones included.
        template<typename T>
        STRATA_NODISCARD std::span<T> GetColumnData(ComponentID component) noexcept
        {
            const ComponentDescriptor& desc = Descriptor(component);
            return m_tables[desc.archetype]->Get<Column>(desc.slot).template Data<T>();
        }

        template<typename T>
        STRATA_NODISCARD std::span<const T> GetColumnData(ComponentID component) const noexcept
        {
            const ComponentDescriptor& desc = Descriptor(component);
            return std::as_const(*m_tables[desc.archetype]).Get<Column>(desc.slot).template Data<T>();
        }

        // -------------------------------------------------------------------
        // Sparse matrices
        // -------------------------------------------------------------------

        STRATA_NODISCARD const SparseMatrixColumn& GetSparse(ComponentID component) const noexcept
        {
            const ComponentDescriptor& desc = Descriptor(component);
            return std::as_const(*m_tables[desc.archetype]).Get<SparseMatrixColumn>(desc.slot);
        }

        STRATA_NODISCARD SparseRowView GetSparseRow(Pointer entity, ComponentID component) const noexcept
        {
            STRATA_ASSERT(entity.archetype == Descriptor(component).archetype, "Component belongs to another archetype");
            return GetSparse(component).Row(entity.row);
        }

        // Values of every entry in CSR order, writable in place. The structure cannot change through this.
        template<typename T>
        STRATA_NODISCARD std::span<T> GetSparseValues(ComponentID component) noexcept
        {
            const ComponentDescriptor& desc = Descriptor(component);
            return m_tables[desc.archetype]->Get<SparseMatrixColumn>(desc.slot).template Values<T>();
        }

        template<typename T>
        Result<void> RebuildSparse(ComponentID component, const std::vector<std::vector<SparseEntry<T>>>& rows)
        {
            auto matrix = LookupSparse(component);
            if (!matrix)
                return Err(matrix.Error());
            return (*matrix)->Rebuild(rows, TargetRows(component));
        }

        Result<void> RebuildSparse(ComponentID component, const std::vector<std::vector<RowIndex>>& rows)
        {
            auto matrix = LookupSparse(component);
            if (!matrix)
                return Err(matrix.Error());
            return (*matrix)->Rebuild(rows, TargetRows(component));
        }

        Result<void> RebuildSparse(ComponentID component, std::vector<SparseOffset> offsets, std::vector<RowIndex> targets, std::vector<std::byte> values)
        {
            auto matrix = LookupSparse(component);
            if (!matrix)
                return Err(matrix.Error());
            return (*matrix)->Rebuild(std::move(offsets), std::move(targets), std::move(values), TargetRows(component));
        }

        template<typename T>
        Result<void> SetSparseRow(Pointer entity, ComponentID component, std::span<const SparseEntry<T>> entries)
        {
            auto matrix = LookupSparse(component, entity);
            if (!matrix)
                return Err(matrix.Error());
            return (*matrix)->SetRow(entity.row, entries, TargetRows(component));
        }

        Result<void> SetSparseRow(Pointer entity, ComponentID component, std::span<const RowIndex> targets)
        {
            auto matrix = LookupSparse(component, entity);
            if (!matrix)
                return Err(matrix.Error());
            return (*matrix)->SetRow(entity.row, targets, TargetRows(component));
        }

        // -------------------------------------------------------------------
        // Reordering
        // -------------------------------------------------------------------

        /**
        * Stable-sorts the archetype's rows by key(row) and rewrites every
        * reference into it. Marks and handles follow their entities.
        */
        template<typename KeyFunc>
        Result<void> Reorder(ArchetypeID archetype, KeyFunc&& key)
        {
            STRATA_PROFILE_FUNCTION();
            if (!m_schema.IsValidArchetype(archetype))
                return Err(ErrorCode::SchemaError, "Unknown archetype");

            ReorderEngine engine(m_schema, m_tables);
            engine.Reorder(archetype, std::forward<KeyFunc>(key));
            return OK;
        }

        Result<void> ReorderBy(ArchetypeID archetype, ComponentID component)
        {
            STRATA_PROFILE_FUNCTION();
            if (!m_schema.IsValidArchetype(archetype))
                return Err(ErrorCode::SchemaError, "Unknown archetype");

            ReorderEngine engine(m_schema, m_tables);
            auto stats = engine.ReorderBy(archetype, component);
            if (!stats)
                return Err(stats.Error());
            return OK;
        }

        // Explicit permutation: new row k takes old row order[k].
        Result<void> Permute(ArchetypeID archetype, std::span<const RowIndex> order)
        {
            if (!m_schema.IsValidArchetype(archetype))
                return Err(ErrorCode::SchemaError, "Unknown archetype");

            std::size_t rows = m_tables[archetype]->Size();
            if (order.size() != rows)
                return Err(ErrorCode::DataError, "Permutation must list every row once");

            std::vector<std::uint8_t> seen(rows, 0);
            for (RowIndex row : order)
            {
                if (row >= rows || seen[row])
                    return Err(ErrorCode::DataError, "Permutation must list every row once");
                seen[row] = 1;
            }

            ReorderEngine engine(m_schema, m_tables);
            engine.Apply(archetype, order);
            return OK;
        }

        // -------------------------------------------------------------------
        // Handles and checked access
        // -------------------------------------------------------------------

        STRATA_NODISCARD Result<EntityHandle> MakeHandle(Pointer entity)
        {
            if (!Contains(entity)) STRATA_UNLIKELY
                return Err(ErrorCode::InvalidHandle, "Pointer does not name an existing row");

            EntityTable& table = *m_tables[entity.archetype];
            StableID id = table.GetPointerIndex().IdAt(entity.row);
            return EntityHandle(&table, id, table.GetPointerIndex().GetVersion(id));
        }

        template<typename T>
        STRATA_NODISCARD Result<T> TryGet(const EntityHandle& handle, ComponentID component) const
        {
            auto entity = handle.Resolve();
            if (!entity)
                return Err(entity.Error());

            auto desc = CheckedDescriptor<T>(*entity, component);
            if (!desc)
                return Err(desc.Error());

            const EntityTable& table = *m_tables[entity->archetype];
            if ((*desc)->storage == StorageKind::GlobalConstant)
                return table.Get<GlobalConstant>((*desc)->slot).template Get<T>();

            T value;
            std::memcpy(&value, table.Get<Column>((*desc)->slot).GetBytes(entity->row), sizeof(T));
            return value;
        }

        // Writes after running the component's configured NaN and bounds checks on `value`.
        template<typename T>
        Result<void> TrySet(const EntityHandle& handle, ComponentID component, const T& value)
        {
            auto entity = handle.Resolve();
            if (!entity)
                return Err(entity.Error());

            auto desc = CheckedDescriptor<T>(*entity, component);
            if (!desc)
                return Err(desc.Error());

            if (auto checked = ValidationEngine::CheckValue(**desc, reinterpret_cast<const std::byte*>(&value)); !checked)
                return checked;

            EntityTable& table = *m_tables[entity->archetype];
            if ((*desc)->storage == StorageKind::GlobalConstant)
            {
                table.Get<GlobalConstant>((*desc)->slot).Set(value);
            }
            else
            {
                std::memcpy(table.Get<Column>((*desc)->slot).GetBytes(entity->row), &value, sizeof(T));
            }
            return OK;
        }

        STRATA_NODISCARD Result<Pointer> TryGetPointer(const EntityHandle& handle, ComponentID component) const
        {
            auto entity = handle.Resolve();
            if (!entity)
                return Err(entity.Error());

            auto desc = CheckedPointerDescriptor(*entity, component);
            if (!desc)
                return Err(desc.Error());

            return Pointer((*desc)->target, GetColumnFor(*entity, component).GetRow(entity->row));
        }

        // Sets a pointer attribute after checking the target's archetype, its existence and the null check.
        Result<void> TrySetPointer(const EntityHandle& handle, ComponentID component, Pointer target)
        {
            auto entity = handle.Resolve();
            if (!entity)
                return Err(entity.Error());

            auto desc = CheckedPointerDescriptor(*entity, component);
            if (!desc)
                return Err(desc.Error());

            if (auto checked = ValidationEngine::CheckPointer(**desc, target.row); !checked)
                return checked;

            if (!target.IsNull())
            {
                if (target.archetype != (*desc)->target)
                    return Err(ErrorCode::TypeMismatch, "Pointer targets the wrong archetype");
                if (!Contains(target))
                    return Err(ErrorCode::InvalidHandle, "Pointer target does not exist");
            }

            GetColumnFor(*entity, component).SetRow(entity->row, target.row);
            return OK;
        }

        // -------------------------------------------------------------------
        // Validation
        // -------------------------------------------------------------------

        STRATA_NODISCARD Result<ValidationReport> RunChecks(ComponentID component) const
        {
            ValidationEngine engine(m_schema, m_tables);
            return engine.Run(component);
        }

        STRATA_NODISCARD ValidationReport RunChecks() const
        {
            ValidationEngine engine(m_schema, m_tables);
            return engine.RunAll();
        }

        // -------------------------------------------------------------------
        // Iteration and introspection
        // -------------------------------------------------------------------

        // Calls func(Pointer) for every live (unmarked) entity of the archetype in row order.
        template<typename Func>
        void ForEachLive(ArchetypeID archetype, Func&& func) const
        {
            STRATA_ASSERT(m_schema.IsValidArchetype(archetype), "Unknown archetype");
            m_tables[archetype]->ForEachLive([&](RowIndex row)
            {
                func(Pointer(archetype, row));
            });
        }

        STRATA_NODISCARD Result<ArchetypeID> FindArchetype(std::string_view name) const
        {
            return m_schema.FindArchetype(name);
        }

        STRATA_NODISCARD Result<ComponentID> FindComponent(ArchetypeID archetype, std::string_view name) const
        {
            return m_schema.FindComponent(archetype, name);
        }

        STRATA_NODISCARD Result<ComponentID> FindComponent(std::string_view qualifiedName) const
        {
            return m_schema.FindComponent(qualifiedName);
        }

        STRATA_NODISCARD const ArchetypeDescriptor* GetArchetypeInfo(ArchetypeID archetype) const noexcept
        {
            return m_schema.GetArchetype(archetype);
        }

        STRATA_NODISCARD const ComponentDescriptor* GetComponentDescriptor(ComponentID component) const noexcept
        {
            return m_schema.GetComponent(component);
        }

        STRATA_NODISCARD const SchemaRegistry& GetSchema() const noexcept { return m_schema; }

        // Row count including marked rows.
        STRATA_NODISCARD std::size_t Size(ArchetypeID archetype) const noexcept
        {
            return m_schema.IsValidArchetype(archetype) ? m_tables[archetype]->Size() : 0;
        }

        STRATA_NODISCARD std::size_t MarkedCount(ArchetypeID archetype) const noexcept
        {
            return m_schema.IsValidArchetype(archetype) ? m_tables[archetype]->MarkedCount() : 0;
        }

        STRATA_NODISCARD RowIndex MaxRows(ArchetypeID archetype) const noexcept
        {
            return m_schema.IsValidArchetype(archetype) ? m_tables[archetype]->MaxRows() : 0;
        }

        // Bumped by every commit that removes rows of the archetype and by every reorder of it.
        STRATA_NODISCARD std::uint64_t GetEpoch(ArchetypeID archetype) const noexcept
        {
            return m_schema.IsValidArchetype(archetype) ? m_tables[archetype]->GetEpoch() : 0;
        }

        STRATA_NODISCARD const Config& GetConfig() const noexcept { return m_config; }

    private:
        STRATA_NODISCARD bool Contains(Pointer entity) const noexcept
        {
            return m_schema.IsValidArchetype(entity.archetype) && entity.row < m_tables[entity.archetype]->Size();
        }

        STRATA_NODISCARD const ComponentDescriptor& Descriptor(ComponentID component) const noexcept
        {
            STRATA_ASSERT(m_schema.IsValidComponent(component), "Unknown component");
            return *m_schema.GetComponent(component);
        }

        STRATA_NODISCARD Column& GetColumnFor(Pointer entity, ComponentID component) const noexcept
        {
            const ComponentDescriptor& desc = Descriptor(component);
            STRATA_ASSERT(desc.archetype == entity.archetype, "Component belongs to another archetype");
            STRATA_ASSERT(entity.row < m_tables[entity.archetype]->Size(), "Row out of range");
            return m_tables[entity.archetype]->Get<Column>(desc.slot);
        }

        STRATA_NODISCARD RowIndex TargetRows(ComponentID component) const noexcept
        {
            return static_cast<RowIndex>(m_tables[Descriptor(component).target]->Size());
        }

        Result<SparseMatrixColumn*> LookupSparse(ComponentID component)
        {
            const ComponentDescriptor* desc = m_schema.GetComponent(component);
            if (!desc)
                return Err(ErrorCode::SchemaError, "Unknown component");
            if (desc->storage != StorageKind::SparseMatrix)
                return Err(ErrorCode::TypeMismatch, "Component is not a sparse matrix");
            return &m_tables[desc->archetype]->Get<SparseMatrixColumn>(desc->slot);
        }

        Result<SparseMatrixColumn*> LookupSparse(ComponentID component, Pointer entity)
        {
            const ComponentDescriptor* desc = m_schema.GetComponent(component);
            if (desc && desc->archetype != entity.archetype)
                return Err(ErrorCode::SchemaError, "Component belongs to another archetype");
            if (!Contains(entity))
                return Err(ErrorCode::InvalidHandle, "Pointer does not name an existing row");
            return LookupSparse(component);
        }

        template<typename T>
        Result<const ComponentDescriptor*> CheckedDescriptor(Pointer entity, ComponentID component) const
        {
            const ComponentDescriptor* desc = m_schema.GetComponent(component);
            if (!desc || desc->archetype != entity.archetype)
                return Err(ErrorCode::SchemaError, "Component does not belong to the entity's archetype");
            if (desc->storage == StorageKind::SparseMatrix || !desc->type.template Accepts<T>())
                return Err(ErrorCode::TypeMismatch);
            return desc;
        }

        Result<const ComponentDescriptor*> CheckedPointerDescriptor(Pointer entity, ComponentID component) const
        {
            const ComponentDescriptor* desc = m_schema.GetComponent(component);
            if (!desc || desc->archetype != entity.archetype)
                return Err(ErrorCode::SchemaError, "Component does not belong to the entity's archetype");
            if (!desc->type.IsPointer() || desc->storage != StorageKind::Attribute)
                return Err(ErrorCode::TypeMismatch, "Component is not a pointer attribute");
            return desc;
        }

        Config m_config;
        SchemaRegistry m_schema;
        TableList m_tables;
    };
}
