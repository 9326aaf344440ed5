#pragma once

#include <cmath>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Result.hpp"
#include "ComponentDescriptor.hpp"
#include "DataType.hpp"

namespace Strata
{
    /**
    * Owns every archetype and component definition of a database.
    *
    * Definitions are append-only: IDs are dense indices in definition order and
    * a registered descriptor never changes afterwards. The registry also keeps,
    * per archetype, the list of components that point into it, which is what
    * commit and reorder walk when rewriting references.
    */
    class SchemaRegistry
    {
    public:
        Result<ArchetypeID> DefineArchetype(std::string_view name)
        {
            if (name.empty() || name.find('.') != std::string_view::npos)
                return Err(ErrorCode::SchemaError, "Archetype name must be non-empty and contain no '.'");

            std::string key(name);
            if (m_archetypeNames.find(key) != m_archetypeNames.end())
                return Err(ErrorCode::SchemaError, "Duplicate archetype name");

            ArchetypeID id = static_cast<ArchetypeID>(m_archetypes.size());

            ArchetypeDescriptor desc;
            desc.id = id;
            desc.name = key;
            m_archetypes.push_back(std::move(desc));
            m_incoming.emplace_back();
            m_archetypeNames.emplace(std::move(key), id);

            return id;
        }

        // Checks a definition against the current schema without registering it.
        Result<void> Validate(ArchetypeID archetype, const ComponentDefinition& def) const
        {
            if (!IsValidArchetype(archetype))
                return Err(ErrorCode::SchemaError, "Unknown archetype");

            if (def.name.empty() || def.name.find('.') != std::string::npos)
                return Err(ErrorCode::SchemaError, "Component name must be non-empty and contain no '.'");

            if (m_componentNames.find(Qualify(archetype, def.name)) != m_componentNames.end())
                return Err(ErrorCode::SchemaError, "Duplicate component name");

            if (auto typeCheck = ValidateType(def); !typeCheck)
                return typeCheck;

            return ValidateChecks(def);
        }

        Result<ComponentID> DefineComponent(ArchetypeID archetype, const ComponentDefinition& def)
        {
            auto desc = MakeDescriptor(archetype, def);
            if (!desc)
                return Err(desc.Error());
            return Register(std::move(desc).Value());
        }

        /**
        * Validates a definition and builds the descriptor it would register as,
        * without changing the registry. Lets the owner allocate storage first
        * and register only once that succeeded.
        */
        STRATA_NODISCARD Result<ComponentDescriptor> MakeDescriptor(ArchetypeID archetype, const ComponentDefinition& def) const
        {
            if (auto valid = Validate(archetype, def); !valid)
                return Err(valid.Error());

            ComponentDescriptor desc;
            desc.id = static_cast<ComponentID>(m_components.size());
            desc.archetype = archetype;
            desc.slot = static_cast<std::uint32_t>(m_archetypes[archetype].components.size());
            desc.name = def.name;
            desc.qualifiedName = Qualify(archetype, def.name);
            desc.type = def.type;
            desc.storage = def.storage;
            desc.target = def.type.IsPointer() ? def.type.target :
                          def.storage == StorageKind::SparseMatrix ? def.target : INVALID_ARCHETYPE;
            desc.nullability = desc.target != INVALID_ARCHETYPE ? def.nullability : Nullability::Disallowed;
            desc.validation = def.validation;
            desc.doc = def.doc;
            desc.unit = def.unit;
            desc.initialValue = MakeInitialValue(def);
            return desc;
        }

        // Registers a descriptor produced by the latest MakeDescriptor call.
        ComponentID Register(ComponentDescriptor desc)
        {
            STRATA_ASSERT(desc.id == m_components.size(), "Descriptor is stale");
            ComponentID id = desc.id;

            m_archetypes[desc.archetype].components.push_back(id);
            m_componentNames.emplace(desc.qualifiedName, id);
            if (desc.IsReference())
            {
                m_incoming[desc.target].push_back(id);
            }
            m_components.push_back(std::move(desc));

            return id;
        }

        STRATA_NODISCARD Result<ArchetypeID> FindArchetype(std::string_view name) const
        {
            auto it = m_archetypeNames.find(std::string(name));
            if (it == m_archetypeNames.end())
                return Err(ErrorCode::SchemaError, "Unknown archetype");
            return it->second;
        }

        STRATA_NODISCARD Result<ComponentID> FindComponent(ArchetypeID archetype, std::string_view name) const
        {
            if (!IsValidArchetype(archetype))
                return Err(ErrorCode::SchemaError, "Unknown archetype");
            return FindComponent(Qualify(archetype, name));
        }

        // Looks up "Archetype.component".
        STRATA_NODISCARD Result<ComponentID> FindComponent(std::string_view qualifiedName) const
        {
            auto it = m_componentNames.find(std::string(qualifiedName));
            if (it == m_componentNames.end())
                return Err(ErrorCode::SchemaError, "Unknown component");
            return it->second;
        }

        STRATA_NODISCARD bool IsValidArchetype(ArchetypeID id) const noexcept
        {
            return id < m_archetypes.size();
        }

        STRATA_NODISCARD bool IsValidComponent(ComponentID id) const noexcept
        {
            return id < m_components.size();
        }

        STRATA_NODISCARD const ArchetypeDescriptor* GetArchetype(ArchetypeID id) const noexcept
        {
            return IsValidArchetype(id) ? &m_archetypes[id] : nullptr;
        }

        STRATA_NODISCARD const ComponentDescriptor* GetComponent(ComponentID id) const noexcept
        {
            return IsValidComponent(id) ? &m_components[id] : nullptr;
        }

        // Components, in any archetype, whose values are rows of `target`.
        STRATA_NODISCARD const std::vector<ComponentID>& GetReferencesTo(ArchetypeID target) const
        {
            STRATA_ASSERT(IsValidArchetype(target), "Unknown archetype");
            return m_incoming[target];
        }

        STRATA_NODISCARD const std::vector<ArchetypeDescriptor>& GetArchetypes() const noexcept { return m_archetypes; }
        STRATA_NODISCARD const std::vector<ComponentDescriptor>& GetComponents() const noexcept { return m_components; }

        STRATA_NODISCARD std::size_t ArchetypeCount() const noexcept { return m_archetypes.size(); }
        STRATA_NODISCARD std::size_t ComponentCount() const noexcept { return m_components.size(); }

    private:
        std::string Qualify(ArchetypeID archetype, std::string_view name) const
        {
            std::string qualified = m_archetypes[archetype].name;
            qualified += '.';
            qualified += name;
            return qualified;
        }

        Result<void> ValidateType(const ComponentDefinition& def) const
        {
            const DataType& type = def.type;

            if (type.IsOpaque() && (type.size == 0 || type.size > config::MAX_OPAQUE_SIZE))
                return Err(ErrorCode::SchemaError, "Opaque payload size out of range");

            if (type.IsPointer())
            {
                if (type.size != 1 && type.size != 2 && type.size != 4)
                    return Err(ErrorCode::SchemaError, "Pointer width must be 8, 16 or 32 bits");
                if (!IsValidArchetype(type.target))
                    return Err(ErrorCode::SchemaError, "Pointer targets an unknown archetype");
            }

            switch (def.storage)
            {
                case StorageKind::Attribute:
                    if (type.IsNone())
                        return Err(ErrorCode::SchemaError, "Attribute requires a data type");
                    break;

                case StorageKind::GlobalConstant:
                    if (type.IsNone() || type.IsPointer())
                        return Err(ErrorCode::SchemaError, "Global constant must be numeric or opaque");
                    break;

                case StorageKind::SparseMatrix:
                    if (type.IsPointer())
                        return Err(ErrorCode::SchemaError, "Sparse matrix values cannot be pointers");
                    if (!IsValidArchetype(def.target))
                        return Err(ErrorCode::SchemaError, "Sparse matrix targets an unknown archetype");
                    if (!def.initialValue.empty())
                        return Err(ErrorCode::SchemaError, "Sparse matrix rows start empty");
                    break;

                default:
                    return Err(ErrorCode::SchemaError, "Unknown storage kind");
            }

            if (!def.initialValue.empty())
            {
                if (type.IsPointer())
                    return Err(ErrorCode::SchemaError, "Pointer components always start NULL");
                if (def.initialValue.size() != type.size)
                    return Err(ErrorCode::SchemaError, "Initial value size does not match data type");
            }

            return OK;
        }

        Result<void> ValidateChecks(const ComponentDefinition& def) const
        {
            const ValidationConfig& checks = def.validation;

            if (checks.nanCheck && !def.type.IsFloating())
                return Err(ErrorCode::SchemaError, "NaN check requires a floating-point type");

            if (checks.bounds)
            {
                if (!def.type.IsNumeric())
                    return Err(ErrorCode::SchemaError, "Bounds check requires a numeric type");
                if (std::isnan(checks.bounds->min) || std::isnan(checks.bounds->max) || checks.bounds->min > checks.bounds->max)
                    return Err(ErrorCode::SchemaError, "Bounds must satisfy min <= max");
            }

            if (checks.nullCheck && !(def.type.IsPointer() && def.storage == StorageKind::Attribute))
                return Err(ErrorCode::SchemaError, "Null check requires a pointer attribute");

            return OK;
        }

        static std::vector<std::byte> MakeInitialValue(const ComponentDefinition& def)
        {
            std::vector<std::byte> value(def.type.size, std::byte{0});
            if (def.type.IsPointer())
            {
                StoreRowIndex(value.data(), def.type.size, NULL_ROW);
            }
            else if (!def.initialValue.empty())
            {
                value = def.initialValue;
            }
            return value;
        }

        std::vector<ArchetypeDescriptor> m_archetypes;
        std::vector<ComponentDescriptor> m_components;
        std::vector<std::vector<ComponentID>> m_incoming;   // target archetype -> referencing components
        std::unordered_map<std::string, ArchetypeID> m_archetypeNames;
        std::unordered_map<std::string, ComponentID> m_componentNames;
    };
}
