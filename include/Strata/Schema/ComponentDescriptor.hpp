#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "../Core/Base.hpp"
#include "DataType.hpp"

namespace Strata
{
    enum class StorageKind : std::uint8_t
    {
        Attribute,          // one element per row
        GlobalConstant,     // one element shared by the whole archetype
        SparseMatrix        // per row, a variable-length list of (target, value)
    };

    // What a commit does to an entity whose pointer would dangle.
    enum class Nullability : std::uint8_t
    {
        Disallowed,         // the owning entity is destroyed along with the target
        Allowed             // the pointer becomes NULL (sparse entries are dropped)
    };

    struct Bounds
    {
        double min;
        double max;

        constexpr bool operator==(const Bounds&) const noexcept = default;
    };

    // Reporting-only checks run by the ValidationEngine. Everything is off by default.
    struct ValidationConfig
    {
        bool nanCheck = false;
        std::optional<Bounds> bounds;
        bool nullCheck = false;

        STRATA_NODISCARD bool Any() const noexcept { return nanCheck || bounds.has_value() || nullCheck; }
    };

    /**
    * Caller-side description of a component, handed to DefineComponent.
    *
    * For SparseMatrix storage `type` is the value type (DataType::None for a
    * pure connectivity matrix) and `target` names the archetype the entries
    * point into. For a pointer attribute the target lives in the DataType.
    */
    struct ComponentDefinition
    {
        std::string name;
        DataType type;
        StorageKind storage = StorageKind::Attribute;
        ArchetypeID target = INVALID_ARCHETYPE;
        Nullability nullability = Nullability::Disallowed;
        ValidationConfig validation;
        std::string doc;
        std::string unit;

        // Element written into new rows and backfilled into existing ones. Empty means zero (NULL for pointers).
        std::vector<std::byte> initialValue;

        template<typename T>
        ComponentDefinition& SetInitialValue(const T& value)
        {
            static_assert(std::is_trivially_copyable_v<T>, "Initial values must be trivially copyable");
            initialValue.resize(sizeof(T));
            std::memcpy(initialValue.data(), &value, sizeof(T));
            return *this;
        }

        STRATA_NODISCARD static ComponentDefinition Attribute(std::string name, DataType type)
        {
            ComponentDefinition def;
            def.name = std::move(name);
            def.type = type;
            def.storage = StorageKind::Attribute;
            return def;
        }

        STRATA_NODISCARD static ComponentDefinition Global(std::string name, DataType type)
        {
            ComponentDefinition def;
            def.name = std::move(name);
            def.type = type;
            def.storage = StorageKind::GlobalConstant;
            return def;
        }

        STRATA_NODISCARD static ComponentDefinition Sparse(std::string name, ArchetypeID target, DataType valueType = DataType::None())
        {
            ComponentDefinition def;
            def.name = std::move(name);
            def.type = valueType;
            def.storage = StorageKind::SparseMatrix;
            def.target = target;
            return def;
        }
    };

    // Registered, immutable form of a component.
    struct ComponentDescriptor
    {
        ComponentID id = INVALID_COMPONENT;
        ArchetypeID archetype = INVALID_ARCHETYPE;
        std::uint32_t slot = 0;                 // storage index inside the owning EntityTable

        std::string name;
        std::string qualifiedName;              // "Archetype.component"
        DataType type;
        StorageKind storage = StorageKind::Attribute;
        ArchetypeID target = INVALID_ARCHETYPE; // pointed-to archetype for pointers and sparse matrices
        Nullability nullability = Nullability::Disallowed;
        ValidationConfig validation;
        std::string doc;
        std::string unit;
        std::vector<std::byte> initialValue;    // exactly ElementSize() bytes

        // True for every component whose stored values are row indices into `target`.
        STRATA_NODISCARD bool IsReference() const noexcept
        {
            return target != INVALID_ARCHETYPE;
        }

        STRATA_NODISCARD bool AllowsNull() const noexcept
        {
            return nullability == Nullability::Allowed;
        }

        STRATA_NODISCARD std::uint32_t ElementSize() const noexcept
        {
            return type.size;
        }
    };

    struct ArchetypeDescriptor
    {
        ArchetypeID id = INVALID_ARCHETYPE;
        std::string name;
        std::vector<ComponentID> components;    // in definition order, index == slot
    };
}
