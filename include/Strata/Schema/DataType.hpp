#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <type_traits>

#include "../Core/Base.hpp"
#include "../Entity/Pointer.hpp"

namespace Strata
{
    // Closed set of element types a component may store. Anything else is a
    // fixed-size Opaque payload established at definition time.
    enum class TypeKind : std::uint8_t
    {
        None = 0,
        Bool,
        Int8,
        Int16,
        Int32,
        Int64,
        UInt8,
        UInt16,
        UInt32,
        UInt64,
        Float32,
        Float64,
        Pointer,
        Opaque
    };

    struct DataType
    {
        TypeKind kind = TypeKind::None;
        std::uint32_t size = 0;
        ArchetypeID target = INVALID_ARCHETYPE;

        STRATA_NODISCARD static constexpr DataType None() noexcept { return {TypeKind::None, 0, INVALID_ARCHETYPE}; }
        STRATA_NODISCARD static constexpr DataType Bool() noexcept { return {TypeKind::Bool, sizeof(bool), INVALID_ARCHETYPE}; }
        STRATA_NODISCARD static constexpr DataType Int8() noexcept { return {TypeKind::Int8, 1, INVALID_ARCHETYPE}; }
        STRATA_NODISCARD static constexpr DataType Int16() noexcept { return {TypeKind::Int16, 2, INVALID_ARCHETYPE}; }
        STRATA_NODISCARD static constexpr DataType Int32() noexcept { return {TypeKind::Int32, 4, INVALID_ARCHETYPE}; }
        STRATA_NODISCARD static constexpr DataType Int64() noexcept { return {TypeKind::Int64, 8, INVALID_ARCHETYPE}; }
        STRATA_NODISCARD static constexpr DataType UInt8() noexcept { return {TypeKind::UInt8, 1, INVALID_ARCHETYPE}; }
        STRATA_NODISCARD static constexpr DataType UInt16() noexcept { return {TypeKind::UInt16, 2, INVALID_ARCHETYPE}; }
        STRATA_NODISCARD static constexpr DataType UInt32() noexcept { return {TypeKind::UInt32, 4, INVALID_ARCHETYPE}; }
        STRATA_NODISCARD static constexpr DataType UInt64() noexcept { return {TypeKind::UInt64, 8, INVALID_ARCHETYPE}; }
        STRATA_NODISCARD static constexpr DataType Float32() noexcept { return {TypeKind::Float32, 4, INVALID_ARCHETYPE}; }
        STRATA_NODISCARD static constexpr DataType Float64() noexcept { return {TypeKind::Float64, 8, INVALID_ARCHETYPE}; }

        /**
        * Row index into another archetype, stored in `bits` bits (8, 16 or 32).
        * The all-ones value of that width is NULL, which caps the target
        * archetype at that many rows.
        */
        STRATA_NODISCARD static constexpr DataType PointerTo(ArchetypeID targetArchetype, std::uint32_t bits = 32) noexcept
        {
            return {TypeKind::Pointer, bits % 8 == 0 ? bits / 8 : 0, targetArchetype};
        }

        STRATA_NODISCARD static constexpr DataType Opaque(std::uint32_t bytes) noexcept
        {
            return {TypeKind::Opaque, bytes, INVALID_ARCHETYPE};
        }

        template<typename T>
        STRATA_NODISCARD static constexpr DataType Of() noexcept
        {
            using U = std::remove_cv_t<T>;
            if constexpr (std::is_same_v<U, bool>) return Bool();
            else if constexpr (std::is_same_v<U, std::int8_t>) return Int8();
            else if constexpr (std::is_same_v<U, std::int16_t>) return Int16();
            else if constexpr (std::is_same_v<U, std::int32_t>) return Int32();
            else if constexpr (std::is_same_v<U, std::int64_t>) return Int64();
            else if constexpr (std::is_same_v<U, std::uint8_t>) return UInt8();
            else if constexpr (std::is_same_v<U, std::uint16_t>) return UInt16();
            else if constexpr (std::is_same_v<U, std::uint32_t>) return UInt32();
            else if constexpr (std::is_same_v<U, std::uint64_t>) return UInt64();
            else if constexpr (std::is_same_v<U, float>) return Float32();
            else if constexpr (std::is_same_v<U, double>) return Float64();
            else
            {
                static_assert(std::is_trivially_copyable_v<U>, "Opaque payloads must be trivially copyable");
                return Opaque(static_cast<std::uint32_t>(sizeof(U)));
            }
        }

        STRATA_NODISCARD constexpr bool IsNone() const noexcept { return kind == TypeKind::None; }
        STRATA_NODISCARD constexpr bool IsPointer() const noexcept { return kind == TypeKind::Pointer; }
        STRATA_NODISCARD constexpr bool IsOpaque() const noexcept { return kind == TypeKind::Opaque; }
        STRATA_NODISCARD constexpr bool IsFloating() const noexcept { return kind == TypeKind::Float32 || kind == TypeKind::Float64; }
        STRATA_NODISCARD constexpr bool IsNumeric() const noexcept { return kind >= TypeKind::Bool && kind <= TypeKind::Float64; }

        // Largest row count the width can address; the value itself is the NULL encoding.
        STRATA_NODISCARD constexpr RowIndex PointerCapacity() const noexcept
        {
            switch (size)
            {
                case 1: return std::numeric_limits<std::uint8_t>::max();
                case 2: return std::numeric_limits<std::uint16_t>::max();
                case 4: return std::numeric_limits<std::uint32_t>::max();
                default: return 0;
            }
        }

        /**
        * Whether T can be read from / written to this type through the checked
        * surface. Pointers go through the Pointer accessors instead.
        */
        template<typename T>
        STRATA_NODISCARD constexpr bool Accepts() const noexcept
        {
            if constexpr (!std::is_trivially_copyable_v<T>)
            {
                return false;
            }
            else
            {
                if (IsOpaque())
                    return sizeof(T) == size;
                if (IsNumeric())
                    return Of<T>().kind == kind;
                return false;
            }
        }

        STRATA_NODISCARD constexpr const char* Name() const noexcept
        {
            switch (kind)
            {
                case TypeKind::None: return "none";
                case TypeKind::Bool: return "bool";
                case TypeKind::Int8: return "int8";
                case TypeKind::Int16: return "int16";
                case TypeKind::Int32: return "int32";
                case TypeKind::Int64: return "int64";
                case TypeKind::UInt8: return "uint8";
                case TypeKind::UInt16: return "uint16";
                case TypeKind::UInt32: return "uint32";
                case TypeKind::UInt64: return "uint64";
                case TypeKind::Float32: return "float32";
                case TypeKind::Float64: return "float64";
                case TypeKind::Pointer: return "pointer";
                case TypeKind::Opaque: return "opaque";
            }
            return "unknown";
        }

        constexpr bool operator==(const DataType& other) const noexcept = default;
    };

    namespace Detail
    {
        template<typename T>
        STRATA_FORCEINLINE T LoadUnaligned(const std::byte* src) noexcept
        {
            T value;
            std::memcpy(&value, src, sizeof(T));
            return value;
        }

        template<typename T>
        STRATA_FORCEINLINE void StoreUnaligned(std::byte* dst, T value) noexcept
        {
            std::memcpy(dst, &value, sizeof(T));
        }
    }

    // Widen one stored numeric element to double for bounds checks and sort keys.
    STRATA_NODISCARD inline double LoadAsDouble(const std::byte* src, TypeKind kind) noexcept
    {
        switch (kind)
        {
            case TypeKind::Bool: return Detail::LoadUnaligned<bool>(src) ? 1.0 : 0.0;
            case TypeKind::Int8: return static_cast<double>(Detail::LoadUnaligned<std::int8_t>(src));
            case TypeKind::Int16: return static_cast<double>(Detail::LoadUnaligned<std::int16_t>(src));
            case TypeKind::Int32: return static_cast<double>(Detail::LoadUnaligned<std::int32_t>(src));
            case TypeKind::Int64: return static_cast<double>(Detail::LoadUnaligned<std::int64_t>(src));
            case TypeKind::UInt8: return static_cast<double>(Detail::LoadUnaligned<std::uint8_t>(src));
            case TypeKind::UInt16: return static_cast<double>(Detail::LoadUnaligned<std::uint16_t>(src));
            case TypeKind::UInt32: return static_cast<double>(Detail::LoadUnaligned<std::uint32_t>(src));
            case TypeKind::UInt64: return static_cast<double>(Detail::LoadUnaligned<std::uint64_t>(src));
            case TypeKind::Float32: return static_cast<double>(Detail::LoadUnaligned<float>(src));
            case TypeKind::Float64: return Detail::LoadUnaligned<double>(src);
            default: return 0.0;
        }
    }

    // Decode a stored pointer of the given byte width, mapping its all-ones value to NULL_ROW.
    STRATA_NODISCARD inline RowIndex LoadRowIndex(const std::byte* src, std::uint32_t width) noexcept
    {
        switch (width)
        {
            case 1:
            {
                auto v = Detail::LoadUnaligned<std::uint8_t>(src);
                return v == std::numeric_limits<std::uint8_t>::max() ? NULL_ROW : RowIndex(v);
            }
            case 2:
            {
                auto v = Detail::LoadUnaligned<std::uint16_t>(src);
                return v == std::numeric_limits<std::uint16_t>::max() ? NULL_ROW : RowIndex(v);
            }
            case 4:
                return Detail::LoadUnaligned<std::uint32_t>(src);
            default:
                STRATA_ASSERT(false, "Unsupported pointer width");
                return NULL_ROW;
        }
    }

    inline void StoreRowIndex(std::byte* dst, std::uint32_t width, RowIndex row) noexcept
    {
        switch (width)
        {
            case 1:
                STRATA_ASSERT(row == NULL_ROW || row < std::numeric_limits<std::uint8_t>::max(), "Row does not fit 8-bit pointer");
                Detail::StoreUnaligned<std::uint8_t>(dst, row == NULL_ROW ? std::numeric_limits<std::uint8_t>::max() : static_cast<std::uint8_t>(row));
                break;
            case 2:
                STRATA_ASSERT(row == NULL_ROW || row < std::numeric_limits<std::uint16_t>::max(), "Row does not fit 16-bit pointer");
                Detail::StoreUnaligned<std::uint16_t>(dst, row == NULL_ROW ? std::numeric_limits<std::uint16_t>::max() : static_cast<std::uint16_t>(row));
                break;
            case 4:
                Detail::StoreUnaligned<std::uint32_t>(dst, row);
                break;
            default:
                STRATA_ASSERT(false, "Unsupported pointer width");
                break;
        }
    }
}
