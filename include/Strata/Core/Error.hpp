#pragma once

#include <cstdint>

namespace Strata
{
    enum class ErrorCode : std::uint32_t
    {
        None = 0,

        // Schema definition and lookup
        SchemaError,

        // Malformed bulk input such as a sparse matrix rebuild
        DataError,

        // Handle whose entity has been removed by a commit
        InvalidHandle,

        // Row count would reach the NULL sentinel of a pointer width
        CapacityExceeded,

        // Column or sparse matrix storage could not grow
        AllocationFailed,

        // Checked access with a value type that does not match the component
        TypeMismatch,

        // Validation failures, raised only by the checked surface
        BoundsCheckFailure,
        NaNCheckFailure,
        NullCheckFailure,

        Unknown = 0xFFFFFFFF
    };

    struct Error
    {
        ErrorCode code;
        const char* message;

        constexpr Error(ErrorCode c = ErrorCode::None, const char* msg = nullptr) noexcept
            : code(c), message(msg ? msg : GetDefaultMessage(c))
        {}

        [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept
        {
            return code == other.code;
        }

        [[nodiscard]] constexpr bool operator==(ErrorCode other) const noexcept
        {
            return code == other;
        }

        [[nodiscard]] constexpr bool IsValidationFailure() const noexcept
        {
            return code == ErrorCode::BoundsCheckFailure ||
                   code == ErrorCode::NaNCheckFailure ||
                   code == ErrorCode::NullCheckFailure;
        }

        [[nodiscard]] static constexpr const char* GetDefaultMessage(ErrorCode code) noexcept
        {
            switch (code)
            {
                case ErrorCode::None: return "No error";
                case ErrorCode::SchemaError: return "Schema error";
                case ErrorCode::DataError: return "Malformed data";
                case ErrorCode::InvalidHandle: return "Handle refers to a removed entity";
                case ErrorCode::CapacityExceeded: return "Archetype row capacity exceeded";
                case ErrorCode::AllocationFailed: return "Allocation failed";
                case ErrorCode::TypeMismatch: return "Value type does not match component type";
                case ErrorCode::BoundsCheckFailure: return "Value outside configured bounds";
                case ErrorCode::NaNCheckFailure: return "Value is NaN";
                case ErrorCode::NullCheckFailure: return "Pointer is NULL";
                case ErrorCode::Unknown: return "Unknown error";
                default: return "Unspecified error";
            }
        }
    };

    inline constexpr Error MakeError(ErrorCode code, const char* message = nullptr) noexcept
    {
        return Error(code, message);
    }
}
