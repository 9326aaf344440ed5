#pragma once

#include <type_traits>
#include <utility>
#include <variant>

#include "Base.hpp"
#include "Error.hpp"

namespace Strata
{
    template<typename E>
    struct ErrorValue
    {
        E value;

        constexpr explicit ErrorValue(const E& e) : value(e) {}
        constexpr explicit ErrorValue(E&& e) : value(std::move(e)) {}
    };

    template<typename E>
    constexpr ErrorValue<std::decay_t<E>> Err(E&& e)
    {
        return ErrorValue<std::decay_t<E>>(std::forward<E>(e));
    }

    // Shorthand for the common case of failing with a library error code.
    inline constexpr ErrorValue<Error> Err(ErrorCode code, const char* message = nullptr)
    {
        return ErrorValue<Error>(MakeError(code, message));
    }

    struct OkTag {};
    inline constexpr OkTag OK{};

    /**
    * Value-or-error return type used across the library instead of exceptions.
    *
    * A Result is either ok (holding a T) or failed (holding an E). Accessing the
    * wrong alternative is a programming error and asserts in debug builds.
    */
    template<typename T, typename E = Error>
    class Result
    {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference type");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = T;
        using ErrorType = E;

        constexpr Result(const T& value) : m_storage(std::in_place_index<0>, value) {}
        constexpr Result(T&& value) : m_storage(std::in_place_index<0>, std::move(value)) {}
        constexpr Result(const ErrorValue<E>& err) : m_storage(std::in_place_index<1>, err.value) {}
        constexpr Result(ErrorValue<E>&& err) : m_storage(std::in_place_index<1>, std::move(err.value)) {}

        STRATA_NODISCARD constexpr bool HasValue() const noexcept { return m_storage.index() == 0; }
        STRATA_NODISCARD constexpr bool IsOk() const noexcept { return HasValue(); }
        STRATA_NODISCARD constexpr bool IsErr() const noexcept { return !HasValue(); }
        STRATA_NODISCARD constexpr explicit operator bool() const noexcept { return HasValue(); }

        constexpr T& Value() &
        {
            STRATA_ASSERT(HasValue(), "Called Value() on Result containing error");
            return *std::get_if<0>(&m_storage);
        }

        constexpr const T& Value() const&
        {
            STRATA_ASSERT(HasValue(), "Called Value() on Result containing error");
            return *std::get_if<0>(&m_storage);
        }

        constexpr T&& Value() &&
        {
            STRATA_ASSERT(HasValue(), "Called Value() on Result containing error");
            return std::move(*std::get_if<0>(&m_storage));
        }

        constexpr const E& Error() const&
        {
            STRATA_ASSERT(!HasValue(), "Called Error() on Result containing value");
            return *std::get_if<1>(&m_storage);
        }

        constexpr E&& Error() &&
        {
            STRATA_ASSERT(!HasValue(), "Called Error() on Result containing value");
            return std::move(*std::get_if<1>(&m_storage));
        }

        // Null when the result holds a value.
        STRATA_NODISCARD constexpr const E* GetError() const noexcept
        {
            return std::get_if<1>(&m_storage);
        }

        constexpr T& operator*() & { return Value(); }
        constexpr const T& operator*() const& { return Value(); }
        constexpr T&& operator*() && { return std::move(*this).Value(); }

        constexpr T* operator->() noexcept { return &Value(); }
        constexpr const T* operator->() const noexcept { return &Value(); }

    private:
        std::variant<T, E> m_storage;
    };

    template<typename E>
    class Result<void, E>
    {
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = void;
        using ErrorType = E;

        constexpr Result() noexcept = default;
        constexpr Result(OkTag) noexcept {}
        constexpr Result(const ErrorValue<E>& err) : m_error(err.value), m_hasValue(false) {}
        constexpr Result(ErrorValue<E>&& err) : m_error(std::move(err.value)), m_hasValue(false) {}

        STRATA_NODISCARD constexpr bool HasValue() const noexcept { return m_hasValue; }
        STRATA_NODISCARD constexpr bool IsOk() const noexcept { return m_hasValue; }
        STRATA_NODISCARD constexpr bool IsErr() const noexcept { return !m_hasValue; }
        STRATA_NODISCARD constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr const E& Error() const&
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        STRATA_NODISCARD constexpr const E* GetError() const noexcept
        {
            return m_hasValue ? nullptr : &m_error;
        }

    private:
        E m_error{};
        bool m_hasValue = true;
    };

    template<typename T, typename E>
    STRATA_NODISCARD constexpr bool operator==(const Result<T, E>& lhs, const ErrorValue<E>& rhs)
    {
        return lhs.IsErr() && lhs.Error() == rhs.value;
    }
}
