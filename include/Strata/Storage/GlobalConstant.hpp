#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"

namespace Strata
{
    // Single value shared by every row of an archetype. Size is independent of the row count.
    class GlobalConstant
    {
    public:
        explicit GlobalConstant(std::vector<std::byte> value) : m_value(std::move(value)) {}

        template<typename T>
        STRATA_NODISCARD T Get() const noexcept
        {
            static_assert(std::is_trivially_copyable_v<T>, "Global constants hold trivially copyable values");
            STRATA_ASSERT(sizeof(T) == m_value.size(), "Type width does not match global constant");
            T value;
            std::memcpy(&value, m_value.data(), sizeof(T));
            return value;
        }

        template<typename T>
        void Set(const T& value) noexcept
        {
            static_assert(std::is_trivially_copyable_v<T>, "Global constants hold trivially copyable values");
            STRATA_ASSERT(sizeof(T) == m_value.size(), "Type width does not match global constant");
            std::memcpy(m_value.data(), &value, sizeof(T));
        }

        STRATA_NODISCARD std::span<const std::byte> Bytes() const noexcept { return m_value; }
        STRATA_NODISCARD std::span<std::byte> Bytes() noexcept { return m_value; }

        STRATA_NODISCARD std::uint32_t ElementSize() const noexcept
        {
            return static_cast<std::uint32_t>(m_value.size());
        }

    private:
        std::vector<std::byte> m_value;
    };
}
