#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>
#include <type_traits>

#include "Base.hpp"

namespace Strata
{
    // Process-wide index of a C++ type. Not stable across runs.
    using TypeIndex = std::uint32_t;

    namespace Detail
    {
        // FNV-1a, 64 bit
        constexpr std::uint64_t HashName(std::string_view name) noexcept
        {
            std::uint64_t hash = 0xcbf29ce484222325ULL;
            for (char c : name)
            {
                hash ^= static_cast<std::uint8_t>(c);
                hash *= 0x100000001b3ULL;
            }
            return hash;
        }

        template<typename T>
        constexpr std::string_view TypeNameInternal() noexcept
        {
#if defined(STRATA_COMPILER_MSVC)
            constexpr std::string_view funcName = __FUNCSIG__;
            constexpr std::string_view prefix = "TypeNameInternal<";
            constexpr std::string_view suffix = ">(void)";
#elif defined(STRATA_COMPILER_CLANG)
            constexpr std::string_view funcName = __PRETTY_FUNCTION__;
            constexpr std::string_view prefix = "TypeNameInternal() [T = ";
            constexpr std::string_view suffix = "]";
#else
            constexpr std::string_view funcName = __PRETTY_FUNCTION__;
            constexpr std::string_view prefix = "TypeNameInternal() [with T = ";
            constexpr std::string_view suffix = "]";
#endif
            std::size_t start = funcName.find(prefix);
            if (start == std::string_view::npos)
                return "Unknown";
            start += prefix.size();

            std::size_t end = funcName.rfind(suffix);
            if (end == std::string_view::npos || end <= start)
                return "Unknown";

            std::string_view name = funcName.substr(start, end - start);
#if defined(STRATA_COMPILER_MSVC)
            if (name.starts_with("class "))
                name.remove_prefix(6);
            else if (name.starts_with("struct "))
                name.remove_prefix(7);
#endif
            return name;
        }

        inline std::atomic<TypeIndex>& TypeIndexCounter() noexcept
        {
            static std::atomic<TypeIndex> s_next{0};
            return s_next;
        }

        template<typename T>
        struct TypeIndexStorage
        {
            static TypeIndex Value() noexcept
            {
                static const TypeIndex s_index = TypeIndexCounter().fetch_add(1, std::memory_order_relaxed);
                return s_index;
            }
        };
    }

    template<typename T>
    struct TypeID
    {
        using Type = std::remove_cvref_t<T>;

        STRATA_NODISCARD static TypeIndex Value() noexcept
        {
            return Detail::TypeIndexStorage<Type>::Value();
        }

        STRATA_NODISCARD static constexpr std::string_view Name() noexcept
        {
            return Detail::TypeNameInternal<Type>();
        }

        // Stable across runs and platforms that spell the type name the same way
        STRATA_NODISCARD static constexpr std::uint64_t Hash() noexcept
        {
            return Detail::HashName(Name());
        }
    };
}
