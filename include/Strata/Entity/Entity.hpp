#pragma once

#include <cstdint>
#include <functional>
#include <limits>

#include "../Core/Base.hpp"

namespace Strata
{
    /**
     * @brief Handle to one logical record: a 32-bit index plus a 32-bit generation
     *
     * The generation of an index is bumped every time the index is freed, so a
     * handle issued before a despawn never matches the slot after it is reused.
     */
    class Entity
    {
    public:
        using IndexType = std::uint32_t;
        using GenerationType = std::uint32_t;
        using ValueType = std::uint64_t;

        static constexpr std::size_t INDEX_BITS = 32;
        static constexpr ValueType INDEX_MASK = 0xFFFFFFFFull;
        static constexpr ValueType INVALID = std::numeric_limits<ValueType>::max();

        constexpr Entity() noexcept : m_value{INVALID} {}
        constexpr Entity(IndexType index, GenerationType generation) noexcept
            : m_value{(static_cast<ValueType>(generation) << INDEX_BITS) | index}
        {}

        STRATA_NODISCARD static constexpr Entity FromBits(ValueType bits) noexcept
        {
            Entity entity;
            entity.m_value = bits;
            return entity;
        }

        STRATA_NODISCARD static constexpr Entity Invalid() noexcept { return Entity{}; }

        STRATA_NODISCARD constexpr IndexType GetIndex() const noexcept { return static_cast<IndexType>(m_value & INDEX_MASK); }
        STRATA_NODISCARD constexpr GenerationType GetGeneration() const noexcept { return static_cast<GenerationType>(m_value >> INDEX_BITS); }
        STRATA_NODISCARD constexpr ValueType GetValue() const noexcept { return m_value; }

        STRATA_NODISCARD constexpr bool IsValid() const noexcept { return m_value != INVALID; }
        STRATA_NODISCARD constexpr explicit operator bool() const noexcept { return IsValid(); }

        STRATA_NODISCARD constexpr bool operator==(const Entity& other) const noexcept = default;
        STRATA_NODISCARD constexpr bool operator<(const Entity& other) const noexcept { return m_value < other.m_value; }

    private:
        ValueType m_value;
    };

    struct EntityHash
    {
        std::size_t operator()(const Entity& entity) const noexcept
        {
            std::uint64_t hash = entity.GetValue();
            hash ^= hash >> 33;
            hash *= 0xff51afd7ed558ccdULL;
            hash ^= hash >> 33;
            return static_cast<std::size_t>(hash);
        }
    };
}

namespace std
{
    template<>
    struct hash<Strata::Entity>
    {
        std::size_t operator()(const Strata::Entity& entity) const noexcept
        {
            return Strata::EntityHash{}(entity);
        }
    };
}
