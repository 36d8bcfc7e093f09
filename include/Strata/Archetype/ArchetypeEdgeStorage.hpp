#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <unordered_map>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Entity/EntityTable.hpp"

namespace Strata
{
    inline constexpr ArchetypeID INVALID_ARCHETYPE = 0xFFFFFFFFu;

    /**
     * @brief Cached single-component transitions out of one archetype
     *
     * Hybrid layout:
     * - Direct array indexing for component ids below FAST_PATH_THRESHOLD
     * - Hash map for higher ids
     *
     * Low ids belong to the components registered first, which are usually the
     * ones that change most often.
     */
    class ArchetypeEdgeStorage
    {
    public:
        static constexpr ComponentID FAST_PATH_THRESHOLD = 32;

        ArchetypeEdgeStorage() noexcept
        {
            m_fastAdd.fill(INVALID_ARCHETYPE);
            m_fastRemove.fill(INVALID_ARCHETYPE);
        }

        void SetAdd(ComponentID component, ArchetypeID target)
        {
            Set(m_fastAdd, m_slowAdd, component, target);
        }

        void SetRemove(ComponentID component, ArchetypeID target)
        {
            Set(m_fastRemove, m_slowRemove, component, target);
        }

        STRATA_NODISCARD std::optional<ArchetypeID> GetAdd(ComponentID component) const noexcept
        {
            return Get(m_fastAdd, m_slowAdd, component);
        }

        STRATA_NODISCARD std::optional<ArchetypeID> GetRemove(ComponentID component) const noexcept
        {
            return Get(m_fastRemove, m_slowRemove, component);
        }

        STRATA_NODISCARD std::size_t Size() const noexcept
        {
            std::size_t count = m_slowAdd.size() + m_slowRemove.size();
            for (std::size_t i = 0; i < FAST_PATH_THRESHOLD; ++i)
            {
                count += m_fastAdd[i] != INVALID_ARCHETYPE;
                count += m_fastRemove[i] != INVALID_ARCHETYPE;
            }
            return count;
        }

    private:
        using FastPath = std::array<ArchetypeID, FAST_PATH_THRESHOLD>;
        using SlowPath = std::unordered_map<ComponentID, ArchetypeID>;

        static void Set(FastPath& fast, SlowPath& slow, ComponentID component, ArchetypeID target)
        {
            if (component < FAST_PATH_THRESHOLD)
                fast[component] = target;
            else
                slow[component] = target;
        }

        static std::optional<ArchetypeID> Get(const FastPath& fast, const SlowPath& slow, ComponentID component) noexcept
        {
            if (component < FAST_PATH_THRESHOLD) STRATA_LIKELY
            {
                ArchetypeID target = fast[component];
                return target != INVALID_ARCHETYPE ? std::optional<ArchetypeID>(target) : std::nullopt;
            }
            auto it = slow.find(component);
            return it != slow.end() ? std::optional<ArchetypeID>(it->second) : std::nullopt;
        }

        FastPath m_fastAdd;
        FastPath m_fastRemove;
        SlowPath m_slowAdd;
        SlowPath m_slowRemove;
    };
}
