#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "../Access/ClaimSet.hpp"
#include "../Archetype/ArchetypeRegistry.hpp"
#include "../Core/Profile.hpp"
#include "../World/WorldData.hpp"
#include "QueryTerms.hpp"

namespace Strata
{
    /**
     * @brief Reference to a matched storage: a table on the dense path, an archetype otherwise
     */
    struct StorageRef
    {
        enum class Kind : std::uint8_t
        {
            Table,
            Archetype
        };

        Kind kind;
        std::uint32_t index;

        STRATA_NODISCARD static constexpr StorageRef ForTable(TableID id) noexcept { return {Kind::Table, id}; }
        STRATA_NODISCARD static constexpr StorageRef ForArchetype(ArchetypeID id) noexcept { return {Kind::Archetype, id}; }

        bool operator==(const StorageRef&) const noexcept = default;
    };

    /**
     * @brief Persistent matching state of one query shape
     *
     * Built once per world: the component ids of every term, the required and
     * excluded masks and the claim set. Update() only looks at archetypes created
     * since the previous call, so keeping a query around stays cheap as the world
     * grows. Matched storages are kept in archetype creation order.
     */
    template<typename... Terms>
    class QueryState
    {
        static_assert((Detail::ValidTerm<Terms> && ...), "Query terms must be components or query modifiers");

    public:
        static constexpr std::size_t TERM_COUNT = sizeof...(Terms);

        // Total number of component ids, Or terms hold one per alternative
        static constexpr std::size_t ID_COUNT = (std::size_t{0} + ... + Detail::TermTraits<Terms>::ID_COUNT);

        // Position of each term's first id in GetComponentIDs()
        static constexpr std::array<std::size_t, TERM_COUNT> ID_OFFSETS = [] {
            constexpr std::array<std::size_t, TERM_COUNT> counts{Detail::TermTraits<Terms>::ID_COUNT...};
            std::array<std::size_t, TERM_COUNT> offsets{};
            std::size_t offset = 0;
            for (std::size_t i = 0; i < TERM_COUNT; ++i)
            {
                offsets[i] = offset;
                offset += counts[i];
            }
            return offsets;
        }();

        // Every term lives in tables, so the query walks tables instead of archetypes
        static constexpr bool IS_DENSE = (Detail::IS_DENSE<Terms> && ...);

        explicit QueryState(WorldData& data)
        {
            std::size_t offset = 0;
            (InitTerm<Terms>(data, offset), ...);
            Update(data.archetypes);
        }

        void Update(const ArchetypeRegistry& archetypes)
        {
            const std::size_t end = archetypes.Size();
            if (m_watermark == end)
                return;

            STRATA_PROFILE_ZONE_NAMED_COLOR("QueryState::Update", Profile::ColorQuery);

            if (m_anchor != INVALID_COMPONENT)
            {
                // Only archetypes containing the anchor component can match
                std::span<const ArchetypeID> candidates = archetypes.GetArchetypesWith(m_anchor);
                auto it = std::lower_bound(candidates.begin(), candidates.end(), static_cast<ArchetypeID>(m_watermark));
                for (; it != candidates.end(); ++it)
                    Consider(archetypes.Get(*it));
            }
            else
            {
                for (std::size_t id = m_watermark; id < end; ++id)
                    Consider(archetypes.Get(static_cast<ArchetypeID>(id)));
            }

            m_watermark = end;
        }

        STRATA_NODISCARD bool Matches(const Archetype& archetype) const noexcept
        {
            const ComponentMask& mask = archetype.GetMask();
            if (!mask.HasAll(m_required) || mask.Intersects(m_excluded))
                return false;

            // Each Or term needs one alternative that can hold in this archetype
            for (const AnyOf& group : m_anyOf)
            {
                if (!mask.Intersects(group.present) && mask.HasAll(group.absent))
                    return false;
            }
            return true;
        }

        STRATA_NODISCARD std::span<const StorageRef> GetStorages() const noexcept { return m_storages; }
        STRATA_NODISCARD const std::array<ComponentID, ID_COUNT>& GetComponentIDs() const noexcept { return m_ids; }
        STRATA_NODISCARD const ClaimSet& GetClaims() const noexcept { return m_claims; }
        STRATA_NODISCARD AccessMode GetMode() const noexcept { return m_claims.GetMode(); }

        // Number of archetypes already examined
        STRATA_NODISCARD std::size_t GetWatermark() const noexcept { return m_watermark; }

    private:
        // Alternatives of one Or term: components that must be present or absent
        struct AnyOf
        {
            ComponentMask present;
            ComponentMask absent;
        };

        template<typename Term>
        void InitTerm(WorldData& data, std::size_t& offset)
        {
            using Traits = Detail::TermTraits<Term>;
            if constexpr (Traits::KIND == Detail::TermKind::Or)
            {
                AnyOf group;
                Traits::ForEachFilter([&]<typename Filter>() {
                    const ComponentID id = data.RegisterComponent<typename Detail::TermTraits<Filter>::ComponentType>();
                    m_ids[offset++] = id;
                    if constexpr (Detail::TermTraits<Filter>::KIND == Detail::TermKind::Without)
                        group.absent.Set(id);
                    else
                        group.present.Set(id);
                    if constexpr (Detail::ACCESSES_DATA<Filter>)
                        m_claims.Read(id);
                });
                m_anyOf.push_back(group);
            }
            else
            {
                const ComponentID id = data.RegisterComponent<typename Traits::ComponentType>();
                m_ids[offset++] = id;
                AddTerm<Term>(id);
            }
        }

        template<typename Term>
        void AddTerm(ComponentID id) noexcept
        {
            using Traits = Detail::TermTraits<Term>;
            if constexpr (Detail::IS_REQUIRED<Term>)
            {
                m_required.Set(id);
                if (m_anchor == INVALID_COMPONENT)
                    m_anchor = id;
            }
            if constexpr (Traits::KIND == Detail::TermKind::Without)
                m_excluded.Set(id);

            if constexpr (Detail::ACCESSES_DATA<Term>)
            {
                if constexpr (Traits::WRITE)
                    m_claims.Write(id);
                else
                    m_claims.Read(id);
            }
        }

        void Consider(const Archetype& archetype)
        {
            if (!Matches(archetype))
                return;

            if constexpr (IS_DENSE)
            {
                const TableID table = archetype.GetTableID();
                if (m_seenTables.size() <= table)
                    m_seenTables.resize(static_cast<std::size_t>(table) + 1, false);
                if (m_seenTables[table])
                    return;
                m_seenTables[table] = true;
                m_storages.push_back(StorageRef::ForTable(table));
            }
            else
            {
                m_storages.push_back(StorageRef::ForArchetype(archetype.GetID()));
            }
        }

        std::array<ComponentID, ID_COUNT> m_ids{};
        ComponentMask m_required;
        ComponentMask m_excluded;
        std::vector<AnyOf> m_anyOf;
        ComponentID m_anchor = INVALID_COMPONENT;
        ClaimSet m_claims;

        std::vector<StorageRef> m_storages;
        std::vector<bool> m_seenTables;
        std::size_t m_watermark = 0;
    };
}
