#pragma once

#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../Component/ComponentRegistry.hpp"
#include "../Core/Contract.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Storage/Table.hpp"
#include "Archetype.hpp"

namespace Strata
{
    /**
     * @brief Canonical component set to archetype mapping plus the transition graph
     *
     * Archetype 0 is the empty archetype. Archetypes are created lazily and never
     * destroyed, so an ArchetypeID stays valid for the lifetime of the registry and
     * Size() only grows. Query caches use Size() as their refresh watermark.
     */
    class ArchetypeRegistry
    {
    public:
        ArchetypeRegistry(const ComponentRegistry& components, Tables& tables)
            : m_components(components)
            , m_tables(tables)
        {
            m_archetypes.push_back(std::make_unique<Archetype>(EMPTY_ARCHETYPE, EMPTY_TABLE,
                std::vector<ComponentID>{}, std::vector<ComponentID>{}));
            m_bySet.emplace(std::vector<ComponentID>{}, EMPTY_ARCHETYPE);
        }

        ArchetypeRegistry(const ArchetypeRegistry&) = delete;
        ArchetypeRegistry& operator=(const ArchetypeRegistry&) = delete;

        /**
         * @brief Find or create the archetype for a component set
         * @param components Component ids in any order, duplicates allowed
         */
        ArchetypeID GetOrCreate(std::span<const ComponentID> components)
        {
            std::vector<ComponentID> key(components.begin(), components.end());
            std::sort(key.begin(), key.end());
            key.erase(std::unique(key.begin(), key.end()), key.end());
            return GetOrCreateSorted(std::move(key));
        }

        /**
         * @brief Archetype reached from `from` by removing then adding one component
         *
         * Uses the edge cache of `from` first. Adding a component already present or
         * removing an absent one leaves the set unchanged.
         */
        ArchetypeID Transition(ArchetypeID from, std::optional<ComponentID> add, std::optional<ComponentID> remove)
        {
            ArchetypeID current = from;
            if (remove)
                current = Step(current, *remove, false);
            if (add)
                current = Step(current, *add, true);
            return current;
        }

        STRATA_NODISCARD Archetype& Get(ArchetypeID id)
        {
            STRATA_VERIFY(id < m_archetypes.size(), "Unknown archetype id");
            return *m_archetypes[id];
        }

        STRATA_NODISCARD const Archetype& Get(ArchetypeID id) const
        {
            STRATA_VERIFY(id < m_archetypes.size(), "Unknown archetype id");
            return *m_archetypes[id];
        }

        STRATA_NODISCARD std::size_t Size() const noexcept { return m_archetypes.size(); }

        // Archetypes containing `component`, in creation order
        STRATA_NODISCARD std::span<const ArchetypeID> GetArchetypesWith(ComponentID component) const noexcept
        {
            if (component >= m_byComponent.size())
                return {};
            return m_byComponent[component];
        }

    private:
        ArchetypeID Step(ArchetypeID from, ComponentID component, bool add)
        {
            Archetype& source = Get(from);
            if (source.HasComponent(component) == add)
                return from;

            ArchetypeEdgeStorage& edges = source.GetEdges();
            if (auto cached = add ? edges.GetAdd(component) : edges.GetRemove(component))
                return *cached;

            std::vector<ComponentID> key(source.GetComponents().begin(), source.GetComponents().end());
            if (add)
                key.push_back(component);
            else
                key.erase(std::find(key.begin(), key.end(), component));
            std::sort(key.begin(), key.end());

            const ArchetypeID target = GetOrCreateSorted(std::move(key));
            Link(add ? from : target, add ? target : from, component);
            return target;
        }

        // Records `smaller + component == larger` in both directions
        void Link(ArchetypeID smaller, ArchetypeID larger, ComponentID component)
        {
            m_archetypes[smaller]->GetEdges().SetAdd(component, larger);
            m_archetypes[larger]->GetEdges().SetRemove(component, smaller);
        }

        // Links an archetype to the existing archetypes holding exactly one more component
        void LinkSupersets(ArchetypeID id)
        {
            const Archetype& archetype = *m_archetypes[id];
            const std::size_t count = archetype.GetComponents().size();

            auto consider = [&](ArchetypeID other) {
                const Archetype& candidate = *m_archetypes[other];
                if (other == id || candidate.GetComponents().size() != count + 1 || !candidate.GetMask().HasAll(archetype.GetMask()))
                    return;
                for (ComponentID component : candidate.GetComponents())
                {
                    if (!archetype.HasComponent(component))
                    {
                        Link(id, other, component);
                        return;
                    }
                }
            };

            if (count == 0)
            {
                for (std::size_t other = 0; other < m_archetypes.size(); ++other)
                    consider(static_cast<ArchetypeID>(other));
            }
            else
            {
                for (ArchetypeID other : GetArchetypesWith(archetype.GetComponents().front()))
                    consider(other);
            }
        }

        ArchetypeID GetOrCreateSorted(std::vector<ComponentID> key)
        {
            if (auto it = m_bySet.find(key); it != m_bySet.end())
                return it->second;

            STRATA_PROFILE_ZONE_NAMED_COLOR("ArchetypeRegistry::Create", Profile::ColorArchetype);

            std::vector<ComponentID> dense;
            std::vector<ComponentID> sparse;
            for (ComponentID component : key)
            {
                if (m_components.GetDescriptor(component).storage == StorageKind::Dense)
                    dense.push_back(component);
                else
                    sparse.push_back(component);
            }

            const auto id = static_cast<ArchetypeID>(m_archetypes.size());
            const TableID table = m_tables.GetOrCreate(dense);
            m_archetypes.push_back(std::make_unique<Archetype>(id, table, std::move(dense), std::move(sparse)));
            m_bySet.emplace(key, id);

            for (ComponentID component : key)
            {
                if (m_byComponent.size() <= component)
                    m_byComponent.resize(static_cast<std::size_t>(component) + 1);
                m_byComponent[component].push_back(id);
            }

            // Wire edges to every existing neighbour one component away
            for (std::size_t i = 0; i < key.size(); ++i)
            {
                std::vector<ComponentID> smaller = key;
                smaller.erase(smaller.begin() + static_cast<std::ptrdiff_t>(i));
                if (auto it = m_bySet.find(smaller); it != m_bySet.end())
                    Link(it->second, id, key[i]);
            }
            LinkSupersets(id);

            if (Log::IsEnabled(LogLevel::Debug))
                Log::Debug("Archetype", "Created archetype " + std::to_string(id) + " with " + std::to_string(key.size()) +
                    " components bound to table " + std::to_string(table));
            return id;
        }

        const ComponentRegistry& m_components;
        Tables& m_tables;
        std::vector<std::unique_ptr<Archetype>> m_archetypes;
        std::map<std::vector<ComponentID>, ArchetypeID> m_bySet;
        std::vector<std::vector<ArchetypeID>> m_byComponent;
    };
}
