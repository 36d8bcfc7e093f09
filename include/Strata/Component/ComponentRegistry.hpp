#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../Core/Contract.hpp"
#include "../Core/Log.hpp"
#include "../Core/TypeID.hpp"
#include "Component.hpp"

namespace Strata
{
    /**
     * @brief Assigns dense ids to component and resource types
     *
     * Components and resources use separate id spaces, both starting at 0.
     * Registration is idempotent per C++ type. Ids are stable for the lifetime
     * of the registry and are used directly as bitmap and array indices.
     */
    class ComponentRegistry
    {
    public:
        template<Component T>
        ComponentID Register()
        {
            return static_cast<ComponentID>(RegisterImpl<T>(m_components, m_componentByType, MAX_COMPONENTS, "component"));
        }

        template<Component... Ts>
        void RegisterAll()
        {
            (Register<Ts>(), ...);
        }

        template<Resource T>
        ResourceID RegisterResource()
        {
            return static_cast<ResourceID>(RegisterImpl<T>(m_resources, m_resourceByType, MAX_RESOURCES, "resource"));
        }

        template<typename T>
        STRATA_NODISCARD std::optional<ComponentID> Find() const noexcept
        {
            return FindImpl(m_componentByType, TypeID<T>::Value());
        }

        template<typename T>
        STRATA_NODISCARD std::optional<ResourceID> FindResource() const noexcept
        {
            return FindImpl(m_resourceByType, TypeID<T>::Value());
        }

        STRATA_NODISCARD const ComponentDescriptor& GetDescriptor(ComponentID id) const
        {
            STRATA_VERIFY(id < m_components.size(), "Unknown component id");
            return m_components[id];
        }

        STRATA_NODISCARD const ResourceDescriptor& GetResourceDescriptor(ResourceID id) const
        {
            STRATA_VERIFY(id < m_resources.size(), "Unknown resource id");
            return m_resources[id];
        }

        // Lookup by the stable name hash, for collaborators that persist type identity
        STRATA_NODISCARD const ComponentDescriptor* FindByHash(std::uint64_t hash) const noexcept
        {
            auto it = m_componentByHash.find(hash);
            return it != m_componentByHash.end() ? &m_components[it->second] : nullptr;
        }

        STRATA_NODISCARD std::size_t ComponentCount() const noexcept { return m_components.size(); }
        STRATA_NODISCARD std::size_t ResourceCount() const noexcept { return m_resources.size(); }

    private:
        template<typename T>
        std::uint32_t RegisterImpl(std::vector<ComponentDescriptor>& descriptors, std::vector<std::uint32_t>& byType,
            std::size_t maxCount, const char* kind)
        {
            const TypeIndex typeIndex = TypeID<T>::Value();
            if (auto existing = FindImpl(byType, typeIndex))
                return *existing;

            STRATA_VERIFY(descriptors.size() < maxCount, "Too many registered types, raise STRATA_MAX_COMPONENTS / STRATA_MAX_RESOURCES");

            const auto id = static_cast<std::uint32_t>(descriptors.size());
            ComponentDescriptor descriptor = MakeDescriptor<T>(static_cast<ComponentID>(id));

            if (&descriptors == &m_components)
            {
                // Same stable hash for a different C++ type means two types would share persisted identity
                auto [it, inserted] = m_componentByHash.try_emplace(descriptor.hash, static_cast<ComponentID>(id));
                STRATA_VERIFY(inserted, "Two component types share the same name hash");
            }

            descriptors.push_back(descriptor);
            if (byType.size() <= typeIndex)
                byType.resize(static_cast<std::size_t>(typeIndex) + 1, INVALID_SLOT);
            byType[typeIndex] = id;

            if (Log::IsEnabled(LogLevel::Debug))
                Log::Debug("Registry", std::string("Registered ") + kind + " '" + std::string(descriptor.name) + "' as id " + std::to_string(id));
            return id;
        }

        static std::optional<std::uint16_t> FindImpl(const std::vector<std::uint32_t>& byType, TypeIndex typeIndex) noexcept
        {
            if (typeIndex >= byType.size() || byType[typeIndex] == INVALID_SLOT)
                return std::nullopt;
            return static_cast<std::uint16_t>(byType[typeIndex]);
        }

        static constexpr std::uint32_t INVALID_SLOT = 0xFFFFFFFFu;

        std::vector<ComponentDescriptor> m_components;
        std::vector<ResourceDescriptor> m_resources;
        std::vector<std::uint32_t> m_componentByType;
        std::vector<std::uint32_t> m_resourceByType;
        std::unordered_map<std::uint64_t, ComponentID> m_componentByHash;
    };
}
