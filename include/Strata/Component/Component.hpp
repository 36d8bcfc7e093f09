#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <new>
#include <string_view>
#include <type_traits>
#include <utility>

#include "../Container/Bitmap.hpp"
#include "../Core/Config.hpp"
#include "../Core/TypeID.hpp"

namespace Strata
{
    using ComponentID = std::uint16_t;
    using ResourceID = std::uint16_t;

    inline constexpr ComponentID INVALID_COMPONENT = std::numeric_limits<ComponentID>::max();
    inline constexpr ResourceID INVALID_RESOURCE = std::numeric_limits<ResourceID>::max();

    constexpr std::size_t MAX_COMPONENTS = config::MAX_COMPONENTS;
    constexpr std::size_t MAX_RESOURCES = config::MAX_RESOURCES;

    using ComponentMask = Bitmap<MAX_COMPONENTS>;
    using ResourceMask = Bitmap<MAX_RESOURCES>;

    enum class StorageKind : std::uint8_t
    {
        Dense,      // columns of the archetype's table
        Sparse      // one sparse set per component, outside of tables
    };

    template<typename T>
    concept Component = std::is_object_v<T> &&
                        !std::is_const_v<T> &&
                        std::is_move_constructible_v<T> &&
                        std::is_nothrow_destructible_v<T>;

    template<typename T>
    concept Resource = Component<T>;

    // A component opts into sparse storage with `static constexpr StorageKind STORAGE = StorageKind::Sparse;`
    template<typename T>
    consteval StorageKind StorageKindOf() noexcept
    {
        if constexpr (requires { { T::STORAGE } -> std::convertible_to<StorageKind>; })
            return T::STORAGE;
        else
            return StorageKind::Dense;
    }

    // Trivially copyable types clone bitwise. Other copyable types opt in with `static constexpr bool CLONEABLE = true;`
    template<typename T>
    consteval bool CloneableOf() noexcept
    {
        if constexpr (requires { { T::CLONEABLE } -> std::convertible_to<bool>; })
            return T::CLONEABLE;
        else
            return std::is_trivially_copyable_v<T>;
    }

    /**
     * @brief Layout and capability record of a registered type
     *
     * Carried alongside every type-erased buffer. A null `move` means the type is
     * bitwise movable, a null `drop` means it is trivially destructible and a null
     * `clone` means it is move-only.
     */
    struct ComponentDescriptor
    {
        using MoveFn = void(void* dst, void* src);
        using DropFn = void(void* ptr);
        using CloneFn = void(void* dst, const void* src);

        ComponentID id = INVALID_COMPONENT;
        std::string_view name;
        std::uint64_t hash = 0;
        std::size_t size = 0;
        std::size_t alignment = 0;
        StorageKind storage = StorageKind::Dense;

        MoveFn* move = nullptr;
        DropFn* drop = nullptr;
        CloneFn* clone = nullptr;

        // Move-constructs dst from src. src stays alive.
        void MoveConstruct(void* dst, void* src) const noexcept
        {
            if (move)
                move(dst, src);
            else
                std::memcpy(dst, src, size);
        }

        // Moves src into uninitialized dst and ends src's lifetime
        void Relocate(void* dst, void* src) const noexcept
        {
            if (move)
            {
                move(dst, src);
                if (drop)
                    drop(src);
            }
            else
            {
                std::memcpy(dst, src, size);
            }
        }

        void Drop(void* ptr) const noexcept
        {
            if (drop)
                drop(ptr);
        }

        STRATA_NODISCARD bool IsCloneable() const noexcept { return clone != nullptr; }
        STRATA_NODISCARD bool IsTriviallyRelocatable() const noexcept { return move == nullptr; }
    };

    using ResourceDescriptor = ComponentDescriptor;

    template<typename T>
    ComponentDescriptor MakeDescriptor(ComponentID id) noexcept
    {
        ComponentDescriptor descriptor;
        descriptor.id = id;
        descriptor.name = TypeID<T>::Name();
        descriptor.hash = TypeID<T>::Hash();
        descriptor.size = sizeof(T);
        descriptor.alignment = alignof(T);
        descriptor.storage = StorageKindOf<T>();

        if constexpr (!std::is_trivially_copyable_v<T>)
        {
            descriptor.move = [](void* dst, void* src) { ::new (dst) T(std::move(*static_cast<T*>(src))); };
        }
        if constexpr (!std::is_trivially_destructible_v<T>)
        {
            descriptor.drop = [](void* ptr) { static_cast<T*>(ptr)->~T(); };
        }
        if constexpr (CloneableOf<T>())
        {
            static_assert(std::is_copy_constructible_v<T>, "A CLONEABLE component must be copy constructible");
            descriptor.clone = [](void* dst, const void* src) { ::new (dst) T(*static_cast<const T*>(src)); };
        }
        return descriptor;
    }
}
