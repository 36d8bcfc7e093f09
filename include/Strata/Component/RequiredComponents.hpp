#pragma once

#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

#include "Component.hpp"

namespace Strata
{
    /**
     * @brief Component that cannot exist on an entity without other components
     *
     * @code
     * struct Rigidbody
     * {
     *     using Required = std::tuple<Position, Velocity>;
     *     float mass = 1.0f;
     * };
     * @endcode
     *
     * Spawning or inserting a Rigidbody default-constructs whichever of Position
     * and Velocity the entity does not already have. Requirements are transitive
     * and may form cycles.
     */
    template<typename T>
    concept HasRequired = requires { typename T::Required; };

    namespace Detail
    {
        template<typename... Ts>
        struct TypeList {};

        template<typename... Lists>
        struct Concat
        {
            using Type = TypeList<>;
        };

        template<typename... As>
        struct Concat<TypeList<As...>>
        {
            using Type = TypeList<As...>;
        };

        template<typename... As, typename... Bs, typename... Rest>
        struct Concat<TypeList<As...>, TypeList<Bs...>, Rest...> : Concat<TypeList<As..., Bs...>, Rest...> {};

        template<typename Tuple>
        struct TupleToList;

        template<typename... Ts>
        struct TupleToList<std::tuple<Ts...>>
        {
            using Type = TypeList<Ts...>;
        };

        template<typename T>
        struct DirectRequired
        {
            using Type = TypeList<>;
        };

        template<HasRequired T>
        struct DirectRequired<T>
        {
            using Type = typename TupleToList<typename T::Required>::Type;
        };

        // Depth-first walk over the requirement graph; Seen stops cycles and duplicates
        template<typename Seen, typename Added, typename Pending>
        struct ExpandRequired;

        template<bool IsSeen, typename Seen, typename Added, typename Next, typename Rest>
        struct ExpandStep;

        template<typename Seen, typename Added>
        struct ExpandRequired<Seen, Added, TypeList<>>
        {
            using Type = Added;
        };

        template<typename... Ss, typename Added, typename Next, typename... Rest>
        struct ExpandRequired<TypeList<Ss...>, Added, TypeList<Next, Rest...>>
            : ExpandStep<(std::is_same_v<Next, Ss> || ...), TypeList<Ss...>, Added, Next, TypeList<Rest...>> {};

        template<typename Seen, typename Added, typename Next, typename Rest>
        struct ExpandStep<true, Seen, Added, Next, Rest> : ExpandRequired<Seen, Added, Rest> {};

        template<typename... Ss, typename... As, typename Next, typename Rest>
        struct ExpandStep<false, TypeList<Ss...>, TypeList<As...>, Next, Rest>
            : ExpandRequired<
                TypeList<Ss..., Next>,
                TypeList<As..., Next>,
                typename Concat<typename DirectRequired<Next>::Type, Rest>::Type>
        {
            static_assert(Component<Next>, "A required type must be a component");
            static_assert(std::is_default_constructible_v<Next>, "A required component must be default constructible");
        };

        // Components a bundle of Ts pulls in beyond Ts themselves
        template<typename... Ts>
        using RequiredExtras = typename ExpandRequired<
            TypeList<Ts...>,
            TypeList<>,
            typename Concat<typename DirectRequired<Ts>::Type...>::Type>::Type;

        template<typename... Ts>
        inline constexpr bool HAS_REQUIRED = !std::is_same_v<RequiredExtras<Ts...>, TypeList<>>;

        template<typename Extras>
        struct RequiredBundle;

        // Explicit values first, then one default-constructed value per extra
        template<typename... Es>
        struct RequiredBundle<TypeList<Es...>>
        {
            template<typename... Ts>
            using Type = std::tuple<std::decay_t<Ts>..., Es...>;

            template<typename... Ts>
            static Type<Ts...> Make(Ts&&... values)
            {
                return Type<Ts...>(std::forward<Ts>(values)..., Es{}...);
            }
        };

        template<typename... Ts>
        auto MakeRequiredBundle(Ts&&... values)
        {
            return RequiredBundle<RequiredExtras<std::decay_t<Ts>...>>::Make(std::forward<Ts>(values)...);
        }
    }
}
