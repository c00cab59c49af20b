module;
#include <vector>
#include <entt/core/type_info.hpp>

export module ECS:Query;

export namespace ECS
{
    // Attribute keys are the storage ids EnTT assigns to component pools by
    // default, so a key can be resolved with registry.storage(key).
    using AttributeKey = entt::id_type;

    template <typename T>
    [[nodiscard]] AttributeKey KeyOf()
    {
        return entt::type_hash<T>::value();
    }

    // Set-membership filter: an entity matches when it carries every Include
    // attribute and none of the Exclude attributes.
    //
    //   auto q = ECS::Query::Of<Movement::Component, Transform::Component>()
    //                .Without<Frozen::Component>();
    struct Query
    {
        std::vector<AttributeKey> Include;
        std::vector<AttributeKey> Exclude;

        template <typename... Ts>
        [[nodiscard]] static Query Of()
        {
            return Query{{KeyOf<Ts>()...}, {}};
        }

        template <typename... Ts>
        [[nodiscard]] Query Without() const
        {
            Query q = *this;
            (q.Exclude.push_back(KeyOf<Ts>()), ...);
            return q;
        }
    };
}
