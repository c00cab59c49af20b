module;
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
#include <entt/entity/registry.hpp>

export module ECS:Scene;

import :Query;
import :Components;

export namespace ECS
{
    // The entity/attribute store. Owns the registry; everything else only reads
    // attributes and iterates query results.
    class Scene
    {
    public:
        Scene() = default;
        ~Scene() = default;

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        // An empty name creates an anonymous entity.
        entt::entity CreateEntity(const std::string& name = {});
        void DestroyEntity(entt::entity entity);

        // entt::null when no live entity carries that name.
        [[nodiscard]] entt::entity FindEntity(std::string_view name) const;
        [[nodiscard]] bool IsValid(entt::entity entity) const { return m_Registry.valid(entity); }
        [[nodiscard]] size_t EntityCount() const { return m_EntityCount; }

        // Entities matching the include/exclude lists, in the store's natural
        // iteration order.
        [[nodiscard]] std::vector<entt::entity> Query(const ECS::Query& query);

        template <typename T>
        [[nodiscard]] T* TryGet(entt::entity entity)
        {
            if (!m_Registry.valid(entity)) return nullptr;
            return m_Registry.try_get<T>(entity);
        }

        // Adds or replaces the attribute. Ignored for dead entities.
        template <typename T, typename... Args>
        void Add(entt::entity entity, Args&&... args)
        {
            if (!m_Registry.valid(entity)) return;
            m_Registry.emplace_or_replace<T>(entity, std::forward<Args>(args)...);
        }

        template <typename T>
        void Remove(entt::entity entity)
        {
            if (!m_Registry.valid(entity)) return;
            m_Registry.remove<T>(entity);
        }

        entt::registry& GetRegistry() { return m_Registry; }

    private:
        entt::registry m_Registry;
        std::unordered_map<std::string, entt::entity> m_Names;
        size_t m_EntityCount = 0;
    };
}
