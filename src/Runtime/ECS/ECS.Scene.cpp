module;
#include <string>
#include <string_view>
#include <vector>
#include <entt/entity/registry.hpp>
#include <entt/entity/runtime_view.hpp>

module ECS:Scene.Impl;
import :Scene;
import :Query;
import :Components;

namespace ECS
{
    entt::entity Scene::CreateEntity(const std::string& name)
    {
        entt::entity e = m_Registry.create();
        ++m_EntityCount;

        if (!name.empty())
        {
            m_Registry.emplace<Components::NameTag::Component>(e, name);
            m_Names[name] = e;
        }
        return e;
    }

    void Scene::DestroyEntity(entt::entity entity)
    {
        if (!m_Registry.valid(entity)) return;

        if (const auto* tag = m_Registry.try_get<Components::NameTag::Component>(entity))
        {
            auto it = m_Names.find(tag->Name);
            if (it != m_Names.end() && it->second == entity) m_Names.erase(it);
        }

        m_Registry.destroy(entity);
        --m_EntityCount;
    }

    entt::entity Scene::FindEntity(std::string_view name) const
    {
        // Heterogeneous lookup would need a transparent hasher; names are short.
        auto it = m_Names.find(std::string(name));
        if (it == m_Names.end() || !m_Registry.valid(it->second)) return entt::null;
        return it->second;
    }

    std::vector<entt::entity> Scene::Query(const ECS::Query& query)
    {
        std::vector<entt::entity> result;
        if (query.Include.empty()) return result;

        entt::runtime_view view{};
        for (AttributeKey key : query.Include)
        {
            // A pool that was never created cannot contain anything.
            auto* storage = m_Registry.storage(key);
            if (!storage) return result;
            view.iterate(*storage);
        }

        for (AttributeKey key : query.Exclude)
        {
            if (auto* storage = m_Registry.storage(key)) view.exclude(*storage);
        }

        result.reserve(view.size_hint());
        for (entt::entity e : view)
        {
            result.push_back(e);
        }
        return result;
    }
}
