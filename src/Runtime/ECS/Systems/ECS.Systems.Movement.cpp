module;
#include <cmath>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module ECS:Systems.Movement.Impl;
import :Systems.Movement;
import :Components.Movement;
import :Components.Transform;

namespace ECS::Systems::Movement
{
    void OnUpdate(entt::registry& registry, entt::entity entity, float dt)
    {
        auto* movement = registry.try_get<Components::Movement::Component>(entity);
        if (!movement) return;

        if (movement->Mass > 0.0f)
        {
            movement->Velocity += movement->Force / movement->Mass * dt;
        }
        movement->Velocity -= movement->Velocity * movement->Decay * dt;

        if (movement->MaxSpeed)
        {
            const float speed = glm::length(movement->Velocity);
            if (speed > *movement->MaxSpeed && speed > 0.0f)
            {
                movement->Velocity *= *movement->MaxSpeed / speed;
            }
        }

        if (auto* transform = registry.try_get<Components::Transform::Component>(entity))
        {
            transform->Position += movement->Velocity * dt;
        }

        movement->Force = glm::vec2(0.0f);
    }
}

namespace ECS::Systems::FaceVelocity
{
    void OnUpdate(entt::registry& registry, entt::entity entity)
    {
        const auto* movement = registry.try_get<Components::Movement::Component>(entity);
        auto* transform = registry.try_get<Components::Transform::Component>(entity);
        if (!movement || !transform) return;

        if (movement->Velocity.x == 0.0f) return;
        if (std::signbit(transform->Scale.x) != std::signbit(movement->Velocity.x))
        {
            transform->Scale.x = -transform->Scale.x;
        }
    }
}
