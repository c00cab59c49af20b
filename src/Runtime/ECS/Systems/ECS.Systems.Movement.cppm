module;
#include <entt/fwd.hpp>

export module ECS:Systems.Movement;

export namespace ECS::Systems::Movement
{
    // Integrates one entity's Movement over dt:
    //   Velocity += Force / Mass * dt
    //   Velocity -= Velocity * Decay * dt
    //   Position += Velocity * dt   (when a Transform is present)
    // and clears the accumulated force.
    void OnUpdate(entt::registry& registry, entt::entity entity, float dt);
}

export namespace ECS::Systems::FaceVelocity
{
    void OnUpdate(entt::registry& registry, entt::entity entity);
}
