module;
#include <optional>
#include <glm/glm.hpp>

export module ECS:Components.Movement;

export namespace ECS::Components::Movement
{
    // Force is an accumulator: gameplay code adds to it during a tick and the
    // movement system consumes and zeroes it.
    struct Component
    {
        glm::vec2 Force{0.0f};
        glm::vec2 Velocity{0.0f};
        float Mass = 1.0f;
        float Decay = 0.0f; // fraction of velocity lost per second
        std::optional<float> MaxSpeed;
    };
}

export namespace ECS::Components::FaceVelocity
{
    // Tag: mirror the sprite horizontally to face the direction of travel.
    struct Component
    {
    };
}
