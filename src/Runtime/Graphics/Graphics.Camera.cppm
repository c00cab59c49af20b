module;
#include <glm/glm.hpp>

export module Graphics:Camera;

export namespace Graphics
{
    // Orthographic 2D view. Screen space is [0,1]^2 over the render target,
    // origin bottom-left; the camera position sits at the screen centre.
    struct Camera2D
    {
        glm::vec2 Position{0.0f};
        float Rotation = 0.0f; // radians
        float Zoom = 0.01f;    // world units per pixel

        // T(Position) * R(Rotation) * S(Zoom * renderSize) * T(-0.5)
        [[nodiscard]] glm::mat3 ScreenToWorld(glm::uvec2 renderSize) const;
        [[nodiscard]] glm::mat3 WorldToScreen(glm::uvec2 renderSize) const;

        // Points in normalized screen space.
        [[nodiscard]] glm::vec2 ScreenPointToWorld(glm::vec2 screen, glm::uvec2 renderSize) const;
        [[nodiscard]] glm::vec2 WorldPointToScreen(glm::vec2 world, glm::uvec2 renderSize) const;
    };
}
