module;
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtx/matrix_transform_2d.hpp>

module Graphics:Camera.Impl;

import :Camera;

namespace Graphics
{
    glm::mat3 Camera2D::ScreenToWorld(glm::uvec2 renderSize) const
    {
        glm::mat3 m = glm::translate(glm::mat3(1.0f), Position);
        m = glm::rotate(m, Rotation);
        m = glm::scale(m, Zoom * glm::vec2(renderSize));
        m = glm::translate(m, glm::vec2(-0.5f));
        return m;
    }

    glm::mat3 Camera2D::WorldToScreen(glm::uvec2 renderSize) const
    {
        // A zero-area target has no meaningful projection.
        if (renderSize.x == 0 || renderSize.y == 0 || Zoom == 0.0f) return glm::mat3(1.0f);
        return glm::inverse(ScreenToWorld(renderSize));
    }

    glm::vec2 Camera2D::ScreenPointToWorld(glm::vec2 screen, glm::uvec2 renderSize) const
    {
        return glm::vec2(ScreenToWorld(renderSize) * glm::vec3(screen, 1.0f));
    }

    glm::vec2 Camera2D::WorldPointToScreen(glm::vec2 world, glm::uvec2 renderSize) const
    {
        return glm::vec2(WorldToScreen(renderSize) * glm::vec3(world, 1.0f));
    }
}
