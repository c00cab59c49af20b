module;
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtx/matrix_transform_2d.hpp>

export module ECS:Components.Transform;

export namespace ECS::Components::Transform
{
    // 2D transform. Rotation is in radians, counter-clockwise. Scale and
    // rotation are applied about Pivot (local space).
    struct Component
    {
        glm::vec2 Position{0.0f};
        float Rotation = 0.0f;
        glm::vec2 Scale{1.0f};
        glm::vec2 Pivot{0.0f};
    };

    // Local -> world: T(Position + Pivot) * R * S * T(-Pivot)
    [[nodiscard]] glm::mat3 GetMatrix(const Component& transform)
    {
        glm::mat3 m = glm::translate(glm::mat3(1.0f), transform.Position + transform.Pivot);
        m = glm::rotate(m, transform.Rotation);
        m = glm::scale(m, transform.Scale);
        m = glm::translate(m, -transform.Pivot);
        return m;
    }

    [[nodiscard]] glm::mat3 GetInverseMatrix(const Component& transform)
    {
        return glm::inverse(GetMatrix(transform));
    }
}
