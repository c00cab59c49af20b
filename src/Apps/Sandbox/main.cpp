#include <cmath>
#include <memory>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

import Core;
import ECS;
import Graphics;
import Runtime.SignalGraph;
import Runtime.Engine;

using namespace Core;
using namespace Runtime;

namespace
{
    constexpr const char* kGridFragment = R"(#version 330 core
in vec2 WORLD_POS;
uniform float LINE_WIDTH;
out vec4 COLOR;

void main()
{
    vec2 cell = abs(fract(WORLD_POS - 0.5) - 0.5) / fwidth(WORLD_POS);
    float line = 1.0 - clamp(min(cell.x, cell.y) - LINE_WIDTH, 0.0, 1.0);
    COLOR = vec4(vec3(0.25), line * 0.6);
}
)";

    constexpr const char* kSpriteFragment = R"(#version 330 core
in vec2 LOCAL_POS;
flat in vec2 TINT;
out vec4 COLOR;

void main()
{
    COLOR = vec4(LOCAL_POS * TINT, 0.0, 1.0);
}
)";

    struct Player
    {
        float WalkForce = 4.0f;
    };

    struct SmoothFollow
    {
        entt::entity Target = entt::null;
        float Speed = 8.0f;
    };
}

// --- The Application ---
class SandboxApp
{
public:
    SandboxApp()
        : m_Engine(EngineConfig{.AppName = "Sandbox", .Width = 1600, .Height = 900, .UpdateFrequency = 60.0})
    {
    }

    int Run()
    {
        if (!m_Engine.Initialize()) return 1;
        if (!CreateContent()) return 1;

        m_Engine.OnQuit([] { Log::Info("Sandbox closing."); });
        m_Engine.Run();
        return 0;
    }

private:
    bool CreateContent()
    {
        ECS::Scene& scene = m_Engine.GetScene();
        SignalGraph& signals = m_Engine.GetSignals();
        Graphics::ShaderRegistry& shaders = m_Engine.GetShaders();
        Graphics::RenderPassGraph& passes = m_Engine.GetRenderPasses();

        // --- Grid: one fullscreen quad behind everything ---
        auto gridShader = shaders.Create(kGridFragment, Graphics::ShaderMode::Fullscreen,
                                         {.Uniforms = {{"LINE_WIDTH", Graphics::UniformType::Float}}});
        if (!gridShader) return false;

        auto gridPass = passes.CreateRenderPass(*gridShader, {.DrawOrder = -1});
        if (!gridPass) return false;
        passes.SetUniform(*gridPass, "LINE_WIDTH", 0.5f);

        const entt::entity grid = scene.CreateEntity("Grid");
        scene.Add<ECS::Components::Renderer::Component>(grid, ECS::Components::Renderer::Component{.Pass = *gridPass});

        // --- Player sprite ---
        auto spriteShader = shaders.Create(kSpriteFragment, Graphics::ShaderMode::World,
                                           {.Properties = {{"TINT", Graphics::PropertyType::Vec2}}});
        if (!spriteShader) return false;

        auto spritePass = passes.CreateRenderPass(*spriteShader, {});
        if (!spritePass) return false;

        const entt::entity player = scene.CreateEntity("Player");
        scene.Add<Player>(player);
        scene.Add<ECS::Components::Transform::Component>(player, ECS::Components::Transform::Component{.Pivot = {0.5f, 0.5f}});
        scene.Add<ECS::Components::Movement::Component>(player, ECS::Components::Movement::Component{.Mass = 1.0f, .Decay = 0.4f});
        scene.Add<ECS::Components::FaceVelocity::Component>(player);
        scene.Add<ECS::Components::Renderer::Component>(player, ECS::Components::Renderer::Component{.Pass = *spritePass});
        if (auto* renderer = scene.TryGet<ECS::Components::Renderer::Component>(player))
            passes.SetProperty(*renderer, "TINT", glm::vec2(1.0f, 0.8f));

        // --- Camera rig ---
        const entt::entity camera = scene.CreateEntity("Camera");
        scene.Add<ECS::Components::Transform::Component>(camera);
        scene.Add<SmoothFollow>(camera, SmoothFollow{.Target = player});

        // --- Tasks ---
        signals.OnSignal(signals.Update(), TaskDesc{
            .Query = ECS::Query::Of<Player, ECS::Components::Movement::Component>(),
            .ForEach = [this](entt::entity e, const TaskContext& ctx) { ProcessInput(e, ctx); },
        });

        signals.OnSignal(m_Engine.GetFixedUpdate(), TaskDesc{
            .Query = ECS::Query::Of<ECS::Components::Movement::Component, ECS::Components::Transform::Component>(),
            .ForEach = [&scene](entt::entity e, const TaskContext& ctx)
            {
                ECS::Systems::Movement::OnUpdate(scene.GetRegistry(), e, static_cast<float>(ctx.FixedDeltaTime));
                ECS::Systems::FaceVelocity::OnUpdate(scene.GetRegistry(), e);
            },
        });

        signals.OnSignal(signals.Update(), TaskDesc{
            .Query = ECS::Query::Of<SmoothFollow, ECS::Components::Transform::Component>(),
            .ForEach = [this, &scene](entt::entity e, const TaskContext& ctx)
            {
                auto* follow = scene.TryGet<SmoothFollow>(e);
                auto* transform = scene.TryGet<ECS::Components::Transform::Component>(e);
                const auto* target = scene.TryGet<ECS::Components::Transform::Component>(follow->Target);
                if (!target) return;

                const glm::vec2 offset = target->Position - transform->Position;
                if (glm::dot(offset, offset) > 0.005f)
                {
                    const float t = glm::min(1.0f, follow->Speed * static_cast<float>(ctx.DeltaTime));
                    transform->Position += offset * t;
                }

                m_Engine.GetCamera().Position = transform->Position;
                m_Engine.GetCamera().Rotation = transform->Rotation;
            },
        });

        signals.AfterDelay(2.0, TaskDesc{
            .Once = [](const TaskContext&) { Log::Info("WASD to move, Escape to quit."); },
        });

        Log::Info("Sandbox Started!");
        return true;
    }

    void ProcessInput(entt::entity e, const TaskContext& ctx)
    {
        const Windowing::Window* window = m_Engine.GetWindow();
        if (!window) return;

        ECS::Scene& scene = m_Engine.GetScene();
        const auto* player = scene.TryGet<Player>(e);
        auto* movement = scene.TryGet<ECS::Components::Movement::Component>(e);

        glm::vec2 walk{0.0f};
        if (window->IsKeyPressed(Windowing::Key::D)) walk.x += 1.0f;
        if (window->IsKeyPressed(Windowing::Key::A)) walk.x -= 1.0f;
        if (window->IsKeyPressed(Windowing::Key::W)) walk.y += 1.0f;
        if (window->IsKeyPressed(Windowing::Key::S)) walk.y -= 1.0f;

        if (walk != glm::vec2(0.0f))
            movement->Force += glm::normalize(walk) * player->WalkForce;

        if (auto* transform = scene.TryGet<ECS::Components::Transform::Component>(e))
            transform->Rotation += 0.5f * static_cast<float>(ctx.DeltaTime);
    }

    Engine m_Engine;
};

int main()
{
    SandboxApp app;
    return app.Run();
}
