module;
#include <cstdint>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

export module Graphics:FrameExecutor;

import Core;
import RHI;
import ECS;
import Runtime.SignalGraph;
import :ShaderRegistry;
import :RenderTexture;
import :Components;
import :RenderPass;
import :Camera;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // FrameExecutor - turns Renderer components into draw calls
    // -------------------------------------------------------------------------
    // Attached as one PhasedTask over every entity with a Renderer:
    //
    //   Collect  (per entity): append its instance record to its pass.
    //   Dispatch (once):       run every enabled pass in DrawOrder, then reset
    //                          the batches for the next frame.
    //
    // Owns the shared offscreen framebuffer with its depth/stencil buffer and
    // the built-in present pass that copies COLOR to the screen.
    // -------------------------------------------------------------------------
    class FrameExecutor final : public Runtime::ICollectPhase, public Runtime::IDispatchPhase
    {
    public:
        FrameExecutor(RHI::IDevice& device, ECS::Scene& scene, ShaderRegistry& shaders,
                      RenderTextureRegistry& textures, RenderPassGraph& passes, const Camera2D& camera);
        ~FrameExecutor() override;

        FrameExecutor(const FrameExecutor&) = delete;
        FrameExecutor& operator=(const FrameExecutor&) = delete;

        // Declares COLOR, creates the framebuffer and the present pass.
        [[nodiscard]] Core::Result Initialize();

        void Collect(entt::entity entity, const Runtime::TaskContext& ctx) override;
        void Dispatch(const Runtime::TaskContext& ctx) override;

        void SetClearColor(const glm::vec4& color) { m_ClearColor = color; }

        [[nodiscard]] RenderPassHandle GetPresentPass() const { return m_PresentPass; }
        [[nodiscard]] RHI::FramebufferHandle GetFramebuffer() const { return m_Framebuffer; }
        [[nodiscard]] uint64_t GetFrameCount() const { return m_FrameCount; }

    private:
        void Enqueue(entt::entity entity);
        void ExecutePass(RenderPass& pass, const Shader& shader, const glm::mat3& worldToScreen, const glm::mat3& screenToWorld);
        void ResizeTargets(glm::uvec2 size);
        void ClearRenderTextures();

        RHI::IDevice& m_Device;
        ECS::Scene& m_Scene;
        ShaderRegistry& m_Shaders;
        RenderTextureRegistry& m_Textures;
        RenderPassGraph& m_Passes;
        const Camera2D& m_Camera;

        RHI::FramebufferHandle m_Framebuffer{};
        RHI::DepthStencilHandle m_DepthStencil{};
        uint32_t m_AttachedOutputs = 0;
        glm::uvec2 m_RenderSize{0};

        ShaderHandle m_PresentShader{};
        RenderPassHandle m_PresentPass{};

        glm::vec4 m_ClearColor{0.07f, 0.07f, 0.07f, 1.0f};
        uint64_t m_FrameCount = 0;
    };
}
