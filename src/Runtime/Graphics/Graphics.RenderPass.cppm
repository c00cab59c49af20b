module;
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

export module Graphics:RenderPass;

import Core;
import RHI;
import :ShaderRegistry;
import :RenderTexture;
import :Components;

export namespace Graphics
{
    // The built-in present pass sorts after every user pass.
    inline constexpr int32_t kPresentDrawOrder = std::numeric_limits<int32_t>::max();

    // Two triangles over [0,1]^2.
    inline constexpr uint32_t kQuadVertexCount = 6;

    struct RenderPassOptions
    {
        int32_t DrawOrder = 0;
        RHI::DepthTest DepthTest = RHI::DepthTest::Always;
        bool DepthWrite = false;
        RHI::BlendState Blend{};
        // Draws one instance straight into the default framebuffer.
        bool Present = false;
    };

    struct RenderPass
    {
        ShaderHandle Shader{};
        RenderPassOptions Options{};
        bool Enabled = true;

        RHI::VertexLayoutHandle Layout{};
        RHI::BufferHandle ModelBuffer{};
        RHI::BufferHandle InstanceBuffer{};

        // Resolved by name; owned by the RenderTextureRegistry.
        std::vector<RenderTexture*> Inputs;  // parallel to Shader::Inputs
        std::vector<RenderTexture*> Outputs; // parallel to Shader::Outputs, empty when presenting

        // Applied on every dispatch until changed.
        std::unordered_map<std::string, UniformValue> Uniforms;
        std::unordered_map<std::string, RHI::TextureHandle> Textures;

        // Per-frame batch, reset after dispatch.
        std::vector<float> InstanceData;
        uint32_t InstanceCount = 0;
    };

    // -------------------------------------------------------------------------
    // RenderPassGraph - ordered set of render passes
    // -------------------------------------------------------------------------
    // Passes are kept in ascending DrawOrder. Registration does an ordered
    // insert after any pass with an equal DrawOrder, so equal orders run in
    // registration order.
    // -------------------------------------------------------------------------
    class RenderPassGraph
    {
    public:
        RenderPassGraph(RHI::IDevice& device, ShaderRegistry& shaders, RenderTextureRegistry& textures);
        ~RenderPassGraph();

        RenderPassGraph(const RenderPassGraph&) = delete;
        RenderPassGraph& operator=(const RenderPassGraph&) = delete;

        // Fails on an unknown shader, unsupported depth/blend values, or more
        // outputs than RHI::kMaxColorAttachments.
        [[nodiscard]] Core::Expected<RenderPassHandle> CreateRenderPass(ShaderHandle shader, const RenderPassOptions& options = {});
        void DestroyRenderPass(RenderPassHandle pass);

        // Undeclared names, sampler uniforms and mismatched value types are
        // logged and dropped.
        void SetUniform(RenderPassHandle pass, std::string_view name, const UniformValue& value);
        // Binds an external texture to a declared sampler that is not an input.
        void SetTexture(RenderPassHandle pass, std::string_view name, RHI::TextureHandle texture);
        void SetProperty(ECS::Components::Renderer::Component& renderer, std::string_view name, const PropertyValue& value) const;
        void SetEnabled(RenderPassHandle pass, bool enabled);

        [[nodiscard]] RenderPass* Get(RenderPassHandle pass) const { return m_Passes.Get(pass); }
        [[nodiscard]] const std::vector<RenderPassHandle>& GetOrder() const { return m_Order; }
        [[nodiscard]] size_t Size() const { return m_Passes.Size(); }

    private:
        void ReleaseDeviceObjects(RenderPass& pass);

        RHI::IDevice& m_Device;
        ShaderRegistry& m_Shaders;
        RenderTextureRegistry& m_Textures;

        Core::ResourcePool<RenderPass, RenderPassTag> m_Passes;
        std::vector<RenderPassHandle> m_Order;
    };
}
