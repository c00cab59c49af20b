module;
#include <cstdint>
#include <span>
#include <string_view>
#include <glm/glm.hpp>

export module RHI:Device;

import Core;
import :Types;

export namespace RHI
{
    // -------------------------------------------------------------------------
    // IDevice - the GPU boundary used by the render graph
    // -------------------------------------------------------------------------
    // Modelled on the GL 3.3 object set: programs, buffers, vertex layouts
    // (VAOs), textures, depth/stencil renderbuffers and framebuffers. All calls
    // happen on the single execution thread that owns the context.
    //
    // Destroy*/Bind* with an unknown handle are no-ops. An invalid (default)
    // FramebufferHandle addresses the default framebuffer.
    // -------------------------------------------------------------------------
    class IDevice
    {
    public:
        virtual ~IDevice() = default;

        // ----- Programs -----
        // Compiles both stages and links. The driver's diagnostic is logged on
        // failure; nothing is created.
        [[nodiscard]] virtual Core::Expected<ProgramHandle> CreateProgram(const ProgramDesc& desc) = 0;
        virtual void DestroyProgram(ProgramHandle program) = 0;

        // -1 when the name is not an active attribute/uniform.
        [[nodiscard]] virtual int32_t GetAttributeLocation(ProgramHandle program, std::string_view name) const = 0;
        [[nodiscard]] virtual int32_t GetUniformLocation(ProgramHandle program, std::string_view name) const = 0;

        // ----- Buffers -----
        [[nodiscard]] virtual BufferHandle CreateBuffer() = 0;
        virtual void UploadBuffer(BufferHandle buffer, std::span<const float> data) = 0;
        virtual void DestroyBuffer(BufferHandle buffer) = 0;

        // ----- Vertex layouts -----
        [[nodiscard]] virtual VertexLayoutHandle CreateVertexLayout() = 0;
        virtual void SetVertexAttribute(VertexLayoutHandle layout, const VertexAttributeDesc& attribute) = 0;
        virtual void DestroyVertexLayout(VertexLayoutHandle layout) = 0;

        // ----- Textures -----
        [[nodiscard]] virtual Core::Expected<TextureHandle> CreateTexture(uint32_t width, uint32_t height, TextureFormat format) = 0;
        [[nodiscard]] virtual Core::Expected<TextureHandle> CreateTextureArray(uint32_t width, uint32_t height, uint32_t layers, TextureFormat format) = 0;
        virtual void DestroyTexture(TextureHandle texture) = 0;
        // Copies the full width x height region of level 0.
        virtual void CopyTexture(TextureHandle source, TextureHandle destination, uint32_t width, uint32_t height) = 0;

        // ----- Depth/stencil -----
        [[nodiscard]] virtual DepthStencilHandle CreateDepthStencil(uint32_t width, uint32_t height) = 0;
        virtual void DestroyDepthStencil(DepthStencilHandle depthStencil) = 0;

        // ----- Framebuffers -----
        [[nodiscard]] virtual FramebufferHandle CreateFramebuffer() = 0;
        virtual void DestroyFramebuffer(FramebufferHandle framebuffer) = 0;
        virtual void AttachDepthStencil(FramebufferHandle framebuffer, DepthStencilHandle depthStencil) = 0;
        // An invalid texture detaches the slot.
        virtual void SetColorAttachment(FramebufferHandle framebuffer, uint32_t slot, TextureHandle texture) = 0;
        // Enables slots [0, count) as draw buffers, disables the rest.
        virtual void SetDrawBuffers(FramebufferHandle framebuffer, uint32_t count) = 0;
        virtual void BindFramebuffer(FramebufferHandle framebuffer) = 0;

        // ----- State & draw -----
        virtual void SetPipelineState(const PipelineState& state) = 0;
        virtual void UseProgram(ProgramHandle program) = 0;
        virtual void BindVertexLayout(VertexLayoutHandle layout) = 0;
        virtual void SetUniform(int32_t location, const UniformValue& value) = 0;
        virtual void BindTexture(uint32_t unit, TextureHandle texture) = 0;
        // Clears colour, depth and stencil of the bound framebuffer.
        virtual void Clear(const glm::vec4& color) = 0;
        virtual void SetViewport(uint32_t width, uint32_t height) = 0;
        virtual void DrawInstanced(uint32_t vertexCount, uint32_t instanceCount) = 0;

        // Pixel size of the default framebuffer.
        [[nodiscard]] virtual glm::uvec2 GetRenderSize() const = 0;
    };
}
