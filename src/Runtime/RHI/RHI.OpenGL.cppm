module;
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <glm/glm.hpp>

export module RHI:OpenGL;

import Core;
import :Types;
import :Device;

export namespace RHI
{
    // IDevice over an OpenGL 3.3 core context. The context must be current on
    // the calling thread (Core::Windowing::Window makes it so) for the whole
    // lifetime of the device. Entry points are loaded by GLEW in Create().
    class OpenGLDevice final : public IDevice
    {
    public:
        // Loads the GL entry points for the window's context, then builds the device.
        [[nodiscard]] static Core::Expected<std::unique_ptr<OpenGLDevice>> Create(Core::Windowing::Window& window);

        explicit OpenGLDevice(Core::Windowing::Window& window);
        ~OpenGLDevice() override;

        OpenGLDevice(const OpenGLDevice&) = delete;
        OpenGLDevice& operator=(const OpenGLDevice&) = delete;

        [[nodiscard]] Core::Expected<ProgramHandle> CreateProgram(const ProgramDesc& desc) override;
        void DestroyProgram(ProgramHandle program) override;
        [[nodiscard]] int32_t GetAttributeLocation(ProgramHandle program, std::string_view name) const override;
        [[nodiscard]] int32_t GetUniformLocation(ProgramHandle program, std::string_view name) const override;

        [[nodiscard]] BufferHandle CreateBuffer() override;
        void UploadBuffer(BufferHandle buffer, std::span<const float> data) override;
        void DestroyBuffer(BufferHandle buffer) override;

        [[nodiscard]] VertexLayoutHandle CreateVertexLayout() override;
        void SetVertexAttribute(VertexLayoutHandle layout, const VertexAttributeDesc& attribute) override;
        void DestroyVertexLayout(VertexLayoutHandle layout) override;

        [[nodiscard]] Core::Expected<TextureHandle> CreateTexture(uint32_t width, uint32_t height, TextureFormat format) override;
        [[nodiscard]] Core::Expected<TextureHandle> CreateTextureArray(uint32_t width, uint32_t height, uint32_t layers, TextureFormat format) override;
        void DestroyTexture(TextureHandle texture) override;
        void CopyTexture(TextureHandle source, TextureHandle destination, uint32_t width, uint32_t height) override;

        [[nodiscard]] DepthStencilHandle CreateDepthStencil(uint32_t width, uint32_t height) override;
        void DestroyDepthStencil(DepthStencilHandle depthStencil) override;

        [[nodiscard]] FramebufferHandle CreateFramebuffer() override;
        void DestroyFramebuffer(FramebufferHandle framebuffer) override;
        void AttachDepthStencil(FramebufferHandle framebuffer, DepthStencilHandle depthStencil) override;
        void SetColorAttachment(FramebufferHandle framebuffer, uint32_t slot, TextureHandle texture) override;
        void SetDrawBuffers(FramebufferHandle framebuffer, uint32_t count) override;
        void BindFramebuffer(FramebufferHandle framebuffer) override;

        void SetPipelineState(const PipelineState& state) override;
        void UseProgram(ProgramHandle program) override;
        void BindVertexLayout(VertexLayoutHandle layout) override;
        void SetUniform(int32_t location, const UniformValue& value) override;
        void BindTexture(uint32_t unit, TextureHandle texture) override;
        void Clear(const glm::vec4& color) override;
        void SetViewport(uint32_t width, uint32_t height) override;
        void DrawInstanced(uint32_t vertexCount, uint32_t instanceCount) override;

        [[nodiscard]] glm::uvec2 GetRenderSize() const override;

    private:
        // GL object names are stored as uint32_t so the GL headers stay out of
        // the interface.
        struct Texture
        {
            uint32_t Id = 0;
            uint32_t Target = 0;
            uint32_t Width = 0;
            uint32_t Height = 0;
            uint32_t Layers = 1;
        };

        void BindTextureToRead(uint32_t framebuffer, const Texture& texture, uint32_t layer) const;
        void BindTextureToDraw(uint32_t framebuffer, const Texture& texture, uint32_t layer) const;

        Core::Windowing::Window& m_Window;

        Core::ResourcePool<uint32_t, ProgramTag> m_Programs;
        Core::ResourcePool<uint32_t, BufferTag> m_Buffers;
        Core::ResourcePool<uint32_t, VertexLayoutTag> m_Layouts;
        Core::ResourcePool<Texture, TextureTag> m_Textures;
        Core::ResourcePool<uint32_t, DepthStencilTag> m_DepthStencils;
        Core::ResourcePool<uint32_t, FramebufferTag> m_Framebuffers;

        // Scratch framebuffers for CopyTexture (read, draw).
        uint32_t m_CopyFramebuffers[2] = {0, 0};
        uint32_t m_BoundFramebuffer = 0;
    };
}
