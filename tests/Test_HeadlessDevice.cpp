#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <glm/glm.hpp>

import Core;
import RHI;

#include "TestLogCapture.h"

namespace
{
    constexpr const char* kVertex = R"(#version 330 core
// in float _COMMENTED;
uniform mat3 WORLD_TO_SCREEN;
in vec2 _LOCAL_POS;
in mat3 _TRANSFORM;
in float _DEPTH;
flat out float LAYER;
void main() { gl_Position = vec4(_LOCAL_POS, _DEPTH, 1.0); }
)";

    constexpr const char* kFragment = R"(#version 330 core
uniform mat3 WORLD_TO_SCREEN;
uniform sampler2D COLOR;
out vec4 RESULT;
void main() { RESULT = texture(COLOR, vec2(0.0)); }
)";
}

TEST(HeadlessDevice, ReflectsAttributesInSourceOrder)
{
    RHI::HeadlessDevice device;

    auto program = device.CreateProgram({.VertexSource = kVertex, .FragmentSource = kFragment});
    ASSERT_TRUE(program.has_value());

    EXPECT_EQ(device.GetAttributeLocation(*program, "_LOCAL_POS"), 0);
    EXPECT_EQ(device.GetAttributeLocation(*program, "_TRANSFORM"), 1);
    EXPECT_EQ(device.GetAttributeLocation(*program, "_DEPTH"), 4); // mat3 spans three locations
    EXPECT_EQ(device.GetAttributeLocation(*program, "_COMMENTED"), -1);
    EXPECT_EQ(device.GetAttributeLocation(*program, "LAYER"), -1);
}

TEST(HeadlessDevice, UniformsAreSharedAcrossStages)
{
    RHI::HeadlessDevice device;

    auto program = device.CreateProgram({.VertexSource = kVertex, .FragmentSource = kFragment});
    ASSERT_TRUE(program.has_value());

    EXPECT_EQ(device.GetUniformLocation(*program, "WORLD_TO_SCREEN"), 0);
    EXPECT_EQ(device.GetUniformLocation(*program, "COLOR"), 1);
    EXPECT_EQ(device.GetUniformLocation(*program, "MISSING"), -1);
    EXPECT_EQ(device.GetUniformLocation(RHI::ProgramHandle{}, "COLOR"), -1);
}

TEST(HeadlessDevice, CompileFailureCreatesNothing)
{
    LogCapture capture;
    RHI::HeadlessDevice device;

    auto broken = device.CreateProgram({.VertexSource = kVertex, .FragmentSource = "#error broken\nvoid main() {}"});
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error(), Core::ErrorCode::ShaderCompilationFailed);

    auto noMain = device.CreateProgram({.VertexSource = kVertex, .FragmentSource = "out vec4 X;"});
    EXPECT_FALSE(noMain.has_value());

    EXPECT_EQ(device.GetLiveProgramCount(), 0u);
    EXPECT_EQ(capture.Count(Core::Log::Level::Error), 2u);
}

TEST(HeadlessDevice, TexturesValidateSizeAndFormat)
{
    RHI::HeadlessDevice device;

    auto texture = device.CreateTexture(64, 32, RHI::TextureFormat::RGBA16F);
    ASSERT_TRUE(texture.has_value());
    const RHI::TextureInfo* info = device.GetTextureInfo(*texture);
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->Width, 64u);
    EXPECT_EQ(info->Height, 32u);
    EXPECT_FALSE(info->IsArray);

    auto array = device.CreateTextureArray(8, 8, 4, RHI::TextureFormat::R32F);
    ASSERT_TRUE(array.has_value());
    EXPECT_EQ(device.GetTextureInfo(*array)->Layers, 4u);

    EXPECT_FALSE(device.CreateTexture(0, 32, RHI::TextureFormat::RGBA8).has_value());
    auto bad = device.CreateTexture(4, 4, static_cast<RHI::TextureFormat>(99));
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error(), Core::ErrorCode::InvalidFormat);

    device.DestroyTexture(*texture);
    EXPECT_EQ(device.GetTextureInfo(*texture), nullptr);
    EXPECT_EQ(device.GetLiveTextureCount(), 1u);
}

TEST(HeadlessDevice, RecordsCommandStream)
{
    RHI::HeadlessDevice device({320, 200});
    EXPECT_EQ(device.GetRenderSize(), glm::uvec2(320, 200));

    auto program = device.CreateProgram({.VertexSource = kVertex, .FragmentSource = kFragment});
    ASSERT_TRUE(program.has_value());

    auto a = device.CreateTexture(4, 4, RHI::TextureFormat::RGBA8);
    auto b = device.CreateTexture(4, 4, RHI::TextureFormat::RGBA8);
    ASSERT_TRUE(a && b);

    const RHI::BufferHandle buffer = device.CreateBuffer();
    const std::vector<float> data{1.0f, 2.0f, 3.0f};

    device.UseProgram(*program);
    device.SetUniform(-1, 1.0f); // inactive uniform, dropped
    device.SetUniform(0, glm::mat3(1.0f));
    device.UploadBuffer(buffer, data);
    device.DrawInstanced(6, 3);
    device.CopyTexture(*a, *b, 4, 4);

    const auto& commands = device.GetCommands();
    ASSERT_EQ(commands.size(), 5u);
    EXPECT_EQ(commands[0].Type, RHI::CommandType::UseProgram);
    EXPECT_EQ(commands[1].Type, RHI::CommandType::SetUniform);
    EXPECT_EQ(commands[2].Type, RHI::CommandType::UploadBuffer);
    EXPECT_EQ(commands[2].Count, 3u);
    EXPECT_EQ(commands[3].Type, RHI::CommandType::DrawInstanced);
    EXPECT_EQ(commands[3].Program, *program);
    EXPECT_EQ(commands[3].Instances, 3u);
    EXPECT_EQ(commands[4].Type, RHI::CommandType::CopyTexture);
    EXPECT_EQ(commands[4].Texture, *a);
    EXPECT_EQ(commands[4].Destination, *b);

    const auto uploaded = device.GetBufferData(buffer);
    ASSERT_EQ(uploaded.size(), 3u);
    EXPECT_FLOAT_EQ(uploaded[2], 3.0f);
}

TEST(HeadlessDevice, FramebufferAttachmentsAreTracked)
{
    RHI::HeadlessDevice device;
    auto texture = device.CreateTexture(4, 4, RHI::TextureFormat::RGBA8);
    ASSERT_TRUE(texture.has_value());

    const RHI::FramebufferHandle fb = device.CreateFramebuffer();
    device.SetColorAttachment(fb, 2, *texture);
    EXPECT_EQ(device.GetColorAttachment(fb, 2), *texture);
    EXPECT_FALSE(device.GetColorAttachment(fb, 0).IsValid());

    device.SetColorAttachment(fb, RHI::kMaxColorAttachments, *texture); // out of range, ignored
    EXPECT_FALSE(device.GetColorAttachment(fb, RHI::kMaxColorAttachments).IsValid());
}
