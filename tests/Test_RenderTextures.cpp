#include <gtest/gtest.h>
#include <glm/glm.hpp>

import Core;
import RHI;
import Graphics;

#include "TestLogCapture.h"

using namespace Graphics;

TEST(RenderTextures, ComputeTextureSizeRoundsUpAndClamps)
{
    EXPECT_EQ(ComputeTextureSize({1280, 720}, 1.0f), glm::uvec2(1280, 720));
    EXPECT_EQ(ComputeTextureSize({101, 51}, 0.5f), glm::uvec2(51, 26));
    EXPECT_EQ(ComputeTextureSize({1, 1}, 0.01f), glm::uvec2(1, 1));
    EXPECT_EQ(ComputeTextureSize({0, 0}, 1.0f), glm::uvec2(1, 1));
}

TEST(RenderTextures, SameNameYieldsSameObject)
{
    RHI::HeadlessDevice device({640, 480});
    RenderTextureRegistry textures(device);

    auto declared = textures.Declare("COLOR", {});
    ASSERT_TRUE(declared.has_value());

    auto acquired = textures.Acquire("COLOR");
    ASSERT_TRUE(acquired.has_value());
    EXPECT_EQ(*declared, *acquired);
    EXPECT_EQ(textures.Find("COLOR"), *declared);
    EXPECT_EQ(textures.Size(), 1u);

    EXPECT_EQ((*declared)->GetName(), "COLOR");
    EXPECT_EQ((*declared)->GetSize(), glm::uvec2(640, 480));
    EXPECT_NE((*declared)->GetReadTexture(), (*declared)->GetWriteTexture());
    EXPECT_EQ(device.GetLiveTextureCount(), 2u);
}

TEST(RenderTextures, AcquireDeclaresWithDefaults)
{
    RHI::HeadlessDevice device({64, 64});
    RenderTextureRegistry textures(device);

    EXPECT_EQ(textures.Find("LIGHT"), nullptr);
    auto light = textures.Acquire("LIGHT");
    ASSERT_TRUE(light.has_value());
    EXPECT_EQ((*light)->GetDesc(), RenderTextureDesc{});
    EXPECT_TRUE((*light)->IsSwappable());
}

TEST(RenderTextures, RedeclareWithNewDescKeepsIdentity)
{
    RHI::HeadlessDevice device({200, 100});
    RenderTextureRegistry textures(device);

    auto first = textures.Declare("BLOOM", {});
    ASSERT_TRUE(first.has_value());
    const RHI::TextureHandle oldWrite = (*first)->GetWriteTexture();

    // Same desc is a no-op.
    auto same = textures.Declare("BLOOM", {});
    ASSERT_TRUE(same.has_value());
    EXPECT_EQ((*same)->GetWriteTexture(), oldWrite);

    auto second = textures.Declare("BLOOM", {.Format = RHI::TextureFormat::RGBA16F, .ResolutionScale = 0.5f});
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_NE((*second)->GetWriteTexture(), oldWrite);
    EXPECT_EQ((*second)->GetSize(), glm::uvec2(100, 50));
    EXPECT_EQ(device.GetTextureInfo(oldWrite), nullptr);
    EXPECT_EQ(device.GetTextureInfo((*second)->GetWriteTexture())->Format, RHI::TextureFormat::RGBA16F);
    EXPECT_EQ(device.GetLiveTextureCount(), 2u);
}

TEST(RenderTextures, ResizeRecreatesChangedTextures)
{
    RHI::HeadlessDevice device({100, 100});
    RenderTextureRegistry textures(device);

    auto full = textures.Declare("FULL", {});
    auto tiny = textures.Declare("TINY", {.ResolutionScale = 0.001f});
    ASSERT_TRUE(full && tiny);

    const RHI::TextureHandle tinyWrite = (*tiny)->GetWriteTexture();
    const RHI::TextureHandle fullWrite = (*full)->GetWriteTexture();

    ASSERT_TRUE(textures.Resize({300, 200}).has_value());
    EXPECT_EQ(textures.GetRenderSize(), glm::uvec2(300, 200));

    EXPECT_EQ((*full)->GetSize(), glm::uvec2(300, 200));
    EXPECT_NE((*full)->GetWriteTexture(), fullWrite);

    // ceil(300 * 0.001) is still 1x1.
    EXPECT_EQ((*tiny)->GetSize(), glm::uvec2(1, 1));
    EXPECT_EQ((*tiny)->GetWriteTexture(), tinyWrite);
}

TEST(RenderTextures, SynchronizeCopiesSwappableOnly)
{
    RHI::HeadlessDevice device({32, 32});
    RenderTextureRegistry textures(device);

    auto swappable = textures.Declare("A", {});
    auto single = textures.Declare("B", {.Swappable = false});
    ASSERT_TRUE(swappable && single);

    EXPECT_EQ((*single)->GetReadTexture(), (*single)->GetWriteTexture());

    device.ClearCommands();
    textures.Synchronize(**single);
    EXPECT_TRUE(device.GetCommands().empty());

    textures.Synchronize(**swappable);
    ASSERT_EQ(device.GetCommands().size(), 1u);
    const RHI::RecordedCommand& copy = device.GetCommands()[0];
    EXPECT_EQ(copy.Type, RHI::CommandType::CopyTexture);
    EXPECT_EQ(copy.Texture, (*swappable)->GetWriteTexture());
    EXPECT_EQ(copy.Destination, (*swappable)->GetReadTexture());
    EXPECT_EQ(copy.Count, 32u * 32u);
}

TEST(RenderTextures, ArrayTexturesCarryLayers)
{
    RHI::HeadlessDevice device({16, 16});
    RenderTextureRegistry textures(device);

    auto layers = textures.Declare("SHADOW", {.Format = RHI::TextureFormat::R32F, .ArrayLayers = 4});
    ASSERT_TRUE(layers.has_value());
    EXPECT_TRUE((*layers)->IsArray());
    EXPECT_EQ(device.GetTextureInfo((*layers)->GetWriteTexture())->Layers, 4u);
}

TEST(RenderTextures, InvalidDescIsRejected)
{
    LogCapture capture;
    RHI::HeadlessDevice device;
    RenderTextureRegistry textures(device);

    auto zero = textures.Declare("ZERO", {.ResolutionScale = 0.0f});
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error(), Core::ErrorCode::InvalidArgument);

    auto format = textures.Declare("BAD", {.Format = static_cast<RHI::TextureFormat>(42)});
    ASSERT_FALSE(format.has_value());
    EXPECT_EQ(format.error(), Core::ErrorCode::InvalidFormat);

    EXPECT_EQ(textures.Size(), 0u);
    EXPECT_EQ(capture.Count(Core::Log::Level::Error), 2u);
}
