#include <gtest/gtest.h>
#include <numbers>
#include <glm/glm.hpp>

import Graphics;

using Graphics::Camera2D;

namespace
{
    void ExpectNear(glm::vec2 actual, glm::vec2 expected)
    {
        EXPECT_NEAR(actual.x, expected.x, 1e-4f);
        EXPECT_NEAR(actual.y, expected.y, 1e-4f);
    }
}

TEST(Camera2D, ScreenCentreIsCameraPosition)
{
    Camera2D camera{.Position = {12.0f, -3.0f}, .Rotation = 0.7f, .Zoom = 0.05f};
    ExpectNear(camera.ScreenPointToWorld({0.5f, 0.5f}, {800, 600}), {12.0f, -3.0f});
    ExpectNear(camera.WorldPointToScreen({12.0f, -3.0f}, {800, 600}), {0.5f, 0.5f});
}

TEST(Camera2D, ZoomIsWorldUnitsPerPixel)
{
    Camera2D camera{.Position = {1.0f, 2.0f}, .Zoom = 0.01f};

    // Right edge is half the width away: 100 px * 0.01.
    ExpectNear(camera.ScreenPointToWorld({1.0f, 0.5f}, {200, 100}), {2.0f, 2.0f});
    ExpectNear(camera.ScreenPointToWorld({0.0f, 0.0f}, {200, 100}), {0.0f, 1.5f});
}

TEST(Camera2D, RotationTurnsTheView)
{
    Camera2D camera{.Rotation = std::numbers::pi_v<float> * 0.5f, .Zoom = 1.0f};

    // A quarter turn maps the screen's right edge onto world +y.
    ExpectNear(camera.ScreenPointToWorld({1.0f, 0.5f}, {10, 10}), {0.0f, 5.0f});
}

TEST(Camera2D, RoundTrip)
{
    Camera2D camera{.Position = {-4.0f, 9.0f}, .Rotation = 1.3f, .Zoom = 0.02f};
    const glm::uvec2 size{1920, 1080};

    for (glm::vec2 world : {glm::vec2(0.0f), glm::vec2(3.5f, -7.25f), glm::vec2(-100.0f, 40.0f)})
        ExpectNear(camera.ScreenPointToWorld(camera.WorldPointToScreen(world, size), size), world);

    const glm::mat3 product = camera.WorldToScreen(size) * camera.ScreenToWorld(size);
    for (int c = 0; c < 3; ++c)
        for (int r = 0; r < 3; ++r)
            EXPECT_NEAR(product[c][r], c == r ? 1.0f : 0.0f, 1e-4f);
}

TEST(Camera2D, ZeroSizeHasIdentityProjection)
{
    Camera2D camera{.Position = {5.0f, 5.0f}};
    EXPECT_EQ(camera.WorldToScreen({0, 480}), glm::mat3(1.0f));
    EXPECT_EQ(camera.WorldToScreen({640, 0}), glm::mat3(1.0f));
}
