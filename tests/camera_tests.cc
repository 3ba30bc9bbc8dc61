#include <gtest/gtest.h>

#include <cmath>

#include "core/camera.h"
#include "core/log.h"
#include "core/math.h"

namespace {

constexpr float kEpsilon = 1e-4f;

float clipDepth(const skygrid::core::Mat4& projection, float viewZ) {
    const skygrid::core::Vec4 clip = projection * skygrid::core::Vec4{0.0f, 0.0f, viewZ, 1.0f};
    return clip.z / clip.w;
}

TEST(CameraTest, ReverseZMapsNearToOneAndFarToZero) {
    skygrid::core::Projection projection{};
    projection.nearPlane = 0.1f;
    projection.farPlane = 100.0f;
    const skygrid::core::Mat4 matrix = projection.matrix();
    EXPECT_NEAR(clipDepth(matrix, -0.1f), 1.0f, kEpsilon);
    EXPECT_NEAR(clipDepth(matrix, -100.0f), 0.0f, kEpsilon);
    EXPECT_GT(clipDepth(matrix, -1.0f), clipDepth(matrix, -10.0f));
}

TEST(CameraTest, ProjectionFlipsYForVulkan) {
    skygrid::core::Projection projection{};
    const skygrid::core::Vec4 clip = projection.matrix() * skygrid::core::Vec4{0.0f, 1.0f, -5.0f, 1.0f};
    EXPECT_LT(clip.y / clip.w, 0.0f);
}

TEST(CameraTest, ResizeIgnoresZeroExtent) {
    skygrid::core::Projection projection{};
    projection.resize(800, 400);
    EXPECT_FLOAT_EQ(projection.aspect, 2.0f);
    projection.resize(0, 400);
    EXPECT_FLOAT_EQ(projection.aspect, 2.0f);
}

TEST(CameraTest, ViewMatrixMovesEyeToOrigin) {
    skygrid::core::Camera camera{};
    camera.position = skygrid::core::Vec3{3.0f, 4.0f, 5.0f};
    const skygrid::core::Vec3 eye = skygrid::core::transformPoint(camera.viewMatrix(), camera.position);
    EXPECT_NEAR(eye.x, 0.0f, kEpsilon);
    EXPECT_NEAR(eye.y, 0.0f, kEpsilon);
    EXPECT_NEAR(eye.z, 0.0f, kEpsilon);

    const skygrid::core::Vec3 ahead =
        skygrid::core::transformPoint(camera.viewMatrix(), camera.position + camera.forward());
    EXPECT_NEAR(ahead.z, -1.0f, kEpsilon);
}

TEST(CameraControllerTest, ForwardMoveScalesWithSpeedAndTime) {
    skygrid::core::Camera camera{};
    camera.position = skygrid::core::Vec3{0.0f, 0.0f, 0.0f};
    camera.yawRadians = 0.0f;
    camera.pitchRadians = 0.0f;

    skygrid::core::CameraController controller(2.0f, 0.5f);
    controller.setMove(skygrid::core::CameraMove::Forward, true);
    controller.update(camera, 0.5f);
    EXPECT_NEAR(camera.position.x, 1.0f, kEpsilon);
    EXPECT_NEAR(camera.position.z, 0.0f, kEpsilon);

    controller.setMove(skygrid::core::CameraMove::Forward, false);
    controller.update(camera, 0.5f);
    EXPECT_NEAR(camera.position.x, 1.0f, kEpsilon);
}

TEST(CameraControllerTest, PitchIsClampedShortOfVertical) {
    skygrid::core::Camera camera{};
    skygrid::core::CameraController controller(1.0f, 1.0f);
    controller.addMouseDelta(0.0f, -1.0e6f);
    controller.update(camera, 1.0f);
    EXPECT_LE(camera.pitchRadians, skygrid::core::kSafeHalfPi);
    EXPECT_LT(camera.pitchRadians, skygrid::core::kPi * 0.5f);
}

TEST(LogLevelTest, ParsesNamesAndDigits) {
    EXPECT_EQ(skygrid::core::parseLogLevel("WARNING"), skygrid::core::LogLevel::Warn);
    EXPECT_EQ(skygrid::core::parseLogLevel("trace"), skygrid::core::LogLevel::Trace);
    EXPECT_EQ(skygrid::core::parseLogLevel("0"), skygrid::core::LogLevel::Error);
    EXPECT_FALSE(skygrid::core::parseLogLevel("loud").has_value());
}

TEST(LogLevelTest, ScopedTimerElapsedIsMonotonic) {
    skygrid::core::ScopedLogTimer timer("test", "scoped timer");
    const double first = timer.elapsedMilliseconds();
    const double second = timer.elapsedMilliseconds();
    EXPECT_GE(first, 0.0);
    EXPECT_GE(second, first);
}

}  // namespace
