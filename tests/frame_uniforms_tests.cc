#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "render/frame_uniforms.h"

namespace {

constexpr float kEpsilon = 1e-4f;

TEST(InstanceGridTest, RowMajorPlacementAtSpacing) {
    skygrid::render::InstanceGridConfig config{};
    config.rows = 10;
    config.columns = 10;
    config.spacing = 3.0f;

    const std::vector<skygrid::render::InstanceRecord> records = skygrid::render::buildInstanceGrid(config);
    ASSERT_EQ(records.size(), 100u);
    for (std::uint32_t k = 0; k < records.size(); ++k) {
        const float row = static_cast<float>(k / 10u);
        const float col = static_cast<float>(k % 10u);
        EXPECT_FLOAT_EQ(records[k].position.x, col * 3.0f) << "k=" << k;
        EXPECT_FLOAT_EQ(records[k].position.y, 0.0f) << "k=" << k;
        EXPECT_FLOAT_EQ(records[k].position.z, row * 3.0f) << "k=" << k;
    }
}

TEST(InstanceGridTest, YawAdvancesPerRecord) {
    skygrid::render::InstanceGridConfig config{};
    config.rows = 2;
    config.columns = 3;
    config.yawStepDegrees = 10.0f;
    const std::vector<skygrid::render::InstanceRecord> records = skygrid::render::buildInstanceGrid(config);
    ASSERT_EQ(records.size(), 6u);
    EXPECT_NEAR(records[0].yawRadians, 0.0f, kEpsilon);
    EXPECT_NEAR(records[5].yawRadians, skygrid::core::radians(50.0f), kEpsilon);
}

TEST(InstanceGridTest, EmptyGridHasNoRecords) {
    skygrid::render::InstanceGridConfig config{};
    config.rows = 0;
    EXPECT_TRUE(skygrid::render::buildInstanceGrid(config).empty());
}

TEST(InstanceGridTest, PackedModelTranslatesAndRotates) {
    skygrid::render::InstanceRecord record{};
    record.position = skygrid::core::Vec3{6.0f, 0.0f, 9.0f};
    record.yawRadians = skygrid::core::kPi * 0.5f;
    const skygrid::render::InstanceRaw raw = skygrid::render::packInstance(record);

    // Row-major: translation sits in the last column.
    EXPECT_FLOAT_EQ(raw.model[3], 6.0f);
    EXPECT_FLOAT_EQ(raw.model[7], 0.0f);
    EXPECT_FLOAT_EQ(raw.model[11], 9.0f);
    EXPECT_FLOAT_EQ(raw.model[15], 1.0f);

    // +X rotated a quarter turn about +Y lands on -Z.
    EXPECT_NEAR(raw.model[0], 0.0f, kEpsilon);
    EXPECT_NEAR(raw.model[8], -1.0f, kEpsilon);
    EXPECT_NEAR(raw.normal[0], 0.0f, kEpsilon);
    EXPECT_NEAR(raw.normal[6], -1.0f, kEpsilon);
    EXPECT_NEAR(raw.normal[4], 1.0f, kEpsilon);
}

TEST(LightOrbitTest, ClosedFormPosition) {
    skygrid::render::LightOrbitConfig config{};
    config.radius = 8.0f;
    config.height = 4.0f;
    config.angularSpeedRadians = 0.5f;

    const double t = 2.5;
    const skygrid::core::Vec3 position = skygrid::render::lightPositionAt(config, t);
    EXPECT_NEAR(position.x, 8.0f * std::cos(1.25f), kEpsilon);
    EXPECT_NEAR(position.y, 4.0f, kEpsilon);
    EXPECT_NEAR(position.z, 8.0f * std::sin(1.25f), kEpsilon);
}

TEST(LightOrbitTest, PositionIndependentOfFrameSplit) {
    skygrid::render::LightOrbitConfig config{};
    const double total = 3.7;

    skygrid::render::LightAnimator coarse(config);
    coarse.setElapsed(total);

    skygrid::render::LightAnimator fine(config);
    const std::vector<double> deltas = {0.016, 0.5, 0.001, 1.2, 0.033, 0.9, 1.05};
    double elapsed = 0.0;
    for (const double delta : deltas) {
        elapsed += delta;
        fine.setElapsed(elapsed);
    }
    ASSERT_NEAR(elapsed, total, 1e-9);

    const skygrid::core::Vec3 expected = skygrid::render::lightPositionAt(config, total);
    EXPECT_NEAR(coarse.position().x, expected.x, kEpsilon);
    EXPECT_NEAR(coarse.position().z, expected.z, kEpsilon);
    EXPECT_NEAR(fine.position().x, expected.x, kEpsilon);
    EXPECT_NEAR(fine.position().y, expected.y, kEpsilon);
    EXPECT_NEAR(fine.position().z, expected.z, kEpsilon);
}

TEST(LightOrbitTest, SpeedChangeKeepsAngleContinuous) {
    skygrid::render::LightOrbitConfig config{};
    config.angularSpeedRadians = 1.0f;
    skygrid::render::LightAnimator animator(config);
    animator.setElapsed(2.0);
    const skygrid::core::Vec3 before = animator.position();

    animator.setAngularSpeed(0.25f);
    const skygrid::core::Vec3 after = animator.position();
    EXPECT_NEAR(before.x, after.x, kEpsilon);
    EXPECT_NEAR(before.z, after.z, kEpsilon);

    animator.setElapsed(4.0);
    const float expectedAngle = 2.0f + (0.25f * 2.0f);
    EXPECT_NEAR(animator.position().x, config.radius * std::cos(expectedAngle), kEpsilon);
    EXPECT_NEAR(animator.position().z, config.radius * std::sin(expectedAngle), kEpsilon);
}

TEST(FrameUniformTest, CameraUniformCarriesPositionAndInverses) {
    skygrid::core::Camera camera{};
    camera.position = skygrid::core::Vec3{1.0f, 2.0f, 3.0f};
    skygrid::core::Projection projection{};
    projection.resize(1280, 720);

    const skygrid::render::CameraUniform uniform = skygrid::render::makeCameraUniform(camera, projection);
    EXPECT_FLOAT_EQ(uniform.viewPosition[0], 1.0f);
    EXPECT_FLOAT_EQ(uniform.viewPosition[1], 2.0f);
    EXPECT_FLOAT_EQ(uniform.viewPosition[2], 3.0f);
    EXPECT_FLOAT_EQ(uniform.viewPosition[3], 1.0f);

    // invView maps the view-space origin back to the eye.
    EXPECT_NEAR(uniform.invView[3], 1.0f, kEpsilon);
    EXPECT_NEAR(uniform.invView[7], 2.0f, kEpsilon);
    EXPECT_NEAR(uniform.invView[11], 3.0f, kEpsilon);
}

TEST(FrameUniformTest, LightUniformPadsVectors) {
    const skygrid::render::LightUniform uniform = skygrid::render::makeLightUniform(
        skygrid::core::Vec3{1.0f, 2.0f, 3.0f},
        skygrid::core::Vec3{0.5f, 0.25f, 0.125f});
    EXPECT_FLOAT_EQ(uniform.position[2], 3.0f);
    EXPECT_FLOAT_EQ(uniform.padding0, 0.0f);
    EXPECT_FLOAT_EQ(uniform.color[0], 0.5f);
    EXPECT_FLOAT_EQ(uniform.padding1, 0.0f);
}

}  // namespace
