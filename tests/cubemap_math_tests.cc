#include <gtest/gtest.h>

#include <cmath>

#include "render/cubemap_math.h"
#include "render/environment_precompute.h"

namespace {

constexpr float kEpsilon = 1e-4f;

skygrid::render::CubemapFace faceAt(std::uint32_t index) {
    return static_cast<skygrid::render::CubemapFace>(index);
}

TEST(CubemapMathTest, FaceCentersPointAlongAxes) {
    const skygrid::core::Vec3 expected[skygrid::render::kCubemapFaceCount] = {
        {1.0f, 0.0f, 0.0f},
        {-1.0f, 0.0f, 0.0f},
        {0.0f, 1.0f, 0.0f},
        {0.0f, -1.0f, 0.0f},
        {0.0f, 0.0f, 1.0f},
        {0.0f, 0.0f, -1.0f},
    };
    for (std::uint32_t face = 0; face < skygrid::render::kCubemapFaceCount; ++face) {
        const skygrid::core::Vec3 direction = skygrid::render::cubemapFaceDirection(faceAt(face), 0.0f, 0.0f);
        EXPECT_NEAR(direction.x, expected[face].x, kEpsilon) << "face=" << face;
        EXPECT_NEAR(direction.y, expected[face].y, kEpsilon) << "face=" << face;
        EXPECT_NEAR(direction.z, expected[face].z, kEpsilon) << "face=" << face;
    }
}

TEST(CubemapMathTest, TopRowOfSideFacesLooksUp) {
    // v = -1 is the first texel row, which cube sampling maps toward +Y on the side faces.
    for (const std::uint32_t face : {0u, 1u, 4u, 5u}) {
        const skygrid::core::Vec3 direction = skygrid::render::cubemapFaceDirection(faceAt(face), 0.0f, -1.0f);
        EXPECT_GT(direction.y, 0.0f) << "face=" << face;
    }
}

TEST(CubemapMathTest, TexelDirectionsAreNormalized) {
    for (std::uint32_t face = 0; face < skygrid::render::kCubemapFaceCount; ++face) {
        const skygrid::core::Vec3 corner = skygrid::render::cubemapTexelDirection(faceAt(face), 0, 0, 8);
        EXPECT_NEAR(skygrid::core::length(corner), 1.0f, kEpsilon);
    }
}

TEST(CubemapMathTest, EquirectMappingOfCardinalDirections) {
    const skygrid::render::EquirectUv up = skygrid::render::directionToEquirectUv({0.0f, 1.0f, 0.0f});
    EXPECT_NEAR(up.v, 0.0f, kEpsilon);

    const skygrid::render::EquirectUv down = skygrid::render::directionToEquirectUv({0.0f, -1.0f, 0.0f});
    EXPECT_NEAR(down.v, 1.0f, kEpsilon);

    const skygrid::render::EquirectUv posX = skygrid::render::directionToEquirectUv({1.0f, 0.0f, 0.0f});
    EXPECT_NEAR(posX.u, 0.5f, kEpsilon);
    EXPECT_NEAR(posX.v, 0.5f, kEpsilon);

    const skygrid::render::EquirectUv posZ = skygrid::render::directionToEquirectUv({0.0f, 0.0f, 1.0f});
    EXPECT_NEAR(posZ.u, 0.75f, kEpsilon);
}

TEST(CubemapMathTest, EquirectUvInvertsDirection) {
    const skygrid::core::Vec3 direction = skygrid::core::normalize(skygrid::core::Vec3{0.3f, -0.4f, 0.8f});
    const skygrid::core::Vec3 restored =
        skygrid::render::equirectUvToDirection(skygrid::render::directionToEquirectUv(direction));
    EXPECT_NEAR(restored.x, direction.x, kEpsilon);
    EXPECT_NEAR(restored.y, direction.y, kEpsilon);
    EXPECT_NEAR(restored.z, direction.z, kEpsilon);
}

TEST(EquirectSourceTest, RequiresTwoToOneAspect) {
    EXPECT_EQ(skygrid::render::validateEquirectDimensions(1024, 512), skygrid::render::PrecomputeError::None);
    EXPECT_EQ(skygrid::render::validateEquirectDimensions(512, 512), skygrid::render::PrecomputeError::BadImageAspect);
    EXPECT_EQ(skygrid::render::validateEquirectDimensions(1000, 512), skygrid::render::PrecomputeError::BadImageAspect);
    EXPECT_EQ(skygrid::render::validateEquirectDimensions(0, 0), skygrid::render::PrecomputeError::BadImageAspect);
}

TEST(EquirectSourceTest, DispatchCoversPartialWorkgroups) {
    EXPECT_EQ(skygrid::render::equirectDispatchGroups(512), 32u);
    EXPECT_EQ(skygrid::render::equirectDispatchGroups(500), 32u);
    EXPECT_EQ(skygrid::render::equirectDispatchGroups(1), 1u);
}

}  // namespace
