#include <gtest/gtest.h>

#include <cmath>

#include "scene/assets.h"

namespace {

TEST(AssetsTest, CubeHasOutwardCounterClockwiseFaces) {
    const skygrid::scene::MeshData cube = skygrid::scene::makeCubeMesh(0.5f);
    ASSERT_EQ(cube.vertices.size(), 24u);
    ASSERT_EQ(cube.indices.size(), 36u);

    for (std::size_t i = 0; i < cube.indices.size(); i += 3) {
        const skygrid::scene::MeshVertex& a = cube.vertices[cube.indices[i]];
        const skygrid::scene::MeshVertex& b = cube.vertices[cube.indices[i + 1]];
        const skygrid::scene::MeshVertex& c = cube.vertices[cube.indices[i + 2]];
        const float e1[3] = {b.position[0] - a.position[0], b.position[1] - a.position[1], b.position[2] - a.position[2]};
        const float e2[3] = {c.position[0] - a.position[0], c.position[1] - a.position[1], c.position[2] - a.position[2]};
        const float n[3] = {
            (e1[1] * e2[2]) - (e1[2] * e2[1]),
            (e1[2] * e2[0]) - (e1[0] * e2[2]),
            (e1[0] * e2[1]) - (e1[1] * e2[0])};
        const float facing = (n[0] * a.normal[0]) + (n[1] * a.normal[1]) + (n[2] * a.normal[2]);
        EXPECT_GT(facing, 0.0f) << "triangle " << (i / 3);
    }
    for (const skygrid::scene::MeshVertex& vertex : cube.vertices) {
        for (const float p : vertex.position) {
            EXPECT_FLOAT_EQ(std::fabs(p), 0.5f);
        }
    }
}

TEST(AssetsTest, CheckerAlternatesCells) {
    const skygrid::scene::ImageRgba8 checker = skygrid::scene::makeCheckerTexture(8, 2);
    ASSERT_EQ(checker.pixels.size(), 8u * 8u * 4u);
    EXPECT_NE(checker.pixels[0], checker.pixels[4u * 4u]);
    EXPECT_EQ(checker.pixels[3], 255u);
}

TEST(AssetsTest, EquirectGeneratorsAreTwoToOne) {
    const float sun[3] = {0.0f, 1.0f, 0.0f};
    const skygrid::scene::EquirectImage sky = skygrid::scene::makeSkyEquirect(32, sun);
    EXPECT_EQ(sky.width, 64u);
    EXPECT_EQ(sky.height, 32u);
    EXPECT_EQ(sky.rgba.size(), 64u * 32u * 4u);

    const skygrid::scene::EquirectImage uniform = skygrid::scene::makeUniformEquirect(16, 0.25f, 0.5f, 0.75f);
    ASSERT_EQ(uniform.rgba.size(), 32u * 16u * 4u);
    EXPECT_FLOAT_EQ(uniform.rgba[0], 0.25f);
    EXPECT_FLOAT_EQ(uniform.rgba[uniform.rgba.size() - 2], 0.75f);
}

TEST(AssetsTest, SkyIsBrighterOverheadThanBelowHorizon) {
    const float sun[3] = {1.0f, 0.0f, 0.0f};
    const skygrid::scene::EquirectImage sky = skygrid::scene::makeSkyEquirect(64, sun);
    const std::size_t topRow = 2;
    const std::size_t bottomRow = sky.height - 3;
    const std::size_t column = 10;
    const float top = sky.rgba[((topRow * sky.width) + column) * 4 + 2];
    const float bottom = sky.rgba[((bottomRow * sky.width) + column) * 4 + 2];
    EXPECT_GT(top, bottom);
}

}  // namespace
