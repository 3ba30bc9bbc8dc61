#pragma once

#include <cstdint>
#include <vector>

namespace skygrid::scene {

struct MeshVertex {
    float position[3];
    float normal[3];
    float uv[2];
};
static_assert(sizeof(MeshVertex) == 32, "MeshVertex is uploaded as-is to the vertex buffer");

struct MeshData {
    std::vector<MeshVertex> vertices;
    std::vector<std::uint32_t> indices;
};

// Tightly packed RGBA8, row 0 at the top.
struct ImageRgba8 {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> pixels;
};

// Linear RGBA32F texels, row 0 at the top (polar angle 0, +Y).
struct EquirectImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<float> rgba;
};

// Unit cube centered on the origin, 24 vertices so each face has its own normal and uvs.
[[nodiscard]] MeshData makeCubeMesh(float halfExtent = 0.5f);

// Two-tone checkerboard with `cells` squares per side.
[[nodiscard]] ImageRgba8 makeCheckerTexture(std::uint32_t size, std::uint32_t cells);

// Analytic sky: horizon gradient, darker ground and a sun disc around `sunDirection`.
// `height` rows, 2 * height columns.
[[nodiscard]] EquirectImage makeSkyEquirect(std::uint32_t height, const float sunDirection[3]);

// Every texel the same color. Handy for checking the precompute path.
[[nodiscard]] EquirectImage makeUniformEquirect(std::uint32_t height, float r, float g, float b);

} // namespace skygrid::scene
