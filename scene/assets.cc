#include "scene/assets.h"

#include <algorithm>
#include <cmath>

namespace skygrid::scene {
namespace {

constexpr float kPi = 3.14159265358979323846f;

struct CubeFace {
    float normal[3];
    float tangent[3];
    float bitangent[3];
};

// tangent x bitangent == normal, so corners walk counter-clockwise seen from outside.
constexpr CubeFace kCubeFaces[6] = {
    {{1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, -1.0f}, {0.0f, 1.0f, 0.0f}},
    {{-1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, {0.0f, 1.0f, 0.0f}},
    {{0.0f, 1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, -1.0f}},
    {{0.0f, -1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}},
    {{0.0f, 0.0f, 1.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}},
    {{0.0f, 0.0f, -1.0f}, {-1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}},
};

float smoothstep(float edge0, float edge1, float x) {
    const float t = std::clamp((x - edge0) / (edge1 - edge0), 0.0f, 1.0f);
    return t * t * (3.0f - (2.0f * t));
}

} // namespace

MeshData makeCubeMesh(float halfExtent) {
    MeshData mesh;
    mesh.vertices.reserve(24);
    mesh.indices.reserve(36);

    constexpr float kCorners[4][2] = {{-1.0f, -1.0f}, {1.0f, -1.0f}, {1.0f, 1.0f}, {-1.0f, 1.0f}};
    for (const CubeFace& face : kCubeFaces) {
        const std::uint32_t base = static_cast<std::uint32_t>(mesh.vertices.size());
        for (const auto& corner : kCorners) {
            MeshVertex vertex{};
            for (int axis = 0; axis < 3; ++axis) {
                vertex.position[axis] = halfExtent *
                    (face.normal[axis] + (corner[0] * face.tangent[axis]) + (corner[1] * face.bitangent[axis]));
                vertex.normal[axis] = face.normal[axis];
            }
            vertex.uv[0] = (corner[0] + 1.0f) * 0.5f;
            vertex.uv[1] = 1.0f - ((corner[1] + 1.0f) * 0.5f);
            mesh.vertices.push_back(vertex);
        }
        mesh.indices.insert(mesh.indices.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
    }
    return mesh;
}

ImageRgba8 makeCheckerTexture(std::uint32_t size, std::uint32_t cells) {
    ImageRgba8 image;
    image.width = size;
    image.height = size;
    image.pixels.resize(static_cast<std::size_t>(size) * size * 4u);
    const std::uint32_t cellSize = std::max<std::uint32_t>(1u, size / std::max<std::uint32_t>(1u, cells));
    for (std::uint32_t y = 0; y < size; ++y) {
        for (std::uint32_t x = 0; x < size; ++x) {
            const bool light = (((x / cellSize) + (y / cellSize)) & 1u) == 0u;
            std::uint8_t* texel = &image.pixels[(static_cast<std::size_t>(y) * size + x) * 4u];
            texel[0] = light ? 230 : 70;
            texel[1] = light ? 225 : 90;
            texel[2] = light ? 210 : 120;
            texel[3] = 255;
        }
    }
    return image;
}

EquirectImage makeSkyEquirect(std::uint32_t height, const float sunDirection[3]) {
    EquirectImage image;
    image.height = height;
    image.width = height * 2u;
    image.rgba.resize(static_cast<std::size_t>(image.width) * image.height * 4u);

    float sun[3] = {sunDirection[0], sunDirection[1], sunDirection[2]};
    const float sunLength = std::sqrt((sun[0] * sun[0]) + (sun[1] * sun[1]) + (sun[2] * sun[2]));
    if (sunLength > 0.0f) {
        for (float& c : sun) {
            c /= sunLength;
        }
    }

    for (std::uint32_t row = 0; row < image.height; ++row) {
        const float theta = ((static_cast<float>(row) + 0.5f) / static_cast<float>(image.height)) * kPi;
        const float dirY = std::cos(theta);
        const float sinTheta = std::sin(theta);
        for (std::uint32_t column = 0; column < image.width; ++column) {
            const float u = (static_cast<float>(column) + 0.5f) / static_cast<float>(image.width);
            const float phi = (u - 0.5f) * 2.0f * kPi;
            const float dirX = sinTheta * std::cos(phi);
            const float dirZ = sinTheta * std::sin(phi);

            float color[3];
            if (dirY >= 0.0f) {
                const float t = std::pow(dirY, 0.5f);
                color[0] = 0.75f + ((0.20f - 0.75f) * t);
                color[1] = 0.82f + ((0.40f - 0.82f) * t);
                color[2] = 0.92f + ((0.85f - 0.92f) * t);
            } else {
                const float t = std::min(1.0f, -dirY * 4.0f);
                color[0] = 0.45f + ((0.18f - 0.45f) * t);
                color[1] = 0.42f + ((0.16f - 0.42f) * t);
                color[2] = 0.38f + ((0.14f - 0.38f) * t);
            }

            const float cosSun = (dirX * sun[0]) + (dirY * sun[1]) + (dirZ * sun[2]);
            const float disc = smoothstep(0.9990f, 0.9996f, cosSun);
            const float glow = std::pow(std::max(cosSun, 0.0f), 64.0f) * 0.35f;
            color[0] += (disc * 8.0f) + glow;
            color[1] += (disc * 7.5f) + (glow * 0.9f);
            color[2] += (disc * 6.5f) + (glow * 0.7f);

            float* texel = &image.rgba[(static_cast<std::size_t>(row) * image.width + column) * 4u];
            texel[0] = color[0];
            texel[1] = color[1];
            texel[2] = color[2];
            texel[3] = 1.0f;
        }
    }
    return image;
}

EquirectImage makeUniformEquirect(std::uint32_t height, float r, float g, float b) {
    EquirectImage image;
    image.height = height;
    image.width = height * 2u;
    image.rgba.resize(static_cast<std::size_t>(image.width) * image.height * 4u);
    for (std::size_t i = 0; i < image.rgba.size(); i += 4u) {
        image.rgba[i + 0] = r;
        image.rgba[i + 1] = g;
        image.rgba[i + 2] = b;
        image.rgba[i + 3] = 1.0f;
    }
    return image;
}

} // namespace skygrid::scene
