#pragma once

#include "core/math.h"

#include <cstdint>

namespace skygrid::render {

// Array layer order of a Vulkan cube image.
enum class CubemapFace : std::uint32_t {
    PositiveX = 0,
    NegativeX = 1,
    PositiveY = 2,
    NegativeY = 3,
    PositiveZ = 4,
    NegativeZ = 5,
};

constexpr std::uint32_t kCubemapFaceCount = 6;

struct EquirectUv {
    float u = 0.0f;
    float v = 0.0f;
};

// Unnormalized direction for face coordinates u, v in [-1, 1], matching hardware cube sampling.
// equirect_to_cubemap.comp carries the same table.
[[nodiscard]] core::Vec3 cubemapFaceDirection(CubemapFace face, float u, float v);

// Normalized direction through the center of texel (x, y) on a face of `faceSize` texels.
[[nodiscard]] core::Vec3 cubemapTexelDirection(CubemapFace face, std::uint32_t x, std::uint32_t y, std::uint32_t faceSize);

// Longitude from atan2(z, x) maps to u, the polar angle from +Y maps to v.
[[nodiscard]] EquirectUv directionToEquirectUv(const core::Vec3& direction);
[[nodiscard]] core::Vec3 equirectUvToDirection(const EquirectUv& uv);

} // namespace skygrid::render
