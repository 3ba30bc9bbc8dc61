#include "render/cubemap_math.h"

#include <algorithm>
#include <cmath>

namespace skygrid::render {

core::Vec3 cubemapFaceDirection(CubemapFace face, float u, float v) {
    switch (face) {
    case CubemapFace::PositiveX:
        return core::Vec3{1.0f, -v, -u};
    case CubemapFace::NegativeX:
        return core::Vec3{-1.0f, -v, u};
    case CubemapFace::PositiveY:
        return core::Vec3{u, 1.0f, v};
    case CubemapFace::NegativeY:
        return core::Vec3{u, -1.0f, -v};
    case CubemapFace::PositiveZ:
        return core::Vec3{u, -v, 1.0f};
    case CubemapFace::NegativeZ:
        return core::Vec3{-u, -v, -1.0f};
    }
    return core::Vec3{0.0f, 0.0f, 1.0f};
}

core::Vec3 cubemapTexelDirection(CubemapFace face, std::uint32_t x, std::uint32_t y, std::uint32_t faceSize) {
    const float size = static_cast<float>(std::max(faceSize, 1u));
    const float u = (2.0f * (static_cast<float>(x) + 0.5f) / size) - 1.0f;
    const float v = (2.0f * (static_cast<float>(y) + 0.5f) / size) - 1.0f;
    return core::normalize(cubemapFaceDirection(face, u, v));
}

EquirectUv directionToEquirectUv(const core::Vec3& direction) {
    const core::Vec3 d = core::normalize(direction);
    EquirectUv uv{};
    uv.u = 0.5f + (std::atan2(d.z, d.x) / (2.0f * core::kPi));
    uv.v = std::acos(std::clamp(d.y, -1.0f, 1.0f)) / core::kPi;
    return uv;
}

core::Vec3 equirectUvToDirection(const EquirectUv& uv) {
    const float phi = (uv.u - 0.5f) * 2.0f * core::kPi;
    const float theta = uv.v * core::kPi;
    return core::Vec3{std::sin(theta) * std::cos(phi), std::cos(theta), std::sin(theta) * std::sin(phi)};
}

} // namespace skygrid::render
