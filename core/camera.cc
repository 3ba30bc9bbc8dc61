#include "core/camera.h"

#include <algorithm>
#include <cmath>

namespace skygrid::core {
namespace {

// One scroll line is treated as 100 pixels of travel.
constexpr float kScrollPixelsPerLine = 100.0f;

} // namespace

Vec3 Camera::forward() const {
    const float cp = std::cos(pitchRadians);
    return normalize(Vec3{std::cos(yawRadians) * cp, std::sin(pitchRadians), std::sin(yawRadians) * cp});
}

Vec3 Camera::right() const {
    return normalize(cross(forward(), Vec3{0.0f, 1.0f, 0.0f}));
}

Mat4 Camera::viewMatrix() const {
    return lookToRH(position, forward(), Vec3{0.0f, 1.0f, 0.0f});
}

void Projection::resize(std::uint32_t width, std::uint32_t height) {
    if (width == 0 || height == 0) {
        return;
    }
    aspect = static_cast<float>(width) / static_cast<float>(height);
}

Mat4 Projection::matrix() const {
    return perspectiveVulkanReverseZ(fovYRadians, aspect, nearPlane, farPlane);
}

CameraController::CameraController(float speed, float sensitivity)
    : m_speed(speed), m_sensitivity(sensitivity) {}

void CameraController::setMove(CameraMove move, bool active) {
    const float amount = active ? 1.0f : 0.0f;
    switch (move) {
    case CameraMove::Forward:
        m_forward = amount;
        break;
    case CameraMove::Backward:
        m_backward = amount;
        break;
    case CameraMove::Left:
        m_left = amount;
        break;
    case CameraMove::Right:
        m_right = amount;
        break;
    case CameraMove::Up:
        m_up = amount;
        break;
    case CameraMove::Down:
        m_down = amount;
        break;
    }
}

void CameraController::addMouseDelta(float dx, float dy) {
    m_rotateHorizontal += dx;
    m_rotateVertical += dy;
}

void CameraController::addScroll(float lines) {
    m_scroll += lines * kScrollPixelsPerLine;
}

void CameraController::update(Camera& camera, float dtSeconds) {
    const float yawSin = std::sin(camera.yawRadians);
    const float yawCos = std::cos(camera.yawRadians);
    const Vec3 planarForward = normalize(Vec3{yawCos, 0.0f, yawSin});
    const Vec3 planarRight = normalize(Vec3{-yawSin, 0.0f, yawCos});
    camera.position += planarForward * ((m_forward - m_backward) * m_speed * dtSeconds);
    camera.position += planarRight * ((m_right - m_left) * m_speed * dtSeconds);

    // Scrolling dollies along the full look direction, pitch included.
    camera.position += camera.forward() * (m_scroll * m_speed * m_sensitivity * dtSeconds);
    m_scroll = 0.0f;

    camera.position.y += (m_up - m_down) * m_speed * dtSeconds;

    camera.yawRadians += m_rotateHorizontal * m_sensitivity * dtSeconds;
    camera.pitchRadians -= m_rotateVertical * m_sensitivity * dtSeconds;
    m_rotateHorizontal = 0.0f;
    m_rotateVertical = 0.0f;

    camera.pitchRadians = std::clamp(camera.pitchRadians, -kSafeHalfPi, kSafeHalfPi);
}

} // namespace skygrid::core
