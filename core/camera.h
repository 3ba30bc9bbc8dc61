#pragma once

#include "core/math.h"

#include <cstdint>

namespace skygrid::core {

// Keeps pitch just short of straight up/down so the look direction never aligns with world up.
constexpr float kSafeHalfPi = (kPi * 0.5f) - 0.0001f;

struct Camera {
    Vec3 position{0.0f, 5.0f, 10.0f};
    float yawRadians = -kPi * 0.5f;
    float pitchRadians = -0.35f;

    [[nodiscard]] Vec3 forward() const;
    [[nodiscard]] Vec3 right() const;
    [[nodiscard]] Mat4 viewMatrix() const;
};

struct Projection {
    float aspect = 16.0f / 9.0f;
    float fovYRadians = radians(45.0f);
    float nearPlane = 0.1f;
    float farPlane = 100.0f;

    void resize(std::uint32_t width, std::uint32_t height);
    [[nodiscard]] Mat4 matrix() const;
};

enum class CameraMove : std::uint8_t {
    Forward,
    Backward,
    Left,
    Right,
    Up,
    Down
};

// Fly-through controller. Input is latched between updates; update() consumes mouse and scroll deltas.
class CameraController {
public:
    CameraController(float speed, float sensitivity);

    void setMove(CameraMove move, bool active);
    void addMouseDelta(float dx, float dy);
    void addScroll(float lines);
    void update(Camera& camera, float dtSeconds);

    [[nodiscard]] float speed() const { return m_speed; }
    [[nodiscard]] float sensitivity() const { return m_sensitivity; }

private:
    float m_speed = 4.0f;
    float m_sensitivity = 0.4f;
    float m_forward = 0.0f;
    float m_backward = 0.0f;
    float m_left = 0.0f;
    float m_right = 0.0f;
    float m_up = 0.0f;
    float m_down = 0.0f;
    float m_rotateHorizontal = 0.0f;
    float m_rotateVertical = 0.0f;
    float m_scroll = 0.0f;
};

} // namespace skygrid::core
