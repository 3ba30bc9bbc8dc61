#pragma once

#include "core/camera.h"
#include "render/frame_uniforms.h"
#include "render/render_pass_graph.h"
#include "render/render_status.h"

#include <cstdint>
#include <string>

struct GLFWwindow;

namespace skygrid::render {

struct EnvironmentConfig {
    // Rows of the equirect source; it is twice as wide.
    std::uint32_t sourceHeight = 512;
    std::uint32_t faceSize = 512;
    core::Vec3 sunDirection{0.4f, 0.35f, -0.85f};
};

struct CameraConfig {
    core::Vec3 position{0.0f, 5.0f, 10.0f};
    float yawDegrees = -90.0f;
    float pitchDegrees = -20.0f;
    float fovYDegrees = 45.0f;
    float nearPlane = 0.1f;
    float farPlane = 100.0f;
    float speed = 4.0f;
    float sensitivity = 0.4f;
};

struct RendererConfig {
    std::string windowTitle = "skygrid";
    int windowWidth = 1280;
    int windowHeight = 720;
    std::string shaderDir;
    bool vsync = true;
    bool enableValidation = false;
    std::uint64_t acquireTimeoutNs = 1'000'000'000ull;
    std::uint32_t materialTextureSize = 256;
    InstanceGridConfig grid{};
    LightOrbitConfig light{};
    EnvironmentConfig environment{};
    CameraConfig camera{};
};

// Owns the GPU context and every component built on it, in dependency order.
class Renderer {
public:
    Renderer() = default;
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    bool init(GLFWwindow* window, const RendererConfig& config);
    [[nodiscard]] FrameResult renderFrame(const core::Camera& camera, float deltaSeconds, double elapsedSeconds);
    void shutdown();

    void toggleOverlay();
    [[nodiscard]] PassToggles passToggles() const;
    void setPassToggles(const PassToggles& toggles);

    [[nodiscard]] std::uint64_t presentedFrames() const;
    [[nodiscard]] std::uint64_t skippedFrames() const;

private:
    struct Impl;
    Impl* m_impl = nullptr;
};

} // namespace skygrid::render
