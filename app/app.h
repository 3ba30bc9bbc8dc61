#pragma once

#include "core/camera.h"
#include "core/frame_clock.h"
#include "render/renderer.h"

struct GLFWwindow;

namespace skygrid::app {

class App {
public:
    App();

    bool init(const render::RendererConfig& config);
    // Returns the process exit code: 0 after a normal close, 1 after a fatal frame.
    int run();
    void shutdown();

private:
    static void scrollCallback(GLFWwindow* window, double xOffset, double yOffset);

    void pollInput();

    GLFWwindow* m_window = nullptr;
    bool m_glfwInitialized = false;
    render::Renderer m_renderer;
    core::Camera m_camera{};
    core::CameraController m_controller;
    core::FrameClock m_clock;

    bool m_tabWasDown = false;
    bool m_rotating = false;
    double m_lastCursorX = 0.0;
    double m_lastCursorY = 0.0;
};

} // namespace skygrid::app
