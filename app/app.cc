#include "app/app.h"

#include "core/log.h"

#include <GLFW/glfw3.h>
#include <imgui.h>

namespace skygrid::app {
namespace {

bool uiWantsMouse() {
    return ImGui::GetCurrentContext() != nullptr && ImGui::GetIO().WantCaptureMouse;
}

bool uiWantsKeyboard() {
    return ImGui::GetCurrentContext() != nullptr && ImGui::GetIO().WantCaptureKeyboard;
}

} // namespace

App::App()
    : m_controller(4.0f, 0.4f) {}

bool App::init(const render::RendererConfig& config) {
    if (!glfwInit()) {
        SKYGRID_LOGE("app") << "failed to initialize GLFW";
        return false;
    }
    m_glfwInitialized = true;

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    m_window = glfwCreateWindow(config.windowWidth, config.windowHeight, config.windowTitle.c_str(), nullptr, nullptr);
    if (m_window == nullptr) {
        SKYGRID_LOGE("app") << "failed to create window";
        return false;
    }

    glfwSetInputMode(m_window, GLFW_CURSOR, GLFW_CURSOR_NORMAL);
    // Installed before the overlay so its GLFW backend chains to it.
    glfwSetWindowUserPointer(m_window, this);
    glfwSetScrollCallback(m_window, &App::scrollCallback);

    m_camera.position = config.camera.position;
    m_camera.yawRadians = core::radians(config.camera.yawDegrees);
    m_camera.pitchRadians = core::radians(config.camera.pitchDegrees);
    m_controller = core::CameraController(config.camera.speed, config.camera.sensitivity);

    if (!m_renderer.init(m_window, config)) {
        SKYGRID_LOGE("app") << "renderer init failed";
        return false;
    }

    SKYGRID_LOGI("app") << "controls: WASD/arrows move, Space/LeftShift up/down, right mouse drag looks, "
                        << "scroll dollies, Tab toggles overlay, Esc quits";
    m_clock.reset();
    return true;
}

void App::scrollCallback(GLFWwindow* window, double /*xOffset*/, double yOffset) {
    App* app = static_cast<App*>(glfwGetWindowUserPointer(window));
    if (app == nullptr || uiWantsMouse()) {
        return;
    }
    app->m_controller.addScroll(static_cast<float>(yOffset));
}

void App::pollInput() {
    if (glfwGetKey(m_window, GLFW_KEY_ESCAPE) == GLFW_PRESS) {
        glfwSetWindowShouldClose(m_window, GLFW_TRUE);
    }

    const bool tabDown = glfwGetKey(m_window, GLFW_KEY_TAB) == GLFW_PRESS;
    if (tabDown && !m_tabWasDown) {
        m_renderer.toggleOverlay();
    }
    m_tabWasDown = tabDown;

    const bool keyboardFree = !uiWantsKeyboard();
    const auto held = [this, keyboardFree](int key) {
        return keyboardFree && glfwGetKey(m_window, key) == GLFW_PRESS;
    };
    m_controller.setMove(core::CameraMove::Forward, held(GLFW_KEY_W) || held(GLFW_KEY_UP));
    m_controller.setMove(core::CameraMove::Backward, held(GLFW_KEY_S) || held(GLFW_KEY_DOWN));
    m_controller.setMove(core::CameraMove::Left, held(GLFW_KEY_A) || held(GLFW_KEY_LEFT));
    m_controller.setMove(core::CameraMove::Right, held(GLFW_KEY_D) || held(GLFW_KEY_RIGHT));
    m_controller.setMove(core::CameraMove::Up, held(GLFW_KEY_SPACE));
    m_controller.setMove(core::CameraMove::Down, held(GLFW_KEY_LEFT_SHIFT));

    double cursorX = 0.0;
    double cursorY = 0.0;
    glfwGetCursorPos(m_window, &cursorX, &cursorY);
    const bool rightDown = glfwGetMouseButton(m_window, GLFW_MOUSE_BUTTON_RIGHT) == GLFW_PRESS;
    if (rightDown && m_rotating) {
        m_controller.addMouseDelta(
            static_cast<float>(cursorX - m_lastCursorX),
            static_cast<float>(cursorY - m_lastCursorY));
    }
    m_rotating = rightDown && !uiWantsMouse();
    m_lastCursorX = cursorX;
    m_lastCursorY = cursorY;
}

int App::run() {
    while (!glfwWindowShouldClose(m_window)) {
        glfwPollEvents();
        pollInput();

        const core::TimeStep step = m_clock.tick();
        m_controller.update(m_camera, step.deltaSeconds);

        const render::FrameResult result = m_renderer.renderFrame(m_camera, step.deltaSeconds, step.elapsedSeconds);
        if (result == render::FrameResult::Fatal) {
            SKYGRID_LOGE("app") << "render frame failed";
            return 1;
        }
    }
    SKYGRID_LOGI("app") << "presented " << m_renderer.presentedFrames() << " frames, skipped "
                        << m_renderer.skippedFrames();
    return 0;
}

void App::shutdown() {
    m_renderer.shutdown();
    if (m_window != nullptr) {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_glfwInitialized) {
        glfwTerminate();
        m_glfwInitialized = false;
    }
}

} // namespace skygrid::app
