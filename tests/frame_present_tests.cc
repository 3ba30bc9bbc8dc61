#include <gtest/gtest.h>

#include <GLFW/glfw3.h>

#include <cstdint>
#include <vector>

#include "render/gpu_context.h"
#include "render/renderer.h"

namespace {

// Hidden window plus a full renderer. Skips without a display or a Vulkan adapter.
class FramePresentTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (glfwInit() != GLFW_TRUE) {
            GTEST_SKIP() << "GLFW could not initialize (no display)";
        }
        m_glfwInitialized = true;
        if (glfwVulkanSupported() != GLFW_TRUE) {
            GTEST_SKIP() << "GLFW reports no Vulkan loader";
        }

        {
            skygrid::render::GpuContext headless;
            if (headless.init(nullptr, skygrid::render::GpuContextConfig{}) != skygrid::render::DeviceInitError::None) {
                GTEST_SKIP() << "no usable Vulkan adapter";
            }
        }

        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
        glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
        m_window = glfwCreateWindow(320, 240, "skygrid_tests", nullptr, nullptr);
        if (m_window == nullptr) {
            GTEST_SKIP() << "hidden window creation failed";
        }

        skygrid::render::RendererConfig config{};
        config.shaderDir = SKYGRID_SHADER_DIR;
        config.environment.sourceHeight = 64;
        config.environment.faceSize = 32;
        config.materialTextureSize = 16;
        ASSERT_TRUE(m_renderer.init(m_window, config));
    }

    void TearDown() override {
        m_renderer.shutdown();
        if (m_window != nullptr) {
            glfwDestroyWindow(m_window);
        }
        if (m_glfwInitialized) {
            glfwTerminate();
        }
    }

    GLFWwindow* m_window = nullptr;
    bool m_glfwInitialized = false;
    skygrid::render::Renderer m_renderer;
};

// Hidden window with only a GPU context, for swapchain lifecycle checks.
class SurfaceReconfigureTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (glfwInit() != GLFW_TRUE) {
            GTEST_SKIP() << "GLFW could not initialize (no display)";
        }
        m_glfwInitialized = true;
        if (glfwVulkanSupported() != GLFW_TRUE) {
            GTEST_SKIP() << "GLFW reports no Vulkan loader";
        }

        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
        glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
        m_window = glfwCreateWindow(320, 240, "skygrid_tests", nullptr, nullptr);
        if (m_window == nullptr) {
            GTEST_SKIP() << "hidden window creation failed";
        }
        if (m_context.init(m_window, skygrid::render::GpuContextConfig{}) != skygrid::render::DeviceInitError::None) {
            GTEST_SKIP() << "no usable Vulkan adapter with present support";
        }
        ASSERT_TRUE(m_context.hasSwapchain());
    }

    void TearDown() override {
        m_context.shutdown();
        if (m_window != nullptr) {
            glfwDestroyWindow(m_window);
        }
        if (m_glfwInitialized) {
            glfwTerminate();
        }
    }

    GLFWwindow* m_window = nullptr;
    bool m_glfwInitialized = false;
    skygrid::render::GpuContext m_context;
};

TEST_F(SurfaceReconfigureTest, InvalidSizesLeaveSwapchainUntouched) {
    const VkSwapchainKHR before = m_context.swapchain();
    const VkExtent2D extentBefore = m_context.swapchainExtent();

    EXPECT_EQ(m_context.reconfigure(0, 0), skygrid::render::SurfaceError::UnsupportedConfig);
    EXPECT_EQ(m_context.reconfigure(-1, 5), skygrid::render::SurfaceError::UnsupportedConfig);
    EXPECT_EQ(m_context.reconfigure(5, -1), skygrid::render::SurfaceError::UnsupportedConfig);

    EXPECT_EQ(m_context.swapchain(), before);
    EXPECT_EQ(m_context.swapchainExtent().width, extentBefore.width);
    EXPECT_EQ(m_context.swapchainExtent().height, extentBefore.height);
}

TEST_F(SurfaceReconfigureTest, SameSizeReconfigureKeepsSwapchain) {
    const VkExtent2D requested = m_context.requestedExtent();
    ASSERT_GT(requested.width, 0u);
    ASSERT_GT(requested.height, 0u);
    const int width = static_cast<int>(requested.width);
    const int height = static_cast<int>(requested.height);

    const VkSwapchainKHR before = m_context.swapchain();
    ASSERT_EQ(m_context.reconfigure(width, height), skygrid::render::SurfaceError::None);
    ASSERT_EQ(m_context.reconfigure(width, height), skygrid::render::SurfaceError::None);
    EXPECT_EQ(m_context.swapchain(), before);
}

TEST_F(SurfaceReconfigureTest, SwapchainColorSpaceComesFromSurfaceFormat) {
    std::uint32_t formatCount = 0;
    ASSERT_EQ(
        vkGetPhysicalDeviceSurfaceFormatsKHR(m_context.physicalDevice(), m_context.surface(), &formatCount, nullptr),
        VK_SUCCESS);
    std::vector<VkSurfaceFormatKHR> formats(formatCount);
    ASSERT_EQ(
        vkGetPhysicalDeviceSurfaceFormatsKHR(
            m_context.physicalDevice(), m_context.surface(), &formatCount, formats.data()),
        VK_SUCCESS);

    bool offered = false;
    for (const VkSurfaceFormatKHR& format : formats) {
        if (format.format == m_context.swapchainFormat() && format.colorSpace == m_context.swapchainColorSpace()) {
            offered = true;
        }
    }
    EXPECT_TRUE(offered);
}

TEST_F(SurfaceReconfigureTest, AbandonedTargetCanBeAcquiredAgain) {
    skygrid::render::SwapchainTarget target{};
    const skygrid::render::SurfaceError first = m_context.acquireFrame(0, &target);
    if (first == skygrid::render::SurfaceError::Timeout) {
        GTEST_SKIP() << "hidden window never offered an image";
    }
    ASSERT_EQ(first, skygrid::render::SurfaceError::None);
    ASSERT_TRUE(m_context.abandonTarget(0));
    EXPECT_TRUE(m_context.swapchainDirty());

    ASSERT_EQ(m_context.reconfigureToWindow(), skygrid::render::SurfaceError::None);
    EXPECT_FALSE(m_context.swapchainDirty());
    ASSERT_EQ(m_context.acquireFrame(0, &target), skygrid::render::SurfaceError::None);
    EXPECT_TRUE(m_context.abandonTarget(0));
}

TEST_F(FramePresentTest, EmptyPassGraphFrameDoesNotError) {
    m_renderer.toggleOverlay();
    skygrid::render::PassToggles toggles{};
    toggles.lightMarker = false;
    toggles.objects = false;
    toggles.skybox = false;
    m_renderer.setPassToggles(toggles);

    const skygrid::core::Camera camera{};
    const skygrid::render::FrameResult result = m_renderer.renderFrame(camera, 0.016f, 0.016);
    EXPECT_NE(result, skygrid::render::FrameResult::Fatal);
    EXPECT_EQ(m_renderer.presentedFrames() + m_renderer.skippedFrames(), 1u);
}

TEST_F(FramePresentTest, FullSceneFramesKeepPresenting) {
    const skygrid::core::Camera camera{};
    double elapsed = 0.0;
    for (int frame = 0; frame < 4; ++frame) {
        elapsed += 0.016;
        glfwPollEvents();
        const skygrid::render::FrameResult result = m_renderer.renderFrame(camera, 0.016f, elapsed);
        ASSERT_NE(result, skygrid::render::FrameResult::Fatal) << "frame " << frame;
    }
    EXPECT_EQ(m_renderer.presentedFrames() + m_renderer.skippedFrames(), 4u);
}

}  // namespace
