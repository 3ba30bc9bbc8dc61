#pragma once

#include "render/render_status.h"

#include <vulkan/vulkan.h>
#include <vk_mem_alloc.h>

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct GLFWwindow;

namespace skygrid::render {

constexpr std::uint32_t kFramesInFlight = 2;

struct GpuContextConfig {
    const char* applicationName = "skygrid";
    bool enableValidation = false;
    bool vsync = true;
    // Deadline for vkAcquireNextImageKHR before the frame reports Timeout.
    std::uint64_t acquireTimeoutNs = 1'000'000'000ull;
};

// One acquired swapchain image, valid until it is presented or the swapchain is rebuilt.
struct SwapchainTarget {
    std::uint32_t imageIndex = 0;
    VkImage image = VK_NULL_HANDLE;
    VkImageView view = VK_NULL_HANDLE;
    VkFormat format = VK_FORMAT_UNDEFINED;
    VkExtent2D extent{};
    VkSemaphore imageAvailable = VK_NULL_HANDLE;
    VkSemaphore renderComplete = VK_NULL_HANDLE;
};

// Rejects sizes no swapchain can take. Zero and negative sizes come from minimized windows.
[[nodiscard]] SurfaceError validateSurfaceExtent(int width, int height);

// Same check against what the surface reports it can present.
[[nodiscard]] SurfaceError validateSurfaceExtent(int width, int height, const VkSurfaceCapabilitiesKHR& capabilities);

// Owns the instance, device, queue, VMA allocator, surface and swapchain.
// Created once by the renderer and passed by reference to every component that records GPU work.
// A null window gives a headless context (no surface) usable for compute and transfer work.
class GpuContext {
public:
    GpuContext() = default;
    ~GpuContext();

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    [[nodiscard]] DeviceInitError init(GLFWwindow* window, const GpuContextConfig& config);
    void shutdown();

    // Rebuilds the swapchain for the given drawable size. Idempotent for an unchanged size.
    [[nodiscard]] SurfaceError reconfigure(int width, int height);
    // Reconfigures to the window's current framebuffer size.
    [[nodiscard]] SurfaceError reconfigureToWindow();

    [[nodiscard]] SurfaceError acquireFrame(std::uint32_t frameSlot, SwapchainTarget* outTarget);
    [[nodiscard]] SurfaceError present(const SwapchainTarget& target);

    // Drops an acquired image that will never be presented. The slot's acquire semaphore is
    // waited on by an empty submit and the swapchain is rebuilt on the next reconfigure.
    bool abandonTarget(std::uint32_t frameSlot);

    // Records and submits a one-shot command buffer, then blocks until the GPU finished it.
    [[nodiscard]] bool submitImmediate(const std::function<void(VkCommandBuffer)>& record);

    void waitIdle();

    [[nodiscard]] bool isInitialized() const { return m_device != VK_NULL_HANDLE; }
    [[nodiscard]] bool hasSurface() const { return m_surface != VK_NULL_HANDLE; }
    [[nodiscard]] bool hasSwapchain() const { return m_swapchain != VK_NULL_HANDLE; }
    [[nodiscard]] bool swapchainDirty() const { return m_swapchainDirty; }
    [[nodiscard]] GLFWwindow* window() const { return m_window; }

    [[nodiscard]] VkInstance instance() const { return m_instance; }
    [[nodiscard]] VkPhysicalDevice physicalDevice() const { return m_physicalDevice; }
    [[nodiscard]] VkDevice device() const { return m_device; }
    [[nodiscard]] VmaAllocator allocator() const { return m_allocator; }
    [[nodiscard]] VkQueue queue() const { return m_queue; }
    [[nodiscard]] std::uint32_t queueFamilyIndex() const { return m_queueFamilyIndex; }
    [[nodiscard]] VkFormat swapchainFormat() const { return m_swapchainFormat; }
    [[nodiscard]] VkExtent2D swapchainExtent() const { return m_swapchainExtent; }
    // Drawable size passed to the last successful reconfigure. May differ from swapchainExtent().
    [[nodiscard]] VkExtent2D requestedExtent() const { return m_requestedExtent; }
    [[nodiscard]] VkSurfaceKHR surface() const { return m_surface; }
    [[nodiscard]] VkSwapchainKHR swapchain() const { return m_swapchain; }
    [[nodiscard]] VkColorSpaceKHR swapchainColorSpace() const { return m_swapchainColorSpace; }
    [[nodiscard]] std::uint32_t swapchainImageCount() const { return static_cast<std::uint32_t>(m_swapchainImages.size()); }
    [[nodiscard]] VkFormat depthFormat() const { return m_depthFormat; }
    [[nodiscard]] const std::string& deviceName() const { return m_deviceName; }

private:
    bool createInstance();
    bool createSurface();
    bool pickPhysicalDevice();
    bool createDevice();
    bool createAllocator();
    bool createFrameSemaphores();
    bool createImmediateResources();
    bool createSwapchain(VkExtent2D extent);
    void destroySwapchain();
    bool recreateSurface();

    GLFWwindow* m_window = nullptr;
    GpuContextConfig m_config{};

    VkInstance m_instance = VK_NULL_HANDLE;
    bool m_debugUtilsEnabled = false;
    VkSurfaceKHR m_surface = VK_NULL_HANDLE;
    VkPhysicalDevice m_physicalDevice = VK_NULL_HANDLE;
    std::string m_deviceName;
    VkDevice m_device = VK_NULL_HANDLE;
    VmaAllocator m_allocator = VK_NULL_HANDLE;
    std::uint32_t m_queueFamilyIndex = 0;
    VkQueue m_queue = VK_NULL_HANDLE;
    VkFormat m_depthFormat = VK_FORMAT_UNDEFINED;

    VkSwapchainKHR m_swapchain = VK_NULL_HANDLE;
    VkFormat m_swapchainFormat = VK_FORMAT_UNDEFINED;
    VkColorSpaceKHR m_swapchainColorSpace = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
    VkExtent2D m_swapchainExtent{};
    VkExtent2D m_requestedExtent{};
    std::vector<VkImage> m_swapchainImages;
    std::vector<VkImageView> m_swapchainImageViews;
    std::vector<VkSemaphore> m_renderCompleteSemaphores;
    bool m_swapchainDirty = false;
    bool m_surfaceLost = false;

    std::array<VkSemaphore, kFramesInFlight> m_imageAvailableSemaphores{};

    VkCommandPool m_immediatePool = VK_NULL_HANDLE;
    VkFence m_immediateFence = VK_NULL_HANDLE;
};

} // namespace skygrid::render
