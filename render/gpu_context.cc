#include "render/gpu_context.h"

#include "core/log.h"
#include "render/vk_utils.h"

#include <GLFW/glfw3.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <limits>

namespace skygrid::render {
namespace {

constexpr const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";

bool isLayerAvailable(const char* layerName) {
    std::uint32_t count = 0;
    vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::vector<VkLayerProperties> layers(count);
    vkEnumerateInstanceLayerProperties(&count, layers.data());
    return std::any_of(layers.begin(), layers.end(), [layerName](const VkLayerProperties& layer) {
        return std::strcmp(layer.layerName, layerName) == 0;
    });
}

bool isInstanceExtensionAvailable(const char* extensionName) {
    std::uint32_t count = 0;
    vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> extensions(count);
    vkEnumerateInstanceExtensionProperties(nullptr, &count, extensions.data());
    return std::any_of(extensions.begin(), extensions.end(), [extensionName](const VkExtensionProperties& extension) {
        return std::strcmp(extension.extensionName, extensionName) == 0;
    });
}

bool isDeviceExtensionAvailable(VkPhysicalDevice physicalDevice, const char* extensionName) {
    std::uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(physicalDevice, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> extensions(count);
    vkEnumerateDeviceExtensionProperties(physicalDevice, nullptr, &count, extensions.data());
    return std::any_of(extensions.begin(), extensions.end(), [extensionName](const VkExtensionProperties& extension) {
        return std::strcmp(extension.extensionName, extensionName) == 0;
    });
}

bool supportsRequiredFeatures(VkPhysicalDevice physicalDevice) {
    VkPhysicalDeviceVulkan13Features vulkan13Features{};
    vulkan13Features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    VkPhysicalDeviceVulkan12Features vulkan12Features{};
    vulkan12Features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
    vulkan12Features.pNext = &vulkan13Features;
    VkPhysicalDeviceFeatures2 features{};
    features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    features.pNext = &vulkan12Features;
    vkGetPhysicalDeviceFeatures2(physicalDevice, &features);
    return vulkan13Features.dynamicRendering == VK_TRUE
        && vulkan13Features.synchronization2 == VK_TRUE
        && vulkan12Features.timelineSemaphore == VK_TRUE;
}

VkSurfaceFormatKHR chooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats) {
    for (const VkSurfaceFormatKHR& format : formats) {
        if ((format.format == VK_FORMAT_B8G8R8A8_SRGB || format.format == VK_FORMAT_R8G8B8A8_SRGB)
            && format.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
            return format;
        }
    }
    return formats.front();
}

VkPresentModeKHR choosePresentMode(const std::vector<VkPresentModeKHR>& modes, bool vsync) {
    if (vsync) {
        return VK_PRESENT_MODE_FIFO_KHR;
    }
    for (const VkPresentModeKHR preferred : {VK_PRESENT_MODE_MAILBOX_KHR, VK_PRESENT_MODE_IMMEDIATE_KHR}) {
        if (std::find(modes.begin(), modes.end(), preferred) != modes.end()) {
            return preferred;
        }
    }
    return VK_PRESENT_MODE_FIFO_KHR;
}

} // namespace

SurfaceError validateSurfaceExtent(int width, int height) {
    if (width <= 0 || height <= 0) {
        return SurfaceError::UnsupportedConfig;
    }
    return SurfaceError::None;
}

SurfaceError validateSurfaceExtent(int width, int height, const VkSurfaceCapabilitiesKHR& capabilities) {
    const SurfaceError sizeCheck = validateSurfaceExtent(width, height);
    if (sizeCheck != SurfaceError::None) {
        return sizeCheck;
    }
    if (capabilities.maxImageExtent.width == 0 || capabilities.maxImageExtent.height == 0) {
        return SurfaceError::UnsupportedConfig;
    }
    const auto w = static_cast<std::uint32_t>(width);
    const auto h = static_cast<std::uint32_t>(height);
    if (w < capabilities.minImageExtent.width || w > capabilities.maxImageExtent.width
        || h < capabilities.minImageExtent.height || h > capabilities.maxImageExtent.height) {
        return SurfaceError::UnsupportedConfig;
    }
    return SurfaceError::None;
}

GpuContext::~GpuContext() {
    shutdown();
}

DeviceInitError GpuContext::init(GLFWwindow* window, const GpuContextConfig& config) {
    if (m_device != VK_NULL_HANDLE) {
        return DeviceInitError::None;
    }

    using Clock = std::chrono::steady_clock;
    auto runStep = [](const char* stepName, auto&& stepFn) -> bool {
        const auto stepStart = Clock::now();
        const bool ok = stepFn();
        const auto tookMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - stepStart).count();
        SKYGRID_LOGI("render") << "init step " << stepName << " took " << tookMs << " ms";
        return ok;
    };
    auto fail = [this](const char* stepName, DeviceInitError error) {
        SKYGRID_LOGE("render") << "gpu context init failed at " << stepName << ": " << toString(error);
        shutdown();
        return error;
    };

    m_window = window;
    m_config = config;

    if (!runStep("createInstance", [&] { return createInstance(); })) {
        return fail("createInstance", DeviceInitError::AdapterNotFound);
    }
    if (m_window != nullptr && !runStep("createSurface", [&] { return createSurface(); })) {
        return fail("createSurface", DeviceInitError::DeviceCreationFailed);
    }
    if (!runStep("pickPhysicalDevice", [&] { return pickPhysicalDevice(); })) {
        return fail("pickPhysicalDevice", DeviceInitError::AdapterNotFound);
    }
    if (!runStep("createDevice", [&] { return createDevice(); })) {
        return fail("createDevice", DeviceInitError::DeviceCreationFailed);
    }
    if (!runStep("createAllocator", [&] { return createAllocator(); })) {
        return fail("createAllocator", DeviceInitError::DeviceCreationFailed);
    }
    if (!runStep("createFrameSemaphores", [&] { return createFrameSemaphores(); })) {
        return fail("createFrameSemaphores", DeviceInitError::DeviceCreationFailed);
    }
    if (!runStep("createImmediateResources", [&] { return createImmediateResources(); })) {
        return fail("createImmediateResources", DeviceInitError::DeviceCreationFailed);
    }

    if (m_surface != VK_NULL_HANDLE) {
        std::uint32_t formatCount = 0;
        vkGetPhysicalDeviceSurfaceFormatsKHR(m_physicalDevice, m_surface, &formatCount, nullptr);
        std::vector<VkSurfaceFormatKHR> formats(formatCount);
        vkGetPhysicalDeviceSurfaceFormatsKHR(m_physicalDevice, m_surface, &formatCount, formats.data());
        if (formats.empty()) {
            return fail("querySurfaceFormats", DeviceInitError::DeviceCreationFailed);
        }
        const VkSurfaceFormatKHR surfaceFormat = chooseSurfaceFormat(formats);
        m_swapchainFormat = surfaceFormat.format;
        m_swapchainColorSpace = surfaceFormat.colorSpace;

        // A window that starts minimized gets its swapchain on the first frame with a real size.
        const SurfaceError configured = reconfigureToWindow();
        if (configured == SurfaceError::UnsupportedConfig) {
            SKYGRID_LOGW("render") << "initial surface size unsupported; swapchain deferred";
        } else if (configured != SurfaceError::None) {
            return fail("createSwapchain", DeviceInitError::DeviceCreationFailed);
        }
    }

    return DeviceInitError::None;
}

bool GpuContext::createInstance() {
    std::vector<const char*> extensions;
    if (m_window != nullptr) {
        std::uint32_t glfwExtensionCount = 0;
        const char** glfwExtensions = glfwGetRequiredInstanceExtensions(&glfwExtensionCount);
        if (glfwExtensions == nullptr || glfwExtensionCount == 0) {
            SKYGRID_LOGE("render") << "GLFW did not return required Vulkan instance extensions";
            return false;
        }
        extensions.assign(glfwExtensions, glfwExtensions + glfwExtensionCount);
    }

    m_debugUtilsEnabled = isInstanceExtensionAvailable(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    if (m_debugUtilsEnabled) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }
    const bool enableValidation = m_config.enableValidation && isLayerAvailable(kValidationLayer);
    if (m_config.enableValidation && !enableValidation) {
        SKYGRID_LOGW("render") << "validation requested but " << kValidationLayer << " is not installed";
    }

    VkApplicationInfo appInfo{};
    appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName = m_config.applicationName;
    appInfo.applicationVersion = VK_MAKE_API_VERSION(0, 0, 1, 0);
    appInfo.pEngineName = "skygrid";
    appInfo.engineVersion = VK_MAKE_API_VERSION(0, 0, 1, 0);
    appInfo.apiVersion = VK_API_VERSION_1_3;

    VkInstanceCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    createInfo.pApplicationInfo = &appInfo;
    createInfo.enabledExtensionCount = static_cast<std::uint32_t>(extensions.size());
    createInfo.ppEnabledExtensionNames = extensions.data();
    if (enableValidation) {
        createInfo.enabledLayerCount = 1;
        createInfo.ppEnabledLayerNames = &kValidationLayer;
    }

    const VkResult result = vkCreateInstance(&createInfo, nullptr, &m_instance);
    if (result != VK_SUCCESS) {
        logVkFailure("render", "vkCreateInstance", result);
        return false;
    }
    SKYGRID_LOGI("render") << "instance ready: validation=" << (enableValidation ? "on" : "off")
                           << ", debugUtils=" << (m_debugUtilsEnabled ? "on" : "off");
    return true;
}

bool GpuContext::createSurface() {
    const VkResult result = glfwCreateWindowSurface(m_instance, m_window, nullptr, &m_surface);
    if (result != VK_SUCCESS) {
        logVkFailure("render", "glfwCreateWindowSurface", result);
        return false;
    }
    return true;
}

bool GpuContext::pickPhysicalDevice() {
    std::uint32_t deviceCount = 0;
    vkEnumeratePhysicalDevices(m_instance, &deviceCount, nullptr);
    if (deviceCount == 0) {
        SKYGRID_LOGE("render") << "no Vulkan physical devices available";
        return false;
    }
    std::vector<VkPhysicalDevice> devices(deviceCount);
    vkEnumeratePhysicalDevices(m_instance, &deviceCount, devices.data());

    int bestScore = -1;
    for (VkPhysicalDevice candidate : devices) {
        VkPhysicalDeviceProperties properties{};
        vkGetPhysicalDeviceProperties(candidate, &properties);
        if (properties.apiVersion < VK_API_VERSION_1_3 || !supportsRequiredFeatures(candidate)) {
            SKYGRID_LOGD("render") << "skipping " << properties.deviceName << ": no Vulkan 1.3 dynamic rendering";
            continue;
        }
        if (m_surface != VK_NULL_HANDLE && !isDeviceExtensionAvailable(candidate, VK_KHR_SWAPCHAIN_EXTENSION_NAME)) {
            continue;
        }

        std::uint32_t familyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(candidate, &familyCount, nullptr);
        std::vector<VkQueueFamilyProperties> families(familyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(candidate, &familyCount, families.data());

        std::uint32_t chosenFamily = std::numeric_limits<std::uint32_t>::max();
        for (std::uint32_t family = 0; family < familyCount; ++family) {
            const VkQueueFlags required = VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT;
            if ((families[family].queueFlags & required) != required) {
                continue;
            }
            if (m_surface != VK_NULL_HANDLE) {
                VkBool32 supportsPresent = VK_FALSE;
                vkGetPhysicalDeviceSurfaceSupportKHR(candidate, family, m_surface, &supportsPresent);
                if (supportsPresent != VK_TRUE) {
                    continue;
                }
            }
            chosenFamily = family;
            break;
        }
        if (chosenFamily == std::numeric_limits<std::uint32_t>::max()) {
            continue;
        }

        int score = 0;
        if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) {
            score = 2;
        } else if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) {
            score = 1;
        }
        if (score > bestScore) {
            bestScore = score;
            m_physicalDevice = candidate;
            m_queueFamilyIndex = chosenFamily;
            m_deviceName = properties.deviceName;
        }
    }

    if (m_physicalDevice == VK_NULL_HANDLE) {
        SKYGRID_LOGE("render") << "no adapter with Vulkan 1.3, graphics+compute"
                               << (m_surface != VK_NULL_HANDLE ? "+present" : "") << " queue";
        return false;
    }

    // Depth-only formats: the passes transition and clear the depth aspect alone.
    for (const VkFormat candidate : {VK_FORMAT_D32_SFLOAT, VK_FORMAT_X8_D24_UNORM_PACK32, VK_FORMAT_D16_UNORM}) {
        VkFormatProperties formatProperties{};
        vkGetPhysicalDeviceFormatProperties(m_physicalDevice, candidate, &formatProperties);
        if ((formatProperties.optimalTilingFeatures & VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT) != 0) {
            m_depthFormat = candidate;
            break;
        }
    }
    if (m_depthFormat == VK_FORMAT_UNDEFINED) {
        SKYGRID_LOGE("render") << "no supported depth attachment format on " << m_deviceName;
        return false;
    }

    SKYGRID_LOGI("render") << "using GPU: " << m_deviceName << ", queue family " << m_queueFamilyIndex;
    return true;
}

bool GpuContext::createDevice() {
    const float queuePriority = 1.0f;
    VkDeviceQueueCreateInfo queueInfo{};
    queueInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    queueInfo.queueFamilyIndex = m_queueFamilyIndex;
    queueInfo.queueCount = 1;
    queueInfo.pQueuePriorities = &queuePriority;

    VkPhysicalDeviceVulkan13Features vulkan13Features{};
    vulkan13Features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    vulkan13Features.synchronization2 = VK_TRUE;
    vulkan13Features.dynamicRendering = VK_TRUE;

    VkPhysicalDeviceVulkan12Features vulkan12Features{};
    vulkan12Features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
    vulkan12Features.timelineSemaphore = VK_TRUE;
    vulkan12Features.pNext = &vulkan13Features;

    std::vector<const char*> extensions;
    if (m_surface != VK_NULL_HANDLE) {
        extensions.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
    }

    VkDeviceCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    createInfo.pNext = &vulkan12Features;
    createInfo.queueCreateInfoCount = 1;
    createInfo.pQueueCreateInfos = &queueInfo;
    createInfo.enabledExtensionCount = static_cast<std::uint32_t>(extensions.size());
    createInfo.ppEnabledExtensionNames = extensions.empty() ? nullptr : extensions.data();

    const VkResult result = vkCreateDevice(m_physicalDevice, &createInfo, nullptr, &m_device);
    if (result != VK_SUCCESS) {
        logVkFailure("render", "vkCreateDevice", result);
        return false;
    }
    vkGetDeviceQueue(m_device, m_queueFamilyIndex, 0, &m_queue);
    return true;
}

bool GpuContext::createAllocator() {
    VmaAllocatorCreateInfo allocatorInfo{};
    allocatorInfo.instance = m_instance;
    allocatorInfo.physicalDevice = m_physicalDevice;
    allocatorInfo.device = m_device;
    allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;

    const VkResult result = vmaCreateAllocator(&allocatorInfo, &m_allocator);
    if (result != VK_SUCCESS) {
        logVkFailure("render", "vmaCreateAllocator", result);
        return false;
    }
    return true;
}

bool GpuContext::createFrameSemaphores() {
    VkSemaphoreCreateInfo semaphoreInfo{};
    semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    for (std::uint32_t slot = 0; slot < kFramesInFlight; ++slot) {
        const VkResult result = vkCreateSemaphore(m_device, &semaphoreInfo, nullptr, &m_imageAvailableSemaphores[slot]);
        if (result != VK_SUCCESS) {
            logVkFailure("render", "vkCreateSemaphore(imageAvailable)", result);
            return false;
        }
    }
    return true;
}

bool GpuContext::createImmediateResources() {
    VkCommandPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolInfo.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
    poolInfo.queueFamilyIndex = m_queueFamilyIndex;
    VkResult result = vkCreateCommandPool(m_device, &poolInfo, nullptr, &m_immediatePool);
    if (result != VK_SUCCESS) {
        logVkFailure("render", "vkCreateCommandPool(immediate)", result);
        return false;
    }

    VkFenceCreateInfo fenceInfo{};
    fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    result = vkCreateFence(m_device, &fenceInfo, nullptr, &m_immediateFence);
    if (result != VK_SUCCESS) {
        logVkFailure("render", "vkCreateFence(immediate)", result);
        return false;
    }
    return true;
}

SurfaceError GpuContext::reconfigureToWindow() {
    if (m_window == nullptr) {
        return SurfaceError::UnsupportedConfig;
    }
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_window, &width, &height);
    return reconfigure(width, height);
}

SurfaceError GpuContext::reconfigure(int width, int height) {
    const SurfaceError sizeCheck = validateSurfaceExtent(width, height);
    if (sizeCheck != SurfaceError::None) {
        SKYGRID_LOGD("render") << "reconfigure rejected " << width << "x" << height;
        return sizeCheck;
    }
    if (m_device == VK_NULL_HANDLE || m_window == nullptr) {
        return SurfaceError::UnsupportedConfig;
    }
    if (m_surfaceLost && !recreateSurface()) {
        return SurfaceError::Lost;
    }

    // The surface may pick its own extent, so compare against what was asked for last time.
    const bool sameSize = m_requestedExtent.width == static_cast<std::uint32_t>(width)
        && m_requestedExtent.height == static_cast<std::uint32_t>(height);
    if (m_swapchain != VK_NULL_HANDLE && !m_swapchainDirty && sameSize) {
        return SurfaceError::None;
    }

    VkSurfaceCapabilitiesKHR capabilities{};
    const VkResult capsResult = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(m_physicalDevice, m_surface, &capabilities);
    if (capsResult == VK_ERROR_SURFACE_LOST_KHR) {
        m_surfaceLost = true;
        return SurfaceError::Lost;
    }
    if (capsResult != VK_SUCCESS) {
        logVkFailure("render", "vkGetPhysicalDeviceSurfaceCapabilitiesKHR", capsResult);
        return SurfaceError::Lost;
    }

    const SurfaceError capsCheck = validateSurfaceExtent(width, height, capabilities);
    if (capsCheck != SurfaceError::None) {
        SKYGRID_LOGW("render") << "surface cannot present " << width << "x" << height
                               << " (supported " << capabilities.minImageExtent.width << "x"
                               << capabilities.minImageExtent.height << " .. "
                               << capabilities.maxImageExtent.width << "x" << capabilities.maxImageExtent.height << ")";
        return capsCheck;
    }

    VkExtent2D extent{static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height)};
    if (capabilities.currentExtent.width != std::numeric_limits<std::uint32_t>::max()) {
        extent = capabilities.currentExtent;
    }

    waitIdle();
    destroySwapchain();
    if (!createSwapchain(extent)) {
        destroySwapchain();
        return SurfaceError::UnsupportedConfig;
    }
    m_requestedExtent = VkExtent2D{static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height)};
    m_swapchainDirty = false;
    SKYGRID_LOGI("render") << "swapchain " << m_swapchainExtent.width << "x" << m_swapchainExtent.height
                           << ", images=" << m_swapchainImages.size();
    return SurfaceError::None;
}

bool GpuContext::createSwapchain(VkExtent2D extent) {
    VkSurfaceCapabilitiesKHR capabilities{};
    vkGetPhysicalDeviceSurfaceCapabilitiesKHR(m_physicalDevice, m_surface, &capabilities);

    std::uint32_t presentModeCount = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(m_physicalDevice, m_surface, &presentModeCount, nullptr);
    std::vector<VkPresentModeKHR> presentModes(presentModeCount);
    vkGetPhysicalDeviceSurfacePresentModesKHR(m_physicalDevice, m_surface, &presentModeCount, presentModes.data());

    std::uint32_t imageCount = capabilities.minImageCount + 1;
    if (capabilities.maxImageCount > 0) {
        imageCount = std::min(imageCount, capabilities.maxImageCount);
    }

    VkSwapchainCreateInfoKHR createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    createInfo.surface = m_surface;
    createInfo.minImageCount = imageCount;
    createInfo.imageFormat = m_swapchainFormat;
    createInfo.imageColorSpace = m_swapchainColorSpace;
    createInfo.imageExtent = extent;
    createInfo.imageArrayLayers = 1;
    createInfo.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    createInfo.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    createInfo.preTransform = capabilities.currentTransform;
    createInfo.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    createInfo.presentMode = choosePresentMode(presentModes, m_config.vsync);
    createInfo.clipped = VK_TRUE;

    const VkResult result = vkCreateSwapchainKHR(m_device, &createInfo, nullptr, &m_swapchain);
    if (result != VK_SUCCESS) {
        logVkFailure("render", "vkCreateSwapchainKHR", result);
        return false;
    }

    std::uint32_t swapchainImageCount = 0;
    vkGetSwapchainImagesKHR(m_device, m_swapchain, &swapchainImageCount, nullptr);
    m_swapchainImages.resize(swapchainImageCount);
    vkGetSwapchainImagesKHR(m_device, m_swapchain, &swapchainImageCount, m_swapchainImages.data());
    m_swapchainExtent = extent;

    m_swapchainImageViews.assign(swapchainImageCount, VK_NULL_HANDLE);
    m_renderCompleteSemaphores.assign(swapchainImageCount, VK_NULL_HANDLE);
    VkSemaphoreCreateInfo semaphoreInfo{};
    semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    for (std::uint32_t i = 0; i < swapchainImageCount; ++i) {
        VkImageViewCreateInfo viewInfo{};
        viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewInfo.image = m_swapchainImages[i];
        viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
        viewInfo.format = m_swapchainFormat;
        viewInfo.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        viewInfo.subresourceRange.levelCount = 1;
        viewInfo.subresourceRange.layerCount = 1;
        VkResult viewResult = vkCreateImageView(m_device, &viewInfo, nullptr, &m_swapchainImageViews[i]);
        if (viewResult != VK_SUCCESS) {
            logVkFailure("render", "vkCreateImageView(swapchain)", viewResult);
            return false;
        }
        // One render-complete semaphore per image: present may still hold the previous one.
        viewResult = vkCreateSemaphore(m_device, &semaphoreInfo, nullptr, &m_renderCompleteSemaphores[i]);
        if (viewResult != VK_SUCCESS) {
            logVkFailure("render", "vkCreateSemaphore(renderComplete)", viewResult);
            return false;
        }
        setDebugObjectName(m_device, VK_OBJECT_TYPE_IMAGE, vkHandleToUint64(m_swapchainImages[i]),
            "swapchain.image." + std::to_string(i));
    }
    return true;
}

void GpuContext::destroySwapchain() {
    for (VkSemaphore semaphore : m_renderCompleteSemaphores) {
        if (semaphore != VK_NULL_HANDLE) {
            vkDestroySemaphore(m_device, semaphore, nullptr);
        }
    }
    m_renderCompleteSemaphores.clear();
    for (VkImageView view : m_swapchainImageViews) {
        if (view != VK_NULL_HANDLE) {
            vkDestroyImageView(m_device, view, nullptr);
        }
    }
    m_swapchainImageViews.clear();
    m_swapchainImages.clear();
    if (m_swapchain != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(m_device, m_swapchain, nullptr);
        m_swapchain = VK_NULL_HANDLE;
    }
    m_swapchainExtent = {};
    m_requestedExtent = {};
}

bool GpuContext::recreateSurface() {
    waitIdle();
    destroySwapchain();
    if (m_surface != VK_NULL_HANDLE) {
        vkDestroySurfaceKHR(m_instance, m_surface, nullptr);
        m_surface = VK_NULL_HANDLE;
    }
    if (!createSurface()) {
        return false;
    }
    VkBool32 supportsPresent = VK_FALSE;
    vkGetPhysicalDeviceSurfaceSupportKHR(m_physicalDevice, m_queueFamilyIndex, m_surface, &supportsPresent);
    if (supportsPresent != VK_TRUE) {
        SKYGRID_LOGE("render") << "recreated surface is not presentable from queue family " << m_queueFamilyIndex;
        return false;
    }
    m_surfaceLost = false;
    m_swapchainDirty = true;
    SKYGRID_LOGW("render") << "surface recreated after loss";
    return true;
}

SurfaceError GpuContext::acquireFrame(std::uint32_t frameSlot, SwapchainTarget* outTarget) {
    if (outTarget == nullptr || frameSlot >= kFramesInFlight) {
        return SurfaceError::UnsupportedConfig;
    }
    if (m_surfaceLost) {
        return SurfaceError::Lost;
    }
    if (m_swapchain == VK_NULL_HANDLE || m_swapchainDirty) {
        return SurfaceError::Outdated;
    }

    const VkSemaphore imageAvailable = m_imageAvailableSemaphores[frameSlot];
    std::uint32_t imageIndex = 0;
    const VkResult result = vkAcquireNextImageKHR(
        m_device,
        m_swapchain,
        m_config.acquireTimeoutNs,
        imageAvailable,
        VK_NULL_HANDLE,
        &imageIndex);

    switch (result) {
    case VK_SUCCESS:
        break;
    case VK_SUBOPTIMAL_KHR:
        // Still presentable; rebuild once this frame is out.
        m_swapchainDirty = true;
        break;
    case VK_ERROR_OUT_OF_DATE_KHR:
        m_swapchainDirty = true;
        return SurfaceError::Outdated;
    case VK_ERROR_SURFACE_LOST_KHR:
        m_surfaceLost = true;
        return SurfaceError::Lost;
    case VK_TIMEOUT:
    case VK_NOT_READY:
        return SurfaceError::Timeout;
    default:
        logVkFailure("render", "vkAcquireNextImageKHR", result);
        return SurfaceError::Lost;
    }

    outTarget->imageIndex = imageIndex;
    outTarget->image = m_swapchainImages[imageIndex];
    outTarget->view = m_swapchainImageViews[imageIndex];
    outTarget->format = m_swapchainFormat;
    outTarget->extent = m_swapchainExtent;
    outTarget->imageAvailable = imageAvailable;
    outTarget->renderComplete = m_renderCompleteSemaphores[imageIndex];
    return SurfaceError::None;
}

SurfaceError GpuContext::present(const SwapchainTarget& target) {
    VkPresentInfoKHR presentInfo{};
    presentInfo.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    presentInfo.waitSemaphoreCount = 1;
    presentInfo.pWaitSemaphores = &target.renderComplete;
    presentInfo.swapchainCount = 1;
    presentInfo.pSwapchains = &m_swapchain;
    presentInfo.pImageIndices = &target.imageIndex;

    const VkResult result = vkQueuePresentKHR(m_queue, &presentInfo);
    switch (result) {
    case VK_SUCCESS:
        return SurfaceError::None;
    case VK_SUBOPTIMAL_KHR:
        m_swapchainDirty = true;
        return SurfaceError::None;
    case VK_ERROR_OUT_OF_DATE_KHR:
        m_swapchainDirty = true;
        return SurfaceError::Outdated;
    case VK_ERROR_SURFACE_LOST_KHR:
        m_surfaceLost = true;
        return SurfaceError::Lost;
    default:
        logVkFailure("render", "vkQueuePresentKHR", result);
        return SurfaceError::Lost;
    }
}

bool GpuContext::abandonTarget(std::uint32_t frameSlot) {
    if (frameSlot >= kFramesInFlight || m_device == VK_NULL_HANDLE) {
        return false;
    }
    // Consume the acquire's pending signal with an empty batch so the semaphore is unsignaled again.
    VkSemaphoreSubmitInfo waitInfo{};
    waitInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    waitInfo.semaphore = m_imageAvailableSemaphores[frameSlot];
    waitInfo.stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
    VkSubmitInfo2 submitInfo{};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    submitInfo.waitSemaphoreInfoCount = 1;
    submitInfo.pWaitSemaphoreInfos = &waitInfo;
    const VkResult result = vkQueueSubmit2(m_queue, 1, &submitInfo, VK_NULL_HANDLE);
    if (result != VK_SUCCESS) {
        logVkFailure("render", "vkQueueSubmit2(abandon)", result);
        return false;
    }
    waitIdle();
    // The abandoned image is only returned to the engine by rebuilding the swapchain.
    m_swapchainDirty = true;
    return true;
}

bool GpuContext::submitImmediate(const std::function<void(VkCommandBuffer)>& record) {
    if (m_device == VK_NULL_HANDLE) {
        return false;
    }

    VkCommandBufferAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocInfo.commandPool = m_immediatePool;
    allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = 1;

    VkCommandBuffer commandBuffer = VK_NULL_HANDLE;
    VkResult result = vkAllocateCommandBuffers(m_device, &allocInfo, &commandBuffer);
    if (result != VK_SUCCESS) {
        logVkFailure("render", "vkAllocateCommandBuffers(immediate)", result);
        return false;
    }

    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    result = vkBeginCommandBuffer(commandBuffer, &beginInfo);
    if (result == VK_SUCCESS) {
        record(commandBuffer);
        result = vkEndCommandBuffer(commandBuffer);
    }

    bool ok = false;
    if (result != VK_SUCCESS) {
        logVkFailure("render", "record immediate command buffer", result);
    } else {
        VkCommandBufferSubmitInfo commandBufferInfo{};
        commandBufferInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
        commandBufferInfo.commandBuffer = commandBuffer;

        VkSubmitInfo2 submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
        submitInfo.commandBufferInfoCount = 1;
        submitInfo.pCommandBufferInfos = &commandBufferInfo;

        vkResetFences(m_device, 1, &m_immediateFence);
        result = vkQueueSubmit2(m_queue, 1, &submitInfo, m_immediateFence);
        if (result != VK_SUCCESS) {
            logVkFailure("render", "vkQueueSubmit2(immediate)", result);
        } else {
            result = vkWaitForFences(m_device, 1, &m_immediateFence, VK_TRUE, std::numeric_limits<std::uint64_t>::max());
            if (result != VK_SUCCESS) {
                logVkFailure("render", "vkWaitForFences(immediate)", result);
            } else {
                ok = true;
            }
        }
    }

    vkFreeCommandBuffers(m_device, m_immediatePool, 1, &commandBuffer);
    return ok;
}

void GpuContext::waitIdle() {
    if (m_device == VK_NULL_HANDLE) {
        return;
    }
    const VkResult result = vkDeviceWaitIdle(m_device);
    if (result != VK_SUCCESS) {
        logVkFailure("render", "vkDeviceWaitIdle", result);
    }
}

void GpuContext::shutdown() {
    if (m_device != VK_NULL_HANDLE) {
        waitIdle();
        destroySwapchain();
        for (VkSemaphore& semaphore : m_imageAvailableSemaphores) {
            if (semaphore != VK_NULL_HANDLE) {
                vkDestroySemaphore(m_device, semaphore, nullptr);
                semaphore = VK_NULL_HANDLE;
            }
        }
        if (m_immediateFence != VK_NULL_HANDLE) {
            vkDestroyFence(m_device, m_immediateFence, nullptr);
            m_immediateFence = VK_NULL_HANDLE;
        }
        if (m_immediatePool != VK_NULL_HANDLE) {
            vkDestroyCommandPool(m_device, m_immediatePool, nullptr);
            m_immediatePool = VK_NULL_HANDLE;
        }
        if (m_allocator != VK_NULL_HANDLE) {
            vmaDestroyAllocator(m_allocator);
            m_allocator = VK_NULL_HANDLE;
        }
        vkDestroyDevice(m_device, nullptr);
        m_device = VK_NULL_HANDLE;
    }
    if (m_surface != VK_NULL_HANDLE) {
        vkDestroySurfaceKHR(m_instance, m_surface, nullptr);
        m_surface = VK_NULL_HANDLE;
    }
    if (m_instance != VK_NULL_HANDLE) {
        vkDestroyInstance(m_instance, nullptr);
        m_instance = VK_NULL_HANDLE;
    }
    m_physicalDevice = VK_NULL_HANDLE;
    m_queue = VK_NULL_HANDLE;
    m_window = nullptr;
    m_swapchainDirty = false;
    m_surfaceLost = false;
}

} // namespace skygrid::render
