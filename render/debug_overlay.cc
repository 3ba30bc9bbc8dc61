#include "render/debug_overlay.h"

#include "core/log.h"
#include "render/gpu_context.h"
#include "render/vk_utils.h"

#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_vulkan.h>

#include <algorithm>
#include <array>

namespace skygrid::render {
namespace {

void imguiCheckVkResult(VkResult result) {
    if (result != VK_SUCCESS) {
        logVkFailure("render", "imgui vulkan backend", result);
    }
}

} // namespace

DebugOverlay::~DebugOverlay() {
    shutdown();
}

bool DebugOverlay::init(GpuContext& context, VkFormat colorFormat) {
    if (m_initialized) {
        return true;
    }
    if (context.window() == nullptr) {
        SKYGRID_LOGW("render") << "debug overlay disabled: no window";
        return false;
    }
    m_context = &context;
    m_colorFormat = colorFormat;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    if (!ImGui_ImplGlfw_InitForVulkan(context.window(), true)) {
        SKYGRID_LOGE("render") << "ImGui_ImplGlfw_InitForVulkan failed";
        ImGui::DestroyContext();
        return false;
    }

    const std::array<VkDescriptorPoolSize, 1> poolSizes = {{
        {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 16},
    }};
    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    poolInfo.maxSets = 16;
    poolInfo.poolSizeCount = static_cast<std::uint32_t>(poolSizes.size());
    poolInfo.pPoolSizes = poolSizes.data();
    const VkResult result = vkCreateDescriptorPool(context.device(), &poolInfo, nullptr, &m_descriptorPool);
    if (result != VK_SUCCESS) {
        logVkFailure("render", "vkCreateDescriptorPool(imgui)", result);
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        return false;
    }

    const std::uint32_t imageCount = std::max<std::uint32_t>(2u, context.swapchainImageCount());
    ImGui_ImplVulkan_InitInfo initInfo{};
    initInfo.ApiVersion = VK_API_VERSION_1_3;
    initInfo.Instance = context.instance();
    initInfo.PhysicalDevice = context.physicalDevice();
    initInfo.Device = context.device();
    initInfo.QueueFamily = context.queueFamilyIndex();
    initInfo.Queue = context.queue();
    initInfo.DescriptorPool = m_descriptorPool;
    initInfo.MinImageCount = imageCount;
    initInfo.ImageCount = imageCount;
    initInfo.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    initInfo.UseDynamicRendering = true;
    initInfo.PipelineRenderingCreateInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
    initInfo.PipelineRenderingCreateInfo.colorAttachmentCount = 1;
    initInfo.PipelineRenderingCreateInfo.pColorAttachmentFormats = &m_colorFormat;
    initInfo.PipelineRenderingCreateInfo.depthAttachmentFormat = VK_FORMAT_UNDEFINED;
    initInfo.CheckVkResultFn = imguiCheckVkResult;
    if (!ImGui_ImplVulkan_Init(&initInfo)) {
        SKYGRID_LOGE("render") << "ImGui_ImplVulkan_Init failed";
        vkDestroyDescriptorPool(context.device(), m_descriptorPool, nullptr);
        m_descriptorPool = VK_NULL_HANDLE;
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        return false;
    }

    if (!ImGui_ImplVulkan_CreateFontsTexture()) {
        SKYGRID_LOGE("render") << "ImGui_ImplVulkan_CreateFontsTexture failed";
        ImGui_ImplVulkan_Shutdown();
        vkDestroyDescriptorPool(context.device(), m_descriptorPool, nullptr);
        m_descriptorPool = VK_NULL_HANDLE;
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        return false;
    }

    m_initialized = true;
    return true;
}

void DebugOverlay::shutdown() {
    if (!m_initialized) {
        return;
    }
    m_context->waitIdle();
    ImGui_ImplVulkan_DestroyFontsTexture();
    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    vkDestroyDescriptorPool(m_context->device(), m_descriptorPool, nullptr);
    m_descriptorPool = VK_NULL_HANDLE;
    m_initialized = false;
    m_context = nullptr;
}

OverlayRecorder DebugOverlay::buildFrame(const OverlayFrameInfo& info, OverlayControls* controls) {
    if (!m_initialized || !m_visible || controls == nullptr) {
        return {};
    }

    const float frameMs = info.deltaSeconds * 1000.0f;
    m_smoothedFrameMs = (m_smoothedFrameMs <= 0.0f) ? frameMs : (m_smoothedFrameMs * 0.9f) + (frameMs * 0.1f);

    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    constexpr ImGuiWindowFlags kPanelFlags = ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoSavedSettings;
    ImGui::SetNextWindowPos(ImVec2(12.0f, 12.0f), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("skygrid", nullptr, kPanelFlags)) {
        const float fps = (m_smoothedFrameMs > 0.0f) ? (1000.0f / m_smoothedFrameMs) : 0.0f;
        ImGui::Text("%.1f fps (%.2f ms)", fps, m_smoothedFrameMs);
        ImGui::Text("Swapchain: %ux%u", info.extent.width, info.extent.height);
        ImGui::Text("Frames: %llu presented, %llu skipped",
            static_cast<unsigned long long>(info.presentedFrames),
            static_cast<unsigned long long>(info.skippedFrames));
        ImGui::Separator();
        ImGui::SliderFloat("Light speed (deg/s)", &controls->lightSpeedDegrees, -180.0f, 180.0f);
        ImGui::Checkbox("Light marker pass", &controls->toggles.lightMarker);
        ImGui::Checkbox("Object pass", &controls->toggles.objects);
        ImGui::Checkbox("Skybox pass", &controls->toggles.skybox);
        ImGui::TextDisabled("Tab hides this panel");
    }
    ImGui::End();
    ImGui::Render();

    return [](VkCommandBuffer commandBuffer) {
        ImGui_ImplVulkan_RenderDrawData(ImGui::GetDrawData(), commandBuffer);
    };
}

} // namespace skygrid::render
