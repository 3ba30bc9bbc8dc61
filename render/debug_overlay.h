#pragma once

#include "render/render_pass_graph.h"

#include <vulkan/vulkan.h>

#include <cstdint>

namespace skygrid::render {

class GpuContext;

struct OverlayFrameInfo {
    float deltaSeconds = 0.0f;
    VkExtent2D extent{};
    std::uint64_t presentedFrames = 0;
    std::uint64_t skippedFrames = 0;
};

// Values the overlay widgets edit in place.
struct OverlayControls {
    float lightSpeedDegrees = 60.0f;
    PassToggles toggles{};
};

// Dear ImGui panel drawn into the swapchain after the skybox pass.
class DebugOverlay {
public:
    DebugOverlay() = default;
    ~DebugOverlay();

    DebugOverlay(const DebugOverlay&) = delete;
    DebugOverlay& operator=(const DebugOverlay&) = delete;

    bool init(GpuContext& context, VkFormat colorFormat);
    void shutdown();

    // Builds this frame's widgets. Returns a recorder for the pass graph, empty when hidden.
    [[nodiscard]] OverlayRecorder buildFrame(const OverlayFrameInfo& info, OverlayControls* controls);

    void setVisible(bool visible) { m_visible = visible; }
    [[nodiscard]] bool isVisible() const { return m_visible; }
    [[nodiscard]] bool isInitialized() const { return m_initialized; }

private:
    GpuContext* m_context = nullptr;
    VkDescriptorPool m_descriptorPool = VK_NULL_HANDLE;
    VkFormat m_colorFormat = VK_FORMAT_UNDEFINED;
    bool m_initialized = false;
    bool m_visible = true;
    float m_smoothedFrameMs = 0.0f;
};

} // namespace skygrid::render
