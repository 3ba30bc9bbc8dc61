#pragma once

#include "core/camera.h"
#include "render/frame_uniforms.h"
#include "render/gpu_context.h"
#include "render/render_pass_graph.h"
#include "render/render_status.h"

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>

namespace skygrid::render {

// Acquires, and on Lost or Outdated reconfigures and acquires exactly once more.
// `outRetried` reports whether the second attempt happened.
template <typename AcquireFn, typename ReconfigureFn>
SurfaceError acquireWithSingleRetry(AcquireFn&& acquire, ReconfigureFn&& reconfigure, bool* outRetried) {
    if (outRetried != nullptr) {
        *outRetried = false;
    }
    const SurfaceError first = acquire();
    if (first != SurfaceError::Lost && first != SurfaceError::Outdated) {
        return first;
    }
    if (outRetried != nullptr) {
        *outRetried = true;
    }
    const SurfaceError reconfigured = reconfigure();
    if (reconfigured != SurfaceError::None) {
        return reconfigured;
    }
    return acquire();
}

// Maps the final acquire outcome onto what the frame does next.
// Surface loss that survived the retry is fatal; a timeout or an unpresentable size skips.
[[nodiscard]] FrameResult classifyAcquireResult(SurfaceError result);

struct FrameStats {
    std::uint64_t presented = 0;
    std::uint64_t skipped = 0;
    std::uint64_t surfaceRetries = 0;
};

// Runs one frame: acquire, update uniforms, record and submit the pass graph, present.
// Owns the per-slot command pools and the timeline semaphore that paces frames in flight.
class FrameDriver {
public:
    FrameDriver() = default;
    ~FrameDriver();

    FrameDriver(const FrameDriver&) = delete;
    FrameDriver& operator=(const FrameDriver&) = delete;

    bool init(GpuContext& context, FrameUniformManager& uniforms, RenderPassGraph& passGraph);
    void shutdown();

    [[nodiscard]] FrameResult runFrame(
        const core::Camera& camera,
        core::Projection& projection,
        double elapsedSeconds,
        const PassToggles& toggles,
        const OverlayRecorder& overlay);

    [[nodiscard]] const FrameStats& stats() const { return m_stats; }
    [[nodiscard]] PassGraphState lastFrameState() const { return m_lastFrameState; }
    [[nodiscard]] std::uint32_t frameSlot() const { return m_frameSlot; }

private:
    struct FrameSlot {
        VkCommandPool commandPool = VK_NULL_HANDLE;
        VkCommandBuffer commandBuffer = VK_NULL_HANDLE;
        // Timeline value signaled when this slot's last submission finished.
        std::uint64_t completionValue = 0;
    };

    [[nodiscard]] bool waitForSlot(const FrameSlot& slot);
    FrameResult skipAfterAcquire(const char* reason);
    FrameResult finish(FrameResult result);

    GpuContext* m_context = nullptr;
    FrameUniformManager* m_uniforms = nullptr;
    RenderPassGraph* m_passGraph = nullptr;

    std::array<FrameSlot, kFramesInFlight> m_slots{};
    VkSemaphore m_timeline = VK_NULL_HANDLE;
    std::uint64_t m_timelineValue = 0;
    std::uint32_t m_frameSlot = 0;

    FrameStats m_stats{};
    PassGraphState m_lastFrameState = PassGraphState::NotRecorded;
};

} // namespace skygrid::render
