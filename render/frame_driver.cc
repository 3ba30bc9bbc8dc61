#include "render/frame_driver.h"

#include "core/log.h"
#include "render/vk_utils.h"

#include <GLFW/glfw3.h>

#include <limits>
#include <string>

namespace skygrid::render {

FrameResult classifyAcquireResult(SurfaceError result) {
    switch (result) {
    case SurfaceError::None:
        return FrameResult::Presented;
    case SurfaceError::Timeout:
    case SurfaceError::UnsupportedConfig:
        return FrameResult::Skipped;
    case SurfaceError::Lost:
    case SurfaceError::Outdated:
        return FrameResult::Fatal;
    }
    return FrameResult::Fatal;
}

FrameDriver::~FrameDriver() {
    shutdown();
}

bool FrameDriver::init(GpuContext& context, FrameUniformManager& uniforms, RenderPassGraph& passGraph) {
    m_context = &context;
    m_uniforms = &uniforms;
    m_passGraph = &passGraph;
    const VkDevice device = context.device();

    VkSemaphoreTypeCreateInfo timelineInfo{};
    timelineInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_TYPE_CREATE_INFO;
    timelineInfo.semaphoreType = VK_SEMAPHORE_TYPE_TIMELINE;
    timelineInfo.initialValue = 0;
    VkSemaphoreCreateInfo semaphoreInfo{};
    semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    semaphoreInfo.pNext = &timelineInfo;
    VkResult result = vkCreateSemaphore(device, &semaphoreInfo, nullptr, &m_timeline);
    if (result != VK_SUCCESS) {
        logVkFailure("frame", "vkCreateSemaphore(timeline)", result);
        return false;
    }
    setDebugObjectName(device, VK_OBJECT_TYPE_SEMAPHORE, vkHandleToUint64(m_timeline), "frame.timeline");

    for (std::uint32_t index = 0; index < kFramesInFlight; ++index) {
        FrameSlot& slot = m_slots[index];
        VkCommandPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
        poolInfo.queueFamilyIndex = context.queueFamilyIndex();
        result = vkCreateCommandPool(device, &poolInfo, nullptr, &slot.commandPool);
        if (result != VK_SUCCESS) {
            logVkFailure("frame", "vkCreateCommandPool(frame)", result);
            return false;
        }

        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool = slot.commandPool;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount = 1;
        result = vkAllocateCommandBuffers(device, &allocInfo, &slot.commandBuffer);
        if (result != VK_SUCCESS) {
            logVkFailure("frame", "vkAllocateCommandBuffers(frame)", result);
            return false;
        }
        setDebugObjectName(device, VK_OBJECT_TYPE_COMMAND_BUFFER, vkHandleToUint64(slot.commandBuffer),
            "frame.commands." + std::to_string(index));
    }
    return true;
}

void FrameDriver::shutdown() {
    if (m_context == nullptr) {
        return;
    }
    const VkDevice device = m_context->device();
    if (device != VK_NULL_HANDLE) {
        m_context->waitIdle();
        for (FrameSlot& slot : m_slots) {
            if (slot.commandPool != VK_NULL_HANDLE) {
                vkDestroyCommandPool(device, slot.commandPool, nullptr);
            }
            slot = FrameSlot{};
        }
        if (m_timeline != VK_NULL_HANDLE) {
            vkDestroySemaphore(device, m_timeline, nullptr);
        }
    }
    m_timeline = VK_NULL_HANDLE;
    m_context = nullptr;
    m_uniforms = nullptr;
    m_passGraph = nullptr;
}

bool FrameDriver::waitForSlot(const FrameSlot& slot) {
    if (slot.completionValue == 0) {
        return true;
    }
    VkSemaphoreWaitInfo waitInfo{};
    waitInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_WAIT_INFO;
    waitInfo.semaphoreCount = 1;
    waitInfo.pSemaphores = &m_timeline;
    waitInfo.pValues = &slot.completionValue;
    const VkResult result = vkWaitSemaphores(m_context->device(), &waitInfo, std::numeric_limits<std::uint64_t>::max());
    if (result != VK_SUCCESS) {
        logVkFailure("frame", "vkWaitSemaphores(frame slot)", result);
        return false;
    }
    return true;
}

FrameResult FrameDriver::finish(FrameResult result) {
    if (result == FrameResult::Presented) {
        ++m_stats.presented;
    } else if (result == FrameResult::Skipped) {
        ++m_stats.skipped;
    }
    return result;
}

FrameResult FrameDriver::skipAfterAcquire(const char* reason) {
    SKYGRID_LOGW("frame") << "frame skipped after acquire: " << reason;
    // The acquired image is never presented; give it back by rebuilding the swapchain.
    if (!m_context->abandonTarget(m_frameSlot)) {
        SKYGRID_LOGE("frame") << "could not release abandoned swapchain image";
        return finish(FrameResult::Fatal);
    }
    return finish(FrameResult::Skipped);
}

FrameResult FrameDriver::runFrame(
    const core::Camera& camera,
    core::Projection& projection,
    double elapsedSeconds,
    const PassToggles& toggles,
    const OverlayRecorder& overlay) {
    m_lastFrameState = PassGraphState::NotRecorded;
    if (m_context == nullptr) {
        return FrameResult::Fatal;
    }

    int framebufferWidth = 0;
    int framebufferHeight = 0;
    if (GLFWwindow* window = m_context->window()) {
        glfwGetFramebufferSize(window, &framebufferWidth, &framebufferHeight);
        if (framebufferWidth <= 0 || framebufferHeight <= 0) {
            SKYGRID_LOGT("frame") << "window minimized, frame skipped";
            return finish(FrameResult::Skipped);
        }
    }

    const VkExtent2D currentExtent = m_context->requestedExtent();
    const bool sizeChanged = currentExtent.width != static_cast<std::uint32_t>(framebufferWidth)
        || currentExtent.height != static_cast<std::uint32_t>(framebufferHeight);
    if (!m_context->hasSwapchain() || m_context->swapchainDirty() || sizeChanged) {
        const SurfaceError resized = m_context->reconfigure(framebufferWidth, framebufferHeight);
        if (resized == SurfaceError::UnsupportedConfig) {
            return finish(FrameResult::Skipped);
        }
        // Lost falls through: the acquire below reports it and takes the retry path.
    }

    FrameSlot& slot = m_slots[m_frameSlot];
    if (!waitForSlot(slot)) {
        return finish(FrameResult::Fatal);
    }

    SwapchainTarget target{};
    bool retried = false;
    const SurfaceError acquired = acquireWithSingleRetry(
        [&]() { return m_context->acquireFrame(m_frameSlot, &target); },
        [&]() { return m_context->reconfigureToWindow(); },
        &retried);
    if (retried) {
        ++m_stats.surfaceRetries;
    }
    const FrameResult acquireOutcome = classifyAcquireResult(acquired);
    if (acquireOutcome == FrameResult::Fatal) {
        SKYGRID_LOGE("frame") << "surface unusable after reconfigure: " << toString(acquired);
        return finish(FrameResult::Fatal);
    }
    if (acquireOutcome == FrameResult::Skipped) {
        SKYGRID_LOGW("frame") << "acquire failed, frame skipped: " << toString(acquired);
        return finish(FrameResult::Skipped);
    }

    projection.resize(target.extent.width, target.extent.height);
    const ResourceError depthResult = m_passGraph->ensureDepth(target.extent);
    if (depthResult != ResourceError::None) {
        return skipAfterAcquire(toString(depthResult));
    }

    PassGraphStateMachine frameState;
    const ResourceError uniformResult = m_uniforms->update(m_frameSlot, camera, projection, elapsedSeconds);
    if (uniformResult != ResourceError::None) {
        return skipAfterAcquire(toString(uniformResult));
    }

    const VkDevice device = m_context->device();
    VkResult result = vkResetCommandPool(device, slot.commandPool, 0);
    if (result != VK_SUCCESS) {
        logVkFailure("frame", "vkResetCommandPool", result);
        return skipAfterAcquire("command pool reset failed");
    }
    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    result = vkBeginCommandBuffer(slot.commandBuffer, &beginInfo);
    if (result != VK_SUCCESS) {
        logVkFailure("frame", "vkBeginCommandBuffer", result);
        return skipAfterAcquire("command buffer begin failed");
    }

    frameState.beginRecording();
    const ResourceError recordResult = m_passGraph->record(slot.commandBuffer, m_frameSlot, target, toggles, overlay);
    result = vkEndCommandBuffer(slot.commandBuffer);
    if (recordResult != ResourceError::None) {
        return skipAfterAcquire(toString(recordResult));
    }
    if (result != VK_SUCCESS) {
        logVkFailure("frame", "vkEndCommandBuffer", result);
        return skipAfterAcquire("command buffer end failed");
    }

    const std::uint64_t signalValue = m_timelineValue + 1;

    VkSemaphoreSubmitInfo waitInfo{};
    waitInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    waitInfo.semaphore = target.imageAvailable;
    waitInfo.stageMask = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT;

    std::array<VkSemaphoreSubmitInfo, 2> signalInfos{};
    signalInfos[0].sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    signalInfos[0].semaphore = target.renderComplete;
    signalInfos[0].stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
    signalInfos[1].sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    signalInfos[1].semaphore = m_timeline;
    signalInfos[1].value = signalValue;
    signalInfos[1].stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;

    VkCommandBufferSubmitInfo commandBufferInfo{};
    commandBufferInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
    commandBufferInfo.commandBuffer = slot.commandBuffer;

    VkSubmitInfo2 submitInfo{};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    submitInfo.waitSemaphoreInfoCount = 1;
    submitInfo.pWaitSemaphoreInfos = &waitInfo;
    submitInfo.commandBufferInfoCount = 1;
    submitInfo.pCommandBufferInfos = &commandBufferInfo;
    submitInfo.signalSemaphoreInfoCount = static_cast<std::uint32_t>(signalInfos.size());
    submitInfo.pSignalSemaphoreInfos = signalInfos.data();

    result = vkQueueSubmit2(m_context->queue(), 1, &submitInfo, VK_NULL_HANDLE);
    if (result == VK_ERROR_DEVICE_LOST) {
        logVkFailure("frame", "vkQueueSubmit2", result);
        return finish(FrameResult::Fatal);
    }
    if (result != VK_SUCCESS) {
        logVkFailure("frame", "vkQueueSubmit2", result);
        return skipAfterAcquire("submit failed");
    }
    m_timelineValue = signalValue;
    slot.completionValue = signalValue;
    frameState.markSubmitted();
    m_lastFrameState = frameState.state();
    m_frameSlot = (m_frameSlot + 1) % kFramesInFlight;

    const SurfaceError presented = m_context->present(target);
    if (presented != SurfaceError::None) {
        // Submitted work still retires through the timeline; the next acquire rebuilds the surface.
        SKYGRID_LOGW("frame") << "present failed: " << toString(presented);
        return finish(FrameResult::Skipped);
    }
    frameState.markPresented();
    m_lastFrameState = frameState.state();
    return finish(FrameResult::Presented);
}

} // namespace skygrid::render
