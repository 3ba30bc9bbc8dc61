#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace skygrid::render {

[[nodiscard]] const char* vkResultName(VkResult result);
void logVkFailure(const char* category, const char* context, VkResult result);

[[nodiscard]] std::optional<std::vector<std::uint8_t>> readBinaryFile(const std::string& filePath);

// Loads `<shaderDir>/<name>.spv`. Logs and returns VK_NULL_HANDLE on failure.
[[nodiscard]] VkShaderModule createShaderModuleFromFile(
    VkDevice device,
    const std::string& shaderDir,
    const char* name);

template <typename VkHandleT>
std::uint64_t vkHandleToUint64(VkHandleT handle) {
    if constexpr (std::is_pointer_v<VkHandleT>) {
        return reinterpret_cast<std::uint64_t>(handle);
    } else {
        return static_cast<std::uint64_t>(handle);
    }
}

// No-op unless VK_EXT_debug_utils is enabled on the instance.
void setDebugObjectName(VkDevice device, VkObjectType objectType, std::uint64_t objectHandle, const std::string& name);

VkImageMemoryBarrier2 imageBarrier(
    VkImage image,
    VkImageLayout oldLayout,
    VkImageLayout newLayout,
    VkPipelineStageFlags2 srcStage,
    VkAccessFlags2 srcAccess,
    VkPipelineStageFlags2 dstStage,
    VkAccessFlags2 dstAccess,
    VkImageAspectFlags aspectMask = VK_IMAGE_ASPECT_COLOR_BIT,
    std::uint32_t baseArrayLayer = 0,
    std::uint32_t layerCount = 1);

void cmdImageBarriers(VkCommandBuffer commandBuffer, const VkImageMemoryBarrier2* barriers, std::uint32_t count);

[[nodiscard]] bool isDepthFormat(VkFormat format);

} // namespace skygrid::render
