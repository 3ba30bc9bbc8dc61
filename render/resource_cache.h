#pragma once

#include "render/render_status.h"
#include "render/slot_table.h"

#include <vulkan/vulkan.h>
#include <vk_mem_alloc.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace skygrid::render {

class GpuContext;

struct BufferTag {};
struct TextureTag {};
struct SamplerTag {};

using BufferHandle = ResourceHandle<BufferTag>;
using TextureHandle = ResourceHandle<TextureTag>;
using SamplerHandle = ResourceHandle<SamplerTag>;

struct BufferDesc {
    VkDeviceSize size = 0;
    VkBufferUsageFlags usage = 0;
    // Copied into the buffer at creation when non-null. Must hold `size` bytes.
    const void* initialData = nullptr;
    // Random host access for readback instead of sequential writes.
    bool hostReadable = false;
    std::string debugName;
};

struct TextureDesc {
    VkFormat format = VK_FORMAT_UNDEFINED;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    // 6 makes a cube-compatible image with a cube view.
    std::uint32_t layerCount = 1;
    VkImageUsageFlags usage = 0;
    std::string debugName;
};

struct SamplerDesc {
    VkFilter filter = VK_FILTER_LINEAR;
    VkSamplerAddressMode addressMode = VK_SAMPLER_ADDRESS_MODE_REPEAT;
    std::string debugName;
};

struct TextureInfo {
    VkImage image = VK_NULL_HANDLE;
    VmaAllocation allocation = VK_NULL_HANDLE;
    // Cube view for 6-layer textures, 2D view otherwise.
    VkImageView view = VK_NULL_HANDLE;
    // 2D-array view over every layer, for storage writes. Only 6-layer textures have one.
    VkImageView arrayView = VK_NULL_HANDLE;
    VkFormat format = VK_FORMAT_UNDEFINED;
    VkExtent2D extent{};
    std::uint32_t layerCount = 1;
    VkImageUsageFlags usage = 0;
    VkImageAspectFlags aspect = VK_IMAGE_ASPECT_COLOR_BIT;
    // Layout of every layer after the last command recorded through the cache or reported back.
    VkImageLayout layout = VK_IMAGE_LAYOUT_UNDEFINED;
};

// Bytes per texel for the formats the renderer uploads or reads back. 0 for anything else.
[[nodiscard]] std::uint32_t texelSizeBytes(VkFormat format);

// Sole owner of long-lived buffers, textures and samplers. Everything else borrows handles.
// Handles carry a generation, so a handle to a destroyed resource reports StaleHandle rather than
// aliasing whatever took its slot.
class ResourceCache {
public:
    ResourceCache() = default;
    ~ResourceCache();

    ResourceCache(const ResourceCache&) = delete;
    ResourceCache& operator=(const ResourceCache&) = delete;

    bool init(GpuContext& context);
    // Releases every resource still alive. The device must be idle.
    void shutdown();

    [[nodiscard]] ResourceError createBuffer(const BufferDesc& desc, BufferHandle* outHandle);
    [[nodiscard]] ResourceError writeBuffer(BufferHandle handle, VkDeviceSize offset, const void* data, VkDeviceSize size);
    [[nodiscard]] ResourceError readBuffer(BufferHandle handle, VkDeviceSize offset, void* outData, VkDeviceSize size) const;
    bool destroyBuffer(BufferHandle handle);
    [[nodiscard]] VkBuffer buffer(BufferHandle handle) const;
    [[nodiscard]] VkDeviceSize bufferSize(BufferHandle handle) const;

    [[nodiscard]] ResourceError createTexture(const TextureDesc& desc, TextureHandle* outHandle);
    // Copies one full layer of tightly packed texels and leaves the texture shader-readable.
    [[nodiscard]] ResourceError uploadTextureLayer(TextureHandle handle, std::uint32_t layer, const void* data, VkDeviceSize size);
    // Blocking readback of one full layer. Meant for tests and tooling.
    [[nodiscard]] ResourceError readTextureLayer(TextureHandle handle, std::uint32_t layer, void* outData, VkDeviceSize size);
    bool destroyTexture(TextureHandle handle);
    [[nodiscard]] const TextureInfo* texture(TextureHandle handle) const;
    // Records the layout a pass left the texture in.
    void setTextureLayout(TextureHandle handle, VkImageLayout layout);

    [[nodiscard]] ResourceError createSampler(const SamplerDesc& desc, SamplerHandle* outHandle);
    bool destroySampler(SamplerHandle handle);
    [[nodiscard]] VkSampler sampler(SamplerHandle handle) const;

    [[nodiscard]] std::size_t bufferCount() const { return m_buffers.size(); }
    [[nodiscard]] std::size_t textureCount() const { return m_textures.size(); }
    [[nodiscard]] std::size_t samplerCount() const { return m_samplers.size(); }

private:
    struct BufferSlot {
        VkBuffer buffer = VK_NULL_HANDLE;
        VmaAllocation allocation = VK_NULL_HANDLE;
        void* mappedData = nullptr;
        VkDeviceSize size = 0;
        VkBufferUsageFlags usage = 0;
    };

    struct StagingBuffer {
        VkBuffer buffer = VK_NULL_HANDLE;
        VmaAllocation allocation = VK_NULL_HANDLE;
        void* mappedData = nullptr;
    };

    bool createStagingBuffer(VkDeviceSize size, bool hostReadable, StagingBuffer* outStaging) const;
    void destroyStagingBuffer(StagingBuffer& staging) const;
    void releaseBuffer(BufferSlot& slot) const;
    void releaseTexture(TextureInfo& texture) const;
    [[nodiscard]] ResourceError checkLayerTransfer(const TextureInfo* texture, std::uint32_t layer, VkDeviceSize size) const;

    GpuContext* m_context = nullptr;
    SlotTable<BufferSlot, BufferTag> m_buffers;
    SlotTable<TextureInfo, TextureTag> m_textures;
    SlotTable<VkSampler, SamplerTag> m_samplers;
};

} // namespace skygrid::render
