#include "render/resource_cache.h"

#include "core/log.h"
#include "render/gpu_context.h"
#include "render/vk_utils.h"

#include <cstring>

namespace skygrid::render {
namespace {

VkImageLayout restingLayout(VkImageUsageFlags usage) {
    if ((usage & VK_IMAGE_USAGE_SAMPLED_BIT) != 0) {
        return VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    }
    return VK_IMAGE_LAYOUT_GENERAL;
}

} // namespace

std::uint32_t texelSizeBytes(VkFormat format) {
    switch (format) {
    case VK_FORMAT_R8G8B8A8_UNORM:
    case VK_FORMAT_R8G8B8A8_SRGB:
    case VK_FORMAT_B8G8R8A8_UNORM:
    case VK_FORMAT_B8G8R8A8_SRGB:
    case VK_FORMAT_R32_SFLOAT:
        return 4;
    case VK_FORMAT_R16G16B16A16_SFLOAT:
        return 8;
    case VK_FORMAT_R32G32B32A32_SFLOAT:
        return 16;
    default:
        return 0;
    }
}

ResourceCache::~ResourceCache() {
    shutdown();
}

bool ResourceCache::init(GpuContext& context) {
    if (!context.isInitialized()) {
        SKYGRID_LOGE("resources") << "resource cache needs an initialized gpu context";
        return false;
    }
    m_context = &context;
    return true;
}

void ResourceCache::shutdown() {
    if (m_context == nullptr) {
        return;
    }
    const std::size_t liveCount = m_buffers.size() + m_textures.size() + m_samplers.size();
    if (liveCount > 0) {
        SKYGRID_LOGD("resources") << "releasing " << liveCount << " resources at shutdown";
    }
    m_buffers.drain([this](BufferSlot& slot) { releaseBuffer(slot); });
    m_textures.drain([this](TextureInfo& texture) { releaseTexture(texture); });
    const VkDevice device = m_context->device();
    m_samplers.drain([device](VkSampler& sampler) { vkDestroySampler(device, sampler, nullptr); });
    m_context = nullptr;
}

ResourceError ResourceCache::createBuffer(const BufferDesc& desc, BufferHandle* outHandle) {
    if (outHandle == nullptr || m_context == nullptr) {
        return ResourceError::AllocationFailed;
    }
    *outHandle = BufferHandle{};
    if (desc.size == 0) {
        SKYGRID_LOGE("resources") << "buffer '" << desc.debugName << "' requested with zero size";
        return ResourceError::SizeMismatch;
    }

    VkBufferCreateInfo bufferInfo{};
    bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufferInfo.size = desc.size;
    bufferInfo.usage = desc.usage;
    bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    // Every cache buffer stays persistently mapped. Uniform and instance data are rewritten each
    // frame, and meshes are small enough that a host-visible heap is fine.
    VmaAllocationCreateInfo allocationInfo{};
    allocationInfo.usage = VMA_MEMORY_USAGE_AUTO;
    allocationInfo.flags = VMA_ALLOCATION_CREATE_MAPPED_BIT
        | (desc.hostReadable ? VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT
                             : VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT);

    BufferSlot slot{};
    slot.size = desc.size;
    slot.usage = desc.usage;
    VmaAllocationInfo allocationResult{};
    const VkResult result = vmaCreateBuffer(
        m_context->allocator(),
        &bufferInfo,
        &allocationInfo,
        &slot.buffer,
        &slot.allocation,
        &allocationResult);
    if (result != VK_SUCCESS) {
        logVkFailure("resources", "vmaCreateBuffer", result);
        return ResourceError::AllocationFailed;
    }
    slot.mappedData = allocationResult.pMappedData;
    if (slot.mappedData == nullptr) {
        SKYGRID_LOGE("resources") << "buffer '" << desc.debugName << "' is not host mapped";
        releaseBuffer(slot);
        return ResourceError::AllocationFailed;
    }

    if (desc.initialData != nullptr) {
        std::memcpy(slot.mappedData, desc.initialData, static_cast<std::size_t>(desc.size));
        const VkResult flushResult = vmaFlushAllocation(m_context->allocator(), slot.allocation, 0, VK_WHOLE_SIZE);
        if (flushResult != VK_SUCCESS) {
            logVkFailure("resources", "vmaFlushAllocation(initial data)", flushResult);
            releaseBuffer(slot);
            return ResourceError::AllocationFailed;
        }
    }
    if (!desc.debugName.empty()) {
        setDebugObjectName(m_context->device(), VK_OBJECT_TYPE_BUFFER, vkHandleToUint64(slot.buffer), desc.debugName);
    }

    SKYGRID_LOGD("resources")
        << "alloc buffer '" << desc.debugName << "': size=" << static_cast<unsigned long long>(desc.size)
        << ", usage=0x" << std::hex << static_cast<unsigned int>(desc.usage) << std::dec;
    *outHandle = m_buffers.insert(slot);
    return ResourceError::None;
}

ResourceError ResourceCache::writeBuffer(BufferHandle handle, VkDeviceSize offset, const void* data, VkDeviceSize size) {
    BufferSlot* slot = m_buffers.get(handle);
    if (slot == nullptr) {
        return ResourceError::StaleHandle;
    }
    if (offset > slot->size || size > slot->size - offset) {
        SKYGRID_LOGE("resources") << "buffer write out of bounds: offset=" << offset << ", len=" << size
                                  << ", size=" << slot->size;
        return ResourceError::OutOfBounds;
    }
    if (size == 0) {
        return ResourceError::None;
    }
    std::memcpy(static_cast<std::uint8_t*>(slot->mappedData) + offset, data, static_cast<std::size_t>(size));
    const VkResult result = vmaFlushAllocation(m_context->allocator(), slot->allocation, offset, size);
    if (result != VK_SUCCESS) {
        logVkFailure("resources", "vmaFlushAllocation", result);
        return ResourceError::AllocationFailed;
    }
    return ResourceError::None;
}

ResourceError ResourceCache::readBuffer(BufferHandle handle, VkDeviceSize offset, void* outData, VkDeviceSize size) const {
    const BufferSlot* slot = m_buffers.get(handle);
    if (slot == nullptr) {
        return ResourceError::StaleHandle;
    }
    if (offset > slot->size || size > slot->size - offset) {
        return ResourceError::OutOfBounds;
    }
    const VkResult result = vmaInvalidateAllocation(m_context->allocator(), slot->allocation, offset, size);
    if (result != VK_SUCCESS) {
        logVkFailure("resources", "vmaInvalidateAllocation", result);
        return ResourceError::AllocationFailed;
    }
    std::memcpy(outData, static_cast<const std::uint8_t*>(slot->mappedData) + offset, static_cast<std::size_t>(size));
    return ResourceError::None;
}

bool ResourceCache::destroyBuffer(BufferHandle handle) {
    std::optional<BufferSlot> removed = m_buffers.remove(handle);
    if (!removed.has_value()) {
        return false;
    }
    releaseBuffer(*removed);
    return true;
}

VkBuffer ResourceCache::buffer(BufferHandle handle) const {
    const BufferSlot* slot = m_buffers.get(handle);
    return (slot != nullptr) ? slot->buffer : VK_NULL_HANDLE;
}

VkDeviceSize ResourceCache::bufferSize(BufferHandle handle) const {
    const BufferSlot* slot = m_buffers.get(handle);
    return (slot != nullptr) ? slot->size : 0;
}

ResourceError ResourceCache::createTexture(const TextureDesc& desc, TextureHandle* outHandle) {
    if (outHandle == nullptr || m_context == nullptr) {
        return ResourceError::AllocationFailed;
    }
    *outHandle = TextureHandle{};
    if (desc.width == 0 || desc.height == 0 || (desc.layerCount != 1 && desc.layerCount != 6)) {
        SKYGRID_LOGE("resources") << "texture '" << desc.debugName << "' has invalid shape " << desc.width << "x"
                                  << desc.height << "x" << desc.layerCount;
        return ResourceError::SizeMismatch;
    }
    const bool isCube = desc.layerCount == 6;
    if (isCube && desc.width != desc.height) {
        SKYGRID_LOGE("resources") << "cubemap '" << desc.debugName << "' faces must be square";
        return ResourceError::SizeMismatch;
    }

    TextureInfo texture{};
    texture.format = desc.format;
    texture.extent = VkExtent2D{desc.width, desc.height};
    texture.layerCount = desc.layerCount;
    texture.usage = desc.usage;
    texture.aspect = isDepthFormat(desc.format) ? VK_IMAGE_ASPECT_DEPTH_BIT : VK_IMAGE_ASPECT_COLOR_BIT;

    VkImageCreateInfo imageInfo{};
    imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    imageInfo.flags = isCube ? VK_IMAGE_CREATE_CUBE_COMPATIBLE_BIT : 0;
    imageInfo.imageType = VK_IMAGE_TYPE_2D;
    imageInfo.format = desc.format;
    imageInfo.extent = VkExtent3D{desc.width, desc.height, 1};
    imageInfo.mipLevels = 1;
    imageInfo.arrayLayers = desc.layerCount;
    imageInfo.samples = VK_SAMPLE_COUNT_1_BIT;
    imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
    imageInfo.usage = desc.usage;
    imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    VmaAllocationCreateInfo allocationInfo{};
    allocationInfo.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;

    VkResult result = vmaCreateImage(
        m_context->allocator(),
        &imageInfo,
        &allocationInfo,
        &texture.image,
        &texture.allocation,
        nullptr);
    if (result != VK_SUCCESS) {
        logVkFailure("resources", "vmaCreateImage", result);
        return ResourceError::AllocationFailed;
    }

    VkImageViewCreateInfo viewInfo{};
    viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    viewInfo.image = texture.image;
    viewInfo.viewType = isCube ? VK_IMAGE_VIEW_TYPE_CUBE : VK_IMAGE_VIEW_TYPE_2D;
    viewInfo.format = desc.format;
    viewInfo.subresourceRange.aspectMask = texture.aspect;
    viewInfo.subresourceRange.levelCount = 1;
    viewInfo.subresourceRange.layerCount = desc.layerCount;
    result = vkCreateImageView(m_context->device(), &viewInfo, nullptr, &texture.view);
    if (result != VK_SUCCESS) {
        logVkFailure("resources", "vkCreateImageView", result);
        releaseTexture(texture);
        return ResourceError::AllocationFailed;
    }

    if (isCube) {
        viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D_ARRAY;
        result = vkCreateImageView(m_context->device(), &viewInfo, nullptr, &texture.arrayView);
        if (result != VK_SUCCESS) {
            logVkFailure("resources", "vkCreateImageView(2D array)", result);
            releaseTexture(texture);
            return ResourceError::AllocationFailed;
        }
    }

    if (!desc.debugName.empty()) {
        setDebugObjectName(m_context->device(), VK_OBJECT_TYPE_IMAGE, vkHandleToUint64(texture.image), desc.debugName);
        setDebugObjectName(m_context->device(), VK_OBJECT_TYPE_IMAGE_VIEW, vkHandleToUint64(texture.view),
            desc.debugName + ".view");
    }

    SKYGRID_LOGD("resources") << "alloc texture '" << desc.debugName << "': " << desc.width << "x" << desc.height
                              << ", layers=" << desc.layerCount << ", format=" << static_cast<int>(desc.format);
    *outHandle = m_textures.insert(texture);
    return ResourceError::None;
}

ResourceError ResourceCache::checkLayerTransfer(const TextureInfo* texture, std::uint32_t layer, VkDeviceSize size) const {
    if (texture == nullptr) {
        return ResourceError::StaleHandle;
    }
    if (layer >= texture->layerCount) {
        return ResourceError::OutOfBounds;
    }
    const VkDeviceSize expected =
        static_cast<VkDeviceSize>(texture->extent.width) * texture->extent.height * texelSizeBytes(texture->format);
    if (expected == 0 || size != expected) {
        SKYGRID_LOGE("resources") << "texture layer transfer size " << size << " does not match " << expected;
        return ResourceError::SizeMismatch;
    }
    return ResourceError::None;
}

ResourceError ResourceCache::uploadTextureLayer(TextureHandle handle, std::uint32_t layer, const void* data, VkDeviceSize size) {
    TextureInfo* texture = m_textures.get(handle);
    const ResourceError check = checkLayerTransfer(texture, layer, size);
    if (check != ResourceError::None) {
        return check;
    }
    if ((texture->usage & VK_IMAGE_USAGE_TRANSFER_DST_BIT) == 0) {
        SKYGRID_LOGE("resources") << "texture upload needs TRANSFER_DST usage";
        return ResourceError::SizeMismatch;
    }

    StagingBuffer staging{};
    if (!createStagingBuffer(size, false, &staging)) {
        return ResourceError::AllocationFailed;
    }
    std::memcpy(staging.mappedData, data, static_cast<std::size_t>(size));
    const VkResult flushResult = vmaFlushAllocation(m_context->allocator(), staging.allocation, 0, VK_WHOLE_SIZE);
    if (flushResult != VK_SUCCESS) {
        logVkFailure("resources", "vmaFlushAllocation(staging)", flushResult);
        destroyStagingBuffer(staging);
        return ResourceError::AllocationFailed;
    }

    const VkImageLayout finalLayout = restingLayout(texture->usage);
    const bool ok = m_context->submitImmediate([&](VkCommandBuffer commandBuffer) {
        const VkImageMemoryBarrier2 toTransfer = imageBarrier(
            texture->image,
            texture->layout,
            VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
            VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT,
            VK_ACCESS_2_MEMORY_READ_BIT | VK_ACCESS_2_MEMORY_WRITE_BIT,
            VK_PIPELINE_STAGE_2_COPY_BIT,
            VK_ACCESS_2_TRANSFER_WRITE_BIT,
            texture->aspect,
            0,
            texture->layerCount);
        cmdImageBarriers(commandBuffer, &toTransfer, 1);

        VkBufferImageCopy region{};
        region.imageSubresource.aspectMask = texture->aspect;
        region.imageSubresource.baseArrayLayer = layer;
        region.imageSubresource.layerCount = 1;
        region.imageExtent = VkExtent3D{texture->extent.width, texture->extent.height, 1};
        vkCmdCopyBufferToImage(
            commandBuffer,
            staging.buffer,
            texture->image,
            VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
            1,
            &region);

        const VkImageMemoryBarrier2 toRead = imageBarrier(
            texture->image,
            VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
            finalLayout,
            VK_PIPELINE_STAGE_2_COPY_BIT,
            VK_ACCESS_2_TRANSFER_WRITE_BIT,
            VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT,
            VK_ACCESS_2_MEMORY_READ_BIT,
            texture->aspect,
            0,
            texture->layerCount);
        cmdImageBarriers(commandBuffer, &toRead, 1);
    });
    destroyStagingBuffer(staging);
    if (!ok) {
        return ResourceError::AllocationFailed;
    }
    texture->layout = finalLayout;
    return ResourceError::None;
}

ResourceError ResourceCache::readTextureLayer(TextureHandle handle, std::uint32_t layer, void* outData, VkDeviceSize size) {
    TextureInfo* texture = m_textures.get(handle);
    const ResourceError check = checkLayerTransfer(texture, layer, size);
    if (check != ResourceError::None) {
        return check;
    }
    if ((texture->usage & VK_IMAGE_USAGE_TRANSFER_SRC_BIT) == 0) {
        SKYGRID_LOGE("resources") << "texture readback needs TRANSFER_SRC usage";
        return ResourceError::SizeMismatch;
    }

    StagingBuffer staging{};
    if (!createStagingBuffer(size, true, &staging)) {
        return ResourceError::AllocationFailed;
    }

    const VkImageLayout restoreLayout =
        texture->layout == VK_IMAGE_LAYOUT_UNDEFINED ? restingLayout(texture->usage) : texture->layout;
    const bool ok = m_context->submitImmediate([&](VkCommandBuffer commandBuffer) {
        const VkImageMemoryBarrier2 toTransfer = imageBarrier(
            texture->image,
            texture->layout,
            VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
            VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT,
            VK_ACCESS_2_MEMORY_WRITE_BIT,
            VK_PIPELINE_STAGE_2_COPY_BIT,
            VK_ACCESS_2_TRANSFER_READ_BIT,
            texture->aspect,
            0,
            texture->layerCount);
        cmdImageBarriers(commandBuffer, &toTransfer, 1);

        VkBufferImageCopy region{};
        region.imageSubresource.aspectMask = texture->aspect;
        region.imageSubresource.baseArrayLayer = layer;
        region.imageSubresource.layerCount = 1;
        region.imageExtent = VkExtent3D{texture->extent.width, texture->extent.height, 1};
        vkCmdCopyImageToBuffer(
            commandBuffer,
            texture->image,
            VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
            staging.buffer,
            1,
            &region);

        const VkImageMemoryBarrier2 restore = imageBarrier(
            texture->image,
            VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
            restoreLayout,
            VK_PIPELINE_STAGE_2_COPY_BIT,
            VK_ACCESS_2_NONE,
            VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT,
            VK_ACCESS_2_MEMORY_READ_BIT,
            texture->aspect,
            0,
            texture->layerCount);
        cmdImageBarriers(commandBuffer, &restore, 1);
    });

    if (!ok) {
        destroyStagingBuffer(staging);
        return ResourceError::AllocationFailed;
    }
    texture->layout = restoreLayout;
    const VkResult invalidateResult = vmaInvalidateAllocation(m_context->allocator(), staging.allocation, 0, VK_WHOLE_SIZE);
    if (invalidateResult != VK_SUCCESS) {
        logVkFailure("resources", "vmaInvalidateAllocation(readback)", invalidateResult);
        destroyStagingBuffer(staging);
        return ResourceError::AllocationFailed;
    }
    std::memcpy(outData, staging.mappedData, static_cast<std::size_t>(size));
    destroyStagingBuffer(staging);
    return ResourceError::None;
}

bool ResourceCache::destroyTexture(TextureHandle handle) {
    std::optional<TextureInfo> removed = m_textures.remove(handle);
    if (!removed.has_value()) {
        return false;
    }
    releaseTexture(*removed);
    return true;
}

const TextureInfo* ResourceCache::texture(TextureHandle handle) const {
    return m_textures.get(handle);
}

void ResourceCache::setTextureLayout(TextureHandle handle, VkImageLayout layout) {
    if (TextureInfo* texture = m_textures.get(handle)) {
        texture->layout = layout;
    }
}

ResourceError ResourceCache::createSampler(const SamplerDesc& desc, SamplerHandle* outHandle) {
    if (outHandle == nullptr || m_context == nullptr) {
        return ResourceError::AllocationFailed;
    }
    *outHandle = SamplerHandle{};

    VkSamplerCreateInfo samplerInfo{};
    samplerInfo.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    samplerInfo.magFilter = desc.filter;
    samplerInfo.minFilter = desc.filter;
    samplerInfo.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
    samplerInfo.addressModeU = desc.addressMode;
    samplerInfo.addressModeV = desc.addressMode;
    samplerInfo.addressModeW = desc.addressMode;
    samplerInfo.maxLod = 0.0f;
    samplerInfo.borderColor = VK_BORDER_COLOR_FLOAT_OPAQUE_BLACK;

    VkSampler sampler = VK_NULL_HANDLE;
    const VkResult result = vkCreateSampler(m_context->device(), &samplerInfo, nullptr, &sampler);
    if (result != VK_SUCCESS) {
        logVkFailure("resources", "vkCreateSampler", result);
        return ResourceError::AllocationFailed;
    }
    if (!desc.debugName.empty()) {
        setDebugObjectName(m_context->device(), VK_OBJECT_TYPE_SAMPLER, vkHandleToUint64(sampler), desc.debugName);
    }
    *outHandle = m_samplers.insert(sampler);
    return ResourceError::None;
}

bool ResourceCache::destroySampler(SamplerHandle handle) {
    std::optional<VkSampler> removed = m_samplers.remove(handle);
    if (!removed.has_value()) {
        return false;
    }
    vkDestroySampler(m_context->device(), *removed, nullptr);
    return true;
}

VkSampler ResourceCache::sampler(SamplerHandle handle) const {
    const VkSampler* sampler = m_samplers.get(handle);
    return (sampler != nullptr) ? *sampler : VK_NULL_HANDLE;
}

bool ResourceCache::createStagingBuffer(VkDeviceSize size, bool hostReadable, StagingBuffer* outStaging) const {
    VkBufferCreateInfo bufferInfo{};
    bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufferInfo.size = size;
    bufferInfo.usage = hostReadable ? VK_BUFFER_USAGE_TRANSFER_DST_BIT : VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
    bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VmaAllocationCreateInfo allocationInfo{};
    allocationInfo.usage = VMA_MEMORY_USAGE_AUTO_PREFER_HOST;
    allocationInfo.flags = VMA_ALLOCATION_CREATE_MAPPED_BIT
        | (hostReadable ? VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT
                        : VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT);

    VmaAllocationInfo allocationResult{};
    const VkResult result = vmaCreateBuffer(
        m_context->allocator(),
        &bufferInfo,
        &allocationInfo,
        &outStaging->buffer,
        &outStaging->allocation,
        &allocationResult);
    if (result != VK_SUCCESS) {
        logVkFailure("resources", "vmaCreateBuffer(staging)", result);
        return false;
    }
    outStaging->mappedData = allocationResult.pMappedData;
    return true;
}

void ResourceCache::destroyStagingBuffer(StagingBuffer& staging) const {
    if (staging.buffer != VK_NULL_HANDLE) {
        vmaDestroyBuffer(m_context->allocator(), staging.buffer, staging.allocation);
    }
    staging = StagingBuffer{};
}

void ResourceCache::releaseBuffer(BufferSlot& slot) const {
    if (slot.buffer != VK_NULL_HANDLE) {
        vmaDestroyBuffer(m_context->allocator(), slot.buffer, slot.allocation);
    }
    slot = BufferSlot{};
}

void ResourceCache::releaseTexture(TextureInfo& texture) const {
    const VkDevice device = m_context->device();
    if (texture.arrayView != VK_NULL_HANDLE) {
        vkDestroyImageView(device, texture.arrayView, nullptr);
    }
    if (texture.view != VK_NULL_HANDLE) {
        vkDestroyImageView(device, texture.view, nullptr);
    }
    if (texture.image != VK_NULL_HANDLE) {
        vmaDestroyImage(m_context->allocator(), texture.image, texture.allocation);
    }
    texture = TextureInfo{};
}

} // namespace skygrid::render
