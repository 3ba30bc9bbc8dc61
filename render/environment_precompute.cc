#include "render/environment_precompute.h"

#include "core/log.h"
#include "render/gpu_context.h"
#include "render/vk_utils.h"

#include <array>
#include <chrono>
#include <cstddef>

namespace skygrid::render {

PrecomputeError validateEquirectDimensions(std::uint32_t width, std::uint32_t height) {
    if (width == 0 || height == 0 || width != 2u * height) {
        return PrecomputeError::BadImageAspect;
    }
    return PrecomputeError::None;
}

std::uint32_t equirectDispatchGroups(std::uint32_t faceSize) {
    return (faceSize + kEquirectWorkgroupSize - 1) / kEquirectWorkgroupSize;
}

std::uint64_t equirectContentKey(const EquirectImage& source) {
    // FNV-1a over the dimensions and the raw texel bytes.
    std::uint64_t key = 14695981039346656037ull;
    auto mix = [&key](const unsigned char* bytes, std::size_t count) {
        for (std::size_t i = 0; i < count; ++i) {
            key ^= bytes[i];
            key *= 1099511628211ull;
        }
    };
    mix(reinterpret_cast<const unsigned char*>(&source.width), sizeof(source.width));
    mix(reinterpret_cast<const unsigned char*>(&source.height), sizeof(source.height));
    mix(reinterpret_cast<const unsigned char*>(source.rgba.data()), source.rgba.size() * sizeof(float));
    return key;
}

EnvironmentPrecompute::~EnvironmentPrecompute() {
    shutdown();
}

bool EnvironmentPrecompute::init(GpuContext& context, ResourceCache& cache, const std::string& shaderDir) {
    m_context = &context;
    m_cache = &cache;

    // 32-bit float filtering is optional hardware support.
    VkFormatProperties formatProperties{};
    vkGetPhysicalDeviceFormatProperties(context.physicalDevice(), VK_FORMAT_R32G32B32A32_SFLOAT, &formatProperties);
    const bool canFilterLinear =
        (formatProperties.optimalTilingFeatures & VK_FORMAT_FEATURE_SAMPLED_IMAGE_FILTER_LINEAR_BIT) != 0;
    if ((formatProperties.optimalTilingFeatures & VK_FORMAT_FEATURE_STORAGE_IMAGE_BIT) == 0) {
        SKYGRID_LOGE("precompute") << "R32G32B32A32_SFLOAT storage images are not supported";
        return false;
    }

    SamplerDesc sourceSamplerDesc{};
    sourceSamplerDesc.filter = canFilterLinear ? VK_FILTER_LINEAR : VK_FILTER_NEAREST;
    sourceSamplerDesc.addressMode = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    sourceSamplerDesc.debugName = "environment.equirect.sampler";
    if (cache.createSampler(sourceSamplerDesc, &m_sourceSampler) != ResourceError::None) {
        return false;
    }

    SamplerDesc cubemapSamplerDesc{};
    cubemapSamplerDesc.filter = VK_FILTER_NEAREST;
    cubemapSamplerDesc.addressMode = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    cubemapSamplerDesc.debugName = "environment.cubemap.sampler";
    if (cache.createSampler(cubemapSamplerDesc, &m_cubemapSampler) != ResourceError::None) {
        return false;
    }

    return createDescriptorResources() && createPipeline(shaderDir);
}

bool EnvironmentPrecompute::createDescriptorResources() {
    const VkDevice device = m_context->device();

    std::array<VkDescriptorSetLayoutBinding, 2> bindings{};
    bindings[0].binding = 0;
    bindings[0].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    bindings[0].descriptorCount = 1;
    bindings[0].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
    bindings[1].binding = 1;
    bindings[1].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    bindings[1].descriptorCount = 1;
    bindings[1].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;

    VkDescriptorSetLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutInfo.bindingCount = static_cast<std::uint32_t>(bindings.size());
    layoutInfo.pBindings = bindings.data();
    VkResult result = vkCreateDescriptorSetLayout(device, &layoutInfo, nullptr, &m_descriptorSetLayout);
    if (result != VK_SUCCESS) {
        logVkFailure("precompute", "vkCreateDescriptorSetLayout(equirect)", result);
        return false;
    }

    const std::array<VkDescriptorPoolSize, 2> poolSizes = {{
        {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 1},
        {VK_DESCRIPTOR_TYPE_STORAGE_IMAGE, 1},
    }};
    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.maxSets = 1;
    poolInfo.poolSizeCount = static_cast<std::uint32_t>(poolSizes.size());
    poolInfo.pPoolSizes = poolSizes.data();
    result = vkCreateDescriptorPool(device, &poolInfo, nullptr, &m_descriptorPool);
    if (result != VK_SUCCESS) {
        logVkFailure("precompute", "vkCreateDescriptorPool(equirect)", result);
        return false;
    }
    return true;
}

bool EnvironmentPrecompute::createPipeline(const std::string& shaderDir) {
    const VkDevice device = m_context->device();

    VkPipelineLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layoutInfo.setLayoutCount = 1;
    layoutInfo.pSetLayouts = &m_descriptorSetLayout;
    VkResult result = vkCreatePipelineLayout(device, &layoutInfo, nullptr, &m_pipelineLayout);
    if (result != VK_SUCCESS) {
        logVkFailure("precompute", "vkCreatePipelineLayout(equirect)", result);
        return false;
    }

    const VkShaderModule shaderModule = createShaderModuleFromFile(device, shaderDir, "equirect_to_cubemap.comp");
    if (shaderModule == VK_NULL_HANDLE) {
        return false;
    }

    VkComputePipelineCreateInfo pipelineInfo{};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
    pipelineInfo.stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    pipelineInfo.stage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
    pipelineInfo.stage.module = shaderModule;
    pipelineInfo.stage.pName = "main";
    pipelineInfo.layout = m_pipelineLayout;
    result = vkCreateComputePipelines(device, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &m_pipeline);
    vkDestroyShaderModule(device, shaderModule, nullptr);
    if (result != VK_SUCCESS) {
        logVkFailure("precompute", "vkCreateComputePipelines(equirect_to_cubemap)", result);
        return false;
    }
    setDebugObjectName(device, VK_OBJECT_TYPE_PIPELINE, vkHandleToUint64(m_pipeline), "pipeline.equirect_to_cubemap");
    return true;
}

PrecomputeError EnvironmentPrecompute::build(const EquirectImage& source, std::uint32_t faceSize, TextureHandle* outCubemap) {
    if (outCubemap == nullptr || m_pipeline == VK_NULL_HANDLE) {
        return PrecomputeError::DispatchFailed;
    }
    *outCubemap = TextureHandle{};

    const PrecomputeError shapeCheck = validateEquirectDimensions(source.width, source.height);
    if (shapeCheck != PrecomputeError::None) {
        SKYGRID_LOGE("precompute") << "equirect source must be 2:1, got " << source.width << "x" << source.height;
        return shapeCheck;
    }
    if (source.rgba.size() != static_cast<std::size_t>(source.width) * source.height * 4u) {
        SKYGRID_LOGE("precompute") << "equirect source holds " << source.rgba.size() << " floats for "
                                   << source.width << "x" << source.height << " RGBA texels";
        return PrecomputeError::BadImageAspect;
    }
    if (faceSize == 0) {
        return PrecomputeError::BadImageAspect;
    }

    const std::uint64_t sourceKey = equirectContentKey(source);
    if (m_cache->texture(m_cubemap) != nullptr) {
        if (sourceKey == m_sourceKey && faceSize == m_faceSize) {
            *outCubemap = m_cubemap;
            return PrecomputeError::None;
        }
        SKYGRID_LOGI("precompute") << "equirect source changed, rebuilding cubemap";
    }

    const auto buildStart = std::chrono::steady_clock::now();

    TextureDesc sourceDesc{};
    sourceDesc.format = VK_FORMAT_R32G32B32A32_SFLOAT;
    sourceDesc.width = source.width;
    sourceDesc.height = source.height;
    sourceDesc.usage = VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    sourceDesc.debugName = "environment.equirect";
    TextureHandle sourceTexture{};
    if (m_cache->createTexture(sourceDesc, &sourceTexture) != ResourceError::None) {
        return PrecomputeError::DispatchFailed;
    }
    const ResourceError uploadResult = m_cache->uploadTextureLayer(
        sourceTexture,
        0,
        source.rgba.data(),
        static_cast<VkDeviceSize>(source.rgba.size() * sizeof(float)));
    if (uploadResult != ResourceError::None) {
        SKYGRID_LOGE("precompute") << "equirect upload failed: " << toString(uploadResult);
        m_cache->destroyTexture(sourceTexture);
        return PrecomputeError::DispatchFailed;
    }

    TextureDesc cubemapDesc{};
    cubemapDesc.format = VK_FORMAT_R32G32B32A32_SFLOAT;
    cubemapDesc.width = faceSize;
    cubemapDesc.height = faceSize;
    cubemapDesc.layerCount = 6;
    cubemapDesc.usage = VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
    cubemapDesc.debugName = "environment.cubemap";
    TextureHandle cubemap{};
    if (m_cache->createTexture(cubemapDesc, &cubemap) != ResourceError::None) {
        m_cache->destroyTexture(sourceTexture);
        return PrecomputeError::DispatchFailed;
    }

    auto releaseOnFailure = [&]() {
        m_cache->destroyTexture(cubemap);
        m_cache->destroyTexture(sourceTexture);
        return PrecomputeError::DispatchFailed;
    };

    const VkDevice device = m_context->device();
    vkResetDescriptorPool(device, m_descriptorPool, 0);
    VkDescriptorSetAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorPool = m_descriptorPool;
    allocInfo.descriptorSetCount = 1;
    allocInfo.pSetLayouts = &m_descriptorSetLayout;
    VkDescriptorSet descriptorSet = VK_NULL_HANDLE;
    const VkResult allocResult = vkAllocateDescriptorSets(device, &allocInfo, &descriptorSet);
    if (allocResult != VK_SUCCESS) {
        logVkFailure("precompute", "vkAllocateDescriptorSets(equirect)", allocResult);
        return releaseOnFailure();
    }

    const TextureInfo* sourceInfo = m_cache->texture(sourceTexture);
    const TextureInfo* cubemapInfo = m_cache->texture(cubemap);

    VkDescriptorImageInfo sourceImageInfo{};
    sourceImageInfo.sampler = m_cache->sampler(m_sourceSampler);
    sourceImageInfo.imageView = sourceInfo->view;
    sourceImageInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    VkDescriptorImageInfo storageImageInfo{};
    storageImageInfo.imageView = cubemapInfo->arrayView;
    storageImageInfo.imageLayout = VK_IMAGE_LAYOUT_GENERAL;

    std::array<VkWriteDescriptorSet, 2> writes{};
    writes[0].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    writes[0].dstSet = descriptorSet;
    writes[0].dstBinding = 0;
    writes[0].descriptorCount = 1;
    writes[0].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    writes[0].pImageInfo = &sourceImageInfo;
    writes[1].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    writes[1].dstSet = descriptorSet;
    writes[1].dstBinding = 1;
    writes[1].descriptorCount = 1;
    writes[1].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_IMAGE;
    writes[1].pImageInfo = &storageImageInfo;
    vkUpdateDescriptorSets(device, static_cast<std::uint32_t>(writes.size()), writes.data(), 0, nullptr);

    const VkImage cubemapImage = cubemapInfo->image;
    const std::uint32_t groups = equirectDispatchGroups(faceSize);
    const bool submitted = m_context->submitImmediate([&](VkCommandBuffer commandBuffer) {
        const VkImageMemoryBarrier2 toGeneral = imageBarrier(
            cubemapImage,
            VK_IMAGE_LAYOUT_UNDEFINED,
            VK_IMAGE_LAYOUT_GENERAL,
            VK_PIPELINE_STAGE_2_NONE,
            VK_ACCESS_2_NONE,
            VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT,
            VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT,
            VK_IMAGE_ASPECT_COLOR_BIT,
            0,
            6);
        cmdImageBarriers(commandBuffer, &toGeneral, 1);

        vkCmdBindPipeline(commandBuffer, VK_PIPELINE_BIND_POINT_COMPUTE, m_pipeline);
        vkCmdBindDescriptorSets(
            commandBuffer,
            VK_PIPELINE_BIND_POINT_COMPUTE,
            m_pipelineLayout,
            0,
            1,
            &descriptorSet,
            0,
            nullptr);
        vkCmdDispatch(commandBuffer, groups, groups, 6);

        const VkImageMemoryBarrier2 toSampled = imageBarrier(
            cubemapImage,
            VK_IMAGE_LAYOUT_GENERAL,
            VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL,
            VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT,
            VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT,
            VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT | VK_PIPELINE_STAGE_2_COPY_BIT,
            VK_ACCESS_2_SHADER_SAMPLED_READ_BIT | VK_ACCESS_2_TRANSFER_READ_BIT,
            VK_IMAGE_ASPECT_COLOR_BIT,
            0,
            6);
        cmdImageBarriers(commandBuffer, &toSampled, 1);
    });
    if (!submitted) {
        SKYGRID_LOGE("precompute") << "equirect to cubemap dispatch failed";
        return releaseOnFailure();
    }

    // The immediate submit waited on its fence, so the source is no longer referenced.
    m_cache->destroyTexture(sourceTexture);
    m_cache->setTextureLayout(cubemap, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
    // Holders of the previous cubemap see a stale handle from here on.
    if (m_cache->texture(m_cubemap) != nullptr) {
        m_context->waitIdle();
        m_cache->destroyTexture(m_cubemap);
    }
    m_cubemap = cubemap;
    m_sourceKey = sourceKey;
    m_faceSize = faceSize;
    *outCubemap = cubemap;

    const auto tookMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - buildStart).count();
    SKYGRID_LOGI("precompute") << "cubemap " << faceSize << "x" << faceSize << "x6 from " << source.width << "x"
                               << source.height << " equirect in " << tookMs << " ms (" << groups << "x" << groups
                               << "x6 groups)";
    return PrecomputeError::None;
}

void EnvironmentPrecompute::shutdown() {
    if (m_context == nullptr) {
        return;
    }
    const VkDevice device = m_context->device();
    if (device != VK_NULL_HANDLE) {
        if (m_pipeline != VK_NULL_HANDLE) {
            vkDestroyPipeline(device, m_pipeline, nullptr);
        }
        if (m_pipelineLayout != VK_NULL_HANDLE) {
            vkDestroyPipelineLayout(device, m_pipelineLayout, nullptr);
        }
        if (m_descriptorPool != VK_NULL_HANDLE) {
            vkDestroyDescriptorPool(device, m_descriptorPool, nullptr);
        }
        if (m_descriptorSetLayout != VK_NULL_HANDLE) {
            vkDestroyDescriptorSetLayout(device, m_descriptorSetLayout, nullptr);
        }
    }
    m_pipeline = VK_NULL_HANDLE;
    m_pipelineLayout = VK_NULL_HANDLE;
    m_descriptorPool = VK_NULL_HANDLE;
    m_descriptorSetLayout = VK_NULL_HANDLE;

    // The cubemap and samplers stay with the cache, which frees them in its own shutdown.
    m_cubemap = TextureHandle{};
    m_sourceSampler = SamplerHandle{};
    m_cubemapSampler = SamplerHandle{};
    m_context = nullptr;
    m_cache = nullptr;
}

} // namespace skygrid::render
