#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <vector>

#include "render/cubemap_math.h"
#include "render/environment_precompute.h"
#include "render/gpu_context.h"
#include "render/resource_cache.h"
#include "render/vk_utils.h"
#include "scene/assets.h"

namespace {

// Headless device shared by the tests in this file. Skips when the machine has no Vulkan 1.3 adapter.
class GpuResourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        skygrid::render::GpuContextConfig config{};
        config.applicationName = "skygrid_tests";
        const skygrid::render::DeviceInitError error = m_context.init(nullptr, config);
        if (error != skygrid::render::DeviceInitError::None) {
            GTEST_SKIP() << "no usable Vulkan adapter: " << skygrid::render::toString(error);
        }
        ASSERT_TRUE(m_cache.init(m_context));
    }

    void TearDown() override {
        m_precompute.shutdown();
        m_cache.shutdown();
        m_context.shutdown();
    }

    std::vector<float> readLayer(skygrid::render::TextureHandle handle, std::uint32_t layer, std::uint32_t size) {
        std::vector<float> texels(static_cast<std::size_t>(size) * size * 4u, -1.0f);
        const skygrid::render::ResourceError error = m_cache.readTextureLayer(
            handle,
            layer,
            texels.data(),
            static_cast<VkDeviceSize>(texels.size() * sizeof(float)));
        EXPECT_EQ(error, skygrid::render::ResourceError::None);
        return texels;
    }

    skygrid::render::GpuContext m_context;
    skygrid::render::ResourceCache m_cache;
    skygrid::render::EnvironmentPrecompute m_precompute;
};

TEST_F(GpuResourceTest, BufferWriteReadsBackAtOffset) {
    skygrid::render::BufferDesc desc{};
    desc.size = 256;
    desc.usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
    desc.hostReadable = true;
    desc.debugName = "test.readback";
    skygrid::render::BufferHandle handle{};
    ASSERT_EQ(m_cache.createBuffer(desc, &handle), skygrid::render::ResourceError::None);

    std::array<std::uint8_t, 64> written{};
    for (std::size_t i = 0; i < written.size(); ++i) {
        written[i] = static_cast<std::uint8_t>(i * 3u + 1u);
    }
    ASSERT_EQ(m_cache.writeBuffer(handle, 32, written.data(), written.size()), skygrid::render::ResourceError::None);

    std::array<std::uint8_t, 64> read{};
    ASSERT_EQ(m_cache.readBuffer(handle, 32, read.data(), read.size()), skygrid::render::ResourceError::None);
    EXPECT_EQ(read, written);
}

TEST_F(GpuResourceTest, InitialDataIsVisibleOnReadback) {
    std::array<std::uint8_t, 48> initial{};
    for (std::size_t i = 0; i < initial.size(); ++i) {
        initial[i] = static_cast<std::uint8_t>(255u - i);
    }
    skygrid::render::BufferDesc desc{};
    desc.size = initial.size();
    desc.usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
    desc.initialData = initial.data();
    desc.hostReadable = true;
    skygrid::render::BufferHandle handle{};
    ASSERT_EQ(m_cache.createBuffer(desc, &handle), skygrid::render::ResourceError::None);

    std::array<std::uint8_t, 48> read{};
    ASSERT_EQ(m_cache.readBuffer(handle, 0, read.data(), read.size()), skygrid::render::ResourceError::None);
    EXPECT_EQ(read, initial);
}

TEST_F(GpuResourceTest, DepthFormatHasNoStencilAspect) {
    const VkFormat depth = m_context.depthFormat();
    EXPECT_TRUE(skygrid::render::isDepthFormat(depth));
    EXPECT_NE(depth, VK_FORMAT_D24_UNORM_S8_UINT);
    EXPECT_NE(depth, VK_FORMAT_D32_SFLOAT_S8_UINT);
    EXPECT_NE(depth, VK_FORMAT_D16_UNORM_S8_UINT);
}

TEST_F(GpuResourceTest, BufferWritePastEndIsOutOfBounds) {
    skygrid::render::BufferDesc desc{};
    desc.size = 64;
    desc.usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
    skygrid::render::BufferHandle handle{};
    ASSERT_EQ(m_cache.createBuffer(desc, &handle), skygrid::render::ResourceError::None);

    const std::array<std::uint8_t, 16> data{};
    EXPECT_EQ(m_cache.writeBuffer(handle, 56, data.data(), data.size()), skygrid::render::ResourceError::OutOfBounds);
    EXPECT_EQ(m_cache.writeBuffer(handle, 48, data.data(), data.size()), skygrid::render::ResourceError::None);
}

TEST_F(GpuResourceTest, DestroyedBufferHandleIsStale) {
    skygrid::render::BufferDesc desc{};
    desc.size = 16;
    desc.usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
    skygrid::render::BufferHandle handle{};
    ASSERT_EQ(m_cache.createBuffer(desc, &handle), skygrid::render::ResourceError::None);
    ASSERT_TRUE(m_cache.destroyBuffer(handle));

    const std::array<std::uint8_t, 4> data{};
    EXPECT_EQ(m_cache.writeBuffer(handle, 0, data.data(), data.size()), skygrid::render::ResourceError::StaleHandle);
    EXPECT_EQ(m_cache.buffer(handle), VK_NULL_HANDLE);
    EXPECT_FALSE(m_cache.destroyBuffer(handle));
}

TEST_F(GpuResourceTest, CubeTextureKeepsPerFaceColors) {
    constexpr std::uint32_t kSize = 4;
    skygrid::render::TextureDesc desc{};
    desc.format = VK_FORMAT_R32G32B32A32_SFLOAT;
    desc.width = kSize;
    desc.height = kSize;
    desc.layerCount = 6;
    desc.usage = VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
    desc.debugName = "test.cube";
    skygrid::render::TextureHandle handle{};
    ASSERT_EQ(m_cache.createTexture(desc, &handle), skygrid::render::ResourceError::None);

    const skygrid::render::TextureInfo* info = m_cache.texture(handle);
    ASSERT_NE(info, nullptr);
    EXPECT_NE(info->view, VK_NULL_HANDLE);
    EXPECT_NE(info->arrayView, VK_NULL_HANDLE);

    for (std::uint32_t face = 0; face < skygrid::render::kCubemapFaceCount; ++face) {
        std::vector<float> texels(kSize * kSize * 4u);
        for (std::size_t i = 0; i < texels.size(); i += 4) {
            texels[i + 0] = static_cast<float>(face);
            texels[i + 1] = 0.5f;
            texels[i + 2] = static_cast<float>(face) * 0.25f;
            texels[i + 3] = 1.0f;
        }
        ASSERT_EQ(
            m_cache.uploadTextureLayer(handle, face, texels.data(), texels.size() * sizeof(float)),
            skygrid::render::ResourceError::None);
    }

    for (std::uint32_t face = 0; face < skygrid::render::kCubemapFaceCount; ++face) {
        const std::vector<float> texels = readLayer(handle, face, kSize);
        EXPECT_FLOAT_EQ(texels[0], static_cast<float>(face)) << "face=" << face;
        EXPECT_FLOAT_EQ(texels[texels.size() - 2], static_cast<float>(face) * 0.25f) << "face=" << face;
    }
}

TEST_F(GpuResourceTest, CubeViewSamplesFaceTexelsByDirection) {
    constexpr std::uint32_t kSize = 4;
    constexpr std::uint32_t kFaceCount = skygrid::render::kCubemapFaceCount;
    constexpr std::uint32_t kSampleCount = kFaceCount * kSize * kSize;
    const VkDevice device = m_context.device();

    // Every texel stores (face, x, y) so a sample names the texel it came from.
    skygrid::render::TextureDesc desc{};
    desc.format = VK_FORMAT_R32G32B32A32_SFLOAT;
    desc.width = kSize;
    desc.height = kSize;
    desc.layerCount = kFaceCount;
    desc.usage = VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    desc.debugName = "test.cube_sampled";
    skygrid::render::TextureHandle cube{};
    ASSERT_EQ(m_cache.createTexture(desc, &cube), skygrid::render::ResourceError::None);
    for (std::uint32_t face = 0; face < kFaceCount; ++face) {
        std::vector<float> texels(kSize * kSize * 4u);
        for (std::uint32_t y = 0; y < kSize; ++y) {
            for (std::uint32_t x = 0; x < kSize; ++x) {
                float* texel = &texels[(y * kSize + x) * 4u];
                texel[0] = static_cast<float>(face);
                texel[1] = static_cast<float>(x);
                texel[2] = static_cast<float>(y);
                texel[3] = 1.0f;
            }
        }
        ASSERT_EQ(
            m_cache.uploadTextureLayer(cube, face, texels.data(), texels.size() * sizeof(float)),
            skygrid::render::ResourceError::None);
    }

    skygrid::render::SamplerDesc samplerDesc{};
    samplerDesc.filter = VK_FILTER_NEAREST;
    samplerDesc.addressMode = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    skygrid::render::SamplerHandle sampler{};
    ASSERT_EQ(m_cache.createSampler(samplerDesc, &sampler), skygrid::render::ResourceError::None);

    std::vector<float> directions(kSampleCount * 4u, 0.0f);
    for (std::uint32_t face = 0; face < kFaceCount; ++face) {
        for (std::uint32_t y = 0; y < kSize; ++y) {
            for (std::uint32_t x = 0; x < kSize; ++x) {
                const skygrid::core::Vec3 direction = skygrid::render::cubemapTexelDirection(
                    static_cast<skygrid::render::CubemapFace>(face), x, y, kSize);
                float* out = &directions[((face * kSize + y) * kSize + x) * 4u];
                out[0] = direction.x;
                out[1] = direction.y;
                out[2] = direction.z;
            }
        }
    }

    skygrid::render::BufferDesc directionDesc{};
    directionDesc.size = directions.size() * sizeof(float);
    directionDesc.usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
    directionDesc.initialData = directions.data();
    directionDesc.debugName = "test.cube_directions";
    skygrid::render::BufferHandle directionBuffer{};
    ASSERT_EQ(m_cache.createBuffer(directionDesc, &directionBuffer), skygrid::render::ResourceError::None);

    skygrid::render::BufferDesc sampleDesc{};
    sampleDesc.size = directionDesc.size;
    sampleDesc.usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
    sampleDesc.hostReadable = true;
    sampleDesc.debugName = "test.cube_samples";
    skygrid::render::BufferHandle sampleBuffer{};
    ASSERT_EQ(m_cache.createBuffer(sampleDesc, &sampleBuffer), skygrid::render::ResourceError::None);

    std::array<VkDescriptorSetLayoutBinding, 3> bindings{};
    bindings[0].binding = 0;
    bindings[0].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    bindings[0].descriptorCount = 1;
    bindings[0].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
    bindings[1].binding = 1;
    bindings[1].descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    bindings[1].descriptorCount = 1;
    bindings[1].stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;
    bindings[2] = bindings[1];
    bindings[2].binding = 2;
    VkDescriptorSetLayoutCreateInfo setLayoutInfo{};
    setLayoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    setLayoutInfo.bindingCount = static_cast<std::uint32_t>(bindings.size());
    setLayoutInfo.pBindings = bindings.data();
    VkDescriptorSetLayout setLayout = VK_NULL_HANDLE;
    ASSERT_EQ(vkCreateDescriptorSetLayout(device, &setLayoutInfo, nullptr, &setLayout), VK_SUCCESS);

    std::array<VkDescriptorPoolSize, 2> poolSizes{};
    poolSizes[0].type = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    poolSizes[0].descriptorCount = 1;
    poolSizes[1].type = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    poolSizes[1].descriptorCount = 2;
    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.maxSets = 1;
    poolInfo.poolSizeCount = static_cast<std::uint32_t>(poolSizes.size());
    poolInfo.pPoolSizes = poolSizes.data();
    VkDescriptorPool pool = VK_NULL_HANDLE;
    ASSERT_EQ(vkCreateDescriptorPool(device, &poolInfo, nullptr, &pool), VK_SUCCESS);

    VkDescriptorSetAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorPool = pool;
    allocInfo.descriptorSetCount = 1;
    allocInfo.pSetLayouts = &setLayout;
    VkDescriptorSet descriptorSet = VK_NULL_HANDLE;
    ASSERT_EQ(vkAllocateDescriptorSets(device, &allocInfo, &descriptorSet), VK_SUCCESS);

    VkDescriptorImageInfo imageInfo{};
    imageInfo.sampler = m_cache.sampler(sampler);
    imageInfo.imageView = m_cache.texture(cube)->view;
    imageInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    VkDescriptorBufferInfo directionInfo{};
    directionInfo.buffer = m_cache.buffer(directionBuffer);
    directionInfo.range = VK_WHOLE_SIZE;
    VkDescriptorBufferInfo sampleInfo{};
    sampleInfo.buffer = m_cache.buffer(sampleBuffer);
    sampleInfo.range = VK_WHOLE_SIZE;
    std::array<VkWriteDescriptorSet, 3> writes{};
    for (std::uint32_t i = 0; i < writes.size(); ++i) {
        writes[i].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        writes[i].dstSet = descriptorSet;
        writes[i].dstBinding = i;
        writes[i].descriptorCount = 1;
        writes[i].descriptorType = bindings[i].descriptorType;
    }
    writes[0].pImageInfo = &imageInfo;
    writes[1].pBufferInfo = &directionInfo;
    writes[2].pBufferInfo = &sampleInfo;
    vkUpdateDescriptorSets(device, static_cast<std::uint32_t>(writes.size()), writes.data(), 0, nullptr);

    VkPipelineLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layoutInfo.setLayoutCount = 1;
    layoutInfo.pSetLayouts = &setLayout;
    VkPipelineLayout pipelineLayout = VK_NULL_HANDLE;
    ASSERT_EQ(vkCreatePipelineLayout(device, &layoutInfo, nullptr, &pipelineLayout), VK_SUCCESS);

    const VkShaderModule shaderModule =
        skygrid::render::createShaderModuleFromFile(device, SKYGRID_SHADER_DIR, "cubemap_sample.comp");
    ASSERT_NE(shaderModule, VK_NULL_HANDLE);
    VkComputePipelineCreateInfo pipelineInfo{};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
    pipelineInfo.stage.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    pipelineInfo.stage.stage = VK_SHADER_STAGE_COMPUTE_BIT;
    pipelineInfo.stage.module = shaderModule;
    pipelineInfo.stage.pName = "main";
    pipelineInfo.layout = pipelineLayout;
    VkPipeline pipeline = VK_NULL_HANDLE;
    const VkResult pipelineResult =
        vkCreateComputePipelines(device, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline);
    vkDestroyShaderModule(device, shaderModule, nullptr);
    ASSERT_EQ(pipelineResult, VK_SUCCESS);

    const bool submitted = m_context.submitImmediate([&](VkCommandBuffer commandBuffer) {
        vkCmdBindPipeline(commandBuffer, VK_PIPELINE_BIND_POINT_COMPUTE, pipeline);
        vkCmdBindDescriptorSets(
            commandBuffer, VK_PIPELINE_BIND_POINT_COMPUTE, pipelineLayout, 0, 1, &descriptorSet, 0, nullptr);
        vkCmdDispatch(commandBuffer, (kSampleCount + 63u) / 64u, 1, 1);

        VkMemoryBarrier2 toHost{};
        toHost.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2;
        toHost.srcStageMask = VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT;
        toHost.srcAccessMask = VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT;
        toHost.dstStageMask = VK_PIPELINE_STAGE_2_HOST_BIT;
        toHost.dstAccessMask = VK_ACCESS_2_HOST_READ_BIT;
        VkDependencyInfo dependency{};
        dependency.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        dependency.memoryBarrierCount = 1;
        dependency.pMemoryBarriers = &toHost;
        vkCmdPipelineBarrier2(commandBuffer, &dependency);
    });
    EXPECT_TRUE(submitted);

    std::vector<float> samples(directions.size(), -1.0f);
    EXPECT_EQ(
        m_cache.readBuffer(sampleBuffer, 0, samples.data(), samples.size() * sizeof(float)),
        skygrid::render::ResourceError::None);

    vkDestroyPipeline(device, pipeline, nullptr);
    vkDestroyPipelineLayout(device, pipelineLayout, nullptr);
    vkDestroyDescriptorPool(device, pool, nullptr);
    vkDestroyDescriptorSetLayout(device, setLayout, nullptr);

    for (std::uint32_t face = 0; face < kFaceCount; ++face) {
        for (std::uint32_t y = 0; y < kSize; ++y) {
            for (std::uint32_t x = 0; x < kSize; ++x) {
                const float* sample = &samples[((face * kSize + y) * kSize + x) * 4u];
                EXPECT_FLOAT_EQ(sample[0], static_cast<float>(face)) << "face=" << face << " x=" << x << " y=" << y;
                EXPECT_FLOAT_EQ(sample[1], static_cast<float>(x)) << "face=" << face << " x=" << x << " y=" << y;
                EXPECT_FLOAT_EQ(sample[2], static_cast<float>(y)) << "face=" << face << " x=" << x << " y=" << y;
            }
        }
    }
}

TEST_F(GpuResourceTest, CubeTextureRejectsWrongLayerCount) {
    skygrid::render::TextureDesc desc{};
    desc.format = VK_FORMAT_R8G8B8A8_UNORM;
    desc.width = 4;
    desc.height = 4;
    desc.layerCount = 3;
    desc.usage = VK_IMAGE_USAGE_SAMPLED_BIT;
    skygrid::render::TextureHandle handle{};
    EXPECT_NE(m_cache.createTexture(desc, &handle), skygrid::render::ResourceError::None);
    EXPECT_FALSE(handle.isValid());
}

TEST_F(GpuResourceTest, UniformEquirectGivesUniformFaces) {
    ASSERT_TRUE(m_precompute.init(m_context, m_cache, SKYGRID_SHADER_DIR));
    const skygrid::render::EquirectImage source = skygrid::scene::makeUniformEquirect(32, 0.2f, 0.4f, 0.8f);

    constexpr std::uint32_t kFaceSize = 16;
    skygrid::render::TextureHandle cubemap{};
    ASSERT_EQ(m_precompute.build(source, kFaceSize, &cubemap), skygrid::render::PrecomputeError::None);

    for (std::uint32_t face = 0; face < skygrid::render::kCubemapFaceCount; ++face) {
        const std::vector<float> texels = readLayer(cubemap, face, kFaceSize);
        for (std::size_t i = 0; i < texels.size(); i += 4) {
            ASSERT_NEAR(texels[i + 0], 0.2f, 1e-5f) << "face=" << face << " texel=" << (i / 4);
            ASSERT_NEAR(texels[i + 1], 0.4f, 1e-5f) << "face=" << face << " texel=" << (i / 4);
            ASSERT_NEAR(texels[i + 2], 0.8f, 1e-5f) << "face=" << face << " texel=" << (i / 4);
        }
    }
}

TEST_F(GpuResourceTest, CubemapTexelsMatchEquirectDirections) {
    ASSERT_TRUE(m_precompute.init(m_context, m_cache, SKYGRID_SHADER_DIR));

    // Each source texel stores the direction it represents.
    skygrid::render::EquirectImage source{};
    source.height = 256;
    source.width = 512;
    source.rgba.resize(static_cast<std::size_t>(source.width) * source.height * 4u);
    for (std::uint32_t row = 0; row < source.height; ++row) {
        for (std::uint32_t column = 0; column < source.width; ++column) {
            skygrid::render::EquirectUv uv{};
            uv.u = (static_cast<float>(column) + 0.5f) / static_cast<float>(source.width);
            uv.v = (static_cast<float>(row) + 0.5f) / static_cast<float>(source.height);
            const skygrid::core::Vec3 direction = skygrid::render::equirectUvToDirection(uv);
            float* texel = &source.rgba[(static_cast<std::size_t>(row) * source.width + column) * 4u];
            texel[0] = direction.x;
            texel[1] = direction.y;
            texel[2] = direction.z;
            texel[3] = 1.0f;
        }
    }

    constexpr std::uint32_t kFaceSize = 8;
    skygrid::render::TextureHandle cubemap{};
    ASSERT_EQ(m_precompute.build(source, kFaceSize, &cubemap), skygrid::render::PrecomputeError::None);

    for (std::uint32_t face = 0; face < skygrid::render::kCubemapFaceCount; ++face) {
        const std::vector<float> texels = readLayer(cubemap, face, kFaceSize);
        for (std::uint32_t y = 0; y < kFaceSize; ++y) {
            for (std::uint32_t x = 0; x < kFaceSize; ++x) {
                const skygrid::core::Vec3 expected = skygrid::render::cubemapTexelDirection(
                    static_cast<skygrid::render::CubemapFace>(face), x, y, kFaceSize);
                const float* texel = &texels[(static_cast<std::size_t>(y) * kFaceSize + x) * 4u];
                const float alignment = (texel[0] * expected.x) + (texel[1] * expected.y) + (texel[2] * expected.z);
                EXPECT_GT(alignment, 0.99f) << "face=" << face << " x=" << x << " y=" << y;
            }
        }
    }
}

TEST_F(GpuResourceTest, SecondBuildReturnsSameCubemap) {
    ASSERT_TRUE(m_precompute.init(m_context, m_cache, SKYGRID_SHADER_DIR));
    const skygrid::render::EquirectImage source = skygrid::scene::makeUniformEquirect(16, 1.0f, 1.0f, 1.0f);
    skygrid::render::TextureHandle first{};
    skygrid::render::TextureHandle second{};
    ASSERT_EQ(m_precompute.build(source, 16, &first), skygrid::render::PrecomputeError::None);
    ASSERT_EQ(m_precompute.build(source, 16, &second), skygrid::render::PrecomputeError::None);
    EXPECT_EQ(first, second);
}

TEST_F(GpuResourceTest, RebuildValidatesNewSource) {
    ASSERT_TRUE(m_precompute.init(m_context, m_cache, SKYGRID_SHADER_DIR));
    const skygrid::render::EquirectImage good = skygrid::scene::makeUniformEquirect(16, 1.0f, 1.0f, 1.0f);
    skygrid::render::TextureHandle first{};
    ASSERT_EQ(m_precompute.build(good, 16, &first), skygrid::render::PrecomputeError::None);

    skygrid::render::EquirectImage wide{};
    wide.width = 48;
    wide.height = 32;
    wide.rgba.assign(48u * 32u * 4u, 1.0f);
    skygrid::render::TextureHandle second{};
    EXPECT_EQ(m_precompute.build(wide, 16, &second), skygrid::render::PrecomputeError::BadImageAspect);
    EXPECT_FALSE(second.isValid());
    EXPECT_EQ(m_precompute.cubemap(), first);
}

TEST_F(GpuResourceTest, DifferentSourceReplacesCubemap) {
    ASSERT_TRUE(m_precompute.init(m_context, m_cache, SKYGRID_SHADER_DIR));
    constexpr std::uint32_t kFaceSize = 8;
    const skygrid::render::EquirectImage white = skygrid::scene::makeUniformEquirect(16, 1.0f, 1.0f, 1.0f);
    const skygrid::render::EquirectImage red = skygrid::scene::makeUniformEquirect(16, 1.0f, 0.0f, 0.0f);
    EXPECT_NE(skygrid::render::equirectContentKey(white), skygrid::render::equirectContentKey(red));

    skygrid::render::TextureHandle first{};
    ASSERT_EQ(m_precompute.build(white, kFaceSize, &first), skygrid::render::PrecomputeError::None);
    skygrid::render::TextureHandle second{};
    ASSERT_EQ(m_precompute.build(red, kFaceSize, &second), skygrid::render::PrecomputeError::None);
    EXPECT_NE(first, second);
    EXPECT_EQ(m_cache.texture(first), nullptr);

    const std::vector<float> texels = readLayer(second, 0, kFaceSize);
    EXPECT_NEAR(texels[0], 1.0f, 1e-5f);
    EXPECT_NEAR(texels[1], 0.0f, 1e-5f);
}

TEST_F(GpuResourceTest, SquareEquirectIsRejected) {
    ASSERT_TRUE(m_precompute.init(m_context, m_cache, SKYGRID_SHADER_DIR));
    skygrid::render::EquirectImage source{};
    source.width = 32;
    source.height = 32;
    source.rgba.assign(32u * 32u * 4u, 1.0f);
    skygrid::render::TextureHandle cubemap{};
    EXPECT_EQ(m_precompute.build(source, 16, &cubemap), skygrid::render::PrecomputeError::BadImageAspect);
    EXPECT_FALSE(cubemap.isValid());
}

}  // namespace
