#pragma once

#include "render/render_status.h"
#include "render/resource_cache.h"
#include "scene/assets.h"

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>

namespace skygrid::render {

class GpuContext;

using EquirectImage = scene::EquirectImage;

constexpr std::uint32_t kEquirectWorkgroupSize = 16;

[[nodiscard]] PrecomputeError validateEquirectDimensions(std::uint32_t width, std::uint32_t height);
[[nodiscard]] std::uint32_t equirectDispatchGroups(std::uint32_t faceSize);
// Identifies an equirect source by its dimensions and texel contents.
[[nodiscard]] std::uint64_t equirectContentKey(const EquirectImage& source);

// Converts an equirectangular sky into a cubemap once at startup with a compute dispatch.
// The result stays alive in the resource cache for the rest of the run. A second build() from the
// same source hands back the same texture; a different source replaces it. Sources are validated
// on every call.
class EnvironmentPrecompute {
public:
    EnvironmentPrecompute() = default;
    ~EnvironmentPrecompute();

    EnvironmentPrecompute(const EnvironmentPrecompute&) = delete;
    EnvironmentPrecompute& operator=(const EnvironmentPrecompute&) = delete;

    bool init(GpuContext& context, ResourceCache& cache, const std::string& shaderDir);
    void shutdown();

    [[nodiscard]] PrecomputeError build(const EquirectImage& source, std::uint32_t faceSize, TextureHandle* outCubemap);

    [[nodiscard]] TextureHandle cubemap() const { return m_cubemap; }
    // Nearest, clamp-to-edge. Shared by the skybox pass.
    [[nodiscard]] SamplerHandle cubemapSampler() const { return m_cubemapSampler; }

private:
    bool createDescriptorResources();
    bool createPipeline(const std::string& shaderDir);

    GpuContext* m_context = nullptr;
    ResourceCache* m_cache = nullptr;

    VkDescriptorSetLayout m_descriptorSetLayout = VK_NULL_HANDLE;
    VkDescriptorPool m_descriptorPool = VK_NULL_HANDLE;
    VkPipelineLayout m_pipelineLayout = VK_NULL_HANDLE;
    VkPipeline m_pipeline = VK_NULL_HANDLE;

    SamplerHandle m_sourceSampler{};
    SamplerHandle m_cubemapSampler{};
    TextureHandle m_cubemap{};
    std::uint64_t m_sourceKey = 0;
    std::uint32_t m_faceSize = 0;
};

} // namespace skygrid::render
