#pragma once

#include "render/frame_graph.h"
#include "render/gpu_context.h"
#include "render/render_status.h"
#include "render/resource_cache.h"

#include <vulkan/vulkan.h>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace skygrid::render {

// Passes, resources and their fixed order: light marker, objects, then skybox.
struct ScenePassPlan {
    FrameGraph::PassId lightMarker = 0;
    FrameGraph::PassId objects = 0;
    FrameGraph::PassId skybox = 0;
    FrameGraph::ResourceId sceneDepth = 0;
    FrameGraph::ResourceId swapchainColor = 0;
    FrameGraph::ResourceId environmentCubemap = 0;
    std::vector<FrameGraph::PassId> executionOrder;
    std::vector<std::uint32_t> passOrderById;
};

std::optional<ScenePassPlan> buildScenePassPlan(FrameGraph* frameGraph);

// Logs any pass recorded earlier in the frame than a pass already recorded.
class PassOrderValidator {
public:
    explicit PassOrderValidator(const ScenePassPlan& plan);

    [[nodiscard]] bool markPassEntered(FrameGraph::PassId passId, const char* passName);

private:
    std::vector<std::uint32_t> m_passOrderById;
    std::optional<std::uint32_t> m_lastPassOrderIndex = std::nullopt;
};

enum class PassGraphState : std::uint8_t {
    NotRecorded,
    Recording,
    Submitted,
    Presented,
};

[[nodiscard]] const char* toString(PassGraphState state);

// Lifecycle of one frame's recording. A new instance is made for every frame.
class PassGraphStateMachine {
public:
    [[nodiscard]] PassGraphState state() const { return m_state; }

    bool beginRecording();
    bool markSubmitted();
    bool markPresented();

private:
    bool advance(PassGraphState expected, PassGraphState next);

    PassGraphState m_state = PassGraphState::NotRecorded;
};

struct PassToggles {
    bool lightMarker = true;
    bool objects = true;
    bool skybox = true;

    [[nodiscard]] bool anyEnabled() const { return lightMarker || objects || skybox; }
};

struct MeshBuffers {
    BufferHandle vertices{};
    BufferHandle indices{};
    std::uint32_t indexCount = 0;
};

// Everything the three passes read. Bound once after startup uploads.
struct SceneBindings {
    std::array<BufferHandle, kFramesInFlight> cameraBuffers{};
    std::array<BufferHandle, kFramesInFlight> lightBuffers{};
    BufferHandle instanceBuffer{};
    std::uint32_t instanceCount = 0;
    MeshBuffers mesh{};
    TextureHandle materialTexture{};
    SamplerHandle materialSampler{};
    TextureHandle cubemap{};
    SamplerHandle cubemapSampler{};
};

// Records into the swapchain color attachment after the scene passes. Color is loaded, no depth.
using OverlayRecorder = std::function<void(VkCommandBuffer)>;

// Owns the three graphics pipelines, their descriptor sets and the shared scene depth buffer,
// and records the passes in plan order into a frame's command buffer.
class RenderPassGraph {
public:
    RenderPassGraph() = default;
    ~RenderPassGraph();

    RenderPassGraph(const RenderPassGraph&) = delete;
    RenderPassGraph& operator=(const RenderPassGraph&) = delete;

    bool init(GpuContext& context, ResourceCache& cache, const std::string& shaderDir, VkFormat colorFormat);
    void shutdown();

    // Recreates the depth buffer when the swapchain extent changed.
    [[nodiscard]] ResourceError ensureDepth(VkExtent2D extent);
    [[nodiscard]] ResourceError bindScene(const SceneBindings& bindings);

    [[nodiscard]] ResourceError record(
        VkCommandBuffer commandBuffer,
        std::uint32_t frameSlot,
        const SwapchainTarget& target,
        const PassToggles& toggles,
        const OverlayRecorder& overlay);

    [[nodiscard]] const ScenePassPlan& plan() const { return m_plan; }
    [[nodiscard]] TextureHandle depthTexture() const { return m_depthTexture; }
    // Passes recorded by the last record() call, in recording order.
    [[nodiscard]] const std::vector<FrameGraph::PassId>& lastRecordedPasses() const { return m_lastRecordedPasses; }

private:
    struct GraphicsPipelineDesc {
        const char* name = "unnamed";
        const char* vertexShader = nullptr;
        const char* fragmentShader = nullptr;
        std::vector<VkVertexInputBindingDescription> bindings;
        std::vector<VkVertexInputAttributeDescription> attributes;
        VkPipelineLayout layout = VK_NULL_HANDLE;
        VkCullModeFlags cullMode = VK_CULL_MODE_BACK_BIT;
        bool depthWrite = true;
    };

    bool createDescriptorLayouts();
    bool createPipelines(const std::string& shaderDir);
    VkPipeline createGraphicsPipeline(const std::string& shaderDir, const GraphicsPipelineDesc& desc);
    [[nodiscard]] bool sceneResourcesAlive(std::uint32_t frameSlot) const;

    void beginPassRendering(
        VkCommandBuffer commandBuffer,
        const SwapchainTarget& target,
        bool clearColor,
        bool clearDepth,
        bool useDepth);
    void recordLightMarker(VkCommandBuffer commandBuffer, std::uint32_t frameSlot);
    void recordObjects(VkCommandBuffer commandBuffer, std::uint32_t frameSlot);
    void recordSkybox(VkCommandBuffer commandBuffer, std::uint32_t frameSlot);

    GpuContext* m_context = nullptr;
    ResourceCache* m_cache = nullptr;
    VkFormat m_colorFormat = VK_FORMAT_UNDEFINED;

    FrameGraph m_frameGraph;
    ScenePassPlan m_plan{};

    VkDescriptorSetLayout m_frameSetLayout = VK_NULL_HANDLE;
    VkDescriptorSetLayout m_textureSetLayout = VK_NULL_HANDLE;
    VkDescriptorPool m_descriptorPool = VK_NULL_HANDLE;
    std::array<VkDescriptorSet, kFramesInFlight> m_frameSets{};
    VkDescriptorSet m_materialSet = VK_NULL_HANDLE;
    VkDescriptorSet m_environmentSet = VK_NULL_HANDLE;

    VkPipelineLayout m_markerLayout = VK_NULL_HANDLE;
    VkPipelineLayout m_texturedLayout = VK_NULL_HANDLE;
    VkPipeline m_markerPipeline = VK_NULL_HANDLE;
    VkPipeline m_objectPipeline = VK_NULL_HANDLE;
    VkPipeline m_skyboxPipeline = VK_NULL_HANDLE;

    TextureHandle m_depthTexture{};
    SceneBindings m_bindings{};
    bool m_sceneBound = false;
    std::vector<FrameGraph::PassId> m_lastRecordedPasses;
};

} // namespace skygrid::render
