#include "render/render_pass_graph.h"

#include "core/log.h"
#include "render/frame_uniforms.h"
#include "render/vk_utils.h"
#include "scene/assets.h"

#include <cstddef>

namespace skygrid::render {
namespace {

constexpr VkPipelineStageFlags2 kDepthStages =
    VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT;
constexpr VkAccessFlags2 kDepthAccess =
    VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_READ_BIT | VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
constexpr VkAccessFlags2 kColorAccess =
    VK_ACCESS_2_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT;

VkVertexInputAttributeDescription attribute(std::uint32_t location, std::uint32_t binding, VkFormat format, std::uint32_t offset) {
    VkVertexInputAttributeDescription description{};
    description.location = location;
    description.binding = binding;
    description.format = format;
    description.offset = offset;
    return description;
}

} // namespace

std::optional<ScenePassPlan> buildScenePassPlan(FrameGraph* frameGraph) {
    if (frameGraph == nullptr) {
        return std::nullopt;
    }

    frameGraph->reset();

    ScenePassPlan plan{};
    plan.lightMarker = frameGraph->addPass({"light_marker", PassQueue::Graphics});
    plan.objects = frameGraph->addPass({"objects", PassQueue::Graphics});
    plan.skybox = frameGraph->addPass({"skybox", PassQueue::Graphics});

    plan.sceneDepth = frameGraph->addResource("scene_depth");
    plan.swapchainColor = frameGraph->addResource("swapchain_color");
    plan.environmentCubemap = frameGraph->addResource("environment_cubemap");

    frameGraph->addResourceUse(plan.lightMarker, plan.sceneDepth, ResourceAccess::ReadWrite);
    frameGraph->addResourceUse(plan.lightMarker, plan.swapchainColor, ResourceAccess::Write);
    frameGraph->addResourceUse(plan.objects, plan.sceneDepth, ResourceAccess::ReadWrite);
    frameGraph->addResourceUse(plan.objects, plan.swapchainColor, ResourceAccess::ReadWrite);
    frameGraph->addResourceUse(plan.skybox, plan.sceneDepth, ResourceAccess::Read);
    frameGraph->addResourceUse(plan.skybox, plan.environmentCubemap, ResourceAccess::Read);
    frameGraph->addResourceUse(plan.skybox, plan.swapchainColor, ResourceAccess::ReadWrite);
    frameGraph->deriveResourceDependencies();

    if (!frameGraph->buildExecutionOrder(&plan.executionOrder)) {
        SKYGRID_LOGE("passes") << "scene pass graph has a cycle";
        return std::nullopt;
    }

    plan.passOrderById.assign(frameGraph->passes().size(), 0u);
    for (std::uint32_t executionIndex = 0; executionIndex < plan.executionOrder.size(); ++executionIndex) {
        plan.passOrderById[plan.executionOrder[executionIndex]] = executionIndex;
    }
    return plan;
}

PassOrderValidator::PassOrderValidator(const ScenePassPlan& plan)
    : m_passOrderById(plan.passOrderById) {}

bool PassOrderValidator::markPassEntered(FrameGraph::PassId passId, const char* passName) {
    if (passId >= m_passOrderById.size()) {
        SKYGRID_LOGE("passes") << "unknown pass entered: " << passName;
        return false;
    }
    const std::uint32_t passOrderIndex = m_passOrderById[passId];
    if (m_lastPassOrderIndex.has_value() && passOrderIndex <= *m_lastPassOrderIndex) {
        SKYGRID_LOGE("passes") << "scene pass executed out of graph order: " << passName
                               << ", orderIndex=" << passOrderIndex
                               << ", previousOrderIndex=" << *m_lastPassOrderIndex;
        return false;
    }
    m_lastPassOrderIndex = passOrderIndex;
    return true;
}

const char* toString(PassGraphState state) {
    switch (state) {
    case PassGraphState::NotRecorded:
        return "NotRecorded";
    case PassGraphState::Recording:
        return "Recording";
    case PassGraphState::Submitted:
        return "Submitted";
    case PassGraphState::Presented:
        return "Presented";
    }
    return "Unknown";
}

bool PassGraphStateMachine::advance(PassGraphState expected, PassGraphState next) {
    if (m_state != expected) {
        SKYGRID_LOGE("passes") << "invalid pass graph transition " << toString(m_state) << " -> " << toString(next);
        return false;
    }
    m_state = next;
    return true;
}

bool PassGraphStateMachine::beginRecording() {
    return advance(PassGraphState::NotRecorded, PassGraphState::Recording);
}

bool PassGraphStateMachine::markSubmitted() {
    return advance(PassGraphState::Recording, PassGraphState::Submitted);
}

bool PassGraphStateMachine::markPresented() {
    return advance(PassGraphState::Submitted, PassGraphState::Presented);
}

RenderPassGraph::~RenderPassGraph() {
    shutdown();
}

bool RenderPassGraph::init(GpuContext& context, ResourceCache& cache, const std::string& shaderDir, VkFormat colorFormat) {
    m_context = &context;
    m_cache = &cache;
    m_colorFormat = colorFormat;
    if (m_colorFormat == VK_FORMAT_UNDEFINED) {
        SKYGRID_LOGE("passes") << "pass graph needs a color attachment format";
        return false;
    }

    std::optional<ScenePassPlan> plan = buildScenePassPlan(&m_frameGraph);
    if (!plan.has_value()) {
        return false;
    }
    m_plan = std::move(*plan);

    return createDescriptorLayouts() && createPipelines(shaderDir);
}

bool RenderPassGraph::createDescriptorLayouts() {
    const VkDevice device = m_context->device();

    std::array<VkDescriptorSetLayoutBinding, 2> frameBindings{};
    frameBindings[0].binding = 0;
    frameBindings[0].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    frameBindings[0].descriptorCount = 1;
    frameBindings[0].stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
    frameBindings[1].binding = 1;
    frameBindings[1].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    frameBindings[1].descriptorCount = 1;
    frameBindings[1].stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;

    VkDescriptorSetLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutInfo.bindingCount = static_cast<std::uint32_t>(frameBindings.size());
    layoutInfo.pBindings = frameBindings.data();
    VkResult result = vkCreateDescriptorSetLayout(device, &layoutInfo, nullptr, &m_frameSetLayout);
    if (result != VK_SUCCESS) {
        logVkFailure("passes", "vkCreateDescriptorSetLayout(frame)", result);
        return false;
    }

    VkDescriptorSetLayoutBinding textureBinding{};
    textureBinding.binding = 0;
    textureBinding.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    textureBinding.descriptorCount = 1;
    textureBinding.stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;
    layoutInfo.bindingCount = 1;
    layoutInfo.pBindings = &textureBinding;
    result = vkCreateDescriptorSetLayout(device, &layoutInfo, nullptr, &m_textureSetLayout);
    if (result != VK_SUCCESS) {
        logVkFailure("passes", "vkCreateDescriptorSetLayout(texture)", result);
        return false;
    }

    const std::array<VkDescriptorPoolSize, 2> poolSizes = {{
        {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 2 * kFramesInFlight},
        {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 2},
    }};
    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.maxSets = kFramesInFlight + 2;
    poolInfo.poolSizeCount = static_cast<std::uint32_t>(poolSizes.size());
    poolInfo.pPoolSizes = poolSizes.data();
    result = vkCreateDescriptorPool(device, &poolInfo, nullptr, &m_descriptorPool);
    if (result != VK_SUCCESS) {
        logVkFailure("passes", "vkCreateDescriptorPool(scene)", result);
        return false;
    }

    std::array<VkDescriptorSetLayout, kFramesInFlight + 2> setLayouts{};
    for (std::uint32_t slot = 0; slot < kFramesInFlight; ++slot) {
        setLayouts[slot] = m_frameSetLayout;
    }
    setLayouts[kFramesInFlight] = m_textureSetLayout;
    setLayouts[kFramesInFlight + 1] = m_textureSetLayout;
    std::array<VkDescriptorSet, kFramesInFlight + 2> sets{};

    VkDescriptorSetAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorPool = m_descriptorPool;
    allocInfo.descriptorSetCount = static_cast<std::uint32_t>(setLayouts.size());
    allocInfo.pSetLayouts = setLayouts.data();
    result = vkAllocateDescriptorSets(device, &allocInfo, sets.data());
    if (result != VK_SUCCESS) {
        logVkFailure("passes", "vkAllocateDescriptorSets(scene)", result);
        return false;
    }
    for (std::uint32_t slot = 0; slot < kFramesInFlight; ++slot) {
        m_frameSets[slot] = sets[slot];
    }
    m_materialSet = sets[kFramesInFlight];
    m_environmentSet = sets[kFramesInFlight + 1];

    VkPipelineLayoutCreateInfo pipelineLayoutInfo{};
    pipelineLayoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    pipelineLayoutInfo.setLayoutCount = 1;
    pipelineLayoutInfo.pSetLayouts = &m_frameSetLayout;
    result = vkCreatePipelineLayout(device, &pipelineLayoutInfo, nullptr, &m_markerLayout);
    if (result != VK_SUCCESS) {
        logVkFailure("passes", "vkCreatePipelineLayout(marker)", result);
        return false;
    }

    const std::array<VkDescriptorSetLayout, 2> texturedSetLayouts = {m_frameSetLayout, m_textureSetLayout};
    pipelineLayoutInfo.setLayoutCount = static_cast<std::uint32_t>(texturedSetLayouts.size());
    pipelineLayoutInfo.pSetLayouts = texturedSetLayouts.data();
    result = vkCreatePipelineLayout(device, &pipelineLayoutInfo, nullptr, &m_texturedLayout);
    if (result != VK_SUCCESS) {
        logVkFailure("passes", "vkCreatePipelineLayout(textured)", result);
        return false;
    }
    return true;
}

VkPipeline RenderPassGraph::createGraphicsPipeline(const std::string& shaderDir, const GraphicsPipelineDesc& desc) {
    const VkDevice device = m_context->device();

    const VkShaderModule vertexModule = createShaderModuleFromFile(device, shaderDir, desc.vertexShader);
    const VkShaderModule fragmentModule = createShaderModuleFromFile(device, shaderDir, desc.fragmentShader);
    if (vertexModule == VK_NULL_HANDLE || fragmentModule == VK_NULL_HANDLE) {
        if (vertexModule != VK_NULL_HANDLE) {
            vkDestroyShaderModule(device, vertexModule, nullptr);
        }
        if (fragmentModule != VK_NULL_HANDLE) {
            vkDestroyShaderModule(device, fragmentModule, nullptr);
        }
        return VK_NULL_HANDLE;
    }

    std::array<VkPipelineShaderStageCreateInfo, 2> shaderStages{};
    shaderStages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    shaderStages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
    shaderStages[0].module = vertexModule;
    shaderStages[0].pName = "main";
    shaderStages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    shaderStages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
    shaderStages[1].module = fragmentModule;
    shaderStages[1].pName = "main";

    VkPipelineVertexInputStateCreateInfo vertexInputInfo{};
    vertexInputInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vertexInputInfo.vertexBindingDescriptionCount = static_cast<std::uint32_t>(desc.bindings.size());
    vertexInputInfo.pVertexBindingDescriptions = desc.bindings.data();
    vertexInputInfo.vertexAttributeDescriptionCount = static_cast<std::uint32_t>(desc.attributes.size());
    vertexInputInfo.pVertexAttributeDescriptions = desc.attributes.data();

    VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
    inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    inputAssembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

    VkPipelineViewportStateCreateInfo viewportState{};
    viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewportState.viewportCount = 1;
    viewportState.scissorCount = 1;

    VkPipelineRasterizationStateCreateInfo rasterizer{};
    rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
    rasterizer.lineWidth = 1.0f;
    rasterizer.cullMode = desc.cullMode;
    rasterizer.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;

    VkPipelineMultisampleStateCreateInfo multisampling{};
    multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    // Reverse-Z: nearer fragments have larger depth.
    VkPipelineDepthStencilStateCreateInfo depthStencil{};
    depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
    depthStencil.depthTestEnable = VK_TRUE;
    depthStencil.depthWriteEnable = desc.depthWrite ? VK_TRUE : VK_FALSE;
    depthStencil.depthCompareOp = VK_COMPARE_OP_GREATER_OR_EQUAL;

    VkPipelineColorBlendAttachmentState colorBlendAttachment{};
    colorBlendAttachment.colorWriteMask =
        VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;

    VkPipelineColorBlendStateCreateInfo colorBlending{};
    colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    colorBlending.attachmentCount = 1;
    colorBlending.pAttachments = &colorBlendAttachment;

    const std::array<VkDynamicState, 2> dynamicStates = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
    VkPipelineDynamicStateCreateInfo dynamicState{};
    dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamicState.dynamicStateCount = static_cast<std::uint32_t>(dynamicStates.size());
    dynamicState.pDynamicStates = dynamicStates.data();

    const VkFormat depthFormat = m_context->depthFormat();
    VkPipelineRenderingCreateInfo renderingCreateInfo{};
    renderingCreateInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
    renderingCreateInfo.colorAttachmentCount = 1;
    renderingCreateInfo.pColorAttachmentFormats = &m_colorFormat;
    renderingCreateInfo.depthAttachmentFormat = depthFormat;

    VkGraphicsPipelineCreateInfo pipelineInfo{};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipelineInfo.pNext = &renderingCreateInfo;
    pipelineInfo.stageCount = static_cast<std::uint32_t>(shaderStages.size());
    pipelineInfo.pStages = shaderStages.data();
    pipelineInfo.pVertexInputState = &vertexInputInfo;
    pipelineInfo.pInputAssemblyState = &inputAssembly;
    pipelineInfo.pViewportState = &viewportState;
    pipelineInfo.pRasterizationState = &rasterizer;
    pipelineInfo.pMultisampleState = &multisampling;
    pipelineInfo.pDepthStencilState = &depthStencil;
    pipelineInfo.pColorBlendState = &colorBlending;
    pipelineInfo.pDynamicState = &dynamicState;
    pipelineInfo.layout = desc.layout;

    VkPipeline pipeline = VK_NULL_HANDLE;
    const VkResult result = vkCreateGraphicsPipelines(device, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline);
    vkDestroyShaderModule(device, vertexModule, nullptr);
    vkDestroyShaderModule(device, fragmentModule, nullptr);
    if (result != VK_SUCCESS) {
        SKYGRID_LOGE("passes") << "pipeline " << desc.name << " creation failed";
        logVkFailure("passes", "vkCreateGraphicsPipelines", result);
        return VK_NULL_HANDLE;
    }
    setDebugObjectName(device, VK_OBJECT_TYPE_PIPELINE, vkHandleToUint64(pipeline), std::string("pipeline.") + desc.name);
    SKYGRID_LOGD("passes") << "pipeline " << desc.name << ": depthWrite=" << (desc.depthWrite ? "on" : "off")
                           << ", depthCompare=" << static_cast<std::uint32_t>(depthStencil.depthCompareOp);
    return pipeline;
}

bool RenderPassGraph::createPipelines(const std::string& shaderDir) {
    VkVertexInputBindingDescription meshBinding{};
    meshBinding.binding = 0;
    meshBinding.stride = sizeof(scene::MeshVertex);
    meshBinding.inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
    const std::vector<VkVertexInputAttributeDescription> meshAttributes = {
        attribute(0, 0, VK_FORMAT_R32G32B32_SFLOAT, static_cast<std::uint32_t>(offsetof(scene::MeshVertex, position))),
        attribute(1, 0, VK_FORMAT_R32G32B32_SFLOAT, static_cast<std::uint32_t>(offsetof(scene::MeshVertex, normal))),
        attribute(2, 0, VK_FORMAT_R32G32_SFLOAT, static_cast<std::uint32_t>(offsetof(scene::MeshVertex, uv))),
    };

    GraphicsPipelineDesc markerDesc{};
    markerDesc.name = "light_marker";
    markerDesc.vertexShader = "light_marker.vert";
    markerDesc.fragmentShader = "light_marker.frag";
    markerDesc.bindings = {meshBinding};
    markerDesc.attributes = {meshAttributes[0]};
    markerDesc.layout = m_markerLayout;
    m_markerPipeline = createGraphicsPipeline(shaderDir, markerDesc);

    VkVertexInputBindingDescription instanceBinding{};
    instanceBinding.binding = 1;
    instanceBinding.stride = sizeof(InstanceRaw);
    instanceBinding.inputRate = VK_VERTEX_INPUT_RATE_INSTANCE;

    GraphicsPipelineDesc objectDesc{};
    objectDesc.name = "objects";
    objectDesc.vertexShader = "object.vert";
    objectDesc.fragmentShader = "object.frag";
    objectDesc.bindings = {meshBinding, instanceBinding};
    objectDesc.attributes = meshAttributes;
    for (std::uint32_t row = 0; row < 4; ++row) {
        objectDesc.attributes.push_back(attribute(
            5 + row,
            1,
            VK_FORMAT_R32G32B32A32_SFLOAT,
            static_cast<std::uint32_t>(offsetof(InstanceRaw, model) + (row * 4 * sizeof(float)))));
    }
    for (std::uint32_t row = 0; row < 3; ++row) {
        objectDesc.attributes.push_back(attribute(
            9 + row,
            1,
            VK_FORMAT_R32G32B32_SFLOAT,
            static_cast<std::uint32_t>(offsetof(InstanceRaw, normal) + (row * 3 * sizeof(float)))));
    }
    objectDesc.layout = m_texturedLayout;
    m_objectPipeline = createGraphicsPipeline(shaderDir, objectDesc);

    // Full-screen triangle generated from gl_VertexIndex; sits on the far plane and never writes depth.
    GraphicsPipelineDesc skyboxDesc{};
    skyboxDesc.name = "skybox";
    skyboxDesc.vertexShader = "skybox.vert";
    skyboxDesc.fragmentShader = "skybox.frag";
    skyboxDesc.layout = m_texturedLayout;
    skyboxDesc.cullMode = VK_CULL_MODE_NONE;
    skyboxDesc.depthWrite = false;
    m_skyboxPipeline = createGraphicsPipeline(shaderDir, skyboxDesc);

    return m_markerPipeline != VK_NULL_HANDLE && m_objectPipeline != VK_NULL_HANDLE
        && m_skyboxPipeline != VK_NULL_HANDLE;
}

ResourceError RenderPassGraph::ensureDepth(VkExtent2D extent) {
    if (m_cache == nullptr) {
        return ResourceError::StaleHandle;
    }
    const TextureInfo* current = m_cache->texture(m_depthTexture);
    if (current != nullptr && current->extent.width == extent.width && current->extent.height == extent.height) {
        return ResourceError::None;
    }
    if (current != nullptr) {
        m_context->waitIdle();
        m_cache->destroyTexture(m_depthTexture);
        m_depthTexture = TextureHandle{};
    }

    TextureDesc depthDesc{};
    depthDesc.format = m_context->depthFormat();
    depthDesc.width = extent.width;
    depthDesc.height = extent.height;
    depthDesc.usage = VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT;
    depthDesc.debugName = "scene.depth";
    return m_cache->createTexture(depthDesc, &m_depthTexture);
}

ResourceError RenderPassGraph::bindScene(const SceneBindings& bindings) {
    m_bindings = bindings;
    m_sceneBound = false;
    for (std::uint32_t slot = 0; slot < kFramesInFlight; ++slot) {
        if (!sceneResourcesAlive(slot)) {
            SKYGRID_LOGE("passes") << "scene bindings reference missing resources for frame slot " << slot;
            return ResourceError::StaleHandle;
        }
    }

    std::vector<VkWriteDescriptorSet> writes;
    std::array<VkDescriptorBufferInfo, 2 * kFramesInFlight> bufferInfos{};
    for (std::uint32_t slot = 0; slot < kFramesInFlight; ++slot) {
        VkDescriptorBufferInfo& cameraInfo = bufferInfos[slot * 2];
        cameraInfo.buffer = m_cache->buffer(bindings.cameraBuffers[slot]);
        cameraInfo.range = sizeof(CameraUniform);
        VkDescriptorBufferInfo& lightInfo = bufferInfos[(slot * 2) + 1];
        lightInfo.buffer = m_cache->buffer(bindings.lightBuffers[slot]);
        lightInfo.range = sizeof(LightUniform);

        for (std::uint32_t binding = 0; binding < 2; ++binding) {
            VkWriteDescriptorSet write{};
            write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
            write.dstSet = m_frameSets[slot];
            write.dstBinding = binding;
            write.descriptorCount = 1;
            write.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            write.pBufferInfo = &bufferInfos[(slot * 2) + binding];
            writes.push_back(write);
        }
    }

    VkDescriptorImageInfo materialInfo{};
    materialInfo.sampler = m_cache->sampler(bindings.materialSampler);
    materialInfo.imageView = m_cache->texture(bindings.materialTexture)->view;
    materialInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    VkDescriptorImageInfo environmentInfo{};
    environmentInfo.sampler = m_cache->sampler(bindings.cubemapSampler);
    environmentInfo.imageView = m_cache->texture(bindings.cubemap)->view;
    environmentInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

    for (const auto& [set, imageInfo] : {std::pair{m_materialSet, &materialInfo}, std::pair{m_environmentSet, &environmentInfo}}) {
        VkWriteDescriptorSet write{};
        write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet = set;
        write.dstBinding = 0;
        write.descriptorCount = 1;
        write.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        write.pImageInfo = imageInfo;
        writes.push_back(write);
    }

    vkUpdateDescriptorSets(
        m_context->device(),
        static_cast<std::uint32_t>(writes.size()),
        writes.data(),
        0,
        nullptr);
    m_sceneBound = true;
    return ResourceError::None;
}

bool RenderPassGraph::sceneResourcesAlive(std::uint32_t frameSlot) const {
    const SceneBindings& b = m_bindings;
    return frameSlot < kFramesInFlight
        && m_cache->buffer(b.cameraBuffers[frameSlot]) != VK_NULL_HANDLE
        && m_cache->buffer(b.lightBuffers[frameSlot]) != VK_NULL_HANDLE
        && (b.instanceCount == 0 || m_cache->buffer(b.instanceBuffer) != VK_NULL_HANDLE)
        && m_cache->buffer(b.mesh.vertices) != VK_NULL_HANDLE
        && m_cache->buffer(b.mesh.indices) != VK_NULL_HANDLE
        && m_cache->texture(b.materialTexture) != nullptr
        && m_cache->sampler(b.materialSampler) != VK_NULL_HANDLE
        && m_cache->texture(b.cubemap) != nullptr
        && m_cache->sampler(b.cubemapSampler) != VK_NULL_HANDLE;
}

void RenderPassGraph::beginPassRendering(
    VkCommandBuffer commandBuffer,
    const SwapchainTarget& target,
    bool clearColor,
    bool clearDepth,
    bool useDepth) {
    VkRenderingAttachmentInfo colorAttachment{};
    colorAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
    colorAttachment.imageView = target.view;
    colorAttachment.imageLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    colorAttachment.loadOp = clearColor ? VK_ATTACHMENT_LOAD_OP_CLEAR : VK_ATTACHMENT_LOAD_OP_LOAD;
    colorAttachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    colorAttachment.clearValue.color.float32[0] = 0.02f;
    colorAttachment.clearValue.color.float32[1] = 0.02f;
    colorAttachment.clearValue.color.float32[2] = 0.03f;
    colorAttachment.clearValue.color.float32[3] = 1.0f;

    VkRenderingAttachmentInfo depthAttachment{};
    depthAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
    depthAttachment.imageView = m_cache->texture(m_depthTexture)->view;
    depthAttachment.imageLayout = VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL;
    depthAttachment.loadOp = clearDepth ? VK_ATTACHMENT_LOAD_OP_CLEAR : VK_ATTACHMENT_LOAD_OP_LOAD;
    depthAttachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    depthAttachment.clearValue.depthStencil.depth = 0.0f;

    VkRenderingInfo renderingInfo{};
    renderingInfo.sType = VK_STRUCTURE_TYPE_RENDERING_INFO;
    renderingInfo.renderArea.extent = target.extent;
    renderingInfo.layerCount = 1;
    renderingInfo.colorAttachmentCount = 1;
    renderingInfo.pColorAttachments = &colorAttachment;
    renderingInfo.pDepthAttachment = useDepth ? &depthAttachment : nullptr;
    vkCmdBeginRendering(commandBuffer, &renderingInfo);

    VkViewport viewport{};
    viewport.width = static_cast<float>(target.extent.width);
    viewport.height = static_cast<float>(target.extent.height);
    viewport.maxDepth = 1.0f;
    VkRect2D scissor{};
    scissor.extent = target.extent;
    vkCmdSetViewport(commandBuffer, 0, 1, &viewport);
    vkCmdSetScissor(commandBuffer, 0, 1, &scissor);
}

void RenderPassGraph::recordLightMarker(VkCommandBuffer commandBuffer, std::uint32_t frameSlot) {
    vkCmdBindPipeline(commandBuffer, VK_PIPELINE_BIND_POINT_GRAPHICS, m_markerPipeline);
    vkCmdBindDescriptorSets(
        commandBuffer,
        VK_PIPELINE_BIND_POINT_GRAPHICS,
        m_markerLayout,
        0,
        1,
        &m_frameSets[frameSlot],
        0,
        nullptr);
    const VkBuffer vertexBuffer = m_cache->buffer(m_bindings.mesh.vertices);
    const VkDeviceSize offset = 0;
    vkCmdBindVertexBuffers(commandBuffer, 0, 1, &vertexBuffer, &offset);
    vkCmdBindIndexBuffer(commandBuffer, m_cache->buffer(m_bindings.mesh.indices), 0, VK_INDEX_TYPE_UINT32);
    vkCmdDrawIndexed(commandBuffer, m_bindings.mesh.indexCount, 1, 0, 0, 0);
}

void RenderPassGraph::recordObjects(VkCommandBuffer commandBuffer, std::uint32_t frameSlot) {
    if (m_bindings.instanceCount == 0) {
        return;
    }
    vkCmdBindPipeline(commandBuffer, VK_PIPELINE_BIND_POINT_GRAPHICS, m_objectPipeline);
    const std::array<VkDescriptorSet, 2> sets = {m_frameSets[frameSlot], m_materialSet};
    vkCmdBindDescriptorSets(
        commandBuffer,
        VK_PIPELINE_BIND_POINT_GRAPHICS,
        m_texturedLayout,
        0,
        static_cast<std::uint32_t>(sets.size()),
        sets.data(),
        0,
        nullptr);
    const std::array<VkBuffer, 2> vertexBuffers = {
        m_cache->buffer(m_bindings.mesh.vertices),
        m_cache->buffer(m_bindings.instanceBuffer)};
    const std::array<VkDeviceSize, 2> offsets = {0, 0};
    vkCmdBindVertexBuffers(commandBuffer, 0, 2, vertexBuffers.data(), offsets.data());
    vkCmdBindIndexBuffer(commandBuffer, m_cache->buffer(m_bindings.mesh.indices), 0, VK_INDEX_TYPE_UINT32);
    // One instanced draw covers the whole grid.
    vkCmdDrawIndexed(commandBuffer, m_bindings.mesh.indexCount, m_bindings.instanceCount, 0, 0, 0);
}

void RenderPassGraph::recordSkybox(VkCommandBuffer commandBuffer, std::uint32_t frameSlot) {
    vkCmdBindPipeline(commandBuffer, VK_PIPELINE_BIND_POINT_GRAPHICS, m_skyboxPipeline);
    const std::array<VkDescriptorSet, 2> sets = {m_frameSets[frameSlot], m_environmentSet};
    vkCmdBindDescriptorSets(
        commandBuffer,
        VK_PIPELINE_BIND_POINT_GRAPHICS,
        m_texturedLayout,
        0,
        static_cast<std::uint32_t>(sets.size()),
        sets.data(),
        0,
        nullptr);
    vkCmdDraw(commandBuffer, 3, 1, 0, 0);
}

ResourceError RenderPassGraph::record(
    VkCommandBuffer commandBuffer,
    std::uint32_t frameSlot,
    const SwapchainTarget& target,
    const PassToggles& toggles,
    const OverlayRecorder& overlay) {
    m_lastRecordedPasses.clear();
    if (!m_sceneBound || !sceneResourcesAlive(frameSlot)) {
        SKYGRID_LOGE("passes") << "record skipped: scene resources are not bound";
        return ResourceError::StaleHandle;
    }
    const TextureInfo* depth = m_cache->texture(m_depthTexture);
    if (depth == nullptr) {
        return ResourceError::StaleHandle;
    }
    if (depth->extent.width != target.extent.width || depth->extent.height != target.extent.height) {
        SKYGRID_LOGE("passes") << "depth buffer " << depth->extent.width << "x" << depth->extent.height
                               << " does not match target " << target.extent.width << "x" << target.extent.height;
        return ResourceError::SizeMismatch;
    }
    const VkImage depthImage = depth->image;

    // The source stages chain with the acquire semaphore wait and with the previous frame's use
    // of the shared depth buffer.
    const std::array<VkImageMemoryBarrier2, 2> frameStart = {
        imageBarrier(
            target.image,
            VK_IMAGE_LAYOUT_UNDEFINED,
            VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
            VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
            VK_ACCESS_2_NONE,
            VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
            kColorAccess),
        imageBarrier(
            depthImage,
            VK_IMAGE_LAYOUT_UNDEFINED,
            VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL,
            kDepthStages,
            VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT,
            kDepthStages,
            kDepthAccess,
            VK_IMAGE_ASPECT_DEPTH_BIT),
    };
    cmdImageBarriers(commandBuffer, frameStart.data(), static_cast<std::uint32_t>(frameStart.size()));

    auto passEnabled = [&](FrameGraph::PassId pass) {
        if (pass == m_plan.lightMarker) {
            return toggles.lightMarker;
        }
        if (pass == m_plan.objects) {
            return toggles.objects;
        }
        return toggles.skybox;
    };
    std::vector<FrameGraph::PassId> enabledOrder;
    for (const FrameGraph::PassId pass : m_plan.executionOrder) {
        if (passEnabled(pass)) {
            enabledOrder.push_back(pass);
        }
    }

    const std::array<VkImageMemoryBarrier2, 2> betweenPasses = {
        imageBarrier(
            target.image,
            VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
            VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
            VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
            VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT,
            VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
            kColorAccess),
        imageBarrier(
            depthImage,
            VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL,
            VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL,
            kDepthStages,
            VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT,
            kDepthStages,
            kDepthAccess,
            VK_IMAGE_ASPECT_DEPTH_BIT),
    };

    PassOrderValidator validator(m_plan);
    const std::span<const GraphPass> passes = m_frameGraph.passes();
    for (const FrameGraph::PassId pass : enabledOrder) {
        if (!m_lastRecordedPasses.empty()) {
            cmdImageBarriers(commandBuffer, betweenPasses.data(), static_cast<std::uint32_t>(betweenPasses.size()));
        }
        if (!validator.markPassEntered(pass, passes[pass].name.c_str())) {
            return ResourceError::PassOrderViolation;
        }

        // Only the first enabled pass clears; the depth buffer is shared by all three.
        beginPassRendering(
            commandBuffer,
            target,
            m_frameGraph.isFirstUse(enabledOrder, pass, m_plan.swapchainColor),
            m_frameGraph.isFirstUse(enabledOrder, pass, m_plan.sceneDepth),
            true);
        if (pass == m_plan.lightMarker) {
            recordLightMarker(commandBuffer, frameSlot);
        } else if (pass == m_plan.objects) {
            recordObjects(commandBuffer, frameSlot);
        } else if (pass == m_plan.skybox) {
            recordSkybox(commandBuffer, frameSlot);
        }
        vkCmdEndRendering(commandBuffer);
        m_lastRecordedPasses.push_back(pass);
    }

    if (m_lastRecordedPasses.empty()) {
        // Empty graph still leaves a defined image to present.
        beginPassRendering(commandBuffer, target, true, true, true);
        vkCmdEndRendering(commandBuffer);
    }

    if (overlay) {
        cmdImageBarriers(commandBuffer, &betweenPasses[0], 1);
        beginPassRendering(commandBuffer, target, false, false, false);
        overlay(commandBuffer);
        vkCmdEndRendering(commandBuffer);
    }

    const VkImageMemoryBarrier2 toPresent = imageBarrier(
        target.image,
        VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
        VK_IMAGE_LAYOUT_PRESENT_SRC_KHR,
        VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
        VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT,
        VK_PIPELINE_STAGE_2_NONE,
        VK_ACCESS_2_NONE);
    cmdImageBarriers(commandBuffer, &toPresent, 1);
    return ResourceError::None;
}

void RenderPassGraph::shutdown() {
    if (m_context == nullptr) {
        return;
    }
    const VkDevice device = m_context->device();
    if (device != VK_NULL_HANDLE) {
        for (VkPipeline pipeline : {m_markerPipeline, m_objectPipeline, m_skyboxPipeline}) {
            if (pipeline != VK_NULL_HANDLE) {
                vkDestroyPipeline(device, pipeline, nullptr);
            }
        }
        for (VkPipelineLayout layout : {m_markerLayout, m_texturedLayout}) {
            if (layout != VK_NULL_HANDLE) {
                vkDestroyPipelineLayout(device, layout, nullptr);
            }
        }
        if (m_descriptorPool != VK_NULL_HANDLE) {
            vkDestroyDescriptorPool(device, m_descriptorPool, nullptr);
        }
        for (VkDescriptorSetLayout layout : {m_frameSetLayout, m_textureSetLayout}) {
            if (layout != VK_NULL_HANDLE) {
                vkDestroyDescriptorSetLayout(device, layout, nullptr);
            }
        }
    }
    if (m_cache != nullptr) {
        m_cache->destroyTexture(m_depthTexture);
    }
    m_markerPipeline = VK_NULL_HANDLE;
    m_objectPipeline = VK_NULL_HANDLE;
    m_skyboxPipeline = VK_NULL_HANDLE;
    m_markerLayout = VK_NULL_HANDLE;
    m_texturedLayout = VK_NULL_HANDLE;
    m_descriptorPool = VK_NULL_HANDLE;
    m_frameSetLayout = VK_NULL_HANDLE;
    m_textureSetLayout = VK_NULL_HANDLE;
    m_frameSets = {};
    m_materialSet = VK_NULL_HANDLE;
    m_environmentSet = VK_NULL_HANDLE;
    m_depthTexture = TextureHandle{};
    m_sceneBound = false;
    m_context = nullptr;
    m_cache = nullptr;
}

} // namespace skygrid::render
