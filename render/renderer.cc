#include "render/renderer.h"

#include "core/log.h"
#include "render/debug_overlay.h"
#include "render/environment_precompute.h"
#include "render/frame_driver.h"
#include "render/gpu_context.h"
#include "render/resource_cache.h"
#include "scene/assets.h"

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>

namespace skygrid::render {

struct Renderer::Impl {
    explicit Impl(const RendererConfig& inConfig)
        : config(inConfig),
          uniforms(inConfig.grid, inConfig.light) {}

    bool init(GLFWwindow* window);
    bool uploadSceneAssets();
    FrameResult render(const core::Camera& camera, float deltaSeconds, double elapsedSeconds);
    void shutdown();

    RendererConfig config;
    GpuContext context;
    ResourceCache cache;
    EnvironmentPrecompute precompute;
    FrameUniformManager uniforms;
    RenderPassGraph passGraph;
    FrameDriver driver;
    DebugOverlay overlay;

    core::Projection projection{};
    OverlayControls controls{};
    float appliedLightSpeedDegrees = 0.0f;

    MeshBuffers mesh{};
    TextureHandle materialTexture{};
    SamplerHandle materialSampler{};
};

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init(GLFWwindow* window, const RendererConfig& config) {
    if (m_impl != nullptr) {
        return true;
    }

    m_impl = new Impl(config);
    if (!m_impl->init(window)) {
        m_impl->shutdown();
        delete m_impl;
        m_impl = nullptr;
        return false;
    }
    return true;
}

FrameResult Renderer::renderFrame(const core::Camera& camera, float deltaSeconds, double elapsedSeconds) {
    if (m_impl == nullptr) {
        return FrameResult::Fatal;
    }
    return m_impl->render(camera, deltaSeconds, elapsedSeconds);
}

void Renderer::shutdown() {
    if (m_impl == nullptr) {
        return;
    }
    m_impl->shutdown();
    delete m_impl;
    m_impl = nullptr;
}

void Renderer::toggleOverlay() {
    if (m_impl == nullptr) {
        return;
    }
    m_impl->overlay.setVisible(!m_impl->overlay.isVisible());
}

PassToggles Renderer::passToggles() const {
    return (m_impl == nullptr) ? PassToggles{} : m_impl->controls.toggles;
}

void Renderer::setPassToggles(const PassToggles& toggles) {
    if (m_impl != nullptr) {
        m_impl->controls.toggles = toggles;
    }
}

std::uint64_t Renderer::presentedFrames() const {
    return (m_impl == nullptr) ? 0u : m_impl->driver.stats().presented;
}

std::uint64_t Renderer::skippedFrames() const {
    return (m_impl == nullptr) ? 0u : m_impl->driver.stats().skipped;
}

bool Renderer::Impl::init(GLFWwindow* window) {
    const auto runStep = [](const char* stepName, auto&& stepFn) -> bool {
        const core::ScopedLogTimer timer("render", std::string("init step ") + stepName);
        const bool ok = stepFn();
        if (!ok) {
            SKYGRID_LOGE("render") << "init step failed: " << stepName;
        }
        return ok;
    };

    GpuContextConfig contextConfig{};
    contextConfig.applicationName = config.windowTitle.c_str();
    contextConfig.enableValidation = config.enableValidation;
    contextConfig.vsync = config.vsync;
    contextConfig.acquireTimeoutNs = config.acquireTimeoutNs;

    const DeviceInitError deviceError = context.init(window, contextConfig);
    if (deviceError != DeviceInitError::None) {
        SKYGRID_LOGE("render") << "GPU context init failed: " << toString(deviceError);
        return false;
    }
    SKYGRID_LOGI("render") << "using device " << context.deviceName();

    projection.fovYRadians = core::radians(config.camera.fovYDegrees);
    projection.nearPlane = config.camera.nearPlane;
    projection.farPlane = config.camera.farPlane;
    projection.resize(context.swapchainExtent().width, context.swapchainExtent().height);

    controls.lightSpeedDegrees = config.light.angularSpeedRadians * (180.0f / core::kPi);
    appliedLightSpeedDegrees = controls.lightSpeedDegrees;

    if (!runStep("resource_cache", [&] { return cache.init(context); })) {
        return false;
    }

    if (!runStep("environment_precompute", [&] {
            if (!precompute.init(context, cache, config.shaderDir)) {
                return false;
            }
            const float sun[3] = {
                config.environment.sunDirection.x,
                config.environment.sunDirection.y,
                config.environment.sunDirection.z};
            const scene::EquirectImage sky = scene::makeSkyEquirect(config.environment.sourceHeight, sun);
            TextureHandle cubemap{};
            const PrecomputeError error = precompute.build(sky, config.environment.faceSize, &cubemap);
            if (error != PrecomputeError::None) {
                SKYGRID_LOGE("render") << "environment precompute failed: " << toString(error);
                return false;
            }
            return true;
        })) {
        return false;
    }

    if (!runStep("scene_assets", [&] { return uploadSceneAssets(); })) {
        return false;
    }

    if (!runStep("frame_uniforms", [&] {
            const ResourceError error = uniforms.init(cache);
            if (error != ResourceError::None) {
                SKYGRID_LOGE("render") << "frame uniform init failed: " << toString(error);
                return false;
            }
            return true;
        })) {
        return false;
    }

    if (!runStep("pass_graph", [&] {
            if (!passGraph.init(context, cache, config.shaderDir, context.swapchainFormat())) {
                return false;
            }
            SceneBindings bindings{};
            for (std::uint32_t slot = 0; slot < kFramesInFlight; ++slot) {
                bindings.cameraBuffers[slot] = uniforms.cameraBuffer(slot);
                bindings.lightBuffers[slot] = uniforms.lightBuffer(slot);
            }
            bindings.instanceBuffer = uniforms.instanceBuffer();
            bindings.instanceCount = uniforms.instanceCount();
            bindings.mesh = mesh;
            bindings.materialTexture = materialTexture;
            bindings.materialSampler = materialSampler;
            bindings.cubemap = precompute.cubemap();
            bindings.cubemapSampler = precompute.cubemapSampler();
            const ResourceError error = passGraph.bindScene(bindings);
            if (error != ResourceError::None) {
                SKYGRID_LOGE("render") << "scene binding failed: " << toString(error);
                return false;
            }
            return true;
        })) {
        return false;
    }

    if (!runStep("frame_driver", [&] { return driver.init(context, uniforms, passGraph); })) {
        return false;
    }

    // The overlay is optional; the renderer runs without it.
    if (!runStep("debug_overlay", [&] { return overlay.init(context, context.swapchainFormat()); })) {
        SKYGRID_LOGW("render") << "continuing without debug overlay";
    }
    return true;
}

bool Renderer::Impl::uploadSceneAssets() {
    const scene::MeshData cube = scene::makeCubeMesh();

    BufferDesc vertexDesc{};
    vertexDesc.size = static_cast<VkDeviceSize>(cube.vertices.size() * sizeof(scene::MeshVertex));
    vertexDesc.usage = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
    vertexDesc.initialData = cube.vertices.data();
    vertexDesc.debugName = "mesh.cube.vertices";
    ResourceError error = cache.createBuffer(vertexDesc, &mesh.vertices);
    if (error != ResourceError::None) {
        SKYGRID_LOGE("render") << "cube vertex buffer: " << toString(error);
        return false;
    }

    BufferDesc indexDesc{};
    indexDesc.size = static_cast<VkDeviceSize>(cube.indices.size() * sizeof(std::uint32_t));
    indexDesc.usage = VK_BUFFER_USAGE_INDEX_BUFFER_BIT;
    indexDesc.initialData = cube.indices.data();
    indexDesc.debugName = "mesh.cube.indices";
    error = cache.createBuffer(indexDesc, &mesh.indices);
    if (error != ResourceError::None) {
        SKYGRID_LOGE("render") << "cube index buffer: " << toString(error);
        return false;
    }
    mesh.indexCount = static_cast<std::uint32_t>(cube.indices.size());

    const scene::ImageRgba8 checker = scene::makeCheckerTexture(config.materialTextureSize, 8);
    TextureDesc textureDesc{};
    textureDesc.format = VK_FORMAT_R8G8B8A8_SRGB;
    textureDesc.width = checker.width;
    textureDesc.height = checker.height;
    textureDesc.usage = VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    textureDesc.debugName = "material.checker";
    error = cache.createTexture(textureDesc, &materialTexture);
    if (error == ResourceError::None) {
        error = cache.uploadTextureLayer(
            materialTexture,
            0,
            checker.pixels.data(),
            static_cast<VkDeviceSize>(checker.pixels.size()));
    }
    if (error != ResourceError::None) {
        SKYGRID_LOGE("render") << "material texture: " << toString(error);
        return false;
    }

    SamplerDesc samplerDesc{};
    samplerDesc.filter = VK_FILTER_LINEAR;
    samplerDesc.addressMode = VK_SAMPLER_ADDRESS_MODE_REPEAT;
    samplerDesc.debugName = "sampler.material";
    error = cache.createSampler(samplerDesc, &materialSampler);
    if (error != ResourceError::None) {
        SKYGRID_LOGE("render") << "material sampler: " << toString(error);
        return false;
    }
    return true;
}

FrameResult Renderer::Impl::render(const core::Camera& camera, float deltaSeconds, double elapsedSeconds) {
    OverlayFrameInfo info{};
    info.deltaSeconds = deltaSeconds;
    info.extent = context.swapchainExtent();
    info.presentedFrames = driver.stats().presented;
    info.skippedFrames = driver.stats().skipped;
    const OverlayRecorder overlayRecorder = overlay.buildFrame(info, &controls);

    if (controls.lightSpeedDegrees != appliedLightSpeedDegrees) {
        // Rebase first so the angle swept so far keeps the old speed.
        uniforms.light().setElapsed(elapsedSeconds);
        uniforms.light().setAngularSpeed(core::radians(controls.lightSpeedDegrees));
        appliedLightSpeedDegrees = controls.lightSpeedDegrees;
    }

    const FrameResult result = driver.runFrame(camera, projection, elapsedSeconds, controls.toggles, overlayRecorder);
    if (result == FrameResult::Fatal) {
        SKYGRID_LOGE("render") << "frame failed fatally in state " << toString(driver.lastFrameState());
    }
    return result;
}

void Renderer::Impl::shutdown() {
    if (context.isInitialized()) {
        context.waitIdle();
    }
    overlay.shutdown();
    driver.shutdown();
    passGraph.shutdown();
    uniforms.shutdown();
    precompute.shutdown();
    cache.shutdown();
    context.shutdown();
}

} // namespace skygrid::render
