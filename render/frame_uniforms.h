#pragma once

#include "core/camera.h"
#include "core/math.h"
#include "render/gpu_context.h"
#include "render/render_status.h"
#include "render/resource_cache.h"

#include <array>
#include <cstdint>
#include <vector>

namespace skygrid::render {

struct InstanceGridConfig {
    std::uint32_t rows = 10;
    std::uint32_t columns = 10;
    float spacing = 3.0f;
    // Each record turns this much further around +Y than the one before it.
    float yawStepDegrees = 10.0f;
};

struct InstanceRecord {
    core::Vec3 position{};
    float yawRadians = 0.0f;
};

// Per-instance vertex attributes: model rows at locations 5-8, normal matrix rows at 9-11.
struct InstanceRaw {
    float model[16];
    float normal[9];
};
static_assert(sizeof(InstanceRaw) == 100, "InstanceRaw must stay tightly packed for the vertex input stride");

// Record k sits at (col * spacing, 0, row * spacing) with row = k / columns and col = k % columns.
[[nodiscard]] std::vector<InstanceRecord> buildInstanceGrid(const InstanceGridConfig& config);
[[nodiscard]] InstanceRaw packInstance(const InstanceRecord& record);

struct LightOrbitConfig {
    float radius = 8.0f;
    float height = 4.0f;
    float angularSpeedRadians = core::kPi / 3.0f;
    core::Vec3 color{1.0f, 0.95f, 0.85f};
};

// Closed form, so the result only depends on total elapsed time.
[[nodiscard]] core::Vec3 lightPositionAt(const LightOrbitConfig& config, double elapsedSeconds);

// Light angle driven by accumulated time. A speed change keeps the current angle continuous.
class LightAnimator {
public:
    explicit LightAnimator(const LightOrbitConfig& config);

    void setElapsed(double elapsedSeconds);
    void setAngularSpeed(float radiansPerSecond);

    [[nodiscard]] double elapsedSeconds() const { return m_elapsedSeconds; }
    [[nodiscard]] float angularSpeed() const { return m_config.angularSpeedRadians; }
    [[nodiscard]] core::Vec3 position() const;
    [[nodiscard]] const LightOrbitConfig& config() const { return m_config; }

private:
    LightOrbitConfig m_config;
    double m_elapsedSeconds = 0.0;
    // Angle already swept before the last speed change.
    double m_phaseRadians = 0.0;
    double m_phaseStartSeconds = 0.0;
};

// std140 with row_major matrices on the GLSL side.
struct CameraUniform {
    float viewPosition[4];
    float view[16];
    float viewProj[16];
    float invProj[16];
    float invView[16];
};
static_assert(sizeof(CameraUniform) == 272, "CameraUniform must match the std140 block in the shaders");

struct LightUniform {
    float position[3];
    float padding0;
    float color[3];
    float padding1;
};
static_assert(sizeof(LightUniform) == 32, "LightUniform must match the std140 block in the shaders");

[[nodiscard]] CameraUniform makeCameraUniform(const core::Camera& camera, const core::Projection& projection);
[[nodiscard]] LightUniform makeLightUniform(const core::Vec3& position, const core::Vec3& color);

// Owns the per-slot camera and light uniform buffers plus the static instance buffer, and
// rewrites the uniforms every frame before the passes that read them are recorded.
class FrameUniformManager {
public:
    FrameUniformManager(const InstanceGridConfig& grid, const LightOrbitConfig& light);

    [[nodiscard]] ResourceError init(ResourceCache& cache);
    void shutdown();

    [[nodiscard]] ResourceError update(
        std::uint32_t frameSlot,
        const core::Camera& camera,
        const core::Projection& projection,
        double elapsedSeconds);

    [[nodiscard]] BufferHandle cameraBuffer(std::uint32_t frameSlot) const { return m_cameraBuffers[frameSlot]; }
    [[nodiscard]] BufferHandle lightBuffer(std::uint32_t frameSlot) const { return m_lightBuffers[frameSlot]; }
    [[nodiscard]] BufferHandle instanceBuffer() const { return m_instanceBuffer; }
    [[nodiscard]] std::uint32_t instanceCount() const { return static_cast<std::uint32_t>(m_instances.size()); }
    [[nodiscard]] const std::vector<InstanceRecord>& instances() const { return m_instances; }

    [[nodiscard]] LightAnimator& light() { return m_light; }
    [[nodiscard]] const core::Vec3& lastLightPosition() const { return m_lastLightPosition; }

private:
    ResourceCache* m_cache = nullptr;
    std::vector<InstanceRecord> m_instances;
    LightAnimator m_light;
    core::Vec3 m_lastLightPosition{};

    std::array<BufferHandle, kFramesInFlight> m_cameraBuffers{};
    std::array<BufferHandle, kFramesInFlight> m_lightBuffers{};
    BufferHandle m_instanceBuffer{};
};

} // namespace skygrid::render
