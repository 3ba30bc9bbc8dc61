#include "render/frame_uniforms.h"

#include "core/log.h"

#include <cmath>
#include <cstring>
#include <string>

namespace skygrid::render {
namespace {

void copyMatrix(float* dst, const core::Mat4& src) {
    std::memcpy(dst, src.m, sizeof(src.m));
}

core::Vec3 orbitPosition(const LightOrbitConfig& config, double angleRadians) {
    return core::Vec3{
        config.radius * static_cast<float>(std::cos(angleRadians)),
        config.height,
        config.radius * static_cast<float>(std::sin(angleRadians))};
}

} // namespace

std::vector<InstanceRecord> buildInstanceGrid(const InstanceGridConfig& config) {
    std::vector<InstanceRecord> records;
    if (config.columns == 0 || config.rows == 0) {
        return records;
    }
    const std::uint32_t count = config.rows * config.columns;
    records.reserve(count);
    const float yawStep = core::radians(config.yawStepDegrees);
    for (std::uint32_t k = 0; k < count; ++k) {
        const std::uint32_t row = k / config.columns;
        const std::uint32_t col = k % config.columns;
        InstanceRecord record{};
        record.position = core::Vec3{static_cast<float>(col) * config.spacing, 0.0f, static_cast<float>(row) * config.spacing};
        record.yawRadians = yawStep * static_cast<float>(k);
        records.push_back(record);
    }
    return records;
}

InstanceRaw packInstance(const InstanceRecord& record) {
    const core::Mat4 rotation = core::Mat4::rotationY(record.yawRadians);
    const core::Mat4 model = core::Mat4::translation(record.position) * rotation;

    InstanceRaw raw{};
    copyMatrix(raw.model, model);
    // Rotation only, so the upper 3x3 already is the normal matrix.
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            raw.normal[(row * 3) + col] = rotation(row, col);
        }
    }
    return raw;
}

core::Vec3 lightPositionAt(const LightOrbitConfig& config, double elapsedSeconds) {
    return orbitPosition(config, static_cast<double>(config.angularSpeedRadians) * elapsedSeconds);
}

LightAnimator::LightAnimator(const LightOrbitConfig& config)
    : m_config(config) {}

void LightAnimator::setElapsed(double elapsedSeconds) {
    m_elapsedSeconds = elapsedSeconds;
}

void LightAnimator::setAngularSpeed(float radiansPerSecond) {
    m_phaseRadians += static_cast<double>(m_config.angularSpeedRadians) * (m_elapsedSeconds - m_phaseStartSeconds);
    m_phaseStartSeconds = m_elapsedSeconds;
    m_config.angularSpeedRadians = radiansPerSecond;
}

core::Vec3 LightAnimator::position() const {
    const double angle =
        m_phaseRadians + (static_cast<double>(m_config.angularSpeedRadians) * (m_elapsedSeconds - m_phaseStartSeconds));
    return orbitPosition(m_config, angle);
}

CameraUniform makeCameraUniform(const core::Camera& camera, const core::Projection& projection) {
    const core::Mat4 view = camera.viewMatrix();
    const core::Mat4 proj = projection.matrix();

    CameraUniform uniform{};
    uniform.viewPosition[0] = camera.position.x;
    uniform.viewPosition[1] = camera.position.y;
    uniform.viewPosition[2] = camera.position.z;
    uniform.viewPosition[3] = 1.0f;
    copyMatrix(uniform.view, view);
    copyMatrix(uniform.viewProj, proj * view);
    copyMatrix(uniform.invProj, core::inverse(proj));
    copyMatrix(uniform.invView, core::inverse(view));
    return uniform;
}

LightUniform makeLightUniform(const core::Vec3& position, const core::Vec3& color) {
    LightUniform uniform{};
    uniform.position[0] = position.x;
    uniform.position[1] = position.y;
    uniform.position[2] = position.z;
    uniform.color[0] = color.x;
    uniform.color[1] = color.y;
    uniform.color[2] = color.z;
    return uniform;
}

FrameUniformManager::FrameUniformManager(const InstanceGridConfig& grid, const LightOrbitConfig& light)
    : m_instances(buildInstanceGrid(grid)), m_light(light) {}

ResourceError FrameUniformManager::init(ResourceCache& cache) {
    m_cache = &cache;

    for (std::uint32_t slot = 0; slot < kFramesInFlight; ++slot) {
        BufferDesc cameraDesc{};
        cameraDesc.size = sizeof(CameraUniform);
        cameraDesc.usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
        cameraDesc.debugName = "uniforms.camera." + std::to_string(slot);
        ResourceError error = cache.createBuffer(cameraDesc, &m_cameraBuffers[slot]);
        if (error != ResourceError::None) {
            return error;
        }

        const LightUniform initialLight = makeLightUniform(m_light.position(), m_light.config().color);
        BufferDesc lightDesc{};
        lightDesc.size = sizeof(LightUniform);
        lightDesc.usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
        lightDesc.initialData = &initialLight;
        lightDesc.debugName = "uniforms.light." + std::to_string(slot);
        error = cache.createBuffer(lightDesc, &m_lightBuffers[slot]);
        if (error != ResourceError::None) {
            return error;
        }
    }

    if (m_instances.empty()) {
        SKYGRID_LOGW("uniforms") << "instance grid is empty; object pass will draw nothing";
        return ResourceError::None;
    }
    std::vector<InstanceRaw> packed;
    packed.reserve(m_instances.size());
    for (const InstanceRecord& record : m_instances) {
        packed.push_back(packInstance(record));
    }
    BufferDesc instanceDesc{};
    instanceDesc.size = static_cast<VkDeviceSize>(packed.size() * sizeof(InstanceRaw));
    instanceDesc.usage = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
    instanceDesc.initialData = packed.data();
    instanceDesc.debugName = "uniforms.instances";
    const ResourceError error = cache.createBuffer(instanceDesc, &m_instanceBuffer);
    if (error == ResourceError::None) {
        SKYGRID_LOGI("uniforms") << "instance buffer: " << m_instances.size() << " records, "
                                 << instanceDesc.size << " bytes";
    }
    return error;
}

void FrameUniformManager::shutdown() {
    if (m_cache == nullptr) {
        return;
    }
    for (std::uint32_t slot = 0; slot < kFramesInFlight; ++slot) {
        m_cache->destroyBuffer(m_cameraBuffers[slot]);
        m_cache->destroyBuffer(m_lightBuffers[slot]);
        m_cameraBuffers[slot] = BufferHandle{};
        m_lightBuffers[slot] = BufferHandle{};
    }
    m_cache->destroyBuffer(m_instanceBuffer);
    m_instanceBuffer = BufferHandle{};
    m_cache = nullptr;
}

ResourceError FrameUniformManager::update(
    std::uint32_t frameSlot,
    const core::Camera& camera,
    const core::Projection& projection,
    double elapsedSeconds) {
    if (m_cache == nullptr || frameSlot >= kFramesInFlight) {
        return ResourceError::StaleHandle;
    }

    const CameraUniform cameraUniform = makeCameraUniform(camera, projection);
    ResourceError error = m_cache->writeBuffer(m_cameraBuffers[frameSlot], 0, &cameraUniform, sizeof(cameraUniform));
    if (error != ResourceError::None) {
        SKYGRID_LOGE("uniforms") << "camera uniform write failed: " << toString(error);
        return error;
    }

    m_light.setElapsed(elapsedSeconds);
    m_lastLightPosition = m_light.position();
    const LightUniform lightUniform = makeLightUniform(m_lastLightPosition, m_light.config().color);
    error = m_cache->writeBuffer(m_lightBuffers[frameSlot], 0, &lightUniform, sizeof(lightUniform));
    if (error != ResourceError::None) {
        SKYGRID_LOGE("uniforms") << "light uniform write failed: " << toString(error);
    }
    return error;
}

} // namespace skygrid::render
