#pragma once

#include <cstdint>

namespace skygrid::render {

// Startup failures. Fatal.
enum class DeviceInitError : std::uint8_t {
    None,
    AdapterNotFound,
    DeviceCreationFailed,
};

// Presentation surface failures. Lost/Outdated recover by reconfiguring.
enum class SurfaceError : std::uint8_t {
    None,
    Lost,
    Outdated,
    Timeout,
    UnsupportedConfig,
};

enum class ResourceError : std::uint8_t {
    None,
    OutOfBounds,
    AllocationFailed,
    StaleHandle,
    SizeMismatch,
    PassOrderViolation,
};

enum class PrecomputeError : std::uint8_t {
    None,
    BadImageAspect,
    DispatchFailed,
};

enum class FrameResult : std::uint8_t {
    Presented,
    Skipped,
    Fatal,
};

[[nodiscard]] const char* toString(DeviceInitError error);
[[nodiscard]] const char* toString(SurfaceError error);
[[nodiscard]] const char* toString(ResourceError error);
[[nodiscard]] const char* toString(PrecomputeError error);
[[nodiscard]] const char* toString(FrameResult result);

} // namespace skygrid::render
