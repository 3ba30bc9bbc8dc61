#include "render/render_status.h"

namespace skygrid::render {

const char* toString(DeviceInitError error) {
    switch (error) {
    case DeviceInitError::None:
        return "none";
    case DeviceInitError::AdapterNotFound:
        return "adapter not found";
    case DeviceInitError::DeviceCreationFailed:
        return "device creation failed";
    }
    return "unknown";
}

const char* toString(SurfaceError error) {
    switch (error) {
    case SurfaceError::None:
        return "none";
    case SurfaceError::Lost:
        return "surface lost";
    case SurfaceError::Outdated:
        return "surface outdated";
    case SurfaceError::Timeout:
        return "acquire timeout";
    case SurfaceError::UnsupportedConfig:
        return "unsupported surface config";
    }
    return "unknown";
}

const char* toString(ResourceError error) {
    switch (error) {
    case ResourceError::None:
        return "none";
    case ResourceError::OutOfBounds:
        return "out of bounds";
    case ResourceError::AllocationFailed:
        return "allocation failed";
    case ResourceError::StaleHandle:
        return "stale handle";
    case ResourceError::SizeMismatch:
        return "size mismatch";
    case ResourceError::PassOrderViolation:
        return "pass order violation";
    }
    return "unknown";
}

const char* toString(PrecomputeError error) {
    switch (error) {
    case PrecomputeError::None:
        return "none";
    case PrecomputeError::BadImageAspect:
        return "equirect width must be 2x height";
    case PrecomputeError::DispatchFailed:
        return "compute dispatch failed";
    }
    return "unknown";
}

const char* toString(FrameResult result) {
    switch (result) {
    case FrameResult::Presented:
        return "presented";
    case FrameResult::Skipped:
        return "skipped";
    case FrameResult::Fatal:
        return "fatal";
    }
    return "unknown";
}

} // namespace skygrid::render
