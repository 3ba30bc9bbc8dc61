#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "render/frame_driver.h"
#include "render/gpu_context.h"

namespace {

using skygrid::render::SurfaceError;

struct ScriptedSurface {
    std::vector<SurfaceError> acquireResults;
    SurfaceError reconfigureResult = SurfaceError::None;
    std::size_t acquireCalls = 0;
    std::size_t reconfigureCalls = 0;

    SurfaceError acquire() {
        const SurfaceError result = acquireResults[std::min(acquireCalls, acquireResults.size() - 1)];
        ++acquireCalls;
        return result;
    }

    SurfaceError reconfigure() {
        ++reconfigureCalls;
        return reconfigureResult;
    }
};

SurfaceError runAcquire(ScriptedSurface& surface, bool* outRetried) {
    return skygrid::render::acquireWithSingleRetry(
        [&surface] { return surface.acquire(); },
        [&surface] { return surface.reconfigure(); },
        outRetried);
}

TEST(AcquireRetryTest, SuccessDoesNotReconfigure) {
    ScriptedSurface surface{{SurfaceError::None}};
    bool retried = true;
    EXPECT_EQ(runAcquire(surface, &retried), SurfaceError::None);
    EXPECT_FALSE(retried);
    EXPECT_EQ(surface.acquireCalls, 1u);
    EXPECT_EQ(surface.reconfigureCalls, 0u);
}

TEST(AcquireRetryTest, LostSurfaceRetriesOnceAfterReconfigure) {
    ScriptedSurface surface{{SurfaceError::Lost, SurfaceError::None}};
    bool retried = false;
    EXPECT_EQ(runAcquire(surface, &retried), SurfaceError::None);
    EXPECT_TRUE(retried);
    EXPECT_EQ(surface.acquireCalls, 2u);
    EXPECT_EQ(surface.reconfigureCalls, 1u);
}

TEST(AcquireRetryTest, SecondFailureIsReturnedWithoutThirdAttempt) {
    ScriptedSurface surface{{SurfaceError::Outdated, SurfaceError::Lost, SurfaceError::None}};
    EXPECT_EQ(runAcquire(surface, nullptr), SurfaceError::Lost);
    EXPECT_EQ(surface.acquireCalls, 2u);
    EXPECT_EQ(skygrid::render::classifyAcquireResult(SurfaceError::Lost), skygrid::render::FrameResult::Fatal);
}

TEST(AcquireRetryTest, TimeoutIsNotRetried) {
    ScriptedSurface surface{{SurfaceError::Timeout}};
    EXPECT_EQ(runAcquire(surface, nullptr), SurfaceError::Timeout);
    EXPECT_EQ(surface.reconfigureCalls, 0u);
    EXPECT_EQ(skygrid::render::classifyAcquireResult(SurfaceError::Timeout), skygrid::render::FrameResult::Skipped);
}

TEST(AcquireRetryTest, UnpresentableSizeDuringRetrySkipsFrame) {
    ScriptedSurface surface{{SurfaceError::Outdated}};
    surface.reconfigureResult = SurfaceError::UnsupportedConfig;
    const SurfaceError result = runAcquire(surface, nullptr);
    EXPECT_EQ(result, SurfaceError::UnsupportedConfig);
    EXPECT_EQ(surface.acquireCalls, 1u);
    EXPECT_EQ(skygrid::render::classifyAcquireResult(result), skygrid::render::FrameResult::Skipped);
}

TEST(SurfaceExtentTest, ZeroAndNegativeSizesAreUnsupported) {
    EXPECT_EQ(skygrid::render::validateSurfaceExtent(0, 0), SurfaceError::UnsupportedConfig);
    EXPECT_EQ(skygrid::render::validateSurfaceExtent(0, 720), SurfaceError::UnsupportedConfig);
    EXPECT_EQ(skygrid::render::validateSurfaceExtent(-1, 720), SurfaceError::UnsupportedConfig);
    EXPECT_EQ(skygrid::render::validateSurfaceExtent(1280, -5), SurfaceError::UnsupportedConfig);
    EXPECT_EQ(skygrid::render::validateSurfaceExtent(1280, 720), SurfaceError::None);
}

TEST(SurfaceExtentTest, SizeOutsideSurfaceLimitsIsUnsupported) {
    VkSurfaceCapabilitiesKHR capabilities{};
    capabilities.minImageExtent = {1, 1};
    capabilities.maxImageExtent = {4096, 4096};
    EXPECT_EQ(skygrid::render::validateSurfaceExtent(1280, 720, capabilities), SurfaceError::None);
    EXPECT_EQ(skygrid::render::validateSurfaceExtent(8192, 720, capabilities), SurfaceError::UnsupportedConfig);

    // A minimized window reports a zero max extent.
    capabilities.maxImageExtent = {0, 0};
    EXPECT_EQ(skygrid::render::validateSurfaceExtent(1280, 720, capabilities), SurfaceError::UnsupportedConfig);
}

}  // namespace
