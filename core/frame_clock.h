#pragma once

#include <chrono>

namespace skygrid::core {

struct TimeStep {
    float deltaSeconds = 0.0f;
    // Measured from the clock's start, not accumulated from deltas.
    double elapsedSeconds = 0.0;
};

// Monotonic frame timer backed by steady_clock.
class FrameClock {
public:
    using Clock = std::chrono::steady_clock;

    FrameClock() { reset(); }

    void reset() {
        m_start = Clock::now();
        m_previous = m_start;
    }

    TimeStep tick() {
        const Clock::time_point now = Clock::now();
        TimeStep step{};
        step.deltaSeconds = std::chrono::duration<float>(now - m_previous).count();
        step.elapsedSeconds = std::chrono::duration<double>(now - m_start).count();
        m_previous = now;
        return step;
    }

private:
    Clock::time_point m_start{};
    Clock::time_point m_previous{};
};

} // namespace skygrid::core
