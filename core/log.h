#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace skygrid::core {

// Lower values are more severe. A line is written when its level <= the threshold.
enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

[[nodiscard]] const char* toString(LogLevel level);
// Accepts names ("warn", "warning", ...) or digits 0-4, case-insensitive.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text);

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);

// Applies SKYGRID_LOG_LEVEL on first call; later calls do nothing.
void initializeLogLevelFromEnvironment();

// One log line. Collects streamed text and writes `[time][category][level] text` on destruction.
class LogLine {
public:
    LogLine(LogLevel level, std::string_view category);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    [[nodiscard]] std::ostream& stream();

private:
    LogLevel m_level;
    std::string m_category;
    std::ostringstream m_stream;
};

// Logs "<label> took N ms" at Info when it goes out of scope.
class ScopedLogTimer {
public:
    ScopedLogTimer(std::string_view category, std::string label);
    ~ScopedLogTimer();

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

    [[nodiscard]] double elapsedMilliseconds() const;

private:
    std::string m_category;
    std::string m_label;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace skygrid::core

#define SKYGRID_LOG_STREAM(level, category) \
    if (!::skygrid::core::shouldLog(level)) {} else ::skygrid::core::LogLine((level), (category)).stream()

#define SKYGRID_LOGE(category) SKYGRID_LOG_STREAM(::skygrid::core::LogLevel::Error, (category))
#define SKYGRID_LOGW(category) SKYGRID_LOG_STREAM(::skygrid::core::LogLevel::Warn, (category))
#define SKYGRID_LOGI(category) SKYGRID_LOG_STREAM(::skygrid::core::LogLevel::Info, (category))
#define SKYGRID_LOGD(category) SKYGRID_LOG_STREAM(::skygrid::core::LogLevel::Debug, (category))
#define SKYGRID_LOGT(category) SKYGRID_LOG_STREAM(::skygrid::core::LogLevel::Trace, (category))
