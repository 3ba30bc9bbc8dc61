#include "core/log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <utility>

namespace skygrid::core {
namespace {

constexpr const char* kLogLevelEnvVar = "SKYGRID_LOG_LEVEL";

std::atomic<LogLevel> g_logLevel{LogLevel::Info};
std::once_flag g_envInitOnce;
std::mutex g_logWriteMutex;

std::string wallClockStamp() {
    const auto now = std::chrono::system_clock::now();
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    const int millis = static_cast<int>(sinceEpoch.count() % 1000);
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&seconds, &local);

    char text[32]{};
    std::snprintf(text, sizeof(text), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min, local.tm_sec, millis);
    return std::string(text);
}

void emit(LogLevel level, std::string_view category, std::string_view message) {
    std::lock_guard<std::mutex> lock(g_logWriteMutex);
    const bool important = level == LogLevel::Error || level == LogLevel::Warn;
    std::ostream& out = important ? std::cerr : std::cout;
    out << "[" << wallClockStamp() << "]";
    if (!category.empty()) {
        out << "[" << category << "]";
    }
    if (level != LogLevel::Info) {
        out << "[" << toString(level) << "]";
    }
    out << " " << message << "\n";
    if (important) {
        out.flush();
    }
}

} // namespace

const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Trace:
        return "trace";
    }
    return "info";
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "error" || lowered == "err" || lowered == "0") {
        return LogLevel::Error;
    }
    if (lowered == "warn" || lowered == "warning" || lowered == "1") {
        return LogLevel::Warn;
    }
    if (lowered == "info" || lowered == "2") {
        return LogLevel::Info;
    }
    if (lowered == "debug" || lowered == "3") {
        return LogLevel::Debug;
    }
    if (lowered == "trace" || lowered == "4") {
        return LogLevel::Trace;
    }
    return std::nullopt;
}

void setLogLevel(LogLevel level) {
    g_logLevel.store(level);
}

LogLevel logLevel() {
    initializeLogLevelFromEnvironment();
    return g_logLevel.load();
}

bool shouldLog(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(logLevel());
}

void initializeLogLevelFromEnvironment() {
    std::call_once(g_envInitOnce, []() {
        const char* value = std::getenv(kLogLevelEnvVar);
        if (value == nullptr || value[0] == '\0') {
            return;
        }
        const std::optional<LogLevel> parsed = parseLogLevel(value);
        if (!parsed.has_value()) {
            emit(LogLevel::Warn, "log", std::string("ignoring unknown ") + kLogLevelEnvVar + "=" + value);
            return;
        }
        setLogLevel(*parsed);
    });
}

LogLine::LogLine(LogLevel level, std::string_view category)
    : m_level(level), m_category(category) {}

LogLine::~LogLine() {
    std::string message = m_stream.str();
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    emit(m_level, m_category, message);
}

std::ostream& LogLine::stream() {
    return m_stream;
}

ScopedLogTimer::ScopedLogTimer(std::string_view category, std::string label)
    : m_category(category), m_label(std::move(label)), m_start(std::chrono::steady_clock::now()) {}

ScopedLogTimer::~ScopedLogTimer() {
    if (!shouldLog(LogLevel::Info)) {
        return;
    }
    std::ostringstream message;
    message << m_label << " took " << static_cast<long long>(elapsedMilliseconds()) << " ms";
    emit(LogLevel::Info, m_category, message.str());
}

double ScopedLogTimer::elapsedMilliseconds() const {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - m_start).count();
}

} // namespace skygrid::core
