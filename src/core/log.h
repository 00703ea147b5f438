#pragma once

#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

// Core Log subsystem
// Responsible for: leveled, categorized log lines shared by every subsystem.
// Should NOT do: file rotation, structured sinks, or metrics.
namespace delve::core {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);
void initializeLogLevelFromEnvironment();
[[nodiscard]] LogLevel parseLogLevel(std::string_view text, LogLevel fallback);

class LogLine {
public:
    LogLine(LogLevel level, std::string_view category);
    ~LogLine();

    [[nodiscard]] std::ostream& stream();

private:
    LogLevel m_level;
    std::string m_category;
    std::ostringstream m_stream;
};

} // namespace delve::core

#define DELVE_LOG_STREAM(level, category) \
    if (!::delve::core::shouldLog(level)) {} else ::delve::core::LogLine((level), (category)).stream()

#define DELVE_LOGE(category) DELVE_LOG_STREAM(::delve::core::LogLevel::Error, (category))
#define DELVE_LOGW(category) DELVE_LOG_STREAM(::delve::core::LogLevel::Warn, (category))
#define DELVE_LOGI(category) DELVE_LOG_STREAM(::delve::core::LogLevel::Info, (category))
#define DELVE_LOGD(category) DELVE_LOG_STREAM(::delve::core::LogLevel::Debug, (category))
#define DELVE_LOGT(category) DELVE_LOG_STREAM(::delve::core::LogLevel::Trace, (category))
