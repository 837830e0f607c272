#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace subvox::core {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

// Receives every formatted line that passes the level filter.
// The default sink writes to stdout (info and below) or stderr (warn, error).
using LogSink = std::function<void(LogLevel level, std::string_view category, std::string_view message)>;

void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();
[[nodiscard]] bool shouldLog(LogLevel level);
void initializeLogLevelFromEnvironment();
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text);
[[nodiscard]] const char* logLevelName(LogLevel level);

// Replaces the active sink. Passing an empty function restores the console sink.
void setLogSink(LogSink sink);

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

} // namespace subvox::core

#define SUBVOX_LOG_STREAM(level, category) \
    if (!::subvox::core::shouldLog(level)) {} else ::subvox::core::LogLine((level), (category)).stream()

#define SUBVOX_LOGE(category) SUBVOX_LOG_STREAM(::subvox::core::LogLevel::Error, (category))
#define SUBVOX_LOGW(category) SUBVOX_LOG_STREAM(::subvox::core::LogLevel::Warn, (category))
#define SUBVOX_LOGI(category) SUBVOX_LOG_STREAM(::subvox::core::LogLevel::Info, (category))
#define SUBVOX_LOGD(category) SUBVOX_LOG_STREAM(::subvox::core::LogLevel::Debug, (category))
#define SUBVOX_LOGT(category) SUBVOX_LOG_STREAM(::subvox::core::LogLevel::Trace, (category))
