#include "core/log.h"

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <utility>

namespace subvox::core {
namespace {

constexpr const char* kLogLevelEnvironmentVariable = "SUBVOX_LOG_LEVEL";

struct LevelAlias {
    std::string_view text;
    LogLevel level;
};

constexpr std::array<LevelAlias, 12> kLevelAliases = {
    LevelAlias{"error", LogLevel::Error},
    LevelAlias{"err", LogLevel::Error},
    LevelAlias{"0", LogLevel::Error},
    LevelAlias{"warn", LogLevel::Warn},
    LevelAlias{"warning", LogLevel::Warn},
    LevelAlias{"1", LogLevel::Warn},
    LevelAlias{"info", LogLevel::Info},
    LevelAlias{"2", LogLevel::Info},
    LevelAlias{"debug", LogLevel::Debug},
    LevelAlias{"3", LogLevel::Debug},
    LevelAlias{"trace", LogLevel::Trace},
    LevelAlias{"4", LogLevel::Trace},
};

// Process-wide logger state. Mesh workers log from their own threads, so the sink is
// only ever invoked with writeMutex held.
struct LoggerState {
    std::atomic<LogLevel> level{LogLevel::Info};
    std::once_flag environmentOnce;
    std::mutex writeMutex;
    LogSink sink;
};

LoggerState& loggerState() {
    static LoggerState state;
    return state;
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        const int a = std::tolower(static_cast<unsigned char>(lhs[i]));
        const int b = std::tolower(static_cast<unsigned char>(rhs[i]));
        if (a != b) {
            return false;
        }
    }
    return true;
}

std::string formatClockTime(std::chrono::system_clock::time_point now) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    const int millis = static_cast<int>(sinceEpoch.count() % 1000);

    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    char text[16]{};
    std::snprintf(text, sizeof(text), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min, local.tm_sec, millis);
    return std::string(text);
}

void consoleSink(LogLevel level, std::string_view category, std::string_view message) {
    const bool isProblem = level == LogLevel::Error || level == LogLevel::Warn;
    std::ostream& out = isProblem ? std::cerr : std::cout;

    out << '[' << formatClockTime(std::chrono::system_clock::now()) << ']';
    if (!category.empty()) {
        out << '[' << category << ']';
    }
    if (level != LogLevel::Info) {
        out << '[' << logLevelName(level) << ']';
    }
    out << ' ' << message << '\n';
}

void dispatch(LogLevel level, std::string_view category, std::string_view message) {
    LoggerState& state = loggerState();
    std::lock_guard<std::mutex> lock(state.writeMutex);
    if (state.sink) {
        state.sink(level, category, message);
    } else {
        consoleSink(level, category, message);
    }
}

} // namespace

const char* logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn: return "warn";
    case LogLevel::Info: return "info";
    case LogLevel::Debug: return "debug";
    case LogLevel::Trace: return "trace";
    }
    return "info";
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    for (const LevelAlias& alias : kLevelAliases) {
        if (equalsIgnoreCase(alias.text, text)) {
            return alias.level;
        }
    }
    return std::nullopt;
}

void setLogLevel(LogLevel level) {
    loggerState().level.store(level);
}

LogLevel logLevel() {
    initializeLogLevelFromEnvironment();
    return loggerState().level.load();
}

bool shouldLog(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(logLevel());
}

void initializeLogLevelFromEnvironment() {
    LoggerState& state = loggerState();
    std::call_once(state.environmentOnce, [&state]() {
        const char* value = std::getenv(kLogLevelEnvironmentVariable);
        if (value == nullptr || value[0] == '\0') {
            return;
        }
        const std::optional<LogLevel> parsed = parseLogLevel(value);
        if (!parsed.has_value()) {
            consoleSink(LogLevel::Warn, "log", std::string("Ignoring unknown ") + kLogLevelEnvironmentVariable + " '" + value + "'");
            return;
        }
        state.level.store(*parsed);
    });
}

void setLogSink(LogSink sink) {
    LoggerState& state = loggerState();
    std::lock_guard<std::mutex> lock(state.writeMutex);
    state.sink = std::move(sink);
}

LogLine::LogLine(LogLevel level, std::string_view category)
    : m_level(level), m_category(category) {}

LogLine::~LogLine() {
    std::string message = m_stream.str();
    const std::size_t end = message.find_last_not_of("\r\n");
    message.erase(end == std::string::npos ? 0 : end + 1);
    dispatch(m_level, m_category, message);
}

std::ostream& LogLine::stream() {
    return m_stream;
}

} // namespace subvox::core
