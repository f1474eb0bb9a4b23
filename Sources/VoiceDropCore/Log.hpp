#pragma once

#include <functional>
#include <string>

namespace vd {

enum class LogLevel {
    debug,
    info,
    warn,
    error
};

inline const char* log_level_to_string(LogLevel l) {
    switch (l) {
        case LogLevel::debug: return "debug";
        case LogLevel::info:  return "info";
        case LogLevel::warn:  return "warn";
        case LogLevel::error: return "error";
    }
    return "info";
}

/// Process-wide logger.  Messages below the threshold are dropped; the rest
/// go to the installed sink (stderr by default).  Thread-safe.
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static void set_level(LogLevel level);
    static LogLevel level();

    /// Replace the output sink.  Pass nullptr to restore stderr.
    static void set_sink(Sink sink);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void write(LogLevel level, const std::string& message);
};

} // namespace vd
