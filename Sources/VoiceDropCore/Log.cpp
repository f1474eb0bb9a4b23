#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>

namespace vd {

namespace {

std::atomic<LogLevel> g_level{LogLevel::info};
std::mutex            g_mu;
Logger::Sink          g_sink;

void write_stderr(LogLevel level, const std::string& message) {
    using Clock = std::chrono::system_clock;
    auto now  = Clock::now();
    auto secs = Clock::to_time_t(now);
    auto ms   = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    std::fprintf(stderr, "[%s.%03d] [%s] %s\n",
                 stamp, static_cast<int>(ms),
                 log_level_to_string(level), message.c_str());
}

} // namespace

void Logger::set_level(LogLevel level) {
    g_level.store(level);
}

LogLevel Logger::level() {
    return g_level.load();
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_mu);
    g_sink = std::move(sink);
}

void Logger::debug(const std::string& message) { write(LogLevel::debug, message); }
void Logger::info(const std::string& message)  { write(LogLevel::info, message); }
void Logger::warn(const std::string& message)  { write(LogLevel::warn, message); }
void Logger::error(const std::string& message) { write(LogLevel::error, message); }

void Logger::write(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(g_level.load())) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_mu);
    if (g_sink) {
        g_sink(level, message);
    } else {
        write_stderr(level, message);
    }
}

} // namespace vd
