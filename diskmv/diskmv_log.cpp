#include "diskmv_log.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

#include <syslog.h>

static std::atomic<bool> g_use_syslog{false};
static std::atomic<int> g_stderr_level{static_cast<int>(LogLevel::Warn)};

void diskmv_log_open(bool use_syslog) noexcept {
    if (use_syslog) {
        openlog("diskmv", LOG_PID | LOG_NDELAY, LOG_USER);
    }
    g_use_syslog.store(use_syslog, std::memory_order_relaxed);
}

void diskmv_log_close() noexcept {
    if (g_use_syslog.exchange(false, std::memory_order_relaxed)) {
        closelog();
    }
}

void diskmv_log_set_stderr_level(LogLevel level) noexcept {
    g_stderr_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel diskmv_log_level_for_verbosity(int verbosity) noexcept {
    if (verbosity <= 0) return LogLevel::Error;
    if (verbosity == 1) return LogLevel::Warn;
    if (verbosity == 2) return LogLevel::Info;
    return LogLevel::Debug;
}

static const char* diskmv_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Debug: return "DEBUG";
    }
    return "DEBUG";
}

static int diskmv_syslog_priority(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error: return LOG_ERR;
    case LogLevel::Warn:  return LOG_WARNING;
    case LogLevel::Info:  return LOG_INFO;
    case LogLevel::Debug: return LOG_DEBUG;
    }
    return LOG_DEBUG;
}

void diskmv_log_output(const char* module, LogLevel level, const char* fmt, ...) noexcept {
    bool to_syslog = g_use_syslog.load(std::memory_order_relaxed);
    bool to_stderr = static_cast<int>(level) <= g_stderr_level.load(std::memory_order_relaxed);
    if (!to_syslog && !to_stderr) return;

    char buffer[2048];
    va_list args;
    va_start(args, fmt);
    int len = vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    if (len <= 0) return;

    const char* level_name = diskmv_level_name(level);

    if (to_syslog) {
        syslog(diskmv_syslog_priority(level), "[%s] [%s] %s", level_name, module, buffer);
    }

    if (to_stderr) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        struct tm tm_time{};
        localtime_r(&t, &tm_time);

        char timestamp[32];
        strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_time);

        fprintf(stderr, "[%s][%s][%s] %s\n", level_name, timestamp, module, buffer);
        fflush(stderr);
    }
}
