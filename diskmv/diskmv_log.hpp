#pragma once

// -----------------------------------------------------------------------------
// Unified logging: syslog plus stderr
// -----------------------------------------------------------------------------
//
// Every record goes to syslog once diskmv_log_open() enabled it. Records at or
// above the stderr threshold are echoed to stderr with a timestamp.

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void diskmv_log_open(bool use_syslog) noexcept;
void diskmv_log_close() noexcept;

void diskmv_log_set_stderr_level(LogLevel level) noexcept;

// Maps the CLI verbosity (-v/-q count, default 1) to a stderr threshold.
LogLevel diskmv_log_level_for_verbosity(int verbosity) noexcept;

void diskmv_log_output(const char* module, LogLevel level, const char* fmt, ...) noexcept
    __attribute__((format(printf, 3, 4)));

#define DISKMV_LOG_INFO(module, ...)   diskmv_log_output(module, LogLevel::Info,  __VA_ARGS__)
#define DISKMV_LOG_ERROR(module, ...)  diskmv_log_output(module, LogLevel::Error, __VA_ARGS__)
#define DISKMV_LOG_WARN(module, ...)   diskmv_log_output(module, LogLevel::Warn,  __VA_ARGS__)
#define DISKMV_LOG_DEBUG(module, ...)  diskmv_log_output(module, LogLevel::Debug, __VA_ARGS__)
