#pragma once

#include <cstdint>

enum class LogLevel : uint8_t {
    Error = 0,
    Warn,
    Info,
    Debug,
};

// printf-style logging. On ESP-IDF this forwards to ESP_LOGx with the given
// tag; host builds print "[LEVEL][tag] message" to stdout.
void init_logging();
void set_log_level(LogLevel level);
void log_error(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_debug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
