#include "logging.hpp"
#include <cstdarg>
#include <cstddef>
#include <cstdio>

#ifdef ESP_PLATFORM
#include "esp_log.h"
#endif

namespace {
constexpr std::size_t kLogLineLen = 192;
LogLevel g_level = LogLevel::Info;

void emit(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (static_cast<uint8_t>(level) > static_cast<uint8_t>(g_level)) {
        return;
    }
    char line[kLogLineLen];
    std::vsnprintf(line, sizeof(line), fmt, args);
#ifdef ESP_PLATFORM
    switch (level) {
        case LogLevel::Error: ESP_LOGE(tag, "%s", line); break;
        case LogLevel::Warn: ESP_LOGW(tag, "%s", line); break;
        case LogLevel::Info: ESP_LOGI(tag, "%s", line); break;
        case LogLevel::Debug: ESP_LOGD(tag, "%s", line); break;
    }
#else
    static const char* const kNames[] = {"ERROR", "WARN", "INFO", "DEBUG"};
    std::printf("[%s][%s] %s\n", kNames[static_cast<uint8_t>(level)], tag, line);
#endif
}
} // namespace

void init_logging() {
#ifdef ESP_PLATFORM
    esp_log_level_set("*", ESP_LOG_INFO);
#else
    std::setvbuf(stdout, nullptr, _IOLBF, 0);
#endif
    g_level = LogLevel::Info;
}

void set_log_level(LogLevel level) {
    g_level = level;
#ifdef ESP_PLATFORM
    esp_log_level_set("*", level == LogLevel::Debug ? ESP_LOG_DEBUG : ESP_LOG_INFO);
#endif
}

void log_error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::Error, tag, fmt, args);
    va_end(args);
}

void log_warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::Warn, tag, fmt, args);
    va_end(args);
}

void log_info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::Info, tag, fmt, args);
    va_end(args);
}

void log_debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::Debug, tag, fmt, args);
    va_end(args);
}
