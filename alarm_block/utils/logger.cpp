#include <alarm_block/utils/logger.hpp>
#include <cstdio>
#include <strings.h>

LogLevel Logger::s_level = LogLevel::INFO;

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

LogLevel Logger::parseLevel(const char* name, LogLevel fallback) {
    if (name == nullptr) {
        return fallback;
    }
    if (strcasecmp(name, "error") == 0) return LogLevel::ERROR;
    if (strcasecmp(name, "warn") == 0)  return LogLevel::WARN;
    if (strcasecmp(name, "info") == 0)  return LogLevel::INFO;
    if (strcasecmp(name, "debug") == 0) return LogLevel::DEBUG;
    return fallback;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "error";
        case LogLevel::WARN:  return "warn";
        case LogLevel::INFO:  return "info";
        case LogLevel::DEBUG: return "debug";
    }
    return "info";
}

void Logger::emit(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (static_cast<int>(s_level) < static_cast<int>(level)) {
        return;
    }
    char buffer[LOGGER_MAX_MESSAGE_LEN];
    const char* text = buffer;
    if (vsnprintf(buffer, sizeof(buffer), fmt, args) < 0) {
        text = "formatting error";
    }
    // vsnprintf truncates, so the buffer is always terminated here

    switch (level) {
        case LogLevel::ERROR: ESP_LOGE(tag, "%s", text); break;
        case LogLevel::WARN:  ESP_LOGW(tag, "%s", text); break;
        case LogLevel::INFO:  ESP_LOGI(tag, "%s", text); break;
        case LogLevel::DEBUG: ESP_LOGD(tag, "%s", text); break;
    }
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}
