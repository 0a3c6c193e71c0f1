#pragma once
#include <sstream>
#include <string>
#include <utility>

// Process-wide logger. One mutex for every line so the stream thread and the
// scheduler thread never interleave.

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

LogLevel parse_log_level(const std::string& s);

// Console threshold + optional file sink (file receives Debug and above).
void log_init(LogLevel console_level, const std::string& file_path);
void log_shutdown();

void log_line(LogLevel lvl, const char* tag, const std::string& msg);

template <typename... Args>
std::string log_concat(Args&&... args) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(4);
    (oss << ... << args);
    return oss.str();
}

template <typename... Args>
void log_debug(const char* tag, Args&&... args) {
    log_line(LogLevel::Debug, tag, log_concat(std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(const char* tag, Args&&... args) {
    log_line(LogLevel::Info, tag, log_concat(std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(const char* tag, Args&&... args) {
    log_line(LogLevel::Warn, tag, log_concat(std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(const char* tag, Args&&... args) {
    log_line(LogLevel::Error, tag, log_concat(std::forward<Args>(args)...));
}
