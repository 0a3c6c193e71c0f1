#include "log.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

static std::mutex g_log_mtx;
static LogLevel g_console_level = LogLevel::Info;
static std::ofstream g_log_file;

static const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "?    ";
}

static std::tm local_now() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

LogLevel parse_log_level(const std::string& s) {
    std::string u;
    for (char c : s) u += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (u == "DEBUG") return LogLevel::Debug;
    if (u == "WARN" || u == "WARNING") return LogLevel::Warn;
    if (u == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

void log_init(LogLevel console_level, const std::string& file_path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_console_level = console_level;

    if (g_log_file.is_open()) g_log_file.close();
    if (file_path.empty()) return;

    std::error_code ec;
    const std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    g_log_file.open(file_path, std::ios::app);
    if (!g_log_file.good()) {
        std::cerr << "[LOG] cannot open log file " << file_path
                  << " (console only)\n";
    }
}

void log_shutdown() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_file.is_open()) {
        g_log_file.flush();
        g_log_file.close();
    }
}

void log_line(LogLevel lvl, const char* tag, const std::string& msg) {
    const std::tm tm = local_now();
    char hms[16];
    char full[32];
    std::strftime(hms, sizeof(hms), "%H:%M:%S", &tm);
    std::strftime(full, sizeof(full), "%Y-%m-%d %H:%M:%S", &tm);

    std::lock_guard<std::mutex> lk(g_log_mtx);

    if (lvl >= g_console_level) {
        std::ostream& out = (lvl >= LogLevel::Warn) ? std::cerr : std::cout;
        out << hms << " | " << level_name(lvl) << " | [" << tag << "] " << msg << "\n";
    }
    if (g_log_file.is_open()) {
        g_log_file << full << " | " << level_name(lvl) << " | [" << tag << "] "
                   << msg << "\n";
    }
}
