// src/log.cpp
// All output goes to stderr: stdout carries fetched content for the CLI.
#include "log.h"
#include <mutex>
#include <atomic>
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <string>

namespace tollgate {

static std::atomic<LogLevel> g_log_level{LogLevel::INFO};
static std::atomic<uint32_t> g_log_categories{static_cast<uint32_t>(LogCategory::ALL)};
static std::atomic<bool> g_timestamps_enabled{true};

static std::mutex g_log_mutex;

static thread_local char g_timestamp_buf[32];
static thread_local int64_t g_last_timestamp_sec = 0;

static inline const char* format_timestamp() {
    using namespace std::chrono;
    const auto now_sec = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();

    // Only reformat if second changed
    if (now_sec != g_last_timestamp_sec) {
        g_last_timestamp_sec = now_sec;
        const std::time_t tt = static_cast<std::time_t>(now_sec);
        std::tm tm{};
        gmtime_r(&tt, &tm);
        std::snprintf(g_timestamp_buf, sizeof(g_timestamp_buf),
                      "%04d-%02d-%02dT%02d:%02d:%02dZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec);
    }
    return g_timestamp_buf;
}

static void write_line(const char* level, const std::string& msg) noexcept {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    try {
        if (g_timestamps_enabled.load(std::memory_order_relaxed)) {
            std::cerr << "[" << level << "][" << format_timestamp() << "] " << msg << '\n';
        } else {
            std::cerr << "[" << level << "] " << msg << '\n';
        }
    } catch (const std::exception&) {
        // Never let logging take the process down
    }
}

static inline bool enabled(LogLevel lvl) {
    return g_log_level.load(std::memory_order_relaxed) <= lvl;
}

static inline bool enabled(LogLevel lvl, LogCategory cat) {
    return enabled(lvl) &&
           (g_log_categories.load(std::memory_order_relaxed) & static_cast<uint32_t>(cat));
}

void log_info(const std::string& m)  { if (enabled(LogLevel::INFO)) write_line("INFO", m); }
void log_warn(const std::string& m)  { if (enabled(LogLevel::WARN)) write_line("WARN", m); }
void log_error(const std::string& m) { if (enabled(LogLevel::ERR))  write_line("ERROR", m); }

void log_trace(LogCategory cat, const std::string& s) { if (enabled(LogLevel::TRACE, cat)) write_line("TRACE", s); }
void log_debug(LogCategory cat, const std::string& s) { if (enabled(LogLevel::DEBUG, cat)) write_line("DEBUG", s); }
void log_info(LogCategory cat, const std::string& s)  { if (enabled(LogLevel::INFO, cat))  write_line("INFO", s); }
void log_warn(LogCategory cat, const std::string& s)  { if (enabled(LogLevel::WARN, cat))  write_line("WARN", s); }
void log_error(LogCategory cat, const std::string& s) { if (enabled(LogLevel::ERR, cat))   write_line("ERROR", s); }
void log_fatal(LogCategory cat, const std::string& s) { if (enabled(LogLevel::FATAL, cat)) write_line("FATAL", s); }

void log_set_level(LogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

void log_set_categories(uint32_t categories) {
    g_log_categories.store(categories, std::memory_order_relaxed);
}

void log_enable_timestamps(bool enable) {
    g_timestamps_enabled.store(enable, std::memory_order_relaxed);
}

LogLevel log_get_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

uint32_t log_get_categories() {
    return g_log_categories.load(std::memory_order_relaxed);
}

bool log_level_from_string(const std::string& s, LogLevel& out) {
    if (s == "trace") out = LogLevel::TRACE;
    else if (s == "debug") out = LogLevel::DEBUG;
    else if (s == "info") out = LogLevel::INFO;
    else if (s == "warn") out = LogLevel::WARN;
    else if (s == "error") out = LogLevel::ERR;
    else if (s == "fatal") out = LogLevel::FATAL;
    else if (s == "none") out = LogLevel::NONE;
    else return false;
    return true;
}

void log_flush() {
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::cerr.flush();
}

void log_init(LogLevel level, uint32_t categories) {
    g_log_level.store(level, std::memory_order_relaxed);
    g_log_categories.store(categories, std::memory_order_relaxed);
}

}  // namespace tollgate
