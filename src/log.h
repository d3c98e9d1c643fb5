// =============================================================================
// LOGGING
// =============================================================================

#pragma once
#include <string>
#include <cstdint>

namespace tollgate {

// Note: Using ERR instead of ERROR to avoid conflict with Windows ERROR macro
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    FATAL = 5,
    NONE = 6
};

// Log categories for filtering
enum class LogCategory : uint32_t {
    GENERAL     = 0x0001,
    NET         = 0x0002,
    WALLET      = 0x0004,
    BUDGET      = 0x0008,
    FACILITATOR = 0x0010,
    ENGINE      = 0x0020,
    STORAGE     = 0x0040,
    ALL         = 0xFFFF
};

// Configuration
void log_set_level(LogLevel level);
void log_set_categories(uint32_t categories);
void log_enable_timestamps(bool enable);

LogLevel log_get_level();
uint32_t log_get_categories();

// "trace" | "debug" | "info" | "warn" | "error" | "fatal" | "none"
bool log_level_from_string(const std::string& s, LogLevel& out);

void log_info(const std::string& s);
void log_warn(const std::string& s);
void log_error(const std::string& s);

void log_trace(LogCategory cat, const std::string& s);
void log_debug(LogCategory cat, const std::string& s);
void log_info(LogCategory cat, const std::string& s);
void log_warn(LogCategory cat, const std::string& s);
void log_error(LogCategory cat, const std::string& s);
void log_fatal(LogCategory cat, const std::string& s);

// Conditional logging (avoids string construction if level is disabled)
#define TOLLGATE_LOG_TRACE(cat, msg) do { \
    if (tollgate::log_get_level() <= tollgate::LogLevel::TRACE && \
        (tollgate::log_get_categories() & static_cast<uint32_t>(cat))) { \
        tollgate::log_trace(cat, msg); \
    } \
} while(0)

#define TOLLGATE_LOG_DEBUG(cat, msg) do { \
    if (tollgate::log_get_level() <= tollgate::LogLevel::DEBUG && \
        (tollgate::log_get_categories() & static_cast<uint32_t>(cat))) { \
        tollgate::log_debug(cat, msg); \
    } \
} while(0)

#define TOLLGATE_LOG_INFO(cat, msg) do { \
    if (tollgate::log_get_level() <= tollgate::LogLevel::INFO && \
        (tollgate::log_get_categories() & static_cast<uint32_t>(cat))) { \
        tollgate::log_info(cat, msg); \
    } \
} while(0)

#define TOLLGATE_LOG_WARN(cat, msg) do { \
    if (tollgate::log_get_level() <= tollgate::LogLevel::WARN && \
        (tollgate::log_get_categories() & static_cast<uint32_t>(cat))) { \
        tollgate::log_warn(cat, msg); \
    } \
} while(0)

#define TOLLGATE_LOG_ERROR(cat, msg) do { \
    if (tollgate::log_get_level() <= tollgate::LogLevel::ERR && \
        (tollgate::log_get_categories() & static_cast<uint32_t>(cat))) { \
        tollgate::log_error(cat, msg); \
    } \
} while(0)

void log_flush();

void log_init(LogLevel level = LogLevel::INFO,
              uint32_t categories = static_cast<uint32_t>(LogCategory::ALL));

}  // namespace tollgate
