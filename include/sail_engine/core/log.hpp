#pragma once

/// @file log.hpp
/// @brief Named spdlog loggers for the ron, layout and tool subsystems

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace sail_core {

// =============================================================================
// Setup
// =============================================================================

/// @brief Default pattern and level for the global spdlog logger
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

/// Sink and level settings shared by every named logger
struct LogConfig {
    bool console_enabled = true;                    ///< Colour sink on stderr
    bool file_enabled = false;                      ///< One rotating file per logger
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Apply @p config to existing loggers and to those created later
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// "sail_ron": parser and writer
std::shared_ptr<spdlog::logger> ron_logger();

/// "sail_layout": reader, writer and validator
std::shared_ptr<spdlog::logger> layout_logger();

/// "sail_tool": command line tool
std::shared_ptr<spdlog::logger> tool_logger();

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);
spdlog::level::level_enum get_global_log_level();

/// Parse a level name; accepts spdlog's names plus "fatal"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Messages
// =============================================================================

/// Log "message {key="value", ...}" on the named logger
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

/// @brief Traces entry and exit of a block with its duration
class LogScope {
public:
    explicit LogScope(std::string name, const std::string& logger_name = "sail_tool");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define SAIL_LOG_CONCAT_IMPL(a, b) a##b
#define SAIL_LOG_CONCAT(a, b) SAIL_LOG_CONCAT_IMPL(a, b)
#define SAIL_LOG_SCOPE(name) ::sail_core::LogScope SAIL_LOG_CONCAT(sail_log_scope_, __LINE__)(name)

// =============================================================================
// Shutdown
// =============================================================================

void flush_all_loggers();

/// Flush and drop every logger; spdlog is unusable afterwards
void shutdown_logging();

} // namespace sail_core
