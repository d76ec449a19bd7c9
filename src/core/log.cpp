/// @file log.cpp
/// @brief Named logger registry for sail_core

#include <sail_engine/core/log.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <utility>
#include <vector>

namespace sail_core {

namespace {

struct LogState {
    std::mutex mutex;
    LogConfig config;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

LogState& state() {
    static LogState s;
    return s;
}

/// Sinks for one logger; caller holds the state mutex
std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    // stdout carries tool output (format, json, ids), diagnostics stay on stderr
    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        const auto file = std::filesystem::path(config.log_directory) / (name + ".log");
        try {
            auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file.string(), config.max_file_size, config.max_files);
            rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(std::move(rotating));
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("Cannot open log file {}: {}", file.string(), ex.what());
        }
    }
    return sinks;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.config = config;
    for (auto& [name, logger] : s.loggers) {
        logger->sinks() = make_sinks(s.config, name);
        logger->set_level(s.config.level);
    }
    spdlog::set_level(s.config.level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (auto it = s.loggers.find(name); it != s.loggers.end()) {
        return it->second;
    }

    auto sinks = make_sinks(s.config, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(s.config.level);
    s.loggers.emplace(name, logger);
    spdlog::register_logger(logger);
    return logger;
}

std::shared_ptr<spdlog::logger> ron_logger() {
    static auto logger = get_logger("sail_ron");
    return logger;
}

std::shared_ptr<spdlog::logger> layout_logger() {
    static auto logger = get_logger("sail_layout");
    return logger;
}

std::shared_ptr<spdlog::logger> tool_logger() {
    static auto logger = get_logger("sail_tool");
    return logger;
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.config.level = level;
    for (auto& entry : s.loggers) {
        entry.second->set_level(level);
    }
    spdlog::set_level(level);
}

spdlog::level::level_enum get_global_log_level() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.config.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "fatal") return spdlog::level::critical;

    // from_str also takes "warn" and "err", and maps every unknown name to off
    auto level = spdlog::level::from_str(str);
    if (level == spdlog::level::off && str != "off") {
        return std::nullopt;
    }
    return level;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Structured Messages
// =============================================================================

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    std::string line = message;
    const char* separator = " {";
    for (const auto& [key, value] : fields) {
        line += fmt::format("{}{}=\"{}\"", separator, key, value);
        separator = ", ";
    }
    if (!fields.empty()) {
        line += '}';
    }
    get_logger(logger_name)->log(level, line);
}

LogScope::LogScope(std::string name, const std::string& logger_name)
    : m_name(std::move(name))
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace("begin {}", m_name);
}

LogScope::~LogScope() {
    const auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("end {} ({:.3f} ms)", m_name, elapsed.count());
}

// =============================================================================
// Shutdown
// =============================================================================

void flush_all_loggers() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    for (auto& entry : s.loggers) {
        entry.second->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.loggers.clear();
    spdlog::shutdown();
}

} // namespace sail_core
