/// @file config.cpp
/// @brief Layout configuration parsing implementation

#include <sail_engine/layout/config.hpp>

#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace sail_layout {

// =============================================================================
// LayoutConfig
// =============================================================================

ReaderOptions LayoutConfig::reader_options() const {
    ReaderOptions options;
    options.strict_fields = strict_fields;
    return options;
}

ValidatorOptions LayoutConfig::validator_options() const {
    ValidatorOptions options;
    options.asset_root = asset_root;
    options.check_files = check_asset_files;
    options.warnings_as_errors = warnings_as_errors;
    return options;
}

sail_core::LogConfig LayoutConfig::log_config() const {
    sail_core::LogConfig config;
    config.level = log_level;
    config.file_enabled = !log_directory.empty();
    config.log_directory = log_directory;
    config.max_file_size = log_max_file_size;
    config.max_files = log_max_files;
    return config;
}

// =============================================================================
// ConfigParser
// =============================================================================

sail_core::Result<LayoutConfig> ConfigParser::parse(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        m_last_error = "Failed to open config file: " + path.string();
        return sail_core::Err<LayoutConfig>(sail_core::Error(sail_core::ErrorCode::IOError, m_last_error));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_string(buffer.str(), path.string());
    if (!result) {
        return result;
    }

    LayoutConfig& config = *result;
    const auto base = path.parent_path();
    if (config.asset_root.is_relative()) {
        config.asset_root = base / config.asset_root;
    }
    if (!config.default_layout.empty() && config.default_layout.is_relative()) {
        config.default_layout = base / config.default_layout;
    }
    if (!config.log_directory.empty() && std::filesystem::path(config.log_directory).is_relative()) {
        config.log_directory = (base / config.log_directory).string();
    }

    sail_core::tool_logger()->debug("Loaded config {}", path.string());
    return result;
}

sail_core::Result<LayoutConfig> ConfigParser::parse_string(
    const std::string& content,
    const std::string& source_name)
{
    LayoutConfig config;

    try {
        toml::table tbl = toml::parse(content, source_name);

        // [layout]
        if (auto layout = tbl["layout"].as_table()) {
            const auto& t = *layout;
            if (auto root = t["asset_root"].value<std::string>()) {
                config.asset_root = *root;
            }
            if (auto file = t["default_layout"].value<std::string>()) {
                config.default_layout = *file;
            }
            if (auto strict = t["strict_fields"].value<bool>()) {
                config.strict_fields = *strict;
            }
            if (auto check = t["check_asset_files"].value<bool>()) {
                config.check_asset_files = *check;
            }
            if (auto werror = t["warnings_as_errors"].value<bool>()) {
                config.warnings_as_errors = *werror;
            }
        }

        // [log]
        if (auto log = tbl["log"].as_table()) {
            const auto& t = *log;
            if (auto level = t["level"].value<std::string>()) {
                auto parsed = sail_core::parse_log_level(*level);
                if (!parsed) {
                    m_last_error = source_name + ": unknown log level '" + *level + "'";
                    return sail_core::Err<LayoutConfig>(
                        sail_core::Error(sail_core::ErrorCode::InvalidArgument, m_last_error));
                }
                config.log_level = *parsed;
            }
            if (auto dir = t["directory"].value<std::string>()) {
                config.log_directory = *dir;
            }
            if (auto size = t["max_file_size"].value<std::int64_t>(); size && *size > 0) {
                config.log_max_file_size = static_cast<std::size_t>(*size);
            }
            if (auto files = t["max_files"].value<std::int64_t>(); files && *files > 0) {
                config.log_max_files = static_cast<std::size_t>(*files);
            }
        }

    } catch (const toml::parse_error& err) {
        m_last_error = "TOML parse error: " + std::string(err.what());
        return sail_core::Err<LayoutConfig>(sail_core::Error(sail_core::ErrorCode::ParseError, m_last_error));
    }

    m_last_error.clear();
    return config;
}

} // namespace sail_layout
