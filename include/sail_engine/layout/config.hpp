/// @file config.hpp
/// @brief Layout tool configuration (sail_layout.toml)

#pragma once

#include "fwd.hpp"
#include "reader.hpp"
#include "validation.hpp"

#include <sail_engine/core/error.hpp>
#include <sail_engine/core/log.hpp>

#include <filesystem>
#include <string>

namespace sail_layout {

/// @brief Settings read from the [layout] and [log] tables
struct LayoutConfig {
    // [layout]
    std::filesystem::path asset_root = "assets";
    std::filesystem::path default_layout;      ///< Used when no file is given on the command line
    bool strict_fields = true;
    bool check_asset_files = false;
    bool warnings_as_errors = false;

    // [log]
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::string log_directory;                  ///< Empty disables the file sink
    std::size_t log_max_file_size = 10 * 1024 * 1024;
    std::size_t log_max_files = 5;

    [[nodiscard]] ReaderOptions reader_options() const;
    [[nodiscard]] ValidatorOptions validator_options() const;
    [[nodiscard]] sail_core::LogConfig log_config() const;
};

/// @brief Parses layout configuration files
class ConfigParser {
public:
    /// Parse a config file; relative paths inside it resolve against its directory
    [[nodiscard]] sail_core::Result<LayoutConfig> parse(const std::filesystem::path& path);

    /// Parse config text
    [[nodiscard]] sail_core::Result<LayoutConfig> parse_string(
        const std::string& content, const std::string& source_name = "<string>");

    /// Last error message
    [[nodiscard]] const std::string& last_error() const { return m_last_error; }

private:
    std::string m_last_error;
};

} // namespace sail_layout
