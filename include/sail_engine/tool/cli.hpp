#pragma once

/// @file cli.hpp
/// @brief sail_layout command line - argument parsing and command dispatch
///
/// Commands:
/// - check: decode and validate a layout, report every issue
/// - format: re-serialize a layout in canonical RON form
/// - json: export the layout tree as JSON
/// - ids: list node ids in document order
/// - tree: print the node hierarchy

#include <iosfwd>
#include <string>
#include <vector>

namespace sail_tool {

constexpr int k_exit_ok = 0;
constexpr int k_exit_usage = 1;      ///< Bad arguments, configuration or output path
constexpr int k_exit_invalid = 2;    ///< Layout failed to decode or validate

/// Default configuration file, relative to the working directory
constexpr const char* k_default_config = "config/sail_layout.toml";

/// @brief Run the tool with @p args (args[0] is the program name)
///
/// Tool output goes to @p out, diagnostics and usage to @p err.
/// Logging must already be initialized; run() reconfigures it from the
/// loaded configuration but never shuts it down.
/// @return Process exit code
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace sail_tool
