/// @file error.cpp
/// @brief Error handling implementation for sail_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error formatting utilities
/// - Explicit template instantiations for common Result types

#include <sail_engine/core/error.hpp>
#include <sstream>

namespace sail_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format parse error with source location
std::string format_parse_error(const ParseError& err) {
    std::ostringstream oss;
    if (!err.source.empty()) {
        oss << err.source << ":";
    }
    oss << err.line << ":" << err.column << ": " << err.message;
    return oss.str();
}

/// Format schema error with field path
std::string format_schema_error(const SchemaError& err) {
    std::ostringstream oss;
    if (!err.path.empty()) {
        oss << err.path << ": ";
    }
    oss << err.message;
    return oss.str();
}

/// Format asset error with asset details
std::string format_asset_error(const AssetError& err) {
    std::ostringstream oss;
    oss << err.message;
    if (!err.asset_kind.empty()) {
        oss << " (kind: " << err.asset_kind << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ParseError>) {
            oss << detail::format_parse_error(err);
        } else if constexpr (std::is_same_v<T, SchemaError>) {
            oss << detail::format_schema_error(err);
        } else if constexpr (std::is_same_v<T, AssetError>) {
            oss << detail::format_asset_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;

} // namespace sail_core
