#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for sail_core module

#include <cstdint>

namespace sail_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ParseError;
struct SchemaError;
struct AssetError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace sail_core
