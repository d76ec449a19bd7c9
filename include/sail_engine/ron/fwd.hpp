#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for sail_ron module

#include <cstdint>

namespace sail_ron {

enum class ValueKind : std::uint8_t;
struct SourceLocation;
class Value;
struct Document;

class Parser;
struct WriterOptions;
class Writer;

} // namespace sail_ron
