#pragma once

/// @file writer.hpp
/// @brief RON text writer for sail_ron

#include "value.hpp"

#include <string>

namespace sail_ron {

/// @brief Output formatting options
struct WriterOptions {
    bool pretty = true;             ///< Multi-line structs, lists and maps
    std::string indent = "    ";
    bool emit_extensions = true;    ///< Write `#![enable(...)]` header
    std::size_t max_inline_tuple = 8;  ///< Longer tuples break across lines
};

/// @brief Serializes value trees back to RON text
///
/// Output always parses back to an equal value tree. Floats are written in
/// shortest round-trip form and always carry a decimal point.
class Writer {
public:
    Writer() = default;
    explicit Writer(WriterOptions options) : m_options(std::move(options)) {}

    [[nodiscard]] std::string write(const Document& doc) const;
    [[nodiscard]] std::string write(const Value& value) const;

    [[nodiscard]] const WriterOptions& options() const { return m_options; }

    /// @brief Format a float the way the writer does
    [[nodiscard]] static std::string format_float(double v);

    /// @brief Quote and escape a string
    [[nodiscard]] static std::string quote(const std::string& text, char quote_char = '"');

private:
    void write_value(std::string& out, const Value& value, std::size_t level) const;
    void write_sequence(std::string& out, const Value& value, char open, char close,
                        std::size_t level) const;
    void write_struct(std::string& out, const Value& value, std::size_t level) const;
    void write_map(std::string& out, const Value& value, std::size_t level) const;
    void newline(std::string& out, std::size_t level) const;
    [[nodiscard]] bool fits_inline(const Value& value) const;

    WriterOptions m_options;
};

} // namespace sail_ron
