#pragma once

/// @file parser.hpp
/// @brief RON text parser for sail_ron

#include "value.hpp"

#include <sail_engine/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace sail_ron {

/// @brief Recursive-descent parser for Rusty Object Notation
///
/// Supports the value grammar used by layout files: unit, booleans, integers
/// (decimal, hex, octal, binary), floats, chars, strings (escaped and raw),
/// identifiers, tuples, structs, lists, maps, trailing commas, line and
/// nested block comments, and `#![enable(...)]` extension headers.
class Parser {
public:
    /// @brief Parse a complete document
    [[nodiscard]] static sail_core::Result<Document> parse(
        std::string_view source, std::string_view source_name = "<string>");

    /// @brief Read and parse a file
    [[nodiscard]] static sail_core::Result<Document> parse_file(const std::filesystem::path& path);

    /// @brief Parse a single value (no extension header)
    [[nodiscard]] static sail_core::Result<Value> parse_value(
        std::string_view source, std::string_view source_name = "<string>");

private:
    Parser(std::string_view source, std::string_view source_name);

    // Document structure
    bool parse_extensions(Document& doc);
    bool parse_any(Value& out);
    bool parse_parenthesized(std::string name, SourceLocation loc, Value& out);
    bool parse_list(Value& out);
    bool parse_map(Value& out);

    // Scalars
    bool parse_number(Value& out);
    bool parse_string(std::string& out);
    bool parse_raw_string(std::string& out);
    bool parse_char(Value& out);
    bool parse_escape(std::string& out);
    bool copy_utf8(std::string& out);
    std::string parse_identifier();

    // Lexing helpers
    void skip_trivia();
    bool skip_block_comment();
    [[nodiscard]] bool at_end() const { return pos_ >= source_.size(); }
    [[nodiscard]] char current() const { return at_end() ? '\0' : source_[pos_]; }
    [[nodiscard]] char peek(std::size_t offset = 1) const;
    void advance();
    bool expect(char c, const char* expected);
    bool consume_separator(char closing, const char* context);
    [[nodiscard]] SourceLocation location() const { return {line_, column_}; }

    static bool is_ident_start(char c);
    static bool is_ident_char(char c);

    // Errors
    bool fail(sail_core::ParseError err);
    bool fail_unexpected(const char* expected);

    std::string_view source_;
    std::string source_name_;
    std::size_t pos_ = 0;
    std::uint32_t line_ = 1;
    std::uint32_t column_ = 1;
    std::uint32_t depth_ = 0;
    bool failed_ = false;
    sail_core::ParseError error_{};

    static constexpr std::uint32_t k_max_depth = 256;
};

} // namespace sail_ron
