/// @file parser.cpp
/// @brief RON parser implementation

#include <sail_engine/ron/parser.hpp>
#include <sail_engine/core/log.hpp>

#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace sail_ron {

using sail_core::ParseError;

namespace {

/// Append a code point as UTF-8
bool append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        return false;
    }
    return true;
}

/// Length of a UTF-8 sequence from its lead byte, 0 if invalid
std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

} // anonymous namespace

// =============================================================================
// Entry Points
// =============================================================================

Parser::Parser(std::string_view source, std::string_view source_name)
    : source_(source), source_name_(source_name) {
    // UTF-8 byte order mark
    if (source_.size() >= 3 && source_.substr(0, 3) == "\xEF\xBB\xBF") {
        pos_ = 3;
    }
}

sail_core::Result<Document> Parser::parse(std::string_view source, std::string_view source_name) {
    Parser parser(source, source_name);
    Document doc;

    if (!parser.parse_extensions(doc) || !parser.parse_any(doc.root)) {
        return sail_core::Err<Document>(sail_core::Error(parser.error_));
    }

    parser.skip_trivia();
    if (parser.failed_) {
        return sail_core::Err<Document>(sail_core::Error(parser.error_));
    }
    if (!parser.at_end()) {
        parser.fail(ParseError::trailing_characters(parser.line_, parser.column_));
        return sail_core::Err<Document>(sail_core::Error(parser.error_));
    }

    return doc;
}

sail_core::Result<Document> Parser::parse_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return sail_core::Err<Document>(
            sail_core::Error(sail_core::ErrorCode::IOError, "Failed to open file: " + path.string()));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    std::string content = ss.str();

    sail_core::ron_logger()->debug("Parsing {} ({} bytes)", path.string(), content.size());
    return parse(content, path.string());
}

sail_core::Result<Value> Parser::parse_value(std::string_view source, std::string_view source_name) {
    Parser parser(source, source_name);
    Value value;

    if (!parser.parse_any(value)) {
        return sail_core::Err<Value>(sail_core::Error(parser.error_));
    }

    parser.skip_trivia();
    if (parser.failed_) {
        return sail_core::Err<Value>(sail_core::Error(parser.error_));
    }
    if (!parser.at_end()) {
        parser.fail(ParseError::trailing_characters(parser.line_, parser.column_));
        return sail_core::Err<Value>(sail_core::Error(parser.error_));
    }

    return value;
}

// =============================================================================
// Document Structure
// =============================================================================

bool Parser::parse_extensions(Document& doc) {
    skip_trivia();

    while (current() == '#') {
        advance();
        if (!expect('!', "'!' in extension attribute")) return false;
        if (!expect('[', "'[' in extension attribute")) return false;
        skip_trivia();

        std::string attribute = parse_identifier();
        if (attribute != "enable") {
            return fail_unexpected("'enable' attribute");
        }
        skip_trivia();
        if (!expect('(', "'(' after enable")) return false;

        while (true) {
            skip_trivia();
            if (current() == ')') {
                advance();
                break;
            }
            if (!is_ident_start(current())) {
                return fail_unexpected("extension name");
            }
            doc.extensions.push_back(parse_identifier());
            if (!consume_separator(')', "extension list")) return false;
        }

        skip_trivia();
        if (!expect(']', "']' closing extension attribute")) return false;
        skip_trivia();
    }

    return true;
}

bool Parser::parse_any(Value& out) {
    skip_trivia();
    SourceLocation loc = location();

    if (at_end()) {
        return fail(ParseError::unexpected_end("value", line_, column_));
    }
    if (depth_ >= k_max_depth) {
        return fail(ParseError{ParseError::Kind::UnexpectedCharacter,
            "Nesting deeper than " + std::to_string(k_max_depth) + " levels", {}, line_, column_});
    }

    ++depth_;
    bool ok = true;
    char c = current();

    if (c == '(') {
        ok = parse_parenthesized({}, loc, out);
    } else if (c == '[') {
        ok = parse_list(out);
    } else if (c == '{') {
        ok = parse_map(out);
    } else if (c == '"') {
        std::string text;
        ok = parse_string(text);
        out = Value::string(std::move(text));
    } else if (c == 'r' && (peek() == '"' || peek() == '#')) {
        std::string text;
        ok = parse_raw_string(text);
        out = Value::string(std::move(text));
    } else if (c == '\'') {
        ok = parse_char(out);
    } else if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.') {
        ok = parse_number(out);
    } else if (is_ident_start(c)) {
        std::string name = parse_identifier();
        if (name == "true" || name == "false") {
            out = Value::boolean(name == "true");
        } else if (name == "inf") {
            out = Value::floating(std::numeric_limits<double>::infinity());
        } else if (name == "NaN") {
            out = Value::floating(std::numeric_limits<double>::quiet_NaN());
        } else {
            skip_trivia();
            if (current() == '(') {
                ok = parse_parenthesized(std::move(name), loc, out);
            } else {
                out = Value::identifier(std::move(name));
            }
        }
    } else {
        ok = fail_unexpected("a value");
    }

    --depth_;
    out.set_location(loc);
    return ok;
}

bool Parser::parse_parenthesized(std::string name, SourceLocation loc, Value& out) {
    if (!expect('(', "'('")) return false;
    skip_trivia();

    if (current() == ')') {
        advance();
        out = name.empty() ? Value::unit() : Value::tuple(std::move(name), {});
        out.set_location(loc);
        return true;
    }

    // `ident :` (but not `ident ::`) opens a struct body
    bool is_struct = false;
    if (is_ident_start(current())) {
        std::size_t saved_pos = pos_;
        std::uint32_t saved_line = line_;
        std::uint32_t saved_column = column_;

        parse_identifier();
        skip_trivia();
        is_struct = current() == ':' && peek() != ':';

        pos_ = saved_pos;
        line_ = saved_line;
        column_ = saved_column;
    }

    if (is_struct) {
        out = Value::structure(std::move(name), {}, {});
        while (true) {
            skip_trivia();
            if (current() == ')') {
                advance();
                break;
            }
            if (at_end()) {
                return fail(ParseError::unexpected_end("struct", line_, column_));
            }
            if (!is_ident_start(current())) {
                return fail_unexpected("field name");
            }
            std::string field_name = parse_identifier();
            skip_trivia();
            if (!expect(':', "':' after field name")) return false;

            Value field_value;
            if (!parse_any(field_value)) return false;
            out.push_field(std::move(field_name), std::move(field_value));

            if (!consume_separator(')', "struct")) return false;
        }
    } else {
        out = Value::tuple(std::move(name), {});
        while (true) {
            skip_trivia();
            if (current() == ')') {
                advance();
                break;
            }
            Value element;
            if (!parse_any(element)) return false;
            out.push_element(std::move(element));

            if (!consume_separator(')', "tuple")) return false;
        }
    }

    out.set_location(loc);
    return true;
}

bool Parser::parse_list(Value& out) {
    if (!expect('[', "'['")) return false;

    Value::Elements items;
    while (true) {
        skip_trivia();
        if (current() == ']') {
            advance();
            break;
        }
        Value element;
        if (!parse_any(element)) return false;
        items.push_back(std::move(element));

        if (!consume_separator(']', "list")) return false;
    }

    out = Value::list(std::move(items));
    return true;
}

bool Parser::parse_map(Value& out) {
    if (!expect('{', "'{'")) return false;

    Value::Elements keys;
    Value::Elements values;
    while (true) {
        skip_trivia();
        if (current() == '}') {
            advance();
            break;
        }
        Value key;
        if (!parse_any(key)) return false;
        skip_trivia();
        if (!expect(':', "':' after map key")) return false;

        Value value;
        if (!parse_any(value)) return false;
        keys.push_back(std::move(key));
        values.push_back(std::move(value));

        if (!consume_separator('}', "map")) return false;
    }

    out = Value::map(std::move(keys), std::move(values));
    return true;
}

// =============================================================================
// Scalars
// =============================================================================

bool Parser::parse_number(Value& out) {
    std::uint32_t start_line = line_;
    std::uint32_t start_column = column_;
    bool negative = false;

    if (current() == '-' || current() == '+') {
        negative = current() == '-';
        advance();
    }

    // Signed infinity
    if (current() == 'i' || current() == 'N') {
        std::string word = parse_identifier();
        if (word == "inf") {
            out = Value::floating(negative ? -std::numeric_limits<double>::infinity()
                                           : std::numeric_limits<double>::infinity());
            return true;
        }
        if (word == "NaN") {
            out = Value::floating(std::numeric_limits<double>::quiet_NaN());
            return true;
        }
        return fail(ParseError::invalid_number(word, start_line, start_column));
    }

    // Hex, octal, binary
    if (current() == '0' && (peek() == 'x' || peek() == 'o' || peek() == 'b')) {
        int base = peek() == 'x' ? 16 : (peek() == 'o' ? 8 : 2);
        advance();
        advance();

        std::string digits;
        while (!at_end() && (std::isxdigit(static_cast<unsigned char>(current())) || current() == '_')) {
            if (current() != '_') digits += current();
            advance();
        }

        std::uint64_t magnitude = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude, base);
        if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return fail(ParseError::invalid_number(digits, start_line, start_column));
        }
        constexpr auto k_max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (magnitude > k_max + (negative ? 1 : 0)) {
            return fail(ParseError::invalid_number(digits, start_line, start_column));
        }
        if (negative && magnitude == k_max + 1) {
            out = Value::integer(std::numeric_limits<std::int64_t>::min());
            return true;
        }
        auto v = static_cast<std::int64_t>(magnitude);
        out = Value::integer(negative ? -v : v);
        return true;
    }

    std::string text;
    bool is_float = false;
    bool has_digits = false;

    while (!at_end() && (std::isdigit(static_cast<unsigned char>(current())) || current() == '_')) {
        if (current() != '_') text += current();
        has_digits = true;
        advance();
    }

    if (current() == '.') {
        is_float = true;
        text += '.';
        advance();
        while (!at_end() && (std::isdigit(static_cast<unsigned char>(current())) || current() == '_')) {
            if (current() != '_') text += current();
            has_digits = true;
            advance();
        }
    }

    if (has_digits && (current() == 'e' || current() == 'E')) {
        is_float = true;
        text += 'e';
        advance();
        if (current() == '-' || current() == '+') {
            text += current();
            advance();
        }
        bool exponent_digits = false;
        while (!at_end() && std::isdigit(static_cast<unsigned char>(current()))) {
            text += current();
            exponent_digits = true;
            advance();
        }
        if (!exponent_digits) {
            return fail(ParseError::invalid_number(text, start_line, start_column));
        }
    }

    if (!has_digits) {
        return fail(ParseError::invalid_number(text.empty() ? std::string(1, current()) : text,
                                               start_line, start_column));
    }

    if (is_float) {
        // from_chars rejects a bare trailing dot such as "4."
        if (text.back() == '.') text += '0';
        if (text.front() == '.') text.insert(text.begin(), '0');

        double v = 0.0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return fail(ParseError::invalid_number(text, start_line, start_column));
        }
        out = Value::floating(negative ? -v : v);
        return true;
    }

    std::uint64_t magnitude = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), magnitude);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return fail(ParseError::invalid_number(text, start_line, start_column));
    }

    constexpr auto max_positive = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (negative) {
        if (magnitude > max_positive + 1) {
            return fail(ParseError::invalid_number("-" + text, start_line, start_column));
        }
        out = Value::integer(magnitude == max_positive + 1
            ? std::numeric_limits<std::int64_t>::min()
            : -static_cast<std::int64_t>(magnitude));
    } else {
        if (magnitude > max_positive) {
            return fail(ParseError::invalid_number(text, start_line, start_column));
        }
        out = Value::integer(static_cast<std::int64_t>(magnitude));
    }
    return true;
}

bool Parser::parse_string(std::string& out) {
    if (!expect('"', "'\"'")) return false;

    while (true) {
        if (at_end()) {
            return fail(ParseError::unexpected_end("string", line_, column_));
        }
        char c = current();
        if (c == '"') {
            advance();
            return true;
        }
        if (c == '\\') {
            if (!parse_escape(out)) return false;
            continue;
        }
        if (!copy_utf8(out)) return false;
    }
}

bool Parser::parse_raw_string(std::string& out) {
    advance();  // 'r'

    std::size_t hashes = 0;
    while (current() == '#') {
        ++hashes;
        advance();
    }
    if (!expect('"', "'\"' opening raw string")) return false;

    while (true) {
        if (at_end()) {
            return fail(ParseError::unexpected_end("raw string", line_, column_));
        }
        if (current() == '"') {
            std::size_t matched = 0;
            while (matched < hashes && peek(matched + 1) == '#') {
                ++matched;
            }
            if (matched == hashes) {
                advance();
                for (std::size_t i = 0; i < hashes; ++i) advance();
                return true;
            }
        }
        if (!copy_utf8(out)) return false;
    }
}

/// Copy one UTF-8 encoded character, rejecting malformed sequences
bool Parser::copy_utf8(std::string& out) {
    std::uint32_t start_line = line_;
    std::uint32_t start_column = column_;

    auto lead = static_cast<unsigned char>(current());
    std::size_t length = utf8_sequence_length(lead);
    // 0xC0/0xC1 only start overlong forms, 0xF5 and up encode past U+10FFFF
    if (length == 0 || lead == 0xC0 || lead == 0xC1 || lead > 0xF4) {
        return fail(ParseError::invalid_string("invalid UTF-8 byte", start_line, start_column));
    }
    if (pos_ + length > source_.size()) {
        return fail(ParseError::invalid_string("truncated UTF-8 sequence", start_line, start_column));
    }
    for (std::size_t i = 1; i < length; ++i) {
        if ((static_cast<unsigned char>(source_[pos_ + i]) & 0xC0) != 0x80) {
            return fail(ParseError::invalid_string("invalid UTF-8 sequence", start_line, start_column));
        }
    }

    for (std::size_t i = 0; i < length; ++i) {
        out += current();
        advance();
    }
    return true;
}

bool Parser::parse_char(Value& out) {
    if (!expect('\'', "'")) return false;

    std::string text;
    if (current() == '\\') {
        if (!parse_escape(text)) return false;
    } else {
        std::size_t length = utf8_sequence_length(static_cast<unsigned char>(current()));
        if (length == 0 || at_end() || current() == '\'') {
            return fail_unexpected("a character");
        }
        for (std::size_t i = 0; i < length; ++i) {
            if (at_end()) {
                return fail(ParseError::unexpected_end("char", line_, column_));
            }
            text += current();
            advance();
        }
    }

    if (!expect('\'', "closing quote of char")) return false;
    out = Value::character(std::move(text));
    return true;
}

bool Parser::parse_escape(std::string& out) {
    std::uint32_t start_line = line_;
    std::uint32_t start_column = column_;
    advance();  // backslash

    if (at_end()) {
        return fail(ParseError::unexpected_end("escape sequence", line_, column_));
    }

    char c = current();
    advance();
    switch (c) {
        case 'n': out += '\n'; return true;
        case 't': out += '\t'; return true;
        case 'r': out += '\r'; return true;
        case '0': out += '\0'; return true;
        case '\\': out += '\\'; return true;
        case '"': out += '"'; return true;
        case '\'': out += '\''; return true;
        case 'x': {
            std::string hex;
            for (int i = 0; i < 2 && std::isxdigit(static_cast<unsigned char>(current())); ++i) {
                hex += current();
                advance();
            }
            unsigned int byte = 0;
            auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), byte, 16);
            if (hex.size() != 2 || ec != std::errc{} || byte > 0x7F) {
                return fail(ParseError::invalid_string("bad \\x escape", start_line, start_column));
            }
            out += static_cast<char>(byte);
            return true;
        }
        case 'u': {
            // \u{1F600} or é
            std::string hex;
            if (current() == '{') {
                advance();
                while (!at_end() && current() != '}') {
                    hex += current();
                    advance();
                }
                if (!expect('}', "'}' closing unicode escape")) return false;
            } else {
                for (int i = 0; i < 4 && std::isxdigit(static_cast<unsigned char>(current())); ++i) {
                    hex += current();
                    advance();
                }
            }
            std::uint32_t cp = 0;
            auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), cp, 16);
            if (hex.empty() || ec != std::errc{} || ptr != hex.data() + hex.size() || !append_utf8(out, cp)) {
                return fail(ParseError::invalid_string("bad unicode escape", start_line, start_column));
            }
            return true;
        }
        default:
            return fail(ParseError::invalid_string(
                std::string("unknown escape '\\") + c + "'", start_line, start_column));
    }
}

std::string Parser::parse_identifier() {
    std::size_t start = pos_;
    while (!at_end() && is_ident_char(current())) {
        advance();
    }
    return std::string(source_.substr(start, pos_ - start));
}

// =============================================================================
// Lexing Helpers
// =============================================================================

void Parser::skip_trivia() {
    while (!at_end()) {
        char c = current();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else if (c == '/' && peek() == '/') {
            while (!at_end() && current() != '\n') {
                advance();
            }
        } else if (c == '/' && peek() == '*') {
            if (!skip_block_comment()) return;
        } else {
            break;
        }
    }
}

bool Parser::skip_block_comment() {
    std::uint32_t start_line = line_;
    std::uint32_t start_column = column_;
    int nesting = 0;

    do {
        if (at_end()) {
            return fail(ParseError::unexpected_end("block comment", start_line, start_column));
        }
        if (current() == '/' && peek() == '*') {
            ++nesting;
            advance();
            advance();
        } else if (current() == '*' && peek() == '/') {
            --nesting;
            advance();
            advance();
        } else {
            advance();
        }
    } while (nesting > 0);

    return true;
}

char Parser::peek(std::size_t offset) const {
    std::size_t index = pos_ + offset;
    return index < source_.size() ? source_[index] : '\0';
}

void Parser::advance() {
    if (at_end()) return;
    if (source_[pos_] == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    ++pos_;
}

bool Parser::expect(char c, const char* expected) {
    if (at_end()) {
        return fail(ParseError::unexpected_end(expected, line_, column_));
    }
    if (current() != c) {
        return fail_unexpected(expected);
    }
    advance();
    return true;
}

bool Parser::consume_separator(char closing, const char* context) {
    skip_trivia();
    if (current() == ',') {
        advance();
        return true;
    }
    if (current() == closing) {
        return true;
    }
    if (at_end()) {
        return fail(ParseError::unexpected_end(context, line_, column_));
    }
    return fail_unexpected((std::string("',' or '") + closing + "' in " + context).c_str());
}

bool Parser::is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool Parser::is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// =============================================================================
// Errors
// =============================================================================

bool Parser::fail(ParseError err) {
    if (!failed_) {
        failed_ = true;
        error_ = std::move(err);
        error_.source = source_name_;
    }
    return false;
}

bool Parser::fail_unexpected(const char* expected) {
    if (at_end()) {
        return fail(ParseError::unexpected_end(expected, line_, column_));
    }
    return fail(ParseError::unexpected_character(current(), expected, line_, column_));
}

} // namespace sail_ron
