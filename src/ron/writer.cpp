/// @file writer.cpp
/// @brief RON writer implementation

#include <sail_engine/ron/writer.hpp>

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace sail_ron {

// =============================================================================
// Scalar Formatting
// =============================================================================

std::string Writer::format_float(double v) {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v < 0 ? "-inf" : "inf";
    }

    std::string text = fmt::format("{}", v);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string Writer::quote(const std::string& text, char quote_char) {
    std::string out;
    out.reserve(text.size() + 2);
    out += quote_char;

    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '\0': out += "\\0"; break;
            default:
                if (c == quote_char) {
                    out += '\\';
                    out += c;
                } else if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{{{:x}}}", static_cast<unsigned int>(c));
                } else {
                    out += c;
                }
                break;
        }
    }

    out += quote_char;
    return out;
}

// =============================================================================
// Writer
// =============================================================================

std::string Writer::write(const Document& doc) const {
    std::string out;

    if (m_options.emit_extensions && !doc.extensions.empty()) {
        out += "#![enable(";
        for (std::size_t i = 0; i < doc.extensions.size(); ++i) {
            if (i > 0) out += ", ";
            out += doc.extensions[i];
        }
        out += ")]\n";
        if (m_options.pretty) out += '\n';
    }

    write_value(out, doc.root, 0);
    out += '\n';
    return out;
}

std::string Writer::write(const Value& value) const {
    std::string out;
    write_value(out, value, 0);
    return out;
}

void Writer::write_value(std::string& out, const Value& value, std::size_t level) const {
    switch (value.kind()) {
        case ValueKind::Unit:
            out += "()";
            break;
        case ValueKind::Bool:
            out += value.as_bool() ? "true" : "false";
            break;
        case ValueKind::Integer:
            out += std::to_string(value.as_integer());
            break;
        case ValueKind::Float:
            out += format_float(value.as_number());
            break;
        case ValueKind::Char:
            out += quote(value.as_string(), '\'');
            break;
        case ValueKind::String:
            out += quote(value.as_string());
            break;
        case ValueKind::Identifier:
            out += value.name();
            break;
        case ValueKind::List:
            write_sequence(out, value, '[', ']', level);
            break;
        case ValueKind::Tuple:
            out += value.name();
            write_sequence(out, value, '(', ')', level);
            break;
        case ValueKind::Struct:
            write_struct(out, value, level);
            break;
        case ValueKind::Map:
            write_map(out, value, level);
            break;
    }
}

void Writer::write_sequence(std::string& out, const Value& value, char open, char close,
                            std::size_t level) const {
    const auto& items = value.elements();
    out += open;

    if (items.empty()) {
        out += close;
        return;
    }

    if (!m_options.pretty || fits_inline(value)) {
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) out += ", ";
            write_value(out, items[i], level);
        }
        // Single-element anonymous tuple needs the comma to stay a tuple
        if (value.is_tuple() && value.name().empty() && items.size() == 1) {
            out += ',';
        }
        out += close;
        return;
    }

    // Newtype wrappers such as Some(...) or Texture(...) hug their payload
    if (value.is_tuple() && !value.name().empty() && items.size() == 1) {
        write_value(out, items.front(), level);
        out += close;
        return;
    }

    for (const auto& item : items) {
        newline(out, level + 1);
        write_value(out, item, level + 1);
        out += ',';
    }
    newline(out, level);
    out += close;
}

void Writer::write_struct(std::string& out, const Value& value, std::size_t level) const {
    const auto& names = value.field_names();
    const auto& values = value.elements();

    out += value.name();
    out += '(';

    if (!m_options.pretty) {
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (i > 0) out += ", ";
            out += names[i];
            out += ": ";
            write_value(out, values[i], level);
        }
        out += ')';
        return;
    }

    for (std::size_t i = 0; i < names.size(); ++i) {
        newline(out, level + 1);
        out += names[i];
        out += ": ";
        write_value(out, values[i], level + 1);
        out += ',';
    }
    if (!names.empty()) {
        newline(out, level);
    }
    out += ')';
}

void Writer::write_map(std::string& out, const Value& value, std::size_t level) const {
    const auto& keys = value.keys();
    const auto& values = value.elements();

    out += '{';
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (m_options.pretty) {
            newline(out, level + 1);
        } else if (i > 0) {
            out += ", ";
        }
        write_value(out, keys[i], level + 1);
        out += ": ";
        write_value(out, values[i], level + 1);
        if (m_options.pretty) out += ',';
    }
    if (m_options.pretty && !keys.empty()) {
        newline(out, level);
    }
    out += '}';
}

void Writer::newline(std::string& out, std::size_t level) const {
    out += '\n';
    for (std::size_t i = 0; i < level; ++i) {
        out += m_options.indent;
    }
}

bool Writer::fits_inline(const Value& value) const {
    switch (value.kind()) {
        case ValueKind::List:
        case ValueKind::Map:
            return value.size() == 0;
        case ValueKind::Struct:
            return value.size() == 0;
        case ValueKind::Tuple:
            if (value.size() > m_options.max_inline_tuple) {
                return false;
            }
            for (const auto& item : value.elements()) {
                if (!fits_inline(item)) {
                    return false;
                }
            }
            return true;
        default:
            return true;
    }
}

} // namespace sail_ron
