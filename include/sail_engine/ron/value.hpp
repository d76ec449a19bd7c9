#pragma once

/// @file value.hpp
/// @brief Generic RON value tree for sail_ron
///
/// A Value is one node of a parsed RON document. Struct fields and map
/// entries keep their declaration order so documents can be written back
/// without reshuffling.

#include "fwd.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sail_ron {

// =============================================================================
// ValueKind
// =============================================================================

/// @brief Shape of a RON value
enum class ValueKind : std::uint8_t {
    Unit,        ///< ()
    Bool,        ///< true / false
    Integer,     ///< 42, 0x2A, -7
    Float,       ///< 4.0, 4., .5, 1e3, inf, NaN
    Char,        ///< 'c'
    String,      ///< "text", r#"raw"#
    Identifier,  ///< Bare name: unit variant or unit struct (Middle, None)
    List,        ///< [a, b]
    Map,         ///< {k: v}
    Tuple,       ///< (a, b) or Name(a, b)
    Struct       ///< (f: a) or Name(f: a)
};

/// @brief Get value kind name
[[nodiscard]] const char* value_kind_name(ValueKind kind) noexcept;

// =============================================================================
// SourceLocation
// =============================================================================

/// @brief Position of a value in its source text (1-based)
struct SourceLocation {
    std::uint32_t line = 0;
    std::uint32_t column = 0;

    [[nodiscard]] bool valid() const noexcept { return line != 0; }
};

// =============================================================================
// Value
// =============================================================================

/// @brief RON value
class Value {
public:
    using Elements = std::vector<Value>;

    Value() = default;

    // Factories
    [[nodiscard]] static Value unit();
    [[nodiscard]] static Value boolean(bool v);
    [[nodiscard]] static Value integer(std::int64_t v);
    [[nodiscard]] static Value floating(double v);
    [[nodiscard]] static Value character(std::string utf8);
    [[nodiscard]] static Value string(std::string v);
    [[nodiscard]] static Value identifier(std::string name);
    [[nodiscard]] static Value list(Elements items);
    [[nodiscard]] static Value map(Elements keys, Elements values);
    [[nodiscard]] static Value tuple(std::string name, Elements items);
    [[nodiscard]] static Value structure(std::string name,
                                         std::vector<std::string> field_names,
                                         Elements values);

    // Kind
    [[nodiscard]] ValueKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_unit() const noexcept { return kind_ == ValueKind::Unit; }
    [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Bool; }
    [[nodiscard]] bool is_integer() const noexcept { return kind_ == ValueKind::Integer; }
    [[nodiscard]] bool is_float() const noexcept { return kind_ == ValueKind::Float; }
    [[nodiscard]] bool is_number() const noexcept { return is_integer() || is_float(); }
    [[nodiscard]] bool is_char() const noexcept { return kind_ == ValueKind::Char; }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }
    [[nodiscard]] bool is_identifier() const noexcept { return kind_ == ValueKind::Identifier; }
    [[nodiscard]] bool is_list() const noexcept { return kind_ == ValueKind::List; }
    [[nodiscard]] bool is_map() const noexcept { return kind_ == ValueKind::Map; }
    [[nodiscard]] bool is_tuple() const noexcept { return kind_ == ValueKind::Tuple; }
    [[nodiscard]] bool is_struct() const noexcept { return kind_ == ValueKind::Struct; }

    /// @brief True for `Identifier`, `Tuple` or `Struct` carrying the given name
    [[nodiscard]] bool is_named(std::string_view name) const noexcept;

    // Scalars
    [[nodiscard]] bool as_bool() const noexcept { return bool_; }
    [[nodiscard]] std::int64_t as_integer() const noexcept { return integer_; }
    /// @brief Numeric value; integers are widened
    [[nodiscard]] double as_number() const noexcept;
    /// @brief Payload of String, Char and Identifier
    [[nodiscard]] const std::string& as_string() const noexcept { return text_; }

    // Compound
    /// @brief Name of Identifier, Tuple or Struct (empty when anonymous)
    [[nodiscard]] const std::string& name() const noexcept { return text_; }
    /// @brief Elements of List or Tuple, field values of Struct, values of Map
    [[nodiscard]] const Elements& elements() const noexcept { return items_; }
    /// @brief Keys of Map
    [[nodiscard]] const Elements& keys() const noexcept { return keys_; }
    /// @brief Field names of Struct
    [[nodiscard]] const std::vector<std::string>& field_names() const noexcept { return field_names_; }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }

    /// @brief Look up a struct field, nullptr if absent or not a struct
    [[nodiscard]] const Value* field(std::string_view field_name) const;

    /// @brief Append a struct field (no duplicate check)
    void push_field(std::string field_name, Value value);

    /// @brief Append a list or tuple element
    void push_element(Value value);

    // Location
    [[nodiscard]] const SourceLocation& location() const noexcept { return location_; }
    void set_location(SourceLocation loc) noexcept { location_ = loc; }

    /// @brief Short description for diagnostics, e.g. "struct Container"
    [[nodiscard]] std::string describe() const;

    /// @brief Structural equality, source locations ignored
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    ValueKind kind_ = ValueKind::Unit;
    bool bool_ = false;
    std::int64_t integer_ = 0;
    double float_ = 0.0;
    std::string text_;
    Elements items_;
    Elements keys_;
    std::vector<std::string> field_names_;
    SourceLocation location_;
};

// =============================================================================
// Document
// =============================================================================

/// @brief Parsed RON file: extension header plus root value
struct Document {
    std::vector<std::string> extensions;  ///< From `#![enable(...)]`
    Value root;

    [[nodiscard]] bool has_extension(std::string_view name) const;
};

} // namespace sail_ron
