/// @file value.cpp
/// @brief RON value tree implementation

#include <sail_engine/ron/value.hpp>

#include <algorithm>
#include <cmath>

namespace sail_ron {

const char* value_kind_name(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Unit: return "unit";
        case ValueKind::Bool: return "bool";
        case ValueKind::Integer: return "integer";
        case ValueKind::Float: return "float";
        case ValueKind::Char: return "char";
        case ValueKind::String: return "string";
        case ValueKind::Identifier: return "identifier";
        case ValueKind::List: return "list";
        case ValueKind::Map: return "map";
        case ValueKind::Tuple: return "tuple";
        case ValueKind::Struct: return "struct";
        default: return "unknown";
    }
}

// =============================================================================
// Factories
// =============================================================================

Value Value::unit() {
    return Value{};
}

Value Value::boolean(bool v) {
    Value value;
    value.kind_ = ValueKind::Bool;
    value.bool_ = v;
    return value;
}

Value Value::integer(std::int64_t v) {
    Value value;
    value.kind_ = ValueKind::Integer;
    value.integer_ = v;
    return value;
}

Value Value::floating(double v) {
    Value value;
    value.kind_ = ValueKind::Float;
    value.float_ = v;
    return value;
}

Value Value::character(std::string utf8) {
    Value value;
    value.kind_ = ValueKind::Char;
    value.text_ = std::move(utf8);
    return value;
}

Value Value::string(std::string v) {
    Value value;
    value.kind_ = ValueKind::String;
    value.text_ = std::move(v);
    return value;
}

Value Value::identifier(std::string name) {
    Value value;
    value.kind_ = ValueKind::Identifier;
    value.text_ = std::move(name);
    return value;
}

Value Value::list(Elements items) {
    Value value;
    value.kind_ = ValueKind::List;
    value.items_ = std::move(items);
    return value;
}

Value Value::map(Elements keys, Elements values) {
    Value value;
    value.kind_ = ValueKind::Map;
    value.keys_ = std::move(keys);
    value.items_ = std::move(values);
    return value;
}

Value Value::tuple(std::string name, Elements items) {
    Value value;
    value.kind_ = ValueKind::Tuple;
    value.text_ = std::move(name);
    value.items_ = std::move(items);
    return value;
}

Value Value::structure(std::string name, std::vector<std::string> field_names, Elements values) {
    Value value;
    value.kind_ = ValueKind::Struct;
    value.text_ = std::move(name);
    value.field_names_ = std::move(field_names);
    value.items_ = std::move(values);
    return value;
}

// =============================================================================
// Accessors
// =============================================================================

bool Value::is_named(std::string_view name) const noexcept {
    if (kind_ != ValueKind::Identifier && kind_ != ValueKind::Tuple && kind_ != ValueKind::Struct) {
        return false;
    }
    return text_ == name;
}

double Value::as_number() const noexcept {
    if (kind_ == ValueKind::Integer) {
        return static_cast<double>(integer_);
    }
    return float_;
}

const Value* Value::field(std::string_view field_name) const {
    if (kind_ != ValueKind::Struct) {
        return nullptr;
    }
    for (std::size_t i = 0; i < field_names_.size(); ++i) {
        if (field_names_[i] == field_name) {
            return &items_[i];
        }
    }
    return nullptr;
}

void Value::push_field(std::string field_name, Value value) {
    field_names_.push_back(std::move(field_name));
    items_.push_back(std::move(value));
}

void Value::push_element(Value value) {
    items_.push_back(std::move(value));
}

std::string Value::describe() const {
    std::string result = value_kind_name(kind_);
    if ((kind_ == ValueKind::Identifier || kind_ == ValueKind::Tuple || kind_ == ValueKind::Struct)
        && !text_.empty()) {
        result += " " + text_;
    }
    return result;
}

// =============================================================================
// Equality
// =============================================================================

bool Value::operator==(const Value& other) const {
    if (kind_ != other.kind_) {
        return false;
    }

    switch (kind_) {
        case ValueKind::Unit:
            return true;
        case ValueKind::Bool:
            return bool_ == other.bool_;
        case ValueKind::Integer:
            return integer_ == other.integer_;
        case ValueKind::Float:
            if (std::isnan(float_) && std::isnan(other.float_)) {
                return true;
            }
            return float_ == other.float_;
        case ValueKind::Char:
        case ValueKind::String:
        case ValueKind::Identifier:
            return text_ == other.text_;
        case ValueKind::List:
            return items_ == other.items_;
        case ValueKind::Map:
            return keys_ == other.keys_ && items_ == other.items_;
        case ValueKind::Tuple:
            return text_ == other.text_ && items_ == other.items_;
        case ValueKind::Struct:
            return text_ == other.text_ && field_names_ == other.field_names_
                && items_ == other.items_;
        default:
            return false;
    }
}

// =============================================================================
// Document
// =============================================================================

bool Document::has_extension(std::string_view name) const {
    return std::find(extensions.begin(), extensions.end(), name) != extensions.end();
}

} // namespace sail_ron
