#pragma once

/// @file error.hpp
/// @brief Error handling types for sail_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace sail_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    IOError,
    ParseError,
    SchemaError,
    ValidationError,
    AssetError,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::SchemaError: return "SchemaError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::AssetError: return "AssetError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Syntax errors raised while reading text
struct ParseError {
    enum class Kind : std::uint8_t {
        UnexpectedCharacter,  // Character not valid at this position
        UnexpectedEnd,        // Input ended inside a value
        InvalidNumber,        // Malformed or out-of-range number literal
        InvalidString,        // Bad escape or unterminated string
        TrailingCharacters,   // Content after the root value
    };

    Kind kind;
    std::string message;
    std::string source;
    std::uint32_t line = 0;
    std::uint32_t column = 0;

    [[nodiscard]] static ParseError unexpected_character(
        char c, const std::string& expected, std::uint32_t line, std::uint32_t column) {
        return ParseError{Kind::UnexpectedCharacter,
            "Unexpected character '" + std::string(1, c) + "', expected " + expected,
            {}, line, column};
    }

    [[nodiscard]] static ParseError unexpected_end(
        const std::string& context, std::uint32_t line, std::uint32_t column) {
        return ParseError{Kind::UnexpectedEnd, "Unexpected end of input in " + context,
            {}, line, column};
    }

    [[nodiscard]] static ParseError invalid_number(
        const std::string& text, std::uint32_t line, std::uint32_t column) {
        return ParseError{Kind::InvalidNumber, "Invalid number literal: " + text,
            {}, line, column};
    }

    [[nodiscard]] static ParseError invalid_string(
        const std::string& reason, std::uint32_t line, std::uint32_t column) {
        return ParseError{Kind::InvalidString, "Invalid string: " + reason,
            {}, line, column};
    }

    [[nodiscard]] static ParseError trailing_characters(std::uint32_t line, std::uint32_t column) {
        return ParseError{Kind::TrailingCharacters, "Trailing characters after root value",
            {}, line, column};
    }
};

/// Errors raised while mapping a value tree onto a typed model
struct SchemaError {
    enum class Kind : std::uint8_t {
        MissingField,    // Required field not present
        UnknownField,    // Field not part of the type
        UnknownVariant,  // Enum/variant name not recognised
        TypeMismatch,    // Value has the wrong shape
        OutOfRange,      // Numeric value does not fit the target
    };

    Kind kind;
    std::string message;
    std::string path;
    std::string expected;  // For TypeMismatch
    std::string found;     // For TypeMismatch

    [[nodiscard]] static SchemaError missing_field(const std::string& path, const std::string& field) {
        return SchemaError{Kind::MissingField, "Missing required field '" + field + "'",
            path, field, {}};
    }

    [[nodiscard]] static SchemaError unknown_field(const std::string& path, const std::string& field) {
        return SchemaError{Kind::UnknownField, "Unknown field '" + field + "'", path, {}, field};
    }

    [[nodiscard]] static SchemaError unknown_variant(
        const std::string& path, const std::string& type, const std::string& name) {
        return SchemaError{Kind::UnknownVariant,
            "Unknown " + type + " variant '" + name + "'", path, type, name};
    }

    [[nodiscard]] static SchemaError type_mismatch(
        const std::string& path, const std::string& expected_t, const std::string& found_t) {
        return SchemaError{Kind::TypeMismatch,
            "Type mismatch: expected " + expected_t + ", found " + found_t,
            path, expected_t, found_t};
    }

    [[nodiscard]] static SchemaError out_of_range(const std::string& path, const std::string& what) {
        return SchemaError{Kind::OutOfRange, "Value out of range: " + what, path, {}, {}};
    }
};

/// Asset reference errors
struct AssetError {
    enum class Kind : std::uint8_t {
        FileNotFound,   // Referenced file missing under the asset root
        KindMismatch,   // Declared kind does not fit the file or its use
        InvalidPath,    // Empty or absolute path
    };

    Kind kind;
    std::string message;
    std::string asset_path;
    std::string asset_kind;

    [[nodiscard]] static AssetError file_not_found(const std::string& path) {
        return AssetError{Kind::FileNotFound, "Asset file not found: " + path, path, {}};
    }

    [[nodiscard]] static AssetError kind_mismatch(
        const std::string& path, const std::string& declared, const std::string& expected) {
        return AssetError{Kind::KindMismatch,
            "Asset '" + path + "' declared as " + declared + ", expected " + expected,
            path, declared};
    }

    [[nodiscard]] static AssetError invalid_path(const std::string& path, const std::string& reason) {
        return AssetError{Kind::InvalidPath, "Invalid asset path '" + path + "': " + reason, path, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ParseError,
        SchemaError,
        AssetError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ParseError err) : m_code(ErrorCode::ParseError), m_error(std::move(err)) {}
    Error(SchemaError err) : m_code(ErrorCode::SchemaError), m_error(std::move(err)) {}
    Error(AssetError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(AssetError::Kind kind) {
        switch (kind) {
            case AssetError::Kind::FileNotFound: return ErrorCode::NotFound;
            case AssetError::Kind::KindMismatch: return ErrorCode::AssetError;
            case AssetError::Kind::InvalidPath: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type holding either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with location and context
std::string build_error_chain(const Error& error);

} // namespace sail_core
