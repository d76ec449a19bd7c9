#pragma once

/// @file validation.hpp
/// @brief Structural checks for sail_layout documents

#include "fwd.hpp"
#include "document.hpp"

#include <sail_engine/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sail_layout {

// =============================================================================
// Severity / IssueCode
// =============================================================================

/// Issue severity
enum class Severity : std::uint8_t {
    Warning = 0,
    Error
};

[[nodiscard]] const char* severity_name(Severity severity) noexcept;

/// What a validation issue is about
enum class IssueCode : std::uint8_t {
    DuplicateId,
    InvalidAssetPath,   // Empty, absolute, or escaping the asset root
    UnknownAssetKind,   // Kind tag other than IMAGE / TTF
    UnknownExtension,   // Extension not mapped to any kind
    AssetKindMismatch,  // Kind disagrees with extension or usage
    MissingAssetFile,
    ColorOutOfRange,
    InvalidFontSize,
    InvalidSize,        // Negative or non-finite width / height / offset
    NineSliceBounds,
    TextureRange,       // PartialTexture coordinates outside [0, 1]
};

[[nodiscard]] const char* issue_code_name(IssueCode code) noexcept;

// =============================================================================
// ValidationIssue
// =============================================================================

/// A single finding
struct ValidationIssue {
    Severity severity = Severity::Error;
    IssueCode code = IssueCode::InvalidSize;
    std::string path;
    std::string message;

    [[nodiscard]] std::string to_string() const;
};

// =============================================================================
// ValidationResult
// =============================================================================

/// Result of validation
struct ValidationResult {
    bool valid = true;
    std::vector<ValidationIssue> issues;

    [[nodiscard]] static ValidationResult ok() {
        return ValidationResult{true, {}};
    }

    /// Merge another result
    void merge(const ValidationResult& other);

    /// Add error (marks the result invalid)
    void add_error(IssueCode code, std::string path, std::string message);

    /// Add warning
    void add_warning(IssueCode code, std::string path, std::string message);

    [[nodiscard]] std::size_t error_count() const;
    [[nodiscard]] std::size_t warning_count() const;

    /// True if any issue carries the given code
    [[nodiscard]] bool has(IssueCode code) const;

    /// Issues with the given code
    [[nodiscard]] std::vector<ValidationIssue> with_code(IssueCode code) const;

    /// Get first error message
    [[nodiscard]] std::string first_error() const;

    /// Get all issue messages
    [[nodiscard]] std::vector<std::string> all_messages() const;

    /// Summarize as an error, with one context entry per issue
    [[nodiscard]] sail_core::Error to_error() const;
};

// =============================================================================
// LayoutValidator
// =============================================================================

/// Validator behaviour
struct ValidatorOptions {
    std::filesystem::path asset_root;  ///< Base for relative asset paths
    bool check_files = false;          ///< Require every asset file to exist
    bool warnings_as_errors = false;
};

/// Checks the properties a consuming engine relies on
///
/// Ids are unique; asset kinds agree with extension and usage; colors lie in
/// [0, 1]; font sizes are positive; sizes are non-negative; nine-slice cells
/// fit their texture.
class LayoutValidator {
public:
    LayoutValidator() = default;
    explicit LayoutValidator(ValidatorOptions options) : m_options(std::move(options)) {}

    [[nodiscard]] ValidationResult validate(const LayoutDocument& doc) const;

    [[nodiscard]] const ValidatorOptions& options() const noexcept { return m_options; }

private:
    void check_ids(const LayoutDocument& doc, ValidationResult& result) const;
    void check_assets(const LayoutDocument& doc, ValidationResult& result) const;
    void check_node(const Node& node, ValidationResult& result) const;
    void check_image(const ImageDesc& image, const std::string& path, ValidationResult& result) const;
    void check_color(const Color& color, const std::string& path, ValidationResult& result) const;
    void check_font_size(float size, const std::string& path, ValidationResult& result) const;

    ValidatorOptions m_options;
};

} // namespace sail_layout
