/// @file validation.cpp
/// @brief Layout validation implementation

#include <sail_engine/layout/validation.hpp>

#include <sail_engine/core/log.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <system_error>
#include <unordered_map>

namespace sail_layout {

// =============================================================================
// Names
// =============================================================================

const char* severity_name(Severity severity) noexcept {
    switch (severity) {
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
    }
    return "error";
}

const char* issue_code_name(IssueCode code) noexcept {
    switch (code) {
        case IssueCode::DuplicateId: return "DuplicateId";
        case IssueCode::InvalidAssetPath: return "InvalidAssetPath";
        case IssueCode::UnknownAssetKind: return "UnknownAssetKind";
        case IssueCode::UnknownExtension: return "UnknownExtension";
        case IssueCode::AssetKindMismatch: return "AssetKindMismatch";
        case IssueCode::MissingAssetFile: return "MissingAssetFile";
        case IssueCode::ColorOutOfRange: return "ColorOutOfRange";
        case IssueCode::InvalidFontSize: return "InvalidFontSize";
        case IssueCode::InvalidSize: return "InvalidSize";
        case IssueCode::NineSliceBounds: return "NineSliceBounds";
        case IssueCode::TextureRange: return "TextureRange";
    }
    return "Unknown";
}

// =============================================================================
// ValidationIssue / ValidationResult
// =============================================================================

std::string ValidationIssue::to_string() const {
    if (path.empty()) {
        return fmt::format("{}: {}", severity_name(severity), message);
    }
    return fmt::format("{}: {}: {}", severity_name(severity), path, message);
}

void ValidationResult::merge(const ValidationResult& other) {
    if (!other.valid) {
        valid = false;
    }
    issues.insert(issues.end(), other.issues.begin(), other.issues.end());
}

void ValidationResult::add_error(IssueCode code, std::string path, std::string message) {
    valid = false;
    issues.push_back(ValidationIssue{Severity::Error, code, std::move(path), std::move(message)});
}

void ValidationResult::add_warning(IssueCode code, std::string path, std::string message) {
    issues.push_back(ValidationIssue{Severity::Warning, code, std::move(path), std::move(message)});
}

std::size_t ValidationResult::error_count() const {
    return static_cast<std::size_t>(std::count_if(issues.begin(), issues.end(),
        [](const ValidationIssue& i) { return i.severity == Severity::Error; }));
}

std::size_t ValidationResult::warning_count() const {
    return issues.size() - error_count();
}

bool ValidationResult::has(IssueCode code) const {
    return std::any_of(issues.begin(), issues.end(),
                       [code](const ValidationIssue& i) { return i.code == code; });
}

std::vector<ValidationIssue> ValidationResult::with_code(IssueCode code) const {
    std::vector<ValidationIssue> found;
    std::copy_if(issues.begin(), issues.end(), std::back_inserter(found),
                 [code](const ValidationIssue& i) { return i.code == code; });
    return found;
}

std::string ValidationResult::first_error() const {
    for (const auto& issue : issues) {
        if (issue.severity == Severity::Error) {
            return issue.to_string();
        }
    }
    return "";
}

std::vector<std::string> ValidationResult::all_messages() const {
    std::vector<std::string> msgs;
    msgs.reserve(issues.size());
    for (const auto& issue : issues) {
        msgs.push_back(issue.to_string());
    }
    return msgs;
}

sail_core::Error ValidationResult::to_error() const {
    sail_core::Error err(sail_core::ErrorCode::ValidationError,
        fmt::format("Layout validation failed with {} error(s)", error_count()));
    for (std::size_t i = 0; i < issues.size(); ++i) {
        err.with_context(fmt::format("issue {:03}", i), issues[i].to_string());
    }
    return err;
}

// =============================================================================
// LayoutValidator
// =============================================================================

namespace {

bool is_absolute_asset_path(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    if (path[0] == '/' || path[0] == '\\') {
        return true;
    }
    // Windows drive letter
    return path.size() > 1 && path[1] == ':';
}

bool escapes_root(const std::string& path) {
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find_first_of("/\\", start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (path.compare(start, end - start, "..") == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

} // namespace

ValidationResult LayoutValidator::validate(const LayoutDocument& doc) const {
    ValidationResult result;
    if (doc.empty()) {
        return result;
    }

    check_ids(doc, result);
    check_assets(doc, result);
    doc.root().visit([this, &result](const Node& node, std::size_t) {
        check_node(node, result);
    });

    if (m_options.warnings_as_errors && result.warning_count() > 0) {
        result.valid = false;
    }

    sail_core::layout_logger()->debug("Validated {} nodes: {} error(s), {} warning(s)",
        doc.node_count(), result.error_count(), result.warning_count());
    return result;
}

void LayoutValidator::check_ids(const LayoutDocument& doc, ValidationResult& result) const {
    std::unordered_map<std::string, std::string> first_seen;
    doc.root().visit([&](const Node& node, std::size_t) {
        if (node.id().empty()) {
            return;
        }
        auto [it, inserted] = first_seen.emplace(node.id(), node.path());
        if (!inserted) {
            result.add_error(IssueCode::DuplicateId, node.path() + ".transform.id",
                fmt::format("Duplicate id '{}' (first defined at {})", node.id(), it->second));
        }
    });
}

void LayoutValidator::check_assets(const LayoutDocument& doc, ValidationResult& result) const {
    for (const AssetUse& use : doc.asset_refs()) {
        const AssetRef& asset = *use.asset;

        if (asset.path.empty()) {
            result.add_error(IssueCode::InvalidAssetPath, use.path, "Asset path is empty");
            continue;
        }
        if (is_absolute_asset_path(asset.path)) {
            result.add_error(IssueCode::InvalidAssetPath, use.path,
                fmt::format("Asset path '{}' must be relative", asset.path));
            continue;
        }
        if (escapes_root(asset.path)) {
            result.add_warning(IssueCode::InvalidAssetPath, use.path,
                fmt::format("Asset path '{}' leaves the asset root", asset.path));
        }

        const AssetKind declared = asset.declared_kind();
        if (declared == AssetKind::Other) {
            result.add_error(IssueCode::UnknownAssetKind, use.path,
                fmt::format("Unknown asset kind '{}' for '{}'", asset.kind, asset.path));
        } else {
            const AssetKind wanted = use.usage == AssetUsage::Font ? AssetKind::Font : AssetKind::Image;
            if (declared != wanted) {
                result.add_error(IssueCode::AssetKindMismatch, use.path,
                    fmt::format("'{}' is used as a {} but declared as {}",
                                asset.path, asset_usage_name(use.usage), asset.kind));
            }
        }

        auto by_extension = asset_kind_for_path(asset.path);
        if (!by_extension) {
            result.add_warning(IssueCode::UnknownExtension, use.path,
                fmt::format("Cannot infer asset kind from '{}'", asset.path));
        } else if (declared != AssetKind::Other && *by_extension != declared) {
            result.add_error(IssueCode::AssetKindMismatch, use.path,
                fmt::format("'{}' looks like a {} file but is declared as {}",
                            asset.path, asset_kind_name(*by_extension), asset.kind));
        }

        if (m_options.check_files) {
            const auto full = m_options.asset_root / asset.path;
            std::error_code ec;
            if (!std::filesystem::is_regular_file(full, ec)) {
                result.add_error(IssueCode::MissingAssetFile, use.path,
                    sail_core::AssetError::file_not_found(full.string()).message);
            }
        }
    }
}

void LayoutValidator::check_node(const Node& node, ValidationResult& result) const {
    const std::string path = node.path();
    const Transform& t = node.transform();
    const std::string tpath = path + ".transform";

    if (!std::isfinite(t.x) || !std::isfinite(t.y) || !std::isfinite(t.z)) {
        result.add_error(IssueCode::InvalidSize, tpath, "Offsets must be finite");
    }
    if (!std::isfinite(t.width) || t.width < 0.0f) {
        result.add_error(IssueCode::InvalidSize, tpath + ".width",
            fmt::format("Width must be a non-negative number, got {}", t.width));
    }
    if (!std::isfinite(t.height) || t.height < 0.0f) {
        result.add_error(IssueCode::InvalidSize, tpath + ".height",
            fmt::format("Height must be a non-negative number, got {}", t.height));
    }
    if (t.stretch.x_margin < 0.0f || t.stretch.y_margin < 0.0f) {
        result.add_warning(IssueCode::InvalidSize, tpath + ".stretch", "Negative stretch margin");
    }

    switch (node.kind()) {
        case NodeKind::Container:
            if (const ImageDesc* bg = node.background()) {
                check_image(*bg, path + ".background", result);
            }
            break;
        case NodeKind::Label: {
            const TextDesc& text = *node.as_label();
            check_font_size(text.font_size, path + ".text.font_size", result);
            check_color(text.color, path + ".text.color", result);
            break;
        }
        case NodeKind::Image:
            check_image(node.as_image()->image, path + ".image", result);
            break;
        case NodeKind::Button: {
            const ButtonDesc& button = *node.as_button();
            const std::string bpath = path + ".button";
            check_font_size(button.font_size, bpath + ".font_size", result);
            check_color(button.normal_text_color, bpath + ".normal_text_color", result);
            if (button.hover_text_color) check_color(*button.hover_text_color, bpath + ".hover_text_color", result);
            if (button.press_text_color) check_color(*button.press_text_color, bpath + ".press_text_color", result);
            if (button.normal_image) check_image(*button.normal_image, bpath + ".normal_image", result);
            if (button.hover_image) check_image(*button.hover_image, bpath + ".hover_image", result);
            if (button.press_image) check_image(*button.press_image, bpath + ".press_image", result);
            break;
        }
    }
}

void LayoutValidator::check_image(const ImageDesc& image, const std::string& path,
                                  ValidationResult& result) const {
    if (const auto* solid = std::get_if<SolidColor>(&image)) {
        check_color(solid->color, path, result);
        return;
    }

    if (const auto* nine = std::get_if<NineSlice>(&image)) {
        const auto tex_w = static_cast<std::uint64_t>(nine->texture_dimensions[0]);
        const auto tex_h = static_cast<std::uint64_t>(nine->texture_dimensions[1]);
        if (tex_w == 0 || tex_h == 0) {
            result.add_error(IssueCode::NineSliceBounds, path + ".texture_dimensions",
                "Texture dimensions must be non-zero");
            return;
        }
        if (std::uint64_t{nine->x_start} + nine->width > tex_w ||
            std::uint64_t{nine->y_start} + nine->height > tex_h) {
            result.add_error(IssueCode::NineSliceBounds, path,
                fmt::format("Cell ({}, {}) {}x{} exceeds texture {}x{}",
                            nine->x_start, nine->y_start, nine->width, nine->height, tex_w, tex_h));
        }
        if (std::uint64_t{nine->left_dist} + nine->right_dist > nine->width ||
            std::uint64_t{nine->top_dist} + nine->bottom_dist > nine->height) {
            result.add_error(IssueCode::NineSliceBounds, path,
                fmt::format("Borders {}+{} / {}+{} do not fit a {}x{} cell",
                            nine->left_dist, nine->right_dist, nine->top_dist, nine->bottom_dist,
                            nine->width, nine->height));
        }
        return;
    }

    if (const auto* partial = std::get_if<PartialTexture>(&image)) {
        auto in_range = [](float v) { return v >= 0.0f && v <= 1.0f; };
        if (!in_range(partial->left) || !in_range(partial->right) ||
            !in_range(partial->bottom) || !in_range(partial->top)) {
            result.add_warning(IssueCode::TextureRange, path,
                "Texture coordinates should lie in [0, 1]");
        }
    }
}

void LayoutValidator::check_color(const Color& color, const std::string& path,
                                  ValidationResult& result) const {
    if (!color.in_unit_range()) {
        result.add_error(IssueCode::ColorOutOfRange, path,
            fmt::format("Color ({}, {}, {}, {}) has components outside [0, 1]",
                        color.r, color.g, color.b, color.a));
    }
}

void LayoutValidator::check_font_size(float size, const std::string& path,
                                      ValidationResult& result) const {
    if (!std::isfinite(size) || size <= 0.0f) {
        result.add_error(IssueCode::InvalidFontSize, path,
            fmt::format("Font size must be positive, got {}", size));
    }
}

} // namespace sail_layout
