/// @file types.cpp
/// @brief Name tables and asset kind helpers for sail_layout

#include <sail_engine/layout/types.hpp>

#include <algorithm>
#include <cctype>

namespace sail_layout {

// =============================================================================
// Anchor / LineMode / Stretch
// =============================================================================

const char* anchor_name(Anchor anchor) noexcept {
    switch (anchor) {
        case Anchor::TopLeft: return "TopLeft";
        case Anchor::TopMiddle: return "TopMiddle";
        case Anchor::TopRight: return "TopRight";
        case Anchor::MiddleLeft: return "MiddleLeft";
        case Anchor::Middle: return "Middle";
        case Anchor::MiddleRight: return "MiddleRight";
        case Anchor::BottomLeft: return "BottomLeft";
        case Anchor::BottomMiddle: return "BottomMiddle";
        case Anchor::BottomRight: return "BottomRight";
    }
    return "Middle";
}

std::optional<Anchor> anchor_from_name(std::string_view name) noexcept {
    for (Anchor anchor : k_all_anchors) {
        if (name == anchor_name(anchor)) {
            return anchor;
        }
    }
    return std::nullopt;
}

const char* line_mode_name(LineMode mode) noexcept {
    switch (mode) {
        case LineMode::Single: return "Single";
        case LineMode::Wrap: return "Wrap";
    }
    return "Single";
}

std::optional<LineMode> line_mode_from_name(std::string_view name) noexcept {
    if (name == "Single") return LineMode::Single;
    if (name == "Wrap") return LineMode::Wrap;
    return std::nullopt;
}

const char* stretch_mode_name(Stretch::Mode mode) noexcept {
    switch (mode) {
        case Stretch::Mode::NoStretch: return "NoStretch";
        case Stretch::Mode::X: return "X";
        case Stretch::Mode::Y: return "Y";
        case Stretch::Mode::XY: return "XY";
    }
    return "NoStretch";
}

// =============================================================================
// Color
// =============================================================================

bool Color::in_unit_range() const {
    auto ok = [](float c) { return c >= 0.0f && c <= 1.0f; };
    return ok(r) && ok(g) && ok(b) && ok(a);
}

// =============================================================================
// Assets
// =============================================================================

const char* asset_kind_name(AssetKind kind) noexcept {
    switch (kind) {
        case AssetKind::Image: return "image";
        case AssetKind::Font: return "font";
        case AssetKind::Other: return "other";
    }
    return "other";
}

AssetKind asset_kind_from_tag(std::string_view tag) noexcept {
    if (tag == k_image_kind_tag) return AssetKind::Image;
    if (tag == k_font_kind_tag) return AssetKind::Font;
    return AssetKind::Other;
}

std::optional<AssetKind> asset_kind_for_path(std::string_view path) {
    auto dot = path.rfind('.');
    auto slash = path.find_last_of("/\\");
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        return std::nullopt;
    }

    std::string ext(path.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "ttf" || ext == "otf") {
        return AssetKind::Font;
    }
    if (ext == "png" || ext == "jpg" || ext == "jpeg" || ext == "bmp" ||
        ext == "tga" || ext == "gif") {
        return AssetKind::Image;
    }
    return std::nullopt;
}

// =============================================================================
// Images
// =============================================================================

const char* image_variant_name(const ImageDesc& image) noexcept {
    switch (image.index()) {
        case 0: return "SolidColor";
        case 1: return "Texture";
        case 2: return "NineSlice";
        case 3: return "PartialTexture";
        default: return "SolidColor";
    }
}

const AssetRef* image_texture(const ImageDesc& image) noexcept {
    if (const auto* tex = std::get_if<TextureImage>(&image)) {
        return &tex->texture;
    }
    if (const auto* nine = std::get_if<NineSlice>(&image)) {
        return &nine->texture;
    }
    if (const auto* partial = std::get_if<PartialTexture>(&image)) {
        return &partial->texture;
    }
    return nullptr;
}

} // namespace sail_layout
