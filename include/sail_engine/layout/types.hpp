/// @file types.hpp
/// @brief Core types and enumerations for sail_layout module

#pragma once

#include "fwd.hpp"

#include <sail_engine/ron/value.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sail_layout {

// =============================================================================
// Anchors
// =============================================================================

/// @brief Reference point on a rectangle, used for both anchor and pivot
enum class Anchor : std::uint8_t {
    TopLeft,
    TopMiddle,
    TopRight,
    MiddleLeft,
    Middle,
    MiddleRight,
    BottomLeft,
    BottomMiddle,
    BottomRight
};

inline constexpr std::array<Anchor, 9> k_all_anchors = {
    Anchor::TopLeft, Anchor::TopMiddle, Anchor::TopRight,
    Anchor::MiddleLeft, Anchor::Middle, Anchor::MiddleRight,
    Anchor::BottomLeft, Anchor::BottomMiddle, Anchor::BottomRight
};

[[nodiscard]] const char* anchor_name(Anchor anchor) noexcept;
[[nodiscard]] std::optional<Anchor> anchor_from_name(std::string_view name) noexcept;

/// @brief Text line breaking
enum class LineMode : std::uint8_t {
    Single,
    Wrap
};

[[nodiscard]] const char* line_mode_name(LineMode mode) noexcept;
[[nodiscard]] std::optional<LineMode> line_mode_from_name(std::string_view name) noexcept;

// =============================================================================
// Basic Structures
// =============================================================================

/// @brief Linear RGBA color, components nominally in [0, 1]
struct Color {
    float r{1}, g{1}, b{1}, a{1};

    Color() = default;
    Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    static Color white() { return {1, 1, 1, 1}; }
    static Color black() { return {0, 0, 0, 1}; }
    static Color transparent() { return {0, 0, 0, 0}; }

    [[nodiscard]] std::array<float, 4> to_array() const { return {r, g, b, a}; }

    /// @brief True when every component lies in [0, 1]
    [[nodiscard]] bool in_unit_range() const;

    bool operator==(const Color&) const = default;
};

/// @brief Sizing rule tracking the parent size minus a margin
struct Stretch {
    enum class Mode : std::uint8_t {
        NoStretch,
        X,
        Y,
        XY
    };

    Mode mode{Mode::NoStretch};
    float x_margin{0};
    float y_margin{0};
    bool keep_aspect_ratio{false};

    static Stretch none() { return {}; }
    static Stretch x(float margin) { return {Mode::X, margin, 0, false}; }
    static Stretch y(float margin) { return {Mode::Y, 0, margin, false}; }
    static Stretch xy(float x_margin, float y_margin, bool keep_aspect) {
        return {Mode::XY, x_margin, y_margin, keep_aspect};
    }

    bool operator==(const Stretch&) const = default;
};

[[nodiscard]] const char* stretch_mode_name(Stretch::Mode mode) noexcept;

/// @brief Placement of a node relative to its parent
struct Transform {
    std::string id;                  ///< Lookup key, empty for anonymous nodes
    Anchor anchor{Anchor::Middle};   ///< Point on the parent
    Anchor pivot{Anchor::Middle};    ///< Point on this node
    float x{0};
    float y{0};
    float z{0};                      ///< Draw order, larger is on top
    float width{0};
    float height{0};
    Stretch stretch;
    std::int32_t tab_order{0};       ///< Focus ordering
    bool opaque{true};               ///< Blocks input to nodes below
    bool mouse_reactive{false};
    bool hidden{false};
    bool percent{false};             ///< Offsets and size are fractions of the parent

    bool operator==(const Transform&) const = default;
};

// =============================================================================
// Asset References
// =============================================================================

/// @brief Loader family an asset belongs to
enum class AssetKind : std::uint8_t {
    Image,
    Font,
    Other
};

inline constexpr const char* k_image_kind_tag = "IMAGE";
inline constexpr const char* k_font_kind_tag = "TTF";

[[nodiscard]] const char* asset_kind_name(AssetKind kind) noexcept;

/// @brief Map a kind tag ("IMAGE", "TTF") to its family
[[nodiscard]] AssetKind asset_kind_from_tag(std::string_view tag) noexcept;

/// @brief Family implied by a path's extension, nullopt if unknown
[[nodiscard]] std::optional<AssetKind> asset_kind_for_path(std::string_view path);

/// @brief `File(path, (kind, options))`
struct AssetRef {
    std::string path;
    std::string kind;
    sail_ron::Value options;  ///< Loader options, kept verbatim

    static AssetRef image(std::string path) {
        return AssetRef{std::move(path), k_image_kind_tag, sail_ron::Value::unit()};
    }
    static AssetRef font(std::string path) {
        return AssetRef{std::move(path), k_font_kind_tag, sail_ron::Value::unit()};
    }

    [[nodiscard]] AssetKind declared_kind() const { return asset_kind_from_tag(kind); }

    bool operator==(const AssetRef&) const = default;
};

// =============================================================================
// Visuals
// =============================================================================

/// @brief Flat color fill
struct SolidColor {
    Color color;

    bool operator==(const SolidColor&) const = default;
};

/// @brief Whole texture stretched over the node
struct TextureImage {
    AssetRef texture;

    bool operator==(const TextureImage&) const = default;
};

/// @brief Texture cell with fixed-size borders and a stretched center
struct NineSlice {
    std::uint32_t x_start{0};
    std::uint32_t y_start{0};
    std::uint32_t width{0};
    std::uint32_t height{0};
    std::uint32_t left_dist{0};
    std::uint32_t right_dist{0};
    std::uint32_t top_dist{0};
    std::uint32_t bottom_dist{0};
    AssetRef texture;
    std::array<std::uint32_t, 2> texture_dimensions{0, 0};

    bool operator==(const NineSlice&) const = default;
};

/// @brief Sub-rectangle of a texture in normalized coordinates
struct PartialTexture {
    AssetRef texture;
    float left{0};
    float right{1};
    float bottom{1};
    float top{0};

    bool operator==(const PartialTexture&) const = default;
};

using ImageDesc = std::variant<SolidColor, TextureImage, NineSlice, PartialTexture>;

/// @brief Variant tag as written in layout files ("SolidColor", "NineSlice", ...)
[[nodiscard]] const char* image_variant_name(const ImageDesc& image) noexcept;

/// @brief Texture referenced by an image, nullptr for solid colors
[[nodiscard]] const AssetRef* image_texture(const ImageDesc& image) noexcept;

// =============================================================================
// Text
// =============================================================================

/// @brief Label payload
struct TextDesc {
    std::string text;
    std::optional<AssetRef> font;     ///< Engine default font when absent
    float font_size{16.0f};
    Color color{Color::white()};
    std::optional<LineMode> line_mode;
    std::optional<Anchor> align;
    bool password{false};

    bool operator==(const TextDesc&) const = default;
};

/// @brief Button payload: caption plus per-state visuals
struct ButtonDesc {
    std::string text;
    std::optional<AssetRef> font;
    float font_size{16.0f};
    Color normal_text_color{Color::white()};
    std::optional<ImageDesc> normal_image;
    std::optional<ImageDesc> hover_image;
    std::optional<Color> hover_text_color;
    std::optional<ImageDesc> press_image;
    std::optional<Color> press_text_color;

    bool operator==(const ButtonDesc&) const = default;
};

} // namespace sail_layout
