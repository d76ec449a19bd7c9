/// @file writer.cpp
/// @brief Layout encoder implementation

#include <sail_engine/layout/writer.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace sail_layout {

namespace {

using sail_ron::Value;

constexpr const char* k_implicit_some = "implicit_some";

/// Struct builder that drops defaulted fields when asked to
class StructBuilder {
public:
    explicit StructBuilder(std::string name, bool omit_defaults = false)
        : m_name(std::move(name))
        , m_omit_defaults(omit_defaults) {}

    StructBuilder& field(std::string name, Value value) {
        m_names.push_back(std::move(name));
        m_values.push_back(std::move(value));
        return *this;
    }

    StructBuilder& field_unless_default(std::string name, Value value, bool is_default) {
        if (m_omit_defaults && is_default) {
            return *this;
        }
        return field(std::move(name), std::move(value));
    }

    Value build() {
        return Value::structure(std::move(m_name), std::move(m_names), std::move(m_values));
    }

private:
    std::string m_name;
    bool m_omit_defaults;
    std::vector<std::string> m_names;
    Value::Elements m_values;
};

Value integer_value(std::int64_t v) {
    return Value::integer(v);
}

} // namespace

// =============================================================================
// Scalars
// =============================================================================

Value LayoutWriter::float_value(float v) {
    if (!std::isfinite(v)) {
        return Value::floating(static_cast<double>(v));
    }
    // Widen through the shortest float text so 0.6f prints as 0.6
    const std::string text = fmt::format("{}", v);
    return Value::floating(std::strtod(text.c_str(), nullptr));
}

Value LayoutWriter::encode_color(const Color& color) {
    return Value::tuple({}, {float_value(color.r), float_value(color.g),
                             float_value(color.b), float_value(color.a)});
}

Value LayoutWriter::encode_stretch(const Stretch& stretch) {
    switch (stretch.mode) {
        case Stretch::Mode::X:
            return StructBuilder("X").field("x_margin", float_value(stretch.x_margin)).build();
        case Stretch::Mode::Y:
            return StructBuilder("Y").field("y_margin", float_value(stretch.y_margin)).build();
        case Stretch::Mode::XY:
            return StructBuilder("XY")
                .field("x_margin", float_value(stretch.x_margin))
                .field("y_margin", float_value(stretch.y_margin))
                .field("keep_aspect_ratio", Value::boolean(stretch.keep_aspect_ratio))
                .build();
        case Stretch::Mode::NoStretch:
            break;
    }
    return Value::identifier("NoStretch");
}

Value LayoutWriter::encode_asset(const AssetRef& asset) {
    Value format = Value::tuple({}, {Value::string(asset.kind), asset.options});
    return Value::tuple("File", {Value::string(asset.path), std::move(format)});
}

Value LayoutWriter::encode_image(const ImageDesc& image, bool omit_defaults) {
    if (const auto* solid = std::get_if<SolidColor>(&image)) {
        const Color& c = solid->color;
        return Value::tuple("SolidColor", {float_value(c.r), float_value(c.g),
                                           float_value(c.b), float_value(c.a)});
    }
    if (const auto* texture = std::get_if<TextureImage>(&image)) {
        return Value::tuple("Texture", {encode_asset(texture->texture)});
    }
    if (const auto* nine = std::get_if<NineSlice>(&image)) {
        return StructBuilder("NineSlice")
            .field("x_start", integer_value(nine->x_start))
            .field("y_start", integer_value(nine->y_start))
            .field("width", integer_value(nine->width))
            .field("height", integer_value(nine->height))
            .field("left_dist", integer_value(nine->left_dist))
            .field("right_dist", integer_value(nine->right_dist))
            .field("top_dist", integer_value(nine->top_dist))
            .field("bottom_dist", integer_value(nine->bottom_dist))
            .field("tex", encode_asset(nine->texture))
            .field("texture_dimensions", Value::tuple({}, {
                integer_value(nine->texture_dimensions[0]),
                integer_value(nine->texture_dimensions[1])}))
            .build();
    }

    const auto& partial = std::get<PartialTexture>(image);
    return StructBuilder("PartialTexture", omit_defaults)
        .field("tex", encode_asset(partial.texture))
        .field_unless_default("left", float_value(partial.left), partial.left == 0.0f)
        .field_unless_default("right", float_value(partial.right), partial.right == 1.0f)
        .field_unless_default("bottom", float_value(partial.bottom), partial.bottom == 1.0f)
        .field_unless_default("top", float_value(partial.top), partial.top == 0.0f)
        .build();
}

Value LayoutWriter::wrap_optional(Value value, const Context& ctx) {
    if (ctx.implicit_some) {
        return value;
    }
    return Value::tuple("Some", {std::move(value)});
}

// =============================================================================
// Node parts
// =============================================================================

Value LayoutWriter::encode_transform(const Transform& t) const {
    const Transform defaults;
    StructBuilder b({}, m_options.omit_defaults);

    b.field_unless_default("id", Value::string(t.id), t.id.empty())
     .field_unless_default("anchor", Value::identifier(anchor_name(t.anchor)), t.anchor == defaults.anchor)
     .field_unless_default("pivot", Value::identifier(anchor_name(t.pivot)), t.pivot == defaults.pivot)
     .field_unless_default("x", float_value(t.x), t.x == 0.0f)
     .field_unless_default("y", float_value(t.y), t.y == 0.0f)
     .field_unless_default("z", float_value(t.z), t.z == 0.0f)
     .field("width", float_value(t.width))
     .field("height", float_value(t.height))
     .field_unless_default("stretch", encode_stretch(t.stretch), t.stretch == defaults.stretch)
     .field_unless_default("tab_order", integer_value(t.tab_order), t.tab_order == 0)
     .field_unless_default("opaque", Value::boolean(t.opaque), t.opaque == defaults.opaque)
     .field_unless_default("mouse_reactive", Value::boolean(t.mouse_reactive), !t.mouse_reactive)
     .field_unless_default("hidden", Value::boolean(t.hidden), !t.hidden)
     .field_unless_default("percent", Value::boolean(t.percent), !t.percent);
    return b.build();
}

Value LayoutWriter::encode_text(const TextDesc& text, const Context& ctx) const {
    StructBuilder b({}, m_options.omit_defaults);
    b.field("text", Value::string(text.text));
    if (text.font) {
        b.field("font", wrap_optional(encode_asset(*text.font), ctx));
    }
    b.field("font_size", float_value(text.font_size));
    b.field("color", encode_color(text.color));
    if (text.line_mode) {
        b.field("line_mode", wrap_optional(Value::identifier(line_mode_name(*text.line_mode)), ctx));
    }
    if (text.align) {
        b.field("align", wrap_optional(Value::identifier(anchor_name(*text.align)), ctx));
    }
    b.field_unless_default("password", Value::boolean(text.password), !text.password);
    return b.build();
}

Value LayoutWriter::encode_button(const ButtonDesc& button, const Context& ctx) const {
    StructBuilder b({}, m_options.omit_defaults);
    b.field("text", Value::string(button.text));
    if (button.font) {
        b.field("font", wrap_optional(encode_asset(*button.font), ctx));
    }
    b.field("font_size", float_value(button.font_size));
    b.field("normal_text_color", encode_color(button.normal_text_color));
    if (button.normal_image) {
        b.field("normal_image", wrap_optional(encode_image(*button.normal_image, m_options.omit_defaults), ctx));
    }
    if (button.hover_image) {
        b.field("hover_image", wrap_optional(encode_image(*button.hover_image, m_options.omit_defaults), ctx));
    }
    if (button.hover_text_color) {
        b.field("hover_text_color", wrap_optional(encode_color(*button.hover_text_color), ctx));
    }
    if (button.press_image) {
        b.field("press_image", wrap_optional(encode_image(*button.press_image, m_options.omit_defaults), ctx));
    }
    if (button.press_text_color) {
        b.field("press_text_color", wrap_optional(encode_color(*button.press_text_color), ctx));
    }
    return b.build();
}

Value LayoutWriter::encode_node(const Node& node, const Context& ctx) const {
    StructBuilder b(node_kind_name(node.kind()));
    b.field("transform", encode_transform(node.transform()));

    switch (node.kind()) {
        case NodeKind::Container: {
            if (const ImageDesc* bg = node.background()) {
                b.field("background", wrap_optional(encode_image(*bg, m_options.omit_defaults), ctx));
            }
            if (!node.children().empty() || !m_options.omit_defaults) {
                Value::Elements children;
                children.reserve(node.child_count());
                for (const auto& child : node.children()) {
                    children.push_back(encode_node(*child, ctx));
                }
                b.field("children", Value::list(std::move(children)));
            }
            break;
        }
        case NodeKind::Label:
            b.field("text", encode_text(*node.as_label(), ctx));
            break;
        case NodeKind::Image:
            b.field("image", encode_image(node.as_image()->image, m_options.omit_defaults));
            break;
        case NodeKind::Button:
            b.field("button", encode_button(*node.as_button(), ctx));
            break;
    }
    return b.build();
}

// =============================================================================
// LayoutWriter
// =============================================================================

Value LayoutWriter::to_value(const Node& node, bool implicit_some) const {
    Context ctx;
    ctx.implicit_some = implicit_some;
    return encode_node(node, ctx);
}

sail_ron::Document LayoutWriter::to_ron(const LayoutDocument& doc) const {
    sail_ron::Document out;
    out.extensions = doc.extensions();

    if (m_options.implicit_some) {
        auto it = std::find(out.extensions.begin(), out.extensions.end(), k_implicit_some);
        if (*m_options.implicit_some && it == out.extensions.end()) {
            out.extensions.emplace_back(k_implicit_some);
        } else if (!*m_options.implicit_some && it != out.extensions.end()) {
            out.extensions.erase(it);
        }
    }

    if (!doc.empty()) {
        out.root = to_value(doc.root(), out.has_extension(k_implicit_some));
    }
    return out;
}

std::string LayoutWriter::write(const LayoutDocument& doc) const {
    return sail_ron::Writer(m_options.format).write(to_ron(doc));
}

} // namespace sail_layout
