/// @file json.cpp
/// @brief JSON interchange implementation

#include <sail_engine/layout/json.hpp>
#include <sail_engine/layout/writer.hpp>

#include <sail_engine/ron/parser.hpp>
#include <sail_engine/ron/writer.hpp>

#include <limits>

namespace sail_layout {

using nlohmann::json;
using sail_core::Error;
using sail_core::Result;
using sail_core::SchemaError;

namespace {

// =============================================================================
// Encoding
// =============================================================================

double clean(float v) {
    return LayoutWriter::float_value(v).as_number();
}

json color_json(const Color& c) {
    return json::array({clean(c.r), clean(c.g), clean(c.b), clean(c.a)});
}

json asset_json(const AssetRef& asset) {
    sail_ron::WriterOptions compact;
    compact.pretty = false;
    return json{
        {"path", asset.path},
        {"kind", asset.kind},
        {"options", sail_ron::Writer(compact).write(asset.options)},
    };
}

json stretch_json(const Stretch& s) {
    json j{{"mode", stretch_mode_name(s.mode)}};
    if (s.mode == Stretch::Mode::X || s.mode == Stretch::Mode::XY) {
        j["x_margin"] = clean(s.x_margin);
    }
    if (s.mode == Stretch::Mode::Y || s.mode == Stretch::Mode::XY) {
        j["y_margin"] = clean(s.y_margin);
    }
    if (s.mode == Stretch::Mode::XY) {
        j["keep_aspect_ratio"] = s.keep_aspect_ratio;
    }
    return j;
}

json image_json(const ImageDesc& image) {
    json j{{"type", image_variant_name(image)}};
    if (const auto* solid = std::get_if<SolidColor>(&image)) {
        j["color"] = color_json(solid->color);
    } else if (const auto* texture = std::get_if<TextureImage>(&image)) {
        j["tex"] = asset_json(texture->texture);
    } else if (const auto* nine = std::get_if<NineSlice>(&image)) {
        j["x_start"] = nine->x_start;
        j["y_start"] = nine->y_start;
        j["width"] = nine->width;
        j["height"] = nine->height;
        j["left_dist"] = nine->left_dist;
        j["right_dist"] = nine->right_dist;
        j["top_dist"] = nine->top_dist;
        j["bottom_dist"] = nine->bottom_dist;
        j["tex"] = asset_json(nine->texture);
        j["texture_dimensions"] = json::array({nine->texture_dimensions[0], nine->texture_dimensions[1]});
    } else if (const auto* partial = std::get_if<PartialTexture>(&image)) {
        j["tex"] = asset_json(partial->texture);
        j["left"] = clean(partial->left);
        j["right"] = clean(partial->right);
        j["bottom"] = clean(partial->bottom);
        j["top"] = clean(partial->top);
    }
    return j;
}

json transform_json(const Transform& t) {
    return json{
        {"id", t.id},
        {"anchor", anchor_name(t.anchor)},
        {"pivot", anchor_name(t.pivot)},
        {"x", clean(t.x)},
        {"y", clean(t.y)},
        {"z", clean(t.z)},
        {"width", clean(t.width)},
        {"height", clean(t.height)},
        {"stretch", stretch_json(t.stretch)},
        {"tab_order", t.tab_order},
        {"opaque", t.opaque},
        {"mouse_reactive", t.mouse_reactive},
        {"hidden", t.hidden},
        {"percent", t.percent},
    };
}

json text_json(const TextDesc& text) {
    json j{
        {"text", text.text},
        {"font_size", clean(text.font_size)},
        {"color", color_json(text.color)},
        {"password", text.password},
    };
    if (text.font) j["font"] = asset_json(*text.font);
    if (text.line_mode) j["line_mode"] = line_mode_name(*text.line_mode);
    if (text.align) j["align"] = anchor_name(*text.align);
    return j;
}

json button_json(const ButtonDesc& button) {
    json j{
        {"text", button.text},
        {"font_size", clean(button.font_size)},
        {"normal_text_color", color_json(button.normal_text_color)},
    };
    if (button.font) j["font"] = asset_json(*button.font);
    if (button.normal_image) j["normal_image"] = image_json(*button.normal_image);
    if (button.hover_image) j["hover_image"] = image_json(*button.hover_image);
    if (button.hover_text_color) j["hover_text_color"] = color_json(*button.hover_text_color);
    if (button.press_image) j["press_image"] = image_json(*button.press_image);
    if (button.press_text_color) j["press_text_color"] = color_json(*button.press_text_color);
    return j;
}

// =============================================================================
// Decoding
// =============================================================================

const json* member(const json& j, const char* name) {
    auto it = j.find(name);
    return it != j.end() ? &*it : nullptr;
}

std::string join(const std::string& path, const char* field) {
    return path + "." + field;
}

const char* json_type(const json& j) {
    return j.type_name();
}

Result<float> float_from_json(const json& j, const std::string& path) {
    if (!j.is_number()) {
        return Error(SchemaError::type_mismatch(path, "number", json_type(j)));
    }
    return static_cast<float>(j.get<double>());
}

Result<std::uint32_t> u32_from_json(const json& j, const std::string& path) {
    if (!j.is_number_integer()) {
        return Error(SchemaError::type_mismatch(path, "unsigned integer", json_type(j)));
    }
    if (j.is_number_unsigned()) {
        const auto v = j.get<std::uint64_t>();
        if (v > std::numeric_limits<std::uint32_t>::max()) {
            return Error(SchemaError::out_of_range(path, std::to_string(v) + " does not fit u32"));
        }
        return static_cast<std::uint32_t>(v);
    }
    const auto v = j.get<std::int64_t>();
    if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
        return Error(SchemaError::out_of_range(path, std::to_string(v) + " does not fit u32"));
    }
    return static_cast<std::uint32_t>(v);
}

Result<std::int32_t> i32_from_json(const json& j, const std::string& path) {
    if (!j.is_number_integer()) {
        return Error(SchemaError::type_mismatch(path, "integer", json_type(j)));
    }
    if (j.is_number_unsigned()) {
        const auto v = j.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
            return Error(SchemaError::out_of_range(path, std::to_string(v) + " does not fit i32"));
        }
        return static_cast<std::int32_t>(v);
    }
    const auto v = j.get<std::int64_t>();
    if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max()) {
        return Error(SchemaError::out_of_range(path, std::to_string(v) + " does not fit i32"));
    }
    return static_cast<std::int32_t>(v);
}

Result<bool> bool_from_json(const json& j, const std::string& path) {
    if (!j.is_boolean()) {
        return Error(SchemaError::type_mismatch(path, "boolean", json_type(j)));
    }
    return j.get<bool>();
}

Result<std::string> string_from_json(const json& j, const std::string& path) {
    if (!j.is_string()) {
        return Error(SchemaError::type_mismatch(path, "string", json_type(j)));
    }
    return j.get<std::string>();
}

Result<Anchor> anchor_from_json(const json& j, const std::string& path) {
    if (!j.is_string()) {
        return Error(SchemaError::type_mismatch(path, "anchor name", json_type(j)));
    }
    auto anchor = anchor_from_name(j.get<std::string>());
    if (!anchor) {
        return Error(SchemaError::unknown_variant(path, "Anchor", j.get<std::string>()));
    }
    return *anchor;
}

Result<Color> color_from_json(const json& j, const std::string& path) {
    if (!j.is_array() || j.size() != 4) {
        return Error(SchemaError::type_mismatch(path, "[r, g, b, a]", json_type(j)));
    }
    float c[4];
    for (std::size_t i = 0; i < 4; ++i) {
        auto v = float_from_json(j[i], path + "[" + std::to_string(i) + "]");
        if (!v) return v.error();
        c[i] = *v;
    }
    return Color{c[0], c[1], c[2], c[3]};
}

Result<AssetRef> asset_from_json(const json& j, const std::string& path) {
    if (!j.is_object()) {
        return Error(SchemaError::type_mismatch(path, "asset object", json_type(j)));
    }
    AssetRef asset;

    const json* p = member(j, "path");
    if (!p || !p->is_string()) {
        return Error(SchemaError::missing_field(path, "path"));
    }
    asset.path = p->get<std::string>();

    const json* kind = member(j, "kind");
    if (!kind || !kind->is_string()) {
        return Error(SchemaError::missing_field(path, "kind"));
    }
    asset.kind = kind->get<std::string>();

    asset.options = sail_ron::Value::unit();
    if (const json* opts = member(j, "options")) {
        if (!opts->is_string()) {
            return Error(SchemaError::type_mismatch(join(path, "options"), "RON text", json_type(*opts)));
        }
        auto parsed = sail_ron::Parser::parse_value(opts->get<std::string>(), join(path, "options"));
        if (!parsed) {
            return parsed.error();
        }
        asset.options = std::move(*parsed);
    }
    return asset;
}

Result<Stretch> stretch_from_json(const json& j, const std::string& path) {
    const json* mode = j.is_object() ? member(j, "mode") : nullptr;
    if (!mode || !mode->is_string()) {
        return Error(SchemaError::missing_field(path, "mode"));
    }

    const std::string name = mode->get<std::string>();
    Stretch s;
    if (name == "NoStretch") {
        return s;
    } else if (name == "X") {
        s.mode = Stretch::Mode::X;
    } else if (name == "Y") {
        s.mode = Stretch::Mode::Y;
    } else if (name == "XY") {
        s.mode = Stretch::Mode::XY;
    } else {
        return Error(SchemaError::unknown_variant(join(path, "mode"), "Stretch", name));
    }

    if (const json* v = member(j, "x_margin")) {
        auto f = float_from_json(*v, join(path, "x_margin"));
        if (!f) return f.error();
        s.x_margin = *f;
    }
    if (const json* v = member(j, "y_margin")) {
        auto f = float_from_json(*v, join(path, "y_margin"));
        if (!f) return f.error();
        s.y_margin = *f;
    }
    if (const json* v = member(j, "keep_aspect_ratio")) {
        auto b = bool_from_json(*v, join(path, "keep_aspect_ratio"));
        if (!b) return b.error();
        s.keep_aspect_ratio = *b;
    }
    return s;
}

Result<ImageDesc> image_from_json(const json& j, const std::string& path) {
    const json* type = j.is_object() ? member(j, "type") : nullptr;
    if (!type || !type->is_string()) {
        return Error(SchemaError::missing_field(path, "type"));
    }
    const std::string name = type->get<std::string>();

    if (name == "SolidColor") {
        const json* c = member(j, "color");
        if (!c) return Error(SchemaError::missing_field(path, "color"));
        auto color = color_from_json(*c, join(path, "color"));
        if (!color) return color.error();
        return ImageDesc{SolidColor{*color}};
    }

    if (name != "Texture" && name != "NineSlice" && name != "PartialTexture") {
        return Error(SchemaError::unknown_variant(join(path, "type"), "image", name));
    }

    const json* tex = member(j, "tex");
    if (!tex) return Error(SchemaError::missing_field(path, "tex"));
    auto asset = asset_from_json(*tex, join(path, "tex"));
    if (!asset) return asset.error();

    if (name == "Texture") {
        return ImageDesc{TextureImage{std::move(*asset)}};
    }

    if (name == "NineSlice") {
        NineSlice nine;
        nine.texture = std::move(*asset);
        struct Slot {
            const char* name;
            std::uint32_t* target;
        };
        const Slot slots[] = {
            {"x_start", &nine.x_start}, {"y_start", &nine.y_start},
            {"width", &nine.width}, {"height", &nine.height},
            {"left_dist", &nine.left_dist}, {"right_dist", &nine.right_dist},
            {"top_dist", &nine.top_dist}, {"bottom_dist", &nine.bottom_dist},
        };
        for (const auto& slot : slots) {
            const json* v = member(j, slot.name);
            if (!v) return Error(SchemaError::missing_field(path, slot.name));
            auto n = u32_from_json(*v, join(path, slot.name));
            if (!n) return n.error();
            *slot.target = *n;
        }

        const json* dims = member(j, "texture_dimensions");
        if (!dims) return Error(SchemaError::missing_field(path, "texture_dimensions"));
        if (!dims->is_array() || dims->size() != 2) {
            return Error(SchemaError::type_mismatch(join(path, "texture_dimensions"), "[w, h]",
                                                    json_type(*dims)));
        }
        for (std::size_t i = 0; i < 2; ++i) {
            auto n = u32_from_json((*dims)[i], join(path, "texture_dimensions") + "[" + std::to_string(i) + "]");
            if (!n) return n.error();
            nine.texture_dimensions[i] = *n;
        }
        return ImageDesc{std::move(nine)};
    }

    PartialTexture partial;
    partial.texture = std::move(*asset);
    struct Slot {
        const char* name;
        float* target;
    };
    const Slot slots[] = {
        {"left", &partial.left}, {"right", &partial.right},
        {"bottom", &partial.bottom}, {"top", &partial.top},
    };
    for (const auto& slot : slots) {
        if (const json* v = member(j, slot.name)) {
            auto f = float_from_json(*v, join(path, slot.name));
            if (!f) return f.error();
            *slot.target = *f;
        }
    }
    return ImageDesc{std::move(partial)};
}

Result<Transform> transform_from_json(const json& j, const std::string& path) {
    if (!j.is_object()) {
        return Error(SchemaError::type_mismatch(path, "transform object", json_type(j)));
    }
    Transform t;

    if (const json* v = member(j, "id")) {
        auto id = string_from_json(*v, join(path, "id"));
        if (!id) return id.error();
        t.id = std::move(*id);
    }
    if (const json* v = member(j, "anchor")) {
        auto a = anchor_from_json(*v, join(path, "anchor"));
        if (!a) return a.error();
        t.anchor = *a;
    }
    if (const json* v = member(j, "pivot")) {
        auto a = anchor_from_json(*v, join(path, "pivot"));
        if (!a) return a.error();
        t.pivot = *a;
    }

    struct FloatSlot {
        const char* name;
        float* target;
    };
    const FloatSlot floats[] = {
        {"x", &t.x}, {"y", &t.y}, {"z", &t.z}, {"width", &t.width}, {"height", &t.height},
    };
    for (const auto& slot : floats) {
        if (const json* v = member(j, slot.name)) {
            auto f = float_from_json(*v, join(path, slot.name));
            if (!f) return f.error();
            *slot.target = *f;
        }
    }
    for (const char* required : {"width", "height"}) {
        if (!member(j, required)) {
            return Error(SchemaError::missing_field(path, required));
        }
    }

    if (const json* v = member(j, "stretch")) {
        auto s = stretch_from_json(*v, join(path, "stretch"));
        if (!s) return s.error();
        t.stretch = *s;
    }
    if (const json* v = member(j, "tab_order")) {
        auto n = i32_from_json(*v, join(path, "tab_order"));
        if (!n) return n.error();
        t.tab_order = *n;
    }

    struct BoolSlot {
        const char* name;
        bool* target;
    };
    const BoolSlot flags[] = {
        {"opaque", &t.opaque}, {"mouse_reactive", &t.mouse_reactive},
        {"hidden", &t.hidden}, {"percent", &t.percent},
    };
    for (const auto& slot : flags) {
        if (const json* v = member(j, slot.name)) {
            auto b = bool_from_json(*v, join(path, slot.name));
            if (!b) return b.error();
            *slot.target = *b;
        }
    }
    return t;
}

Result<TextDesc> text_from_json(const json& j, const std::string& path) {
    if (!j.is_object()) {
        return Error(SchemaError::type_mismatch(path, "text object", json_type(j)));
    }
    TextDesc text;

    const json* t = member(j, "text");
    if (!t) return Error(SchemaError::missing_field(path, "text"));
    auto content = string_from_json(*t, join(path, "text"));
    if (!content) return content.error();
    text.text = std::move(*content);

    if (const json* v = member(j, "font"); v && !v->is_null()) {
        auto font = asset_from_json(*v, join(path, "font"));
        if (!font) return font.error();
        text.font = std::move(*font);
    }
    if (const json* v = member(j, "font_size")) {
        auto f = float_from_json(*v, join(path, "font_size"));
        if (!f) return f.error();
        text.font_size = *f;
    }
    if (const json* v = member(j, "color")) {
        auto c = color_from_json(*v, join(path, "color"));
        if (!c) return c.error();
        text.color = *c;
    }
    if (const json* v = member(j, "line_mode"); v && !v->is_null()) {
        auto name = string_from_json(*v, join(path, "line_mode"));
        if (!name) return name.error();
        auto mode = line_mode_from_name(*name);
        if (!mode) {
            return Error(SchemaError::unknown_variant(join(path, "line_mode"), "LineMode", *name));
        }
        text.line_mode = mode;
    }
    if (const json* v = member(j, "align"); v && !v->is_null()) {
        auto a = anchor_from_json(*v, join(path, "align"));
        if (!a) return a.error();
        text.align = *a;
    }
    if (const json* v = member(j, "password")) {
        auto b = bool_from_json(*v, join(path, "password"));
        if (!b) return b.error();
        text.password = *b;
    }
    return text;
}

Result<ButtonDesc> button_from_json(const json& j, const std::string& path) {
    if (!j.is_object()) {
        return Error(SchemaError::type_mismatch(path, "button object", json_type(j)));
    }
    ButtonDesc button;

    const json* t = member(j, "text");
    if (!t) return Error(SchemaError::missing_field(path, "text"));
    auto content = string_from_json(*t, join(path, "text"));
    if (!content) return content.error();
    button.text = std::move(*content);

    if (const json* v = member(j, "font"); v && !v->is_null()) {
        auto font = asset_from_json(*v, join(path, "font"));
        if (!font) return font.error();
        button.font = std::move(*font);
    }
    if (const json* v = member(j, "font_size")) {
        auto f = float_from_json(*v, join(path, "font_size"));
        if (!f) return f.error();
        button.font_size = *f;
    }
    if (const json* v = member(j, "normal_text_color")) {
        auto c = color_from_json(*v, join(path, "normal_text_color"));
        if (!c) return c.error();
        button.normal_text_color = *c;
    }

    struct ImageSlot {
        const char* name;
        std::optional<ImageDesc>* target;
    };
    const ImageSlot images[] = {
        {"normal_image", &button.normal_image},
        {"hover_image", &button.hover_image},
        {"press_image", &button.press_image},
    };
    for (const auto& slot : images) {
        if (const json* v = member(j, slot.name); v && !v->is_null()) {
            auto image = image_from_json(*v, join(path, slot.name));
            if (!image) return image.error();
            *slot.target = std::move(*image);
        }
    }

    struct ColorSlot {
        const char* name;
        std::optional<Color>* target;
    };
    const ColorSlot colors[] = {
        {"hover_text_color", &button.hover_text_color},
        {"press_text_color", &button.press_text_color},
    };
    for (const auto& slot : colors) {
        if (const json* v = member(j, slot.name); v && !v->is_null()) {
            auto c = color_from_json(*v, join(path, slot.name));
            if (!c) return c.error();
            *slot.target = *c;
        }
    }
    return button;
}

Result<std::unique_ptr<Node>> node_from_json(const json& j, const std::string& path) {
    const json* kind_json = j.is_object() ? member(j, "kind") : nullptr;
    if (!kind_json || !kind_json->is_string()) {
        return Error(SchemaError::missing_field(path, "kind"));
    }
    auto kind = node_kind_from_name(kind_json->get<std::string>());
    if (!kind) {
        return Error(SchemaError::unknown_variant(join(path, "kind"), "node", kind_json->get<std::string>()));
    }

    const json* t = member(j, "transform");
    if (!t) return Error(SchemaError::missing_field(path, "transform"));
    auto transform = transform_from_json(*t, join(path, "transform"));
    if (!transform) return transform.error();

    std::unique_ptr<Node> node;
    switch (*kind) {
        case NodeKind::Container: {
            std::optional<ImageDesc> background;
            if (const json* v = member(j, "background"); v && !v->is_null()) {
                auto image = image_from_json(*v, join(path, "background"));
                if (!image) return image.error();
                background = std::move(*image);
            }
            node = Node::container(std::move(*transform), std::move(background));

            if (const json* children = member(j, "children")) {
                if (!children->is_array()) {
                    return Error(SchemaError::type_mismatch(join(path, "children"), "array",
                                                            json_type(*children)));
                }
                for (std::size_t i = 0; i < children->size(); ++i) {
                    auto child = node_from_json((*children)[i],
                                                join(path, "children") + "[" + std::to_string(i) + "]");
                    if (!child) return child.error();
                    node->add_child(std::move(*child));
                }
            }
            break;
        }
        case NodeKind::Label: {
            const json* v = member(j, "text");
            if (!v) return Error(SchemaError::missing_field(path, "text"));
            auto text = text_from_json(*v, join(path, "text"));
            if (!text) return text.error();
            node = Node::label(std::move(*transform), std::move(*text));
            break;
        }
        case NodeKind::Image: {
            const json* v = member(j, "image");
            if (!v) return Error(SchemaError::missing_field(path, "image"));
            auto image = image_from_json(*v, join(path, "image"));
            if (!image) return image.error();
            node = Node::image(std::move(*transform), std::move(*image));
            break;
        }
        case NodeKind::Button: {
            const json* v = member(j, "button");
            if (!v) return Error(SchemaError::missing_field(path, "button"));
            auto button = button_from_json(*v, join(path, "button"));
            if (!button) return button.error();
            node = Node::button(std::move(*transform), std::move(*button));
            break;
        }
    }
    return sail_core::Ok(std::move(node));
}

} // namespace

// =============================================================================
// Public API
// =============================================================================

json node_to_json(const Node& node) {
    json j{
        {"kind", node_kind_name(node.kind())},
        {"transform", transform_json(node.transform())},
    };

    switch (node.kind()) {
        case NodeKind::Container: {
            if (const ImageDesc* bg = node.background()) {
                j["background"] = image_json(*bg);
            }
            json children = json::array();
            for (const auto& child : node.children()) {
                children.push_back(node_to_json(*child));
            }
            j["children"] = std::move(children);
            break;
        }
        case NodeKind::Label:
            j["text"] = text_json(*node.as_label());
            break;
        case NodeKind::Image:
            j["image"] = image_json(node.as_image()->image);
            break;
        case NodeKind::Button:
            j["button"] = button_json(*node.as_button());
            break;
    }
    return j;
}

json to_json(const LayoutDocument& doc) {
    json j;
    j["extensions"] = doc.extensions();
    j["root"] = doc.empty() ? json(nullptr) : node_to_json(doc.root());
    return j;
}

Result<LayoutDocument> layout_from_json(const json& j) {
    if (!j.is_object()) {
        return Error(SchemaError::type_mismatch("<root>", "object", json_type(j)));
    }

    std::vector<std::string> extensions;
    if (const json* ext = member(j, "extensions")) {
        if (!ext->is_array()) {
            return Error(SchemaError::type_mismatch("extensions", "array", json_type(*ext)));
        }
        for (std::size_t i = 0; i < ext->size(); ++i) {
            auto name = string_from_json((*ext)[i], "extensions[" + std::to_string(i) + "]");
            if (!name) return name.error();
            extensions.push_back(std::move(*name));
        }
    }

    const json* root = member(j, "root");
    if (!root || root->is_null()) {
        return Error(SchemaError::missing_field("<root>", "root"));
    }

    auto node = node_from_json(*root, "root");
    if (!node) {
        return node.error();
    }
    return LayoutDocument(std::move(*node), std::move(extensions));
}

Result<LayoutDocument> layout_from_json_string(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return Error(sail_core::ErrorCode::ParseError, "JSON parse error: " + std::string(e.what()));
    }
    return layout_from_json(j);
}

} // namespace sail_layout
