/// @file reader.cpp
/// @brief Layout decoder implementation

#include <sail_engine/layout/reader.hpp>

#include <sail_engine/core/log.hpp>
#include <sail_engine/ron/parser.hpp>

#include <limits>
#include <optional>
#include <string>

namespace sail_layout {

namespace {

using sail_core::SchemaError;
using sail_ron::Value;

std::string join_path(const std::string& path, std::string_view field) {
    if (path.empty()) {
        return std::string(field);
    }
    return path + "." + std::string(field);
}

std::string index_path(const std::string& path, std::size_t index) {
    return path + "[" + std::to_string(index) + "]";
}

/// `Some(x)` -> x, `None` -> nullptr, anything else unchanged
const Value* unwrap_option(const Value* value) {
    if (!value) {
        return nullptr;
    }
    if (value->is_identifier() && value->name() == "None") {
        return nullptr;
    }
    if (value->is_tuple() && value->name() == "Some" && value->size() == 1) {
        return &value->elements().front();
    }
    return value;
}

// =============================================================================
// Fields
// =============================================================================

/// Struct field accessor that remembers which fields were consumed
class Fields {
public:
    Fields(const Value& value, std::string path)
        : m_value(value)
        , m_path(std::move(path))
        , m_used(value.field_names().size(), false) {}

    const Value* get(std::string_view name) {
        const auto& names = m_value.field_names();
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name) {
                m_used[i] = true;
                return &m_value.elements()[i];
            }
        }
        return nullptr;
    }

    [[nodiscard]] const std::string& path() const { return m_path; }
    [[nodiscard]] std::string path_of(std::string_view name) const { return join_path(m_path, name); }
    [[nodiscard]] const Value& value() const { return m_value; }
    [[nodiscard]] bool used(std::size_t index) const { return m_used[index]; }

private:
    const Value& m_value;
    std::string m_path;
    std::vector<bool> m_used;
};

// =============================================================================
// Decoder
// =============================================================================

class Decoder {
public:
    explicit Decoder(const ReaderOptions& options) : m_options(options) {}

    [[nodiscard]] SchemaError take_error() { return std::move(*m_error); }

    bool read_node(const Value& value, const std::string& path, std::unique_ptr<Node>& out);

private:
    bool fail(SchemaError err) {
        if (!m_error) {
            m_error = std::move(err);
        }
        return false;
    }

    bool mismatch(const std::string& path, const std::string& expected, const Value& found) {
        return fail(SchemaError::type_mismatch(path, expected, found.describe()));
    }

    bool check_struct(const Value& value, const std::string& path, const char* expected);
    bool finish(const Fields& fields);
    const Value* require(Fields& fields, std::string_view name);

    // Scalars
    bool read_float(const Value& value, const std::string& path, float& out);
    bool read_u32(const Value& value, const std::string& path, std::uint32_t& out);
    bool read_i32(const Value& value, const std::string& path, std::int32_t& out);
    bool read_bool(const Value& value, const std::string& path, bool& out);
    bool read_string(const Value& value, const std::string& path, std::string& out);

    // Composite values
    bool read_anchor(const Value& value, const std::string& path, Anchor& out);
    bool read_line_mode(const Value& value, const std::string& path, LineMode& out);
    bool read_color(const Value& value, const std::string& path, Color& out);
    bool read_stretch(const Value& value, const std::string& path, Stretch& out);
    bool read_asset(const Value& value, const std::string& path, AssetRef& out);
    bool read_image(const Value& value, const std::string& path, ImageDesc& out);
    bool read_nine_slice(const Value& value, const std::string& path, NineSlice& out);
    bool read_partial(const Value& value, const std::string& path, PartialTexture& out);

    // Node parts
    bool read_transform(const Value& value, const std::string& path, Transform& out);
    bool read_text(const Value& value, const std::string& path, TextDesc& out);
    bool read_button(const Value& value, const std::string& path, ButtonDesc& out);
    bool read_children(const Value& value, const std::string& path, Node& parent);

    const ReaderOptions& m_options;
    std::optional<SchemaError> m_error;
};

bool Decoder::check_struct(const Value& value, const std::string& path, const char* expected) {
    // `()` is how an empty struct reads
    if (value.is_struct() || value.is_unit()) {
        return true;
    }
    return mismatch(path, expected, value);
}

bool Decoder::finish(const Fields& fields) {
    const auto& names = fields.value().field_names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (fields.used(i)) {
            // A later field with the same name as a consumed one is a duplicate
            for (std::size_t j = i + 1; j < names.size(); ++j) {
                if (names[j] == names[i]) {
                    return fail(SchemaError{SchemaError::Kind::UnknownField,
                        "Duplicate field '" + names[j] + "'", fields.path(), {}, names[j]});
                }
            }
            continue;
        }

        bool duplicate = false;
        for (std::size_t j = 0; j < i; ++j) {
            if (names[j] == names[i]) {
                duplicate = true;
                break;
            }
        }
        if (duplicate) {
            continue;
        }

        if (m_options.strict_fields) {
            return fail(SchemaError::unknown_field(fields.path(), names[i]));
        }
        sail_core::layout_logger()->warn("{}: ignoring unknown field '{}'",
                                         fields.path(), names[i]);
    }
    return true;
}

const Value* Decoder::require(Fields& fields, std::string_view name) {
    const Value* value = fields.get(name);
    if (!value) {
        fail(SchemaError::missing_field(fields.path(), std::string(name)));
    }
    return value;
}

// -----------------------------------------------------------------------------
// Scalars
// -----------------------------------------------------------------------------

bool Decoder::read_float(const Value& value, const std::string& path, float& out) {
    if (!value.is_number()) {
        return mismatch(path, "float", value);
    }
    out = static_cast<float>(value.as_number());
    return true;
}

bool Decoder::read_u32(const Value& value, const std::string& path, std::uint32_t& out) {
    if (!value.is_integer()) {
        return mismatch(path, "unsigned integer", value);
    }
    const std::int64_t v = value.as_integer();
    if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
        return fail(SchemaError::out_of_range(path, std::to_string(v) + " does not fit u32"));
    }
    out = static_cast<std::uint32_t>(v);
    return true;
}

bool Decoder::read_i32(const Value& value, const std::string& path, std::int32_t& out) {
    if (!value.is_integer()) {
        return mismatch(path, "integer", value);
    }
    const std::int64_t v = value.as_integer();
    if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max()) {
        return fail(SchemaError::out_of_range(path, std::to_string(v) + " does not fit i32"));
    }
    out = static_cast<std::int32_t>(v);
    return true;
}

bool Decoder::read_bool(const Value& value, const std::string& path, bool& out) {
    if (!value.is_bool()) {
        return mismatch(path, "bool", value);
    }
    out = value.as_bool();
    return true;
}

bool Decoder::read_string(const Value& value, const std::string& path, std::string& out) {
    if (!value.is_string()) {
        return mismatch(path, "string", value);
    }
    out = value.as_string();
    return true;
}

// -----------------------------------------------------------------------------
// Composite values
// -----------------------------------------------------------------------------

bool Decoder::read_anchor(const Value& value, const std::string& path, Anchor& out) {
    if (!value.is_identifier()) {
        return mismatch(path, "Anchor", value);
    }
    auto anchor = anchor_from_name(value.name());
    if (!anchor) {
        return fail(SchemaError::unknown_variant(path, "Anchor", value.name()));
    }
    out = *anchor;
    return true;
}

bool Decoder::read_line_mode(const Value& value, const std::string& path, LineMode& out) {
    if (!value.is_identifier()) {
        return mismatch(path, "LineMode", value);
    }
    auto mode = line_mode_from_name(value.name());
    if (!mode) {
        return fail(SchemaError::unknown_variant(path, "LineMode", value.name()));
    }
    out = *mode;
    return true;
}

bool Decoder::read_color(const Value& value, const std::string& path, Color& out) {
    const bool sequence = value.is_list() || (value.is_tuple() && value.name().empty());
    if (!sequence || value.size() != 4) {
        return mismatch(path, "color (r, g, b, a)", value);
    }
    const auto& c = value.elements();
    return read_float(c[0], index_path(path, 0), out.r) &&
           read_float(c[1], index_path(path, 1), out.g) &&
           read_float(c[2], index_path(path, 2), out.b) &&
           read_float(c[3], index_path(path, 3), out.a);
}

bool Decoder::read_stretch(const Value& value, const std::string& path, Stretch& out) {
    if (value.is_identifier()) {
        if (value.name() == "NoStretch") {
            out = Stretch::none();
            return true;
        }
        return fail(SchemaError::unknown_variant(path, "Stretch", value.name()));
    }
    if (!value.is_tuple() && !value.is_struct()) {
        return mismatch(path, "Stretch", value);
    }

    const std::string& name = value.name();
    Stretch::Mode mode;
    if (name == "X") {
        mode = Stretch::Mode::X;
    } else if (name == "Y") {
        mode = Stretch::Mode::Y;
    } else if (name == "XY") {
        mode = Stretch::Mode::XY;
    } else {
        return fail(SchemaError::unknown_variant(path, "Stretch", name.empty() ? "()" : name));
    }

    Stretch result;
    result.mode = mode;

    // Positional form: X(m), Y(m), XY(xm, ym, keep_aspect_ratio)
    if (value.is_tuple()) {
        const auto& items = value.elements();
        const std::size_t expected = mode == Stretch::Mode::XY ? 3 : 1;
        if (items.size() != expected) {
            return mismatch(path, name + " with " + std::to_string(expected) + " fields", value);
        }
        if (mode == Stretch::Mode::X) {
            if (!read_float(items[0], index_path(path, 0), result.x_margin)) return false;
        } else if (mode == Stretch::Mode::Y) {
            if (!read_float(items[0], index_path(path, 0), result.y_margin)) return false;
        } else {
            if (!read_float(items[0], index_path(path, 0), result.x_margin) ||
                !read_float(items[1], index_path(path, 1), result.y_margin) ||
                !read_bool(items[2], index_path(path, 2), result.keep_aspect_ratio)) {
                return false;
            }
        }
        out = result;
        return true;
    }

    Fields fields(value, path);
    if (mode != Stretch::Mode::Y) {
        const Value* v = require(fields, "x_margin");
        if (!v || !read_float(*v, fields.path_of("x_margin"), result.x_margin)) return false;
    }
    if (mode != Stretch::Mode::X) {
        const Value* v = require(fields, "y_margin");
        if (!v || !read_float(*v, fields.path_of("y_margin"), result.y_margin)) return false;
    }
    if (mode == Stretch::Mode::XY) {
        if (const Value* v = fields.get("keep_aspect_ratio")) {
            if (!read_bool(*v, fields.path_of("keep_aspect_ratio"), result.keep_aspect_ratio)) {
                return false;
            }
        }
    }
    if (!finish(fields)) {
        return false;
    }
    out = result;
    return true;
}

bool Decoder::read_asset(const Value& value, const std::string& path, AssetRef& out) {
    if (!value.is_tuple() || value.name() != "File") {
        return mismatch(path, "File(path, (kind, options))", value);
    }
    if (value.size() != 2) {
        return mismatch(path, "File with 2 fields", value);
    }

    const Value& file_path = value.elements()[0];
    const Value& format = value.elements()[1];
    if (!read_string(file_path, index_path(path, 0), out.path)) {
        return false;
    }

    const std::string format_path = index_path(path, 1);
    if (!format.is_tuple() || !format.name().empty() || format.size() != 2) {
        return mismatch(format_path, "(kind, options)", format);
    }
    if (!read_string(format.elements()[0], index_path(format_path, 0), out.kind)) {
        return false;
    }
    out.options = format.elements()[1];
    return true;
}

bool Decoder::read_image(const Value& value, const std::string& path, ImageDesc& out) {
    if (!value.is_tuple() && !value.is_struct() && !value.is_identifier()) {
        return mismatch(path, "image (SolidColor, Texture, NineSlice, PartialTexture)", value);
    }

    const std::string& name = value.name();
    if (name == "SolidColor" && value.is_tuple()) {
        SolidColor solid;
        // SolidColor((r, g, b, a)) or SolidColor(r, g, b, a)
        if (value.size() == 1) {
            if (!read_color(value.elements().front(), index_path(path, 0), solid.color)) return false;
        } else {
            if (!read_color(Value::tuple({}, value.elements()), path, solid.color)) return false;
        }
        out = solid;
        return true;
    }
    if (name == "Texture" && value.is_tuple()) {
        if (value.size() != 1) {
            return mismatch(path, "Texture(File(...))", value);
        }
        TextureImage texture;
        if (!read_asset(value.elements().front(), path, texture.texture)) return false;
        out = std::move(texture);
        return true;
    }
    if (name == "NineSlice") {
        NineSlice nine;
        if (!read_nine_slice(value, path, nine)) return false;
        out = std::move(nine);
        return true;
    }
    if (name == "PartialTexture") {
        PartialTexture partial;
        if (!read_partial(value, path, partial)) return false;
        out = std::move(partial);
        return true;
    }
    return fail(SchemaError::unknown_variant(path, "image", name.empty() ? value.describe() : name));
}

bool Decoder::read_nine_slice(const Value& value, const std::string& path, NineSlice& out) {
    if (!value.is_struct()) {
        return mismatch(path, "NineSlice(...) with named fields", value);
    }
    Fields fields(value, path);

    struct Slot {
        const char* name;
        std::uint32_t* target;
    };
    const Slot slots[] = {
        {"x_start", &out.x_start}, {"y_start", &out.y_start},
        {"width", &out.width}, {"height", &out.height},
        {"left_dist", &out.left_dist}, {"right_dist", &out.right_dist},
        {"top_dist", &out.top_dist}, {"bottom_dist", &out.bottom_dist},
    };
    for (const auto& slot : slots) {
        const Value* v = require(fields, slot.name);
        if (!v || !read_u32(*v, fields.path_of(slot.name), *slot.target)) return false;
    }

    const Value* tex = require(fields, "tex");
    if (!tex || !read_asset(*tex, fields.path_of("tex"), out.texture)) return false;

    const Value* dims = require(fields, "texture_dimensions");
    if (!dims) return false;
    const std::string dims_path = fields.path_of("texture_dimensions");
    const bool sequence = dims->is_list() || (dims->is_tuple() && dims->name().empty());
    if (!sequence || dims->size() != 2) {
        return mismatch(dims_path, "(width, height)", *dims);
    }
    if (!read_u32(dims->elements()[0], index_path(dims_path, 0), out.texture_dimensions[0]) ||
        !read_u32(dims->elements()[1], index_path(dims_path, 1), out.texture_dimensions[1])) {
        return false;
    }
    return finish(fields);
}

bool Decoder::read_partial(const Value& value, const std::string& path, PartialTexture& out) {
    if (!value.is_struct()) {
        return mismatch(path, "PartialTexture(...) with named fields", value);
    }
    Fields fields(value, path);

    const Value* tex = require(fields, "tex");
    if (!tex || !read_asset(*tex, fields.path_of("tex"), out.texture)) return false;

    struct Slot {
        const char* name;
        float* target;
    };
    const Slot slots[] = {
        {"left", &out.left}, {"right", &out.right}, {"bottom", &out.bottom}, {"top", &out.top},
    };
    for (const auto& slot : slots) {
        if (const Value* v = fields.get(slot.name)) {
            if (!read_float(*v, fields.path_of(slot.name), *slot.target)) return false;
        }
    }
    return finish(fields);
}

// -----------------------------------------------------------------------------
// Node parts
// -----------------------------------------------------------------------------

bool Decoder::read_transform(const Value& value, const std::string& path, Transform& out) {
    if (!check_struct(value, path, "transform struct")) {
        return false;
    }
    Fields fields(value, path);

    if (const Value* v = fields.get("id")) {
        if (!read_string(*v, fields.path_of("id"), out.id)) return false;
    }
    if (const Value* v = fields.get("anchor")) {
        if (!read_anchor(*v, fields.path_of("anchor"), out.anchor)) return false;
    }
    if (const Value* v = fields.get("pivot")) {
        if (!read_anchor(*v, fields.path_of("pivot"), out.pivot)) return false;
    }

    struct FloatSlot {
        const char* name;
        float* target;
        bool required;
    };
    const FloatSlot floats[] = {
        {"x", &out.x, false}, {"y", &out.y, false}, {"z", &out.z, false},
        {"width", &out.width, true}, {"height", &out.height, true},
    };
    for (const auto& slot : floats) {
        const Value* v = slot.required ? require(fields, slot.name) : fields.get(slot.name);
        if (!v) {
            if (slot.required) return false;
            continue;
        }
        if (!read_float(*v, fields.path_of(slot.name), *slot.target)) return false;
    }

    if (const Value* v = fields.get("stretch")) {
        if (!read_stretch(*v, fields.path_of("stretch"), out.stretch)) return false;
    }
    if (const Value* v = fields.get("tab_order")) {
        if (!read_i32(*v, fields.path_of("tab_order"), out.tab_order)) return false;
    }

    struct BoolSlot {
        const char* name;
        bool* target;
    };
    const BoolSlot flags[] = {
        {"opaque", &out.opaque}, {"mouse_reactive", &out.mouse_reactive},
        {"hidden", &out.hidden}, {"percent", &out.percent},
    };
    for (const auto& slot : flags) {
        if (const Value* v = fields.get(slot.name)) {
            if (!read_bool(*v, fields.path_of(slot.name), *slot.target)) return false;
        }
    }
    return finish(fields);
}

bool Decoder::read_text(const Value& value, const std::string& path, TextDesc& out) {
    if (!check_struct(value, path, "text struct")) {
        return false;
    }
    Fields fields(value, path);

    const Value* text = require(fields, "text");
    if (!text || !read_string(*text, fields.path_of("text"), out.text)) return false;

    if (const Value* v = unwrap_option(fields.get("font"))) {
        AssetRef font;
        if (!read_asset(*v, fields.path_of("font"), font)) return false;
        out.font = std::move(font);
    }

    const Value* size = require(fields, "font_size");
    if (!size || !read_float(*size, fields.path_of("font_size"), out.font_size)) return false;

    const Value* color = require(fields, "color");
    if (!color || !read_color(*color, fields.path_of("color"), out.color)) return false;

    if (const Value* v = unwrap_option(fields.get("line_mode"))) {
        LineMode mode;
        if (!read_line_mode(*v, fields.path_of("line_mode"), mode)) return false;
        out.line_mode = mode;
    }
    if (const Value* v = unwrap_option(fields.get("align"))) {
        Anchor align;
        if (!read_anchor(*v, fields.path_of("align"), align)) return false;
        out.align = align;
    }
    if (const Value* v = fields.get("password")) {
        if (!read_bool(*v, fields.path_of("password"), out.password)) return false;
    }
    return finish(fields);
}

bool Decoder::read_button(const Value& value, const std::string& path, ButtonDesc& out) {
    if (!check_struct(value, path, "button struct")) {
        return false;
    }
    Fields fields(value, path);

    const Value* text = require(fields, "text");
    if (!text || !read_string(*text, fields.path_of("text"), out.text)) return false;

    if (const Value* v = unwrap_option(fields.get("font"))) {
        AssetRef font;
        if (!read_asset(*v, fields.path_of("font"), font)) return false;
        out.font = std::move(font);
    }

    const Value* size = require(fields, "font_size");
    if (!size || !read_float(*size, fields.path_of("font_size"), out.font_size)) return false;

    const Value* color = require(fields, "normal_text_color");
    if (!color || !read_color(*color, fields.path_of("normal_text_color"), out.normal_text_color)) {
        return false;
    }

    struct ImageSlot {
        const char* name;
        std::optional<ImageDesc>* target;
    };
    const ImageSlot images[] = {
        {"normal_image", &out.normal_image},
        {"hover_image", &out.hover_image},
        {"press_image", &out.press_image},
    };
    for (const auto& slot : images) {
        if (const Value* v = unwrap_option(fields.get(slot.name))) {
            ImageDesc image;
            if (!read_image(*v, fields.path_of(slot.name), image)) return false;
            *slot.target = std::move(image);
        }
    }

    struct ColorSlot {
        const char* name;
        std::optional<Color>* target;
    };
    const ColorSlot colors[] = {
        {"hover_text_color", &out.hover_text_color},
        {"press_text_color", &out.press_text_color},
    };
    for (const auto& slot : colors) {
        if (const Value* v = unwrap_option(fields.get(slot.name))) {
            Color c;
            if (!read_color(*v, fields.path_of(slot.name), c)) return false;
            *slot.target = c;
        }
    }
    return finish(fields);
}

bool Decoder::read_children(const Value& value, const std::string& path, Node& parent) {
    if (!value.is_list()) {
        return mismatch(path, "list of nodes", value);
    }
    const auto& items = value.elements();
    for (std::size_t i = 0; i < items.size(); ++i) {
        std::unique_ptr<Node> child;
        if (!read_node(items[i], index_path(path, i), child)) {
            return false;
        }
        parent.add_child(std::move(child));
    }
    return true;
}

bool Decoder::read_node(const Value& value, const std::string& path, std::unique_ptr<Node>& out) {
    const std::string where = path.empty() ? std::string("<root>") : path;
    if (!value.is_struct()) {
        return mismatch(where, "node (Container, Label, Image, Button)", value);
    }
    auto kind = node_kind_from_name(value.name());
    if (!kind) {
        return fail(SchemaError::unknown_variant(where, "node", value.name().empty() ? "()" : value.name()));
    }

    const std::string node_path = path.empty() ? value.name() : path;
    Fields fields(value, node_path);

    Transform transform;
    const Value* t = require(fields, "transform");
    if (!t || !read_transform(*t, fields.path_of("transform"), transform)) {
        return false;
    }

    switch (*kind) {
        case NodeKind::Container: {
            std::optional<ImageDesc> background;
            if (const Value* v = unwrap_option(fields.get("background"))) {
                ImageDesc image;
                if (!read_image(*v, fields.path_of("background"), image)) return false;
                background = std::move(image);
            }
            out = Node::container(std::move(transform), std::move(background));
            if (const Value* v = fields.get("children")) {
                if (!read_children(*v, fields.path_of("children"), *out)) return false;
            }
            break;
        }
        case NodeKind::Label: {
            TextDesc text;
            const Value* v = require(fields, "text");
            if (!v || !read_text(*v, fields.path_of("text"), text)) return false;
            out = Node::label(std::move(transform), std::move(text));
            break;
        }
        case NodeKind::Image: {
            ImageDesc image;
            const Value* v = require(fields, "image");
            if (!v || !read_image(*v, fields.path_of("image"), image)) return false;
            out = Node::image(std::move(transform), std::move(image));
            break;
        }
        case NodeKind::Button: {
            ButtonDesc button;
            const Value* v = require(fields, "button");
            if (!v || !read_button(*v, fields.path_of("button"), button)) return false;
            out = Node::button(std::move(transform), std::move(button));
            break;
        }
    }
    return finish(fields);
}

} // namespace

// =============================================================================
// LayoutReader
// =============================================================================

sail_core::Result<std::unique_ptr<Node>> LayoutReader::read_node(
    const sail_ron::Value& value, const std::string& path) const {
    Decoder decoder(m_options);
    std::unique_ptr<Node> node;
    if (!decoder.read_node(value, path, node)) {
        return sail_core::Err<std::unique_ptr<Node>>(decoder.take_error());
    }
    return sail_core::Ok(std::move(node));
}

sail_core::Result<LayoutDocument> LayoutReader::read(const sail_ron::Document& doc) const {
    auto root = read_node(doc.root);
    if (!root) {
        return sail_core::Err<LayoutDocument>(root.error());
    }

    LayoutDocument layout(std::move(*root), doc.extensions);
    sail_core::layout_logger()->debug("Decoded layout with {} nodes", layout.node_count());
    return sail_core::Ok(std::move(layout));
}

sail_core::Result<LayoutDocument> LayoutReader::read_string(
    std::string_view source, std::string_view source_name) const {
    auto parsed = sail_ron::Parser::parse(source, source_name);
    if (!parsed) {
        return sail_core::Err<LayoutDocument>(parsed.error());
    }

    auto layout = read(*parsed);
    if (!layout) {
        sail_core::Error err = layout.error();
        err.with_context("source", std::string(source_name));
        return sail_core::Err<LayoutDocument>(std::move(err));
    }
    return layout;
}

sail_core::Result<LayoutDocument> LayoutReader::read_file(const std::filesystem::path& path) const {
    auto parsed = sail_ron::Parser::parse_file(path);
    if (!parsed) {
        return sail_core::Err<LayoutDocument>(parsed.error());
    }

    auto layout = read(*parsed);
    if (!layout) {
        sail_core::Error err = layout.error();
        err.with_context("file", path.string());
        return sail_core::Err<LayoutDocument>(std::move(err));
    }
    sail_core::log_structured(spdlog::level::info, "sail_layout", "Loaded layout",
                              {{"file", path.string()},
                               {"nodes", std::to_string(layout->node_count())},
                               {"ids", std::to_string(layout->ids().size())}});
    return layout;
}

} // namespace sail_layout
