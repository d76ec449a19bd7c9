// sail_layout LayoutWriter tests

#include <catch2/catch_test_macros.hpp>
#include <sail_engine/layout/reader.hpp>
#include <sail_engine/layout/writer.hpp>

#include <string>

using namespace sail_layout;

namespace {

LayoutDocument read_ok(std::string_view text) {
    auto result = LayoutReader().read_string(text);
    if (result.is_err()) {
        FAIL(sail_core::build_error_chain(result.error()));
    }
    return std::move(*result);
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

LayoutDocument make_document(std::vector<std::string> extensions = {}) {
    Transform root_t;
    root_t.id = "root";
    root_t.width = 20.0f;
    root_t.height = 20.0f;
    root_t.stretch = Stretch::xy(0.0f, 0.0f, false);
    root_t.opaque = false;

    NineSlice nine;
    nine.x_start = 4;
    nine.y_start = 4;
    nine.width = 56;
    nine.height = 56;
    nine.left_dist = nine.right_dist = nine.top_dist = nine.bottom_dist = 4;
    nine.texture = AssetRef::image("texture/panel.png");
    nine.texture_dimensions = {64, 64};

    auto root = Node::container(root_t, nine);

    Transform label_t;
    label_t.id = "money";
    label_t.anchor = Anchor::BottomLeft;
    label_t.width = 180.0f;
    label_t.height = 40.0f;
    label_t.z = 1.0f;

    TextDesc text;
    text.text = "$0";
    text.font = AssetRef::font("font/square.ttf");
    text.font_size = 22.0f;
    text.color = Color(1.0f, 0.85f, 0.3f, 1.0f);
    text.align = Anchor::MiddleRight;
    root->add_child(Node::label(label_t, text));

    Transform button_t;
    button_t.id = "pause";
    button_t.width = 32.0f;
    button_t.height = 32.0f;
    button_t.tab_order = 2;
    button_t.mouse_reactive = true;
    button_t.hidden = true;

    ButtonDesc button;
    button.font_size = 20.0f;
    button.normal_image = TextureImage{AssetRef::image("texture/pause.png")};
    button.hover_text_color = Color(1.0f, 0.9f, 0.6f, 1.0f);
    root->add_child(Node::button(button_t, button));

    Transform image_t;
    image_t.width = 10.0f;
    image_t.height = 10.0f;
    PartialTexture partial;
    partial.texture = AssetRef::image("texture/atlas.png");
    partial.right = 0.25f;
    root->add_child(Node::image(image_t, partial));

    return LayoutDocument(std::move(root), std::move(extensions));
}

} // anonymous namespace

TEST_CASE("Writer round trip", "[layout][writer]") {
    for (bool implicit : {false, true}) {
        LayoutDocument doc = make_document(implicit
            ? std::vector<std::string>{"implicit_some"} : std::vector<std::string>{});
        std::string text = LayoutWriter().write(doc);

        LayoutDocument back = read_ok(text);
        REQUIRE(back.root() == doc.root());
        REQUIRE(back.extensions() == doc.extensions());
    }
}

TEST_CASE("Writer float formatting", "[layout][writer]") {
    REQUIRE(LayoutWriter::float_value(0.6f).as_number() == 0.6);
    REQUIRE(LayoutWriter::float_value(0.85f).as_number() == 0.85);
    REQUIRE(LayoutWriter::float_value(20.0f).as_number() == 20.0);

    std::string text = LayoutWriter().write(make_document());
    REQUIRE(contains(text, "(1.0, 0.85, 0.3, 1.0)"));
    REQUIRE(contains(text, "width: 180.0"));
}

TEST_CASE("Writer omits defaults", "[layout][writer]") {
    LayoutDocument doc = make_document();

    SECTION("defaults dropped") {
        std::string text = LayoutWriter().write(doc);
        REQUIRE_FALSE(contains(text, "pivot:"));
        REQUIRE_FALSE(contains(text, "percent:"));
        REQUIRE_FALSE(contains(text, "password:"));
        REQUIRE_FALSE(contains(text, "left:"));
        REQUIRE(contains(text, "right: 0.25"));
        REQUIRE(contains(text, "opaque: false"));
        REQUIRE(contains(text, "hidden: true"));
        REQUIRE(contains(text, "tab_order: 2"));
    }

    SECTION("defaults kept on request") {
        LayoutWriterOptions options;
        options.omit_defaults = false;
        std::string text = LayoutWriter(options).write(doc);
        REQUIRE(contains(text, "pivot: Middle"));
        REQUIRE(contains(text, "percent: false"));
        REQUIRE(contains(text, "stretch: NoStretch"));
        REQUIRE(contains(text, "left: 0.0"));

        LayoutDocument back = read_ok(text);
        REQUIRE(back.root() == doc.root());
    }

    SECTION("size is always written") {
        Transform t;
        auto node = Node::container(t);
        sail_ron::Value value = LayoutWriter().to_value(*node);
        const sail_ron::Value* transform = value.field("transform");
        REQUIRE(transform != nullptr);
        REQUIRE(transform->field("width") != nullptr);
        REQUIRE(transform->field("height") != nullptr);
        REQUIRE(transform->field("id") == nullptr);
        REQUIRE(value.field("children") == nullptr);
    }
}

TEST_CASE("Writer optional fields", "[layout][writer]") {
    SECTION("Some wrappers without implicit_some") {
        std::string text = LayoutWriter().write(make_document());
        REQUIRE(contains(text, "font: Some(File(\"font/square.ttf\", (\"TTF\", ())))"));
        REQUIRE(contains(text, "align: Some(MiddleRight)"));
        REQUIRE(contains(text, "background: Some(NineSlice("));
        REQUIRE_FALSE(contains(text, "#![enable"));
    }

    SECTION("bare values with implicit_some") {
        std::string text = LayoutWriter().write(make_document({"implicit_some"}));
        REQUIRE(contains(text, "#![enable(implicit_some)]"));
        REQUIRE(contains(text, "font: File(\"font/square.ttf\", (\"TTF\", ()))"));
        REQUIRE(contains(text, "align: MiddleRight"));
        REQUIRE_FALSE(contains(text, "Some("));
    }

    SECTION("option overrides the document") {
        LayoutWriterOptions options;
        options.implicit_some = true;
        sail_ron::Document ron = LayoutWriter(options).to_ron(make_document());
        REQUIRE(ron.has_extension("implicit_some"));

        options.implicit_some = false;
        ron = LayoutWriter(options).to_ron(make_document({"implicit_some"}));
        REQUIRE_FALSE(ron.has_extension("implicit_some"));
        REQUIRE(ron.root.field("background")->is_named("Some"));
    }
}

TEST_CASE("Writer emits SolidColor with four components", "[layout][writer]") {
    LayoutDocument doc = read_ok(
        "Container(transform: (width: 1., height: 1.), background: SolidColor(0.1, 0.2, 0.3, 1.0))");
    std::string text = LayoutWriter().write(doc);

    REQUIRE(contains(text, "SolidColor(0.1, 0.2, 0.3, 1.0)"));
    REQUIRE_FALSE(contains(text, "SolidColor(("));

    sail_ron::Value root = LayoutWriter().to_value(doc.root());
    const sail_ron::Value* some = root.field("background");
    REQUIRE(some != nullptr);
    REQUIRE(some->is_named("Some"));
    const sail_ron::Value& bg = some->elements().front();
    REQUIRE(bg.is_named("SolidColor"));
    REQUIRE(bg.size() == 4);
    REQUIRE(read_ok(text).root() == doc.root());
}

TEST_CASE("Writer node shapes", "[layout][writer]") {
    LayoutDocument doc = make_document();
    sail_ron::Value root = LayoutWriter().to_value(doc.root());

    REQUIRE(root.is_named("Container"));
    REQUIRE(root.field_names().front() == "transform");
    const sail_ron::Value* children = root.field("children");
    REQUIRE(children != nullptr);
    REQUIRE(children->size() == 3);
    REQUIRE(children->elements()[0].is_named("Label"));
    REQUIRE(children->elements()[1].field("button")->field("normal_text_color") != nullptr);
    REQUIRE(children->elements()[2].field("image")->is_named("PartialTexture"));

    const sail_ron::Value* stretch = root.field("transform")->field("stretch");
    REQUIRE(stretch != nullptr);
    REQUIRE(stretch->is_named("XY"));
    REQUIRE(stretch->field("keep_aspect_ratio") != nullptr);
}

TEST_CASE("Writer compact output", "[layout][writer]") {
    LayoutWriterOptions options;
    options.format.pretty = false;
    std::string text = LayoutWriter(options).write(make_document());

    REQUIRE(text.find('\n') == text.size() - 1);
    REQUIRE(read_ok(text).root() == make_document().root());
}
