// sail_layout validation tests

#include <catch2/catch_test_macros.hpp>
#include <sail_engine/layout/validation.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using namespace sail_layout;

namespace {

Transform sized(std::string id, float w = 10.0f, float h = 10.0f) {
    Transform t;
    t.id = std::move(id);
    t.width = w;
    t.height = h;
    return t;
}

TextDesc text_with_font(AssetRef font) {
    TextDesc text;
    text.text = "hello";
    text.font = std::move(font);
    return text;
}

NineSlice panel() {
    NineSlice nine;
    nine.x_start = 4;
    nine.y_start = 4;
    nine.width = 56;
    nine.height = 56;
    nine.left_dist = nine.right_dist = nine.top_dist = nine.bottom_dist = 4;
    nine.texture = AssetRef::image("texture/panel.png");
    nine.texture_dimensions = {64, 64};
    return nine;
}

LayoutDocument single(std::unique_ptr<Node> child) {
    auto root = Node::container(sized("root"));
    root->add_child(std::move(child));
    return LayoutDocument(std::move(root));
}

ValidationResult validate(const LayoutDocument& doc, ValidatorOptions options = {}) {
    return LayoutValidator(std::move(options)).validate(doc);
}

} // anonymous namespace

// =============================================================================
// ValidationResult
// =============================================================================

TEST_CASE("ValidationResult bookkeeping", "[layout][validation]") {
    ValidationResult result = ValidationResult::ok();
    REQUIRE(result.valid);

    result.add_warning(IssueCode::UnknownExtension, "a", "odd extension");
    REQUIRE(result.valid);
    REQUIRE(result.warning_count() == 1);
    REQUIRE(result.first_error().empty());

    result.add_error(IssueCode::DuplicateId, "b.transform.id", "dup");
    REQUIRE_FALSE(result.valid);
    REQUIRE(result.error_count() == 1);
    REQUIRE(result.has(IssueCode::DuplicateId));
    REQUIRE_FALSE(result.has(IssueCode::ColorOutOfRange));
    REQUIRE(result.first_error() == "error: b.transform.id: dup");
    REQUIRE(result.all_messages().size() == 2);
    REQUIRE(result.all_messages()[0] == "warning: a: odd extension");

    ValidationResult other;
    other.add_error(IssueCode::InvalidSize, "", "bad size");
    ValidationResult merged;
    merged.merge(other);
    REQUIRE_FALSE(merged.valid);
    REQUIRE(merged.issues.size() == 1);
    REQUIRE(merged.issues[0].to_string() == "error: bad size");

    sail_core::Error err = result.to_error();
    REQUIRE(err.code() == sail_core::ErrorCode::ValidationError);
    REQUIRE(err.get_context("issue 000") != nullptr);
    REQUIRE(err.get_context("issue 001") != nullptr);
    REQUIRE(err.get_context("issue 002") == nullptr);
}

TEST_CASE("Issue names", "[layout][validation]") {
    REQUIRE(std::string(issue_code_name(IssueCode::NineSliceBounds)) == "NineSliceBounds");
    REQUIRE(std::string(severity_name(Severity::Warning)) == "warning");
}

// =============================================================================
// Checks
// =============================================================================

TEST_CASE("Validator accepts a clean layout", "[layout][validation]") {
    auto root = Node::container(sized("root"), panel());
    root->add_child(Node::label(sized("title"), text_with_font(AssetRef::font("font/square.ttf"))));
    ButtonDesc button;
    button.normal_image = TextureImage{AssetRef::image("texture/pause.png")};
    root->add_child(Node::button(sized("pause"), button));
    LayoutDocument doc(std::move(root));

    ValidationResult result = validate(doc);
    REQUIRE(result.valid);
    REQUIRE(result.issues.empty());
}

TEST_CASE("Validator duplicate ids", "[layout][validation]") {
    auto root = Node::container(sized("panel"));
    root->add_child(Node::label(sized("panel"), TextDesc{}));
    root->add_child(Node::label(sized(""), TextDesc{}));
    root->add_child(Node::label(sized(""), TextDesc{}));
    LayoutDocument doc(std::move(root));

    ValidationResult result = validate(doc);
    REQUIRE_FALSE(result.valid);
    auto dups = result.with_code(IssueCode::DuplicateId);
    REQUIRE(dups.size() == 1);
    REQUIRE(dups[0].path == "Container.children[0].transform.id");
}

TEST_CASE("Validator asset checks", "[layout][validation]") {
    SECTION("font declared as image") {
        AssetRef font = AssetRef::font("font/square.ttf");
        font.kind = "IMAGE";
        ValidationResult result = validate(single(Node::label(sized("l"), text_with_font(font))));
        REQUIRE_FALSE(result.valid);
        auto issues = result.with_code(IssueCode::AssetKindMismatch);
        REQUIRE(issues.size() == 2);
        REQUIRE(issues[0].path == "Container.children[0].text.font");
    }

    SECTION("texture with a font extension") {
        ValidationResult result = validate(single(
            Node::image(sized("i"), TextureImage{AssetRef::image("font/square.ttf")})));
        REQUIRE(result.has(IssueCode::AssetKindMismatch));
        REQUIRE(result.with_code(IssueCode::AssetKindMismatch)[0].path == "Container.children[0].image");
    }

    SECTION("unknown kind tag") {
        AssetRef sound{"sound/bell.ogg", "OGG", sail_ron::Value::unit()};
        ValidationResult result = validate(single(Node::label(sized("l"), text_with_font(sound))));
        REQUIRE(result.has(IssueCode::UnknownAssetKind));
        REQUIRE(result.has(IssueCode::UnknownExtension));
    }

    SECTION("unknown extension is only a warning") {
        ValidationResult result = validate(single(
            Node::image(sized("i"), TextureImage{AssetRef::image("texture/panel.dds")})));
        REQUIRE(result.valid);
        REQUIRE(result.warning_count() == 1);
        REQUIRE(result.has(IssueCode::UnknownExtension));
    }

    SECTION("empty and absolute paths") {
        ValidationResult empty = validate(single(
            Node::image(sized("i"), TextureImage{AssetRef::image("")})));
        REQUIRE(empty.has(IssueCode::InvalidAssetPath));
        REQUIRE_FALSE(empty.valid);

        ValidationResult absolute = validate(single(
            Node::image(sized("i"), TextureImage{AssetRef::image("/usr/share/panel.png")})));
        REQUIRE(absolute.has(IssueCode::InvalidAssetPath));
        REQUIRE_FALSE(absolute.valid);

        ValidationResult drive = validate(single(
            Node::image(sized("i"), TextureImage{AssetRef::image("C:\\panel.png")})));
        REQUIRE_FALSE(drive.valid);
    }

    SECTION("parent directory is a warning") {
        ValidationResult result = validate(single(
            Node::image(sized("i"), TextureImage{AssetRef::image("../shared/panel.png")})));
        REQUIRE(result.valid);
        REQUIRE(result.has(IssueCode::InvalidAssetPath));
        REQUIRE(result.warning_count() == 1);

        ValidationResult dotted = validate(single(
            Node::image(sized("i"), TextureImage{AssetRef::image("texture/..hidden.png")})));
        REQUIRE(dotted.issues.empty());
    }

    SECTION("nine slice texture path includes the tex field") {
        NineSlice nine = panel();
        nine.texture.kind = "TTF";
        ValidationResult result = validate(single(Node::image(sized("i"), nine)));
        REQUIRE(result.with_code(IssueCode::AssetKindMismatch)[0].path == "Container.children[0].image.tex");
    }
}

TEST_CASE("Validator asset files", "[layout][validation]") {
    auto root_dir = std::filesystem::temp_directory_path() / "sail_validation_assets";
    std::filesystem::create_directories(root_dir / "texture");
    {
        std::ofstream out(root_dir / "texture" / "panel.png");
        out << "png";
    }

    auto root = Node::container(sized("root"), panel());
    root->add_child(Node::image(sized("i"), TextureImage{AssetRef::image("texture/missing.png")}));
    LayoutDocument doc(std::move(root));

    SECTION("not checked by default") {
        REQUIRE(validate(doc).valid);
    }

    SECTION("missing files reported") {
        ValidatorOptions options;
        options.asset_root = root_dir;
        options.check_files = true;
        ValidationResult result = validate(doc, options);
        REQUIRE_FALSE(result.valid);
        auto missing = result.with_code(IssueCode::MissingAssetFile);
        REQUIRE(missing.size() == 1);
        REQUIRE(missing[0].path == "Container.children[0].image");
    }

    std::filesystem::remove_all(root_dir);
}

TEST_CASE("Validator node checks", "[layout][validation]") {
    SECTION("negative size") {
        ValidationResult result = validate(single(Node::container(sized("c", -1.0f, 5.0f))));
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.with_code(IssueCode::InvalidSize)[0].path == "Container.children[0].transform.width");
    }

    SECTION("non-finite offsets") {
        Transform t = sized("c");
        t.x = std::numeric_limits<float>::infinity();
        ValidationResult result = validate(single(Node::container(t)));
        REQUIRE(result.has(IssueCode::InvalidSize));
    }

    SECTION("negative stretch margin warns") {
        Transform t = sized("c");
        t.stretch = Stretch::x(-2.0f);
        ValidationResult result = validate(single(Node::container(t)));
        REQUIRE(result.valid);
        REQUIRE(result.warning_count() == 1);
    }

    SECTION("font size must be positive") {
        TextDesc text;
        text.font_size = 0.0f;
        ValidationResult result = validate(single(Node::label(sized("l"), text)));
        REQUIRE(result.with_code(IssueCode::InvalidFontSize)[0].path == "Container.children[0].text.font_size");
    }

    SECTION("colors must be in range") {
        TextDesc text;
        text.color = Color(1.5f, 0.0f, 0.0f);
        REQUIRE(validate(single(Node::label(sized("l"), text))).has(IssueCode::ColorOutOfRange));

        ButtonDesc button;
        button.hover_text_color = Color(0.0f, 0.0f, 0.0f, 2.0f);
        ValidationResult result = validate(single(Node::button(sized("b"), button)));
        REQUIRE(result.with_code(IssueCode::ColorOutOfRange)[0].path
                == "Container.children[0].button.hover_text_color");

        REQUIRE(validate(single(Node::image(sized("i"), SolidColor{Color(-0.1f, 0.0f, 0.0f)})))
                    .has(IssueCode::ColorOutOfRange));
    }

    SECTION("nine slice cell outside the texture") {
        NineSlice nine = panel();
        nine.x_start = 16;
        ValidationResult result = validate(single(Node::image(sized("i"), nine)));
        REQUIRE(result.has(IssueCode::NineSliceBounds));
        REQUIRE(result.with_code(IssueCode::NineSliceBounds)[0].path == "Container.children[0].image");
    }

    SECTION("nine slice borders larger than the cell") {
        NineSlice nine = panel();
        nine.left_dist = 30;
        nine.right_dist = 30;
        REQUIRE(validate(single(Node::image(sized("i"), nine))).has(IssueCode::NineSliceBounds));
    }

    SECTION("nine slice zero texture dimensions") {
        NineSlice nine = panel();
        nine.texture_dimensions = {0, 64};
        ValidationResult result = validate(single(Node::image(sized("i"), nine)));
        REQUIRE(result.with_code(IssueCode::NineSliceBounds).size() == 1);
        REQUIRE(result.with_code(IssueCode::NineSliceBounds)[0].path
                == "Container.children[0].image.texture_dimensions");
    }

    SECTION("partial texture range warns") {
        PartialTexture partial;
        partial.texture = AssetRef::image("texture/atlas.png");
        partial.right = 1.5f;
        ValidationResult result = validate(single(Node::image(sized("i"), partial)));
        REQUIRE(result.valid);
        REQUIRE(result.has(IssueCode::TextureRange));
    }
}

TEST_CASE("Validator warnings_as_errors", "[layout][validation]") {
    LayoutDocument doc = single(
        Node::image(sized("i"), TextureImage{AssetRef::image("texture/panel.dds")}));

    REQUIRE(validate(doc).valid);

    ValidatorOptions options;
    options.warnings_as_errors = true;
    ValidationResult result = validate(doc, options);
    REQUIRE_FALSE(result.valid);
    REQUIRE(result.error_count() == 0);
}

TEST_CASE("Validator on an empty document", "[layout][validation]") {
    LayoutDocument doc;
    ValidationResult result = validate(doc);
    REQUIRE(result.valid);
    REQUIRE(result.issues.empty());
}
