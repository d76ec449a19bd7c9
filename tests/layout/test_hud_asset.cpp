// sail_layout tests against the shipped game HUD

#include <catch2/catch_test_macros.hpp>
#include <sail_engine/layout/reader.hpp>
#include <sail_engine/layout/validation.hpp>
#include <sail_engine/layout/writer.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

using namespace sail_layout;

namespace {

LayoutDocument load_hud() {
    auto path = std::filesystem::path(SAIL_ENGINE_SOURCE_DIR) / "assets" / "ui" / "main.ron";
    auto result = LayoutReader().read_file(path);
    if (result.is_err()) {
        FAIL(sail_core::build_error_chain(result.error()));
    }
    return std::move(*result);
}

} // anonymous namespace

TEST_CASE("HUD identifiers", "[layout][hud]") {
    LayoutDocument doc = load_hud();

    REQUIRE(doc.has_extension("implicit_some"));
    REQUIRE(doc.node_count() == 19);
    REQUIRE(doc.ids() == std::vector<std::string>{
        "background",
        "port_info",
        "port_info_name",
        "notification",
        "ship_info",
        "ship_info_name",
        "ship_info_affiliation",
        "player_contracts_info",
        "player_contracts_info_title",
        "time",
        "time_panel",
        "current_time",
        "pause_button",
        "play_button",
        "increase_speed_button",
        "decrease_speed_button",
        "player_status",
        "player_status_panel",
        "player_money",
    });
    for (const auto& id : doc.ids()) {
        REQUIRE(doc.find_all(id).size() == 1);
    }
}

TEST_CASE("HUD root fills the screen", "[layout][hud]") {
    LayoutDocument doc = load_hud();
    const Transform& t = doc.root().transform();

    REQUIRE(doc.root().kind() == NodeKind::Container);
    REQUIRE(t.id == "background");
    REQUIRE(t.stretch == Stretch::xy(0.0f, 0.0f, false));
    REQUIRE_FALSE(t.opaque);
    REQUIRE(doc.root().background() == nullptr);
}

TEST_CASE("HUD speed controls", "[layout][hud]") {
    LayoutDocument doc = load_hud();

    const Node* pause = doc.find("pause_button");
    const Node* play = doc.find("play_button");
    REQUIRE(pause != nullptr);
    REQUIRE(play != nullptr);
    REQUIRE(pause->kind() == NodeKind::Button);
    REQUIRE(pause->parent() == play->parent());
    REQUIRE(pause->parent()->id() == "time");

    REQUIRE(pause->transform().z == 1.0f);
    REQUIRE_FALSE(pause->transform().hidden);
    REQUIRE(play->transform().z == -1.0f);
    REQUIRE(play->transform().hidden);

    const ButtonDesc* button = pause->as_button();
    REQUIRE(button != nullptr);
    REQUIRE(button->font.has_value());
    REQUIRE(button->font->path == "font/square.ttf");
    REQUIRE(button->normal_image.has_value());
    const AssetRef* tex = image_texture(*button->normal_image);
    REQUIRE(tex != nullptr);
    REQUIRE(tex->path == "texture/pause.png");
}

TEST_CASE("HUD player status", "[layout][hud]") {
    LayoutDocument doc = load_hud();

    const Node* panel = doc.find("player_status_panel");
    REQUIRE(panel != nullptr);
    REQUIRE(panel->kind() == NodeKind::Image);
    REQUIRE(panel->transform().stretch.mode == Stretch::Mode::XY);
    const auto* nine = std::get_if<NineSlice>(&panel->as_image()->image);
    REQUIRE(nine != nullptr);
    REQUIRE(nine->texture_dimensions == std::array<std::uint32_t, 2>{64, 64});

    const Node* money = doc.find("player_money");
    REQUIRE(money != nullptr);
    REQUIRE(money->as_label()->text == "$0");
    REQUIRE(money->as_label()->color == Color(1.0f, 0.85f, 0.3f, 1.0f));
}

TEST_CASE("HUD assets", "[layout][hud]") {
    LayoutDocument doc = load_hud();
    auto uses = doc.asset_refs();
    REQUIRE_FALSE(uses.empty());

    for (const auto& use : uses) {
        INFO(use.path);
        if (use.usage == AssetUsage::Font) {
            REQUIRE(use.asset->kind == "TTF");
            REQUIRE(asset_kind_for_path(use.asset->path) == AssetKind::Font);
        } else {
            REQUIRE(use.asset->kind == "IMAGE");
            REQUIRE(asset_kind_for_path(use.asset->path) == AssetKind::Image);
        }
    }
}

TEST_CASE("HUD validates cleanly", "[layout][hud]") {
    LayoutDocument doc = load_hud();

    ValidatorOptions options;
    options.warnings_as_errors = true;
    ValidationResult result = LayoutValidator(options).validate(doc);
    INFO(result.first_error());
    REQUIRE(result.valid);
    REQUIRE(result.issues.empty());
}

TEST_CASE("HUD survives a write and read", "[layout][hud]") {
    LayoutDocument doc = load_hud();

    std::string text = LayoutWriter().write(doc);
    REQUIRE(text.rfind("#![enable(implicit_some)]", 0) == 0);

    auto back = LayoutReader().read_string(text);
    REQUIRE(back.is_ok());
    REQUIRE(back->root() == doc.root());
    REQUIRE(back->ids() == doc.ids());
}
