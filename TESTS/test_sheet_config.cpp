#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "config/sheet_config.hpp"

using namespace sheet;
using nlohmann::json;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& text) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << text;
    return path;
}

}

TEST_CASE("Empty document keeps every default") {
    const SheetConfig config = sheet_config_from_json(json::object());
    CHECK(config.animation.enter_duration == doctest::Approx(0.4));
    CHECK(config.animation.exit_duration == doctest::Approx(0.35));
    CHECK(config.animation.settle_curve == "ease_in_out_cubic_emphasized");
    CHECK(config.gesture.fling_velocity == doctest::Approx(700.0f));
    CHECK(config.gesture.close_threshold == doctest::Approx(0.5f));
    CHECK(config.gesture.enable_drag);
    CHECK(config.backdrop.dead_zone == doctest::Approx(0.7f));
    CHECK(config.backdrop.max_opacity == doctest::Approx(0.32f));
    CHECK(config.layout.max_width == doctest::Approx(640.0f));
    CHECK(config.layout.show_drag_handle);
}

TEST_CASE("Values are read from nested groups") {
    const json root = {
        {"animation", {{"enter_duration", 0.25}, {"settle_curve", "linear"}}},
        {"gesture", {{"fling_velocity", 900}, {"close_threshold", 0.4}, {"enable_drag", false}}},
        {"backdrop", {{"max_opacity", 0.5}}},
        {"layout", {{"max_width", 480}, {"show_drag_handle", false}}},
    };
    const SheetConfig config = sheet_config_from_json(root);
    CHECK(config.animation.enter_duration == doctest::Approx(0.25));
    CHECK(config.animation.settle_curve == "linear");
    CHECK(config.gesture.fling_velocity == doctest::Approx(900.0f));
    CHECK(config.gesture.close_threshold == doctest::Approx(0.4f));
    CHECK_FALSE(config.gesture.enable_drag);
    CHECK(config.backdrop.max_opacity == doctest::Approx(0.5f));
    CHECK(config.layout.max_width == doctest::Approx(480.0f));
    CHECK_FALSE(config.layout.show_drag_handle);

    CHECK(settle_curve(config) == curves::linear());
    CHECK(drag_policy(config).fling_velocity_threshold == doctest::Approx(900.0f));
    CHECK(backdrop_ramp(config).max_opacity == doctest::Approx(0.5f));
}

TEST_CASE("Out of range and mistyped values fall back") {
    const json root = {
        {"gesture", {{"close_threshold", 1.5}, {"touch_slop", "wide"}, {"enable_drag", 1}}},
        {"backdrop", {{"dead_zone", -0.2}}},
        {"animation", {{"exit_duration", -1}, {"settle_curve", "bouncy"}}},
    };
    const SheetConfig config = sheet_config_from_json(root);
    CHECK(config.gesture.close_threshold == doctest::Approx(0.5f));
    CHECK(config.gesture.touch_slop == doctest::Approx(18.0f));
    CHECK(config.gesture.enable_drag);
    CHECK(config.backdrop.dead_zone == doctest::Approx(0.7f));
    CHECK(config.animation.exit_duration == doctest::Approx(0.35));
    CHECK(config.animation.settle_curve == "ease_in_out_cubic_emphasized");
}

TEST_CASE("Inverted fling velocity bounds reset both bounds") {
    const json root = {{"gesture", {{"min_fling_velocity", 500}, {"max_fling_velocity", 100}}}};
    const SheetConfig config = sheet_config_from_json(root);
    CHECK(config.gesture.min_fling_velocity == doctest::Approx(50.0f));
    CHECK(config.gesture.max_fling_velocity == doctest::Approx(8000.0f));

    const DragRecognizerSettings settings = drag_recognizer_settings(config);
    CHECK(settings.max_fling_velocity == doctest::Approx(8000.0f));
}

TEST_CASE("Spring settings become a critically damped fling") {
    const FlingSettings fling = fling_settings(SheetConfig{});
    CHECK(fling.spring.mass == doctest::Approx(1.0));
    CHECK(fling.spring.stiffness == doctest::Approx(500.0));
    CHECK(fling.spring.damping == doctest::Approx(44.7214).epsilon(1e-4));
}

TEST_CASE("Dotted lookups walk nested objects") {
    const json root = {{"a", {{"b", {{"c", 3}}}}}, {"flag", true}, {"name", "sheet"}};
    CHECK(lookup_number(root, "a.b.c", 0.0) == doctest::Approx(3.0));
    CHECK(lookup_number(root, "a.b.missing", 7.0) == doctest::Approx(7.0));
    CHECK(lookup_number(root, "flag", 7.0) == doctest::Approx(7.0));
    CHECK(lookup_number(root, "", 1.0) == doctest::Approx(1.0));
    CHECK(lookup_bool(root, "flag", false));
    CHECK(lookup_string(root, "name", "") == "sheet");
    CHECK(lookup_string(root, "a.b", "none") == "none");
}

TEST_CASE("Written configuration reads back unchanged") {
    SheetConfig config;
    config.gesture.fling_velocity = 1200.0f;
    config.layout.min_content_height = 96.0f;
    config.animation.settle_curve = "fast_out_slow_in";
    const SheetConfig reread = sheet_config_from_json(sheet_config_to_json(config));
    CHECK(reread.gesture.fling_velocity == doctest::Approx(1200.0f));
    CHECK(reread.layout.min_content_height == doctest::Approx(96.0f));
    CHECK(reread.animation.settle_curve == "fast_out_slow_in");
}

TEST_CASE("Config files load with defaults on failure") {
    const auto missing = std::filesystem::temp_directory_path() / "sheet_config_does_not_exist.json";
    std::filesystem::remove(missing);
    CHECK(load_sheet_config(missing).gesture.fling_velocity == doctest::Approx(700.0f));

    const auto malformed = write_temp("sheet_config_malformed.json", "{ \"gesture\": ");
    CHECK(load_sheet_config(malformed).gesture.fling_velocity == doctest::Approx(700.0f));
    std::filesystem::remove(malformed);

    const auto valid = write_temp("sheet_config_valid.json", R"({"gesture": {"fling_velocity": 333}})");
    CHECK(load_sheet_config(valid).gesture.fling_velocity == doctest::Approx(333.0f));
    std::filesystem::remove(valid);
}
