#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "animation/animation_driver.hpp"
#include "animation/easing_curve.hpp"
#include "gesture/drag_recognizer.hpp"
#include "gesture/sheet_drag_controller.hpp"
#include "layout/sheet_layout.hpp"

namespace sheet {

struct SheetConfig {
    struct Animation {
        double enter_duration = AnimationDriver::kDefaultDuration;
        double exit_duration = AnimationDriver::kDefaultReverseDuration;
        std::string settle_curve = "ease_in_out_cubic_emphasized";
    } animation;

    struct Gesture {
        float fling_velocity = 700.0f;
        float close_threshold = 0.5f;
        float touch_slop = 18.0f;
        float min_fling_velocity = 50.0f;
        float max_fling_velocity = 8000.0f;
        bool enable_drag = true;
    } gesture;

    struct Backdrop {
        float dead_zone = 0.7f;
        float max_opacity = 0.32f;
    } backdrop;

    struct Layout {
        float max_width = 640.0f;
        float min_content_height = 0.0f;
        float drag_handle_width = 32.0f;
        float drag_handle_height = 4.0f;
        bool show_drag_handle = true;
    } layout;

    struct Spring {
        double mass = 1.0;
        double stiffness = 500.0;
        double damping_ratio = 1.0;
    } spring;
};

// Reads a number at a dotted path such as "gesture.fling_velocity". Missing
// keys and non-numeric values yield `default_value`.
double lookup_number(const nlohmann::json& root, std::string_view dotted_key, double default_value);
bool lookup_bool(const nlohmann::json& root, std::string_view dotted_key, bool default_value);
std::string lookup_string(const nlohmann::json& root, std::string_view dotted_key, const std::string& default_value);

// Out-of-range values are logged and replaced with defaults.
SheetConfig sheet_config_from_json(const nlohmann::json& root);
// Never throws. A missing or malformed file yields the defaults.
SheetConfig load_sheet_config(const std::filesystem::path& path);
nlohmann::json sheet_config_to_json(const SheetConfig& config);

DragPolicy drag_policy(const SheetConfig& config);
DragRecognizerSettings drag_recognizer_settings(const SheetConfig& config);
BackdropRamp backdrop_ramp(const SheetConfig& config);
FlingSettings fling_settings(const SheetConfig& config);
// Falls back to the emphasized easing for unknown names.
CurvePtr settle_curve(const SheetConfig& config);

}
