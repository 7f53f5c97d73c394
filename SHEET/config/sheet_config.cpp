#include "sheet_config.hpp"

#include <cmath>
#include <fstream>
#include <system_error>
#include <vector>

#include "utils/log.hpp"

namespace sheet {

namespace {

std::vector<std::string> split_key(std::string_view key) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : key) {
        if (ch == '.') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

const nlohmann::json* find_node(const nlohmann::json& root, std::string_view dotted_key) {
    const auto parts = split_key(dotted_key);
    if (parts.empty()) {
        return nullptr;
    }
    const nlohmann::json* node = &root;
    for (const auto& part : parts) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(part);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}

// Reads a number and rejects it when it falls outside [lo, hi].
double checked_number(const nlohmann::json& root, std::string_view key, double default_value, double lo, double hi) {
    const nlohmann::json* node = find_node(root, key);
    if (!node) {
        return default_value;
    }
    if (!node->is_number()) {
        log::warn("[SheetConfig] '" + std::string(key) + "' is not a number; using default " + std::to_string(default_value) + ".");
        return default_value;
    }
    const double value = node->get<double>();
    if (!std::isfinite(value) || value < lo || value > hi) {
        log::warn("[SheetConfig] '" + std::string(key) + "' = " + std::to_string(value) + " is out of range; using default " +
                  std::to_string(default_value) + ".");
        return default_value;
    }
    return value;
}

float checked_float(const nlohmann::json& root, std::string_view key, float default_value, double lo, double hi) {
    return static_cast<float>(checked_number(root, key, default_value, lo, hi));
}

constexpr double kHuge = 1e9;

}

double lookup_number(const nlohmann::json& root, std::string_view dotted_key, double default_value) {
    const nlohmann::json* node = find_node(root, dotted_key);
    if (!node || !node->is_number()) {
        return default_value;
    }
    return node->get<double>();
}

bool lookup_bool(const nlohmann::json& root, std::string_view dotted_key, bool default_value) {
    const nlohmann::json* node = find_node(root, dotted_key);
    if (!node || !node->is_boolean()) {
        return default_value;
    }
    return node->get<bool>();
}

std::string lookup_string(const nlohmann::json& root, std::string_view dotted_key, const std::string& default_value) {
    const nlohmann::json* node = find_node(root, dotted_key);
    if (!node || !node->is_string()) {
        return default_value;
    }
    return node->get<std::string>();
}

SheetConfig sheet_config_from_json(const nlohmann::json& root) {
    SheetConfig config;
    if (!root.is_object()) {
        if (!root.is_null()) {
            log::warn("[SheetConfig] root is not an object; using defaults.");
        }
        return config;
    }

    auto& anim = config.animation;
    anim.enter_duration = checked_number(root, "animation.enter_duration", anim.enter_duration, 0.0, 60.0);
    anim.exit_duration = checked_number(root, "animation.exit_duration", anim.exit_duration, 0.0, 60.0);
    const std::string curve_name = lookup_string(root, "animation.settle_curve", anim.settle_curve);
    if (curves::by_name(curve_name)) {
        anim.settle_curve = curve_name;
    } else {
        log::warn("[SheetConfig] unknown curve '" + curve_name + "'; using '" + anim.settle_curve + "'.");
    }

    auto& gesture = config.gesture;
    gesture.fling_velocity = checked_float(root, "gesture.fling_velocity", gesture.fling_velocity, 0.0, kHuge);
    gesture.close_threshold = checked_float(root, "gesture.close_threshold", gesture.close_threshold, 0.0, 1.0);
    gesture.touch_slop = checked_float(root, "gesture.touch_slop", gesture.touch_slop, 0.0, 1000.0);
    gesture.min_fling_velocity = checked_float(root, "gesture.min_fling_velocity", gesture.min_fling_velocity, 0.0, kHuge);
    gesture.max_fling_velocity = checked_float(root, "gesture.max_fling_velocity", gesture.max_fling_velocity, 0.0, kHuge);
    if (gesture.max_fling_velocity < gesture.min_fling_velocity) {
        log::warn("[SheetConfig] gesture.max_fling_velocity is below gesture.min_fling_velocity; using defaults.");
        gesture.min_fling_velocity = SheetConfig::Gesture{}.min_fling_velocity;
        gesture.max_fling_velocity = SheetConfig::Gesture{}.max_fling_velocity;
    }
    gesture.enable_drag = lookup_bool(root, "gesture.enable_drag", gesture.enable_drag);

    auto& backdrop = config.backdrop;
    backdrop.dead_zone = checked_float(root, "backdrop.dead_zone", backdrop.dead_zone, 0.0, 1.0);
    backdrop.max_opacity = checked_float(root, "backdrop.max_opacity", backdrop.max_opacity, 0.0, 1.0);

    auto& layout = config.layout;
    layout.max_width = checked_float(root, "layout.max_width", layout.max_width, 0.0, kHuge);
    layout.min_content_height = checked_float(root, "layout.min_content_height", layout.min_content_height, 0.0, kHuge);
    layout.drag_handle_width = checked_float(root, "layout.drag_handle_width", layout.drag_handle_width, 0.0, kHuge);
    layout.drag_handle_height = checked_float(root, "layout.drag_handle_height", layout.drag_handle_height, 0.0, kHuge);
    layout.show_drag_handle = lookup_bool(root, "layout.show_drag_handle", layout.show_drag_handle);

    auto& spring = config.spring;
    spring.mass = checked_number(root, "spring.mass", spring.mass, 1e-6, kHuge);
    spring.stiffness = checked_number(root, "spring.stiffness", spring.stiffness, 1e-6, kHuge);
    spring.damping_ratio = checked_number(root, "spring.damping_ratio", spring.damping_ratio, 0.0, kHuge);

    return config;
}

SheetConfig load_sheet_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        log::info("[SheetConfig] '" + path.string() + "' not found; using defaults.");
        return SheetConfig{};
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        log::warn("[SheetConfig] could not open '" + path.string() + "'; using defaults.");
        return SheetConfig{};
    }
    nlohmann::json root = nlohmann::json::parse(in, nullptr, false);
    if (root.is_discarded()) {
        log::warn("[SheetConfig] '" + path.string() + "' is not valid JSON; using defaults.");
        return SheetConfig{};
    }
    log::info("[SheetConfig] loaded '" + path.string() + "'.");
    return sheet_config_from_json(root);
}

nlohmann::json sheet_config_to_json(const SheetConfig& config) {
    nlohmann::json root = nlohmann::json::object();
    root["animation"] = {
        {"enter_duration", config.animation.enter_duration},
        {"exit_duration", config.animation.exit_duration},
        {"settle_curve", config.animation.settle_curve},
    };
    root["gesture"] = {
        {"fling_velocity", config.gesture.fling_velocity},
        {"close_threshold", config.gesture.close_threshold},
        {"touch_slop", config.gesture.touch_slop},
        {"min_fling_velocity", config.gesture.min_fling_velocity},
        {"max_fling_velocity", config.gesture.max_fling_velocity},
        {"enable_drag", config.gesture.enable_drag},
    };
    root["backdrop"] = {
        {"dead_zone", config.backdrop.dead_zone},
        {"max_opacity", config.backdrop.max_opacity},
    };
    root["layout"] = {
        {"max_width", config.layout.max_width},
        {"min_content_height", config.layout.min_content_height},
        {"drag_handle_width", config.layout.drag_handle_width},
        {"drag_handle_height", config.layout.drag_handle_height},
        {"show_drag_handle", config.layout.show_drag_handle},
    };
    root["spring"] = {
        {"mass", config.spring.mass},
        {"stiffness", config.spring.stiffness},
        {"damping_ratio", config.spring.damping_ratio},
    };
    return root;
}

DragPolicy drag_policy(const SheetConfig& config) {
    DragPolicy policy;
    policy.fling_velocity_threshold = config.gesture.fling_velocity;
    policy.close_progress_threshold = config.gesture.close_threshold;
    return policy;
}

DragRecognizerSettings drag_recognizer_settings(const SheetConfig& config) {
    DragRecognizerSettings settings;
    settings.touch_slop = config.gesture.touch_slop;
    settings.min_fling_velocity = config.gesture.min_fling_velocity;
    settings.max_fling_velocity = config.gesture.max_fling_velocity;
    return settings;
}

BackdropRamp backdrop_ramp(const SheetConfig& config) {
    return BackdropRamp{config.backdrop.dead_zone, config.backdrop.max_opacity};
}

FlingSettings fling_settings(const SheetConfig& config) {
    FlingSettings settings;
    settings.spring = SpringDescription::with_damping_ratio(config.spring.mass, config.spring.stiffness,
                                                           config.spring.damping_ratio);
    return settings;
}

CurvePtr settle_curve(const SheetConfig& config) {
    CurvePtr curve = curves::by_name(config.animation.settle_curve);
    return curve ? curve : curves::ease_in_out_cubic_emphasized();
}

}
