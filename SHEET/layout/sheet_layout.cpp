#include "sheet_layout.hpp"

#include <algorithm>
#include <cmath>

#include "utils/log.hpp"

namespace sheet {

namespace {

float non_negative(float v) {
    return (std::isfinite(v) && v > 0.0f) ? v : 0.0f;
}

}

float backdrop_opacity(float t, const BackdropRamp& ramp) {
    if (!std::isfinite(t) || t <= ramp.dead_zone) {
        return 0.0f;
    }
    if (ramp.dead_zone >= 1.0f) {
        return t >= 1.0f ? ramp.max_opacity : 0.0f;
    }
    const float progress = std::min(1.0f, (t - ramp.dead_zone) / (1.0f - ramp.dead_zone));
    return progress * ramp.max_opacity;
}

void SheetLayout::set_base(LayoutNode* node) { base_ = node; needs_layout_ = true; }
void SheetLayout::set_backdrop(LayoutNode* node) { backdrop_ = node; needs_layout_ = true; }
void SheetLayout::set_content(LayoutNode* node) { content_ = node; needs_layout_ = true; }
void SheetLayout::set_drag_handle(LayoutNode* node) { drag_handle_ = node; needs_layout_ = true; }
void SheetLayout::set_navigation_bar(LayoutNode* node) { navigation_bar_ = node; needs_layout_ = true; }

void SheetLayout::set_constraints(std::optional<BoxConstraints> constraints) {
    if (constraints_ == constraints) {
        return;
    }
    constraints_ = constraints;
    needs_layout_ = true;
}

void SheetLayout::set_min_content_height(float height) {
    const float clamped = non_negative(height);
    if (clamped == min_content_height_) {
        return;
    }
    min_content_height_ = clamped;
    needs_layout_ = true;
}

void SheetLayout::set_backdrop_ramp(const BackdropRamp& ramp) {
    if (ramp.dead_zone == ramp_.dead_zone && ramp.max_opacity == ramp_.max_opacity) {
        return;
    }
    ramp_ = ramp;
    needs_layout_ = true;
}

bool SheetLayout::should_relayout(const Size& available, float animation_value, float eased_value) const {
    return needs_layout_ ||
           result_.available != available ||
           result_.animation_value != animation_value ||
           result_.eased_value != eased_value;
}

const SheetLayoutResult& SheetLayout::layout_if_needed(const Size& available, float animation_value, float eased_value) {
    if (!should_relayout(available, animation_value, eased_value)) {
        return result_;
    }
    return perform_layout(available, animation_value, eased_value);
}

const SheetLayoutResult& SheetLayout::perform_layout(const Size& available, float animation_value, float eased_value) {
    const float width = non_negative(available.w);
    const float height = non_negative(available.h);
    const float eased = std::isfinite(eased_value) ? eased_value : 0.0f;

    SheetLayoutResult r;
    r.available = available;
    r.animation_value = animation_value;
    r.eased_value = eased_value;
    r.variant = navigation_bar_ ? SheetVariant::WithNavigationBar : SheetVariant::Standalone;
    r.dimensions.min_content_height = min_content_height_;

    // 1. Navigation bar: full width, any height up to the view. It slides out
    // as the sheet opens.
    float nav_height = 0.0f;
    if (navigation_bar_) {
        nav_height = non_negative(navigation_bar_->layout(BoxConstraints::tight(Size{width, height}).loosen_height()).h);
        r.navigation_bar_visible_height = nav_height * (1.0f - eased);
        navigation_bar_->set_position(0.0f, height - r.navigation_bar_visible_height);
        r.navigation_bar = navigation_bar_->bounds();
    }
    r.dimensions.navigation_bar_height = nav_height;

    // 2. Sheet constraints.
    BoxConstraints sheet_constraints = BoxConstraints::loose(Size{width, height});
    if (constraints_) {
        sheet_constraints = constraints_->enforce(sheet_constraints);
    }
    const float min_height_constraint = non_negative(sheet_constraints.min_h);
    r.sheet_max_height = non_negative(sheet_constraints.max_h);

    // 3. Drag handle, capped by what the visible navigation bar leaves.
    float handle_height = 0.0f;
    Size handle_size{};
    if (drag_handle_) {
        handle_size = drag_handle_->layout(sheet_constraints.with_height(
            0.0f, std::max(0.0f, sheet_constraints.max_h - r.navigation_bar_visible_height)));
        handle_height = non_negative(handle_size.h);
        sheet_constraints = sheet_constraints.deflate_top(handle_height);
    }
    r.dimensions.drag_handle_height = handle_height;

    // 4. Content with whatever budget remains.
    Size content_size{};
    if (content_) {
        content_size = content_->layout(sheet_constraints);
    }
    const float content_height = non_negative(content_size.h);
    r.dimensions.measured_content_height = content_height;

    // 5-6. Travel distance and the animated placement.
    float content_top = height;
    float content_visible_height = content_height;
    if (r.variant == SheetVariant::WithNavigationBar) {
        r.dimensions.drag_extent = std::max(0.0f, content_height - nav_height);
        r.dimensions.min_extent = handle_height + nav_height;
        content_top = height - nav_height - r.dimensions.drag_extent * eased;
        r.visible_extent = height - content_top + handle_height;
    } else {
        const float min_extent = std::max(min_height_constraint, handle_height + min_content_height_);
        r.dimensions.min_extent = min_extent;
        r.dimensions.drag_extent = std::max(0.0f, r.sheet_max_height - min_extent);
        r.visible_extent = min_extent + r.dimensions.drag_extent * eased;
        content_top = height - r.visible_extent + handle_height;
        content_visible_height = std::max(0.0f, r.visible_extent - handle_height);
    }

    if (content_) {
        content_->set_position((width - content_size.w) / 2.0f, content_top);
        r.content = SDL_FRect{(width - content_size.w) / 2.0f, content_top, content_size.w, content_visible_height};
    }

    // 7. Handle sits on the content's top edge.
    if (drag_handle_) {
        drag_handle_->set_position((width - handle_size.w) / 2.0f, content_top - handle_height);
        r.drag_handle = drag_handle_->bounds();
    }

    // 8. Backdrop.
    r.backdrop_opacity = backdrop_opacity(eased, ramp_);
    if (backdrop_) {
        backdrop_->layout(BoxConstraints::tight(Size{width, height}));
        backdrop_->set_position(0.0f, 0.0f);
        r.backdrop = backdrop_->bounds();
    }

    // Base child keeps the area the collapsed sheet does not cover.
    if (base_) {
        base_->layout(BoxConstraints::tight(Size{width, std::max(0.0f, height - r.dimensions.min_extent)}));
        base_->set_position(0.0f, 0.0f);
        r.base = base_->bounds();
    }

    result_ = r;
    needs_layout_ = false;
    ++pass_count_;

    if (dimensions_sink_) {
        dimensions_sink_->publish(result_.dimensions, result_.sheet_max_height);
    }
    if (log::enabled(log::Level::Debug)) {
        log::debug("[SheetLayout] pass " + std::to_string(pass_count_) + " t=" + std::to_string(animation_value) +
                   " eased=" + std::to_string(eased_value) + " " + describe(result_.dimensions));
    }
    return result_;
}

}
