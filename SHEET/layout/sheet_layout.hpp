#pragma once

#include <SDL.h>

#include <optional>

#include "box_constraints.hpp"
#include "layout_node.hpp"
#include "sheet_dimensions.hpp"

namespace sheet {

enum class SheetVariant {
    Standalone,     // no navigation bar; collapsed extent from the minimum-extent law
    WithNavigationBar
};

struct BackdropRamp {
    float dead_zone = 0.7f;
    float max_opacity = 0.32f;
};

// Backdrop opacity for eased progress `t`: zero up to the dead zone, then a
// linear ramp to `max_opacity` at t == 1.
float backdrop_opacity(float t, const BackdropRamp& ramp = {});

struct SheetLayoutResult {
    SheetVariant variant = SheetVariant::Standalone;
    Size available{};
    float animation_value = 0.0f;
    float eased_value = 0.0f;

    SDL_FRect base{0.0f, 0.0f, 0.0f, 0.0f};
    SDL_FRect backdrop{0.0f, 0.0f, 0.0f, 0.0f};
    SDL_FRect content{0.0f, 0.0f, 0.0f, 0.0f};
    SDL_FRect drag_handle{0.0f, 0.0f, 0.0f, 0.0f};
    SDL_FRect navigation_bar{0.0f, 0.0f, 0.0f, 0.0f};

    // Height the sheet covers above the bottom edge, handle included.
    float visible_extent = 0.0f;
    float navigation_bar_visible_height = 0.0f;
    float backdrop_opacity = 0.0f;
    float sheet_max_height = 0.0f;

    SheetDimensions dimensions{};
};

// Dependency-ordered layout of the sheet's parts. Each pass measures the
// navigation bar, then the drag handle, then the content, because every step
// consumes the heights measured before it. Nodes are not owned.
class SheetLayout {
public:
    void set_base(LayoutNode* node);
    void set_backdrop(LayoutNode* node);
    void set_content(LayoutNode* node);
    void set_drag_handle(LayoutNode* node);
    void set_navigation_bar(LayoutNode* node);

    LayoutNode* base() const { return base_; }
    LayoutNode* backdrop() const { return backdrop_; }
    LayoutNode* content() const { return content_; }
    LayoutNode* drag_handle() const { return drag_handle_; }
    LayoutNode* navigation_bar() const { return navigation_bar_; }

    // Caller constraints intersected with the available box each pass.
    void set_constraints(std::optional<BoxConstraints> constraints);
    const std::optional<BoxConstraints>& constraints() const { return constraints_; }
    void set_min_content_height(float height);
    float min_content_height() const { return min_content_height_; }
    void set_backdrop_ramp(const BackdropRamp& ramp);
    void set_dimensions_sink(BottomSheetDimensions* sink) { dimensions_sink_ = sink; }

    void mark_needs_layout() { needs_layout_ = true; }
    bool should_relayout(const Size& available, float animation_value, float eased_value) const;

    // Runs the pass unconditionally and positions every node.
    const SheetLayoutResult& perform_layout(const Size& available, float animation_value, float eased_value);
    // Runs the pass only when should_relayout() says so.
    const SheetLayoutResult& layout_if_needed(const Size& available, float animation_value, float eased_value);

    const SheetLayoutResult& result() const { return result_; }
    // Travel distance of the last pass; what drag deltas are normalized by.
    float drag_extent() const { return result_.dimensions.drag_extent; }
    unsigned long long pass_count() const { return pass_count_; }

private:
    LayoutNode* base_ = nullptr;
    LayoutNode* backdrop_ = nullptr;
    LayoutNode* content_ = nullptr;
    LayoutNode* drag_handle_ = nullptr;
    LayoutNode* navigation_bar_ = nullptr;

    std::optional<BoxConstraints> constraints_{};
    float min_content_height_ = 0.0f;
    BackdropRamp ramp_{};
    BottomSheetDimensions* dimensions_sink_ = nullptr;

    bool needs_layout_ = true;
    SheetLayoutResult result_{};
    unsigned long long pass_count_ = 0;
};

}
