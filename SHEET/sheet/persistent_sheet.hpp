#pragma once

#include <SDL.h>

#include <functional>
#include <memory>
#include <optional>

#include "animation/animation_driver.hpp"
#include "animation/easing_curve.hpp"
#include "gesture/drag_recognizer.hpp"
#include "gesture/sheet_drag_controller.hpp"
#include "layout/layout_node.hpp"
#include "layout/sheet_dimensions.hpp"
#include "layout/sheet_layout.hpp"
#include "sheet_theme.hpp"

namespace sheet {

struct SheetConfig;

struct PersistentSheetOptions {
    bool enable_drag = true;
    // Intersected with the available box and the style's max width.
    std::optional<BoxConstraints> constraints{};
    float min_content_height = 0.0f;
    DragPolicy policy{};
    DragRecognizerSettings recognizer{};
    BackdropRamp backdrop{};
    CurvePtr settle_curve{};
    // Replaces the default handle bar. Borrowed; it can style itself from
    // PersistentSheet::handle_state().
    LayoutNode* drag_handle = nullptr;
};

PersistentSheetOptions persistent_sheet_options(const SheetConfig& config);
SheetTheme sheet_theme(const SheetConfig& config);

// A bottom sheet layer: backdrop, content with a drag handle above it, and an
// optional navigation bar that slides away as the sheet opens. The sheet is
// laid out at the origin of the box it is given.
//
// The driver and every slot node are borrowed and must outlive the sheet.
// Without a driver the sheet rests fully open and cannot be dragged.
class PersistentSheet : public LayoutNode {
public:
    using ClosingHook = SheetDragController::ClosingHook;
    using DragStartHook = SheetDragController::DragStartHook;
    using DragEndHook = SheetDragController::DragEndHook;

    // Throws std::invalid_argument when `content` is null, or when drag or the
    // drag handle is enabled without a driver. The handle shows when the style
    // asks for it, or else when drag is enabled and the theme asks for it.
    PersistentSheet(AnimationDriver* driver,
                    LayoutNode* content,
                    PersistentSheetOptions options = {},
                    const ResolvedSheetStyle& style = {});
    ~PersistentSheet() override;

    PersistentSheet(const PersistentSheet&) = delete;
    PersistentSheet& operator=(const PersistentSheet&) = delete;

    void set_base(LayoutNode* node) { layout_.set_base(node); }
    void set_navigation_bar(LayoutNode* node) { layout_.set_navigation_bar(node); }
    void set_dimensions_sink(BottomSheetDimensions* sink) { layout_.set_dimensions_sink(sink); }
    void set_touch_surface_size(int w, int h);

    void set_on_closing(ClosingHook hook);
    void set_on_drag_start(DragStartHook hook);
    void set_on_drag_end(DragEndHook hook);
    // Runs whenever the sheet needs another layout pass.
    void set_on_needs_layout(std::function<void()> callback) { on_needs_layout_ = std::move(callback); }

    AnimationDriver* driver() const { return driver_; }
    SheetDragController* drag_controller() const { return controller_.get(); }
    const CurveTween& tween() const { return tween_; }
    const ResolvedSheetStyle& style() const { return style_; }
    SheetLayout& layout_engine() { return layout_; }
    const SheetLayoutResult& layout_result() const { return layout_.result(); }
    bool shows_drag_handle() const { return drag_handle_ != nullptr; }
    LayoutNode* drag_handle() const { return drag_handle_; }
    // Dragged and hovered flags of the handle; 0 without a driver.
    unsigned handle_state() const { return controller_ ? controller_->handle_state() : 0u; }

    float animation_value() const;
    float eased_value() const;

    void paint(SDL_Renderer* renderer) const override;
    bool handle_event(const SDL_Event& e) override;

protected:
    Size perform_layout(const BoxConstraints& constraints) override;

private:
    void request_layout();
    void paint_drag_handle(SDL_Renderer* renderer, const SDL_FRect& rect) const;
    bool backdrop_blocks(const SDL_Event& e) const;

    AnimationDriver* driver_;
    LayoutNode* content_;
    PersistentSheetOptions options_;
    ResolvedSheetStyle style_;

    CurveTween tween_;
    SheetLayout layout_{};
    std::unique_ptr<SheetDragController> controller_{};
    std::unique_ptr<BoxNode> backdrop_{};
    std::unique_ptr<CallbackNode> default_drag_handle_{};
    LayoutNode* drag_handle_ = nullptr;
    VerticalDragRecognizer handle_recognizer_;
    VerticalDragRecognizer content_recognizer_;

    AnimationDriver::ListenerId driver_listener_ = 0;
    std::function<void()> on_needs_layout_{};
};

}
