#include "persistent_sheet.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "config/sheet_config.hpp"
#include "utils/log.hpp"

namespace sheet {

namespace {

bool is_pointer_event(const SDL_Event& e) {
    switch (e.type) {
    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
    case SDL_MOUSEMOTION:
    case SDL_MOUSEWHEEL:
    case SDL_FINGERDOWN:
    case SDL_FINGERUP:
    case SDL_FINGERMOTION:
        return true;
    default:
        return false;
    }
}

SDL_FRect union_rect(const SDL_FRect& a, const SDL_FRect& b) {
    if (a.w <= 0.0f || a.h <= 0.0f) return b;
    if (b.w <= 0.0f || b.h <= 0.0f) return a;
    const float x0 = std::min(a.x, b.x);
    const float y0 = std::min(a.y, b.y);
    const float x1 = std::max(a.x + a.w, b.x + b.w);
    const float y1 = std::max(a.y + a.h, b.y + b.h);
    return SDL_FRect{x0, y0, x1 - x0, y1 - y0};
}

}

PersistentSheetOptions persistent_sheet_options(const SheetConfig& config) {
    PersistentSheetOptions options;
    options.enable_drag = config.gesture.enable_drag;
    options.min_content_height = config.layout.min_content_height;
    options.policy = drag_policy(config);
    options.recognizer = drag_recognizer_settings(config);
    options.backdrop = backdrop_ramp(config);
    options.settle_curve = settle_curve(config);
    return options;
}

SheetTheme sheet_theme(const SheetConfig& config) {
    SheetTheme theme;
    theme.max_width = config.layout.max_width;
    theme.drag_handle_size = Size{config.layout.drag_handle_width, config.layout.drag_handle_height};
    theme.show_drag_handle = config.layout.show_drag_handle;
    return theme;
}

PersistentSheet::PersistentSheet(AnimationDriver* driver,
                                 LayoutNode* content,
                                 PersistentSheetOptions options,
                                 const ResolvedSheetStyle& style)
    : LayoutNode("persistent_sheet"),
      driver_(driver),
      content_(content),
      options_(std::move(options)),
      style_(style),
      tween_(options_.settle_curve ? options_.settle_curve : curves::ease_in_out_cubic_emphasized()),
      handle_recognizer_(options_.recognizer),
      content_recognizer_(options_.recognizer) {
    if (!content_) {
        const std::string message = "PersistentSheet requires a content node.";
        log::error("[PersistentSheet] " + message);
        throw std::invalid_argument(message);
    }
    const bool show_handle = style_.drag_handle_visible(options_.enable_drag);
    if (!driver_ && (options_.enable_drag || show_handle)) {
        const std::string message =
            "PersistentSheet requires an AnimationDriver when drag or the drag handle is enabled.";
        log::error("[PersistentSheet] " + message);
        throw std::invalid_argument(message);
    }

    BoxConstraints constraints = options_.constraints.value_or(BoxConstraints{});
    constraints.max_w = std::min(constraints.max_w, style_.max_width);
    constraints.min_w = std::min(constraints.min_w, constraints.max_w);
    layout_.set_constraints(constraints);
    layout_.set_min_content_height(options_.min_content_height);
    layout_.set_backdrop_ramp(options_.backdrop);

    backdrop_ = std::make_unique<BoxNode>("backdrop", std::nullopt, 0.0f, style_.backdrop);
    backdrop_->set_opacity(0.0f);
    layout_.set_backdrop(backdrop_.get());
    layout_.set_content(content_);

    tween_.set_listener([this]() { request_layout(); });

    if (!driver_) {
        log::debug("[PersistentSheet] no driver; resting fully open.");
        return;
    }

    driver_listener_ = driver_->add_listener([this]() { request_layout(); });
    controller_ = std::make_unique<SheetDragController>(
        driver_, &tween_, tween_.curve(), [this]() { return layout_.drag_extent(); }, options_.policy);

    if (show_handle) {
        if (options_.drag_handle) {
            drag_handle_ = options_.drag_handle;
        } else {
            const Size box = style_.drag_handle_box();
            default_drag_handle_ = std::make_unique<CallbackNode>(
                "drag_handle",
                [box](const BoxConstraints& c) {
                    return Size{c.has_bounded_width() ? c.max_w : box.w, box.h};
                },
                [this](SDL_Renderer* renderer, const SDL_FRect& rect) { paint_drag_handle(renderer, rect); });
            drag_handle_ = default_drag_handle_.get();
        }
        layout_.set_drag_handle(drag_handle_);

        handle_recognizer_.set_on_start([this](const DragStartDetails& d) { controller_->handle_drag_start(d); });
        handle_recognizer_.set_on_update([this](const DragUpdateDetails& d) { controller_->handle_drag_update(d); });
        handle_recognizer_.set_on_end([this](const DragEndDetails& d) { controller_->handle_drag_end(d); });
        handle_recognizer_.set_on_hover([this](bool hovering) { controller_->handle_hover(hovering); });
        handle_recognizer_.set_on_tap([this]() { controller_->handle_activate(); });
    }

    if (options_.enable_drag) {
        content_recognizer_.set_on_start([this](const DragStartDetails& d) { controller_->handle_drag_start(d); });
        content_recognizer_.set_on_update([this](const DragUpdateDetails& d) { controller_->handle_drag_update(d); });
        content_recognizer_.set_on_end([this](const DragEndDetails& d) { controller_->handle_drag_end(d); });
    }
}

PersistentSheet::~PersistentSheet() {
    if (driver_) {
        driver_->remove_listener(driver_listener_);
    }
}

void PersistentSheet::set_touch_surface_size(int w, int h) {
    handle_recognizer_.set_touch_surface_size(w, h);
    content_recognizer_.set_touch_surface_size(w, h);
}

void PersistentSheet::set_on_closing(ClosingHook hook) {
    if (controller_) controller_->set_on_closing(std::move(hook));
}

void PersistentSheet::set_on_drag_start(DragStartHook hook) {
    if (controller_) controller_->set_on_drag_start(std::move(hook));
}

void PersistentSheet::set_on_drag_end(DragEndHook hook) {
    if (controller_) controller_->set_on_drag_end(std::move(hook));
}

float PersistentSheet::animation_value() const {
    return driver_ ? static_cast<float>(driver_->value()) : 1.0f;
}

float PersistentSheet::eased_value() const {
    return tween_.evaluate(animation_value());
}

void PersistentSheet::request_layout() {
    layout_.mark_needs_layout();
    if (on_needs_layout_) {
        on_needs_layout_();
    }
}

Size PersistentSheet::perform_layout(const BoxConstraints& constraints) {
    Size available = constraints.biggest();
    if (!std::isfinite(available.w)) available.w = constraints.min_w;
    if (!std::isfinite(available.h)) available.h = constraints.min_h;

    const SheetLayoutResult& r = layout_.layout_if_needed(available, animation_value(), eased_value());
    backdrop_->set_opacity(r.backdrop_opacity);
    handle_recognizer_.set_hit_rect(r.drag_handle);
    content_recognizer_.set_hit_rect(r.content);
    return available;
}

void PersistentSheet::paint(SDL_Renderer* renderer) const {
    const SheetLayoutResult& r = layout_.result();
    if (LayoutNode* base = layout_.base()) {
        base->paint(renderer);
    }
    if (r.backdrop_opacity > 0.0f) {
        backdrop_->paint(renderer);
    }
    fill_rect(renderer, union_rect(r.drag_handle, r.content), style_.background);
    content_->paint(renderer);
    if (drag_handle_) {
        drag_handle_->paint(renderer);
    }
    if (LayoutNode* nav = layout_.navigation_bar()) {
        nav->paint(renderer);
    }
}

void PersistentSheet::paint_drag_handle(SDL_Renderer* renderer, const SDL_FRect& rect) const {
    const Size bar = style_.drag_handle_size;
    const SDL_FRect bar_rect{rect.x + (rect.w - bar.w) / 2.0f, rect.y + (rect.h - bar.h) / 2.0f, bar.w, bar.h};
    const bool active = handle_state() != 0;
    fill_rect(renderer, bar_rect, active ? style_.drag_handle_active : style_.drag_handle);
}

bool PersistentSheet::backdrop_blocks(const SDL_Event& e) const {
    return layout_.result().backdrop_opacity > 0.0f && is_pointer_event(e);
}

bool PersistentSheet::handle_event(const SDL_Event& e) {
    if (LayoutNode* nav = layout_.navigation_bar()) {
        if (nav->handle_event(e)) return true;
    }
    if (drag_handle_ && (drag_handle_->handle_event(e) || handle_recognizer_.handle_event(e))) {
        return true;
    }
    if (content_->handle_event(e)) {
        return true;
    }
    if (controller_ && options_.enable_drag && content_recognizer_.handle_event(e)) {
        return true;
    }
    if (backdrop_blocks(e)) {
        return true;
    }
    if (LayoutNode* base = layout_.base()) {
        return base->handle_event(e);
    }
    return false;
}

}
