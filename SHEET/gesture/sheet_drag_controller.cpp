#include "sheet_drag_controller.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>

#include "utils/log.hpp"

namespace sheet {

const char* drag_decision_to_string(DragDecision decision) {
    switch (decision) {
        case DragDecision::Ignored:      return "ignored";
        case DragDecision::Fling:        return "fling";
        case DragDecision::SettleClosed: return "settle_closed";
        case DragDecision::SettleOpen:   return "settle_open";
    }
    return "unknown";
}

SheetDragController::SheetDragController(AnimationDriver* driver,
                                         CurveTween* tween,
                                         CurvePtr settle_curve,
                                         DragExtentProvider drag_extent,
                                         DragPolicy policy)
    : driver_(driver),
      tween_(tween),
      settle_curve_(settle_curve ? std::move(settle_curve) : curves::ease_in_out_cubic_emphasized()),
      drag_extent_(std::move(drag_extent)),
      policy_(policy) {
    if (!driver_ || !tween_) {
        const std::string message = !driver_
            ? "SheetDragController requires an AnimationDriver."
            : "SheetDragController requires a CurveTween.";
        log::error("[SheetDragController] " + message);
        throw std::invalid_argument(message);
    }
}

void SheetDragController::set_settle_curve(CurvePtr curve) {
    settle_curve_ = curve ? std::move(curve) : curves::ease_in_out_cubic_emphasized();
}

void SheetDragController::handle_drag_start(const DragStartDetails& details) {
    state_ = GestureState::Dragging;
    set_handle_flag(kDragHandleDragged, true);
    if (on_drag_start_) {
        on_drag_start_(details);
    }
    tween_->set_curve(curves::linear(), static_cast<float>(driver_->value()));
}

void SheetDragController::handle_drag_update(const DragUpdateDetails& details) {
    if (dismiss_underway()) {
        return;
    }
    const float extent = drag_extent_ ? drag_extent_() : 0.0f;
    const double unit_delta = static_cast<double>(details.primary_delta) / static_cast<double>(extent);
    if (!std::isfinite(unit_delta)) {
        log::debug("[SheetDragController] drag update ignored: no drag extent.");
        return;
    }
    const double value = driver_->value();
    if ((value <= 0.0 && unit_delta > 0.0) || (value >= 1.0 && unit_delta < 0.0)) {
        return;
    }
    if (driver_->is_dismissed()) {
        // Dragging a dismissed sheet open would otherwise read as a dismissal.
        driver_->animate_to(value, 0.0);
    }
    driver_->set_value(std::clamp(value - unit_delta, 0.0, 1.0));
}

DragDecision SheetDragController::handle_drag_end(const DragEndDetails& details) {
    if (dismiss_underway()) {
        return DragDecision::Ignored;
    }
    state_ = GestureState::Idle;
    set_handle_flag(kDragHandleDragged, false);

    DragDecision decision = DragDecision::SettleOpen;
    bool is_closing = false;
    const double value = driver_->value();

    if (details.velocity_y > policy_.fling_velocity_threshold) {
        decision = DragDecision::Fling;
        const float extent = drag_extent_ ? drag_extent_() : 0.0f;
        const double fling_velocity = -static_cast<double>(details.velocity_y) / static_cast<double>(extent);
        if (!std::isfinite(fling_velocity)) {
            log::debug("[SheetDragController] fling skipped: no drag extent.");
            is_closing = true;
        } else {
            if (value > 0.0) {
                driver_->fling(fling_velocity);
            }
            is_closing = fling_velocity < 0.0;
        }
    } else if (value < policy_.close_progress_threshold) {
        decision = DragDecision::SettleClosed;
        if (value > 0.0) {
            driver_->fling(-1.0);
        }
        is_closing = true;
    } else {
        driver_->forward();
    }

    log::debug(std::string("[SheetDragController] drag end: ") + drag_decision_to_string(decision) +
               " at " + std::to_string(value) + " (velocity " + std::to_string(details.velocity_y) +
               (is_closing ? ", closing)" : ", opening)"));

    if (on_drag_end_) {
        on_drag_end_(details, is_closing);
    }

    const float anchor = static_cast<float>(driver_->value());
    tween_->set_curve(std::make_shared<SplitCurve>(anchor, settle_curve_), anchor);

    if (is_closing && on_closing_) {
        on_closing_();
    }
    return decision;
}

void SheetDragController::handle_hover(bool hovering) {
    set_handle_flag(kDragHandleHovered, hovering);
}

void SheetDragController::handle_activate() {
    driver_->toggle();
    if (dismiss_underway() && on_closing_) {
        on_closing_();
    }
}

void SheetDragController::set_handle_flag(unsigned flag, bool on) {
    const unsigned next = on ? (handle_state_ | flag) : (handle_state_ & ~flag);
    if (next == handle_state_) {
        return;
    }
    handle_state_ = next;
    if (handle_state_listener_) {
        handle_state_listener_(handle_state_);
    }
}

}
