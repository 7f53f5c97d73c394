#pragma once

#include <functional>

#include "animation/animation_driver.hpp"
#include "animation/easing_curve.hpp"
#include "drag_details.hpp"

namespace sheet {

enum class GestureState {
    Idle,
    Dragging
};

// Interaction flags of the drag handle, combined as a bit set.
enum DragHandleStateFlag : unsigned {
    kDragHandleDragged = 1u << 0,
    kDragHandleHovered = 1u << 1,
};

enum class DragDecision {
    Ignored,        // dismiss already underway
    Fling,          // released fast enough downward
    SettleClosed,   // released below the close threshold
    SettleOpen      // released at or past the close threshold
};

const char* drag_decision_to_string(DragDecision decision);

struct DragPolicy {
    float fling_velocity_threshold = 700.0f;
    float close_progress_threshold = 0.5f;
};

// Converts drag gestures on the sheet into AnimationDriver commands and owns
// the open/close decision made when a drag is released.
class SheetDragController {
public:
    using DragStartHook = std::function<void(const DragStartDetails&)>;
    using DragEndHook = std::function<void(const DragEndDetails&, bool is_closing)>;
    using ClosingHook = std::function<void()>;
    using DragExtentProvider = std::function<float()>;
    using HandleStateListener = std::function<void(unsigned)>;

    // Throws std::invalid_argument when `driver` or `tween` is null.
    SheetDragController(AnimationDriver* driver,
                        CurveTween* tween,
                        CurvePtr settle_curve,
                        DragExtentProvider drag_extent,
                        DragPolicy policy = {});

    void set_on_drag_start(DragStartHook hook) { on_drag_start_ = std::move(hook); }
    void set_on_drag_end(DragEndHook hook) { on_drag_end_ = std::move(hook); }
    // May fire several times for one logical close; listeners must be idempotent.
    void set_on_closing(ClosingHook hook) { on_closing_ = std::move(hook); }
    void set_handle_state_listener(HandleStateListener listener) { handle_state_listener_ = std::move(listener); }

    void set_policy(const DragPolicy& policy) { policy_ = policy; }
    const DragPolicy& policy() const { return policy_; }
    void set_settle_curve(CurvePtr curve);
    const CurvePtr& settle_curve() const { return settle_curve_; }

    void handle_drag_start(const DragStartDetails& details);
    void handle_drag_update(const DragUpdateDetails& details);
    DragDecision handle_drag_end(const DragEndDetails& details);
    void handle_hover(bool hovering);
    // Click or key activation of the drag handle.
    void handle_activate();

    bool dismiss_underway() const { return driver_->status() == AnimationStatus::Reverse; }
    GestureState state() const { return state_; }
    unsigned handle_state() const { return handle_state_; }

private:
    void set_handle_flag(unsigned flag, bool on);

    AnimationDriver* driver_;
    CurveTween* tween_;
    CurvePtr settle_curve_;
    DragExtentProvider drag_extent_;
    DragPolicy policy_;

    GestureState state_ = GestureState::Idle;
    unsigned handle_state_ = 0;

    DragStartHook on_drag_start_{};
    DragEndHook on_drag_end_{};
    ClosingHook on_closing_{};
    HandleStateListener handle_state_listener_{};
};

}
