#pragma once

#include <SDL.h>

#include <deque>
#include <functional>
#include <optional>

#include "drag_details.hpp"

namespace sheet {

struct DragRecognizerSettings {
    float touch_slop = 18.0f;
    float min_fling_velocity = 50.0f;
    float max_fling_velocity = 8000.0f;
    Uint32 velocity_horizon_ms = 100;
    Uint32 pointer_stopped_ms = 40;
};

// Turns SDL mouse and finger events that start inside a hit rectangle into a
// vertical drag. Nothing is reported until the pointer travels past the slop.
class VerticalDragRecognizer {
public:
    using StartCallback = std::function<void(const DragStartDetails&)>;
    using UpdateCallback = std::function<void(const DragUpdateDetails&)>;
    using EndCallback = std::function<void(const DragEndDetails&)>;
    using HoverCallback = std::function<void(bool)>;
    using TapCallback = std::function<void()>;

    explicit VerticalDragRecognizer(DragRecognizerSettings settings = {});

    void set_on_start(StartCallback cb) { on_start_ = std::move(cb); }
    void set_on_update(UpdateCallback cb) { on_update_ = std::move(cb); }
    void set_on_end(EndCallback cb) { on_end_ = std::move(cb); }
    void set_on_hover(HoverCallback cb) { on_hover_ = std::move(cb); }
    void set_on_tap(TapCallback cb) { on_tap_ = std::move(cb); }

    void set_hit_rect(const SDL_FRect& rect) { hit_rect_ = rect; }
    const SDL_FRect& hit_rect() const { return hit_rect_; }
    // Finger coordinates arrive normalized; this maps them into pixels.
    void set_touch_surface_size(int w, int h);
    void set_settings(const DragRecognizerSettings& settings) { settings_ = settings; }
    const DragRecognizerSettings& settings() const { return settings_; }

    // Returns true when the event was consumed.
    bool handle_event(const SDL_Event& e);

    // Abandons the current pointer. A drag in progress ends with zero velocity.
    void cancel();

    bool is_tracking() const { return tracking_; }
    bool is_dragging() const { return dragging_; }
    bool is_hovered() const { return hovered_; }

private:
    struct Sample {
        Uint32 timestamp;
        float y;
    };

    enum class PointerKind {
        Mouse,
        Finger
    };

    bool contains(const SDL_FPoint& p) const;
    bool pointer_down(PointerKind kind, SDL_FingerID finger, const SDL_FPoint& p, Uint32 timestamp);
    bool pointer_move(const SDL_FPoint& p, Uint32 timestamp);
    bool pointer_up(const SDL_FPoint& p, Uint32 timestamp);
    void update_hover(const SDL_FPoint& p);
    void add_sample(Uint32 timestamp, float y);
    float estimate_velocity(Uint32 release_timestamp) const;
    void reset();

    DragRecognizerSettings settings_;
    SDL_FRect hit_rect_{0.0f, 0.0f, 0.0f, 0.0f};
    int touch_w_ = 0;
    int touch_h_ = 0;

    bool tracking_ = false;
    bool dragging_ = false;
    bool hovered_ = false;
    PointerKind kind_ = PointerKind::Mouse;
    SDL_FingerID finger_ = 0;
    SDL_FPoint down_position_{0.0f, 0.0f};
    SDL_FPoint last_position_{0.0f, 0.0f};
    float pending_delta_ = 0.0f;
    std::deque<Sample> samples_{};

    StartCallback on_start_{};
    UpdateCallback on_update_{};
    EndCallback on_end_{};
    HoverCallback on_hover_{};
    TapCallback on_tap_{};
};

}
