#include "drag_recognizer.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "utils/log.hpp"

namespace sheet {

namespace {

constexpr size_t kMaxSamples = 20;

SDL_FPoint to_fpoint(int x, int y) {
    return SDL_FPoint{static_cast<float>(x), static_cast<float>(y)};
}

// Slope of y over t by least squares. Returns nullopt for degenerate input.
std::optional<float> solve_least_squares_slope(const std::vector<float>& times, const std::vector<float>& positions) {
    const size_t n = times.size();
    if (n < 2 || positions.size() != n) {
        return std::nullopt;
    }
    double sum_t = 0.0;
    double sum_p = 0.0;
    double sum_tp = 0.0;
    double sum_tt = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum_t += times[i];
        sum_p += positions[i];
        sum_tp += static_cast<double>(times[i]) * positions[i];
        sum_tt += static_cast<double>(times[i]) * times[i];
    }
    const double denominator = sum_tt - sum_t * sum_t / static_cast<double>(n);
    if (std::fabs(denominator) < 1e-9) {
        return std::nullopt;
    }
    return static_cast<float>((sum_tp - sum_t * sum_p / static_cast<double>(n)) / denominator);
}

}

VerticalDragRecognizer::VerticalDragRecognizer(DragRecognizerSettings settings)
    : settings_(settings) {}

void VerticalDragRecognizer::set_touch_surface_size(int w, int h) {
    touch_w_ = std::max(0, w);
    touch_h_ = std::max(0, h);
}

bool VerticalDragRecognizer::contains(const SDL_FPoint& p) const {
    return hit_rect_.w > 0.0f && hit_rect_.h > 0.0f &&
           p.x >= hit_rect_.x && p.x < hit_rect_.x + hit_rect_.w &&
           p.y >= hit_rect_.y && p.y < hit_rect_.y + hit_rect_.h;
}

bool VerticalDragRecognizer::handle_event(const SDL_Event& e) {
    switch (e.type) {
    case SDL_MOUSEBUTTONDOWN:
        if (e.button.which == SDL_TOUCH_MOUSEID || e.button.button != SDL_BUTTON_LEFT) {
            return false;
        }
        return pointer_down(PointerKind::Mouse, 0, to_fpoint(e.button.x, e.button.y), e.button.timestamp);
    case SDL_MOUSEMOTION: {
        if (e.motion.which == SDL_TOUCH_MOUSEID) {
            return false;
        }
        const SDL_FPoint p = to_fpoint(e.motion.x, e.motion.y);
        update_hover(p);
        if (!tracking_ || kind_ != PointerKind::Mouse) {
            return false;
        }
        return pointer_move(p, e.motion.timestamp);
    }
    case SDL_MOUSEBUTTONUP:
        if (e.button.which == SDL_TOUCH_MOUSEID || e.button.button != SDL_BUTTON_LEFT) {
            return false;
        }
        if (!tracking_ || kind_ != PointerKind::Mouse) {
            return false;
        }
        return pointer_up(to_fpoint(e.button.x, e.button.y), e.button.timestamp);
    case SDL_FINGERDOWN: {
        if (tracking_) {
            return false;
        }
        const SDL_FPoint p{e.tfinger.x * static_cast<float>(touch_w_), e.tfinger.y * static_cast<float>(touch_h_)};
        return pointer_down(PointerKind::Finger, e.tfinger.fingerId, p, e.tfinger.timestamp);
    }
    case SDL_FINGERMOTION:
        if (!tracking_ || kind_ != PointerKind::Finger || e.tfinger.fingerId != finger_) {
            return false;
        }
        return pointer_move(SDL_FPoint{e.tfinger.x * static_cast<float>(touch_w_), e.tfinger.y * static_cast<float>(touch_h_)},
                            e.tfinger.timestamp);
    case SDL_FINGERUP:
        if (!tracking_ || kind_ != PointerKind::Finger || e.tfinger.fingerId != finger_) {
            return false;
        }
        return pointer_up(SDL_FPoint{e.tfinger.x * static_cast<float>(touch_w_), e.tfinger.y * static_cast<float>(touch_h_)},
                          e.tfinger.timestamp);
    case SDL_WINDOWEVENT:
        if (e.window.event == SDL_WINDOWEVENT_FOCUS_LOST || e.window.event == SDL_WINDOWEVENT_LEAVE) {
            cancel();
            if (hovered_) {
                hovered_ = false;
                if (on_hover_) on_hover_(false);
            }
        }
        return false;
    default:
        return false;
    }
}

bool VerticalDragRecognizer::pointer_down(PointerKind kind, SDL_FingerID finger, const SDL_FPoint& p, Uint32 timestamp) {
    if (tracking_ || !contains(p)) {
        return false;
    }
    tracking_ = true;
    dragging_ = false;
    kind_ = kind;
    finger_ = finger;
    down_position_ = p;
    last_position_ = p;
    pending_delta_ = 0.0f;
    samples_.clear();
    add_sample(timestamp, p.y);
    return true;
}

bool VerticalDragRecognizer::pointer_move(const SDL_FPoint& p, Uint32 timestamp) {
    const float dy = p.y - last_position_.y;
    last_position_ = p;
    add_sample(timestamp, p.y);

    if (!dragging_) {
        pending_delta_ += dy;
        if (std::fabs(pending_delta_) <= settings_.touch_slop) {
            return true;
        }
        dragging_ = true;
        if (on_start_) {
            on_start_(DragStartDetails{p, timestamp});
        }
        const float excess = pending_delta_ - std::copysign(settings_.touch_slop, pending_delta_);
        pending_delta_ = 0.0f;
        if (excess != 0.0f && on_update_) {
            on_update_(DragUpdateDetails{excess, p, timestamp});
        }
        return true;
    }

    if (dy != 0.0f && on_update_) {
        on_update_(DragUpdateDetails{dy, p, timestamp});
    }
    return true;
}

bool VerticalDragRecognizer::pointer_up(const SDL_FPoint& p, Uint32 timestamp) {
    if (p.y != last_position_.y) {
        pointer_move(p, timestamp);
    }
    const bool was_dragging = dragging_;
    const float velocity = was_dragging ? estimate_velocity(timestamp) : 0.0f;
    reset();

    if (was_dragging) {
        if (on_end_) {
            on_end_(DragEndDetails{velocity, p});
        }
    } else if (contains(p) && on_tap_) {
        on_tap_();
    }
    return true;
}

void VerticalDragRecognizer::cancel() {
    if (!tracking_) {
        return;
    }
    const bool was_dragging = dragging_;
    const SDL_FPoint last = last_position_;
    reset();
    if (was_dragging) {
        log::debug("[VerticalDragRecognizer] drag cancelled; ending with zero velocity.");
        if (on_end_) {
            on_end_(DragEndDetails{0.0f, last});
        }
    }
}

void VerticalDragRecognizer::update_hover(const SDL_FPoint& p) {
    const bool inside = contains(p);
    if (inside == hovered_) {
        return;
    }
    hovered_ = inside;
    if (on_hover_) {
        on_hover_(hovered_);
    }
}

void VerticalDragRecognizer::add_sample(Uint32 timestamp, float y) {
    samples_.push_back(Sample{timestamp, y});
    while (samples_.size() > kMaxSamples) {
        samples_.pop_front();
    }
}

float VerticalDragRecognizer::estimate_velocity(Uint32 release_timestamp) const {
    if (samples_.size() < 2) {
        return 0.0f;
    }
    const Sample& newest = samples_.back();
    if (release_timestamp - newest.timestamp > settings_.pointer_stopped_ms) {
        return 0.0f;
    }

    std::vector<float> times;
    std::vector<float> positions;
    for (auto it = samples_.rbegin(); it != samples_.rend(); ++it) {
        const Uint32 age = newest.timestamp - it->timestamp;
        if (age > settings_.velocity_horizon_ms) {
            break;
        }
        times.push_back(-static_cast<float>(age) / 1000.0f);
        positions.push_back(it->y);
    }

    const std::optional<float> slope = solve_least_squares_slope(times, positions);
    if (!slope || !std::isfinite(*slope)) {
        return 0.0f;
    }
    const float velocity = std::clamp(*slope, -settings_.max_fling_velocity, settings_.max_fling_velocity);
    if (std::fabs(velocity) < settings_.min_fling_velocity) {
        return 0.0f;
    }
    return velocity;
}

void VerticalDragRecognizer::reset() {
    tracking_ = false;
    dragging_ = false;
    pending_delta_ = 0.0f;
    samples_.clear();
}

}
