#include "animation_driver.hpp"

#include <algorithm>
#include <cmath>

#include "utils/log.hpp"

namespace sheet {

namespace {

constexpr double kLowerBound = 0.0;
constexpr double kUpperBound = 1.0;

}

const char* animation_status_to_string(AnimationStatus status) {
    switch (status) {
        case AnimationStatus::Dismissed: return "dismissed";
        case AnimationStatus::Forward:   return "forward";
        case AnimationStatus::Reverse:   return "reverse";
        case AnimationStatus::Completed: return "completed";
    }
    return "unknown";
}

AnimationDriver::AnimationDriver(double duration,
                                 std::optional<double> reverse_duration,
                                 FrameScheduler* scheduler,
                                 std::string debug_label)
    : duration_(duration),
      reverse_duration_(reverse_duration),
      scheduler_(scheduler),
      debug_label_(std::move(debug_label)) {
    if (scheduler_) {
        scheduler_->add_ticker(this);
    }
}

AnimationDriver::~AnimationDriver() {
    if (scheduler_) {
        scheduler_->remove_ticker(this);
    }
}

void AnimationDriver::set_value(double value) {
    stop();
    if (value == value_) {
        return;
    }
    internal_set_value(value);
    notify_listeners();
    check_status_changed();
}

void AnimationDriver::internal_set_value(double value) {
    value_ = value;
    if (value_ <= kLowerBound) {
        status_ = AnimationStatus::Dismissed;
    } else if (value_ >= kUpperBound) {
        status_ = AnimationStatus::Completed;
    } else {
        status_ = direction_ == Direction::Forward ? AnimationStatus::Forward : AnimationStatus::Reverse;
    }
}

void AnimationDriver::forward() {
    direction_ = Direction::Forward;
    animate_to_internal(kUpperBound, std::nullopt);
}

void AnimationDriver::reverse() {
    direction_ = Direction::Reverse;
    animate_to_internal(kLowerBound, std::nullopt);
}

void AnimationDriver::animate_to(double target, std::optional<double> duration) {
    direction_ = Direction::Forward;
    animate_to_internal(target, duration);
}

void AnimationDriver::animate_back(double target, std::optional<double> duration) {
    direction_ = Direction::Reverse;
    animate_to_internal(target, duration);
}

void AnimationDriver::toggle() {
    direction_ = is_forward_or_completed() ? Direction::Reverse : Direction::Forward;
    animate_to_internal(direction_ == Direction::Forward ? kUpperBound : kLowerBound, std::nullopt);
}

void AnimationDriver::animate_to_internal(double target, std::optional<double> duration) {
    double seconds = 0.0;
    if (!duration) {
        const double remaining_fraction = std::fabs(target - value_) / (kUpperBound - kLowerBound);
        const double direction_duration =
            (direction_ == Direction::Reverse && reverse_duration_) ? *reverse_duration_ : duration_;
        seconds = direction_duration * remaining_fraction;
    } else if (target != value_) {
        seconds = *duration;
    }

    stop();
    if (!(seconds > 0.0)) {
        if (value_ != target) {
            value_ = std::clamp(target, kLowerBound, kUpperBound);
            notify_listeners();
        }
        status_ = direction_ == Direction::Forward ? AnimationStatus::Completed : AnimationStatus::Dismissed;
        check_status_changed();
        return;
    }
    start_simulation(std::make_unique<InterpolationSimulation>(value_, target, seconds));
}

void AnimationDriver::fling(double velocity) {
    if (!std::isfinite(velocity)) {
        log::warn("[AnimationDriver] " + debug_label_ + ": ignoring non-finite fling velocity.");
        return;
    }
    direction_ = velocity < 0.0 ? Direction::Reverse : Direction::Forward;
    const double target = velocity < 0.0 ? kLowerBound - fling_.tolerance.distance
                                         : kUpperBound + fling_.tolerance.distance;
    auto simulation = std::make_unique<SpringSimulation>(fling_.spring, value_, target, velocity);
    simulation->set_tolerance(fling_.tolerance);
    log::debug("[AnimationDriver] " + debug_label_ + ": fling from " + std::to_string(value_) +
               " with velocity " + std::to_string(velocity));
    stop();
    start_simulation(std::move(simulation));
}

void AnimationDriver::stop() {
    simulation_.reset();
    elapsed_ = 0.0;
}

void AnimationDriver::start_simulation(std::unique_ptr<Simulation> simulation) {
    simulation_ = std::move(simulation);
    elapsed_ = 0.0;
    const double start = std::clamp(simulation_->x(0.0), kLowerBound, kUpperBound);
    const bool changed = start != value_;
    value_ = start;
    status_ = direction_ == Direction::Forward ? AnimationStatus::Forward : AnimationStatus::Reverse;
    if (changed) {
        notify_listeners();
    }
    check_status_changed();
}

bool AnimationDriver::tick(double dt) {
    if (!simulation_) {
        return false;
    }
    if (!std::isfinite(dt) || dt < 0.0) {
        return true;
    }
    elapsed_ += dt;
    const double next = std::clamp(simulation_->x(elapsed_), kLowerBound, kUpperBound);
    const bool changed = next != value_;
    value_ = next;
    if (simulation_->is_done(elapsed_)) {
        status_ = direction_ == Direction::Forward ? AnimationStatus::Completed : AnimationStatus::Dismissed;
        stop();
    }
    if (changed) {
        notify_listeners();
    }
    check_status_changed();
    return is_animating();
}

AnimationDriver::ListenerId AnimationDriver::add_listener(Listener listener) {
    const ListenerId id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void AnimationDriver::remove_listener(ListenerId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     listeners_.end());
}

AnimationDriver::ListenerId AnimationDriver::add_status_listener(StatusListener listener) {
    const ListenerId id = next_listener_id_++;
    status_listeners_.emplace_back(id, std::move(listener));
    return id;
}

void AnimationDriver::remove_status_listener(ListenerId id) {
    status_listeners_.erase(std::remove_if(status_listeners_.begin(), status_listeners_.end(),
                                           [id](const auto& entry) { return entry.first == id; }),
                            status_listeners_.end());
}

void AnimationDriver::notify_listeners() {
    if (scheduler_) {
        scheduler_->request_layout();
    }
    // Copy so a listener may unsubscribe itself.
    const auto snapshot = listeners_;
    for (const auto& entry : snapshot) {
        if (entry.second) {
            entry.second();
        }
    }
}

void AnimationDriver::check_status_changed() {
    if (status_ == last_reported_status_) {
        return;
    }
    last_reported_status_ = status_;
    const auto snapshot = status_listeners_;
    for (const auto& entry : snapshot) {
        if (entry.second) {
            entry.second(status_);
        }
    }
}

}
