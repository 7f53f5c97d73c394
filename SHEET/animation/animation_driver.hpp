#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "frame_scheduler.hpp"
#include "simulation.hpp"

namespace sheet {

enum class AnimationStatus {
    Dismissed = 0,  // stopped at 0
    Forward,
    Reverse,
    Completed       // stopped at the end of a forward run
};

const char* animation_status_to_string(AnimationStatus status);

struct FlingSettings {
    SpringDescription spring = SpringDescription::with_damping_ratio(1.0, 500.0, 1.0);
    Tolerance tolerance{0.01, 1e9};
};

// Time-driven scalar in [0,1] behind the sheet's open/close motion. Commands
// supersede each other; the most recent one always wins.
class AnimationDriver : public FrameTicker {
public:
    using Listener = std::function<void()>;
    using StatusListener = std::function<void(AnimationStatus)>;
    using ListenerId = int;

    static constexpr double kDefaultDuration = 0.4;
    static constexpr double kDefaultReverseDuration = 0.35;

    explicit AnimationDriver(double duration = kDefaultDuration,
                             std::optional<double> reverse_duration = kDefaultReverseDuration,
                             FrameScheduler* scheduler = nullptr,
                             std::string debug_label = "AnimationDriver");
    ~AnimationDriver() override;

    AnimationDriver(const AnimationDriver&) = delete;
    AnimationDriver& operator=(const AnimationDriver&) = delete;

    double value() const { return value_; }
    // Stops any running animation. Callers clamp; the driver does not.
    void set_value(double value);

    AnimationStatus status() const { return status_; }
    bool is_dismissed() const { return status_ == AnimationStatus::Dismissed; }
    bool is_completed() const { return status_ == AnimationStatus::Completed; }
    bool is_forward_or_completed() const {
        return status_ == AnimationStatus::Forward || status_ == AnimationStatus::Completed;
    }
    bool is_animating() const { return static_cast<bool>(simulation_); }

    double duration() const { return duration_; }
    void set_duration(double seconds) { duration_ = seconds; }
    std::optional<double> reverse_duration() const { return reverse_duration_; }
    void set_reverse_duration(std::optional<double> seconds) { reverse_duration_ = seconds; }

    const FlingSettings& fling_settings() const { return fling_; }
    void set_fling_settings(const FlingSettings& settings) { fling_ = settings; }

    void forward();
    void reverse();
    // A zero duration snaps to `target` and leaves the driver in the forward direction.
    void animate_to(double target, std::optional<double> duration = std::nullopt);
    void animate_back(double target, std::optional<double> duration = std::nullopt);
    void fling(double velocity = 1.0);
    void toggle();
    void stop();

    bool tick(double dt) override;
    bool is_ticking() const override { return is_animating(); }

    ListenerId add_listener(Listener listener);
    void remove_listener(ListenerId id);
    ListenerId add_status_listener(StatusListener listener);
    void remove_status_listener(ListenerId id);

    const std::string& debug_label() const { return debug_label_; }

private:
    enum class Direction {
        Forward,
        Reverse
    };

    void animate_to_internal(double target, std::optional<double> duration);
    void start_simulation(std::unique_ptr<Simulation> simulation);
    void internal_set_value(double value);
    void notify_listeners();
    void check_status_changed();

    double value_ = 0.0;
    AnimationStatus status_ = AnimationStatus::Dismissed;
    AnimationStatus last_reported_status_ = AnimationStatus::Dismissed;
    Direction direction_ = Direction::Forward;

    double duration_;
    std::optional<double> reverse_duration_;
    FlingSettings fling_{};

    std::unique_ptr<Simulation> simulation_{};
    double elapsed_ = 0.0;

    FrameScheduler* scheduler_ = nullptr;
    std::string debug_label_;

    ListenerId next_listener_id_ = 1;
    std::vector<std::pair<ListenerId, Listener>> listeners_{};
    std::vector<std::pair<ListenerId, StatusListener>> status_listeners_{};
};

}
