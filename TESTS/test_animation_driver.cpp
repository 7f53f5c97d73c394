#include "doctest/doctest.h"

#include <cmath>
#include <limits>
#include <vector>

#include "animation/animation_driver.hpp"
#include "animation/frame_scheduler.hpp"

using namespace sheet;

namespace {

// Ticks at 60 Hz until the driver stops or the frame budget runs out.
int run_to_rest(AnimationDriver& driver, int max_frames = 600) {
    int frames = 0;
    while (driver.is_animating() && frames < max_frames) {
        driver.tick(1.0 / 60.0);
        ++frames;
    }
    return frames;
}

}

TEST_CASE("Driver starts dismissed at zero") {
    AnimationDriver driver;
    CHECK(driver.value() == 0.0);
    CHECK(driver.status() == AnimationStatus::Dismissed);
    CHECK(driver.duration() == doctest::Approx(0.4));
    REQUIRE(driver.reverse_duration().has_value());
    CHECK(*driver.reverse_duration() == doctest::Approx(0.35));
}

TEST_CASE("Forward runs to completion over the enter duration") {
    AnimationDriver driver;
    std::vector<AnimationStatus> statuses;
    int changes = 0;
    driver.add_status_listener([&statuses](AnimationStatus s) { statuses.push_back(s); });
    driver.add_listener([&changes]() { ++changes; });

    driver.forward();
    CHECK(driver.status() == AnimationStatus::Forward);
    driver.tick(0.2);
    CHECK(driver.value() == doctest::Approx(0.5));
    driver.tick(0.2);
    CHECK(driver.value() == doctest::Approx(1.0));
    CHECK(driver.status() == AnimationStatus::Completed);
    CHECK_FALSE(driver.is_animating());

    REQUIRE(statuses.size() == 2);
    CHECK(statuses[0] == AnimationStatus::Forward);
    CHECK(statuses[1] == AnimationStatus::Completed);
    CHECK(changes == 2);
}

TEST_CASE("Reverse uses the exit duration") {
    AnimationDriver driver;
    driver.set_value(1.0);
    CHECK(driver.status() == AnimationStatus::Completed);

    driver.reverse();
    CHECK(driver.status() == AnimationStatus::Reverse);
    driver.tick(0.2);
    CHECK(driver.value() == doctest::Approx(1.0 - 0.2 / 0.35));
    driver.tick(0.2);
    CHECK(driver.value() == doctest::Approx(0.0));
    CHECK(driver.status() == AnimationStatus::Dismissed);
}

TEST_CASE("Remaining duration scales with the remaining distance") {
    AnimationDriver driver;
    driver.set_value(0.5);
    driver.forward();
    driver.tick(0.1);
    CHECK(driver.value() == doctest::Approx(0.75));
    driver.tick(0.1);
    CHECK(driver.status() == AnimationStatus::Completed);
}

TEST_CASE("animate_to with zero duration snaps forward") {
    AnimationDriver driver;
    int changes = 0;
    driver.add_listener([&changes]() { ++changes; });

    driver.animate_to(0.3, 0.0);
    CHECK(driver.value() == doctest::Approx(0.3));
    CHECK_FALSE(driver.is_animating());
    CHECK(driver.status() == AnimationStatus::Completed);
    CHECK(changes == 1);

    driver.animate_to(0.3, 0.0);
    CHECK(changes == 1);
}

TEST_CASE("animate_back runs in the reverse direction") {
    AnimationDriver driver;
    driver.set_value(0.8);
    driver.animate_back(0.2, 0.3);
    CHECK(driver.status() == AnimationStatus::Reverse);
    driver.tick(0.3);
    CHECK(driver.value() == doctest::Approx(0.2));
    CHECK(driver.status() == AnimationStatus::Dismissed);
}

TEST_CASE("Direct assignment derives status and skips equal values") {
    AnimationDriver driver;
    int changes = 0;
    driver.add_listener([&changes]() { ++changes; });

    driver.set_value(0.5);
    CHECK(driver.status() == AnimationStatus::Forward);
    driver.set_value(0.5);
    CHECK(changes == 1);

    driver.set_value(0.0);
    CHECK(driver.status() == AnimationStatus::Dismissed);
    driver.set_value(1.0);
    CHECK(driver.status() == AnimationStatus::Completed);

    driver.reverse();
    driver.set_value(0.4);
    CHECK(driver.status() == AnimationStatus::Reverse);
    CHECK_FALSE(driver.is_animating());
}

TEST_CASE("Fling toward open completes at one") {
    AnimationDriver driver;
    driver.set_value(0.5);
    driver.fling(1.0);
    CHECK(driver.status() == AnimationStatus::Forward);
    run_to_rest(driver);
    CHECK_FALSE(driver.is_animating());
    CHECK(driver.value() == 1.0);
    CHECK(driver.status() == AnimationStatus::Completed);
}

TEST_CASE("Fling toward closed ends dismissed at zero") {
    AnimationDriver driver;
    driver.set_value(0.6);
    driver.fling(-2.0);
    CHECK(driver.status() == AnimationStatus::Reverse);
    driver.tick(0.0001);
    CHECK(driver.value() == doctest::Approx(0.6 - 0.0002).epsilon(1e-5));
    run_to_rest(driver);
    CHECK(driver.value() == 0.0);
    CHECK(driver.status() == AnimationStatus::Dismissed);
}

TEST_CASE("Non-finite fling velocity is ignored") {
    AnimationDriver driver;
    driver.set_value(0.5);
    driver.fling(std::numeric_limits<double>::infinity());
    CHECK_FALSE(driver.is_animating());
    CHECK(driver.value() == doctest::Approx(0.5));
    CHECK(driver.status() == AnimationStatus::Forward);
}

TEST_CASE("Toggle flips the direction of travel") {
    AnimationDriver driver;
    driver.toggle();
    CHECK(driver.status() == AnimationStatus::Forward);
    driver.tick(0.1);
    driver.toggle();
    CHECK(driver.status() == AnimationStatus::Reverse);
    run_to_rest(driver);
    CHECK(driver.status() == AnimationStatus::Dismissed);

    driver.set_value(1.0);
    driver.toggle();
    CHECK(driver.status() == AnimationStatus::Reverse);
}

TEST_CASE("Stop keeps value and status") {
    AnimationDriver driver;
    driver.forward();
    driver.tick(0.1);
    const double held = driver.value();
    driver.stop();
    CHECK_FALSE(driver.is_animating());
    CHECK(driver.value() == held);
    CHECK(driver.status() == AnimationStatus::Forward);
    CHECK_FALSE(driver.tick(0.1));
    CHECK(driver.value() == held);
}

TEST_CASE("Invalid frame deltas are skipped") {
    AnimationDriver driver;
    driver.forward();
    CHECK(driver.tick(-1.0));
    CHECK(driver.tick(std::nan("")));
    CHECK(driver.value() == 0.0);
    CHECK(driver.is_animating());
}

TEST_CASE("Removed listeners stop hearing changes") {
    AnimationDriver driver;
    int a = 0;
    int b = 0;
    const auto id = driver.add_listener([&a]() { ++a; });
    driver.add_listener([&b]() { ++b; });
    driver.set_value(0.2);
    driver.remove_listener(id);
    driver.set_value(0.4);
    CHECK(a == 1);
    CHECK(b == 2);
}

TEST_CASE("Scheduler ticks registered drivers and reports layout requests") {
    FrameScheduler scheduler;
    CHECK_FALSE(scheduler.advance(0.016));
    {
        AnimationDriver driver(0.4, 0.35, &scheduler);
        CHECK_FALSE(scheduler.has_active_tickers());
        driver.forward();
        CHECK(scheduler.has_active_tickers());
        CHECK(scheduler.advance(0.1));
        CHECK(driver.value() == doctest::Approx(0.25));
        CHECK(scheduler.advance(0.1));
        CHECK(scheduler.frame_count() == 3);
    }
    CHECK_FALSE(scheduler.has_active_tickers());
    CHECK_FALSE(scheduler.advance(0.1));
}

namespace {

class SelfRemovingTicker : public FrameTicker {
public:
    explicit SelfRemovingTicker(FrameScheduler& scheduler) : scheduler_(scheduler) {}

    bool tick(double) override {
        ++ticks;
        scheduler_.remove_ticker(this);
        return false;
    }
    bool is_ticking() const override { return true; }

    int ticks = 0;

private:
    FrameScheduler& scheduler_;
};

}

TEST_CASE("Tickers may unregister while being ticked") {
    FrameScheduler scheduler;
    SelfRemovingTicker first(scheduler);
    SelfRemovingTicker second(scheduler);
    scheduler.add_ticker(&first);
    scheduler.add_ticker(&second);
    scheduler.advance(0.016);
    scheduler.advance(0.016);
    CHECK(first.ticks == 1);
    CHECK(second.ticks == 1);
}
