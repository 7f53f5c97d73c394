#include "doctest/doctest.h"

#include <vector>

#include "gesture/drag_recognizer.hpp"

using namespace sheet;

namespace {

SDL_Event mouse_button(Uint32 type, int x, int y, Uint32 timestamp, Uint32 which = 0) {
    SDL_Event e{};
    e.type = type;
    e.button.which = which;
    e.button.button = SDL_BUTTON_LEFT;
    e.button.x = x;
    e.button.y = y;
    e.button.timestamp = timestamp;
    return e;
}

SDL_Event mouse_motion(int x, int y, Uint32 timestamp) {
    SDL_Event e{};
    e.type = SDL_MOUSEMOTION;
    e.motion.which = 0;
    e.motion.x = x;
    e.motion.y = y;
    e.motion.timestamp = timestamp;
    return e;
}

SDL_Event finger(Uint32 type, float x, float y, Uint32 timestamp) {
    SDL_Event e{};
    e.type = type;
    e.tfinger.fingerId = 1;
    e.tfinger.x = x;
    e.tfinger.y = y;
    e.tfinger.timestamp = timestamp;
    return e;
}

struct Recorder {
    int starts = 0;
    std::vector<float> deltas;
    std::vector<float> end_velocities;
    int taps = 0;
    std::vector<bool> hovers;

    void attach(VerticalDragRecognizer& r) {
        r.set_on_start([this](const DragStartDetails&) { ++starts; });
        r.set_on_update([this](const DragUpdateDetails& d) { deltas.push_back(d.primary_delta); });
        r.set_on_end([this](const DragEndDetails& d) { end_velocities.push_back(d.velocity_y); });
        r.set_on_tap([this]() { ++taps; });
        r.set_on_hover([this](bool h) { hovers.push_back(h); });
    }
};

VerticalDragRecognizer make_recognizer(Recorder& rec) {
    VerticalDragRecognizer r;
    r.set_hit_rect(SDL_FRect{0.0f, 100.0f, 400.0f, 200.0f});
    rec.attach(r);
    return r;
}

}

TEST_CASE("Movement inside the slop does not start a drag") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    CHECK(r.handle_event(mouse_button(SDL_MOUSEBUTTONDOWN, 200, 200, 1000)));
    CHECK(r.is_tracking());
    r.handle_event(mouse_motion(200, 210, 1010));
    CHECK_FALSE(r.is_dragging());
    CHECK(rec.starts == 0);
    CHECK(rec.deltas.empty());
}

TEST_CASE("Crossing the slop starts the drag and reports the excess") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    r.handle_event(mouse_button(SDL_MOUSEBUTTONDOWN, 200, 200, 1000));
    r.handle_event(mouse_motion(200, 210, 1010));
    r.handle_event(mouse_motion(200, 230, 1020));
    CHECK(r.is_dragging());
    CHECK(rec.starts == 1);
    REQUIRE(rec.deltas.size() == 1);
    CHECK(rec.deltas[0] == doctest::Approx(12.0f));

    r.handle_event(mouse_motion(200, 225, 1030));
    REQUIRE(rec.deltas.size() == 2);
    CHECK(rec.deltas[1] == doctest::Approx(-5.0f));
}

TEST_CASE("Release velocity is fitted over the recent samples") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    r.handle_event(mouse_button(SDL_MOUSEBUTTONDOWN, 200, 100, 1000));
    for (int i = 1; i <= 10; ++i) {
        r.handle_event(mouse_motion(200, 100 + i * 10, 1000 + static_cast<Uint32>(i) * 10));
    }
    r.handle_event(mouse_button(SDL_MOUSEBUTTONUP, 200, 200, 1100));
    REQUIRE(rec.end_velocities.size() == 1);
    CHECK(rec.end_velocities[0] == doctest::Approx(1000.0f).epsilon(0.01));
    CHECK_FALSE(r.is_tracking());
}

TEST_CASE("A pointer that stopped before release has no velocity") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    r.handle_event(mouse_button(SDL_MOUSEBUTTONDOWN, 200, 100, 1000));
    for (int i = 1; i <= 10; ++i) {
        r.handle_event(mouse_motion(200, 100 + i * 10, 1000 + static_cast<Uint32>(i) * 10));
    }
    r.handle_event(mouse_button(SDL_MOUSEBUTTONUP, 200, 200, 1200));
    REQUIRE(rec.end_velocities.size() == 1);
    CHECK(rec.end_velocities[0] == 0.0f);
}

TEST_CASE("Slow releases fall below the minimum fling velocity") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    r.handle_event(mouse_button(SDL_MOUSEBUTTONDOWN, 200, 100, 1000));
    r.handle_event(mouse_motion(200, 130, 1010));
    for (int i = 1; i <= 6; ++i) {
        r.handle_event(mouse_motion(200, 130 + i, 1010 + static_cast<Uint32>(i) * 30));
    }
    r.handle_event(mouse_button(SDL_MOUSEBUTTONUP, 200, 136, 1190));
    REQUIRE(rec.end_velocities.size() == 1);
    CHECK(rec.end_velocities[0] == 0.0f);
}

TEST_CASE("Release velocity is clamped to the maximum") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    r.set_hit_rect(SDL_FRect{0.0f, 0.0f, 400.0f, 2000.0f});
    r.handle_event(mouse_button(SDL_MOUSEBUTTONDOWN, 200, 0, 1000));
    for (int i = 1; i <= 5; ++i) {
        r.handle_event(mouse_motion(200, i * 100, 1000 + static_cast<Uint32>(i) * 10));
    }
    r.handle_event(mouse_button(SDL_MOUSEBUTTONUP, 200, 500, 1050));
    REQUIRE(rec.end_velocities.size() == 1);
    CHECK(rec.end_velocities[0] == doctest::Approx(8000.0f));
}

TEST_CASE("Press and release without travel is a tap") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    r.handle_event(mouse_button(SDL_MOUSEBUTTONDOWN, 50, 150, 1000));
    CHECK(r.handle_event(mouse_button(SDL_MOUSEBUTTONUP, 50, 150, 1050)));
    CHECK(rec.taps == 1);
    CHECK(rec.starts == 0);
    CHECK(rec.end_velocities.empty());
}

TEST_CASE("Presses outside the hit rectangle are not consumed") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    CHECK_FALSE(r.handle_event(mouse_button(SDL_MOUSEBUTTONDOWN, 200, 50, 1000)));
    CHECK_FALSE(r.is_tracking());

    SDL_Event right = mouse_button(SDL_MOUSEBUTTONDOWN, 200, 200, 1000);
    right.button.button = SDL_BUTTON_RIGHT;
    CHECK_FALSE(r.handle_event(right));
}

TEST_CASE("Synthetic mouse events from touches are ignored") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    CHECK_FALSE(r.handle_event(mouse_button(SDL_MOUSEBUTTONDOWN, 200, 200, 1000, SDL_TOUCH_MOUSEID)));
    CHECK_FALSE(r.is_tracking());
}

TEST_CASE("Finger coordinates are scaled to the touch surface") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    r.set_touch_surface_size(400, 1000);
    CHECK(r.handle_event(finger(SDL_FINGERDOWN, 0.5f, 0.15f, 1000)));
    r.handle_event(finger(SDL_FINGERMOTION, 0.5f, 0.19f, 1010));
    CHECK(rec.starts == 1);
    REQUIRE(rec.deltas.size() == 1);
    CHECK(rec.deltas[0] == doctest::Approx(22.0f).epsilon(0.01));
    r.handle_event(finger(SDL_FINGERUP, 0.5f, 0.19f, 1100));
    CHECK(rec.end_velocities.size() == 1);
}

TEST_CASE("Cancel ends an active drag with zero velocity") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    r.handle_event(mouse_button(SDL_MOUSEBUTTONDOWN, 200, 200, 1000));
    r.handle_event(mouse_motion(200, 260, 1010));
    REQUIRE(r.is_dragging());
    r.cancel();
    CHECK_FALSE(r.is_tracking());
    REQUIRE(rec.end_velocities.size() == 1);
    CHECK(rec.end_velocities[0] == 0.0f);

    r.cancel();
    CHECK(rec.end_velocities.size() == 1);
}

TEST_CASE("Losing window focus cancels the drag") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    r.handle_event(mouse_button(SDL_MOUSEBUTTONDOWN, 200, 200, 1000));
    r.handle_event(mouse_motion(200, 260, 1010));

    SDL_Event focus{};
    focus.type = SDL_WINDOWEVENT;
    focus.window.event = SDL_WINDOWEVENT_FOCUS_LOST;
    CHECK_FALSE(r.handle_event(focus));
    CHECK_FALSE(r.is_dragging());
    CHECK(rec.end_velocities.size() == 1);
    CHECK_FALSE(r.is_hovered());
}

TEST_CASE("Hover follows the pointer across the hit rectangle") {
    Recorder rec;
    VerticalDragRecognizer r = make_recognizer(rec);
    r.handle_event(mouse_motion(10, 10, 1000));
    r.handle_event(mouse_motion(10, 150, 1010));
    r.handle_event(mouse_motion(20, 160, 1020));
    r.handle_event(mouse_motion(10, 400, 1030));
    REQUIRE(rec.hovers.size() == 2);
    CHECK(rec.hovers[0]);
    CHECK_FALSE(rec.hovers[1]);
}
