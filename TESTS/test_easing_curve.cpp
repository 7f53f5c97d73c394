#include "doctest/doctest.h"

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "animation/easing_curve.hpp"

using namespace sheet;

TEST_CASE("Every named curve maps 0 to 0 and 1 to 1") {
    const std::vector<std::string> names = {
        "linear", "ease", "ease_in", "ease_out", "ease_in_out", "fast_out_slow_in", "ease_in_out_cubic_emphasized",
    };
    for (const auto& name : names) {
        CAPTURE(name);
        CurvePtr curve = curves::by_name(name);
        REQUIRE(curve);
        CHECK(curve->transform(0.0f) == 0.0f);
        CHECK(curve->transform(1.0f) == 1.0f);
    }
}

TEST_CASE("Unknown curve names resolve to nothing") {
    CHECK(curves::by_name("bounce") == nullptr);
    CHECK(curves::by_name("") == nullptr);
}

TEST_CASE("Curve inputs outside the unit range are clamped") {
    CurvePtr ease = curves::ease();
    CHECK(ease->transform(-0.5f) == 0.0f);
    CHECK(ease->transform(1.5f) == 1.0f);
    CHECK(curves::linear()->transform(0.37f) == doctest::Approx(0.37f));
}

TEST_CASE("Symmetric cubic passes through the midpoint") {
    CHECK(curves::ease_in_out()->transform(0.5f) == doctest::Approx(0.5f).epsilon(0.01));
    CHECK(curves::ease_in()->transform(0.25f) < 0.25f);
    CHECK(curves::ease_out()->transform(0.25f) > 0.25f);
}

TEST_CASE("Emphasized easing is front-loaded and non-decreasing") {
    CurvePtr curve = curves::ease_in_out_cubic_emphasized();
    CHECK(curve->transform(0.5f) > 0.5f);
    float previous = 0.0f;
    for (int i = 1; i <= 100; ++i) {
        const float y = curve->transform(static_cast<float>(i) / 100.0f);
        CHECK(y >= previous - 0.002f);
        previous = y;
    }
}

TEST_CASE("Flipped curve mirrors its source") {
    FlippedCurve flipped(curves::ease_in());
    CHECK(flipped.transform(0.3f) == doctest::Approx(1.0f - curves::ease_in()->transform(0.7f)));
    CHECK(flipped.describe().find("flipped") != std::string::npos);
}

TEST_CASE("Split curve is the identity up to the split point") {
    SplitCurve split(0.4f, curves::ease_in_out_cubic_emphasized());
    CHECK(split.transform(0.1f) == doctest::Approx(0.1f));
    CHECK(split.transform(0.4f) == doctest::Approx(0.4f));
    CHECK(split.transform(1.0f) == 1.0f);
}

TEST_CASE("Split curve is continuous at the split point") {
    for (float x0 : {0.1f, 0.35f, 0.6f, 0.9f}) {
        CAPTURE(x0);
        SplitCurve split(x0, curves::ease_in_out_cubic_emphasized());
        const float at = split.transform(x0);
        const float after = split.transform(x0 + 1e-4f);
        CHECK(after == doctest::Approx(at).epsilon(0.002));
        CHECK(after >= at);
    }
}

TEST_CASE("Split curve rescales the end curve into the tail") {
    SplitCurve split(0.5f, curves::linear());
    CHECK(split.transform(0.75f) == doctest::Approx(0.75f));

    SplitCurve eased(0.5f, curves::ease_in());
    const float expected = 0.5f + 0.5f * curves::ease_in()->transform(0.5f);
    CHECK(eased.transform(0.75f) == doctest::Approx(expected));
}

TEST_CASE("Degenerate split points") {
    SplitCurve at_end(1.0f, curves::ease_in());
    CHECK(at_end.transform(0.3f) == doctest::Approx(0.3f));

    SplitCurve not_a_number(std::nanf(""), curves::linear());
    CHECK(not_a_number.split() == 0.0f);
    CHECK(not_a_number.transform(0.3f) == doctest::Approx(0.3f));
}

TEST_CASE("Curve tween notifies only when its output moves") {
    CurveTween tween(std::make_shared<SplitCurve>(0.3f, curves::ease_in_out_cubic_emphasized()));
    int notified = 0;
    tween.set_listener([&notified]() { ++notified; });

    tween.set_curve(curves::linear(), 0.2f);
    CHECK(notified == 0);

    tween.set_curve(std::make_shared<SplitCurve>(0.3f, curves::ease_in_out_cubic_emphasized()), 0.8f);
    CHECK(notified == 1);
    CHECK(tween.evaluate(0.8f) > 0.8f);

    tween.set_curve(nullptr, 0.5f);
    CHECK(tween.curve() == curves::linear());
}
