#include "easing_curve.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace sheet {

namespace {

constexpr float kCubicErrorBound = 0.001f;

float evaluate_cubic(float a, float b, float m) {
    return 3.0f * a * (1.0f - m) * (1.0f - m) * m +
           3.0f * b * (1.0f - m) * m * m +
           m * m * m;
}

CurvePtr make_cubic(float a, float b, float c, float d) {
    return std::make_shared<CubicCurve>(a, b, c, d);
}

}

float EasingCurve::transform(float t) const {
    if (!std::isfinite(t) || t <= 0.0f) {
        return 0.0f;
    }
    if (t >= 1.0f) {
        return 1.0f;
    }
    return transform_internal(t);
}

CubicCurve::CubicCurve(float a, float b, float c, float d)
    : a_(a), b_(b), c_(c), d_(d) {}

std::string CubicCurve::describe() const {
    std::ostringstream ss;
    ss << "cubic(" << a_ << ", " << b_ << ", " << c_ << ", " << d_ << ")";
    return ss.str();
}

float CubicCurve::transform_internal(float t) const {
    // Bisect on the x polynomial, then evaluate y at the found parameter.
    float start = 0.0f;
    float end = 1.0f;
    for (int guard = 0; guard < 64; ++guard) {
        const float midpoint = (start + end) / 2.0f;
        const float estimate = evaluate_cubic(a_, c_, midpoint);
        if (std::fabs(t - estimate) < kCubicErrorBound) {
            return evaluate_cubic(b_, d_, midpoint);
        }
        if (estimate < t) {
            start = midpoint;
        } else {
            end = midpoint;
        }
    }
    return evaluate_cubic(b_, d_, (start + end) / 2.0f);
}

ThreePointCubicCurve::ThreePointCubicCurve(CurvePoint a1, CurvePoint b1, CurvePoint midpoint, CurvePoint a2, CurvePoint b2)
    : midpoint_(midpoint),
      first_(a1.x / midpoint.x, a1.y / midpoint.y, b1.x / midpoint.x, b1.y / midpoint.y),
      second_((a2.x - midpoint.x) / (1.0f - midpoint.x),
              (a2.y - midpoint.y) / (1.0f - midpoint.y),
              (b2.x - midpoint.x) / (1.0f - midpoint.x),
              (b2.y - midpoint.y) / (1.0f - midpoint.y)) {}

float ThreePointCubicCurve::transform_internal(float t) const {
    if (t < midpoint_.x) {
        return first_.transform(t / midpoint_.x) * midpoint_.y;
    }
    const float scale_x = 1.0f - midpoint_.x;
    const float scale_y = 1.0f - midpoint_.y;
    return second_.transform((t - midpoint_.x) / scale_x) * scale_y + midpoint_.y;
}

FlippedCurve::FlippedCurve(CurvePtr curve) : curve_(std::move(curve)) {}

std::string FlippedCurve::describe() const {
    return "flipped(" + (curve_ ? curve_->describe() : std::string("null")) + ")";
}

float FlippedCurve::transform_internal(float t) const {
    if (!curve_) {
        return t;
    }
    return 1.0f - curve_->transform(1.0f - t);
}

SplitCurve::SplitCurve(float split, CurvePtr end)
    : split_(std::clamp(std::isfinite(split) ? split : 0.0f, 0.0f, 1.0f)),
      end_(end ? std::move(end) : curves::linear()) {}

std::string SplitCurve::describe() const {
    std::ostringstream ss;
    ss << "split(" << split_ << ", " << end_->describe() << ")";
    return ss.str();
}

float SplitCurve::transform_internal(float t) const {
    if (t <= split_ || split_ >= 1.0f) {
        return t;
    }
    const float progress = (t - split_) / (1.0f - split_);
    return split_ + (1.0f - split_) * end_->transform(progress);
}

namespace curves {

CurvePtr linear() {
    static const CurvePtr curve = std::make_shared<LinearCurve>();
    return curve;
}

CurvePtr ease() {
    static const CurvePtr curve = make_cubic(0.25f, 0.1f, 0.25f, 1.0f);
    return curve;
}

CurvePtr ease_in() {
    static const CurvePtr curve = make_cubic(0.42f, 0.0f, 1.0f, 1.0f);
    return curve;
}

CurvePtr ease_out() {
    static const CurvePtr curve = make_cubic(0.0f, 0.0f, 0.58f, 1.0f);
    return curve;
}

CurvePtr ease_in_out() {
    static const CurvePtr curve = make_cubic(0.42f, 0.0f, 0.58f, 1.0f);
    return curve;
}

CurvePtr fast_out_slow_in() {
    static const CurvePtr curve = make_cubic(0.4f, 0.0f, 0.2f, 1.0f);
    return curve;
}

CurvePtr ease_in_out_cubic_emphasized() {
    static const CurvePtr curve = std::make_shared<ThreePointCubicCurve>(
        CurvePoint{0.05f, 0.0f},
        CurvePoint{0.133333f, 0.06f},
        CurvePoint{0.166666f, 0.4f},
        CurvePoint{0.208333f, 0.82f},
        CurvePoint{0.25f, 1.0f});
    return curve;
}

CurvePtr by_name(std::string_view name) {
    if (name == "linear") return linear();
    if (name == "ease") return ease();
    if (name == "ease_in") return ease_in();
    if (name == "ease_out") return ease_out();
    if (name == "ease_in_out") return ease_in_out();
    if (name == "fast_out_slow_in") return fast_out_slow_in();
    if (name == "ease_in_out_cubic_emphasized") return ease_in_out_cubic_emphasized();
    return nullptr;
}

}

CurveTween::CurveTween(CurvePtr curve)
    : curve_(curve ? std::move(curve) : curves::linear()) {}

void CurveTween::set_curve(CurvePtr curve, float current_t) {
    if (!curve) {
        curve = curves::linear();
    }
    if (curve == curve_) {
        return;
    }
    const float before = curve_->transform(current_t);
    curve_ = std::move(curve);
    if (listener_ && curve_->transform(current_t) != before) {
        listener_();
    }
}

float CurveTween::evaluate(float t) const {
    return curve_->transform(t);
}

}
