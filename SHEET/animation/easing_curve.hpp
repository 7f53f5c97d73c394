#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace sheet {

class EasingCurve {
public:
    virtual ~EasingCurve() = default;

    // Maps progress in [0,1] to eased progress. Inputs outside the range are
    // clamped; 0 and 1 map to themselves.
    float transform(float t) const;

    virtual std::string describe() const = 0;

protected:
    virtual float transform_internal(float t) const = 0;
};

using CurvePtr = std::shared_ptr<const EasingCurve>;

class LinearCurve final : public EasingCurve {
public:
    std::string describe() const override { return "linear"; }

protected:
    float transform_internal(float t) const override { return t; }
};

// Cubic Bezier from (0,0) to (1,1) with control points (a,b) and (c,d).
class CubicCurve final : public EasingCurve {
public:
    CubicCurve(float a, float b, float c, float d);

    std::string describe() const override;

    float a() const { return a_; }
    float b() const { return b_; }
    float c() const { return c_; }
    float d() const { return d_; }

protected:
    float transform_internal(float t) const override;

private:
    float a_;
    float b_;
    float c_;
    float d_;
};

struct CurvePoint {
    float x = 0.0f;
    float y = 0.0f;
};

// Two cubic segments joined at `midpoint`, each rescaled into its half.
class ThreePointCubicCurve final : public EasingCurve {
public:
    ThreePointCubicCurve(CurvePoint a1, CurvePoint b1, CurvePoint midpoint, CurvePoint a2, CurvePoint b2);

    std::string describe() const override { return "three_point_cubic"; }

protected:
    float transform_internal(float t) const override;

private:
    CurvePoint midpoint_;
    CubicCurve first_;
    CubicCurve second_;
};

class FlippedCurve final : public EasingCurve {
public:
    explicit FlippedCurve(CurvePtr curve);

    std::string describe() const override;

protected:
    float transform_internal(float t) const override;

private:
    CurvePtr curve_;
};

// Linear up to `split`, then `end` rescaled into [split,1]. Installed when a
// drag is released so the settle continues from the release point.
class SplitCurve final : public EasingCurve {
public:
    SplitCurve(float split, CurvePtr end);

    float split() const { return split_; }
    const CurvePtr& end_curve() const { return end_; }

    std::string describe() const override;

protected:
    float transform_internal(float t) const override;

private:
    float split_;
    CurvePtr end_;
};

namespace curves {

CurvePtr linear();
CurvePtr ease();
CurvePtr ease_in();
CurvePtr ease_out();
CurvePtr ease_in_out();
CurvePtr fast_out_slow_in();
CurvePtr ease_in_out_cubic_emphasized();

// Returns nullptr for unknown names.
CurvePtr by_name(std::string_view name);

}

// Holds the curve the sheet's layout reads the animation through.
class CurveTween {
public:
    using Listener = std::function<void()>;

    explicit CurveTween(CurvePtr curve);

    const CurvePtr& curve() const { return curve_; }

    // Notifies only when the output at `current_t` differs from before.
    void set_curve(CurvePtr curve, float current_t);
    float evaluate(float t) const;

    void set_listener(Listener listener) { listener_ = std::move(listener); }

private:
    CurvePtr curve_;
    Listener listener_{};
};

}
