#pragma once

#include "easing_curve.hpp"

namespace sheet {

struct Tolerance {
    double distance = 1e-3;
    double velocity = 1e-3;
};

class Simulation {
public:
    virtual ~Simulation() = default;

    virtual double x(double time) const = 0;
    virtual double dx(double time) const = 0;
    virtual bool is_done(double time) const = 0;

    const Tolerance& tolerance() const { return tolerance_; }
    void set_tolerance(const Tolerance& tolerance) { tolerance_ = tolerance; }

protected:
    Tolerance tolerance_{};
};

// Moves from `begin` to `end` over `duration` seconds along `curve`.
class InterpolationSimulation final : public Simulation {
public:
    InterpolationSimulation(double begin, double end, double duration, CurvePtr curve = curves::linear());

    double x(double time) const override;
    double dx(double time) const override;
    bool is_done(double time) const override { return time >= duration_; }

private:
    double begin_;
    double end_;
    double duration_;
    CurvePtr curve_;
};

struct SpringDescription {
    double mass = 1.0;
    double stiffness = 500.0;
    double damping = 0.0;

    static SpringDescription with_damping_ratio(double mass, double stiffness, double ratio = 1.0);
};

enum class SpringType {
    CriticallyDamped,
    UnderDamped,
    OverDamped
};

// Damped harmonic oscillator released at `start` with `velocity`, resting at `end`.
class SpringSimulation final : public Simulation {
public:
    SpringSimulation(const SpringDescription& spring, double start, double end, double velocity);

    double x(double time) const override;
    double dx(double time) const override;
    bool is_done(double time) const override;

    SpringType type() const { return type_; }

private:
    double end_;
    SpringType type_;
    // Coefficients of the closed-form solution for the offset from `end_`.
    double r1_ = 0.0;
    double r2_ = 0.0;
    double c1_ = 0.0;
    double c2_ = 0.0;
    double w_ = 0.0;
};

}
