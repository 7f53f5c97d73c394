#include "simulation.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace sheet {

InterpolationSimulation::InterpolationSimulation(double begin, double end, double duration, CurvePtr curve)
    : begin_(begin),
      end_(end),
      duration_(std::max(0.0, duration)),
      curve_(curve ? std::move(curve) : curves::linear()) {}

double InterpolationSimulation::x(double time) const {
    if (duration_ <= 0.0) {
        return end_;
    }
    const double t = std::clamp(time / duration_, 0.0, 1.0);
    if (t <= 0.0) {
        return begin_;
    }
    if (t >= 1.0) {
        return end_;
    }
    return begin_ + (end_ - begin_) * curve_->transform(static_cast<float>(t));
}

double InterpolationSimulation::dx(double time) const {
    const double epsilon = tolerance_.distance > 0.0 ? tolerance_.distance : 1e-3;
    return (x(time + epsilon) - x(time - epsilon)) / (2.0 * epsilon);
}

SpringDescription SpringDescription::with_damping_ratio(double mass, double stiffness, double ratio) {
    SpringDescription spring;
    spring.mass = mass;
    spring.stiffness = stiffness;
    spring.damping = ratio * 2.0 * std::sqrt(mass * stiffness);
    return spring;
}

SpringSimulation::SpringSimulation(const SpringDescription& spring, double start, double end, double velocity)
    : end_(end) {
    const double distance = start - end;
    const double mass = spring.mass > 0.0 ? spring.mass : 1.0;
    const double discriminant = spring.damping * spring.damping - 4.0 * mass * spring.stiffness;
    // damping is derived through a square root, so an exact zero is rare.
    const double critical_band = 1e-9 * std::max(1.0, 4.0 * mass * spring.stiffness);

    if (std::fabs(discriminant) <= critical_band) {
        type_ = SpringType::CriticallyDamped;
        r1_ = -spring.damping / (2.0 * mass);
        c1_ = distance;
        c2_ = velocity - r1_ * distance;
    } else if (discriminant > 0.0) {
        type_ = SpringType::OverDamped;
        const double root = std::sqrt(discriminant);
        r1_ = (-spring.damping - root) / (2.0 * mass);
        r2_ = (-spring.damping + root) / (2.0 * mass);
        c2_ = (velocity - r1_ * distance) / (r2_ - r1_);
        c1_ = distance - c2_;
    } else {
        type_ = SpringType::UnderDamped;
        w_ = std::sqrt(4.0 * mass * spring.stiffness - spring.damping * spring.damping) / (2.0 * mass);
        r1_ = -(spring.damping / (2.0 * mass));
        c1_ = distance;
        c2_ = (velocity - r1_ * distance) / w_;
    }
}

double SpringSimulation::x(double time) const {
    switch (type_) {
    case SpringType::CriticallyDamped:
        return end_ + (c1_ + c2_ * time) * std::exp(r1_ * time);
    case SpringType::OverDamped:
        return end_ + c1_ * std::exp(r1_ * time) + c2_ * std::exp(r2_ * time);
    case SpringType::UnderDamped:
        return end_ + std::exp(r1_ * time) * (c1_ * std::cos(w_ * time) + c2_ * std::sin(w_ * time));
    }
    return end_;
}

double SpringSimulation::dx(double time) const {
    switch (type_) {
    case SpringType::CriticallyDamped: {
        const double power = std::exp(r1_ * time);
        return r1_ * (c1_ + c2_ * time) * power + c2_ * power;
    }
    case SpringType::OverDamped:
        return c1_ * r1_ * std::exp(r1_ * time) + c2_ * r2_ * std::exp(r2_ * time);
    case SpringType::UnderDamped: {
        const double power = std::exp(r1_ * time);
        const double cosine = std::cos(w_ * time);
        const double sine = std::sin(w_ * time);
        return power * (c2_ * w_ * cosine - c1_ * w_ * sine) + r1_ * power * (c2_ * sine + c1_ * cosine);
    }
    }
    return 0.0;
}

bool SpringSimulation::is_done(double time) const {
    return std::fabs(x(time) - end_) < tolerance_.distance && std::fabs(dx(time)) < tolerance_.velocity;
}

}
