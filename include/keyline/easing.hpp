#pragma once

#include <cstdint>
#include <string_view>

namespace keyline
{

namespace ease
{
// Fixed quadratic shapes. Callers clamp t to [0, 1] before evaluating.
double linear(double t);
double ease_in(double t);
double ease_out(double t);
double ease_in_out(double t);

// CSS-style cubic-bezier timing curve through (0,0), (x1,y1), (x2,y2), (1,1).
// x1/x2 are expected in [0, 1] so time stays monotonic; y may overshoot.
struct CubicBezier
{
    double x1 = 0.42;
    double y1 = 0.0;
    double x2 = 0.58;
    double y2 = 1.0;

    double operator()(double t) const;

    bool operator==(const CubicBezier&) const = default;
};

// Damped harmonic oscillator settling toward 1. Output is clamped to
// [0, 1.2] so degenerate parameters cannot run away.
struct Spring
{
    double tension  = 170.0;
    double friction = 26.0;
    double mass     = 1.0;

    double operator()(double t) const;

    double natural_frequency() const;   // sqrt(tension / mass)
    double damping_ratio() const;       // friction / (2 sqrt(tension * mass))

    bool operator==(const Spring&) const = default;
};

inline constexpr CubicBezier default_bezier{0.42, 0.0, 0.58, 1.0};
inline constexpr Spring      default_spring{170.0, 26.0, 1.0};
}   // namespace ease

enum class EasingKind : uint8_t
{
    Linear,
    EaseIn,
    EaseOut,
    EaseInOut,
    CubicBezier,
    Spring,
};

// Easing of the segment that leaves a keyframe. Only the parameter block
// matching `kind` is meaningful; the other one is ignored.
struct EasingSpec
{
    EasingKind        kind = EasingKind::Linear;
    ease::CubicBezier bezier;
    ease::Spring      spring;

    static constexpr EasingSpec linear() { return {}; }
    static constexpr EasingSpec of(EasingKind k) { return EasingSpec{k, {}, {}}; }
    static EasingSpec           cubic_bezier(double x1, double y1, double x2, double y2);
    static EasingSpec           spring_physics(double tension, double friction, double mass);

    bool operator==(const EasingSpec& other) const;
};

// Eased progress for t in [0, 1]. Unknown kinds and physically meaningless
// spring parameters evaluate as linear. NaN in, NaN out.
double evaluate(double t, const EasingSpec& spec);

// Spec with the default parameter block for `kind`.
EasingSpec default_easing_spec(EasingKind kind);

// "linear", "ease-in", "ease-out", "ease-in-out", "cubic-bezier", "spring".
const char* easing_kind_name(EasingKind kind);

// Unrecognised names map to Linear.
EasingKind easing_kind_from_name(std::string_view name);

}   // namespace keyline
