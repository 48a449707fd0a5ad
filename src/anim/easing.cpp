#include <algorithm>
#include <cmath>
#include <keyline/easing.hpp>
#include <keyline/logger.hpp>

namespace keyline
{

namespace ease
{

double linear(double t)
{
    return t;
}

double ease_in(double t)
{
    return t * t;
}

double ease_out(double t)
{
    return t * (2.0 - t);
}

double ease_in_out(double t)
{
    if (t < 0.5)
        return 2.0 * t * t;
    return -1.0 + (4.0 - 2.0 * t) * t;
}

double CubicBezier::operator()(double t) const
{
    if (t == 0.0)
        return 0.0;
    if (t == 1.0)
        return 1.0;

    // Polynomial form: X(u) = ((ax*u + bx)*u + cx)*u, same for Y.
    const double cx = 3.0 * x1;
    const double bx = 3.0 * (x2 - x1) - cx;
    const double ax = 1.0 - cx - bx;

    const double cy = 3.0 * y1;
    const double by = 3.0 * (y2 - y1) - cy;
    const double ay = 1.0 - cy - by;

    // Newton-Raphson for X(u) == t, seeded at u = t
    double u = t;
    for (int i = 0; i < 8; ++i)
    {
        const double err = ((ax * u + bx) * u + cx) * u - t;
        if (std::abs(err) < 1e-6)
            break;

        const double slope = (3.0 * ax * u + 2.0 * bx) * u + cx;
        if (std::abs(slope) < 1e-6)
            break;

        u -= err / slope;
        u = std::clamp(u, 0.0, 1.0);
    }

    return ((ay * u + by) * u + cy) * u;
}

double Spring::natural_frequency() const
{
    return std::sqrt(tension / mass);
}

double Spring::damping_ratio() const
{
    return friction / (2.0 * std::sqrt(tension * mass));
}

double Spring::operator()(double t) const
{
    if (t == 0.0)
        return 0.0;
    if (t == 1.0)
        return 1.0;

    const double omega0 = natural_frequency();
    const double zeta   = damping_ratio();

    // A spring never settles in finite time; map progress 1 onto ~4 time
    // constants of the decay envelope.
    const double settle_time = 4.0 / (zeta * omega0);
    const double tau         = t * settle_time;

    double value = 0.0;
    if (zeta < 1.0)
    {
        const double omega_d = omega0 * std::sqrt(1.0 - zeta * zeta);
        value                = 1.0 - std::exp(-zeta * omega0 * tau) *
                          (std::cos(omega_d * tau) +
                           (zeta * omega0 / omega_d) * std::sin(omega_d * tau));
    }
    else if (zeta == 1.0)
    {
        value = 1.0 - std::exp(-omega0 * tau) * (1.0 + omega0 * tau);
    }
    else
    {
        const double root = std::sqrt(zeta * zeta - 1.0);
        const double s1   = -omega0 * (zeta - root);
        const double s2   = -omega0 * (zeta + root);
        value = 1.0 - (s2 * std::exp(s1 * tau) - s1 * std::exp(s2 * tau)) / (s2 - s1);
    }

    // std::clamp would keep NaN, which is what callers expect for NaN input.
    return std::clamp(value, 0.0, 1.2);
}

}   // namespace ease

// ─── EasingSpec ──────────────────────────────────────────────────────────────

EasingSpec EasingSpec::cubic_bezier(double x1, double y1, double x2, double y2)
{
    EasingSpec spec;
    spec.kind   = EasingKind::CubicBezier;
    spec.bezier = ease::CubicBezier{std::clamp(x1, 0.0, 1.0), y1, std::clamp(x2, 0.0, 1.0), y2};
    return spec;
}

EasingSpec EasingSpec::spring_physics(double tension, double friction, double mass)
{
    EasingSpec spec;
    spec.kind   = EasingKind::Spring;
    spec.spring = ease::Spring{tension, friction, mass};
    return spec;
}

bool EasingSpec::operator==(const EasingSpec& other) const
{
    if (kind != other.kind)
        return false;
    switch (kind)
    {
        case EasingKind::CubicBezier:
            return bezier == other.bezier;
        case EasingKind::Spring:
            return spring == other.spring;
        default:
            return true;
    }
}

namespace
{

// Non-positive tension, friction or mass has no settling solution.
bool spring_is_degenerate(const ease::Spring& s)
{
    return s.tension <= 0.0 || s.friction <= 0.0 || s.mass <= 0.0;
}

}   // anonymous namespace

double evaluate(double t, const EasingSpec& spec)
{
    switch (spec.kind)
    {
        case EasingKind::Linear:
            return ease::linear(t);
        case EasingKind::EaseIn:
            return ease::ease_in(t);
        case EasingKind::EaseOut:
            return ease::ease_out(t);
        case EasingKind::EaseInOut:
            return ease::ease_in_out(t);
        case EasingKind::CubicBezier:
            return spec.bezier(t);
        case EasingKind::Spring:
            if (spring_is_degenerate(spec.spring))
            {
                KEYLINE_LOG_TRACE("easing",
                                  "degenerate spring (tension={}, friction={}, mass={}), using linear",
                                  spec.spring.tension,
                                  spec.spring.friction,
                                  spec.spring.mass);
                return ease::linear(t);
            }
            return spec.spring(t);
    }

    KEYLINE_LOG_WARN("easing",
                     "unknown easing kind {}, using linear",
                     static_cast<int>(spec.kind));
    return ease::linear(t);
}

EasingSpec default_easing_spec(EasingKind kind)
{
    switch (kind)
    {
        case EasingKind::CubicBezier:
            return EasingSpec{kind, ease::default_bezier, ease::default_spring};
        case EasingKind::Spring:
            return EasingSpec{kind, ease::default_bezier, ease::default_spring};
        case EasingKind::Linear:
        case EasingKind::EaseIn:
        case EasingKind::EaseOut:
        case EasingKind::EaseInOut:
            return EasingSpec::of(kind);
    }
    return EasingSpec::linear();
}

const char* easing_kind_name(EasingKind kind)
{
    switch (kind)
    {
        case EasingKind::Linear:
            return "linear";
        case EasingKind::EaseIn:
            return "ease-in";
        case EasingKind::EaseOut:
            return "ease-out";
        case EasingKind::EaseInOut:
            return "ease-in-out";
        case EasingKind::CubicBezier:
            return "cubic-bezier";
        case EasingKind::Spring:
            return "spring";
    }
    return "linear";
}

EasingKind easing_kind_from_name(std::string_view name)
{
    if (name == "ease-in")
        return EasingKind::EaseIn;
    if (name == "ease-out")
        return EasingKind::EaseOut;
    if (name == "ease-in-out")
        return EasingKind::EaseInOut;
    if (name == "cubic-bezier")
        return EasingKind::CubicBezier;
    if (name == "spring")
        return EasingKind::Spring;
    return EasingKind::Linear;
}

}   // namespace keyline
