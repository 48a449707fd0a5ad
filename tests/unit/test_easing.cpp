#include <cmath>
#include <gtest/gtest.h>
#include <keyline/easing.hpp>
#include <limits>
#include <vector>

using namespace keyline;

namespace
{

std::vector<EasingSpec> all_kinds()
{
    return {
        EasingSpec::of(EasingKind::Linear),
        EasingSpec::of(EasingKind::EaseIn),
        EasingSpec::of(EasingKind::EaseOut),
        EasingSpec::of(EasingKind::EaseInOut),
        default_easing_spec(EasingKind::CubicBezier),
        default_easing_spec(EasingKind::Spring),
        EasingSpec::cubic_bezier(0.34, 1.56, 0.64, 1.0),
        EasingSpec::spring_physics(300.0, 10.0, 1.0),
        EasingSpec::spring_physics(100.0, 20.0, 1.0),
        EasingSpec::spring_physics(100.0, 40.0, 1.0),
    };
}

}   // anonymous namespace

// ─── Boundaries ──────────────────────────────────────────────────────────────

TEST(Easing, EveryKindStartsAtZeroAndEndsAtOne)
{
    for (const auto& spec : all_kinds())
    {
        EXPECT_EQ(evaluate(0.0, spec), 0.0) << easing_kind_name(spec.kind);
        EXPECT_EQ(evaluate(1.0, spec), 1.0) << easing_kind_name(spec.kind);
    }
}

TEST(Easing, FixedCurvesAreMonotonic)
{
    const EasingKind kinds[] = {EasingKind::Linear, EasingKind::EaseIn, EasingKind::EaseOut, EasingKind::EaseInOut};
    for (auto kind : kinds)
    {
        const auto spec = EasingSpec::of(kind);
        double     prev = evaluate(0.0, spec);
        for (int i = 1; i <= 100; ++i)
        {
            const double v = evaluate(i * 0.01, spec);
            EXPECT_GE(v, prev) << easing_kind_name(kind) << " at t=" << i * 0.01;
            prev = v;
        }
    }
}

// ─── Fixed curves ────────────────────────────────────────────────────────────

TEST(Easing, QuadraticShapes)
{
    EXPECT_DOUBLE_EQ(ease::linear(0.3), 0.3);
    EXPECT_DOUBLE_EQ(ease::ease_in(0.5), 0.25);
    EXPECT_DOUBLE_EQ(ease::ease_out(0.5), 0.75);
    EXPECT_DOUBLE_EQ(ease::ease_in_out(0.25), 0.125);
    EXPECT_DOUBLE_EQ(ease::ease_in_out(0.5), 0.5);
    EXPECT_DOUBLE_EQ(ease::ease_in_out(0.75), 0.875);
}

// ─── Cubic bezier ────────────────────────────────────────────────────────────

TEST(EasingBezier, SymmetricCurvePassesThroughMidpoint)
{
    ease::CubicBezier b{0.42, 0.0, 0.58, 1.0};
    EXPECT_NEAR(b(0.5), 0.5, 1e-6);
}

TEST(EasingBezier, DiagonalControlPointsGiveIdentity)
{
    ease::CubicBezier b{0.25, 0.25, 0.75, 0.75};
    for (int i = 1; i < 20; ++i)
    {
        const double t = i * 0.05;
        EXPECT_NEAR(b(t), t, 1e-5);
    }
}

TEST(EasingBezier, EaseInStartsSlow)
{
    ease::CubicBezier b{0.42, 0.0, 1.0, 1.0};
    EXPECT_LT(b(0.25), 0.25);
}

TEST(EasingBezier, YOutsideUnitRangeOvershoots)
{
    auto   spec = EasingSpec::cubic_bezier(0.34, 1.56, 0.64, 1.0);
    double peak = 0.0;
    for (int i = 0; i <= 100; ++i)
        peak = std::max(peak, evaluate(i * 0.01, spec));
    EXPECT_GT(peak, 1.0);
}

TEST(EasingBezier, FactoryClampsTimeCoordinates)
{
    auto spec = EasingSpec::cubic_bezier(-0.5, 2.0, 1.5, -1.0);
    EXPECT_DOUBLE_EQ(spec.bezier.x1, 0.0);
    EXPECT_DOUBLE_EQ(spec.bezier.x2, 1.0);
    EXPECT_DOUBLE_EQ(spec.bezier.y1, 2.0);
    EXPECT_DOUBLE_EQ(spec.bezier.y2, -1.0);
}

// ─── Spring ──────────────────────────────────────────────────────────────────

TEST(EasingSpring, DefaultParametersAreUnderdamped)
{
    ease::Spring s = ease::default_spring;
    EXPECT_LT(s.damping_ratio(), 1.0);
    EXPECT_NEAR(s.natural_frequency(), std::sqrt(170.0), 1e-12);
    EXPECT_EQ(s(1.0), 1.0);

    for (int i = 1; i < 100; ++i)
    {
        const double v = s(i * 0.01);
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 1.2);
    }
}

TEST(EasingSpring, BouncySpringOvershootsThenSettles)
{
    auto   spec = EasingSpec::spring_physics(300.0, 10.0, 1.0);
    double peak = 0.0;
    double peak_t = 0.0;
    for (int i = 1; i < 100; ++i)
    {
        const double v = evaluate(i * 0.01, spec);
        if (v > peak)
        {
            peak   = v;
            peak_t = i * 0.01;
        }
    }
    EXPECT_GT(peak, 1.0);
    EXPECT_LE(peak, 1.2);
    EXPECT_LT(peak_t, 0.5);
    EXPECT_NEAR(evaluate(0.99, spec), 1.0, 0.05);
}

TEST(EasingSpring, OvershootIsClamped)
{
    // First peak of this spring is ~1.39 before clamping.
    ease::Spring s{300.0, 10.0, 1.0};
    double       peak = 0.0;
    for (int i = 1; i < 1000; ++i)
        peak = std::max(peak, s(i * 0.001));
    EXPECT_DOUBLE_EQ(peak, 1.2);
}

TEST(EasingSpring, CriticallyDampedRisesWithoutOvershoot)
{
    ease::Spring s{100.0, 20.0, 1.0};
    ASSERT_DOUBLE_EQ(s.damping_ratio(), 1.0);
    double prev = 0.0;
    for (int i = 1; i < 100; ++i)
    {
        const double v = s(i * 0.01);
        EXPECT_GE(v, prev);
        EXPECT_LE(v, 1.0);
        prev = v;
    }
}

TEST(EasingSpring, OverdampedRisesWithoutOvershoot)
{
    ease::Spring s{100.0, 40.0, 1.0};
    ASSERT_GT(s.damping_ratio(), 1.0);
    double prev = 0.0;
    for (int i = 1; i < 100; ++i)
    {
        const double v = s(i * 0.01);
        EXPECT_GE(v, prev);
        EXPECT_LE(v, 1.0);
        prev = v;
    }
}

TEST(EasingSpring, DegenerateParametersFallBackToLinear)
{
    EXPECT_DOUBLE_EQ(evaluate(0.3, EasingSpec::spring_physics(170.0, 26.0, 0.0)), 0.3);
    EXPECT_DOUBLE_EQ(evaluate(0.3, EasingSpec::spring_physics(0.0, 26.0, 1.0)), 0.3);
    EXPECT_DOUBLE_EQ(evaluate(0.3, EasingSpec::spring_physics(170.0, -1.0, 1.0)), 0.3);
}

// ─── Failure policy ──────────────────────────────────────────────────────────

TEST(Easing, UnknownKindFallsBackToLinear)
{
    EasingSpec spec;
    spec.kind = static_cast<EasingKind>(42);
    EXPECT_DOUBLE_EQ(evaluate(0.4, spec), 0.4);
}

TEST(Easing, NaNPropagates)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    for (const auto& spec : all_kinds())
        EXPECT_TRUE(std::isnan(evaluate(nan, spec))) << easing_kind_name(spec.kind);
}

// ─── Spec helpers ────────────────────────────────────────────────────────────

TEST(EasingSpec, DefaultsPerKind)
{
    auto bezier = default_easing_spec(EasingKind::CubicBezier);
    EXPECT_EQ(bezier.kind, EasingKind::CubicBezier);
    EXPECT_EQ(bezier.bezier, (ease::CubicBezier{0.42, 0.0, 0.58, 1.0}));

    auto spring = default_easing_spec(EasingKind::Spring);
    EXPECT_EQ(spring.spring, (ease::Spring{170.0, 26.0, 1.0}));

    EXPECT_EQ(default_easing_spec(EasingKind::EaseOut), EasingSpec::of(EasingKind::EaseOut));
}

TEST(EasingSpec, EqualityIgnoresInactiveParameters)
{
    EasingSpec a = EasingSpec::of(EasingKind::EaseIn);
    EasingSpec b = EasingSpec::of(EasingKind::EaseIn);
    b.bezier.x1  = 0.9;
    EXPECT_EQ(a, b);

    EXPECT_NE(EasingSpec::cubic_bezier(0.1, 0.0, 0.9, 1.0), EasingSpec::cubic_bezier(0.2, 0.0, 0.9, 1.0));
}

TEST(EasingSpec, NamesRoundTrip)
{
    const EasingKind kinds[] = {EasingKind::Linear,
                                EasingKind::EaseIn,
                                EasingKind::EaseOut,
                                EasingKind::EaseInOut,
                                EasingKind::CubicBezier,
                                EasingKind::Spring};
    for (auto kind : kinds)
        EXPECT_EQ(easing_kind_from_name(easing_kind_name(kind)), kind);

    EXPECT_EQ(easing_kind_from_name("bogus"), EasingKind::Linear);
}
