#include <benchmark/benchmark.h>
#include <keyline/easing.hpp>
#include <keyline/interpolate.hpp>
#include <keyline/transition.hpp>
#include <vector>

#include "ui/graph_editor.hpp"

using namespace keyline;

namespace
{

ItemAnimation make_animation(int keyframes_per_track)
{
    const EasingSpec easings[] = {EasingSpec::linear(),
                                  EasingSpec::of(EasingKind::EaseInOut),
                                  default_easing_spec(EasingKind::CubicBezier),
                                  default_easing_spec(EasingKind::Spring)};

    ItemAnimation anim("clip-bench");
    for (auto prop : kAnimatableProperties)
    {
        for (int i = 0; i < keyframes_per_track; ++i)
            anim.add_keyframe(prop, i * 10, i * 3.0, easings[i % 4]);
    }
    return anim;
}

}   // anonymous namespace

// ─── Easing benchmarks ───────────────────────────────────────────────────────

static void BM_Easing_CubicBezier(benchmark::State& state)
{
    const auto spec = EasingSpec::cubic_bezier(0.34, 1.56, 0.64, 1.0);
    double     t    = 0.0;
    for (auto _ : state)
    {
        t = t >= 1.0 ? 0.0 : t + 0.001;
        benchmark::DoNotOptimize(evaluate(t, spec));
    }
}
BENCHMARK(BM_Easing_CubicBezier);

static void BM_Easing_Spring(benchmark::State& state)
{
    const auto spec = default_easing_spec(EasingKind::Spring);
    double     t    = 0.0;
    for (auto _ : state)
    {
        t = t >= 1.0 ? 0.0 : t + 0.001;
        benchmark::DoNotOptimize(evaluate(t, spec));
    }
}
BENCHMARK(BM_Easing_Spring);

// ─── Interpolation benchmarks ────────────────────────────────────────────────

static void BM_InterpolateValue(benchmark::State& state)
{
    const int  count = static_cast<int>(state.range(0));
    const auto anim  = make_animation(count);
    const auto kfs   = anim.keyframes(AnimatableProperty::X);
    double     frame = 0.0;
    for (auto _ : state)
    {
        frame = frame >= count * 10.0 ? 0.0 : frame + 0.37;
        benchmark::DoNotOptimize(interpolate_value(kfs, frame, 0.0));
    }
}
BENCHMARK(BM_InterpolateValue)->Arg(2)->Arg(16)->Arg(256)->Arg(4096);

static void BM_ResolveTransform(benchmark::State& state)
{
    const auto anim = make_animation(static_cast<int>(state.range(0)));
    Transform  base{0.0, 0.0, 1920.0, 1080.0, 0.0, 1.0, 0.0};
    double     frame = 0.0;
    for (auto _ : state)
    {
        frame += 1.0;
        benchmark::DoNotOptimize(resolve_animated_transform(base, &anim, frame));
    }
}
BENCHMARK(BM_ResolveTransform)->Arg(4)->Arg(64)->Unit(benchmark::kMicrosecond);

static void BM_SampleCurve(benchmark::State& state)
{
    const auto anim = make_animation(32);
    const auto kfs  = anim.keyframes(AnimatableProperty::Y);
    for (auto _ : state)
    {
        auto samples = sample_values(kfs, 0.0, 0.0, 320.0, static_cast<uint32_t>(state.range(0)));
        benchmark::DoNotOptimize(samples.data());
    }
}
BENCHMARK(BM_SampleCurve)->Arg(200)->Arg(2000)->Unit(benchmark::kMicrosecond);

// ─── Transition and editor benchmarks ────────────────────────────────────────

static void BM_BlockedRanges(benchmark::State& state)
{
    Clip                    clip{"b", 0, 45};
    std::vector<Transition> ts;
    for (int i = 0; i < 64; ++i)
        ts.push_back(Transition{"t" + std::to_string(i), "x" + std::to_string(i), "y", "track-1", 10, 0.5});
    ts.push_back(Transition{"in", "a", "b", "track-1", 40, 0.5});
    ts.push_back(Transition{"out", "b", "c", "track-1", 40, 0.5});

    for (auto _ : state)
        benchmark::DoNotOptimize(blocked_ranges(clip, ts));
}
BENCHMARK(BM_BlockedRanges);

static void BM_GraphEditor_DragMove(benchmark::State& state)
{
    std::vector<Keyframe> kfs;
    for (int i = 0; i < 64; ++i)
        kfs.push_back(Keyframe{"kf-" + std::to_string(i), i * 4, i * 10.0, {}});

    GraphEditor editor;
    (void)editor.open(GraphTarget{"clip-bench", AnimatableProperty::X, 300}, 1200.0, 400.0);

    GraphEditorContext ctx;
    ctx.keyframes = kfs;
    (void)editor.handle_event(KeyframePointerDown{"kf-10", 1, 160.0, 200.0, {}}, ctx);

    double x = 160.0;
    for (auto _ : state)
    {
        x = x > 1100.0 ? 160.0 : x + 3.0;
        benchmark::DoNotOptimize(editor.handle_event(PointerMove{1, x, 180.0, {}}, ctx));
    }
}
BENCHMARK(BM_GraphEditor_DragMove)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
