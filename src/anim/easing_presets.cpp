#include <algorithm>
#include <array>
#include <cmath>
#include <keyline/easing_presets.hpp>

namespace keyline
{

namespace
{

constexpr double kBezierMatchTolerance = 0.01;

EasingSpec bezier(double x1, double y1, double x2, double y2)
{
    EasingSpec s;
    s.kind   = EasingKind::CubicBezier;
    s.bezier = ease::CubicBezier{x1, y1, x2, y2};
    return s;
}

EasingSpec spring(double tension, double friction, double mass)
{
    EasingSpec s;
    s.kind   = EasingKind::Spring;
    s.spring = ease::Spring{tension, friction, mass};
    return s;
}

const std::array<EasingCategoryInfo, 6> kCategories = {{
    {EasingCategory::Basic, "Basic", "Simple linear and quadratic curves"},
    {EasingCategory::Ease, "Ease", "Smooth acceleration and deceleration"},
    {EasingCategory::Emphasis, "Emphasis", "Dramatic curves with overshoot"},
    {EasingCategory::Bounce, "Bounce", "Bouncy, playful animations"},
    {EasingCategory::Elastic, "Elastic", "Springy, stretchy feel"},
    {EasingCategory::Spring, "Spring", "Physics-based spring motion"},
}};

// clang-format off
const std::array<EasingPreset, 22> kPresets = {{
    // Basic
    {"linear",            "Linear",            EasingCategory::Basic,    EasingSpec::of(EasingKind::Linear),    "M2,20 L22,4"},
    {"ease-in-quad",      "Ease In",           EasingCategory::Basic,    EasingSpec::of(EasingKind::EaseIn),    "M2,20 Q2,4 22,4"},
    {"ease-out-quad",     "Ease Out",          EasingCategory::Basic,    EasingSpec::of(EasingKind::EaseOut),   "M2,20 Q22,20 22,4"},
    {"ease-in-out-quad",  "Ease In Out",       EasingCategory::Basic,    EasingSpec::of(EasingKind::EaseInOut), "M2,20 C2,12 22,12 22,4"},

    // Ease
    {"ease-in-cubic",     "Ease In Cubic",     EasingCategory::Ease,     bezier(0.32, 0.0, 0.67, 0.0),  "M2,20 C8,20 16,4 22,4"},
    {"ease-out-cubic",    "Ease Out Cubic",    EasingCategory::Ease,     bezier(0.33, 1.0, 0.68, 1.0),  "M2,20 C8,20 8,4 22,4"},
    {"ease-in-out-cubic", "Ease In Out Cubic", EasingCategory::Ease,     bezier(0.65, 0.0, 0.35, 1.0),  "M2,20 C10,20 14,4 22,4"},
    {"ease-in-quart",     "Ease In Quart",     EasingCategory::Ease,     bezier(0.5, 0.0, 0.75, 0.0),   "M2,20 C12,20 18,4 22,4"},
    {"ease-out-quart",    "Ease Out Quart",    EasingCategory::Ease,     bezier(0.25, 1.0, 0.5, 1.0),   "M2,20 C6,20 6,4 22,4"},
    {"ease-in-out-quart", "Ease In Out Quart", EasingCategory::Ease,     bezier(0.76, 0.0, 0.24, 1.0),  "M2,20 C12,20 12,4 22,4"},

    // Emphasis
    {"ease-out-back",     "Ease Out Back",     EasingCategory::Emphasis, bezier(0.34, 1.56, 0.64, 1.0), "M2,20 C6,20 10,0 22,4"},
    {"ease-in-back",      "Ease In Back",      EasingCategory::Emphasis, bezier(0.36, 0.0, 0.66, -0.56), "M2,20 C12,24 18,4 22,4"},
    {"ease-in-out-back",  "Ease In Out Back",  EasingCategory::Emphasis, bezier(0.68, -0.6, 0.32, 1.6), "M2,20 C8,24 16,0 22,4"},

    // Bounce
    {"bounce-out",        "Bounce Out",        EasingCategory::Bounce,   bezier(0.34, 1.4, 0.64, 1.0),  "M2,20 C6,20 8,-2 14,6 C16,8 18,4 22,4"},
    {"bounce-in",         "Bounce In",         EasingCategory::Bounce,   bezier(0.36, 0.0, 0.66, -0.4), "M2,20 C4,20 6,16 10,18 C14,20 18,4 22,4"},

    // Elastic
    {"elastic-out",       "Elastic Out",       EasingCategory::Elastic,  bezier(0.64, 0.57, 0.67, 1.53), "M2,20 C4,12 6,0 10,6 C12,8 14,2 16,4 C18,5 20,4 22,4"},
    {"elastic-in",        "Elastic In",        EasingCategory::Elastic,  bezier(0.33, -0.53, 0.36, 0.43), "M2,20 C4,20 6,19 8,20 C10,22 12,16 14,18 C18,12 22,4 22,4"},

    // Spring
    {"spring-gentle",     "Spring Gentle",     EasingCategory::Spring,   spring(120.0, 14.0, 1.0), "M2,20 C4,8 8,2 12,6 C14,8 16,4 18,4 C20,4 22,4 22,4"},
    {"spring-default",    "Spring",            EasingCategory::Spring,   spring(170.0, 26.0, 1.0), "M2,20 C4,8 8,2 12,6 C16,10 18,3 22,4"},
    {"spring-bouncy",     "Spring Bouncy",     EasingCategory::Spring,   spring(300.0, 10.0, 1.0), "M2,20 C3,4 5,-2 8,8 C10,14 11,0 14,6 C16,10 18,2 20,4 C21,5 22,4 22,4"},
    {"spring-stiff",      "Spring Stiff",      EasingCategory::Spring,   spring(400.0, 30.0, 1.0), "M2,20 C3,6 6,2 10,4 C12,5 14,3 16,4 C20,4 22,4 22,4"},
    {"spring-slow",       "Spring Slow",       EasingCategory::Spring,   spring(100.0, 20.0, 2.0), "M2,20 C6,10 10,4 14,6 C18,8 20,4 22,4"},
}};
// clang-format on

bool bezier_close(const ease::CubicBezier& a, const ease::CubicBezier& b)
{
    return std::abs(a.x1 - b.x1) < kBezierMatchTolerance && std::abs(a.y1 - b.y1) < kBezierMatchTolerance
           && std::abs(a.x2 - b.x2) < kBezierMatchTolerance && std::abs(a.y2 - b.y2) < kBezierMatchTolerance;
}

}   // anonymous namespace

std::span<const EasingCategoryInfo> easing_categories()
{
    return kCategories;
}

std::span<const EasingPreset> easing_presets()
{
    return kPresets;
}

std::vector<const EasingPreset*> presets_in_category(EasingCategory category)
{
    std::vector<const EasingPreset*> out;
    for (const auto& p : kPresets)
    {
        if (p.category == category)
            out.push_back(&p);
    }
    return out;
}

const EasingPreset* preset_by_id(std::string_view id)
{
    auto it = std::find_if(kPresets.begin(), kPresets.end(), [id](const EasingPreset& p) { return id == p.id; });
    return it != kPresets.end() ? &*it : nullptr;
}

const EasingPreset* find_matching_preset(const EasingSpec& spec)
{
    for (const auto& p : kPresets)
    {
        if (p.spec.kind != spec.kind)
            continue;

        switch (spec.kind)
        {
            case EasingKind::CubicBezier:
                if (bezier_close(p.spec.bezier, spec.bezier))
                    return &p;
                break;
            case EasingKind::Spring:
                if (p.spec.spring == spec.spring)
                    return &p;
                break;
            default:
                return &p;
        }
    }
    return nullptr;
}

}   // namespace keyline
