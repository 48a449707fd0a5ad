#include <algorithm>
#include <cmath>
#include <iterator>
#include <keyline/interpolate.hpp>
#include <limits>

namespace keyline
{

// ─── Interpolation ───────────────────────────────────────────────────────────

double interpolate_value(std::span<const Keyframe> keyframes, double frame, double base_value)
{
    if (keyframes.empty())
        return base_value;

    const Keyframe& first = keyframes.front();
    if (keyframes.size() == 1)
        return first.value;

    if (std::isnan(frame))
        return std::numeric_limits<double>::quiet_NaN();

    if (frame <= first.frame)
        return first.value;

    const Keyframe& last = keyframes.back();
    if (frame >= last.frame)
        return last.value;

    // First keyframe strictly after `frame`; its predecessor satisfies
    // prev.frame <= frame < next.frame.
    auto next = std::upper_bound(keyframes.begin(),
                                 keyframes.end(),
                                 frame,
                                 [](double f, const Keyframe& kf) { return f < kf.frame; });
    auto prev = next - 1;

    const double span = static_cast<double>(next->frame - prev->frame);
    if (span <= 0.0)
        return prev->value;

    const double t     = (frame - prev->frame) / span;
    const double eased = evaluate(t, prev->easing);
    return prev->value + (next->value - prev->value) * eased;
}

std::vector<double> sample_values(std::span<const Keyframe> keyframes,
                                  double                    base_value,
                                  double                    start_frame,
                                  double                    end_frame,
                                  uint32_t                  count)
{
    std::vector<double> out;
    if (count == 0)
        return out;

    out.reserve(count);
    if (count == 1)
    {
        out.push_back(interpolate_value(keyframes, start_frame, base_value));
        return out;
    }

    const double step = (end_frame - start_frame) / static_cast<double>(count - 1);
    for (uint32_t i = 0; i < count; ++i)
    {
        out.push_back(interpolate_value(keyframes, start_frame + step * i, base_value));
    }
    return out;
}

std::optional<int> previous_keyframe_frame(std::span<const Keyframe> keyframes, int frame)
{
    auto it = std::lower_bound(keyframes.begin(),
                               keyframes.end(),
                               frame,
                               [](const Keyframe& kf, int f) { return kf.frame < f; });
    if (it == keyframes.begin())
        return std::nullopt;
    return std::prev(it)->frame;
}

std::optional<int> next_keyframe_frame(std::span<const Keyframe> keyframes, int frame)
{
    auto it = std::upper_bound(keyframes.begin(),
                               keyframes.end(),
                               frame,
                               [](int f, const Keyframe& kf) { return f < kf.frame; });
    if (it == keyframes.end())
        return std::nullopt;
    return it->frame;
}

// ─── Transform ───────────────────────────────────────────────────────────────

double Transform::get(AnimatableProperty property) const
{
    return const_cast<Transform*>(this)->at(property);
}

double& Transform::at(AnimatableProperty property)
{
    switch (property)
    {
        case AnimatableProperty::X:
            return x;
        case AnimatableProperty::Y:
            return y;
        case AnimatableProperty::Width:
            return width;
        case AnimatableProperty::Height:
            return height;
        case AnimatableProperty::Rotation:
            return rotation;
        case AnimatableProperty::Opacity:
            return opacity;
        case AnimatableProperty::CornerRadius:
            return corner_radius;
    }
    return opacity;
}

Transform resolve_animated_transform(const Transform& base, const ItemAnimation* animation, double frame)
{
    if (!animation || !animation->has_animation())
        return base;

    Transform result = base;
    for (const auto& track : animation->tracks())
    {
        if (track.keyframes.empty())
            continue;
        result.at(track.property) = interpolate_value(track.keyframes, frame, base.get(track.property));
    }
    return result;
}

}   // namespace keyline
