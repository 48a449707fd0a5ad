#pragma once

#include <cstdint>
#include <keyline/keyframe.hpp>
#include <optional>
#include <span>
#include <vector>

namespace keyline
{

// Value of a property at `frame` (item-relative, may be fractional).
//
// - no keyframes: base_value
// - before the first / after the last keyframe: that keyframe's value
// - in between: prev.value + (next.value - prev.value) * evaluate(t, prev.easing)
//
// The easing of the departing keyframe shapes the segment. `keyframes` must
// be sorted by frame. Stateless: frames may arrive in any order.
double interpolate_value(std::span<const Keyframe> keyframes, double frame, double base_value);

// Samples `count` evenly spaced values over [start_frame, end_frame], for
// drawing a curve.
std::vector<double> sample_values(std::span<const Keyframe> keyframes,
                                  double                    base_value,
                                  double                    start_frame,
                                  double                    end_frame,
                                  uint32_t                  count);

// Nearest keyframe frame strictly before / after `frame`.
std::optional<int> previous_keyframe_frame(std::span<const Keyframe> keyframes, int frame);
std::optional<int> next_keyframe_frame(std::span<const Keyframe> keyframes, int frame);

// Resolved (non-animated) transform of an item.
struct Transform
{
    double x             = 0.0;
    double y             = 0.0;
    double width         = 0.0;
    double height        = 0.0;
    double rotation      = 0.0;
    double opacity       = 1.0;
    double corner_radius = 0.0;

    double  get(AnimatableProperty property) const;
    double& at(AnimatableProperty property);

    bool operator==(const Transform&) const = default;
};

// Base transform with every animated property replaced by its value at
// `frame`. A null or empty animation returns `base` unchanged.
Transform resolve_animated_transform(const Transform&     base,
                                     const ItemAnimation* animation,
                                     double               frame);

}   // namespace keyline
