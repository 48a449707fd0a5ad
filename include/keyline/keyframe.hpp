#pragma once

#include <array>
#include <cstdint>
#include <keyline/easing.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyline
{

enum class AnimatableProperty : uint8_t
{
    X,
    Y,
    Width,
    Height,
    Rotation,
    Opacity,
    CornerRadius,
};

inline constexpr std::array<AnimatableProperty, 7> kAnimatableProperties = {
    AnimatableProperty::X,
    AnimatableProperty::Y,
    AnimatableProperty::Width,
    AnimatableProperty::Height,
    AnimatableProperty::Rotation,
    AnimatableProperty::Opacity,
    AnimatableProperty::CornerRadius,
};

// Declared value range of a property, as stored in keyframes.
struct PropertyRange
{
    double      min      = 0.0;
    double      max      = 1.0;
    const char* unit     = "";
    int         decimals = 0;

    bool contains(double v) const { return v >= min && v <= max; }
};

const PropertyRange& property_range(AnimatableProperty property);

// "x", "y", "width", "height", "rotation", "opacity", "cornerRadius".
const char*                       property_name(AnimatableProperty property);
std::optional<AnimatableProperty> property_from_name(std::string_view name);

// One authored anchor. `frame` is relative to the owning item's start.
struct Keyframe
{
    std::string id;
    int         frame = 0;
    double      value = 0.0;
    EasingSpec  easing;
};

// Keyframes of one property, unique frames, sorted ascending.
struct PropertyTrack
{
    AnimatableProperty    property = AnimatableProperty::X;
    std::vector<Keyframe> keyframes;
};

// Partial update applied by ItemAnimation::update_keyframe.
struct KeyframeUpdate
{
    std::optional<int>        frame;
    std::optional<double>     value;
    std::optional<EasingSpec> easing;
};

// ItemAnimation: the animated properties of one timeline item.
//
// Tracks are created on the first keyframe insert and dropped when their
// last keyframe is removed, so an empty track never exists. Every mutation
// keeps the per-track invariant (frames unique, ascending).
class ItemAnimation
{
   public:
    ItemAnimation() = default;
    explicit ItemAnimation(std::string item_id);

    const std::string& item_id() const { return item_id_; }

    // ─── Queries ─────────────────────────────────────────────────────

    const std::vector<PropertyTrack>& tracks() const { return tracks_; }
    const PropertyTrack*              track(AnimatableProperty property) const;

    // Empty span when the property is not animated.
    std::span<const Keyframe> keyframes(AnimatableProperty property) const;

    const Keyframe* find_keyframe(AnimatableProperty property, std::string_view id) const;
    const Keyframe* keyframe_at(AnimatableProperty property, int frame) const;

    bool   is_animated(AnimatableProperty property) const;
    bool   has_animation() const { return !tracks_.empty(); }
    size_t keyframe_count() const;

    // ─── Mutation ────────────────────────────────────────────────────

    // Insert a keyframe. A keyframe already at `frame` is updated in place
    // (value and easing) and keeps its id. Returns the id of the written
    // keyframe, or nullopt for a negative frame.
    std::optional<std::string> add_keyframe(AnimatableProperty property,
                                            int                frame,
                                            double             value,
                                            EasingSpec         easing = {},
                                            std::string        id     = {});

    // Fails if the keyframe does not exist, or if the update would move it
    // to a negative frame or onto a frame held by another keyframe.
    bool update_keyframe(AnimatableProperty property,
                         std::string_view   id,
                         const KeyframeUpdate& update);

    bool remove_keyframe(AnimatableProperty property, std::string_view id);
    bool remove_property(AnimatableProperty property);
    void clear();

   private:
    std::string                item_id_;
    std::vector<PropertyTrack> tracks_;
    uint64_t                   next_id_ = 1;

    PropertyTrack* find_track(AnimatableProperty property);
    std::string    generate_id();
};

}   // namespace keyline
