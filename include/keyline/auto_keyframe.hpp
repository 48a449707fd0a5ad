#pragma once

#include <array>
#include <cstdint>
#include <keyline/keyframe.hpp>
#include <keyline/transition.hpp>
#include <span>
#include <string>
#include <string_view>

namespace keyline
{

enum class AutoKeyframeAction : uint8_t
{
    Add,
    Update,
};

// Outcome of the auto-keyframe policy for one property edit. When `handled`
// is false the caller writes the base (non-animated) value instead and the
// other fields are meaningless.
struct AutoKeyframeDecision
{
    bool               handled = false;
    AutoKeyframeAction action  = AutoKeyframeAction::Add;
    std::string        existing_keyframe_id;   // set for Update
    EasingSpec         easing;                 // easing of an added keyframe

    bool operator==(const AutoKeyframeDecision&) const = default;
};

// Decides whether an edit of `property` at `relative_frame` becomes a
// keyframe write. Pure: identical inputs give identical decisions.
AutoKeyframeDecision decide_auto_keyframe(std::span<const Keyframe> track,
                                          int                       relative_frame,
                                          int                       item_duration);

AutoKeyframeDecision decide_auto_keyframe(const ItemAnimation* animation,
                                          AnimatableProperty   property,
                                          int                  relative_frame,
                                          int                  item_duration);

// Host-owned keyframe mutation surface the policy result is applied through.
class KeyframeSink
{
   public:
    virtual ~KeyframeSink() = default;

    virtual void add_keyframe(std::string_view   item_id,
                              AnimatableProperty property,
                              int                frame,
                              double             value,
                              const EasingSpec&  easing) = 0;

    virtual void update_keyframe_value(std::string_view   item_id,
                                       AnimatableProperty property,
                                       std::string_view   keyframe_id,
                                       double             value) = 0;
};

// Sink writing straight into one ItemAnimation.
class ItemAnimationSink : public KeyframeSink
{
   public:
    explicit ItemAnimationSink(ItemAnimation& animation) : animation_(animation) {}

    void add_keyframe(std::string_view   item_id,
                      AnimatableProperty property,
                      int                frame,
                      double             value,
                      const EasingSpec&  easing) override;

    void update_keyframe_value(std::string_view   item_id,
                               AnimatableProperty property,
                               std::string_view   keyframe_id,
                               double             value) override;

   private:
    ItemAnimation& animation_;
};

// Applies the policy for a single property edit at the absolute playhead
// frame `current_frame`. Returns true if the edit was absorbed into
// keyframes, false if the caller must update the base transform.
bool auto_keyframe_property(KeyframeSink&        sink,
                            const Clip&          item,
                            const ItemAnimation* animation,
                            AnimatableProperty   property,
                            double               value,
                            int                  current_frame);

struct PropertyEdit
{
    AnimatableProperty property = AnimatableProperty::X;
    double             value    = 0.0;
};

// Runs auto_keyframe_property for every edit. Returns true when the caller
// must fall back to a base-transform update, i.e. no edit was handled.
bool auto_keyframe_properties(KeyframeSink&                 sink,
                              const Clip&                   item,
                              const ItemAnimation*          animation,
                              std::span<const PropertyEdit> edits,
                              int                           current_frame);

// Properties a canvas transform gizmo can drive.
inline constexpr std::array<AnimatableProperty, 5> kGizmoAnimatableProperties = {
    AnimatableProperty::X,
    AnimatableProperty::Y,
    AnimatableProperty::Width,
    AnimatableProperty::Height,
    AnimatableProperty::Rotation,
};

}   // namespace keyline
