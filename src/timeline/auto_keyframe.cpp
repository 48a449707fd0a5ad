#include <algorithm>
#include <keyline/auto_keyframe.hpp>
#include <keyline/logger.hpp>

namespace keyline
{

AutoKeyframeDecision decide_auto_keyframe(std::span<const Keyframe> track,
                                          int                       relative_frame,
                                          int                       item_duration)
{
    AutoKeyframeDecision decision;
    if (track.empty())
        return decision;
    if (relative_frame < 0 || relative_frame >= item_duration)
        return decision;

    decision.handled = true;
    decision.easing  = EasingSpec::linear();

    auto it = std::find_if(track.begin(),
                           track.end(),
                           [relative_frame](const Keyframe& kf) { return kf.frame == relative_frame; });
    if (it != track.end())
    {
        decision.action               = AutoKeyframeAction::Update;
        decision.existing_keyframe_id = it->id;
    }
    else
    {
        decision.action = AutoKeyframeAction::Add;
    }
    return decision;
}

AutoKeyframeDecision decide_auto_keyframe(const ItemAnimation* animation,
                                          AnimatableProperty   property,
                                          int                  relative_frame,
                                          int                  item_duration)
{
    if (!animation)
        return {};
    return decide_auto_keyframe(animation->keyframes(property), relative_frame, item_duration);
}

// ─── ItemAnimationSink ───────────────────────────────────────────────────────

void ItemAnimationSink::add_keyframe(std::string_view   item_id,
                                     AnimatableProperty property,
                                     int                frame,
                                     double             value,
                                     const EasingSpec&  easing)
{
    if (item_id != animation_.item_id())
    {
        KEYLINE_LOG_WARN("auto-key",
                         "sink for '{}' asked to add a keyframe on '{}'",
                         animation_.item_id(),
                         std::string(item_id));
        return;
    }
    if (!animation_.add_keyframe(property, frame, value, easing))
        KEYLINE_LOG_WARN("auto-key", "could not add keyframe at frame {}", frame);
}

void ItemAnimationSink::update_keyframe_value(std::string_view   item_id,
                                              AnimatableProperty property,
                                              std::string_view   keyframe_id,
                                              double             value)
{
    if (item_id != animation_.item_id())
    {
        KEYLINE_LOG_WARN("auto-key",
                         "sink for '{}' asked to update a keyframe on '{}'",
                         animation_.item_id(),
                         std::string(item_id));
        return;
    }

    KeyframeUpdate update;
    update.value = value;
    if (!animation_.update_keyframe(property, keyframe_id, update))
        KEYLINE_LOG_WARN("auto-key", "keyframe '{}' vanished before update", std::string(keyframe_id));
}

// ─── Application ─────────────────────────────────────────────────────────────

bool auto_keyframe_property(KeyframeSink&        sink,
                            const Clip&          item,
                            const ItemAnimation* animation,
                            AnimatableProperty   property,
                            double               value,
                            int                  current_frame)
{
    const int relative_frame = current_frame - item.from;
    auto decision = decide_auto_keyframe(animation, property, relative_frame, item.duration_in_frames);
    if (!decision.handled)
        return false;

    switch (decision.action)
    {
        case AutoKeyframeAction::Update:
            sink.update_keyframe_value(item.id, property, decision.existing_keyframe_id, value);
            break;
        case AutoKeyframeAction::Add:
            sink.add_keyframe(item.id, property, relative_frame, value, decision.easing);
            break;
    }
    return true;
}

bool auto_keyframe_properties(KeyframeSink&                 sink,
                              const Clip&                   item,
                              const ItemAnimation*          animation,
                              std::span<const PropertyEdit> edits,
                              int                           current_frame)
{
    bool any_handled = false;
    for (const auto& edit : edits)
    {
        if (auto_keyframe_property(sink, item, animation, edit.property, edit.value, current_frame))
            any_handled = true;
    }
    return !any_handled;
}

}   // namespace keyline
