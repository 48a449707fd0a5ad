#include <algorithm>
#include <keyline/keyframe.hpp>
#include <keyline/logger.hpp>

namespace keyline
{

// ─── Property metadata ───────────────────────────────────────────────────────

namespace
{

constexpr PropertyRange kPositionRange{-1000.0, 2000.0, "px", 0};
constexpr PropertyRange kSizeRange{0.0, 2000.0, "px", 0};
constexpr PropertyRange kRotationRange{-360.0, 360.0, "deg", 1};
constexpr PropertyRange kOpacityRange{0.0, 1.0, "", 2};
constexpr PropertyRange kCornerRadiusRange{0.0, 1000.0, "px", 0};

bool frame_less(const Keyframe& kf, int frame)
{
    return kf.frame < frame;
}

}   // anonymous namespace

const PropertyRange& property_range(AnimatableProperty property)
{
    switch (property)
    {
        case AnimatableProperty::X:
        case AnimatableProperty::Y:
            return kPositionRange;
        case AnimatableProperty::Width:
        case AnimatableProperty::Height:
            return kSizeRange;
        case AnimatableProperty::Rotation:
            return kRotationRange;
        case AnimatableProperty::Opacity:
            return kOpacityRange;
        case AnimatableProperty::CornerRadius:
            return kCornerRadiusRange;
    }
    return kOpacityRange;
}

const char* property_name(AnimatableProperty property)
{
    switch (property)
    {
        case AnimatableProperty::X:
            return "x";
        case AnimatableProperty::Y:
            return "y";
        case AnimatableProperty::Width:
            return "width";
        case AnimatableProperty::Height:
            return "height";
        case AnimatableProperty::Rotation:
            return "rotation";
        case AnimatableProperty::Opacity:
            return "opacity";
        case AnimatableProperty::CornerRadius:
            return "cornerRadius";
    }
    return "unknown";
}

std::optional<AnimatableProperty> property_from_name(std::string_view name)
{
    for (auto p : kAnimatableProperties)
    {
        if (name == property_name(p))
            return p;
    }
    return std::nullopt;
}

// ─── ItemAnimation ───────────────────────────────────────────────────────────

ItemAnimation::ItemAnimation(std::string item_id) : item_id_(std::move(item_id)) {}

const PropertyTrack* ItemAnimation::track(AnimatableProperty property) const
{
    for (const auto& t : tracks_)
    {
        if (t.property == property)
            return &t;
    }
    return nullptr;
}

PropertyTrack* ItemAnimation::find_track(AnimatableProperty property)
{
    for (auto& t : tracks_)
    {
        if (t.property == property)
            return &t;
    }
    return nullptr;
}

std::span<const Keyframe> ItemAnimation::keyframes(AnimatableProperty property) const
{
    const auto* t = track(property);
    if (!t)
        return {};
    return t->keyframes;
}

const Keyframe* ItemAnimation::find_keyframe(AnimatableProperty property, std::string_view id) const
{
    for (const auto& kf : keyframes(property))
    {
        if (kf.id == id)
            return &kf;
    }
    return nullptr;
}

const Keyframe* ItemAnimation::keyframe_at(AnimatableProperty property, int frame) const
{
    auto kfs = keyframes(property);
    auto it  = std::lower_bound(kfs.begin(), kfs.end(), frame, frame_less);
    if (it != kfs.end() && it->frame == frame)
        return &*it;
    return nullptr;
}

bool ItemAnimation::is_animated(AnimatableProperty property) const
{
    return track(property) != nullptr;
}

size_t ItemAnimation::keyframe_count() const
{
    size_t count = 0;
    for (const auto& t : tracks_)
        count += t.keyframes.size();
    return count;
}

std::string ItemAnimation::generate_id()
{
    return "kf-" + std::to_string(next_id_++);
}

std::optional<std::string> ItemAnimation::add_keyframe(AnimatableProperty property,
                                                       int                frame,
                                                       double             value,
                                                       EasingSpec         easing,
                                                       std::string        id)
{
    if (frame < 0)
    {
        KEYLINE_LOG_DEBUG("animation",
                          "rejected keyframe at negative frame {} on {}",
                          frame,
                          property_name(property));
        return std::nullopt;
    }

    auto* t = find_track(property);
    if (!t)
    {
        tracks_.push_back(PropertyTrack{property, {}});
        t = &tracks_.back();
    }

    auto& kfs = t->keyframes;
    auto  it  = std::lower_bound(kfs.begin(), kfs.end(), frame, frame_less);
    if (it != kfs.end() && it->frame == frame)
    {
        it->value  = value;
        it->easing = easing;
        return it->id;
    }

    if (id.empty())
        id = generate_id();

    Keyframe kf;
    kf.id     = id;
    kf.frame  = frame;
    kf.value  = value;
    kf.easing = easing;
    kfs.insert(it, std::move(kf));
    return id;
}

bool ItemAnimation::update_keyframe(AnimatableProperty    property,
                                    std::string_view      id,
                                    const KeyframeUpdate& update)
{
    auto* t = find_track(property);
    if (!t)
        return false;

    auto& kfs = t->keyframes;
    auto  it  = std::find_if(kfs.begin(), kfs.end(), [id](const Keyframe& kf) { return kf.id == id; });
    if (it == kfs.end())
        return false;

    if (update.frame && *update.frame != it->frame)
    {
        const int target = *update.frame;
        if (target < 0)
            return false;
        bool occupied = std::any_of(kfs.begin(),
                                    kfs.end(),
                                    [target](const Keyframe& kf) { return kf.frame == target; });
        if (occupied)
        {
            KEYLINE_LOG_DEBUG("animation",
                              "rejected move of {} onto occupied frame {}",
                              std::string(id),
                              target);
            return false;
        }
        it->frame = target;
    }
    if (update.value)
        it->value = *update.value;
    if (update.easing)
        it->easing = *update.easing;

    if (update.frame)
    {
        std::sort(kfs.begin(),
                  kfs.end(),
                  [](const Keyframe& a, const Keyframe& b) { return a.frame < b.frame; });
    }
    return true;
}

bool ItemAnimation::remove_keyframe(AnimatableProperty property, std::string_view id)
{
    auto* t = find_track(property);
    if (!t)
        return false;

    auto removed = std::erase_if(t->keyframes, [id](const Keyframe& kf) { return kf.id == id; });
    if (removed == 0)
        return false;

    if (t->keyframes.empty())
        remove_property(property);
    return true;
}

bool ItemAnimation::remove_property(AnimatableProperty property)
{
    return std::erase_if(tracks_, [property](const PropertyTrack& t) { return t.property == property; }) > 0;
}

void ItemAnimation::clear()
{
    tracks_.clear();
}

}   // namespace keyline
