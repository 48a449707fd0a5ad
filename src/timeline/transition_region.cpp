#include <algorithm>
#include <cmath>
#include <keyline/logger.hpp>
#include <keyline/transition.hpp>

namespace keyline
{

TransitionPortions transition_portions(int duration_in_frames, double alignment)
{
    if (duration_in_frames <= 0)
        return TransitionPortions{0, 0};

    const int    duration = duration_in_frames;
    const double align    = std::isnan(alignment) ? 0.5 : std::clamp(alignment, 0.0, 1.0);

    TransitionPortions p;
    p.outgoing = static_cast<int>(std::floor(duration * align));
    p.incoming = duration - p.outgoing;
    return p;
}

TransitionPortions fit_portions_to_clip(int clip_duration, int incoming, int outgoing)
{
    const int available = std::max(0, clip_duration);
    const int in_use    = std::max(0, incoming);
    const int out_use   = std::max(0, outgoing);
    const int total     = in_use + out_use;

    if (total <= available)
        return TransitionPortions{out_use, in_use};
    if (available == 0)
        return TransitionPortions{0, 0};

    const double scale   = static_cast<double>(available) / static_cast<double>(total);
    int          new_in  = static_cast<int>(std::floor(in_use * scale));
    int          new_out = static_cast<int>(std::floor(out_use * scale));

    // Flooring loses at most one frame per portion. Hand leftovers to the
    // smaller portion (incoming on a tie) without exceeding what it asked for.
    int remaining = available - (new_in + new_out);
    while (remaining > 0)
    {
        const bool in_can_grow  = new_in < in_use;
        const bool out_can_grow = new_out < out_use;
        if (!in_can_grow && !out_can_grow)
            break;

        const bool prefer_in = new_in <= new_out;
        if ((prefer_in && in_can_grow) || !out_can_grow)
            ++new_in;
        else
            ++new_out;
        --remaining;
    }

    KEYLINE_LOG_DEBUG("transition",
                      "clip of {} frames over-committed ({} in + {} out), fitted to {} in + {} out",
                      clip_duration,
                      in_use,
                      out_use,
                      new_in,
                      new_out);
    return TransitionPortions{new_out, new_in};
}

std::vector<BlockedFrameRange> blocked_ranges(const Clip& clip, std::span<const Transition> transitions)
{
    std::vector<BlockedFrameRange> ranges;
    const int                      duration = std::max(0, clip.duration_in_frames);
    if (duration == 0)
        return ranges;

    const Transition* incoming = nullptr;
    const Transition* outgoing = nullptr;
    for (const auto& t : transitions)
    {
        if (!incoming && t.right_clip_id == clip.id)
            incoming = &t;
        if (!outgoing && t.left_clip_id == clip.id)
            outgoing = &t;
    }

    int in_portion  = incoming ? transition_portions(incoming->duration_in_frames, incoming->alignment).incoming : 0;
    int out_portion = outgoing ? transition_portions(outgoing->duration_in_frames, outgoing->alignment).outgoing : 0;

    // Back-to-back transitions must leave each other room on a short clip.
    if (incoming && outgoing)
    {
        auto fitted = fit_portions_to_clip(duration, in_portion, out_portion);
        in_portion  = fitted.incoming;
        out_portion = fitted.outgoing;
    }

    if (incoming)
    {
        BlockedFrameRange r;
        r.start         = 0;
        r.end           = std::clamp(in_portion, 0, duration);
        r.role          = TransitionRole::Incoming;
        r.transition_id = incoming->id;
        if (r.end > r.start)
            ranges.push_back(std::move(r));
    }

    if (outgoing)
    {
        BlockedFrameRange r;
        r.start         = std::clamp(duration - out_portion, 0, duration);
        r.end           = duration;
        r.role          = TransitionRole::Outgoing;
        r.transition_id = outgoing->id;
        if (r.end > r.start)
            ranges.push_back(std::move(r));
    }

    return ranges;
}

std::optional<BlockedFrameRange> is_blocked(double frame, const Clip& clip, std::span<const Transition> transitions)
{
    for (auto& range : blocked_ranges(clip, transitions))
    {
        if (range.contains(frame))
            return std::move(range);
    }
    return std::nullopt;
}

bool clip_has_transitions(std::string_view clip_id, std::span<const Transition> transitions)
{
    return std::any_of(transitions.begin(),
                       transitions.end(),
                       [clip_id](const Transition& t)
                       { return t.left_clip_id == clip_id || t.right_clip_id == clip_id; });
}

std::string blocked_message(const BlockedFrameRange& range)
{
    const char* position = range.role == TransitionRole::Outgoing ? "end" : "start";
    return std::string("Keyframes cannot be added here. This region is part of a transition at the ") +
           position + " of the clip.";
}

const char* transition_role_name(TransitionRole role)
{
    switch (role)
    {
        case TransitionRole::Outgoing:
            return "outgoing";
        case TransitionRole::Incoming:
            return "incoming";
    }
    return "unknown";
}

}   // namespace keyline
