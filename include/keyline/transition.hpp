#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyline
{

// A timeline item as far as frame bookkeeping is concerned.
struct Clip
{
    std::string id;
    int         from               = 0;   // absolute start frame
    int         duration_in_frames = 0;
};

// Cross effect between two adjacent clips on the same track.
// `alignment` places the effect relative to the cut: 0.5 centres it,
// 0 puts it entirely on the right clip, 1 entirely on the left clip.
struct Transition
{
    std::string id;
    std::string left_clip_id;
    std::string right_clip_id;
    std::string track_id;
    int         duration_in_frames = 0;
    double      alignment          = 0.5;
};

enum class TransitionRole : uint8_t
{
    Outgoing,   // end of the left clip
    Incoming,   // start of the right clip
};

// Clip-relative frames reserved by a transition: [start, end).
struct BlockedFrameRange
{
    int            start = 0;
    int            end   = 0;
    TransitionRole role  = TransitionRole::Outgoing;
    std::string    transition_id;

    bool contains(double frame) const { return frame >= start && frame < end; }
    int  length() const { return end - start; }

    bool operator==(const BlockedFrameRange&) const = default;
};

struct TransitionPortions
{
    int outgoing = 0;   // frames taken from the end of the left clip
    int incoming = 0;   // frames taken from the start of the right clip

    bool operator==(const TransitionPortions&) const = default;
};

// Split of a transition's duration around the cut for a given alignment.
// A transition without frames takes nothing from either clip.
TransitionPortions transition_portions(int duration_in_frames, double alignment = 0.5);

// Shrinks the portions a clip gives to its incoming and outgoing
// transitions so that together they fit in `clip_duration`. Both portions
// scale by available/total (floored); the leftover frame goes to whichever
// portion is currently smaller.
TransitionPortions fit_portions_to_clip(int clip_duration, int incoming, int outgoing);

// Frame ranges of `clip` where keyframes must not be placed, at most one per
// attached transition. Ranges never overlap, are never empty, and lie
// within [0, clip.duration_in_frames].
std::vector<BlockedFrameRange> blocked_ranges(const Clip& clip, std::span<const Transition> transitions);

// First blocked range containing `frame`, if any.
std::optional<BlockedFrameRange> is_blocked(double                      frame,
                                            const Clip&                 clip,
                                            std::span<const Transition> transitions);

bool clip_has_transitions(std::string_view clip_id, std::span<const Transition> transitions);

// User-facing explanation for a refused keyframe placement.
std::string blocked_message(const BlockedFrameRange& range);

const char* transition_role_name(TransitionRole role);

}   // namespace keyline
