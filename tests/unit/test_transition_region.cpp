#include <cmath>
#include <gtest/gtest.h>
#include <keyline/transition.hpp>
#include <vector>

using namespace keyline;

namespace
{

Transition make_transition(std::string id, std::string left, std::string right, int duration, double alignment = 0.5)
{
    Transition t;
    t.id                 = std::move(id);
    t.left_clip_id       = std::move(left);
    t.right_clip_id      = std::move(right);
    t.track_id           = "track-1";
    t.duration_in_frames = duration;
    t.alignment          = alignment;
    return t;
}

}   // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Portions
// ═══════════════════════════════════════════════════════════════════════════════

TEST(TransitionPortions, CentredSplit)
{
    EXPECT_EQ(transition_portions(20), (TransitionPortions{10, 10}));
    EXPECT_EQ(transition_portions(7), (TransitionPortions{3, 4}));
}

TEST(TransitionPortions, AlignmentExtremes)
{
    EXPECT_EQ(transition_portions(12, 0.0), (TransitionPortions{0, 12}));
    EXPECT_EQ(transition_portions(12, 1.0), (TransitionPortions{12, 0}));
    EXPECT_EQ(transition_portions(12, 2.5), (TransitionPortions{12, 0}));
    EXPECT_EQ(transition_portions(12, -1.0), (TransitionPortions{0, 12}));
}

TEST(TransitionPortions, NaNAlignmentCentres)
{
    EXPECT_EQ(transition_portions(10, std::nan("")), (TransitionPortions{5, 5}));
}

TEST(TransitionPortions, EmptyDurationTakesNothing)
{
    EXPECT_EQ(transition_portions(0), (TransitionPortions{0, 0}));
    EXPECT_EQ(transition_portions(-4), (TransitionPortions{0, 0}));
}

TEST(TransitionPortions, AlwaysSumToDuration)
{
    for (int d = 1; d <= 40; ++d)
    {
        for (int a = 0; a <= 10; ++a)
        {
            auto p = transition_portions(d, a / 10.0);
            EXPECT_EQ(p.incoming + p.outgoing, d);
            EXPECT_GE(p.incoming, 0);
            EXPECT_GE(p.outgoing, 0);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Fitting to short clips
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FitPortions, UnchangedWhenTheyFit)
{
    EXPECT_EQ(fit_portions_to_clip(30, 10, 10), (TransitionPortions{10, 10}));
    EXPECT_EQ(fit_portions_to_clip(20, 10, 10), (TransitionPortions{10, 10}));
}

TEST(FitPortions, ScalesProportionally)
{
    EXPECT_EQ(fit_portions_to_clip(10, 8, 8), (TransitionPortions{5, 5}));
}

TEST(FitPortions, LeftoverGoesToSmallerPortion)
{
    // 6 and 4 into 7: floors give 4 in and 2 out, spare frame to outgoing.
    EXPECT_EQ(fit_portions_to_clip(7, 6, 4), (TransitionPortions{3, 4}));
}

TEST(FitPortions, LeftoverTieGoesToIncoming)
{
    EXPECT_EQ(fit_portions_to_clip(7, 5, 5), (TransitionPortions{3, 4}));
}

TEST(FitPortions, ZeroLengthClip)
{
    EXPECT_EQ(fit_portions_to_clip(0, 5, 5), (TransitionPortions{0, 0}));
}

TEST(FitPortions, NeverExceedsClipOrRequests)
{
    for (int clip = 1; clip <= 30; ++clip)
    {
        for (int in = 0; in <= 20; ++in)
        {
            for (int out = 0; out <= 20; ++out)
            {
                auto p = fit_portions_to_clip(clip, in, out);
                EXPECT_LE(p.incoming + p.outgoing, clip);
                EXPECT_LE(p.incoming, in);
                EXPECT_LE(p.outgoing, out);
                if (in + out > clip)
                {
                    EXPECT_EQ(p.incoming + p.outgoing, clip);
                }
            }
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Blocked ranges
// ═══════════════════════════════════════════════════════════════════════════════

TEST(BlockedRanges, NoTransitions)
{
    Clip clip{"b", 100, 30};
    EXPECT_TRUE(blocked_ranges(clip, {}).empty());
    EXPECT_FALSE(clip_has_transitions("b", {}));
}

TEST(BlockedRanges, BothEndsOfLongClip)
{
    Clip                    clip{"b", 100, 30};
    std::vector<Transition> ts = {make_transition("t1", "a", "b", 20), make_transition("t2", "b", "c", 20)};

    auto ranges = blocked_ranges(clip, ts);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].role, TransitionRole::Incoming);
    EXPECT_EQ(ranges[0].start, 0);
    EXPECT_EQ(ranges[0].end, 10);
    EXPECT_EQ(ranges[0].transition_id, "t1");
    EXPECT_EQ(ranges[1].role, TransitionRole::Outgoing);
    EXPECT_EQ(ranges[1].start, 20);
    EXPECT_EQ(ranges[1].end, 30);
    EXPECT_EQ(ranges[1].transition_id, "t2");
    EXPECT_TRUE(clip_has_transitions("b", ts));
}

TEST(BlockedRanges, OverCommittedClipIsRebalanced)
{
    Clip                    clip{"b", 0, 10};
    std::vector<Transition> ts = {make_transition("t1", "a", "b", 16), make_transition("t2", "b", "c", 16)};

    auto ranges = blocked_ranges(clip, ts);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].end, 5);
    EXPECT_EQ(ranges[1].start, 5);
    EXPECT_EQ(ranges[1].end, 10);
}

TEST(BlockedRanges, SingleSidedTransitionNotFitted)
{
    // Only an outgoing transition: its portion is clamped to the clip.
    Clip                    clip{"a", 0, 6};
    std::vector<Transition> ts = {make_transition("t1", "a", "b", 20)};

    auto ranges = blocked_ranges(clip, ts);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0].start, 0);
    EXPECT_EQ(ranges[0].end, 6);
}

TEST(BlockedRanges, ZeroLengthTransitionBlocksNothing)
{
    Clip                    left{"a", 0, 30};
    Clip                    right{"b", 30, 30};
    std::vector<Transition> ts = {make_transition("t1", "a", "b", 0)};

    EXPECT_TRUE(blocked_ranges(left, ts).empty());
    EXPECT_TRUE(blocked_ranges(right, ts).empty());
    EXPECT_FALSE(is_blocked(0, right, ts).has_value());
}

TEST(BlockedRanges, EmptyPortionIsOmitted)
{
    // A one-frame centred transition takes nothing from the left clip.
    Clip                    left{"a", 0, 30};
    Clip                    right{"b", 30, 30};
    std::vector<Transition> ts = {make_transition("t1", "a", "b", 1)};

    EXPECT_TRUE(blocked_ranges(left, ts).empty());
    auto ranges = blocked_ranges(right, ts);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0].length(), 1);
}

TEST(BlockedRanges, AlignmentShiftsBlockedSide)
{
    Clip                    left{"a", 0, 30};
    Clip                    right{"b", 30, 30};
    std::vector<Transition> ts = {make_transition("t1", "a", "b", 12, 1.0)};

    auto l = blocked_ranges(left, ts);
    ASSERT_EQ(l.size(), 1u);
    EXPECT_EQ(l[0].start, 18);
    EXPECT_TRUE(blocked_ranges(right, ts).empty());
}

TEST(BlockedRanges, FirstMatchPerSideWins)
{
    Clip                    clip{"b", 0, 40};
    std::vector<Transition> ts = {make_transition("t1", "a", "b", 10), make_transition("t2", "x", "b", 30)};

    auto ranges = blocked_ranges(clip, ts);
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0].transition_id, "t1");
}

TEST(BlockedRanges, DisjointAndInsideClipForAnyDuration)
{
    for (int clip_len = 1; clip_len <= 40; ++clip_len)
    {
        for (int t_len = 1; t_len <= 40; t_len += 3)
        {
            Clip                    clip{"b", 0, clip_len};
            std::vector<Transition> ts = {make_transition("t1", "a", "b", t_len),
                                          make_transition("t2", "b", "c", t_len + 1)};

            auto ranges = blocked_ranges(clip, ts);
            for (const auto& r : ranges)
            {
                EXPECT_GT(r.end, r.start);
                EXPECT_GE(r.start, 0);
                EXPECT_LE(r.end, clip_len);
            }
            if (ranges.size() == 2)
            {
                EXPECT_LE(ranges[0].end, ranges[1].start) << "clip " << clip_len << " transition " << t_len;
            }
        }
    }
}

// ─── Queries ─────────────────────────────────────────────────────────────────

TEST(BlockedRanges, IsBlockedIsHalfOpen)
{
    Clip                    clip{"b", 100, 30};
    std::vector<Transition> ts = {make_transition("t1", "a", "b", 20), make_transition("t2", "b", "c", 20)};

    EXPECT_TRUE(is_blocked(0, clip, ts).has_value());
    EXPECT_TRUE(is_blocked(9.5, clip, ts).has_value());
    EXPECT_FALSE(is_blocked(10, clip, ts).has_value());
    EXPECT_FALSE(is_blocked(19, clip, ts).has_value());
    EXPECT_TRUE(is_blocked(20, clip, ts).has_value());
    EXPECT_EQ(is_blocked(29, clip, ts)->role, TransitionRole::Outgoing);
    EXPECT_FALSE(is_blocked(30, clip, ts).has_value());
}

TEST(BlockedRanges, MessageNamesClipSide)
{
    BlockedFrameRange out{20, 30, TransitionRole::Outgoing, "t2"};
    BlockedFrameRange in{0, 10, TransitionRole::Incoming, "t1"};
    EXPECT_EQ(blocked_message(out),
              "Keyframes cannot be added here. This region is part of a transition at the end of the clip.");
    EXPECT_EQ(blocked_message(in),
              "Keyframes cannot be added here. This region is part of a transition at the start of the clip.");
    EXPECT_STREQ(transition_role_name(TransitionRole::Incoming), "incoming");
}
