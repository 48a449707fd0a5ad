#include <gtest/gtest.h>
#include <keyline/easing_presets.hpp>
#include <set>
#include <string>

using namespace keyline;

TEST(EasingPresets, IdsAreUnique)
{
    std::set<std::string> ids;
    for (const auto& p : easing_presets())
        EXPECT_TRUE(ids.insert(p.id).second) << p.id;
    EXPECT_EQ(ids.size(), easing_presets().size());
}

TEST(EasingPresets, EveryCategoryIsPopulated)
{
    size_t total = 0;
    for (const auto& cat : easing_categories())
    {
        auto presets = presets_in_category(cat.category);
        EXPECT_FALSE(presets.empty()) << cat.name;
        for (const auto* p : presets)
            EXPECT_EQ(p->category, cat.category);
        total += presets.size();
    }
    EXPECT_EQ(total, easing_presets().size());
}

TEST(EasingPresets, LookupById)
{
    const auto* back = preset_by_id("ease-out-back");
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(back->spec, EasingSpec::cubic_bezier(0.34, 1.56, 0.64, 1.0));

    const auto* bouncy = preset_by_id("spring-bouncy");
    ASSERT_NE(bouncy, nullptr);
    EXPECT_EQ(bouncy->spec.spring, (ease::Spring{300.0, 10.0, 1.0}));

    EXPECT_EQ(preset_by_id("nope"), nullptr);
}

TEST(EasingPresets, EveryPresetEndsAtOne)
{
    for (const auto& p : easing_presets())
    {
        EXPECT_EQ(evaluate(0.0, p.spec), 0.0) << p.id;
        EXPECT_EQ(evaluate(1.0, p.spec), 1.0) << p.id;
    }
}

TEST(EasingPresets, MatchesBezierWithinTolerance)
{
    const auto* m = find_matching_preset(EasingSpec::cubic_bezier(0.345, 1.555, 0.64, 1.0));
    ASSERT_NE(m, nullptr);
    EXPECT_STREQ(m->id, "ease-out-back");

    EXPECT_EQ(find_matching_preset(EasingSpec::cubic_bezier(0.1, 0.9, 0.1, 0.9)), nullptr);
}

TEST(EasingPresets, MatchesSpringExactly)
{
    const auto* m = find_matching_preset(EasingSpec::spring_physics(170.0, 26.0, 1.0));
    ASSERT_NE(m, nullptr);
    EXPECT_STREQ(m->id, "spring-default");

    EXPECT_EQ(find_matching_preset(EasingSpec::spring_physics(170.0, 25.0, 1.0)), nullptr);
}

TEST(EasingPresets, MatchesFixedKindsByKind)
{
    const auto* m = find_matching_preset(EasingSpec::of(EasingKind::EaseInOut));
    ASSERT_NE(m, nullptr);
    EXPECT_STREQ(m->id, "ease-in-out-quad");
}
