#include <gtest/gtest.h>

#include "ui/graph_viewport.hpp"

using namespace keyline;

namespace
{

GraphViewport make_viewport()
{
    GraphViewport vp;
    vp.width       = 600.0;
    vp.height      = 200.0;
    vp.start_frame = 0.0;
    vp.end_frame   = 300.0;
    vp.min_value   = -1000.0;
    vp.max_value   = 2000.0;
    return vp;
}

}   // anonymous namespace

// ─── Mapping ─────────────────────────────────────────────────────────────────

TEST(GraphViewport, FrameAndValueToScreen)
{
    auto vp = make_viewport();
    EXPECT_DOUBLE_EQ(vp.frame_to_x(0.0), 0.0);
    EXPECT_DOUBLE_EQ(vp.frame_to_x(150.0), 300.0);
    EXPECT_DOUBLE_EQ(vp.frame_to_x(300.0), 600.0);

    // Higher values sit higher on screen.
    EXPECT_DOUBLE_EQ(vp.value_to_y(2000.0), 0.0);
    EXPECT_DOUBLE_EQ(vp.value_to_y(-1000.0), 200.0);
    EXPECT_DOUBLE_EQ(vp.value_to_y(500.0), 100.0);
}

TEST(GraphViewport, ScreenToDataInvertsMapping)
{
    auto vp = make_viewport();
    for (double f : {0.0, 12.5, 150.0, 299.0})
        EXPECT_NEAR(vp.x_to_frame(vp.frame_to_x(f)), f, 1e-9);
    for (double v : {-1000.0, 0.0, 733.3, 2000.0})
        EXPECT_NEAR(vp.y_to_value(vp.value_to_y(v)), v, 1e-9);
}

TEST(GraphViewport, PaddingInsetsPlotArea)
{
    auto         vp = make_viewport();
    GraphPadding pad{10.0, 20.0, 30.0, 40.0};
    EXPECT_DOUBLE_EQ(vp.plot_width(pad), 540.0);
    EXPECT_DOUBLE_EQ(vp.plot_height(pad), 160.0);
    EXPECT_DOUBLE_EQ(vp.frame_to_x(0.0, pad), 40.0);
    EXPECT_DOUBLE_EQ(vp.value_to_y(2000.0, pad), 10.0);
    EXPECT_DOUBLE_EQ(vp.value_to_y(-1000.0, pad), 170.0);
    EXPECT_NEAR(vp.x_to_frame(40.0 + 270.0, pad), 150.0, 1e-9);
}

TEST(GraphViewport, UnitsPerPixel)
{
    auto vp = make_viewport();
    EXPECT_DOUBLE_EQ(vp.frames_per_px(), 0.5);
    EXPECT_DOUBLE_EQ(vp.values_per_px(), 15.0);

    vp.width  = 0.0;
    vp.height = 0.0;
    EXPECT_DOUBLE_EQ(vp.frames_per_px(), 0.0);
    EXPECT_DOUBLE_EQ(vp.values_per_px(), 0.0);
}

TEST(GraphViewport, DegenerateRangesDoNotDivideByZero)
{
    GraphViewport vp;
    vp.end_frame = vp.start_frame;
    vp.max_value = vp.min_value;
    EXPECT_DOUBLE_EQ(vp.frame_to_x(10.0), 0.0);
    EXPECT_DOUBLE_EQ(vp.value_to_y(10.0), vp.height);
}

// ─── Zoom ────────────────────────────────────────────────────────────────────

TEST(GraphViewport, ZoomAroundKeepsAnchorFixed)
{
    auto vp = make_viewport();
    vp.zoom_around(0.5, 150.0, 500.0, 2.0, 0.01);
    EXPECT_DOUBLE_EQ(vp.frame_span(), 150.0);
    EXPECT_DOUBLE_EQ(vp.value_span(), 1500.0);
    EXPECT_NEAR(vp.frame_to_x(150.0), 300.0, 1e-9);
    EXPECT_NEAR(vp.value_to_y(500.0), 100.0, 1e-9);
}

TEST(GraphViewport, ZoomOutClampsStartAtZero)
{
    auto vp = make_viewport();
    vp.zoom_around(2.0, 30.0, 500.0, 2.0, 0.01);
    EXPECT_DOUBLE_EQ(vp.start_frame, 0.0);
    EXPECT_GT(vp.end_frame, 300.0);
}

TEST(GraphViewport, ZoomRespectsMinimumSpans)
{
    auto vp = make_viewport();
    for (int i = 0; i < 200; ++i)
        vp.zoom_around(0.5, 10.0, 0.0, 2.0, 0.01);
    EXPECT_GE(vp.frame_span(), 2.0 - 1e-9);
    EXPECT_GE(vp.value_span(), 0.01 - 1e-12);
    EXPECT_GE(vp.start_frame, 0.0);
}

TEST(GraphViewport, ZoomNearZeroKeepsMinimumSpan)
{
    GraphViewport vp;
    vp.start_frame = 0.0;
    vp.end_frame   = 3.0;
    vp.zoom_around(0.1, 0.5, 0.5, 2.0, 0.01);
    EXPECT_GE(vp.frame_span(), 2.0 - 1e-9);
    EXPECT_GE(vp.start_frame, 0.0);
}

TEST(GraphViewport, ZoomCenteredScalesAroundMiddle)
{
    auto vp = make_viewport();
    vp.zoom_centered(0.8, 2.0, 0.01);
    EXPECT_DOUBLE_EQ(vp.start_frame, 30.0);
    EXPECT_DOUBLE_EQ(vp.end_frame, 270.0);
    EXPECT_DOUBLE_EQ(vp.min_value, -700.0);
    EXPECT_DOUBLE_EQ(vp.max_value, 1700.0);
}

TEST(GraphViewport, InvalidZoomFactorIgnored)
{
    auto       vp     = make_viewport();
    const auto before = vp;
    vp.zoom_around(0.0, 10.0, 0.0, 2.0, 0.01);
    vp.zoom_around(-1.0, 10.0, 0.0, 2.0, 0.01);
    EXPECT_EQ(vp, before);
}
