#pragma once

#include "ui/editor_config.hpp"

namespace keyline
{

// Visible rectangle of a value graph: widget size in pixels plus the frame
// and value ranges it shows. Frames grow to the right, values grow upward.
// Screen coordinates are local to the widget; `padding` insets the plot area.
struct GraphViewport
{
    double width       = 400.0;
    double height      = 200.0;
    double start_frame = 0.0;
    double end_frame   = 60.0;
    double min_value   = 0.0;
    double max_value   = 1.0;

    double frame_span() const { return end_frame - start_frame; }
    double value_span() const { return max_value - min_value; }

    double plot_width(const GraphPadding& pad = {}) const;
    double plot_height(const GraphPadding& pad = {}) const;

    // Data -> screen
    double frame_to_x(double frame, const GraphPadding& pad = {}) const;
    double value_to_y(double value, const GraphPadding& pad = {}) const;

    // Screen -> data
    double x_to_frame(double x, const GraphPadding& pad = {}) const;
    double y_to_value(double y, const GraphPadding& pad = {}) const;

    // Data units covered by one pixel; 0 for a degenerate plot area.
    double frames_per_px(const GraphPadding& pad = {}) const;
    double values_per_px(const GraphPadding& pad = {}) const;

    // Rescale both ranges by `factor` (>1 shows more) keeping the data point
    // (frame, value) at the same screen position. Spans never drop below the
    // given minimums and the start frame never goes negative.
    void zoom_around(double factor, double frame, double value, double min_frame_span, double min_value_span);

    // Rescale both ranges by `factor` around their centres.
    void zoom_centered(double factor, double min_frame_span, double min_value_span);

    bool operator==(const GraphViewport&) const = default;
};

}   // namespace keyline
