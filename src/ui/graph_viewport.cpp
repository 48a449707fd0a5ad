#include "ui/graph_viewport.hpp"

#include <algorithm>

namespace keyline
{

double GraphViewport::plot_width(const GraphPadding& pad) const
{
    return width - pad.left - pad.right;
}

double GraphViewport::plot_height(const GraphPadding& pad) const
{
    return height - pad.top - pad.bottom;
}

double GraphViewport::frame_to_x(double frame, const GraphPadding& pad) const
{
    const double span = frame_span();
    if (span <= 0.0)
        return pad.left;
    return pad.left + (frame - start_frame) / span * plot_width(pad);
}

double GraphViewport::value_to_y(double value, const GraphPadding& pad) const
{
    const double span = value_span();
    if (span <= 0.0)
        return pad.top + plot_height(pad);
    // Inverted: higher values sit at lower screen y.
    return pad.top + (1.0 - (value - min_value) / span) * plot_height(pad);
}

double GraphViewport::x_to_frame(double x, const GraphPadding& pad) const
{
    const double w = plot_width(pad);
    if (w <= 0.0)
        return start_frame;
    return start_frame + (x - pad.left) / w * frame_span();
}

double GraphViewport::y_to_value(double y, const GraphPadding& pad) const
{
    const double h = plot_height(pad);
    if (h <= 0.0)
        return min_value;
    return max_value - (y - pad.top) / h * value_span();
}

double GraphViewport::frames_per_px(const GraphPadding& pad) const
{
    const double w = plot_width(pad);
    return w > 0.0 ? frame_span() / w : 0.0;
}

double GraphViewport::values_per_px(const GraphPadding& pad) const
{
    const double h = plot_height(pad);
    return h > 0.0 ? value_span() / h : 0.0;
}

void GraphViewport::zoom_around(double factor,
                                double frame,
                                double value,
                                double min_frame_span,
                                double min_value_span)
{
    const double fspan = frame_span();
    const double vspan = value_span();
    if (fspan <= 0.0 || vspan <= 0.0 || factor <= 0.0)
        return;

    const double new_fspan = std::max(fspan * factor, min_frame_span);
    const double new_vspan = std::max(vspan * factor, min_value_span);

    // Share of the range before the anchor stays the same after scaling.
    const double frame_ratio = (frame - start_frame) / fspan;
    const double value_ratio = (value - min_value) / vspan;

    const double new_start = frame - new_fspan * frame_ratio;
    start_frame            = std::max(0.0, new_start);
    end_frame              = std::max(new_start + new_fspan, start_frame + min_frame_span);
    min_value              = value - new_vspan * value_ratio;
    max_value              = min_value + new_vspan;
}

void GraphViewport::zoom_centered(double factor, double min_frame_span, double min_value_span)
{
    const double centre_frame = (start_frame + end_frame) * 0.5;
    const double centre_value = (min_value + max_value) * 0.5;
    zoom_around(factor, centre_frame, centre_value, min_frame_span, min_value_span);
}

}   // namespace keyline
