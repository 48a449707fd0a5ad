#include "ui/graph_editor.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <keyline/interpolate.hpp>
#include <keyline/logger.hpp>
#include <limits>
#include <type_traits>

namespace keyline
{

namespace
{

constexpr double kValueCommitEpsilon = 1e-4;

// Closest target within `threshold`, else `value` unchanged.
double snap_to(double value, const std::vector<double>& targets, double threshold)
{
    double best      = value;
    double best_dist = std::numeric_limits<double>::infinity();
    for (double t : targets)
    {
        const double d = std::abs(value - t);
        if (d <= threshold && d < best_dist)
        {
            best_dist = d;
            best      = t;
        }
    }
    return best;
}

void push_unique(std::vector<double>& v, double x)
{
    if (std::find(v.begin(), v.end(), x) == v.end())
        v.push_back(x);
}

double distance_sq(double ax, double ay, double bx, double by)
{
    const double dx = ax - bx;
    const double dy = ay - by;
    return dx * dx + dy * dy;
}

}   // anonymous namespace

// ─── GraphEditorContext ──────────────────────────────────────────────────────

const Keyframe* GraphEditorContext::find(std::string_view keyframe_id) const
{
    for (const auto& kf : keyframes)
    {
        if (kf.id == keyframe_id)
            return &kf;
    }
    return nullptr;
}

bool GraphEditorContext::is_selected(std::string_view keyframe_id) const
{
    return std::find(selected_ids.begin(), selected_ids.end(), keyframe_id) != selected_ids.end();
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

GraphEditor::GraphEditor(GraphEditorConfig config, PointerCaptureTarget* capture_target)
    : config_(config), capture_target_(capture_target), snap_enabled_(config.snap_enabled)
{
}

GraphEditResult GraphEditor::open(const GraphTarget& target, double width, double height)
{
    GraphEditResult out;
    if (phase_ != DragPhase::Idle)
        finish_gesture(false, out);

    target_           = target;
    viewport_.width   = width;
    viewport_.height  = height;
    viewport_         = fitted_viewport();

    KEYLINE_LOG_DEBUG("graph",
                      "opened {}.{} ({} frames)",
                      target.item_id,
                      property_name(target.property),
                      target.max_frame);

    out.intents.push_back(ViewportChanged{viewport_});
    out.state = state();
    return out;
}

GraphEditResult GraphEditor::close()
{
    GraphEditResult out;
    if (phase_ != DragPhase::Idle)
        finish_gesture(false, out);
    if (target_)
        KEYLINE_LOG_DEBUG("graph", "closed {}", target_->item_id);
    target_.reset();
    out.state = state();
    return out;
}

GraphViewport GraphEditor::fitted_viewport() const
{
    GraphViewport vp = viewport_;
    vp.start_frame   = 0.0;
    vp.end_frame     = config_.default_frame_span;
    vp.min_value     = 0.0;
    vp.max_value     = 1.0;
    if (target_)
    {
        const auto& range = property_range(target_->property);
        vp.end_frame      = std::max(static_cast<double>(target_->max_frame), config_.default_frame_span);
        vp.min_value      = range.min;
        vp.max_value      = range.max;
    }
    return vp;
}

GraphEditorState GraphEditor::state() const
{
    GraphEditorState s;
    s.phase        = phase_;
    s.viewport     = viewport_;
    s.preview      = preview_;
    s.constraint   = constraint_;
    s.snap_enabled = snap_enabled_;
    return s;
}

// ─── Event dispatch ──────────────────────────────────────────────────────────

GraphEditResult GraphEditor::handle_event(const GraphEvent& event, const GraphEditorContext& ctx)
{
    GraphEditResult out;
    if (!target_)
    {
        out.state = state();
        return out;
    }

    std::visit(
        [&](const auto& e)
        {
            using T = std::decay_t<decltype(e)>;

            // Gesture exits are honoured even while disabled so capture is
            // never left behind.
            if constexpr (std::is_same_v<T, PointerUp>)
                on_up(e, ctx, out);
            else if constexpr (std::is_same_v<T, PointerCaptureLost>)
                on_capture_lost(e, out);
            else if constexpr (std::is_same_v<T, GraphResize>)
                on_resize(e, out);
            else if (ctx.disabled)
                return;
            else if constexpr (std::is_same_v<T, KeyframePointerDown>)
                on_keyframe_down(e, ctx, out);
            else if constexpr (std::is_same_v<T, HandlePointerDown>)
                on_handle_down(e, ctx, out);
            else if constexpr (std::is_same_v<T, PointerMove>)
                on_move(e, ctx, out);
            else if constexpr (std::is_same_v<T, WheelScroll>)
                on_wheel(e, ctx, out);
            else if constexpr (std::is_same_v<T, BackgroundClick>)
                on_background_click(e, ctx, out);
            else if constexpr (std::is_same_v<T, ViewportCommand>)
                on_viewport_command(e, ctx, out);
            else if constexpr (std::is_same_v<T, CommitFrameInput>)
                on_commit_frame(e, ctx, out);
            else if constexpr (std::is_same_v<T, CommitValueInput>)
                on_commit_value(e, ctx, out);
            else if constexpr (std::is_same_v<T, NavigateKeyframe>)
                on_navigate(e, ctx, out);
            else if constexpr (std::is_same_v<T, AddKeyframeAtPlayhead>)
                on_add_keyframe(ctx, out);
            else if constexpr (std::is_same_v<T, RemoveSelectedKeyframes>)
                on_remove_selected(ctx, out);
        },
        event);

    out.state = state();
    return out;
}

// ─── Pointer down ────────────────────────────────────────────────────────────

void GraphEditor::on_keyframe_down(const KeyframePointerDown& e,
                                   const GraphEditorContext&  ctx,
                                   GraphEditResult&           out)
{
    if (phase_ != DragPhase::Idle)
        return;

    const Keyframe* kf = ctx.find(e.keyframe_id);
    if (!kf)
    {
        KEYLINE_LOG_TRACE("graph", "pointer down on unknown keyframe '{}'", e.keyframe_id);
        return;
    }

    capture_ = PointerCapture(capture_target_, e.pointer_id);

    const bool was_selected = ctx.is_selected(kf->id);
    if (!was_selected)
    {
        SelectionChanged sel;
        if (e.mods.shift)
            sel.keyframe_ids.assign(ctx.selected_ids.begin(), ctx.selected_ids.end());
        sel.keyframe_ids.push_back(kf->id);
        out.intents.push_back(std::move(sel));
    }

    keyframe_drag_ = KeyframeDrag{kf->id, e.x, e.y, kf->frame, kf->value, was_selected};
    phase_         = DragPhase::PendingKeyframeDrag;
    KEYLINE_LOG_TRACE("graph", "pointer {} captured for keyframe '{}'", e.pointer_id, kf->id);
}

void GraphEditor::on_handle_down(const HandlePointerDown& e, const GraphEditorContext& ctx, GraphEditResult& out)
{
    if (phase_ != DragPhase::Idle)
        return;

    auto it = std::find_if(ctx.keyframes.begin(),
                           ctx.keyframes.end(),
                           [&](const Keyframe& kf) { return kf.id == e.keyframe_id; });
    if (it == ctx.keyframes.end() || it->easing.kind != EasingKind::CubicBezier)
        return;

    auto next = std::next(it);
    if (next == ctx.keyframes.end() || next->frame == it->frame)
    {
        KEYLINE_LOG_DEBUG("graph", "handle of '{}' has no usable segment", e.keyframe_id);
        return;
    }

    const auto& pad = config_.padding;
    handle_drag_    = HandleDrag{it->id,
                              e.handle,
                              viewport_.frame_to_x(it->frame, pad),
                              viewport_.value_to_y(it->value, pad),
                              viewport_.frame_to_x(next->frame, pad),
                              viewport_.value_to_y(next->value, pad),
                              it->easing.bezier};

    capture_      = PointerCapture(capture_target_, e.pointer_id);
    phase_        = DragPhase::DraggingHandle;
    drag_started_ = true;
    out.intents.push_back(DragStarted{});
    KEYLINE_LOG_DEBUG("graph",
                      "handle drag started on '{}' ({})",
                      it->id,
                      e.handle == BezierHandleType::Out ? "out" : "in");
}

// ─── Pointer move ────────────────────────────────────────────────────────────

void GraphEditor::on_move(const PointerMove& e, const GraphEditorContext& ctx, GraphEditResult& out)
{
    if (!capture_.owns(e.pointer_id))
        return;

    switch (phase_)
    {
        case DragPhase::PendingKeyframeDrag:
        case DragPhase::DraggingKeyframe:
            drag_keyframe(e, ctx, out);
            break;
        case DragPhase::DraggingHandle:
            drag_handle(e, out);
            break;
        case DragPhase::Idle:
            break;
    }
}

void GraphEditor::drag_keyframe(const PointerMove& e, const GraphEditorContext& ctx, GraphEditResult& out)
{
    const auto&  d  = keyframe_drag_;
    const double dx = e.x - d.start_x;
    const double dy = e.y - d.start_y;

    if (phase_ == DragPhase::PendingKeyframeDrag)
    {
        const double threshold = config_.drag_threshold_px;
        if (std::abs(dx) <= threshold && std::abs(dy) <= threshold)
            return;
        phase_        = DragPhase::DraggingKeyframe;
        drag_started_ = true;
        out.intents.push_back(DragStarted{});
        KEYLINE_LOG_DEBUG("graph", "keyframe drag started on '{}'", d.keyframe_id);
    }

    const auto& pad         = config_.padding;
    double      frame_delta = dx * viewport_.frames_per_px(pad);
    double      value_delta = -dy * viewport_.values_per_px(pad);
    if (e.mods.alt)
    {
        frame_delta *= config_.fine_adjust_factor;
        value_delta *= config_.fine_adjust_factor;
    }

    double new_frame = d.initial_frame + frame_delta;
    double new_value = d.initial_value + value_delta;

    // Dominant axis is re-evaluated on every move.
    if (e.mods.shift)
    {
        if (std::abs(dx) > std::abs(dy))
        {
            new_value   = d.initial_value;
            constraint_ = ConstraintAxis::Frame;
        }
        else
        {
            new_frame   = d.initial_frame;
            constraint_ = ConstraintAxis::Value;
        }
    }
    else
    {
        constraint_ = ConstraintAxis::None;
    }

    new_frame         = std::clamp(std::round(new_frame), 0.0, static_cast<double>(max_valid_frame()));
    const auto& range = property_range(target_->property);
    new_value         = std::clamp(new_value, range.min, range.max);

    if (snap_enabled_ && !e.mods.ctrl_or_meta())
    {
        // A Shift-locked axis stays at its initial value.
        const auto targets = snap_targets(ctx);
        if (constraint_ != ConstraintAxis::Value)
            new_frame = snap_to(new_frame, targets.frames, config_.snap_threshold_px * viewport_.frames_per_px(pad));
        if (constraint_ != ConstraintAxis::Frame)
            new_value = snap_to(new_value, targets.values, config_.snap_threshold_px * viewport_.values_per_px(pad));
        new_frame = std::clamp(new_frame, 0.0, static_cast<double>(max_valid_frame()));
    }

    const int frame = avoid_blocked(static_cast<int>(std::lround(new_frame)), d.initial_frame, ctx.blocked_ranges);

    preview_ = DragPreview{d.keyframe_id, frame, new_value};
    out.intents.push_back(KeyframeMoved{ref_for(d.keyframe_id), frame, new_value});
}

void GraphEditor::drag_handle(const PointerMove& e, GraphEditResult& out)
{
    const auto&  h      = handle_drag_;
    const double seg_w  = h.end_x - h.start_x;
    const double seg_h  = h.end_y - h.start_y;
    if (seg_w == 0.0)
        return;

    const double x = std::clamp((e.x - h.start_x) / seg_w, 0.0, 1.0);
    const double y = seg_h == 0.0 ? 0.5 : (e.y - h.start_y) / seg_h;   // may overshoot

    ease::CubicBezier bezier = h.initial;
    if (h.handle == BezierHandleType::Out)
    {
        bezier.x1 = x;
        bezier.y1 = y;
    }
    else
    {
        bezier.x2 = x;
        bezier.y2 = y;
    }
    out.intents.push_back(BezierHandleMoved{ref_for(h.keyframe_id), bezier});
}

// ─── Pointer release ─────────────────────────────────────────────────────────

void GraphEditor::on_up(const PointerUp& e, const GraphEditorContext& ctx, GraphEditResult& out)
{
    if (phase_ == DragPhase::Idle || !capture_.owns(e.pointer_id))
        return;

    // A pending drag that never crossed the threshold is a click.
    if (phase_ == DragPhase::PendingKeyframeDrag && !ctx.disabled)
    {
        const auto&      d = keyframe_drag_;
        SelectionChanged sel;
        if (e.mods.shift)
        {
            sel.keyframe_ids.assign(ctx.selected_ids.begin(), ctx.selected_ids.end());
            if (d.was_selected)
                std::erase(sel.keyframe_ids, d.keyframe_id);
            else if (!ctx.is_selected(d.keyframe_id))
                sel.keyframe_ids.push_back(d.keyframe_id);
        }
        else if (e.mods.ctrl_or_meta())
        {
            sel.keyframe_ids.assign(ctx.selected_ids.begin(), ctx.selected_ids.end());
            if (!ctx.is_selected(d.keyframe_id))
                sel.keyframe_ids.push_back(d.keyframe_id);
        }
        else
        {
            sel.keyframe_ids.push_back(d.keyframe_id);
        }
        out.intents.push_back(std::move(sel));
    }

    finish_gesture(false, out);
}

void GraphEditor::on_capture_lost(const PointerCaptureLost& e, GraphEditResult& out)
{
    if (phase_ == DragPhase::Idle || !capture_.owns(e.pointer_id))
        return;
    KEYLINE_LOG_DEBUG("graph", "pointer {} capture lost mid-gesture", e.pointer_id);
    finish_gesture(true, out);
}

void GraphEditor::finish_gesture(bool capture_lost, GraphEditResult& out)
{
    if (capture_lost)
        capture_.disown();
    else
        capture_.release();

    if (drag_started_)
    {
        out.intents.push_back(DragEnded{});
        KEYLINE_LOG_DEBUG("graph", "drag ended");
    }
    reset_gesture();
}

void GraphEditor::reset_gesture()
{
    capture_       = PointerCapture{};
    phase_         = DragPhase::Idle;
    drag_started_  = false;
    keyframe_drag_ = KeyframeDrag{};
    handle_drag_   = HandleDrag{};
    preview_.reset();
    constraint_ = ConstraintAxis::None;
}

// ─── Viewport ────────────────────────────────────────────────────────────────

void GraphEditor::on_wheel(const WheelScroll& e, const GraphEditorContext&, GraphEditResult& out)
{
    if (phase_ != DragPhase::Idle || e.delta_y == 0.0)
        return;

    const auto&  pad    = config_.padding;
    const double factor = e.delta_y > 0.0 ? config_.wheel_zoom_out : config_.wheel_zoom_in;
    const double frame  = viewport_.x_to_frame(e.x, pad);
    const double value  = viewport_.y_to_value(e.y, pad);

    viewport_.zoom_around(factor, frame, value, config_.min_frame_span, config_.min_value_span);
    out.intents.push_back(ViewportChanged{viewport_});
}

void GraphEditor::on_viewport_command(const ViewportCommand& e, const GraphEditorContext&, GraphEditResult& out)
{
    if (phase_ != DragPhase::Idle)
        return;

    switch (e.action)
    {
        case ViewportAction::ZoomIn:
            viewport_.zoom_centered(config_.button_zoom_in, config_.min_frame_span, config_.min_value_span);
            break;
        case ViewportAction::ZoomOut:
            viewport_.zoom_centered(config_.button_zoom_out, config_.min_frame_span, config_.min_value_span);
            break;
        case ViewportAction::Fit:
        case ViewportAction::Reset:
            viewport_ = fitted_viewport();
            break;
    }
    out.intents.push_back(ViewportChanged{viewport_});
}

void GraphEditor::on_resize(const GraphResize& e, GraphEditResult& out)
{
    if (e.width == viewport_.width && e.height == viewport_.height)
        return;
    viewport_.width  = e.width;
    viewport_.height = e.height;
    out.intents.push_back(ViewportChanged{viewport_});
}

void GraphEditor::on_background_click(const BackgroundClick& e, const GraphEditorContext&, GraphEditResult& out)
{
    if (!e.target_is_background || phase_ != DragPhase::Idle)
        return;
    out.intents.push_back(SelectionChanged{});
}

// ─── Toolbar actions ─────────────────────────────────────────────────────────

void GraphEditor::on_commit_frame(const CommitFrameInput& e, const GraphEditorContext& ctx, GraphEditResult& out)
{
    if (phase_ != DragPhase::Idle || ctx.selected_ids.size() != 1 || !std::isfinite(e.frame))
        return;
    const Keyframe* kf = ctx.find(ctx.selected_ids.front());
    if (!kf)
        return;

    const double clamped = std::clamp(std::round(e.frame), 0.0, static_cast<double>(max_valid_frame()));
    const int    frame   = avoid_blocked(static_cast<int>(clamped), kf->frame, ctx.blocked_ranges);
    if (frame == kf->frame)
        return;

    out.intents.push_back(DragStarted{});
    out.intents.push_back(KeyframeMoved{ref_for(kf->id), frame, kf->value});
    out.intents.push_back(DragEnded{});
    out.intents.push_back(PlayheadMoveRequested{frame});
}

void GraphEditor::on_commit_value(const CommitValueInput& e, const GraphEditorContext& ctx, GraphEditResult& out)
{
    if (phase_ != DragPhase::Idle || ctx.selected_ids.size() != 1 || !std::isfinite(e.value))
        return;
    const Keyframe* kf = ctx.find(ctx.selected_ids.front());
    if (!kf)
        return;

    const auto&  range = property_range(target_->property);
    const double value = std::clamp(e.value, range.min, range.max);
    if (std::abs(value - kf->value) < kValueCommitEpsilon)
        return;

    out.intents.push_back(DragStarted{});
    out.intents.push_back(KeyframeMoved{ref_for(kf->id), kf->frame, value});
    out.intents.push_back(DragEnded{});
}

void GraphEditor::on_navigate(const NavigateKeyframe& e, const GraphEditorContext& ctx, GraphEditResult& out)
{
    auto frame = e.direction == NavigateDirection::Previous
                     ? previous_keyframe_frame(ctx.keyframes, ctx.current_frame)
                     : next_keyframe_frame(ctx.keyframes, ctx.current_frame);
    if (!frame)
        return;

    out.intents.push_back(PlayheadMoveRequested{*frame});
    for (const auto& kf : ctx.keyframes)
    {
        if (kf.frame == *frame)
        {
            out.intents.push_back(SelectionChanged{{kf.id}});
            break;
        }
    }
}

void GraphEditor::on_add_keyframe(const GraphEditorContext& ctx, GraphEditResult& out)
{
    const int frame = ctx.current_frame;
    if (frame < 0 || frame >= target_->max_frame)
        return;

    for (const auto& range : ctx.blocked_ranges)
    {
        if (range.contains(frame))
        {
            out.notice = blocked_message(range);
            KEYLINE_LOG_DEBUG("graph", "add at frame {} refused: {}", frame, transition_role_name(range.role));
            return;
        }
    }

    auto exists = std::any_of(ctx.keyframes.begin(),
                              ctx.keyframes.end(),
                              [frame](const Keyframe& kf) { return kf.frame == frame; });
    if (exists)
        return;

    out.intents.push_back(AddKeyframeRequested{target_->item_id, target_->property, frame});
}

void GraphEditor::on_remove_selected(const GraphEditorContext& ctx, GraphEditResult& out)
{
    if (phase_ != DragPhase::Idle)
        return;

    RemoveKeyframesRequested req;
    for (const auto& id : ctx.selected_ids)
    {
        if (ctx.find(id))
            req.refs.push_back(ref_for(id));
    }
    if (!req.refs.empty())
        out.intents.push_back(std::move(req));
}

// ─── Geometry ────────────────────────────────────────────────────────────────

SnapTargets GraphEditor::snap_targets(const GraphEditorContext& ctx) const
{
    SnapTargets t;
    push_unique(t.frames, 0.0);
    if (ctx.current_frame >= 0 && ctx.current_frame <= max_valid_frame())
        push_unique(t.frames, static_cast<double>(ctx.current_frame));

    if (target_)
    {
        const auto& range = property_range(target_->property);
        push_unique(t.values, range.min);
        push_unique(t.values, range.max);
        if (range.contains(0.0))
            push_unique(t.values, 0.0);
        if (range.contains(1.0))
            push_unique(t.values, 1.0);
    }

    const bool dragging_point = phase_ == DragPhase::PendingKeyframeDrag || phase_ == DragPhase::DraggingKeyframe;
    for (const auto& kf : ctx.keyframes)
    {
        if (ctx.is_selected(kf.id))
            continue;
        if (dragging_point && kf.id == keyframe_drag_.keyframe_id)
            continue;
        push_unique(t.frames, static_cast<double>(kf.frame));
        push_unique(t.values, kf.value);
    }
    return t;
}

std::vector<GraphPoint> GraphEditor::keyframe_points(const GraphEditorContext& ctx) const
{
    const auto&             pad = config_.padding;
    std::vector<GraphPoint> points;
    points.reserve(ctx.keyframes.size());
    for (const auto& kf : ctx.keyframes)
    {
        GraphPoint p;
        p.keyframe_id = kf.id;
        p.selected    = ctx.is_selected(kf.id);
        p.dragging    = preview_ && preview_->keyframe_id == kf.id;

        const double frame = p.dragging ? preview_->frame : kf.frame;
        const double value = p.dragging ? preview_->value : kf.value;
        p.x                = viewport_.frame_to_x(frame, pad);
        p.y                = viewport_.value_to_y(value, pad);
        points.push_back(std::move(p));
    }
    return points;
}

std::vector<GraphBezierHandle> GraphEditor::bezier_handles(const GraphEditorContext& ctx) const
{
    const auto&                    pad = config_.padding;
    std::vector<GraphBezierHandle> handles;
    for (size_t i = 0; i + 1 < ctx.keyframes.size(); ++i)
    {
        const auto& kf   = ctx.keyframes[i];
        const auto& next = ctx.keyframes[i + 1];
        if (kf.easing.kind != EasingKind::CubicBezier || !ctx.is_selected(kf.id))
            continue;

        const double sx = viewport_.frame_to_x(kf.frame, pad);
        const double sy = viewport_.value_to_y(kf.value, pad);
        const double ex = viewport_.frame_to_x(next.frame, pad);
        const double ey = viewport_.value_to_y(next.value, pad);
        const auto&  b  = kf.easing.bezier;

        handles.push_back({kf.id, BezierHandleType::Out, sx + b.x1 * (ex - sx), sy + b.y1 * (ey - sy), sx, sy});
        handles.push_back({kf.id, BezierHandleType::In, sx + b.x2 * (ex - sx), sy + b.y2 * (ey - sy), ex, ey});
    }
    return handles;
}

GraphHit GraphEditor::hit_test(double x, double y, const GraphEditorContext& ctx) const
{
    const double radius_sq = config_.hit_radius_px * config_.hit_radius_px;

    GraphHit hit;
    double   best = radius_sq;
    for (const auto& h : bezier_handles(ctx))
    {
        const double d = distance_sq(x, y, h.x, h.y);
        if (d <= best)
        {
            best             = d;
            hit.type         = GraphHitType::BezierHandle;
            hit.keyframe_id  = h.keyframe_id;
            hit.handle       = h.type;
        }
    }
    if (hit.type == GraphHitType::BezierHandle)
        return hit;

    for (const auto& p : keyframe_points(ctx))
    {
        const double d = distance_sq(x, y, p.x, p.y);
        if (d <= best)
        {
            best            = d;
            hit.type        = GraphHitType::Keyframe;
            hit.keyframe_id = p.keyframe_id;
        }
    }
    return hit;
}

// ─── Helpers ─────────────────────────────────────────────────────────────────

int GraphEditor::max_valid_frame() const
{
    return target_ ? std::max(0, target_->max_frame - 1) : 0;
}

int GraphEditor::avoid_blocked(int frame, int initial_frame, std::span<const BlockedFrameRange> ranges) const
{
    const int upper  = max_valid_frame();
    auto      usable = [upper](int f) { return f >= 0 && f <= upper; };

    int candidate = frame;
    for (size_t pass = 0; pass <= ranges.size(); ++pass)
    {
        auto hit = std::find_if(ranges.begin(),
                                ranges.end(),
                                [candidate](const BlockedFrameRange& r) { return r.contains(candidate); });
        if (hit == ranges.end())
            return usable(candidate) ? candidate : initial_frame;

        const int before = hit->start - 1;
        const int after  = hit->end;
        if (initial_frame < hit->start)
            candidate = before;
        else if (initial_frame >= hit->end)
            candidate = after;
        else
        {
            // Started inside: nearest usable edge.
            const bool before_nearer = candidate - hit->start < hit->end - candidate;
            if (before_nearer)
                candidate = usable(before) ? before : after;
            else
                candidate = usable(after) ? after : before;
        }
    }

    KEYLINE_LOG_DEBUG("graph", "no free frame near {}, holding {}", frame, initial_frame);
    return initial_frame;
}

KeyframeRef GraphEditor::ref_for(const std::string& keyframe_id) const
{
    KeyframeRef ref;
    if (target_)
    {
        ref.item_id  = target_->item_id;
        ref.property = target_->property;
    }
    ref.keyframe_id = keyframe_id;
    return ref;
}

}   // namespace keyline
