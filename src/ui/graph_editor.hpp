#pragma once

#include <cstdint>
#include <keyline/easing.hpp>
#include <keyline/keyframe.hpp>
#include <keyline/transition.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ui/editor_config.hpp"
#include "ui/graph_viewport.hpp"
#include "ui/pointer_capture.hpp"

namespace keyline
{

// Identifies one keyframe in the host's store.
struct KeyframeRef
{
    std::string        item_id;
    AnimatableProperty property = AnimatableProperty::X;
    std::string        keyframe_id;

    bool operator==(const KeyframeRef&) const = default;
};

// The (item, property) pair an editor instance is showing.
struct GraphTarget
{
    std::string        item_id;
    AnimatableProperty property  = AnimatableProperty::X;
    int                max_frame = 0;   // item duration; valid frames are [0, max_frame)
};

enum class BezierHandleType : uint8_t
{
    Out,   // (x1, y1), leaves the keyframe
    In,    // (x2, y2), arrives at the next keyframe
};

enum class DragPhase : uint8_t
{
    Idle,
    PendingKeyframeDrag,   // pointer down on a point, threshold not crossed yet
    DraggingKeyframe,
    DraggingHandle,
};

// Axis a Shift-drag is currently locked to.
enum class ConstraintAxis : uint8_t
{
    None,
    Frame,   // horizontal: only the frame changes
    Value,   // vertical: only the value changes
};

enum class ViewportAction : uint8_t
{
    ZoomIn,
    ZoomOut,
    Fit,
    Reset,
};

enum class NavigateDirection : uint8_t
{
    Previous,
    Next,
};

struct PointerModifiers
{
    bool shift = false;
    bool alt   = false;
    bool ctrl  = false;
    bool meta  = false;

    bool ctrl_or_meta() const { return ctrl || meta; }
};

// ─── Events ──────────────────────────────────────────────────────────────────
// Pointer coordinates are pixels local to the graph widget.

struct KeyframePointerDown
{
    std::string      keyframe_id;
    int              pointer_id = 1;
    double           x          = 0.0;
    double           y          = 0.0;
    PointerModifiers mods;
};

struct HandlePointerDown
{
    std::string      keyframe_id;
    BezierHandleType handle     = BezierHandleType::Out;
    int              pointer_id = 1;
    double           x          = 0.0;
    double           y          = 0.0;
};

struct PointerMove
{
    int              pointer_id = 1;
    double           x          = 0.0;
    double           y          = 0.0;
    PointerModifiers mods;
};

struct PointerUp
{
    int              pointer_id = 1;
    double           x          = 0.0;
    double           y          = 0.0;
    PointerModifiers mods;
};

// The platform dropped capture without a pointer-up.
struct PointerCaptureLost
{
    int pointer_id = 1;
};

struct WheelScroll
{
    double x       = 0.0;
    double y       = 0.0;
    double delta_y = 0.0;   // > 0 zooms out
};

struct BackgroundClick
{
    bool target_is_background = true;
};

struct ViewportCommand
{
    ViewportAction action = ViewportAction::Fit;
};

struct GraphResize
{
    double width  = 0.0;
    double height = 0.0;
};

// Numeric entry for the single selected keyframe.
struct CommitFrameInput
{
    double frame = 0.0;
};

struct CommitValueInput
{
    double value = 0.0;
};

struct NavigateKeyframe
{
    NavigateDirection direction = NavigateDirection::Next;
};

struct AddKeyframeAtPlayhead
{
};

struct RemoveSelectedKeyframes
{
};

using GraphEvent = std::variant<KeyframePointerDown,
                                HandlePointerDown,
                                PointerMove,
                                PointerUp,
                                PointerCaptureLost,
                                WheelScroll,
                                BackgroundClick,
                                ViewportCommand,
                                GraphResize,
                                CommitFrameInput,
                                CommitValueInput,
                                NavigateKeyframe,
                                AddKeyframeAtPlayhead,
                                RemoveSelectedKeyframes>;

// ─── Intents ─────────────────────────────────────────────────────────────────
// Emitted for the host to apply to its own store.

struct SelectionChanged
{
    std::vector<std::string> keyframe_ids;

    bool operator==(const SelectionChanged&) const = default;
};

struct KeyframeMoved
{
    KeyframeRef ref;
    int         frame = 0;
    double      value = 0.0;

    bool operator==(const KeyframeMoved&) const = default;
};

struct BezierHandleMoved
{
    KeyframeRef       ref;
    ease::CubicBezier bezier;

    bool operator==(const BezierHandleMoved&) const = default;
};

// Opens an undo batch; always paired with exactly one DragEnded.
struct DragStarted
{
    bool operator==(const DragStarted&) const = default;
};

struct DragEnded
{
    bool operator==(const DragEnded&) const = default;
};

struct ViewportChanged
{
    GraphViewport viewport;

    bool operator==(const ViewportChanged&) const = default;
};

struct AddKeyframeRequested
{
    std::string        item_id;
    AnimatableProperty property = AnimatableProperty::X;
    int                frame    = 0;

    bool operator==(const AddKeyframeRequested&) const = default;
};

struct RemoveKeyframesRequested
{
    std::vector<KeyframeRef> refs;

    bool operator==(const RemoveKeyframesRequested&) const = default;
};

struct PlayheadMoveRequested
{
    int frame = 0;   // item-relative

    bool operator==(const PlayheadMoveRequested&) const = default;
};

using GraphIntent = std::variant<SelectionChanged,
                                 KeyframeMoved,
                                 BezierHandleMoved,
                                 DragStarted,
                                 DragEnded,
                                 ViewportChanged,
                                 AddKeyframeRequested,
                                 RemoveKeyframesRequested,
                                 PlayheadMoveRequested>;

// ─── State ───────────────────────────────────────────────────────────────────

// Where the dragged keyframe is shown while the host catches up.
struct DragPreview
{
    std::string keyframe_id;
    int         frame = 0;
    double      value = 0.0;

    bool operator==(const DragPreview&) const = default;
};

struct GraphEditorState
{
    DragPhase                  phase = DragPhase::Idle;
    GraphViewport              viewport;
    std::optional<DragPreview> preview;
    ConstraintAxis             constraint = ConstraintAxis::None;
    bool                       snap_enabled = true;
};

struct GraphEditResult
{
    GraphEditorState         state;
    std::vector<GraphIntent> intents;
    std::string              notice;   // user-facing reason a request was refused
};

// Host data the editor reads on every event. Spans must stay valid for the
// duration of the handle_event() call only.
struct GraphEditorContext
{
    std::span<const Keyframe>          keyframes;   // open track, sorted by frame
    std::span<const std::string>       selected_ids;
    int                                current_frame = 0;   // item-relative playhead
    std::span<const BlockedFrameRange> blocked_ranges;
    bool                               disabled = false;

    const Keyframe* find(std::string_view keyframe_id) const;
    bool            is_selected(std::string_view keyframe_id) const;
};

struct SnapTargets
{
    std::vector<double> frames;
    std::vector<double> values;
};

enum class GraphHitType : uint8_t
{
    Background,
    Keyframe,
    BezierHandle,
};

struct GraphHit
{
    GraphHitType     type = GraphHitType::Background;
    std::string      keyframe_id;
    BezierHandleType handle = BezierHandleType::Out;
};

struct GraphPoint
{
    std::string keyframe_id;
    double      x        = 0.0;
    double      y        = 0.0;
    bool        selected = false;
    bool        dragging = false;
};

struct GraphBezierHandle
{
    std::string      keyframe_id;
    BezierHandleType type     = BezierHandleType::Out;
    double           x        = 0.0;
    double           y        = 0.0;
    double           anchor_x = 0.0;
    double           anchor_y = 0.0;
};

// GraphEditor: interaction state machine of the value graph for one
// (item, property) pair.
//
// Pure event reducer: handle_event() takes a GraphEvent plus the host's
// current data and returns the new state and the intents to apply. The
// editor owns its viewport, drag state and pointer capture; keyframes and
// selection belong to the host and arrive through GraphEditorContext.
class GraphEditor
{
   public:
    explicit GraphEditor(GraphEditorConfig config = {}, PointerCaptureTarget* capture_target = nullptr);
    ~GraphEditor() = default;

    GraphEditor(const GraphEditor&)            = delete;
    GraphEditor& operator=(const GraphEditor&) = delete;

    // ─── Lifecycle ───────────────────────────────────────────────────

    // Show `target`. Any gesture on the previous target is ended (capture
    // released, DragEnded emitted if one was started) and the viewport is
    // fitted to the new property.
    GraphEditResult open(const GraphTarget& target, double width, double height);

    // Tear down: ends any gesture the same way open() does.
    GraphEditResult close();

    bool                              is_open() const { return target_.has_value(); }
    const std::optional<GraphTarget>& target() const { return target_; }

    // ─── Events ──────────────────────────────────────────────────────

    GraphEditResult handle_event(const GraphEvent& event, const GraphEditorContext& ctx);

    // ─── State ───────────────────────────────────────────────────────

    GraphEditorState     state() const;
    DragPhase            phase() const { return phase_; }
    bool                 is_dragging() const { return drag_started_; }
    const GraphViewport& viewport() const { return viewport_; }
    bool                 has_pointer_capture() const { return capture_.active(); }

    bool snap_enabled() const { return snap_enabled_; }
    void set_snap_enabled(bool enabled) { snap_enabled_ = enabled; }

    const GraphEditorConfig& config() const { return config_; }
    void                     set_config(const GraphEditorConfig& config) { config_ = config; }

    // Viewport showing frames [0, max(max_frame, default span)] and the full
    // declared range of the open property.
    GraphViewport fitted_viewport() const;

    // ─── Geometry ────────────────────────────────────────────────────

    SnapTargets snap_targets(const GraphEditorContext& ctx) const;

    std::vector<GraphPoint>        keyframe_points(const GraphEditorContext& ctx) const;
    std::vector<GraphBezierHandle> bezier_handles(const GraphEditorContext& ctx) const;

    // Handles take precedence over points; anything else is background.
    GraphHit hit_test(double x, double y, const GraphEditorContext& ctx) const;

   private:
    struct KeyframeDrag
    {
        std::string keyframe_id;
        double      start_x       = 0.0;
        double      start_y       = 0.0;
        int         initial_frame = 0;
        double      initial_value = 0.0;
        bool        was_selected  = false;
    };

    struct HandleDrag
    {
        std::string       keyframe_id;
        BezierHandleType  handle  = BezierHandleType::Out;
        double            start_x = 0.0;   // screen position of the segment's keyframes
        double            start_y = 0.0;
        double            end_x   = 0.0;
        double            end_y   = 0.0;
        ease::CubicBezier initial;
    };

    GraphEditorConfig          config_;
    PointerCaptureTarget*      capture_target_ = nullptr;
    std::optional<GraphTarget> target_;
    GraphViewport              viewport_;

    DragPhase                   phase_        = DragPhase::Idle;
    bool                        drag_started_ = false;
    PointerCapture              capture_;
    KeyframeDrag                keyframe_drag_;
    HandleDrag                  handle_drag_;
    std::optional<DragPreview>  preview_;
    ConstraintAxis              constraint_   = ConstraintAxis::None;
    bool                        snap_enabled_ = true;

    void on_keyframe_down(const KeyframePointerDown& e, const GraphEditorContext& ctx, GraphEditResult& out);
    void on_handle_down(const HandlePointerDown& e, const GraphEditorContext& ctx, GraphEditResult& out);
    void on_move(const PointerMove& e, const GraphEditorContext& ctx, GraphEditResult& out);
    void on_up(const PointerUp& e, const GraphEditorContext& ctx, GraphEditResult& out);
    void on_capture_lost(const PointerCaptureLost& e, GraphEditResult& out);
    void on_wheel(const WheelScroll& e, const GraphEditorContext& ctx, GraphEditResult& out);
    void on_background_click(const BackgroundClick& e, const GraphEditorContext& ctx, GraphEditResult& out);
    void on_viewport_command(const ViewportCommand& e, const GraphEditorContext& ctx, GraphEditResult& out);
    void on_resize(const GraphResize& e, GraphEditResult& out);
    void on_commit_frame(const CommitFrameInput& e, const GraphEditorContext& ctx, GraphEditResult& out);
    void on_commit_value(const CommitValueInput& e, const GraphEditorContext& ctx, GraphEditResult& out);
    void on_navigate(const NavigateKeyframe& e, const GraphEditorContext& ctx, GraphEditResult& out);
    void on_add_keyframe(const GraphEditorContext& ctx, GraphEditResult& out);
    void on_remove_selected(const GraphEditorContext& ctx, GraphEditResult& out);

    void drag_keyframe(const PointerMove& e, const GraphEditorContext& ctx, GraphEditResult& out);
    void drag_handle(const PointerMove& e, GraphEditResult& out);

    // Ends the current gesture. A normal release resolves a pending click;
    // a lost capture is disowned rather than released.
    void finish_gesture(bool capture_lost, GraphEditResult& out);
    void reset_gesture();

    int  max_valid_frame() const;
    int  avoid_blocked(int frame, int initial_frame, std::span<const BlockedFrameRange> ranges) const;
    KeyframeRef ref_for(const std::string& keyframe_id) const;
};

}   // namespace keyline
