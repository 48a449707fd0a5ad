// Graph editor demo
// Drives the value graph headlessly: a scripted pointer session edits the X
// track of one clip and the host applies the emitted intents.
//
// This example shows:
// - Deriving transition-blocked frames for a clip
// - Feeding pointer events into GraphEditor
// - Applying intents to an ItemAnimation
// - Auto-keyframing a gizmo edit at the playhead

#include <iostream>
#include <keyline/keyline.hpp>
#include <type_traits>
#include <variant>
#include <vector>

#include "ui/editor_config.hpp"
#include "ui/graph_editor.hpp"

using namespace keyline;

namespace
{

struct Host
{
    ItemAnimation            anim{"clip-1"};
    std::vector<std::string> selection;
    int                      playhead = 0;

    void apply(const GraphEditResult& result)
    {
        for (const auto& intent : result.intents)
        {
            std::visit(
                [this](const auto& i)
                {
                    using T = std::decay_t<decltype(i)>;
                    if constexpr (std::is_same_v<T, SelectionChanged>)
                        selection = i.keyframe_ids;
                    else if constexpr (std::is_same_v<T, KeyframeMoved>)
                    {
                        KeyframeUpdate up;
                        up.frame = i.frame;
                        up.value = i.value;
                        if (!anim.update_keyframe(i.ref.property, i.ref.keyframe_id, up))
                            std::cout << "  (move of " << i.ref.keyframe_id << " rejected)\n";
                    }
                    else if constexpr (std::is_same_v<T, BezierHandleMoved>)
                    {
                        KeyframeUpdate up;
                        up.easing = EasingSpec::cubic_bezier(i.bezier.x1, i.bezier.y1, i.bezier.x2, i.bezier.y2);
                        if (!anim.update_keyframe(i.ref.property, i.ref.keyframe_id, up))
                            std::cout << "  (easing of " << i.ref.keyframe_id << " rejected)\n";
                    }
                    else if constexpr (std::is_same_v<T, DragStarted>)
                        std::cout << "  begin undo batch\n";
                    else if constexpr (std::is_same_v<T, DragEnded>)
                        std::cout << "  end undo batch\n";
                    else if constexpr (std::is_same_v<T, AddKeyframeRequested>)
                    {
                        const double value = interpolate_value(anim.keyframes(i.property), i.frame, 0.0);
                        if (auto id = anim.add_keyframe(i.property, i.frame, value))
                            std::cout << "  added " << *id << " at frame " << i.frame << "\n";
                    }
                    else if constexpr (std::is_same_v<T, RemoveKeyframesRequested>)
                    {
                        for (const auto& ref : i.refs)
                        {
                            if (!anim.remove_keyframe(ref.property, ref.keyframe_id))
                                std::cout << "  (" << ref.keyframe_id << " already gone)\n";
                        }
                    }
                    else if constexpr (std::is_same_v<T, PlayheadMoveRequested>)
                        playhead = i.frame;
                },
                intent);
        }
        if (!result.notice.empty())
            std::cout << "  notice: " << result.notice << "\n";
    }

    void print_track() const
    {
        for (const auto& kf : anim.keyframes(AnimatableProperty::X))
            std::cout << "    " << kf.id << " @ " << kf.frame << " = " << kf.value << " ("
                      << easing_kind_name(kf.easing.kind) << ")\n";
    }
};

}   // anonymous namespace

int main()
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    EditorConfigStore config;
    if (!config.load(EditorConfigStore::default_path()))
        std::cout << "Using default graph editor settings\n";

    Clip                    clip{"clip-1", 0, 90};
    std::vector<Transition> transitions = {
        Transition{"fade-in", "clip-0", "clip-1", "track-1", 20, 0.5},
        Transition{"wipe-out", "clip-1", "clip-2", "track-1", 30, 0.5},
    };
    const auto blocked = blocked_ranges(clip, transitions);
    for (const auto& r : blocked)
        std::cout << transition_role_name(r.role) << " transition blocks [" << r.start << ", " << r.end << ")\n";

    Host host;
    if (!host.anim.add_keyframe(AnimatableProperty::X, 20, 0.0, default_easing_spec(EasingKind::CubicBezier)) ||
        !host.anim.add_keyframe(AnimatableProperty::X, 50, 400.0))
    {
        std::cerr << "failed to seed the X track\n";
        return 1;
    }

    GraphEditor editor(config.config());
    host.apply(editor.open(GraphTarget{clip.id, AnimatableProperty::X, clip.duration_in_frames}, 900.0, 300.0));

    auto ctx = [&]
    {
        GraphEditorContext c;
        c.keyframes      = host.anim.keyframes(AnimatableProperty::X);
        c.selected_ids   = host.selection;
        c.current_frame  = host.playhead;
        c.blocked_ranges = blocked;
        return c;
    };

    std::cout << "\nInitial X track:\n";
    host.print_track();

    // Drag the second keyframe to the right, into the outgoing transition.
    const auto points = editor.keyframe_points(ctx());
    const auto& p     = points.back();
    std::cout << "\nDragging " << p.keyframe_id << " from (" << p.x << ", " << p.y << ")\n";
    host.apply(editor.handle_event(KeyframePointerDown{p.keyframe_id, 1, p.x, p.y, {}}, ctx()));
    for (int step = 1; step <= 10; ++step)
        host.apply(editor.handle_event(PointerMove{1, p.x + step * 30.0, p.y - step * 5.0, {}}, ctx()));
    host.apply(editor.handle_event(PointerUp{1, p.x + 300.0, p.y - 50.0, {}}, ctx()));
    host.print_track();

    // Reshape the first segment.
    host.selection = {host.anim.keyframes(AnimatableProperty::X).front().id};
    const auto handles = editor.bezier_handles(ctx());
    if (!handles.empty())
    {
        const auto& h = handles.front();
        std::cout << "\nPulling the out handle of " << h.keyframe_id << "\n";
        host.apply(editor.handle_event(HandlePointerDown{h.keyframe_id, h.type, 1, h.x, h.y}, ctx()));
        host.apply(editor.handle_event(PointerMove{1, h.x + 20.0, h.y - 60.0, {}}, ctx()));
        host.apply(editor.handle_event(PointerUp{1, h.x + 20.0, h.y - 60.0, {}}, ctx()));
    }

    // Try to key inside the transition, then on a free frame.
    host.playhead = 80;
    host.apply(editor.handle_event(AddKeyframeAtPlayhead{}, ctx()));
    host.playhead = 35;
    host.apply(editor.handle_event(AddKeyframeAtPlayhead{}, ctx()));

    // A gizmo edit on an animated property lands in the track.
    ItemAnimationSink  sink(host.anim);
    const PropertyEdit edits[] = {{AnimatableProperty::X, 250.0}, {AnimatableProperty::Y, 40.0}};
    const bool         fallback = auto_keyframe_properties(sink, clip, &host.anim, edits, 40);
    std::cout << "\nGizmo edit at frame 40 " << (fallback ? "updated the base transform" : "was keyframed") << "\n";

    std::cout << "\nFinal X track:\n";
    host.print_track();

    Transform base{0.0, 0.0, 1920.0, 1080.0, 0.0, 1.0, 0.0};
    for (int f = 0; f <= 90; f += 15)
    {
        const auto t = resolve_animated_transform(base, &host.anim, f);
        std::cout << "  frame " << f << ": x = " << t.x << "\n";
    }

    host.apply(editor.close());
    return 0;
}
