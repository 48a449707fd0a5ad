#pragma once

#include <keyline/auto_keyframe.hpp>
#include <keyline/easing.hpp>
#include <keyline/easing_presets.hpp>
#include <keyline/fwd.hpp>
#include <keyline/interpolate.hpp>
#include <keyline/keyframe.hpp>
#include <keyline/logger.hpp>
#include <keyline/transition.hpp>

// ─── Render path ─────────────────────────────────────────────────────────────
// Per displayed frame, resolve every animated property of an item:
//
//   keyline::Transform t = keyline::resolve_animated_transform(base, &anim, frame);
//
// Interactive graph editing lives in the editor library (ui/graph_editor.hpp).
