#pragma once

#include <cstdint>

namespace keyline
{

enum class AnimatableProperty : uint8_t;
enum class EasingKind : uint8_t;
enum class TransitionRole : uint8_t;

struct EasingSpec;
struct Keyframe;
struct KeyframeUpdate;
struct PropertyTrack;
struct PropertyRange;
struct Transform;

class ItemAnimation;

struct Clip;
struct Transition;
struct BlockedFrameRange;
struct TransitionPortions;

struct AutoKeyframeDecision;
class KeyframeSink;

struct EasingPreset;

class Logger;

}   // namespace keyline
