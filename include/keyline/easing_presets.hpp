#pragma once

#include <cstdint>
#include <keyline/easing.hpp>
#include <span>
#include <string_view>
#include <vector>

namespace keyline
{

enum class EasingCategory : uint8_t
{
    Basic,
    Ease,
    Emphasis,
    Bounce,
    Elastic,
    Spring,
};

struct EasingCategoryInfo
{
    EasingCategory category;
    const char*    name;
    const char*    description;
};

// Named easing for pickers. `icon_path` is an SVG path in a 24x24 box
// running from (2,20) to (22,4).
struct EasingPreset
{
    const char*    id;
    const char*    name;
    EasingCategory category;
    EasingSpec     spec;
    const char*    icon_path;
};

std::span<const EasingCategoryInfo> easing_categories();
std::span<const EasingPreset>       easing_presets();

std::vector<const EasingPreset*> presets_in_category(EasingCategory category);
const EasingPreset*              preset_by_id(std::string_view id);

// Preset equivalent to `spec`, or nullptr. Bezier control points match
// within 0.01, spring parameters must match exactly, and the fixed kinds
// match by kind alone.
const EasingPreset* find_matching_preset(const EasingSpec& spec);

}   // namespace keyline
