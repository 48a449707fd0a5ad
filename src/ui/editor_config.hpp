#pragma once

#include <functional>
#include <string>

namespace keyline
{

// Inner margins of the plot area inside the graph widget, in pixels.
struct GraphPadding
{
    double top    = 0.0;
    double right  = 0.0;
    double bottom = 0.0;
    double left   = 0.0;

    bool operator==(const GraphPadding&) const = default;
};

// Tunables of the interactive graph editor.
struct GraphEditorConfig
{
    double drag_threshold_px = 3.0;   // click vs drag
    double snap_threshold_px = 8.0;

    double wheel_zoom_out = 1.1;     // per notch, delta_y > 0
    double wheel_zoom_in  = 0.909;   // per notch, delta_y < 0
    double button_zoom_in  = 0.8;
    double button_zoom_out = 1.25;

    double min_frame_span = 2.0;
    double min_value_span = 0.01;

    double fine_adjust_factor = 0.5;   // Alt held during a drag
    double hit_radius_px      = 8.0;

    double       default_frame_span = 60.0;   // fit shows at least this many frames
    GraphPadding padding;

    bool snap_enabled = true;

    // Finite values, positive spans and thresholds, zoom factors on the
    // right side of 1, non-negative padding.
    bool valid() const;

    bool operator==(const GraphEditorConfig&) const = default;
};

// Persistent graph editor settings: save/load GraphEditorConfig as JSON.
//
// Unknown keys are ignored and missing keys keep their current value, so a
// file written by an older build still loads. A document declaring a newer
// version is rejected and leaves the config untouched.
class EditorConfigStore
{
   public:
    EditorConfigStore() = default;
    explicit EditorConfigStore(GraphEditorConfig config) : config_(config) {}

    EditorConfigStore(const EditorConfigStore&)            = delete;
    EditorConfigStore& operator=(const EditorConfigStore&) = delete;

    static constexpr int kVersion = 1;

    const GraphEditorConfig& config() const { return config_; }
    void                     set_config(const GraphEditorConfig& config);

    // Restore every setting to its built-in default.
    void reset();

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // ~/.config/keyline/graph_editor.json
    static std::string default_path();

    std::string serialize() const;
    bool        deserialize(const std::string& json);

    using ChangeCallback = std::function<void(const GraphEditorConfig&)>;
    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

   private:
    GraphEditorConfig config_;
    ChangeCallback    on_change_;

    void notify_change();
};

}   // namespace keyline
