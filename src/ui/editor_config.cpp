#include "ui/editor_config.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <keyline/logger.hpp>
#include <optional>
#include <sstream>
#include <system_error>

namespace keyline
{

bool GraphEditorConfig::valid() const
{
    const double values[] = {drag_threshold_px,
                             snap_threshold_px,
                             wheel_zoom_out,
                             wheel_zoom_in,
                             button_zoom_in,
                             button_zoom_out,
                             min_frame_span,
                             min_value_span,
                             fine_adjust_factor,
                             hit_radius_px,
                             default_frame_span,
                             padding.top,
                             padding.right,
                             padding.bottom,
                             padding.left};
    for (double v : values)
    {
        if (!std::isfinite(v))
            return false;
    }

    if (drag_threshold_px <= 0.0 || snap_threshold_px <= 0.0 || hit_radius_px <= 0.0)
        return false;
    if (min_frame_span <= 0.0 || min_value_span <= 0.0 || default_frame_span <= 0.0)
        return false;
    if (fine_adjust_factor <= 0.0)
        return false;
    if (wheel_zoom_in <= 0.0 || wheel_zoom_in >= 1.0 || button_zoom_in <= 0.0 || button_zoom_in >= 1.0)
        return false;
    if (wheel_zoom_out <= 1.0 || button_zoom_out <= 1.0)
        return false;
    return padding.top >= 0.0 && padding.right >= 0.0 && padding.bottom >= 0.0 && padding.left >= 0.0;
}

void EditorConfigStore::set_config(const GraphEditorConfig& config)
{
    if (config == config_)
        return;
    config_ = config;
    notify_change();
}

void EditorConfigStore::reset()
{
    set_config(GraphEditorConfig{});
}

// ─── JSON serialization ──────────────────────────────────────────────────────

std::string EditorConfigStore::serialize() const
{
    const auto&        c = config_;
    std::ostringstream os;
    os.precision(17);
    os << "{\n";
    os << "  \"version\": " << kVersion << ",\n";
    os << "  \"drag_threshold_px\": " << c.drag_threshold_px << ",\n";
    os << "  \"snap_threshold_px\": " << c.snap_threshold_px << ",\n";
    os << "  \"wheel_zoom_out\": " << c.wheel_zoom_out << ",\n";
    os << "  \"wheel_zoom_in\": " << c.wheel_zoom_in << ",\n";
    os << "  \"button_zoom_in\": " << c.button_zoom_in << ",\n";
    os << "  \"button_zoom_out\": " << c.button_zoom_out << ",\n";
    os << "  \"min_frame_span\": " << c.min_frame_span << ",\n";
    os << "  \"min_value_span\": " << c.min_value_span << ",\n";
    os << "  \"fine_adjust_factor\": " << c.fine_adjust_factor << ",\n";
    os << "  \"hit_radius_px\": " << c.hit_radius_px << ",\n";
    os << "  \"default_frame_span\": " << c.default_frame_span << ",\n";
    os << "  \"padding\": {\n";
    os << "    \"top\": " << c.padding.top << ",\n";
    os << "    \"right\": " << c.padding.right << ",\n";
    os << "    \"bottom\": " << c.padding.bottom << ",\n";
    os << "    \"left\": " << c.padding.left << "\n";
    os << "  },\n";
    os << "  \"snap_enabled\": " << (c.snap_enabled ? "true" : "false") << "\n";
    os << "}\n";
    return os.str();
}

// Minimal JSON reader for the flat format written above.
static std::optional<size_t> find_value_start(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find_first_not_of(" \t\n\r", pos + 1);
    if (pos == std::string::npos)
        return std::nullopt;
    return pos;
}

static std::optional<double> read_json_number(const std::string& json, const std::string& key)
{
    auto pos = find_value_start(json, key);
    if (!pos)
        return std::nullopt;

    const char* begin = json.c_str() + *pos;
    char*       end   = nullptr;
    double      v     = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    return v;
}

static std::optional<bool> read_json_bool(const std::string& json, const std::string& key)
{
    auto pos = find_value_start(json, key);
    if (!pos)
        return std::nullopt;
    if (json.compare(*pos, 4, "true") == 0)
        return true;
    if (json.compare(*pos, 5, "false") == 0)
        return false;
    return std::nullopt;
}

static std::string read_json_object(const std::string& json, const std::string& key)
{
    auto pos = find_value_start(json, key);
    if (!pos || json[*pos] != '{')
        return {};

    int depth = 0;
    for (size_t i = *pos; i < json.size(); ++i)
    {
        if (json[i] == '{')
            ++depth;
        else if (json[i] == '}' && --depth == 0)
            return json.substr(*pos, i - *pos + 1);
    }
    return {};
}

static void assign_number(const std::string& json, const std::string& key, double& out)
{
    if (auto v = read_json_number(json, key))
        out = *v;
}

bool EditorConfigStore::deserialize(const std::string& json)
{
    if (json.empty() || json.find('{') == std::string::npos)
        return false;

    if (auto ver = read_json_number(json, "version"); ver && *ver > kVersion)
    {
        KEYLINE_LOG_WARN("config", "graph editor config version {} is newer than {}", *ver, kVersion);
        return false;
    }

    // Read the nested object first and cut it out so its keys cannot be
    // mistaken for top-level ones.
    std::string top     = json;
    std::string padding = read_json_object(json, "padding");
    if (!padding.empty())
        top.erase(top.find(padding), padding.size());

    GraphEditorConfig c = config_;
    assign_number(top, "drag_threshold_px", c.drag_threshold_px);
    assign_number(top, "snap_threshold_px", c.snap_threshold_px);
    assign_number(top, "wheel_zoom_out", c.wheel_zoom_out);
    assign_number(top, "wheel_zoom_in", c.wheel_zoom_in);
    assign_number(top, "button_zoom_in", c.button_zoom_in);
    assign_number(top, "button_zoom_out", c.button_zoom_out);
    assign_number(top, "min_frame_span", c.min_frame_span);
    assign_number(top, "min_value_span", c.min_value_span);
    assign_number(top, "fine_adjust_factor", c.fine_adjust_factor);
    assign_number(top, "hit_radius_px", c.hit_radius_px);
    assign_number(top, "default_frame_span", c.default_frame_span);
    if (auto snap = read_json_bool(top, "snap_enabled"))
        c.snap_enabled = *snap;

    if (!padding.empty())
    {
        assign_number(padding, "top", c.padding.top);
        assign_number(padding, "right", c.padding.right);
        assign_number(padding, "bottom", c.padding.bottom);
        assign_number(padding, "left", c.padding.left);
    }

    if (!c.valid())
    {
        KEYLINE_LOG_WARN("config", "graph editor config has out-of-range values, keeping current settings");
        return false;
    }

    set_config(c);
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool EditorConfigStore::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            KEYLINE_LOG_DEBUG("config", "create_directories({}) failed: {}", dir.string(), ec.message());
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        KEYLINE_LOG_WARN("config", "cannot write graph editor config to {}", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool EditorConfigStore::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

std::string EditorConfigStore::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "graph_editor.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "keyline";
    return (dir / "graph_editor.json").string();
}

void EditorConfigStore::notify_change()
{
    if (on_change_)
        on_change_(config_);
}

}   // namespace keyline
