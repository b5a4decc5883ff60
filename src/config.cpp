#include "config.hpp"
#include "render_error.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <map>
#include <stdexcept>
#include <string_view>

#include <yaml-cpp/yaml.h>

using std::string;
using std::string_view;

namespace {

struct OptionDef {
    const char* name;
    char        short_name;     // 0 if none
    bool        is_flag;
    const char* default_value;  // nullptr = required (or unset flag)
    const char* value_name;
    const char* help;
};

const OptionDef OPTIONS[] = {
    {"image-width",  'w', false, nullptr, "WIDTH",  "Width of the video in pixels."},
    {"image-height", 'h', false, nullptr, "HEIGHT", "Height of the video in pixels."},
    {"frames",       'f', false, nullptr, "COUNT",  "Number of frames; sets the video's length."},
    {"plane-width",  'W', false, nullptr, "WIDTH",  "Width of the complex-plane area covered."},
    {"path",         'p', false, nullptr, "SVG_PATH",
     "Path through the complex plane followed by the Julia constant, in SVG path syntax."},
    {"output",       'o', false, nullptr, "PATH",
     "Output directory (png, jxl) or file (raw, '-' for stdout)."},
    {"iterations",   'i', false, "100",   "N",      "Iteration cap before a pixel counts as interior."},
    {"fractal-progress-interval", 0, false, "1000", "MS",
     "Milliseconds between progress reports while computing one frame."},
    {"video-progress-interval",   0, false, "1000", "MS",
     "Milliseconds between overall video progress reports."},
    {"time-base",    't', false, "1/30",  "FRACTION", "Seconds per frame of the output video."},
    {"path-tolerance", 0, false, "0.01",  "TOLERANCE", "Tolerance for flattening curves in the path."},
    {"smoothing",      0, false, "LogarithmicDistance(4, 2)", "SMOOTHING",
     "None or LogarithmicDistance(radius, power)."},
    {"threads",        0, false, "0",     "N",      "Worker threads per frame (0 = one per core)."},
    {"format",         0, false, "png",   "FORMAT", "Output format: png, raw or jxl."},
    {"mandelbrot",   'm', true,  nullptr, nullptr,
     "Trace the path with a crosshair over the Mandelbrot set instead of animating a Julia set."},
};

const OptionDef* find_long(string_view name)
{
    for (const auto& o : OPTIONS)
        if (name == o.name) return &o;
    return nullptr;
}

const OptionDef* find_short(char c)
{
    for (const auto& o : OPTIONS)
        if (o.short_name != 0 && o.short_name == c) return &o;
    return nullptr;
}

bool starts_with(string_view s, string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

string yaml_key(const char* name)
{
    string k(name);
    for (char& c : k)
        if (c == '-') c = '_';
    return k;
}

// ---------- YAML ----------
void apply_yaml_config(const string& path, std::map<string, string>& values)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile& e) {
        throw ConfigError("config", string("cannot read ") + path + ": " + e.what());
    } catch (const YAML::Exception& e) {
        throw ConfigError("config", string("YAML parse error: ") + e.what());
    }
    const YAML::Node& doc = root;
    if (!doc || !doc.IsMap())
        throw ConfigError("config", "YAML config root must be a mapping");

    for (const auto& o : OPTIONS) {
        // Accept both image_width and image-width.
        const string     key = yaml_key(o.name);
        const YAML::Node n   = doc[key] ? doc[key] : doc[o.name];
        if (!n) continue;
        if (!n.IsScalar())
            throw ConfigError(o.name, "config value must be a scalar");
        try {
            if (o.is_flag)
                values[o.name] = n.as<bool>() ? "true" : "false";
            else
                values[o.name] = n.as<string>();
        } catch (const YAML::Exception& e) {
            throw ConfigError(o.name, string("bad config value: ") + e.what());
        }
    }
}

// ---------- Value conversion ----------
uint32_t parse_u32(const string& text, const char* name, uint32_t min_value)
{
    size_t             used = 0;
    unsigned long long v    = 0;
    const bool negative = text.find('-') != string::npos;
    try {
        v = std::stoull(text, &used);
    } catch (const std::exception&) {
        throw ConfigError(name, "invalid integer '" + text + "'");
    }
    if (negative || used != text.size())
        throw ConfigError(name, "invalid integer '" + text + "'");
    if (v > 0xFFFFFFFFull)
        throw ConfigError(name, "value out of range: " + text);
    if (v < min_value)
        throw ConfigError(name, "must be at least " + std::to_string(min_value));
    return static_cast<uint32_t>(v);
}

double parse_positive_double(const string& text, const char* name)
{
    size_t used = 0;
    double v    = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::exception&) {
        throw ConfigError(name, "invalid number '" + text + "'");
    }
    if (used != text.size() || !std::isfinite(v))
        throw ConfigError(name, "invalid number '" + text + "'");
    if (!(v > 0.0))
        throw ConfigError(name, "must be positive");
    return v;
}

bool parse_bool(const string& text, const char* name)
{
    if (text == "true" || text == "1")  return true;
    if (text == "false" || text == "0") return false;
    throw ConfigError(name, "expected true or false, got '" + text + "'");
}

RenderConfig build_config(const std::map<string, string>& values)
{
    for (const auto& o : OPTIONS)
        if (!o.is_flag && !o.default_value && !values.count(o.name))
            throw ConfigError(o.name, "required argument is missing");

    auto get = [&](const char* name) -> string {
        auto it = values.find(name);
        if (it != values.end()) return it->second;
        return find_long(name)->default_value;
    };

    RenderConfig c;
    c.image_width  = parse_u32(get("image-width"), "image-width", 1);
    c.image_height = parse_u32(get("image-height"), "image-height", 1);
    c.frames       = parse_u32(get("frames"), "frames", 1);
    c.plane_width  = parse_positive_double(get("plane-width"), "plane-width");

    c.path_data = get("path");
    try {
        c.path = parse_svg_path(c.path_data);
    } catch (const PathParseError& e) {
        throw ConfigError("path", e.what());
    }
    if (c.path.empty())
        throw ConfigError("path", "path is empty");

    c.output = get("output");
    if (c.output.empty())
        throw ConfigError("output", "must not be empty");

    c.iterations = parse_u32(get("iterations"), "iterations", 1);
    c.fractal_progress_interval = std::chrono::milliseconds(
        parse_u32(get("fractal-progress-interval"), "fractal-progress-interval", 0));
    c.video_progress_interval = std::chrono::milliseconds(
        parse_u32(get("video-progress-interval"), "video-progress-interval", 0));

    try {
        c.time_base = parse_rational(get("time-base"));
    } catch (const std::invalid_argument& e) {
        throw ConfigError("time-base", e.what());
    }

    c.path_tolerance = parse_positive_double(get("path-tolerance"), "path-tolerance");

    try {
        c.smoothing = parse_smoothing(get("smoothing"));
    } catch (const std::invalid_argument& e) {
        throw ConfigError("smoothing", e.what());
    }

    const uint32_t threads = parse_u32(get("threads"), "threads", 0);
    if (threads > 4096)
        throw ConfigError("threads", "at most 4096 worker threads");
    c.threads = static_cast<int>(threads);

    if (!parse_output_format(get("format"), c.format))
        throw ConfigError("format", "unknown format '" + get("format") +
                                    "' (expected png, raw or jxl)");
    if (c.format == OutputFormat::Jxl && !jxl_available())
        throw ConfigError("format", "this build has no JPEG XL support");

    auto flag = values.find("mandelbrot");
    c.mandelbrot = flag != values.end() && parse_bool(flag->second, "mandelbrot");
    return c;
}

} // namespace

Rational parse_rational(const std::string& text)
{
    const size_t slash = text.find('/');
    auto all_digits = [](const string& s) {
        if (s.empty()) return false;
        for (char ch : s)
            if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
        return true;
    };
    if (slash == string::npos || !all_digits(text.substr(0, slash)) ||
        !all_digits(text.substr(slash + 1)))
        throw std::invalid_argument("'" + text + "' is not a fraction like 1/30");

    Rational r;
    try {
        r.num = std::stoi(text.substr(0, slash));
        r.den = std::stoi(text.substr(slash + 1));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("fraction component out of range: '" + text + "'");
    }
    if (r.num <= 0 || r.den <= 0)
        throw std::invalid_argument("fraction components must be positive: '" + text + "'");
    return r;
}

void print_help(const char* argv0)
{
    std::printf("fractal_reel - renders a Julia set animation along a path\n\n"
                "Usage:\n  %s [--config file.yaml] [options]\n\n"
                "Options:\n", argv0);
    for (const auto& o : OPTIONS) {
        char lhs[64];
        if (o.short_name)
            std::snprintf(lhs, sizeof(lhs), "-%c, --%s%s%s", o.short_name, o.name,
                          o.value_name ? " " : "", o.value_name ? o.value_name : "");
        else
            std::snprintf(lhs, sizeof(lhs), "    --%s%s%s", o.name,
                          o.value_name ? " " : "", o.value_name ? o.value_name : "");
        std::printf("  %-40s %s", lhs, o.help);
        if (o.default_value)
            std::printf(" [default: %s]", o.default_value);
        else if (!o.is_flag)
            std::printf(" (required)");
        std::printf("\n");
    }
    std::printf("  %-40s %s\n", "    --config FILE",
                "YAML file of defaults (keys like image_width); flags override it.");
    std::printf("  %-40s %s\n", "    --help", "Show this help.");
}

// ---------- CLI parsing ----------
ArgSpec parse_args(int argc, const char* const* argv)
{
    ArgSpec a;

    // Pass 1: --config and --help
    for (int i = 1; i < argc; ++i) {
        string_view cur(argv[i]);
        if (cur == "--help") {
            a.show_help = true;
        } else if (cur == "--config") {
            if (i + 1 >= argc)
                throw ConfigError("config", "missing value");
            a.config_path = string(argv[++i]);
        } else if (starts_with(cur, "--config=")) {
            a.config_path = string(cur.substr(9));
        }
    }
    if (a.show_help) return a;

    std::map<string, string> values;
    if (a.config_path)
        apply_yaml_config(*a.config_path, values);

    // Pass 2: CLI overrides
    for (int i = 1; i < argc; ++i) {
        string_view cur(argv[i]);
        if (cur == "--config") {
            ++i;   // value consumed in pass 1
            continue;
        }
        if (starts_with(cur, "--config="))
            continue;

        const OptionDef* opt = nullptr;
        std::optional<string> inline_value;
        if (starts_with(cur, "--")) {
            string_view body = cur.substr(2);
            const size_t eq = body.find('=');
            if (eq != string_view::npos) {
                inline_value = string(body.substr(eq + 1));
                body         = body.substr(0, eq);
            }
            opt = find_long(body);
        } else if (cur.size() == 2 && cur[0] == '-') {
            opt = find_short(cur[1]);
        }
        if (!opt) {
            const size_t name_start = cur.find_first_not_of('-');
            throw ConfigError(string(name_start == string_view::npos ? cur
                                                                     : cur.substr(name_start)),
                              "unknown argument");
        }

        if (opt->is_flag) {
            if (inline_value)
                values[opt->name] = parse_bool(*inline_value, opt->name) ? "true" : "false";
            else
                values[opt->name] = "true";
            continue;
        }
        if (inline_value) {
            values[opt->name] = *inline_value;
        } else {
            if (i + 1 >= argc)
                throw ConfigError(opt->name, "missing value");
            values[opt->name] = argv[++i];
        }
    }

    a.config = build_config(values);
    return a;
}
