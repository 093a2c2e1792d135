#include "Config.hpp"
#include "KeyBindings.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace {
template <typename T>
T read(const YAML::Node& section, const char* key, const T& fallback) {
    if (!section || !section[key]) return fallback;
    return section[key].as<T>();
}

std::expected<void, std::string> validate(const AppConfig& c) {
    if (c.camera.index < 0) return std::unexpected("camera.index must be >= 0");
    if (!(c.camera.fps > 0.0)) return std::unexpected("camera.fps must be positive");
    if (c.camera.roi_width <= 0 || c.camera.roi_height <= 0) {
        return std::unexpected("camera.roi_width and camera.roi_height must be positive");
    }
    if (!(c.analysis.min_hz > 0.0) || !(c.analysis.min_hz < c.analysis.max_hz)) {
        return std::unexpected("analysis.min_hz must be positive and below analysis.max_hz");
    }
    if (c.analysis.buffer_size < 2) return std::unexpected("analysis.buffer_size must be at least 2");
    if (c.analysis.smoothing_window < 1) return std::unexpected("analysis.smoothing_window must be at least 1");
    if (!(c.display.signal_scale > 0.0)) return std::unexpected("display.signal_scale must be positive");
    if (!(c.display.signal_smoothing >= 0.0 && c.display.signal_smoothing < 1.0)) {
        return std::unexpected("display.signal_smoothing must be in [0, 1)");
    }
    for (int v : c.display.color) {
        if (v < 0 || v > 255) return std::unexpected("display.color components must be in [0, 255]");
    }
    auto keys = KeyBindings::from_names(c.display.key_start, c.display.key_stop, c.display.key_quit);
    if (!keys) return std::unexpected(keys.error());
    return {};
}
} // namespace

std::expected<AppConfig, std::string> AppConfig::parse(const std::string& yaml) {
    try {
        const YAML::Node node = YAML::Load(yaml);
        AppConfig c;

        const YAML::Node camera = node["camera"];
        c.camera.index = read(camera, "index", c.camera.index);
        c.camera.fps = read(camera, "fps", c.camera.fps);
        c.camera.roi_width = read(camera, "roi_width", c.camera.roi_width);
        c.camera.roi_height = read(camera, "roi_height", c.camera.roi_height);

        const YAML::Node analysis = node["analysis"];
        c.analysis.min_hz = read(analysis, "min_hz", c.analysis.min_hz);
        c.analysis.max_hz = read(analysis, "max_hz", c.analysis.max_hz);
        c.analysis.buffer_size = read(analysis, "buffer_size", c.analysis.buffer_size);
        c.analysis.smoothing_window = read(analysis, "smoothing_window", c.analysis.smoothing_window);

        const YAML::Node display = node["display"];
        c.display.window_name = read(display, "window_name", c.display.window_name);
        c.display.signal_scale = read(display, "signal_scale", c.display.signal_scale);
        c.display.signal_smoothing = read(display, "signal_smoothing", c.display.signal_smoothing);
        if (display && display["color"]) {
            auto col = display["color"].as<std::vector<int>>();
            if (col.size() != 3) return std::unexpected("display.color must have 3 components");
            c.display.color = {col[0], col[1], col[2]};
        }
        c.display.key_start = read(display, "key_start", c.display.key_start);
        c.display.key_stop = read(display, "key_stop", c.display.key_stop);
        c.display.key_quit = read(display, "key_quit", c.display.key_quit);

        const YAML::Node logging = node["logging"];
        const auto level = read<std::string>(logging, "level", "info");
        c.logging.level = spdlog::level::from_str(level);
        if (c.logging.level == spdlog::level::off && level != "off") {
            return std::unexpected("Unknown logging.level: " + level);
        }

        auto valid = validate(c);
        if (!valid) return std::unexpected(valid.error());
        return c;
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }
}

std::expected<AppConfig, std::string> AppConfig::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected("Config missing: " + path);
    }
    std::ifstream in(path);
    if (!in) {
        return std::unexpected("Config unreadable: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}
