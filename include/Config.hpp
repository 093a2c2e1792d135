#pragma once
#include <string>
#include <array>
#include <expected>
#include <spdlog/common.h>

/**
 * @struct AppConfig
 * @brief Start-up configuration loaded from YAML. Not re-read while running.
 */
struct AppConfig {
    struct {
        int index{0};
        double fps{30.0};
        int roi_width{150};
        int roi_height{150};
    } camera;

    struct {
        double min_hz{0.7};
        double max_hz{3.5};
        int buffer_size{256};
        int smoothing_window{5};
    } analysis;

    struct {
        std::string window_name{"PulseMonitor"};
        double signal_scale{50.0};
        double signal_smoothing{0.7};
        std::array<int, 3> color{0, 255, 0}; // r, g, b
        std::string key_start{"S"};
        std::string key_stop{"X"};
        std::string key_quit{"ESC"};
    } display;

    struct {
        spdlog::level::level_enum level{spdlog::level::info};
    } logging;

    /**
     * @brief Parses config.yaml into the struct. Missing keys keep their defaults.
     * @return std::expected containing config or error string.
     */
    static std::expected<AppConfig, std::string> load(const std::string& path);

    /**
     * @brief Same as load(), from an in-memory YAML document.
     */
    static std::expected<AppConfig, std::string> parse(const std::string& yaml);
};
