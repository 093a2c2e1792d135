#include <thread>
#include <chrono>
#include <cmath>
#include <algorithm>
#include <string>
#include <spdlog/spdlog.h>
#include <opencv2/videoio.hpp>
#include "Config.hpp"
#include "KeyBindings.hpp"
#include "Overlay.hpp"
#include "PulseMonitor.hpp"
#include "RateMeter.hpp"
#include "RoiSampler.hpp"

#ifndef PULSE_MONITOR_DEFAULT_CONFIG
#define PULSE_MONITOR_DEFAULT_CONFIG "config.yaml"
#endif

namespace {
struct RunningStats {
    size_t count{0};
    double mean{0.0};
    double m2{0.0};
    double min{0.0};
    double max{0.0};

    void add(double x) {
        if (count == 0) {
            min = max = x;
        } else {
            min = std::min(min, x);
            max = std::max(max, x);
        }
        ++count;
        const double delta = x - mean;
        mean += delta / static_cast<double>(count);
        const double delta2 = x - mean;
        m2 += delta * delta2;
    }

    double variance() const {
        return (count > 1) ? (m2 / static_cast<double>(count - 1)) : 0.0;
    }
};

double ms(std::chrono::steady_clock::duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}
} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
    spdlog::info("Starting PulseMonitor...");

    const std::string config_path = argc > 1 ? argv[1] : PULSE_MONITOR_DEFAULT_CONFIG;
    auto app_start = std::chrono::steady_clock::now();
    auto config_res = AppConfig::load(config_path);
    if (!config_res) {
        spdlog::error("Config Error: {}", config_res.error());
        return 1;
    }
    const auto config = *config_res;
    spdlog::set_level(config.logging.level);
    spdlog::info("Config loaded in {:.1f} ms", ms(std::chrono::steady_clock::now() - app_start));
    spdlog::info("Camera {} @ {} fps, ROI {}x{}, band {:.2f}-{:.2f} Hz, window {} samples",
        config.camera.index, config.camera.fps, config.camera.roi_width, config.camera.roi_height,
        config.analysis.min_hz, config.analysis.max_hz, config.analysis.buffer_size);

    auto keys = KeyBindings::from_names(config.display.key_start, config.display.key_stop, config.display.key_quit);
    if (!keys) {
        spdlog::error("Key binding Error: {}", keys.error());
        return 1;
    }
    spdlog::info("Keys: start '{}', stop '{}', quit '{}'",
        config.display.key_start, config.display.key_stop, config.display.key_quit);

    try {
        auto cam_start = std::chrono::steady_clock::now();
        cv::VideoCapture cap(config.camera.index);
        if (!cap.isOpened()) {
            spdlog::error("Could not open camera {}", config.camera.index);
            return 1;
        }
        cap.set(cv::CAP_PROP_FPS, config.camera.fps);
        spdlog::info("Camera opened in {:.1f} ms", ms(std::chrono::steady_clock::now() - cam_start));
        spdlog::info("Camera props: {}x{} @ {:.1f} fps",
            cap.get(cv::CAP_PROP_FRAME_WIDTH),
            cap.get(cv::CAP_PROP_FRAME_HEIGHT),
            cap.get(cv::CAP_PROP_FPS));

        RoiSampler sampler(config.camera.roi_width, config.camera.roi_height);
        PulseMonitor monitor(static_cast<size_t>(config.analysis.buffer_size),
                             static_cast<size_t>(config.analysis.smoothing_window),
                             config.analysis.min_hz, config.analysis.max_hz);
        Overlay hud(config, *keys);
        RateMeter frame_rate;

        cv::Mat frame;
        const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(1.0 / config.camera.fps));
        auto last_buffer_log = std::chrono::steady_clock::now();
        auto last_stats_log = std::chrono::steady_clock::now();
        RunningStats frame_dt_stats;
        std::chrono::steady_clock::time_point last_frame_time;
        bool has_last_frame = false;
        bool buffer_ready_logged = false;

        while (true) {
            auto frame_start = std::chrono::steady_clock::now();
            if (!cap.read(frame) || frame.empty()) {
                spdlog::warn("Camera stream ended");
                break;
            }
            if (frame_rate.tick(frame_start)) {
                hud.update_fps(frame_rate.rate());
            }
            if (has_last_frame) {
                frame_dt_stats.add(ms(frame_start - last_frame_time));
            }
            last_frame_time = frame_start;
            has_last_frame = true;

            const cv::Rect roi = sampler.roi_for(frame.size());
            if (monitor.is_running()) {
                auto value = sampler.sample(frame);
                if (value) {
                    if (auto reading = monitor.step(Sample{frame_start, *value})) {
                        hud.update_bpm(reading->heart_rate_bpm);
                        hud.update_waveform(reading->waveform);
                        buffer_ready_logged = true;
                    }
                } else {
                    spdlog::warn("Sample dropped: {}", value.error());
                }
            }

            hud.show(frame, roi);
            switch (hud.poll(1)) {
                case Command::Start:
                    monitor.start();
                    hud.set_running(true);
                    buffer_ready_logged = false;
                    last_buffer_log = std::chrono::steady_clock::now();
                    break;
                case Command::Stop:
                    monitor.stop();
                    hud.set_running(false);
                    break;
                case Command::Quit:
                    spdlog::info("Quit requested");
                    monitor.stop();
                    return 0;
                case Command::None:
                    break;
            }

            auto elapsed = std::chrono::steady_clock::now() - frame_start;
            if (monitor.is_running() && !buffer_ready_logged) {
                auto now = std::chrono::steady_clock::now();
                if (now - last_buffer_log > std::chrono::seconds(2)) {
                    const double pct = 100.0 * monitor.buffer_size() /
                        std::max<size_t>(1, monitor.window_size());
                    spdlog::info("Buffering: {}/{} ({:.0f}%)",
                        monitor.buffer_size(), monitor.window_size(), pct);
                    last_buffer_log = now;
                }
            }
            if (spdlog::should_log(spdlog::level::debug)) {
                auto now = std::chrono::steady_clock::now();
                if (now - last_stats_log > std::chrono::seconds(2) && frame_dt_stats.count > 1) {
                    const double target_dt_ms = ms(interval);
                    spdlog::debug("Frame dt: mean {:.2f} ms (std {:.2f}), min {:.2f}, max {:.2f}, jitter [min {:.2f}, max {:.2f}] ms",
                        frame_dt_stats.mean, std::sqrt(frame_dt_stats.variance()),
                        frame_dt_stats.min, frame_dt_stats.max,
                        frame_dt_stats.min - target_dt_ms, frame_dt_stats.max - target_dt_ms);
                    last_stats_log = now;
                    frame_dt_stats = RunningStats{};
                }
            }
            if (elapsed > interval * 2) {
                spdlog::warn("Frame processing overrun: {:.1f} ms (interval {:.1f} ms)", ms(elapsed), ms(interval));
            } else if (spdlog::should_log(spdlog::level::debug)) {
                spdlog::debug("Frame processing time: {:.1f} ms", ms(elapsed));
            }
            if (elapsed < interval) {
                std::this_thread::sleep_for(interval - elapsed);
            }
        }
        monitor.stop();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
