/**
 * @file Overlay.cpp
 * @brief HighGUI monitor window with the filtered waveform strip.
 */

#include "Overlay.hpp"
#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/fmt/fmt.h>
#include <numeric>
#include <cmath>

cv::Mat plot_waveform(const std::vector<double>& data, const cv::Size& size, double scale, double smoothing) {
    const int width = size.width;
    const int height = size.height;
    if (width < 2 || height < 2) {
        return cv::Mat();
    }
    cv::Mat plot(height, width, CV_8UC3, cv::Scalar(255, 255, 255));

    // 1. Grid: 10 columns, 5 rows
    const cv::Scalar grid(221, 221, 221);
    for (int i = 0; i < 10; ++i) {
        const int x = i * width / 10;
        cv::line(plot, cv::Point(x, 0), cv::Point(x, height - 1), grid, 1);
    }
    for (int i = 0; i < 5; ++i) {
        const int y = i * height / 5;
        cv::line(plot, cv::Point(0, y), cv::Point(width - 1, y), grid, 1);
    }

    if (data.size() < 2) {
        return plot;
    }

    // 2. Trace centered on the mean, scaled and smoothed along x
    const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
    const double center_y = height / 2.0;
    const double step = static_cast<double>(width - 1) / static_cast<double>(data.size() - 1);

    double level = data[0] - mean;
    cv::Point prev;
    for (size_t i = 0; i < data.size(); ++i) {
        level = smoothing * level + (1.0 - smoothing) * (data[i] - mean);
        const cv::Point pt(static_cast<int>(std::lround(i * step)),
                           static_cast<int>(std::lround(center_y - level * scale)));
        if (i > 0) {
            cv::line(plot, prev, pt, cv::Scalar(0, 0, 255), 2, cv::LINE_AA);
        }
        prev = pt;
    }
    return plot;
}

Overlay::Overlay(const AppConfig& c, const KeyBindings& keys)
    : m_cfg(c), m_keys(keys) {}

Overlay::~Overlay() {
    if (m_window_open) {
        cv::destroyWindow(m_cfg.display.window_name);
    }
}

void Overlay::set_running(bool r) {
    m_running = r;
    m_bpm = 0.0;
    m_waveform.clear();
}

cv::Mat Overlay::compose(const cv::Mat& frame, const cv::Rect& roi) const {
    cv::Mat view;
    frame.copyTo(view);
    const auto& col = m_cfg.display.color;
    const cv::Scalar text_color(col[2], col[1], col[0]);

    // 1. ROI
    cv::rectangle(view, roi, cv::Scalar(0, 255, 0), 2);

    // 2. Labels with a shadow for readability
    const std::string bpm_text = m_bpm > 0
        ? fmt::format("BPM: {}", static_cast<long>(std::lround(m_bpm)))
        : std::string("BPM: --");
    const std::string status_text = fmt::format("FPS: {:.0f}  {}", m_fps, m_running ? "Running" : "Idle");
    auto label = [&](const std::string& text, cv::Point org, double font_scale) {
        cv::putText(view, text, org + cv::Point(2, 2), cv::FONT_HERSHEY_SIMPLEX, font_scale,
                    cv::Scalar(0, 0, 0), 2, cv::LINE_AA);
        cv::putText(view, text, org, cv::FONT_HERSHEY_SIMPLEX, font_scale, text_color, 2, cv::LINE_AA);
    };
    label(bpm_text, cv::Point(10, 36), 1.0);
    label(status_text, cv::Point(10, 64), 0.6);

    // 3. Waveform strip below the frame
    cv::Mat plot = plot_waveform(m_waveform, cv::Size(view.cols, kPlotHeight),
                                 m_cfg.display.signal_scale, m_cfg.display.signal_smoothing);
    if (plot.empty()) {
        return view;
    }
    cv::Mat out;
    cv::vconcat(view, plot, out);
    return out;
}

void Overlay::show(const cv::Mat& frame, const cv::Rect& roi) {
    if (frame.empty()) {
        return;
    }
    if (!m_window_open) {
        cv::namedWindow(m_cfg.display.window_name, cv::WINDOW_AUTOSIZE);
        m_window_open = true;
    }
    cv::imshow(m_cfg.display.window_name, compose(frame, roi));
}

Command Overlay::poll(int delay_ms) {
    return m_keys.command_for(cv::waitKeyEx(delay_ms));
}
