#include <gtest/gtest.h>
#include <cmath>
#include <numbers>
#include "Overlay.hpp"

namespace {
// Pixels drawn in the trace color (pure-ish red in BGR)
int count_trace_pixels(const cv::Mat& plot) {
    int n = 0;
    for (int y = 0; y < plot.rows; ++y) {
        for (int x = 0; x < plot.cols; ++x) {
            const auto& px = plot.at<cv::Vec3b>(y, x);
            if (px[2] > 200 && px[1] < 100 && px[0] < 100) ++n;
        }
    }
    return n;
}

std::vector<double> wave(size_t n) {
    std::vector<double> out;
    for (size_t i = 0; i < n; ++i) out.push_back(std::sin(2.0 * std::numbers::pi * static_cast<double>(i) / 24.0));
    return out;
}
} // namespace

TEST(PlotWaveformTest, GridOnlyForShortWaveforms) {
    const auto plot = plot_waveform({1.0}, cv::Size(320, 160), 50.0, 0.7);
    ASSERT_EQ(plot.type(), CV_8UC3);
    EXPECT_EQ(plot.size(), cv::Size(320, 160));
    EXPECT_EQ(count_trace_pixels(plot), 0);
    // Grid line at x = 32 and background in between
    EXPECT_EQ(plot.at<cv::Vec3b>(80, 32), cv::Vec3b(221, 221, 221));
    EXPECT_EQ(plot.at<cv::Vec3b>(10, 10), cv::Vec3b(255, 255, 255));
}

TEST(PlotWaveformTest, DrawsTrace) {
    const auto plot = plot_waveform(wave(256), cv::Size(320, 160), 50.0, 0.0);
    EXPECT_GT(count_trace_pixels(plot), 100);
}

TEST(PlotWaveformTest, SmoothingChangesTrace) {
    const auto raw = plot_waveform(wave(256), cv::Size(320, 160), 50.0, 0.0);
    const auto smooth = plot_waveform(wave(256), cv::Size(320, 160), 50.0, 0.9);
    EXPECT_GT(cv::norm(raw, smooth, cv::NORM_L1), 0.0);
}

TEST(PlotWaveformTest, TooSmallIsEmpty) {
    EXPECT_TRUE(plot_waveform(wave(10), cv::Size(1, 100), 50.0, 0.7).empty());
}

TEST(OverlayTest, StopDropsWaveformAndReading) {
    AppConfig cfg;
    Overlay hud(cfg, KeyBindings{});
    const cv::Mat frame(240, 320, CV_8UC3, cv::Scalar(40, 40, 40));
    const cv::Rect roi(100, 80, 120, 80);
    const cv::Rect strip(0, frame.rows, frame.cols, Overlay::kPlotHeight);

    hud.set_running(true);
    hud.update_bpm(72.0);
    hud.update_waveform(wave(256));
    const cv::Mat running = hud.compose(frame, roi);
    ASSERT_EQ(running.rows, frame.rows + Overlay::kPlotHeight);
    EXPECT_GT(count_trace_pixels(running(strip)), 100);

    hud.set_running(false);
    const cv::Mat idle = hud.compose(frame, roi);
    EXPECT_EQ(count_trace_pixels(idle(strip)), 0);

    // Same labels as a HUD that never showed a reading
    Overlay fresh(cfg, KeyBindings{});
    const cv::Mat expected = fresh.compose(frame, roi);
    EXPECT_EQ(cv::norm(idle, expected, cv::NORM_INF), 0.0);
}
