#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "Config.hpp"
#include "KeyBindings.hpp"

/**
 * @brief Renders a waveform on a grid, centered on its mean.
 * @param data Filtered waveform.
 * @param size Output image size.
 * @param scale Pixels per signal unit.
 * @param smoothing Exponential smoothing along the trace, 0 draws it raw.
 * @return BGR image; only the grid when fewer than 2 samples are given,
 *         empty when @p size is under 2x2.
 */
cv::Mat plot_waveform(const std::vector<double>& data, const cv::Size& size, double scale, double smoothing);

/**
 * @class Overlay
 * @brief HighGUI monitor window: camera frame, ROI, heart rate and waveform.
 */
class Overlay {
public:
    static constexpr int kPlotHeight = 150;

    /**
     * @brief Prepares the HUD. The window opens on the first show().
     * @param c Application configuration.
     * @param keys Key bindings for start/stop/quit.
     */
    Overlay(const AppConfig& c, const KeyBindings& keys);

    /**
     * @brief Destroys the window if it was opened.
     */
    ~Overlay();

    Overlay(const Overlay&) = delete;
    Overlay& operator=(const Overlay&) = delete;

    /**
     * @brief Updates the numerical BPM display. 0 shows a placeholder.
     */
    void update_bpm(double b) { m_bpm = b; }

    void update_fps(double f) { m_fps = f; }
    void update_waveform(const std::vector<double>& w) { m_waveform = w; }

    /**
     * @brief Switches the Running/Idle label and drops the last reading and waveform.
     */
    void set_running(bool r);

    /**
     * @brief Draws the HUD over a copy of @p frame with the waveform strip below it.
     */
    cv::Mat compose(const cv::Mat& frame, const cv::Rect& roi) const;

    /**
     * @brief Composes and shows the frame.
     */
    void show(const cv::Mat& frame, const cv::Rect& roi);

    /**
     * @brief Pumps the HighGUI event loop and maps the pressed key.
     */
    Command poll(int delay_ms = 1);

private:
    AppConfig m_cfg;
    KeyBindings m_keys;
    double m_bpm{0.0};
    double m_fps{0.0};
    bool m_running{false};
    bool m_window_open{false};
    std::vector<double> m_waveform;
};
