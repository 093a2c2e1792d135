#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include "SampleBuffer.hpp"
#include "SignalFilters.hpp"
#include "RateMeter.hpp"

/**
 * @struct PulseReading
 * @brief Result published once per processing cycle.
 *
 * heart_rate_bpm is 0 when no rate could be estimated.
 */
struct PulseReading {
    double heart_rate_bpm{0.0};
    std::vector<double> waveform;
    double sample_rate{0.0};
};

/**
 * @class PulseMonitor
 * @brief Drives the fill -> filter -> estimate -> slide cycle over a sample window.
 *
 * step() must be called once per producer sample from a single thread.
 */
class PulseMonitor {
public:
    enum class State { Idle, Running };

    /**
     * @param buffer_size Samples per processing cycle (e.g., 256).
     * @param smoothing_window Moving-average window in samples.
     * @param min_hz Lower edge of the heart-rate band.
     * @param max_hz Upper edge of the heart-rate band.
     * @throws std::invalid_argument if buffer_size < 2.
     */
    PulseMonitor(size_t buffer_size, size_t smoothing_window, double min_hz, double max_hz);

    /**
     * @brief Clears all buffered state and starts accepting samples.
     */
    void start();

    /**
     * @brief Discards buffered samples and the measured rate.
     */
    void stop();

    /**
     * @brief Feeds one sample. Ignored while Idle.
     * @return The published reading if this sample completed a cycle.
     */
    std::optional<PulseReading> step(const Sample& sample);

    State state() const { return m_state; }
    bool is_running() const { return m_state == State::Running; }
    double heart_rate() const { return m_heart_rate; }
    const std::vector<double>& waveform() const { return m_waveform; }
    double sample_rate() const { return m_rate.rate(); }
    size_t buffer_size() const { return m_buffer.size(); }
    size_t window_size() const { return m_buffer.capacity(); }
    size_t retained_size() const { return m_buffer.capacity() / 2; }

private:
    PulseReading process();

    State m_state{State::Idle};
    SampleBuffer m_buffer;
    RateMeter m_rate;
    size_t m_smoothing_window;
    BandLimitFilter m_band;
    double m_heart_rate{0.0};
    std::vector<double> m_waveform;
};
