#include "PulseMonitor.hpp"
#include "PeriodicityEstimator.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

PulseMonitor::PulseMonitor(size_t buffer_size, size_t smoothing_window, double min_hz, double max_hz)
    : m_buffer(buffer_size), m_smoothing_window(smoothing_window), m_band(min_hz, max_hz) {
    if (buffer_size < 2) {
        throw std::invalid_argument("Buffer size must be at least 2, got " + std::to_string(buffer_size));
    }
}

void PulseMonitor::start() {
    if (m_state == State::Running) return;
    m_buffer.clear();
    m_rate.reset();
    m_heart_rate = 0.0;
    m_waveform.clear();
    m_state = State::Running;
    spdlog::info("Measurement started (window {} samples, slide {})", window_size(), window_size() - retained_size());
}

void PulseMonitor::stop() {
    if (m_state == State::Idle) return;
    m_state = State::Idle;
    m_buffer.clear();
    m_rate.reset();
    m_heart_rate = 0.0;
    m_waveform.clear();
    spdlog::info("Measurement stopped");
}

std::optional<PulseReading> PulseMonitor::step(const Sample& sample) {
    if (m_state != State::Running) return std::nullopt;
    if (!std::isfinite(sample.value)) {
        spdlog::warn("Rejected non-finite sample");
        return std::nullopt;
    }

    if (m_rate.tick(sample.timestamp)) {
        spdlog::debug("Effective sample rate: {:.0f} fps", m_rate.rate());
    }
    m_buffer.append(sample);
    if (!m_buffer.is_full()) return std::nullopt;

    auto reading = process();
    m_buffer.drain_keeping_tail(retained_size());
    return reading;
}

PulseReading PulseMonitor::process() {
    const double fps = m_rate.rate();

    // 1. Denoise
    const auto smoothed = moving_average(m_buffer.values(), m_smoothing_window);

    // 2. Remove baseline drift and high frequency noise
    m_waveform = m_band.filter(smoothed, fps);

    // 3. Dominant period via autocorrelation
    auto est = find_dominant_period(m_waveform, fps);
    if (est) {
        m_heart_rate = est->bpm;
        spdlog::debug("Autocorrelation peak: lag {} (value {:.4f}) at {:.0f} fps",
            est->peak_lag, est->peak_value, fps);
        spdlog::info("Heart rate: {:.1f} bpm", m_heart_rate);
    } else {
        m_heart_rate = 0.0;
        spdlog::info("Heart rate indeterminate: {}", est.error());
    }

    return PulseReading{m_heart_rate, m_waveform, fps};
}
