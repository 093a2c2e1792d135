#include "RateMeter.hpp"
#include <cmath>

RateMeter::RateMeter(Clock::duration window)
    : m_window(window) {}

bool RateMeter::tick(Clock::time_point t) {
    if (!m_window_start) {
        m_window_start = t;
        m_count = 0;
        return false;
    }
    ++m_count;
    const auto elapsed = t - *m_window_start;
    if (elapsed < m_window) return false;

    const double seconds = std::chrono::duration<double>(elapsed).count();
    m_rate = std::round(static_cast<double>(m_count) / seconds);
    m_window_start = t;
    m_count = 0;
    return true;
}

void RateMeter::reset() {
    m_window_start.reset();
    m_count = 0;
    m_rate = 0.0;
}
