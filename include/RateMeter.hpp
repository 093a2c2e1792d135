#pragma once
#include <chrono>
#include <cstddef>
#include <optional>

/**
 * @class RateMeter
 * @brief Measures the effective sample rate over one-second windows.
 *
 * The rate stays 0 until the first window closes.
 */
class RateMeter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateMeter(Clock::duration window = std::chrono::seconds(1));

    /**
     * @brief Registers one sample taken at @p t.
     * @return true if this sample closed a window and updated rate().
     */
    bool tick(Clock::time_point t);

    void reset();

    double rate() const { return m_rate; }

private:
    Clock::duration m_window;
    std::optional<Clock::time_point> m_window_start;
    size_t m_count{0};
    double m_rate{0.0};
};
