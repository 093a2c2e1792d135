#pragma once
#include <cstddef>
#include <expected>
#include <string>
#include <vector>

/**
 * @struct PeriodEstimate
 * @brief Dominant autocorrelation peak and the heart rate it implies.
 */
struct PeriodEstimate {
    size_t peak_lag{0};
    double peak_value{0.0};
    double bpm{0.0};
};

/**
 * @brief Unnormalized autocorrelation for lags [0, max_lag).
 *
 * ac[lag] = sum of signal[i] * signal[i + lag] over every i where both exist.
 * @p max_lag is clamped to the signal length.
 */
std::vector<double> autocorrelation(const std::vector<double>& signal, size_t max_lag);

/**
 * @brief Finds the strongest periodicity between 0.5 s and 2 s.
 *
 * Lags are scanned in ascending order and only a strictly larger positive
 * correlation replaces the current peak, so the first maximum wins.
 * @param signal Filtered waveform.
 * @param fps Effective sample rate used to turn lags into seconds.
 * @return The peak, or the reason no rate can be given.
 */
std::expected<PeriodEstimate, std::string> find_dominant_period(const std::vector<double>& signal, double fps);

/**
 * @brief Heart rate in bpm, or 0 when it cannot be determined. Never negative.
 */
double estimate_heart_rate(const std::vector<double>& signal, double fps);
