#include "PeriodicityEstimator.hpp"
#include <algorithm>
#include <cmath>

namespace {
// Converts a duration in seconds to a whole number of lags, floored and capped at @p limit.
size_t seconds_to_lag(double seconds, double fps, size_t limit) {
    const double lag = std::floor(fps * seconds);
    if (lag >= static_cast<double>(limit)) return limit;
    return static_cast<size_t>(lag);
}
} // namespace

std::vector<double> autocorrelation(const std::vector<double>& signal, size_t max_lag) {
    const size_t n = signal.size();
    max_lag = std::min(max_lag, n);
    std::vector<double> ac(max_lag, 0.0);
    for (size_t lag = 0; lag < max_lag; ++lag) {
        double sum = 0.0;
        for (size_t i = 0; i + lag < n; ++i) {
            sum += signal[i] * signal[i + lag];
        }
        ac[lag] = sum;
    }
    return ac;
}

std::expected<PeriodEstimate, std::string> find_dominant_period(const std::vector<double>& signal, double fps) {
    if (signal.size() < 2) return std::unexpected("Not enough samples");
    if (!std::isfinite(fps) || fps <= 0.0) return std::unexpected("Sample rate unknown");

    // Periods are searched between 0.5 s and 2 s
    const size_t max_lag = seconds_to_lag(2.0, fps, signal.size());
    const size_t min_lag = seconds_to_lag(0.5, fps, signal.size());
    if (min_lag >= max_lag) return std::unexpected("Window shorter than the minimum period");

    const auto ac = autocorrelation(signal, max_lag);

    PeriodEstimate est;
    for (size_t lag = min_lag; lag < ac.size(); ++lag) {
        if (ac[lag] > est.peak_value) {
            est.peak_value = ac[lag];
            est.peak_lag = lag;
        }
    }

    if (est.peak_lag == 0) {
        if (est.peak_value > 0.0) return std::unexpected("Peak at zero lag");
        return std::unexpected("No positive autocorrelation peak");
    }
    const double period = static_cast<double>(est.peak_lag) / fps;
    est.bpm = 60.0 / period;
    return est;
}

double estimate_heart_rate(const std::vector<double>& signal, double fps) {
    auto est = find_dominant_period(signal, fps);
    return est ? est->bpm : 0.0;
}
