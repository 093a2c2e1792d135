#include "SignalFilters.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

std::vector<double> moving_average(const std::vector<double>& signal, size_t window_size) {
    const size_t n = signal.size();
    const size_t half = window_size / 2;
    std::vector<double> out;
    out.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        const size_t lo = (i >= half) ? i - half : 0;
        const size_t hi = std::min(n - 1, i + half);
        // Summed as offsets from the center sample so a flat window is bit-exact
        const double ref = signal[i];
        double sum = 0.0;
        for (size_t j = lo; j <= hi; ++j) {
            sum += signal[j] - ref;
        }
        out.push_back(ref + sum / static_cast<double>(hi - lo + 1));
    }
    return out;
}

BandLimitFilter::BandLimitFilter(double min_hz, double max_hz)
    : m_min_hz(min_hz), m_max_hz(max_hz) {}

BandLimitResult BandLimitFilter::apply(BandLimitState state, const std::vector<double>& samples) const {
    BandLimitResult res{state, {}};
    res.output.reserve(samples.size());

    for (double s : samples) {
        auto& st = res.state;
        if (!st.primed) {
            // First sample: high-pass output is zero, which also seeds the low-pass.
            st.baseline = s;
            st.smoothed = 0.0;
            st.primed = true;
        }
        // Both updates are prev = alpha * prev + (1 - alpha) * x, written so a
        // constant input leaves prev bit-exact.

        // 1. High-pass: subtract the running baseline, then let it drift toward s
        const double high = s - st.baseline;
        st.baseline += (1.0 - kAlphaHigh) * (s - st.baseline);

        // 2. Low-pass: single-pole smoothing of the high-passed sample
        st.smoothed += (1.0 - kAlphaLow) * (high - st.smoothed);
        res.output.push_back(st.smoothed);
    }
    return res;
}

std::vector<double> BandLimitFilter::filter(const std::vector<double>& samples, double sample_rate) const {
    if (spdlog::should_log(spdlog::level::debug)) {
        const auto [lo, hi] = normalized_cutoffs(sample_rate);
        spdlog::debug("Band-limit {:.2f}-{:.2f} Hz @ {:.1f} fps (normalized {:.3f}-{:.3f})",
            m_min_hz, m_max_hz, sample_rate, lo, hi);
    }
    return apply(BandLimitState{}, samples).output;
}

std::pair<double, double> BandLimitFilter::normalized_cutoffs(double sample_rate) const {
    if (!(sample_rate > 0.0)) return {0.0, 0.0};
    const double nyquist = sample_rate / 2.0;
    return {m_min_hz / nyquist, m_max_hz / nyquist};
}
