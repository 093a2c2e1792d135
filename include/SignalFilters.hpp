#pragma once
#include <cstddef>
#include <vector>
#include <utility>

/**
 * @brief Centered moving average with an integer half window of @p window_size / 2.
 *
 * Near the edges the window shrinks instead of padding, so output[i] averages
 * input[max(0, i - h) .. min(N - 1, i + h)].
 */
std::vector<double> moving_average(const std::vector<double>& signal, size_t window_size);

/**
 * @struct BandLimitState
 * @brief Loop-carried state of the cascaded high-pass / low-pass stage.
 */
struct BandLimitState {
    double baseline{0.0};  ///< Exponential baseline subtracted by the high-pass stage.
    double smoothed{0.0};  ///< Last low-pass output.
    bool primed{false};    ///< False until the first sample seeds both stages.
};

struct BandLimitResult {
    BandLimitState state;
    std::vector<double> output;
};

/**
 * @class BandLimitFilter
 * @brief Fixed-pole approximation of a heart-rate bandpass.
 *
 * A single-pole baseline subtraction (alpha 0.95) followed by single-pole
 * smoothing (alpha 0.8). The cutoff frequencies are kept for reporting only:
 * they do not move the poles.
 */
class BandLimitFilter {
public:
    static constexpr double kAlphaHigh = 0.95;
    static constexpr double kAlphaLow = 0.8;

    BandLimitFilter(double min_hz, double max_hz);

    /**
     * @brief Folds @p samples through the filter starting from @p state.
     * @return The advanced state and one output per input sample.
     */
    BandLimitResult apply(BandLimitState state, const std::vector<double>& samples) const;

    /**
     * @brief Filters a whole window from a fresh state.
     * @param sample_rate Effective sample rate, used to report normalized cutoffs.
     */
    std::vector<double> filter(const std::vector<double>& samples, double sample_rate) const;

    /**
     * @brief Cutoffs as a fraction of Nyquist, or {0, 0} for a non-positive rate.
     */
    std::pair<double, double> normalized_cutoffs(double sample_rate) const;

    double min_hz() const { return m_min_hz; }
    double max_hz() const { return m_max_hz; }

private:
    double m_min_hz;
    double m_max_hz;
};
