#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <vector>

/**
 * @struct Sample
 * @brief One ROI intensity reading and the moment it was captured.
 */
struct Sample {
    std::chrono::steady_clock::time_point timestamp;
    double value{0.0};
};

/**
 * @class SampleBuffer
 * @brief Time-ordered sliding window of samples with a fill threshold.
 *
 * The buffer never rejects an append. Growth is bounded only by the owner
 * calling drain_keeping_tail() once per fill.
 */
class SampleBuffer {
public:
    /**
     * @param capacity Number of samples that makes the buffer full.
     */
    explicit SampleBuffer(size_t capacity);

    void append(const Sample& sample);

    bool is_full() const { return m_samples.size() >= m_capacity; }

    /**
     * @brief Keeps only the most recent @p n samples (all of them if fewer).
     */
    void drain_keeping_tail(size_t n);

    void clear() { m_samples.clear(); }

    /**
     * @brief Snapshot of sample values in insertion order.
     */
    std::vector<double> values() const;

    /**
     * @brief Snapshot of sample timestamps in insertion order.
     */
    std::vector<std::chrono::steady_clock::time_point> timestamps() const;

    size_t size() const { return m_samples.size(); }
    size_t capacity() const { return m_capacity; }
    bool empty() const { return m_samples.empty(); }

private:
    std::deque<Sample> m_samples;
    size_t m_capacity;
};
