#include "SampleBuffer.hpp"
#include <algorithm>
#include <iterator>

SampleBuffer::SampleBuffer(size_t capacity)
    : m_capacity(capacity) {}

void SampleBuffer::append(const Sample& sample) {
    m_samples.push_back(sample);
}

void SampleBuffer::drain_keeping_tail(size_t n) {
    if (m_samples.size() <= n) return;
    m_samples.erase(m_samples.begin(), m_samples.end() - static_cast<std::ptrdiff_t>(n));
}

std::vector<double> SampleBuffer::values() const {
    std::vector<double> out;
    out.reserve(m_samples.size());
    std::transform(m_samples.begin(), m_samples.end(), std::back_inserter(out),
                   [](const Sample& s) { return s.value; });
    return out;
}

std::vector<std::chrono::steady_clock::time_point> SampleBuffer::timestamps() const {
    std::vector<std::chrono::steady_clock::time_point> out;
    out.reserve(m_samples.size());
    for (const auto& s : m_samples) {
        out.push_back(s.timestamp);
    }
    return out;
}
