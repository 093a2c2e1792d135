#include "RoiSampler.hpp"
#include <cmath>
#include <stdexcept>

RoiSampler::RoiSampler(int roi_width, int roi_height)
    : m_width(roi_width), m_height(roi_height) {
    if (roi_width <= 0 || roi_height <= 0) {
        throw std::invalid_argument("ROI dimensions must be positive");
    }
}

cv::Rect RoiSampler::roi_for(const cv::Size& frame_size) const {
    return centered_roi(frame_size, m_width, m_height);
}

std::expected<double, std::string> RoiSampler::sample(const cv::Mat& frame) const {
    if (frame.empty()) {
        return std::unexpected("Empty frame");
    }
    return mean_green(frame, roi_for(frame.size()));
}

cv::Rect centered_roi(const cv::Size& frame_size, int width, int height) {
    // A ROI larger than the frame gets a negative offset and is clipped
    const int x = static_cast<int>(std::floor((frame_size.width - width) / 2.0));
    const int y = static_cast<int>(std::floor((frame_size.height - height) / 2.0));
    return cv::Rect(x, y, width, height) & cv::Rect(0, 0, frame_size.width, frame_size.height);
}

std::expected<double, std::string> mean_green(const cv::Mat& frame, const cv::Rect& roi) {
    if (frame.empty()) {
        return std::unexpected("Empty frame");
    }
    if (frame.channels() < 3) {
        return std::unexpected("Expected a BGR frame, got " + std::to_string(frame.channels()) + " channel(s)");
    }
    const cv::Rect clipped = roi & cv::Rect(0, 0, frame.cols, frame.rows);
    if (clipped.area() <= 0) {
        return std::unexpected("ROI outside the frame");
    }
    return cv::mean(frame(clipped))[1];
}
