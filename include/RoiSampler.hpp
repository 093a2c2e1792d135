#ifndef ROI_SAMPLER_HPP
#define ROI_SAMPLER_HPP

#include <opencv2/core.hpp>
#include <expected>
#include <string>

/**
 * @class RoiSampler
 * @brief Extracts one intensity scalar per frame from a fixed, centered ROI.
 */
class RoiSampler {
public:
    /**
     * @param roi_width Requested ROI width in pixels.
     * @param roi_height Requested ROI height in pixels.
     * @throws std::invalid_argument if either dimension is not positive.
     */
    RoiSampler(int roi_width, int roi_height);

    /**
     * @brief ROI centered in a frame of @p frame_size, clipped to the frame.
     */
    cv::Rect roi_for(const cv::Size& frame_size) const;

    /**
     * @brief Mean green intensity of a BGR frame inside the centered ROI.
     * @return std::expected containing the mean, or an error for an empty frame/ROI.
     */
    std::expected<double, std::string> sample(const cv::Mat& frame) const;

private:
    int m_width;
    int m_height;
};

/**
 * @brief Rectangle of size @p width x @p height centered in @p frame_size, clipped to it.
 */
cv::Rect centered_roi(const cv::Size& frame_size, int width, int height);

/**
 * @brief Mean of the green channel (index 1 of BGR) inside @p roi.
 */
std::expected<double, std::string> mean_green(const cv::Mat& frame, const cv::Rect& roi);

#endif
