#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief Rate-based extraction capability consumed by the duration-adaptive sampler
 */
class FrameExtractor
{
public:
    virtual ~FrameExtractor() = default;

    /**
     * @brief Duration of the container in seconds, 0 when it cannot be determined
     */
    virtual double probeDuration(const std::string &path) = 0;

    /**
     * @brief Decode frames at a fixed rate, scaled to the given height
     * @param path Video file
     * @param fps Frames per second to extract
     * @param frame_height Output height; width follows the aspect ratio
     * @return RGB8 rasters in temporal order; unreadable frames are left out
     * @throws ExternalProcessError if the decode process fails or times out
     */
    virtual std::vector<cv::Mat> extractAtRate(const std::string &path, double fps, int frame_height) = 0;
};
