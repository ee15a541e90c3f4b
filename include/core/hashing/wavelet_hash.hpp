#pragma once

#include <opencv2/core.hpp>
#include "core/binary_fingerprint.hpp"
#include "core/frame_types.hpp"
#include "core/video_hash_config.hpp"

/**
 * @brief Structural hash of a whole frame set.
 *
 * A single frame is hashed directly. Several frames are tiled into a square
 * collage first so one hash captures the coarse luminance layout of all of
 * them. Bits are set where the grid cell is at or above the grid median.
 */
class MultiFrameWaveletHash
{
public:
    /**
     * @return grid_size^2 bits, row-major
     * @throws EmptyFrameSetError if frames is empty
     */
    static BinaryFingerprint compute(const FrameSet &frames, const VideoHashSettings &settings = VideoHashSettings());

    /**
     * @brief Tile frames row-major into a ceil(sqrt(n)) per side RGBA collage
     *
     * Each frame is scaled to tile_size x tile_size; cells without a frame
     * stay transparent black.
     */
    static cv::Mat buildCollage(const FrameSet &frames, int tile_size);

private:
    static BinaryFingerprint medianThreshold(const cv::Mat &gray_grid);
};
