#pragma once

#include <opencv2/core.hpp>
#include "core/binary_fingerprint.hpp"
#include "core/frame_types.hpp"
#include "core/video_hash_config.hpp"

/**
 * @brief Color-dominance hash of a whole frame set.
 *
 * Frames are stitched left to right into one strip of constant height and
 * the strip is split into grid_size vertical chunks. Each chunk contributes
 * one bit, repeated on every row of the grid so the result has as many bits
 * as the wavelet hash.
 */
class MultiFrameColorHash
{
public:
    /**
     * @return grid_size^2 bits, row-major
     * @throws EmptyFrameSetError if frames is empty
     */
    static BinaryFingerprint compute(const FrameSet &frames, const VideoHashSettings &settings = VideoHashSettings());

    /**
     * @brief Scale each frame to strip_height keeping its aspect ratio and join them horizontally
     */
    static cv::Mat buildStrip(const FrameSet &frames, int strip_height);

    /**
     * @brief Bit for one averaged color
     *
     * The strictly largest channel decides (set when above 128). Without a
     * strict maximum the integer mean of the three channels decides.
     */
    static bool dominantChannelBit(int r, int g, int b);

    // Chunks larger than this many pixels are sampled every SAMPLE_STEP pixels
    static constexpr int SAMPLING_AREA_THRESHOLD = 10000;
    static constexpr int SAMPLE_STEP = 4;
};
