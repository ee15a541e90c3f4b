#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include "core/binary_fingerprint.hpp"
#include "core/frame_types.hpp"

/**
 * @brief Difference hash (dHash) of a single frame.
 *
 * The frame is reduced to luminance, area-averaged down to (N+1) x N and
 * each bit records whether a pixel is brighter than its right neighbour.
 * Bits are packed MSB-first, row-major, giving exactly N*N bits.
 */
class ImageHasher
{
public:
    /**
     * @param grid_size Hash grid side N
     * @throws std::invalid_argument if grid_size < 1
     */
    explicit ImageHasher(int grid_size = 8);

    int gridSize() const { return grid_size_; }

    BinaryFingerprint computeHash(const RawFrame &frame) const;

    /**
     * @brief Hash an RGB8 (or single channel) matrix
     * @throws InvalidFrameError if the matrix has zero width or height
     */
    BinaryFingerprint computeHash(const cv::Mat &rgb) const;

    /**
     * @brief Hash each frame in order
     */
    std::vector<BinaryFingerprint> computeHashes(const FrameSet &frames) const;

private:
    int grid_size_;
};
