#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include "core/frame_diff_comparator.hpp"
#include "core/frame_types.hpp"

/**
 * @brief Files written for one differing frame position
 */
struct ExportedFrame
{
    size_t frame_index = 0;
    int bit_distance = 0;
    fs::path video1_path;
    fs::path video2_path;
    fs::path combined_path;
};

/**
 * @brief Images that let a person inspect where two videos differ
 */
class FrameReview
{
public:
    /**
     * @brief Place two frames side by side
     * @return RGBA image as wide as both frames and as tall as the taller
     *         one; uncovered pixels are transparent black
     */
    static cv::Mat joinHorizontally(const RawFrame &left, const RawFrame &right);

    /**
     * @brief Write frame-<i>-video1.png, frame-<i>-video2.png and frame-<i>-combined.png per divergence
     * @param report Comparison result holding both frame sets
     * @param output_dir Created if missing
     * @throws IoError if the directory or an image cannot be written
     */
    static std::vector<ExportedFrame> exportDivergentFrames(const FrameDiffReport &report, const fs::path &output_dir);
};
