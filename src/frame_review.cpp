#include "core/frame_review.hpp"
#include "core/video_hash_errors.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace
{
    void writeImage(const fs::path &path, const cv::Mat &image)
    {
        if (!cv::imwrite(path.string(), image))
        {
            throw IoError("Failed to write image: " + path.string());
        }
    }
}

cv::Mat FrameReview::joinHorizontally(const RawFrame &left, const RawFrame &right)
{
    const int width = left.width() + right.width();
    const int height = std::max(left.height(), right.height());

    cv::Mat combined(height, width, CV_8UC4, cv::Scalar(0, 0, 0, 0));

    cv::Mat left_cell = combined(cv::Rect(0, 0, left.width(), left.height()));
    cv::cvtColor(left.rgb(), left_cell, cv::COLOR_RGB2RGBA);

    cv::Mat right_cell = combined(cv::Rect(left.width(), 0, right.width(), right.height()));
    cv::cvtColor(right.rgb(), right_cell, cv::COLOR_RGB2RGBA);

    return combined;
}

std::vector<ExportedFrame> FrameReview::exportDivergentFrames(const FrameDiffReport &report, const fs::path &output_dir)
{
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec)
    {
        throw IoError("Failed to create output directory " + output_dir.string() + ": " + ec.message());
    }

    std::vector<ExportedFrame> exported;
    for (const auto &divergence : report.divergences)
    {
        const size_t i = divergence.frame_index;
        if (i >= report.frames_1.size() || i >= report.frames_2.size())
        {
            Logger::warn("Frame index " + std::to_string(i) + " out of bounds, skipping");
            continue;
        }

        const RawFrame &frame_1 = report.frames_1[i];
        const RawFrame &frame_2 = report.frames_2[i];
        const std::string stem = "frame-" + std::to_string(i);

        ExportedFrame entry;
        entry.frame_index = i;
        entry.bit_distance = divergence.bit_distance;
        entry.video1_path = output_dir / (stem + "-video1.png");
        entry.video2_path = output_dir / (stem + "-video2.png");
        entry.combined_path = output_dir / (stem + "-combined.png");

        // imwrite expects BGR channel order
        cv::Mat bgr_1, bgr_2, bgra_combined;
        cv::cvtColor(frame_1.rgb(), bgr_1, cv::COLOR_RGB2BGR);
        cv::cvtColor(frame_2.rgb(), bgr_2, cv::COLOR_RGB2BGR);
        cv::cvtColor(joinHorizontally(frame_1, frame_2), bgra_combined, cv::COLOR_RGBA2BGRA);

        writeImage(entry.video1_path, bgr_1);
        writeImage(entry.video2_path, bgr_2);
        writeImage(entry.combined_path, bgra_combined);
        exported.push_back(entry);
    }

    Logger::info("Exported " + std::to_string(exported.size()) + " differing frame pairs to " + output_dir.string());
    return exported;
}
