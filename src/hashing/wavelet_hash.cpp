#include "core/hashing/wavelet_hash.hpp"
#include "core/video_hash_errors.hpp"
#include <opencv2/imgproc.hpp>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <cmath>

BinaryFingerprint MultiFrameWaveletHash::compute(const FrameSet &frames, const VideoHashSettings &settings)
{
    if (frames.empty())
    {
        throw EmptyFrameSetError("Cannot compute wavelet hash of an empty frame set");
    }
    settings.validate();

    const cv::Size grid(settings.grid_size, settings.grid_size);

    if (frames.size() == 1)
    {
        cv::Mat resized, gray;
        cv::resize(frames[0].rgb(), resized, grid, 0, 0, cv::INTER_AREA);
        cv::cvtColor(resized, gray, cv::COLOR_RGB2GRAY);
        return medianThreshold(gray);
    }

    cv::Mat collage = buildCollage(frames, settings.frame_size);
    cv::Mat gray, resized;
    cv::cvtColor(collage, gray, cv::COLOR_RGBA2GRAY);
    cv::resize(gray, resized, grid, 0, 0, cv::INTER_AREA);
    return medianThreshold(resized);
}

cv::Mat MultiFrameWaveletHash::buildCollage(const FrameSet &frames, int tile_size)
{
    const int per_side = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(frames.size()))));
    cv::Mat collage(per_side * tile_size, per_side * tile_size, CV_8UC4, cv::Scalar(0, 0, 0, 0));

    // Tiles are disjoint, so frames can be scaled and placed concurrently
    tbb::parallel_for(size_t(0), frames.size(), [&](size_t i)
                      {
        cv::Mat tile;
        cv::resize(frames[i].rgb(), tile, cv::Size(tile_size, tile_size), 0, 0, cv::INTER_AREA);

        const int col = static_cast<int>(i) % per_side;
        const int row = static_cast<int>(i) / per_side;
        cv::Mat cell = collage(cv::Rect(col * tile_size, row * tile_size, tile_size, tile_size));
        cv::cvtColor(tile, cell, cv::COLOR_RGB2RGBA); });

    return collage;
}

BinaryFingerprint MultiFrameWaveletHash::medianThreshold(const cv::Mat &gray_grid)
{
    std::vector<uint8_t> pixels;
    pixels.reserve(gray_grid.total());
    for (int y = 0; y < gray_grid.rows; y++)
    {
        for (int x = 0; x < gray_grid.cols; x++)
        {
            pixels.push_back(gray_grid.at<uint8_t>(y, x));
        }
    }

    std::vector<uint8_t> sorted = pixels;
    std::sort(sorted.begin(), sorted.end());
    const uint8_t median = sorted[sorted.size() / 2];

    std::vector<bool> bits;
    bits.reserve(pixels.size());
    for (uint8_t p : pixels)
    {
        bits.push_back(p >= median);
    }
    return BinaryFingerprint(std::move(bits));
}
