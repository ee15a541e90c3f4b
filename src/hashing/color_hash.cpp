#include "core/hashing/color_hash.hpp"
#include "core/video_hash_errors.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

bool MultiFrameColorHash::dominantChannelBit(int r, int g, int b)
{
    if (r > g && r > b)
        return r > 128;
    if (g > r && g > b)
        return g > 128;
    if (b > r && b > g)
        return b > 128;
    return (r + g + b) / 3 > 128;
}

cv::Mat MultiFrameColorHash::buildStrip(const FrameSet &frames, int strip_height)
{
    std::vector<cv::Mat> scaled;
    scaled.reserve(frames.size());
    for (const auto &frame : frames)
    {
        double aspect = static_cast<double>(frame.width()) / static_cast<double>(frame.height());
        int width = std::max(1, static_cast<int>(std::round(strip_height * aspect)));

        cv::Mat resized;
        cv::resize(frame.rgb(), resized, cv::Size(width, strip_height), 0, 0, cv::INTER_AREA);
        scaled.push_back(resized);
    }

    cv::Mat strip;
    cv::hconcat(scaled, strip);
    return strip;
}

BinaryFingerprint MultiFrameColorHash::compute(const FrameSet &frames, const VideoHashSettings &settings)
{
    if (frames.empty())
    {
        throw EmptyFrameSetError("Cannot compute color hash of an empty frame set");
    }
    settings.validate();

    const int grid = settings.grid_size;
    std::vector<bool> bits;
    bits.reserve(static_cast<size_t>(grid) * grid);

    if (frames.size() == 1)
    {
        cv::Mat resized;
        cv::resize(frames[0].rgb(), resized, cv::Size(grid, grid), 0, 0, cv::INTER_AREA);
        for (int y = 0; y < grid; y++)
        {
            for (int x = 0; x < grid; x++)
            {
                const cv::Vec3b &px = resized.at<cv::Vec3b>(y, x);
                bits.push_back(dominantChannelBit(px[0], px[1], px[2]));
            }
        }
        return BinaryFingerprint(std::move(bits));
    }

    cv::Mat strip = buildStrip(frames, settings.frame_size);
    const int chunk_width = strip.cols / grid;
    const int chunk_height = strip.rows;
    const int step = (chunk_width * chunk_height > SAMPLING_AREA_THRESHOLD) ? SAMPLE_STEP : 1;

    std::vector<bool> column_bits;
    column_bits.reserve(grid);
    for (int chunk = 0; chunk < grid; chunk++)
    {
        const int x_start = chunk * chunk_width;
        long long r_sum = 0, g_sum = 0, b_sum = 0, count = 0;

        for (int y = 0; y < chunk_height; y += step)
        {
            const cv::Vec3b *row = strip.ptr<cv::Vec3b>(y);
            for (int x = x_start; x < x_start + chunk_width; x += step)
            {
                r_sum += row[x][0];
                g_sum += row[x][1];
                b_sum += row[x][2];
                count++;
            }
        }

        if (count == 0)
        {
            column_bits.push_back(false);
            continue;
        }
        column_bits.push_back(dominantChannelBit(static_cast<int>(r_sum / count),
                                                 static_cast<int>(g_sum / count),
                                                 static_cast<int>(b_sum / count)));
    }

    for (int row = 0; row < grid; row++)
    {
        bits.insert(bits.end(), column_bits.begin(), column_bits.end());
    }
    return BinaryFingerprint(std::move(bits));
}
