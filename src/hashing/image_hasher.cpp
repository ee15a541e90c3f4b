#include "core/hashing/image_hasher.hpp"
#include "core/video_hash_errors.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

ImageHasher::ImageHasher(int grid_size)
    : grid_size_(grid_size)
{
    if (grid_size_ < 1)
    {
        throw std::invalid_argument("Hash grid size must be positive, got " + std::to_string(grid_size_));
    }
}

BinaryFingerprint ImageHasher::computeHash(const RawFrame &frame) const
{
    return computeHash(frame.rgb());
}

BinaryFingerprint ImageHasher::computeHash(const cv::Mat &rgb) const
{
    if (rgb.empty() || rgb.cols <= 0 || rgb.rows <= 0)
    {
        throw InvalidFrameError("Cannot hash frame with degenerate dimensions: " + std::to_string(rgb.cols) + "x" + std::to_string(rgb.rows));
    }

    cv::Mat gray;
    if (rgb.channels() == 1)
    {
        gray = rgb;
    }
    else if (rgb.channels() == 4)
    {
        cv::cvtColor(rgb, gray, cv::COLOR_RGBA2GRAY);
    }
    else
    {
        cv::cvtColor(rgb, gray, cv::COLOR_RGB2GRAY);
    }

    // One extra column so every cell has a right neighbour
    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(grid_size_ + 1, grid_size_), 0, 0, cv::INTER_AREA);

    const int bit_count = grid_size_ * grid_size_;
    std::vector<uint8_t> hash_data((bit_count + 7) / 8, 0);

    int hash_index = 0;
    int bit_position = 0;
    for (int y = 0; y < grid_size_; y++)
    {
        for (int x = 0; x < grid_size_; x++)
        {
            uint8_t current_pixel = resized.at<uint8_t>(y, x);
            uint8_t next_pixel = resized.at<uint8_t>(y, x + 1);

            if (current_pixel > next_pixel)
            {
                hash_data[hash_index] |= (1 << (7 - bit_position));
            }

            bit_position++;
            if (bit_position == 8)
            {
                bit_position = 0;
                hash_index++;
            }
        }
    }

    return BinaryFingerprint::fromBytes(hash_data, static_cast<size_t>(bit_count));
}

std::vector<BinaryFingerprint> ImageHasher::computeHashes(const FrameSet &frames) const
{
    std::vector<BinaryFingerprint> hashes;
    hashes.reserve(frames.size());
    for (const auto &frame : frames)
    {
        hashes.push_back(computeHash(frame));
    }
    return hashes;
}
