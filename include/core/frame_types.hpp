#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>

/**
 * @brief One decoded video frame, RGB8, immutable once constructed
 */
class RawFrame
{
public:
    /**
     * @brief Wrap an RGB8 raster
     * @param rgb CV_8UC3 matrix in R,G,B channel order
     * @throws InvalidFrameError if the raster is empty or not 8-bit RGB
     */
    explicit RawFrame(cv::Mat rgb);

    /**
     * @brief Build a frame from an OpenCV BGR image (cv::imread output)
     */
    static RawFrame fromBgr(const cv::Mat &bgr);

    int width() const { return rgb_.cols; }
    int height() const { return rgb_.rows; }
    const cv::Mat &rgb() const { return rgb_; }

private:
    cv::Mat rgb_;
};

/**
 * @brief Temporally ordered frames sampled from one video
 */
class FrameSet
{
public:
    FrameSet() = default;
    explicit FrameSet(std::vector<RawFrame> frames) : frames_(std::move(frames)) {}

    void add(RawFrame frame) { frames_.push_back(std::move(frame)); }

    size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }

    const RawFrame &operator[](size_t index) const { return frames_[index]; }
    const RawFrame &at(size_t index) const { return frames_.at(index); }

    std::vector<RawFrame>::const_iterator begin() const { return frames_.begin(); }
    std::vector<RawFrame>::const_iterator end() const { return frames_.end(); }

    const std::vector<RawFrame> &frames() const { return frames_; }

private:
    std::vector<RawFrame> frames_;
};

/**
 * @brief Stream properties reported by a decoder probe
 */
struct VideoStreamInfo
{
    int64_t total_frames = 0;     // Reported or estimated frame count
    double duration_seconds = 0.0;
    int width = 0;
    int height = 0;
    double fps = 0.0;             // Average frame rate
};

/**
 * @brief Bookkeeping sidecar stored next to a fingerprint; never affects hashing
 */
struct VideoMetadata
{
    std::string video_id;
    double duration = 0.0;
    int width = 0;
    int height = 0;
    double fps = 0.0;

    static VideoMetadata fromStreamInfo(const std::string &video_id, const VideoStreamInfo &info);

    nlohmann::json toJson() const;
    static VideoMetadata fromJson(const nlohmann::json &j);
};

/**
 * @brief A sampled position where two videos' per-frame hashes differ
 */
struct FrameDivergence
{
    size_t frame_index = 0;
    int bit_distance = 0;

    bool operator==(const FrameDivergence &other) const
    {
        return frame_index == other.frame_index && bit_distance == other.bit_distance;
    }
};
