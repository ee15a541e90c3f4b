#pragma once

#include <atomic>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/decoder/frame_decoder.hpp"
#include "core/decoder/frame_extractor.hpp"
#include "core/frame_diff_comparator.hpp"
#include "core/frame_types.hpp"
#include "core/video_hash_errors.hpp"

// Synthetic RGB frames with exactly predictable hashes.
namespace test_media
{
    inline cv::Mat solidFrame(int width, int height, uint8_t r, uint8_t g, uint8_t b)
    {
        return cv::Mat(height, width, CV_8UC3, cv::Scalar(r, g, b));
    }

    // Left half white, right half black
    inline cv::Mat leftHalfWhite(int width, int height)
    {
        cv::Mat frame = solidFrame(width, height, 0, 0, 0);
        frame(cv::Rect(0, 0, width / 2, height)).setTo(cv::Scalar(255, 255, 255));
        return frame;
    }

    // Top half white, bottom half black
    inline cv::Mat topHalfWhite(int width, int height)
    {
        cv::Mat frame = solidFrame(width, height, 0, 0, 0);
        frame(cv::Rect(0, 0, width, height / 2)).setTo(cv::Scalar(255, 255, 255));
        return frame;
    }

    // Brightness rises (or falls) by 10 every 10 columns; with width 90 the
    // 9-column reduction used by the difference hash is exact
    inline cv::Mat horizontalGradient(int width, int height, bool increasing)
    {
        cv::Mat frame(height, width, CV_8UC3);
        for (int x = 0; x < width; x++)
        {
            int step = x / 10;
            uint8_t value = static_cast<uint8_t>(increasing ? 40 + step * 20 : 220 - step * 20);
            frame.col(x).setTo(cv::Scalar(value, value, value));
        }
        return frame;
    }

    inline FrameSet frameSetOf(const std::vector<cv::Mat> &mats)
    {
        FrameSet frames;
        for (const auto &mat : mats)
        {
            frames.add(RawFrame(mat.clone()));
        }
        return frames;
    }

    inline std::string readFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
}

/**
 * @brief In-memory FrameDecoder; the content of the file passed in selects the video
 */
class FakeFrameDecoder : public FrameDecoder
{
public:
    struct Video
    {
        std::vector<cv::Mat> frames;
        VideoStreamInfo info;
    };

    void addVideo(const std::string &key, std::vector<cv::Mat> frames, int64_t reported_total = -1)
    {
        Video video;
        video.info.width = frames.empty() ? 0 : frames.front().cols;
        video.info.height = frames.empty() ? 0 : frames.front().rows;
        video.info.fps = 30.0;
        video.info.total_frames = reported_total >= 0 ? reported_total : static_cast<int64_t>(frames.size());
        video.info.duration_seconds = static_cast<double>(frames.size()) / video.info.fps;
        video.frames = std::move(frames);
        videos_[key] = std::move(video);
    }

    VideoStreamInfo probe(const std::string &path) override
    {
        return find(path).info;
    }

    void decode(const std::string &path, const std::vector<int64_t> &frame_indices, const FrameCallback &on_frame) override
    {
        const Video &video = find(path);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_indices_[test_media::readFile(path)] = frame_indices;
        }
        decode_calls_++;

        size_t next = 0;
        for (size_t i = 0; i < video.frames.size() && next < frame_indices.size(); ++i)
        {
            if (static_cast<int64_t>(i) == frame_indices[next])
            {
                ++next;
                if (!on_frame(static_cast<int64_t>(i), video.frames[i].clone()))
                    return;
            }
        }
    }

    std::vector<int64_t> requestedIndices(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requested_indices_[key];
    }

    int decodeCalls() const { return decode_calls_.load(); }

private:
    const Video &find(const std::string &path) const
    {
        auto it = videos_.find(test_media::readFile(path));
        if (it == videos_.end())
        {
            throw DecodeError("Could not open video file: " + path);
        }
        return it->second;
    }

    std::map<std::string, Video> videos_;
    std::mutex mutex_;
    std::map<std::string, std::vector<int64_t>> requested_indices_;
    std::atomic<int> decode_calls_{0};
};

/**
 * @brief In-memory FrameExtractor; the content of the file passed in selects the video
 */
class FakeFrameExtractor : public FrameExtractor
{
public:
    struct Video
    {
        double duration = 0.0;
        std::vector<cv::Mat> frames;
        bool fail = false;
    };

    void addVideo(const std::string &key, double duration, std::vector<cv::Mat> frames)
    {
        videos_[key] = Video{duration, std::move(frames), false};
    }

    void addFailingVideo(const std::string &key, double duration)
    {
        videos_[key] = Video{duration, {}, true};
    }

    double probeDuration(const std::string &path) override
    {
        auto it = videos_.find(test_media::readFile(path));
        return it == videos_.end() ? 0.0 : it->second.duration;
    }

    std::vector<cv::Mat> extractAtRate(const std::string &path, double fps, int frame_height) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_fps_ = fps;
            last_height_ = frame_height;
        }
        auto it = videos_.find(test_media::readFile(path));
        if (it == videos_.end() || it->second.fail)
        {
            throw ExternalProcessError("ffmpeg frame extraction exited with code 1 for " + path, 1, false);
        }
        std::vector<cv::Mat> copies;
        for (const auto &frame : it->second.frames)
        {
            copies.push_back(frame.clone());
        }
        return copies;
    }

    double lastFps()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_fps_;
    }

    int lastHeight()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_height_;
    }

private:
    std::map<std::string, Video> videos_;
    std::mutex mutex_;
    double last_fps_ = 0.0;
    int last_height_ = 0;
};

/**
 * @brief VideoFetcher writing a key string as the video's content
 */
class FakeVideoFetcher : public VideoFetcher
{
public:
    void addVideo(const std::string &video_id, const std::string &content) { contents_[video_id] = content; }

    void fetch(const std::string &video_id, const fs::path &destination) override
    {
        auto it = contents_.find(video_id);
        if (it == contents_.end())
        {
            throw IoError("Video " + video_id + " not found");
        }
        std::ofstream out(destination, std::ios::binary);
        out << it->second;
        std::lock_guard<std::mutex> lock(mutex_);
        fetched_paths_.push_back(destination);
    }

    std::vector<fs::path> fetchedPaths()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return fetched_paths_;
    }

private:
    std::map<std::string, std::string> contents_;
    std::mutex mutex_;
    std::vector<fs::path> fetched_paths_;
};
