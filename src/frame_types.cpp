#include "core/frame_types.hpp"
#include "core/video_hash_errors.hpp"
#include <opencv2/imgproc.hpp>

RawFrame::RawFrame(cv::Mat rgb)
{
    if (rgb.empty() || rgb.cols <= 0 || rgb.rows <= 0)
    {
        throw InvalidFrameError("Frame has degenerate dimensions: " + std::to_string(rgb.cols) + "x" + std::to_string(rgb.rows));
    }
    if (rgb.type() != CV_8UC3)
    {
        throw InvalidFrameError("Frame must be 8-bit RGB, got OpenCV type " + std::to_string(rgb.type()));
    }
    rgb_ = std::move(rgb);
}

RawFrame RawFrame::fromBgr(const cv::Mat &bgr)
{
    if (bgr.empty())
    {
        throw InvalidFrameError("Frame has degenerate dimensions: " + std::to_string(bgr.cols) + "x" + std::to_string(bgr.rows));
    }
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    return RawFrame(rgb);
}

VideoMetadata VideoMetadata::fromStreamInfo(const std::string &video_id, const VideoStreamInfo &info)
{
    VideoMetadata metadata;
    metadata.video_id = video_id;
    metadata.duration = info.duration_seconds;
    metadata.width = info.width;
    metadata.height = info.height;
    metadata.fps = info.fps;
    return metadata;
}

nlohmann::json VideoMetadata::toJson() const
{
    return nlohmann::json{
        {"video_id", video_id},
        {"duration", duration},
        {"width", width},
        {"height", height},
        {"fps", fps}};
}

VideoMetadata VideoMetadata::fromJson(const nlohmann::json &j)
{
    VideoMetadata metadata;
    metadata.video_id = j.value("video_id", std::string());
    metadata.duration = j.value("duration", 0.0);
    metadata.width = j.value("width", 0);
    metadata.height = j.value("height", 0);
    metadata.fps = j.value("fps", 0.0);
    return metadata;
}
