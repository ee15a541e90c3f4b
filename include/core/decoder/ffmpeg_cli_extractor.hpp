#pragma once

#include "core/decoder/frame_extractor.hpp"
#include "core/video_hash_config.hpp"

/**
 * @brief FrameExtractor that shells out to the ffprobe and ffmpeg executables.
 *
 * Frames are written as JPEG files into a private temp directory, read back
 * in name order and removed with the directory.
 */
class FfmpegCliExtractor : public FrameExtractor
{
public:
    /**
     * @throws std::invalid_argument if the settings are out of range
     */
    explicit FfmpegCliExtractor(const ExtractorSettings &settings = ExtractorSettings(),
                                const TempDirSettings &temp_settings = TempDirSettings());

    /**
     * @brief Container duration from ffprobe
     * @return Seconds, or 0.0 when ffprobe fails or prints something unparsable
     */
    double probeDuration(const std::string &path) override;

    std::vector<cv::Mat> extractAtRate(const std::string &path, double fps, int frame_height) override;

    /**
     * @brief Argument list passed to ffmpeg for a rate-based extraction
     */
    std::vector<std::string> buildExtractArgs(const std::string &path, double fps, int frame_height,
                                              const std::string &output_pattern) const;

private:
    ExtractorSettings settings_;
    TempDirSettings temp_settings_;
};
