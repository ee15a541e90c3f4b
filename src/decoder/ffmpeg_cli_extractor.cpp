#include "core/decoder/ffmpeg_cli_extractor.hpp"
#include "core/decoder/process_runner.hpp"
#include "core/frame_types.hpp"
#include "core/scoped_temp_dir.hpp"
#include "core/video_hash_errors.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

FfmpegCliExtractor::FfmpegCliExtractor(const ExtractorSettings &settings, const TempDirSettings &temp_settings)
    : settings_(settings), temp_settings_(temp_settings)
{
    settings_.validate();
}

double FfmpegCliExtractor::probeDuration(const std::string &path)
{
    ProcessResult result = ProcessRunner::run(
        {settings_.ffprobe_path, "-v", "error", "-show_entries", "format=duration",
         "-of", "default=noprint_wrappers=1:nokey=1", path},
        settings_.timeout_seconds);

    if (!result.succeeded())
    {
        Logger::warn("ffprobe failed for " + path + " (exit code " + std::to_string(result.exit_code) +
                     "), assuming zero duration");
        return 0.0;
    }

    std::istringstream iss(result.output);
    double duration = 0.0;
    if (!(iss >> duration) || !std::isfinite(duration) || duration < 0.0)
    {
        Logger::warn("Could not parse duration of " + path + " from ffprobe output, assuming zero duration");
        return 0.0;
    }
    return duration;
}

std::vector<std::string> FfmpegCliExtractor::buildExtractArgs(const std::string &path, double fps, int frame_height,
                                                              const std::string &output_pattern) const
{
    std::ostringstream filter;
    filter << "fps=" << fps << ",scale=-1:" << frame_height;

    std::vector<std::string> args = {settings_.ffmpeg_path, "-v", "error", "-y"};
    if (settings_.max_input_seconds > 0)
    {
        args.push_back("-t");
        args.push_back(std::to_string(settings_.max_input_seconds));
    }
    args.insert(args.end(), {"-i", path,
                             "-threads", std::to_string(settings_.decoder_threads),
                             "-vf", filter.str(),
                             "-q:v", "2",
                             output_pattern});
    return args;
}

std::vector<cv::Mat> FfmpegCliExtractor::extractAtRate(const std::string &path, double fps, int frame_height)
{
    ScopedTempDir frames_dir(temp_settings_.prefix + "_frames", temp_settings_.prefer_ram);
    std::string pattern = frames_dir.filePath("frame_%04d.jpg").string();

    ProcessResult result = ProcessRunner::run(buildExtractArgs(path, fps, frame_height, pattern),
                                              settings_.timeout_seconds);
    if (!result.succeeded())
    {
        std::string reason = result.timed_out
                                 ? "timed out after " + std::to_string(settings_.timeout_seconds) + "s"
                                 : "exited with code " + std::to_string(result.exit_code);
        throw ExternalProcessError("ffmpeg frame extraction " + reason + " for " + path + ": " + result.output,
                                   result.exit_code, result.timed_out);
    }

    std::vector<fs::path> files;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(frames_dir.path(), ec))
    {
        if (entry.is_regular_file() && entry.path().extension() == ".jpg")
        {
            files.push_back(entry.path());
        }
    }
    if (ec)
    {
        throw IoError("Could not list extracted frames in " + frames_dir.path().string() + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    std::vector<cv::Mat> frames;
    frames.reserve(files.size());
    for (const auto &file : files)
    {
        cv::Mat bgr = cv::imread(file.string(), cv::IMREAD_COLOR);
        if (bgr.empty())
        {
            Logger::warn("Skipping unreadable frame: " + file.filename().string());
            continue;
        }
        frames.push_back(RawFrame::fromBgr(bgr).rgb());
    }

    Logger::debug("Extracted " + std::to_string(frames.size()) + " frames at " + std::to_string(fps) +
                  " fps from " + path);
    return frames;
}
