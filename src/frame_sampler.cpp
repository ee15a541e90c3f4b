#include "core/frame_sampler.hpp"
#include "core/video_hash_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

std::vector<int64_t> FrameSampler::computeSampleIndices(int64_t total_frames, int count)
{
    if (count < 1)
    {
        throw std::invalid_argument("Sample count must be at least 1, got " + std::to_string(count));
    }

    std::vector<int64_t> indices;
    indices.reserve(count);

    if (total_frames <= 1 || count == 1)
    {
        indices.assign(count, 0);
        return indices;
    }

    const double span = static_cast<double>(total_frames - 1);
    for (int i = 0; i < count; ++i)
    {
        double position = static_cast<double>(i) * span / static_cast<double>(count - 1);
        indices.push_back(static_cast<int64_t>(std::round(position)));
    }
    return indices;
}

double FrameSampler::selectSampleRate(double duration_seconds)
{
    if (duration_seconds < 3.0)
        return 0.8;
    if (duration_seconds < 5.0)
        return 0.5;
    if (duration_seconds < 15.0)
        return 0.3;
    if (duration_seconds < 30.0)
        return 0.1;
    return 0.05;
}

std::vector<size_t> FrameSampler::subsamplePositions(size_t count, size_t cap)
{
    std::vector<size_t> positions;
    if (cap == 0)
    {
        return positions;
    }

    if (count <= cap)
    {
        positions.reserve(count);
        for (size_t i = 0; i < count; ++i)
        {
            positions.push_back(i);
        }
        return positions;
    }

    size_t step = count / cap;
    positions.reserve(cap);
    for (size_t i = 0; i < count && positions.size() < cap; i += step)
    {
        positions.push_back(i);
    }
    return positions;
}

FrameSet FrameSampler::sampleEvenly(FrameDecoder &decoder, const std::string &path, int count)
{
    auto start = std::chrono::steady_clock::now();

    VideoStreamInfo info = decoder.probe(path);
    std::vector<int64_t> indices = computeSampleIndices(info.total_frames, count);

    // Each decoded frame is taken at most once, so repeated indices collapse
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    FrameSet frames;
    decoder.decode(path, indices,
                   [&frames, &path](int64_t frame_index, cv::Mat rgb)
                   {
                       try
                       {
                           frames.add(RawFrame(std::move(rgb)));
                       }
                       catch (const InvalidFrameError &e)
                       {
                           Logger::warn("Skipping frame " + std::to_string(frame_index) + " of " + path + ": " + e.what());
                       }
                       return true;
                   });

    if (frames.empty())
    {
        throw EmptyFrameSetError("No frames could be decoded from " + path);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::info("Sampled " + std::to_string(frames.size()) + " of " + std::to_string(count) +
                 " frames from " + path + " in " + std::to_string(elapsed.count()) + "ms");
    return frames;
}

AdaptiveSampleResult FrameSampler::sampleAdaptive(FrameExtractor &extractor, const std::string &path,
                                                  const VideoHashSettings &settings)
{
    settings.validate();
    auto start = std::chrono::steady_clock::now();

    AdaptiveSampleResult result;
    result.duration_seconds = extractor.probeDuration(path);
    result.sample_rate = selectSampleRate(result.duration_seconds);

    std::vector<cv::Mat> extracted = extractor.extractAtRate(path, result.sample_rate, settings.frame_size);
    result.extracted_count = extracted.size();

    for (size_t position : subsamplePositions(extracted.size(), static_cast<size_t>(settings.max_frames)))
    {
        try
        {
            result.frames.add(RawFrame(extracted[position]));
        }
        catch (const InvalidFrameError &e)
        {
            Logger::warn("Skipping extracted frame " + std::to_string(position) + " of " + path + ": " + e.what());
        }
    }

    if (result.frames.empty())
    {
        throw EmptyFrameSetError("No frames could be extracted from " + path);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::info("Frame extraction took " + std::to_string(elapsed.count()) + "ms - " +
                 std::to_string(result.frames.size()) + " frames at " + std::to_string(result.sample_rate) +
                 " fps (duration " + std::to_string(result.duration_seconds) + "s)");
    return result;
}
