#include "core/video_hash.hpp"
#include "core/decoder/ffmpeg_cli_extractor.hpp"
#include "core/frame_sampler.hpp"
#include "core/hashing/color_hash.hpp"
#include "core/hashing/wavelet_hash.hpp"
#include "core/video_hash_errors.hpp"
#include "logging/logger.hpp"
#include <tbb/parallel_invoke.h>
#include <chrono>
#include <stdexcept>

VideoHash::VideoHash(BinaryFingerprint fingerprint)
    : fingerprint_(std::move(fingerprint))
{
    if (fingerprint_.empty())
    {
        throw std::invalid_argument("Video hash cannot be empty");
    }
}

VideoHash VideoHash::fromString(const std::string &bit_string)
{
    return VideoHash(BinaryFingerprint::fromString(bit_string));
}

VideoHash VideoHash::fromFrames(const FrameSet &frames, const VideoHashSettings &settings)
{
    if (frames.empty())
    {
        throw EmptyFrameSetError("Cannot compute video hash of an empty frame set");
    }

    auto start = std::chrono::steady_clock::now();

    BinaryFingerprint wavelet;
    BinaryFingerprint color;
    tbb::parallel_invoke(
        [&]()
        { wavelet = MultiFrameWaveletHash::compute(frames, settings); },
        [&]()
        { color = MultiFrameColorHash::compute(frames, settings); });

    VideoHash hash(wavelet.xorWith(color));

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::info("Hash calculation took " + std::to_string(elapsed.count()) + "ms for " +
                 std::to_string(frames.size()) + " frames");
    return hash;
}

VideoHash VideoHash::compute(const VideoSource &source, FrameExtractor &extractor,
                             const VideoHashSettings &settings, const TempDirSettings &temp_settings)
{
    auto start = std::chrono::steady_clock::now();

    MaterializedVideo video = source.materialize(temp_settings);
    AdaptiveSampleResult sampled = FrameSampler::sampleAdaptive(extractor, video.path.string(), settings);
    VideoHash hash = fromFrames(sampled.frames, settings);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::info("Total video hash processing took " + std::to_string(elapsed.count()) + "ms for " + source.id());
    return hash;
}

VideoHash VideoHash::compute(const VideoSource &source)
{
    const auto &config = VideoHashConfig::getInstance();
    FfmpegCliExtractor extractor(config.getExtractorSettings(), config.getTempDirSettings());
    return compute(source, extractor, config.getVideoHashSettings(), config.getTempDirSettings());
}

int VideoHash::hammingDistance(const VideoHash &other) const
{
    return fingerprint_.hammingDistance(other.fingerprint_);
}

double VideoHash::similarity(const VideoHash &other) const
{
    const double length = static_cast<double>(fingerprint_.size());
    const double distance = static_cast<double>(hammingDistance(other));
    return (length - distance) / length * 100.0;
}

bool VideoHash::isDuplicate(const VideoHash &other, double threshold) const
{
    return similarity(other) >= threshold;
}
