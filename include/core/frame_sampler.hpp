#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/decoder/frame_decoder.hpp"
#include "core/decoder/frame_extractor.hpp"
#include "core/frame_types.hpp"
#include "core/video_hash_config.hpp"

/**
 * @brief Result of a duration-adaptive extraction
 */
struct AdaptiveSampleResult
{
    FrameSet frames;
    double duration_seconds = 0.0;
    double sample_rate = 0.0;   // Frames per second requested from the extractor
    size_t extracted_count = 0; // Frames produced before the cap was applied
};

/**
 * @brief Chooses which frames of a video represent it.
 *
 * Two strategies: a fixed number of evenly spaced frames taken from a
 * FrameDecoder, and a rate that depends on the duration taken from a
 * FrameExtractor and then capped.
 */
class FrameSampler
{
public:
    /**
     * @brief Evenly spaced decode-order indices, round(i * (total - 1) / (count - 1))
     * @param total_frames Frame count of the stream; values <= 1 select frame 0 only
     * @param count Number of indices to produce
     * @return count indices, possibly repeating when the stream is shorter than count
     * @throws std::invalid_argument if count < 1
     */
    static std::vector<int64_t> computeSampleIndices(int64_t total_frames, int count);

    /**
     * @brief Extraction rate in frames per second for a video of the given duration
     */
    static double selectSampleRate(double duration_seconds);

    /**
     * @brief Positions kept when more frames than cap were extracted
     *
     * Keeps every (count / cap)-th position, at most cap of them. When count
     * does not exceed cap every position is kept.
     */
    static std::vector<size_t> subsamplePositions(size_t count, size_t cap);

    /**
     * @brief Decode count evenly spaced frames
     * @throws DecodeError if the video cannot be opened
     * @throws EmptyFrameSetError if no usable frame was decoded
     */
    static FrameSet sampleEvenly(FrameDecoder &decoder, const std::string &path, int count);

    /**
     * @brief Extract frames at a duration-dependent rate and cap their number
     * @throws ExternalProcessError if extraction fails
     * @throws EmptyFrameSetError if no usable frame was extracted
     */
    static AdaptiveSampleResult sampleAdaptive(FrameExtractor &extractor, const std::string &path,
                                               const VideoHashSettings &settings);
};
