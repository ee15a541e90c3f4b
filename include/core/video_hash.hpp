#pragma once

#include <string>
#include "core/binary_fingerprint.hpp"
#include "core/decoder/frame_extractor.hpp"
#include "core/frame_types.hpp"
#include "core/video_hash_config.hpp"
#include "core/video_source.hpp"

/**
 * @brief Whole-video fingerprint: structural (wavelet) hash XOR color hash.
 *
 * Immutable. Two VideoHash values compare by hamming distance; similarity is
 * the percentage of matching bits.
 */
class VideoHash
{
public:
    static constexpr double DEFAULT_DUPLICATE_THRESHOLD = 85.0;

    /**
     * @throws std::invalid_argument if the fingerprint is empty
     */
    explicit VideoHash(BinaryFingerprint fingerprint);

    /**
     * @brief Restore a stored hash from its '0'/'1' form
     */
    static VideoHash fromString(const std::string &bit_string);

    /**
     * @brief Hash already sampled frames; wavelet and color hashes run in parallel
     * @throws EmptyFrameSetError if frames is empty
     */
    static VideoHash fromFrames(const FrameSet &frames, const VideoHashSettings &settings = VideoHashSettings());

    /**
     * @brief Sample a video at its duration-adaptive rate and hash it
     * @param source Video file or buffer
     * @param extractor Rate-based frame extractor
     * @param settings Hash parameters
     * @param temp_settings Where buffer sources are written
     */
    static VideoHash compute(const VideoSource &source, FrameExtractor &extractor,
                             const VideoHashSettings &settings = VideoHashSettings(),
                             const TempDirSettings &temp_settings = TempDirSettings());

    /**
     * @brief Hash a video with the ffmpeg CLI extractor and settings from VideoHashConfig
     */
    static VideoHash compute(const VideoSource &source);

    /**
     * @throws std::invalid_argument if the two hashes differ in length
     */
    int hammingDistance(const VideoHash &other) const;

    /**
     * @brief Percentage of matching bits, 100 for identical hashes
     */
    double similarity(const VideoHash &other) const;

    bool isDuplicate(const VideoHash &other, double threshold = DEFAULT_DUPLICATE_THRESHOLD) const;

    std::string toString() const { return fingerprint_.toString(); }
    const BinaryFingerprint &fingerprint() const { return fingerprint_; }
    size_t size() const { return fingerprint_.size(); }

    bool operator==(const VideoHash &other) const { return fingerprint_ == other.fingerprint_; }
    bool operator!=(const VideoHash &other) const { return fingerprint_ != other.fingerprint_; }

private:
    BinaryFingerprint fingerprint_;
};
