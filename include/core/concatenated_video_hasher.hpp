#pragma once

#include <string>
#include <vector>
#include "core/binary_fingerprint.hpp"
#include "core/decoder/frame_decoder.hpp"
#include "core/frame_types.hpp"
#include "core/hashing/image_hasher.hpp"
#include "core/video_hash_config.hpp"
#include "core/video_source.hpp"

/**
 * @brief Per-frame hashes of evenly sampled frames, kept in temporal order.
 *
 * Not comparable with VideoHash; the two schemes answer different questions.
 */
class ConcatenatedFingerprint
{
public:
    /**
     * @throws std::invalid_argument if frame_hashes is empty or the hashes differ in length
     */
    explicit ConcatenatedFingerprint(std::vector<BinaryFingerprint> frame_hashes);

    const std::vector<BinaryFingerprint> &frameHashes() const { return frame_hashes_; }
    size_t frameCount() const { return frame_hashes_.size(); }

    /**
     * @brief All frame hashes joined end to end
     */
    BinaryFingerprint combined() const { return BinaryFingerprint::concatenate(frame_hashes_); }
    std::string toString() const { return combined().toString(); }

    /**
     * @throws std::invalid_argument if the combined lengths differ
     */
    int hammingDistance(const ConcatenatedFingerprint &other) const;

    /**
     * @brief Positions, present in both, whose frame hashes differ
     */
    std::vector<FrameDivergence> divergences(const ConcatenatedFingerprint &other) const;

private:
    std::vector<BinaryFingerprint> frame_hashes_;
};

/**
 * @brief Fingerprint plus the stream properties of the video it came from
 */
struct ConcatenatedHashResult
{
    ConcatenatedFingerprint fingerprint;
    VideoMetadata metadata;
};

/**
 * @brief Samples a fixed number of frames through a FrameDecoder and hashes each one
 */
class ConcatenatedVideoHasher
{
public:
    /**
     * @param decoder Must outlive the hasher
     * @param settings Sample count and per-frame grid size
     * @throws std::invalid_argument if the settings are invalid
     */
    ConcatenatedVideoHasher(FrameDecoder &decoder, const FrameDiffSettings &settings = FrameDiffSettings());

    FrameSet sampleFrames(const std::string &path) const;
    ConcatenatedFingerprint hashFrames(const FrameSet &frames) const;
    ConcatenatedFingerprint computeHash(const std::string &path) const;

    /**
     * @brief Hash a source and read its stream properties
     * @throws DecodeError if the video cannot be opened
     * @throws EmptyFrameSetError if no frame could be decoded
     */
    ConcatenatedHashResult computeWithMetadata(const VideoSource &source,
                                               const TempDirSettings &temp_settings = TempDirSettings()) const;

    const FrameDiffSettings &settings() const { return settings_; }

private:
    FrameDecoder &decoder_;
    FrameDiffSettings settings_;
    ImageHasher hasher_;
};
