#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/binary_fingerprint.hpp"
#include "core/concatenated_video_hasher.hpp"
#include "core/decoder/frame_decoder.hpp"
#include "core/frame_types.hpp"
#include "core/scoped_temp_dir.hpp"
#include "core/video_hash_config.hpp"
#include "core/video_source.hpp"

/**
 * @brief Frame-by-frame comparison of two videos
 */
struct FrameDiffReport
{
    std::string video_id_1;
    std::string video_id_2;
    FrameSet frames_1;
    FrameSet frames_2;
    std::vector<BinaryFingerprint> frame_hashes_1;
    std::vector<BinaryFingerprint> frame_hashes_2;
    std::vector<FrameDivergence> divergences;

    size_t totalFrames() const { return frames_1.size(); }
    size_t differingFramesCount() const { return divergences.size(); }

    std::string concatenatedHash1() const { return BinaryFingerprint::concatenate(frame_hashes_1).toString(); }
    std::string concatenatedHash2() const { return BinaryFingerprint::concatenate(frame_hashes_2).toString(); }

    /**
     * @brief Ids, concatenated hashes, frame counts and per-frame distances
     */
    nlohmann::json toJson() const;
};

/**
 * @brief Resolves a video id to a local file
 */
class VideoFetcher
{
public:
    virtual ~VideoFetcher() = default;

    /**
     * @brief Store the video's bytes at destination
     * @throws VideoHashError (or a subclass) when the video cannot be fetched
     */
    virtual void fetch(const std::string &video_id, const fs::path &destination) = 0;
};

/**
 * @brief Fetcher over a directory holding <id><extension> files
 */
class LocalFileFetcher : public VideoFetcher
{
public:
    explicit LocalFileFetcher(fs::path root_dir, std::string extension = ".mp4");

    void fetch(const std::string &video_id, const fs::path &destination) override;

private:
    fs::path root_dir_;
    std::string extension_;
};

/**
 * @brief Samples the same positions of two videos and reports where their frame hashes differ
 */
class FrameDiffComparator
{
public:
    FrameDiffComparator(FrameDecoder &decoder,
                        const FrameDiffSettings &settings = FrameDiffSettings(),
                        const TempDirSettings &temp_settings = TempDirSettings());

    /**
     * @brief Compare two sources; both are sampled and hashed concurrently
     * @throws DecodeError, EmptyFrameSetError from either pipeline
     */
    FrameDiffReport compare(const VideoSource &video_1, const VideoSource &video_2) const;

    /**
     * @brief Fetch two videos by id into a temp directory, then compare them
     *
     * Fetches run concurrently. The directory and both files are removed
     * whether or not the comparison succeeds.
     */
    FrameDiffReport compareFetched(VideoFetcher &fetcher, const std::string &video_id_1,
                                   const std::string &video_id_2) const;

private:
    ConcatenatedVideoHasher hasher_;
    TempDirSettings temp_settings_;
};
