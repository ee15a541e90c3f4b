#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/decoder/frame_extractor.hpp"
#include "core/video_hash.hpp"
#include "core/video_hash_config.hpp"
#include "core/video_hash_errors.hpp"
#include "core/video_source.hpp"

/**
 * @brief Hashing outcome for one video of a batch
 */
struct HashedVideo
{
    std::string video_id;
    std::optional<VideoHash> hash; // Empty when hashing failed
    std::string error_message;
    VideoHashErrorKind error_kind = VideoHashErrorKind::NONE;

    bool success() const { return hash.has_value(); }
};

/**
 * @brief Two videos whose hashes are at least as similar as the threshold
 */
struct DuplicatePair
{
    std::string video_id_1;
    std::string video_id_2;
    int hamming_distance = 0;
    double similarity = 0.0;
};

/**
 * @brief Hashes a batch of videos and links the near-duplicates among them
 */
class DuplicateLinker
{
public:
    /**
     * @param extractor Shared by all workers; must be safe to call concurrently
     */
    explicit DuplicateLinker(FrameExtractor &extractor,
                             const VideoHashSettings &settings = VideoHashSettings(),
                             const TempDirSettings &temp_settings = TempDirSettings());

    /**
     * @brief Hash every source in parallel
     * @return One entry per source, in input order; a failure is recorded on its entry only
     */
    std::vector<HashedVideo> hashAll(const std::vector<VideoSource> &sources) const;

    /**
     * @brief All pairs of successfully hashed videos with similarity >= threshold
     *
     * Pairs are ordered by the position of their first and then second video.
     */
    static std::vector<DuplicatePair> findDuplicates(const std::vector<HashedVideo> &videos,
                                                     double threshold = VideoHash::DEFAULT_DUPLICATE_THRESHOLD);

    /**
     * @brief Clusters of videos connected through duplicate pairs
     * @return Groups of two or more ids, in order of first appearance
     */
    static std::vector<std::vector<std::string>> groupDuplicates(const std::vector<HashedVideo> &videos,
                                                                 double threshold = VideoHash::DEFAULT_DUPLICATE_THRESHOLD);

private:
    FrameExtractor &extractor_;
    VideoHashSettings settings_;
    TempDirSettings temp_settings_;
};
