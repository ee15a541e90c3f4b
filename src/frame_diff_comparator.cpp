#include "core/frame_diff_comparator.hpp"
#include "core/video_hash_errors.hpp"
#include "logging/logger.hpp"
#include <tbb/task_group.h>
#include <chrono>
#include <future>
#include <optional>

nlohmann::json FrameDiffReport::toJson() const
{
    nlohmann::json comparisons = nlohmann::json::array();
    for (const auto &divergence : divergences)
    {
        comparisons.push_back({{"frame_index", divergence.frame_index},
                               {"hamming_distance", divergence.bit_distance}});
    }

    return {{"video_id_1", video_id_1},
            {"video_id_2", video_id_2},
            {"video1_phash", concatenatedHash1()},
            {"video2_phash", concatenatedHash2()},
            {"total_frames", totalFrames()},
            {"differing_frames_count", differingFramesCount()},
            {"frame_comparisons", comparisons}};
}

LocalFileFetcher::LocalFileFetcher(fs::path root_dir, std::string extension)
    : root_dir_(std::move(root_dir)), extension_(std::move(extension))
{
}

void LocalFileFetcher::fetch(const std::string &video_id, const fs::path &destination)
{
    fs::path source = root_dir_ / (video_id + extension_);

    std::error_code ec;
    if (!fs::is_regular_file(source, ec))
    {
        throw IoError("Video " + video_id + " not found at " + source.string());
    }
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        throw IoError("Failed to fetch video " + video_id + ": " + ec.message());
    }
    Logger::debug("Fetched " + video_id + " to " + destination.string());
}

namespace
{
    struct SampledVideo
    {
        FrameSet frames;
        ConcatenatedFingerprint fingerprint;
    };
}

FrameDiffComparator::FrameDiffComparator(FrameDecoder &decoder,
                                         const FrameDiffSettings &settings,
                                         const TempDirSettings &temp_settings)
    : hasher_(decoder, settings), temp_settings_(temp_settings)
{
}

FrameDiffReport FrameDiffComparator::compare(const VideoSource &video_1, const VideoSource &video_2) const
{
    auto start = std::chrono::steady_clock::now();

    MaterializedVideo file_1 = video_1.materialize(temp_settings_);
    MaterializedVideo file_2 = video_2.materialize(temp_settings_);

    std::optional<SampledVideo> sampled_1;
    std::optional<SampledVideo> sampled_2;

    auto sample = [this](const fs::path &path, std::optional<SampledVideo> &out)
    {
        FrameSet frames = hasher_.sampleFrames(path.string());
        ConcatenatedFingerprint fingerprint = hasher_.hashFrames(frames);
        out = SampledVideo{std::move(frames), std::move(fingerprint)};
    };

    tbb::task_group group;
    group.run([&]()
              { sample(file_1.path, sampled_1); });
    group.run([&]()
              { sample(file_2.path, sampled_2); });
    group.wait();

    FrameDiffReport report;
    report.video_id_1 = video_1.id();
    report.video_id_2 = video_2.id();
    report.divergences = sampled_1->fingerprint.divergences(sampled_2->fingerprint);
    report.frames_1 = std::move(sampled_1->frames);
    report.frames_2 = std::move(sampled_2->frames);
    report.frame_hashes_1 = sampled_1->fingerprint.frameHashes();
    report.frame_hashes_2 = sampled_2->fingerprint.frameHashes();

    if (report.frames_1.size() != report.frames_2.size())
    {
        Logger::warn("Sampled frame counts differ (" + std::to_string(report.frames_1.size()) + " vs " +
                     std::to_string(report.frames_2.size()) + "), comparing common positions only");
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::info("Found " + std::to_string(report.differingFramesCount()) + " differing frames out of " +
                 std::to_string(report.totalFrames()) + " between " + report.video_id_1 + " and " +
                 report.video_id_2 + " in " + std::to_string(elapsed.count()) + "ms");
    return report;
}

FrameDiffReport FrameDiffComparator::compareFetched(VideoFetcher &fetcher, const std::string &video_id_1,
                                                    const std::string &video_id_2) const
{
    ScopedTempDir work_dir(temp_settings_.prefix + "_frame_diff", temp_settings_.prefer_ram);
    // Ids are caller-supplied and never become path components
    const fs::path path_1 = work_dir.filePath("video_1.mp4");
    const fs::path path_2 = work_dir.filePath("video_2.mp4");

    auto fetch_1 = std::async(std::launch::async, [&]()
                              { fetcher.fetch(video_id_1, path_1); });
    auto fetch_2 = std::async(std::launch::async, [&]()
                              { fetcher.fetch(video_id_2, path_2); });
    fetch_1.get();
    fetch_2.get();

    FrameDiffReport report = compare(VideoSource::fromPath(path_1.string()), VideoSource::fromPath(path_2.string()));
    report.video_id_1 = video_id_1;
    report.video_id_2 = video_id_2;
    return report;
}
