#include "core/duplicate_linker.hpp"
#include "logging/logger.hpp"
#include <opencv2/core.hpp>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <chrono>
#include <map>
#include <numeric>

DuplicateLinker::DuplicateLinker(FrameExtractor &extractor,
                                 const VideoHashSettings &settings,
                                 const TempDirSettings &temp_settings)
    : extractor_(extractor), settings_(settings), temp_settings_(temp_settings)
{
}

std::vector<HashedVideo> DuplicateLinker::hashAll(const std::vector<VideoSource> &sources) const
{
    auto start = std::chrono::steady_clock::now();
    std::vector<HashedVideo> results(sources.size());

    tbb::parallel_for(size_t(0), sources.size(), [&](size_t i)
                      {
        const VideoSource &source = sources[i];
        HashedVideo &entry = results[i];
        entry.video_id = source.id();
        try
        {
            entry.hash = VideoHash::compute(source, extractor_, settings_, temp_settings_);
        }
        catch (const VideoHashError &e)
        {
            entry.error_message = e.what();
            entry.error_kind = e.kind();
        }
        catch (const cv::Exception &e)
        {
            entry.error_message = "OpenCV error: " + std::string(e.what());
            entry.error_kind = VideoHashErrorKind::UNKNOWN;
        }
        catch (const std::exception &e)
        {
            entry.error_message = e.what();
            entry.error_kind = VideoHashErrorKind::UNKNOWN;
        }

        if (!entry.success())
        {
            Logger::warn("Failed to hash " + entry.video_id + ": " + entry.error_message);
        } });

    size_t failed = 0;
    for (const auto &entry : results)
    {
        if (!entry.success())
            failed++;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::info("Hashed " + std::to_string(results.size() - failed) + " of " + std::to_string(results.size()) +
                 " videos in " + std::to_string(elapsed.count()) + "ms");
    return results;
}

std::vector<DuplicatePair> DuplicateLinker::findDuplicates(const std::vector<HashedVideo> &videos, double threshold)
{
    std::vector<DuplicatePair> pairs;
    for (size_t i = 0; i < videos.size(); ++i)
    {
        if (!videos[i].success())
            continue;
        for (size_t j = i + 1; j < videos.size(); ++j)
        {
            if (!videos[j].success())
                continue;

            const VideoHash &a = *videos[i].hash;
            const VideoHash &b = *videos[j].hash;
            if (a.size() != b.size())
            {
                Logger::warn("Skipping " + videos[i].video_id + " vs " + videos[j].video_id + ": hash lengths differ");
                continue;
            }

            double similarity = a.similarity(b);
            if (similarity >= threshold)
            {
                pairs.push_back({videos[i].video_id, videos[j].video_id, a.hammingDistance(b), similarity});
            }
        }
    }

    Logger::debug("Found " + std::to_string(pairs.size()) + " duplicate pairs among " + std::to_string(videos.size()) + " videos");
    return pairs;
}

namespace
{
    size_t findRoot(std::vector<size_t> &parent, size_t i)
    {
        while (parent[i] != i)
        {
            parent[i] = parent[parent[i]];
            i = parent[i];
        }
        return i;
    }
}

std::vector<std::vector<std::string>> DuplicateLinker::groupDuplicates(const std::vector<HashedVideo> &videos, double threshold)
{
    std::vector<size_t> parent(videos.size());
    std::iota(parent.begin(), parent.end(), 0);

    for (size_t i = 0; i < videos.size(); ++i)
    {
        if (!videos[i].success())
            continue;
        for (size_t j = i + 1; j < videos.size(); ++j)
        {
            if (!videos[j].success() || videos[i].hash->size() != videos[j].hash->size())
                continue;
            if (videos[i].hash->isDuplicate(*videos[j].hash, threshold))
            {
                size_t root_i = findRoot(parent, i);
                size_t root_j = findRoot(parent, j);
                if (root_i != root_j)
                {
                    // Lower index stays root so groups keep input order
                    parent[std::max(root_i, root_j)] = std::min(root_i, root_j);
                }
            }
        }
    }

    std::map<size_t, std::vector<std::string>> by_root;
    for (size_t i = 0; i < videos.size(); ++i)
    {
        by_root[findRoot(parent, i)].push_back(videos[i].video_id);
    }

    std::vector<std::vector<std::string>> groups;
    for (auto &entry : by_root)
    {
        if (entry.second.size() >= 2)
        {
            groups.push_back(std::move(entry.second));
        }
    }
    return groups;
}
