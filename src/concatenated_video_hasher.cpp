#include "core/concatenated_video_hasher.hpp"
#include "core/frame_sampler.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <stdexcept>

ConcatenatedFingerprint::ConcatenatedFingerprint(std::vector<BinaryFingerprint> frame_hashes)
    : frame_hashes_(std::move(frame_hashes))
{
    if (frame_hashes_.empty())
    {
        throw std::invalid_argument("Concatenated fingerprint needs at least one frame hash");
    }
    for (const auto &hash : frame_hashes_)
    {
        if (hash.empty() || hash.size() != frame_hashes_.front().size())
        {
            throw std::invalid_argument("Frame hashes of a concatenated fingerprint must share one non-zero length");
        }
    }
}

int ConcatenatedFingerprint::hammingDistance(const ConcatenatedFingerprint &other) const
{
    return combined().hammingDistance(other.combined());
}

std::vector<FrameDivergence> ConcatenatedFingerprint::divergences(const ConcatenatedFingerprint &other) const
{
    std::vector<FrameDivergence> result;
    const size_t common = std::min(frame_hashes_.size(), other.frame_hashes_.size());
    for (size_t i = 0; i < common; ++i)
    {
        if (frame_hashes_[i] != other.frame_hashes_[i])
        {
            result.push_back({i, frame_hashes_[i].hammingDistance(other.frame_hashes_[i])});
        }
    }
    return result;
}

ConcatenatedVideoHasher::ConcatenatedVideoHasher(FrameDecoder &decoder, const FrameDiffSettings &settings)
    : decoder_(decoder), settings_(settings), hasher_(settings.hash_size)
{
    settings_.validate();
}

FrameSet ConcatenatedVideoHasher::sampleFrames(const std::string &path) const
{
    return FrameSampler::sampleEvenly(decoder_, path, settings_.num_frames);
}

ConcatenatedFingerprint ConcatenatedVideoHasher::hashFrames(const FrameSet &frames) const
{
    return ConcatenatedFingerprint(hasher_.computeHashes(frames));
}

ConcatenatedFingerprint ConcatenatedVideoHasher::computeHash(const std::string &path) const
{
    return hashFrames(sampleFrames(path));
}

ConcatenatedHashResult ConcatenatedVideoHasher::computeWithMetadata(const VideoSource &source,
                                                                    const TempDirSettings &temp_settings) const
{
    MaterializedVideo video = source.materialize(temp_settings);
    const std::string path = video.path.string();

    VideoMetadata metadata = VideoMetadata::fromStreamInfo(source.id(), decoder_.probe(path));
    ConcatenatedFingerprint fingerprint = computeHash(path);

    Logger::info("Computed " + std::to_string(fingerprint.frameCount()) + "-frame fingerprint for " + source.id());
    return ConcatenatedHashResult{std::move(fingerprint), std::move(metadata)};
}
