#include "core/video_fingerprint_processor.hpp"
#include "core/concatenated_video_hasher.hpp"
#include "core/frame_sampler.hpp"
#include "core/video_hash.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <chrono>

VideoFingerprintProcessor::VideoFingerprintProcessor(FrameExtractor &extractor,
                                                     FrameDecoder &decoder,
                                                     const VideoHashSettings &hash_settings,
                                                     const FrameDiffSettings &frame_diff_settings,
                                                     const TempDirSettings &temp_settings)
    : extractor_(extractor),
      decoder_(decoder),
      hash_settings_(hash_settings),
      frame_diff_settings_(frame_diff_settings),
      temp_settings_(temp_settings)
{
}

ProcessingResult VideoFingerprintProcessor::processFile(const std::string &file_path, FingerprintScheme scheme) const
{
    if (!isVideoFile(file_path))
    {
        return ProcessingResult(false, "Unsupported file type: " + file_path, VideoHashErrorKind::DECODE);
    }
    return processVideo(VideoSource::fromPath(file_path), scheme);
}

ProcessingResult VideoFingerprintProcessor::processVideo(const VideoSource &source, FingerprintScheme scheme) const
{
    const ProcessingAlgorithm *algorithm = getProcessingAlgorithm(scheme);
    if (!algorithm)
    {
        return ProcessingResult(false, "No processing algorithm found for scheme " + FingerprintSchemes::getSchemeName(scheme));
    }

    Logger::info("Processing video with " + algorithm->name + ": " + source.id());

    try
    {
        switch (scheme)
        {
        case FingerprintScheme::COMBINED:
            return processCombined(source, *algorithm);
        case FingerprintScheme::CONCATENATED:
            return processConcatenated(source, *algorithm);
        default:
            return ProcessingResult(false, "Unknown fingerprint scheme");
        }
    }
    catch (const VideoHashError &e)
    {
        Logger::error("Failed to fingerprint " + source.id() + " [" + errorKindName(e.kind()) + "]: " + e.what());
        return ProcessingResult(false, e.what(), e.kind());
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error while fingerprinting " + source.id() + ": " + std::string(e.what()));
        return ProcessingResult(false, "OpenCV error: " + std::string(e.what()));
    }
    catch (const std::exception &e)
    {
        Logger::error("Error fingerprinting " + source.id() + ": " + std::string(e.what()));
        return ProcessingResult(false, "Processing error: " + std::string(e.what()));
    }
}

ProcessingResult VideoFingerprintProcessor::processCombined(const VideoSource &source, const ProcessingAlgorithm &algorithm) const
{
    auto start = std::chrono::steady_clock::now();

    MaterializedVideo video = source.materialize(temp_settings_);
    AdaptiveSampleResult sampled = FrameSampler::sampleAdaptive(extractor_, video.path.string(), hash_settings_);
    VideoHash hash = VideoHash::fromFrames(sampled.frames, hash_settings_);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    nlohmann::json metadata = {{"algorithm", algorithm.output_format},
                               {"scheme", FingerprintSchemes::getSchemeName(FingerprintScheme::COMBINED)},
                               {"video_id", source.id()},
                               {"duration", sampled.duration_seconds},
                               {"sample_rate", sampled.sample_rate},
                               {"frames_extracted", sampled.extracted_count},
                               {"frames_used", sampled.frames.size()},
                               {"bits", hash.size()},
                               {"processing_ms", elapsed.count()}};

    MediaArtifact artifact;
    artifact.data = hash.fingerprint().toBytes();
    artifact.format = algorithm.output_format;
    artifact.hash = hash.toString();
    artifact.confidence = algorithm.typical_confidence;
    artifact.metadata = metadata.dump();

    ProcessingResult result(true);
    result.artifact = artifact;
    Logger::info("Video hash for " + source.id() + ": " + artifact.hash);
    return result;
}

ProcessingResult VideoFingerprintProcessor::processConcatenated(const VideoSource &source, const ProcessingAlgorithm &algorithm) const
{
    auto start = std::chrono::steady_clock::now();

    ConcatenatedVideoHasher hasher(decoder_, frame_diff_settings_);
    ConcatenatedHashResult hashed = hasher.computeWithMetadata(source, temp_settings_);
    BinaryFingerprint combined = hashed.fingerprint.combined();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    nlohmann::json metadata = hashed.metadata.toJson();
    metadata["algorithm"] = algorithm.output_format;
    metadata["scheme"] = FingerprintSchemes::getSchemeName(FingerprintScheme::CONCATENATED);
    metadata["frames"] = hashed.fingerprint.frameCount();
    metadata["bits"] = combined.size();
    metadata["processing_ms"] = elapsed.count();

    MediaArtifact artifact;
    artifact.data = combined.toBytes();
    artifact.format = algorithm.output_format;
    artifact.hash = combined.toString();
    artifact.confidence = algorithm.typical_confidence;
    artifact.metadata = metadata.dump();

    ProcessingResult result(true);
    result.artifact = artifact;
    return result;
}

const ProcessingAlgorithm *VideoFingerprintProcessor::getProcessingAlgorithm(FingerprintScheme scheme)
{
    auto it = processing_algorithms_.find(scheme);
    if (it == processing_algorithms_.end())
    {
        return nullptr;
    }
    return &(it->second);
}

bool VideoFingerprintProcessor::isVideoFile(const std::string &file_path)
{
    std::string ext = getFileExtension(file_path);
    const auto &supported = getSupportedExtensions();
    return std::find(supported.begin(), supported.end(), ext) != supported.end();
}

std::string VideoFingerprintProcessor::getFileExtension(const std::string &file_path)
{
    size_t dot_pos = file_path.find_last_of('.');
    size_t slash_pos = file_path.find_last_of('/');
    if (dot_pos == std::string::npos || (slash_pos != std::string::npos && dot_pos < slash_pos))
    {
        return "";
    }

    std::string extension = file_path.substr(dot_pos + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
    return extension;
}

const std::vector<std::string> &VideoFingerprintProcessor::getSupportedExtensions()
{
    return video_extensions_;
}

const std::vector<std::string> VideoFingerprintProcessor::video_extensions_ = {
    "mp4", "mov", "mkv", "webm", "avi", "m4v", "flv", "wmv", "mpg", "mpeg", "3gp", "ts"};

const std::unordered_map<FingerprintScheme, ProcessingAlgorithm> VideoFingerprintProcessor::processing_algorithms_ = {
    {FingerprintScheme::COMBINED, {"Video Hash", "Wavelet collage hash XOR color strip hash over duration-adaptive frame samples", {"FFmpeg", "OpenCV", "TBB"}, "video_hash", 0.85, 8}},
    {FingerprintScheme::CONCATENATED, {"Concatenated dHash", "Per-frame difference hashes of evenly spaced frames, joined in temporal order", {"FFmpeg", "OpenCV"}, "concatenated_dhash", 0.90, 80}}};
