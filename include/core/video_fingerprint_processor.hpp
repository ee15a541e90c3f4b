#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "core/decoder/frame_decoder.hpp"
#include "core/decoder/frame_extractor.hpp"
#include "core/fingerprint_schemes.hpp"
#include "core/processing_result.hpp"
#include "core/video_hash_config.hpp"
#include "core/video_source.hpp"

/**
 * @brief Processing algorithm information
 */
struct ProcessingAlgorithm
{
    std::string name;                   // Algorithm name
    std::string description;            // Human-readable description
    std::vector<std::string> libraries; // Required libraries
    std::string output_format;          // Artifact format tag
    double typical_confidence;          // Typical confidence score
    int data_size_bytes;                // Packed size with default settings
};

/**
 * @brief Turns a video into a fingerprint artifact.
 *
 * The boundary between the hashing pipeline, which throws, and callers that
 * want a plain success/failure value. Every pipeline error is logged and
 * returned in the ProcessingResult.
 */
class VideoFingerprintProcessor
{
public:
    /**
     * @param extractor Used by the COMBINED scheme; must outlive the processor
     * @param decoder Used by the CONCATENATED scheme; must outlive the processor
     */
    VideoFingerprintProcessor(FrameExtractor &extractor,
                              FrameDecoder &decoder,
                              const VideoHashSettings &hash_settings = VideoHashSettings(),
                              const FrameDiffSettings &frame_diff_settings = FrameDiffSettings(),
                              const TempDirSettings &temp_settings = TempDirSettings());

    /**
     * @brief Fingerprint a video with the given scheme
     * @param source Video file or buffer
     * @param scheme Fingerprint scheme
     * @return ProcessingResult containing the artifact, or the error and its kind
     */
    ProcessingResult processVideo(const VideoSource &source, FingerprintScheme scheme) const;

    /**
     * @brief Fingerprint a file after checking its extension
     */
    ProcessingResult processFile(const std::string &file_path, FingerprintScheme scheme) const;

    /**
     * @brief Get processing algorithm information for a scheme
     * @return ProcessingAlgorithm information, or nullptr if not found
     */
    static const ProcessingAlgorithm *getProcessingAlgorithm(FingerprintScheme scheme);

    static bool isVideoFile(const std::string &file_path);
    static std::string getFileExtension(const std::string &file_path);
    static const std::vector<std::string> &getSupportedExtensions();

private:
    ProcessingResult processCombined(const VideoSource &source, const ProcessingAlgorithm &algorithm) const;
    ProcessingResult processConcatenated(const VideoSource &source, const ProcessingAlgorithm &algorithm) const;

    FrameExtractor &extractor_;
    FrameDecoder &decoder_;
    VideoHashSettings hash_settings_;
    FrameDiffSettings frame_diff_settings_;
    TempDirSettings temp_settings_;

    static const std::vector<std::string> video_extensions_;
    static const std::unordered_map<FingerprintScheme, ProcessingAlgorithm> processing_algorithms_;
};
