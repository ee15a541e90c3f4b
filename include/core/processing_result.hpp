#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/video_hash_errors.hpp"

/**
 * @brief Fingerprint produced for one video
 */
struct MediaArtifact
{
    std::vector<uint8_t> data; // Fingerprint packed MSB-first
    std::string format;        // Scheme tag, e.g. "video_hash"
    std::string hash;          // Fingerprint as a '0'/'1' string
    double confidence;         // Typical confidence of the scheme
    std::string metadata;      // JSON describing the video and the run

    MediaArtifact() : confidence(0.0) {}
};

/**
 * @brief Either a fingerprint or the reason there is none
 */
struct ProcessingResult
{
    bool success;
    std::string error_message;
    VideoHashErrorKind error_kind;
    MediaArtifact artifact;

    ProcessingResult() : success(false), error_kind(VideoHashErrorKind::UNKNOWN) {}
    ProcessingResult(bool s, const std::string &msg = "", VideoHashErrorKind kind = VideoHashErrorKind::NONE)
        : success(s), error_message(msg), error_kind(s ? VideoHashErrorKind::NONE : (kind == VideoHashErrorKind::NONE ? VideoHashErrorKind::UNKNOWN : kind)) {}
};
