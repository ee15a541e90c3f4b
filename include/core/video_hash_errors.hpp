#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Kind of failure reported by the hashing pipeline
 */
enum class VideoHashErrorKind
{
    NONE,
    DECODE,
    EMPTY_FRAME_SET,
    INVALID_FRAME,
    EXTERNAL_PROCESS,
    IO,
    UNKNOWN
};

/**
 * @brief Base class for all errors raised while fingerprinting a video.
 *
 * Stages throw and never fall back to a partial or zeroed hash; callers see
 * either a fingerprint or one of these.
 */
class VideoHashError : public std::runtime_error
{
public:
    VideoHashError(VideoHashErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    VideoHashErrorKind kind() const { return kind_; }

private:
    VideoHashErrorKind kind_;
};

/**
 * @brief Container or codec could not be opened, or no video stream exists
 */
class DecodeError : public VideoHashError
{
public:
    explicit DecodeError(const std::string &message)
        : VideoHashError(VideoHashErrorKind::DECODE, message) {}
};

/**
 * @brief Decoding succeeded but produced no usable frame
 */
class EmptyFrameSetError : public VideoHashError
{
public:
    explicit EmptyFrameSetError(const std::string &message)
        : VideoHashError(VideoHashErrorKind::EMPTY_FRAME_SET, message) {}
};

/**
 * @brief A decoded frame has degenerate dimensions
 */
class InvalidFrameError : public VideoHashError
{
public:
    explicit InvalidFrameError(const std::string &message)
        : VideoHashError(VideoHashErrorKind::INVALID_FRAME, message) {}
};

/**
 * @brief External decode process exited non-zero or hit its wall-clock limit
 */
class ExternalProcessError : public VideoHashError
{
public:
    ExternalProcessError(const std::string &message, int exit_code, bool timed_out)
        : VideoHashError(VideoHashErrorKind::EXTERNAL_PROCESS, message),
          exit_code_(exit_code), timed_out_(timed_out) {}

    int exitCode() const { return exit_code_; }
    bool timedOut() const { return timed_out_; }

private:
    int exit_code_;
    bool timed_out_;
};

/**
 * @brief Temp file or directory could not be created or written
 */
class IoError : public VideoHashError
{
public:
    explicit IoError(const std::string &message)
        : VideoHashError(VideoHashErrorKind::IO, message) {}
};

inline std::string errorKindName(VideoHashErrorKind kind)
{
    switch (kind)
    {
    case VideoHashErrorKind::NONE:
        return "NONE";
    case VideoHashErrorKind::DECODE:
        return "DECODE";
    case VideoHashErrorKind::EMPTY_FRAME_SET:
        return "EMPTY_FRAME_SET";
    case VideoHashErrorKind::INVALID_FRAME:
        return "INVALID_FRAME";
    case VideoHashErrorKind::EXTERNAL_PROCESS:
        return "EXTERNAL_PROCESS";
    case VideoHashErrorKind::IO:
        return "IO";
    default:
        return "UNKNOWN";
    }
}
