#pragma once

#include <string>

/**
 * @brief Whole-video fingerprint schemes
 */
enum class FingerprintScheme
{
    COMBINED,    // Wavelet XOR color hash over adaptively sampled frames - ffmpeg CLI + OpenCV
    CONCATENATED // Per-frame dHash over evenly sampled frames - libav + OpenCV
};

class FingerprintSchemes
{
public:
    /**
     * @brief Get the library stack for a specific scheme
     */
    static std::string getLibraryStack(FingerprintScheme scheme)
    {
        switch (scheme)
        {
        case FingerprintScheme::COMBINED:
            return "ffmpeg/ffprobe CLI + OpenCV + TBB";
        case FingerprintScheme::CONCATENATED:
            return "FFmpeg (libavformat/libavcodec/libswscale) + OpenCV";
        default:
            return "Unknown scheme";
        }
    }

    /**
     * @brief Get what the scheme is suited for
     */
    static std::string getSchemeDescription(FingerprintScheme scheme)
    {
        switch (scheme)
        {
        case FingerprintScheme::COMBINED:
            return "One 64-bit fingerprint per video, compared by similarity percentage";
        case FingerprintScheme::CONCATENATED:
            return "One hash per sampled frame, compared position by position";
        default:
            return "Unknown scheme";
        }
    }

    static std::string getSchemeName(FingerprintScheme scheme)
    {
        switch (scheme)
        {
        case FingerprintScheme::COMBINED:
            return "COMBINED";
        case FingerprintScheme::CONCATENATED:
            return "CONCATENATED";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Convert string to FingerprintScheme
     * @return COMBINED for unrecognised names
     */
    static FingerprintScheme fromString(const std::string &scheme_str)
    {
        if (scheme_str == "CONCATENATED" || scheme_str == "concatenated")
            return FingerprintScheme::CONCATENATED;
        return FingerprintScheme::COMBINED;
    }
};
