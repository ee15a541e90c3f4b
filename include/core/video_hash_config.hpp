#pragma once

#include <string>
#include "core/poco_config_manager.hpp"

/**
 * @brief Parameters of the aggregate (wavelet XOR color) video hash
 */
struct VideoHashSettings
{
    int frame_size = 144;              // Collage tile side and strip height in pixels
    int grid_size = 8;                 // Hash grid side, grid_size^2 bits
    int max_frames = 60;               // Cap applied after adaptive extraction
    double duplicate_threshold = 85.0; // Similarity percentage

    void validate() const;
};

/**
 * @brief Parameters of the per-frame (concatenated pHash) scheme
 */
struct FrameDiffSettings
{
    int num_frames = 10;
    int hash_size = 8;

    void validate() const;
};

/**
 * @brief How the external decoders are invoked
 */
struct ExtractorSettings
{
    std::string ffmpeg_path = "ffmpeg";
    std::string ffprobe_path = "ffprobe";
    int timeout_seconds = 300;   // Wall-clock kill limit, 0 disables it
    int max_input_seconds = 300; // Only this much of the input is read, 0 reads all of it
    int decoder_threads = 0;

    void validate() const;
};

struct TempDirSettings
{
    bool prefer_ram = true;
    std::string prefix = "videohash";
};

/**
 * @brief Typed view over PocoConfigManager for the hashing engine.
 *
 * Settings are copied out as values; nothing in the pipeline reads the
 * configuration store while hashing.
 */
class VideoHashConfig
{
public:
    static VideoHashConfig &getInstance()
    {
        static VideoHashConfig instance;
        return instance;
    }

    /**
     * @brief Load a JSON configuration file and apply its log level
     * @param file_path Path to the JSON file
     * @return false if the file could not be loaded (defaults stay in effect)
     */
    bool loadConfig(const std::string &file_path);

    std::string getLogLevel() const;
    int getMaxProcessingThreads() const;
    int getMaxDecoderThreads() const;

    VideoHashSettings getVideoHashSettings() const;
    FrameDiffSettings getFrameDiffSettings() const;
    ExtractorSettings getExtractorSettings() const;
    TempDirSettings getTempDirSettings() const;

private:
    VideoHashConfig();
    VideoHashConfig(const VideoHashConfig &) = delete;
    VideoHashConfig &operator=(const VideoHashConfig &) = delete;

    PocoConfigManager &poco_cfg_;
};
