#include "core/video_hash_config.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

void VideoHashSettings::validate() const
{
    if (grid_size < 1)
        throw std::invalid_argument("grid_size must be positive, got " + std::to_string(grid_size));
    if (frame_size < grid_size)
        throw std::invalid_argument("frame_size must be at least grid_size, got " + std::to_string(frame_size));
    if (max_frames < 1)
        throw std::invalid_argument("max_frames must be positive, got " + std::to_string(max_frames));
    if (duplicate_threshold < 0.0 || duplicate_threshold > 100.0)
        throw std::invalid_argument("duplicate_threshold must be within [0, 100]");
}

void FrameDiffSettings::validate() const
{
    if (num_frames < 1)
        throw std::invalid_argument("num_frames must be positive, got " + std::to_string(num_frames));
    if (hash_size < 1)
        throw std::invalid_argument("hash_size must be positive, got " + std::to_string(hash_size));
}

void ExtractorSettings::validate() const
{
    if (ffmpeg_path.empty() || ffprobe_path.empty())
        throw std::invalid_argument("ffmpeg_path and ffprobe_path must not be empty");
    if (timeout_seconds < 0)
        throw std::invalid_argument("timeout_seconds must not be negative, got " + std::to_string(timeout_seconds));
    if (max_input_seconds < 0)
        throw std::invalid_argument("max_input_seconds must not be negative, got " + std::to_string(max_input_seconds));
    if (decoder_threads < 0)
        throw std::invalid_argument("decoder_threads must not be negative, got " + std::to_string(decoder_threads));
}

VideoHashConfig::VideoHashConfig()
    : poco_cfg_(PocoConfigManager::getInstance())
{
}

bool VideoHashConfig::loadConfig(const std::string &file_path)
{
    if (!poco_cfg_.load(file_path))
    {
        Logger::warn("Could not load configuration from " + file_path + ", using defaults");
        return false;
    }
    Logger::init(getLogLevel());
    Logger::info("Configuration loaded from " + file_path);
    return true;
}

std::string VideoHashConfig::getLogLevel() const
{
    return poco_cfg_.getString("log_level", "INFO");
}

int VideoHashConfig::getMaxProcessingThreads() const
{
    return poco_cfg_.getInt("max_processing_threads", 4);
}

int VideoHashConfig::getMaxDecoderThreads() const
{
    return poco_cfg_.getInt("decoder.max_decoder_threads", 0);
}

VideoHashSettings VideoHashConfig::getVideoHashSettings() const
{
    VideoHashSettings settings;
    settings.frame_size = poco_cfg_.getInt("video_hash.frame_size", settings.frame_size);
    settings.grid_size = poco_cfg_.getInt("video_hash.grid_size", settings.grid_size);
    settings.max_frames = poco_cfg_.getInt("video_hash.max_frames", settings.max_frames);
    settings.duplicate_threshold = poco_cfg_.getDouble("video_hash.duplicate_threshold", settings.duplicate_threshold);
    settings.validate();
    return settings;
}

FrameDiffSettings VideoHashConfig::getFrameDiffSettings() const
{
    FrameDiffSettings settings;
    settings.num_frames = poco_cfg_.getInt("frame_diff.num_frames", settings.num_frames);
    settings.hash_size = poco_cfg_.getInt("frame_diff.hash_size", settings.hash_size);
    settings.validate();
    return settings;
}

ExtractorSettings VideoHashConfig::getExtractorSettings() const
{
    ExtractorSettings settings;
    settings.ffmpeg_path = poco_cfg_.getString("extractor.ffmpeg_path", settings.ffmpeg_path);
    settings.ffprobe_path = poco_cfg_.getString("extractor.ffprobe_path", settings.ffprobe_path);
    settings.timeout_seconds = poco_cfg_.getInt("extractor.timeout_seconds", settings.timeout_seconds);
    settings.max_input_seconds = poco_cfg_.getInt("extractor.max_input_seconds", settings.max_input_seconds);
    settings.decoder_threads = getMaxDecoderThreads();
    settings.validate();
    return settings;
}

TempDirSettings VideoHashConfig::getTempDirSettings() const
{
    TempDirSettings settings;
    settings.prefer_ram = poco_cfg_.getBool("temp.prefer_ram", settings.prefer_ram);
    settings.prefix = poco_cfg_.getString("temp.prefix", settings.prefix);
    return settings;
}
