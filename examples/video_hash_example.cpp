#include "core/decoder/ffmpeg_cli_extractor.hpp"
#include "core/decoder/ffmpeg_frame_decoder.hpp"
#include "core/fingerprint_schemes.hpp"
#include "core/frame_diff_comparator.hpp"
#include "core/thread_pool_manager.hpp"
#include "core/video_fingerprint_processor.hpp"
#include "core/video_hash.hpp"
#include "core/video_hash_config.hpp"
#include "logging/logger.hpp"
#include <iomanip>
#include <iostream>

/**
 * @brief Fingerprint one video, or compare two
 *
 * Usage: video_hash_example <video> [other_video] [config.json]
 */
int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <video> [other_video] [config.json]" << std::endl;
        return 1;
    }

    Logger::init();
    auto &config = VideoHashConfig::getInstance();
    if (argc > 3)
    {
        config.loadConfig(argv[3]);
    }
    ThreadPoolManager::initializeFromConfig();

    FfmpegCliExtractor extractor(config.getExtractorSettings(), config.getTempDirSettings());
    FFmpegFrameDecoder decoder(config.getMaxDecoderThreads());
    VideoFingerprintProcessor processor(extractor, decoder,
                                        config.getVideoHashSettings(),
                                        config.getFrameDiffSettings(),
                                        config.getTempDirSettings());

    std::cout << "=== Video Hash Example ===" << std::endl;

    std::vector<std::string> videos = {argv[1]};
    if (argc > 2)
    {
        videos.push_back(argv[2]);
    }

    std::vector<std::string> hashes;
    for (const auto &path : videos)
    {
        std::cout << "\n--- " << path << " ---" << std::endl;
        for (auto scheme : {FingerprintScheme::COMBINED, FingerprintScheme::CONCATENATED})
        {
            ProcessingResult result = processor.processFile(path, scheme);
            std::cout << "  " << FingerprintSchemes::getSchemeName(scheme) << " ("
                      << FingerprintSchemes::getLibraryStack(scheme) << ")" << std::endl;
            std::cout << "    " << FingerprintSchemes::getSchemeDescription(scheme) << std::endl;
            if (!result.success)
            {
                std::cout << "    failed [" << errorKindName(result.error_kind) << "]: " << result.error_message << std::endl;
                continue;
            }
            std::cout << "    hash: " << result.artifact.hash << std::endl;
            std::cout << "    metadata: " << result.artifact.metadata << std::endl;
            if (scheme == FingerprintScheme::COMBINED)
            {
                hashes.push_back(result.artifact.hash);
            }
        }
    }

    if (videos.size() == 2 && hashes.size() == 2)
    {
        VideoHash first = VideoHash::fromString(hashes[0]);
        VideoHash second = VideoHash::fromString(hashes[1]);
        double threshold = config.getVideoHashSettings().duplicate_threshold;

        std::cout << "\n--- Comparison ---" << std::endl;
        std::cout << "  hamming distance: " << first.hammingDistance(second) << std::endl;
        std::cout << "  similarity: " << std::fixed << std::setprecision(2) << first.similarity(second) << "%" << std::endl;
        std::cout << "  duplicate: " << (first.isDuplicate(second, threshold) ? "yes" : "no") << std::endl;

        try
        {
            FrameDiffComparator comparator(decoder, config.getFrameDiffSettings(), config.getTempDirSettings());
            FrameDiffReport report = comparator.compare(VideoSource::fromPath(videos[0]), VideoSource::fromPath(videos[1]));
            std::cout << "  frame diff: " << report.toJson().dump(2) << std::endl;
        }
        catch (const std::exception &e)
        {
            std::cout << "  frame diff failed: " << e.what() << std::endl;
        }
    }

    ThreadPoolManager::shutdown();
    std::cout << "\n=== Example completed ===" << std::endl;
    return 0;
}
