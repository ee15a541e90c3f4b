#include <gtest/gtest.h>
#include <fstream>
#include "core/poco_config_manager.hpp"
#include "core/video_hash_config.hpp"
#include "test_base.hpp"

class VideoHashConfigTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        PocoConfigManager::getInstance().resetToDefaults();
    }

    void TearDown() override
    {
        PocoConfigManager::getInstance().resetToDefaults();
        TestBase::TearDown();
    }
};

TEST_F(VideoHashConfigTest, DefaultsMatchDocumentedValues)
{
    auto &config = VideoHashConfig::getInstance();
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getMaxProcessingThreads(), 4);
    EXPECT_EQ(config.getMaxDecoderThreads(), 0);

    VideoHashSettings hash = config.getVideoHashSettings();
    EXPECT_EQ(hash.frame_size, 144);
    EXPECT_EQ(hash.grid_size, 8);
    EXPECT_EQ(hash.max_frames, 60);
    EXPECT_DOUBLE_EQ(hash.duplicate_threshold, 85.0);

    FrameDiffSettings diff = config.getFrameDiffSettings();
    EXPECT_EQ(diff.num_frames, 10);
    EXPECT_EQ(diff.hash_size, 8);

    ExtractorSettings extractor = config.getExtractorSettings();
    EXPECT_EQ(extractor.ffmpeg_path, "ffmpeg");
    EXPECT_EQ(extractor.ffprobe_path, "ffprobe");
    EXPECT_EQ(extractor.timeout_seconds, 300);
    EXPECT_EQ(extractor.max_input_seconds, 300);

    TempDirSettings temp = config.getTempDirSettings();
    EXPECT_TRUE(temp.prefer_ram);
    EXPECT_EQ(temp.prefix, "videohash");
}

TEST_F(VideoHashConfigTest, LoadsNestedJsonFile)
{
    std::string path = createDummyFile("config.json",
                                       R"({"log_level": "DEBUG", "video_hash": {"max_frames": 30, "duplicate_threshold": 90.5},)"
                                       R"( "extractor": {"timeout_seconds": 60}, "temp": {"prefer_ram": false}})");

    auto &config = VideoHashConfig::getInstance();
    ASSERT_TRUE(config.loadConfig(path));

    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getVideoHashSettings().max_frames, 30);
    EXPECT_DOUBLE_EQ(config.getVideoHashSettings().duplicate_threshold, 90.5);
    EXPECT_EQ(config.getVideoHashSettings().grid_size, 8);
    EXPECT_EQ(config.getExtractorSettings().timeout_seconds, 60);
    EXPECT_FALSE(config.getTempDirSettings().prefer_ram);
    Logger::init("WARN");
}

TEST_F(VideoHashConfigTest, MissingOrMalformedFileKeepsDefaults)
{
    auto &config = VideoHashConfig::getInstance();
    EXPECT_FALSE(config.loadConfig(getTestFilesDir() + "/does_not_exist.json"));

    std::string broken = createDummyFile("broken.json", "{ not json");
    EXPECT_FALSE(config.loadConfig(broken));
    EXPECT_EQ(config.getVideoHashSettings().max_frames, 60);
}

TEST_F(VideoHashConfigTest, UpdateFlattensNestedPatch)
{
    auto &manager = PocoConfigManager::getInstance();
    manager.update({{"frame_diff", {{"num_frames", 5}}}, {"extractor", {{"ffmpeg_path", "/opt/ffmpeg"}}}});

    auto &config = VideoHashConfig::getInstance();
    EXPECT_EQ(config.getFrameDiffSettings().num_frames, 5);
    EXPECT_EQ(config.getExtractorSettings().ffmpeg_path, "/opt/ffmpeg");

    nlohmann::json all = manager.getAll();
    EXPECT_EQ(all["frame_diff"]["num_frames"], 5);
}

TEST_F(VideoHashConfigTest, SaveAndReload)
{
    auto &manager = PocoConfigManager::getInstance();
    manager.update({{"video_hash", {{"grid_size", 16}}}});
    std::string path = getTestFilesDir() + "/saved.json";
    ASSERT_TRUE(manager.save(path));

    manager.resetToDefaults();
    EXPECT_EQ(VideoHashConfig::getInstance().getVideoHashSettings().grid_size, 8);

    ASSERT_TRUE(manager.load(path));
    EXPECT_EQ(VideoHashConfig::getInstance().getVideoHashSettings().grid_size, 16);
}

TEST_F(VideoHashConfigTest, ExtractorLimitsAreReadSeparately)
{
    auto &manager = PocoConfigManager::getInstance();
    manager.update({{"extractor", {{"timeout_seconds", 0}, {"max_input_seconds", 90}}}});

    ExtractorSettings extractor = VideoHashConfig::getInstance().getExtractorSettings();
    EXPECT_EQ(extractor.timeout_seconds, 0);
    EXPECT_EQ(extractor.max_input_seconds, 90);

    manager.update({{"extractor", {{"timeout_seconds", -1}}}});
    EXPECT_THROW(VideoHashConfig::getInstance().getExtractorSettings(), std::invalid_argument);
}

TEST_F(VideoHashConfigTest, SettingsValidation)
{
    VideoHashSettings hash;
    EXPECT_NO_THROW(hash.validate());
    hash.grid_size = 0;
    EXPECT_THROW(hash.validate(), std::invalid_argument);

    hash = VideoHashSettings();
    hash.duplicate_threshold = 120.0;
    EXPECT_THROW(hash.validate(), std::invalid_argument);

    FrameDiffSettings diff;
    diff.hash_size = -1;
    EXPECT_THROW(diff.validate(), std::invalid_argument);
}
