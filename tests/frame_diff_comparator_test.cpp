#include <gtest/gtest.h>
#include <set>
#include "core/frame_diff_comparator.hpp"
#include "core/frame_review.hpp"
#include "core/video_hash_errors.hpp"
#include "test_base.hpp"
#include "test_media.hpp"

using namespace test_media;

class FrameDiffComparatorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        std::vector<cv::Mat> frames_a;
        std::vector<cv::Mat> frames_b;
        for (int i = 0; i < 100; i++)
        {
            frames_a.push_back(horizontalGradient(90, 80, true));
            // Frame 44 is the fifth sampled position
            frames_b.push_back(horizontalGradient(90, 80, i != 44));
        }
        decoder_.addVideo("video_a", frames_a);
        decoder_.addVideo("video_b", frames_b);
    }

    FakeFrameDecoder decoder_;
};

TEST_F(FrameDiffComparatorTest, ReportsOnlyTheDivergingPosition)
{
    FrameDiffComparator comparator(decoder_);
    FrameDiffReport report = comparator.compare(VideoSource::fromPath(createDummyFile("a.mp4", "video_a")),
                                                VideoSource::fromPath(createDummyFile("b.mp4", "video_b")));

    ASSERT_EQ(report.divergences.size(), 1u);
    EXPECT_EQ(report.divergences[0], (FrameDivergence{4, 64}));
    EXPECT_EQ(report.totalFrames(), 10u);
    EXPECT_EQ(report.frames_2.size(), 10u);
    EXPECT_EQ(report.frame_hashes_1.size(), 10u);
    EXPECT_EQ(report.video_id_1, "a");
    EXPECT_EQ(report.video_id_2, "b");
}

TEST_F(FrameDiffComparatorTest, IdenticalVideosHaveNoDivergence)
{
    FrameDiffComparator comparator(decoder_);
    FrameDiffReport report = comparator.compare(VideoSource::fromPath(createDummyFile("a.mp4", "video_a")),
                                                VideoSource::fromPath(createDummyFile("a_copy.mp4", "video_a")));
    EXPECT_TRUE(report.divergences.empty());
    EXPECT_EQ(report.concatenatedHash1(), report.concatenatedHash2());
}

TEST_F(FrameDiffComparatorTest, ReportSerialisesToJson)
{
    FrameDiffComparator comparator(decoder_);
    FrameDiffReport report = comparator.compare(VideoSource::fromPath(createDummyFile("a.mp4", "video_a")),
                                                VideoSource::fromPath(createDummyFile("b.mp4", "video_b")));
    nlohmann::json j = report.toJson();

    EXPECT_EQ(j["video_id_1"], "a");
    EXPECT_EQ(j["total_frames"], 10);
    EXPECT_EQ(j["differing_frames_count"], 1);
    EXPECT_EQ(j["video1_phash"].get<std::string>().size(), 640u);
    ASSERT_EQ(j["frame_comparisons"].size(), 1u);
    EXPECT_EQ(j["frame_comparisons"][0]["frame_index"], 4);
    EXPECT_EQ(j["frame_comparisons"][0]["hamming_distance"], 64);
}

TEST_F(FrameDiffComparatorTest, ShorterVideoLimitsComparedPositions)
{
    std::vector<cv::Mat> short_frames;
    for (int i = 0; i < 5; i++)
        short_frames.push_back(horizontalGradient(90, 80, i != 2));
    decoder_.addVideo("video_short", short_frames);

    FrameDiffComparator comparator(decoder_);
    FrameDiffReport report = comparator.compare(VideoSource::fromPath(createDummyFile("a.mp4", "video_a")),
                                                VideoSource::fromPath(createDummyFile("s.mp4", "video_short")));

    // Five frames give five distinct sampled positions; only position 2 differs
    EXPECT_EQ(report.frames_2.size(), 5u);
    EXPECT_EQ(report.totalFrames(), 10u);
    ASSERT_EQ(report.divergences.size(), 1u);
    EXPECT_EQ(report.divergences[0], (FrameDivergence{2, 64}));
}

TEST_F(FrameDiffComparatorTest, FetchedVideosAreComparedAndRemoved)
{
    FakeVideoFetcher fetcher;
    fetcher.addVideo("id_1", "video_a");
    fetcher.addVideo("id_2", "video_b");

    FrameDiffComparator comparator(decoder_);
    FrameDiffReport report = comparator.compareFetched(fetcher, "id_1", "id_2");

    EXPECT_EQ(report.video_id_1, "id_1");
    EXPECT_EQ(report.video_id_2, "id_2");
    ASSERT_EQ(report.divergences.size(), 1u);
    EXPECT_EQ(report.divergences[0].frame_index, 4u);

    for (const auto &path : fetcher.fetchedPaths())
    {
        EXPECT_FALSE(fs::exists(path));
        EXPECT_FALSE(fs::exists(path.parent_path()));
    }
}

TEST_F(FrameDiffComparatorTest, FetchedFilesDoNotUseIdsAsPaths)
{
    FakeVideoFetcher fetcher;
    fetcher.addVideo("../outside", "video_a");
    fetcher.addVideo("nested/id", "video_b");

    FrameDiffComparator comparator(decoder_);
    FrameDiffReport report = comparator.compareFetched(fetcher, "../outside", "nested/id");

    EXPECT_EQ(report.video_id_1, "../outside");
    EXPECT_EQ(report.video_id_2, "nested/id");
    ASSERT_EQ(report.divergences.size(), 1u);

    std::vector<fs::path> paths = fetcher.fetchedPaths();
    ASSERT_EQ(paths.size(), 2u);
    std::set<std::string> names = {paths[0].filename().string(), paths[1].filename().string()};
    EXPECT_EQ(names, (std::set<std::string>{"video_1.mp4", "video_2.mp4"}));
    EXPECT_EQ(paths[0].parent_path(), paths[1].parent_path());
}

TEST_F(FrameDiffComparatorTest, FailedFetchStillCleansUp)
{
    FakeVideoFetcher fetcher;
    fetcher.addVideo("id_1", "video_a");

    FrameDiffComparator comparator(decoder_);
    EXPECT_THROW(comparator.compareFetched(fetcher, "id_1", "missing"), IoError);

    for (const auto &path : fetcher.fetchedPaths())
    {
        EXPECT_FALSE(fs::exists(path));
    }
}

TEST_F(FrameDiffComparatorTest, LocalFileFetcherCopiesById)
{
    createDummyFile("stored.mp4", "video_a");
    LocalFileFetcher fetcher(getTestFilesDir());
    fs::path destination = fs::path(getTestFilesDir()) / "fetched.bin";

    fetcher.fetch("stored", destination);
    EXPECT_EQ(readFile(destination.string()), "video_a");
    EXPECT_THROW(fetcher.fetch("absent", destination), IoError);
}

TEST_F(FrameDiffComparatorTest, JoinedFramesArePaddedTransparently)
{
    RawFrame left(solidFrame(10, 20, 255, 0, 0));
    RawFrame right(solidFrame(30, 40, 0, 0, 255));
    cv::Mat joined = FrameReview::joinHorizontally(left, right);

    ASSERT_EQ(joined.cols, 40);
    ASSERT_EQ(joined.rows, 40);
    ASSERT_EQ(joined.type(), CV_8UC4);
    EXPECT_EQ(joined.at<cv::Vec4b>(5, 5), cv::Vec4b(255, 0, 0, 255));
    EXPECT_EQ(joined.at<cv::Vec4b>(30, 5), cv::Vec4b(0, 0, 0, 0));
    EXPECT_EQ(joined.at<cv::Vec4b>(30, 20), cv::Vec4b(0, 0, 255, 255));
}

TEST_F(FrameDiffComparatorTest, ExportsImagesForEachDivergence)
{
    FrameDiffComparator comparator(decoder_);
    FrameDiffReport report = comparator.compare(VideoSource::fromPath(createDummyFile("a.mp4", "video_a")),
                                                VideoSource::fromPath(createDummyFile("b.mp4", "video_b")));

    fs::path out = fs::path(getTestFilesDir()) / "review";
    auto exported = FrameReview::exportDivergentFrames(report, out);

    ASSERT_EQ(exported.size(), 1u);
    EXPECT_EQ(exported[0].frame_index, 4u);
    EXPECT_EQ(exported[0].video1_path.filename(), "frame-4-video1.png");
    EXPECT_TRUE(fs::exists(exported[0].video1_path));
    EXPECT_TRUE(fs::exists(exported[0].video2_path));
    EXPECT_TRUE(fs::exists(exported[0].combined_path));
}
