#include <gtest/gtest.h>
#include <fstream>
#include <set>
#include <stdexcept>
#include "core/scoped_temp_dir.hpp"

class ScopedTempDirTest : public ::testing::Test
{
};

TEST_F(ScopedTempDirTest, CreatesAndRemovesDirectory)
{
    fs::path created;
    {
        ScopedTempDir dir("unit");
        created = dir.path();
        EXPECT_TRUE(fs::is_directory(created));
        EXPECT_EQ(created.filename().string().rfind("unit_", 0), 0u);

        std::ofstream(dir.filePath("frame_0001.jpg")) << "data";
        EXPECT_TRUE(fs::exists(dir.filePath("frame_0001.jpg")));
    }
    EXPECT_FALSE(fs::exists(created));
}

TEST_F(ScopedTempDirTest, RemovedWhenAnExceptionUnwinds)
{
    fs::path created;
    try
    {
        ScopedTempDir dir("unwind");
        created = dir.path();
        std::ofstream(dir.filePath("partial.jpg")) << "data";
        throw std::runtime_error("extraction failed");
    }
    catch (const std::runtime_error &)
    {
    }
    ASSERT_FALSE(created.empty());
    EXPECT_FALSE(fs::exists(created));
}

TEST_F(ScopedTempDirTest, NamesAreUnique)
{
    ScopedTempDir a("same");
    ScopedTempDir b("same");
    ScopedTempDir c("same");
    std::set<fs::path> paths = {a.path(), b.path(), c.path()};
    EXPECT_EQ(paths.size(), 3u);
}

TEST_F(ScopedTempDirTest, MoveTransfersOwnership)
{
    ScopedTempDir original("moved");
    fs::path created = original.path();
    {
        ScopedTempDir moved(std::move(original));
        EXPECT_EQ(moved.path(), created);
        EXPECT_TRUE(original.path().empty());
        EXPECT_TRUE(fs::exists(created));
    }
    EXPECT_FALSE(fs::exists(created));
}

TEST_F(ScopedTempDirTest, DiskFallbackUsesSystemTempDirectory)
{
    EXPECT_EQ(ScopedTempDir::selectBaseDirectory(false), fs::temp_directory_path());

    ScopedTempDir dir("disk", false);
    EXPECT_EQ(dir.path().parent_path(), fs::temp_directory_path());
}
