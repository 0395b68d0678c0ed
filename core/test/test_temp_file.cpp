#include "test.hpp"
#include "TestRasters.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <vector>

#include "fa/core/util/TempFile.hpp"

TEST(TempFileManager, PathsAreUniqueInsidePrivateDirectory)
{
    fa_test::ScratchDir parent("tempfile");
    fa::TempFileManager::cleanup();
    fa::TempFileManager::setTempDir(parent.path());

    const auto a = fa::TempFileManager::mktmp(".tif");
    const auto b = fa::TempFileManager::mktmp(".png");
    EXPECT_NE(a, b);
    EXPECT_EQ(a.extension().string(), std::string(".tif"));
    EXPECT_EQ(b.extension().string(), std::string(".png"));
    EXPECT_FALSE(std::filesystem::exists(a));

    const auto dir = fa::TempFileManager::directory();
    EXPECT_EQ(a.parent_path(), dir);
    EXPECT_EQ(dir.parent_path(), parent.path());
    EXPECT_NE(dir.filename().string().find("fluxanim"), std::string::npos);
}

TEST(TempFileManager, CleanupRemovesDirectory)
{
    fa_test::ScratchDir parent("tempfile_cleanup");
    fa::TempFileManager::cleanup();
    fa::TempFileManager::setTempDir(parent.path());

    const auto path = fa::TempFileManager::mktmp(".txt");
    std::ofstream(path) << "frame";
    const auto dir = fa::TempFileManager::directory();
    ASSERT_TRUE(std::filesystem::exists(path));

    fa::TempFileManager::cleanup();
    EXPECT_FALSE(std::filesystem::exists(dir));

    // a fresh directory is created on next use
    const auto next = fa::TempFileManager::mktmp(".txt");
    EXPECT_NE(next.parent_path(), dir);
    fa::TempFileManager::cleanup();
}

namespace {
std::filesystem::path previousTestDir;
}

TEST(TempFileManager, LeavesDirectoryForHarness)
{
    fa::TempFileManager::setTempDir(std::filesystem::temp_directory_path());
    const auto path = fa::TempFileManager::mktmp(".tif");
    std::ofstream(path) << "raster";
    previousTestDir = fa::TempFileManager::directory();
    EXPECT_TRUE(std::filesystem::exists(previousTestDir));
}

// runs after the test above, once the harness has cleaned up behind it
TEST(TempFileManager, HarnessRemovesDirectoryBetweenTests)
{
    ASSERT_FALSE(previousTestDir.empty());
    EXPECT_FALSE(std::filesystem::exists(previousTestDir));
}

TEST(ScratchDir, NamesDoNotCollide)
{
    std::vector<std::filesystem::path> paths;
    std::vector<std::unique_ptr<fa_test::ScratchDir>> dirs;
    for (int i = 0; i < 50; ++i) {
        dirs.push_back(std::make_unique<fa_test::ScratchDir>("collide"));
        paths.push_back(dirs.back()->path());
        EXPECT_TRUE(std::filesystem::is_directory(paths.back()));
    }
    std::sort(paths.begin(), paths.end());
    EXPECT_TRUE(std::adjacent_find(paths.begin(), paths.end()) == paths.end());

    dirs.clear();
    for (const auto& p : paths) {
        EXPECT_FALSE(std::filesystem::exists(p));
    }
}
