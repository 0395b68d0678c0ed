#include "test.hpp"
#include "TestRasters.hpp"

#include <fstream>
#include <sstream>

#include "fa/core/util/Logging.hpp"

TEST(Logging, FormatsPlaceholdersInOrder)
{
    EXPECT_EQ(fa::MinimalLogger::format("{} of {} frames", 3, 10), std::string("3 of 10 frames"));
    EXPECT_EQ(fa::MinimalLogger::format("path {}", std::filesystem::path("/tmp/a.tif")),
              std::string("path /tmp/a.tif"));
    EXPECT_EQ(fa::MinimalLogger::format("no args {}"), std::string("no args {}"));
    EXPECT_EQ(fa::MinimalLogger::format("extra", 1), std::string("extra"));
}

TEST(Logging, LevelFromString)
{
    fa::SetLogLevel("error");
    EXPECT_TRUE(fa::Logger()->level() == fa::MinimalLogger::Level::Error);
    fa::SetLogLevel("DEBUG");
    EXPECT_TRUE(fa::Logger()->level() == fa::MinimalLogger::Level::Debug);
    fa::SetLogLevel("nonsense");
    EXPECT_TRUE(fa::Logger()->level() == fa::MinimalLogger::Level::Info);
}

TEST(Logging, FileSinkReceivesMessagesAboveLevel)
{
    fa_test::ScratchDir dir("logging");
    fa::MinimalLogger logger("test");
    logger.add_file(dir / "log.txt");
    logger.set_level(fa::MinimalLogger::Level::Warn);
    logger.info("hidden {}", 1);
    logger.warn("shown {}", 2);

    std::ifstream in(dir / "log.txt");
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str().find("hidden"), std::string::npos);
    EXPECT_NE(ss.str().find("shown 2"), std::string::npos);
    EXPECT_NE(ss.str().find("[test]"), std::string::npos);

    EXPECT_THROW(logger.add_file(dir / "no" / "such" / "dir.txt"), std::runtime_error);
}
