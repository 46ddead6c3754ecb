#include <gtest/gtest.h>

#include "log.hpp"
#include "test_util.hpp"

TEST(LogTest, SharedLoggerIsNamed)
{
    auto logger = logging::get();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "fluxcode");
    EXPECT_EQ(logging::get(), logger);
}

TEST(LogTest, FileSinkReceivesMessages)
{
    test_util::TempDir dir("fluxcode_log");
    const auto log_path = dir / "fluxcode.log";

    logging::init(spdlog::level::debug, log_path.string());
    logging::get()->debug("sink check {}", 7);
    logging::get()->flush();
    EXPECT_NE(test_util::read_file(log_path).find("sink check 7"), std::string::npos);
    EXPECT_EQ(logging::get()->level(), spdlog::level::debug);

    logging::init(spdlog::level::info);
}

TEST(LogTest, UnopenableFileKeepsPreviousLogger)
{
    test_util::TempDir dir("fluxcode_log");
    const auto blocker = dir / "not_a_directory";
    test_util::write_file(blocker, "x");

    logging::init(spdlog::level::warn);
    auto before = logging::get();

    EXPECT_THROW(logging::init(spdlog::level::debug, (blocker / "fluxcode.log").string()), spdlog::spdlog_ex);
    EXPECT_EQ(logging::get(), before);
    EXPECT_EQ(logging::get()->level(), spdlog::level::warn);

    logging::init(spdlog::level::info);
}
