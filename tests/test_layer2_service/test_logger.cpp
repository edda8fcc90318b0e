// tests/test_layer2_service/test_logger.cpp
/**
 * @file test_logger.cpp
 * @brief Unit tests for the asynchronous Logger.
 *
 * The logger is a process-wide singleton, so every test switches it to its own log
 * file, restores the console sink and level in TearDown, and never shuts it down
 * (LoggerEnvironment does that at the end of the run).
 */
#include "kbh_service.hpp"
#include "shared_test_helpers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <atomic>
#include <fstream>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace kanbanhub::tests::helper;
using kanbanhub::utils::Logger;
using namespace std::chrono_literals;

class LoggerTest : public ::testing::Test
{
  protected:
    std::vector<fs::path> paths_to_clean_;
    Logger::Level saved_level_{Logger::Level::L_ERROR};

    void SetUp() override { saved_level_ = Logger::instance().level(); }

    void TearDown() override
    {
        Logger::instance().set_console();
        Logger::instance().set_level(saved_level_);
        for (const auto &p : paths_to_clean_)
            remove_quietly(p);
    }

    fs::path GetUniqueLogPath(const std::string &test_name)
    {
        auto p = unique_temp_path(test_name, ".log");
        paths_to_clean_.push_back(p);
        return p;
    }

    static std::string ReadLog(const fs::path &p)
    {
        std::string contents;
        EXPECT_TRUE(read_file_contents(p.string(), contents)) << p;
        return contents;
    }
};

TEST_F(LoggerTest, BasicLogging)
{
    auto log_path = GetUniqueLogPath("basic_logging");
    ASSERT_TRUE(Logger::instance().set_logfile(log_path.string()));
    Logger::instance().set_level(Logger::Level::L_INFO);
    LOGGER_INFO("Hello, {}!", "board");
    Logger::instance().flush();

    auto contents = ReadLog(log_path);
    EXPECT_THAT(contents, ::testing::HasSubstr("Hello, board!"));
    EXPECT_THAT(contents, ::testing::HasSubstr("[INFO  ]"));
}

TEST_F(LoggerTest, LogLevelFiltering)
{
    auto log_path = GetUniqueLogPath("log_level_filtering");
    ASSERT_TRUE(Logger::instance().set_logfile(log_path.string()));
    Logger::instance().set_level(Logger::Level::L_WARNING);

    LOGGER_INFO("This should be filtered.");
    LOGGER_WARN("This should appear.");
    Logger::instance().flush();

    auto contents = ReadLog(log_path);
    EXPECT_EQ(contents.find("This should be filtered."), std::string::npos);
    EXPECT_NE(contents.find("This should appear."), std::string::npos);
}

TEST_F(LoggerTest, SinkSwitchIsRecorded)
{
    auto first = GetUniqueLogPath("switch_first");
    auto second = GetUniqueLogPath("switch_second");
    Logger::instance().set_level(Logger::Level::L_INFO);

    ASSERT_TRUE(Logger::instance().set_logfile(first.string()));
    LOGGER_INFO("in the first file");
    ASSERT_TRUE(Logger::instance().set_logfile(second.string()));
    LOGGER_INFO("in the second file");
    Logger::instance().flush();

    auto a = ReadLog(first);
    auto b = ReadLog(second);
    EXPECT_THAT(a, ::testing::HasSubstr("in the first file"));
    EXPECT_THAT(a, ::testing::HasSubstr("Switching log sink to:"));
    EXPECT_EQ(a.find("in the second file"), std::string::npos);
    EXPECT_THAT(b, ::testing::HasSubstr("Log sink switched from:"));
    EXPECT_THAT(b, ::testing::HasSubstr("in the second file"));
}

TEST_F(LoggerTest, FlushWaitsForQueue)
{
    auto log_path = GetUniqueLogPath("flush_waits");
    ASSERT_TRUE(Logger::instance().set_logfile(log_path.string()));
    Logger::instance().set_level(Logger::Level::L_DEBUG);

    constexpr int kMessages = 500;
    for (int i = 0; i < kMessages; ++i)
        LOGGER_DEBUG("flush-msg idx={}", i);
    Logger::instance().flush();

    // No polling: flush() returned, so every message is on disk.
    auto contents = ReadLog(log_path);
    EXPECT_EQ(count_lines(contents, "flush-msg"), static_cast<size_t>(kMessages));
}

TEST_F(LoggerTest, MultithreadStress)
{
    auto log_path = GetUniqueLogPath("multithread_stress");
    ASSERT_TRUE(Logger::instance().set_logfile(log_path.string()));
    Logger::instance().set_level(Logger::Level::L_INFO);

    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back(
            [t]()
            {
                for (int i = 0; i < kPerThread; ++i)
                    LOGGER_INFO("stress-msg thread={} idx={}", t, i);
            });
    }
    for (auto &th : threads)
        th.join();
    Logger::instance().flush();

    auto contents = ReadLog(log_path);
    EXPECT_EQ(count_lines(contents, "stress-msg"), static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(LoggerTest, UnopenableFileReportsThroughCallback)
{
    auto promise = std::make_shared<std::promise<std::string>>();
    auto reported = promise->get_future();
    auto fired = std::make_shared<std::atomic<bool>>(false);
    Logger::instance().set_write_error_callback(
        [promise, fired](const std::string &msg)
        {
            if (!fired->exchange(true))
                promise->set_value(msg);
        });

    // A regular file cannot be used as a directory.
    auto blocker = GetUniqueLogPath("blocker");
    {
        std::ofstream(blocker.string()) << "x";
    }
    EXPECT_FALSE(Logger::instance().set_logfile((blocker / "nested.log").string()));

    ASSERT_EQ(reported.wait_for(5s), std::future_status::ready);
    EXPECT_THAT(reported.get(), ::testing::HasSubstr("Failed to create FileSink"));

    Logger::instance().set_write_error_callback(nullptr);
}

TEST(LoggerStaticTest, ParseLevel)
{
    EXPECT_EQ(Logger::parse_level("TRACE"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::parse_level("debug"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::parse_level("Info"), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::parse_level("system"), Logger::Level::L_SYSTEM);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
}

TEST(LoggerStaticTest, RunningUntilShutdown)
{
    EXPECT_TRUE(Logger::instance().is_running());
}
