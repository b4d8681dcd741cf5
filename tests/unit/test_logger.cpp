#include <cadence/logger.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

using namespace cadence;

namespace
{

// Routes the global logger into a memory sink for one test and restores it after.
class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        saved_level_ = Logger::instance().get_level();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(memory_.sink());
        Logger::instance().set_level(LogLevel::Trace);
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
    }

    sinks::MemorySink memory_;
    LogLevel          saved_level_ = LogLevel::Info;
};

}   // namespace

// ─── Levels ──────────────────────────────────────────────────────────────────

TEST(LoggerLevels, ParseLevel)
{
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(Logger::parse_level("debug", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(Logger::parse_level("WARN", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_TRUE(Logger::parse_level("warning", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_TRUE(Logger::parse_level("off", level));
    EXPECT_EQ(level, LogLevel::Off);

    EXPECT_FALSE(Logger::parse_level("verbose", level));
    EXPECT_EQ(level, LogLevel::Off);
}

TEST(LoggerLevels, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Trace), "TRACE");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel)
{
    Logger::instance().set_level(LogLevel::Warning);
    CADENCE_LOG_DEBUG("test", "hidden");
    CADENCE_LOG_INFO("test", "hidden");
    CADENCE_LOG_WARN("test", "shown");
    CADENCE_LOG_ERROR("test", "shown");

    EXPECT_EQ(memory_.entries().size(), 2u);
    EXPECT_EQ(memory_.count(LogLevel::Warning), 1u);
    EXPECT_EQ(memory_.count(LogLevel::Error), 1u);
}

TEST_F(LoggerTest, OffSilencesEverything)
{
    Logger::instance().set_level(LogLevel::Off);
    CADENCE_LOG_CRITICAL("test", "nothing");
    EXPECT_TRUE(memory_.entries().empty());
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Off));
}

// ─── Formatting ──────────────────────────────────────────────────────────────

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    std::string label = "intro";
    int64_t     frame = -3;
    CADENCE_LOG_INFO("timeline", "clip {} at {} visible {} ({})", label, frame, true, "ok");

    auto entries = memory_.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].category, "timeline");
    EXPECT_EQ(entries[0].message, "clip intro at -3 visible true (ok)");
    EXPECT_EQ(entries[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, ExtraArgumentsIgnoredMissingLeavePlaceholder)
{
    CADENCE_LOG_INFO("test", "only {}", 1, 2, 3);
    CADENCE_LOG_INFO("test", "{} and {}", 7);

    auto entries = memory_.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "only 1");
    EXPECT_EQ(entries[1].message, "7 and {}");
}

TEST_F(LoggerTest, ArgumentContainingBracesIsNotReexpanded)
{
    CADENCE_LOG_INFO("test", "{} then {}", std::string("{}"), 5);
    EXPECT_EQ(memory_.entries().at(0).message, "{} then 5");
}

TEST_F(LoggerTest, NullCString)
{
    const char* missing = nullptr;
    CADENCE_LOG_INFO("test", "path {}", missing);
    EXPECT_TRUE(memory_.contains("path (null)"));
}

// ─── Sinks ───────────────────────────────────────────────────────────────────

TEST(LoggerSinks, MemorySinkKeepsMostRecent)
{
    sinks::MemorySink memory(2);
    auto              sink = memory.sink();
    for (int i = 0; i < 5; ++i)
        sink({std::chrono::system_clock::now(), LogLevel::Info, "test", std::to_string(i)});

    auto entries = memory.entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "3");
    EXPECT_EQ(entries[1].message, "4");

    memory.clear();
    EXPECT_TRUE(memory.entries().empty());
}

TEST(LoggerSinks, FileSinkAppendsLines)
{
    auto path = std::filesystem::temp_directory_path() / "cadence_test_logger.log";
    std::filesystem::remove(path);
    {
        auto sink = sinks::file_sink(path.string());
        sink({std::chrono::system_clock::now(), LogLevel::Error, "capture", "frame stuck"});
    }

    std::ifstream in(path);
    std::string   line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("ERROR [capture] frame stuck"), std::string::npos);
    in.close();
    std::filesystem::remove(path);
}

TEST(LoggerSinks, NullSinkAcceptsEntries)
{
    auto sink = sinks::null_sink();
    sink({std::chrono::system_clock::now(), LogLevel::Info, "test", "dropped"});
    SUCCEED();
}
