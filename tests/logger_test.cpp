#include "../libanvil/include/logger.hpp"
#include "../libanvil/include/file_utils.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <vector>

namespace {
    struct Recorded {
        LogLevel level;
        std::string message;
        std::string tag;
    };

    class RecordingSink final : public ILogSink {
    public:
        explicit RecordingSink(std::vector<Recorded>& out) : out_(out) {}

        void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
            out_.push_back({level, std::string(message), std::string(tag)});
        }

    private:
        std::vector<Recorded>& out_;
    };

    class LoggerTest : public ::testing::Test {
    protected:
        void SetUp() override { Logger::clear_sinks(); }
        void TearDown() override { Logger::clear_sinks(); }
    };
}

TEST_F(LoggerTest, FansOutToEverySink) {
    std::vector<Recorded> a;
    std::vector<Recorded> b;
    Logger::add_sink(std::make_unique<RecordingSink>(a));
    Logger::add_sink(std::make_unique<RecordingSink>(b));

    Logger::log(LogLevel::Warning, "candidate skipped", "selection");
    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(a[0].level, LogLevel::Warning);
    EXPECT_EQ(a[0].message, "candidate skipped");
    EXPECT_EQ(a[0].tag, "selection");

    Logger::log(LogLevel::Info, "default tag");
    EXPECT_EQ(b.back().tag, "anvil");
}

TEST_F(LoggerTest, RemovedSinkStopsReceiving) {
    std::vector<Recorded> got;
    auto sink = std::make_unique<RecordingSink>(got);
    const ILogSink* handle = sink.get();
    Logger::add_sink(std::move(sink));
    Logger::log(LogLevel::Debug, "one");
    Logger::remove_sink(handle);
    Logger::log(LogLevel::Debug, "two");
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].message, "one");
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_EQ(Logger::string_to_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::string_to_level("Info"), LogLevel::Info);
    EXPECT_EQ(Logger::string_to_level("WARN"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("ERROR"), LogLevel::Error);
    EXPECT_FALSE(Logger::string_to_level("NONE").has_value());
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Warning), "WARN");
}

TEST(FileUtils, WriteThenReadBack) {
    const auto path = std::filesystem::temp_directory_path() / "anvil_file_utils_test.bin";
    const std::vector<uint8_t> data = {0, 1, 2, 250, 251, 252};
    anvil::write_file(path, data);
    EXPECT_EQ(anvil::read_file(path), data);

    // replacing keeps no trace of the previous, longer content
    const std::vector<uint8_t> shorter = {9};
    anvil::write_file(path, shorter);
    EXPECT_EQ(anvil::read_file(path), shorter);
    std::filesystem::remove(path);
}

TEST(FileUtils, MissingFileThrows) {
    EXPECT_THROW((void)anvil::read_file("/nonexistent/anvil/input.gif"), std::runtime_error);
}
