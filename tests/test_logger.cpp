#include "../libmediapress/include/logger.hpp"
#include <gtest/gtest.h>

using namespace mediapress;

namespace {

struct RecordingSink final : ILogSink {
    std::vector<std::string>* lines;

    explicit RecordingSink(std::vector<std::string>* out) : lines(out) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        lines->push_back(std::string(to_string(level)) + " " + std::string(tag) + " " +
                         std::string(message));
    }
};

} // namespace

TEST(Logger, StringToLevel) {
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("INFO"), LogLevel::Info);
    EXPECT_EQ(Logger::parse_level("Warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::parse_level("WARN"), LogLevel::Warning);
    EXPECT_EQ(Logger::parse_level("none"), LogLevel::None);
    EXPECT_EQ(Logger::parse_level("ERROR"), LogLevel::Error);
    EXPECT_EQ(Logger::parse_level("garbage"), LogLevel::Error);
}

TEST(Logger, FansOutToEverySink) {
    std::vector<std::string> a;
    std::vector<std::string> b;
    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<RecordingSink>(&a));
    Logger::add_sink(std::make_unique<RecordingSink>(&b));

    Logger::log(LogLevel::Warning, "disk almost full", "scanner");
    Logger::log(LogLevel::Info, "hello");
    Logger::clear_sinks();
    Logger::log(LogLevel::Error, "nobody listens");

    const std::vector<std::string> expected = {"WARN scanner disk almost full", "INFO mediapress hello"};
    EXPECT_EQ(a, expected);
    EXPECT_EQ(b, expected);
}
