/**
 * @file test_logger.cpp
 * @brief Unit tests for the NDJSON logger and its sinks.
 */

#include "core/logger.hpp"
#include "telemetry/log_sinks.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace cloudslash;

namespace {

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    return lines;
}

}  // namespace

TEST(LoggerTest, EmitsOneJsonObjectPerLine) {
    auto sink = std::make_unique<MemorySink>();
    auto* memory = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug, "scheduler");

    logger.info("worker pool grown");

    auto lines = memory->lines();
    ASSERT_EQ(lines.size(), 1u);
    const auto& line = lines[0];
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(line.find(R"("component":"scheduler")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"worker pool grown")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto sink = std::make_unique<MemorySink>();
    auto* memory = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("shown");
    EXPECT_EQ(memory->lines().size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("now shown");
    EXPECT_EQ(memory->lines().size(), 3u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, EscapesMessageText) {
    auto sink = std::make_unique<MemorySink>();
    auto* memory = sink.get();
    Logger logger(std::move(sink));

    logger.info("path \"C:\\tmp\"\nnext");
    auto lines = memory->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(R"(path \"C:\\tmp\"\nnext)"), std::string::npos);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug").value(), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning").value(), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error").value(), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(LoggerTest, ConcurrentWritersKeepLinesIntact) {
    auto sink = std::make_unique<MemorySink>();
    auto* memory = sink.get();
    Logger logger(std::move(sink));

    {
        std::vector<std::jthread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&logger, t] {
                for (int i = 0; i < 100; ++i) {
                    logger.info("writer " + std::to_string(t) + " line " + std::to_string(i));
                }
            });
        }
    }

    auto lines = memory->lines();
    ASSERT_EQ(lines.size(), 400u);
    for (const auto& line : lines) {
        EXPECT_EQ(line.back(), '}');
    }
}

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "cs_test_logs";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(JsonFileSinkTest, CreatesDirectoryAndAppends) {
    {
        JsonFileSink sink(temp_dir_, "cloudslash");
        sink.write(R"({"msg":"one"})");
        sink.write(R"({"msg":"two"})");
        sink.flush();
    }
    auto lines = read_lines(temp_dir_ / "cloudslash.ndjson");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], R"({"msg":"two"})");
}

TEST_F(JsonFileSinkTest, RotatesNewestFirst) {
    {
        JsonFileSink sink(temp_dir_, "cloudslash", 50, 2);
        sink.set_max_file_size_bytes(10);
        sink.write(R"({"msg":"first"})");
        sink.write(R"({"msg":"second"})");
        sink.write(R"({"msg":"third"})");
        sink.write(R"({"msg":"fourth"})");
        sink.flush();

        EXPECT_EQ(sink.active_path(), temp_dir_ / "cloudslash.ndjson");
        EXPECT_EQ(sink.rotated_path(1), temp_dir_ / "cloudslash.1.ndjson");
    }

    EXPECT_EQ(read_lines(temp_dir_ / "cloudslash.ndjson"),
              std::vector<std::string>{R"({"msg":"fourth"})"});
    EXPECT_EQ(read_lines(temp_dir_ / "cloudslash.1.ndjson"),
              std::vector<std::string>{R"({"msg":"third"})"});
    EXPECT_EQ(read_lines(temp_dir_ / "cloudslash.2.ndjson"),
              std::vector<std::string>{R"({"msg":"second"})"});
    // Oldest file beyond the retention count is dropped.
    EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "cloudslash.3.ndjson"));
}
