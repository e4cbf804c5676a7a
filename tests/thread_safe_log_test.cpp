/**
 * @file thread_safe_log_test.cpp
 * @brief Tests for the trace file logger
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/ThreadSafeLog.h"
#include <gtest/gtest.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <regex>
#include <string>
#include <thread>
#include <vector>

using namespace QuickSend;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> readLines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

class ThreadSafeLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_logPath = fs::temp_directory_path() /
                    ("quicksend_log_" + std::to_string(::getpid()) + ".log");
        fs::remove(m_logPath);
    }

    void TearDown() override {
        ThreadSafeLog::initialize({});
        std::error_code ec;
        fs::remove(m_logPath, ec);
    }

    fs::path m_logPath;
};

/**
 * @test Logging before initialize() writes nothing
 */
TEST_F(ThreadSafeLogTest, DisabledUntilInitialized) {
    ThreadSafeLog::initialize({});
    EXPECT_FALSE(ThreadSafeLog::isEnabled());
    ThreadSafeLog::log("dropped");
    EXPECT_FALSE(fs::exists(m_logPath));
}

TEST_F(ThreadSafeLogTest, LinesAreTimestamped) {
    ThreadSafeLog::initialize(m_logPath);
    EXPECT_TRUE(ThreadSafeLog::isEnabled());

    ThreadSafeLog::log("first");
    ThreadSafeLog::log(std::string("second"));

    auto lines = readLines(m_logPath);
    ASSERT_EQ(lines.size(), 2u);

    const std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3} - (.*))");
    std::smatch match;
    ASSERT_TRUE(std::regex_match(lines[0], match, pattern)) << lines[0];
    EXPECT_EQ(match[1], "first");
    ASSERT_TRUE(std::regex_match(lines[1], match, pattern)) << lines[1];
    EXPECT_EQ(match[1], "second");
}

/**
 * @test Concurrent writers never interleave within a line
 */
TEST_F(ThreadSafeLogTest, ConcurrentWritersKeepLinesIntact) {
    ThreadSafeLog::initialize(m_logPath);

    constexpr int kThreads = 4;
    constexpr int kLinesPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < kLinesPerThread; ++i) {
                ThreadSafeLog::log("thread " + std::to_string(t) + " line " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto lines = readLines(m_logPath);
    ASSERT_EQ(lines.size(), static_cast<size_t>(kThreads * kLinesPerThread));

    const std::regex pattern(R"(.* - thread \d line \d+)");
    for (const auto& line : lines) {
        EXPECT_TRUE(std::regex_match(line, pattern)) << line;
    }
}
