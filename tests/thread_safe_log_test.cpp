#include <gtest/gtest.h>
#include "qrshare/ThreadSafeLog.h"

#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

using namespace QrShare;

namespace {

std::filesystem::path logPath() {
    const auto dir = std::filesystem::temp_directory_path() / "qrshare_thread_safe_log_test";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);
    return dir / "trace.log";
}

std::vector<std::string> readLines(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

TEST(ThreadSafeLogTest, DisabledUntilInitialized) {
    ThreadSafeLog::shutdown();
    EXPECT_FALSE(ThreadSafeLog::isEnabled());
    ThreadSafeLog::log("dropped");  // must not crash
}

TEST(ThreadSafeLogTest, AppendsTimestampedLines) {
    const auto path = logPath();
    ThreadSafeLog::initialize(path);
    EXPECT_TRUE(ThreadSafeLog::isEnabled());

    ThreadSafeLog::log("first");
    ThreadSafeLog::log(std::string("second"));
    ThreadSafeLog::shutdown();
    ThreadSafeLog::log("after shutdown");

    const auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find(" - first"), std::string::npos);
    EXPECT_NE(lines[1].find(" - second"), std::string::npos);
    // "YYYY-MM-DD HH:MM:SS.mmm - "
    EXPECT_EQ(lines[0][4], '-');
    EXPECT_EQ(lines[0][19], '.');
}

TEST(ThreadSafeLogTest, ConcurrentWritersDoNotInterleave) {
    const auto path = logPath();
    ThreadSafeLog::initialize(path);

    std::vector<std::thread> writers;
    for (int t = 0; t < 8; ++t) {
        writers.emplace_back([t]() {
            for (int i = 0; i < 50; ++i) {
                ThreadSafeLog::log("writer " + std::to_string(t) + " line " + std::to_string(i));
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }
    ThreadSafeLog::shutdown();

    const auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 400u);
    for (const auto& line : lines) {
        EXPECT_NE(line.find(" - writer "), std::string::npos) << line;
    }
}
