#include <gtest/gtest.h>
#include "qrshare/StopSignal.h"

#include <signal.h>
#include <unistd.h>
#include <chrono>
#include <future>
#include <thread>

using namespace QrShare;

class StopSignalTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string err;
        ASSERT_TRUE(StopSignal::install(err)) << err;
        ASSERT_EQ(::pipe(m_input), 0);
    }

    void TearDown() override {
        StopSignal::uninstall();
        for (int fd : m_input) {
            if (fd >= 0) ::close(fd);
        }
    }

    void closeWriteEnd() {
        ::close(m_input[1]);
        m_input[1] = -1;
    }

    int m_input[2] = {-1, -1};
};

TEST_F(StopSignalTest, EnterEndsWait) {
    ASSERT_EQ(::write(m_input[1], "\n", 1), 1);
    EXPECT_EQ(StopSignal::waitForStop(m_input[0]), StopReason::ENTER);
}

TEST_F(StopSignalTest, TextWithoutNewlineKeepsWaiting) {
    auto result = std::async(std::launch::async, [this]() {
        return StopSignal::waitForStop(m_input[0]);
    });

    ASSERT_EQ(::write(m_input[1], "abc", 3), 3);
    EXPECT_EQ(result.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);

    ASSERT_EQ(::write(m_input[1], "\n", 1), 1);
    EXPECT_EQ(result.get(), StopReason::ENTER);
}

TEST_F(StopSignalTest, NotifyEndsWait) {
    StopSignal::notify();
    EXPECT_EQ(StopSignal::waitForStop(m_input[0]), StopReason::SIGNAL);
}

TEST_F(StopSignalTest, SigtermEndsWait) {
    ASSERT_EQ(::raise(SIGTERM), 0);
    EXPECT_EQ(StopSignal::waitForStop(m_input[0]), StopReason::SIGNAL);
}

TEST_F(StopSignalTest, EofWaitsForSignalOnly) {
    closeWriteEnd();

    auto result = std::async(std::launch::async, [this]() {
        return StopSignal::waitForStop(m_input[0]);
    });

    EXPECT_EQ(result.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);
    StopSignal::notify();
    EXPECT_EQ(result.get(), StopReason::SIGNAL);
}
