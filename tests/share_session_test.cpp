// ShareSession.h comes first so it must compile on its own includes
#include "qrshare/ShareSession.h"
#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace QrShare;

TEST(ShareSessionTest, EmptyPasswordDisablesCheck) {
    ShareSession session("abc123", "/tmp/file.bin");
    session.setPassword(std::string());
    EXPECT_FALSE(session.hasPassword());

    session.setPassword(std::string("secret"));
    ASSERT_TRUE(session.hasPassword());
    EXPECT_EQ(*session.getRules().expectedPassword, "secret");
    EXPECT_EQ(session.getToken(), "abc123");
}

TEST(ShareSessionTest, ConcurrentDownloadsAreCountedExactly) {
    ShareSession session("abc123", "/tmp/file.bin", true);
    EXPECT_TRUE(session.isArtifactTemporary());

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&session]() {
            for (int j = 0; j < 1000; ++j) {
                session.recordDownload();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(session.getDownloadCount(), 8000u);
    EXPECT_EQ(session.recordDownload(), 8001u);
}
