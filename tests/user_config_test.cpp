#include <gtest/gtest.h>
#include "qrshare/UserConfig.h"
#include "qrshare/AppPaths.h"
#include "qrshare/config.h"

#include <cstdlib>
#include <fstream>

using namespace QrShare;

namespace {

std::filesystem::path testDir() {
    const auto root = std::filesystem::temp_directory_path() / "qrshare_user_config_test";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root);
    return root;
}

}  // namespace

TEST(UserConfigTest, RoundTripThroughFile) {
    const auto path = testDir() / "config.json";

    UserConfig config;
    config.setInterfaceName("wlan0");
    std::string err;
    ASSERT_TRUE(config.save(path, err)) << err;

    const UserConfig loaded = UserConfig::load(path);
    EXPECT_EQ(loaded.interfaceName(), "wlan0");
}

TEST(UserConfigTest, WritesInterfaceKey) {
    UserConfig config;
    config.setInterfaceName("eth0");
    const nlohmann::json j = config.toJson();
    ASSERT_TRUE(j.contains("interface"));
    EXPECT_EQ(j["interface"], "eth0");
}

TEST(UserConfigTest, MissingFileYieldsEmptyConfig) {
    const UserConfig loaded = UserConfig::load(testDir() / "does-not-exist.json");
    EXPECT_TRUE(loaded.interfaceName().empty());
}

TEST(UserConfigTest, CorruptFileYieldsEmptyConfig) {
    const auto path = testDir() / "corrupt.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_TRUE(UserConfig::load(path).interfaceName().empty());
}

TEST(UserConfigTest, WrongTypesAreIgnored) {
    EXPECT_TRUE(UserConfig::fromJson(nlohmann::json::array()).interfaceName().empty());
    EXPECT_TRUE(UserConfig::fromJson({{"interface", 42}}).interfaceName().empty());
    EXPECT_EQ(UserConfig::fromJson({{"interface", "en0"}, {"other", true}}).interfaceName(), "en0");
}

TEST(UserConfigTest, SaveWithoutPathFails) {
    UserConfig config;
    std::string err;
    EXPECT_FALSE(config.save({}, err));
    EXPECT_FALSE(err.empty());
}

TEST(AppPathsTest, EnvironmentOverridesConfigPath) {
    const auto path = testDir() / "override.json";
    ASSERT_EQ(::setenv(USER_CONFIG_ENV, path.c_str(), 1), 0);
    EXPECT_EQ(AppPaths::configJsonPath(), path);
    ::unsetenv(USER_CONFIG_ENV);
}

TEST(AppPathsTest, DefaultConfigLivesInHome) {
    ::unsetenv(USER_CONFIG_ENV);
    const auto home = AppPaths::homeDir();
    if (home.empty()) {
        GTEST_SKIP() << "No home directory in this environment";
    }
    EXPECT_EQ(AppPaths::configJsonPath(), home / USER_CONFIG_FILE);
}
