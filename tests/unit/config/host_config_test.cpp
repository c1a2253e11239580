#include <gtest/gtest.h>
#include <sitecache/config/config_helpers.h>
#include <sitecache/config/host_config.h>

#include "../../common/test_helpers.h"

#include <cstdlib>
#include <filesystem>

using namespace sitecache;
using namespace sitecache::config;
namespace fs = std::filesystem;

class HostConfigTest : public ::testing::Test {
protected:
    void SetUp() override { temp_dir_ = tests::make_temp_dir("sitecache_config_"); }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    fs::path writeConfig(const std::string& content) {
        return tests::write_file(temp_dir_ / "config.toml", content);
    }

    fs::path temp_dir_;
};

TEST_F(HostConfigTest, MissingFileYieldsDefaults) {
    auto cfg = HostConfig::load(temp_dir_ / "absent.toml");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().sitesRoot, fs::path("/sites"));
    EXPECT_EQ(cfg.value().portRangeStart, 6380);
    EXPECT_EQ(cfg.value().portRangeEnd, 6400);
    EXPECT_EQ(cfg.value().defaultMaxMemory, "256M");
    EXPECT_EQ(cfg.value().overrideDir(), fs::path("/etc/redis/sites"));
}

TEST_F(HostConfigTest, SectionsAndDottedKeysAreApplied) {
    auto path = writeConfig(R"(# host settings
[paths]
sites_root = "/srv/sites"   # trailing comment
site_config_dir = "/etc/redis/per-site"

[ports]
range_start = 7000
range_end = 7010

[lifecycle]
settle_delay_ms = 0
probe_attempts = 5

[daemon]
manage_ownership = no
)");
    auto cfg = HostConfig::load(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().sitesRoot, fs::path("/srv/sites"));
    EXPECT_EQ(cfg.value().overrideDir(), fs::path("/etc/redis/per-site"));
    EXPECT_EQ(cfg.value().portRangeStart, 7000);
    EXPECT_EQ(cfg.value().portRangeEnd, 7010);
    EXPECT_EQ(cfg.value().settleDelay.count(), 0);
    EXPECT_EQ(cfg.value().probeAttempts, 5);
    EXPECT_FALSE(cfg.value().manageOwnership);
}

TEST_F(HostConfigTest, QuotedHashIsNotAComment) {
    auto path = writeConfig("[integration]\nplugin = \"redis#cache\"\n");
    auto values = parse_simple_toml(path);
    EXPECT_EQ(values["integration.plugin"], "redis#cache");
}

TEST_F(HostConfigTest, BadIntegerIsRejectedWithPath) {
    auto path = writeConfig("[ports]\nrange_start = abc\n");
    auto cfg = HostConfig::load(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::ValidationError);
    EXPECT_NE(cfg.error().message.find(path.string()), std::string::npos);
    EXPECT_NE(cfg.error().message.find("ports.range_start"), std::string::npos);
}

TEST_F(HostConfigTest, PortOutsideRangeIsRejected) {
    auto path = writeConfig("[ports]\nrange_end = 80\n");
    auto cfg = HostConfig::load(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::ValidationError);
}

TEST_F(HostConfigTest, InvertedRangeFailsValidation) {
    auto path = writeConfig("[ports]\nrange_start = 6500\nrange_end = 6400\n");
    auto cfg = HostConfig::load(path);
    ASSERT_FALSE(cfg);
    EXPECT_NE(cfg.error().message.find("above range end"), std::string::npos);
}

TEST_F(HostConfigTest, ZeroProbeAttemptsFailsValidation) {
    HostConfig cfg;
    cfg.probeAttempts = 0;
    auto r = cfg.validate();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
}

TEST_F(HostConfigTest, BadBooleanIsRejected) {
    HostConfig cfg;
    auto r = cfg.applyValues({{"host.require_root", "maybe"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
}

TEST_F(HostConfigTest, UnknownKeysAreIgnored) {
    HostConfig cfg;
    auto r = cfg.applyValues({{"paths.nonsense", "x"}, {"naming.config_prefix", "valkey"}});
    ASSERT_TRUE(r);
    EXPECT_EQ(cfg.configPrefix, "valkey");
}

TEST(ConfigHelpersTest, ParseBoolAcceptsCommonSpellings) {
    EXPECT_EQ(parse_bool("TRUE"), true);
    EXPECT_EQ(parse_bool("on"), true);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_FALSE(parse_bool("enabled").has_value());
}

TEST(ConfigHelpersTest, ConfigPathPrefersExplicitThenEnvironment) {
    EXPECT_EQ(get_config_path("/tmp/explicit.toml"), fs::path("/tmp/explicit.toml"));

    const char* saved = std::getenv("SITECACHE_CONFIG");
    std::string savedValue = saved ? saved : "";
    setenv("SITECACHE_CONFIG", "/tmp/from-env.toml", 1);
    EXPECT_EQ(get_config_path(), fs::path("/tmp/from-env.toml"));
    unsetenv("SITECACHE_CONFIG");
    EXPECT_EQ(get_config_path(), fs::path("/etc/sitecache/config.toml"));
    if (saved)
        setenv("SITECACHE_CONFIG", savedValue.c_str(), 1);
}
