#include <gtest/gtest.h>
#include <sitecache/provision/instance.h>
#include <sitecache/provision/instance_layout.h>
#include <sitecache/provision/mode_resolver.h>

using namespace sitecache;
using namespace sitecache::provision;

TEST(MaxMemoryTest, ParsesAndNormalizesUnit) {
    auto m = MaxMemory::parse("512m");
    ASSERT_TRUE(m);
    EXPECT_EQ(m.value().amount, 512u);
    EXPECT_EQ(m.value().unit, 'M');
    EXPECT_EQ(m.value().toString(), "512M");

    auto g = MaxMemory::parse("1G");
    ASSERT_TRUE(g);
    EXPECT_EQ(g.value().toString(), "1G");
}

TEST(MaxMemoryTest, RejectsMalformedInput) {
    for (const char* bad : {"", "M", "256", "256K", "2.5G", "-1M", "12 M"}) {
        auto m = MaxMemory::parse(bad);
        ASSERT_FALSE(m) << bad;
        EXPECT_EQ(m.error().code, ErrorCode::ValidationError) << bad;
    }
    auto r = MaxMemory::parse("256K");
    EXPECT_NE(r.error().message.find("Use format like 256M or 1G"), std::string::npos);
}

TEST(MaxMemoryTest, RejectsZero) {
    auto m = MaxMemory::parse("0M");
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().code, ErrorCode::ValidationError);
}

TEST(SiteNameTest, AcceptsDomainStyleNames) {
    EXPECT_TRUE(validateSiteName("example.com"));
    EXPECT_TRUE(validateSiteName("my_site-2.example.org"));
}

TEST(SiteNameTest, RejectsTraversalAndSeparators) {
    for (const char* bad : {"", ".", "..", "a/b", "../etc", "site name", "semi;colon"}) {
        EXPECT_FALSE(validateSiteName(bad)) << bad;
    }
}

TEST(PortNumberTest, EnforcesUnprivilegedRange) {
    EXPECT_FALSE(validatePortNumber(1023));
    EXPECT_FALSE(validatePortNumber(65536));
    EXPECT_FALSE(validatePortNumber(-1));
    ASSERT_TRUE(validatePortNumber(1024));
    EXPECT_EQ(validatePortNumber(65535).value(), 65535);
    EXPECT_NE(validatePortNumber(80).error().message.find("between 1024 and 65535"),
              std::string::npos);
}

TEST(InstanceLayoutTest, DerivesEveryNameFromTheSite) {
    config::HostConfig cfg;
    InstanceLayout layout(cfg);
    auto p = layout.pathsFor("example.com");

    EXPECT_EQ(p.siteName, "example.com");
    EXPECT_EQ(p.baseConfig, std::filesystem::path("/etc/redis/redis.example.com.conf"));
    EXPECT_EQ(p.overrideConfig, std::filesystem::path("/etc/redis/sites/overrides.example.com.conf"));
    EXPECT_EQ(p.unitName, "redis-server-example.com.service");
    EXPECT_EQ(p.unitFile,
              std::filesystem::path("/etc/systemd/system/redis-server-example.com.service"));
    EXPECT_EQ(p.serviceAlias, "redis-example.com.service");
    EXPECT_EQ(p.pidFile, std::filesystem::path("/run/redis/redis-server-example.com.pid"));
    EXPECT_EQ(p.logFile, std::filesystem::path("/var/log/redis/redis-server-example.com.log"));
    EXPECT_EQ(p.dataFileName, "dump-example.com.rdb");
}

TEST(InstanceLayoutTest, HonorsConfiguredPrefixes) {
    config::HostConfig cfg;
    cfg.configPrefix = "valkey";
    cfg.servicePrefix = "valkey-server";
    cfg.aliasPrefix = "valkey";
    cfg.siteConfigDir = "/srv/overrides";
    InstanceLayout layout(cfg);
    auto p = layout.pathsFor("acme");
    EXPECT_EQ(p.baseConfig.filename(), "valkey.acme.conf");
    EXPECT_EQ(p.overrideConfig, std::filesystem::path("/srv/overrides/overrides.acme.conf"));
    EXPECT_EQ(p.unitName, "valkey-server-acme.service");
    EXPECT_EQ(p.serviceAlias, "valkey-acme.service");
}

TEST(InstanceLayoutTest, RecognizesOnlyOverrideFileNames) {
    config::HostConfig cfg;
    InstanceLayout layout(cfg);
    EXPECT_EQ(layout.siteFromOverrideFile("/x/overrides.example.com.conf"), "example.com");
    EXPECT_FALSE(layout.siteFromOverrideFile("/x/overrides..conf"));
    EXPECT_FALSE(layout.siteFromOverrideFile("/x/redis.example.com.conf"));
    EXPECT_FALSE(layout.siteFromOverrideFile("/x/overrides.example.com.conf.bak"));
}

class ModeResolverTest : public ::testing::Test {
protected:
    InstanceSummary existing(bool complete = true) {
        InstanceSummary s;
        s.siteName = "acme";
        if (complete) {
            s.port = 6380;
            s.maxMemory = MaxMemory{256, 'M'};
        }
        return s;
    }
};

TEST_F(ModeResolverTest, NoInstanceIsAlwaysFreshInstall) {
    auto m = resolveMode(std::nullopt, std::nullopt);
    ASSERT_TRUE(m);
    EXPECT_EQ(kindOf(m.value()), ModeKind::FreshInstall);

    // An operator choice is irrelevant without an instance
    auto m2 = resolveMode(std::nullopt, OperatorChoice::Reinstall);
    ASSERT_TRUE(m2);
    EXPECT_EQ(kindOf(m2.value()), ModeKind::FreshInstall);
}

TEST_F(ModeResolverTest, ExistingInstanceNeedsAChoice) {
    auto m = resolveMode(existing(), std::nullopt);
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ModeResolverTest, ReconfigureCarriesPortAndMemory) {
    auto m = resolveMode(existing(), OperatorChoice::Reconfigure);
    ASSERT_TRUE(m);
    ASSERT_EQ(kindOf(m.value()), ModeKind::Reconfigure);
    const auto& r = std::get<Reconfigure>(m.value());
    EXPECT_EQ(r.port, 6380);
    EXPECT_EQ(r.maxMemory.toString(), "256M");
}

TEST_F(ModeResolverTest, ReconfigureRefusedWhenValuesUnreadable) {
    auto m = resolveMode(existing(false), OperatorChoice::Reconfigure);
    ASSERT_FALSE(m);
    EXPECT_EQ(m.error().code, ErrorCode::InvalidState);

    // Reinstall still works: it does not depend on the old values
    auto r = resolveMode(existing(false), OperatorChoice::Reinstall);
    ASSERT_TRUE(r);
    EXPECT_EQ(kindOf(r.value()), ModeKind::Reinstall);
}

TEST_F(ModeResolverTest, CancelIsTerminal) {
    auto m = resolveMode(existing(), OperatorChoice::Cancel);
    ASSERT_TRUE(m);
    EXPECT_EQ(kindOf(m.value()), ModeKind::Cancel);
    EXPECT_STREQ(modeName(ModeKind::Cancel), "cancel");
}

TEST(OperatorChoiceTest, ParsesNamesAndMenuNumbers) {
    EXPECT_EQ(parseOperatorChoice("1"), OperatorChoice::Reconfigure);
    EXPECT_EQ(parseOperatorChoice("Reinstall"), OperatorChoice::Reinstall);
    EXPECT_EQ(parseOperatorChoice("cancel"), OperatorChoice::Cancel);
    EXPECT_FALSE(parseOperatorChoice("4"));
    EXPECT_FALSE(parseOperatorChoice(""));
}
