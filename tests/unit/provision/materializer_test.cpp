#include <gtest/gtest.h>
#include <sitecache/provision/config_materializer.h>
#include <sitecache/provision/instance_layout.h>
#include <sitecache/provision/unit_materializer.h>

#include "../../common/test_helpers.h"

using namespace sitecache;
using namespace sitecache::provision;
namespace fs = std::filesystem;

namespace {

InstanceParameters params(Port port, const std::string& credential) {
    InstanceParameters p;
    p.port = port;
    p.maxMemory = MaxMemory{256, 'M'};
    p.credential = credential;
    return p;
}

} // namespace

class ConfigMaterializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        layout_ = std::make_unique<InstanceLayout>(host_.config());
        paths_ = layout_->pathsFor("acme.test");
    }

    ArtifactJournal journal() {
        ArtifactJournal j;
        j.expect(ArtifactKind::OverrideConfig, paths_.overrideConfig);
        j.expect(ArtifactKind::BaseConfig, paths_.baseConfig);
        return j;
    }

    ConfigMaterializer materializer() {
        return ConfigMaterializer(host_.config().baseTemplate, std::nullopt);
    }

    tests::SandboxHost host_;
    std::unique_ptr<InstanceLayout> layout_;
    InstancePaths paths_;
};

TEST_F(ConfigMaterializerTest, OverrideRenderingIsDeterministic) {
    auto p = params(6380, "abc123");
    auto text = renderOverride(paths_, p);
    EXPECT_EQ(text, renderOverride(paths_, p));

    std::string expected = "port 6380\n"
                           "pidfile " + paths_.pidFile.string() + "\n"
                           "logfile " + paths_.logFile.string() + "\n"
                           "dbfilename dump-acme.test.rdb\n"
                           "maxmemory 256M\n"
                           "maxmemory-policy allkeys-lru\n"
                           "requirepass \"abc123\"\n";
    EXPECT_EQ(text, expected);
}

TEST_F(ConfigMaterializerTest, FreshInstallWritesBothArtifacts) {
    auto j = journal();
    auto r = materializer().materialize(ModeKind::FreshInstall, paths_, params(6380, "c1"), j);
    ASSERT_TRUE(r) << r.error().message;

    auto base = tests::read_file(paths_.baseConfig);
    EXPECT_EQ(base.rfind(tests::kStockBaseConfig, 0), 0u) << "stock content is preserved";
    EXPECT_EQ(tests::count_occurrences(base, includeDirective(paths_.overrideConfig)), 1u);
    EXPECT_NE(tests::read_file(paths_.overrideConfig).find("port 6380"), std::string::npos);

    for (const auto& e : j.entries())
        EXPECT_EQ(e.state, ArtifactJournal::State::Written) << artifactKindName(e.kind);
}

TEST_F(ConfigMaterializerTest, OverridePermissionsExcludeOthers) {
    auto j = journal();
    ASSERT_TRUE(materializer().materialize(ModeKind::FreshInstall, paths_, params(6380, "c1"), j));
    auto perms = fs::status(paths_.overrideConfig).permissions();
    EXPECT_EQ(perms & fs::perms::others_all, fs::perms::none);
    EXPECT_NE(perms & fs::perms::group_read, fs::perms::none);
    EXPECT_EQ(perms & fs::perms::group_write, fs::perms::none);
}

TEST_F(ConfigMaterializerTest, ReconfigureKeepsSingleIncludeAndRotatesCredential) {
    auto j1 = journal();
    ASSERT_TRUE(materializer().materialize(ModeKind::FreshInstall, paths_, params(6380, "old"), j1));

    auto j2 = journal();
    auto r = materializer().materialize(ModeKind::Reconfigure, paths_, params(6380, "new"), j2);
    ASSERT_TRUE(r) << r.error().message;

    auto base = tests::read_file(paths_.baseConfig);
    EXPECT_EQ(tests::count_occurrences(base, includeDirective(paths_.overrideConfig)), 1u);
    auto overrideText = tests::read_file(paths_.overrideConfig);
    EXPECT_NE(overrideText.find("requirepass \"new\""), std::string::npos);
    EXPECT_EQ(overrideText.find("old"), std::string::npos);

    // The base already had the include, so reconfigure did not rewrite it
    EXPECT_EQ(j2.entries()[1].kind, ArtifactKind::BaseConfig);
    EXPECT_EQ(j2.entries()[1].state, ArtifactJournal::State::Untouched);
}

TEST_F(ConfigMaterializerTest, ReconfigureRestoresMissingInclude) {
    tests::write_file(paths_.baseConfig, "port 6379\n# operator edit");
    auto j = journal();
    ASSERT_TRUE(materializer().materialize(ModeKind::Reconfigure, paths_, params(6380, "x"), j));
    auto base = tests::read_file(paths_.baseConfig);
    EXPECT_EQ(base, "port 6379\n# operator edit\n" + includeDirective(paths_.overrideConfig) + "\n");
}

TEST_F(ConfigMaterializerTest, ReconfigureWithoutBaseIsPreconditionFailure) {
    tests::write_file(paths_.overrideConfig, renderOverride(paths_, params(6380, "current")));
    const auto before = tests::read_file(paths_.overrideConfig);

    auto check = materializer().checkInputs(ModeKind::Reconfigure, paths_);
    ASSERT_FALSE(check);
    EXPECT_EQ(check.error().code, ErrorCode::PreconditionFailed);

    auto j = journal();
    auto r = materializer().materialize(ModeKind::Reconfigure, paths_, params(6380, "rotated"), j);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PreconditionFailed);
    EXPECT_NE(r.error().message.find("reinstall"), std::string::npos);
    EXPECT_EQ(tests::read_file(paths_.overrideConfig), before);
    EXPECT_FALSE(j.anyWritten());
}

TEST_F(ConfigMaterializerTest, MissingStockTemplateIsCheckedBeforeWriting) {
    fs::remove(host_.config().baseTemplate);
    auto check = materializer().checkInputs(ModeKind::FreshInstall, paths_);
    ASSERT_FALSE(check);
    EXPECT_EQ(check.error().code, ErrorCode::PreconditionFailed);

    auto j = journal();
    ASSERT_FALSE(materializer().materialize(ModeKind::Reinstall, paths_, params(6380, "x"), j));
    EXPECT_FALSE(fs::exists(paths_.overrideConfig));
}

TEST_F(ConfigMaterializerTest, ReinstallRestartsFromStockTemplate) {
    tests::write_file(paths_.baseConfig, "stale content\n");
    auto j = journal();
    ASSERT_TRUE(materializer().materialize(ModeKind::Reinstall, paths_, params(6381, "x"), j));
    auto base = tests::read_file(paths_.baseConfig);
    EXPECT_EQ(base.find("stale content"), std::string::npos);
    EXPECT_EQ(base.rfind(tests::kStockBaseConfig, 0), 0u);
}

TEST_F(ConfigMaterializerTest, CancelMaterializesNothing) {
    auto j = journal();
    auto r = materializer().materialize(ModeKind::Cancel, paths_, params(6380, "x"), j);
    ASSERT_FALSE(r);
    EXPECT_FALSE(j.anyWritten());
    EXPECT_FALSE(fs::exists(paths_.overrideConfig));
}

TEST(IncludeDirectiveTest, DetectsIndentedLineAndIgnoresLookalikes) {
    fs::path ov = "/etc/redis/sites/overrides.a.conf";
    EXPECT_TRUE(hasIncludeDirective("x\n  include /etc/redis/sites/overrides.a.conf  \r\n", ov));
    EXPECT_FALSE(hasIncludeDirective("# include /etc/redis/sites/overrides.a.conf\n", ov));
    EXPECT_FALSE(hasIncludeDirective("include /etc/redis/sites/overrides.a.conf.bak\n", ov));
    EXPECT_EQ(ensureIncludeDirective("", ov), "include /etc/redis/sites/overrides.a.conf\n");
}

TEST(ArtifactJournalTest, DescribesPartialState) {
    ArtifactJournal j;
    j.expect(ArtifactKind::OverrideConfig, "/o.conf");
    j.expect(ArtifactKind::BaseConfig, "/b.conf");
    j.expect(ArtifactKind::ServiceUnit, "/u.service");
    j.markWritten(ArtifactKind::OverrideConfig);
    j.markUntouched(ArtifactKind::BaseConfig);

    EXPECT_TRUE(j.anyWritten());
    EXPECT_EQ(j.describe(),
              "written: [override config (/o.conf)]; not written: [service unit (/u.service)]");

    auto err = j.failure(Error{ErrorCode::WriteError, "disk full"});
    EXPECT_EQ(err.code, ErrorCode::WriteError);
    EXPECT_EQ(err.message.rfind("disk full; partial state written: [", 0), 0u);
}

TEST(ArtifactWriterTest, AtomicWriteReplacesContentAndPermissions) {
    auto dir = tests::make_temp_dir("sitecache_writer_");
    auto target = dir / "nested" / "file.conf";
    ASSERT_TRUE(writeFileAtomic(target, "one\n", fs::perms::owner_read | fs::perms::owner_write));
    ASSERT_TRUE(writeFileAtomic(target, "two\n", fs::perms::owner_read));
    EXPECT_EQ(tests::read_file(target), "two\n");
    EXPECT_EQ(fs::status(target).permissions() & fs::perms::all, fs::perms::owner_read);

    // No staging files are left behind
    std::size_t files = 0;
    for ([[maybe_unused]] const auto& e : fs::directory_iterator(target.parent_path()))
        ++files;
    EXPECT_EQ(files, 1u);
    fs::remove_all(dir);
}

TEST(ArtifactWriterTest, UnknownOwnerIsPreconditionFailure) {
    auto r = resolveOwner("sitecache-no-such-user", "sitecache-no-such-group");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PreconditionFailed);
}

class UnitMaterializerTest : public ConfigMaterializerTest {
protected:
    std::string stock() { return tests::stock_unit(host_.config().baseTemplate); }
};

TEST_F(UnitMaterializerTest, RewritesSiteSpecificFields) {
    auto r = renderUnit(stock(), paths_, host_.config().baseTemplate);
    ASSERT_TRUE(r) << r.error().message;
    const auto& text = r.value().content;
    EXPECT_TRUE(r.value().warnings.empty());
    EXPECT_NE(text.find("Description=Advanced key-value store for acme.test\n"), std::string::npos);
    EXPECT_NE(text.find("ExecStart=/usr/bin/redis-server " + paths_.baseConfig.string() +
                        " --supervised systemd --daemonize no\n"),
              std::string::npos);
    EXPECT_NE(text.find("PIDFile=" + paths_.pidFile.string() + "\n"), std::string::npos);
    EXPECT_NE(text.find("Alias=redis-acme.test.service\n"), std::string::npos);
    EXPECT_NE(text.find("WantedBy=multi-user.target\n"), std::string::npos);
}

TEST_F(UnitMaterializerTest, MissingExecStartIsFatal) {
    auto r = renderUnit("[Service]\nPIDFile=/run/x.pid\n", paths_, host_.config().baseTemplate);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PreconditionFailed);
    EXPECT_NE(r.error().message.find("ExecStart"), std::string::npos);
}

TEST_F(UnitMaterializerTest, ExecStartMustReferenceStockConfig) {
    auto r = renderUnit("ExecStart=/usr/bin/redis-server /opt/other.conf\nPIDFile=/x\n", paths_,
                        host_.config().baseTemplate);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PreconditionFailed);
}

TEST_F(UnitMaterializerTest, MissingPidFileIsFatal) {
    auto r = renderUnit("ExecStart=/usr/bin/redis-server " + host_.config().baseTemplate.string() +
                            "\n",
                        paths_, host_.config().baseTemplate);
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("PIDFile"), std::string::npos);
}

TEST_F(UnitMaterializerTest, MissingOptionalFieldsWarn) {
    auto r = renderUnit("ExecStart=/usr/bin/redis-server " + host_.config().baseTemplate.string() +
                            "\r\nPIDFile=/x\r\n",
                        paths_, host_.config().baseTemplate);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().warnings.size(), 2u);
    EXPECT_EQ(r.value().content.find('\r'), std::string::npos);
}

TEST_F(UnitMaterializerTest, ReconfigureLeavesExistingUnitUntouched) {
    UnitMaterializer units(host_.config().unitTemplate, host_.config().baseTemplate, std::nullopt);
    tests::write_file(paths_.unitFile, "hand-edited\n");

    ArtifactJournal j;
    j.expect(ArtifactKind::ServiceUnit, paths_.unitFile);
    ASSERT_TRUE(units.materialize(ModeKind::Reconfigure, paths_, j));
    EXPECT_EQ(tests::read_file(paths_.unitFile), "hand-edited\n");
    EXPECT_EQ(j.entries()[0].state, ArtifactJournal::State::Untouched);

    ASSERT_TRUE(units.materialize(ModeKind::Reinstall, paths_, j));
    EXPECT_NE(tests::read_file(paths_.unitFile).find("Alias=redis-acme.test.service"),
              std::string::npos);
    EXPECT_EQ(j.entries()[0].state, ArtifactJournal::State::Written);
}

TEST_F(UnitMaterializerTest, UnreadableTemplateIsPreconditionFailure) {
    UnitMaterializer units(host_.root() / "missing.service", host_.config().baseTemplate,
                           std::nullopt);
    auto check = units.checkInputs(ModeKind::Reinstall, paths_);
    ASSERT_FALSE(check);
    EXPECT_EQ(check.error().code, ErrorCode::PreconditionFailed);
    // An existing unit kept by reconfigure needs no template
    tests::write_file(paths_.unitFile, "[Unit]\n");
    EXPECT_TRUE(units.checkInputs(ModeKind::Reconfigure, paths_));

    fs::remove(paths_.unitFile);
    ArtifactJournal j;
    auto r = units.materialize(ModeKind::FreshInstall, paths_, j);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PreconditionFailed);
}
