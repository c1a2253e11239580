#include <gtest/gtest.h>
#include <sitecache/system/process.h>
#include <sitecache/system/service_manager.h>

#include "../../common/test_helpers.h"

using namespace sitecache;
using namespace sitecache::system;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

TEST(ProcessTest, CapturesStdoutAndExitCode) {
    auto r = runProcess({{"sh", "-c", "echo hello; echo oops >&2; exit 3"}});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().exitCode, 3);
    EXPECT_EQ(r.value().out, "hello\n");
    EXPECT_EQ(r.value().err, "oops\n");
    EXPECT_FALSE(r.value().ok());
}

TEST(ProcessTest, RunsInWorkdir) {
    auto dir = tests::make_temp_dir("sitecache_proc_");
    ProcessSpec spec;
    spec.argv = {"pwd"};
    spec.workdir = dir;
    auto r = runProcess(spec);
    ASSERT_TRUE(r);
    auto out = r.value().out;
    while (!out.empty() && out.back() == '\n')
        out.pop_back();
    EXPECT_EQ(fs::canonical(out), fs::canonical(dir));
    fs::remove_all(dir);
}

TEST(ProcessTest, MissingExecutableExits127) {
    auto r = runProcess({{"sitecache-definitely-not-installed"}});
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().exitCode, kExecFailedExitCode);
}

TEST(ProcessTest, TimeoutKillsTheChild) {
    ProcessSpec spec;
    spec.argv = {"sleep", "5"};
    spec.timeout = 200ms;
    auto start = std::chrono::steady_clock::now();
    auto r = runProcess(spec);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
}

TEST(ProcessTest, EmptyArgvIsInvalid) {
    auto r = runProcess(ProcessSpec{});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(ProcessTest, DescribeJoinsArguments) {
    EXPECT_EQ(describeCommand({"systemctl", "restart", "x.service"}), "systemctl restart x.service");
}

// Stand-in systemctl: logs its arguments, fails "start", reports only up.service active
class SystemctlServiceManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tests::make_temp_dir("sitecache_systemctl_");
        log_ = dir_ / "calls.log";
        script_ = tests::write_file(dir_ / "systemctl",
                                    "#!/bin/sh\n"
                                    "echo \"$*\" >> '" + log_.string() + "'\n"
                                    "case \"$1\" in\n"
                                    "  is-active) [ \"$3\" = up.service ] && exit 0; exit 3 ;;\n"
                                    "  start) echo 'Job for x failed.' >&2; exit 1 ;;\n"
                                    "esac\n"
                                    "exit 0\n");
        fs::permissions(script_, fs::perms::owner_all);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    fs::path log_;
    fs::path script_;
};

TEST_F(SystemctlServiceManagerTest, PassesVerbAndUnit) {
    SystemctlServiceManager services(script_.string(), 5s);
    ASSERT_TRUE(services.reloadConfiguration());
    ASSERT_TRUE(services.enable("a.service"));
    ASSERT_TRUE(services.restart("a.service"));
    EXPECT_EQ(tests::read_file(log_), "daemon-reload\nenable a.service\nrestart a.service\n");
}

TEST_F(SystemctlServiceManagerTest, NonZeroExitCarriesStderr) {
    SystemctlServiceManager services(script_.string(), 5s);
    auto r = services.start("a.service");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ExternalCommandFailed);
    EXPECT_NE(r.error().message.find("Job for x failed."), std::string::npos);
}

TEST_F(SystemctlServiceManagerTest, IsActiveMapsExitCode) {
    SystemctlServiceManager services(script_.string(), 5s);
    auto up = services.isActive("up.service");
    ASSERT_TRUE(up);
    EXPECT_TRUE(up.value());
    auto down = services.isActive("down.service");
    ASSERT_TRUE(down);
    EXPECT_FALSE(down.value());
}

TEST_F(SystemctlServiceManagerTest, MissingBinaryIsPreconditionFailure) {
    SystemctlServiceManager services((dir_ / "nope").string(), 5s);
    auto r = services.reloadConfiguration();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PreconditionFailed);
    auto a = services.isActive("x.service");
    ASSERT_FALSE(a);
    EXPECT_EQ(a.error().code, ErrorCode::PreconditionFailed);
}
