#include <gtest/gtest.h>
#include <sitecache/provision/instance_layout.h>
#include <sitecache/provision/lifecycle_controller.h>

#include "../../common/fakes.h"

#include <vector>

using namespace sitecache;
using namespace sitecache::provision;
using namespace std::chrono_literals;

class LifecycleControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config::HostConfig cfg;
        paths_ = InstanceLayout(cfg).pathsFor("acme");
        options_.settleDelay = 2000ms;
        options_.probeAttempts = 3;
        options_.probeInterval = 500ms;
        prober_.credentials[6380] = "good";
    }

    LifecycleController controller() {
        return LifecycleController(services_, prober_, options_,
                                   [this](std::chrono::milliseconds d) { sleeps_.push_back(d); });
    }

    tests::FakeServiceManager services_;
    tests::FakeProber prober_;
    LifecycleOptions options_;
    InstancePaths paths_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(LifecycleControllerTest, FreshInstallReloadsEnablesAndStarts) {
    auto lc = controller();
    auto h = lc.transition(ModeKind::FreshInstall, paths_, 6380, "good");
    ASSERT_TRUE(h) << h.error().message;
    EXPECT_TRUE(h.value().active);
    EXPECT_TRUE(h.value().responding);
    EXPECT_EQ(h.value().probeAttemptsUsed, 1);
    EXPECT_EQ(services_.calls,
              (std::vector<std::string>{"daemon-reload", "enable " + paths_.unitName,
                                        "start " + paths_.unitName}));
    ASSERT_EQ(sleeps_.size(), 1u);
    EXPECT_EQ(sleeps_[0], 2000ms);
}

TEST_F(LifecycleControllerTest, ReconfigureAndReinstallRestart) {
    for (auto mode : {ModeKind::Reconfigure, ModeKind::Reinstall}) {
        services_.calls.clear();
        auto lc = controller();
        ASSERT_TRUE(lc.transition(mode, paths_, 6380, "good"));
        EXPECT_EQ(services_.calls,
                  (std::vector<std::string>{"daemon-reload", "restart " + paths_.unitName}));
    }
}

TEST_F(LifecycleControllerTest, RewrittenUnitIsEnabledBeforeRestart) {
    auto lc = controller();
    ASSERT_TRUE(lc.transition(ModeKind::Reconfigure, paths_, 6380, "good", true));
    EXPECT_EQ(services_.calls,
              (std::vector<std::string>{"daemon-reload", "enable " + paths_.unitName,
                                        "restart " + paths_.unitName}));
}

TEST_F(LifecycleControllerTest, InactiveUnitIsServiceStartFailed) {
    services_.failToStart.insert(paths_.unitName);
    auto lc = controller();
    auto h = lc.transition(ModeKind::FreshInstall, paths_, 6380, "good");
    ASSERT_FALSE(h);
    EXPECT_EQ(h.error().code, ErrorCode::ServiceStartFailed);
    EXPECT_NE(h.error().message.find("journalctl -u " + paths_.unitName), std::string::npos);
    EXPECT_EQ(prober_.calls, 0);
}

TEST_F(LifecycleControllerTest, ReloadFailureStopsTheTransition) {
    services_.failReload = true;
    auto lc = controller();
    auto h = lc.transition(ModeKind::FreshInstall, paths_, 6380, "good");
    ASSERT_FALSE(h);
    EXPECT_EQ(h.error().code, ErrorCode::ExternalCommandFailed);
    EXPECT_EQ(services_.calls.size(), 1u);
}

TEST_F(LifecycleControllerTest, ProbeRetriesUntilAnswer) {
    prober_.failuresBeforeSuccess = 2;
    auto lc = controller();
    auto h = lc.transition(ModeKind::FreshInstall, paths_, 6380, "good");
    ASSERT_TRUE(h);
    EXPECT_EQ(h.value().probeAttemptsUsed, 3);
    // settle + two retry intervals
    EXPECT_EQ(sleeps_, (std::vector<std::chrono::milliseconds>{2000ms, 500ms, 500ms}));
}

TEST_F(LifecycleControllerTest, ExhaustedProbesAreProbeFailed) {
    prober_.failuresBeforeSuccess = 10;
    auto lc = controller();
    auto h = lc.transition(ModeKind::FreshInstall, paths_, 6380, "good");
    ASSERT_FALSE(h);
    EXPECT_EQ(h.error().code, ErrorCode::ProbeFailed);
    EXPECT_EQ(prober_.calls, 3);
    EXPECT_NE(h.error().message.find("after 3 attempt(s)"), std::string::npos);
}

TEST_F(LifecycleControllerTest, RejectedCredentialIsNotRetried) {
    auto lc = controller();
    auto h = lc.transition(ModeKind::Reconfigure, paths_, 6380, "stale");
    ASSERT_FALSE(h);
    EXPECT_EQ(h.error().code, ErrorCode::ProbeFailed);
    EXPECT_EQ(prober_.calls, 1);
    EXPECT_NE(h.error().message.find("Authentication failed"), std::string::npos);
    EXPECT_EQ(h.error().message.find("stale"), std::string::npos);
}

TEST_F(LifecycleControllerTest, CancelHasNoTransition) {
    auto lc = controller();
    auto h = lc.transition(ModeKind::Cancel, paths_, 6380, "good");
    ASSERT_FALSE(h);
    EXPECT_EQ(h.error().code, ErrorCode::InvalidState);
    EXPECT_TRUE(services_.calls.empty());
}

TEST_F(LifecycleControllerTest, VerifyOnlyProbes) {
    auto lc = controller();
    auto h = lc.verify(paths_, 6380, "good");
    ASSERT_TRUE(h);
    EXPECT_FALSE(h.value().active);
    EXPECT_TRUE(h.value().responding);
    EXPECT_TRUE(services_.calls.empty());
}

TEST_F(LifecycleControllerTest, ZeroAttemptsStillProbesOnce) {
    options_.probeAttempts = 0;
    auto lc = controller();
    ASSERT_TRUE(lc.verify(paths_, 6380, "good"));
    EXPECT_EQ(prober_.calls, 1);
}
