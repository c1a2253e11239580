#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <sitecache/core/types.h>
#include <sitecache/provision/instance.h>
#include <sitecache/provision/mode_resolver.h>
#include <sitecache/system/liveness_prober.h>
#include <sitecache/system/service_manager.h>

namespace sitecache::provision {

struct LifecycleOptions {
    std::chrono::milliseconds settleDelay{2000};
    int probeAttempts{3};
    std::chrono::milliseconds probeInterval{500};
    std::chrono::milliseconds probeTimeout{2000};
    std::string probeHost{"127.0.0.1"};
};

struct HealthStatus {
    bool active{false};
    bool responding{false};
    int probeAttemptsUsed{0};
};

/**
 * Moves a freshly materialized instance into the running state and verifies
 * it: reload, enable+start (fresh) or restart, settle, one is-active check,
 * then a bounded authenticated probe.
 */
class LifecycleController {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    LifecycleController(system::IServiceManager& services, system::ILivenessProber& prober,
                        LifecycleOptions options, Sleeper sleeper = {});

    /// ServiceStartFailed when the unit is not active after settling; ProbeFailed when it
    /// is active but does not answer the probe. A unit rewritten outside a fresh install
    /// is enabled again before the restart.
    Result<HealthStatus> transition(ModeKind mode, const InstancePaths& paths, Port port,
                                    const std::string& credential, bool unitWritten = false);

    /// Probe only, without touching the service
    Result<HealthStatus> verify(const InstancePaths& paths, Port port,
                                const std::string& credential);

private:
    Result<void> probeWithRetries(Port port, const std::string& credential,
                                  HealthStatus& status);

    system::IServiceManager& services_;
    system::ILivenessProber& prober_;
    LifecycleOptions options_;
    Sleeper sleep_;
};

} // namespace sitecache::provision
