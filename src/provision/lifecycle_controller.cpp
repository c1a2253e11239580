#include <sitecache/provision/lifecycle_controller.h>

#include <spdlog/spdlog.h>
#include <thread>

namespace sitecache::provision {

LifecycleController::LifecycleController(system::IServiceManager& services,
                                         system::ILivenessProber& prober,
                                         LifecycleOptions options, Sleeper sleeper)
    : services_(services), prober_(prober), options_(std::move(options)),
      sleep_(std::move(sleeper)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    if (options_.probeAttempts < 1)
        options_.probeAttempts = 1;
}

Result<HealthStatus> LifecycleController::transition(ModeKind mode, const InstancePaths& paths,
                                                     Port port, const std::string& credential,
                                                     bool unitWritten) {
    if (mode == ModeKind::Cancel) {
        return Error{ErrorCode::InvalidState, "Cancelled runs have no lifecycle transition"};
    }

    if (auto r = services_.reloadConfiguration(); !r)
        return r.error();

    if (mode == ModeKind::FreshInstall) {
        spdlog::info("Enabling and starting {}", paths.unitName);
        if (auto r = services_.enable(paths.unitName); !r)
            return r.error();
        if (auto r = services_.start(paths.unitName); !r)
            return r.error();
    } else {
        if (unitWritten) {
            spdlog::info("Enabling rewritten unit {}", paths.unitName);
            if (auto r = services_.enable(paths.unitName); !r)
                return r.error();
        }
        spdlog::info("Restarting {}", paths.unitName);
        if (auto r = services_.restart(paths.unitName); !r)
            return r.error();
    }

    sleep_(options_.settleDelay);

    HealthStatus status;
    auto active = services_.isActive(paths.unitName);
    if (!active || !active.value()) {
        std::string reason = active ? "unit is not active" : active.error().message;
        return Error{ErrorCode::ServiceStartFailed,
                     paths.unitName + " failed to start (" + reason +
                         "). Check logs with: journalctl -u " + paths.unitName};
    }
    status.active = true;

    if (auto r = probeWithRetries(port, credential, status); !r)
        return r.error();
    return status;
}

Result<HealthStatus> LifecycleController::verify(const InstancePaths& paths, Port port,
                                                 const std::string& credential) {
    HealthStatus status;
    auto active = services_.isActive(paths.unitName);
    status.active = active && active.value();
    if (auto r = probeWithRetries(port, credential, status); !r)
        return r.error();
    return status;
}

Result<void> LifecycleController::probeWithRetries(Port port, const std::string& credential,
                                                   HealthStatus& status) {
    Error last{ErrorCode::ProbeFailed, "no probe attempted"};
    for (int attempt = 1; attempt <= options_.probeAttempts; ++attempt) {
        status.probeAttemptsUsed = attempt;
        auto r = prober_.probe(options_.probeHost, port, credential, options_.probeTimeout);
        if (r) {
            status.responding = true;
            spdlog::debug("Probe of port {} succeeded on attempt {}", port, attempt);
            return {};
        }
        last = r.error();
        spdlog::debug("Probe attempt {}/{} on port {} failed: {}", attempt,
                      options_.probeAttempts, port, last.message);
        // A rejected credential will not change between attempts
        if (last.code == ErrorCode::AuthenticationFailed)
            break;
        if (attempt < options_.probeAttempts)
            sleep_(options_.probeInterval);
    }
    return Error{ErrorCode::ProbeFailed,
                 fmt::format("Instance on port {} did not answer the authenticated probe after {} "
                             "attempt(s): {} ({})",
                             port, status.probeAttemptsUsed, last.message,
                             errorToString(last.code))};
}

} // namespace sitecache::provision
