#include <sitecache/config/config_helpers.h>
#include <sitecache/system/process.h>
#include <sitecache/system/service_manager.h>

#include <spdlog/spdlog.h>

namespace sitecache::system {

SystemctlServiceManager::SystemctlServiceManager(std::string systemctl,
                                                 std::chrono::milliseconds timeout)
    : systemctl_(std::move(systemctl)), timeout_(timeout) {}

Result<void> SystemctlServiceManager::run(const std::string& verb, const std::string& unit) {
    ProcessSpec spec;
    spec.argv = {systemctl_, verb};
    if (!unit.empty())
        spec.argv.push_back(unit);
    spec.timeout = timeout_;

    auto r = runProcess(spec);
    if (!r) {
        return r.error();
    }
    const auto& res = r.value();
    if (res.exitCode == kExecFailedExitCode) {
        return Error{ErrorCode::PreconditionFailed, "Could not execute " + systemctl_};
    }
    if (!res.ok()) {
        std::string detail = res.err;
        config::trim(detail);
        return Error{ErrorCode::ExternalCommandFailed,
                     fmt::format("{} failed (exit {}){}", describeCommand(spec.argv), res.exitCode,
                                 detail.empty() ? "" : ": " + detail)};
    }
    spdlog::debug("{} {} {}: ok", systemctl_, verb, unit);
    return {};
}

Result<void> SystemctlServiceManager::reloadConfiguration() {
    return run("daemon-reload", "");
}

Result<void> SystemctlServiceManager::enable(const std::string& unit) {
    return run("enable", unit);
}

Result<void> SystemctlServiceManager::start(const std::string& unit) {
    return run("start", unit);
}

Result<void> SystemctlServiceManager::stop(const std::string& unit) {
    return run("stop", unit);
}

Result<void> SystemctlServiceManager::restart(const std::string& unit) {
    return run("restart", unit);
}

Result<bool> SystemctlServiceManager::isActive(const std::string& unit) {
    ProcessSpec spec;
    spec.argv = {systemctl_, "is-active", "--quiet", unit};
    spec.timeout = timeout_;

    auto r = runProcess(spec);
    if (!r) {
        return r.error();
    }
    if (r.value().exitCode == kExecFailedExitCode) {
        return Error{ErrorCode::PreconditionFailed, "Could not execute " + systemctl_};
    }
    // is-active exits 0 only for "active"; every other state is a non-zero exit
    return r.value().exitCode == 0;
}

} // namespace sitecache::system
