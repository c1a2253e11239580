#pragma once

#include <string>
#include <vector>
#include <sitecache/config/host_config.h>
#include <sitecache/core/types.h>

namespace sitecache::provision {

struct PreconditionCheck {
    std::string name;
    bool passed{false};
    std::string detail;
};

/// Every host check, in order, for display
std::vector<PreconditionCheck> runPreconditionChecks(const config::HostConfig& cfg);

/// First failing check as an error (PermissionDenied for root, PreconditionFailed otherwise)
Result<void> checkHostPreconditions(const config::HostConfig& cfg);

} // namespace sitecache::provision
