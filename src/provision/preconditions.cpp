#include <sitecache/provision/preconditions.h>

#include <spdlog/spdlog.h>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>

namespace sitecache::provision {

namespace fs = std::filesystem;

std::vector<PreconditionCheck> runPreconditionChecks(const config::HostConfig& cfg) {
    std::vector<PreconditionCheck> checks;
    std::error_code ec;

    if (cfg.requireRoot) {
        bool root = ::geteuid() == 0;
        checks.push_back({"root", root, root ? "running as root" : "must be run as root (sudo)"});
    }

    bool sites = fs::is_directory(cfg.sitesRoot, ec);
    checks.push_back({"sites root", sites,
                      sites ? cfg.sitesRoot.string()
                            : cfg.sitesRoot.string() + " does not exist or is not a directory"});

    bool base = fs::is_regular_file(cfg.baseTemplate, ec);
    checks.push_back({"base template", base,
                      base ? cfg.baseTemplate.string()
                           : cfg.baseTemplate.string() +
                                 " not found. Is the cache server installed?"});

    bool unit = fs::is_regular_file(cfg.unitTemplate, ec);
    checks.push_back({"unit template", unit,
                      unit ? cfg.unitTemplate.string()
                           : cfg.unitTemplate.string() + " not found"});

    if (cfg.manageOwnership) {
        bool user = ::getpwnam(cfg.daemonUser.c_str()) != nullptr;
        checks.push_back({"daemon user", user,
                          user ? cfg.daemonUser
                               : "user '" + cfg.daemonUser + "' does not exist"});
    }
    return checks;
}

Result<void> checkHostPreconditions(const config::HostConfig& cfg) {
    for (const auto& c : runPreconditionChecks(cfg)) {
        if (c.passed) {
            spdlog::debug("precondition {}: {}", c.name, c.detail);
            continue;
        }
        if (c.name == "root")
            return Error{ErrorCode::PermissionDenied, c.detail};
        return Error{ErrorCode::PreconditionFailed, c.name + ": " + c.detail};
    }
    return {};
}

} // namespace sitecache::provision
