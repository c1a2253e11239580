#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <sitecache/core/types.h>

namespace sitecache::integration {

// A downstream application found for a site
struct ApplicationTarget {
    std::string user;           // account the application's tooling runs as
    std::filesystem::path root; // application root directory
    std::string version;
};

enum class PluginState { NotInstalled, Inactive, Active };

constexpr const char* pluginStateName(PluginState s) {
    switch (s) {
        case PluginState::NotInstalled: return "not installed";
        case PluginState::Inactive: return "inactive";
        case PluginState::Active: return "active";
    }
    return "unknown";
}

/**
 * Capability interface for pointing a site's application at its cache
 * instance. Every method is allowed to fail; callers treat failures as
 * warnings.
 */
class IApplicationConfigurer {
public:
    virtual ~IApplicationConfigurer() = default;

    /// NotFound when the site hosts no supported application
    virtual Result<ApplicationTarget> detect(const std::string& site) = 0;

    /// `raw` stores the value unquoted (numbers, booleans)
    virtual Result<void> setConstant(const ApplicationTarget& target, const std::string& name,
                                     const std::string& value, bool raw) = 0;

    virtual Result<PluginState> pluginState(const ApplicationTarget& target,
                                            const std::string& slug) = 0;
    virtual Result<void> activatePlugin(const ApplicationTarget& target,
                                        const std::string& slug) = 0;
    virtual Result<void> installPlugin(const ApplicationTarget& target,
                                       const std::string& slug) = 0;
};

enum class PluginPolicy { Ask, Yes, No };

Result<PluginPolicy> parsePluginPolicy(const std::string& text);

struct IntegrationSettings {
    std::string portConstant{"WP_REDIS_PORT"};
    std::string passwordConstant{"WP_REDIS_PASSWORD"};
    std::string pluginSlug{"spinupwp"};
    PluginPolicy pluginPolicy{PluginPolicy::Ask};
};

struct IntegrationReport {
    bool detected{false};
    ApplicationTarget target;
    std::vector<std::string> applied;
    std::vector<std::string> warnings;
};

// Asked when the plugin policy is Ask; returns true to go ahead
using PluginConfirm = std::function<bool(PluginState state, const std::string& slug)>;

/**
 * Best-effort: detect the application, set the port and credential constants
 * and bring the cache plugin to the active state per policy. Never fails; all
 * problems land in IntegrationReport::warnings.
 */
IntegrationReport integrateApplication(IApplicationConfigurer& configurer,
                                       const std::string& site, Port port,
                                       const std::string& credential,
                                       const IntegrationSettings& settings,
                                       const PluginConfirm& confirm = {});

} // namespace sitecache::integration
