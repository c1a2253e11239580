#pragma once

#include <optional>
#include <string>
#include <vector>
#include <sitecache/provision/instance.h>
#include <sitecache/provision/instance_layout.h>

namespace sitecache::system {
class IServiceManager;
}

namespace sitecache::provision {

/**
 * Read-only view of provisioned instances, backed by the override artifacts
 * in the layout's override directory.
 */
class InstanceRegistry {
public:
    explicit InstanceRegistry(const InstanceLayout& layout);

    /// All instances with an override artifact, sorted by site name
    std::vector<InstanceSummary> listInstances() const;

    std::optional<InstanceSummary> lookup(const std::string& site) const;

    /// The credential stored in a site's override artifact
    Result<std::string> readCredential(const std::string& site) const;

    /// Candidate sites (directory names under the sites root), sorted
    std::vector<std::string> listSites() const;

    /// Instances with live status; a failed status query reports Stopped
    std::vector<InstanceStatus> report(system::IServiceManager& services) const;

    /// Parse one override artifact; missing keywords leave fields unset
    static InstanceSummary parseOverride(const std::string& site,
                                         const std::filesystem::path& file);

private:
    InstanceLayout layout_;
};

} // namespace sitecache::provision
