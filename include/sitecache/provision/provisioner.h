#pragma once

#include <memory>
#include <optional>
#include <string>
#include <sitecache/config/host_config.h>
#include <sitecache/core/types.h>
#include <sitecache/provision/artifact_writer.h>
#include <sitecache/provision/config_materializer.h>
#include <sitecache/provision/credential.h>
#include <sitecache/provision/instance_layout.h>
#include <sitecache/provision/instance_registry.h>
#include <sitecache/provision/lifecycle_controller.h>
#include <sitecache/provision/mode_resolver.h>
#include <sitecache/provision/port_allocator.h>
#include <sitecache/system/liveness_prober.h>
#include <sitecache/system/service_manager.h>
#include <sitecache/system/socket_table.h>

namespace sitecache::provision {

struct ProvisionRequest {
    std::string site;
    std::optional<OperatorChoice> choice; // required when the site already has an instance
    std::optional<long long> port;        // unset: suggest the lowest free port
    std::optional<std::string> maxMemory; // unset: host default
};

// Everything a run will write, resolved before any mutation
struct ProvisionPlan {
    Mode mode;
    InstancePaths paths;
    InstanceParameters params;
    std::optional<InstanceSummary> previous;

    ModeKind kind() const { return kindOf(mode); }
};

struct ProvisionOutcome {
    ModeKind mode{ModeKind::Cancel};
    InstancePaths paths;
    InstanceParameters params;
    HealthStatus health;
    ArtifactJournal journal;

    bool cancelled() const { return mode == ModeKind::Cancel; }
};

/**
 * One provisioning run: plan() resolves the mode and every parameter without
 * side effects; apply() takes the host lock, re-checks the port, writes the
 * artifacts and moves the service to a verified running state.
 */
class Provisioner {
public:
    Provisioner(const config::HostConfig& cfg, std::shared_ptr<system::ISocketTable> sockets,
                system::IServiceManager& services, system::ILivenessProber& prober,
                LifecycleController::Sleeper sleeper = {});

    // Members hold references into each other
    Provisioner(const Provisioner&) = delete;
    Provisioner& operator=(const Provisioner&) = delete;
    Provisioner(Provisioner&&) = delete;
    Provisioner& operator=(Provisioner&&) = delete;

    Result<ProvisionPlan> plan(const ProvisionRequest& request) const;

    /// PortConflict when the planned port was taken after planning; nothing is written then
    Result<ProvisionOutcome> apply(const ProvisionPlan& plan);

    const InstanceLayout& layout() const { return layout_; }
    const InstanceRegistry& registry() const { return registry_; }
    const PortAllocator& allocator() const { return allocator_; }

private:
    Result<InstanceParameters> resolveParameters(const Mode& mode,
                                                 const ProvisionRequest& request) const;

    config::HostConfig cfg_;
    InstanceLayout layout_;
    InstanceRegistry registry_;
    PortAllocator allocator_;
    LifecycleController lifecycle_;
};

} // namespace sitecache::provision
