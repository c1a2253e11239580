#include <sitecache/provision/credential.h>
#include <sitecache/provision/provision_lock.h>
#include <sitecache/provision/provisioner.h>
#include <sitecache/provision/unit_materializer.h>

#include <spdlog/spdlog.h>
#include <algorithm>

namespace sitecache::provision {

namespace {
LifecycleOptions lifecycleOptionsFrom(const config::HostConfig& cfg) {
    LifecycleOptions o;
    o.settleDelay = cfg.settleDelay;
    o.probeAttempts = cfg.probeAttempts;
    o.probeInterval = cfg.probeInterval;
    o.probeTimeout = cfg.probeTimeout;
    o.probeHost = cfg.probeHost;
    return o;
}
} // namespace

Provisioner::Provisioner(const config::HostConfig& cfg,
                         std::shared_ptr<system::ISocketTable> sockets,
                         system::IServiceManager& services, system::ILivenessProber& prober,
                         LifecycleController::Sleeper sleeper)
    : cfg_(cfg), layout_(cfg_), registry_(layout_),
      allocator_(registry_, std::move(sockets), PortRange{cfg_.portRangeStart, cfg_.portRangeEnd}),
      lifecycle_(services, prober, lifecycleOptionsFrom(cfg_), std::move(sleeper)) {}

Result<InstanceParameters> Provisioner::resolveParameters(const Mode& mode,
                                                          const ProvisionRequest& request) const {
    InstanceParameters params;
    params.evictionPolicy = cfg_.evictionPolicy;

    if (const auto* keep = std::get_if<Reconfigure>(&mode)) {
        if (request.port && *request.port != keep->port) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Reconfigure keeps port {}; use reinstall to change it",
                                     keep->port)};
        }
        if (request.maxMemory) {
            auto m = MaxMemory::parse(*request.maxMemory);
            if (!m || !(m.value() == keep->maxMemory)) {
                return Error{ErrorCode::InvalidArgument,
                             "Reconfigure keeps maxmemory " + keep->maxMemory.toString() +
                                 "; use reinstall to change it"};
            }
        }
        params.port = keep->port;
        params.maxMemory = keep->maxMemory;
    } else {
        auto port = request.port ? allocator_.validateCandidate(*request.port)
                                 : allocator_.suggestPort();
        if (!port)
            return port.error();
        params.port = port.value();

        auto mem = MaxMemory::parse(request.maxMemory ? *request.maxMemory
                                                      : cfg_.defaultMaxMemory);
        if (!mem)
            return mem.error();
        params.maxMemory = mem.value();
    }

    auto credential = generateCredential();
    if (!credential)
        return credential.error();
    params.credential = std::move(credential).value();
    return params;
}

Result<ProvisionPlan> Provisioner::plan(const ProvisionRequest& request) const {
    if (auto v = validateSiteName(request.site); !v)
        return v.error();

    auto existing = registry_.lookup(request.site);
    auto mode = resolveMode(existing, request.choice);
    if (!mode)
        return mode.error();

    ProvisionPlan plan{mode.value(), layout_.pathsFor(request.site), {}, existing};
    if (plan.kind() == ModeKind::Cancel) {
        spdlog::info("Provisioning of {} cancelled", request.site);
        return plan;
    }

    auto params = resolveParameters(plan.mode, request);
    if (!params)
        return params.error();
    plan.params = std::move(params).value();
    spdlog::info("Planned {} for {} on port {} ({})", modeName(plan.kind()), request.site,
                 plan.params.port, plan.params.maxMemory.toString());
    return plan;
}

Result<ProvisionOutcome> Provisioner::apply(const ProvisionPlan& plan) {
    ProvisionOutcome outcome;
    outcome.mode = plan.kind();
    outcome.paths = plan.paths;
    outcome.params = plan.params;
    if (outcome.cancelled()) {
        return outcome;
    }

    auto lock = ProvisionLock::acquire(cfg_.lockFile);
    if (!lock)
        return lock.error();

    // Re-check under the lock: another run may have committed since planning
    if (outcome.mode == ModeKind::FreshInstall && registry_.lookup(plan.paths.siteName)) {
        return Error{ErrorCode::InvalidState,
                     "An instance for '" + plan.paths.siteName + "' was created concurrently"};
    }
    if (outcome.mode != ModeKind::Reconfigure && allocator_.isPortInUse(plan.params.port)) {
        return Error{ErrorCode::PortConflict,
                     fmt::format("Port {} is already in use. Please choose another port.",
                                 plan.params.port)};
    }

    std::optional<FileOwner> daemonOwner;
    std::optional<FileOwner> rootOwner;
    if (cfg_.manageOwnership) {
        auto owner = resolveOwner(cfg_.daemonUser, cfg_.daemonGroup);
        if (!owner)
            return owner.error();
        daemonOwner = owner.value();
        rootOwner = FileOwner{0, 0};
    }

    ConfigMaterializer configs(cfg_.baseTemplate, daemonOwner);
    UnitMaterializer units(cfg_.unitTemplate, cfg_.baseTemplate, rootOwner);

    // Nothing is written unless every input of the run is readable and valid
    if (auto r = configs.checkInputs(outcome.mode, plan.paths); !r)
        return r.error();
    if (auto r = units.checkInputs(outcome.mode, plan.paths); !r)
        return r.error();

    auto& journal = outcome.journal;
    journal.expect(ArtifactKind::OverrideConfig, plan.paths.overrideConfig);
    journal.expect(ArtifactKind::BaseConfig, plan.paths.baseConfig);
    journal.expect(ArtifactKind::ServiceUnit, plan.paths.unitFile);

    if (auto r = configs.materialize(outcome.mode, plan.paths, plan.params, journal); !r) {
        spdlog::error("Config materialization failed for {}", plan.paths.siteName);
        return journal.failure(r.error());
    }

    if (auto r = units.materialize(outcome.mode, plan.paths, journal); !r) {
        spdlog::error("Unit materialization failed for {}", plan.paths.siteName);
        return journal.failure(r.error());
    }

    const bool unitWritten = std::any_of(
        journal.entries().begin(), journal.entries().end(), [](const ArtifactJournal::Entry& e) {
            return e.kind == ArtifactKind::ServiceUnit &&
                   e.state == ArtifactJournal::State::Written;
        });
    auto health = lifecycle_.transition(outcome.mode, plan.paths, plan.params.port,
                                        plan.params.credential, unitWritten);
    if (!health)
        return health.error();
    outcome.health = health.value();
    spdlog::info("{} complete for {}", modeName(outcome.mode), plan.paths.siteName);
    return outcome;
}

} // namespace sitecache::provision
