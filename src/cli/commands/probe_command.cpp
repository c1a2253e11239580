#include <spdlog/spdlog.h>
#include <iostream>

#include <sitecache/cli/command.h>
#include <sitecache/cli/sitecache_cli.h>
#include <sitecache/cli/ui_helpers.hpp>
#include <sitecache/provision/instance_layout.h>
#include <sitecache/provision/instance_registry.h>
#include <sitecache/provision/lifecycle_controller.h>

namespace sitecache::cli {

// Authenticated PING against an existing instance using its stored credential
class ProbeCommand : public ICommand {
public:
    std::string getName() const override { return "probe"; }

    std::string getDescription() const override {
        return "Check that a site's instance answers an authenticated PING";
    }

    void registerCommand(CLI::App& app, SitecacheCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("probe", getDescription());
        cmd->add_option("-s,--site", site_, "Site name")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfg = cli_->getHostConfig();
        if (!cfg)
            return cfg.error();
        if (auto v = provision::validateSiteName(site_); !v)
            return v.error();

        provision::InstanceLayout layout(cfg.value());
        provision::InstanceRegistry registry(layout);
        auto summary = registry.lookup(site_);
        if (!summary) {
            return Error{ErrorCode::NotFound, "No cache instance is provisioned for " + site_};
        }
        if (!summary->port) {
            return Error{ErrorCode::InvalidData,
                         summary->overrideConfig.string() + " declares no usable port"};
        }
        auto credential = registry.readCredential(site_);
        if (!credential)
            return credential.error();

        provision::LifecycleOptions opts;
        opts.probeAttempts = cfg.value().probeAttempts;
        opts.probeInterval = cfg.value().probeInterval;
        opts.probeTimeout = cfg.value().probeTimeout;
        opts.probeHost = cfg.value().probeHost;
        provision::LifecycleController::Sleeper sleeper;
        if (cli_->sleepDisabled())
            sleeper = [](std::chrono::milliseconds) {};

        auto services = cli_->getServiceManager();
        auto prober = cli_->getLivenessProber();
        provision::LifecycleController lifecycle(*services, *prober, opts, sleeper);
        auto health = lifecycle.verify(layout.pathsFor(site_), *summary->port, credential.value());
        if (!health)
            return health.error();

        std::cout << ui::status_ok("Instance for " + site_ + " on port " +
                                   std::to_string(*summary->port) + " answered PONG")
                  << "\n";
        if (!health.value().active) {
            std::cout << ui::status_warning("Service manager does not report " +
                                            layout.unitNameFor(site_) + " as active")
                      << "\n";
        }
        return Result<void>();
    }

private:
    SitecacheCLI* cli_ = nullptr;
    std::string site_;
};

// Factory function
std::unique_ptr<ICommand> createProbeCommand() {
    return std::make_unique<ProbeCommand>();
}

} // namespace sitecache::cli
