#include <spdlog/spdlog.h>
#include <charconv>
#include <filesystem>
#include <iostream>

#include <sitecache/cli/command.h>
#include <sitecache/cli/instance_report.h>
#include <sitecache/cli/prompt_util.h>
#include <sitecache/cli/sitecache_cli.h>
#include <sitecache/cli/ui_helpers.hpp>
#include <sitecache/config/config_helpers.h>
#include <sitecache/integration/application_configurer.h>
#include <sitecache/provision/preconditions.h>
#include <sitecache/provision/provisioner.h>

namespace sitecache::cli {

namespace {

std::optional<long long> parsePortText(const std::string& text) {
    long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

} // namespace

/**
 * Provision, reconfigure or reinstall one site's cache instance. Interactive by
 * default; --yes together with --site/--mode/--port/--memory runs unattended.
 */
class InstallCommand : public ICommand {
public:
    std::string getName() const override { return "install"; }

    std::string getDescription() const override {
        return "Provision a cache instance for a site (fresh install, reconfigure or reinstall)";
    }

    void registerCommand(CLI::App& app, SitecacheCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("install", getDescription());
        cmd->add_option("-s,--site", site_, "Site name (directory under the sites root)");
        cmd->add_option("--mode", modeText_,
                        "Action when the site already has an instance")
            ->check(CLI::IsMember({"reconfigure", "reinstall", "cancel"}));
        portOpt_ = cmd->add_option("-p,--port", portValue_, "Port for a fresh install or reinstall");
        cmd->add_option("-m,--memory", memory_, "Memory ceiling, e.g. 256M or 1G");
        cmd->add_flag("-y,--yes", assumeYes_, "Do not prompt; fail instead of asking");
        cmd->add_flag("--no-app", noApp_, "Skip application integration");
        cmd->add_option("--plugin", pluginText_, "Cache plugin handling: ask, yes or no")
            ->check(CLI::IsMember({"ask", "yes", "no"}));
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfgResult = cli_->getHostConfig();
        if (!cfgResult)
            return cfgResult.error();
        cfg_ = cfgResult.value();

        if (auto pre = provision::checkHostPreconditions(cfg_); !pre)
            return pre.error();

        provision::LifecycleController::Sleeper sleeper;
        if (cli_->sleepDisabled())
            sleeper = [](std::chrono::milliseconds) {};
        auto services = cli_->getServiceManager();
        auto prober = cli_->getLivenessProber();
        provision::Provisioner provisioner(cfg_, cli_->getSocketTable(), *services, *prober,
                                           sleeper);

        renderInstanceTable(std::cout, "Existing Cache Instances",
                            provisioner.registry().report(*services));
        std::cout << "\n";

        auto site = selectSite(provisioner);
        if (!site)
            return site.error();

        provision::ProvisionRequest request;
        request.site = site.value();
        if (!memory_.empty())
            request.maxMemory = memory_;
        if (portOpt_ && portOpt_->count() > 0)
            request.port = portValue_;

        auto existing = provisioner.registry().lookup(request.site);
        if (existing) {
            auto choice = selectChoice(*existing);
            if (!choice)
                return choice.error();
            request.choice = choice.value();
        }

        auto mode = provision::resolveMode(existing, request.choice);
        if (!mode)
            return mode.error();
        if (provision::kindOf(mode.value()) == provision::ModeKind::Cancel) {
            std::cout << ui::status_info("Installation cancelled.") << "\n";
            return Result<void>();
        }
        const bool needsParams = provision::kindOf(mode.value()) != provision::ModeKind::Reconfigure;

        for (;;) {
            if (needsParams && interactive()) {
                if (auto r = promptParameters(provisioner, request); !r)
                    return r;
            }

            auto plan = provisioner.plan(request);
            if (!plan)
                return plan.error();

            printSummary(plan.value());
            if (interactive() &&
                !prompt_yes_no("Proceed with installation? [Y/n]: ", YesNoOptions{})) {
                std::cout << ui::status_info("Installation cancelled.") << "\n";
                return Result<void>();
            }

            auto outcome = provisioner.apply(plan.value());
            if (!outcome) {
                if (outcome.error().code == ErrorCode::PortConflict && needsParams &&
                    interactive()) {
                    std::cout << ui::status_warning(outcome.error().message) << "\n";
                    request.port.reset();
                    continue;
                }
                return outcome.error();
            }

            std::cout << ui::status_ok(plan.value().paths.unitName + " is active and answered "
                                                                     "an authenticated PING")
                      << "\n";
            runIntegration(outcome.value());
            renderConnectionReport(std::cout, outcome.value(), cfg_.probeHost);
            std::cout << "\n";
            renderInstanceTable(std::cout, "All Cache Instances",
                                provisioner.registry().report(*services));
            return Result<void>();
        }
    }

private:
    bool interactive() const { return !assumeYes_; }

    Result<std::string> selectSite(const provision::Provisioner& provisioner) {
        namespace fs = std::filesystem;
        if (!site_.empty()) {
            if (auto v = provision::validateSiteName(site_); !v)
                return v.error();
            std::error_code ec;
            if (!fs::is_directory(cfg_.sitesRoot / site_, ec)) {
                return Error{ErrorCode::NotFound,
                             "Site " + site_ + " not found under " + cfg_.sitesRoot.string()};
            }
            return site_;
        }
        if (!interactive()) {
            return Error{ErrorCode::InvalidArgument, "--site is required with --yes"};
        }

        auto sites = provisioner.registry().listSites();
        if (sites.empty()) {
            return Error{ErrorCode::NotFound, "No sites found in " + cfg_.sitesRoot.string()};
        }
        std::vector<ChoiceItem> items;
        for (const auto& s : sites) {
            ChoiceItem item{s, s, ""};
            if (provisioner.registry().lookup(s))
                item.label = s + " (has instance)";
            items.push_back(std::move(item));
        }
        bool eof = false;
        auto idx = prompt_choice("Available sites:", items,
                                 ChoiceOptions{0, false, true, "Select site number"}, &eof);
        if (eof) {
            return Error{ErrorCode::OperationCancelled, "No site selected"};
        }
        return sites[idx];
    }

    Result<provision::OperatorChoice>
    selectChoice(const provision::InstanceSummary& existing) {
        if (!modeText_.empty()) {
            if (auto c = provision::parseOperatorChoice(modeText_))
                return *c;
            return Error{ErrorCode::InvalidArgument, "Unknown mode: " + modeText_};
        }
        if (!interactive()) {
            return Error{ErrorCode::InvalidArgument,
                         "An instance for '" + existing.siteName +
                             "' already exists; pass --mode reconfigure|reinstall|cancel"};
        }

        std::cout << ui::status_warning("A cache instance already exists for " +
                                        existing.siteName)
                  << "\n";
        std::cout << "  Port:   " << (existing.port ? std::to_string(*existing.port) : "?")
                  << "\n";
        std::cout << "  Memory: " << (existing.maxMemory ? existing.maxMemory->toString() : "?")
                  << "\n\n";
        std::vector<ChoiceItem> items = {
            {"reconfigure", "Reconfigure (keep port and memory, new password)", ""},
            {"reinstall", "Reinstall (new port, memory and password)", ""},
            {"cancel", "Cancel", ""},
        };
        bool eof = false;
        auto idx = prompt_choice("What would you like to do?", items,
                                 ChoiceOptions{0, false, true, "Select option"}, &eof);
        if (eof)
            return provision::OperatorChoice::Cancel;
        return *provision::parseOperatorChoice(items[idx].value);
    }

    Result<void> promptParameters(const provision::Provisioner& provisioner,
                                  provision::ProvisionRequest& request) {
        const auto& allocator = provisioner.allocator();
        // Flag values get the same checks as typed ones; a rejected value is asked for again
        if (request.port) {
            if (auto r = allocator.validateCandidate(*request.port); !r) {
                std::cout << ui::status_warning(r.error().message) << "\n";
                request.port.reset();
            }
        }
        if (request.maxMemory && !provision::MaxMemory::parse(*request.maxMemory)) {
            std::cout << ui::status_warning("Invalid memory format " + *request.maxMemory +
                                            ". Use a number followed by M or G (e.g. 256M, 1G).")
                      << "\n";
            request.maxMemory.reset();
        }
        if (!request.port) {
            auto suggested = allocator.suggestPort();
            if (!suggested)
                return suggested.error();

            InputOptions opts;
            opts.defaultValue = std::to_string(suggested.value());
            opts.validator = [&allocator](const std::string& text) -> std::string {
                auto value = parsePortText(text);
                if (!value)
                    return "Invalid port " + text +
                           ". Please enter a number between 1024 and 65535.";
                auto r = allocator.validateCandidate(*value);
                return r ? std::string{} : r.error().message;
            };
            bool eof = false;
            auto text = prompt_input("Port [" + opts.defaultValue + "]: ", opts, &eof);
            if (eof)
                return Error{ErrorCode::OperationCancelled, "Input ended before a port was chosen"};
            request.port = parsePortText(text);
        }

        if (!request.maxMemory) {
            InputOptions opts;
            opts.defaultValue = cfg_.defaultMaxMemory;
            opts.validator = [](const std::string& text) -> std::string {
                return provision::MaxMemory::parse(text)
                           ? std::string{}
                           : "Invalid memory format. Use a number followed by M or G (e.g. "
                             "256M, 1G).";
            };
            bool eof = false;
            auto text = prompt_input("Max memory [" + opts.defaultValue + "]: ", opts, &eof);
            if (eof)
                return Error{ErrorCode::OperationCancelled, "Input ended before memory was chosen"};
            request.maxMemory = text;
        }
        return Result<void>();
    }

    void printSummary(const provision::ProvisionPlan& plan) const {
        const auto& p = plan.paths;
        std::cout << "\n" << ui::section_header("Installation Summary") << "\n";
        std::cout << ui::key_value("Site", p.siteName, 10) << "\n";
        std::cout << ui::key_value("Mode", provision::modeName(plan.kind()), 10) << "\n";
        std::cout << ui::key_value("Port", std::to_string(plan.params.port), 10) << "\n";
        std::cout << ui::key_value("Memory", plan.params.maxMemory.toString(), 10) << "\n";
        std::cout << ui::key_value("Policy", plan.params.evictionPolicy, 10) << "\n";
        std::cout << ui::key_value("Config", p.baseConfig.string(), 10) << "\n";
        std::cout << ui::key_value("Overrides", p.overrideConfig.string(), 10) << "\n";
        std::cout << ui::key_value("Service", p.unitFile.string(), 10) << "\n\n";
    }

    void runIntegration(const provision::ProvisionOutcome& outcome) {
        if (noApp_ || !cfg_.integrationEnabled)
            return;
        if (interactive() &&
            !prompt_yes_no("Configure the site's application to use this instance? [Y/n]: ")) {
            std::cout << ui::status_info("Skipped application configuration.") << "\n";
            return;
        }

        integration::IntegrationSettings settings;
        settings.portConstant = cfg_.portConstant;
        settings.passwordConstant = cfg_.passwordConstant;
        settings.pluginSlug = cfg_.pluginSlug;
        if (auto policy = integration::parsePluginPolicy(pluginText_)) {
            settings.pluginPolicy = policy.value();
        }
        // Unattended runs never block on a plugin question
        if (!interactive() && settings.pluginPolicy == integration::PluginPolicy::Ask)
            settings.pluginPolicy = integration::PluginPolicy::No;

        auto confirm = [](integration::PluginState state, const std::string& slug) {
            YesNoOptions opts;
            opts.defaultYes = false;
            if (state == integration::PluginState::Inactive)
                return prompt_yes_no("Activate plugin " + slug + "? [y/N]: ", opts);
            return prompt_yes_no("Install and activate plugin " + slug + "? [y/N]: ", opts);
        };

        auto configurer = cli_->getApplicationConfigurer();
        auto report = integration::integrateApplication(*configurer, outcome.paths.siteName,
                                                        outcome.params.port,
                                                        outcome.params.credential, settings,
                                                        confirm);
        if (!report.detected) {
            std::cout << ui::status_info("No supported application detected; skipped.") << "\n";
        } else if (!report.target.version.empty()) {
            std::cout << ui::status_ok("WordPress " + report.target.version + " detected") << "\n";
        }
        for (const auto& a : report.applied)
            std::cout << ui::status_ok(a) << "\n";
        for (const auto& w : report.warnings)
            std::cout << ui::status_warning(w) << "\n";
    }

    SitecacheCLI* cli_ = nullptr;
    config::HostConfig cfg_;

    std::string site_;
    std::string modeText_;
    long long portValue_ = 0;
    CLI::Option* portOpt_ = nullptr;
    std::string memory_;
    bool assumeYes_ = false;
    bool noApp_ = false;
    std::string pluginText_ = "ask";
};

// Factory function
std::unique_ptr<ICommand> createInstallCommand() {
    return std::make_unique<InstallCommand>();
}

} // namespace sitecache::cli
