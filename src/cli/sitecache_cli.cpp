#include <sitecache/cli/command_registry.h>
#include <sitecache/cli/error_hints.h>
#include <sitecache/cli/sitecache_cli.h>
#include <sitecache/config/config_helpers.h>
#include <sitecache/integration/wp_cli_configurer.h>

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>

#ifndef SITECACHE_VERSION_STRING
#define SITECACHE_VERSION_STRING "0.0.0-dev"
#endif

namespace sitecache::cli {

SitecacheCLI::SitecacheCLI() {
    // Conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Per-site cache instance provisioner", "sitecache");
    app_->set_version_flag("--version", SITECACHE_VERSION_STRING);
    app_->require_subcommand(1);

    app_->add_option("--config", configPath_,
                     "Host config file (default: $SITECACHE_CONFIG or "
                     "/etc/sitecache/config.toml)");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");

    CommandRegistry::registerAllCommands(this);
}

SitecacheCLI::~SitecacheCLI() = default;

void SitecacheCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void SitecacheCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
    pendingName_ = cmd ? cmd->getName() : std::string{};
}

void SitecacheCLI::applyLogLevel() {
    // Precedence: env SITECACHE_LOG_LEVEL > --verbose > warn
    auto parseLevel = [](const std::string& s) -> std::optional<spdlog::level::level_enum> {
        auto v = config::to_lower(s);
        if (v == "trace")
            return spdlog::level::trace;
        if (v == "debug")
            return spdlog::level::debug;
        if (v == "info")
            return spdlog::level::info;
        if (v == "warn" || v == "warning")
            return spdlog::level::warn;
        if (v == "error" || v == "err")
            return spdlog::level::err;
        if (v == "critical" || v == "crit")
            return spdlog::level::critical;
        if (v == "off" || v == "none" || v == "silent")
            return spdlog::level::off;
        return std::nullopt;
    };

    if (const char* envLvl = std::getenv("SITECACHE_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

int SitecacheCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
        applyLogLevel();

        if (!pendingCommand_) {
            return 0;
        }
        auto result = pendingCommand_->execute();
        if (!result) {
            spdlog::debug("{} failed: {}", pendingName_, errorToString(result.error().code));
            std::cerr << "[FAIL] "
                      << formatErrorWithHint(result.error().code, result.error().message,
                                             pendingName_)
                      << "\n";
            return 1;
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

Result<config::HostConfig> SitecacheCLI::getHostConfig() {
    if (hostConfig_) {
        return *hostConfig_;
    }
    auto path = config::get_config_path(configPath_);
    spdlog::debug("Loading host config from {}", path.string());
    auto cfg = config::HostConfig::load(path);
    if (!cfg) {
        return cfg.error();
    }
    hostConfig_ = cfg.value();
    return *hostConfig_;
}

std::shared_ptr<system::IServiceManager> SitecacheCLI::getServiceManager() {
    if (!services_) {
        services_ = std::make_shared<system::SystemctlServiceManager>();
    }
    return services_;
}

std::shared_ptr<system::ISocketTable> SitecacheCLI::getSocketTable() {
    if (!sockets_) {
        sockets_ = std::make_shared<system::ProcNetSocketTable>();
    }
    return sockets_;
}

std::shared_ptr<system::ILivenessProber> SitecacheCLI::getLivenessProber() {
    if (!prober_) {
        prober_ = std::make_shared<system::RespLivenessProber>();
    }
    return prober_;
}

std::shared_ptr<integration::IApplicationConfigurer> SitecacheCLI::getApplicationConfigurer() {
    if (!appConfigurer_) {
        integration::WpCliApplicationConfigurer::Options opts;
        if (auto cfg = getHostConfig()) {
            opts.sitesRoot = cfg.value().sitesRoot;
        }
        appConfigurer_ = std::make_shared<integration::WpCliApplicationConfigurer>(opts);
    }
    return appConfigurer_;
}

} // namespace sitecache::cli
