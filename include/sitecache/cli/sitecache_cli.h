#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <sitecache/cli/command.h>
#include <sitecache/config/host_config.h>
#include <sitecache/integration/application_configurer.h>
#include <sitecache/system/liveness_prober.h>
#include <sitecache/system/service_manager.h>
#include <sitecache/system/socket_table.h>

namespace sitecache::cli {

/**
 * Main CLI application class
 */
class SitecacheCLI {
public:
    SitecacheCLI();
    ~SitecacheCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Host configuration, loaded once from --config / SITECACHE_CONFIG / the default path
     */
    Result<config::HostConfig> getHostConfig();

    // Host adapters; created on first use unless replaced (tests inject fakes)
    std::shared_ptr<system::IServiceManager> getServiceManager();
    std::shared_ptr<system::ISocketTable> getSocketTable();
    std::shared_ptr<system::ILivenessProber> getLivenessProber();
    std::shared_ptr<integration::IApplicationConfigurer> getApplicationConfigurer();

    void setServiceManager(std::shared_ptr<system::IServiceManager> s) { services_ = std::move(s); }
    void setSocketTable(std::shared_ptr<system::ISocketTable> s) { sockets_ = std::move(s); }
    void setLivenessProber(std::shared_ptr<system::ILivenessProber> p) { prober_ = std::move(p); }
    void setApplicationConfigurer(std::shared_ptr<integration::IApplicationConfigurer> c) {
        appConfigurer_ = std::move(c);
    }
    void setHostConfig(config::HostConfig cfg) { hostConfig_ = std::move(cfg); }

    /**
     * Skip the settle/probe sleeps (tests)
     */
    void setSleepDisabled(bool disabled) { sleepDisabled_ = disabled; }
    bool sleepDisabled() const { return sleepDisabled_; }

    bool getVerbose() const { return verbose_; }

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing
     */
    void setPendingCommand(ICommand* cmd);

private:
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;

    std::string configPath_;
    bool verbose_ = false;
    bool sleepDisabled_ = false;
    std::optional<config::HostConfig> hostConfig_;

    std::shared_ptr<system::IServiceManager> services_;
    std::shared_ptr<system::ISocketTable> sockets_;
    std::shared_ptr<system::ILivenessProber> prober_;
    std::shared_ptr<integration::IApplicationConfigurer> appConfigurer_;

    ICommand* pendingCommand_ = nullptr;
    std::string pendingName_;
};

} // namespace sitecache::cli
