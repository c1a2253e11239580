#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <iostream>

#include <sitecache/cli/command.h>
#include <sitecache/cli/instance_report.h>
#include <sitecache/cli/sitecache_cli.h>
#include <sitecache/provision/instance_layout.h>
#include <sitecache/provision/instance_registry.h>

namespace sitecache::cli {

class ListCommand : public ICommand {
public:
    std::string getName() const override { return "list"; }

    std::string getDescription() const override {
        return "List provisioned cache instances with port, memory and live status";
    }

    void registerCommand(CLI::App& app, SitecacheCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("list", getDescription());
        cmd->alias("ls");
        cmd->add_flag("--json", jsonOutput_, "Output in JSON format");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfg = cli_->getHostConfig();
        if (!cfg)
            return cfg.error();

        provision::InstanceLayout layout(cfg.value());
        provision::InstanceRegistry registry(layout);
        auto services = cli_->getServiceManager();
        auto instances = registry.report(*services);
        spdlog::debug("Found {} instance(s) in {}", instances.size(),
                      layout.overrideDir().string());

        if (jsonOutput_) {
            std::cout << instancesToJson(instances).dump(2) << std::endl;
        } else {
            renderInstanceTable(std::cout, "Cache Instances", instances);
        }
        return Result<void>();
    }

private:
    SitecacheCLI* cli_ = nullptr;
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createListCommand() {
    return std::make_unique<ListCommand>();
}

} // namespace sitecache::cli
