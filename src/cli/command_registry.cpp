#include <sitecache/cli/command_registry.h>
#include <sitecache/cli/sitecache_cli.h>

namespace sitecache::cli {

// Factory functions from command implementations
std::unique_ptr<ICommand> createListCommand();
std::unique_ptr<ICommand> createInstallCommand();
std::unique_ptr<ICommand> createProbeCommand();

void CommandRegistry::registerAllCommands(SitecacheCLI* cli) {
    cli->registerCommand(CommandRegistry::createListCommand());
    cli->registerCommand(CommandRegistry::createInstallCommand());
    cli->registerCommand(CommandRegistry::createProbeCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createListCommand() {
    return ::sitecache::cli::createListCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createInstallCommand() {
    return ::sitecache::cli::createInstallCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createProbeCommand() {
    return ::sitecache::cli::createProbeCommand();
}

} // namespace sitecache::cli
