#pragma once

#include <memory>
#include <sitecache/cli/command.h>

namespace sitecache::cli {

class SitecacheCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(SitecacheCLI* cli);

    static std::unique_ptr<ICommand> createListCommand();
    static std::unique_ptr<ICommand> createInstallCommand();
    static std::unique_ptr<ICommand> createProbeCommand();
};

} // namespace sitecache::cli
