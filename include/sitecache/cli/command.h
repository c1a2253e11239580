#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include <sitecache/core/types.h>

namespace sitecache::cli {

class SitecacheCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "install", "list")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, SitecacheCLI* cli) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;
};

} // namespace sitecache::cli
