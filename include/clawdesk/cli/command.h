#pragma once

#include <clawdesk/core/types.h>

#include <memory>
#include <string>
#include <CLI/CLI.hpp>

namespace clawdesk::cli {

class ClawdeskCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "start", "fetch")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, ClawdeskCLI* cli) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;
};

} // namespace clawdesk::cli
