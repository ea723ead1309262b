#pragma once

#include <clawdesk/cli/command.h>

#include <memory>

namespace clawdesk::cli {

class ClawdeskCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(ClawdeskCLI* cli);
};

// Command factories
std::unique_ptr<ICommand> createStartCommand();
std::unique_ptr<ICommand> createStopCommand();
std::unique_ptr<ICommand> createStatusCommand();
std::unique_ptr<ICommand> createFlushCommand();
std::unique_ptr<ICommand> createFetchCommand();
std::unique_ptr<ICommand> createPlatformCommand();
std::unique_ptr<ICommand> createProbeCommand();
std::unique_ptr<ICommand> createAgentConfigCommand();

} // namespace clawdesk::cli
