#include <clawdesk/cli/clawdesk_cli.h>
#include <clawdesk/cli/command_registry.h>

namespace clawdesk::cli {

void CommandRegistry::registerAllCommands(ClawdeskCLI* cli) {
    cli->registerCommand(createStartCommand());
    cli->registerCommand(createStopCommand());
    cli->registerCommand(createStatusCommand());
    cli->registerCommand(createFlushCommand());
    cli->registerCommand(createFetchCommand());
    cli->registerCommand(createPlatformCommand());
    cli->registerCommand(createProbeCommand());
    cli->registerCommand(createAgentConfigCommand());
}

} // namespace clawdesk::cli
