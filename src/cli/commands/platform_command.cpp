#include <clawdesk/cli/clawdesk_cli.h>
#include <clawdesk/cli/command.h>
#include <clawdesk/cli/json_views.h>
#include <clawdesk/cli/ui_helpers.hpp>

#include <ostream>

namespace clawdesk::cli {

namespace {

class PlatformCommand : public ICommand {
public:
    std::string getName() const override { return "platform"; }

    std::string getDescription() const override {
        return "Show the detected platform and the paths clawdesk will use";
    }

    void registerCommand(CLI::App& app, ClawdeskCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("platform", getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto service = cli_->getService();
        if (!service) {
            return service.error();
        }
        const auto info = service.value()->platformInfo();
        const auto& source = cli_->getConfig().source;

        if (cli_->getJsonOutput()) {
            auto j = toJson(info);
            j["config_file"] = source.empty() ? nlohmann::json(nullptr) : source.string();
            cli_->out() << j.dump(2) << "\n";
            return Result<void>();
        }

        auto row = [this](const char* key, const std::string& value) {
            cli_->out() << ui::colorize(key, ui::Ansi::CYAN) << ": " << value << "\n";
        };
        row("Platform      ", info.platform);
        row("Home          ", info.homeDir.string());
        row("Agent home    ", info.agentHome.string());
        row("Daemon binary ", info.daemonBinary.string());
        row("Scratch dir   ", info.scratchDir.string());
        row("Config file   ", source.empty() ? "(defaults)" : source.string());
        return Result<void>();
    }

private:
    ClawdeskCLI* cli_ = nullptr;
};

} // namespace

std::unique_ptr<ICommand> createPlatformCommand() {
    return std::make_unique<PlatformCommand>();
}

} // namespace clawdesk::cli
