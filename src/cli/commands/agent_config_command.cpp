#include <clawdesk/app/agent_config_store.h>
#include <clawdesk/cli/clawdesk_cli.h>
#include <clawdesk/cli/command.h>
#include <clawdesk/cli/ui_helpers.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace clawdesk::cli {

namespace {

class AgentConfigCommand : public ICommand {
public:
    std::string getName() const override { return "agent-config"; }

    std::string getDescription() const override {
        return "Read or edit the agent's config.toml under the agent home";
    }

    void registerCommand(CLI::App& app, ClawdeskCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("agent-config", getDescription());
        cmd->require_subcommand(1);

        auto* show = cmd->add_subcommand("show", "Print the agent config file");
        show->callback([this]() {
            action_ = Action::Show;
            cli_->setPendingCommand(this);
        });

        auto* write = cmd->add_subcommand("write", "Replace the agent config with a file ('-' = stdin)");
        write->add_option("file", sourceFile_, "File holding the new contents")->required();
        write->callback([this]() {
            action_ = Action::Write;
            cli_->setPendingCommand(this);
        });

        auto* set = cmd->add_subcommand("set", "Set one key=\"value\" line");
        set->add_option("key", key_, "Config key")->required();
        set->add_option("value", value_, "Value (single line, no quotes)")->required();
        set->callback([this]() {
            action_ = Action::Set;
            cli_->setPendingCommand(this);
        });
    }

    Result<void> execute() override {
        app::AgentConfigStore store(cli_->getConfig().daemon.agentHome);
        switch (action_) {
            case Action::Show: {
                auto content = store.read();
                if (!content) {
                    return content.error();
                }
                cli_->out() << content.value();
                if (!content.value().empty() && content.value().back() != '\n') {
                    cli_->out() << "\n";
                }
                return Result<void>();
            }
            case Action::Write: {
                auto content = readSource();
                if (!content) {
                    return content.error();
                }
                if (auto r = store.write(content.value()); !r) {
                    return r;
                }
                cli_->out() << ui::status_ok("Wrote " + store.path().string()) << "\n";
                return Result<void>();
            }
            case Action::Set: {
                if (auto r = store.set(key_, value_); !r) {
                    return r;
                }
                cli_->out() << ui::status_ok("Set " + key_ + " in " + store.path().string())
                            << "\n";
                return Result<void>();
            }
        }
        return Error{ErrorCode::InvalidArgument, "agent-config requires show, write or set"};
    }

private:
    enum class Action { Show, Write, Set };

    Result<std::string> readSource() const {
        if (sourceFile_ == "-") {
            return std::string(std::istreambuf_iterator<char>(std::cin),
                               std::istreambuf_iterator<char>());
        }
        std::ifstream in(sourceFile_, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::FileNotFound, "Cannot open " + sourceFile_};
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    ClawdeskCLI* cli_ = nullptr;
    Action action_ = Action::Show;
    std::string sourceFile_;
    std::string key_;
    std::string value_;
};

} // namespace

std::unique_ptr<ICommand> createAgentConfigCommand() {
    return std::make_unique<AgentConfigCommand>();
}

} // namespace clawdesk::cli
