#include <clawdesk/app/prerequisite_probe.h>
#include <clawdesk/cli/clawdesk_cli.h>
#include <clawdesk/cli/command.h>
#include <clawdesk/cli/json_views.h>
#include <clawdesk/cli/ui_helpers.hpp>

#include <future>
#include <optional>
#include <ostream>
#include <vector>

namespace clawdesk::cli {

namespace {

class ProbeCommand : public ICommand {
public:
    std::string getName() const override { return "probe"; }

    std::string getDescription() const override {
        return "Check for agent prerequisites (rustc, cargo, bambooclaw, vs_build_tools)";
    }

    void registerCommand(CLI::App& app, ClawdeskCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("probe", getDescription());
        cmd->add_option("names", names_, "Prerequisites to check (default: all)");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto service = cli_->getService();
        if (!service) {
            return service.error();
        }
        const auto names = names_.empty() ? app::PrerequisiteProbe::knownNames() : names_;

        std::vector<std::future<Result<std::string>>> pending;
        pending.reserve(names.size());
        for (const auto& name : names) {
            pending.push_back(service.value()->checkPrerequisite(name));
        }

        nlohmann::json results = nlohmann::json::array();
        std::optional<Error> firstFailure;
        std::size_t failed = 0;
        for (std::size_t i = 0; i < names.size(); ++i) {
            auto r = pending[i].get();
            if (cli_->getJsonOutput()) {
                nlohmann::json entry{{"name", names[i]}, {"ok", r.has_value()}};
                if (r) {
                    entry["detail"] = r.value();
                } else {
                    entry["error"] = toJson(r.error());
                }
                results.push_back(std::move(entry));
            } else if (r) {
                cli_->out() << ui::status_ok(names[i] + ": " + r.value()) << "\n";
            } else {
                cli_->out() << ui::status_error(names[i] + ": " + r.error().message) << "\n";
            }
            if (!r) {
                ++failed;
                if (!firstFailure)
                    firstFailure = r.error();
            }
        }
        if (cli_->getJsonOutput()) {
            cli_->out() << results.dump(2) << "\n";
        }

        if (failed == 1 && names.size() == 1) {
            return *firstFailure;
        }
        if (failed > 0) {
            return Error{firstFailure->code, std::to_string(failed) + " of " +
                                                 std::to_string(names.size()) +
                                                 " prerequisites missing"};
        }
        return Result<void>();
    }

private:
    ClawdeskCLI* cli_ = nullptr;
    std::vector<std::string> names_;
};

} // namespace

std::unique_ptr<ICommand> createProbeCommand() {
    return std::make_unique<ProbeCommand>();
}

} // namespace clawdesk::cli
