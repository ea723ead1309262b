#include <clawdesk/cli/clawdesk_cli.h>
#include <clawdesk/cli/command.h>
#include <clawdesk/cli/json_views.h>
#include <clawdesk/cli/ui_helpers.hpp>

#include <ostream>

namespace clawdesk::cli {

namespace {

// Start, stop, status and flush all go through the companion's lifecycle strand.
class LifecycleCommand : public ICommand {
public:
    void registerCommand(CLI::App& app, ClawdeskCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto service = cli_->getService();
        if (!service) {
            return service.error();
        }
        return run(*service.value());
    }

protected:
    virtual Result<void> run(app::CompanionService& service) = 0;

    void printJson(const nlohmann::json& j) const { cli_->out() << j.dump(2) << "\n"; }

    ClawdeskCLI* cli_ = nullptr;
};

class StartCommand final : public LifecycleCommand {
public:
    std::string getName() const override { return "start"; }
    std::string getDescription() const override {
        return "Start the bambooclaw daemon (adopts one that is already running)";
    }

protected:
    Result<void> run(app::CompanionService& service) override {
        auto result = service.startDaemon().get();
        if (!result) {
            return result.error();
        }
        if (cli_->getJsonOutput()) {
            printJson(toJson(result.value()));
        } else {
            cli_->out() << ui::status_ok(result.value().message) << "\n";
        }
        return Result<void>();
    }
};

class StopCommand final : public LifecycleCommand {
public:
    std::string getName() const override { return "stop"; }
    std::string getDescription() const override {
        return "Stop the bambooclaw daemon, graceful first, forced after the stop timeout";
    }

protected:
    Result<void> run(app::CompanionService& service) override {
        auto result = service.stopDaemon().get();
        if (!result) {
            return result.error();
        }
        if (cli_->getJsonOutput()) {
            printJson(toJson(result.value()));
        } else {
            cli_->out() << ui::status_ok(result.value().message) << "\n";
        }
        return Result<void>();
    }
};

class StatusCommand final : public LifecycleCommand {
public:
    std::string getName() const override { return "status"; }
    std::string getDescription() const override { return "Report whether the daemon is running"; }

protected:
    Result<void> run(app::CompanionService& service) override {
        auto result = service.daemonStatus().get();
        if (!result) {
            return result.error();
        }
        const auto& status = result.value();
        if (cli_->getJsonOutput()) {
            printJson(toJson(status));
            return Result<void>();
        }
        auto& out = cli_->out();
        out << "Daemon: " << supervisor::toString(status.state);
        if (status.handle) {
            out << " (pid " << status.handle->pid << ", "
                << (status.handle->owned ? "started by clawdesk" : "external") << ")";
        }
        out << "\n";
        return Result<void>();
    }
};

class FlushCommand final : public LifecycleCommand {
public:
    std::string getName() const override { return "flush"; }
    std::string getDescription() const override {
        return "Emergency flush: stop the daemon, kill auxiliary processes, reset scratch";
    }

protected:
    Result<void> run(app::CompanionService& service) override {
        auto report = service.emergencyFlush().get();
        if (cli_->getJsonOutput()) {
            printJson(toJson(report));
        } else {
            auto& out = cli_->out();
            for (const auto& step : report.steps) {
                const std::string line =
                    step.detail.empty() ? step.name : step.name + ": " + step.detail;
                out << (step.ok ? ui::status_ok(line) : ui::status_error(line)) << "\n";
            }
            out << report.summary() << "\n";
        }
        if (!report.fullySucceeded()) {
            return Error{ErrorCode::InternalError, report.summary()};
        }
        return Result<void>();
    }
};

} // namespace

std::unique_ptr<ICommand> createStartCommand() {
    return std::make_unique<StartCommand>();
}

std::unique_ptr<ICommand> createStopCommand() {
    return std::make_unique<StopCommand>();
}

std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

std::unique_ptr<ICommand> createFlushCommand() {
    return std::make_unique<FlushCommand>();
}

} // namespace clawdesk::cli
