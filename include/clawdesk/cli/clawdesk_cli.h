#pragma once

#include <clawdesk/app/companion_service.h>
#include <clawdesk/cli/command.h>
#include <clawdesk/config/app_config.h>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>

namespace clawdesk::cli {

/**
 * Main CLI application class
 */
class ClawdeskCLI {
public:
    ClawdeskCLI();
    ~ClawdeskCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Companion service, created on first use from the loaded configuration
     */
    Result<app::CompanionService*> getService();

    /**
     * Inject a prebuilt service instead of the native one
     */
    void setService(std::unique_ptr<app::CompanionService> service);

    /**
     * Configuration resolved after parsing (--config, env, file)
     */
    const config::AppConfig& getConfig() const { return config_; }

    bool getJsonOutput() const { return jsonOutput_; }

    /**
     * Streams for command output; stdout/stderr unless redirected
     */
    std::ostream& out() const { return *out_; }
    std::ostream& err() const { return *err_; }
    void setOutputStreams(std::ostream& out, std::ostream& err) {
        out_ = &out;
        err_ = &err;
    }

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing and configuration load.
     */
    void setPendingCommand(ICommand* cmd);

private:
    Result<void> loadConfiguration();
    void configureLogging();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    std::unique_ptr<app::CompanionService> service_;
    config::AppConfig config_;
    std::unique_ptr<platform::PlatformAdapter> platform_;

    std::string configPath_;
    std::string logLevel_;
    bool jsonOutput_ = false;

    std::ostream* out_;
    std::ostream* err_;
};

} // namespace clawdesk::cli
