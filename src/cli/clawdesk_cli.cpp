#include <clawdesk/cli/clawdesk_cli.h>
#include <clawdesk/cli/command_registry.h>
#include <clawdesk/cli/error_hints.h>
#include <clawdesk/process/process_backend.h>
#include <clawdesk/version.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>
#include <system_error>

namespace clawdesk::cli {

namespace {

constexpr std::size_t kLogFileMaxBytes = 5 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 3;

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none")
        return spdlog::level::off;
    return std::nullopt;
}

int exitCodeFor(ErrorCode code) {
    return code == ErrorCode::OperationCancelled ? 130 : 1;
}

} // namespace

ClawdeskCLI::ClawdeskCLI() : out_(&std::cout), err_(&std::cerr) {
    app_ = std::make_unique<CLI::App>("Desktop companion for the bambooclaw agent", "clawdesk");
    app_->set_version_flag("--version", std::string(version::long_string_v));
    app_->require_subcommand(1);
    app_->fallthrough();

    app_->add_option("--config", configPath_, "Path to clawdesk config.toml");
    app_->add_option("--log-level", logLevel_,
                     "Log level: trace, debug, info, warn, error, critical, off");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");

    CommandRegistry::registerAllCommands(this);
}

ClawdeskCLI::~ClawdeskCLI() = default;

void ClawdeskCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void ClawdeskCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

void ClawdeskCLI::setService(std::unique_ptr<app::CompanionService> service) {
    service_ = std::move(service);
}

int ClawdeskCLI::run(int argc, char* argv[]) {
    pendingCommand_ = nullptr;
    try {
        app_->parse(argc, argv);

        if (auto loaded = loadConfiguration(); !loaded) {
            *err_ << formatErrorWithHint(loaded.error().code, loaded.error().message) << "\n";
            return 1;
        }
        configureLogging();

        if (!pendingCommand_) {
            return 0;
        }
        auto result = pendingCommand_->execute();
        if (!result) {
            spdlog::debug("[CLI] {} failed: {}", pendingCommand_->getName(),
                          result.error().message);
            *err_ << formatErrorWithHint(result.error().code, result.error().message) << "\n";
            return exitCodeFor(result.error().code);
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e, *out_, *err_);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        *err_ << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

Result<void> ClawdeskCLI::loadConfiguration() {
    if (service_) {
        config_ = service_->config();
        return Result<void>();
    }
    auto platform = platform::makeNativePlatformAdapter();
    if (!platform) {
        return platform.error();
    }
    auto cfg = config::loadAppConfig(*platform.value(), configPath_);
    if (!cfg) {
        return cfg.error();
    }
    config_ = std::move(cfg).value();
    platform_ = std::move(platform).value();
    return Result<void>();
}

void ClawdeskCLI::configureLogging() {
    // Precedence: --log-level > CLAWDESK_LOG_LEVEL > [logging] level > info
    const std::string requested = logLevel_.empty() ? config_.logging.level : logLevel_;
    auto level = parseLevel(requested);
    if (!level) {
        *err_ << "[WARN] Unknown log level '" << requested << "', using info\n";
        level = spdlog::level::info;
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string fileProblem;
    if (!config_.logging.file.empty() && *level != spdlog::level::off) {
        std::error_code ec;
        std::filesystem::create_directories(config_.logging.file.parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config_.logging.file.string(), kLogFileMaxBytes, kLogFileCount));
        } catch (const spdlog::spdlog_ex& e) {
            fileProblem = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("clawdesk", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(*level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    if (!fileProblem.empty()) {
        spdlog::warn("[CLI] log file {} unavailable: {}", config_.logging.file.string(),
                     fileProblem);
    }
}

Result<app::CompanionService*> ClawdeskCLI::getService() {
    if (service_) {
        return service_.get();
    }
    if (!platform_) {
        return Error{ErrorCode::InvalidState, "Configuration not loaded"};
    }
    try {
        service_ = std::make_unique<app::CompanionService>(config_, std::move(platform_),
                                                           process::makeNativeProcessBackend());
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError,
                     std::string("Failed to start companion service: ") + e.what()};
    }
    return service_.get();
}

} // namespace clawdesk::cli
