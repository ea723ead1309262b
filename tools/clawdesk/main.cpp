#include <spdlog/spdlog.h>
#include <clawdesk/cli/clawdesk_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default until ClawdeskCLI::run() applies the configured level
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        clawdesk::cli::ClawdeskCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
