#pragma once

#include <clawdesk/core/types.h>
#include <clawdesk/platform/platform_adapter.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clawdesk::process {

struct CommandSpec {
    std::string program; ///< bare name (PATH lookup) or path
    std::vector<std::string> args;
    platform::SpawnOptions options{}; ///< only the window/session bits apply; stdio is captured
    std::chrono::milliseconds timeout{std::chrono::seconds(15)};
};

struct CommandOutput {
    int exitCode{0};
    std::string stdoutText;
    std::string stderrText;
};

/**
 * Run a short-lived helper to completion and capture its output.
 *
 * stdin is the null device. A program that cannot be found or started is
 * ProcessSpawnError, a non-zero exit is InternalError whose message carries the
 * trimmed stderr, and a run exceeding `timeout` is killed and reported as Timeout.
 */
Result<CommandOutput> runCommand(const CommandSpec& spec);

/// Resolve a bare executable name against PATH (and PATHEXT on Windows).
std::optional<std::filesystem::path> findOnPath(std::string_view name);

} // namespace clawdesk::process
