#pragma once

#include <clawdesk/platform/platform_adapter.h>
#include <clawdesk/process/process_backend.h>
#include <clawdesk/supervisor/daemon_supervisor.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clawdesk::supervisor {

struct FlushConfig {
    /// Overrides PlatformAdapter::scratchDirectory().
    std::optional<std::filesystem::path> scratchDir;
    /// Appended to the platform's auxiliary kill-list.
    std::vector<std::string> extraKillNames;
    std::chrono::milliseconds killTimeout{3000};
};

struct FlushStep {
    std::string name;
    bool ok{true};
    std::string detail;
};

struct FlushReport {
    std::vector<FlushStep> steps;
    std::vector<process::Pid> terminated;

    [[nodiscard]] bool fullySucceeded() const noexcept;
    [[nodiscard]] std::string summary() const;
};

/**
 * Kill switch: stop the daemon, force-terminate every auxiliary process the
 * agent may have left behind, and reset the scratch directory.
 *
 * Never fails as a whole; every failure lands in the report. Running it twice
 * is harmless. This process (by pid and by image name) is never a target.
 */
class EmergencyFlush {
public:
    EmergencyFlush(DaemonSupervisor& supervisor, const platform::PlatformAdapter& platform,
                   process::IProcessBackend& backend, FlushConfig config = {});

    FlushReport run();

    [[nodiscard]] const std::filesystem::path& scratchDirectory() const noexcept { return scratch_; }

    /// Ordered kill-list: platform auxiliaries first, then configured extras (deduplicated).
    [[nodiscard]] const std::vector<std::string>& killList() const noexcept { return killList_; }

private:
    void killAuxiliaries(FlushReport& report);
    void resetScratch(FlushReport& report);

    DaemonSupervisor& supervisor_;
    const platform::PlatformAdapter& platform_;
    process::IProcessBackend& backend_;
    FlushConfig config_;
    std::filesystem::path scratch_;
    std::vector<std::string> killList_;
};

/// Empty, relative, filesystem-root or home-directory paths are never wiped.
[[nodiscard]] bool isSafeScratchPath(const std::filesystem::path& path,
                                     const std::filesystem::path& home);

} // namespace clawdesk::supervisor
