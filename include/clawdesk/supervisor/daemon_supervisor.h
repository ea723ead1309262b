#pragma once

#include <clawdesk/core/types.h>
#include <clawdesk/platform/platform_adapter.h>
#include <clawdesk/process/process_backend.h>
#include <clawdesk/process/process_table.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clawdesk::supervisor {

enum class DaemonState : std::uint8_t {
    Stopped,
    Starting,
    Running,
    Stopping,
    Unknown ///< no local handle but a matching process was seen; resolves to Running
};

[[nodiscard]] const char* toString(DaemonState state) noexcept;

struct SupervisorConfig {
    /// Daemon binary. Empty means <agent home>/<platform daemon name>.
    std::filesystem::path daemonPath;
    std::vector<std::string> daemonArgs{"daemon"};
    std::optional<std::filesystem::path> workdir;
    std::chrono::milliseconds spawnTimeout{2000};
    std::chrono::milliseconds stopTimeout{5000};
};

/// Reference to the daemon process. `owned` is true only when this supervisor spawned it.
struct DaemonHandle {
    process::Pid pid{0};
    bool owned{false};
};

enum class StartOutcome { Started, AlreadyRunning };

struct StartResult {
    StartOutcome outcome{StartOutcome::Started};
    DaemonHandle handle;
    std::string message;
};

enum class StopOutcome { Stopped, NotRunning };

struct StopResult {
    StopOutcome outcome{StopOutcome::NotRunning};
    std::vector<process::Pid> terminated;
    std::string message;
};

struct DaemonStatus {
    DaemonState state{DaemonState::Stopped};
    std::optional<DaemonHandle> handle;
};

/**
 * @brief Owns the daemon lifecycle: start, stop, status.
 *
 * One mutex guards the handle and is held for the whole of each operation, so
 * concurrent start/stop calls are strictly serialized. EmergencyFlush takes
 * the same lock through lockHandle() and calls stop(const HandleLock&).
 *
 * Expected conditions ("already running", "not running") are successful
 * results; only spawn failures, refused terminations and unreadable process
 * tables are errors.
 */
class DaemonSupervisor {
public:
    using HandleLock = std::unique_lock<std::mutex>;

    DaemonSupervisor(const platform::PlatformAdapter& platform, process::IProcessBackend& backend,
                     SupervisorConfig config);

    DaemonSupervisor(const DaemonSupervisor&) = delete;
    DaemonSupervisor& operator=(const DaemonSupervisor&) = delete;

    Result<StartResult> start();
    Result<StopResult> stop();
    Result<DaemonStatus> status();

    /// Acquire the handle lock for a compound operation.
    [[nodiscard]] HandleLock lockHandle();

    /// stop() for callers already holding lockHandle().
    Result<StopResult> stop(const HandleLock& held);

    /// Most recent state, readable without waiting on a running command.
    [[nodiscard]] DaemonState lastKnownState() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    /// Executable name used for process-table scans.
    [[nodiscard]] const std::string& daemonProcessName() const noexcept { return processName_; }

    [[nodiscard]] const SupervisorConfig& config() const noexcept { return config_; }

    /// Number of successful spawns over this supervisor's lifetime.
    [[nodiscard]] std::size_t spawnCount() const noexcept {
        return spawnCount_.load(std::memory_order_relaxed);
    }

private:
    bool ownedHandleAlive();
    Result<std::vector<process::ProcessRecord>> scanForDaemon();
    Result<StopResult> stopLocked();
    void setState(DaemonState s) noexcept { state_.store(s, std::memory_order_release); }

    const platform::PlatformAdapter& platform_;
    process::IProcessBackend& backend_;
    SupervisorConfig config_;
    std::string processName_;

    std::mutex handleMutex_;
    std::optional<DaemonHandle> handle_;
    process::ProcessTable table_;

    std::atomic<DaemonState> state_{DaemonState::Stopped};
    std::atomic<std::size_t> spawnCount_{0};
};

} // namespace clawdesk::supervisor
