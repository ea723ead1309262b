#include <clawdesk/supervisor/daemon_supervisor.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace clawdesk::supervisor {

const char* toString(DaemonState state) noexcept {
    switch (state) {
        case DaemonState::Stopped:
            return "stopped";
        case DaemonState::Starting:
            return "starting";
        case DaemonState::Running:
            return "running";
        case DaemonState::Stopping:
            return "stopping";
        case DaemonState::Unknown:
            return "unknown";
    }
    return "unknown";
}

DaemonSupervisor::DaemonSupervisor(const platform::PlatformAdapter& platform,
                                   process::IProcessBackend& backend, SupervisorConfig config)
    : platform_(platform), backend_(backend), config_(std::move(config)),
      table_(backend, platform) {
    if (config_.daemonPath.empty()) {
        config_.daemonPath = platform_.agentHomeDirectory() / platform_.daemonExecutableName();
    }
    processName_ = config_.daemonPath.filename().string();
    spdlog::debug("[Supervisor] daemon binary {} (scan name '{}')", config_.daemonPath.string(),
                  processName_);
}

DaemonSupervisor::HandleLock DaemonSupervisor::lockHandle() {
    return HandleLock(handleMutex_);
}

// Drops an owned handle whose process has gone away.
bool DaemonSupervisor::ownedHandleAlive() {
    if (!handle_) {
        return false;
    }
    if (backend_.isAlive(handle_->pid)) {
        return true;
    }
    if (handle_->owned) {
        spdlog::warn("[Supervisor] daemon pid {} exited unexpectedly", handle_->pid);
    } else {
        spdlog::info("[Supervisor] adopted daemon pid {} is gone", handle_->pid);
    }
    handle_.reset();
    setState(DaemonState::Stopped);
    return false;
}

Result<std::vector<process::ProcessRecord>> DaemonSupervisor::scanForDaemon() {
    if (auto r = table_.refresh(); !r) {
        return Error{r.error().code, "Cannot scan for " + processName_ + ": " + r.error().message};
    }
    auto matches = table_.findByName(processName_);
    const auto self = backend_.selfPid();
    matches.erase(std::remove_if(matches.begin(), matches.end(),
                                 [self](const process::ProcessRecord& r) { return r.pid == self; }),
                  matches.end());
    return matches;
}

Result<StartResult> DaemonSupervisor::start() {
    auto lock = lockHandle();

    if (ownedHandleAlive()) {
        setState(DaemonState::Running);
        return StartResult{StartOutcome::AlreadyRunning, *handle_,
                           "Daemon already running (pid " + std::to_string(handle_->pid) + ")"};
    }

    auto scanned = scanForDaemon();
    if (!scanned) {
        // Without a table we cannot rule out a running copy; spawning is still what was asked.
        spdlog::warn("[Supervisor] {}", scanned.error().message);
    } else if (!scanned.value().empty()) {
        setState(DaemonState::Unknown);
        const auto& found = scanned.value().front();
        handle_ = DaemonHandle{found.pid, false};
        setState(DaemonState::Running);
        spdlog::info("[Supervisor] adopted running daemon pid {}", found.pid);
        return StartResult{StartOutcome::AlreadyRunning, *handle_,
                           "Daemon already running (pid " + std::to_string(found.pid) + ")"};
    }

    setState(DaemonState::Starting);
    process::SpawnRequest req;
    req.executable = config_.daemonPath;
    req.args = config_.daemonArgs;
    req.options = platform_.detachedSpawnOptions();
    req.workdir = config_.workdir;
    req.confirmTimeout = config_.spawnTimeout;

    auto spawned = backend_.spawn(req);
    if (!spawned) {
        setState(DaemonState::Stopped);
        spdlog::error("[Supervisor] start failed: {}", spawned.error().message);
        return Error{ErrorCode::ProcessSpawnError, spawned.error().message};
    }

    handle_ = DaemonHandle{spawned.value(), true};
    spawnCount_.fetch_add(1, std::memory_order_relaxed);
    setState(DaemonState::Running);
    spdlog::info("[Supervisor] daemon started (pid {})", handle_->pid);
    return StartResult{StartOutcome::Started, *handle_,
                       "Daemon started (pid " + std::to_string(handle_->pid) + ")"};
}

Result<StopResult> DaemonSupervisor::stop() {
    auto lock = lockHandle();
    return stopLocked();
}

Result<StopResult> DaemonSupervisor::stop(const HandleLock& held) {
    if (!held.owns_lock() || held.mutex() != &handleMutex_) {
        return Error{ErrorCode::InvalidState, "stop(lock) called without this supervisor's lock"};
    }
    return stopLocked();
}

Result<StopResult> DaemonSupervisor::stopLocked() {
    if (ownedHandleAlive() && handle_->owned) {
        const auto pid = handle_->pid;
        setState(DaemonState::Stopping);
        auto r = backend_.terminate(pid, config_.stopTimeout);
        if (!r) {
            const bool alive = backend_.isAlive(pid);
            if (!alive) {
                handle_.reset();
            }
            setState(alive ? DaemonState::Running : DaemonState::Stopped);
            spdlog::error("[Supervisor] failed to stop daemon pid {}: {}", pid, r.error().message);
            return Error{r.error().code,
                         "Failed to stop daemon pid " + std::to_string(pid) + ": " +
                             r.error().message};
        }
        handle_.reset();
        setState(DaemonState::Stopped);
        spdlog::info("[Supervisor] daemon pid {} stopped", pid);
        return StopResult{StopOutcome::Stopped, {pid}, "Daemon stopped"};
    }

    // Adopted or no handle: fall back to a name scan.
    handle_.reset();
    auto scanned = scanForDaemon();
    if (!scanned) {
        return scanned.error();
    }
    const auto& matches = scanned.value();
    if (matches.empty()) {
        setState(DaemonState::Stopped);
        spdlog::debug("[Supervisor] stop: no {} process found", processName_);
        return StopResult{StopOutcome::NotRunning, {}, "Daemon is not running"};
    }

    setState(DaemonState::Stopping);
    StopResult result;
    std::vector<std::string> failures;
    bool denied = false;
    ErrorCode firstFailure = ErrorCode::Success;
    for (const auto& rec : matches) {
        auto r = backend_.terminate(rec.pid, config_.stopTimeout);
        if (r) {
            result.terminated.push_back(rec.pid);
            continue;
        }
        spdlog::warn("[Supervisor] could not terminate {} pid {}: {}", rec.name, rec.pid,
                     r.error().message);
        denied = denied || r.error().code == ErrorCode::PermissionDenied;
        if (firstFailure == ErrorCode::Success) {
            firstFailure = r.error().code;
        }
        failures.push_back("pid " + std::to_string(rec.pid) + ": " + r.error().message);
    }

    if (!failures.empty()) {
        setState(DaemonState::Running);
        std::string msg = "Failed to stop " + std::to_string(failures.size()) + " of " +
                          std::to_string(matches.size()) + " daemon processes";
        for (const auto& f : failures) {
            msg += "; " + f;
        }
        return Error{denied ? ErrorCode::PermissionDenied : firstFailure, msg};
    }

    setState(DaemonState::Stopped);
    result.outcome = StopOutcome::Stopped;
    result.message = "Stopped " + std::to_string(result.terminated.size()) + " daemon process" +
                     (result.terminated.size() == 1 ? "" : "es");
    spdlog::info("[Supervisor] {}", result.message);
    return result;
}

Result<DaemonStatus> DaemonSupervisor::status() {
    auto lock = lockHandle();

    if (ownedHandleAlive()) {
        setState(DaemonState::Running);
        return DaemonStatus{DaemonState::Running, handle_};
    }

    auto scanned = scanForDaemon();
    if (!scanned) {
        return scanned.error();
    }
    if (scanned.value().empty()) {
        setState(DaemonState::Stopped);
        return DaemonStatus{DaemonState::Stopped, std::nullopt};
    }
    setState(DaemonState::Running);
    return DaemonStatus{DaemonState::Running, DaemonHandle{scanned.value().front().pid, false}};
}

} // namespace clawdesk::supervisor
