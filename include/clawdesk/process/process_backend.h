#pragma once

#include <clawdesk/core/types.h>
#include <clawdesk/platform/platform_adapter.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clawdesk::process {

using Pid = std::int64_t;

/**
 * @brief One row of a process-table snapshot.
 *
 * `name` is the exact executable name used for matching (no directory, with
 * the platform's suffix such as ".exe"). `args` holds argv when the OS lets
 * us read it, and is empty otherwise.
 */
struct ProcessRecord {
    Pid pid{0};
    std::string name;
    std::vector<std::string> args;
};

struct SpawnRequest {
    std::filesystem::path executable;
    std::vector<std::string> args; ///< arguments after argv[0]
    platform::SpawnOptions options{};
    std::optional<std::filesystem::path> workdir;
    /// How long to wait for the OS to confirm the image was loaded.
    std::chrono::milliseconds confirmTimeout{2000};
};

/**
 * @brief The only seam through which clawdesk touches OS processes.
 *
 * The native implementation covers Linux (/proc), macOS (libproc) and
 * Windows (Toolhelp32). Tests substitute a scripted fake.
 *
 * Termination contract shared by terminate() and forceKill():
 * - a pid that no longer exists is success;
 * - an OS refusal is ErrorCode::PermissionDenied;
 * - a process still alive after the timeout is ErrorCode::Timeout.
 */
class IProcessBackend {
public:
    virtual ~IProcessBackend() = default;

    /// Start a process. Missing/non-executable images fail with ProcessSpawnError.
    virtual Result<Pid> spawn(const SpawnRequest& request) = 0;

    /// True while the process exists. Reaps the pid if it is an exited child of ours.
    virtual bool isAlive(Pid pid) = 0;

    /// Ask politely (SIGTERM), then force after `timeout`; waits up to `timeout` again.
    virtual Result<void> terminate(Pid pid, std::chrono::milliseconds timeout) = 0;

    /// Immediate forced termination (SIGKILL / TerminateProcess), waiting up to `timeout`.
    virtual Result<void> forceKill(Pid pid, std::chrono::milliseconds timeout) = 0;

    virtual Result<std::vector<ProcessRecord>> listProcesses() = 0;

    [[nodiscard]] virtual Pid selfPid() const noexcept = 0;

    /// Executable name of the running application, comparable with ProcessRecord::name.
    [[nodiscard]] virtual std::string selfImageName() const = 0;
};

std::unique_ptr<IProcessBackend> makeNativeProcessBackend();

} // namespace clawdesk::process
