#pragma once

#include <clawdesk/core/types.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace clawdesk::platform {

enum class PlatformId : uint8_t { Linux, MacOS, Windows };

/**
 * @brief How a child process is detached from the supervising application.
 *
 * POSIX backends honour newSession/redirectStdioToNull; the Windows backend
 * passes windowsCreationFlags straight to CreateProcessW.
 */
struct SpawnOptions {
    bool newSession{false};         ///< setsid() in the child
    bool redirectStdioToNull{false}; ///< stdin/stdout/stderr -> null device
    std::uint32_t windowsCreationFlags{0};
};

// Win32 creation flags, spelled out so every adapter variant builds on every host.
inline constexpr std::uint32_t kWinCreateNoWindow = 0x08000000;
inline constexpr std::uint32_t kWinCreateNewProcessGroup = 0x00000200;

/**
 * @brief OS-specific facts the supervisor needs, selected once at startup.
 *
 * Implementations are stateless: every method is a pure function of the
 * platform identity (plus the user's home/temp locations).
 */
class PlatformAdapter {
public:
    virtual ~PlatformAdapter() = default;

    [[nodiscard]] virtual PlatformId id() const noexcept = 0;

    /// "linux", "macos" or "windows"
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Daemon executable name including the platform suffix ("bambooclaw.exe" on Windows).
    [[nodiscard]] virtual std::string daemonExecutableName() const = 0;

    /// Options that keep the daemon from inheriting a console, window or terminal.
    [[nodiscard]] virtual SpawnOptions detachedSpawnOptions() const = 0;

    /// Options for short-lived helper commands: hidden, but still attached for output capture.
    [[nodiscard]] virtual SpawnOptions hiddenSpawnOptions() const = 0;

    /// Ordered list of process names that must not survive an emergency flush.
    [[nodiscard]] virtual std::vector<std::string> auxiliaryProcessNames() const = 0;

    /// Scratch directory owned by the agent; the only path an emergency flush wipes.
    [[nodiscard]] virtual std::filesystem::path scratchDirectory() const = 0;

    /// Agent home (~/.bambooclaw) holding the daemon binary and its config.toml.
    [[nodiscard]] virtual std::filesystem::path agentHomeDirectory() const = 0;

    [[nodiscard]] virtual bool caseInsensitiveProcessNames() const noexcept = 0;

    /// Exact process-name comparison using this platform's case rules.
    [[nodiscard]] bool sameProcessName(std::string_view a, std::string_view b) const noexcept;
};

/// Platform name of the build target ("linux", "macos", "windows", or the unsupported OS name).
[[nodiscard]] std::string_view nativePlatformName() noexcept;

[[nodiscard]] Result<PlatformId> parsePlatformId(std::string_view name);

/// Select the adapter for a platform name; unknown names yield UnsupportedPlatform.
Result<std::unique_ptr<PlatformAdapter>> makePlatformAdapter(std::string_view name);

/// Adapter for the OS this binary was built for.
Result<std::unique_ptr<PlatformAdapter>> makeNativePlatformAdapter();

} // namespace clawdesk::platform
