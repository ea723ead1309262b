#include <clawdesk/config/config_helpers.h>
#include <clawdesk/platform/platform_adapter.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <system_error>

namespace clawdesk::platform {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kDaemonBaseName = "bambooclaw";
constexpr std::string_view kScratchDirName = "bambooclaw";
constexpr std::string_view kAgentHomeDirName = ".bambooclaw";

fs::path tempRoot(const char* fallback) {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec || tmp.empty()) {
        return fs::path(fallback);
    }
    return tmp;
}

fs::path homeRelative(std::string_view leaf) {
    auto home = config::get_home_dir();
    if (home.empty()) {
        // No home at all; keep the agent next to the working directory rather than at "/".
        return fs::current_path() / std::string(leaf);
    }
    return home / std::string(leaf);
}

class PosixPlatformAdapter : public PlatformAdapter {
public:
    std::string daemonExecutableName() const override { return std::string(kDaemonBaseName); }

    SpawnOptions detachedSpawnOptions() const override {
        SpawnOptions opts;
        opts.newSession = true;
        opts.redirectStdioToNull = true;
        return opts;
    }

    SpawnOptions hiddenSpawnOptions() const override { return SpawnOptions{}; }

    std::vector<std::string> auxiliaryProcessNames() const override {
        return {std::string(kDaemonBaseName), "python", "python3"};
    }

    fs::path scratchDirectory() const override {
        return tempRoot("/tmp") / std::string(kScratchDirName);
    }

    fs::path agentHomeDirectory() const override { return homeRelative(kAgentHomeDirName); }

    bool caseInsensitiveProcessNames() const noexcept override { return false; }
};

class LinuxPlatformAdapter final : public PosixPlatformAdapter {
public:
    PlatformId id() const noexcept override { return PlatformId::Linux; }
    std::string_view name() const noexcept override { return "linux"; }
};

class MacPlatformAdapter final : public PosixPlatformAdapter {
public:
    PlatformId id() const noexcept override { return PlatformId::MacOS; }
    std::string_view name() const noexcept override { return "macos"; }
};

class WindowsPlatformAdapter final : public PlatformAdapter {
public:
    PlatformId id() const noexcept override { return PlatformId::Windows; }
    std::string_view name() const noexcept override { return "windows"; }

    std::string daemonExecutableName() const override {
        return std::string(kDaemonBaseName) + ".exe";
    }

    SpawnOptions detachedSpawnOptions() const override {
        SpawnOptions opts;
        opts.windowsCreationFlags = kWinCreateNoWindow | kWinCreateNewProcessGroup;
        return opts;
    }

    SpawnOptions hiddenSpawnOptions() const override {
        SpawnOptions opts;
        opts.windowsCreationFlags = kWinCreateNoWindow;
        return opts;
    }

    std::vector<std::string> auxiliaryProcessNames() const override {
        return {daemonExecutableName(), "python.exe", "pythonw.exe", "cmd.exe", "powershell.exe"};
    }

    fs::path scratchDirectory() const override {
        return tempRoot("C:\\tmp") / std::string(kScratchDirName);
    }

    fs::path agentHomeDirectory() const override { return homeRelative(kAgentHomeDirName); }

    bool caseInsensitiveProcessNames() const noexcept override { return true; }
};

} // namespace

bool PlatformAdapter::sameProcessName(std::string_view a, std::string_view b) const noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (!caseInsensitiveProcessNames()) {
        return a == b;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view nativePlatformName() noexcept {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#elif defined(__linux__)
    return "linux";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

Result<PlatformId> parsePlatformId(std::string_view name) {
    if (name == "linux")
        return PlatformId::Linux;
    if (name == "macos" || name == "darwin")
        return PlatformId::MacOS;
    if (name == "windows")
        return PlatformId::Windows;
    return Error{ErrorCode::UnsupportedPlatform,
                 "No platform adapter for '" + std::string(name) + "'"};
}

Result<std::unique_ptr<PlatformAdapter>> makePlatformAdapter(std::string_view name) {
    auto id = parsePlatformId(name);
    if (!id) {
        spdlog::error("[Platform] {}", id.error().message);
        return id.error();
    }

    std::unique_ptr<PlatformAdapter> adapter;
    switch (id.value()) {
        case PlatformId::Linux:
            adapter = std::make_unique<LinuxPlatformAdapter>();
            break;
        case PlatformId::MacOS:
            adapter = std::make_unique<MacPlatformAdapter>();
            break;
        case PlatformId::Windows:
            adapter = std::make_unique<WindowsPlatformAdapter>();
            break;
    }
    spdlog::debug("[Platform] Selected {} adapter (daemon='{}')", adapter->name(),
                  adapter->daemonExecutableName());
    return adapter;
}

Result<std::unique_ptr<PlatformAdapter>> makeNativePlatformAdapter() {
    return makePlatformAdapter(nativePlatformName());
}

} // namespace clawdesk::platform
