#pragma once

#include <clawdesk/core/types.h>
#include <clawdesk/platform/platform_adapter.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clawdesk::config {

/**
 * Application settings, resolved as environment > config.toml > defaults.
 *
 *   [daemon]   binary, args, agent_home, spawn_timeout_ms, stop_timeout_ms
 *   [flush]    scratch_dir, extra_kill
 *   [download] chunk_size, timeout_ms, connect_timeout_ms, stall_timeout_ms,
 *              follow_redirects, proxy
 *   [logging]  level, file
 *   [worker]   threads
 */
struct AppConfig {
    struct Daemon {
        std::filesystem::path binary;
        std::vector<std::string> args{"daemon"};
        std::filesystem::path agentHome;
        std::chrono::milliseconds spawnTimeout{2000};
        std::chrono::milliseconds stopTimeout{5000};
    } daemon;

    struct Flush {
        std::optional<std::filesystem::path> scratchDir;
        std::vector<std::string> extraKill;
    } flush;

    struct Download {
        std::size_t chunkSize{64 * 1024};
        std::chrono::milliseconds timeout{0};
        std::chrono::milliseconds connectTimeout{30000};
        std::chrono::milliseconds stallTimeout{60000};
        bool followRedirects{true};
        std::string proxy;
    } download;

    struct Logging {
        std::string level{"info"};
        std::filesystem::path file;
    } logging;

    struct Worker {
        std::size_t threads{2};
    } worker;

    /// File the values were read from; empty when only defaults/env applied.
    std::filesystem::path source;
};

/**
 * Load settings for this platform.
 *
 * A missing default config file is not an error. An explicitly requested file
 * (`overridePath` or CLAWDESK_CONFIG) that does not exist is FileNotFound.
 * Malformed values fall back to their defaults with a warning.
 */
Result<AppConfig> loadAppConfig(const platform::PlatformAdapter& platform,
                                const std::string& overridePath = "");

} // namespace clawdesk::config
