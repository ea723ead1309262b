#include <clawdesk/config/app_config.h>
#include <clawdesk/config/config_helpers.h>
#include <clawdesk/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <system_error>

namespace clawdesk::config {

namespace fs = std::filesystem;

namespace {

std::string env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return v;
    }
    return {};
}

std::optional<std::uint64_t> parse_unsigned(const std::string& raw) {
    if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoull(raw);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

class Reader {
public:
    explicit Reader(fs::path path) : path_(std::move(path)) {}

    std::string raw(const std::string& section, const std::string& key) const {
        if (path_.empty())
            return {};
        return parse_config_value(path_, section, key);
    }

    std::uint64_t number(const std::string& section, const std::string& key,
                         std::uint64_t fallback) const {
        auto value = raw(section, key);
        if (value.empty())
            return fallback;
        if (auto n = parse_unsigned(value))
            return *n;
        spdlog::warn("[Config] {}.{} = '{}' is not a non-negative integer; using {}", section, key,
                     value, fallback);
        return fallback;
    }

    std::chrono::milliseconds millis(const std::string& section, const std::string& key,
                                     std::chrono::milliseconds fallback) const {
        return std::chrono::milliseconds(
            number(section, key, static_cast<std::uint64_t>(fallback.count())));
    }

    bool flag(const std::string& section, const std::string& key, bool fallback) const {
        auto value = raw(section, key);
        return value.empty() ? fallback : parse_bool(value, fallback);
    }

private:
    fs::path path_;
};

} // namespace

Result<AppConfig> loadAppConfig(const platform::PlatformAdapter& platform,
                                const std::string& overridePath) {
    const bool explicitFile = !overridePath.empty() || !env_value("CLAWDESK_CONFIG").empty();
    const auto path = get_config_path(overridePath);

    std::error_code ec;
    const bool exists = fs::is_regular_file(path, ec);
    if (!exists && explicitFile) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    }

    AppConfig cfg;
    if (exists) {
        cfg.source = path;
        spdlog::debug("[Config] reading {}", path.string());
    }
    const Reader file(exists ? path : fs::path{});

    // daemon
    if (auto home = env_value("CLAWDESK_AGENT_HOME"); !home.empty()) {
        cfg.daemon.agentHome = expand_tilde(home);
    } else if (auto fromFile = file.raw("daemon", "agent_home"); !fromFile.empty()) {
        cfg.daemon.agentHome = expand_tilde(fromFile);
    } else {
        cfg.daemon.agentHome = platform.agentHomeDirectory();
    }

    if (auto bin = env_value("CLAWDESK_DAEMON_BIN"); !bin.empty()) {
        cfg.daemon.binary = expand_tilde(bin);
    } else if (auto fromFile = file.raw("daemon", "binary"); !fromFile.empty()) {
        cfg.daemon.binary = expand_tilde(fromFile);
    } else {
        cfg.daemon.binary = cfg.daemon.agentHome / platform.daemonExecutableName();
    }

    if (auto args = file.raw("daemon", "args"); !args.empty()) {
        cfg.daemon.args = parse_string_list(args);
    }
    cfg.daemon.spawnTimeout = file.millis("daemon", "spawn_timeout_ms", cfg.daemon.spawnTimeout);
    cfg.daemon.stopTimeout = file.millis("daemon", "stop_timeout_ms", cfg.daemon.stopTimeout);

    // flush
    if (auto scratch = env_value("CLAWDESK_SCRATCH_DIR"); !scratch.empty()) {
        cfg.flush.scratchDir = expand_tilde(scratch);
    } else if (auto fromFile = file.raw("flush", "scratch_dir"); !fromFile.empty()) {
        cfg.flush.scratchDir = expand_tilde(fromFile);
    }
    cfg.flush.extraKill = parse_string_list(file.raw("flush", "extra_kill"));

    // download
    const auto chunk = file.number("download", "chunk_size", cfg.download.chunkSize);
    cfg.download.chunkSize = downloader::clampChunkSize(static_cast<std::size_t>(chunk));
    if (cfg.download.chunkSize != chunk) {
        spdlog::warn("[Config] download.chunk_size {} clamped to {}", chunk, cfg.download.chunkSize);
    }
    cfg.download.timeout = file.millis("download", "timeout_ms", cfg.download.timeout);
    cfg.download.connectTimeout =
        file.millis("download", "connect_timeout_ms", cfg.download.connectTimeout);
    cfg.download.stallTimeout =
        file.millis("download", "stall_timeout_ms", cfg.download.stallTimeout);
    cfg.download.followRedirects =
        file.flag("download", "follow_redirects", cfg.download.followRedirects);
    cfg.download.proxy = file.raw("download", "proxy");

    // logging
    if (auto level = env_value("CLAWDESK_LOG_LEVEL"); !level.empty()) {
        cfg.logging.level = level;
    } else if (auto fromFile = file.raw("logging", "level"); !fromFile.empty()) {
        cfg.logging.level = fromFile;
    }
    if (auto logFile = file.raw("logging", "file"); !logFile.empty()) {
        cfg.logging.file = expand_tilde(logFile);
    } else {
        cfg.logging.file = get_data_dir() / "logs" / "clawdesk.log";
    }

    // worker
    cfg.worker.threads = static_cast<std::size_t>(file.number("worker", "threads", 2));
    if (cfg.worker.threads == 0) {
        spdlog::warn("[Config] worker.threads must be at least 1; using 1");
        cfg.worker.threads = 1;
    }

    return cfg;
}

} // namespace clawdesk::config
