#pragma once

#include <clawdesk/app/agent_config_store.h>
#include <clawdesk/app/prerequisite_probe.h>
#include <clawdesk/app/work_coordinator.h>
#include <clawdesk/config/app_config.h>
#include <clawdesk/downloader/downloader.hpp>
#include <clawdesk/platform/platform_adapter.h>
#include <clawdesk/process/process_backend.h>
#include <clawdesk/supervisor/daemon_supervisor.h>
#include <clawdesk/supervisor/emergency_flush.h>

#include <exception>
#include <future>
#include <memory>
#include <string>
#include <type_traits>

namespace clawdesk::app {

struct PlatformInfo {
    std::string platform;
    std::filesystem::path homeDir;
    std::filesystem::path agentHome;
    std::filesystem::path daemonBinary;
    std::filesystem::path scratchDir;
};

/**
 * @brief Command surface of the desktop companion.
 *
 * Owns every component and runs each command on the worker pool. Lifecycle
 * commands (start/stop/status/flush) share one strand and complete in
 * submission order; downloads and probes run beside them.
 */
class CompanionService {
public:
    CompanionService(config::AppConfig cfg, std::unique_ptr<platform::PlatformAdapter> platform,
                     std::unique_ptr<process::IProcessBackend> backend,
                     std::unique_ptr<downloader::IHttpAdapter> http = nullptr);
    ~CompanionService();

    CompanionService(const CompanionService&) = delete;
    CompanionService& operator=(const CompanionService&) = delete;

    std::future<Result<supervisor::StartResult>> startDaemon();
    std::future<Result<supervisor::StopResult>> stopDaemon();
    std::future<Result<supervisor::DaemonStatus>> daemonStatus();
    std::future<supervisor::FlushReport> emergencyFlush();

    std::future<Result<downloader::DownloadResult>>
    fetch(downloader::DownloadRequest request, downloader::ProgressCallback onProgress = {},
          downloader::ShouldCancel shouldCancel = {});

    std::future<Result<std::string>> checkPrerequisite(std::string name);

    [[nodiscard]] supervisor::DaemonState lastKnownState() const noexcept {
        return supervisor_->lastKnownState();
    }

    [[nodiscard]] PlatformInfo platformInfo() const;

    [[nodiscard]] const config::AppConfig& config() const noexcept { return config_; }
    [[nodiscard]] const platform::PlatformAdapter& platform() const noexcept { return *platform_; }
    [[nodiscard]] const AgentConfigStore& agentConfig() const noexcept { return agentConfig_; }
    [[nodiscard]] supervisor::DaemonSupervisor& supervisor() noexcept { return *supervisor_; }

private:
    template <typename Executor, typename Fn>
    static auto submit(const Executor& ex, Fn fn) -> std::future<std::invoke_result_t<Fn&>> {
        using R = std::invoke_result_t<Fn&>;
        auto promise = std::make_shared<std::promise<R>>();
        auto future = promise->get_future();
        boost::asio::post(ex, [promise, fn = std::move(fn)]() mutable {
            try {
                promise->set_value(fn());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
        return future;
    }

    config::AppConfig config_;
    std::unique_ptr<platform::PlatformAdapter> platform_;
    std::unique_ptr<process::IProcessBackend> backend_;
    std::unique_ptr<supervisor::DaemonSupervisor> supervisor_;
    std::unique_ptr<supervisor::EmergencyFlush> flush_;
    std::unique_ptr<downloader::IDownloadManager> downloads_;
    PrerequisiteProbe probe_;
    AgentConfigStore agentConfig_;

    WorkCoordinator coordinator_;
    boost::asio::strand<boost::asio::io_context::executor_type> lifecycleStrand_;
};

} // namespace clawdesk::app
