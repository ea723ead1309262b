#include <clawdesk/app/companion_service.h>
#include <clawdesk/config/config_helpers.h>

#include <spdlog/spdlog.h>

namespace clawdesk::app {

namespace {

supervisor::SupervisorConfig supervisorConfigFrom(const config::AppConfig& cfg) {
    supervisor::SupervisorConfig sc;
    sc.daemonPath = cfg.daemon.binary;
    sc.daemonArgs = cfg.daemon.args;
    sc.spawnTimeout = cfg.daemon.spawnTimeout;
    sc.stopTimeout = cfg.daemon.stopTimeout;
    if (!cfg.daemon.agentHome.empty()) {
        sc.workdir = cfg.daemon.agentHome;
    }
    return sc;
}

supervisor::FlushConfig flushConfigFrom(const config::AppConfig& cfg) {
    supervisor::FlushConfig fc;
    fc.scratchDir = cfg.flush.scratchDir;
    fc.extraKillNames = cfg.flush.extraKill;
    fc.killTimeout = cfg.daemon.stopTimeout;
    return fc;
}

downloader::DownloaderConfig downloaderConfigFrom(const config::AppConfig& cfg) {
    downloader::DownloaderConfig dc;
    dc.chunkSizeBytes = cfg.download.chunkSize;
    dc.timeout = cfg.download.timeout;
    dc.connectTimeout = cfg.download.connectTimeout;
    dc.stallTimeout = cfg.download.stallTimeout;
    dc.proxy = cfg.download.proxy;
    dc.followRedirects = cfg.download.followRedirects;
    return dc;
}

} // namespace

CompanionService::CompanionService(config::AppConfig cfg,
                                   std::unique_ptr<platform::PlatformAdapter> platform,
                                   std::unique_ptr<process::IProcessBackend> backend,
                                   std::unique_ptr<downloader::IHttpAdapter> http)
    : config_(std::move(cfg)), platform_(std::move(platform)), backend_(std::move(backend)),
      probe_(*platform_), agentConfig_(config_.daemon.agentHome),
      lifecycleStrand_(coordinator_.makeStrand()) {
    supervisor_ = std::make_unique<supervisor::DaemonSupervisor>(*platform_, *backend_,
                                                                 supervisorConfigFrom(config_));
    flush_ = std::make_unique<supervisor::EmergencyFlush>(*supervisor_, *platform_, *backend_,
                                                          flushConfigFrom(config_));
    downloads_ = downloader::makeDownloadManager(downloaderConfigFrom(config_), std::move(http));
    coordinator_.start(config_.worker.threads);
    spdlog::debug("[Companion] ready on {} (daemon {})", platform_->name(),
                  supervisor_->config().daemonPath.string());
}

CompanionService::~CompanionService() {
    coordinator_.stop();
    coordinator_.join();
}

std::future<Result<supervisor::StartResult>> CompanionService::startDaemon() {
    return submit(lifecycleStrand_, [this] { return supervisor_->start(); });
}

std::future<Result<supervisor::StopResult>> CompanionService::stopDaemon() {
    return submit(lifecycleStrand_, [this] { return supervisor_->stop(); });
}

std::future<Result<supervisor::DaemonStatus>> CompanionService::daemonStatus() {
    return submit(lifecycleStrand_, [this] { return supervisor_->status(); });
}

std::future<supervisor::FlushReport> CompanionService::emergencyFlush() {
    return submit(lifecycleStrand_, [this] { return flush_->run(); });
}

std::future<Result<downloader::DownloadResult>>
CompanionService::fetch(downloader::DownloadRequest request, downloader::ProgressCallback onProgress,
                        downloader::ShouldCancel shouldCancel) {
    return submit(coordinator_.getExecutor(),
                  [this, request = std::move(request), onProgress = std::move(onProgress),
                   shouldCancel = std::move(shouldCancel)] {
                      return downloads_->fetch(request, onProgress, shouldCancel);
                  });
}

std::future<Result<std::string>> CompanionService::checkPrerequisite(std::string name) {
    return submit(coordinator_.getExecutor(),
                  [this, name = std::move(name)] { return probe_.check(name); });
}

PlatformInfo CompanionService::platformInfo() const {
    PlatformInfo info;
    info.platform = std::string(platform_->name());
    info.homeDir = config::get_home_dir();
    info.agentHome = config_.daemon.agentHome;
    info.daemonBinary = supervisor_->config().daemonPath;
    info.scratchDir = flush_->scratchDirectory();
    return info;
}

} // namespace clawdesk::app
