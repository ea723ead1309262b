#pragma once

#include <clawdesk/app/companion_service.h>
#include <clawdesk/core/types.h>
#include <clawdesk/downloader/downloader.hpp>
#include <clawdesk/supervisor/daemon_supervisor.h>
#include <clawdesk/supervisor/emergency_flush.h>

#include <nlohmann/json.hpp>

namespace clawdesk::cli {

// JSON shapes printed by --json; keys are stable.
nlohmann::json toJson(const Error& error);
nlohmann::json toJson(const supervisor::StartResult& result);
nlohmann::json toJson(const supervisor::StopResult& result);
nlohmann::json toJson(const supervisor::DaemonStatus& status);
nlohmann::json toJson(const supervisor::FlushReport& report);
nlohmann::json toJson(const downloader::DownloadResult& result);
nlohmann::json toJson(const app::PlatformInfo& info);

} // namespace clawdesk::cli
