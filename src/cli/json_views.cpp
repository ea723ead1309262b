#include <clawdesk/cli/json_views.h>

namespace clawdesk::cli {

using json = nlohmann::json;

namespace {

json handleJson(const supervisor::DaemonHandle& handle) {
    return json{{"pid", handle.pid}, {"owned", handle.owned}};
}

} // namespace

json toJson(const Error& error) {
    return json{{"code", errorToString(error.code)}, {"message", error.message}};
}

json toJson(const supervisor::StartResult& result) {
    return json{
        {"outcome", result.outcome == supervisor::StartOutcome::Started ? "started"
                                                                         : "already_running"},
        {"handle", handleJson(result.handle)},
        {"message", result.message}};
}

json toJson(const supervisor::StopResult& result) {
    return json{
        {"outcome", result.outcome == supervisor::StopOutcome::Stopped ? "stopped" : "not_running"},
        {"terminated", result.terminated},
        {"message", result.message}};
}

json toJson(const supervisor::DaemonStatus& status) {
    json j{{"state", supervisor::toString(status.state)}};
    j["handle"] = status.handle ? handleJson(*status.handle) : json(nullptr);
    return j;
}

json toJson(const supervisor::FlushReport& report) {
    json steps = json::array();
    for (const auto& step : report.steps) {
        steps.push_back({{"name", step.name}, {"ok", step.ok}, {"detail", step.detail}});
    }
    return json{{"ok", report.fullySucceeded()},
                {"summary", report.summary()},
                {"terminated", report.terminated},
                {"steps", std::move(steps)}};
}

json toJson(const downloader::DownloadResult& result) {
    json j{{"url", result.url},
           {"destination", result.destination.string()},
           {"bytes_written", result.bytesWritten},
           {"elapsed_ms", result.elapsed.count()}};
    j["total"] = result.total ? json(*result.total) : json(nullptr);
    j["http_status"] = result.httpStatus ? json(*result.httpStatus) : json(nullptr);
    return j;
}

json toJson(const app::PlatformInfo& info) {
    return json{{"platform", info.platform},
                {"home_dir", info.homeDir.string()},
                {"agent_home", info.agentHome.string()},
                {"daemon_binary", info.daemonBinary.string()},
                {"scratch_dir", info.scratchDir.string()}};
}

} // namespace clawdesk::cli
