#include <clawdesk/process/process_table.h>

#include <spdlog/spdlog.h>

namespace clawdesk::process {

ProcessTable::ProcessTable(IProcessBackend& backend, const platform::PlatformAdapter& platform)
    : backend_(backend), platform_(platform) {}

Result<void> ProcessTable::refresh() {
    auto listed = backend_.listProcesses();
    if (!listed) {
        spdlog::warn("[ProcessTable] refresh failed: {}", listed.error().message);
        return listed.error();
    }
    records_ = std::move(listed).value();
    snapshotTime_ = std::chrono::system_clock::now();
    spdlog::debug("[ProcessTable] snapshot holds {} processes", records_.size());
    return Result<void>();
}

std::vector<ProcessRecord> ProcessTable::findByName(std::string_view name) const {
    std::vector<ProcessRecord> matches;
    if (name.empty()) {
        return matches;
    }
    for (const auto& rec : records_) {
        if (platform_.sameProcessName(rec.name, name)) {
            matches.push_back(rec);
        }
    }
    return matches;
}

} // namespace clawdesk::process
