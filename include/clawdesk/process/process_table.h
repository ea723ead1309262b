#pragma once

#include <clawdesk/core/types.h>
#include <clawdesk/platform/platform_adapter.h>
#include <clawdesk/process/process_backend.h>

#include <string_view>
#include <vector>

namespace clawdesk::process {

/**
 * @brief Point-in-time snapshot of the OS process table.
 *
 * The snapshot only changes on refresh(); lookups never touch the OS. Not
 * thread-safe on its own; DaemonSupervisor serializes access under its handle
 * lock.
 */
class ProcessTable {
public:
    ProcessTable(IProcessBackend& backend, const platform::PlatformAdapter& platform);

    /// Re-enumerate processes. On failure the previous snapshot is kept.
    Result<void> refresh();

    [[nodiscard]] const std::vector<ProcessRecord>& records() const noexcept { return records_; }

    /// Records whose executable name equals `name` exactly (platform case rules).
    [[nodiscard]] std::vector<ProcessRecord> findByName(std::string_view name) const;

    [[nodiscard]] TimePoint snapshotTime() const noexcept { return snapshotTime_; }

    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

private:
    IProcessBackend& backend_;
    const platform::PlatformAdapter& platform_;
    std::vector<ProcessRecord> records_;
    TimePoint snapshotTime_{};
};

} // namespace clawdesk::process
