#include <clawdesk/config/config_helpers.h>
#include <clawdesk/process/process_table.h>
#include <clawdesk/supervisor/emergency_flush.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace clawdesk::supervisor {

namespace fs = std::filesystem;

namespace {

fs::path normalized(const fs::path& p) {
    std::error_code ec;
    auto canon = fs::weakly_canonical(p, ec);
    auto out = (ec ? p : canon).lexically_normal();
    // "a/b/" and "a/b" compare equal
    if (!out.has_filename() && out.has_relative_path()) {
        out = out.parent_path();
    }
    return out;
}

} // namespace

bool isSafeScratchPath(const fs::path& path, const fs::path& home) {
    if (path.empty() || path.is_relative()) {
        return false;
    }
    const auto p = normalized(path);
    if (!p.has_relative_path()) {
        return false; // "/" or "C:\"
    }
    if (!home.empty() && p == normalized(home)) {
        return false;
    }
    return true;
}

bool FlushReport::fullySucceeded() const noexcept {
    return std::all_of(steps.begin(), steps.end(), [](const FlushStep& s) { return s.ok; });
}

std::string FlushReport::summary() const {
    size_t failed = 0;
    for (const auto& s : steps) {
        if (!s.ok)
            ++failed;
    }
    if (failed == 0) {
        return "Emergency flush complete: terminated " + std::to_string(terminated.size()) +
               " process(es), scratch reset";
    }
    return "Emergency flush finished with " + std::to_string(failed) + " failed step(s)";
}

EmergencyFlush::EmergencyFlush(DaemonSupervisor& supervisor,
                               const platform::PlatformAdapter& platform,
                               process::IProcessBackend& backend, FlushConfig config)
    : supervisor_(supervisor), platform_(platform), backend_(backend), config_(std::move(config)) {
    scratch_ = config_.scratchDir ? *config_.scratchDir : platform_.scratchDirectory();

    killList_ = platform_.auxiliaryProcessNames();
    for (const auto& extra : config_.extraKillNames) {
        const bool dup = std::any_of(killList_.begin(), killList_.end(), [&](const std::string& n) {
            return platform_.sameProcessName(n, extra);
        });
        if (!dup && !extra.empty()) {
            killList_.push_back(extra);
        }
    }
}

FlushReport EmergencyFlush::run() {
    spdlog::warn("[Flush] emergency flush requested");
    auto lock = supervisor_.lockHandle();
    FlushReport report;

    auto stopped = supervisor_.stop(lock);
    if (stopped) {
        report.terminated.insert(report.terminated.end(), stopped.value().terminated.begin(),
                                 stopped.value().terminated.end());
        report.steps.push_back({"stop daemon", true, stopped.value().message});
    } else {
        report.steps.push_back({"stop daemon", false, stopped.error().message});
    }

    killAuxiliaries(report);
    resetScratch(report);

    if (report.fullySucceeded()) {
        spdlog::info("[Flush] {}", report.summary());
    } else {
        for (const auto& s : report.steps) {
            if (!s.ok)
                spdlog::warn("[Flush] {} failed: {}", s.name, s.detail);
        }
    }
    return report;
}

void EmergencyFlush::killAuxiliaries(FlushReport& report) {
    process::ProcessTable table(backend_, platform_);
    if (auto r = table.refresh(); !r) {
        report.steps.push_back({"scan processes", false, r.error().message});
        return;
    }

    const auto selfPid = backend_.selfPid();
    const auto selfName = backend_.selfImageName();

    for (const auto& name : killList_) {
        FlushStep step{"kill " + name, true, {}};
        size_t killed = 0;
        size_t skipped = 0;
        for (const auto& rec : table.findByName(name)) {
            if (rec.pid == selfPid ||
                (!selfName.empty() && platform_.sameProcessName(rec.name, selfName))) {
                ++skipped;
                continue;
            }
            auto r = backend_.forceKill(rec.pid, config_.killTimeout);
            if (r) {
                ++killed;
                report.terminated.push_back(rec.pid);
            } else {
                step.ok = false;
                if (!step.detail.empty())
                    step.detail += "; ";
                step.detail += "pid " + std::to_string(rec.pid) + ": " + r.error().message;
            }
        }
        if (step.ok) {
            step.detail = killed == 0 ? "no matches" : "terminated " + std::to_string(killed);
        }
        if (skipped > 0) {
            spdlog::debug("[Flush] skipped {} {} process(es) belonging to this application", skipped,
                          name);
        }
        report.steps.push_back(std::move(step));
    }
}

void EmergencyFlush::resetScratch(FlushReport& report) {
    FlushStep step{"reset scratch", true, scratch_.string()};
    if (!isSafeScratchPath(scratch_, config::get_home_dir())) {
        step.ok = false;
        step.detail = "refusing to wipe unsafe path '" + scratch_.string() + "'";
        report.steps.push_back(std::move(step));
        return;
    }

    std::string problems;
    std::error_code ec;
    if (fs::exists(scratch_, ec)) {
        fs::remove_all(scratch_, ec);
        if (ec) {
            problems = "remove: " + ec.message();
        }
    }
    ec.clear();
    fs::create_directories(scratch_, ec);
    if (ec) {
        problems += (problems.empty() ? "" : "; ") + std::string("create: ") + ec.message();
    }
    if (!problems.empty()) {
        step.ok = false;
        step.detail = scratch_.string() + ": " + problems;
    }
    report.steps.push_back(std::move(step));
}

} // namespace clawdesk::supervisor
