// Supervisor lifecycle against real processes.
//
// A copy of /bin/sleep under a unique name stands in for the daemon, so the
// scan only ever matches processes this test started.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <clawdesk/platform/platform_adapter.h>
#include <clawdesk/process/process_backend.h>
#include <clawdesk/supervisor/daemon_supervisor.h>

#include "../../support/temp_dir_scope.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>

#ifndef _WIN32
#include <unistd.h>

using namespace clawdesk;
using namespace clawdesk::supervisor;
using clawdesk::test_support::TempDirScope;
using Catch::Matchers::ContainsSubstring;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct LiveDaemonFixture {
    LiveDaemonFixture() : tmp(TempDirScope::unique_under("clawdesk-live")) {
        // Short enough to survive the kernel's 15-byte comm limit.
        const auto name = "cdit" + std::to_string(::getpid() % 1000000);
        binary = tmp.path() / name;
        std::error_code ec;
        fs::copy_file("/bin/sleep", binary, fs::copy_options::overwrite_existing, ec);
        REQUIRE_FALSE(ec);
        fs::permissions(binary, fs::perms::owner_all, fs::perm_options::add, ec);

        auto p = platform::makeNativePlatformAdapter();
        REQUIRE(p);
        platform = std::move(p).value();
        backend = process::makeNativeProcessBackend();

        SupervisorConfig cfg;
        cfg.daemonPath = binary;
        cfg.daemonArgs = {"60"};
        cfg.stopTimeout = 2000ms;
        supervisor = std::make_unique<DaemonSupervisor>(*platform, *backend, cfg);
    }

    ~LiveDaemonFixture() {
        // Never leave a sleeper behind when an assertion bails out early.
        if (supervisor) {
            if (auto r = supervisor->stop(); !r) {
                spdlog::warn("[Test] cleanup stop failed: {}", r.error().message);
            }
        }
    }

    TempDirScope tmp;
    fs::path binary;
    std::unique_ptr<platform::PlatformAdapter> platform;
    std::unique_ptr<process::IProcessBackend> backend;
    std::unique_ptr<DaemonSupervisor> supervisor;
};

} // namespace

TEST_CASE_METHOD(LiveDaemonFixture, "Start, status and stop a real daemon",
                 "[integration][supervisor]") {
    auto before = supervisor->status();
    REQUIRE(before);
    CHECK(before.value().state == DaemonState::Stopped);

    auto started = supervisor->start();
    REQUIRE(started);
    CHECK(started.value().outcome == StartOutcome::Started);
    const auto pid = started.value().handle.pid;
    CHECK(backend->isAlive(pid));

    auto again = supervisor->start();
    REQUIRE(again);
    CHECK(again.value().outcome == StartOutcome::AlreadyRunning);
    CHECK(again.value().handle.pid == pid);

    auto running = supervisor->status();
    REQUIRE(running);
    CHECK(running.value().state == DaemonState::Running);
    REQUIRE(running.value().handle.has_value());
    CHECK(running.value().handle->pid == pid);

    auto stopped = supervisor->stop();
    REQUIRE(stopped);
    CHECK(stopped.value().outcome == StopOutcome::Stopped);
    CHECK_FALSE(backend->isAlive(pid));

    auto after = supervisor->status();
    REQUIRE(after);
    CHECK(after.value().state == DaemonState::Stopped);
}

TEST_CASE_METHOD(LiveDaemonFixture, "A daemon started elsewhere is adopted and stopped",
                 "[integration][supervisor]") {
    process::SpawnRequest req;
    req.executable = binary;
    req.args = {"60"};
    req.options = platform->detachedSpawnOptions();
    auto external = backend->spawn(req);
    REQUIRE(external);

    DaemonSupervisor other(*platform, *backend, supervisor->config());
    auto status = other.status();
    REQUIRE(status);
    REQUIRE(status.value().handle.has_value());
    CHECK(status.value().handle->pid == external.value());
    CHECK_FALSE(status.value().handle->owned);

    auto stopped = other.stop();
    REQUIRE(stopped);
    CHECK(stopped.value().terminated == std::vector<process::Pid>{external.value()});
    CHECK_FALSE(backend->isAlive(external.value()));
}

TEST_CASE("Starting a missing binary reports a spawn error", "[integration][supervisor]") {
    auto p = platform::makeNativePlatformAdapter();
    REQUIRE(p);
    auto backend = process::makeNativeProcessBackend();
    SupervisorConfig cfg;
    cfg.daemonPath = "/nonexistent/clawdesk-it/bambooclaw";
    DaemonSupervisor supervisor(*p.value(), *backend, cfg);

    auto r = supervisor.start();
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::ProcessSpawnError);
    CHECK(supervisor.lastKnownState() == DaemonState::Stopped);
}

#endif
