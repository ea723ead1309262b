#include <catch2/catch_test_macros.hpp>

#include <clawdesk/platform/platform_adapter.h>
#include <clawdesk/process/process_table.h>

#include "../../support/fake_process_backend.h"

using namespace clawdesk;
using clawdesk::test_support::FakeProcessBackend;

namespace {

std::unique_ptr<platform::PlatformAdapter> adapter(std::string_view name) {
    auto r = platform::makePlatformAdapter(name);
    REQUIRE(r);
    return std::move(r).value();
}

} // namespace

TEST_CASE("ProcessTable finds processes by exact name", "[process][table]") {
    FakeProcessBackend backend;
    auto platform = adapter("linux");
    const auto daemon = backend.addProcess("bambooclaw", {"daemon"});
    backend.addProcess("bambooclaw-helper");
    backend.addProcess("python3");
    const auto py = backend.addProcess("python");

    process::ProcessTable table(backend, *platform);
    CHECK(table.empty());
    REQUIRE(table.refresh());
    CHECK(table.records().size() == 4);

    auto found = table.findByName("bambooclaw");
    REQUIRE(found.size() == 1);
    CHECK(found.front().pid == daemon);
    CHECK(found.front().args == std::vector<std::string>{"daemon"});

    auto pythons = table.findByName("python");
    REQUIRE(pythons.size() == 1);
    CHECK(pythons.front().pid == py);

    CHECK(table.findByName("").empty());
    CHECK(table.findByName("bamboo").empty());
}

TEST_CASE("ProcessTable on Windows ignores case", "[process][table]") {
    FakeProcessBackend backend;
    auto platform = adapter("windows");
    backend.addProcess("Python.exe");
    backend.addProcess("PYTHONW.EXE");

    process::ProcessTable table(backend, *platform);
    REQUIRE(table.refresh());
    CHECK(table.findByName("python.exe").size() == 1);
    CHECK(table.findByName("pythonw.exe").size() == 1);
}

TEST_CASE("ProcessTable keeps its snapshot until refreshed", "[process][table]") {
    FakeProcessBackend backend;
    auto platform = adapter("linux");
    const auto pid = backend.addProcess("bambooclaw");

    process::ProcessTable table(backend, *platform);
    REQUIRE(table.refresh());
    const auto firstSnapshot = table.snapshotTime();

    backend.exitProcess(pid);
    CHECK(table.findByName("bambooclaw").size() == 1);

    SECTION("refresh sees the exit") {
        REQUIRE(table.refresh());
        CHECK(table.findByName("bambooclaw").empty());
        CHECK(table.snapshotTime() >= firstSnapshot);
    }

    SECTION("failed refresh keeps the previous snapshot") {
        backend.failListing(true);
        auto r = table.refresh();
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::IoError);
        CHECK(table.findByName("bambooclaw").size() == 1);
        CHECK(table.snapshotTime() == firstSnapshot);
    }
}
