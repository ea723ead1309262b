#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <clawdesk/app/prerequisite_probe.h>
#include <clawdesk/platform/platform_adapter.h>

#include <vector>

using namespace clawdesk;
using clawdesk::app::PrerequisiteProbe;
using Catch::Matchers::ContainsSubstring;

namespace {

struct ProbeFixture {
    explicit ProbeFixture(std::string_view platformName = "linux") {
        auto r = platform::makePlatformAdapter(platformName);
        REQUIRE(r);
        platform = std::move(r).value();
    }

    PrerequisiteProbe probe() {
        return PrerequisiteProbe(
            *platform,
            [this](const process::CommandSpec& spec) -> Result<process::CommandOutput> {
                commands.push_back(spec);
                if (!runnerResult) {
                    return runnerResult.error();
                }
                return runnerResult.value();
            },
            [this](std::string_view name) -> std::optional<std::filesystem::path> {
                lookups.emplace_back(name);
                return found;
            });
    }

    std::unique_ptr<platform::PlatformAdapter> platform;
    Result<process::CommandOutput> runnerResult{process::CommandOutput{}};
    std::optional<std::filesystem::path> found;
    std::vector<process::CommandSpec> commands;
    std::vector<std::string> lookups;
};

} // namespace

TEST_CASE_METHOD(ProbeFixture, "Toolchain probes report --version output", "[app][probe]") {
    runnerResult = process::CommandOutput{0, "rustc 1.79.0 (129f3b996 2024-06-10)\n", ""};
    auto r = probe().check("rustc");
    REQUIRE(r);
    CHECK(r.value() == "rustc 1.79.0 (129f3b996 2024-06-10)");
    REQUIRE(commands.size() == 1);
    CHECK(commands[0].program == "rustc");
    CHECK(commands[0].args == std::vector<std::string>{"--version"});
}

TEST_CASE_METHOD(ProbeFixture, "Version on stderr is accepted", "[app][probe]") {
    runnerResult = process::CommandOutput{0, "  \n", "cargo 1.79.0\n"};
    auto r = probe().check("cargo");
    REQUIRE(r);
    CHECK(r.value() == "cargo 1.79.0");
}

TEST_CASE_METHOD(ProbeFixture, "A missing tool surfaces the runner error", "[app][probe]") {
    runnerResult = Error{ErrorCode::ProcessSpawnError, "cargo not found"};
    auto r = probe().check("cargo");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::ProcessSpawnError);
    CHECK(r.error().message == "cargo not found");
}

TEST_CASE_METHOD(ProbeFixture, "bambooclaw is looked up on PATH", "[app][probe]") {
    SECTION("found") {
        found = std::filesystem::path("/usr/local/bin/bambooclaw");
        auto r = probe().check("bambooclaw");
        REQUIRE(r);
        CHECK(r.value() == "Found at: /usr/local/bin/bambooclaw");
        CHECK(lookups == std::vector<std::string>{"bambooclaw"});
    }

    SECTION("missing") {
        auto r = probe().check("bambooclaw");
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::FileNotFound);
        CHECK_THAT(r.error().message, ContainsSubstring("not found"));
    }
    CHECK(commands.empty());
}

TEST_CASE_METHOD(ProbeFixture, "Build tools are not needed off Windows", "[app][probe]") {
    auto r = probe().check("vs_build_tools");
    REQUIRE(r);
    CHECK(r.value() == "Not required on this platform");
    CHECK(commands.empty());
}

TEST_CASE("Build tools on Windows ask vswhere", "[app][probe]") {
    ProbeFixture fx("windows");
    fx.found = std::filesystem::path("C:/agent/bambooclaw.exe");
    fx.runnerResult =
        process::CommandOutput{0, "C:\\BuildTools\r\n", ""};
    auto r = fx.probe().check("vs_build_tools");
    REQUIRE(r);
    CHECK(r.value() == "C:\\BuildTools");
    REQUIRE(fx.commands.size() == 1);
    CHECK_THAT(fx.commands[0].program, ContainsSubstring("vswhere.exe"));

    SECTION("empty vswhere output means not installed") {
        fx.runnerResult = process::CommandOutput{0, "", ""};
        auto missing = fx.probe().check("vs_build_tools");
        REQUIRE_FALSE(missing);
        CHECK(missing.error().code == ErrorCode::FileNotFound);
    }

    SECTION("the daemon name carries .exe") {
        auto bin = fx.probe().check("bambooclaw");
        REQUIRE(bin);
        CHECK(fx.lookups.back() == "bambooclaw.exe");
    }
}

TEST_CASE_METHOD(ProbeFixture, "Unknown prerequisites are rejected", "[app][probe]") {
    auto r = probe().check("gcc");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidArgument);
    CHECK(PrerequisiteProbe::knownNames() ==
          std::vector<std::string>{"rustc", "cargo", "bambooclaw", "vs_build_tools"});
}
