#include <catch2/catch_test_macros.hpp>

#include <clawdesk/platform/platform_adapter.h>

#include <algorithm>

using namespace clawdesk;
using namespace clawdesk::platform;

namespace {

std::unique_ptr<PlatformAdapter> adapterFor(std::string_view name) {
    auto r = makePlatformAdapter(name);
    REQUIRE(r);
    return std::move(r).value();
}

} // namespace

TEST_CASE("makePlatformAdapter selects by name", "[platform]") {
    CHECK(adapterFor("linux")->id() == PlatformId::Linux);
    CHECK(adapterFor("macos")->id() == PlatformId::MacOS);
    CHECK(adapterFor("darwin")->id() == PlatformId::MacOS);
    CHECK(adapterFor("windows")->id() == PlatformId::Windows);

    auto unknown = makePlatformAdapter("plan9");
    REQUIRE_FALSE(unknown);
    CHECK(unknown.error().code == ErrorCode::UnsupportedPlatform);
}

TEST_CASE("Native adapter matches the build target", "[platform]") {
    auto native = makeNativePlatformAdapter();
#if defined(_WIN32) || defined(__APPLE__) || defined(__linux__)
    REQUIRE(native);
    CHECK(native.value()->name() == nativePlatformName());
#else
    CHECK_FALSE(native);
#endif
}

TEST_CASE("Daemon executable name carries the platform suffix", "[platform]") {
    CHECK(adapterFor("linux")->daemonExecutableName() == "bambooclaw");
    CHECK(adapterFor("macos")->daemonExecutableName() == "bambooclaw");
    CHECK(adapterFor("windows")->daemonExecutableName() == "bambooclaw.exe");
}

TEST_CASE("Auxiliary kill-list per platform", "[platform][flush]") {
    SECTION("POSIX") {
        auto names = adapterFor("linux")->auxiliaryProcessNames();
        CHECK(names == std::vector<std::string>{"bambooclaw", "python", "python3"});
        CHECK(adapterFor("macos")->auxiliaryProcessNames() == names);
    }
    SECTION("Windows") {
        auto names = adapterFor("windows")->auxiliaryProcessNames();
        CHECK(names == std::vector<std::string>{"bambooclaw.exe", "python.exe", "pythonw.exe",
                                                "cmd.exe", "powershell.exe"});
    }
}

TEST_CASE("Spawn options detach the daemon", "[platform]") {
    SECTION("POSIX starts a new session with null stdio") {
        auto opts = adapterFor("linux")->detachedSpawnOptions();
        CHECK(opts.newSession);
        CHECK(opts.redirectStdioToNull);
        CHECK(opts.windowsCreationFlags == 0);
    }
    SECTION("Windows hides the console and starts a new process group") {
        auto win = adapterFor("windows");
        CHECK(win->detachedSpawnOptions().windowsCreationFlags ==
              (kWinCreateNoWindow | kWinCreateNewProcessGroup));
        CHECK(win->hiddenSpawnOptions().windowsCreationFlags == kWinCreateNoWindow);
    }
}

TEST_CASE("Process name comparison follows platform case rules", "[platform]") {
    auto lin = adapterFor("linux");
    CHECK(lin->sameProcessName("python3", "python3"));
    CHECK_FALSE(lin->sameProcessName("Python3", "python3"));
    CHECK_FALSE(lin->sameProcessName("python", "python3"));

    auto windows = adapterFor("windows");
    CHECK(windows->sameProcessName("Python.EXE", "python.exe"));
    CHECK_FALSE(windows->sameProcessName("python.exe", "pythonw.exe"));
}

TEST_CASE("Scratch and agent home locations", "[platform]") {
    auto lin = adapterFor("linux");
    CHECK(lin->scratchDirectory().filename() == "bambooclaw");
    CHECK(lin->scratchDirectory().is_absolute());
    CHECK(lin->agentHomeDirectory().filename() == ".bambooclaw");
}
