#include <clawdesk/app/prerequisite_probe.h>
#include <clawdesk/config/config_helpers.h>

#include <spdlog/spdlog.h>

namespace clawdesk::app {

namespace {

constexpr const char* kVsWhere =
    "C:\\Program Files (x86)\\Microsoft Visual Studio\\Installer\\vswhere.exe";

std::string firstNonEmpty(std::string a, std::string b) {
    config::trim(a);
    if (!a.empty())
        return a;
    config::trim(b);
    return b;
}

} // namespace

PrerequisiteProbe::PrerequisiteProbe(const platform::PlatformAdapter& platform, Runner runner,
                                     PathLookup lookup)
    : platform_(platform), runner_(std::move(runner)), lookup_(std::move(lookup)) {
    if (!runner_) {
        runner_ = [](const process::CommandSpec& spec) { return process::runCommand(spec); };
    }
    if (!lookup_) {
        lookup_ = [](std::string_view name) { return process::findOnPath(name); };
    }
}

const std::vector<std::string>& PrerequisiteProbe::knownNames() {
    static const std::vector<std::string> names{"rustc", "cargo", "bambooclaw", "vs_build_tools"};
    return names;
}

Result<std::string> PrerequisiteProbe::check(std::string_view name) const {
    spdlog::debug("[Probe] checking {}", name);
    if (name == "rustc" || name == "cargo") {
        return versionOf(std::string(name));
    }
    if (name == "bambooclaw") {
        auto found = lookup_(platform_.daemonExecutableName());
        if (!found) {
            return Error{ErrorCode::FileNotFound, "bambooclaw not found in PATH"};
        }
        return "Found at: " + found->string();
    }
    if (name == "vs_build_tools") {
        return visualStudioBuildTools();
    }
    return Error{ErrorCode::InvalidArgument, "Unknown prerequisite: " + std::string(name)};
}

Result<std::string> PrerequisiteProbe::versionOf(const std::string& tool) const {
    process::CommandSpec spec;
    spec.program = tool;
    spec.args = {"--version"};
    spec.options = platform_.hiddenSpawnOptions();
    auto out = runner_(spec);
    if (!out) {
        return out.error();
    }
    return firstNonEmpty(out.value().stdoutText, out.value().stderrText);
}

Result<std::string> PrerequisiteProbe::visualStudioBuildTools() const {
    if (platform_.id() != platform::PlatformId::Windows) {
        return std::string("Not required on this platform");
    }
    process::CommandSpec spec;
    spec.program = kVsWhere;
    spec.args = {"-latest", "-property", "installationPath"};
    spec.options = platform_.hiddenSpawnOptions();
    auto out = runner_(spec);
    if (!out) {
        return Error{out.error().code,
                     "Visual Studio Build Tools not found: " + out.error().message};
    }
    auto path = firstNonEmpty(out.value().stdoutText, {});
    if (path.empty()) {
        return Error{ErrorCode::FileNotFound, "Visual Studio Build Tools not found"};
    }
    return path;
}

} // namespace clawdesk::app
