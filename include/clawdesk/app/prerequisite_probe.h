#pragma once

#include <clawdesk/core/types.h>
#include <clawdesk/platform/platform_adapter.h>
#include <clawdesk/process/command_runner.h>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace clawdesk::app {

/**
 * Checks for the toolchain pieces the agent installer relies on.
 *
 *   rustc, cargo     "<tool> --version" output
 *   bambooclaw       "Found at: <path>" from a PATH lookup
 *   vs_build_tools   Windows: vswhere installation path; elsewhere "Not required on this platform"
 *
 * Any other name is InvalidArgument.
 */
class PrerequisiteProbe {
public:
    using Runner = std::function<Result<process::CommandOutput>(const process::CommandSpec&)>;
    using PathLookup = std::function<std::optional<std::filesystem::path>(std::string_view)>;

    explicit PrerequisiteProbe(const platform::PlatformAdapter& platform, Runner runner = {},
                               PathLookup lookup = {});

    Result<std::string> check(std::string_view name) const;

    [[nodiscard]] static const std::vector<std::string>& knownNames();

private:
    Result<std::string> versionOf(const std::string& tool) const;
    Result<std::string> visualStudioBuildTools() const;

    const platform::PlatformAdapter& platform_;
    Runner runner_;
    PathLookup lookup_;
};

} // namespace clawdesk::app
