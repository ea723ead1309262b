#pragma once

#include <clawdesk/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace clawdesk::app {

/**
 * Raw access to the agent's own config.toml under the agent home.
 *
 * The agent owns the schema; this store only reads, replaces, or edits single
 * `key="value"` lines.
 */
class AgentConfigStore {
public:
    explicit AgentConfigStore(std::filesystem::path agentHome);

    [[nodiscard]] std::filesystem::path path() const { return home_ / "config.toml"; }

    Result<std::string> read() const;

    /// Replace the whole file, creating the agent home if needed.
    Result<void> write(std::string_view content) const;

    /// Replace the first line that assigns `key`, or append `key="value"`.
    Result<void> set(std::string_view key, std::string_view value) const;

private:
    std::filesystem::path home_;
};

} // namespace clawdesk::app
