#include <clawdesk/app/agent_config_store.h>
#include <clawdesk/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace clawdesk::app {

namespace fs = std::filesystem;

namespace {

bool assignsKey(const std::string& line, std::string_view key) {
    std::string s = line;
    config::ltrim(s);
    if (s.compare(0, key.size(), key) != 0) {
        return false;
    }
    auto rest = s.substr(key.size());
    config::ltrim(rest);
    return !rest.empty() && rest.front() == '=';
}

} // namespace

AgentConfigStore::AgentConfigStore(fs::path agentHome) : home_(std::move(agentHome)) {}

Result<std::string> AgentConfigStore::read() const {
    const auto file = path();
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!fs::exists(file, ec)) {
            return Error{ErrorCode::FileNotFound, "Failed to read config: " + file.string() +
                                                      " does not exist"};
        }
        return Error{ErrorCode::IoError, "Failed to read config: cannot open " + file.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

Result<void> AgentConfigStore::write(std::string_view content) const {
    std::error_code ec;
    fs::create_directories(home_, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to create config dir " + home_.string() + ": " + ec.message()};
    }
    const auto file = path();
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to create config file " + file.string()};
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to write config " + file.string()};
    }
    spdlog::debug("[AgentConfig] wrote {} bytes to {}", content.size(), file.string());
    return Result<void>();
}

Result<void> AgentConfigStore::set(std::string_view key, std::string_view value) const {
    std::string k(key);
    config::trim(k);
    if (k.empty() || k.find_first_of("=\n\r") != std::string::npos) {
        return Error{ErrorCode::InvalidArgument, "Invalid config key '" + std::string(key) + "'"};
    }
    if (value.find_first_of("\n\r\"") != std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument, "Config value for '" + k +
                                                     "' must be a single line without quotes"};
    }

    std::string existing;
    if (auto current = read()) {
        existing = std::move(current).value();
    } else if (current.error().code != ErrorCode::FileNotFound) {
        return current.error();
    }

    const std::string assignment = k + "=\"" + std::string(value) + "\"";
    std::vector<std::string> lines;
    std::istringstream in(existing);
    bool replaced = false;
    for (std::string line; std::getline(in, line);) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!replaced && assignsKey(line, k)) {
            lines.push_back(assignment);
            replaced = true;
        } else {
            lines.push_back(std::move(line));
        }
    }
    if (!replaced) {
        lines.push_back(assignment);
    }

    std::string updated;
    for (const auto& line : lines) {
        updated += line;
        updated += '\n';
    }
    return write(updated);
}

} // namespace clawdesk::app
