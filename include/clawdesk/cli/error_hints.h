#pragma once
#include <clawdesk/core/types.h>
#include <string>
#include <string_view>

namespace clawdesk::cli {

/**
 * Actionable hint for a failed command, picked from the error code and message.
 */
struct ErrorHint {
    std::string hint;    // Short actionable suggestion
    std::string command; // Suggested command to run (if any)
};

inline ErrorHint getErrorHint(ErrorCode code, std::string_view message) {
    ErrorHint hint;

    if (message.find("bambooclaw") != std::string_view::npos &&
        (code == ErrorCode::FileNotFound || code == ErrorCode::ProcessSpawnError)) {
        hint.hint = "Install the agent or point daemon.binary / CLAWDESK_DAEMON_BIN at it";
        hint.command = "clawdesk probe bambooclaw";
        return hint;
    }

    switch (code) {
        case ErrorCode::PermissionDenied:
            hint.hint = "The process belongs to another user; retry with elevated privileges";
            break;
        case ErrorCode::ProcessSpawnError:
            hint.hint = "Check that the daemon binary exists and is executable";
            hint.command = "clawdesk platform";
            break;
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
            hint.hint = "Check network connectivity and retry; partial files are left in place";
            break;
        case ErrorCode::HttpError:
            hint.hint = "The server rejected the request; verify the URL";
            break;
        case ErrorCode::IoError:
            hint.hint = "Check free disk space and directory permissions";
            break;
        case ErrorCode::UnsupportedPlatform:
            hint.hint = "Supported platforms are windows, macos and linux";
            break;
        default:
            break;
    }
    return hint;
}

inline std::string formatErrorWithHint(ErrorCode code, std::string_view message) {
    std::string out = "[FAIL] " + std::string(message);
    auto hint = getErrorHint(code, message);
    if (!hint.hint.empty()) {
        out += "\n  hint: " + hint.hint;
    }
    if (!hint.command.empty()) {
        out += "\n  try:  " + hint.command;
    }
    return out;
}

} // namespace clawdesk::cli
