#pragma once

// Helpers shared by runCommand and the native process backend.

#include <mutex>
#include <string>

namespace clawdesk::process::detail {

/// Quote one argument for a CreateProcessW command line (MSVCRT parsing rules):
/// backslashes are literal unless they precede a quote, so a run of n backslashes
/// becomes 2n+1 before an embedded quote and 2n before the closing quote.
std::wstring quoteWindowsArg(const std::wstring& arg);

#ifndef _WIN32
/// Create a pipe whose both ends are close-on-exec. Returns 0 or an errno value.
/// Without pipe2() the flags are set in a second step; callers must hold
/// lockForkWindow() across this call and the following fork().
int openCloexecPipe(int fds[2]);

/// Serializes pipe creation against fork() where pipe2() is unavailable.
/// Returns an unlocked lock where pipes are created atomically.
std::unique_lock<std::mutex> lockForkWindow();
#endif

} // namespace clawdesk::process::detail
