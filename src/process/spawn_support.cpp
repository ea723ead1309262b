#include <clawdesk/process/detail/spawn_support.h>

#include <cerrno>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace clawdesk::process::detail {

std::wstring quoteWindowsArg(const std::wstring& arg) {
    if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos)
        return arg;

    std::wstring out = L"\"";
    std::size_t backslashes = 0;
    for (wchar_t c : arg) {
        if (c == L'\\') {
            ++backslashes;
            continue;
        }
        if (c == L'"') {
            out.append(backslashes * 2 + 1, L'\\');
        } else {
            out.append(backslashes, L'\\');
        }
        backslashes = 0;
        out.push_back(c);
    }
    // The closing quote must not be escaped
    out.append(backslashes * 2, L'\\');
    out.push_back(L'"');
    return out;
}

#ifndef _WIN32

namespace {

#if !defined(__linux__)
std::mutex& forkWindowMutex() {
    static std::mutex m;
    return m;
}
#endif

} // namespace

int openCloexecPipe(int fds[2]) {
#if defined(__linux__)
    if (::pipe2(fds, O_CLOEXEC) != 0)
        return errno;
    return 0;
#else
    if (::pipe(fds) != 0)
        return errno;
    if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) != 0 || ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) != 0) {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return err;
    }
    return 0;
#endif
}

std::unique_lock<std::mutex> lockForkWindow() {
#if defined(__linux__)
    return {};
#else
    return std::unique_lock<std::mutex>(forkWindowMutex());
#endif
}

#endif // _WIN32

} // namespace clawdesk::process::detail
