#include <clawdesk/config/config_helpers.h>
#include <clawdesk/process/command_runner.h>
#include <clawdesk/process/detail/spawn_support.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <thread>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#endif

namespace clawdesk::process {

namespace fs = std::filesystem;

namespace {

#ifdef _WIN32
constexpr char kPathSeparator = ';';
#else
constexpr char kPathSeparator = ':';
#endif

std::string trimmed(std::string s) {
    config::trim(s);
    return s;
}

Result<CommandOutput> finish(const CommandSpec& spec, CommandOutput out) {
    if (out.exitCode == 0) {
        return out;
    }
    auto detail = trimmed(out.stderrText);
    if (detail.empty()) {
        detail = trimmed(out.stdoutText);
    }
    spdlog::debug("[Command] {} exited with code {}", spec.program, out.exitCode);
    return Error{ErrorCode::InternalError, spec.program + " exited with code " +
                                               std::to_string(out.exitCode) +
                                               (detail.empty() ? "" : ": " + detail)};
}

bool isExecutableFile(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return ::access(p.c_str(), X_OK) == 0;
#endif
}

} // namespace

std::optional<fs::path> findOnPath(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }
    const fs::path bare{std::string(name)};
    if (bare.has_parent_path()) {
        return isExecutableFile(bare) ? std::optional<fs::path>(bare) : std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv || !*pathEnv) {
        return std::nullopt;
    }

    std::vector<std::string> suffixes{""};
#ifdef _WIN32
    if (!bare.has_extension()) {
        const char* pathExt = std::getenv("PATHEXT");
        std::string exts = (pathExt && *pathExt) ? pathExt : ".COM;.EXE;.BAT;.CMD";
        size_t start = 0;
        while (start <= exts.size()) {
            auto end = exts.find(';', start);
            auto ext = exts.substr(start, end == std::string::npos ? std::string::npos : end - start);
            if (!ext.empty())
                suffixes.push_back(ext);
            if (end == std::string::npos)
                break;
            start = end + 1;
        }
    }
#endif

    std::string_view remaining{pathEnv};
    while (true) {
        auto sep = remaining.find(kPathSeparator);
        auto dir = remaining.substr(0, sep);
        if (!dir.empty()) {
            for (const auto& suffix : suffixes) {
                auto candidate = fs::path(std::string(dir)) / (std::string(name) + suffix);
                if (isExecutableFile(candidate)) {
                    return candidate;
                }
            }
        }
        if (sep == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

#ifndef _WIN32

Result<CommandOutput> runCommand(const CommandSpec& spec) {
    if (spec.program.empty()) {
        return Error{ErrorCode::InvalidArgument, "runCommand: empty program"};
    }
    auto resolved = findOnPath(spec.program);
    if (!resolved) {
        return Error{ErrorCode::ProcessSpawnError, spec.program + " not found"};
    }

    std::vector<std::string> argvStore;
    argvStore.push_back(resolved->string());
    argvStore.insert(argvStore.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argvStore) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    // Both pipes are close-on-exec so a daemon spawned concurrently from another
    // thread cannot inherit them and hold our read ends open.
    auto forkWindow = detail::lockForkWindow();
    int outPipe[2];
    int errPipe[2];
    if (int err = detail::openCloexecPipe(outPipe); err != 0) {
        return Error{ErrorCode::ProcessSpawnError,
                     "pipe() failed: " + std::system_category().message(err)};
    }
    if (int err = detail::openCloexecPipe(errPipe); err != 0) {
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        return Error{ErrorCode::ProcessSpawnError,
                     "pipe() failed: " + std::system_category().message(err)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]})
            ::close(fd);
        return Error{ErrorCode::ProcessSpawnError,
                     "fork() failed: " + std::system_category().message(err)};
    }

    if (pid == 0) {
        if (spec.options.newSession) {
            (void)::setsid();
        }
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            (void)::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        (void)::dup2(outPipe[1], STDOUT_FILENO);
        (void)::dup2(errPipe[1], STDERR_FILENO);
        for (int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]})
            ::close(fd);
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    if (forkWindow.owns_lock())
        forkWindow.unlock();
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    CommandOutput out;
    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&out.stdoutText, &out.stderrText};
    int openCount = 2;
    bool timedOut = false;
    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    char buf[4096];

    while (openCount > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            break;
        }
        int rc = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        if (rc == 0) {
            timedOut = true;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --openCount;
            }
        }
    }
    for (auto& f : fds) {
        if (f.fd >= 0)
            ::close(f.fd);
    }

    if (timedOut) {
        ::kill(pid, SIGKILL);
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    if (timedOut) {
        spdlog::warn("[Command] {} killed after {} ms", spec.program, spec.timeout.count());
        return Error{ErrorCode::Timeout,
                     spec.program + " timed out after " + std::to_string(spec.timeout.count()) +
                         " ms"};
    }

    if (WIFEXITED(status)) {
        out.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.exitCode = 128 + WTERMSIG(status);
    }
    return finish(spec, std::move(out));
}

#else

namespace {

std::wstring widen(const std::string& s) {
    if (s.empty())
        return {};
    int len = MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
    std::wstring out(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), len);
    return out;
}

void drain(HANDLE h, std::string& sink) {
    char buf[4096];
    DWORD n = 0;
    while (ReadFile(h, buf, sizeof(buf), &n, nullptr) && n > 0) {
        sink.append(buf, n);
    }
}

} // namespace

Result<CommandOutput> runCommand(const CommandSpec& spec) {
    if (spec.program.empty()) {
        return Error{ErrorCode::InvalidArgument, "runCommand: empty program"};
    }
    auto resolved = findOnPath(spec.program);
    if (!resolved) {
        return Error{ErrorCode::ProcessSpawnError, spec.program + " not found"};
    }

    SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
    HANDLE outRd = nullptr, outWr = nullptr, errRd = nullptr, errWr = nullptr;
    if (!CreatePipe(&outRd, &outWr, &sa, 0) || !CreatePipe(&errRd, &errWr, &sa, 0)) {
        return Error{ErrorCode::ProcessSpawnError, "CreatePipe failed"};
    }
    SetHandleInformation(outRd, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(errRd, HANDLE_FLAG_INHERIT, 0);
    HANDLE nul = CreateFileW(L"NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                             OPEN_EXISTING, 0, nullptr);

    std::wstring cmdline = detail::quoteWindowsArg(resolved->wstring());
    for (const auto& arg : spec.args) {
        cmdline += L" " + detail::quoteWindowsArg(widen(arg));
    }

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = nul;
    si.hStdOutput = outWr;
    si.hStdError = errWr;
    PROCESS_INFORMATION pi{};

    const BOOL ok = CreateProcessW(nullptr, cmdline.data(), nullptr, nullptr, TRUE,
                                   static_cast<DWORD>(spec.options.windowsCreationFlags), nullptr,
                                   nullptr, &si, &pi);
    const DWORD createError = ok ? 0 : GetLastError();
    CloseHandle(outWr);
    CloseHandle(errWr);
    if (nul != INVALID_HANDLE_VALUE)
        CloseHandle(nul);
    if (!ok) {
        CloseHandle(outRd);
        CloseHandle(errRd);
        return Error{ErrorCode::ProcessSpawnError,
                     "Failed to start " + spec.program + ": " +
                         std::system_category().message(static_cast<int>(createError))};
    }
    CloseHandle(pi.hThread);

    CommandOutput out;
    std::thread errReader([&] { drain(errRd, out.stderrText); });
    std::thread outReader([&] { drain(outRd, out.stdoutText); });

    const DWORD wait = WaitForSingleObject(pi.hProcess, static_cast<DWORD>(spec.timeout.count()));
    const bool timedOut = wait != WAIT_OBJECT_0;
    if (timedOut) {
        TerminateProcess(pi.hProcess, 1);
        WaitForSingleObject(pi.hProcess, INFINITE);
    }
    outReader.join();
    errReader.join();
    CloseHandle(outRd);
    CloseHandle(errRd);

    DWORD code = 0;
    GetExitCodeProcess(pi.hProcess, &code);
    CloseHandle(pi.hProcess);

    if (timedOut) {
        spdlog::warn("[Command] {} killed after {} ms", spec.program, spec.timeout.count());
        return Error{ErrorCode::Timeout,
                     spec.program + " timed out after " + std::to_string(spec.timeout.count()) +
                         " ms"};
    }
    out.exitCode = static_cast<int>(code);
    return finish(spec, std::move(out));
}

#endif

} // namespace clawdesk::process
