/*
 * native_process_backend.cpp
 *
 * OS process primitives behind IProcessBackend.
 * - POSIX spawn is fork/exec with a close-on-exec status pipe: EOF on the pipe
 *   means the image was loaded, an errno on the pipe means exec failed. This
 *   turns "binary missing / not executable" into a synchronous spawn error.
 * - Termination escalates SIGTERM -> SIGKILL with bounded waits.
 * - Enumeration: /proc on Linux, libproc on macOS, Toolhelp32 on Windows.
 */

#include <clawdesk/process/detail/spawn_support.h>
#include <clawdesk/process/process_backend.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string_view>
#include <system_error>
#include <thread>
#include <unordered_map>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <tlhelp32.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#if defined(__APPLE__)
#include <libproc.h>
#include <sys/param.h>
#endif
#endif

namespace clawdesk::process {

namespace fs = std::filesystem;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

std::string baseName(std::string_view path) {
    auto pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(pos + 1));
}

} // namespace

// ============================================================================
// POSIX (Linux/macOS)
// ============================================================================

#ifndef _WIN32

namespace {

std::string errnoText(int err) {
    return std::system_category().message(err);
}

enum class ExecStatus { Started, Failed, TimedOut };

[[noreturn]] void reportChildFailure(int fd, int err) {
    // Only async-signal-safe calls between fork and exec.
    ssize_t ignored = ::write(fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

ExecStatus readExecStatus(int fd, std::chrono::milliseconds timeout, int& childErrno) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return ExecStatus::TimedOut;
        }
        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            childErrno = errno;
            return ExecStatus::Failed;
        }
        if (rc == 0) {
            return ExecStatus::TimedOut;
        }
        int err = 0;
        ssize_t n = ::read(fd, &err, sizeof(err));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n == 0) {
            return ExecStatus::Started;
        }
        childErrno = (n == static_cast<ssize_t>(sizeof(err))) ? err : EIO;
        return ExecStatus::Failed;
    }
}

#if defined(__linux__)
std::string readSmallFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        return {};
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::vector<std::string> splitNul(const std::string& raw) {
    std::vector<std::string> out;
    std::string current;
    for (char c : raw) {
        if (c == '\0') {
            out.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        out.push_back(std::move(current));
    }
    return out;
}

// The kernel truncates comm to 15 bytes. When it is shorter it is exact; otherwise
// prefer argv[0]'s basename if comm is a prefix of it.
std::string pickProcessName(std::string comm, const std::vector<std::string>& args) {
    while (!comm.empty() && (comm.back() == '\n' || comm.back() == '\r')) {
        comm.pop_back();
    }
    constexpr size_t kCommMax = 15;
    if (comm.size() < kCommMax || args.empty()) {
        return comm.empty() && !args.empty() ? baseName(args.front()) : comm;
    }
    auto candidate = baseName(args.front());
    if (candidate.rfind(comm, 0) == 0) {
        auto space = candidate.find(' ');
        return space == std::string::npos ? candidate : candidate.substr(0, space);
    }
    return comm;
}

bool isZombie(Pid pid) {
    auto stat = readSmallFile(fs::path("/proc") / std::to_string(pid) / "stat");
    // "<pid> (<comm>) <state> ..." ; comm may contain spaces or parens
    auto close = stat.rfind(')');
    if (close == std::string::npos || close + 2 >= stat.size()) {
        return false;
    }
    return stat[close + 2] == 'Z';
}
#else
bool isZombie(Pid) {
    return false;
}
#endif

} // namespace

class NativeProcessBackend final : public IProcessBackend {
public:
    Result<Pid> spawn(const SpawnRequest& request) override {
        if (request.executable.empty()) {
            return Error{ErrorCode::InvalidArgument, "spawn: empty executable path"};
        }

        const std::string exe = request.executable.string();
        const bool searchPath = exe.find('/') == std::string::npos;
        const std::string workdir = request.workdir ? request.workdir->string() : std::string{};

        // argv is built before fork; the child must not allocate.
        std::vector<std::string> argvStore;
        argvStore.reserve(request.args.size() + 1);
        argvStore.push_back(exe);
        argvStore.insert(argvStore.end(), request.args.begin(), request.args.end());
        std::vector<char*> argv;
        argv.reserve(argvStore.size() + 1);
        for (auto& a : argvStore) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);

        auto forkWindow = detail::lockForkWindow();
        int statusPipe[2];
        if (int err = detail::openCloexecPipe(statusPipe); err != 0) {
            return Error{ErrorCode::ProcessSpawnError,
                         "Failed to start " + exe + ": pipe() failed: " + errnoText(err)};
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            int err = errno;
            ::close(statusPipe[0]);
            ::close(statusPipe[1]);
            return Error{ErrorCode::ProcessSpawnError,
                         "Failed to start " + exe + ": fork() failed: " + errnoText(err)};
        }

        if (pid == 0) {
            ::close(statusPipe[0]);
            if (request.options.newSession) {
                (void)::setsid();
            }
            if (request.options.redirectStdioToNull) {
                int devnull = ::open("/dev/null", O_RDWR);
                if (devnull >= 0) {
                    (void)::dup2(devnull, STDIN_FILENO);
                    (void)::dup2(devnull, STDOUT_FILENO);
                    (void)::dup2(devnull, STDERR_FILENO);
                    if (devnull > 2)
                        ::close(devnull);
                }
            }
            if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
                reportChildFailure(statusPipe[1], errno);
            }
            if (searchPath) {
                ::execvp(argv[0], argv.data());
            } else {
                ::execv(argv[0], argv.data());
            }
            reportChildFailure(statusPipe[1], errno);
        }

        if (forkWindow.owns_lock())
            forkWindow.unlock();
        ::close(statusPipe[1]);
        int childErrno = 0;
        auto status = readExecStatus(statusPipe[0], request.confirmTimeout, childErrno);
        ::close(statusPipe[0]);

        switch (status) {
            case ExecStatus::Started:
                spdlog::info("[Process] Spawned {} (pid={})", exe, pid);
                return static_cast<Pid>(pid);
            case ExecStatus::Failed: {
                int ignored = 0;
                (void)::waitpid(pid, &ignored, 0);
                spdlog::error("[Process] exec of {} failed: {}", exe, errnoText(childErrno));
                return Error{ErrorCode::ProcessSpawnError,
                             "Failed to start " + exe + ": " + errnoText(childErrno)};
            }
            case ExecStatus::TimedOut:
                break;
        }

        spdlog::error("[Process] {} (pid={}) did not finish exec within {} ms; killing it", exe,
                      pid, request.confirmTimeout.count());
        ::kill(pid, SIGKILL);
        int ignored = 0;
        (void)::waitpid(pid, &ignored, 0);
        return Error{ErrorCode::ProcessSpawnError,
                     "Failed to start " + exe + ": timed out after " +
                         std::to_string(request.confirmTimeout.count()) + " ms"};
    }

    bool isAlive(Pid pid) override {
        if (pid <= 0) {
            return false;
        }
        int status = 0;
        pid_t r = ::waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
        if (r == static_cast<pid_t>(pid)) {
            if (WIFEXITED(status)) {
                spdlog::debug("[Process] Reaped child {} (exit code {})", pid, WEXITSTATUS(status));
            } else if (WIFSIGNALED(status)) {
                spdlog::debug("[Process] Reaped child {} (signal {})", pid, WTERMSIG(status));
            }
            return false;
        }
        if (r == 0) {
            return true;
        }
        // Not our child: probe existence.
        if (::kill(static_cast<pid_t>(pid), 0) == 0) {
            return !isZombie(pid);
        }
        return errno == EPERM;
    }

    Result<void> terminate(Pid pid, std::chrono::milliseconds timeout) override {
        auto sent = sendSignal(pid, SIGTERM, "SIGTERM");
        if (!sent) {
            return sent.error();
        }
        if (!sent.value()) {
            return Result<void>();
        }
        if (waitForExit(pid, timeout)) {
            return Result<void>();
        }
        spdlog::warn("[Process] pid {} did not exit within {} ms after SIGTERM, sending SIGKILL",
                     pid, timeout.count());
        return forceKill(pid, timeout);
    }

    Result<void> forceKill(Pid pid, std::chrono::milliseconds timeout) override {
        auto sent = sendSignal(pid, SIGKILL, "SIGKILL");
        if (!sent) {
            return sent.error();
        }
        if (!sent.value() || waitForExit(pid, timeout)) {
            return Result<void>();
        }
        return Error{ErrorCode::Timeout, "pid " + std::to_string(pid) +
                                             " still running " + std::to_string(timeout.count()) +
                                             " ms after SIGKILL"};
    }

    Result<std::vector<ProcessRecord>> listProcesses() override {
#if defined(__linux__)
        std::error_code ec;
        fs::directory_iterator it("/proc", ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Cannot enumerate /proc: " + ec.message()};
        }
        std::vector<ProcessRecord> out;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                // Entries vanish while we iterate; keep what we have.
                spdlog::debug("[Process] /proc iteration stopped early: {}", ec.message());
                break;
            }
            const auto leaf = it->path().filename().string();
            if (leaf.empty() || !std::all_of(leaf.begin(), leaf.end(),
                                             [](unsigned char c) { return std::isdigit(c); })) {
                continue;
            }
            ProcessRecord rec;
            try {
                rec.pid = std::stoll(leaf);
            } catch (const std::exception&) {
                continue;
            }
            rec.args = splitNul(readSmallFile(it->path() / "cmdline"));
            auto comm = readSmallFile(it->path() / "comm");
            if (comm.empty() && rec.args.empty()) {
                continue;
            }
            rec.name = pickProcessName(std::move(comm), rec.args);
            out.push_back(std::move(rec));
        }
        return out;
#elif defined(__APPLE__)
        int count = proc_listallpids(nullptr, 0);
        if (count <= 0) {
            return Error{ErrorCode::IoError, "proc_listallpids failed: " + errnoText(errno)};
        }
        std::vector<pid_t> pids(static_cast<size_t>(count) + 64);
        count = proc_listallpids(pids.data(), static_cast<int>(pids.size() * sizeof(pid_t)));
        if (count <= 0) {
            return Error{ErrorCode::IoError, "proc_listallpids failed: " + errnoText(errno)};
        }
        std::vector<ProcessRecord> out;
        out.reserve(static_cast<size_t>(count));
        for (int i = 0; i < count; ++i) {
            if (pids[i] <= 0)
                continue;
            ProcessRecord rec;
            rec.pid = pids[i];
            char path[PROC_PIDPATHINFO_MAXSIZE];
            if (proc_pidpath(pids[i], path, sizeof(path)) > 0) {
                rec.name = baseName(path);
                rec.args.emplace_back(path);
            } else {
                char name[2 * MAXCOMLEN + 1];
                if (proc_name(pids[i], name, sizeof(name)) <= 0)
                    continue;
                rec.name = name;
            }
            out.push_back(std::move(rec));
        }
        return out;
#else
        return Error{ErrorCode::NotSupported, "Process enumeration not supported on this OS"};
#endif
    }

    Pid selfPid() const noexcept override { return static_cast<Pid>(::getpid()); }

    std::string selfImageName() const override {
#if defined(__linux__)
        auto args = splitNul(readSmallFile("/proc/self/cmdline"));
        return pickProcessName(readSmallFile("/proc/self/comm"), args);
#elif defined(__APPLE__)
        char path[PROC_PIDPATHINFO_MAXSIZE];
        if (proc_pidpath(::getpid(), path, sizeof(path)) > 0) {
            return baseName(path);
        }
        return {};
#else
        return {};
#endif
    }

private:
    // Ok(true) when delivered, Ok(false) when the pid is already gone.
    Result<bool> sendSignal(Pid pid, int sig, const char* sigName) {
        if (pid <= 0) {
            return Error{ErrorCode::InvalidArgument, "Refusing to signal pid " + std::to_string(pid)};
        }
        if (::kill(static_cast<pid_t>(pid), sig) == 0) {
            spdlog::debug("[Process] Sent {} to pid {}", sigName, pid);
            return true;
        }
        const int err = errno;
        if (err == ESRCH) {
            return false;
        }
        if (err == EPERM) {
            return Error{ErrorCode::PermissionDenied, std::string(sigName) + " to pid " +
                                                          std::to_string(pid) + ": " +
                                                          errnoText(err)};
        }
        return Error{ErrorCode::InternalError,
                     std::string(sigName) + " to pid " + std::to_string(pid) + ": " + errnoText(err)};
    }

    bool waitForExit(Pid pid, std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!isAlive(pid)) {
                return true;
            }
            std::this_thread::sleep_for(kPollInterval);
        }
        return !isAlive(pid);
    }
};

#endif // !_WIN32

// ============================================================================
// Windows
// ============================================================================

#ifdef _WIN32

namespace {

std::string narrow(const std::wstring& w) {
    if (w.empty())
        return {};
    int len = WideCharToMultiByte(CP_UTF8, 0, w.data(), static_cast<int>(w.size()), nullptr, 0,
                                  nullptr, nullptr);
    std::string out(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, w.data(), static_cast<int>(w.size()), out.data(), len, nullptr,
                        nullptr);
    return out;
}

std::wstring widen(const std::string& s) {
    if (s.empty())
        return {};
    int len = MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
    std::wstring out(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), len);
    return out;
}

std::string winErrorText(DWORD err) {
    return std::system_category().message(static_cast<int>(err));
}

} // namespace

class NativeProcessBackend final : public IProcessBackend {
public:
    ~NativeProcessBackend() override {
        std::lock_guard lock(mutex_);
        for (auto& [pid, handle] : children_) {
            CloseHandle(handle);
        }
    }

    Result<Pid> spawn(const SpawnRequest& request) override {
        if (request.executable.empty()) {
            return Error{ErrorCode::InvalidArgument, "spawn: empty executable path"};
        }
        std::wstring cmdline = detail::quoteWindowsArg(request.executable.wstring());
        for (const auto& arg : request.args) {
            cmdline += L" " + detail::quoteWindowsArg(widen(arg));
        }

        STARTUPINFOW si{};
        si.cb = sizeof(si);
        PROCESS_INFORMATION pi{};
        const std::wstring workdir = request.workdir ? request.workdir->wstring() : std::wstring{};

        if (!CreateProcessW(nullptr, cmdline.data(), nullptr, nullptr, FALSE,
                            static_cast<DWORD>(request.options.windowsCreationFlags), nullptr,
                            workdir.empty() ? nullptr : workdir.c_str(), &si, &pi)) {
            DWORD err = GetLastError();
            spdlog::error("[Process] CreateProcessW failed for {}: {}",
                          request.executable.string(), winErrorText(err));
            return Error{ErrorCode::ProcessSpawnError,
                         "Failed to start " + request.executable.string() + ": " +
                             winErrorText(err)};
        }
        CloseHandle(pi.hThread);

        const auto pid = static_cast<Pid>(pi.dwProcessId);
        {
            std::lock_guard lock(mutex_);
            children_[pid] = pi.hProcess;
        }
        spdlog::info("[Process] Spawned {} (pid={})", request.executable.string(), pid);
        return pid;
    }

    bool isAlive(Pid pid) override {
        if (pid <= 0)
            return false;
        HANDLE h = OpenProcess(SYNCHRONIZE | PROCESS_QUERY_LIMITED_INFORMATION, FALSE,
                               static_cast<DWORD>(pid));
        if (h == nullptr) {
            const bool exists = GetLastError() == ERROR_ACCESS_DENIED;
            if (!exists)
                releaseChild(pid);
            return exists;
        }
        const bool alive = WaitForSingleObject(h, 0) == WAIT_TIMEOUT;
        CloseHandle(h);
        if (!alive)
            releaseChild(pid);
        return alive;
    }

    Result<void> terminate(Pid pid, std::chrono::milliseconds timeout) override {
        // Windowless processes have no close message to honour; go straight to TerminateProcess.
        return forceKill(pid, timeout);
    }

    Result<void> forceKill(Pid pid, std::chrono::milliseconds timeout) override {
        if (pid <= 0) {
            return Error{ErrorCode::InvalidArgument, "Refusing to kill pid " + std::to_string(pid)};
        }
        HANDLE h = OpenProcess(PROCESS_TERMINATE | SYNCHRONIZE, FALSE, static_cast<DWORD>(pid));
        if (h == nullptr) {
            DWORD err = GetLastError();
            if (err == ERROR_ACCESS_DENIED) {
                return Error{ErrorCode::PermissionDenied,
                             "OpenProcess pid " + std::to_string(pid) + ": " + winErrorText(err)};
            }
            releaseChild(pid);
            return Result<void>(); // gone
        }
        if (!TerminateProcess(h, 1)) {
            DWORD err = GetLastError();
            CloseHandle(h);
            if (err == ERROR_ACCESS_DENIED) {
                return Error{ErrorCode::PermissionDenied, "TerminateProcess pid " +
                                                              std::to_string(pid) + ": " +
                                                              winErrorText(err)};
            }
            return Error{ErrorCode::InternalError,
                         "TerminateProcess pid " + std::to_string(pid) + ": " + winErrorText(err)};
        }
        DWORD wait = WaitForSingleObject(h, static_cast<DWORD>(timeout.count()));
        CloseHandle(h);
        if (wait != WAIT_OBJECT_0) {
            return Error{ErrorCode::Timeout, "pid " + std::to_string(pid) +
                                                 " still running after TerminateProcess"};
        }
        releaseChild(pid);
        return Result<void>();
    }

    Result<std::vector<ProcessRecord>> listProcesses() override {
        HANDLE snap = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
        if (snap == INVALID_HANDLE_VALUE) {
            return Error{ErrorCode::IoError,
                         "CreateToolhelp32Snapshot failed: " + winErrorText(GetLastError())};
        }
        std::vector<ProcessRecord> out;
        PROCESSENTRY32W entry{};
        entry.dwSize = sizeof(entry);
        if (Process32FirstW(snap, &entry)) {
            do {
                ProcessRecord rec;
                rec.pid = static_cast<Pid>(entry.th32ProcessID);
                rec.name = narrow(entry.szExeFile);
                out.push_back(std::move(rec));
            } while (Process32NextW(snap, &entry));
        }
        CloseHandle(snap);
        return out;
    }

    Pid selfPid() const noexcept override { return static_cast<Pid>(GetCurrentProcessId()); }

    std::string selfImageName() const override {
        wchar_t buf[MAX_PATH];
        DWORD n = GetModuleFileNameW(nullptr, buf, MAX_PATH);
        if (n == 0)
            return {};
        return baseName(narrow(std::wstring(buf, n)));
    }

private:
    void releaseChild(Pid pid) {
        std::lock_guard lock(mutex_);
        if (auto it = children_.find(pid); it != children_.end()) {
            CloseHandle(it->second);
            children_.erase(it);
        }
    }

    std::mutex mutex_;
    std::unordered_map<Pid, HANDLE> children_;
};

#endif // _WIN32

std::unique_ptr<IProcessBackend> makeNativeProcessBackend() {
    return std::make_unique<NativeProcessBackend>();
}

} // namespace clawdesk::process
