// ==============================================================================
// platform.cpp - MOD-0004: Платформенные абстракции
// ==============================================================================
//
// MOD-0004 platform
// ADR-0010: std::filesystem::path + явные преобразования path <-> UTF-8
// ADR-0012: запуск внешних процессов с таймаутом
//
// ==============================================================================

#include "flexscan/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace flexscan::platform {

// ----------------------------------------------------------------------------
// Преобразования путей (ADR-0010)
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Внешние процессы (ADR-0012)
// ----------------------------------------------------------------------------

namespace {

bool needs_quoting(const std::string& arg) {
    if (arg.empty()) {
        return true;
    }
    return arg.find_first_of(" \t\"'") != std::string::npos;
}

std::string quote_arg(const std::string& arg) {
    if (!needs_quoting(arg)) {
        return arg;
    }
    std::string quoted = "\"";
    for (char c : arg) {
        if (c == '"') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}  // anonymous namespace

std::string join_command(const std::vector<std::string>& argv) {
    std::string line;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            line += ' ';
        }
        line += quote_arg(argv[i]);
    }
    return line;
}

#ifdef _WIN32

namespace {

std::wstring widen(const std::string& s) {
    if (s.empty()) {
        return {};
    }
    int len = MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
    std::wstring w(static_cast<size_t>(len > 0 ? len : 0), L'\0');
    if (len > 0) {
        MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), w.data(), len);
    }
    return w;
}

void drain_pipe(HANDLE h, std::string* sink) {
    char buffer[4096];
    DWORD n = 0;
    while (ReadFile(h, buffer, sizeof(buffer), &n, nullptr) && n > 0) {
        sink->append(buffer, n);
    }
}

}  // anonymous namespace

ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(sa);
    sa.lpSecurityDescriptor = nullptr;
    sa.bInheritHandle = TRUE;

    HANDLE out_r = nullptr, out_w = nullptr, err_r = nullptr, err_w = nullptr;
    if (!CreatePipe(&out_r, &out_w, &sa, 0) || !CreatePipe(&err_r, &err_w, &sa, 0)) {
        result.error = "failed to create pipes";
        for (HANDLE h : {out_r, out_w, err_r, err_w}) {
            if (h != nullptr) {
                CloseHandle(h);
            }
        }
        return result;
    }
    SetHandleInformation(out_r, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_r, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOW si;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = nullptr;
    si.hStdOutput = out_w;
    si.hStdError = err_w;

    PROCESS_INFORMATION pi;
    ZeroMemory(&pi, sizeof(pi));

    // cmd.exe нужен, чтобы az.cmd находился так же, как из консоли
    std::wstring cmdline = widen("cmd.exe /S /C \"" + join_command(argv) + "\"");

    // Job object: по таймауту убиваем всё дерево, иначе python-потомок az держит пайпы
    HANDLE job = CreateJobObjectW(nullptr, nullptr);

    BOOL ok = CreateProcessW(nullptr, cmdline.data(), nullptr, nullptr, TRUE,
                             CREATE_NO_WINDOW | CREATE_SUSPENDED, nullptr, nullptr, &si, &pi);
    CloseHandle(out_w);
    CloseHandle(err_w);

    if (!ok) {
        result.error = "failed to execute '" + argv[0] + "' (error " +
                       std::to_string(GetLastError()) + ")";
        CloseHandle(out_r);
        CloseHandle(err_r);
        if (job != nullptr) {
            CloseHandle(job);
        }
        return result;
    }
    if (job != nullptr) {
        AssignProcessToJobObject(job, pi.hProcess);
    }
    ResumeThread(pi.hThread);
    result.launched = true;

    std::thread out_thread(drain_pipe, out_r, &result.out);
    std::thread err_thread(drain_pipe, err_r, &result.err);

    DWORD wait = WaitForSingleObject(pi.hProcess, static_cast<DWORD>(timeout.count()));
    if (wait == WAIT_TIMEOUT) {
        if (job != nullptr) {
            TerminateJobObject(job, 1);
        } else {
            TerminateProcess(pi.hProcess, 1);
        }
        WaitForSingleObject(pi.hProcess, INFINITE);
        result.timed_out = true;
    } else {
        DWORD code = 0;
        if (GetExitCodeProcess(pi.hProcess, &code)) {
            result.exit_code = static_cast<int>(code);
        }
    }

    out_thread.join();
    err_thread.join();

    CloseHandle(out_r);
    CloseHandle(err_r);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    if (job != nullptr) {
        CloseHandle(job);
    }
    return result;
}

#else

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) {
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

/// Дождаться завершения процесса; по дедлайну убить
/// @return status из waitpid, timed_out выставляется при убийстве
int reap(pid_t pid, std::chrono::steady_clock::time_point deadline, bool& timed_out) {
    int status = 0;
    while (true) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            return status;
        }
        if (w < 0 && errno != EINTR) {
            return status;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(-pid, SIGKILL);
            timed_out = true;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // anonymous namespace

ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe(exec_pipe) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0],
                        &exec_pipe[1]}) {
            close_fd(*fd);
        }
        return result;
    }
    // exec_pipe закрывается при успешном exec; ошибку exec ребёнок пишет туда errno
    set_cloexec(exec_pipe[0]);
    set_cloexec(exec_pipe[1]);

    // argv готовим до fork: в ребёнке только async-signal-safe вызовы
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0],
                        &exec_pipe[1]}) {
            close_fd(*fd);
        }
        return result;
    }

    if (pid == 0) {
        // Своя группа процессов: по таймауту убивается всё дерево (az - это
        // shell-обёртка, запускающая python дочерним процессом)
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::close(exec_pipe[0]);
        execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t written = write(exec_pipe[1], &e, sizeof(e));
        (void)written;
        _exit(127);
    }

    // Повтор setpgid в родителе: группа существует до первого kill(-pid)
    setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        result.error = "failed to execute '" + argv[0] + "': " + std::strerror(child_errno);
        return result;
    }
    result.launched = true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    pollfd fds[2];
    fds[0].fd = out_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = err_pipe[0];
    fds[1].events = POLLIN;
    std::string* sinks[2] = {&result.out, &result.err};

    char buffer[4096];
    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int rc = poll(fds, 2, static_cast<int>(left > 0 ? left : 1));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error = std::string("poll failed: ") + std::strerror(errno);
            result.timed_out = true;
            break;
        }
        if (rc == 0) {
            continue;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t r = read(fds[i].fd, buffer, sizeof(buffer));
            if (r > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(r));
            } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(fds[i].fd);
            }
        }
    }

    if (result.timed_out) {
        kill(-pid, SIGKILL);
    }
    close_fd(fds[0].fd);
    close_fd(fds[1].fd);

    bool killed = false;
    int status = reap(pid, result.timed_out ? std::chrono::steady_clock::now() : deadline, killed);
    if (killed) {
        result.timed_out = true;
    }

    if (result.timed_out) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

#endif

}  // namespace flexscan::platform
