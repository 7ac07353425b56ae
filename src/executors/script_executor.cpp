#include "script_executor.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <vector>
extern char **environ;

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {

// How long output is still collected after the interpreter exited or was killed.
constexpr std::chrono::milliseconds kDrainGrace{250};

// Sent by the child over the close-on-exec status pipe when it cannot exec.
struct ChildFailure {
    int stage;
    int err;
};
enum : int { kStageChdir = 1, kStageExec = 2 };

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Reads whatever is available. Returns false once the pipe is closed.
bool drain(int fd, std::string& sink, bool& truncated, std::size_t limit) {
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            std::size_t room = sink.size() < limit ? limit - sink.size() : 0;
            std::size_t take = std::min(room, static_cast<std::size_t>(n));
            sink.append(buf, take);
            if (take < static_cast<std::size_t>(n)) truncated = true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

// Child side, between fork and exec: async-signal-safe calls only.
void close_inherited_fds(int keep) {
#ifdef SYS_close_range
    bool ok = true;
    if (keep > 3) ok = ::syscall(SYS_close_range, 3u, static_cast<unsigned>(keep - 1), 0u) == 0;
    if (ok && ::syscall(SYS_close_range, static_cast<unsigned>(keep + 1), ~0u, 0u) == 0) return;
#endif
    long maxfd = ::sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    if (maxfd > 65536) maxfd = 65536;
    for (int fd = 3; fd < static_cast<int>(maxfd); ++fd) {
        if (fd != keep) ::close(fd);
    }
}

std::vector<std::string> build_environment(const fs::path& work_dir) {
    const std::vector<std::pair<std::string, std::string>> overrides = {
        {"MPLBACKEND", "Agg"},
        {"MPLCONFIGDIR", work_dir.string()},
        {"PYTHONUNBUFFERED", "1"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
    };

    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string kv = *e;
        std::string key = kv.substr(0, kv.find('='));
        bool replaced = std::any_of(overrides.begin(), overrides.end(),
                                    [&](const auto& o) { return o.first == key; });
        if (!replaced) env.push_back(std::move(kv));
    }
    for (const auto& [key, value] : overrides) env.push_back(key + "=" + value);
    return env;
}

bool is_executable_file(const std::string& p) {
    struct stat st;
    return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
}

} // namespace

ScriptExecutor::ScriptExecutor(std::string interpreter, std::size_t max_output_bytes)
    : interpreter_(std::move(interpreter)), max_output_bytes_(max_output_bytes) {}

std::optional<std::string> ScriptExecutor::find_program(const std::string& name) {
    if (name.empty()) return std::nullopt;

    // the child changes directory before exec, so relative paths are pinned here
    if (name.find('/') != std::string::npos) {
        std::error_code ec;
        std::string abs = fs::absolute(name, ec).string();
        if (ec) return std::nullopt;
        return is_executable_file(abs) ? std::optional<std::string>(abs) : std::nullopt;
    }

    const char* env_path = std::getenv("PATH");
    std::string dirs = env_path ? env_path : "/usr/local/bin:/usr/bin:/bin";
    std::size_t start = 0;
    while (start <= dirs.size()) {
        std::size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::error_code ec;
        std::string candidate = fs::absolute(fs::path(dir) / name, ec).string();
        if (!ec && is_executable_file(candidate)) return candidate;
        start = end + 1;
    }
    return std::nullopt;
}

RunOutcome ScriptExecutor::run(const fs::path& work_dir, const std::string& script, double timeout_seconds) {
    RunOutcome r;

    fs::path script_path = work_dir / kScriptFilename;
    std::ofstream file(script_path, std::ios::binary | std::ios::trunc);
    if (file) file.write(script.data(), static_cast<std::streamsize>(script.size()));
    file.close();
    if (!file) {
        r.spawn_error = "cannot write " + script_path.string();
        std::cerr << "[ScriptExecutor] " << r.spawn_error << std::endl;
        return r;
    }

    auto program = find_program(interpreter_);
    if (!program) {
        r.interpreter_missing = true;
        r.spawn_error = "interpreter not found: " + interpreter_;
        std::cerr << "[ScriptExecutor] " << r.spawn_error << std::endl;
        return r;
    }

    return spawn_and_wait(work_dir, *program, timeout_seconds);
}

RunOutcome ScriptExecutor::spawn_and_wait(const fs::path& work_dir, const std::string& program,
                                          double timeout_seconds) {
    RunOutcome r;

    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, status_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        r.spawn_error = std::string("failed to create pipes: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &status_pipe[0], &status_pipe[1]})
            close_fd(*fd);
        std::cerr << "[ScriptExecutor] " << r.spawn_error << std::endl;
        return r;
    }

    // everything the child touches is prepared before fork
    std::vector<std::string> env = build_environment(work_dir);
    std::vector<char*> envp;
    for (auto& kv : env) envp.push_back(kv.data());
    envp.push_back(nullptr);

    std::string arg0 = program;
    std::string arg1 = kScriptFilename;
    std::vector<char*> argv{arg0.data(), arg1.data(), nullptr};
    std::string dir = work_dir.string();

    std::cout << "[ScriptExecutor] Executing: " << program << " " << kScriptFilename
              << " in " << dir << " (timeout " << timeout_seconds << "s)" << std::endl;

    auto t0 = Clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        r.spawn_error = std::string("fork failed: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &status_pipe[0], &status_pipe[1]})
            close_fd(*fd);
        std::cerr << "[ScriptExecutor] " << r.spawn_error << std::endl;
        return r;
    }

    if (pid == 0) {
        ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        ChildFailure failure{kStageChdir, 0};
        if (::chdir(dir.c_str()) != 0) {
            failure.err = errno;
        } else {
            close_inherited_fds(status_pipe[1]);
            ::execve(argv[0], argv.data(), envp.data());
            failure = ChildFailure{kStageExec, errno};
        }
        ssize_t w = ::write(status_pipe[1], &failure, sizeof(failure));
        (void)w;
        ::_exit(127);
    }

    // mirror child's setpgid; EACCES just means it already exec'd
    if (::setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        std::cerr << "[ScriptExecutor] setpgid failed: " << std::strerror(errno) << std::endl;
    }
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    ChildFailure failure{0, 0};
    ssize_t got;
    do {
        got = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    int status = 0;
    if (got == static_cast<ssize_t>(sizeof(failure))) {
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        r.interpreter_missing = failure.stage == kStageExec && failure.err == ENOENT;
        r.spawn_error = (failure.stage == kStageChdir ? "cannot enter work area: " : "exec " + program + " failed: ")
                        + std::string(std::strerror(failure.err));
        std::cerr << "[ScriptExecutor] " << r.spawn_error << std::endl;
        return r;
    }

    for (int fd : {out_pipe[0], err_pipe[0]}) {
        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    auto deadline = t0 + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(timeout_seconds));
    bool out_open = true, err_open = true;
    bool exited = false, timed_out = false;
    Clock::time_point drain_until{};

    for (;;) {
        auto now = Clock::now();
        if (!exited && now >= deadline) {
            timed_out = true;
            break;
        }
        if (exited && ((!out_open && !err_open) || now >= drain_until)) break;

        pollfd fds[2];
        nfds_t n = 0;
        if (out_open) fds[n++] = pollfd{out_pipe[0], POLLIN, 0};
        if (err_open) fds[n++] = pollfd{err_pipe[0], POLLIN, 0};
        auto limit = exited ? drain_until : deadline;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(limit - now).count();
        int wait_ms = static_cast<int>(std::clamp<long long>(left, 0, 50));
        if (::poll(n ? fds : nullptr, n, wait_ms) < 0 && errno != EINTR) {
            std::cerr << "[ScriptExecutor] poll failed: " << std::strerror(errno) << std::endl;
        }

        if (out_open) out_open = drain(out_pipe[0], r.stdout_text, r.stdout_truncated, max_output_bytes_);
        if (err_open) err_open = drain(err_pipe[0], r.stderr_text, r.stderr_truncated, max_output_bytes_);

        if (!exited) {
            // WNOWAIT keeps the zombie, so the group id stays ours for killpg
            siginfo_t info{};
            if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
                info.si_pid == pid) {
                exited = true;
                ::killpg(pid, SIGKILL);
                drain_until = Clock::now() + kDrainGrace;
            }
        }
    }

    if (timed_out) {
        ::killpg(pid, SIGKILL);
        auto until = Clock::now() + kDrainGrace;
        while ((out_open || err_open) && Clock::now() < until) {
            pollfd fds[2];
            nfds_t n = 0;
            if (out_open) fds[n++] = pollfd{out_pipe[0], POLLIN, 0};
            if (err_open) fds[n++] = pollfd{err_pipe[0], POLLIN, 0};
            if (::poll(fds, n, 10) < 0 && errno != EINTR) break;
            if (out_open) out_open = drain(out_pipe[0], r.stdout_text, r.stdout_truncated, max_output_bytes_);
            if (err_open) err_open = drain(err_pipe[0], r.stderr_text, r.stderr_truncated, max_output_bytes_);
        }
    }
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    auto t1 = Clock::now();
    r.ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    if (timed_out) {
        r.status = RunStatus::TimedOut;
        std::cerr << "[ScriptExecutor] Process group killed after " << timeout_seconds << "s timeout" << std::endl;
    } else if (WIFEXITED(status)) {
        r.status = RunStatus::Exited;
        r.exit_code = WEXITSTATUS(status);
        std::cout << "[ScriptExecutor] Process exited with code: " << r.exit_code
                  << " (" << r.ms << " ms)" << std::endl;
    } else {
        r.status = RunStatus::Signalled;
        r.term_signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
        std::cout << "[ScriptExecutor] Process killed by signal: " << r.term_signal << std::endl;
    }

    if (r.stdout_truncated || r.stderr_truncated) {
        std::cerr << "[ScriptExecutor] Output truncated at " << max_output_bytes_ << " bytes per stream" << std::endl;
    }
    return r;
}
