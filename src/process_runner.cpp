#include "process_runner.hpp"
#include "logging.hpp"

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>

#include <mutex>

namespace {

using SteadyClock = std::chrono::steady_clock;

struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    ~Fd() { reset(); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }
    int release() {
        int f = fd;
        fd = -1;
        return f;
    }
};

bool make_pipe(Fd& rd, Fd& wr) {
    int p[2];
    if (pipe2(p, O_CLOEXEC) != 0) return false;
    rd.fd = p[0];
    wr.fd = p[1];
    return true;
}

int remaining_ms(SteadyClock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now()).count();
    if (left <= 0) return 0;
    return left > 1000 ? 1000 : static_cast<int>(left);
}

// Appends whatever is readable; returns false on EOF or error
bool read_chunk(int fd, std::string& out) {
    char buf[4096];
    ssize_t r = read(fd, buf, sizeof(buf));
    if (r < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    if (r <= 0) {
        sodium_memzero(buf, sizeof(buf));
        return false;
    }
    size_t n = static_cast<size_t>(r);
    if (out.size() + n > MAX_TOOL_OUTPUT) {
        n = MAX_TOOL_OUTPUT - out.size();
    }
    out.append(buf, n);
    sodium_memzero(buf, sizeof(buf));
    return true;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void kill_and_reap(pid_t pid) {
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

// Child keeps running after acknowledging (clip mode): keep draining its
// output so it never hits SIGPIPE, then reap it.
void drain_in_background(pid_t pid, int out_fd, int err_fd, const std::string& tool) {
    std::thread([pid, out_fd, err_fd, tool]() {
        std::string sink;
        struct pollfd fds[2] = { { out_fd, POLLIN, 0 }, { err_fd, POLLIN, 0 } };
        int open_fds = 2;
        while (open_fds > 0) {
            if (poll(fds, 2, -1) < 0) {
                if (errno == EINTR) continue;
                break;
            }
            for (auto& p : fds) {
                if (p.fd >= 0 && (p.revents & (POLLIN | POLLHUP | POLLERR))) {
                    sink.clear();
                    if (!read_chunk(p.fd, sink)) {
                        close(p.fd);
                        p.fd = -1;
                        --open_fds;
                    }
                }
            }
        }
        for (auto& p : fds) {
            if (p.fd >= 0) close(p.fd);
        }
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        int code = decode_status(status);
        audit_log_level(code == 0 ? LogLevel::INFO : LogLevel::WARN,
            tool + " finished in background with code " + std::to_string(code),
            "process_runner",
            code == 0 ? "success" : "failure");
        }).detach();
}

} // namespace


// ---------------- SubprocessRunner ----------------
SubprocessRunner::SubprocessRunner() {
    // a child that exits early must not kill us while we feed its stdin
    static std::once_flag once;
    std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

ProcessResult SubprocessRunner::run(const ProcessRequest& req) {
    Fd in_rd, in_wr, out_rd, out_wr, err_rd, err_wr, exec_rd, exec_wr;
    if (!make_pipe(out_rd, out_wr) || !make_pipe(err_rd, err_wr) ||
        !make_pipe(exec_rd, exec_wr) ||
        (req.stdin_secret && !make_pipe(in_rd, in_wr))) {
        audit_log_level(LogLevel::ERROR,
            "run: pipe creation failed for " + req.command,
            "process_runner",
            "failure");
        throw ExternalToolError(req.command, -1, std::strerror(errno));
    }

    // argv is built before fork; the child only calls async-signal-safe code
    std::vector<char*> argv;
    argv.reserve(req.args.size() + 2);
    argv.push_back(const_cast<char*>(req.command.c_str()));
    for (const auto& a : req.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        audit_log_level(LogLevel::ERROR,
            "run: fork failed for " + req.command,
            "process_runner",
            "failure");
        throw ExternalToolError(req.command, -1, std::strerror(errno));
    }

    if (pid == 0) {
        // child: dup2 clears CLOEXEC on the standard descriptors only
        if (in_rd.fd >= 0) {
            dup2(in_rd.fd, STDIN_FILENO);
        }
        else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        }
        dup2(out_wr.fd, STDOUT_FILENO);
        dup2(err_wr.fd, STDERR_FILENO);

        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(exec_wr.fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // parent
    in_rd.reset();
    out_wr.reset();
    err_wr.reset();
    exec_wr.reset();

    // exec_rd reads EOF once execvp succeeded (CLOEXEC), or the child's errno
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_rd.fd, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    exec_rd.reset();
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        audit_log_level(LogLevel::WARN,
            "run: cannot execute " + req.command,
            "process_runner",
            "failure");
        if (exec_errno == ENOENT || exec_errno == EACCES || exec_errno == ENOTDIR) {
            throw ToolNotFoundError(req.command);
        }
        throw ExternalToolError(req.command, 127, std::strerror(exec_errno));
    }

    const auto deadline = SteadyClock::now() + req.timeout;
    ProcessResult result;
    result.stdout_data.reserve(4096);
    bool out_open = true;
    bool err_open = true;

    auto fail_timeout = [&]() {
        kill_and_reap(pid);
        wipe_string(result.stdout_data);
        audit_log_level(LogLevel::WARN,
            "run: " + req.command + " timed out and was killed",
            "process_runner",
            "failure");
        throw TimeoutError(req.command);
    };

    auto acknowledged = [&]() {
        return !req.ack_marker.empty() &&
            result.stdout_data.find(req.ack_marker) != std::string::npos;
    };

    // One poll round over stdout/stderr and optionally the stdin writer.
    // Returns false once the deadline has passed.
    auto pump = [&](int write_fd, bool& write_ready) {
        struct pollfd fds[3];
        nfds_t count = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_open) { out_idx = static_cast<int>(count); fds[count++] = { out_rd.fd, POLLIN, 0 }; }
        if (err_open) { err_idx = static_cast<int>(count); fds[count++] = { err_rd.fd, POLLIN, 0 }; }
        if (write_fd >= 0) { in_idx = static_cast<int>(count); fds[count++] = { write_fd, POLLOUT, 0 }; }
        write_ready = false;

        int wait = remaining_ms(deadline);
        if (wait == 0) return false;
        int pr = poll(fds, count, wait);
        if (pr < 0) {
            return errno == EINTR;
        }
        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            if (!read_chunk(out_rd.fd, result.stdout_data)) {
                out_open = false;
                out_rd.reset();
            }
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            if (!read_chunk(err_rd.fd, result.stderr_data)) {
                err_open = false;
                err_rd.reset();
            }
        }
        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            write_ready = true;
        }
        return true;
    };

    // ---- feed stdin while holding the secret's view lock ----
    if (req.stdin_secret) {
        fcntl(in_wr.fd, F_SETFL, fcntl(in_wr.fd, F_GETFL) | O_NONBLOCK);
        bool timed_out = false;
        try {
            req.stdin_secret->with_view([&](std::string_view payload) {
                size_t off = 0;
                while (off < payload.size()) {
                    bool ready = false;
                    if (!pump(in_wr.fd, ready)) {
                        timed_out = true;
                        return;
                    }
                    if (!ready) continue;
                    ssize_t w = write(in_wr.fd, payload.data() + off, payload.size() - off);
                    if (w < 0) {
                        if (errno == EAGAIN || errno == EINTR) continue;
                        return; // EPIPE: child stopped reading, exit status decides
                    }
                    off += static_cast<size_t>(w);
                }
                });
        }
        catch (const AlreadyWipedError&) {
            // session force-wiped the payload before it was sent
            kill_and_reap(pid);
            throw;
        }
        in_wr.reset();
        if (timed_out) fail_timeout();
    }

    // ---- collect output ----
    while ((out_open || err_open) && !acknowledged()) {
        bool unused = false;
        if (!pump(-1, unused)) fail_timeout();
    }

    if (acknowledged()) {
        result.acknowledged = true;
        result.exit_code = 0;
        int out_fd = out_open ? out_rd.release() : -1;
        int err_fd = err_open ? err_rd.release() : -1;
        if (out_fd < 0) out_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (err_fd < 0) err_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
        drain_in_background(pid, out_fd, err_fd, req.command);
        return result;
    }

    // both streams closed; the child should be exiting
    int status = 0;
    for (;;) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) break;
        if (SteadyClock::now() >= deadline) fail_timeout();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    result.exit_code = decode_status(status);
    if (result.exit_code != 0) {
        wipe_string(result.stdout_data);
        audit_log_level(LogLevel::WARN,
            "run: " + req.command + " exited with code " + std::to_string(result.exit_code),
            "process_runner",
            "failure");
        throw ExternalToolError(req.command, result.exit_code, result.stderr_data);
    }
    return result;
}


// ---------------- PATH lookup ----------------
bool find_executable(const std::string& name, std::string* resolved) {
    if (name.empty()) return false;
    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) {
            if (resolved) *resolved = name;
            return true;
        }
        return false;
    }
    const char* path = std::getenv("PATH");
    std::string dirs = (path && *path) ? path : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(':', start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            if (resolved) *resolved = candidate;
            return true;
        }
        start = end + 1;
    }
    return false;
}
