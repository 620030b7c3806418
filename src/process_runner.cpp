// =============================================================================
// PhoneBridge - External Process Execution
// =============================================================================

#include "process_runner.hpp"
#include "phonebridge_log.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace phonebridge {

namespace {

static constexpr size_t MAX_CAPTURE_BYTES = 64 * 1024 * 1024;

// Owns one pipe end
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }

private:
    int fd_ = -1;
};

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Reads what is available; returns false on EOF/error.
bool drain(UniqueFd& fd, std::string& sink) {
    char buf[16384];
    for (;;) {
        ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n > 0) {
            if (sink.size() < MAX_CAPTURE_BYTES) {
                sink.append(buf, static_cast<size_t>(std::min<size_t>(n, MAX_CAPTURE_BYTES - sink.size())));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        fd.reset();
        return false;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

} // anonymous namespace

std::string CommandResult::diagnostic() const {
    std::string e = trim(err);
    if (!e.empty()) return e;
    return trim(out);
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& a : argv) {
        if (!line.empty()) line += ' ';
        if (a.empty() || a.find_first_of(" \t\"'\\$`") != std::string::npos) {
            line += '\'';
            for (char c : a) {
                if (c == '\'') line += "'\\''";
                else line += c;
            }
            line += '\'';
        } else {
            line += a;
        }
    }
    return line;
}

CommandResult run_command(const std::vector<std::string>& argv, int timeout_ms) {
    CommandResult r;
    if (argv.empty() || argv[0].empty()) {
        r.exit_code = EXIT_CODE_SPAWN_FAILED;
        r.err = "empty command";
        return r;
    }

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        r.exit_code = EXIT_CODE_SPAWN_FAILED;
        r.err = std::string("pipe failed: ") + std::strerror(errno);
        return r;
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        r.exit_code = EXIT_CODE_SPAWN_FAILED;
        r.err = std::string("pipe failed: ") + std::strerror(errno);
        return r;
    }
    UniqueFd out_read(out_pipe[0]), out_write(out_pipe[1]);
    UniqueFd err_read(err_pipe[0]), err_write(err_pipe[1]);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        r.exit_code = EXIT_CODE_SPAWN_FAILED;
        r.err = std::string("fork failed: ") + std::strerror(errno);
        return r;
    }
    if (pid == 0) {
        // child: async-signal-safe calls only
        ::setpgid(0, 0);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::execvp(cargv[0], cargv.data());
        const char msg[] = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(EXIT_CODE_SPAWN_FAILED);
    }

    out_write.reset();
    err_write.reset();
    ::fcntl(out_read.get(), F_SETFL, ::fcntl(out_read.get(), F_GETFL, 0) | O_NONBLOCK);
    ::fcntl(err_read.get(), F_SETFL, ::fcntl(err_read.get(), F_GETFL, 0) | O_NONBLOCK);

    const auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start]() {
        return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
    };

    // Read until both pipes hit EOF or the deadline passes
    while (out_read.valid() || err_read.valid()) {
        int wait_ms = 100;
        if (timeout_ms > 0) {
            int remaining = timeout_ms - elapsed_ms();
            if (remaining <= 0) break;
            wait_ms = std::min(wait_ms, remaining);
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_read.valid()) fds[nfds++] = {out_read.get(), POLLIN, 0};
        if (err_read.valid()) fds[nfds++] = {err_read.get(), POLLIN, 0};

        int pr = ::poll(fds, nfds, wait_ms);
        if (pr < 0 && errno != EINTR) break;
        if (pr <= 0) continue;

        for (nfds_t i = 0; i < nfds; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_read.get()) drain(out_read, r.out);
            else if (fds[i].fd == err_read.get()) drain(err_read, r.err);
        }
    }

    int status = 0;
    if (out_read.valid() || err_read.valid()) {
        // Deadline hit with the pipes still open
        PBLOG_WARN("process", "timeout after %dms: %s", timeout_ms, format_command(argv).c_str());
        ::kill(-pid, SIGTERM);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        ::kill(-pid, SIGKILL);
        ::waitpid(pid, &status, 0);
        r.exit_code = EXIT_CODE_TIMEOUT;
        r.timed_out = true;
        return r;
    }

    // Pipes closed; the child may still be exiting
    for (;;) {
        pid_t w = ::waitpid(pid, &status, timeout_ms > 0 ? WNOHANG : 0);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            r.exit_code = EXIT_CODE_SPAWN_FAILED;
            r.err += std::string("waitpid failed: ") + std::strerror(errno);
            return r;
        }
        if (timeout_ms > 0 && elapsed_ms() > timeout_ms) {
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            r.exit_code = EXIT_CODE_TIMEOUT;
            r.timed_out = true;
            return r;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    r.exit_code = decode_status(status);
    PBLOG_TRACE("process", "rc=%d out=%zuB err=%zuB: %s", r.exit_code, r.out.size(),
                r.err.size(), format_command(argv).c_str());
    return r;
}

} // namespace phonebridge
