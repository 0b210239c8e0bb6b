#include "edashell/process.hpp"
#include "edashell/dev_debug.hpp"
#include "edashell/errors.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace edashell {
namespace core {

namespace {

constexpr size_t READ_BUFFER_SIZE = 4096;

// What the child was doing when it gave up; sent back over the status pipe.
constexpr int STAGE_STDIO = 1;
constexpr int STAGE_CHDIR = 2;
constexpr int STAGE_EXEC  = 3;

std::once_flag g_sigpipeOnce;

void ignore_sigpipe() {
    // A dead child must surface as a failed write, not kill the controller.
    std::call_once(g_sigpipeOnce, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void set_cloexec(int fd) {
    if (fd == -1) return;
    int f = fcntl(fd, F_GETFD, 0);
    if (f != -1) fcntl(fd, F_SETFD, f | FD_CLOEXEC);
}

void close_fd(int& fd) noexcept {
    if (fd != -1) { ::close(fd); fd = -1; }
}

bool write_all(int fd, std::string_view data) {
    if (fd == -1) return false;
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n > 0) { p += n; left -= static_cast<size_t>(n); continue; }
        if (n == -1 && errno == EINTR) continue; // retry on signal
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            continue;
        }
        return false; // EPIPE once the child has gone away
    }
    return true;
}

std::vector<std::string> start_failure_hints(int stage, int err) {
    if (stage == STAGE_CHDIR) {
        return {"Check that the working directory exists and is accessible"};
    }
    if (err == ENOENT) {
        return {"Check the executable path or add the tool to PATH",
                "Install the tool if it is missing"};
    }
    if (err == EACCES || err == EPERM) {
        return {"Verify executable permissions"};
    }
    if (err == ENOEXEC) {
        return {"The binary was built for another platform; enable the environment bridge"};
    }
    return {};
}

} // namespace

int decode_wait_status(int status) noexcept {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

ChildProcess::ChildProcess(ProcessConfig config) : config_(std::move(config)) {}

ChildProcess::~ChildProcess() {
    if (child_pid_ > 0 && !exit_status_) {
        kill();
    }
    close_pipes_();
}

bool ChildProcess::create_pipes_() {
    if (config_.pipe_stdin && ::pipe(stdin_pipe_) == -1) {
        close_pipes_();
        return false;
    }
    if (config_.capture_output && (::pipe(stdout_pipe_) == -1 || ::pipe(stderr_pipe_) == -1)) {
        close_pipes_();
        return false;
    }

    // Parent ends must not leak into this or any later child.
    set_cloexec(stdin_pipe_[1]);
    set_cloexec(stdout_pipe_[0]);
    set_cloexec(stderr_pipe_[0]);
    return true;
}

void ChildProcess::close_pipes_() noexcept {
    close_fd(stdin_pipe_[0]);
    close_fd(stdin_pipe_[1]);
    close_fd(stdout_pipe_[0]);
    close_fd(stdout_pipe_[1]);
    close_fd(stderr_pipe_[0]);
    close_fd(stderr_pipe_[1]);
}

void ChildProcess::start() {
    if (running_) return;
    if (config_.argv.empty() || config_.argv.front().empty()) {
        throw ToolError(ErrorKind::ProcessStartFailure, "cannot launch: empty command line");
    }

    ignore_sigpipe();

    if (!create_pipes_()) {
        const int err = errno;
        throw ToolError(ErrorKind::ProcessStartFailure,
                        std::string("cannot create pipes: ") + std::strerror(err),
                        std::strerror(err), {}, err);
    }

    int statusPipe[2]{-1, -1};
    if (::pipe2(statusPipe, O_CLOEXEC) == -1) {
        const int err = errno;
        close_pipes_();
        throw ToolError(ErrorKind::ProcessStartFailure,
                        std::string("cannot create status pipe: ") + std::strerror(err),
                        std::strerror(err), {}, err);
    }

    // Everything the child needs is prepared before fork(); after it only
    // async-signal-safe calls are made.
    std::vector<char*> argv;
    argv.reserve(config_.argv.size() + 1);
    for (auto& a : config_.argv) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> envStrings;
    std::vector<char*> envp;
    if (!config_.environment.empty()) {
        for (char** e = environ; e && *e; ++e) {
            std::string_view entry(*e);
            std::string key(entry.substr(0, entry.find('=')));
            if (config_.environment.find(key) == config_.environment.end()) {
                envStrings.emplace_back(entry);
            }
        }
        for (const auto& [k, v] : config_.environment) {
            envStrings.push_back(k + "=" + v);
        }
        for (auto& s : envStrings) envp.push_back(const_cast<char*>(s.c_str()));
        envp.push_back(nullptr);
    }
    char** envPtr = envp.empty() ? environ : envp.data();
    const char* workDir = config_.working_directory.empty() ? nullptr
                                                            : config_.working_directory.c_str();
    // execvpe() would run a file it cannot execute through /bin/sh; an
    // explicit path must report ENOEXEC instead.
    const bool explicitPath = config_.argv.front().find('/') != std::string::npos;

    int devNull = -1;
    if (!config_.pipe_stdin) devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int err = errno;
        close_fd(statusPipe[0]);
        close_fd(statusPipe[1]);
        close_fd(devNull);
        close_pipes_();
        throw ToolError(ErrorKind::ProcessStartFailure,
                        std::string("fork failed: ") + std::strerror(err),
                        std::strerror(err), {}, err);
    }

    if (pid == 0) {
        // --- Child process context ---
        ::setpgid(0, 0);
        auto fail = [&](int stage) {
            int payload[2] = {stage, errno};
            ssize_t ignored = ::write(statusPipe[1], payload, sizeof(payload));
            (void)ignored;
            _exit(127);
        };

        if (stdin_pipe_[0] != -1) {
            if (::dup2(stdin_pipe_[0], STDIN_FILENO) == -1) fail(STAGE_STDIO);
        } else if (devNull != -1) {
            if (::dup2(devNull, STDIN_FILENO) == -1) fail(STAGE_STDIO);
        }
        if (stdout_pipe_[1] != -1 && ::dup2(stdout_pipe_[1], STDOUT_FILENO) == -1) fail(STAGE_STDIO);
        if (stderr_pipe_[1] != -1 && ::dup2(stderr_pipe_[1], STDERR_FILENO) == -1) fail(STAGE_STDIO);

        for (int fd : {stdin_pipe_[0], stdin_pipe_[1], stdout_pipe_[0],
                       stdout_pipe_[1], stderr_pipe_[0], stderr_pipe_[1]}) {
            if (fd > STDERR_FILENO) ::close(fd);
        }

        if (workDir && ::chdir(workDir) != 0) fail(STAGE_CHDIR);

        if (explicitPath) {
            ::execve(argv[0], argv.data(), envPtr);
        } else {
            ::execvpe(argv[0], argv.data(), envPtr);
        }
        fail(STAGE_EXEC);
    }

    // --- Parent process context ---
    ::setpgid(pid, pid); // may lose the race against the child's own call; both agree
    close_fd(statusPipe[1]);
    close_fd(stdin_pipe_[0]);
    close_fd(stdout_pipe_[1]);
    close_fd(stderr_pipe_[1]);
    close_fd(devNull);

    int payload[2]{0, 0};
    ssize_t got = 0;
    do {
        got = ::read(statusPipe[0], payload, sizeof(payload));
    } while (got == -1 && errno == EINTR);
    close_fd(statusPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(payload))) {
        int st = 0;
        ::waitpid(pid, &st, 0);
        close_pipes_();

        const int stage = payload[0];
        const int err = payload[1];
        std::string what = stage == STAGE_CHDIR
            ? "cannot enter working directory '" + config_.working_directory + "'"
            : "cannot launch '" + config_.argv.front() + "'";
        EDASHELL_DBG("LIFECYCLE", "start failed stage=%d errno=%d argv0='%s'",
                     stage, err, config_.argv.front().c_str());
        throw ToolError(ErrorKind::ProcessStartFailure,
                        what + ": " + std::strerror(err),
                        std::strerror(err),
                        start_failure_hints(stage, err),
                        err);
    }

    {
        std::lock_guard<std::mutex> lk(wait_mutex_);
        child_pid_ = pid;
        exit_status_.reset();
    }
    running_ = true;
    EDASHELL_DBG("LIFECYCLE", "spawned pid=%d argv0='%s' cwd='%s'",
                 static_cast<int>(pid), config_.argv.front().c_str(),
                 workDir ? workDir : "(inherited)");
}

bool ChildProcess::write(std::string_view data) {
    std::lock_guard<std::mutex> lk(stdin_mutex_);
    return write_all(stdin_pipe_[1], data);
}

void ChildProcess::close_stdin() noexcept {
    std::lock_guard<std::mutex> lk(stdin_mutex_);
    close_fd(stdin_pipe_[1]);
}

std::optional<std::string> ChildProcess::read_line_(int fd, std::string& carry) {
    if (fd == -1) return std::nullopt;

    std::array<char, READ_BUFFER_SIZE> buf{};
    for (;;) {
        const size_t nl = carry.find('\n');
        if (nl != std::string::npos) {
            std::string line = carry.substr(0, nl);
            carry.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }

        ssize_t got = ::read(fd, buf.data(), buf.size());
        if (got > 0) {
            carry.append(buf.data(), static_cast<size_t>(got));
            continue;
        }
        if (got == -1 && errno == EINTR) continue;

        // EOF (or a fatal read error): hand back a trailing partial line once.
        if (carry.empty()) return std::nullopt;
        std::string line;
        line.swap(carry);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return line;
    }
}

std::string ChildProcess::read_all_(int fd) {
    std::string out;
    if (fd == -1) return out;

    std::array<char, READ_BUFFER_SIZE> buf{};
    for (;;) {
        ssize_t got = ::read(fd, buf.data(), buf.size());
        if (got > 0) {
            out.append(buf.data(), static_cast<size_t>(got));
        } else if (got == 0) {
            break; // EOF: every writer closed
        } else if (errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    return out;
}

std::optional<std::string> ChildProcess::read_stdout_line() {
    return read_line_(stdout_pipe_[0], stdout_carry_);
}

std::optional<std::string> ChildProcess::read_stderr_line() {
    return read_line_(stderr_pipe_[0], stderr_carry_);
}

std::string ChildProcess::read_all_stdout() {
    std::string out;
    out.swap(stdout_carry_);
    out += read_all_(stdout_pipe_[0]);
    return out;
}

std::string ChildProcess::read_all_stderr() {
    std::string out;
    out.swap(stderr_carry_);
    out += read_all_(stderr_pipe_[0]);
    return out;
}

bool ChildProcess::reap_locked_(bool block) {
    if (exit_status_) return true;
    if (child_pid_ <= 0) return false;

    int status = 0;
    pid_t r = 0;
    do {
        r = ::waitpid(child_pid_, &status, block ? 0 : WNOHANG);
    } while (r == -1 && errno == EINTR);

    if (r == child_pid_) {
        exit_status_ = decode_wait_status(status);
        running_ = false;
        EDASHELL_DBG("LIFECYCLE", "pid=%d exited status=%d",
                     static_cast<int>(child_pid_), *exit_status_);
        return true;
    }
    if (r == -1) {
        // ECHILD: nothing left to wait for; the real status is unknown.
        exit_status_ = -1;
        running_ = false;
        return true;
    }
    return false;
}

bool ChildProcess::is_alive() {
    std::lock_guard<std::mutex> lk(wait_mutex_);
    if (child_pid_ <= 0) return false;
    return !reap_locked_(false);
}

std::optional<int> ChildProcess::wait_for(std::chrono::milliseconds timeout) {
    const auto end = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        {
            std::lock_guard<std::mutex> lk(wait_mutex_);
            if (child_pid_ <= 0) return exit_status_;
            if (reap_locked_(false)) return exit_status_;
        }
        if (std::chrono::steady_clock::now() >= end) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int ChildProcess::wait() {
    std::lock_guard<std::mutex> lk(wait_mutex_);
    reap_locked_(true);
    return exit_status_.value_or(-1);
}

void ChildProcess::signal_group_(int sig) noexcept {
    if (child_pid_ <= 0) return;
    // Negative pid: the whole group, so helpers the tool spawned go too.
    if (::kill(-child_pid_, sig) == -1 && !exit_status_) {
        ::kill(child_pid_, sig);
    }
}

void ChildProcess::terminate(std::chrono::milliseconds grace) noexcept {
    {
        std::lock_guard<std::mutex> lk(wait_mutex_);
        if (child_pid_ <= 0 || reap_locked_(false)) return;
        signal_group_(SIGTERM);
    }
    if (!wait_for(grace)) {
        EDASHELL_DBG("LIFECYCLE", "pid=%d ignored SIGTERM, killing", static_cast<int>(child_pid_));
        kill();
    }
}

void ChildProcess::kill() noexcept {
    std::lock_guard<std::mutex> lk(wait_mutex_);
    if (child_pid_ <= 0) return;
    // Once reaped, the pid may already belong to someone else.
    if (!exit_status_) signal_group_(SIGKILL);
    reap_locked_(true);
    running_ = false;
}

void ChildProcess::kill_group() noexcept {
    std::lock_guard<std::mutex> lk(wait_mutex_);
    if (child_pid_ <= 0) return;
    // The group id stays reserved while any member is alive; an empty group
    // just reports ESRCH.
    if (::kill(-child_pid_, SIGKILL) == 0) {
        EDASHELL_DBG("LIFECYCLE", "pgid=%d killed leftover group members",
                     static_cast<int>(child_pid_));
    }
    reap_locked_(true);
    running_ = false;
}

} // namespace core
} // namespace edashell
