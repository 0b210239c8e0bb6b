#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace edashell {
namespace core {

/**
 * @brief Line-oriented channel to one external process. Session talks to
 *        this interface so tests can substitute an in-process fake.
 *
 * read_stdout_line() and read_stderr_line() block; each may be called from
 * its own thread. Both return std::nullopt at end-of-stream.
 */
class Process {
public:
    virtual ~Process() = default;

    virtual bool write(std::string_view data) = 0;
    virtual std::optional<std::string> read_stdout_line() = 0;
    virtual std::optional<std::string> read_stderr_line() = 0;
    virtual bool is_alive() = 0;
    virtual void close_stdin() noexcept = 0;
    /// SIGTERM, wait up to @p grace, then SIGKILL. Reaps the child.
    virtual void terminate(std::chrono::milliseconds grace) noexcept = 0;
    /// SIGKILL to the whole process group; unblocks pending reads.
    virtual void kill() noexcept = 0;
};

struct ProcessConfig {
    std::vector<std::string> argv{};
    std::string working_directory{};
    std::map<std::string, std::string> environment{};
    bool pipe_stdin{true};      ///< false: child inherits /dev/null on stdin
    bool capture_output{true};  ///< false: child inherits our stdout/stderr (GUI mode)
};

/**
 * @brief POSIX child process with stdin/stdout/stderr pipes, started in its
 *        own process group so a timeout can take down everything it spawned.
 */
class ChildProcess final : public Process {
public:
    explicit ChildProcess(ProcessConfig config);
    ~ChildProcess() override;

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    /// Throws ToolError(ProcessStartFailure) carrying errno when fork, chdir
    /// or exec fails.
    void start();

    bool write(std::string_view data) override;
    std::optional<std::string> read_stdout_line() override;
    std::optional<std::string> read_stderr_line() override;
    bool is_alive() override;
    void close_stdin() noexcept override;
    void terminate(std::chrono::milliseconds grace) noexcept override;
    void kill() noexcept override;

    /// Read a whole stream until EOF (batch capture).
    std::string read_all_stdout();
    std::string read_all_stderr();

    /// SIGKILL whatever is left of the child's process group, including
    /// after the child itself has exited and been reaped.
    void kill_group() noexcept;

    /// Exit status if the child ended within @p timeout.
    std::optional<int> wait_for(std::chrono::milliseconds timeout);
    /// Block until the child exits; returns its exit status.
    int wait();

    pid_t native_pid() const noexcept { return child_pid_; }
    const ProcessConfig& config() const noexcept { return config_; }

private:
    bool create_pipes_();
    void close_pipes_() noexcept;
    bool reap_locked_(bool block);
    void signal_group_(int sig) noexcept;

    static std::optional<std::string> read_line_(int fd, std::string& carry);
    static std::string read_all_(int fd);

    ProcessConfig config_;
    std::atomic<bool> running_{false};

    int stdin_pipe_[2]{-1, -1};
    int stdout_pipe_[2]{-1, -1};
    int stderr_pipe_[2]{-1, -1};
    pid_t child_pid_{-1};

    std::string stdout_carry_;
    std::string stderr_carry_;

    std::optional<int> exit_status_;
    mutable std::mutex wait_mutex_;
    mutable std::mutex stdin_mutex_;
};

/// Decode a waitpid() status: exit code, or 128 + signal number.
int decode_wait_status(int status) noexcept;

} // namespace core
} // namespace edashell
