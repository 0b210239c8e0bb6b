#include "edashell/session.hpp"
#include "edashell/batch_runner.hpp"
#include "edashell/dev_debug.hpp"
#include "edashell/errors.hpp"

#include <future>
#include <optional>
#include <thread>
#include <utility>

namespace edashell {
namespace core {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

[[noreturn]] void not_running(SessionState state, const std::string& why) {
    throw ToolError(ErrorKind::SessionNotRunning,
                    std::string("session is not running (") + to_string(state) + "): " + why,
                    {}, {"Open a new session"});
}

} // namespace

const char* to_string(SessionState state) noexcept {
    switch (state) {
    case SessionState::Created: return "created";
    case SessionState::Running: return "running";
    case SessionState::Closed:  return "closed";
    case SessionState::Dead:    return "dead";
    }
    return "unknown";
}

SessionOptions SessionOptions::from_config(const Config& config, const ToolSpec& tool) {
    SessionOptions o;
    o.arguments = tool.sessionArguments;
    o.workingDirectory = config.workingDirectory;
    o.shutdownCommand = tool.shutdownCommand;
    o.startupSettle = std::chrono::milliseconds(config.startupSettleMs);
    o.terminateGrace = std::chrono::milliseconds(config.terminateGraceMs);
    o.commandTimeout = std::chrono::seconds(config.commandTimeoutSeconds);
    o.transcriptPath = config.transcriptPath;
    o.environment = config.environment;
    o.bridge = config.bridge;
    return o;
}

Session::Session(std::unique_ptr<Process> process, SessionOptions options)
    : process_(std::move(process)), options_(std::move(options)) {
    if (process_ && process_->is_alive()) state_ = SessionState::Running;

    if (!options_.transcriptPath.empty()) {
        transcript_.open(options_.transcriptPath, std::ios::out | std::ios::app);
        if (!transcript_) {
            EDASHELL_DBG("SESSION", "cannot open transcript %s", options_.transcriptPath.c_str());
        }
    }
    EDASHELL_DBG("SESSION", "created state=%s", to_string(state_));
}

Session::~Session() {
    close();
}

std::unique_ptr<Session> Session::open(const ToolHandle& handle, const SessionOptions& options) {
    ProcessConfig pc;
    pc.argv = build_command_line(handle, options.arguments, options.workingDirectory, options.bridge);
    if (!handle.requires_bridge()) pc.working_directory = options.workingDirectory;
    pc.environment = options.environment;

    auto child = std::make_unique<ChildProcess>(std::move(pc));
    child->start();

    std::this_thread::sleep_for(options.startupSettle);
    if (!child->is_alive()) {
        const std::string err = child->read_all_stderr();
        EDASHELL_DBG("SESSION", "tool=%s exited during startup", handle.executable().c_str());
        throw ToolError(ErrorKind::ProcessStartFailure,
                        "'" + handle.executable() + "' exited during startup",
                        err,
                        {"Run the tool by hand to see its startup errors",
                         "Check the session arguments and the working directory"});
    }
    EDASHELL_DBG("SESSION", "opened pid=%d tool=%s", static_cast<int>(child->native_pid()),
                 handle.executable().c_str());
    return std::make_unique<Session>(std::move(child), options);
}

std::string Session::send(const std::string& command, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lk(mutex_);

    if (state_ != SessionState::Running) {
        not_running(state_, "cannot send '" + command + "'");
    }
    if (!process_->is_alive()) {
        state_ = SessionState::Dead;
        not_running(state_, "process exited");
    }
    if (!process_->write(command + "\n")) {
        state_ = SessionState::Dead;
        process_->kill();
        not_running(state_, "process no longer accepts input");
    }
    EDASHELL_DBG("IO", "-> %s", command.c_str());

    Process* proc = process_.get();
    auto outTask = std::async(std::launch::async, [proc] { return proc->read_stdout_line(); });
    auto errTask = std::async(std::launch::async, [proc] { return proc->read_stderr_line(); });

    // One deadline shared by both listeners.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const bool outReady = outTask.wait_until(deadline) == std::future_status::ready;
    const bool errReady = errTask.wait_until(deadline) == std::future_status::ready;

    if (!outReady || !errReady) {
        process_->kill(); // unblocks whichever listener is still reading
        outTask.wait();
        errTask.wait();
        state_ = SessionState::Dead;
        record_(command, "", "<no reply>");
        EDASHELL_DBG("TIMEOUT", "'%s' got no reply within %lldms (stdout=%d stderr=%d)",
                     command.c_str(), static_cast<long long>(timeout.count()),
                     outReady ? 1 : 0, errReady ? 1 : 0);
        const std::string ms = std::to_string(timeout.count());
        throw ToolError(ErrorKind::Timeout,
                        "no reply to '" + command + "' within " + ms + "ms",
                        {},
                        {"Increase the command timeout (current: " + ms + "ms)",
                         "Open a new session; a timed-out session cannot be reused"});
    }

    const std::optional<std::string> out = outTask.get();
    const std::optional<std::string> err = errTask.get();

    if (!out || !err) {
        state_ = SessionState::Dead;
        process_->kill();
        record_(command, out.value_or(""), err.value_or("<end of stream>"));
        not_running(state_, "process closed its output while running '" + command + "'");
    }

    const std::string reply = trim(*out);
    const std::string diagnostic = trim(*err);
    record_(command, reply, diagnostic);
    EDASHELL_DBG("IO", "<- out='%s' err='%s'", reply.c_str(), diagnostic.c_str());

    if (!diagnostic.empty()) {
        throw ToolError(ErrorKind::ToolReportedError,
                        "tool rejected '" + command + "': " + diagnostic,
                        diagnostic);
    }
    return reply;
}

std::string Session::send(const std::string& command) {
    return send(command, options_.commandTimeout);
}

void Session::close() noexcept {
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ == SessionState::Closed) return;

    try {
        if (process_) {
            if (state_ != SessionState::Dead && !options_.shutdownCommand.empty() &&
                process_->is_alive()) {
                process_->write(options_.shutdownCommand + "\n");
            }
            process_->close_stdin();
            process_->terminate(options_.terminateGrace);
        }
        if (transcript_.is_open()) transcript_.close();
    } catch (const std::exception& e) {
        EDASHELL_DBG("SESSION", "close: %s", e.what());
    }

    if (state_ != SessionState::Dead) state_ = SessionState::Closed;
    EDASHELL_DBG("SESSION", "closed state=%s", to_string(state_));
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

bool Session::is_running() const {
    return state() == SessionState::Running;
}

void Session::record_(const std::string& command,
                      const std::string& output,
                      const std::string& error) {
    if (!transcript_.is_open()) return;
    transcript_ << "Command: " << command << '\n'
                << "Output: " << output << '\n'
                << "Error: " << error << '\n'
                << "---\n";
    transcript_.flush();
}

} // namespace core
} // namespace edashell
