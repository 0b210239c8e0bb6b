#pragma once

#include "edashell/config.hpp"
#include "edashell/process.hpp"
#include "edashell/tool_handle.hpp"

#include <chrono>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace edashell {
namespace core {

enum class SessionState {
    Created,
    Running,
    Closed,
    Dead,
};

const char* to_string(SessionState state) noexcept;

struct SessionOptions {
    std::vector<std::string> arguments{"-noconsole"};       ///< Appended to the tool path
    std::string workingDirectory{""};
    std::string shutdownCommand{"quit"};                    ///< Sent by close()
    std::chrono::milliseconds startupSettle{200};           ///< Pause after spawn before first command
    std::chrono::milliseconds terminateGrace{500};          ///< SIGTERM -> SIGKILL
    std::chrono::milliseconds commandTimeout{15000};        ///< send() without an explicit timeout
    std::string transcriptPath{""};                         ///< Command/Output/Error records (empty = none)
    std::map<std::string, std::string> environment{};
    BridgeConfig bridge{};

    static SessionOptions from_config(const Config& config, const ToolSpec& tool);
};

/**
 * @brief A long-lived tool process used as a command/response channel.
 *
 * One command is in flight at a time; concurrent send() callers serialize.
 * A session that timed out or whose process died is Dead for good.
 */
class Session {
public:
    /// Adopts an already started process; Running if it is alive.
    explicit Session(std::unique_ptr<Process> process, SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Spawn `<tool> <arguments>` and wait out the startup settle period.
    /// Throws ToolError(ProcessStartFailure) if the tool cannot be launched
    /// or exits before the settle period ends.
    static std::unique_ptr<Session> open(const ToolHandle& handle,
                                         const SessionOptions& options = {});

    /**
     * @brief Write @p command, then read one line from stdout and one from
     *        stderr, both bounded by @p timeout.
     *
     * @return The trimmed stdout line (possibly empty).
     * @throws ToolError SessionNotRunning, Timeout (session becomes Dead),
     *         or ToolReportedError with the stderr line as detail.
     */
    std::string send(const std::string& command, std::chrono::milliseconds timeout);
    /// Same, bounded by SessionOptions::commandTimeout.
    std::string send(const std::string& command);

    /// Graceful shutdown then terminate. Idempotent; never throws.
    void close() noexcept;

    SessionState state() const;
    bool is_running() const;

private:
    void record_(const std::string& command, const std::string& output, const std::string& error);

    mutable std::mutex mutex_;
    std::unique_ptr<Process> process_;
    SessionOptions options_;
    SessionState state_{SessionState::Created};
    std::ofstream transcript_;
};

} // namespace core
} // namespace edashell
