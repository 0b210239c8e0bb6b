#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace edashell {
namespace core {

/**
 * @brief Failure classes surfaced by the orchestration layer.
 */
enum class ErrorKind {
    UnsupportedPath,      ///< Path cannot be mapped into the other environment
    NotFound,             ///< Tool absent (locator reports this as an empty optional)
    ProcessStartFailure,  ///< Executable could not be launched
    BridgeFailure,        ///< Environment bridge itself is unavailable
    Timeout,              ///< Budget exceeded; the process was killed
    ToolReportedError,    ///< Tool is alive but wrote a diagnostic line
    SessionNotRunning,    ///< Session is closed or its process died
    InvalidInput,         ///< Request rejected before anything was run
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Exception carrying the classified kind, raw diagnostic text and
 *        remediation hints for one failed operation.
 */
class ToolError : public std::runtime_error {
public:
    ToolError(ErrorKind kind,
              const std::string& message,
              std::string detail = {},
              std::vector<std::string> suggestions = {},
              int systemError = 0);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& detail() const noexcept { return detail_; }
    const std::vector<std::string>& suggestions() const noexcept { return suggestions_; }
    int system_error() const noexcept { return systemError_; }

private:
    ErrorKind kind_;
    std::string detail_;
    std::vector<std::string> suggestions_;
    int systemError_{0};
};

} // namespace core
} // namespace edashell
