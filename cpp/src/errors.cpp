#include "edashell/errors.hpp"

#include <utility>

namespace edashell {
namespace core {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::UnsupportedPath:     return "UnsupportedPath";
    case ErrorKind::NotFound:            return "NotFound";
    case ErrorKind::ProcessStartFailure: return "ProcessStartFailure";
    case ErrorKind::BridgeFailure:       return "BridgeFailure";
    case ErrorKind::Timeout:             return "Timeout";
    case ErrorKind::ToolReportedError:   return "ToolReportedError";
    case ErrorKind::SessionNotRunning:   return "SessionNotRunning";
    case ErrorKind::InvalidInput:        return "InvalidInput";
    }
    return "Unknown";
}

ToolError::ToolError(ErrorKind kind,
                     const std::string& message,
                     std::string detail,
                     std::vector<std::string> suggestions,
                     int systemError)
    : std::runtime_error(message),
      kind_(kind),
      detail_(std::move(detail)),
      suggestions_(std::move(suggestions)),
      systemError_(systemError) {}

} // namespace core
} // namespace edashell
