#pragma once

#include "edashell/execution_result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace edashell {
namespace core {

/**
 * @brief Best-effort line classifier for synthesizer output.
 *
 * Scans stdout then stderr, trimmed line by line. Unrecognised lines are
 * ignored, so unexpected output yields an empty result rather than an
 * error. Pure: equal input gives equal output.
 */
InterpretedOutput interpret(const RawOutput& raw);

/// Modules, ports and declaration counts of a written netlist.
NetlistSummary analyze_netlist(std::string_view netlist);

/// Remove (* ... *) attributes and // comments, right-trim lines, collapse
/// runs of blank lines and end with a single newline.
std::string strip_attributes(std::string_view netlist);

/// Names from every `module <name>` declaration, in source order.
std::vector<std::string> declared_modules(std::string_view source);

} // namespace core
} // namespace edashell
