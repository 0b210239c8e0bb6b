#pragma once

#include "edashell/batch_runner.hpp"
#include "edashell/config.hpp"
#include "edashell/tool_handle.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edashell {
namespace core {

/**
 * @brief Finds a runnable tool among candidate paths or names.
 *
 * Each candidate must exist (explicit path) or resolve on PATH (bare name)
 * and then pass a version query bounded by at most 10 s. A binary the host
 * cannot execute is retried through the environment bridge when enabled.
 * Absence is reported as std::nullopt, never thrown.
 */
class ToolLocator {
public:
    ToolLocator(Config config, ToolSpec spec);

    std::optional<ToolHandle> locate(const std::vector<std::string>& candidates) const;
    /// Uses the ToolSpec's own candidate list.
    std::optional<ToolHandle> locate() const;

    /// Resolve a bare name against $PATH (first executable hit).
    static std::optional<std::string> search_path(std::string_view name);

private:
    bool verify_(const ToolHandle& candidate) const;
    bool bridge_available_() const;
    std::chrono::seconds verify_budget_() const;

    Config config_;
    ToolSpec spec_;
    BatchRunner runner_;
};

} // namespace core
} // namespace edashell
