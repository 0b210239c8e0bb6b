#pragma once

#include "edashell/config.hpp"
#include "edashell/execution_result.hpp"
#include "edashell/process.hpp"
#include "edashell/script_builder.hpp"
#include "edashell/tool_handle.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace edashell {
namespace core {

/**
 * @brief How a script file is handed to a tool: `<tool> [-gui] <scriptFlag...>
 *        <file> <extraArguments...>`.
 */
struct BatchOptions {
    std::vector<std::string> scriptFlag{"-s"};     ///< Precedes the script path
    std::string extension{".ys"};                  ///< Scratch file suffix
    std::vector<std::string> extraArguments{};     ///< Appended after the script path
    bool gui{false};                               ///< Prepend -gui
};

/**
 * @brief Owns a uniquely named script file; the file is removed when the
 *        owner goes out of scope, whatever the outcome of the run.
 */
class ScratchScript {
public:
    /// Throws ToolError(InvalidInput) when the file cannot be written.
    ScratchScript(const std::filesystem::path& directory,
                  std::string_view extension,
                  const std::string& text);
    ~ScratchScript();

    ScratchScript(const ScratchScript&) = delete;
    ScratchScript& operator=(const ScratchScript&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// Argument vector for @p handle. Bridged handles become
/// `<bridge> <shell> -c 'cd "<dir>" && "<tool>" <args>'` with drive paths
/// rewritten to the bridge's mount-point form.
std::vector<std::string> build_command_line(const ToolHandle& handle,
                                            const std::vector<std::string>& args,
                                            const std::string& workingDir,
                                            const BridgeConfig& bridge);

/**
 * @brief One-shot tool runs with full output capture and a wall-clock
 *        budget. Holds no mutable state; concurrent runs are independent.
 */
class BatchRunner {
public:
    explicit BatchRunner(Config config);

    /// Throws ToolError: ProcessStartFailure, BridgeFailure, or Timeout once
    /// @p budget elapses (the process group has been killed by then).
    RawOutput run(const ToolHandle& handle,
                  const std::vector<std::string>& args,
                  const std::string& workingDir,
                  std::chrono::seconds budget) const;

    /// Writes @p script to a scratch file, runs it, removes the file.
    RawOutput run_batch(const ToolHandle& handle,
                        const RenderedScript& script,
                        std::chrono::seconds budget,
                        const BatchOptions& options = {}) const;

    /// Uncaptured run that blocks until the tool exits; returns its status.
    int run_gui(const ToolHandle& handle,
                const std::vector<std::string>& args,
                const std::string& workingDir) const;

    const Config& config() const noexcept { return config_; }

private:
    ProcessConfig process_config_(const ToolHandle& handle,
                                  const std::vector<std::string>& args,
                                  const std::string& workingDir,
                                  bool capture) const;
    void start_(ChildProcess& child, const ToolHandle& handle) const;

    Config config_;
};

} // namespace core
} // namespace edashell
