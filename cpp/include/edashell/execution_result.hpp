#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace edashell {
namespace core {

/**
 * @brief Everything a finished tool invocation produced.
 */
struct RawOutput {
    std::string out{};           ///< Captured stdout
    std::string err{};           ///< Captured stderr
    int         exitCode{};      ///< Exit status (128 + signal when killed)
    double      executionTime{}; ///< Wall-clock seconds
};

/// Classification attached to an interpreted run.
enum class DiagnosticKind {
    EntityNotFound,
    SyntaxError,
};

const char* to_string(DiagnosticKind kind) noexcept;

/**
 * @brief Structured view of tool output. See interpret().
 */
struct InterpretedOutput {
    std::vector<std::string> errors{};
    std::vector<std::string> warnings{};
    std::map<std::string, long> statistics{};   ///< "cells" -> 42
    std::vector<std::string> entities{};        ///< Modules the tool elaborated, in order
    std::optional<DiagnosticKind> kind{};
    std::vector<std::string> suggestions{};
};

/**
 * @brief Shape of a written gate-level netlist.
 */
struct NetlistSummary {
    std::vector<std::string> modules{};
    std::vector<std::string> inputs{};
    std::vector<std::string> outputs{};
    size_t wireCount{};
    size_t assignCount{};
    size_t lineCount{};
};

/// Where a synthesis run ended.
enum class Stage {
    Completed,      ///< exit 0 and output written
    ToolFailed,     ///< non-zero exit
    OutputMissing,  ///< exit 0 but no output artifact
};

const char* to_string(Stage stage) noexcept;

/**
 * @brief Outcome of one synthesis request. Built once by the driver;
 *        read-only afterwards.
 */
class ExecutionResult {
public:
    ExecutionResult(bool success,
                    Stage stage,
                    std::optional<std::filesystem::path> outputPath,
                    InterpretedOutput interpreted,
                    double executionTime,
                    int exitCode,
                    std::optional<std::filesystem::path> logPath = std::nullopt,
                    std::optional<NetlistSummary> netlist = std::nullopt)
        : success_(success),
          stage_(stage),
          outputPath_(std::move(outputPath)),
          interpreted_(std::move(interpreted)),
          executionTime_(executionTime),
          exitCode_(exitCode),
          logPath_(std::move(logPath)),
          netlist_(std::move(netlist)) {}

    bool success() const noexcept { return success_; }
    Stage stage() const noexcept { return stage_; }
    const std::optional<std::filesystem::path>& output_path() const noexcept { return outputPath_; }
    const InterpretedOutput& interpreted() const noexcept { return interpreted_; }
    double execution_time() const noexcept { return executionTime_; }
    int exit_code() const noexcept { return exitCode_; }
    const std::optional<std::filesystem::path>& log_path() const noexcept { return logPath_; }
    const std::optional<NetlistSummary>& netlist() const noexcept { return netlist_; }

private:
    bool success_;
    Stage stage_;
    std::optional<std::filesystem::path> outputPath_;
    InterpretedOutput interpreted_;
    double executionTime_;
    int exitCode_;
    std::optional<std::filesystem::path> logPath_;
    std::optional<NetlistSummary> netlist_;
};

} // namespace core
} // namespace edashell
