#pragma once

#include "edashell/path_translator.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edashell {
namespace core {

/// Technology the synthesizer maps to.
enum class TargetProfile {
    Generic,
    Ice40,
    Ecp5,
    Xilinx,
    Intel,
};

const char* to_string(TargetProfile target) noexcept;
/// "generic", "ice40", "ecp5", "xilinx", "intel" (case-insensitive).
std::optional<TargetProfile> parse_target_profile(std::string_view name);

enum class CircuitKind {
    Combinational,
    Sequential,
};

const char* to_string(CircuitKind kind) noexcept;

/// Sequential when the text mentions a clocked process or a state-holding
/// construct; combinational otherwise.
CircuitKind detect_circuit_kind(std::string_view sourceText);

/**
 * @brief One synthesis job as the caller describes it. Never modified by
 *        the core.
 */
struct ExecutionRequest {
    std::vector<std::filesystem::path> inputs{};           ///< Read in this order
    std::string topEntity{};                               ///< Top-level module
    TargetProfile target{TargetProfile::Generic};
    std::filesystem::path outputPath{};                    ///< Netlist to write
    std::map<std::string, std::string> parameters{};       ///< Passed as -D<name>=<value>
    std::optional<std::chrono::seconds> timeBudget{};      ///< Unset: Config::batchTimeoutSeconds
    bool showStatistics{true};                             ///< Emit a `stat` directive
};

/**
 * @brief Script lines plus the directory they must run in.
 */
struct RenderedScript {
    std::vector<std::string> lines{};
    std::filesystem::path workingDirectory{};

    /// Lines joined with '\n', newline-terminated.
    std::string text() const;
};

/**
 * @brief Renders the Yosys script for an ExecutionRequest. The same request
 *        and circuit kind always give the same text.
 */
class SynthesisScriptBuilder {
public:
    explicit SynthesisScriptBuilder(PathTranslator translator = PathTranslator());

    /// Throws ToolError(InvalidInput) for a bad top entity, no inputs, no
    /// output path or a malformed parameter name. With @p forBridge, drive
    /// paths are rewritten to their mount-point form.
    RenderedScript render(const ExecutionRequest& request,
                          CircuitKind kind,
                          bool forBridge = false) const;

    /// [A-Za-z_][A-Za-z0-9_$]*
    static bool is_identifier(std::string_view name) noexcept;

private:
    std::string format_path_(const std::filesystem::path& path, bool forBridge) const;

    PathTranslator translator_;
};

/// Double-quote @p token when it holds whitespace or characters the script
/// or shell would interpret.
std::string quote_if_needed(std::string_view token);

} // namespace core
} // namespace edashell
