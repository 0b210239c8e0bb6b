#pragma once

#include "edashell/batch_runner.hpp"
#include "edashell/config.hpp"
#include "edashell/execution_result.hpp"
#include "edashell/script_builder.hpp"
#include "edashell/session.hpp"
#include "edashell/tool_handle.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edashell {
namespace core {

enum class ToolFamily {
    Synthesizer,    ///< yosys
    LayoutEditor,   ///< magic
    PlaceRoute,     ///< openroad
};

const char* to_string(ToolFamily family) noexcept;
/// "synthesizer"/"yosys", "layout"/"magic", "placeroute"/"openroad".
std::optional<ToolFamily> parse_tool_family(std::string_view name);

/**
 * @brief What every tool family offers: find the tool, run a script once,
 *        and (where the tool supports it) hold an interactive session.
 */
class ToolDriver {
public:
    explicit ToolDriver(Config config);
    virtual ~ToolDriver() = default;

    ToolDriver(const ToolDriver&) = delete;
    ToolDriver& operator=(const ToolDriver&) = delete;

    virtual ToolFamily family() const noexcept = 0;
    virtual const ToolSpec& spec() const noexcept = 0;
    const char* name() const noexcept { return to_string(family()); }

    /// First successful lookup is cached; absence is not.
    std::optional<ToolHandle> locate();

    /// Run @p script once through a scratch file. Throws ToolError NotFound
    /// when the tool cannot be located, plus everything BatchRunner throws.
    RawOutput run_batch(const RenderedScript& script, std::chrono::seconds budget);

    /// Throws ToolError(InvalidInput) for tools without an interactive mode.
    virtual std::unique_ptr<Session> open_session();

    const Config& config() const noexcept { return config_; }

protected:
    virtual BatchOptions batch_options_() const = 0;
    virtual std::vector<std::string> install_hints_() const = 0;

    /// Located handle, or ToolError(NotFound) with install hints.
    ToolHandle require_handle_();

    Config config_;
    BatchRunner runner_;

private:
    std::mutex handleMutex_;
    std::optional<ToolHandle> handle_;
};

/**
 * @brief Yosys: one-shot synthesis of Verilog sources to a gate-level netlist.
 */
class SynthesisDriver final : public ToolDriver {
public:
    explicit SynthesisDriver(Config config = Config());

    ToolFamily family() const noexcept override { return ToolFamily::Synthesizer; }
    const ToolSpec& spec() const noexcept override { return config_.synthesizer; }

    /**
     * @brief Validate, render, run and interpret one synthesis request.
     *
     * Drive-letter paths are accepted when the bridge is enabled and are
     * used at their mount-point form. An existing output file is removed
     * before the tool runs.
     *
     * @return A result whenever the tool ran to completion, successful or not.
     * @throws ToolError InvalidInput, NotFound, ProcessStartFailure,
     *         BridgeFailure or Timeout, each with suggestions.
     */
    ExecutionResult synthesize(const ExecutionRequest& request);

    /// Modules declared across @p files, in order; unreadable files are skipped.
    std::vector<std::string> list_modules(const std::vector<std::filesystem::path>& files) const;

protected:
    BatchOptions batch_options_() const override;
    std::vector<std::string> install_hints_() const override;

private:
    SynthesisScriptBuilder builder_;
};

/**
 * @brief Magic: interactive layout sessions, or a TCL script run headless.
 */
class LayoutDriver final : public ToolDriver {
public:
    explicit LayoutDriver(Config config = Config());

    ToolFamily family() const noexcept override { return ToolFamily::LayoutEditor; }
    const ToolSpec& spec() const noexcept override { return config_.layoutEditor; }

    std::unique_ptr<Session> open_session() override;

protected:
    BatchOptions batch_options_() const override;
    std::vector<std::string> install_hints_() const override;
};

/**
 * @brief OpenROAD: caller-owned TCL flows in terminal or GUI mode.
 */
class PlaceRouteDriver final : public ToolDriver {
public:
    explicit PlaceRouteDriver(Config config = Config());

    ToolFamily family() const noexcept override { return ToolFamily::PlaceRoute; }
    const ToolSpec& spec() const noexcept override { return config_.placeRoute; }

    /// Run @p script from its own directory with output captured. A non-zero
    /// exit is thrown as ToolError(ToolReportedError) carrying stderr.
    RawOutput run_script(const std::filesystem::path& script, std::chrono::seconds budget);
    /// Budget from Config::batchTimeoutSeconds.
    RawOutput run_script(const std::filesystem::path& script);

    /// Same, with -gui and no capture; blocks until the window is closed.
    int run_script_gui(const std::filesystem::path& script);

    /// Contents of sta_report.txt in @p directory, if the flow wrote one.
    static std::optional<std::string> read_sta_report(const std::filesystem::path& directory);

protected:
    BatchOptions batch_options_() const override;
    std::vector<std::string> install_hints_() const override;

private:
    std::filesystem::path checked_script_(const std::filesystem::path& script) const;
};

std::unique_ptr<ToolDriver> make_driver(ToolFamily family, const Config& config);

} // namespace core
} // namespace edashell
