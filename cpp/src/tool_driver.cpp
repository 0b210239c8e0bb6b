#include "edashell/tool_driver.hpp"
#include "edashell/dev_debug.hpp"
#include "edashell/errors.hpp"
#include "edashell/output_interpreter.hpp"
#include "edashell/tool_locator.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace edashell {
namespace core {

namespace fs = std::filesystem;

namespace {

const std::vector<std::string> VERILOG_EXTENSIONS{".v", ".sv", ".vh", ".verilog"};

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

// Every input must be a readable, non-empty regular file. Returns contents
// in input order; odd extensions only produce warnings.
std::vector<std::string> load_inputs(const std::vector<fs::path>& inputs,
                                     std::vector<std::string>& warnings) {
    std::vector<std::string> contents;
    contents.reserve(inputs.size());

    for (const auto& p : inputs) {
        std::error_code ec;
        if (!fs::exists(p, ec)) {
            throw ToolError(ErrorKind::InvalidInput, "Verilog file not found: " + p.string(),
                            p.string(),
                            {"Check the file path", "Use absolute paths for input files"});
        }
        if (!fs::is_regular_file(p, ec)) {
            throw ToolError(ErrorKind::InvalidInput, "Path is not a file: " + p.string(), p.string());
        }

        const std::string ext = lowercase(p.extension().string());
        if (std::find(VERILOG_EXTENSIONS.begin(), VERILOG_EXTENSIONS.end(), ext) ==
            VERILOG_EXTENSIONS.end()) {
            warnings.push_back("File may not be Verilog: " + p.string() +
                               " (extension: " + (ext.empty() ? "none" : ext) + ")");
        }

        auto text = read_text(p);
        if (!text) {
            throw ToolError(ErrorKind::InvalidInput, "Cannot read Verilog file: " + p.string(),
                            p.string(), {"Verify file permissions"});
        }
        if (text->find_first_not_of(" \t\r\n") == std::string::npos) {
            throw ToolError(ErrorKind::InvalidInput, "Verilog file is empty: " + p.string(),
                            p.string());
        }
        contents.push_back(std::move(*text));
    }
    return contents;
}

// Drive-letter paths name files on the bridged host; they are reached, by
// us and by the tool, at their mount-point form.
fs::path mount_path(const fs::path& p, const BridgeConfig& bridge) {
    const std::string s = p.string();
    if (!PathTranslator::is_drive_path(s)) return p;
    if (!bridge.enabled) {
        throw ToolError(ErrorKind::InvalidInput, "drive path needs the environment bridge: " + s, s,
                        {"Set EDASHELL_BRIDGE to the bridge executable", "Or pass a native path"});
    }
    return fs::path(PathTranslator(bridge.mountRoot).to_foreign(s));
}

ExecutionRequest with_mount_paths(const ExecutionRequest& request, const BridgeConfig& bridge) {
    ExecutionRequest mapped = request;
    for (auto& in : mapped.inputs) in = mount_path(in, bridge);
    mapped.outputPath = mount_path(mapped.outputPath, bridge);
    return mapped;
}

// Best effort: a failed write only loses the log.
std::optional<fs::path> write_run_log(const fs::path& output, const RawOutput& raw) {
    fs::path logPath = output;
    logPath.replace_extension(".log");

    std::ofstream log(logPath, std::ios::binary | std::ios::trunc);
    if (!log) {
        EDASHELL_DBG("DRIVER", "cannot write log %s", logPath.c_str());
        return std::nullopt;
    }
    log << "=== stdout ===\n" << raw.out;
    if (!raw.out.empty() && raw.out.back() != '\n') log << '\n';
    log << "=== stderr ===\n" << raw.err;
    if (!raw.err.empty() && raw.err.back() != '\n') log << '\n';
    log << "=== exit " << raw.exitCode << " after " << raw.executionTime << "s ===\n";
    if (!log) return std::nullopt;
    return logPath;
}

} // namespace

const char* to_string(ToolFamily family) noexcept {
    switch (family) {
    case ToolFamily::Synthesizer:  return "yosys";
    case ToolFamily::LayoutEditor: return "magic";
    case ToolFamily::PlaceRoute:   return "openroad";
    }
    return "unknown";
}

std::optional<ToolFamily> parse_tool_family(std::string_view name) {
    const std::string n = lowercase(std::string(name));
    if (n == "yosys" || n == "synthesizer") return ToolFamily::Synthesizer;
    if (n == "magic" || n == "layout") return ToolFamily::LayoutEditor;
    if (n == "openroad" || n == "placeroute") return ToolFamily::PlaceRoute;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ToolDriver
// ---------------------------------------------------------------------------

ToolDriver::ToolDriver(Config config) : config_(std::move(config)), runner_(config_) {}

std::optional<ToolHandle> ToolDriver::locate() {
    std::lock_guard<std::mutex> lk(handleMutex_);
    if (!handle_) {
        handle_ = ToolLocator(config_, spec()).locate();
        EDASHELL_DBG("DRIVER", "%s located=%s", name(),
                     handle_ ? handle_->executable().c_str() : "(none)");
    }
    return handle_;
}

ToolHandle ToolDriver::require_handle_() {
    if (auto h = locate()) return *h;
    throw ToolError(ErrorKind::NotFound,
                    std::string(name()) + " not found (tried: " + join(spec().candidates, ", ") + ")",
                    {}, install_hints_());
}

RawOutput ToolDriver::run_batch(const RenderedScript& script, std::chrono::seconds budget) {
    return runner_.run_batch(require_handle_(), script, budget, batch_options_());
}

std::unique_ptr<Session> ToolDriver::open_session() {
    throw ToolError(ErrorKind::InvalidInput,
                    std::string(name()) + " has no interactive session mode",
                    {}, {"Use run_batch() with a script instead"});
}

// ---------------------------------------------------------------------------
// SynthesisDriver
// ---------------------------------------------------------------------------

SynthesisDriver::SynthesisDriver(Config config)
    : ToolDriver(std::move(config)), builder_(PathTranslator(config_.bridge.mountRoot)) {}

BatchOptions SynthesisDriver::batch_options_() const {
    BatchOptions o;
    o.scriptFlag = {"-s"};
    o.extension = ".ys";
    return o;
}

std::vector<std::string> SynthesisDriver::install_hints_() const {
    return {"Install Yosys from https://github.com/YosysHQ/yosys",
            "Add Yosys to your system PATH",
            "Or set EDASHELL_YOSYS to the executable path"};
}

std::vector<std::string> SynthesisDriver::list_modules(const std::vector<fs::path>& files) const {
    std::vector<std::string> modules;
    for (const auto& f : files) {
        const bool reachable = config_.bridge.enabled || !PathTranslator::is_drive_path(f.string());
        auto text = reachable ? read_text(mount_path(f, config_.bridge)) : std::nullopt;
        if (!text) continue;
        auto found = declared_modules(*text);
        EDASHELL_DBG("DRIVER", "%s declares %zu module(s)", f.c_str(), found.size());
        modules.insert(modules.end(), found.begin(), found.end());
    }
    return modules;
}

ExecutionResult SynthesisDriver::synthesize(const ExecutionRequest& original) {
    const ExecutionRequest request = with_mount_paths(original, config_.bridge);
    const std::chrono::seconds budget =
        request.timeBudget.value_or(std::chrono::seconds(config_.batchTimeoutSeconds));

    std::vector<std::string> fileWarnings;
    const auto contents = load_inputs(request.inputs, fileWarnings);
    // The first file decides for the whole design.
    const CircuitKind kind = contents.empty() ? CircuitKind::Combinational
                                              : detect_circuit_kind(contents.front());

    // Validates top entity, inputs and output before anything is spawned.
    RenderedScript script = builder_.render(request, kind);

    std::vector<std::string> available;
    for (const auto& text : contents) {
        auto found = declared_modules(text);
        available.insert(available.end(), found.begin(), found.end());
    }
    if (std::find(available.begin(), available.end(), request.topEntity) == available.end()) {
        std::vector<std::string> hints{"Check module name spelling"};
        if (available.empty()) {
            hints.emplace_back("No module declarations found in the input files");
        } else {
            hints.push_back("Available modules: " + join(available, ", "));
        }
        throw ToolError(ErrorKind::InvalidInput,
                        "top module '" + request.topEntity + "' is not declared in the input files",
                        join(available, " "), std::move(hints));
    }

    const ToolHandle handle = require_handle_();
    if (handle.requires_bridge()) script = builder_.render(request, kind, true);

    std::error_code ec;
    const fs::path outDir = request.outputPath.parent_path();
    if (!outDir.empty()) fs::create_directories(outDir, ec);

    // A netlist left by an earlier run must not pass for this run's output.
    fs::remove(request.outputPath, ec);
    if (ec) {
        throw ToolError(ErrorKind::InvalidInput,
                        "cannot replace existing output: " + request.outputPath.string(),
                        ec.message(), {"Check permissions on the output file"});
    }

    EDASHELL_DBG("DRIVER", "synthesize top=%s kind=%s inputs=%zu budget=%llds",
                 request.topEntity.c_str(), to_string(kind), request.inputs.size(),
                 static_cast<long long>(budget.count()));
    EDASHELL_DBG_BLOCK("DRIVER", "script", script.text());

    const RawOutput raw = runner_.run_batch(handle, script, budget, batch_options_());

    InterpretedOutput interpreted = interpret(raw);
    interpreted.warnings.insert(interpreted.warnings.begin(), fileWarnings.begin(), fileWarnings.end());

    std::optional<fs::path> logPath;
    if (config_.writeLogFile) logPath = write_run_log(request.outputPath, raw);

    const bool outputExists = fs::is_regular_file(request.outputPath, ec);
    Stage stage = Stage::Completed;
    if (raw.exitCode != 0) {
        stage = Stage::ToolFailed;
    } else if (!outputExists) {
        stage = Stage::OutputMissing;
    }
    const bool success = stage == Stage::Completed;

    std::optional<NetlistSummary> netlist;
    if (success) {
        if (auto text = read_text(request.outputPath)) {
            const std::string cleaned = strip_attributes(*text);
            std::ofstream rewrite(request.outputPath, std::ios::binary | std::ios::trunc);
            rewrite << cleaned;
            if (!rewrite) {
                EDASHELL_DBG("DRIVER", "cannot rewrite %s", request.outputPath.c_str());
            }
            netlist = analyze_netlist(cleaned);
        }
    }

    EDASHELL_DBG("DRIVER", "synthesize top=%s stage=%s exit=%d errors=%zu",
                 request.topEntity.c_str(), to_string(stage), raw.exitCode,
                 interpreted.errors.size());

    std::optional<fs::path> outputPath;
    if (outputExists) outputPath = request.outputPath;

    return ExecutionResult(success, stage, std::move(outputPath), std::move(interpreted),
                           raw.executionTime, raw.exitCode, std::move(logPath), std::move(netlist));
}

// ---------------------------------------------------------------------------
// LayoutDriver
// ---------------------------------------------------------------------------

LayoutDriver::LayoutDriver(Config config) : ToolDriver(std::move(config)) {}

BatchOptions LayoutDriver::batch_options_() const {
    BatchOptions o;
    o.scriptFlag = {"-dnull", "-noconsole"};
    o.extension = ".tcl";
    return o;
}

std::vector<std::string> LayoutDriver::install_hints_() const {
    return {"Install Magic from http://opencircuitdesign.com/magic/",
            "Add magic to your system PATH",
            "Or set EDASHELL_MAGIC to the executable path"};
}

std::unique_ptr<Session> LayoutDriver::open_session() {
    return Session::open(require_handle_(), SessionOptions::from_config(config_, spec()));
}

// ---------------------------------------------------------------------------
// PlaceRouteDriver
// ---------------------------------------------------------------------------

PlaceRouteDriver::PlaceRouteDriver(Config config) : ToolDriver(std::move(config)) {}

BatchOptions PlaceRouteDriver::batch_options_() const {
    BatchOptions o;
    o.scriptFlag = {"-exit"};
    o.extension = ".tcl";
    return o;
}

std::vector<std::string> PlaceRouteDriver::install_hints_() const {
    return {"Install OpenROAD from https://github.com/The-OpenROAD-Project/OpenROAD",
            "Add openroad to your system PATH",
            "Or set EDASHELL_OPENROAD to the executable path",
            "If the binary targets another OS, set EDASHELL_BRIDGE"};
}

fs::path PlaceRouteDriver::checked_script_(const fs::path& requested) const {
    const fs::path script = mount_path(requested, config_.bridge);
    std::error_code ec;
    if (!fs::is_regular_file(script, ec)) {
        throw ToolError(ErrorKind::InvalidInput, "TCL script file not found: " + script.string(),
                        script.string(), {"Check the script path"});
    }
    fs::path absolute = fs::absolute(script, ec);
    return ec ? script : absolute;
}

RawOutput PlaceRouteDriver::run_script(const fs::path& script, std::chrono::seconds budget) {
    const fs::path path = checked_script_(script);
    const ToolHandle handle = require_handle_();

    const std::vector<std::string> args{"-exit", path.filename().string()};
    RawOutput raw = runner_.run(handle, args, path.parent_path().string(), budget);

    if (raw.exitCode != 0) {
        throw ToolError(ErrorKind::ToolReportedError,
                        "OpenROAD failed with exit code " + std::to_string(raw.exitCode),
                        raw.err.empty() ? raw.out : raw.err,
                        {"Inspect the script output for the failing command"});
    }
    return raw;
}

RawOutput PlaceRouteDriver::run_script(const fs::path& script) {
    return run_script(script, std::chrono::seconds(config_.batchTimeoutSeconds));
}

int PlaceRouteDriver::run_script_gui(const fs::path& script) {
    const fs::path path = checked_script_(script);
    const ToolHandle handle = require_handle_();
    return runner_.run_gui(handle, {"-gui", path.filename().string()}, path.parent_path().string());
}

std::optional<std::string> PlaceRouteDriver::read_sta_report(const fs::path& directory) {
    return read_text(directory / "sta_report.txt");
}

std::unique_ptr<ToolDriver> make_driver(ToolFamily family, const Config& config) {
    switch (family) {
    case ToolFamily::Synthesizer:  return std::make_unique<SynthesisDriver>(config);
    case ToolFamily::LayoutEditor: return std::make_unique<LayoutDriver>(config);
    case ToolFamily::PlaceRoute:   return std::make_unique<PlaceRouteDriver>(config);
    }
    throw ToolError(ErrorKind::InvalidInput, "unknown tool family");
}

} // namespace core
} // namespace edashell
