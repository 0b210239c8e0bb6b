#include "edashell/config.hpp"
#include "edashell/errors.hpp"
#include "edashell/execution_result.hpp"
#include "edashell/output_interpreter.hpp"
#include "edashell/path_translator.hpp"
#include "edashell/session.hpp"
#include "edashell/tool_driver.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include <optional>

namespace py = pybind11;
using namespace edashell::core;

namespace {

// Python side: edashell.ToolError(message) with .kind, .detail, .suggestions.
py::handle g_toolErrorType;

void raise_tool_error(const ToolError& e) {
    py::object exc = py::reinterpret_borrow<py::object>(g_toolErrorType)(e.what());
    exc.attr("kind") = py::str(to_string(e.kind()));
    exc.attr("detail") = py::str(e.detail());
    exc.attr("suggestions") = py::cast(e.suggestions());
    exc.attr("errno") = py::int_(e.system_error());
    PyErr_SetObject(g_toolErrorType.ptr(), exc.ptr());
}

} // namespace

PYBIND11_MODULE(edashell, m) {
    m.doc() = "Drive Yosys, Magic and OpenROAD from Python";

    // Owned by the module; the handle only borrows it.
    auto errorType = py::reinterpret_steal<py::object>(
        PyErr_NewException("edashell.ToolError", PyExc_RuntimeError, nullptr));
    m.attr("ToolError") = errorType;
    g_toolErrorType = errorType;
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const ToolError& e) {
            raise_tool_error(e);
        }
    });

    py::enum_<TargetProfile>(m, "TargetProfile")
        .value("Generic", TargetProfile::Generic)
        .value("Ice40", TargetProfile::Ice40)
        .value("Ecp5", TargetProfile::Ecp5)
        .value("Xilinx", TargetProfile::Xilinx)
        .value("Intel", TargetProfile::Intel);

    py::enum_<Stage>(m, "Stage")
        .value("Completed", Stage::Completed)
        .value("ToolFailed", Stage::ToolFailed)
        .value("OutputMissing", Stage::OutputMissing)
        .def("__str__", [](Stage s) { return std::string(to_string(s)); });

    py::enum_<DiagnosticKind>(m, "DiagnosticKind")
        .value("EntityNotFound", DiagnosticKind::EntityNotFound)
        .value("SyntaxError", DiagnosticKind::SyntaxError);

    py::enum_<SessionState>(m, "SessionState")
        .value("Created", SessionState::Created)
        .value("Running", SessionState::Running)
        .value("Closed", SessionState::Closed)
        .value("Dead", SessionState::Dead);

    py::class_<BridgeConfig>(m, "BridgeConfig")
        .def(py::init<>())
        .def_readwrite("enabled", &BridgeConfig::enabled)
        .def_readwrite("executable", &BridgeConfig::executable)
        .def_readwrite("shell", &BridgeConfig::shell)
        .def_readwrite("status_arguments", &BridgeConfig::statusArguments)
        .def_readwrite("mount_root", &BridgeConfig::mountRoot);

    py::class_<ToolSpec>(m, "ToolSpec")
        .def(py::init<>())
        .def_readwrite("candidates", &ToolSpec::candidates)
        .def_readwrite("version_arguments", &ToolSpec::versionArguments)
        .def_readwrite("version_token", &ToolSpec::versionToken)
        .def_readwrite("session_arguments", &ToolSpec::sessionArguments)
        .def_readwrite("shutdown_command", &ToolSpec::shutdownCommand);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_static("from_environment", &Config::from_environment)
        .def_readwrite("working_directory", &Config::workingDirectory)
        .def_readwrite("verify_timeout_seconds", &Config::verifyTimeoutSeconds)
        .def_readwrite("batch_timeout_seconds", &Config::batchTimeoutSeconds)
        .def_readwrite("command_timeout_seconds", &Config::commandTimeoutSeconds)
        .def_readwrite("startup_settle_ms", &Config::startupSettleMs)
        .def_readwrite("terminate_grace_ms", &Config::terminateGraceMs)
        .def_readwrite("write_log_file", &Config::writeLogFile)
        .def_readwrite("transcript_path", &Config::transcriptPath)
        .def_readwrite("environment", &Config::environment)
        .def_readwrite("bridge", &Config::bridge)
        .def_readwrite("synthesizer", &Config::synthesizer)
        .def_readwrite("layout_editor", &Config::layoutEditor)
        .def_readwrite("place_route", &Config::placeRoute);

    py::class_<ExecutionRequest>(m, "ExecutionRequest")
        .def(py::init<>())
        .def_readwrite("inputs", &ExecutionRequest::inputs)
        .def_readwrite("top_entity", &ExecutionRequest::topEntity)
        .def_readwrite("target", &ExecutionRequest::target)
        .def_readwrite("output_path", &ExecutionRequest::outputPath)
        .def_readwrite("parameters", &ExecutionRequest::parameters)
        .def_readwrite("time_budget", &ExecutionRequest::timeBudget)
        .def_readwrite("show_statistics", &ExecutionRequest::showStatistics);

    py::class_<RawOutput>(m, "RawOutput")
        .def(py::init<>())
        .def_readwrite("out", &RawOutput::out)
        .def_readwrite("err", &RawOutput::err)
        .def_readwrite("exit_code", &RawOutput::exitCode)
        .def_readwrite("execution_time", &RawOutput::executionTime);

    py::class_<InterpretedOutput>(m, "InterpretedOutput")
        .def_readonly("errors", &InterpretedOutput::errors)
        .def_readonly("warnings", &InterpretedOutput::warnings)
        .def_readonly("statistics", &InterpretedOutput::statistics)
        .def_readonly("entities", &InterpretedOutput::entities)
        .def_readonly("kind", &InterpretedOutput::kind)
        .def_readonly("suggestions", &InterpretedOutput::suggestions);

    py::class_<NetlistSummary>(m, "NetlistSummary")
        .def_readonly("modules", &NetlistSummary::modules)
        .def_readonly("inputs", &NetlistSummary::inputs)
        .def_readonly("outputs", &NetlistSummary::outputs)
        .def_readonly("wire_count", &NetlistSummary::wireCount)
        .def_readonly("assign_count", &NetlistSummary::assignCount)
        .def_readonly("line_count", &NetlistSummary::lineCount);

    py::class_<ExecutionResult>(m, "ExecutionResult")
        .def_property_readonly("success", &ExecutionResult::success)
        .def_property_readonly("stage", [](const ExecutionResult& r) { return std::string(to_string(r.stage())); })
        .def_property_readonly("output_path", &ExecutionResult::output_path)
        .def_property_readonly("interpreted", &ExecutionResult::interpreted)
        .def_property_readonly("execution_time", &ExecutionResult::execution_time)
        .def_property_readonly("exit_code", &ExecutionResult::exit_code)
        .def_property_readonly("log_path", &ExecutionResult::log_path)
        .def_property_readonly("netlist", &ExecutionResult::netlist);

    py::class_<PathTranslator>(m, "PathTranslator")
        .def(py::init<std::string>(), py::arg("mount_root") = "/mnt")
        .def("to_foreign", &PathTranslator::to_foreign, py::arg("path"))
        .def("to_native", &PathTranslator::to_native, py::arg("path"))
        .def_static("is_drive_path", &PathTranslator::is_drive_path, py::arg("path"));

    py::class_<Session>(m, "Session")
        .def("send",
             [](Session& s, const std::string& command, std::optional<double> timeoutSeconds) {
                 if (!timeoutSeconds) return s.send(command);
                 return s.send(command, std::chrono::milliseconds(
                                            static_cast<long long>(*timeoutSeconds * 1000.0)));
             },
             py::arg("command"), py::arg("timeout") = py::none(),
             py::call_guard<py::gil_scoped_release>())
        .def("close", &Session::close, py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("state", &Session::state)
        .def_property_readonly("is_running", &Session::is_running)
        .def("__enter__", [](Session& s) -> Session& { return s; }, py::return_value_policy::reference)
        .def("__exit__", [](Session& s, py::args) { s.close(); });

    py::class_<SynthesisDriver>(m, "SynthesisDriver")
        .def(py::init<Config>(), py::arg("config") = Config())
        .def("synthesize", &SynthesisDriver::synthesize, py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("list_modules", &SynthesisDriver::list_modules, py::arg("files"))
        .def("locate", &SynthesisDriver::locate);

    py::class_<LayoutDriver>(m, "LayoutDriver")
        .def(py::init<Config>(), py::arg("config") = Config())
        .def("open_session", &LayoutDriver::open_session,
             py::call_guard<py::gil_scoped_release>())
        .def("locate", &LayoutDriver::locate);

    py::class_<PlaceRouteDriver>(m, "PlaceRouteDriver")
        .def(py::init<Config>(), py::arg("config") = Config())
        .def("run_script",
             [](PlaceRouteDriver& d, const std::filesystem::path& script, bool gui,
                std::optional<long long> budgetSeconds) {
                 if (gui) {
                     RawOutput raw;
                     raw.exitCode = d.run_script_gui(script);
                     return raw;
                 }
                 if (!budgetSeconds) return d.run_script(script);
                 return d.run_script(script, std::chrono::seconds(*budgetSeconds));
             },
             py::arg("script"), py::arg("gui") = false, py::arg("timeout") = py::none(),
             py::call_guard<py::gil_scoped_release>())
        .def_static("read_sta_report", &PlaceRouteDriver::read_sta_report, py::arg("directory"))
        .def("locate", &PlaceRouteDriver::locate);

    py::class_<ToolHandle>(m, "ToolHandle")
        .def_property_readonly("executable", &ToolHandle::executable)
        .def_property_readonly("requires_bridge", &ToolHandle::requires_bridge)
        .def_property_readonly("verified", &ToolHandle::verified);

    m.def("interpret", &interpret, py::arg("raw"));
    m.def("strip_attributes", &strip_attributes, py::arg("netlist"));
    m.def("analyze_netlist", &analyze_netlist, py::arg("netlist"));
}
