#include "edashell/batch_runner.hpp"
#include "edashell/dev_debug.hpp"
#include "edashell/errors.hpp"

#include <atomic>
#include <fstream>
#include <thread>
#include <utility>

#include <unistd.h>

namespace edashell {
namespace core {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned long> g_scratchCounter{0};

std::string double_quoted(std::string_view s) {
    std::string q;
    q.reserve(s.size() + 2);
    q += '"';
    for (char c : s) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') q += '\\';
        q += c;
    }
    q += '"';
    return q;
}

double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

} // namespace

ScratchScript::ScratchScript(const fs::path& directory,
                             std::string_view extension,
                             const std::string& text) {
    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string name = "edashell_" + std::to_string(::getpid()) + "_" +
                       std::to_string(g_scratchCounter.fetch_add(1)) + "_" +
                       std::to_string(static_cast<long long>(ticks)) + std::string(extension);
    path_ = directory / name;

    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ToolError(ErrorKind::InvalidInput,
                        "cannot write script file '" + path_.string() + "'",
                        {}, {"Check that the working directory exists and is writable"});
    }
    out << text;
    out.close();
    if (!out) {
        std::error_code ec;
        fs::remove(path_, ec);
        throw ToolError(ErrorKind::InvalidInput,
                        "cannot write script file '" + path_.string() + "'",
                        {}, {"Check free disk space in the working directory"});
    }
    EDASHELL_DBG("BATCH", "scratch script %s (%zu bytes)", path_.c_str(), text.size());
}

ScratchScript::~ScratchScript() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        EDASHELL_DBG("BATCH", "failed to remove %s: %s", path_.c_str(), ec.message().c_str());
    }
}

std::vector<std::string> build_command_line(const ToolHandle& handle,
                                            const std::vector<std::string>& args,
                                            const std::string& workingDir,
                                            const BridgeConfig& bridge) {
    if (!handle.requires_bridge()) {
        std::vector<std::string> argv;
        argv.reserve(args.size() + 1);
        argv.push_back(handle.executable());
        argv.insert(argv.end(), args.begin(), args.end());
        return argv;
    }

    const PathTranslator translator(bridge.mountRoot);
    auto foreign = [&](const std::string& s) {
        return PathTranslator::is_drive_path(s) ? translator.to_foreign(s) : s;
    };

    std::string command;
    if (!workingDir.empty()) {
        command += "cd " + double_quoted(foreign(workingDir)) + " && ";
    }
    command += double_quoted(foreign(handle.executable()));
    for (const auto& a : args) {
        command += ' ';
        command += quote_if_needed(foreign(a));
    }
    return {bridge.executable, bridge.shell, "-c", command};
}

BatchRunner::BatchRunner(Config config) : config_(std::move(config)) {}

ProcessConfig BatchRunner::process_config_(const ToolHandle& handle,
                                           const std::vector<std::string>& args,
                                           const std::string& workingDir,
                                           bool capture) const {
    ProcessConfig pc;
    pc.argv = build_command_line(handle, args, workingDir, config_.bridge);
    // A bridged command line changes directory itself, inside the guest.
    if (!handle.requires_bridge()) pc.working_directory = workingDir;
    pc.environment = config_.environment;
    pc.pipe_stdin = false;
    pc.capture_output = capture;
    return pc;
}

void BatchRunner::start_(ChildProcess& child, const ToolHandle& handle) const {
    try {
        child.start();
    } catch (const ToolError& e) {
        if (!handle.requires_bridge()) throw;
        throw ToolError(ErrorKind::BridgeFailure,
                        "environment bridge '" + config_.bridge.executable +
                            "' could not be launched: " + e.what(),
                        e.detail(),
                        {"Check that the bridge is installed and enabled",
                         "Run '" + config_.bridge.executable + " --status' to diagnose"},
                        e.system_error());
    }
}

RawOutput BatchRunner::run(const ToolHandle& handle,
                           const std::vector<std::string>& args,
                           const std::string& workingDir,
                           std::chrono::seconds budget) const {
    ChildProcess child(process_config_(handle, args, workingDir, true));
    const auto t0 = std::chrono::steady_clock::now();
    start_(child, handle);
    EDASHELL_DBG("BATCH", "pid=%d tool=%s args=%zu budget=%llds bridged=%d",
                 static_cast<int>(child.native_pid()), handle.executable().c_str(), args.size(),
                 static_cast<long long>(budget.count()), handle.requires_bridge() ? 1 : 0);

    RawOutput raw;
    std::thread outReader([&child, &raw] { raw.out = child.read_all_stdout(); });
    std::thread errReader([&child, &raw] { raw.err = child.read_all_stderr(); });

    const auto status = child.wait_for(budget);
    if (!status) {
        child.terminate(std::chrono::milliseconds(config_.terminateGraceMs));
    }
    // Helpers left in the group would keep the pipes open past the budget;
    // killing them closes every writer, which ends both readers.
    child.kill_group();
    outReader.join();
    errReader.join();
    raw.executionTime = seconds_since(t0);

    if (!status) {
        EDASHELL_DBG("TIMEOUT", "tool=%s exceeded %llds, killed",
                     handle.executable().c_str(), static_cast<long long>(budget.count()));
        const std::string secs = std::to_string(budget.count());
        throw ToolError(ErrorKind::Timeout,
                        "'" + handle.executable() + "' did not finish within " + secs + "s",
                        raw.err.empty() ? raw.out : raw.err,
                        {"Increase timeout (current: " + secs + "s)",
                         "Simplify the design or split it into smaller modules"});
    }

    raw.exitCode = *status;
    EDASHELL_DBG("BATCH", "tool=%s exit=%d time=%.3fs out=%zu err=%zu",
                 handle.executable().c_str(), raw.exitCode, raw.executionTime,
                 raw.out.size(), raw.err.size());
    EDASHELL_DBG_BLOCK("IO", "stderr", raw.err);
    return raw;
}

RawOutput BatchRunner::run_batch(const ToolHandle& handle,
                                 const RenderedScript& script,
                                 std::chrono::seconds budget,
                                 const BatchOptions& options) const {
    fs::path dir = config_.workingDirectory.empty() ? script.workingDirectory
                                                    : fs::path(config_.workingDirectory);
    if (dir.empty()) dir = fs::current_path();

    ScratchScript scratch(dir, options.extension, script.text());

    std::vector<std::string> args;
    if (options.gui) args.emplace_back("-gui");
    args.insert(args.end(), options.scriptFlag.begin(), options.scriptFlag.end());
    args.push_back(scratch.path().string());
    args.insert(args.end(), options.extraArguments.begin(), options.extraArguments.end());

    const std::string workDir = script.workingDirectory.empty() ? dir.string()
                                                                : script.workingDirectory.string();
    return run(handle, args, workDir, budget);
}

int BatchRunner::run_gui(const ToolHandle& handle,
                         const std::vector<std::string>& args,
                         const std::string& workingDir) const {
    ChildProcess child(process_config_(handle, args, workingDir, false));
    start_(child, handle);
    EDASHELL_DBG("BATCH", "gui pid=%d tool=%s", static_cast<int>(child.native_pid()),
                 handle.executable().c_str());
    const int status = child.wait();
    EDASHELL_DBG("BATCH", "gui tool=%s exit=%d", handle.executable().c_str(), status);
    return status;
}

} // namespace core
} // namespace edashell
