#pragma once

#include <map>
#include <string>
#include <vector>

namespace edashell {
namespace core {

/**
 * @brief How to reach binaries built for the guest environment.
 */
struct BridgeConfig {
	bool enabled{false};                                   ///< Try the bridge when a native launch cannot execute the binary
	std::string executable{"wsl"};                         ///< Bridge launcher
	std::string shell{"bash"};                             ///< Shell started inside the bridge for `-c` command lines
	std::vector<std::string> statusArguments{"--status"};  ///< Arguments of the availability check
	std::string mountRoot{"/mnt"};                         ///< Where host drives appear inside the guest
};

/**
 * @brief Per-tool discovery and invocation settings.
 */
struct ToolSpec {
	std::vector<std::string> candidates;               ///< Paths or bare names tried in order
	std::vector<std::string> versionArguments;         ///< Lightweight verification invocation
	std::string versionToken;                          ///< Accept verification when stdout contains this (case-insensitive)
	std::vector<std::string> sessionArguments;         ///< Arguments for an interactive session
	std::string shutdownCommand{"quit"};               ///< Sent by Session::close() before terminating
};

struct Config {
	std::string workingDirectory{""};       ///< Scratch directory (empty = output/script directory)
	int  verifyTimeoutSeconds{10};          ///< Locator verification budget (capped at 10 s)
	int  batchTimeoutSeconds{300};          ///< Default wall-clock budget for batch runs
	int  commandTimeoutSeconds{15};         ///< Default per-command session timeout
	int  startupSettleMs{200};              ///< Pause after spawning a session before first command
	int  terminateGraceMs{500};             ///< SIGTERM -> SIGKILL grace period
	bool writeLogFile{true};                ///< Write <output stem>.log next to synthesis output
	std::string transcriptPath{""};         ///< Optional session transcript (Command/Output/Error records)
	std::map<std::string, std::string> environment;   ///< Extra environment variables for every tool

	BridgeConfig bridge{};

	ToolSpec synthesizer{{"yosys"}, {"-V"}, "yosys", {}, "exit"};
	ToolSpec layoutEditor{{"magic"}, {"--version"}, "magic", {"-noconsole"}, "quit"};
	ToolSpec placeRoute{{"openroad"}, {"-version"}, "openroad", {"-no_splash"}, "exit"};

	/// Defaults overlaid with EDASHELL_YOSYS, EDASHELL_MAGIC, EDASHELL_OPENROAD,
	/// EDASHELL_BRIDGE and EDASHELL_WORK_DIR when set.
	static Config from_environment();
};

} // namespace core
} // namespace edashell
