#include "edashell/tool_locator.hpp"
#include "edashell/dev_debug.hpp"
#include "edashell/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <utility>

#include <unistd.h>

namespace edashell {
namespace core {

namespace fs = std::filesystem;

namespace {

constexpr int MAX_VERIFY_SECONDS = 10;

bool contains_nocase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return false;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

} // namespace

ToolLocator::ToolLocator(Config config, ToolSpec spec)
    : config_(std::move(config)), spec_(std::move(spec)), runner_(config_) {}

std::optional<std::string> ToolLocator::search_path(std::string_view name) {
    const char* env = std::getenv("PATH");
    if (!env || name.empty()) return std::nullopt;

    std::string_view path(env);
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t end = path.find(':', pos);
        if (end == std::string_view::npos) end = path.size();
        std::string dir(path.substr(pos, end - pos));
        if (dir.empty()) dir = ".";

        fs::path candidate = fs::path(dir) / std::string(name);
        std::error_code ec;
        if (::access(candidate.c_str(), X_OK) == 0 && !fs::is_directory(candidate, ec)) {
            return candidate.string();
        }
        pos = end + 1;
    }
    return std::nullopt;
}

std::chrono::seconds ToolLocator::verify_budget_() const {
    return std::chrono::seconds(std::clamp(config_.verifyTimeoutSeconds, 1, MAX_VERIFY_SECONDS));
}

bool ToolLocator::verify_(const ToolHandle& candidate) const {
    try {
        const RawOutput raw = runner_.run(candidate, spec_.versionArguments, "", verify_budget_());
        const bool ok = raw.exitCode == 0 || contains_nocase(raw.out, spec_.versionToken);
        EDASHELL_DBG("LOCATE", "verify %s bridged=%d exit=%d -> %s", candidate.executable().c_str(),
                     candidate.requires_bridge() ? 1 : 0, raw.exitCode, ok ? "ok" : "rejected");
        return ok;
    } catch (const ToolError& e) {
        if (e.kind() != ErrorKind::Timeout) throw;
        EDASHELL_DBG("LOCATE", "verify %s timed out", candidate.executable().c_str());
        return false;
    }
}

bool ToolLocator::bridge_available_() const {
    const ToolHandle bridge(config_.bridge.executable, false, false);
    try {
        const RawOutput raw = runner_.run(bridge, config_.bridge.statusArguments, "", verify_budget_());
        EDASHELL_DBG("LOCATE", "bridge %s status exit=%d", config_.bridge.executable.c_str(), raw.exitCode);
        return raw.exitCode == 0;
    } catch (const ToolError& e) {
        EDASHELL_DBG("LOCATE", "bridge %s unavailable: %s", config_.bridge.executable.c_str(), e.what());
        return false;
    }
}

std::optional<ToolHandle> ToolLocator::locate(const std::vector<std::string>& candidates) const {
    for (const auto& candidate : candidates) {
        if (candidate.empty()) continue;

        // A host drive path can only be reached from inside the bridge.
        if (PathTranslator::is_drive_path(candidate)) {
            if (!config_.bridge.enabled) {
                EDASHELL_DBG("LOCATE", "skip %s: drive path without bridge", candidate.c_str());
                continue;
            }
            try {
                const ToolHandle bridged(candidate, true, false);
                if (bridge_available_() && verify_(bridged)) return ToolHandle(candidate, true, true);
            } catch (const ToolError& e) {
                EDASHELL_DBG("LOCATE", "bridged %s failed: %s", candidate.c_str(), e.what());
            }
            continue;
        }

        std::string resolved;
        if (candidate.find('/') != std::string::npos) {
            std::error_code ec;
            if (!fs::exists(candidate, ec)) {
                EDASHELL_DBG("LOCATE", "skip %s: does not exist", candidate.c_str());
                continue;
            }
            resolved = candidate;
        } else if (auto hit = search_path(candidate)) {
            resolved = *hit;
        } else {
            EDASHELL_DBG("LOCATE", "skip %s: not on PATH", candidate.c_str());
            continue;
        }

        try {
            if (verify_(ToolHandle(resolved, false, false))) return ToolHandle(resolved, false, true);
            continue;
        } catch (const ToolError& e) {
            const bool foreignBinary = e.kind() == ErrorKind::ProcessStartFailure &&
                                       e.system_error() == ENOEXEC;
            EDASHELL_DBG("LOCATE", "native %s failed: %s", resolved.c_str(), e.what());
            if (!foreignBinary || !config_.bridge.enabled) continue;
        }

        try {
            const ToolHandle bridged(resolved, true, false);
            if (bridge_available_() && verify_(bridged)) return ToolHandle(resolved, true, true);
        } catch (const ToolError& e) {
            EDASHELL_DBG("LOCATE", "bridged %s failed: %s", resolved.c_str(), e.what());
        }
    }
    return std::nullopt;
}

std::optional<ToolHandle> ToolLocator::locate() const {
    return locate(spec_.candidates);
}

} // namespace core
} // namespace edashell
