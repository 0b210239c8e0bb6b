#include "edashell/config.hpp"
#include "edashell/dev_debug.hpp"

#include <cstdlib>

namespace edashell {
namespace core {

namespace {

const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

// An override is tried first; the built-in candidates stay as fallbacks.
void prepend_candidate(ToolSpec& spec, const char* name) {
    if (const char* v = env_value(name)) {
        spec.candidates.insert(spec.candidates.begin(), v);
        EDASHELL_DBG("CONFIG", "%s=%s", name, v);
    }
}

} // namespace

Config Config::from_environment() {
    Config cfg;
    prepend_candidate(cfg.synthesizer, "EDASHELL_YOSYS");
    prepend_candidate(cfg.layoutEditor, "EDASHELL_MAGIC");
    prepend_candidate(cfg.placeRoute, "EDASHELL_OPENROAD");

    if (const char* bridge = env_value("EDASHELL_BRIDGE")) {
        cfg.bridge.enabled = true;
        cfg.bridge.executable = bridge;
        EDASHELL_DBG("CONFIG", "EDASHELL_BRIDGE=%s", bridge);
    }
    if (const char* dir = env_value("EDASHELL_WORK_DIR")) {
        cfg.workingDirectory = dir;
    }
    return cfg;
}

} // namespace core
} // namespace edashell
