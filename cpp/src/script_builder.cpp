#include "edashell/script_builder.hpp"
#include "edashell/dev_debug.hpp"
#include "edashell/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace edashell {
namespace core {

namespace {

constexpr std::array<std::string_view, 7> SEQUENTIAL_MARKERS{
    "always @(posedge",
    "always @(negedge",
    "always @(edge",
    "reg ",
    "flip",
    "latch",
    "memory",
};

// Leaner ABC run for pure logic; avoids the redundant-warning class the
// default script triggers on combinational netlists.
constexpr const char* COMBINATIONAL_ABC =
    "abc -g AND,NAND,OR,NOR,XOR,XNOR,MUX -script +fraig_sweep;fraig;refactor;balance";
constexpr const char* SEQUENTIAL_ABC = "abc";

std::string lowercase(std::string_view s) {
    std::string r(s);
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
}

const char* target_synth_pass(TargetProfile target) noexcept {
    switch (target) {
    case TargetProfile::Ice40:  return "synth_ice40";
    case TargetProfile::Ecp5:   return "synth_ecp5";
    case TargetProfile::Xilinx: return "synth_xilinx";
    case TargetProfile::Intel:  return "synth_intel";
    case TargetProfile::Generic: break;
    }
    return nullptr;
}

[[noreturn]] void invalid(const std::string& message, std::vector<std::string> hints = {}) {
    throw ToolError(ErrorKind::InvalidInput, message, {}, std::move(hints));
}

} // namespace

const char* to_string(TargetProfile target) noexcept {
    switch (target) {
    case TargetProfile::Generic: return "generic";
    case TargetProfile::Ice40:   return "ice40";
    case TargetProfile::Ecp5:    return "ecp5";
    case TargetProfile::Xilinx:  return "xilinx";
    case TargetProfile::Intel:   return "intel";
    }
    return "generic";
}

std::optional<TargetProfile> parse_target_profile(std::string_view name) {
    const std::string n = lowercase(name);
    for (auto t : {TargetProfile::Generic, TargetProfile::Ice40, TargetProfile::Ecp5,
                   TargetProfile::Xilinx, TargetProfile::Intel}) {
        if (n == to_string(t)) return t;
    }
    return std::nullopt;
}

const char* to_string(CircuitKind kind) noexcept {
    return kind == CircuitKind::Sequential ? "sequential" : "combinational";
}

CircuitKind detect_circuit_kind(std::string_view sourceText) {
    const std::string text = lowercase(sourceText);
    for (auto marker : SEQUENTIAL_MARKERS) {
        if (text.find(marker) != std::string::npos) return CircuitKind::Sequential;
    }
    return CircuitKind::Combinational;
}

std::string RenderedScript::text() const {
    std::string out;
    for (const auto& l : lines) {
        out += l;
        out += '\n';
    }
    return out;
}

std::string quote_if_needed(std::string_view token) {
    static constexpr std::string_view SPECIAL = " \t\"'$`\\;&|<>()[]{}#*?!~";
    if (!token.empty() && token.find_first_of(SPECIAL) == std::string_view::npos) {
        return std::string(token);
    }
    std::string q;
    q.reserve(token.size() + 2);
    q += '"';
    for (char c : token) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') q += '\\';
        q += c;
    }
    q += '"';
    return q;
}

SynthesisScriptBuilder::SynthesisScriptBuilder(PathTranslator translator)
    : translator_(std::move(translator)) {}

bool SynthesisScriptBuilder::is_identifier(std::string_view name) noexcept {
    if (name.empty()) return false;
    auto head = static_cast<unsigned char>(name.front());
    if (!(std::isalpha(head) || head == '_')) return false;
    return std::all_of(name.begin() + 1, name.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return std::isalnum(c) || c == '_' || c == '$';
    });
}

std::string SynthesisScriptBuilder::format_path_(const std::filesystem::path& path,
                                                 bool forBridge) const {
    std::string s = path.string();
    if (forBridge && PathTranslator::is_drive_path(s)) {
        s = translator_.to_foreign(s);
    }
    std::replace(s.begin(), s.end(), '\\', '/');
    return quote_if_needed(s);
}

RenderedScript SynthesisScriptBuilder::render(const ExecutionRequest& request,
                                              CircuitKind kind,
                                              bool forBridge) const {
    if (request.topEntity.empty()) {
        invalid("top-level entity name is empty",
                {"Name the top module of the design"});
    }
    if (!is_identifier(request.topEntity)) {
        invalid("top-level entity '" + request.topEntity + "' is not a valid module name",
                {"Check module name spelling"});
    }
    if (request.inputs.empty()) {
        invalid("no input files given", {"Add at least one Verilog source file"});
    }
    if (request.outputPath.empty()) {
        invalid("no output path given", {"Choose where the synthesized netlist is written"});
    }

    std::string defines;
    for (const auto& [name, value] : request.parameters) {
        if (!is_identifier(name)) {
            invalid("parameter name '" + name + "' is not a valid identifier");
        }
        defines += quote_if_needed("-D" + name + "=" + value);
        defines += ' ';
    }

    RenderedScript script;
    auto& l = script.lines;

    l.push_back("# Yosys synthesis script for module " + request.topEntity);
    l.push_back(std::string("# Circuit kind: ") + to_string(kind));
    l.push_back(std::string("# Target: ") + to_string(request.target));

    for (const auto& in : request.inputs) {
        l.push_back("read_verilog " + defines + format_path_(in, forBridge));
    }

    l.push_back("hierarchy -check -top " + request.topEntity);
    l.push_back("proc");
    l.push_back("opt");
    l.push_back("memory");
    l.push_back("opt");

    if (const char* pass = target_synth_pass(request.target)) {
        l.push_back(std::string(pass) + " -top " + request.topEntity);
    } else {
        l.push_back("fsm");
        l.push_back("opt");
        l.push_back("techmap");
        l.push_back("opt");
        l.push_back(kind == CircuitKind::Combinational ? COMBINATIONAL_ABC : SEQUENTIAL_ABC);
        l.push_back("clean");
    }

    if (request.showStatistics) l.push_back("stat");
    l.push_back("write_verilog -noattr " + format_path_(request.outputPath, forBridge));

    script.workingDirectory = request.outputPath.parent_path();

    EDASHELL_DBG("BATCH", "rendered %zu lines for top=%s kind=%s target=%s",
                 l.size(), request.topEntity.c_str(), to_string(kind), to_string(request.target));
    return script;
}

} // namespace core
} // namespace edashell
