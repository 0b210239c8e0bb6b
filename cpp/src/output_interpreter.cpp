#include "edashell/output_interpreter.hpp"
#include "edashell/dev_debug.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace edashell {
namespace core {

namespace {

const std::vector<std::string> NOT_FOUND_HINTS{
    "Check module name spelling",
    "Ensure module is defined in the input files",
};

const std::vector<std::string> SYNTAX_HINTS{
    "Check Verilog syntax",
    "Look for missing semicolons or parentheses",
};

std::string trim(std::string_view s) {
    const char* ws = " \t\r\n\f\v";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(ws);
    return std::string(s.substr(b, e - b + 1));
}

std::string rtrim(std::string_view s) {
    const auto e = s.find_last_not_of(" \t\r\f\v");
    return e == std::string_view::npos ? std::string() : std::string(s.substr(0, e + 1));
}

std::string lowercase(std::string_view s) {
    std::string r(s);
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
}

bool has(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

void add_hints(std::vector<std::string>& out, const std::vector<std::string>& hints) {
    for (const auto& h : hints) {
        if (std::find(out.begin(), out.end(), h) == out.end()) out.push_back(h);
    }
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) nl = text.size();
        lines.emplace_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }
    return lines;
}

// "input [7:0] a, b;" -> {"a", "b"}
void collect_names(const std::string& declaration, std::vector<std::string>& out) {
    std::string list = declaration;
    if (auto close = list.rfind(']'); close != std::string::npos) list.erase(0, close + 1);
    if (auto semi = list.find(';'); semi != std::string::npos) list.erase(semi);
    list = trim(list);
    for (const char* kw : {"wire ", "reg "}) {
        if (list.rfind(kw, 0) == 0) list.erase(0, std::char_traits<char>::length(kw));
    }

    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::string name = trim(item);
        if (!name.empty() && name.front() == '\\') name.erase(0, 1);
        if (!name.empty()) out.push_back(name);
    }
}

size_t count_names(const std::string& declaration) {
    std::vector<std::string> names;
    collect_names(declaration, names);
    return names.size();
}

} // namespace

const char* to_string(DiagnosticKind kind) noexcept {
    switch (kind) {
    case DiagnosticKind::EntityNotFound: return "EntityNotFound";
    case DiagnosticKind::SyntaxError:    return "SyntaxError";
    }
    return "Unknown";
}

const char* to_string(Stage stage) noexcept {
    switch (stage) {
    case Stage::Completed:     return "completed";
    case Stage::ToolFailed:    return "failed";
    case Stage::OutputMissing: return "output_missing";
    }
    return "unknown";
}

InterpretedOutput interpret(const RawOutput& raw) {
    static const std::regex statLine(R"(number of\s+([a-z0-9_$ ]*[a-z0-9_$])\s*:\s*(\d+))",
                                     std::regex::icase);
    static const std::regex entityLine(
        R"(generating rtlil representation for module\s+`?\\?([A-Za-z_][A-Za-z0-9_$]*))",
        std::regex::icase);

    InterpretedOutput result;
    std::smatch m;

    for (const auto& rawLine : split_lines(raw.out + "\n" + raw.err)) {
        const std::string line = trim(rawLine);
        if (line.empty()) continue;
        const std::string lower = lowercase(line);

        if (has(lower, "error:") || has(lower, "fatal:") || has(lower, "abort")) {
            result.errors.push_back(line);
            if (has(lower, "not found")) {
                result.kind = DiagnosticKind::EntityNotFound;
                add_hints(result.suggestions, NOT_FOUND_HINTS);
            }
            if (has(lower, "syntax error")) {
                result.kind = DiagnosticKind::SyntaxError;
                add_hints(result.suggestions, SYNTAX_HINTS);
            }
            continue;
        }

        if (has(lower, "warning:") || has(lower, "warn:")) {
            result.warnings.push_back(line);
            continue;
        }

        if (std::regex_search(line, m, statLine)) {
            result.statistics[lowercase(m[1].str())] = std::strtol(m[2].str().c_str(), nullptr, 10);
            continue;
        }

        if (std::regex_search(line, m, entityLine)) {
            result.entities.push_back(m[1].str());
        }
    }

    EDASHELL_DBG("PARSE", "errors=%zu warnings=%zu stats=%zu entities=%zu kind=%s",
                 result.errors.size(), result.warnings.size(), result.statistics.size(),
                 result.entities.size(), result.kind ? to_string(*result.kind) : "-");
    return result;
}

std::vector<std::string> declared_modules(std::string_view source) {
    static const std::regex moduleDecl(R"(\bmodule\s+\\?([A-Za-z_][A-Za-z0-9_$]*))");

    std::vector<std::string> names;
    const std::string text(source);
    for (auto it = std::sregex_iterator(text.begin(), text.end(), moduleDecl);
         it != std::sregex_iterator(); ++it) {
        names.push_back((*it)[1].str());
    }
    return names;
}

NetlistSummary analyze_netlist(std::string_view netlist) {
    NetlistSummary summary;
    const auto lines = split_lines(netlist);
    summary.lineCount = lines.size();

    for (const auto& rawLine : lines) {
        const std::string line = trim(rawLine);
        if (line.rfind("module ", 0) == 0) {
            auto names = declared_modules(line);
            summary.modules.insert(summary.modules.end(), names.begin(), names.end());
        } else if (line.rfind("input ", 0) == 0) {
            collect_names(line.substr(6), summary.inputs);
        } else if (line.rfind("output ", 0) == 0) {
            collect_names(line.substr(7), summary.outputs);
        } else if (line.rfind("wire ", 0) == 0) {
            summary.wireCount += count_names(line.substr(5));
        } else if (line.rfind("assign ", 0) == 0) {
            ++summary.assignCount;
        }
    }
    return summary;
}

std::string strip_attributes(std::string_view netlist) {
    std::string text(netlist);

    // (* ... *) may span lines; "@(*)" is a sensitivity list, not an attribute.
    for (size_t open = text.find("(*"); open != std::string::npos; open = text.find("(*", open)) {
        if (open + 2 < text.size() && text[open + 2] == ')') {
            open += 3;
            continue;
        }
        const size_t close = text.find("*)", open + 2);
        if (close == std::string::npos) break;
        text.erase(open, close + 2 - open);
    }

    std::string out;
    bool previousBlank = false;
    for (const auto& rawLine : split_lines(text)) {
        std::string line = rawLine;
        if (auto c = line.find("//"); c != std::string::npos) line.erase(c);
        line = rtrim(line);

        const bool blank = line.empty();
        if (blank && previousBlank) continue;
        previousBlank = blank;
        out += line;
        out += '\n';
    }

    while (!out.empty() && (out.back() == '\n' || out.back() == ' ' || out.back() == '\t')) {
        out.pop_back();
    }
    out += '\n';
    return out;
}

} // namespace core
} // namespace edashell
