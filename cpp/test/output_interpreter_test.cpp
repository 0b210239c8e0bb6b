#include <string>

#include <gtest/gtest.h>

#include "edashell/output_interpreter.hpp"

using namespace edashell::core;

namespace {

RawOutput raw(std::string out, std::string err = {}) {
    RawOutput r;
    r.out = std::move(out);
    r.err = std::move(err);
    return r;
}

} // namespace

TEST(OutputInterpreterTest, ModuleNotFoundScenario) {
    const auto result = interpret(raw("ERROR: module 'foo' not found"));

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "ERROR: module 'foo' not found");
    ASSERT_TRUE(result.kind.has_value());
    EXPECT_EQ(*result.kind, DiagnosticKind::EntityNotFound);
    EXPECT_FALSE(result.suggestions.empty());
}

TEST(OutputInterpreterTest, SyntaxErrorFromStderr) {
    const auto result = interpret(raw("", "  top.v:3: ERROR: syntax error, unexpected ';'\n"));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.kind, DiagnosticKind::SyntaxError);
    EXPECT_EQ(result.suggestions.front(), "Check Verilog syntax");
}

TEST(OutputInterpreterTest, SuggestionsAreNotRepeated) {
    const auto result = interpret(raw("ERROR: module 'a' not found\nERROR: module 'b' not found\n"));
    EXPECT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.suggestions.size(), 2u);
}

TEST(OutputInterpreterTest, LastClassifiedLineWins) {
    const auto result = interpret(raw("ERROR: syntax error near x\nERROR: module 'foo' not found\n"));
    EXPECT_EQ(result.kind, DiagnosticKind::EntityNotFound);
    EXPECT_EQ(result.suggestions.size(), 4u);
}

TEST(OutputInterpreterTest, WarningsStatisticsAndEntities) {
    const std::string log =
        "1. Executing Verilog-2005 frontend: /d/mux8_2to1.v\n"
        "Generating RTLIL representation for module `\\mux8_2to1'.\n"
        "Warning: Replacing memory \\mem with list of registers.\n"
        "   Number of wires:                 12\n"
        "   Number of wire bits:             40\n"
        "   Number of cells:                  9\n"
        "   Number of cells:                  8\n"
        "\n"
        "End of script.\n";
    const auto result = interpret(raw(log));

    EXPECT_TRUE(result.errors.empty());
    EXPECT_FALSE(result.kind.has_value());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.statistics.at("wires"), 12);
    EXPECT_EQ(result.statistics.at("wire bits"), 40);
    EXPECT_EQ(result.statistics.at("cells"), 8);
    ASSERT_EQ(result.entities.size(), 1u);
    EXPECT_EQ(result.entities[0], "mux8_2to1");
}

TEST(OutputInterpreterTest, InterpretationIsRepeatable) {
    const auto r = raw("Generating RTLIL representation for module `\\top'.\nWARNING: x\n",
                       "ERROR: module 'foo' not found\n");
    const auto a = interpret(r);
    const auto b = interpret(r);
    EXPECT_EQ(a.errors, b.errors);
    EXPECT_EQ(a.warnings, b.warnings);
    EXPECT_EQ(a.statistics, b.statistics);
    EXPECT_EQ(a.entities, b.entities);
    EXPECT_EQ(a.kind, b.kind);
    EXPECT_EQ(a.suggestions, b.suggestions);
}

TEST(OutputInterpreterTest, UnknownOutputYieldsEmptyResult) {
    const auto result = interpret(raw("\x01\x02 garbage\n\n   \nnothing to see\n"));
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_TRUE(result.statistics.empty());
    EXPECT_TRUE(result.entities.empty());
    EXPECT_TRUE(result.suggestions.empty());
}

TEST(NetlistTest, StripAttributesAndComments) {
    const std::string netlist =
        "/* Generated by Yosys */\n"
        "\n"
        "(* top =  1  *)\n"
        "(* src = \"mux.v:1.1-5.10\" *)\n"
        "module mux8_2to1(a, b, sel, y);   \n"
        "  // select\n"
        "  input [7:0] a;\n"
        "\n"
        "\n"
        "\n"
        "  assign y = sel ? b : a;\n"
        "endmodule\n"
        "\n\n";
    const std::string cleaned = strip_attributes(netlist);

    EXPECT_EQ(cleaned.find("(*"), std::string::npos);
    EXPECT_EQ(cleaned.find("// select"), std::string::npos);
    EXPECT_EQ(cleaned.find("\n\n\n"), std::string::npos);
    EXPECT_NE(cleaned.find("module mux8_2to1(a, b, sel, y);\n"), std::string::npos);
    ASSERT_FALSE(cleaned.empty());
    EXPECT_EQ(cleaned.back(), '\n');
    EXPECT_NE(cleaned.substr(cleaned.size() - 2), "\n\n");
    EXPECT_EQ(strip_attributes(cleaned), cleaned);
}

TEST(NetlistTest, SensitivityListIsNotAnAttribute) {
    const std::string netlist =
        "module r(clk, d, q);\n"
        "  always @(*) q = d;\n"
        "  (* keep *) wire k;\n"
        "endmodule\n";
    EXPECT_EQ(strip_attributes(netlist),
              "module r(clk, d, q);\n"
              "  always @(*) q = d;\n"
              "   wire k;\n"
              "endmodule\n");
}

TEST(NetlistTest, SummaryCountsPortsAndDeclarations) {
    const std::string netlist =
        "module mux8_2to1(a, b, sel, y);\n"
        "  wire _0_;\n"
        "  wire _1_, _2_;\n"
        "  input [7:0] a;\n"
        "  input [7:0] b;\n"
        "  input sel;\n"
        "  output [7:0] y;\n"
        "  assign y[0] = sel ? b[0] : a[0];\n"
        "  assign y[1] = sel ? b[1] : a[1];\n"
        "endmodule\n";
    const auto s = analyze_netlist(netlist);
    EXPECT_EQ(s.modules, std::vector<std::string>{"mux8_2to1"});
    EXPECT_EQ(s.inputs, (std::vector<std::string>{"a", "b", "sel"}));
    EXPECT_EQ(s.outputs, std::vector<std::string>{"y"});
    EXPECT_EQ(s.wireCount, 3u);
    EXPECT_EQ(s.assignCount, 2u);
    EXPECT_EQ(s.lineCount, 10u);
}

TEST(NetlistTest, DeclaredModulesSkipsEndmodule) {
    const std::string src = "module a(); endmodule\nmodule b(); endmodule\n";
    EXPECT_EQ(declared_modules(src), (std::vector<std::string>{"a", "b"}));
}
