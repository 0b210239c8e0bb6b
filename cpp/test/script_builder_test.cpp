#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "edashell/errors.hpp"
#include "edashell/script_builder.hpp"

using namespace edashell::core;

class ScriptBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        request_.inputs = {"/designs/mux8_2to1.v"};
        request_.topEntity = "mux8_2to1";
        request_.outputPath = "/designs/out/mux8_2to1_synth.v";
    }

    static size_t index_of(const RenderedScript& s, const std::string& line) {
        auto it = std::find(s.lines.begin(), s.lines.end(), line);
        EXPECT_NE(it, s.lines.end()) << "missing line: " << line;
        return static_cast<size_t>(it - s.lines.begin());
    }

    static ErrorKind render_error(const SynthesisScriptBuilder& b, const ExecutionRequest& r) {
        try {
            b.render(r, CircuitKind::Combinational);
        } catch (const ToolError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "render accepted an invalid request";
        return ErrorKind::NotFound;
    }

    SynthesisScriptBuilder builder_;
    ExecutionRequest request_;
};

TEST_F(ScriptBuilderTest, GenericCombinationalOrder) {
    const auto s = builder_.render(request_, CircuitKind::Combinational);

    const size_t read = index_of(s, "read_verilog /designs/mux8_2to1.v");
    const size_t hier = index_of(s, "hierarchy -check -top mux8_2to1");
    const size_t abc = index_of(
        s, "abc -g AND,NAND,OR,NOR,XOR,XNOR,MUX -script +fraig_sweep;fraig;refactor;balance");
    const size_t stat = index_of(s, "stat");
    const size_t write = index_of(s, "write_verilog -noattr /designs/out/mux8_2to1_synth.v");

    EXPECT_LT(read, hier);
    EXPECT_LT(hier, abc);
    EXPECT_LT(abc, stat);
    EXPECT_LT(stat, write);
    EXPECT_EQ(write, s.lines.size() - 1);
    EXPECT_EQ(s.workingDirectory, std::filesystem::path("/designs/out"));
}

TEST_F(ScriptBuilderTest, SequentialUsesDefaultAbc) {
    const auto s = builder_.render(request_, CircuitKind::Sequential);
    EXPECT_NE(std::find(s.lines.begin(), s.lines.end(), "abc"), s.lines.end());
    for (const auto& l : s.lines) {
        EXPECT_EQ(l.find("-g AND"), std::string::npos) << l;
    }
}

TEST_F(ScriptBuilderTest, TargetProfileSelectsSynthPass) {
    request_.target = TargetProfile::Ice40;
    const auto s = builder_.render(request_, CircuitKind::Sequential);
    index_of(s, "synth_ice40 -top mux8_2to1");
    EXPECT_EQ(std::find(s.lines.begin(), s.lines.end(), "techmap"), s.lines.end());
}

TEST_F(ScriptBuilderTest, RenderingIsDeterministic) {
    request_.inputs.push_back("/designs/helpers.v");
    request_.parameters = {{"WIDTH", "8"}, {"DEPTH", "4"}};
    const auto a = builder_.render(request_, CircuitKind::Sequential);
    const auto b = builder_.render(request_, CircuitKind::Sequential);
    EXPECT_EQ(a.text(), b.text());
    EXPECT_EQ(a.lines, b.lines);
}

TEST_F(ScriptBuilderTest, InputsKeepTheirOrderAndDefines) {
    request_.inputs = {"/d/b.v", "/d/a.v"};
    request_.parameters = {{"WIDTH", "8"}};
    const auto s = builder_.render(request_, CircuitKind::Combinational);
    EXPECT_LT(index_of(s, "read_verilog -DWIDTH=8 /d/b.v"), index_of(s, "read_verilog -DWIDTH=8 /d/a.v"));
}

TEST_F(ScriptBuilderTest, StatisticsCanBeOmitted) {
    request_.showStatistics = false;
    const auto s = builder_.render(request_, CircuitKind::Combinational);
    EXPECT_EQ(std::find(s.lines.begin(), s.lines.end(), "stat"), s.lines.end());
}

TEST_F(ScriptBuilderTest, PathsWithSpacesAreQuoted) {
    request_.inputs = {"/my designs/mux.v"};
    const auto s = builder_.render(request_, CircuitKind::Combinational);
    index_of(s, "read_verilog \"/my designs/mux.v\"");
}

TEST_F(ScriptBuilderTest, BridgeRenderingTranslatesDrivePaths) {
    request_.inputs = {R"(D:\work\mux8_2to1.v)"};
    request_.outputPath = R"(D:\work\out\mux8_2to1_synth.v)";
    const auto s = builder_.render(request_, CircuitKind::Combinational, true);
    index_of(s, "read_verilog /mnt/d/work/mux8_2to1.v");
    index_of(s, "write_verilog -noattr /mnt/d/work/out/mux8_2to1_synth.v");
}

TEST_F(ScriptBuilderTest, InvalidRequestsAreRejected) {
    auto r = request_;
    r.topEntity = "";
    EXPECT_EQ(render_error(builder_, r), ErrorKind::InvalidInput);

    r = request_;
    r.topEntity = "module mux";
    EXPECT_EQ(render_error(builder_, r), ErrorKind::InvalidInput);

    r = request_;
    r.topEntity = "9lives";
    EXPECT_EQ(render_error(builder_, r), ErrorKind::InvalidInput);

    r = request_;
    r.inputs.clear();
    EXPECT_EQ(render_error(builder_, r), ErrorKind::InvalidInput);

    r = request_;
    r.outputPath.clear();
    EXPECT_EQ(render_error(builder_, r), ErrorKind::InvalidInput);

    r = request_;
    r.parameters = {{"bad name", "1"}};
    EXPECT_EQ(render_error(builder_, r), ErrorKind::InvalidInput);
}

TEST(CircuitKindTest, DetectsStateHoldingConstructs) {
    EXPECT_EQ(detect_circuit_kind("always @(posedge clk) q <= d;"), CircuitKind::Sequential);
    EXPECT_EQ(detect_circuit_kind("ALWAYS @(NEGEDGE rst_n)"), CircuitKind::Sequential);
    EXPECT_EQ(detect_circuit_kind("reg [7:0] count;"), CircuitKind::Sequential);
    EXPECT_EQ(detect_circuit_kind("// simple latch"), CircuitKind::Sequential);
}

TEST(CircuitKindTest, PlainAssignIsCombinational) {
    const char* mux =
        "module mux8_2to1(input [7:0] a, input [7:0] b, input sel, output [7:0] y);\n"
        "  assign y = sel ? b : a;\n"
        "endmodule\n";
    EXPECT_EQ(detect_circuit_kind(mux), CircuitKind::Combinational);
}

TEST(TargetProfileTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parse_target_profile("ICE40"), TargetProfile::Ice40);
    EXPECT_EQ(parse_target_profile("generic"), TargetProfile::Generic);
    EXPECT_FALSE(parse_target_profile("asic").has_value());
}
