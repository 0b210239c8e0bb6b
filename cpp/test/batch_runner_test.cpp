#include <chrono>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "edashell/batch_runner.hpp"
#include "edashell/errors.hpp"
#include "test_support.hpp"

using namespace edashell::core;
using edashell::test::TempDir;

class BatchRunnerTest : public ::testing::Test {
protected:
    BatchRunnerTest() : runner_(make_config()) {}

    static Config make_config() {
        Config c;
        c.terminateGraceMs = 100;
        return c;
    }

    RenderedScript script(const std::string& body) {
        RenderedScript s;
        s.lines = {"# test script", body};
        s.workingDirectory = dir_.path();
        return s;
    }

    TempDir dir_;
    BatchRunner runner_;
};

TEST_F(BatchRunnerTest, CapturesOutputAndExitCode) {
    auto tool = dir_.write_tool("tool.sh", "echo out-line\necho err-line >&2\nexit 3\n");
    const RawOutput r = runner_.run(ToolHandle(tool.string(), false, true), {}, dir_.path().string(),
                                    std::chrono::seconds(10));
    EXPECT_EQ(r.out, "out-line\n");
    EXPECT_EQ(r.err, "err-line\n");
    EXPECT_EQ(r.exitCode, 3);
    EXPECT_GE(r.executionTime, 0.0);
}

TEST_F(BatchRunnerTest, RunsInTheWorkingDirectory) {
    auto tool = dir_.write_tool("pwd.sh", "pwd\n");
    const RawOutput r = runner_.run(ToolHandle(tool.string(), false, true), {}, dir_.path().string(),
                                    std::chrono::seconds(10));
    EXPECT_EQ(r.out, std::filesystem::canonical(dir_.path()).string() + "\n");
}

TEST_F(BatchRunnerTest, ScriptFileIsPassedAndRemovedOnSuccess) {
    auto tool = dir_.write_tool("yosys", "[ \"$1\" = \"-s\" ] || exit 9\ncat \"$2\"\n");
    const RawOutput r = runner_.run_batch(ToolHandle(tool.string(), false, true),
                                          script("stat"), std::chrono::seconds(10));
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_EQ(r.out, "# test script\nstat\n");
    EXPECT_TRUE(dir_.files_with_extension(".ys").empty());
}

TEST_F(BatchRunnerTest, ScriptFileIsRemovedOnToolFailure) {
    auto tool = dir_.write_tool("yosys", "echo 'ERROR: boom' >&2\nexit 1\n");
    const RawOutput r = runner_.run_batch(ToolHandle(tool.string(), false, true),
                                          script("stat"), std::chrono::seconds(10));
    EXPECT_EQ(r.exitCode, 1);
    EXPECT_TRUE(dir_.files_with_extension(".ys").empty());
}

TEST_F(BatchRunnerTest, TimeoutKillsToolAndRemovesScript) {
    auto tool = dir_.write_tool("yosys", "sleep 30\n");
    const auto t0 = std::chrono::steady_clock::now();
    try {
        runner_.run_batch(ToolHandle(tool.string(), false, true), script("stat"),
                          std::chrono::seconds(1));
        FAIL() << "expected Timeout";
    } catch (const ToolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
        ASSERT_FALSE(e.suggestions().empty());
        EXPECT_EQ(e.suggestions().front(), "Increase timeout (current: 1s)");
    }
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(10));
    EXPECT_TRUE(dir_.files_with_extension(".ys").empty());
}

TEST_F(BatchRunnerTest, BackgroundHelperDoesNotOutliveTheBudget) {
    // The helper inherits stdout and would keep the readers waiting for 8 s.
    auto tool = dir_.write_tool("tool.sh", "sleep 8 &\necho started\nexit 0\n");
    const auto t0 = std::chrono::steady_clock::now();
    const RawOutput r = runner_.run(ToolHandle(tool.string(), false, true), {}, dir_.path().string(),
                                    std::chrono::seconds(2));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(4));
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_EQ(r.out, "started\n");
}

TEST_F(BatchRunnerTest, MissingExecutableIsStartFailure) {
    try {
        runner_.run(ToolHandle((dir_ / "no-such-tool").string(), false, true), {},
                    dir_.path().string(), std::chrono::seconds(5));
        FAIL() << "expected ProcessStartFailure";
    } catch (const ToolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProcessStartFailure);
        EXPECT_NE(e.system_error(), 0);
    }
}

TEST_F(BatchRunnerTest, BadWorkingDirectoryIsStartFailure) {
    auto tool = dir_.write_tool("tool.sh", "exit 0\n");
    try {
        runner_.run(ToolHandle(tool.string(), false, true), {}, (dir_ / "missing").string(),
                    std::chrono::seconds(5));
        FAIL() << "expected ProcessStartFailure";
    } catch (const ToolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProcessStartFailure);
    }
}

TEST_F(BatchRunnerTest, MissingBridgeIsBridgeFailure) {
    Config c = make_config();
    c.bridge.enabled = true;
    c.bridge.executable = (dir_ / "no-bridge").string();
    BatchRunner bridged(c);
    try {
        bridged.run(ToolHandle("/opt/openroad/bin/openroad", true, true), {"-version"}, "",
                    std::chrono::seconds(5));
        FAIL() << "expected BridgeFailure";
    } catch (const ToolError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::BridgeFailure);
    }
}

TEST_F(BatchRunnerTest, GuiRunReturnsExitStatus) {
    auto tool = dir_.write_tool("gui.sh", "[ \"$1\" = \"-gui\" ] && exit 4\nexit 0\n");
    EXPECT_EQ(runner_.run_gui(ToolHandle(tool.string(), false, true), {"-gui"}, dir_.path().string()), 4);
}

TEST(CommandLineTest, NativeHandleKeepsArguments) {
    const auto argv = build_command_line(ToolHandle("/usr/bin/yosys", false, true), {"-s", "x.ys"},
                                         "/tmp", BridgeConfig{});
    EXPECT_EQ(argv, (std::vector<std::string>{"/usr/bin/yosys", "-s", "x.ys"}));
}

TEST(CommandLineTest, BridgedHandleIsWrappedAndTranslated) {
    BridgeConfig bridge;
    bridge.enabled = true;
    const auto argv = build_command_line(ToolHandle(R"(D:\OpenROAD\bin\openroad)", true, true),
                                         {"-gui", R"(D:\flows\run.tcl)"}, R"(D:\flows)", bridge);
    ASSERT_EQ(argv.size(), 4u);
    EXPECT_EQ(argv[0], "wsl");
    EXPECT_EQ(argv[1], "bash");
    EXPECT_EQ(argv[2], "-c");
    EXPECT_EQ(argv[3], R"(cd "/mnt/d/flows" && "/mnt/d/OpenROAD/bin/openroad" -gui /mnt/d/flows/run.tcl)");
}

TEST(CommandLineTest, BridgedGuestPathsStayVerbatim) {
    const auto argv = build_command_line(ToolHandle("/usr/local/bin/openroad", true, true),
                                         {"-version"}, "", BridgeConfig{});
    ASSERT_EQ(argv.size(), 4u);
    EXPECT_EQ(argv[3], R"("/usr/local/bin/openroad" -version)");
}
