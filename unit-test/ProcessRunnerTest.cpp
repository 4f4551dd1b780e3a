#include <cerrno>
#include <csignal>
#include <filesystem>
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/process_runner.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codify;
namespace fs = std::filesystem;

static process_result run(const vector<string> &argv, const string &input = "", int time_limit = 5000, size_t output_limit = 1 << 20) {
    return run_process({argv, TEMP_DIR, input, time_limit, output_limit});
}

TEST(ProcessRunnerTest, PipesStdinToStdout) {
    auto result = run({"cat"}, "hello\nworld\n");
    EXPECT_FALSE(result.spawn_failed);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello\nworld\n");
    EXPECT_EQ(result.error, "");
}

TEST(ProcessRunnerTest, LargeInputDoesNotDeadlock) {
    string input(1 << 20, 'x');
    auto result = run({"cat"}, input);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output.size(), input.size());
}

TEST(ProcessRunnerTest, CapturesStderrAndExitCode) {
    auto result = run({"sh", "-c", "echo out; echo err >&2; exit 3"});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.output, "out\n");
    EXPECT_EQ(result.error, "err\n");
}

TEST(ProcessRunnerTest, ArgumentsAreNotInterpretedByShell) {
    auto result = run({"echo", "$HOME; rm -rf /"});
    EXPECT_EQ(result.output, "$HOME; rm -rf /\n");
}

TEST(ProcessRunnerTest, RunsInWorkingDirectory) {
    auto result = run_process({{"pwd"}, TEMP_DIR, "", 5000, 1 << 20});
    EXPECT_EQ(fs::path(result.output.substr(0, result.output.size() - 1)), fs::canonical(TEMP_DIR));
}

TEST(ProcessRunnerTest, KillsProcessOnTimeout) {
    auto result = run({"sleep", "10"}, "", 300);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.term_signal, SIGKILL);
    EXPECT_LT(result.elapsed, 5000);
}

TEST(ProcessRunnerTest, KillsWholeProcessGroupOnTimeout) {
    // 后台子进程持有 stdout，必须连同整个进程组一起终止，否则会一直等待
    auto result = run({"sh", "-c", "sleep 10 & sleep 10; wait"}, "", 300);
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.elapsed, 5000);
}

TEST(ProcessRunnerTest, StopsProcessExceedingOutputLimit) {
    auto result = run({"yes"}, "", 5000, 4096);
    EXPECT_TRUE(result.output_limit_exceeded);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.output.size(), 4096u);
}

TEST(ProcessRunnerTest, ReportsMissingProgram) {
    auto result = run({"codify-no-such-program"});
    EXPECT_TRUE(result.spawn_failed);
    EXPECT_EQ(result.spawn_errno, ENOENT);
}

TEST(ProcessRunnerTest, IgnoresProgramThatClosesStdinEarly) {
    string input(1 << 20, 'x');
    auto result = run({"true"}, input);
    EXPECT_FALSE(result.spawn_failed);
    EXPECT_EQ(result.exit_code, 0);
}

class ProcessRunnerWorkspaceTest : public ::testing::Test {
protected:
    ProcessRunnerWorkspaceTest()
        : manager(TEMP_DIR / "runner-test"), runner(manager) {}

    execution_limits limits{5000, 1 << 20, 500, 1 << 16};
    toolchain_registry registry;
    workspace_manager manager;
    process_runner runner;
};

TEST_F(ProcessRunnerWorkspaceTest, ExpandsPlaceholders) {
    workspace ws = manager.create(registry.resolve("java"), "public class Solution {}");
    auto argv = process_runner::expand({"java", "-cp", "{workdir}", "{entry}", "{source}"}, ws);
    EXPECT_EQ(argv, (vector<string>{"java", "-cp", ws.root_path.string(), "Solution", ws.source_path.string()}));
    manager.destroy(ws);
}

TEST_F(ProcessRunnerWorkspaceTest, ExecuteRunsInterpretedCode) {
    auto outcome = runner.execute(shell_toolchain(), "read name; echo \"hello $name\"", "world\n", limits);
    EXPECT_EQ(outcome.kind, outcome_kind::SUCCESS);
    EXPECT_EQ(outcome.fault, error_type::NONE);
    EXPECT_EQ(outcome.output, "hello world\n");
    EXPECT_GE(outcome.elapsed, 0);
    EXPECT_EQ(count_workspace_entries(manager), 0u);
}

TEST_F(ProcessRunnerWorkspaceTest, NonZeroExitIsRuntimeError) {
    auto outcome = runner.execute(shell_toolchain(), "echo boom >&2; exit 2", "", limits);
    EXPECT_EQ(outcome.kind, outcome_kind::RUNTIME_ERROR);
    EXPECT_EQ(outcome.fault, error_type::RUNTIME);
    EXPECT_EQ(outcome.exit_code, 2);
    EXPECT_EQ(outcome.error, "boom\n");
}

TEST_F(ProcessRunnerWorkspaceTest, TimeoutOnlyWhenForciblyTerminated) {
    auto outcome = runner.execute(shell_toolchain(), "sleep 10", "", limits);
    EXPECT_EQ(outcome.kind, outcome_kind::TIMEOUT);
    EXPECT_EQ(outcome.fault, error_type::TIMEOUT);
    EXPECT_FALSE(outcome.error.empty());
    EXPECT_EQ(count_workspace_entries(manager), 0u);
}

TEST_F(ProcessRunnerWorkspaceTest, OutputLimitIsRuntimeError) {
    auto outcome = runner.execute(shell_toolchain(), "yes", "", limits);
    EXPECT_EQ(outcome.kind, outcome_kind::RUNTIME_ERROR);
    EXPECT_EQ(outcome.fault, error_type::OUTPUT_LIMIT);
}

TEST_F(ProcessRunnerWorkspaceTest, CompilesBeforeRunning) {
    auto outcome = runner.execute(checked_shell_toolchain(), "echo compiled", "", limits);
    EXPECT_EQ(outcome.kind, outcome_kind::SUCCESS);
    EXPECT_EQ(outcome.output, "compiled\n");
    EXPECT_EQ(count_workspace_entries(manager), 0u);
}

TEST_F(ProcessRunnerWorkspaceTest, CompileFailureSkipsRun) {
    auto outcome = runner.execute(checked_shell_toolchain(), "if then fi (", "", limits);
    EXPECT_EQ(outcome.kind, outcome_kind::COMPILE_ERROR);
    EXPECT_EQ(outcome.fault, error_type::COMPILATION);
    EXPECT_FALSE(outcome.error.empty());
    EXPECT_EQ(count_workspace_entries(manager), 0u);
}

TEST_F(ProcessRunnerWorkspaceTest, MissingInterpreterIsConfigurationFault) {
    toolchain missing = {"ghost", "Ghost", ".ghost", {}, {"codify-no-such-interpreter", "{source}"}};
    auto outcome = runner.execute(missing, "anything", "", limits);
    EXPECT_EQ(outcome.kind, outcome_kind::RUNTIME_ERROR);
    EXPECT_EQ(outcome.fault, error_type::CONFIGURATION);
    EXPECT_NE(outcome.error.find("codify-no-such-interpreter"), string::npos);
}

TEST_F(ProcessRunnerWorkspaceTest, MissingCompilerIsConfigurationFault) {
    toolchain missing = {"ghost", "Ghost", ".ghost", {"codify-no-such-compiler", "{source}"}, {"{executable}"}};
    auto outcome = runner.execute(missing, "anything", "", limits);
    EXPECT_EQ(outcome.kind, outcome_kind::COMPILE_ERROR);
    EXPECT_EQ(outcome.fault, error_type::CONFIGURATION);
}
