#include <gtest/gtest.h>
#include "executors/script_executor.hpp"
#include "test_util.hpp"
#include "work_area.hpp"
#include <signal.h>
#include <cerrno>
#include <chrono>
#include <thread>

namespace fs = std::filesystem;

// /bin/sh stands in for the interpreter: the executor only cares that some
// program runs script.py from inside the work area.
class ScriptExecutorTest : public ::testing::Test {
protected:
    TempDir root;
    WorkArea area = WorkArea::open(root.path());
    ScriptExecutor sh{"/bin/sh", 1024 * 1024};
};

TEST_F(ScriptExecutorTest, CapturesStdoutAndStderrSeparately) {
    RunOutcome r = sh.run(area.path(), "echo hello\necho oops >&2\n", 10);
    EXPECT_EQ(r.status, RunStatus::Exited);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.stdout_text, "hello\n");
    EXPECT_EQ(r.stderr_text, "oops\n");
}

TEST_F(ScriptExecutorTest, ReportsExitCode) {
    RunOutcome r = sh.run(area.path(), "echo partial\nexit 3\n", 10);
    EXPECT_EQ(r.status, RunStatus::Exited);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.stdout_text, "partial\n");
}

TEST_F(ScriptExecutorTest, ReportsTerminatingSignal) {
    RunOutcome r = sh.run(area.path(), "kill -9 $$\n", 10);
    EXPECT_EQ(r.status, RunStatus::Signalled);
    EXPECT_EQ(r.term_signal, SIGKILL);
}

TEST_F(ScriptExecutorTest, RunsInsideWorkArea) {
    RunOutcome r = sh.run(area.path(), "pwd\nls\n", 10);
    EXPECT_EQ(r.status, RunStatus::Exited);
    EXPECT_EQ(r.stdout_text, area.path().string() + "\n" + kScriptFilename + "\n");
    EXPECT_TRUE(fs::exists(area.path() / kScriptFilename));
}

TEST_F(ScriptExecutorTest, SetsHeadlessEnvironment) {
    RunOutcome r = sh.run(area.path(), "echo $MPLBACKEND $PYTHONUNBUFFERED\n", 10);
    EXPECT_EQ(r.stdout_text, "Agg 1\n");
}

TEST_F(ScriptExecutorTest, StdinIsEmpty) {
    RunOutcome r = sh.run(area.path(), "cat\necho done\n", 5);
    EXPECT_EQ(r.status, RunStatus::Exited);
    EXPECT_EQ(r.stdout_text, "done\n");
}

TEST_F(ScriptExecutorTest, TimesOut) {
    auto t0 = std::chrono::steady_clock::now();
    RunOutcome r = sh.run(area.path(), "echo started\nsleep 30\n", 0.5);
    auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_EQ(r.status, RunStatus::TimedOut);
    EXPECT_EQ(r.stdout_text, "started\n");
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(ScriptExecutorTest, TimeoutKillsDescendants) {
    RunOutcome r = sh.run(area.path(), "sleep 30 &\necho $! > child.pid\nwait\n", 0.5);
    ASSERT_EQ(r.status, RunStatus::TimedOut);

    pid_t child = static_cast<pid_t>(std::stol(read_file(area.path() / "child.pid")));
    auto gone = [child] {
        if (::kill(child, 0) != 0) return errno == ESRCH;
        // reparented and killed but not yet reaped
        std::string stat = read_file("/proc/" + std::to_string(child) + "/stat");
        auto close = stat.rfind(')');
        return close != std::string::npos && close + 2 < stat.size() && stat[close + 2] == 'Z';
    };
    bool dead = false;
    for (int i = 0; i < 40 && !(dead = gone()); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_TRUE(dead);
}

TEST_F(ScriptExecutorTest, TruncatesOutputAtLimit) {
    ScriptExecutor capped{"/bin/sh", 100};
    RunOutcome r = capped.run(area.path(),
                              "i=0\nwhile [ $i -lt 100 ]; do printf 0123456789; i=$((i+1)); done\n", 10);
    EXPECT_EQ(r.status, RunStatus::Exited);
    EXPECT_EQ(r.stdout_text.size(), 100u);
    EXPECT_TRUE(r.stdout_truncated);
    EXPECT_FALSE(r.stderr_truncated);
}

TEST_F(ScriptExecutorTest, MissingInterpreter) {
    ScriptExecutor missing{"/nonexistent/python3", 1024};
    RunOutcome r = missing.run(area.path(), "print(1)\n", 5);
    EXPECT_EQ(r.status, RunStatus::SpawnFailed);
    EXPECT_TRUE(r.interpreter_missing);
    EXPECT_EQ(missing.interpreter(), "/nonexistent/python3");
}

TEST(ScriptExecutorLookup, FindsProgramsOnPath) {
    auto sh = ScriptExecutor::find_program("sh");
    ASSERT_TRUE(sh);
    EXPECT_TRUE(fs::path(*sh).is_absolute());
    EXPECT_FALSE(ScriptExecutor::find_program("codebox-no-such-program"));
    EXPECT_FALSE(ScriptExecutor::find_program(""));
}
