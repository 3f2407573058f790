#include <gtest/gtest.h>

#include <unistd.h>

#include <string>
#include <thread>

#include "exec_kernel/code_execution_tool.h"
#include "exec_kernel/linux_runtime.h"
#include "exec_kernel/process.h"

using namespace exec_kernel;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

// These tests drive real processes. They skip on hosts without python3 or
// without permission to create namespaces.
namespace {

bool have_python() {
    return access("/usr/bin/python3", X_OK) == 0 || access("/usr/local/bin/python3", X_OK) == 0;
}

EnvironmentSpec python_spec(int memory_mb = 128) {
    EnvironmentSpec spec;
    spec.command = {"python3", "-I", "-B"};
    spec.constraints.memory_bytes = int64_t(memory_mb) * 1024 * 1024;
    spec.constraints.cpu_quota_us = 50000;
    return spec;
}

class LinuxRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!have_python()) GTEST_SKIP() << "python3 not installed";
        runtime = std::make_shared<LinuxRuntime>(runtime_options());
        try {
            EnvironmentHandle first = runtime->create_environment(python_spec());
            runtime->remove(first);
        } catch (const IsolationError& e) {
            GTEST_SKIP() << "isolation unavailable: " << e.what();
        }
    }

    virtual LinuxRuntimeOptions runtime_options() const { return {}; }

    WaitResult run(const std::string& code, EnvironmentSpec spec = python_spec(),
                   std::chrono::milliseconds timeout = 10s) {
        EnvironmentHandle h = runtime->create_environment(spec);
        runtime->start(h, code);
        WaitResult r = runtime->wait(h, Clock::now() + timeout);
        if (r.timed_out) runtime->kill(h);
        runtime->remove(h);
        return r;
    }

    std::shared_ptr<LinuxRuntime> runtime;
};

/// Same runtime with cgroups turned off: limits come from rlimits only.
class RlimitFallbackTest : public LinuxRuntimeTest {
protected:
    LinuxRuntimeOptions runtime_options() const override {
        LinuxRuntimeOptions o;
        o.use_cgroups = false;
        return o;
    }

    std::unique_ptr<CodeExecutionTool> make_tool() {
        KernelConfig config;
        config.kill_grace = 500ms;
        config.log_level = "warn";
        return std::make_unique<CodeExecutionTool>(config, runtime);
    }
};

// Forks a child that outlives the payload and prints the child's pid first.
std::string forking_payload(const std::string& then) {
    return "import os, time\n"
           "pid = os.fork()\n"
           "if pid == 0:\n"
           "    time.sleep(60)\n"
           "    os._exit(0)\n"
           "print(pid, flush=True)\n" +
           then;
}

// A killed orphan is reparented and reaped by init, so it may linger briefly as a zombie.
bool process_gone(pid_t pid, std::chrono::milliseconds within = 2s) {
    const auto until = Clock::now() + within;
    for (;;) {
        char state = ProcessManager::usage(pid).state;
        if (state == '?' || state == 'Z') return true;
        if (Clock::now() >= until) return false;
        std::this_thread::sleep_for(20ms);
    }
}

pid_t first_pid(const std::string& output) {
    return static_cast<pid_t>(std::stol(output.substr(0, output.find('\n'))));
}

} // anonymous namespace

TEST_F(LinuxRuntimeTest, RunsPayloadAndCapturesOutput) {
    WaitResult r = run("print('4')");
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.status.exit_code, 0) << r.stderr_output;
    EXPECT_EQ(r.stdout_output, "4\n");
    EXPECT_EQ(runtime->environment_count(), 0u);
}

TEST_F(LinuxRuntimeTest, ReportsNonZeroExit) {
    WaitResult r = run("import sys\nsys.stderr.write('bad')\nsys.exit(2)");
    EXPECT_EQ(r.status.exit_code, 2);
    EXPECT_EQ(r.stderr_output, "bad");
}

TEST_F(LinuxRuntimeTest, WaitReturnsAtDeadline) {
    auto start = Clock::now();
    WaitResult r = run("while True: pass", python_spec(), 500ms);
    EXPECT_TRUE(r.timed_out);
    EXPECT_LT(Clock::now() - start, 3s);
    EXPECT_EQ(runtime->environment_count(), 0u);
}

TEST_F(LinuxRuntimeTest, NetworkIsUnreachable) {
    WaitResult r = run(
        "import socket\n"
        "s = socket.socket()\n"
        "s.settimeout(2)\n"
        "try:\n"
        "    s.connect(('1.1.1.1', 53))\n"
        "    print('connected')\n"
        "except OSError:\n"
        "    print('blocked')\n");
    EXPECT_EQ(r.stdout_output, "blocked\n");
}

TEST_F(LinuxRuntimeTest, MemoryCeilingStopsAllocation) {
    if (!runtime->cgroups_enabled()) GTEST_SKIP() << "cgroup v2 not writable";
    WaitResult r = run("x = bytearray(200 * 1024 * 1024)\nprint(len(x))", python_spec(32));
    EXPECT_NE(r.status.exit_code, 0);
    EXPECT_TRUE(r.status.oom_killed);
}

TEST_F(LinuxRuntimeTest, StatsAndUpdateOnLiveEnvironment) {
    EnvironmentHandle h = runtime->create_environment(python_spec());
    runtime->start(h, "import time\ntime.sleep(1)");

    ResourceSnapshot s = runtime->stats(h);
    EXPECT_GE(s.memory_mb, 0.0);

    ResourceConstraints bigger = python_spec(256).constraints;
    EXPECT_NO_THROW(runtime->update(h, bigger));

    runtime->kill(h);
    runtime->wait(h, Clock::now() + 5s);
    runtime->remove(h);
    EXPECT_EQ(runtime->environment_count(), 0u);
}

TEST_F(LinuxRuntimeTest, UnknownHandleIsAnError) {
    EXPECT_THROW(runtime->start("missing", "pass"), IsolationError);
}

TEST_F(LinuxRuntimeTest, ToolEndToEnd) {
    KernelConfig config;
    config.kill_grace = 500ms;
    auto tool = CodeExecutionTool::create(config);

    RequestOptions o;
    o.code = "print(\"4\")";
    ExecutionResult r = tool->execute(o);
    EXPECT_TRUE(r.success) << r.error_message;
    EXPECT_EQ(r.output, "4\n");
    EXPECT_TRUE(r.sandboxed);

    o.code = "while True: pass";
    o.timeout_seconds = 1;
    ExecutionResult slow = tool->execute(o);
    EXPECT_EQ(slow.error_kind, ErrorKind::TimeoutError);
    EXPECT_EQ(tool->sandbox_manager().live_count(), 0);
}

TEST_F(RlimitFallbackTest, RunsWithoutCgroups) {
    EXPECT_FALSE(runtime->cgroups_enabled());
    WaitResult r = run("print('4')");
    EXPECT_EQ(r.status.exit_code, 0) << r.stderr_output;
    EXPECT_EQ(r.stdout_output, "4\n");
}

TEST_F(RlimitFallbackTest, ForkedChildrenDieWithTheEnvironment) {
    WaitResult r = run(forking_payload(""));
    EXPECT_EQ(r.status.exit_code, 0) << r.stderr_output;
    ASSERT_FALSE(r.stdout_output.empty());
    pid_t child = first_pid(r.stdout_output);
    EXPECT_TRUE(process_gone(child)) << "pid " << child << " survived remove";
    EXPECT_EQ(runtime->environment_count(), 0u);
}

TEST_F(RlimitFallbackTest, ForkedChildrenDieOnTimeout) {
    EnvironmentHandle h = runtime->create_environment(python_spec());
    runtime->start(h, forking_payload("while True: pass\n"));
    WaitResult r = runtime->wait(h, Clock::now() + 1s);
    EXPECT_TRUE(r.timed_out);

    runtime->kill(h);
    WaitResult killed = runtime->wait(h, Clock::now() + 5s);
    EXPECT_EQ(killed.status.term_signal, 9);
    runtime->remove(h);

    ASSERT_FALSE(killed.stdout_output.empty());
    pid_t child = first_pid(killed.stdout_output);
    EXPECT_TRUE(process_gone(child)) << "pid " << child << " survived the timeout kill";
    EXPECT_EQ(runtime->environment_count(), 0u);
}

TEST_F(RlimitFallbackTest, ForkedChildrenDieWhenThePayloadCrashes) {
    WaitResult r = run(forking_payload("os.kill(os.getpid(), 9)\n"));
    EXPECT_EQ(r.status.term_signal, 9);
    ASSERT_FALSE(r.stdout_output.empty());
    pid_t child = first_pid(r.stdout_output);
    EXPECT_TRUE(process_gone(child)) << "pid " << child << " survived remove";
    EXPECT_EQ(runtime->environment_count(), 0u);
}

TEST_F(RlimitFallbackTest, SmallMemoryLimitIsAResourceKill) {
    auto tool = make_tool();
    RequestOptions o;
    o.code = "x = bytearray(200 * 1024 * 1024)\nprint(len(x))";
    o.memory_limit_mb = 16;
    ExecutionResult r = tool->execute(o);
    EXPECT_EQ(r.error_kind, ErrorKind::ResourceLimitExceeded) << r.error_message;
    EXPECT_EQ(tool->sandbox_manager().live_count(), 0);
}

TEST_F(RlimitFallbackTest, RaisedOrPrintedMemoryErrorIsARuntimeError) {
    auto tool = make_tool();
    RequestOptions o;
    o.memory_limit_mb = 64;

    o.code = "raise MemoryError('x')";
    EXPECT_EQ(tool->execute(o).error_kind, ErrorKind::RuntimeError);

    o.code = "import sys\nsys.stderr.write('MemoryError\\n')\nsys.exit(3)";
    EXPECT_EQ(tool->execute(o).error_kind, ErrorKind::RuntimeError);
}

TEST_F(RlimitFallbackTest, RealTimeoutThroughTheTool) {
    auto tool = make_tool();
    RequestOptions o;
    o.code = "while True: pass";
    o.timeout_seconds = 1;

    auto start = Clock::now();
    ExecutionResult r = tool->execute(o);
    EXPECT_LT(Clock::now() - start, 2s);
    EXPECT_EQ(r.error_kind, ErrorKind::TimeoutError);
    EXPECT_EQ(r.error_message, "Execution timed out after 1 seconds");
    EXPECT_EQ(tool->sandbox_manager().live_count(), 0);
    EXPECT_EQ(runtime->environment_count(), 0u);
}
