#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "exec_kernel/code_execution_tool.h"
#include "fake_runtime.h"

using namespace exec_kernel;
using namespace std::chrono_literals;
using exec_kernel::test::FakeRuntime;
using Clock = std::chrono::steady_clock;

namespace {

KernelConfig test_config() {
    KernelConfig c;
    // Direct runs go through the shell so these tests need no interpreter.
    c.interpreter = {"/bin/sh"};
    c.kill_grace = 50ms;
    c.monitor_interval = 20ms;
    c.max_concurrent_environments = 4;
    c.log_level = "warn";
    return c;
}

RequestOptions options(const std::string& code) {
    RequestOptions o;
    o.code = code;
    return o;
}

class CodeExecutionToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime = std::make_shared<FakeRuntime>();
    }

    std::unique_ptr<CodeExecutionTool> make_tool(KernelConfig config = test_config()) {
        return std::make_unique<CodeExecutionTool>(config, runtime);
    }

    std::shared_ptr<FakeRuntime> runtime;
};

} // anonymous namespace

TEST_F(CodeExecutionToolTest, PrintRoundTrip) {
    runtime->script.stdout_output = "4\n";
    auto tool = make_tool();

    ExecutionResult r = tool->execute(options("print(\"4\")"));

    EXPECT_TRUE(r.success);
    EXPECT_NE(r.output.find('4'), std::string::npos);
    EXPECT_EQ(r.error_kind, ErrorKind::None);
    EXPECT_TRUE(r.error_message.empty());
    EXPECT_TRUE(r.sandboxed);
    EXPECT_EQ(runtime->creates.load(), 1);
    EXPECT_EQ(runtime->live(), 0u);
}

TEST_F(CodeExecutionToolTest, SyntaxErrorNeverCreatesAnEnvironment) {
    auto tool = make_tool();
    const std::vector<std::string> broken = {
        "print(",
        "def f()\n    return 1\n",
        "if True:\nprint(1)\n",
        "s = 'unterminated\n",
        "x = (1, 2]\n",
        "x = = 1",
        "print(1 +)",
        "1 = x",
        "for in range(3):\n    pass",
    };

    for (const auto& code : broken) {
        ExecutionResult isolated = tool->execute(options(code));
        EXPECT_EQ(isolated.error_kind, ErrorKind::SyntaxError) << code;
        EXPECT_EQ(isolated.error_message.rfind("Syntax error at line ", 0), 0u) << isolated.error_message;

        RequestOptions direct = options(code);
        direct.isolated = false;
        EXPECT_EQ(tool->execute(direct).error_kind, ErrorKind::SyntaxError) << code;
    }
    EXPECT_EQ(runtime->creates.load(), 0);
    EXPECT_EQ(runtime->starts.load(), 0);
}

TEST_F(CodeExecutionToolTest, SyntaxErrorMessageNamesLine) {
    auto tool = make_tool();
    ExecutionResult r = tool->execute(options("x = 1\nprint(x\n"));
    EXPECT_EQ(r.error_message, "Syntax error at line 2: '(' was never closed");
}

TEST_F(CodeExecutionToolTest, OversizedCodeIsRejectedBeforeParsing) {
    KernelConfig c = test_config();
    c.max_code_length = 16;
    auto tool = make_tool(c);

    ExecutionResult r = tool->execute(options(std::string(17, 'x')));
    EXPECT_EQ(r.error_kind, ErrorKind::InvalidRequest);
    EXPECT_NE(r.error_message.find("maximum length of 16"), std::string::npos);
    EXPECT_EQ(runtime->creates.load(), 0);

    EXPECT_TRUE(tool->execute(options(std::string(16, 'x'))).success);
}

TEST_F(CodeExecutionToolTest, OutOfRangeOverridesAreInvalid) {
    auto tool = make_tool();
    RequestOptions o = options("pass");
    o.timeout_seconds = 301;
    EXPECT_EQ(tool->execute(o).error_kind, ErrorKind::InvalidRequest);

    o = options("pass");
    o.memory_limit_mb = 0;
    EXPECT_EQ(tool->execute(o).error_kind, ErrorKind::InvalidRequest);

    o = options("pass");
    o.cpu_fraction = 1.5;
    EXPECT_EQ(tool->execute(o).error_kind, ErrorKind::InvalidRequest);
    EXPECT_EQ(runtime->creates.load(), 0);
}

TEST_F(CodeExecutionToolTest, OverridesReachTheEnvironment) {
    auto tool = make_tool();
    RequestOptions o = options("pass");
    o.memory_limit_mb = 16;
    o.cpu_fraction = 0.2;
    tool->execute(o);

    EnvironmentSpec spec = runtime->last_spec();
    EXPECT_EQ(spec.constraints.memory_bytes, 16LL * 1024 * 1024);
    EXPECT_EQ(spec.constraints.cpu_quota_us, 20000);
    EXPECT_TRUE(spec.network_disabled);
}

TEST_F(CodeExecutionToolTest, TimeoutThroughTheFacade) {
    runtime->script.behavior = FakeRuntime::Behavior::Hang;
    auto tool = make_tool();
    RequestOptions o = options("while True: pass");
    o.timeout_seconds = 1;

    auto start = Clock::now();
    ExecutionResult r = tool->execute(o);
    EXPECT_EQ(r.error_kind, ErrorKind::TimeoutError);
    EXPECT_LT(Clock::now() - start, 1500ms);
    EXPECT_EQ(runtime->live(), 0u);
}

TEST_F(CodeExecutionToolTest, DirectModeSkipsTheRuntime) {
    auto tool = make_tool();
    RequestOptions o = options("echo 4");
    o.isolated = false;

    ExecutionResult r = tool->execute(o);

    EXPECT_TRUE(r.success) << r.error_message;
    EXPECT_EQ(r.output, "4\n");
    EXPECT_FALSE(r.sandboxed);
    EXPECT_EQ(runtime->creates.load(), 0);
}

TEST_F(CodeExecutionToolTest, MonitoringRequiresSandboxMode) {
    auto tool = make_tool();
    RequestOptions o = options("pass");
    o.isolated = false;

    ExecutionResult r = tool->execute_with_monitoring(o);
    EXPECT_EQ(r.error_kind, ErrorKind::InvalidRequest);
    EXPECT_EQ(r.error_message, "Monitoring requires sandbox mode");
}

TEST_F(CodeExecutionToolTest, MonitoringAttachesUsage) {
    runtime->script.run_time = 150ms;
    runtime->script.memory_mb = 20.0;
    auto tool = make_tool();

    ExecutionResult r = tool->execute_with_monitoring(options("pass"));

    EXPECT_TRUE(r.success);
    ASSERT_TRUE(r.resource_usage.has_value());
    EXPECT_GT(r.resource_usage->samples, 0);
    EXPECT_DOUBLE_EQ(r.resource_usage->peak_memory_mb, 20.0);
    EXPECT_GT(runtime->stats_calls.load(), 0);
}

TEST_F(CodeExecutionToolTest, UpdateLimitsWithoutLiveEnvironmentChangesDefaults) {
    auto tool = make_tool();

    LimitsUpdate u = tool->update_limits(256, std::nullopt);
    EXPECT_EQ(u.memory_limit_mb, 256);
    EXPECT_DOUBLE_EQ(u.cpu_fraction, 0.5);
    EXPECT_EQ(u.live_environments_updated, 0);

    LimitsUpdate again = tool->update_limits(256, std::nullopt);
    EXPECT_EQ(again.memory_limit_mb, u.memory_limit_mb);
    EXPECT_DOUBLE_EQ(again.cpu_fraction, u.cpu_fraction);

    tool->execute(options("pass"));
    EXPECT_EQ(runtime->last_spec().constraints.memory_bytes, 256LL * 1024 * 1024);
    EXPECT_EQ(tool->defaults().memory_limit_mb, 256);

    EXPECT_THROW(tool->update_limits(5000, std::nullopt), std::invalid_argument);
    EXPECT_THROW(tool->update_limits(std::nullopt, 0.0), std::invalid_argument);
    EXPECT_EQ(tool->defaults().memory_limit_mb, 256);
}

TEST_F(CodeExecutionToolTest, UpdateLimitsReachesLiveEnvironment) {
    runtime->script.run_time = 400ms;
    auto tool = make_tool();

    ExecutionResult r;
    std::thread worker([&] { r = tool->execute(options("pass")); });
    auto until = Clock::now() + 2s;
    auto running = [&] {
        auto live = tool->sandbox_manager().live_sandboxes();
        return live.size() == 1 && live[0].state == SandboxState::Running;
    };
    while (!running() && Clock::now() < until) std::this_thread::sleep_for(5ms);

    LimitsUpdate u = tool->update_limits(512, 1.0);
    worker.join();

    EXPECT_EQ(u.live_environments_updated, 1);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(runtime->creates.load(), 1);
}

TEST_F(CodeExecutionToolTest, ConcurrencyCeilingRejectsTheExtraRequest) {
    runtime->script.run_time = 400ms;
    KernelConfig c = test_config();
    c.max_concurrent_environments = 2;
    auto tool = make_tool(c);

    std::vector<ExecutionResult> results(2);
    std::vector<std::thread> workers;
    for (int i = 0; i < 2; ++i) {
        workers.emplace_back([&, i] { results[i] = tool->execute(options("pass")); });
    }
    auto until = Clock::now() + 2s;
    while (tool->sandbox_manager().live_count() < 2 && Clock::now() < until) {
        std::this_thread::sleep_for(5ms);
    }
    ExecutionResult extra = tool->execute(options("pass"));
    for (auto& t : workers) t.join();

    EXPECT_EQ(extra.error_kind, ErrorKind::Rejected);
    EXPECT_TRUE(results[0].success);
    EXPECT_TRUE(results[1].success);
    EXPECT_EQ(tool->stats().rejected, 1u);
}

TEST_F(CodeExecutionToolTest, IsolationFailureIsCountedAsInfrastructureFault) {
    runtime->fail_create = true;
    auto tool = make_tool();

    ExecutionResult r = tool->execute(options("pass"));
    EXPECT_EQ(r.error_kind, ErrorKind::IsolationFailure);
    EXPECT_EQ(tool->stats().infrastructure_faults, 1u);
}

TEST_F(CodeExecutionToolTest, StatsCountEachOutcomeOnce) {
    auto tool = make_tool();
    tool->execute(options("pass"));
    tool->execute(options("print("));
    runtime->script.exit_code = 1;
    tool->execute(options("raise SystemExit(1)"));

    ExecutionStats s = tool->stats();
    EXPECT_EQ(s.total, 3u);
    EXPECT_EQ(s.succeeded, 1u);
    EXPECT_EQ(s.syntax_errors, 1u);
    EXPECT_EQ(s.runtime_errors, 1u);

    tool->reset_stats();
    EXPECT_EQ(tool->stats().total, 0u);
}

TEST_F(CodeExecutionToolTest, TeardownFailuresAreCountedBesideTheOutcome) {
    runtime->fail_remove = true;
    runtime->script.stdout_output = "4\n";
    auto tool = make_tool();

    ExecutionResult r = tool->execute(options("print(4)"));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.output, "4\n");

    ExecutionStats s = tool->stats();
    EXPECT_EQ(s.succeeded, 1u);
    EXPECT_EQ(s.infrastructure_faults, 0u);
    EXPECT_EQ(s.teardown_failures, 1u);

    tool->reset_stats();
    EXPECT_EQ(tool->stats().teardown_failures, 0u);
    tool->execute(options("print(4)"));
    EXPECT_EQ(tool->stats().teardown_failures, 1u);
}

TEST_F(CodeExecutionToolTest, ValidateSyntaxDoesNotExecute) {
    auto tool = make_tool();
    EXPECT_TRUE(tool->validate_syntax("print(1)").valid);
    SyntaxCheck bad = tool->validate_syntax("for x in y\n    pass\n");
    EXPECT_FALSE(bad.valid);
    EXPECT_EQ(bad.message, "expected ':'");
    EXPECT_EQ(runtime->creates.load(), 0);
}

TEST_F(CodeExecutionToolTest, RejectsInvalidConfiguration) {
    KernelConfig c = test_config();
    c.max_concurrent_environments = 0;
    EXPECT_THROW(make_tool(c), ConfigError);
}
