#include "exec_kernel/code_execution_tool.h"
#include "exec_kernel/linux_runtime.h"
#include "exec_kernel/logging.h"

#include <cmath>
#include <stdexcept>

namespace exec_kernel {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point begin) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - begin);
}

SandboxManagerOptions manager_options(const KernelConfig& c) {
    SandboxManagerOptions o;
    o.image = c.image;
    o.command = c.interpreter;
    o.max_environments = c.max_concurrent_environments;
    o.max_output_bytes = c.max_output_bytes;
    o.pids_max = c.pids_max;
    o.monitor_interval = c.monitor_interval;
    o.kill_grace = c.kill_grace;
    o.sample_timeout = c.runtime_call_timeout;
    return o;
}

EngineOptions engine_options(const KernelConfig& c) {
    EngineOptions o;
    o.command = c.interpreter;
    o.command.push_back("-c");
    o.max_output_bytes = c.max_output_bytes;
    o.kill_grace = c.kill_grace;
    o.working_dir = c.work_root;
    return o;
}

const KernelConfig& checked(const KernelConfig& c) {
    validate_config(c);
    return c;
}

} // anonymous namespace

CodeExecutionTool::CodeExecutionTool(KernelConfig config,
                                     std::shared_ptr<IsolationRuntime> runtime,
                                     std::shared_ptr<const SyntaxValidator> validator)
    : config_(checked(config)),
      validator_(validator ? std::move(validator) : std::make_shared<PythonSyntaxValidator>()),
      manager_(std::move(runtime), manager_options(config_)),
      engine_(engine_options(config_)),
      defaults_(config_.request_defaults()) {}

std::unique_ptr<CodeExecutionTool> CodeExecutionTool::create(const KernelConfig& config) {
    validate_config(config);
    set_log_level(config.log_level);

    LinuxRuntimeOptions options;
    options.cgroup_root = config.cgroup_root;
    options.work_root = config.work_root;
    options.call_timeout = config.runtime_call_timeout;
    auto runtime = std::make_shared<LinuxRuntime>(options);

    return std::make_unique<CodeExecutionTool>(config, std::move(runtime));
}

ExecutionResult CodeExecutionTool::execute(const ExecutionRequest& request, const CancellationToken& cancel) {
    return dispatch(request, cancel, config_.monitor);
}

ExecutionResult CodeExecutionTool::execute(const RequestOptions& options, const CancellationToken& cancel) {
    const auto begin = Clock::now();
    ExecutionRequest request;
    try {
        request = make_request(options, defaults());
    } catch (const std::invalid_argument& e) {
        ExecutionResult r = ExecutionResult::failed(ErrorKind::InvalidRequest, e.what(), since(begin));
        record(r);
        return r;
    }
    return dispatch(request, cancel, config_.monitor);
}

ExecutionResult CodeExecutionTool::execute_with_monitoring(const RequestOptions& options,
                                                           const CancellationToken& cancel) {
    const auto begin = Clock::now();
    ExecutionRequest request;
    try {
        request = make_request(options, defaults());
    } catch (const std::invalid_argument& e) {
        ExecutionResult r = ExecutionResult::failed(ErrorKind::InvalidRequest, e.what(), since(begin));
        record(r);
        return r;
    }
    if (!request.isolated) {
        ExecutionResult r = ExecutionResult::failed(ErrorKind::InvalidRequest,
                                                    "Monitoring requires sandbox mode", since(begin));
        record(r);
        return r;
    }
    return dispatch(request, cancel, true);
}

ExecutionResult CodeExecutionTool::dispatch(const ExecutionRequest& request, const CancellationToken& cancel,
                                            bool monitor) {
    const auto begin = Clock::now();
    ExecutionResult result;

    if (request.code.size() > config_.max_code_length) {
        result = ExecutionResult::failed(
            ErrorKind::InvalidRequest,
            "Code exceeds maximum length of " + std::to_string(config_.max_code_length) +
                " characters (got " + std::to_string(request.code.size()) + ")",
            since(begin));
        record(result);
        return result;
    }

    SyntaxCheck check;
    try {
        check = validator_->check(request.code);
    } catch (const std::exception& e) {
        result = ExecutionResult::failed(ErrorKind::InternalError,
                                         std::string("Internal error: syntax check failed: ") + e.what(),
                                         since(begin));
        record(result);
        return result;
    }
    if (!check.valid) {
        result = ExecutionResult::failed(ErrorKind::SyntaxError, check.describe(), since(begin));
        record(result);
        return result;
    }

    try {
        if (request.isolated) {
            RunOptions options;
            options.monitor = monitor;
            options.cancel = cancel;
            result = manager_.run(request, options);
        } else {
            result = engine_.run(request, cancel);
        }
    } catch (const std::exception& e) {
        result = ExecutionResult::failed(ErrorKind::InternalError,
                                         std::string("Internal error: ") + e.what(), since(begin));
        result.sandboxed = request.isolated;
    }

    record(result);
    return result;
}

void CodeExecutionTool::record(const ExecutionResult& result) {
    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        ++stats_.total;
        switch (result.error_kind) {
            case ErrorKind::None:                  ++stats_.succeeded; break;
            case ErrorKind::SyntaxError:           ++stats_.syntax_errors; break;
            case ErrorKind::RuntimeError:          ++stats_.runtime_errors; break;
            case ErrorKind::TimeoutError:          ++stats_.timeouts; break;
            case ErrorKind::ResourceLimitExceeded: ++stats_.resource_exceeded; break;
            case ErrorKind::IsolationFailure:
            case ErrorKind::InternalError:         ++stats_.infrastructure_faults; break;
            case ErrorKind::Rejected:              ++stats_.rejected; break;
            case ErrorKind::Cancelled:             ++stats_.cancelled; break;
            case ErrorKind::InvalidRequest:        ++stats_.invalid; break;
        }
    }

    if (result.success) {
        logger()->debug("execution succeeded in {}ms (sandboxed={})", result.elapsed_ms(), result.sandboxed);
    } else if (is_infrastructure_fault(result.error_kind)) {
        logger()->error("execution infrastructure fault [{}]: {}", to_string(result.error_kind),
                        result.error_message);
    } else {
        logger()->info("execution failed [{}] after {}ms", to_string(result.error_kind), result.elapsed_ms());
    }
}

SyntaxCheck CodeExecutionTool::validate_syntax(const std::string& code) const {
    if (code.size() > config_.max_code_length) {
        return SyntaxCheck::error("code exceeds maximum length of " + std::to_string(config_.max_code_length) +
                                  " characters", 0, 0);
    }
    return validator_->check(code);
}

LimitsUpdate CodeExecutionTool::update_limits(std::optional<int64_t> memory_limit_mb,
                                              std::optional<double> cpu_fraction) {
    LimitsUpdate update;
    {
        std::lock_guard<std::mutex> lock(defaults_mtx_);
        int64_t memory = memory_limit_mb.value_or(defaults_.memory_limit_mb);
        double cpu = cpu_fraction.value_or(defaults_.cpu_fraction);
        if (memory < kMinMemoryLimitMb || memory > kMaxMemoryLimitMb) {
            throw std::invalid_argument("memory_limit_mb must be between 1 and 4096, got " + std::to_string(memory));
        }
        if (std::isnan(cpu) || cpu <= 0.0 || cpu > 1.0) {
            throw std::invalid_argument("cpu_fraction must be in (0, 1]");
        }
        defaults_.memory_limit_mb = memory;
        defaults_.cpu_fraction = cpu;
        update.memory_limit_mb = memory;
        update.cpu_fraction = cpu;
    }

    update.live_environments_updated = manager_.update_limits(update.memory_limit_mb, update.cpu_fraction);
    logger()->info("limits updated: {} MB, cpu {:.2f} ({} live environments changed)",
                   update.memory_limit_mb, update.cpu_fraction, update.live_environments_updated);
    return update;
}

ExecutionRequest CodeExecutionTool::defaults() const {
    std::lock_guard<std::mutex> lock(defaults_mtx_);
    return defaults_;
}

ExecutionStats CodeExecutionTool::stats() const {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    ExecutionStats s = stats_;
    s.teardown_failures = manager_.teardown_failures() - teardown_baseline_;
    return s;
}

void CodeExecutionTool::reset_stats() {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    stats_ = ExecutionStats{};
    teardown_baseline_ = manager_.teardown_failures();
}

} // namespace exec_kernel
