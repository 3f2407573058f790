#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "cancellation.h"
#include "config.h"
#include "execution_engine.h"
#include "isolation_runtime.h"
#include "sandbox_manager.h"
#include "syntax_validator.h"
#include "types.h"

namespace exec_kernel {

struct LimitsUpdate {
    int64_t memory_limit_mb = 0;
    double cpu_fraction = 0.0;
    int live_environments_updated = 0;
};

/// Counters since construction or the last reset_stats().
struct ExecutionStats {
    uint64_t total = 0;
    uint64_t succeeded = 0;
    uint64_t syntax_errors = 0;
    uint64_t runtime_errors = 0;
    uint64_t timeouts = 0;
    uint64_t resource_exceeded = 0;
    uint64_t infrastructure_faults = 0;
    uint64_t rejected = 0;
    uint64_t cancelled = 0;
    uint64_t invalid = 0;
    uint64_t teardown_failures = 0;  // not an outcome; counted beside the run's own
};

/// Entry point for code execution requests.
///
/// Rejects oversized input, validates syntax, then dispatches to the
/// SandboxManager (isolated) or the ExecutionEngine (direct). Every call
/// yields exactly one result and none of them throw.
class CodeExecutionTool {
public:
    CodeExecutionTool(KernelConfig config,
                      std::shared_ptr<IsolationRuntime> runtime,
                      std::shared_ptr<const SyntaxValidator> validator = nullptr);

    /// Tool wired to a LinuxRuntime built from `config`.
    static std::unique_ptr<CodeExecutionTool> create(const KernelConfig& config);

    ExecutionResult execute(const ExecutionRequest& request, const CancellationToken& cancel = {});

    /// Caller-facing form: out-of-range overrides yield InvalidRequest.
    ExecutionResult execute(const RequestOptions& options, const CancellationToken& cancel = {});

    /// Isolated run with periodic sampling; usage is attached to the result.
    /// Direct mode has nothing to sample and yields InvalidRequest.
    ExecutionResult execute_with_monitoring(const RequestOptions& options, const CancellationToken& cancel = {});

    /// Throws std::runtime_error if the parser cannot be started.
    SyntaxCheck validate_syntax(const std::string& code) const;

    /// Change defaults for future requests and apply them to live
    /// environments. Unset arguments keep their current value. Throws
    /// std::invalid_argument on out-of-range values.
    LimitsUpdate update_limits(std::optional<int64_t> memory_limit_mb, std::optional<double> cpu_fraction);

    ExecutionRequest defaults() const;
    ExecutionStats stats() const;
    void reset_stats();

    const KernelConfig& config() const { return config_; }
    SandboxManager& sandbox_manager() { return manager_; }

private:
    ExecutionResult dispatch(const ExecutionRequest& request, const CancellationToken& cancel, bool monitor);
    void record(const ExecutionResult& result);

    KernelConfig config_;
    std::shared_ptr<const SyntaxValidator> validator_;
    SandboxManager manager_;
    ExecutionEngine engine_;

    mutable std::mutex defaults_mtx_;
    ExecutionRequest defaults_;

    mutable std::mutex stats_mtx_;
    ExecutionStats stats_;
    uint64_t teardown_baseline_ = 0;
};

} // namespace exec_kernel
