#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "cancellation.h"
#include "isolation_runtime.h"
#include "resource_limiter.h"
#include "types.h"

namespace exec_kernel {

enum class SandboxState {
    Created,
    Starting,
    Running,
    Completed,
    TimedOut,
    ResourceExceeded,
    Crashed,
    Cancelled,
    Terminated,
};

const char* to_string(SandboxState state) noexcept;

struct Sandbox {
    EnvironmentHandle id;
    SandboxState state = SandboxState::Created;
    int64_t memory_limit_mb = 0;
    double cpu_fraction = 0.0;
    std::chrono::system_clock::time_point created_at;
};

struct SandboxManagerOptions {
    std::string image = "python:3.11-slim";
    std::vector<std::string> command{"python3", "-I", "-B"};
    int max_environments = 8;
    size_t max_output_bytes = 1 << 20;
    int64_t pids_max = 64;
    std::chrono::milliseconds monitor_interval{100};
    std::chrono::milliseconds kill_grace{2000};
    std::chrono::milliseconds sample_timeout{500};
};

struct RunOptions {
    bool monitor = false;
    CancellationToken cancel;
    /// Called from the monitoring thread for every successful sample.
    std::function<void(const EnvironmentHandle&, const ResourceSnapshot&)> on_sample;
};

/// Runs requests inside isolated environments, one environment per request.
///
/// Each run drives its sandbox through Created -> Starting -> Running ->
/// {Completed | TimedOut | ResourceExceeded | Crashed | Cancelled} and always
/// ends in Terminated before run() returns, whatever happened on the way.
class SandboxManager {
public:
    using TransitionListener = std::function<void(const Sandbox&)>;

    SandboxManager(std::shared_ptr<IsolationRuntime> runtime, SandboxManagerOptions options = {});

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    /// Never throws: every failure becomes a failed result.
    ExecutionResult run(const ExecutionRequest& request, const RunOptions& options = {});

    /// Apply new limits to every live environment. Returns how many changed.
    int update_limits(int64_t memory_limit_mb, double cpu_fraction);

    /// Sandboxes that have not reached Terminated yet.
    std::vector<Sandbox> live_sandboxes() const;
    int live_count() const { return live_.load(); }

    /// Environments whose teardown reported a failure. Such a failure is
    /// logged and counted; the result already decided for the run stands.
    uint64_t teardown_failures() const { return teardown_failures_.load(); }

    /// Invoked on every state change. Set before running requests.
    void set_transition_listener(TransitionListener listener) { listener_ = std::move(listener); }

    const SandboxManagerOptions& options() const { return options_; }
    ResourceLimiter& limiter() { return limiter_; }

private:
    class Lease;

    bool try_acquire_slot();
    void release_slot();
    void transition(Sandbox& sandbox, SandboxState state);

    ExecutionResult supervise(const ExecutionRequest& request, const RunOptions& options,
                              Sandbox& sandbox, std::unique_ptr<Lease>& lease,
                              std::chrono::steady_clock::time_point begin);

    std::shared_ptr<IsolationRuntime> runtime_;
    SandboxManagerOptions options_;
    ResourceLimiter limiter_;
    TransitionListener listener_;

    std::atomic<int> live_{0};
    std::atomic<uint64_t> teardown_failures_{0};

    mutable std::mutex sandboxes_mtx_;
    std::unordered_map<EnvironmentHandle, Sandbox> sandboxes_;
};

} // namespace exec_kernel
