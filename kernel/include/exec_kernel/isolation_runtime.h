#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "types.h"

namespace exec_kernel {

using EnvironmentHandle = std::string;

/// Raised by runtime clients when the isolation layer itself misbehaves.
class IsolationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ResourceConstraints {
    int64_t memory_bytes = -1;      // hard ceiling, swap disabled; -1 = unlimited
    int64_t cpu_quota_us = -1;      // per cpu_period_us; -1 = unlimited
    int64_t cpu_period_us = 100000;
    int64_t pids_max = 64;

    bool operator==(const ResourceConstraints& o) const {
        return memory_bytes == o.memory_bytes && cpu_quota_us == o.cpu_quota_us &&
               cpu_period_us == o.cpu_period_us && pids_max == o.pids_max;
    }
    bool operator!=(const ResourceConstraints& o) const { return !(*this == o); }
};

struct EnvironmentSpec {
    std::string image;                 // runtime identifier, may be ignored
    std::vector<std::string> command;  // interpreter argv, payload file appended
    ResourceConstraints constraints;
    bool network_disabled = true;
    size_t max_output_bytes = 1 << 20;
};

struct ExitStatus {
    int exit_code = -1;   // valid when term_signal == 0
    int term_signal = 0;
    bool oom_killed = false;
    bool quota_killed = false;  // CPU time or file size rlimit
};

struct WaitResult {
    bool timed_out = false;
    ExitStatus status;
    std::string stdout_output;
    std::string stderr_output;
    ResourceUsage usage;
};

/// Client of the isolation runtime: one environment per handle.
///
/// create/start/kill/remove/stats/update must return within a bounded time.
/// wait() blocks until the environment exits or `deadline` passes and must be
/// callable concurrently with kill() for the same handle.
class IsolationRuntime {
public:
    virtual ~IsolationRuntime() = default;

    /// Allocate an environment without starting it. Network is off when requested.
    virtual EnvironmentHandle create_environment(const EnvironmentSpec& spec) = 0;

    /// Inject the code payload and let the environment run.
    virtual void start(const EnvironmentHandle& handle, const std::string& code) = 0;

    virtual WaitResult wait(const EnvironmentHandle& handle,
                            std::chrono::steady_clock::time_point deadline) = 0;

    /// Forcibly stop everything inside the environment.
    virtual void kill(const EnvironmentHandle& handle) = 0;

    /// Release every resource held by the environment. Kills first if needed.
    virtual void remove(const EnvironmentHandle& handle) = 0;

    /// Point-in-time usage. Only cpu_percent and memory_mb are filled in.
    virtual ResourceSnapshot stats(const EnvironmentHandle& handle) = 0;

    /// Change the constraints of a live environment in place.
    virtual void update(const EnvironmentHandle& handle, const ResourceConstraints& constraints) = 0;

    /// False when calls other than wait() must not overlap.
    virtual bool concurrent_safe() const { return true; }
};

/// Wraps a client that is not concurrency safe: every call except wait()
/// goes through a single mutex.
class SerializedRuntime : public IsolationRuntime {
public:
    explicit SerializedRuntime(std::shared_ptr<IsolationRuntime> inner);

    EnvironmentHandle create_environment(const EnvironmentSpec& spec) override;
    void start(const EnvironmentHandle& handle, const std::string& code) override;
    WaitResult wait(const EnvironmentHandle& handle,
                    std::chrono::steady_clock::time_point deadline) override;
    void kill(const EnvironmentHandle& handle) override;
    void remove(const EnvironmentHandle& handle) override;
    ResourceSnapshot stats(const EnvironmentHandle& handle) override;
    void update(const EnvironmentHandle& handle, const ResourceConstraints& constraints) override;
    bool concurrent_safe() const override { return true; }

private:
    std::shared_ptr<IsolationRuntime> inner_;
    std::mutex mtx_;
};

} // namespace exec_kernel
