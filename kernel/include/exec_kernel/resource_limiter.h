#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "isolation_runtime.h"
#include "types.h"

namespace exec_kernel {

constexpr int64_t kCpuPeriodUs = 100000;
constexpr int64_t kMinCpuQuotaUs = 1000;

/// Limits as the caller expressed them, kept next to their runtime form.
struct AppliedLimits {
    int64_t memory_limit_mb = 0;
    double cpu_fraction = 0.0;
    ResourceConstraints constraints;
};

/// Configures and samples per-environment quotas on an isolation runtime.
///
/// Every environment's limits live behind one mutex, so a sample() racing
/// with update_limits() reports either the old or the new limits in full.
class ResourceLimiter {
public:
    explicit ResourceLimiter(std::shared_ptr<IsolationRuntime> runtime,
                             std::chrono::milliseconds sample_timeout = std::chrono::milliseconds(500),
                             int64_t pids_max = 64);

    /// CPU share of one core -> quota per kCpuPeriodUs, memory MB -> bytes.
    static ResourceConstraints translate(int64_t memory_limit_mb, double cpu_fraction, int64_t pids_max);

    /// Push the limits to the runtime. Calling it again with the same values
    /// leaves the environment unchanged. Throws IsolationError.
    void apply_limits(const EnvironmentHandle& handle, int64_t memory_limit_mb, double cpu_fraction);

    /// Change limits of a live environment in place. Returns false when the
    /// values already match and the runtime was not touched.
    bool update_limits(const EnvironmentHandle& handle, int64_t memory_limit_mb, double cpu_fraction);

    /// Current usage plus the limits in force. Bounded by the sample timeout;
    /// throws IsolationError when the runtime does not answer in time. While
    /// an earlier stats call for `handle` is still outstanding no new one is
    /// issued and this throws at once, so a hung runtime costs one thread per
    /// environment at most.
    ResourceSnapshot sample(const EnvironmentHandle& handle);

    /// Limits currently recorded for `handle`; nullopt if none were applied.
    std::optional<AppliedLimits> limits(const EnvironmentHandle& handle) const;

    void forget(const EnvironmentHandle& handle);

    std::chrono::milliseconds sample_timeout() const { return sample_timeout_; }

private:
    std::shared_ptr<IsolationRuntime> runtime_;
    std::chrono::milliseconds sample_timeout_;
    int64_t pids_max_;

    mutable std::mutex mtx_;
    std::unordered_map<EnvironmentHandle, AppliedLimits> limits_;

    // Shared with workers that may outlive the limiter.
    struct InFlight {
        std::mutex mtx;
        std::unordered_set<EnvironmentHandle> handles;
    };
    std::shared_ptr<InFlight> in_flight_ = std::make_shared<InFlight>();
};

} // namespace exec_kernel
