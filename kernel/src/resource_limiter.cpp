#include "exec_kernel/resource_limiter.h"
#include "exec_kernel/logging.h"

#include <algorithm>
#include <cmath>
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace exec_kernel {

ResourceLimiter::ResourceLimiter(std::shared_ptr<IsolationRuntime> runtime,
                                 std::chrono::milliseconds sample_timeout,
                                 int64_t pids_max)
    : runtime_(std::move(runtime)), sample_timeout_(sample_timeout), pids_max_(pids_max) {
    if (!runtime_) throw std::invalid_argument("resource limiter needs a runtime");
}

ResourceConstraints ResourceLimiter::translate(int64_t memory_limit_mb, double cpu_fraction, int64_t pids_max) {
    if (memory_limit_mb <= 0) throw std::invalid_argument("memory limit must be positive");
    if (!(cpu_fraction > 0.0 && cpu_fraction <= 1.0)) {
        throw std::invalid_argument("cpu fraction must be in (0, 1]");
    }

    ResourceConstraints c;
    c.memory_bytes = memory_limit_mb * 1024 * 1024;
    c.cpu_period_us = kCpuPeriodUs;
    c.cpu_quota_us = std::max<int64_t>(
        kMinCpuQuotaUs, static_cast<int64_t>(std::llround(cpu_fraction * static_cast<double>(kCpuPeriodUs))));
    c.pids_max = pids_max;
    return c;
}

void ResourceLimiter::apply_limits(const EnvironmentHandle& handle, int64_t memory_limit_mb, double cpu_fraction) {
    update_limits(handle, memory_limit_mb, cpu_fraction);
}

bool ResourceLimiter::update_limits(const EnvironmentHandle& handle, int64_t memory_limit_mb, double cpu_fraction) {
    ResourceConstraints next = translate(memory_limit_mb, cpu_fraction, pids_max_);

    // Held across the runtime call so readers never see the map ahead of
    // (or behind) what the runtime enforces.
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = limits_.find(handle);
    if (it != limits_.end() && it->second.constraints == next) return false;

    runtime_->update(handle, next);
    limits_[handle] = AppliedLimits{memory_limit_mb, cpu_fraction, next};
    logger()->debug("limits for {}: {} MB, cpu quota {}/{} us", handle, memory_limit_mb,
                    next.cpu_quota_us, next.cpu_period_us);
    return true;
}

ResourceSnapshot ResourceLimiter::sample(const EnvironmentHandle& handle) {
    {
        std::lock_guard<std::mutex> lock(in_flight_->mtx);
        if (!in_flight_->handles.insert(handle).second) {
            throw IsolationError("stats for " + handle + " still pending from an earlier sample");
        }
    }

    // The worker owns its copies so an abandoned call can finish on its own.
    auto task = std::make_shared<std::packaged_task<ResourceSnapshot()>>(
        [runtime = runtime_, in_flight = in_flight_, handle] {
            struct Done {
                std::shared_ptr<InFlight> in_flight;
                const EnvironmentHandle& handle;
                ~Done() {
                    std::lock_guard<std::mutex> lock(in_flight->mtx);
                    in_flight->handles.erase(handle);
                }
            } done{in_flight, handle};
            return runtime->stats(handle);
        });
    std::future<ResourceSnapshot> result = task->get_future();
    try {
        std::thread([task] { (*task)(); }).detach();
    } catch (const std::system_error&) {
        std::lock_guard<std::mutex> lock(in_flight_->mtx);
        in_flight_->handles.erase(handle);
        throw;
    }

    if (result.wait_for(sample_timeout_) != std::future_status::ready) {
        throw IsolationError("stats for " + handle + " did not return within " +
                             std::to_string(sample_timeout_.count()) + "ms");
    }
    ResourceSnapshot s = result.get();

    std::lock_guard<std::mutex> lock(mtx_);
    auto it = limits_.find(handle);
    if (it != limits_.end()) {
        s.memory_limit_mb = it->second.memory_limit_mb;
        s.cpu_fraction = it->second.cpu_fraction;
        s.memory_percent = 100.0 * s.memory_mb / static_cast<double>(it->second.memory_limit_mb);
    }
    return s;
}

std::optional<AppliedLimits> ResourceLimiter::limits(const EnvironmentHandle& handle) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = limits_.find(handle);
    if (it == limits_.end()) return std::nullopt;
    return it->second;
}

void ResourceLimiter::forget(const EnvironmentHandle& handle) {
    std::lock_guard<std::mutex> lock(mtx_);
    limits_.erase(handle);
}

} // namespace exec_kernel
