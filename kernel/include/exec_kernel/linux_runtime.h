#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "isolation_runtime.h"

namespace exec_kernel {

struct LinuxRuntimeOptions {
    std::string cgroup_root;        // empty = /sys/fs/cgroup/exec_kernel
    std::string work_root = "/tmp";
    bool use_cgroups = true;
    std::chrono::milliseconds call_timeout{2000};
};

/// Process-based isolation runtime for Linux.
///
/// Each environment is a pre-forked child parked on a control pipe inside
/// fresh user (when unprivileged), network, IPC and UTS namespaces, placed in
/// its own cgroup v2 leaf and working directory. start() writes the payload
/// and releases the child into exec(). Without a writable cgroup v2
/// hierarchy the runtime falls back to rlimits and /proc sampling; CPU
/// quotas are then recorded but not enforced.
class LinuxRuntime : public IsolationRuntime {
public:
    explicit LinuxRuntime(LinuxRuntimeOptions options = {});
    ~LinuxRuntime() override;

    LinuxRuntime(const LinuxRuntime&) = delete;
    LinuxRuntime& operator=(const LinuxRuntime&) = delete;

    EnvironmentHandle create_environment(const EnvironmentSpec& spec) override;
    void start(const EnvironmentHandle& handle, const std::string& code) override;
    WaitResult wait(const EnvironmentHandle& handle,
                    std::chrono::steady_clock::time_point deadline) override;
    void kill(const EnvironmentHandle& handle) override;
    void remove(const EnvironmentHandle& handle) override;
    ResourceSnapshot stats(const EnvironmentHandle& handle) override;
    void update(const EnvironmentHandle& handle, const ResourceConstraints& constraints) override;

    bool cgroups_enabled() const noexcept { return !cgroup_root_.empty(); }
    size_t environment_count() const;

private:
    struct Environment;

    std::shared_ptr<Environment> find(const EnvironmentHandle& handle) const;
    void destroy(Environment& env);

    LinuxRuntimeOptions options_;
    std::string cgroup_root_;  // empty when falling back to rlimits

    mutable std::mutex mtx_;
    std::unordered_map<EnvironmentHandle, std::shared_ptr<Environment>> envs_;
};

} // namespace exec_kernel
