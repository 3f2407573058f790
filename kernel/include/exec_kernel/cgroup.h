#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <sys/types.h>

namespace exec_kernel {

class CgroupManager {
public:
    /// 2 for the unified hierarchy, 1 for legacy controllers, 0 if unknown.
    static int version();

    /// Prepare `path` as a parent for per-environment cgroups: create it and
    /// enable the cpu, memory and pids controllers for its children.
    /// Returns false when the hierarchy is not writable by this process.
    static bool prepare_parent(const std::string& path);
};

/// One leaf cgroup v2 directory.
class Cgroup {
public:
    /// mkdir `parent/name`. Throws IsolationError on failure.
    static Cgroup create(const std::string& parent, const std::string& name);

    const std::string& path() const noexcept { return path_; }

    void set_memory_max(int64_t bytes);          // -1 = max; swap is always disabled
    void set_cpu_max(int64_t quota_us, int64_t period_us);  // quota -1 = max
    void set_pids_max(int64_t n);                // -1 = max
    void add_process(pid_t pid);

    int64_t memory_current() const;   // bytes, -1 if unavailable
    int64_t memory_peak() const;      // bytes, -1 if unavailable (kernel < 5.19)
    int64_t cpu_usage_usec() const;   // -1 if unavailable
    int64_t oom_kills() const;        // oom_kill counter from memory.events

    /// SIGKILL every process in the cgroup.
    void kill_all();

    /// rmdir. Returns false if the directory is still busy.
    bool remove();

private:
    explicit Cgroup(std::string path) : path_(std::move(path)) {}

    void write(const std::string& file, const std::string& value);
    std::vector<pid_t> procs() const;

    std::string path_;
};

} // namespace exec_kernel
