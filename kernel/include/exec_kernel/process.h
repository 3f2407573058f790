#pragma once

#include <cstdint>
#include <string>
#include <sys/types.h>

namespace exec_kernel {

struct ProcessUsage {
    pid_t pid;
    char state;            // R, S, D, Z, T, etc.; '?' if gone
    uint64_t rss_kb;       // resident set size
    uint64_t vsize_kb;     // virtual memory size
    uint64_t cpu_ticks;    // utime + stime in clock ticks
};

struct ProcessLimits {
    int64_t max_cpu_seconds = -1;   // RLIMIT_CPU, -1 = unlimited
    int64_t max_memory_bytes = -1;  // RLIMIT_AS
    int64_t max_file_size = -1;     // RLIMIT_FSIZE
    int64_t max_open_files = 256;   // RLIMIT_NOFILE
    int64_t max_processes = -1;     // RLIMIT_NPROC (counted per user)
};

class ProcessManager {
public:
    /// Apply limits to the calling process. Async-signal-safe, meant for the
    /// window between fork() and exec().
    static bool apply_limits(const ProcessLimits& limits) noexcept;

    /// Change RLIMIT_AS of a running process.
    static bool set_memory_limit(pid_t pid, int64_t bytes);

    /// Read usage from /proc/<pid>/stat. state is '?' if the process is gone.
    static ProcessUsage usage(pid_t pid);

    /// SIGKILL a whole process group.
    static bool kill_group(pid_t pgid);

    /// Clock ticks per second for ProcessUsage::cpu_ticks.
    static long ticks_per_second();
};

} // namespace exec_kernel
