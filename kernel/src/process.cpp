#include "exec_kernel/process.h"

#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>

#include <fstream>
#include <sstream>

namespace exec_kernel {

namespace {

std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return {};
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

bool apply_rlimit(int resource, int64_t value) noexcept {
    if (value < 0) return true;  // unlimited
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(value);
    rl.rlim_max = static_cast<rlim_t>(value);
    return setrlimit(resource, &rl) == 0;
}

} // anonymous namespace

bool ProcessManager::apply_limits(const ProcessLimits& limits) noexcept {
    bool ok = true;
    ok &= apply_rlimit(RLIMIT_CPU, limits.max_cpu_seconds);
    ok &= apply_rlimit(RLIMIT_AS, limits.max_memory_bytes);
    ok &= apply_rlimit(RLIMIT_FSIZE, limits.max_file_size);
    ok &= apply_rlimit(RLIMIT_NOFILE, limits.max_open_files);
    ok &= apply_rlimit(RLIMIT_NPROC, limits.max_processes);
    return ok;
}

bool ProcessManager::set_memory_limit(pid_t pid, int64_t bytes) {
    struct rlimit rl;
    rl.rlim_cur = bytes < 0 ? RLIM_INFINITY : static_cast<rlim_t>(bytes);
    rl.rlim_max = rl.rlim_cur;
    // Raising the hard limit needs CAP_SYS_RESOURCE; lower the soft limit at least.
    if (prlimit(pid, RLIMIT_AS, &rl, nullptr) == 0) return true;
    struct rlimit current;
    if (prlimit(pid, RLIMIT_AS, nullptr, &current) != 0) return false;
    rl.rlim_max = current.rlim_max;
    if (rl.rlim_cur > rl.rlim_max) rl.rlim_cur = rl.rlim_max;
    return prlimit(pid, RLIMIT_AS, &rl, nullptr) == 0;
}

ProcessUsage ProcessManager::usage(pid_t pid) {
    ProcessUsage info{};
    info.pid = pid;
    info.state = '?';

    // /proc/pid/stat: the command name in field 2 may contain spaces
    std::string stat_content = read_file("/proc/" + std::to_string(pid) + "/stat");
    auto close = stat_content.rfind(')');
    if (stat_content.empty() || close == std::string::npos || close + 2 > stat_content.size()) {
        return info;
    }

    // Fields after the closing paren
    std::istringstream rest(stat_content.substr(close + 2));
    std::string field;

    // field 3: state
    rest >> field; info.state = field.empty() ? '?' : field[0];

    // Skip fields 4-13 to reach 14 (utime) and 15 (stime)
    for (int i = 4; i <= 13; ++i) rest >> field;
    uint64_t utime = 0, stime = 0;
    rest >> utime >> stime;
    info.cpu_ticks = utime + stime;

    // Skip fields 16-22 to reach field 23 (vsize) and 24 (rss in pages)
    for (int i = 16; i <= 22; ++i) rest >> field;
    uint64_t vsize_bytes = 0, rss_pages = 0;
    rest >> vsize_bytes >> rss_pages;
    info.vsize_kb = vsize_bytes / 1024;
    info.rss_kb = (rss_pages * static_cast<uint64_t>(sysconf(_SC_PAGESIZE))) / 1024;

    return info;
}

bool ProcessManager::kill_group(pid_t pgid) {
    if (pgid <= 0) return false;
    return ::kill(-pgid, SIGKILL) == 0;
}

long ProcessManager::ticks_per_second() {
    static const long ticks = sysconf(_SC_CLK_TCK);
    return ticks > 0 ? ticks : 100;
}

} // namespace exec_kernel
