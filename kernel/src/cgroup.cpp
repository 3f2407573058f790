#include "exec_kernel/cgroup.h"
#include "exec_kernel/isolation_runtime.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace exec_kernel {

namespace {

constexpr const char* kCgroupMount = "/sys/fs/cgroup";

std::string read_first_line(const std::string& path) {
    std::ifstream f(path);
    std::string line;
    if (f.is_open()) std::getline(f, line);
    return line;
}

int64_t read_int64(const std::string& path, int64_t fallback = -1) {
    std::string line = read_first_line(path);
    if (line.empty() || line == "max") return fallback;
    try {
        return std::stoll(line);
    } catch (const std::exception&) {
        return fallback;
    }
}

// Value of `key` in flat-keyed files such as memory.events or cpu.stat.
int64_t read_keyed(const std::string& path, const std::string& key, int64_t fallback = -1) {
    std::ifstream f(path);
    if (!f.is_open()) return fallback;
    std::string k;
    int64_t v;
    while (f >> k >> v) {
        if (k == key) return v;
    }
    return fallback;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool write_file(const std::string& path, const std::string& value) {
    int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    ssize_t n = ::write(fd, value.data(), value.size());
    int saved = errno;
    close(fd);
    errno = saved;
    return n == static_cast<ssize_t>(value.size());
}

bool has_controllers(const std::string& dir) {
    std::istringstream iss(read_first_line(dir + "/cgroup.controllers"));
    bool cpu = false, memory = false, pids = false;
    std::string c;
    while (iss >> c) {
        if (c == "cpu") cpu = true;
        else if (c == "memory") memory = true;
        else if (c == "pids") pids = true;
    }
    return cpu && memory && pids;
}

std::string parent_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return "/";
    return path.substr(0, slash);
}

} // anonymous namespace

int CgroupManager::version() {
    // cgroup v2 has a unified hierarchy
    if (file_exists(std::string(kCgroupMount) + "/cgroup.controllers")) return 2;
    // cgroup v1 has separate controllers
    if (file_exists(std::string(kCgroupMount) + "/memory/memory.limit_in_bytes")) return 1;
    return 0;
}

bool CgroupManager::prepare_parent(const std::string& path) {
    if (version() != 2 || path.empty()) return false;

    if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) return false;

    // Controllers must be enabled on every level above a leaf. Writing the
    // grandparent fails harmlessly when it is already configured or owned
    // by someone else; the final check decides.
    if (!has_controllers(path)) {
        write_file(parent_dir(path) + "/cgroup.subtree_control", "+cpu +memory +pids");
    }
    if (!has_controllers(path)) return false;

    if (!write_file(path + "/cgroup.subtree_control", "+cpu +memory +pids")) return false;
    return access((path + "/cgroup.procs").c_str(), W_OK) == 0;
}

Cgroup Cgroup::create(const std::string& parent, const std::string& name) {
    std::string path = parent + "/" + name;
    if (mkdir(path.c_str(), 0755) != 0) {
        throw IsolationError("cgroup mkdir failed for " + path + ": " + strerror(errno));
    }
    return Cgroup(std::move(path));
}

void Cgroup::write(const std::string& file, const std::string& value) {
    if (!write_file(path_ + "/" + file, value)) {
        throw IsolationError("cgroup write " + file + "=" + value + " failed: " + strerror(errno));
    }
}

void Cgroup::set_memory_max(int64_t bytes) {
    write("memory.max", bytes < 0 ? "max" : std::to_string(bytes));
    // Without this, the limit only pushes pages to swap instead of killing.
    if (file_exists(path_ + "/memory.swap.max")) write("memory.swap.max", "0");
}

void Cgroup::set_cpu_max(int64_t quota_us, int64_t period_us) {
    // cpu.max format: "$MAX $PERIOD" or "max $PERIOD"
    std::string quota = quota_us < 0 ? "max" : std::to_string(quota_us);
    write("cpu.max", quota + " " + std::to_string(period_us));
}

void Cgroup::set_pids_max(int64_t n) {
    write("pids.max", n < 0 ? "max" : std::to_string(n));
}

void Cgroup::add_process(pid_t pid) {
    write("cgroup.procs", std::to_string(pid));
}

int64_t Cgroup::memory_current() const {
    return read_int64(path_ + "/memory.current", -1);
}

int64_t Cgroup::memory_peak() const {
    return read_int64(path_ + "/memory.peak", -1);
}

int64_t Cgroup::cpu_usage_usec() const {
    return read_keyed(path_ + "/cpu.stat", "usage_usec", -1);
}

int64_t Cgroup::oom_kills() const {
    return read_keyed(path_ + "/memory.events", "oom_kill", 0);
}

std::vector<pid_t> Cgroup::procs() const {
    std::vector<pid_t> pids;
    std::ifstream f(path_ + "/cgroup.procs");
    pid_t pid;
    while (f >> pid) pids.push_back(pid);
    return pids;
}

void Cgroup::kill_all() {
    // cgroup.kill exists since Linux 5.14
    if (write_file(path_ + "/cgroup.kill", "1")) return;
    for (pid_t pid : procs()) {
        ::kill(pid, SIGKILL);
    }
}

bool Cgroup::remove() {
    if (rmdir(path_.c_str()) == 0) return true;
    return errno == ENOENT;
}

} // namespace exec_kernel
