#include "exec_kernel/linux_runtime.h"
#include "exec_kernel/cgroup.h"
#include "exec_kernel/logging.h"
#include "exec_kernel/outcome.h"
#include "exec_kernel/process.h"

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <thread>
#include <vector>

namespace exec_kernel {

namespace {

constexpr const char* kDefaultCgroupRoot = "/sys/fs/cgroup/exec_kernel";
constexpr const char* kPayloadName = "payload";
constexpr const char* kStdoutName = "stdout.log";
constexpr const char* kStderrName = "stderr.log";
constexpr int64_t kMinFileSizeLimit = 16 << 20;
constexpr auto kReapPoll = std::chrono::milliseconds(10);

constexpr char kReady = 'R';
constexpr char kFailed = 'E';
constexpr char kGo = 'G';

enum ChildStage {
    kStageNamespaces = 1,
    kStageIdMap,
    kStageSetup,
    kStageExec,
};

// Written by the child in a single write() so it arrives atomically.
struct ChildError {
    char tag;
    int stage;
    int err;
};

const char* stage_name(int stage) {
    switch (stage) {
        case kStageNamespaces: return "unshare";
        case kStageIdMap:      return "user namespace id map";
        case kStageSetup:      return "environment setup";
        case kStageExec:       return "exec";
        default:               return "child";
    }
}

void write_all(int fd, const void* buf, size_t len) noexcept {
    const char* p = static_cast<const char*>(buf);
    while (len > 0) {
        ssize_t n = ::write(fd, p, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        p += n;
        len -= static_cast<size_t>(n);
    }
}

bool write_small_file(const char* path, const char* data) noexcept {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    size_t len = strlen(data);
    ssize_t n = ::write(fd, data, len);
    close(fd);
    return n == static_cast<ssize_t>(len);
}

[[noreturn]] void child_fail(int status_fd, int stage) noexcept {
    ChildError e{kFailed, stage, errno};
    write_all(status_fd, &e, sizeof(e));
    _exit(126);
}

enum class Report { Ready, Exited, Failed, Timeout };

Report read_report(int fd, std::chrono::milliseconds timeout, std::string& error) {
    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int ret;
    do {
        ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (ret < 0 && errno == EINTR);
    if (ret == 0) return Report::Timeout;
    if (ret < 0) {
        error = std::string("poll failed: ") + strerror(errno);
        return Report::Failed;
    }

    ChildError ce{};
    ssize_t n;
    do {
        n = read(fd, &ce, sizeof(ce));
    } while (n < 0 && errno == EINTR);

    if (n == 0) return Report::Exited;
    if (n == 1 && ce.tag == kReady) return Report::Ready;
    if (n == static_cast<ssize_t>(sizeof(ce)) && ce.tag == kFailed) {
        error = std::string(stage_name(ce.stage)) + " failed: " + strerror(ce.err);
        return Report::Failed;
    }
    error = "malformed report from environment process";
    return Report::Failed;
}

std::string read_capped(const std::string& path, size_t cap) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return {};
    std::string out(cap, '\0');
    f.read(&out[0], static_cast<std::streamsize>(cap));
    out.resize(static_cast<size_t>(f.gcount()));
    if (out.size() == cap && f.peek() != std::char_traits<char>::eof()) {
        out += "\n[output truncated]";
    }
    return out;
}

double to_mb(int64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

} // anonymous namespace

struct LinuxRuntime::Environment {
    EnvironmentHandle id;
    std::string work_dir;
    EnvironmentSpec spec;
    std::optional<Cgroup> cgroup;
    pid_t pid = -1;
    int control_fd = -1;
    int status_fd = -1;

    // Everything below is guarded by mtx.
    std::mutex mtx;
    bool started = false;
    bool reaped = false;
    int wait_status = 0;
    struct rusage usage{};
    std::chrono::steady_clock::time_point started_at;
    std::chrono::steady_clock::time_point exited_at;
    int64_t last_cpu_usec = -1;
    std::chrono::steady_clock::time_point last_sample;

    ~Environment() {
        if (control_fd >= 0) close(control_fd);
        if (status_fd >= 0) close(status_fd);
    }

    // mtx held by caller
    bool try_reap() {
        if (reaped || pid <= 0) return reaped;
        int status = 0;
        pid_t w = wait4(pid, &status, WNOHANG, &usage);
        if (w == pid || (w < 0 && errno == ECHILD)) {
            reaped = true;
            wait_status = status;
            exited_at = std::chrono::steady_clock::now();
        }
        return reaped;
    }

    // mtx held by caller. The process group outlives its leader while
    // anything the payload forked is still running, so it is signalled
    // even after the leader has been reaped.
    void kill_all() {
        if (pid <= 0) return;
        if (cgroup) cgroup->kill_all();
        ProcessManager::kill_group(pid);
        if (!reaped) ::kill(pid, SIGKILL);
    }
};

LinuxRuntime::LinuxRuntime(LinuxRuntimeOptions options)
    : options_(std::move(options)) {
    if (!options_.use_cgroups) return;

    std::string root = options_.cgroup_root.empty() ? kDefaultCgroupRoot : options_.cgroup_root;
    if (CgroupManager::prepare_parent(root)) {
        cgroup_root_ = root;
        logger()->info("linux runtime: using cgroup v2 parent {}", root);
    } else {
        logger()->warn("linux runtime: cgroup v2 parent {} is not usable, falling back to rlimits "
                       "(memory via RLIMIT_AS, CPU quota not enforced)", root);
    }
}

LinuxRuntime::~LinuxRuntime() {
    std::unordered_map<EnvironmentHandle, std::shared_ptr<Environment>> leftovers;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        leftovers.swap(envs_);
    }
    for (auto& [id, env] : leftovers) {
        logger()->warn("linux runtime: removing leftover environment {} at shutdown", id);
        try {
            destroy(*env);
        } catch (const IsolationError& e) {
            logger()->error("linux runtime: {}", e.what());
        }
    }
}

std::shared_ptr<LinuxRuntime::Environment> LinuxRuntime::find(const EnvironmentHandle& handle) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = envs_.find(handle);
    if (it == envs_.end()) throw IsolationError("unknown environment: " + handle);
    return it->second;
}

size_t LinuxRuntime::environment_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return envs_.size();
}

EnvironmentHandle LinuxRuntime::create_environment(const EnvironmentSpec& spec) {
    if (spec.command.empty()) throw IsolationError("environment command is empty");

    std::string tmpl = options_.work_root + "/exec_kernel-XXXXXX";
    std::vector<char> dir(tmpl.begin(), tmpl.end());
    dir.push_back('\0');
    if (!mkdtemp(dir.data())) {
        throw IsolationError("mkdtemp failed in " + options_.work_root + ": " + strerror(errno));
    }

    auto env = std::make_shared<Environment>();
    env->work_dir = dir.data();
    env->id = env->work_dir.substr(env->work_dir.find_last_of('/') + 1);
    env->spec = spec;

    try {
        if (cgroups_enabled()) {
            env->cgroup.emplace(Cgroup::create(cgroup_root_, env->id));
            env->cgroup->set_memory_max(spec.constraints.memory_bytes);
            env->cgroup->set_cpu_max(spec.constraints.cpu_quota_us, spec.constraints.cpu_period_us);
            env->cgroup->set_pids_max(spec.constraints.pids_max);
        }

        // Everything the child touches is prepared here; after fork() it may
        // only make async-signal-safe calls.
        std::vector<std::string> args = spec.command;
        args.push_back(kPayloadName);
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);

        std::vector<std::string> vars = {
            "PATH=/usr/local/bin:/usr/bin:/bin",
            "HOME=" + env->work_dir,
            "LANG=C.UTF-8",
            "PYTHONDONTWRITEBYTECODE=1",
            "PYTHONUNBUFFERED=1",
        };
        std::vector<char*> envp;
        for (auto& v : vars) envp.push_back(const_cast<char*>(v.c_str()));
        envp.push_back(nullptr);

        const bool user_ns = geteuid() != 0;
        const std::string uid_map = std::to_string(getuid()) + " " + std::to_string(getuid()) + " 1\n";
        const std::string gid_map = std::to_string(getgid()) + " " + std::to_string(getgid()) + " 1\n";
        int ns_flags = CLONE_NEWIPC | CLONE_NEWUTS;
        if (spec.network_disabled) ns_flags |= CLONE_NEWNET;
        if (user_ns) ns_flags |= CLONE_NEWUSER;

        ProcessLimits limits;
        limits.max_file_size = std::max<int64_t>(static_cast<int64_t>(spec.max_output_bytes), kMinFileSizeLimit);
        if (!cgroups_enabled()) limits.max_memory_bytes = spec.constraints.memory_bytes;

        const std::string stdout_path = env->work_dir + "/" + kStdoutName;
        const std::string stderr_path = env->work_dir + "/" + kStderrName;
        const char* work_dir = env->work_dir.c_str();

        long max_fd = sysconf(_SC_OPEN_MAX);
        if (max_fd <= 0 || max_fd > 65536) max_fd = 65536;

        int control[2], status[2];
        if (pipe2(control, O_CLOEXEC) != 0) {
            throw IsolationError(std::string("pipe failed: ") + strerror(errno));
        }
        if (pipe2(status, O_CLOEXEC) != 0) {
            int saved = errno;
            close(control[0]);
            close(control[1]);
            throw IsolationError(std::string("pipe failed: ") + strerror(saved));
        }

        const pid_t parent = getpid();
        pid_t pid = fork();
        if (pid < 0) {
            int saved = errno;
            close(control[0]); close(control[1]);
            close(status[0]); close(status[1]);
            throw IsolationError(std::string("fork failed: ") + strerror(saved));
        }

        if (pid == 0) {
            const int sfd = status[1];
            const int cfd = control[0];
            for (int fd = 3; fd < max_fd; ++fd) {
                if (fd != sfd && fd != cfd) close(fd);
            }
            setpgid(0, 0);

            if (unshare(ns_flags) != 0) child_fail(sfd, kStageNamespaces);
            if (user_ns) {
                if (!write_small_file("/proc/self/setgroups", "deny") ||
                    !write_small_file("/proc/self/uid_map", uid_map.c_str()) ||
                    !write_small_file("/proc/self/gid_map", gid_map.c_str())) {
                    child_fail(sfd, kStageIdMap);
                }
            }
            // Set after unshare: a credential change clears the death signal.
            prctl(PR_SET_PDEATHSIG, SIGKILL);
            if (getppid() != parent) _exit(126);

            char ready = kReady;
            write_all(sfd, &ready, 1);

            // Parked until start(); EOF means the environment was removed.
            char go = 0;
            ssize_t n;
            do {
                n = read(cfd, &go, 1);
            } while (n < 0 && errno == EINTR);
            if (n != 1 || go != kGo) _exit(125);
            close(cfd);

            if (chdir(work_dir) != 0) child_fail(sfd, kStageSetup);
            int in = open("/dev/null", O_RDONLY);
            int out = open(stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
            int err = open(stderr_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
            if (in < 0 || out < 0 || err < 0) child_fail(sfd, kStageSetup);
            dup2(in, STDIN_FILENO);
            dup2(out, STDOUT_FILENO);
            dup2(err, STDERR_FILENO);
            close(in); close(out); close(err);

            if (!ProcessManager::apply_limits(limits)) child_fail(sfd, kStageSetup);

            execvpe(argv[0], argv.data(), envp.data());
            child_fail(sfd, kStageExec);
        }

        close(control[0]);
        close(status[1]);
        env->pid = pid;
        env->control_fd = control[1];
        env->status_fd = status[0];

        // The child is parked, so joining the cgroup now accounts for all it does.
        if (env->cgroup) env->cgroup->add_process(pid);

        std::string error;
        switch (read_report(env->status_fd, options_.call_timeout, error)) {
            case Report::Ready:
                break;
            case Report::Timeout:
                throw IsolationError("environment " + env->id + " did not become ready within " +
                                     std::to_string(options_.call_timeout.count()) + "ms");
            case Report::Exited:
                throw IsolationError("environment " + env->id + " exited during setup");
            case Report::Failed:
                throw IsolationError("environment " + env->id + ": " + error);
        }
    } catch (const std::exception& e) {
        try {
            destroy(*env);
        } catch (const IsolationError& cleanup) {
            logger()->error("linux runtime: cleanup after failed create: {}", cleanup.what());
        }
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        envs_[env->id] = env;
    }
    logger()->debug("linux runtime: created {} (pid {}, cgroup {})", env->id, env->pid,
                    env->cgroup ? env->cgroup->path() : std::string("none"));
    return env->id;
}

void LinuxRuntime::start(const EnvironmentHandle& handle, const std::string& code) {
    auto env = find(handle);
    std::lock_guard<std::mutex> lock(env->mtx);

    if (env->started) throw IsolationError("environment already started: " + handle);
    if (env->try_reap()) throw IsolationError("environment process is gone: " + handle);

    {
        std::ofstream payload(env->work_dir + "/" + kPayloadName, std::ios::binary | std::ios::trunc);
        if (!payload) throw IsolationError("cannot write payload into " + env->work_dir);
        payload << code;
        if (!payload.flush()) throw IsolationError("cannot write payload into " + env->work_dir);
    }

    char go = kGo;
    if (::write(env->control_fd, &go, 1) != 1) {
        throw IsolationError(std::string("control pipe write failed: ") + strerror(errno));
    }
    close(env->control_fd);
    env->control_fd = -1;
    env->started = true;
    env->started_at = std::chrono::steady_clock::now();

    // The status pipe is close-on-exec: EOF means exec succeeded.
    std::string error;
    Report report = read_report(env->status_fd, options_.call_timeout, error);
    close(env->status_fd);
    env->status_fd = -1;

    switch (report) {
        case Report::Exited:
            return;
        case Report::Timeout:
            throw IsolationError("environment " + handle + " did not exec within " +
                                 std::to_string(options_.call_timeout.count()) + "ms");
        case Report::Ready:
        case Report::Failed:
            throw IsolationError("environment " + handle + ": " + error);
    }
}

WaitResult LinuxRuntime::wait(const EnvironmentHandle& handle,
                              std::chrono::steady_clock::time_point deadline) {
    auto env = find(handle);

    for (;;) {
        {
            std::lock_guard<std::mutex> lock(env->mtx);
            if (env->try_reap()) break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            WaitResult r;
            r.timed_out = true;
            return r;
        }
        std::this_thread::sleep_for(kReapPoll);
    }

    std::lock_guard<std::mutex> lock(env->mtx);
    WaitResult r;
    const int status = env->wait_status;
    if (WIFEXITED(status)) {
        r.status.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        r.status.term_signal = WTERMSIG(status);
    }
    r.status.quota_killed = r.status.term_signal == SIGXCPU || r.status.term_signal == SIGXFSZ;

    r.stdout_output = read_capped(env->work_dir + "/" + kStdoutName, env->spec.max_output_bytes);
    r.stderr_output = read_capped(env->work_dir + "/" + kStderrName, env->spec.max_output_bytes);

    if (env->cgroup) {
        r.status.oom_killed = env->cgroup->oom_kills() > 0;
    } else if (env->spec.constraints.memory_bytes > 0) {
        // Under RLIMIT_AS an allocation failure surfaces as an interpreter error.
        r.status.oom_killed = is_allocation_failure(r.status, r.stderr_output);
    }

    int64_t peak = env->cgroup ? env->cgroup->memory_peak() : -1;
    if (peak < 0) peak = static_cast<int64_t>(env->usage.ru_maxrss) * 1024;
    int64_t cpu_usec = env->cgroup ? env->cgroup->cpu_usage_usec() : -1;
    if (cpu_usec < 0) {
        cpu_usec = (env->usage.ru_utime.tv_sec + env->usage.ru_stime.tv_sec) * 1000000LL +
                   env->usage.ru_utime.tv_usec + env->usage.ru_stime.tv_usec;
    }
    r.usage.peak_memory_mb = to_mb(peak);
    if (env->started) {
        auto wall = std::chrono::duration_cast<std::chrono::microseconds>(env->exited_at - env->started_at).count();
        if (wall > 0) r.usage.avg_cpu_percent = 100.0 * static_cast<double>(cpu_usec) / static_cast<double>(wall);
    }
    return r;
}

void LinuxRuntime::kill(const EnvironmentHandle& handle) {
    auto env = find(handle);
    std::lock_guard<std::mutex> lock(env->mtx);
    // Holding mtx keeps the pid from being reaped and reused under us.
    env->kill_all();
}

void LinuxRuntime::remove(const EnvironmentHandle& handle) {
    std::shared_ptr<Environment> env;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = envs_.find(handle);
        if (it == envs_.end()) return;
        env = it->second;
        envs_.erase(it);
    }
    destroy(*env);
    logger()->debug("linux runtime: removed {}", handle);
}

void LinuxRuntime::destroy(Environment& env) {
    std::string problems;
    const auto give_up = std::chrono::steady_clock::now() + options_.call_timeout;

    if (env.control_fd >= 0) {
        close(env.control_fd);
        env.control_fd = -1;
    }

    if (env.pid > 0) {
        std::unique_lock<std::mutex> lock(env.mtx);
        env.kill_all();
        while (!env.try_reap() && std::chrono::steady_clock::now() < give_up) {
            lock.unlock();
            std::this_thread::sleep_for(kReapPoll);
            lock.lock();
        }
        if (!env.reaped) problems += "process " + std::to_string(env.pid) + " did not exit; ";
        // Stragglers forked after the first kill.
        env.kill_all();
    }

    if (env.cgroup) {
        bool removed = env.cgroup->remove();
        while (!removed && std::chrono::steady_clock::now() < give_up) {
            // Stragglers forked before the kill may still be exiting.
            env.cgroup->kill_all();
            std::this_thread::sleep_for(kReapPoll);
            removed = env.cgroup->remove();
        }
        if (!removed) problems += "cgroup " + env.cgroup->path() + " is still busy; ";
    }

    std::error_code ec;
    std::filesystem::remove_all(env.work_dir, ec);
    if (ec) problems += "cannot remove " + env.work_dir + ": " + ec.message() + "; ";

    if (env.status_fd >= 0) {
        close(env.status_fd);
        env.status_fd = -1;
    }

    if (!problems.empty()) {
        throw IsolationError("teardown of " + env.id + " incomplete: " + problems);
    }
}

ResourceSnapshot LinuxRuntime::stats(const EnvironmentHandle& handle) {
    auto env = find(handle);
    std::lock_guard<std::mutex> lock(env->mtx);

    ResourceSnapshot s;
    const auto now = std::chrono::steady_clock::now();
    int64_t memory = -1;
    int64_t cpu_usec = -1;

    if (env->cgroup) {
        memory = env->cgroup->memory_current();
        cpu_usec = env->cgroup->cpu_usage_usec();
    } else if (!env->try_reap()) {
        ProcessUsage u = ProcessManager::usage(env->pid);
        if (u.state != '?') {
            memory = static_cast<int64_t>(u.rss_kb) * 1024;
            cpu_usec = static_cast<int64_t>(u.cpu_ticks) * 1000000LL / ProcessManager::ticks_per_second();
        }
    }

    if (memory >= 0) s.memory_mb = to_mb(memory);

    if (cpu_usec >= 0 && env->started) {
        // First sample averages since start, later ones cover the interval.
        int64_t base_usec = env->last_cpu_usec >= 0 ? env->last_cpu_usec : 0;
        auto since = env->last_cpu_usec >= 0 ? env->last_sample : env->started_at;
        auto wall = std::chrono::duration_cast<std::chrono::microseconds>(now - since).count();
        if (wall > 0 && cpu_usec >= base_usec) {
            s.cpu_percent = 100.0 * static_cast<double>(cpu_usec - base_usec) / static_cast<double>(wall);
        }
        env->last_cpu_usec = cpu_usec;
        env->last_sample = now;
    }
    return s;
}

void LinuxRuntime::update(const EnvironmentHandle& handle, const ResourceConstraints& constraints) {
    auto env = find(handle);
    std::lock_guard<std::mutex> lock(env->mtx);

    if (env->cgroup) {
        env->cgroup->set_memory_max(constraints.memory_bytes);
        env->cgroup->set_cpu_max(constraints.cpu_quota_us, constraints.cpu_period_us);
        env->cgroup->set_pids_max(constraints.pids_max);
    } else if (!env->try_reap()) {
        if (!ProcessManager::set_memory_limit(env->pid, constraints.memory_bytes)) {
            throw IsolationError("prlimit on " + handle + " failed: " + strerror(errno));
        }
    }
    env->spec.constraints = constraints;
}

} // namespace exec_kernel
