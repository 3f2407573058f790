#include "exec_kernel/execution_engine.h"
#include "exec_kernel/deadline_race.h"
#include "exec_kernel/logging.h"
#include "exec_kernel/outcome.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/wait.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace exec_kernel {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point begin) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - begin);
}

/// Output of one pipe, capped; bytes past the cap are drained and dropped.
struct CappedBuffer {
    std::string data;
    size_t cap = 0;
    bool truncated = false;
    bool open = true;

    std::string finish() {
        if (truncated) data += "\n[output truncated]";
        return std::move(data);
    }
};

void drain(int fd, CappedBuffer& buf) {
    char chunk[4096];
    ssize_t n = read(fd, chunk, sizeof(chunk));
    if (n > 0) {
        size_t room = buf.cap > buf.data.size() ? buf.cap - buf.data.size() : 0;
        size_t take = std::min(room, static_cast<size_t>(n));
        buf.data.append(chunk, take);
        if (take < static_cast<size_t>(n)) buf.truncated = true;
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        buf.open = false;
    }
}

/// The child and the lock that keeps kill() from racing with reaping.
struct Child {
    pid_t pid = -1;
    std::mutex mtx;
    bool reaped = false;

    void kill_all() {
        std::lock_guard<std::mutex> lock(mtx);
        ProcessManager::kill_group(pid);
        if (!reaped) ::kill(pid, SIGKILL);
    }
};

// Collects output and reaps. Once the child is gone, stragglers holding
// the pipes get kill_grace before we stop reading.
WaitResult collect(Child& child, int out_fd, int err_fd, size_t cap,
                   std::chrono::milliseconds kill_grace, Clock::time_point begin,
                   bool memory_limited) {
    CappedBuffer out, err;
    out.cap = err.cap = cap;
    int status = 0;
    struct rusage ru{};
    Clock::time_point reaped_at;

    for (;;) {
        struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
        struct pollfd* active = out.open ? fds : fds + 1;
        int nfds = (out.open ? 1 : 0) + (err.open ? 1 : 0);
        if (nfds > 0) {
            if (::poll(active, static_cast<nfds_t>(nfds), 10) > 0) {
                if (out.open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) drain(out_fd, out);
                if (err.open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) drain(err_fd, err);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        {
            std::lock_guard<std::mutex> lock(child.mtx);
            if (!child.reaped) {
                pid_t w = wait4(child.pid, &status, WNOHANG, &ru);
                if (w == child.pid || (w < 0 && errno == ECHILD)) {
                    child.reaped = true;
                    reaped_at = Clock::now();
                    // Background processes it left behind go with it.
                    ProcessManager::kill_group(child.pid);
                }
            }
        }
        if (child.reaped && !out.open && !err.open) break;
        if (child.reaped && Clock::now() - reaped_at > kill_grace) break;
    }

    WaitResult r;
    if (WIFEXITED(status)) {
        r.status.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        r.status.term_signal = WTERMSIG(status);
    }
    r.status.quota_killed = r.status.term_signal == SIGXCPU || r.status.term_signal == SIGXFSZ;
    r.stdout_output = out.finish();
    r.stderr_output = err.finish();
    if (memory_limited) r.status.oom_killed = is_allocation_failure(r.status, r.stderr_output);
    r.usage.peak_memory_mb = static_cast<double>(ru.ru_maxrss) / 1024.0;
    auto wall = std::chrono::duration_cast<std::chrono::microseconds>(reaped_at - begin).count();
    int64_t cpu_usec = (ru.ru_utime.tv_sec + ru.ru_stime.tv_sec) * 1000000LL +
                       ru.ru_utime.tv_usec + ru.ru_stime.tv_usec;
    if (wall > 0) r.usage.avg_cpu_percent = 100.0 * static_cast<double>(cpu_usec) / static_cast<double>(wall);
    return r;
}

} // anonymous namespace

ExecutionEngine::ExecutionEngine(EngineOptions options) : options_(std::move(options)) {
    if (options_.command.empty()) throw std::invalid_argument("engine command is empty");
}

ExecutionResult ExecutionEngine::run(const ExecutionRequest& request, const CancellationToken& cancel) const {
    const auto begin = Clock::now();

    try {
        validate_request(request);
    } catch (const std::invalid_argument& e) {
        return ExecutionResult::failed(ErrorKind::InvalidRequest, e.what(), since(begin));
    }

    std::vector<std::string> args = options_.command;
    args.push_back(request.code);
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    ProcessLimits limits = options_.limits;
    if (options_.apply_memory_limit) limits.max_memory_bytes = request.memory_limit_mb * 1024 * 1024;
    // Backstop only; the wall-clock deadline fires first.
    limits.max_cpu_seconds = std::chrono::duration_cast<std::chrono::seconds>(request.timeout).count() + 1;

    const char* working_dir = options_.working_dir.c_str();

    int stdout_pipe[2], stderr_pipe[2];
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        return ExecutionResult::failed(ErrorKind::InternalError,
                                       std::string("pipe failed: ") + strerror(errno), since(begin));
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return ExecutionResult::failed(ErrorKind::InternalError,
                                       std::string("pipe failed: ") + strerror(saved), since(begin));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return ExecutionResult::failed(ErrorKind::InternalError,
                                       std::string("fork failed: ") + strerror(saved), since(begin));
    }

    if (pid == 0) {
        // Child: own process group so the whole tree can be killed at once
        setpgid(0, 0);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        ProcessManager::apply_limits(limits);
        if (chdir(working_dir) != 0) _exit(126);

        execvp(argv[0], argv.data());
        const char* msg = "exec failed: ";
        const char* why = strerror(errno);
        ssize_t ignored = ::write(STDERR_FILENO, msg, strlen(msg));
        ignored = ::write(STDERR_FILENO, why, strlen(why));
        (void)ignored;
        _exit(127);
    }

    // Parent
    setpgid(pid, pid);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    const int out_fd = stdout_pipe[0];
    const int err_fd = stderr_pipe[0];
    fcntl(out_fd, F_SETFL, O_NONBLOCK);
    fcntl(err_fd, F_SETFL, O_NONBLOCK);

    const auto deadline = begin + request.timeout;
    const auto kill_grace = options_.kill_grace;
    const size_t cap = options_.max_output_bytes;

    Child child;
    child.pid = pid;
    DeadlineRace race;

    std::thread waiter([&] {
        try {
            race.complete(collect(child, out_fd, err_fd, cap, kill_grace, begin, options_.apply_memory_limit));
        } catch (const std::exception& e) {
            race.fail(e.what());
        }
    });

    RaceOutcome outcome = race.await(deadline, cancel);
    if (outcome != RaceOutcome::Completed) {
        logger()->info("direct run of pid {}: {}, killing process group", pid, to_string(outcome));
        child.kill_all();
    }
    waiter.join();
    close(out_fd);
    close(err_fd);

    const auto elapsed = since(begin);
    ExecutionResult result;
    switch (outcome) {
        case RaceOutcome::Completed: {
            WaitResult wait = race.take_result();
            result = result_from_exit(wait, elapsed);
            result.resource_usage = wait.usage;
            break;
        }
        case RaceOutcome::DeadlineExpired:
            result = timeout_result(request.timeout, elapsed);
            break;
        case RaceOutcome::Cancelled:
            result = cancelled_result(elapsed);
            break;
        case RaceOutcome::Failed:
            result = ExecutionResult::failed(ErrorKind::InternalError,
                                             "Lost track of child process: " + race.failure(), elapsed);
            break;
    }
    result.sandboxed = false;
    return result;
}

} // namespace exec_kernel
