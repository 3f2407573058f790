#include "exec_kernel/sandbox_manager.h"
#include "exec_kernel/deadline_race.h"
#include "exec_kernel/logging.h"
#include "exec_kernel/outcome.h"

#include <algorithm>
#include <condition_variable>
#include <stdexcept>
#include <thread>

namespace exec_kernel {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point begin) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - begin);
}

/// Reaps the waiter on scope exit. When the scope unwinds before the race was
/// settled the environment is still running, so it is killed first; joining
/// alone would block until the payload finished on its own.
class WaiterGuard {
public:
    WaiterGuard(std::thread& t, IsolationRuntime& runtime, EnvironmentHandle handle)
        : t_(t), runtime_(runtime), handle_(std::move(handle)) {}

    ~WaiterGuard() {
        if (!t_.joinable()) return;
        try {
            runtime_.kill(handle_);
        } catch (const IsolationError& e) {
            logger()->warn("sandbox {}: kill while unwinding failed: {}", handle_, e.what());
        }
        t_.join();
    }

    WaiterGuard(const WaiterGuard&) = delete;
    WaiterGuard& operator=(const WaiterGuard&) = delete;

private:
    std::thread& t_;
    IsolationRuntime& runtime_;
    EnvironmentHandle handle_;
};

/// Periodic sampling while an environment runs.
class UsageMonitor {
public:
    UsageMonitor(ResourceLimiter& limiter, EnvironmentHandle handle, std::chrono::milliseconds interval,
                 std::function<void(const EnvironmentHandle&, const ResourceSnapshot&)> on_sample)
        : limiter_(limiter), handle_(std::move(handle)), interval_(interval),
          on_sample_(std::move(on_sample)) {}

    ~UsageMonitor() { stop(); }

    void start() {
        thread_ = std::thread([this] { loop(); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    ResourceUsage usage() const {
        std::lock_guard<std::mutex> lock(mtx_);
        ResourceUsage u;
        u.peak_memory_mb = peak_memory_mb_;
        u.avg_cpu_percent = samples_ > 0 ? cpu_total_ / samples_ : 0.0;
        u.samples = samples_;
        return u;
    }

private:
    void loop() {
        std::unique_lock<std::mutex> lock(mtx_);
        while (!stopping_) {
            lock.unlock();
            sample_once();
            lock.lock();
            cv_.wait_for(lock, interval_, [this] { return stopping_; });
        }
    }

    void sample_once() {
        ResourceSnapshot s;
        try {
            s = limiter_.sample(handle_);
        } catch (const IsolationError& e) {
            // The environment may have exited between samples.
            logger()->debug("sample of {} skipped: {}", handle_, e.what());
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mtx_);
            peak_memory_mb_ = std::max(peak_memory_mb_, s.memory_mb);
            cpu_total_ += s.cpu_percent;
            ++samples_;
        }
        if (!on_sample_) return;
        try {
            on_sample_(handle_, s);
        } catch (const std::exception& e) {
            logger()->warn("sample callback for {} threw: {}", handle_, e.what());
        }
    }

    ResourceLimiter& limiter_;
    EnvironmentHandle handle_;
    std::chrono::milliseconds interval_;
    std::function<void(const EnvironmentHandle&, const ResourceSnapshot&)> on_sample_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stopping_ = false;
    double peak_memory_mb_ = 0.0;
    double cpu_total_ = 0.0;
    int samples_ = 0;
    std::thread thread_;
};

SandboxState state_for(const ExecutionResult& result) {
    if (result.success) return SandboxState::Completed;
    switch (result.error_kind) {
        case ErrorKind::TimeoutError:          return SandboxState::TimedOut;
        case ErrorKind::ResourceLimitExceeded: return SandboxState::ResourceExceeded;
        case ErrorKind::Cancelled:             return SandboxState::Cancelled;
        default:                               return SandboxState::Crashed;
    }
}

} // anonymous namespace

const char* to_string(SandboxState state) noexcept {
    switch (state) {
        case SandboxState::Created:          return "created";
        case SandboxState::Starting:         return "starting";
        case SandboxState::Running:          return "running";
        case SandboxState::Completed:        return "completed";
        case SandboxState::TimedOut:         return "timed_out";
        case SandboxState::ResourceExceeded: return "resource_exceeded";
        case SandboxState::Crashed:          return "crashed";
        case SandboxState::Cancelled:        return "cancelled";
        case SandboxState::Terminated:       return "terminated";
    }
    return "unknown";
}

/// Owns one environment from creation on. release() tears it down and
/// reports failure; the destructor is the fallback for paths that never
/// reached release().
class SandboxManager::Lease {
public:
    Lease(SandboxManager& owner, Sandbox& sandbox) : owner_(owner), sandbox_(sandbox) {
        std::lock_guard<std::mutex> lock(owner_.sandboxes_mtx_);
        owner_.sandboxes_[sandbox_.id] = sandbox_;
    }

    ~Lease() {
        if (released_) return;
        try {
            release();
        } catch (const std::exception& e) {
            logger()->error("sandbox {}: teardown failed: {}", sandbox_.id, e.what());
        }
    }

    void release() {
        if (released_) return;
        released_ = true;

        std::string failure;
        try {
            owner_.runtime_->kill(sandbox_.id);
        } catch (const IsolationError& e) {
            failure = std::string("kill: ") + e.what();
        }
        try {
            owner_.runtime_->remove(sandbox_.id);
        } catch (const IsolationError& e) {
            if (!failure.empty()) failure += "; ";
            failure += std::string("remove: ") + e.what();
        }
        owner_.limiter_.forget(sandbox_.id);
        try {
            owner_.transition(sandbox_, SandboxState::Terminated);
        } catch (const std::exception& e) {
            logger()->warn("sandbox {}: transition listener threw: {}", sandbox_.id, e.what());
        }
        {
            std::lock_guard<std::mutex> lock(owner_.sandboxes_mtx_);
            owner_.sandboxes_.erase(sandbox_.id);
        }
        if (!failure.empty()) throw IsolationError(failure);
    }

private:
    SandboxManager& owner_;
    Sandbox& sandbox_;
    bool released_ = false;
};

SandboxManager::SandboxManager(std::shared_ptr<IsolationRuntime> runtime, SandboxManagerOptions options)
    : runtime_(runtime && !runtime->concurrent_safe()
                   ? std::make_shared<SerializedRuntime>(runtime)
                   : std::move(runtime)),
      options_(std::move(options)),
      limiter_(runtime_, options_.sample_timeout, options_.pids_max) {
    if (options_.max_environments <= 0) throw std::invalid_argument("max_environments must be positive");
    if (options_.command.empty()) throw std::invalid_argument("sandbox command is empty");
}

bool SandboxManager::try_acquire_slot() {
    int current = live_.load();
    while (current < options_.max_environments) {
        if (live_.compare_exchange_weak(current, current + 1)) return true;
    }
    return false;
}

void SandboxManager::release_slot() {
    live_.fetch_sub(1);
}

void SandboxManager::transition(Sandbox& sandbox, SandboxState state) {
    logger()->debug("sandbox {}: {} -> {}", sandbox.id, to_string(sandbox.state), to_string(state));
    sandbox.state = state;
    {
        std::lock_guard<std::mutex> lock(sandboxes_mtx_);
        auto it = sandboxes_.find(sandbox.id);
        if (it != sandboxes_.end()) it->second.state = state;
    }
    if (listener_) listener_(sandbox);
}

ExecutionResult SandboxManager::run(const ExecutionRequest& request, const RunOptions& options) {
    const auto begin = Clock::now();

    try {
        validate_request(request);
    } catch (const std::invalid_argument& e) {
        ExecutionResult r = ExecutionResult::failed(ErrorKind::InvalidRequest, e.what(), since(begin));
        r.sandboxed = true;
        return r;
    }

    if (!try_acquire_slot()) {
        logger()->warn("sandbox manager: rejecting request, {} environments already live",
                       options_.max_environments);
        ExecutionResult r = ExecutionResult::failed(
            ErrorKind::Rejected,
            "Concurrency limit reached: " + std::to_string(options_.max_environments) + " environments in use",
            since(begin));
        r.sandboxed = true;
        return r;
    }

    Sandbox sandbox;
    sandbox.memory_limit_mb = request.memory_limit_mb;
    sandbox.cpu_fraction = request.cpu_fraction;
    sandbox.created_at = std::chrono::system_clock::now();

    std::unique_ptr<Lease> lease;
    ExecutionResult result;
    try {
        result = supervise(request, options, sandbox, lease, begin);
    } catch (const IsolationError& e) {
        logger()->error("sandbox {}: isolation failure: {}", sandbox.id, e.what());
        result = ExecutionResult::failed(ErrorKind::IsolationFailure,
                                         std::string("Isolation failure: ") + e.what(), since(begin));
    } catch (const std::exception& e) {
        logger()->error("sandbox {}: internal error: {}", sandbox.id, e.what());
        result = ExecutionResult::failed(ErrorKind::InternalError,
                                         std::string("Internal error: ") + e.what(), since(begin));
    }

    if (lease) {
        try {
            lease->release();
        } catch (const IsolationError& e) {
            ++teardown_failures_;
            logger()->error("sandbox {}: teardown failed after {}: {}", sandbox.id,
                            to_string(result.error_kind), e.what());
        }
        lease.reset();
    }
    release_slot();

    result.sandboxed = true;
    return result;
}

ExecutionResult SandboxManager::supervise(const ExecutionRequest& request, const RunOptions& options,
                                          Sandbox& sandbox, std::unique_ptr<Lease>& lease,
                                          Clock::time_point begin) {
    EnvironmentSpec spec;
    spec.image = options_.image;
    spec.command = options_.command;
    spec.constraints = ResourceLimiter::translate(request.memory_limit_mb, request.cpu_fraction, options_.pids_max);
    spec.network_disabled = true;
    spec.max_output_bytes = options_.max_output_bytes;

    sandbox.id = runtime_->create_environment(spec);
    lease = std::make_unique<Lease>(*this, sandbox);

    limiter_.apply_limits(sandbox.id, request.memory_limit_mb, request.cpu_fraction);
    transition(sandbox, SandboxState::Created);

    transition(sandbox, SandboxState::Starting);
    runtime_->start(sandbox.id, request.code);
    const auto started = Clock::now();
    const auto deadline = started + request.timeout;

    DeadlineRace race;
    const EnvironmentHandle handle = sandbox.id;
    // The waiter outlives the deadline by the kill grace so a killed
    // environment is still reaped by it; it never blocks past that.
    const auto wait_limit = deadline + 2 * options_.kill_grace;
    std::thread waiter([this, &race, handle, wait_limit] {
        try {
            race.complete(runtime_->wait(handle, wait_limit));
        } catch (const std::exception& e) {
            race.fail(e.what());
        }
    });
    WaiterGuard reap_waiter(waiter, *runtime_, handle);

    std::unique_ptr<UsageMonitor> monitor;
    if (options.monitor) {
        monitor = std::make_unique<UsageMonitor>(limiter_, handle, options_.monitor_interval, options.on_sample);
        monitor->start();
    }
    transition(sandbox, SandboxState::Running);

    RaceOutcome outcome = race.await(deadline, options.cancel);
    if (outcome == RaceOutcome::DeadlineExpired || outcome == RaceOutcome::Cancelled) {
        logger()->info("sandbox {}: {}, killing", handle, to_string(outcome));
        try {
            runtime_->kill(handle);
        } catch (const IsolationError& e) {
            logger()->warn("sandbox {}: kill failed: {}", handle, e.what());
        }
    }
    waiter.join();
    if (monitor) monitor->stop();

    const auto elapsed = since(begin);
    ExecutionResult result;
    WaitResult wait;
    switch (outcome) {
        case RaceOutcome::Completed:
            wait = race.take_result();
            result = wait.timed_out ? timeout_result(request.timeout, elapsed)
                                    : result_from_exit(wait, elapsed);
            break;
        case RaceOutcome::DeadlineExpired:
            result = timeout_result(request.timeout, elapsed);
            break;
        case RaceOutcome::Cancelled:
            result = cancelled_result(elapsed);
            break;
        case RaceOutcome::Failed:
            logger()->error("sandbox {}: lost track of environment: {}", handle, race.failure());
            result = ExecutionResult::failed(ErrorKind::IsolationFailure,
                                             "Isolation failure: lost track of environment: " + race.failure(),
                                             elapsed);
            break;
    }

    if (outcome == RaceOutcome::Completed || monitor) {
        ResourceUsage usage = wait.usage;
        if (monitor) {
            ResourceUsage sampled = monitor->usage();
            if (sampled.samples > 0) {
                usage.peak_memory_mb = std::max(usage.peak_memory_mb, sampled.peak_memory_mb);
                usage.avg_cpu_percent = sampled.avg_cpu_percent;
                usage.samples = sampled.samples;
            }
        }
        result.resource_usage = usage;
    }

    transition(sandbox, state_for(result));
    return result;
}

int SandboxManager::update_limits(int64_t memory_limit_mb, double cpu_fraction) {
    // Validates before touching any environment.
    ResourceLimiter::translate(memory_limit_mb, cpu_fraction, options_.pids_max);

    int changed = 0;
    for (const Sandbox& s : live_sandboxes()) {
        try {
            if (limiter_.update_limits(s.id, memory_limit_mb, cpu_fraction)) ++changed;
        } catch (const IsolationError& e) {
            // Environment finished while we were iterating.
            logger()->warn("sandbox {}: live limit update failed: {}", s.id, e.what());
        }
    }
    return changed;
}

std::vector<Sandbox> SandboxManager::live_sandboxes() const {
    std::lock_guard<std::mutex> lock(sandboxes_mtx_);
    std::vector<Sandbox> out;
    out.reserve(sandboxes_.size());
    for (const auto& [id, s] : sandboxes_) {
        if (s.state != SandboxState::Terminated) out.push_back(s);
    }
    return out;
}

} // namespace exec_kernel
