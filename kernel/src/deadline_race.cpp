#include "exec_kernel/deadline_race.h"

#include <algorithm>

namespace exec_kernel {

const char* to_string(RaceOutcome outcome) noexcept {
    switch (outcome) {
        case RaceOutcome::Completed:       return "completed";
        case RaceOutcome::DeadlineExpired: return "deadline expired";
        case RaceOutcome::Cancelled:       return "cancelled";
        case RaceOutcome::Failed:          return "failed";
    }
    return "unknown";
}

bool DeadlineRace::settle(RaceOutcome outcome) {
    // mtx_ held by caller
    if (decided_) return false;
    decided_ = true;
    outcome_ = outcome;
    cv_.notify_all();
    return true;
}

bool DeadlineRace::complete(WaitResult result) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (decided_) return false;
    result_ = std::move(result);
    return settle(RaceOutcome::Completed);
}

bool DeadlineRace::fail(std::string message) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (decided_) return false;
    failure_ = std::move(message);
    return settle(RaceOutcome::Failed);
}

RaceOutcome DeadlineRace::await(std::chrono::steady_clock::time_point deadline,
                                const CancellationToken& cancel,
                                std::chrono::milliseconds poll) {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!decided_) {
        if (cancel.cancelled()) {
            settle(RaceOutcome::Cancelled);
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            settle(RaceOutcome::DeadlineExpired);
            break;
        }
        // Cancellation has no wakeup of its own, so sleep in slices.
        auto until = std::min(deadline, now + poll);
        cv_.wait_until(lock, until, [this] { return decided_; });
    }
    return outcome_;
}

bool DeadlineRace::decided() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return decided_;
}

WaitResult DeadlineRace::take_result() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!decided_ || outcome_ != RaceOutcome::Completed) return {};
    return std::move(result_);
}

std::string DeadlineRace::failure() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return failure_;
}

} // namespace exec_kernel
