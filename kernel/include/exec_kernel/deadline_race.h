#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

#include "cancellation.h"
#include "isolation_runtime.h"

namespace exec_kernel {

enum class RaceOutcome {
    Completed,
    DeadlineExpired,
    Cancelled,
    Failed,  // the completion side could not observe the exit
};

const char* to_string(RaceOutcome outcome) noexcept;

/// Natural completion against deadline and cancellation.
///
/// The completion side reports through complete()/fail() from its own
/// thread; await() blocks the supervising thread. The first event to arrive
/// decides the outcome and every later report is dropped.
class DeadlineRace {
public:
    /// Returns false when the race was already decided.
    bool complete(WaitResult result);
    bool fail(std::string message);

    RaceOutcome await(std::chrono::steady_clock::time_point deadline,
                      const CancellationToken& cancel,
                      std::chrono::milliseconds poll = std::chrono::milliseconds(20));

    bool decided() const;

    /// Payload of the winning completion; empty unless await() returned Completed.
    WaitResult take_result();
    std::string failure() const;

private:
    bool settle(RaceOutcome outcome);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool decided_ = false;
    RaceOutcome outcome_ = RaceOutcome::Failed;
    WaitResult result_;
    std::string failure_;
};

} // namespace exec_kernel
