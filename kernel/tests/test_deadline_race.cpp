#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "exec_kernel/deadline_race.h"

using namespace exec_kernel;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

TEST(DeadlineRaceTest, CompletionBeforeDeadlineWins) {
    DeadlineRace race;
    std::thread worker([&] {
        std::this_thread::sleep_for(20ms);
        WaitResult r;
        r.status.exit_code = 0;
        r.stdout_output = "done";
        EXPECT_TRUE(race.complete(r));
    });

    RaceOutcome outcome = race.await(Clock::now() + 2s, CancellationToken{});
    worker.join();

    EXPECT_EQ(outcome, RaceOutcome::Completed);
    EXPECT_EQ(race.take_result().stdout_output, "done");
}

TEST(DeadlineRaceTest, DeadlineWinsAndLateCompletionIsDropped) {
    DeadlineRace race;
    auto start = Clock::now();
    RaceOutcome outcome = race.await(start + 50ms, CancellationToken{});
    EXPECT_EQ(outcome, RaceOutcome::DeadlineExpired);
    EXPECT_GE(Clock::now() - start, 50ms);

    WaitResult late;
    late.stdout_output = "too late";
    EXPECT_FALSE(race.complete(late));
    EXPECT_TRUE(race.take_result().stdout_output.empty());
}

TEST(DeadlineRaceTest, CancellationIsObservedWithinAPollSlice) {
    DeadlineRace race;
    CancellationToken cancel;
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(30ms);
        cancel.cancel();
    });

    auto start = Clock::now();
    RaceOutcome outcome = race.await(start + 5s, cancel, 10ms);
    canceller.join();

    EXPECT_EQ(outcome, RaceOutcome::Cancelled);
    EXPECT_LT(Clock::now() - start, 1s);
}

TEST(DeadlineRaceTest, FailureIsReported) {
    DeadlineRace race;
    EXPECT_TRUE(race.fail("runtime went away"));
    EXPECT_FALSE(race.complete(WaitResult{}));
    EXPECT_EQ(race.await(Clock::now() + 1s, CancellationToken{}), RaceOutcome::Failed);
    EXPECT_EQ(race.failure(), "runtime went away");
}

TEST(DeadlineRaceTest, ExactlyOneOfManyReportersWins) {
    DeadlineRace race;
    std::atomic<int> winners{0};
    std::vector<std::thread> reporters;
    for (int i = 0; i < 8; ++i) {
        reporters.emplace_back([&, i] {
            bool won = (i % 2 == 0) ? race.complete(WaitResult{}) : race.fail("lost");
            if (won) ++winners;
        });
    }
    for (auto& t : reporters) t.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_TRUE(race.decided());
}

TEST(CancellationTokenTest, CopiesShareState) {
    CancellationToken a;
    CancellationToken b = a;
    EXPECT_FALSE(b.cancelled());
    a.cancel();
    EXPECT_TRUE(b.cancelled());
    EXPECT_FALSE(CancellationToken{}.cancelled());
}
