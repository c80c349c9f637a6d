#include <gtest/gtest.h>
#include <job_system/admission_gate.hpp>
#include <job_system/bounded_run.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

// Tracks how many instrumented tasks are inside their body at once
struct ConcurrencyProbe {
    std::atomic<int> current{0};
    std::atomic<int> peak{0};

    void enter() {
        int now = current.fetch_add(1) + 1;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
    }

    void leave() {
        current.fetch_sub(1);
    }
};

std::function<int()> probed_task(ConcurrencyProbe& probe, int value, int sleep_ms = 5) {
    return [&probe, value, sleep_ms]() {
        probe.enter();
        std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
        probe.leave();
        return value;
    };
}

} // anonymous namespace

TEST(AdmissionGateTest, RejectsZeroLimit) {
    EXPECT_THROW(job_system::AdmissionGate(0), std::invalid_argument);
}

TEST(AdmissionGateTest, AcquireUpToLimit) {
    job_system::AdmissionGate gate(2);

    EXPECT_TRUE(gate.try_acquire());
    EXPECT_TRUE(gate.try_acquire());
    EXPECT_FALSE(gate.try_acquire());
    EXPECT_EQ(gate.in_use(), 2u);

    gate.release();
    EXPECT_EQ(gate.in_use(), 1u);
    EXPECT_TRUE(gate.try_acquire());
    EXPECT_EQ(gate.peak(), 2u);
    EXPECT_EQ(gate.limit(), 2u);
}

TEST(AdmissionGateTest, ReleaseWithoutAcquireIsError) {
    job_system::AdmissionGate gate(1);
    EXPECT_THROW(gate.release(), std::logic_error);
}

TEST(BoundedRunTest, ResultsInInputOrder) {
    std::vector<std::function<int()>> tasks;
    for (int i = 0; i < 8; ++i) {
        // Later tasks finish first
        tasks.push_back([i]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2 * (8 - i)));
            return i * 10;
        });
    }

    auto results = job_system::run_bounded<int>(3, std::move(tasks));

    ASSERT_EQ(results.size(), 8u);
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(results[i], i * 10);
    }
}

TEST(BoundedRunTest, NeverExceedsLimit) {
    ConcurrencyProbe probe;
    std::vector<std::function<int()>> tasks;
    for (int i = 0; i < 20; ++i) {
        tasks.push_back(probed_task(probe, i));
    }

    auto results = job_system::run_bounded<int>(2, std::move(tasks));

    EXPECT_EQ(results.size(), 20u);
    EXPECT_LE(probe.peak.load(), 2);
    EXPECT_GE(probe.peak.load(), 1);
}

TEST(BoundedRunTest, LimitAboveTaskCountRunsEverything) {
    ConcurrencyProbe probe;
    std::vector<std::function<int()>> tasks;
    for (int i = 0; i < 3; ++i) {
        tasks.push_back(probed_task(probe, i, 20));
    }

    auto results = job_system::run_bounded<int>(10, std::move(tasks));

    EXPECT_EQ(results, (std::vector<int>{0, 1, 2}));
    EXPECT_LE(probe.peak.load(), 3);
}

TEST(BoundedRunTest, UnboundedStartsAllTasks) {
    std::atomic<int> arrived{0};
    std::vector<std::function<int()>> tasks;
    for (int i = 0; i < 4; ++i) {
        // Each task waits for all four; this only completes if they run together
        tasks.push_back([&arrived, i]() {
            arrived.fetch_add(1);
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (arrived.load() < 4 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return arrived.load() == 4 ? i : -1;
        });
    }

    auto results = job_system::run_bounded<int>(std::nullopt, std::move(tasks));

    EXPECT_EQ(results, (std::vector<int>{0, 1, 2, 3}));
}

TEST(BoundedRunTest, EmptyTaskList) {
    auto results = job_system::run_bounded<int>(4, {});
    EXPECT_TRUE(results.empty());
}

TEST(BoundedRunTest, ZeroLimitRejected) {
    std::vector<std::function<int()>> tasks{[]() { return 1; }};
    EXPECT_THROW(job_system::run_bounded<int>(0, std::move(tasks)), std::invalid_argument);
}

TEST(BoundedRunTest, FirstFailureStopsAdmission) {
    std::atomic<int> started{0};
    std::vector<std::function<int()>> tasks;
    for (int i = 0; i < 5; ++i) {
        tasks.push_back([&started, i]() -> int {
            started.fetch_add(1);
            if (i == 2) {
                throw std::runtime_error("task 3 failed");
            }
            return i;
        });
    }

    try {
        job_system::run_bounded<int>(1, std::move(tasks));
        FAIL() << "expected the task failure to propagate";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "task 3 failed");
    }

    // With one slot the tasks after the failing one are never started
    EXPECT_EQ(started.load(), 3);
}

TEST(BoundedRunTest, FailureDoesNotWaitForRunningSiblings) {
    using Clock = std::chrono::steady_clock;
    auto finished = std::make_shared<std::atomic<int>>(0);

    std::vector<std::function<int()>> tasks;
    for (int i = 0; i < 5; ++i) {
        tasks.push_back([finished, i]() -> int {
            if (i == 2) {
                throw std::runtime_error("task 3 failed");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            finished->fetch_add(1);
            return i;
        });
    }

    auto begin = Clock::now();
    try {
        job_system::run_bounded<int>(std::nullopt, std::move(tasks));
        FAIL() << "expected the task failure to propagate";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "task 3 failed");
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - begin);

    EXPECT_LT(elapsed.count(), 1000);
    EXPECT_EQ(finished->load(), 0);
}

TEST(BoundedRunTest, SharedPoolFailureLeavesSiblingsOnPool) {
    enum class PoolJob { Work };
    using Clock = std::chrono::steady_clock;

    job_system::JobSystem<PoolJob> pool(2);
    pool.start();

    auto sibling_done = std::make_shared<std::atomic<bool>>(false);
    std::vector<std::function<int()>> tasks{
        [sibling_done]() -> int {
            std::this_thread::sleep_for(std::chrono::milliseconds(800));
            sibling_done->store(true);
            return 0;
        },
        []() -> int {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            throw std::runtime_error("boom");
        }
    };

    auto begin = Clock::now();
    EXPECT_THROW((job_system::run_bounded<PoolJob, int>(pool, PoolJob::Work, std::nullopt, std::move(tasks))),
                 std::runtime_error);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - begin);

    EXPECT_LT(elapsed.count(), 500);
    EXPECT_FALSE(sibling_done->load());

    // Shutting the pool down lets the sibling run to completion
    pool.shutdown();
    EXPECT_TRUE(sibling_done->load());
}

TEST(BoundedRunTest, VoidTasks) {
    std::atomic<int> counter{0};
    std::vector<std::function<void()>> tasks;
    for (int i = 0; i < 10; ++i) {
        tasks.push_back([&counter]() { counter.fetch_add(1); });
    }

    job_system::run_bounded<void>(3, std::move(tasks));

    EXPECT_EQ(counter.load(), 10);
}

TEST(BoundedRunTest, SharedPoolOverload) {
    enum class PoolJob { Work };

    job_system::JobSystem<PoolJob> pool(4);
    pool.start();

    ConcurrencyProbe probe;
    std::vector<std::function<int()>> tasks;
    for (int i = 0; i < 12; ++i) {
        tasks.push_back(probed_task(probe, i));
    }

    auto results = job_system::run_bounded<PoolJob, int>(pool, PoolJob::Work, 2, std::move(tasks));

    ASSERT_EQ(results.size(), 12u);
    for (int i = 0; i < 12; ++i) {
        EXPECT_EQ(results[i], i);
    }
    EXPECT_LE(probe.peak.load(), 2);

    // The pool keeps serving after the call
    std::vector<std::function<std::string()>> more{[]() { return std::string("again"); }};
    auto again = job_system::run_bounded<PoolJob, std::string>(pool, PoolJob::Work, std::nullopt, std::move(more));
    EXPECT_EQ(again, (std::vector<std::string>{"again"}));

    pool.shutdown();
}
