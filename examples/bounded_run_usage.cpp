/**
 * Bounded Run Usage Example
 *
 * Demonstrates running independent work under a concurrency ceiling:
 * - Collecting results in input order
 * - Fail-fast behaviour on the first error
 * - Serving several event consumers from one translated session
 */

#include <job_system/bounded_run.hpp>
#include <runstream/dispatch.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

int main() {
    std::cout << "=== Bounded Run Usage Example ===\n\n";

    // Example 1: At most two tasks at a time
    std::cout << "=== Example 1: Ordered Results ===\n";
    std::atomic<int> active{0};
    std::vector<std::function<int()>> tasks;
    for (int i = 0; i < 6; ++i) {
        tasks.push_back([&active, i]() {
            int now = active.fetch_add(1) + 1;
            std::cout << "Task " << i << " running (" << now << " active)\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (6 - i)));
            active.fetch_sub(1);
            return i * i;
        });
    }

    auto squares = job_system::run_bounded<int>(2, std::move(tasks));
    std::cout << "Results:";
    for (int value : squares) {
        std::cout << " " << value;
    }
    std::cout << "\n\n";

    // Example 2: The first failure aborts the call
    std::cout << "=== Example 2: Fail Fast ===\n";
    std::vector<std::function<int()>> flaky;
    for (int i = 0; i < 5; ++i) {
        flaky.push_back([i]() -> int {
            if (i == 2) {
                throw std::runtime_error("task 3 could not reach its backend");
            }
            return i;
        });
    }
    try {
        job_system::run_bounded<int>(1, std::move(flaky));
    } catch (const std::runtime_error& e) {
        std::cout << "Aborted: " << e.what() << "\n\n";
    }

    // Example 3: Several subscribers of one session
    std::cout << "=== Example 3: Event Dispatch ===\n";
    using runstream::PatchOp;
    using runstream::RunLogPatch;
    auto events = runstream::collect_events({
        RunLogPatch{PatchOp::add("/id", "run-1")},
        RunLogPatch{PatchOp::add("/logs/search/id", "run-2")},
        RunLogPatch{PatchOp::add("/logs/search/type", "tool")},
        RunLogPatch{PatchOp::add("/logs/search/end_time", "t1")}
    });

    std::atomic<size_t> delivered{0};
    std::vector<runstream::EventConsumer> consumers;
    for (int i = 0; i < 3; ++i) {
        consumers.push_back([&delivered](const runstream::StreamEvent&) {
            delivered.fetch_add(1);
        });
    }
    runstream::dispatch_events(events, consumers, 2);
    std::cout << "Delivered " << delivered.load() << " events to " << consumers.size() << " consumers\n";

    return 0;
}
