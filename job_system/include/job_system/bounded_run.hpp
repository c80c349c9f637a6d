#ifndef JOB_SYSTEM_BOUNDED_RUN_HPP
#define JOB_SYSTEM_BOUNDED_RUN_HPP

#include <job_system/admission_gate.hpp>
#include <job_system/job_system.hpp>
#include <algorithm>
#include <condition_variable>
#include <cstdio>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace job_system {

enum class BoundedTaskType {
    Task
};

namespace detail {

template<typename R>
using ResultSlot = std::conditional_t<std::is_void_v<R>, bool, std::optional<R>>;

/**
 * Shared state of one run_bounded call. Held by shared_ptr so that it stays
 * valid for sibling jobs still running after the caller has returned.
 */
template<typename JobType, typename R>
struct BoundedRun {
    JobSystem<JobType>& system;
    JobType job_type;
    std::vector<std::function<R()>> tasks;
    std::vector<ResultSlot<R>> results;
    std::unique_ptr<AdmissionGate> gate;  // null when unbounded

    std::mutex mutex;
    std::condition_variable done_cv;
    size_t next_index = 0;
    size_t active = 0;
    bool failed = false;
    bool done = false;
    std::exception_ptr first_error;

    BoundedRun(JobSystem<JobType>& sys, JobType type, std::vector<std::function<R()>> work,
               std::optional<size_t> limit)
        : system(sys), job_type(type), tasks(std::move(work)), results(tasks.size()) {
        if (limit) {
            gate = std::make_unique<AdmissionGate>(*limit);
        }
    }

    void fail(std::exception_ptr error) {
        if (!first_error) {
            first_error = error;
        }
        failed = true;
    }

    // A failure completes the call at once; success waits for every task
    void check_done() {
        if (done) return;
        if (failed || (active == 0 && next_index == tasks.size())) {
            done = true;
            done_cv.notify_all();
        }
    }

    // Submit as many pending tasks as the gate allows
    static void admit(const std::shared_ptr<BoundedRun>& self) {
        std::lock_guard<std::mutex> lock(self->mutex);
        while (!self->failed && self->next_index < self->tasks.size()) {
            if (self->gate && !self->gate->try_acquire()) {
                break;
            }
            size_t index = self->next_index++;
            ++self->active;
            try {
                self->system.submit_function([self, index]() { run_one(self, index); },
                                             self->job_type, ScheduleMode::FIFO);
            } catch (...) {
                --self->active;
                if (self->gate) self->gate->release();
                self->fail(std::current_exception());
            }
        }
        self->check_done();
    }

    static void run_one(const std::shared_ptr<BoundedRun>& self, size_t index) {
        std::exception_ptr error;
        ResultSlot<R> value{};
        try {
            if constexpr (std::is_void_v<R>) {
                self->tasks[index]();
                value = true;
            } else {
                value.emplace(self->tasks[index]());
            }
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(self->mutex);
            if (error) {
#ifdef JOBSYSTEM_DEBUG
                printf("[JOB_SYSTEM DEBUG] bounded task %zu failed, admission stopped\n", index);
                fflush(stdout);
#endif
                self->fail(error);
                self->check_done();
            } else if (!self->failed) {
                self->results[index] = std::move(value);
            }
            --self->active;
            if (self->gate) self->gate->release();
        }

        admit(self);
    }
};

template<typename JobType, typename R>
std::shared_ptr<BoundedRun<JobType, R>> launch_and_wait(JobSystem<JobType>& system, JobType job_type,
                                                       std::optional<size_t> limit,
                                                       std::vector<std::function<R()>> tasks) {
    using Run = BoundedRun<JobType, R>;
    auto run = std::make_shared<Run>(system, job_type, std::move(tasks), limit);
    Run::admit(run);

    std::unique_lock<std::mutex> lock(run->mutex);
    run->done_cv.wait(lock, [&run] { return run->done; });
    return run;
}

template<typename JobType, typename R>
auto collect_results(BoundedRun<JobType, R>& run)
    -> std::conditional_t<std::is_void_v<R>, void, std::vector<R>> {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(run.mutex);
        error = run.first_error;
    }
    if (error) {
        std::rethrow_exception(error);
    }

    if constexpr (std::is_void_v<R>) {
        return;
    } else {
        std::vector<R> results;
        results.reserve(run.results.size());
        for (auto& slot : run.results) {
            results.push_back(std::move(*slot));
        }
        return results;
    }
}

} // namespace detail

/**
 * Run independent tasks on a running job system with at most `limit` of them
 * executing at once (no limit when empty). Results come back in input order.
 *
 * The first task to throw stops further admission and its exception is
 * rethrown right away. Tasks already running are not awaited: they finish on
 * the pool in the background and their results are discarded, so anything
 * they capture by reference must outlive them.
 */
template<typename JobType, typename R>
auto run_bounded(JobSystem<JobType>& system, JobType job_type, std::optional<size_t> limit,
                 std::vector<std::function<R()>> tasks)
    -> std::conditional_t<std::is_void_v<R>, void, std::vector<R>> {
    if (limit && *limit == 0) {
        throw std::invalid_argument("run_bounded limit must be positive");
    }

    if (tasks.empty()) {
        if constexpr (std::is_void_v<R>) {
            return;
        } else {
            return {};
        }
    }

    auto run = detail::launch_and_wait(system, job_type, limit, std::move(tasks));
    return detail::collect_results(*run);
}

/**
 * Same as above on a private pool sized to the admitted parallelism.
 *
 * Without a limit every task gets its own worker thread and starts
 * immediately, so the thread count grows with the task list. Pass a limit
 * for large task lists.
 *
 * After a failure the pool is shut down on a detached thread once the
 * remaining siblings return, and the call itself does not wait for them.
 */
template<typename R>
auto run_bounded(std::optional<size_t> limit, std::vector<std::function<R()>> tasks)
    -> std::conditional_t<std::is_void_v<R>, void, std::vector<R>> {
    if (limit && *limit == 0) {
        throw std::invalid_argument("run_bounded limit must be positive");
    }

    if (tasks.empty()) {
        if constexpr (std::is_void_v<R>) {
            return;
        } else {
            return {};
        }
    }

    size_t workers = limit ? std::min(*limit, tasks.size()) : tasks.size();
    auto system = std::make_unique<JobSystem<BoundedTaskType>>(workers);
    system->start();

    auto run = detail::launch_and_wait(*system, BoundedTaskType::Task, limit, std::move(tasks));

    bool siblings_running;
    {
        std::lock_guard<std::mutex> lock(run->mutex);
        siblings_running = run->active > 0;
    }
    if (siblings_running) {
        std::thread([pool = std::move(system)]() mutable { pool.reset(); }).detach();
    }

    return detail::collect_results(*run);
}

} // namespace job_system

#endif // JOB_SYSTEM_BOUNDED_RUN_HPP
