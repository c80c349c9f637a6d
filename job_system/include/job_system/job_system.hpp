#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <algorithm>
#include <thread>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <new>
#include <stdexcept>
#include <random>
#include <string>

namespace job_system {

// Error types that can occur during job execution
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught
    Aborted,       // AbortedException caught (user requested abort)
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

// Thrown by a job to request that the whole system stop
class AbortedException : public std::runtime_error {
public:
    AbortedException() : std::runtime_error("Operation aborted") {}
    explicit AbortedException(const std::string& message) : std::runtime_error(message) {}
};

template<typename JobType>
class JobSystem {
private:
    struct WorkerData {
        std::deque<JobPtr<JobType>> tasks;  // Supports both LIFO and FIFO
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        std::atomic<size_t> jobs_executed{0};
        std::atomic<size_t> jobs_executing{0};
        std::atomic<size_t> jobs_stolen{0};
    };

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};
    size_t num_threads_;

    // Global work tracking for completion detection
    std::atomic<size_t> total_submitted_{0};
    std::atomic<size_t> total_completed_{0};
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    // First failure wins; later failures only bump the counter
    std::atomic<ErrorType> error_type_{ErrorType::None};
    std::atomic<size_t> failed_jobs_{0};
    mutable std::mutex error_mutex_;
    std::exception_ptr first_exception_;

    // Try to steal half the tasks from a victim worker
    std::vector<JobPtr<JobType>> try_steal_from(WorkerData* victim) {
        std::vector<JobPtr<JobType>> stolen;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);

        if (!lock.owns_lock() || victim->tasks.empty()) {
            return stolen;
        }

        size_t steal_count = std::max(size_t(1), victim->tasks.size() / 2);
        stolen.reserve(steal_count);

        for (size_t i = 0; i < steal_count && !victim->tasks.empty(); ++i) {
            stolen.push_back(std::move(victim->tasks.front()));
            victim->tasks.pop_front();
        }

        return stolen;
    }

    void record_failure(ErrorType type, std::exception_ptr error) {
        failed_jobs_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            if (!first_exception_) {
                first_exception_ = error;
                error_type_.store(type, std::memory_order_release);
            }
        }
        for (auto& w : workers_) {
            w->stop.store(true);
        }
    }

    void worker_loop(WorkerData* data) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<size_t> dist(0, workers_.size() - 1);

        while (true) {
            JobPtr<JobType> job;

            {
                std::unique_lock<std::mutex> lock(data->mutex);

                // If no local work, try stealing before waiting
                if (data->tasks.empty() && !data->stop.load()) {
                    lock.unlock();

                    for (size_t attempt = 0; attempt < workers_.size(); ++attempt) {
                        auto* victim = workers_[dist(gen)].get();
                        if (victim == data) continue;

                        auto stolen = try_steal_from(victim);
                        if (!stolen.empty()) {
                            std::lock_guard<std::mutex> local_lock(data->mutex);
                            for (auto& stolen_job : stolen) {
                                data->tasks.push_back(std::move(stolen_job));
                            }
                            data->jobs_stolen.fetch_add(stolen.size());
                            break;
                        }
                    }

                    lock.lock();
                }

                data->cv.wait_for(lock, std::chrono::milliseconds(1), [data] {
                    return data->stop.load() || !data->tasks.empty();
                });

                // Queued work is still drained after a stop request
                if (data->stop.load() && data->tasks.empty()) {
                    break;
                }

                if (!data->tasks.empty()) {
                    job = std::move(data->tasks.back());
                    data->tasks.pop_back();
                }
            }

            if (job) {
                data->jobs_executing.fetch_add(1);

                // Worker threads must not throw
                try {
                    job->execute();
                } catch (const std::bad_alloc&) {
                    record_failure(ErrorType::OutOfMemory, std::current_exception());
                } catch (const AbortedException&) {
                    record_failure(ErrorType::Aborted, std::current_exception());
                } catch (const std::exception&) {
                    record_failure(ErrorType::Exception, std::current_exception());
                } catch (...) {
                    record_failure(ErrorType::Unhandled, std::current_exception());
                }

                data->jobs_executing.fetch_sub(1);
                data->jobs_executed.fetch_add(1);

                {
                    std::lock_guard<std::mutex> lock(completion_mutex_);
                    total_completed_.fetch_add(1);
                }
                completion_cv_.notify_all();
            }
        }
    }

    bool all_work_done() {
        if (total_submitted_.load() != total_completed_.load()) {
            return false;
        }
        for (const auto& worker : workers_) {
            std::lock_guard<std::mutex> worker_lock(worker->mutex);
            if (!worker->tasks.empty() || worker->jobs_executing.load() > 0) {
                return false;
            }
        }
        std::atomic_thread_fence(std::memory_order_acquire);
        return total_submitted_.load() == total_completed_.load();
    }

public:
    explicit JobSystem(size_t num_threads = 0)
        : num_threads_(num_threads == 0 ? std::thread::hardware_concurrency() : num_threads) {
        if (num_threads_ == 0) num_threads_ = 1;

        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    ~JobSystem() {
        shutdown();
    }

    void start() {
        if (is_running_.load()) return;

        // Reset counters and error state for new session
        total_submitted_.store(0);
        total_completed_.store(0);
        failed_jobs_.store(0);
        error_type_.store(ErrorType::None, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            first_exception_ = nullptr;
        }

        for (auto& worker : workers_) {
            worker->stop.store(false);
            auto* w = worker.get();
            worker->thread = std::thread([this, w] {
                worker_loop(w);
            });
        }

        is_running_.store(true);
    }

    void shutdown() {
        if (!is_running_.load()) return;

        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop.store(true);
            }
            worker->cv.notify_all();
        }

        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }

        is_running_.store(false);
    }

    void submit(JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        submit_to_worker(worker_idx, std::move(job), mode);
    }

    void submit_to_worker(size_t worker_id, JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        if (worker_id >= workers_.size()) {
            throw std::out_of_range("Invalid worker ID");
        }

        total_submitted_.fetch_add(1);

        auto* worker = workers_[worker_id].get();

        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            if (worker->stop.load()) {
                // The worker may already have exited; the job would never run
                total_submitted_.fetch_sub(1);
                throw std::runtime_error("JobSystem is stopping after a job failure");
            }
            if (mode == ScheduleMode::LIFO) {
                worker->tasks.push_back(std::move(job));
            } else {
                // FIFO: push to front, pop from back (oldest at back)
                worker->tasks.push_front(std::move(job));
            }
        }
        worker->cv.notify_one();
    }

    template<typename F>
    void submit_function(F&& func, JobType job_type, ScheduleMode mode = ScheduleMode::LIFO) {
        submit(make_job(std::forward<F>(func), job_type), mode);
    }

    // Wait for completion with abort callback
    // If abort_check returns true, stops waiting and returns true (aborted)
    // Returns false if completed normally
    template<typename AbortCheck>
    bool wait_for_completion_with_abort(AbortCheck&& abort_check) {
        while (true) {
            if (abort_check()) {
                return true;
            }

            {
                std::unique_lock<std::mutex> lock(completion_mutex_);
                completion_cv_.wait_for(lock, std::chrono::milliseconds(10), [this] {
                    return total_submitted_.load() == total_completed_.load();
                });
            }

            if (all_work_done()) {
                return false;
            }
        }
    }

    void wait_for_completion() {
        wait_for_completion_with_abort([] { return false; });
    }

    size_t get_num_workers() const {
        return workers_.size();
    }

    // Submitted but not yet completed
    size_t get_pending_count() const {
        size_t submitted = total_submitted_.load(std::memory_order_relaxed);
        size_t completed = total_completed_.load(std::memory_order_relaxed);
        return submitted > completed ? submitted - completed : 0;
    }

    size_t get_executing_count() const {
        size_t count = 0;
        for (const auto& worker : workers_) {
            count += worker->jobs_executing.load(std::memory_order_relaxed);
        }
        return count;
    }

    bool is_running() const {
        return is_running_.load();
    }

    ErrorType get_error_type() const {
        return error_type_.load(std::memory_order_acquire);
    }

    bool has_error() const {
        return get_error_type() != ErrorType::None;
    }

    size_t get_failed_count() const {
        return failed_jobs_.load();
    }

    std::exception_ptr first_exception() const {
        std::lock_guard<std::mutex> lock(error_mutex_);
        return first_exception_;
    }

    // Rethrows the first exception any job raised since start()
    void rethrow_if_failed() const {
        if (auto error = first_exception()) {
            std::rethrow_exception(error);
        }
    }

    const char* get_error_description() const {
        switch (get_error_type()) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Aborted: return "Aborted";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

    struct SystemStatistics {
        size_t total_jobs_executed;
        size_t total_jobs_stolen;
        size_t total_jobs_failed;
    };

    SystemStatistics get_statistics() const {
        size_t total_executed = 0;
        size_t total_stolen = 0;
        for (const auto& worker : workers_) {
            total_executed += worker->jobs_executed.load();
            total_stolen += worker->jobs_stolen.load();
        }

        return SystemStatistics{
            total_executed,
            total_stolen,
            failed_jobs_.load()
        };
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP
