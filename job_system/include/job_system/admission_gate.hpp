#ifndef JOB_SYSTEM_ADMISSION_GATE_HPP
#define JOB_SYSTEM_ADMISSION_GATE_HPP

#include <atomic>
#include <cstddef>
#include <stdexcept>

namespace job_system {

/**
 * Counting gate limiting how many units of work may be in flight.
 * Non-blocking: a caller that fails to acquire keeps its work queued
 * instead of parking a worker thread on the gate.
 */
class AdmissionGate {
private:
    const size_t limit_;
    std::atomic<size_t> in_use_{0};
    std::atomic<size_t> peak_{0};

public:
    explicit AdmissionGate(size_t limit) : limit_(limit) {
        if (limit_ == 0) {
            throw std::invalid_argument("AdmissionGate limit must be positive");
        }
    }

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    bool try_acquire() {
        size_t current = in_use_.load(std::memory_order_relaxed);
        while (current < limit_) {
            if (in_use_.compare_exchange_weak(current, current + 1,
                    std::memory_order_acq_rel, std::memory_order_relaxed)) {
                size_t peak = peak_.load(std::memory_order_relaxed);
                while (current + 1 > peak &&
                       !peak_.compare_exchange_weak(peak, current + 1, std::memory_order_relaxed)) {
                }
                return true;
            }
        }
        return false;
    }

    void release() {
        size_t current = in_use_.load(std::memory_order_relaxed);
        do {
            if (current == 0) {
                throw std::logic_error("AdmissionGate released more often than acquired");
            }
        } while (!in_use_.compare_exchange_weak(current, current - 1,
                    std::memory_order_acq_rel, std::memory_order_relaxed));
    }

    size_t limit() const noexcept { return limit_; }
    size_t in_use() const noexcept { return in_use_.load(std::memory_order_acquire); }

    // Highest simultaneous occupancy observed since construction
    size_t peak() const noexcept { return peak_.load(std::memory_order_acquire); }
};

} // namespace job_system

#endif // JOB_SYSTEM_ADMISSION_GATE_HPP
