#ifndef RUNSTREAM_CHANNEL_HPP
#define RUNSTREAM_CHANNEL_HPP

#include <runstream/value.hpp>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace runstream {

class StreamCancelled : public RunStreamError {
public:
    StreamCancelled() : RunStreamError("Stream cancelled") {}
};

/**
 * Pull side of an ordered, possibly unbounded sequence.
 * next() blocks until an item is ready and returns nullopt once the
 * sequence is exhausted. cancel() tells the producer to stop; a later
 * next() throws StreamCancelled.
 */
template<typename T>
class Source {
public:
    virtual ~Source() = default;

    virtual std::optional<T> next() = 0;
    virtual void cancel() = 0;
};

/**
 * Source over items already in memory.
 */
template<typename T>
class VectorSource : public Source<T> {
private:
    std::vector<T> items_;
    size_t position_{0};
    bool cancelled_{false};

public:
    explicit VectorSource(std::vector<T> items) : items_(std::move(items)) {}

    std::optional<T> next() override {
        if (cancelled_) {
            throw StreamCancelled();
        }
        if (position_ >= items_.size()) {
            return std::nullopt;
        }
        return std::move(items_[position_++]);
    }

    void cancel() override {
        cancelled_ = true;
    }

    bool is_cancelled() const { return cancelled_; }
    size_t consumed() const { return position_; }
};

/**
 * Bounded multi-producer single-consumer hand-off queue.
 * - push() blocks while the buffer is full (backpressure)
 * - close() ends the sequence once buffered items are drained
 * - cancel() drops buffered items, wakes everyone, and makes push() return false
 */
template<typename T>
class Channel : public Source<T> {
private:
    std::deque<T> buffer_;
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool closed_{false};
    bool cancelled_{false};

public:
    explicit Channel(size_t capacity = 64) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("Channel capacity must be positive");
        }
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false if the consumer cancelled; pushing after close() is a logic error
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return cancelled_ || buffer_.size() < capacity_; });
        if (cancelled_) {
            return false;
        }
        if (closed_) {
            throw std::logic_error("push on a closed Channel");
        }
        buffer_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool try_push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_ || closed_ || buffer_.size() >= capacity_) {
                return false;
            }
            buffer_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    std::optional<T> next() override {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return cancelled_ || closed_ || !buffer_.empty(); });
        if (cancelled_) {
            throw StreamCancelled();
        }
        if (buffer_.empty()) {
            return std::nullopt;  // closed and drained
        }
        T item = std::move(buffer_.front());
        buffer_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
            buffer_.clear();
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.size();
    }

    size_t capacity() const { return capacity_; }
};

} // namespace runstream

#endif // RUNSTREAM_CHANNEL_HPP
