#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <utility>


namespace lcr {
namespace sync {

// -----------------------------------------------------------------------------
// bounded_queue - blocking multi-producer / multi-consumer FIFO
//
// push() blocks while the queue is full, pop() blocks while it is empty.
// close() wakes every waiter: subsequent pushes are rejected and pops keep
// returning queued items until the queue is drained, then return false.
// -----------------------------------------------------------------------------
template <typename T>
class bounded_queue {
public:
    explicit bounded_queue(std::size_t capacity) noexcept
        : capacity_(capacity == 0 ? 1 : capacity)
    {}

    bounded_queue(const bounded_queue&) = delete;
    bounded_queue& operator=(const bounded_queue&) = delete;

    /// Returns false if the queue was closed before the item could be queued.
    [[nodiscard]]
    bool push(T&& item) {
        std::unique_lock<std::mutex> lk(mtx_);
        not_full_.wait(lk, [&] { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        lk.unlock();
        not_empty_.notify_one();
        return true;
    }

    /// Non-blocking variant: false when full or closed.
    [[nodiscard]]
    bool try_push(T&& item) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /// Returns false only once the queue is closed and drained.
    [[nodiscard]]
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mtx_);
        not_empty_.wait(lk, [&] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        lk.unlock();
        not_full_.notify_one();
        return true;
    }

    void close() noexcept {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]]
    bool closed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

    [[nodiscard]]
    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return items_.size();
    }

    [[nodiscard]]
    std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    std::deque<T> items_;
    bool closed_ = false;

    mutable std::mutex mtx_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
};

} // namespace sync
} // namespace lcr
