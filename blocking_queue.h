// Thread-safe queue for handing work between threads
// (closures posted into the event loop, transfer results for the history writer)
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace linkshare {

template<typename T>
class BlockingQueue {
public:
    void push(T&& item) {
        { std::lock_guard<std::mutex> lk(m_); q_.push_back(std::move(item)); }
        cv_.notify_one();
    }

    // Blocks until an item arrives or `running` drops; returns false only when stopped and empty.
    bool wait_pop(T& out, const std::atomic<bool>& running) {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&] { return !q_.empty() || !running.load(); });
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    // Moves everything queued so far into `out` under one lock.
    std::size_t drain(std::vector<T>& out) {
        std::lock_guard<std::mutex> lk(m_);
        std::size_t n = q_.size();
        for (auto& item : q_) out.push_back(std::move(item));
        q_.clear();
        return n;
    }

    // Wakes waiters after `running` was cleared; the lock orders it against their predicate check.
    void notify_all() {
        std::lock_guard<std::mutex> lk(m_);
        cv_.notify_all();
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<T> q_;
};

} // namespace linkshare
