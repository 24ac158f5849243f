// Single-threaded poll loop with timers
#pragma once

#include "blocking_queue.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace linkshare {

using Clock = std::chrono::steady_clock;
using TimerId = std::uint64_t;

// Single-threaded timer source every engine schedules its work on.
// All callbacks run on the thread that drives the scheduler.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual Clock::time_point now() const = 0;

    // Runs `fn` once after `delay`; returns an id usable with cancel(). Never returns 0.
    virtual TimerId schedule_after(std::chrono::milliseconds delay, std::function<void()> fn) = 0;

    // Cancelling an id that already fired or was never issued is a no-op.
    virtual void cancel(TimerId id) = 0;

    // Runs `fn` on the next turn of the loop (same thread only).
    void post(std::function<void()> fn) { schedule_after(std::chrono::milliseconds(0), std::move(fn)); }
};

// One re-armable timer. Arming an armed timer replaces the pending callback,
// so at most one callback is outstanding per Timer.
class Timer {
public:
    explicit Timer(Scheduler& sched) : sched_(sched) {}
    ~Timer() { cancel(); }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    void arm(std::chrono::milliseconds delay, std::function<void()> fn);
    void cancel();
    bool armed() const { return id_ != 0; }

private:
    Scheduler& sched_;
    TimerId id_ = 0;
};

// poll()-driven event loop: ordered timers, fd readiness callbacks, and a
// wake pipe for closures dispatched from other threads.
class EventLoop : public Scheduler {
public:
    using FdCallback = std::function<void(short revents)>;

    EventLoop();
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    Clock::time_point now() const override { return Clock::now(); }
    TimerId schedule_after(std::chrono::milliseconds delay, std::function<void()> fn) override;
    void cancel(TimerId id) override;

    void watch(int fd, short events, FdCallback cb);
    void update(int fd, short events);
    void unwatch(int fd);

    // Thread-safe: queues `fn` to run on the loop thread and wakes the loop.
    void dispatch(std::function<void()> fn);

    // Runs until stop(); stop() is thread-safe and async-signal-safe.
    void run();
    void stop();
    bool running() const { return running_.load(); }

    // One poll/timer/dispatch turn waiting at most `max_wait_ms`; returns false if poll failed.
    bool run_once(int max_wait_ms);

private:
    struct Watch {
        short events;
        FdCallback cb;
    };

    int next_timeout_ms(int cap) const;
    void run_due_timers();
    void run_dispatched();
    void wake();

    using TimerKey = std::pair<Clock::time_point, TimerId>;
    std::map<TimerKey, std::function<void()>> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_due_;
    TimerId next_timer_id_ = 1;

    std::map<int, Watch> watches_;

    int wake_fds_[2]{-1, -1};
    BlockingQueue<std::function<void()>> dispatched_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace linkshare
