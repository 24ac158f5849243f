#include "linkshare_event_loop.h"
#include "linkshare_log.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <vector>

namespace linkshare {

void Timer::arm(std::chrono::milliseconds delay, std::function<void()> fn) {
    cancel();
    id_ = sched_.schedule_after(delay, [this, fn = std::move(fn)] {
        id_ = 0;
        fn();
    });
}

void Timer::cancel() {
    if (id_ != 0) {
        sched_.cancel(id_);
        id_ = 0;
    }
}

EventLoop::EventLoop() {
    if (::pipe(wake_fds_) != 0) {
        log_err("LOOP") << "pipe failed: " << std::strerror(errno) << std::endl;
        wake_fds_[0] = wake_fds_[1] = -1;
        return;
    }
    for (int fd : wake_fds_) {
        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
}

EventLoop::~EventLoop() {
    for (int& fd : wake_fds_) {
        if (fd != -1) { ::close(fd); fd = -1; }
    }
}

TimerId EventLoop::schedule_after(std::chrono::milliseconds delay, std::function<void()> fn) {
    TimerId id = next_timer_id_++;
    Clock::time_point due = Clock::now() + delay;
    timers_.emplace(TimerKey{due, id}, std::move(fn));
    timer_due_.emplace(id, due);
    return id;
}

void EventLoop::cancel(TimerId id) {
    auto it = timer_due_.find(id);
    if (it == timer_due_.end()) return;
    timers_.erase(TimerKey{it->second, id});
    timer_due_.erase(it);
}

void EventLoop::watch(int fd, short events, FdCallback cb) {
    watches_[fd] = Watch{events, std::move(cb)};
}

void EventLoop::update(int fd, short events) {
    auto it = watches_.find(fd);
    if (it != watches_.end()) it->second.events = events;
}

void EventLoop::unwatch(int fd) { watches_.erase(fd); }

void EventLoop::dispatch(std::function<void()> fn) {
    dispatched_.push(std::move(fn));
    wake();
}

void EventLoop::wake() {
    if (wake_fds_[1] == -1) return;
    char b = 1;
    // a full pipe already guarantees a wake-up
    ssize_t n = ::write(wake_fds_[1], &b, 1);
    (void)n;
}

void EventLoop::stop() {
    stop_requested_.store(true);
    wake();
}

void EventLoop::run() {
    running_.store(true);
    stop_requested_.store(false);
    log_debug("LOOP") << "event loop running" << std::endl;
    while (!stop_requested_.load()) {
        if (!run_once(1000)) break;
    }
    running_.store(false);
    log_debug("LOOP") << "event loop stopped" << std::endl;
}

int EventLoop::next_timeout_ms(int cap) const {
    if (timers_.empty()) return cap;
    auto due = timers_.begin()->first.first;
    auto now = Clock::now();
    if (due <= now) return 0;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(due - now).count() + 1;
    return ms < cap ? static_cast<int>(ms) : cap;
}

bool EventLoop::run_once(int max_wait_ms) {
    std::vector<pollfd> pfds;
    pfds.reserve(watches_.size() + 1);
    if (wake_fds_[0] != -1) pfds.push_back(pollfd{wake_fds_[0], POLLIN, 0});
    for (const auto& w : watches_) pfds.push_back(pollfd{w.first, w.second.events, 0});

    int rc = ::poll(pfds.data(), pfds.size(), next_timeout_ms(max_wait_ms));
    if (rc < 0 && errno != EINTR) {
        log_err("LOOP") << "poll failed: " << std::strerror(errno) << std::endl;
        return false;
    }

    if (rc > 0) {
        for (const auto& p : pfds) {
            if (p.revents == 0) continue;
            if (p.fd == wake_fds_[0]) {
                char buf[64];
                while (::read(wake_fds_[0], buf, sizeof(buf)) > 0) {}
                continue;
            }
            // an earlier callback in this turn may have unwatched the fd
            auto it = watches_.find(p.fd);
            if (it == watches_.end()) continue;
            FdCallback cb = it->second.cb;
            cb(p.revents);
        }
    }

    run_dispatched();
    run_due_timers();
    return true;
}

void EventLoop::run_due_timers() {
    auto now = Clock::now();
    // timers armed by callbacks in this turn wait for the next poll
    const TimerId first_new = next_timer_id_;
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        auto it = timers_.begin();
        TimerId id = it->first.second;
        if (id >= first_new) break;
        std::function<void()> fn = std::move(it->second);
        timers_.erase(it);
        timer_due_.erase(id);
        fn();
    }
}

void EventLoop::run_dispatched() {
    std::vector<std::function<void()>> batch;
    dispatched_.drain(batch);
    for (auto& fn : batch) fn();
}

} // namespace linkshare
