#include "event_loop.hpp"

#include <errno.h>
#include <poll.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace qode {
namespace events {

void EventLoop::watch(int fd, short events, IoCallback callback) {
    Watcher watcher;
    watcher.events = events;
    watcher.serial = next_serial_++;
    watcher.callback = std::move(callback);
    watchers_[fd] = std::move(watcher);
}

void EventLoop::update_events(int fd, short events) {
    auto it = watchers_.find(fd);
    if (it != watchers_.end()) {
        it->second.events = events;
    }
}

void EventLoop::unwatch(int fd) { watchers_.erase(fd); }

EventLoop::TimerId EventLoop::call_later(int delay_ms, Callback callback) {
    TimerId id = next_timer_id_++;
    auto deadline = Clock::now() + std::chrono::milliseconds(std::max(delay_ms, 0));
    timers_.emplace(TimerKey{deadline, id}, std::move(callback));
    timer_deadlines_[id] = deadline;
    return id;
}

void EventLoop::cancel(TimerId id) {
    auto it = timer_deadlines_.find(id);
    if (it == timer_deadlines_.end()) {
        return;
    }
    timers_.erase(TimerKey{it->second, id});
    timer_deadlines_.erase(it);
}

void EventLoop::post(Callback callback) { posted_.push_back(std::move(callback)); }

int EventLoop::compute_wait_ms(int max_wait_ms) const {
    if (!posted_.empty()) {
        return 0;
    }
    if (timers_.empty()) {
        return max_wait_ms;
    }

    auto until_next = timers_.begin()->first.first - Clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(until_next).count();
    if (ms < 0) {
        ms = 0;
    } else if (std::chrono::milliseconds(ms) < until_next) {
        ms += 1;  // round up so the timer is due when poll returns
    }
    if (max_wait_ms >= 0 && ms > max_wait_ms) {
        return max_wait_ms;
    }
    return static_cast<int>(ms);
}

void EventLoop::run_posted() {
    // Callbacks posted while draining run on the next iteration
    std::deque<Callback> batch;
    batch.swap(posted_);
    for (auto &callback : batch) {
        callback();
    }
}

void EventLoop::run_due_timers() {
    auto now = Clock::now();
    // Collect first: a timer callback may schedule a new zero-delay timer,
    // which must wait for the next iteration.
    std::vector<TimerId> due;
    for (const auto &entry : timers_) {
        if (entry.first.first > now) {
            break;
        }
        due.push_back(entry.first.second);
    }

    for (TimerId id : due) {
        auto deadline_it = timer_deadlines_.find(id);
        if (deadline_it == timer_deadlines_.end()) {
            continue;  // cancelled by an earlier callback
        }
        auto timer_it = timers_.find(TimerKey{deadline_it->second, id});
        Callback callback = std::move(timer_it->second);
        timers_.erase(timer_it);
        timer_deadlines_.erase(deadline_it);
        callback();
    }
}

void EventLoop::run_once(int max_wait_ms) {
    run_posted();

    std::vector<pollfd> fds;
    std::vector<uint64_t> serials;
    fds.reserve(watchers_.size());
    serials.reserve(watchers_.size());
    for (const auto &entry : watchers_) {
        pollfd pfd;
        pfd.fd = entry.first;
        pfd.events = entry.second.events;
        pfd.revents = 0;
        fds.push_back(pfd);
        serials.push_back(entry.second.serial);
    }

    int wait_ms = compute_wait_ms(max_wait_ms);
    int result = ::poll(fds.empty() ? nullptr : fds.data(), fds.size(), wait_ms);
    if (result < 0 && errno != EINTR) {
        // Nothing sensible to dispatch; timers still advance below.
        result = 0;
    }

    if (result > 0) {
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            auto it = watchers_.find(fds[i].fd);
            // Skip watchers removed (or replaced) by an earlier callback
            if (it == watchers_.end() || it->second.serial != serials[i]) {
                continue;
            }
            IoCallback callback = it->second.callback;
            callback(fds[i].revents);
        }
    }

    run_due_timers();
}

void EventLoop::run() {
    stopped_ = false;
    while (!stopped_) {
        run_once(-1);
    }
}

bool EventLoop::run_until(const std::function<bool()> &done, int timeout_ms) {
    stopped_ = false;
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!done()) {
        if (stopped_) {
            return done();
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remaining <= 0) {
            return done();
        }
        run_once(static_cast<int>(std::min<long long>(remaining, 50)));
    }
    return true;
}

}  // namespace events
}  // namespace qode
