#pragma once

/**
 * @file event_loop.hpp
 * @brief Single-threaded poll(2) reactor driving all client I/O
 *
 * Socket reads/writes, worker pipe reads, process reaping and connection
 * retries are all callbacks on one EventLoop. Nothing here is thread-safe:
 * every method must be called from the thread running the loop.
 */

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <unordered_map>

namespace qode {
namespace events {

class EventLoop {
public:
    using Callback = std::function<void()>;
    using IoCallback = std::function<void(short revents)>;
    using TimerId = uint64_t;

    EventLoop() = default;

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    // Register interest in fd (POLLIN/POLLOUT). Replaces an existing watcher.
    void watch(int fd, short events, IoCallback callback);

    // Change the event mask of an existing watcher
    void update_events(int fd, short events);

    // Remove the watcher; safe to call from inside its own callback
    void unwatch(int fd);

    bool is_watching(int fd) const { return watchers_.count(fd) != 0; }

    // One-shot timer. Timers with equal deadlines fire in scheduling order.
    TimerId call_later(int delay_ms, Callback callback);

    // Cancel a pending timer (no-op if it already fired)
    void cancel(TimerId id);

    bool has_timer(TimerId id) const { return timer_deadlines_.count(id) != 0; }

    // Run callback on the next iteration
    void post(Callback callback);

    // Process posted callbacks, wait up to max_wait_ms for I/O (or the next
    // timer), dispatch ready watchers and due timers.
    void run_once(int max_wait_ms);

    // Run until stop()
    void run();

    // Run until done() returns true or timeout_ms elapses.
    // Returns the final value of done().
    bool run_until(const std::function<bool()> &done, int timeout_ms);

    void stop() { stopped_ = true; }

    size_t watcher_count() const { return watchers_.size(); }
    size_t timer_count() const { return timers_.size(); }

private:
    using Clock = std::chrono::steady_clock;
    using TimerKey = std::pair<Clock::time_point, TimerId>;

    struct Watcher {
        short events = 0;
        uint64_t serial = 0;
        IoCallback callback;
    };

    std::unordered_map<int, Watcher> watchers_;
    std::map<TimerKey, Callback> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_deadlines_;
    std::deque<Callback> posted_;
    uint64_t next_serial_ = 1;
    TimerId next_timer_id_ = 1;
    bool stopped_ = false;

    int compute_wait_ms(int max_wait_ms) const;
    void run_posted();
    void run_due_timers();
};

}  // namespace events
}  // namespace qode
