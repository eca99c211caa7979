#pragma once

/**
 * @file signal.hpp
 * @brief Named event stream with any number of subscribers
 *
 * Components expose their events (connected, error, exited, ...) as public
 * Signal members. Subscribers attach a callable with connect() and keep the
 * returned id to detach later.
 *
 * Single-threaded: connect/disconnect/emit must all run on the thread that
 * drives the owning EventLoop.
 */

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace qode {
namespace events {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    // Signals are owned by the component that emits them
    Signal(const Signal &) = delete;
    Signal &operator=(const Signal &) = delete;

    /**
     * @brief Attach a subscriber
     * @return Id for disconnect(); never 0
     */
    SlotId connect(Slot slot) {
        SlotId id = next_id_++;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    /**
     * @brief Detach a subscriber (no-op for unknown ids)
     */
    void disconnect(SlotId id) {
        slots_.erase(std::remove_if(slots_.begin(), slots_.end(),
                                    [id](const std::pair<SlotId, Slot> &entry) { return entry.first == id; }),
                     slots_.end());
    }

    void disconnect_all() { slots_.clear(); }

    /**
     * @brief Invoke every subscriber in connection order
     *
     * Iterates over a snapshot: slots connected during emission are not
     * called, slots disconnected during emission are skipped.
     */
    void emit(Args... args) const {
        auto snapshot = slots_;
        for (const auto &entry : snapshot) {
            if (!is_connected(entry.first)) {
                continue;
            }
            entry.second(args...);
        }
    }

    size_t slot_count() const { return slots_.size(); }

private:
    bool is_connected(SlotId id) const {
        return std::any_of(slots_.begin(), slots_.end(),
                           [id](const std::pair<SlotId, Slot> &entry) { return entry.first == id; });
    }

    std::vector<std::pair<SlotId, Slot>> slots_;
    SlotId next_id_ = 1;
};

}  // namespace events
}  // namespace qode
