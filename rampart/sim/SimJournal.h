// Ordered record of discrete facts produced by commands and ticks, drained by the observer.
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "../../engine/core/Logger.h"
#include "../observer/GameEvents.h"

namespace Rampart {

// Bounded: when nobody drains it, the oldest facts are dropped once `capacity` is reached.
class SimJournal {
public:
    static constexpr std::size_t kDefaultCapacity = 4096;

    explicit SimJournal(std::size_t capacity = kDefaultCapacity) : capacity_(capacity > 0 ? capacity : 1) {}

    template <typename P>
    void record(P payload) {
        if (facts_.size() >= capacity_) {
            facts_.pop_front();
            if (dropped_++ == 0) {
                Engine::logWarn("Fact journal full at " + std::to_string(capacity_) +
                                " entries; dropping the oldest until it is drained");
            }
        }
        facts_.push_back(GameEvent{tick_, EventPayload{std::move(payload)}});
    }

    void setTick(std::uint64_t tick) { tick_ = tick; }

    void setCapacity(std::size_t capacity) {
        capacity_ = capacity > 0 ? capacity : 1;
        while (facts_.size() > capacity_) {
            facts_.pop_front();
            ++dropped_;
        }
    }
    std::size_t capacity() const { return capacity_; }
    // Facts discarded because the journal was full, since the last drain.
    std::size_t dropped() const { return dropped_; }

    const std::deque<GameEvent>& facts() const { return facts_; }
    bool empty() const { return facts_.empty(); }

    std::vector<GameEvent> drain() {
        std::vector<GameEvent> out(std::make_move_iterator(facts_.begin()), std::make_move_iterator(facts_.end()));
        facts_.clear();
        dropped_ = 0;
        return out;
    }

    void clear() {
        facts_.clear();
        dropped_ = 0;
    }

private:
    std::size_t capacity_;
    std::size_t dropped_{0};
    std::uint64_t tick_{0};
    std::deque<GameEvent> facts_;
};

}  // namespace Rampart
