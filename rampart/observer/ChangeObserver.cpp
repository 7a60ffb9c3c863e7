#include "ChangeObserver.h"

#include <algorithm>

#include "../sim/Simulation.h"

namespace Rampart {

ChangeObserver::ChangeObserver(Simulation& sim) : sim_(sim) { resync(); }

ChangeObserver::SubscriptionId ChangeObserver::subscribe(EventType type, Handler handler) {
    const SubscriptionId id = nextId_++;
    subscribers_.push_back(Subscriber{id, false, type, std::move(handler)});
    return id;
}

ChangeObserver::SubscriptionId ChangeObserver::subscribeAll(Handler handler) {
    const SubscriptionId id = nextId_++;
    subscribers_.push_back(Subscriber{id, true, EventType::CurrencyChanged, std::move(handler)});
    return id;
}

bool ChangeObserver::unsubscribe(SubscriptionId id) {
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [id](const Subscriber& s) { return s.id == id; });
    if (it == subscribers_.end()) return false;
    subscribers_.erase(it);
    return true;
}

void ChangeObserver::resync() {
    lastCurrency_ = sim_.getCurrency();
    lastLives_ = sim_.getLives();
    lastScore_ = sim_.getScore();
}

void ChangeObserver::dispatch(const GameEvent& ev) {
    // Handlers may subscribe or unsubscribe; iterate over a copy.
    const std::vector<Subscriber> current = subscribers_;
    const EventType type = ev.type();
    for (const auto& s : current) {
        if (!s.handler) continue;
        if (s.all || s.type == type) s.handler(ev);
    }
}

std::size_t ChangeObserver::pump() {
    std::size_t dispatched = 0;
    const std::uint64_t tick = sim_.tickCount();
    for (const auto& ev : sim_.drainFacts()) {
        dispatch(ev);
        ++dispatched;
    }

    const std::int64_t currency = sim_.getCurrency();
    if (currency != lastCurrency_) {
        dispatch(GameEvent{tick, CurrencyChanged{lastCurrency_, currency}});
        lastCurrency_ = currency;
        ++dispatched;
    }
    const int lives = sim_.getLives();
    if (lives != lastLives_) {
        dispatch(GameEvent{tick, LivesChanged{lastLives_, lives}});
        lastLives_ = lives;
        ++dispatched;
    }
    const std::int64_t score = sim_.getScore();
    if (score != lastScore_) {
        dispatch(GameEvent{tick, ScoreChanged{lastScore_, score}});
        lastScore_ = score;
        ++dispatched;
    }
    return dispatched;
}

}  // namespace Rampart
