// Turns simulation facts and scalar diffs into typed notifications for subscribers.
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "GameEvents.h"

namespace Rampart {

class Simulation;

class ChangeObserver {
public:
    using Handler = std::function<void(const GameEvent&)>;
    using SubscriptionId = std::uint64_t;

    // Takes the current currency, lives and score as the diff baseline.
    explicit ChangeObserver(Simulation& sim);

    ChangeObserver(const ChangeObserver&) = delete;
    ChangeObserver& operator=(const ChangeObserver&) = delete;

    SubscriptionId subscribe(EventType type, Handler handler);
    SubscriptionId subscribeAll(Handler handler);
    bool unsubscribe(SubscriptionId id);

    // Typed convenience: fn receives the payload struct.
    template <typename P, typename Fn>
    SubscriptionId on(Fn fn) {
        return subscribe(P::kType, [fn = std::move(fn)](const GameEvent& ev) {
            if (const P* p = ev.as<P>()) fn(*p);
        });
    }

    // Drains the journal and dispatches its facts in order, then emits
    // currencyChanged/livesChanged/scoreChanged for scalars that moved since the last pump.
    // Returns the number of events dispatched.
    std::size_t pump();

    // Re-reads the scalar baseline without emitting anything. Call after Simulation::reset()
    // when the reset itself should not show up as diffs.
    void resync();

    std::size_t subscriberCount() const { return subscribers_.size(); }

private:
    struct Subscriber {
        SubscriptionId id{0};
        bool all{false};
        EventType type{EventType::CurrencyChanged};
        Handler handler;
    };

    void dispatch(const GameEvent& ev);

    Simulation& sim_;
    std::vector<Subscriber> subscribers_;
    SubscriptionId nextId_{1};
    std::int64_t lastCurrency_{0};
    int lastLives_{0};
    std::int64_t lastScore_{0};
};

}  // namespace Rampart
