// Currency balance with all-or-nothing spending.
#pragma once

#include <cstdint>

#include "../CommandResult.h"

namespace Rampart {

class EconomyLedger {
public:
    EconomyLedger() = default;
    explicit EconomyLedger(std::int64_t startingBalance);

    std::int64_t balance() const { return balance_; }

    bool canAfford(std::int64_t cost) const { return cost >= 0 && balance_ >= cost; }
    // Fails with InsufficientFunds and leaves the balance untouched when !canAfford(cost).
    CommandResult spend(std::int64_t cost);
    // Non-positive amounts are ignored. Returns the amount credited.
    std::int64_t credit(std::int64_t amount);

    void reset(std::int64_t balance);

    // Throws InvariantViolation on a negative balance.
    void verify() const;

    // floor(cumulativeSpend * rate), rate clamped to [0,1].
    static std::int64_t refundFor(std::int64_t cumulativeSpend, double rate);

private:
    std::int64_t balance_{0};
};

}  // namespace Rampart
