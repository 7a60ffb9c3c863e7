#include "EconomyLedger.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace Rampart {

EconomyLedger::EconomyLedger(std::int64_t startingBalance) : balance_(std::max<std::int64_t>(0, startingBalance)) {}

CommandResult EconomyLedger::spend(std::int64_t cost) {
    if (!canAfford(cost)) return CommandResult::fail(CommandError::InsufficientFunds);
    balance_ -= cost;
    return CommandResult::ok(balance_);
}

std::int64_t EconomyLedger::credit(std::int64_t amount) {
    if (amount <= 0) return 0;
    const std::int64_t maxVal = std::numeric_limits<std::int64_t>::max();
    if (maxVal - balance_ < amount) {
        amount = maxVal - balance_;
    }
    balance_ += amount;
    return amount;
}

void EconomyLedger::reset(std::int64_t balance) { balance_ = std::max<std::int64_t>(0, balance); }

void EconomyLedger::verify() const {
    if (balance_ < 0) {
        throw InvariantViolation("currency balance went negative: " + std::to_string(balance_));
    }
}

std::int64_t EconomyLedger::refundFor(std::int64_t cumulativeSpend, double rate) {
    if (cumulativeSpend <= 0) return 0;
    if (!std::isfinite(rate)) return 0;
    const double r = std::clamp(rate, 0.0, 1.0);
    const auto refund = static_cast<std::int64_t>(std::floor(static_cast<double>(cumulativeSpend) * r));
    return std::clamp<std::int64_t>(refund, 0, cumulativeSpend);
}

}  // namespace Rampart
