// Explicit handle to simulation state passed to every system for one tick or command.
#pragma once

#include <cstdint>
#include <random>

#include "../../engine/core/Time.h"
#include "../config/GameConfig.h"
#include "../ecs/EntityRegistry.h"
#include "../economy/EconomyLedger.h"
#include "../world/PathPlanner.h"
#include "../world/SpatialGrid.h"
#include "SimJournal.h"

namespace Rampart {

// Economy side effects gathered during a tick and applied in one place afterwards.
struct TickOutcome {
    std::int64_t rewards{0};
    std::int64_t score{0};
    std::int64_t pickupCurrency{0};
    std::int64_t waveBonus{0};
    int livesLost{0};
};

struct SimContext {
    const GameConfig& config;
    SpatialGrid& grid;
    PathPlanner& planner;
    EntityRegistry& registry;
    EconomyLedger& ledger;
    SimJournal& journal;
    std::mt19937& rng;
    Engine::TimeStep step{};
    TickOutcome outcome{};
};

}  // namespace Rampart
