// Wave-scaled enemy stats. Position and health live in Transform/Health.
#pragma once

#include <cstdint>

#include "../Types.h"

namespace Rampart {

struct EnemyState {
    EnemyType type{EnemyType::Basic};
    float speed{0.0f};
    float healthMultiplier{1.0f};
    float speedMultiplier{1.0f};
    std::int64_t reward{0};
    int livesCost{1};
    float contactDamage{0.0f};
    float attackRange{0.0f};
    float attackCooldown{1.0f};
    float attackTimer{0.0f};
    bool boss{false};
    int waveIndex{0};
};

}  // namespace Rampart
