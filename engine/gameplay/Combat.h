// Core damage/armor/cooldown rules shared across engine and game layers.
#pragma once

#include <algorithm>

#include "../ecs/components/Health.h"

namespace Engine::Gameplay {

enum class DamageType {
    Normal,  // reduced by armor
    True     // ignores armor
};

struct DamageEvent {
    float baseDamage = 0.0f;
    DamageType type = DamageType::Normal;
};

constexpr float MIN_DAMAGE_PER_HIT = 0.5f;

inline bool damageUsesArmor(DamageType type) {
    switch (type) {
        case DamageType::Normal: return true;
        case DamageType::True:   return false;
        default:                 return true;
    }
}

inline float computeEffectiveDamage(const DamageEvent& dmg, const ECS::Health& target) {
    if (dmg.baseDamage <= 0.0f) return 0.0f;
    float result = dmg.baseDamage;
    if (damageUsesArmor(dmg.type)) {
        result = std::max(result - target.armor, MIN_DAMAGE_PER_HIT);
    }
    return result;
}

// Returns the health actually removed.
inline float applyDamage(ECS::Health& target, const DamageEvent& dmg) {
    if (!target.alive()) {
        return 0.0f;
    }
    const float damage = computeEffectiveDamage(dmg, target);
    const float dealt = std::min(damage, target.current);
    target.current -= dealt;
    if (target.current < 0.0f) target.current = 0.0f;
    return dealt;
}

// Returns the health actually restored.
inline float applyHeal(ECS::Health& target, float amount) {
    if (amount <= 0.0f || !target.alive()) return 0.0f;
    const float healed = std::min(amount, target.max - target.current);
    if (healed <= 0.0f) return 0.0f;
    target.current += healed;
    return healed;
}

// Counts a cooldown down; true once it has elapsed.
inline bool tickCooldown(float& cooldown, float dt) {
    if (cooldown > 0.0f) {
        cooldown = std::max(0.0f, cooldown - dt);
    }
    return cooldown <= 0.0f;
}

}  // namespace Engine::Gameplay
