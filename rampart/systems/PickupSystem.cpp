#include "PickupSystem.h"

#include <algorithm>
#include <iterator>
#include <random>

#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/gameplay/Combat.h"
#include "../components/CollectibleState.h"
#include "../components/PlayerState.h"
#include "../world/EntityFactory.h"

namespace Rampart {

namespace {
constexpr CollectibleType kPowerUps[] = {CollectibleType::ExtraDamage, CollectibleType::FasterShooting,
                                         CollectibleType::Shield, CollectibleType::SpeedBoost};

float durationFor(const DropConfig& drops, CollectibleType type) {
    switch (type) {
        case CollectibleType::ExtraDamage: return drops.extraDamageSeconds;
        case CollectibleType::FasterShooting: return drops.fasterShootingSeconds;
        case CollectibleType::Shield: return drops.shieldSeconds;
        case CollectibleType::SpeedBoost: return drops.speedBoostSeconds;
        case CollectibleType::Health:
        case CollectibleType::ExtraCurrency:
            return 0.0f;
    }
    return 0.0f;
}
}  // namespace

std::optional<CollectibleType> PickupSystem::rollDrop(SimContext& ctx, const Engine::Vec2& position) {
    if (!ctx.config.player.enabled) return std::nullopt;
    const DropConfig& drops = ctx.config.drops;
    std::uniform_real_distribution<float> roll(0.0f, 1.0f);
    const float r = roll(ctx.rng);

    std::optional<CollectibleType> type;
    if (r < drops.healthChance) {
        type = CollectibleType::Health;
    } else if (r < drops.healthChance + drops.powerUpChance) {
        std::uniform_int_distribution<std::size_t> pick(0, std::size(kPowerUps) - 1);
        type = kPowerUps[pick(ctx.rng)];
    } else if (r < drops.healthChance + drops.powerUpChance + drops.extraCurrencyChance) {
        type = CollectibleType::ExtraCurrency;
    }
    if (type) EntityFactory::dropCollectible(ctx, *type, position);
    return type;
}

void PickupSystem::update(SimContext& ctx) {
    collect(ctx);
    ageCollectibles(ctx);
}

void PickupSystem::expireEffects(SimContext& ctx) {
    auto* player = ctx.registry.get<PlayerState>(ctx.registry.player());
    if (!player) return;
    const double now = ctx.step.elapsedSeconds;
    for (auto it = player->effects.begin(); it != player->effects.end();) {
        if (it->second <= now) {
            it = player->effects.erase(it);
        } else {
            ++it;
        }
    }
}

void PickupSystem::collect(SimContext& ctx) {
    const auto playerId = ctx.registry.player();
    const auto* player = ctx.registry.get<PlayerState>(playerId);
    const auto* playerTf = ctx.registry.get<Engine::ECS::Transform>(playerId);
    if (!player || !playerTf || player->downed) return;

    const float radius = ctx.config.drops.pickupRadius;
    for (auto e : ctx.registry.collectibles()) {
        const auto* tf = ctx.registry.get<Engine::ECS::Transform>(e);
        const auto* item = ctx.registry.get<CollectibleState>(e);
        if (!tf || !item) continue;
        const float reach = radius + tf->radius;
        if (Engine::distanceSquared(tf->position, playerTf->position) > reach * reach) continue;
        ctx.journal.record(CollectiblePicked{e, item->type});
        applyPickup(ctx, playerId, item->type);
        ctx.registry.destroyLater(e);
    }
}

void PickupSystem::applyPickup(SimContext& ctx, Engine::ECS::Entity playerId, CollectibleType type) {
    auto* player = ctx.registry.get<PlayerState>(playerId);
    auto* hp = ctx.registry.get<Engine::ECS::Health>(playerId);
    if (!player || !hp) return;
    const DropConfig& drops = ctx.config.drops;

    switch (type) {
        case CollectibleType::Health: {
            const float before = hp->current;
            if (Engine::Gameplay::applyHeal(*hp, drops.healAmount) > 0.0f) {
                ctx.journal.record(PlayerHealed{before, hp->current});
            }
            break;
        }
        case CollectibleType::ExtraCurrency:
            ctx.outcome.pickupCurrency += drops.currencyAmount;
            break;
        case CollectibleType::ExtraDamage:
        case CollectibleType::FasterShooting:
        case CollectibleType::Shield:
        case CollectibleType::SpeedBoost: {
            const double expiry = ctx.step.elapsedSeconds + durationFor(drops, type);
            auto [it, inserted] = player->effects.emplace(type, expiry);
            if (!inserted) it->second = std::max(it->second, expiry);
            break;
        }
    }
}

void PickupSystem::ageCollectibles(SimContext& ctx) {
    const float dt = static_cast<float>(ctx.step.deltaSeconds);
    for (auto e : ctx.registry.collectibles()) {
        auto* item = ctx.registry.get<CollectibleState>(e);
        if (!item) continue;
        item->remaining -= dt;
        if (item->remaining <= 0.0f) ctx.registry.destroyLater(e);
    }
}

}  // namespace Rampart
