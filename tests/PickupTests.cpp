// Collectible drops, pickups, power-up expiry and player regeneration/respawn.
#include <cassert>
#include <cmath>
#include <random>
#include <utility>

#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Transform.h"
#include "../rampart/components/CollectibleState.h"
#include "../rampart/components/PlayerState.h"
#include "../rampart/config/GameConfig.h"
#include "../rampart/sim/SimContext.h"
#include "../rampart/systems/PickupSystem.h"
#include "../rampart/systems/PlayerSystem.h"
#include "../rampart/world/EntityFactory.h"

using namespace Rampart;

namespace {
bool near(float a, float b) { return std::fabs(a - b) < 1e-3f; }

GameConfig smallConfig() {
    GameConfig cfg = defaultConfig();
    cfg.grid = GridConfig{};
    cfg.grid.width = 10;
    cfg.grid.height = 5;
    cfg.grid.cellSize = 10.0f;
    cfg.grid.spawns = {Cell{0, 2}};
    cfg.grid.goal = Cell{9, 2};
    cfg.player.enabled = true;
    cfg.player.startCell = Cell{5, 2};
    return cfg;
}

struct World {
    GameConfig config;
    SpatialGrid grid;
    PathPlanner planner;
    EntityRegistry registry;
    EconomyLedger ledger{0};
    SimJournal journal;
    std::mt19937 rng{11};

    explicit World(GameConfig cfg) : config(std::move(cfg)), grid(config.grid) { planner.recompute(grid); }

    SimContext context(double dt, double now) {
        return SimContext{config, grid, planner, registry, ledger, journal, rng, Engine::TimeStep{dt, now, 1},
                          TickOutcome{}};
    }
};
}  // namespace

int main() {
    {
        // Health pickups heal up to max and report it; nothing is reported at full health.
        World world(smallConfig());
        auto ctx = world.context(0.1, 1.0);
        const auto player = EntityFactory::createPlayer(ctx);
        auto* hp = world.registry.get<Engine::ECS::Health>(player);
        hp->current = 40.0f;
        PickupSystem pickups;
        pickups.applyPickup(ctx, player, CollectibleType::Health);
        assert(near(hp->current, 65.0f));
        const auto* healed = world.journal.facts().back().as<PlayerHealed>();
        assert(healed && near(healed->before, 40.0f) && near(healed->after, 65.0f));

        hp->current = hp->max;
        const auto factCount = world.journal.facts().size();
        pickups.applyPickup(ctx, player, CollectibleType::Health);
        assert(world.journal.facts().size() == factCount);
    }
    {
        // Currency pickups are paid through the tick outcome.
        World world(smallConfig());
        auto ctx = world.context(0.1, 1.0);
        const auto player = EntityFactory::createPlayer(ctx);
        PickupSystem pickups;
        pickups.applyPickup(ctx, player, CollectibleType::ExtraCurrency);
        assert(ctx.outcome.pickupCurrency == 50);
    }
    {
        // Timed power-ups expire at their expiry time; picking one up again extends it.
        World world(smallConfig());
        auto start = world.context(0.1, 1.0);
        const auto player = EntityFactory::createPlayer(start);
        PickupSystem pickups;
        pickups.applyPickup(start, player, CollectibleType::ExtraDamage);
        const auto* state = world.registry.get<PlayerState>(player);
        assert(state->hasEffect(CollectibleType::ExtraDamage, 1.0));
        assert(state->effects.at(CollectibleType::ExtraDamage) == 11.0);
        assert(state->hasEffect(CollectibleType::ExtraDamage, 10.9));
        assert(!state->hasEffect(CollectibleType::ExtraDamage, 11.0));

        auto before = world.context(0.1, 10.5);
        pickups.expireEffects(before);
        assert(state->effects.count(CollectibleType::ExtraDamage) == 1);
        auto at = world.context(0.1, 11.0);
        pickups.expireEffects(at);
        assert(state->effects.count(CollectibleType::ExtraDamage) == 0);

        auto first = world.context(0.1, 20.0);
        pickups.applyPickup(first, player, CollectibleType::Shield);
        auto second = world.context(0.1, 25.0);
        pickups.applyPickup(second, player, CollectibleType::Shield);
        assert(state->effects.at(CollectibleType::Shield) == 40.0);
    }
    {
        // Walking over a collectible picks it up; collectibles left lying around despawn.
        World world(smallConfig());
        auto ctx = world.context(0.1, 1.0);
        const auto player = EntityFactory::createPlayer(ctx);
        const auto playerPos = world.registry.get<Engine::ECS::Transform>(player)->position;
        const auto nearby = EntityFactory::dropCollectible(ctx, CollectibleType::SpeedBoost, playerPos);
        const auto far = EntityFactory::dropCollectible(ctx, CollectibleType::Health, Engine::Vec2{500.0f, 500.0f});
        PickupSystem pickups;
        pickups.update(ctx);
        assert(world.registry.pendingDestroy(nearby));
        assert(!world.registry.pendingDestroy(far));
        assert(world.registry.get<PlayerState>(player)->hasEffect(CollectibleType::SpeedBoost, 1.0));
        const auto* picked = world.journal.facts().back().as<CollectiblePicked>();
        assert(picked && picked->collectible == nearby && picked->type == CollectibleType::SpeedBoost);

        world.registry.flushDestroyed();
        auto later = world.context(16.0, 17.0);
        pickups.update(later);
        assert(world.registry.pendingDestroy(far));
    }
    {
        // Drops roll against the configured chances and need a player to exist.
        GameConfig cfg = smallConfig();
        cfg.drops.healthChance = 1.0f;
        cfg.drops.powerUpChance = 0.0f;
        cfg.drops.extraCurrencyChance = 0.0f;
        World world(cfg);
        auto ctx = world.context(0.1, 1.0);
        PickupSystem pickups;
        auto dropped = pickups.rollDrop(ctx, Engine::Vec2{20.0f, 20.0f});
        assert(dropped && *dropped == CollectibleType::Health);
        assert(world.registry.collectibles().size() == 1);

        cfg.player.enabled = false;
        World noPlayer(cfg);
        auto quiet = noPlayer.context(0.1, 1.0);
        assert(!pickups.rollDrop(quiet, Engine::Vec2{20.0f, 20.0f}));
        assert(noPlayer.registry.collectibles().empty());

        cfg.player.enabled = true;
        cfg.drops.healthChance = 0.0f;
        World never(cfg);
        auto none = never.context(0.1, 1.0);
        for (int i = 0; i < 50; ++i) assert(!pickups.rollDrop(none, Engine::Vec2{}));
    }
    {
        // Same seed, same drops.
        GameConfig cfg = smallConfig();
        World a(cfg);
        World b(cfg);
        auto ca = a.context(0.1, 1.0);
        auto cb = b.context(0.1, 1.0);
        PickupSystem pickups;
        for (int i = 0; i < 100; ++i) {
            assert(pickups.rollDrop(ca, Engine::Vec2{}) == pickups.rollDrop(cb, Engine::Vec2{}));
        }
    }
    {
        // Regeneration waits for the damage delay, then heals per second.
        World world(smallConfig());
        auto ctx = world.context(1.0, 1.0);
        const auto player = EntityFactory::createPlayer(ctx);
        auto* state = world.registry.get<PlayerState>(player);
        auto* hp = world.registry.get<Engine::ECS::Health>(player);
        state->regenPerSecond = 2.0f;
        state->regenDelay = 1.5f;
        hp->current = 50.0f;
        PlayerSystem system;
        system.update(ctx);
        assert(near(hp->current, 50.0f));
        system.update(ctx);
        assert(near(hp->current, 52.0f));
    }
    {
        // A downed player respawns at the start cell with full health.
        World world(smallConfig());
        auto ctx = world.context(1.0, 1.0);
        const auto player = EntityFactory::createPlayer(ctx);
        auto* state = world.registry.get<PlayerState>(player);
        auto* hp = world.registry.get<Engine::ECS::Health>(player);
        auto* tf = world.registry.get<Engine::ECS::Transform>(player);
        const auto home = tf->position;
        hp->current = 0.0f;
        state->downed = true;
        state->respawnTimer = 2.0f;
        tf->position = Engine::Vec2{1.0f, 1.0f};
        PlayerSystem system;
        system.update(ctx);
        assert(state->downed);
        system.update(ctx);
        assert(!state->downed);
        assert(hp->current == hp->max);
        assert(tf->position == home);
        const auto* healed = world.journal.facts().back().as<PlayerHealed>();
        assert(healed && healed->before == 0.0f);
    }
    return 0;
}
