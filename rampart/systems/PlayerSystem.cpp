#include "PlayerSystem.h"

#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/gameplay/Combat.h"
#include "../components/PlayerState.h"

namespace Rampart {

void PlayerSystem::update(SimContext& ctx) {
    const auto e = ctx.registry.player();
    auto* player = ctx.registry.get<PlayerState>(e);
    auto* hp = ctx.registry.get<Engine::ECS::Health>(e);
    auto* tf = ctx.registry.get<Engine::ECS::Transform>(e);
    if (!player || !hp || !tf) return;
    const float dt = static_cast<float>(ctx.step.deltaSeconds);

    if (player->downed) {
        if (!Engine::Gameplay::tickCooldown(player->respawnTimer, dt)) return;
        player->downed = false;
        player->fireCooldown = 0.0f;
        player->regenDelay = 0.0f;
        tf->position = ctx.grid.cellCenter(ctx.config.player.startCell);
        const float before = hp->current;
        hp->current = hp->max;
        ctx.journal.record(PlayerHealed{before, hp->current});
        return;
    }

    if (!Engine::Gameplay::tickCooldown(player->regenDelay, dt)) return;
    if (player->regenPerSecond <= 0.0f || hp->current >= hp->max) return;
    const float before = hp->current;
    if (Engine::Gameplay::applyHeal(*hp, player->regenPerSecond * dt) > 0.0f) {
        ctx.journal.record(PlayerHealed{before, hp->current});
    }
}

}  // namespace Rampart
