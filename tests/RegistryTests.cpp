// Entity ids, kinds, deferred destruction and component access.
#include <cassert>
#include <set>

#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Transform.h"
#include "../rampart/ecs/EntityRegistry.h"

using namespace Rampart;
using Engine::ECS::kInvalidEntity;

int main() {
    {
        // Ids are non-zero, ascending and never handed out twice, even across clear().
        EntityRegistry reg;
        std::set<Engine::ECS::Entity> seen;
        Engine::ECS::Entity last = kInvalidEntity;
        for (int i = 0; i < 20; ++i) {
            const auto e = reg.create(i % 2 ? EntityKind::Enemy : EntityKind::Tower);
            assert(e != kInvalidEntity);
            assert(e > last);
            assert(seen.insert(e).second);
            last = e;
        }
        reg.destroyNow(last);
        reg.clear();
        assert(reg.size() == 0);
        const auto fresh = reg.create(EntityKind::Tower);
        assert(fresh > last);
        assert(!reg.valid(last));
    }
    {
        // Kind lookups.
        EntityRegistry reg;
        const auto t = reg.create(EntityKind::Tower);
        const auto e = reg.create(EntityKind::Enemy);
        assert(reg.kindOf(t) == EntityKind::Tower);
        assert(reg.isKind(e, EntityKind::Enemy));
        assert(!reg.isKind(e, EntityKind::Tower));
        assert(!reg.kindOf(999));
        assert(!reg.isKind(kInvalidEntity, EntityKind::Tower));
        assert(reg.player() == kInvalidEntity);
        const auto p = reg.create(EntityKind::Player);
        assert(reg.player() == p);
    }
    {
        // Deferred destruction keeps the entity readable until the flush.
        EntityRegistry reg;
        const auto a = reg.create(EntityKind::Enemy);
        const auto b = reg.create(EntityKind::Projectile);
        const auto c = reg.create(EntityKind::Enemy);
        reg.emplace(a, Engine::ECS::Health{10.0f, 10.0f, 0.0f});
        reg.destroyLater(c);
        reg.destroyLater(a);
        reg.destroyLater(a);
        reg.destroyLater(12345);

        assert(reg.valid(a));
        assert(reg.pendingDestroy(a));
        assert(reg.get<Engine::ECS::Health>(a) != nullptr);
        assert(reg.enemies().empty());
        assert(reg.count(EntityKind::Enemy) == 2);

        const auto removed = reg.flushDestroyed();
        assert(removed.size() == 2);
        assert(removed[0].id == a && removed[0].kind == EntityKind::Enemy);
        assert(removed[1].id == c);
        assert(!reg.valid(a));
        assert(!reg.pendingDestroy(a));
        assert(reg.get<Engine::ECS::Health>(a) == nullptr);
        assert(reg.valid(b));
        assert(reg.flushDestroyed().empty());
    }
    {
        // Immediate destruction also cancels a queued one.
        EntityRegistry reg;
        const auto t = reg.create(EntityKind::Tower);
        reg.destroyLater(t);
        assert(reg.destroyNow(t));
        assert(!reg.destroyNow(t));
        assert(reg.flushDestroyed().empty());
    }
    {
        // Kind queries come back in creation order.
        EntityRegistry reg;
        const auto e1 = reg.create(EntityKind::Enemy);
        reg.create(EntityKind::Tower);
        const auto e2 = reg.create(EntityKind::Enemy);
        const auto e3 = reg.create(EntityKind::Enemy);
        reg.create(EntityKind::Collectible);
        const auto enemies = reg.enemies();
        assert(enemies.size() == 3);
        assert(enemies[0] == e1 && enemies[1] == e2 && enemies[2] == e3);
        assert(reg.towers().size() == 1);
        assert(reg.collectibles().size() == 1);
        assert(reg.projectiles().empty());
        assert(reg.size() == 5);
    }
    {
        // Components are replaced in place and vanish with their entity.
        EntityRegistry reg;
        const auto e = reg.create(EntityKind::Enemy);
        reg.emplace(e, Engine::ECS::Transform{Engine::Vec2{1.0f, 2.0f}, 5.0f});
        assert(reg.has<Engine::ECS::Transform>(e));
        assert(!reg.has<Engine::ECS::Health>(e));
        reg.emplace(e, Engine::ECS::Transform{Engine::Vec2{3.0f, 4.0f}, 6.0f});
        const EntityRegistry& view = reg;
        assert(view.get<Engine::ECS::Transform>(e)->position == (Engine::Vec2{3.0f, 4.0f}));
        assert(view.get<Engine::ECS::Health>(e) == nullptr);
        reg.destroyNow(e);
        assert(!reg.has<Engine::ECS::Transform>(e));
    }
    return 0;
}
