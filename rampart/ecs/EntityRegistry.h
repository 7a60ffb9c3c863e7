// Game-level entity bookkeeping: kinds, typed queries and deferred destruction.
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include "../../engine/ecs/Registry.h"
#include "../Types.h"

namespace Rampart {

struct DestroyedEntity {
    Engine::ECS::Entity id{Engine::ECS::kInvalidEntity};
    EntityKind kind{EntityKind::Enemy};
};

class EntityRegistry {
public:
    using Entity = Engine::ECS::Entity;

    Entity create(EntityKind kind);

    bool valid(Entity e) const { return registry_.valid(e); }
    std::optional<EntityKind> kindOf(Entity e) const;
    bool isKind(Entity e, EntityKind kind) const;

    // Queued removal. The entity stays readable until flushDestroyed().
    void destroyLater(Entity e);
    bool pendingDestroy(Entity e) const { return pending_.count(e) > 0; }
    // Removes queued entities in ascending id order and reports them.
    std::vector<DestroyedEntity> flushDestroyed();
    // Immediate removal for use outside a tick.
    bool destroyNow(Entity e);

    // Ascending id (creation) order, excluding entities queued for removal.
    Engine::ECS::EntityList ofKind(EntityKind kind) const;
    Engine::ECS::EntityList towers() const { return ofKind(EntityKind::Tower); }
    Engine::ECS::EntityList enemies() const { return ofKind(EntityKind::Enemy); }
    Engine::ECS::EntityList projectiles() const { return ofKind(EntityKind::Projectile); }
    Engine::ECS::EntityList collectibles() const { return ofKind(EntityKind::Collectible); }
    // kInvalidEntity when there is no player.
    Entity player() const;

    std::size_t count(EntityKind kind) const;
    std::size_t size() const { return registry_.size(); }

    void clear();

    template <typename T>
    T& emplace(Entity e, T component) {
        return registry_.emplace<T>(e, std::move(component));
    }

    template <typename T>
    T* get(Entity e) {
        return registry_.get<T>(e);
    }

    template <typename T>
    const T* get(Entity e) const {
        return registry_.get<T>(e);
    }

    template <typename T>
    bool has(Entity e) const {
        return registry_.has<T>(e);
    }

private:
    Engine::ECS::Registry registry_;
    std::map<Entity, EntityKind> kinds_;
    std::set<Entity> pending_;
};

}  // namespace Rampart
