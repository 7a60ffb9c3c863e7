#include "EntityRegistry.h"

namespace Rampart {

EntityRegistry::Entity EntityRegistry::create(EntityKind kind) {
    const Entity e = registry_.create();
    kinds_.emplace(e, kind);
    return e;
}

std::optional<EntityKind> EntityRegistry::kindOf(Entity e) const {
    auto it = kinds_.find(e);
    if (it == kinds_.end()) return std::nullopt;
    return it->second;
}

bool EntityRegistry::isKind(Entity e, EntityKind kind) const {
    auto it = kinds_.find(e);
    return it != kinds_.end() && it->second == kind;
}

void EntityRegistry::destroyLater(Entity e) {
    if (!valid(e)) return;
    pending_.insert(e);
}

std::vector<DestroyedEntity> EntityRegistry::flushDestroyed() {
    std::vector<DestroyedEntity> removed;
    removed.reserve(pending_.size());
    for (Entity e : pending_) {
        auto it = kinds_.find(e);
        if (it == kinds_.end()) continue;
        removed.push_back(DestroyedEntity{e, it->second});
        kinds_.erase(it);
        registry_.destroy(e);
    }
    pending_.clear();
    return removed;
}

bool EntityRegistry::destroyNow(Entity e) {
    if (kinds_.erase(e) == 0) return false;
    pending_.erase(e);
    registry_.destroy(e);
    return true;
}

Engine::ECS::EntityList EntityRegistry::ofKind(EntityKind kind) const {
    Engine::ECS::EntityList out;
    for (const auto& [e, k] : kinds_) {
        if (k == kind && pending_.count(e) == 0) out.push_back(e);
    }
    return out;
}

EntityRegistry::Entity EntityRegistry::player() const {
    for (const auto& [e, k] : kinds_) {
        if (k == EntityKind::Player) return e;
    }
    return Engine::ECS::kInvalidEntity;
}

std::size_t EntityRegistry::count(EntityKind kind) const {
    std::size_t n = 0;
    for (const auto& [e, k] : kinds_) {
        if (k == kind) ++n;
    }
    return n;
}

void EntityRegistry::clear() {
    registry_.clear();
    kinds_.clear();
    pending_.clear();
}

}  // namespace Rampart
