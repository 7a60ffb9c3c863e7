// Minimal ECS registry: entity lifecycle + component management.
#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <utility>

#include "ComponentStorage.h"
#include "Entity.h"

namespace Engine::ECS {

class Registry {
public:
    Entity create() {
        const Entity id = ++lastIssued_;
        alive_.insert(id);
        return id;
    }

    // Removes the entity and all of its components immediately.
    // Callers walking an entity list must defer this.
    void destroy(Entity e) {
        if (alive_.erase(e) == 0) return;
        storage_.removeAll(e);
    }

    bool valid(Entity e) const { return alive_.count(e) > 0; }
    std::size_t size() const { return alive_.size(); }

    // Drops every entity; ids keep counting up so stale handles stay invalid.
    void clear() {
        alive_.clear();
        storage_.clear();
    }

    template <typename T, typename... Args>
    T& emplace(Entity e, Args&&... args) {
        return storage_.template pool<T>().emplace(e, std::forward<Args>(args)...);
    }

    template <typename T>
    T* get(Entity e) {
        return storage_.template pool<T>().get(e);
    }

    template <typename T>
    const T* get(Entity e) const {
        const auto* p = storage_.template pool<T>();
        return p ? p->get(e) : nullptr;
    }

    template <typename T>
    bool has(Entity e) const {
        const auto* p = storage_.template pool<T>();
        return p && p->contains(e);
    }

private:
    Entity lastIssued_{kInvalidEntity};
    std::set<Entity> alive_;
    ComponentStorage storage_;
};

}  // namespace Engine::ECS
