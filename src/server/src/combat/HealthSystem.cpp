// [COMBAT_AGENT] Health and death tracking implementation

#include "combat/HealthSystem.hpp"
#include <algorithm>

namespace SkyClash {

HealthSystem::HealthSystem(const HealthConfig& config) : config_(config) {}

void HealthSystem::initialize(Registry& registry, EntityID entity) const {
    HealthState state;
    state.maxHealth = std::max(1, config_.maxHealth);
    state.health = state.maxHealth;
    registry.emplace_or_replace<HealthState>(entity, state);
}

int32_t HealthSystem::clampHealth(const HealthState& state, int32_t value) const {
    return std::clamp(value, 0, state.maxHealth);
}

bool HealthSystem::reduceHealth(Registry& registry, EntityID target, int32_t amount,
                                EntityID attacker, uint32_t currentTimeMs) {
    HealthState* health = registry.try_get<HealthState>(target);
    if (!health || health->isDead) {
        return false;
    }

    const int32_t damage = std::max(0, amount);
    health->health = clampHealth(*health, health->health - damage);
    if (attacker != entt::null) {
        health->lastAttacker = attacker;
    }
    health->lastDamageTimeMs = currentTimeMs;

    if (onDamage_ && damage > 0) {
        onDamage_(attacker, target, damage);
    }
    return true;
}

bool HealthSystem::setHealth(Registry& registry, EntityID target, int32_t value) {
    HealthState* health = registry.try_get<HealthState>(target);
    if (!health) {
        return false;
    }
    health->health = clampHealth(*health, value);
    return true;
}

bool HealthSystem::heal(Registry& registry, EntityID target, int32_t amount) {
    HealthState* health = registry.try_get<HealthState>(target);
    if (!health || health->isDead) {
        return false;
    }
    health->health = clampHealth(*health, health->health + std::max(0, amount));
    return true;
}

std::optional<int32_t> HealthSystem::getHealth(const Registry& registry, EntityID entity) const {
    if (const HealthState* health = registry.try_get<HealthState>(entity)) {
        return health->health;
    }
    return std::nullopt;
}

bool HealthSystem::isDead(const Registry& registry, EntityID entity) const {
    const HealthState* health = registry.try_get<HealthState>(entity);
    return health && health->isDead;
}

bool HealthSystem::checkDeath(Registry& registry, EntityID entity) {
    HealthState* health = registry.try_get<HealthState>(entity);
    if (!health || health->isDead || health->health > 0) {
        return false;
    }

    health->isDead = true;
    if (onDeath_) {
        onDeath_(entity, health->lastAttacker);
    }
    return true;
}

std::vector<EntityID> HealthSystem::collectDeaths(Registry& registry) {
    std::vector<EntityID> candidates;
    auto view = registry.view<HealthState>();
    for (EntityID entity : view) {
        const HealthState& health = view.get<HealthState>(entity);
        if (!health.isDead && health.health <= 0) {
            candidates.push_back(entity);
        }
    }

    // Callbacks may touch the registry, so flag outside the view loop
    std::vector<EntityID> died;
    for (EntityID entity : candidates) {
        if (checkDeath(registry, entity)) {
            died.push_back(entity);
        }
    }
    return died;
}

void HealthSystem::respawn(Registry& registry, EntityID entity) {
    HealthState* health = registry.try_get<HealthState>(entity);
    if (!health) {
        return;
    }
    health->health = health->maxHealth;
    health->isDead = false;
    health->lastAttacker = entt::null;
    health->respawnAtMs = 0;
}

} // namespace SkyClash
