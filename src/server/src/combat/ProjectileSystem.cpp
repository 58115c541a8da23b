// [COMBAT_AGENT] Projectile system implementation

#include "combat/ProjectileSystem.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace SkyClash {

namespace {
constexpr float MIN_SEGMENT_LENGTH = 1e-6f;
}

ProjectileSystem::ProjectileSystem(const ProjectileConfig& config, HealthSystem& health)
    : config_(config)
    , health_(health) {}

float ProjectileSystem::speedFor(ProjectileKind kind) const {
    return kind == ProjectileKind::SHELL ? config_.shellSpeed : config_.boltSpeed;
}

float ProjectileSystem::lifetimeFor(ProjectileKind kind) const {
    return kind == ProjectileKind::SHELL ? config_.shellLifetime : config_.boltLifetime;
}

// ============================================================================
// Spawning
// ============================================================================

bool ProjectileSystem::handleTrigger(Registry& registry, const PhysicsBackend& physics,
                                     EntityID shooter, bool triggerPressed,
                                     uint32_t currentTimeMs) {
    if (!registry.valid(shooter)) {
        return false;
    }
    WeaponState& weapon = registry.get_or_emplace<WeaponState>(shooter);

    const uint32_t intervalMs = static_cast<uint32_t>(config_.shootInterval * 1000.0f);
    bool fire = false;
    if (triggerPressed && !weapon.lastTrigger) {
        fire = true;
    } else if (triggerPressed && config_.autoFire &&
               currentTimeMs - weapon.lastShotMs >= intervalMs) {
        fire = true;
    }
    weapon.lastTrigger = triggerPressed;

    if (!fire || spawnBolts(registry, physics, shooter, currentTimeMs) == 0) {
        return false;
    }
    weapon.lastShotMs = currentTimeMs;
    return true;
}

size_t ProjectileSystem::spawnBolts(Registry& registry, const PhysicsBackend& physics,
                                    EntityID shooter, uint32_t currentTimeMs) {
    auto body = physics.getBodyState(shooter);
    if (!body) {
        return 0;
    }

    const glm::quat& rotation = body->rotation;
    const glm::vec3 forward = rotation * glm::vec3(0.0f, 0.0f, -1.0f);
    const glm::vec3 up = rotation * glm::vec3(0.0f, 1.0f, 0.0f);

    size_t spawned = 0;
    for (float side : {-1.0f, 1.0f}) {
        const glm::vec3 gun(side * config_.boltGunOffsetX, 0.0f, config_.boltGunOffsetZ);
        const glm::vec3 position = body->position + rotation * gun +
                                   forward * config_.boltForwardOffset +
                                   up * config_.boltUpOffset;
        spawnProjectile(registry, ProjectileKind::BOLT, position, forward, shooter, currentTimeMs);
        ++spawned;
    }
    return spawned;
}

EntityID ProjectileSystem::spawnShell(Registry& registry, const PhysicsBackend& physics,
                                      EntityID shooter, uint32_t currentTimeMs) {
    auto body = physics.getBodyState(shooter);
    if (!body) {
        return entt::null;
    }

    const glm::vec3 forward = body->rotation * glm::vec3(0.0f, 0.0f, -1.0f);
    const glm::vec3 up = body->rotation * glm::vec3(0.0f, 1.0f, 0.0f);
    const glm::vec3 position = body->position + forward * config_.shellForwardOffset +
                               up * config_.shellUpOffset;
    return spawnProjectile(registry, ProjectileKind::SHELL, position, forward, shooter,
                           currentTimeMs);
}

EntityID ProjectileSystem::spawnProjectile(Registry& registry, ProjectileKind kind,
                                           const glm::vec3& position, const glm::vec3& direction,
                                           EntityID owner, uint32_t currentTimeMs) {
    const float length = glm::length(direction);
    if (length < MIN_SEGMENT_LENGTH) {
        return entt::null;
    }

    Projectile projectile;
    projectile.kind = kind;
    projectile.position = position;
    projectile.direction = direction / length;
    projectile.owner = owner;
    projectile.spawnTimeMs = currentTimeMs;
    projectile.age = 0.0f;
    projectile.lifetime = lifetimeFor(kind);

    const EntityID entity = registry.create();
    registry.emplace<Projectile>(entity, projectile);
    registry.emplace<ProjectileTag>(entity);
    return entity;
}

// ============================================================================
// Per-tick update
// ============================================================================

void ProjectileSystem::update(Registry& registry, PhysicsBackend& physics, float dt,
                              uint32_t currentTimeMs) {
    // Hits destroy entities, so snapshot the set first
    std::vector<EntityID> active;
    for (EntityID entity : registry.view<Projectile>()) {
        active.push_back(entity);
    }

    for (EntityID entity : active) {
        if (!registry.valid(entity)) {
            continue;
        }
        Projectile projectile = registry.get<Projectile>(entity);

        const glm::vec3 from = projectile.position;
        const glm::vec3 to = from + projectile.direction * speedFor(projectile.kind) * dt;

        bool consumed = false;
        if (glm::length(to - from) > MIN_SEGMENT_LENGTH) {
            if (auto hit = physics.castRayAgainstBodies(from, to, projectile.owner)) {
                if (projectile.kind == ProjectileKind::SHELL) {
                    detonateShell(registry, physics, projectile, hit->point, currentTimeMs);
                } else {
                    resolveBoltHit(registry, physics, projectile, *hit, currentTimeMs);
                }
                emitDecal(*hit, currentTimeMs);
                consumed = true;
            } else if (auto wall = physics.castRayAgainstStatic(from, to)) {
                emitDecal(*wall, currentTimeMs);
                consumed = true;
            }
        }

        if (!consumed) {
            projectile.position = to;
            projectile.age += dt;
            consumed = projectile.age > projectile.lifetime;
        }

        if (consumed) {
            registry.destroy(entity);
        } else {
            registry.replace<Projectile>(entity, projectile);
        }
    }
}

void ProjectileSystem::resolveBoltHit(Registry& registry, PhysicsBackend& physics,
                                      const Projectile& projectile, const RayHit& hit,
                                      uint32_t currentTimeMs) {
    if (!health_.reduceHealth(registry, hit.entity, config_.boltDamage, projectile.owner,
                              currentTimeMs)) {
        return;
    }
    physics.applyImpulse(hit.entity, projectile.direction * config_.boltKnockback);

    if (onHit_) {
        onHit_(ProjectileHit{ProjectileKind::BOLT, projectile.owner, hit.entity,
                             config_.boltDamage, hit.point});
    }
}

void ProjectileSystem::detonateShell(Registry& registry, PhysicsBackend& physics,
                                     const Projectile& projectile, const glm::vec3& point,
                                     uint32_t currentTimeMs) {
    const float radius = config_.shellExplosionRadius;

    std::vector<EntityID> players;
    for (EntityID entity : registry.view<PlayerTag, HealthState>()) {
        players.push_back(entity);
    }

    for (EntityID target : players) {
        if (target == projectile.owner || !physics.isBodyEnabled(target)) {
            continue;
        }
        auto body = physics.getBodyState(target);
        if (!body) {
            continue;
        }

        const glm::vec3 offset = body->position - point;
        const float distance = glm::length(offset);
        const int32_t damage = computeSplashDamage(config_.shellDamage, distance, radius);
        if (distance > radius) {
            continue;
        }

        if (damage > 0 &&
            health_.reduceHealth(registry, target, damage, projectile.owner, currentTimeMs) &&
            onHit_) {
            onHit_(ProjectileHit{ProjectileKind::SHELL, projectile.owner, target, damage, point});
        }

        const glm::vec3 direction = distance > MIN_SEGMENT_LENGTH ? offset / distance
                                                                  : projectile.direction;
        physics.applyImpulse(target, direction * config_.shellKnockback *
                                         computeFalloff(distance, radius));
    }
}

void ProjectileSystem::emitDecal(const RayHit& hit, uint32_t currentTimeMs) {
    if (!onImpact_) {
        return;
    }
    Decal decal;
    decal.position = hit.point + hit.normal * config_.decalSurfaceOffset;
    decal.normal = hit.normal;
    decal.spawnTimeMs = currentTimeMs;
    onImpact_(decal);
}

void ProjectileSystem::removeOwnedBy(Registry& registry, EntityID owner) {
    std::vector<EntityID> owned;
    auto view = registry.view<Projectile>();
    for (EntityID entity : view) {
        if (view.get<Projectile>(entity).owner == owner) {
            owned.push_back(entity);
        }
    }
    registry.destroy(owned.begin(), owned.end());
}

float ProjectileSystem::computeFalloff(float distance, float radius) {
    if (radius <= 0.0f || distance > radius) {
        return 0.0f;
    }
    return std::clamp(1.0f - std::max(0.0f, distance) / radius, 0.0f, 1.0f);
}

int32_t ProjectileSystem::computeSplashDamage(int32_t baseDamage, float distance, float radius) {
    const float falloff = computeFalloff(distance, radius);
    if (falloff <= 0.0f) {
        return 0;
    }
    return static_cast<int32_t>(std::ceil(static_cast<float>(baseDamage) * falloff));
}

size_t ProjectileSystem::getActiveCount(const Registry& registry) const {
    return registry.view<const Projectile>().size();
}

} // namespace SkyClash
