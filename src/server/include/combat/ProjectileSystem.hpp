#pragma once

#include "combat/HealthSystem.hpp"
#include "ecs/CoreTypes.hpp"
#include "physics/PhysicsBackend.hpp"
#include <cstdint>
#include <functional>

// [COMBAT_AGENT] Bolt and shell projectiles
// Projectiles are registry entities advanced by segment raycasts each tick so
// fast bolts cannot tunnel through thin hulls. Players are tested before
// static geometry and the first hit ends the projectile.

namespace SkyClash {

// [COMBAT_AGENT] Projectile tuning
struct ProjectileConfig {
    // Bolt
    float boltSpeed = Constants::BOLT_SPEED;
    float boltLifetime = Constants::BOLT_LIFETIME;
    int32_t boltDamage = Constants::BOLT_DAMAGE;
    float boltKnockback = Constants::BOLT_KNOCKBACK;
    float boltGunOffsetX = Constants::BOLT_GUN_OFFSET_X;
    float boltGunOffsetZ = Constants::BOLT_GUN_OFFSET_Z;
    float boltForwardOffset = Constants::BOLT_FORWARD_OFFSET;
    float boltUpOffset = Constants::BOLT_UP_OFFSET;
    float shootInterval = Constants::SHOOT_INTERVAL;
    bool autoFire = true;            // Held trigger re-fires every shootInterval

    // Shell
    float shellSpeed = Constants::SHELL_SPEED;
    float shellLifetime = Constants::SHELL_LIFETIME;
    int32_t shellDamage = Constants::SHELL_DAMAGE;
    float shellKnockback = Constants::SHELL_KNOCKBACK;
    float shellExplosionRadius = Constants::SHELL_EXPLOSION_RADIUS;
    float shellForwardOffset = Constants::SHELL_FORWARD_OFFSET;
    float shellUpOffset = Constants::SHELL_UP_OFFSET;

    float decalSurfaceOffset = Constants::DECAL_SURFACE_OFFSET;
};

// [COMBAT_AGENT] One damaged player
struct ProjectileHit {
    ProjectileKind kind{ProjectileKind::BOLT};
    EntityID owner{entt::null};
    EntityID target{entt::null};
    int32_t damage{0};
    glm::vec3 point{0.0f};
};

class ProjectileSystem {
public:
    using HitCallback = std::function<void(const ProjectileHit& hit)>;
    using ImpactCallback = std::function<void(const Decal& decal)>;

public:
    ProjectileSystem(const ProjectileConfig& config, HealthSystem& health);

    // Fires bolts on a rising trigger edge, or while held once the refire
    // interval elapsed. Returns true when bolts were spawned.
    bool handleTrigger(Registry& registry, const PhysicsBackend& physics, EntityID shooter,
                       bool triggerPressed, uint32_t currentTimeMs);

    // Both guns; returns the number spawned (0 without a shooter transform)
    size_t spawnBolts(Registry& registry, const PhysicsBackend& physics, EntityID shooter,
                      uint32_t currentTimeMs);

    // Returns entt::null without a shooter transform
    EntityID spawnShell(Registry& registry, const PhysicsBackend& physics, EntityID shooter,
                        uint32_t currentTimeMs);

    EntityID spawnProjectile(Registry& registry, ProjectileKind kind, const glm::vec3& position,
                             const glm::vec3& direction, EntityID owner, uint32_t currentTimeMs);

    // Advance, raycast, resolve hits, expire
    void update(Registry& registry, PhysicsBackend& physics, float dt, uint32_t currentTimeMs);

    // Destroys projectiles fired by owner (player left)
    void removeOwnedBy(Registry& registry, EntityID owner);

    // ceil(base * (1 - d/R)) inside R, 0 outside
    [[nodiscard]] static int32_t computeSplashDamage(int32_t baseDamage, float distance, float radius);
    [[nodiscard]] static float computeFalloff(float distance, float radius);

    [[nodiscard]] size_t getActiveCount(const Registry& registry) const;

    void setOnHit(HitCallback callback) { onHit_ = std::move(callback); }
    void setOnImpact(ImpactCallback callback) { onImpact_ = std::move(callback); }

    [[nodiscard]] const ProjectileConfig& getConfig() const { return config_; }

private:
    [[nodiscard]] float speedFor(ProjectileKind kind) const;
    [[nodiscard]] float lifetimeFor(ProjectileKind kind) const;

    void resolveBoltHit(Registry& registry, PhysicsBackend& physics, const Projectile& projectile,
                        const RayHit& hit, uint32_t currentTimeMs);
    void detonateShell(Registry& registry, PhysicsBackend& physics, const Projectile& projectile,
                       const glm::vec3& point, uint32_t currentTimeMs);
    void emitDecal(const RayHit& hit, uint32_t currentTimeMs);

    ProjectileConfig config_;
    HealthSystem& health_;
    HitCallback onHit_;
    ImpactCallback onImpact_;
};

} // namespace SkyClash
