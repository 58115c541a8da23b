#pragma once

#include "ecs/CoreTypes.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

// [COMBAT_AGENT] Health and death tracking
// Health is clamped to [0, max] on every write. Death is edge-detected so a
// player that sits at zero health produces exactly one death notification.

namespace SkyClash {

// [COMBAT_AGENT] Health configuration
struct HealthConfig {
    int32_t maxHealth = Constants::MAX_HEALTH;
    float respawnDelaySec = Constants::RESPAWN_DELAY_SECONDS;
};

class HealthSystem {
public:
    using DeathCallback = std::function<void(EntityID victim, EntityID killer)>;
    using DamageCallback = std::function<void(EntityID attacker, EntityID target, int32_t damage)>;

public:
    explicit HealthSystem(const HealthConfig& config = HealthConfig{});

    // Adds (or resets) the HealthState component at full health
    void initialize(Registry& registry, EntityID entity) const;

    // Subtracts amount (negative amounts count as zero). False if the entity
    // has no health or is already flagged dead.
    bool reduceHealth(Registry& registry, EntityID target, int32_t amount,
                      EntityID attacker = entt::null, uint32_t currentTimeMs = 0);

    bool setHealth(Registry& registry, EntityID target, int32_t value);
    bool heal(Registry& registry, EntityID target, int32_t amount);

    [[nodiscard]] std::optional<int32_t> getHealth(const Registry& registry, EntityID entity) const;
    [[nodiscard]] bool isDead(const Registry& registry, EntityID entity) const;

    // True exactly once per transition from >0 to <=0
    bool checkDeath(Registry& registry, EntityID entity);

    // Runs checkDeath over every entity with health; returns the newly dead
    std::vector<EntityID> collectDeaths(Registry& registry);

    // Full health, death flag cleared
    void respawn(Registry& registry, EntityID entity);

    void setOnDeath(DeathCallback callback) { onDeath_ = std::move(callback); }
    void setOnDamage(DamageCallback callback) { onDamage_ = std::move(callback); }

    [[nodiscard]] const HealthConfig& getConfig() const { return config_; }
    void setConfig(const HealthConfig& config) { config_ = config; }

private:
    [[nodiscard]] int32_t clampHealth(const HealthState& state, int32_t value) const;

    HealthConfig config_;
    DeathCallback onDeath_;
    DamageCallback onDamage_;
};

} // namespace SkyClash
