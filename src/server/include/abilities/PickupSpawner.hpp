#pragma once

#include "abilities/AbilityRegistry.hpp"
#include "ecs/CoreTypes.hpp"
#include "physics/PhysicsBackend.hpp"
#include <cstdint>
#include <random>
#include <string>

// [ABILITY_AGENT] Collectible spawner
// Drops a rarity-rolled ability pickup into the arena annulus on a fixed
// interval until the cap is reached. Each pickup owns a physics sensor whose
// key is the pickup entity.

namespace SkyClash {

// [ABILITY_AGENT] Spawner tuning
struct PickupConfig {
    float spawnIntervalSec = Constants::PICKUP_SPAWN_INTERVAL;
    uint32_t maxPickups = Constants::MAX_PICKUPS;
    float arenaRadius = Constants::ARENA_RADIUS;
    float minDistance = Constants::PICKUP_MIN_DISTANCE;
    float boundaryMargin = Constants::PICKUP_BOUNDARY_MARGIN;
    float baseHeight = Constants::PICKUP_BASE_HEIGHT;
    float heightVariance = Constants::PICKUP_HEIGHT_VARIANCE;
    float pickupRadius = Constants::PICKUP_RADIUS;
};

class PickupSpawner {
public:
    PickupSpawner(const PickupConfig& config, const AbilityRegistry& abilities);

    // Spawns at most one pickup per call; entt::null when nothing spawned
    EntityID update(Registry& registry, PhysicsBackend& physics, uint32_t currentTimeMs,
                    std::mt19937& rng);

    EntityID spawnPickup(Registry& registry, PhysicsBackend& physics, const std::string& abilityId,
                         const glm::vec3& position, uint32_t currentTimeMs);

    void removePickup(Registry& registry, PhysicsBackend& physics, EntityID pickup);

    // Uniform angle, distance in [minDistance, arenaRadius - boundaryMargin]
    [[nodiscard]] glm::vec3 randomPosition(std::mt19937& rng) const;

    [[nodiscard]] size_t getCount(const Registry& registry) const;

    [[nodiscard]] static EntityID entityFromSensorKey(uint32_t key) {
        return static_cast<EntityID>(key);
    }

    [[nodiscard]] const PickupConfig& getConfig() const { return config_; }

private:
    PickupConfig config_;
    const AbilityRegistry& abilities_;
    uint32_t lastSpawnMs_{0};
};

} // namespace SkyClash
