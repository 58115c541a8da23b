// [ABILITY_AGENT] Collectible spawner implementation

#include "abilities/PickupSpawner.hpp"
#include <algorithm>
#include <cmath>
#include <glm/gtc/constants.hpp>

namespace SkyClash {

PickupSpawner::PickupSpawner(const PickupConfig& config, const AbilityRegistry& abilities)
    : config_(config)
    , abilities_(abilities) {}

EntityID PickupSpawner::update(Registry& registry, PhysicsBackend& physics,
                               uint32_t currentTimeMs, std::mt19937& rng) {
    const uint32_t intervalMs = static_cast<uint32_t>(config_.spawnIntervalSec * 1000.0f);
    if (currentTimeMs - lastSpawnMs_ < intervalMs) {
        return entt::null;
    }
    lastSpawnMs_ = currentTimeMs;

    if (getCount(registry) >= config_.maxPickups) {
        return entt::null;
    }

    const AbilityDefinition* ability = abilities_.roll(rng);
    if (!ability) {
        return entt::null;
    }
    return spawnPickup(registry, physics, ability->id, randomPosition(rng), currentTimeMs);
}

EntityID PickupSpawner::spawnPickup(Registry& registry, PhysicsBackend& physics,
                                    const std::string& abilityId, const glm::vec3& position,
                                    uint32_t currentTimeMs) {
    const EntityID entity = registry.create();

    SensorDesc sensor;
    sensor.kind = SensorKind::PICKUP;
    sensor.key = static_cast<uint32_t>(entt::to_integral(entity));
    sensor.center = position - glm::vec3(0.0f, config_.pickupRadius, 0.0f);
    sensor.radius = config_.pickupRadius;
    sensor.height = config_.pickupRadius * 2.0f;

    Pickup pickup;
    pickup.abilityId = abilityId;
    pickup.position = position;
    pickup.spawnTimeMs = currentTimeMs;
    pickup.sensorId = physics.addSensor(sensor);

    registry.emplace<Pickup>(entity, std::move(pickup));
    registry.emplace<PickupTag>(entity);
    return entity;
}

void PickupSpawner::removePickup(Registry& registry, PhysicsBackend& physics, EntityID pickup) {
    if (!registry.valid(pickup)) {
        return;
    }
    if (const Pickup* data = registry.try_get<Pickup>(pickup)) {
        physics.removeSensor(data->sensorId);
    }
    registry.destroy(pickup);
}

glm::vec3 PickupSpawner::randomPosition(std::mt19937& rng) const {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    const float maxDistance = std::max(config_.minDistance,
                                       config_.arenaRadius - config_.boundaryMargin);

    const float angle = unit(rng) * glm::two_pi<float>();
    const float distance = config_.minDistance + unit(rng) * (maxDistance - config_.minDistance);
    const float height = config_.baseHeight + unit(rng) * config_.heightVariance;

    return glm::vec3(std::cos(angle) * distance, height, std::sin(angle) * distance);
}

size_t PickupSpawner::getCount(const Registry& registry) const {
    return registry.view<const Pickup>().size();
}

} // namespace SkyClash
