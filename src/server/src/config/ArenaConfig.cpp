// [SIM_AGENT] Arena configuration loading

#include "config/ArenaConfig.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>
#include <glm/gtc/constants.hpp>
#include <nlohmann/json.hpp>

namespace SkyClash {

using json = nlohmann::json;

namespace {

template<typename T>
void readValue(const json& node, const char* key, T& out) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

void readVec3(const json& node, const char* key, glm::vec3& out) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_array() || it->size() != 3) {
        return;
    }
    out = glm::vec3((*it)[0].get<float>(), (*it)[1].get<float>(), (*it)[2].get<float>());
}

const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    auto it = root.find(key);
    return (it != root.end() && it->is_object()) ? *it : empty;
}

float finiteOr(float value, float fallback) {
    return std::isfinite(value) ? value : fallback;
}

void readMovement(const json& node, MovementConfig& config) {
    readValue(node, "maxSpeed", config.maxSpeed);
    readValue(node, "acceleration", config.acceleration);
    readValue(node, "deceleration", config.deceleration);
    readValue(node, "maxVelocityChangePerFrame", config.maxVelocityChangePerFrame);
    readValue(node, "lateralDamping", config.lateralDamping);
    readValue(node, "maxAngularVelocity", config.maxAngularVelocity);
    readValue(node, "angularAcceleration", config.angularAcceleration);
    readValue(node, "maxAngularChangePerFrame", config.maxAngularChangePerFrame);
    readValue(node, "inputSmoothTime", config.inputSmoothTime);
    readValue(node, "hoverHeight", config.hoverHeight);
    readValue(node, "airModeThreshold", config.airModeThreshold);
    readValue(node, "hoverRestoreForce", config.hoverRestoreForce);
    readValue(node, "baseGravity", config.baseGravity);
    readValue(node, "maxDiveGravity", config.maxDiveGravity);
    readValue(node, "maxLift", config.maxLift);
    readValue(node, "maxPitch", config.maxPitch);
    readValue(node, "minVerticalVelocity", config.minVerticalVelocity);
    readValue(node, "maxVerticalVelocity", config.maxVerticalVelocity);
    readValue(node, "launchVelocityThreshold", config.launchVelocityThreshold);
    readValue(node, "airAutoThrust", config.airAutoThrust);
}

void readProjectiles(const json& node, ProjectileConfig& config) {
    readValue(node, "boltSpeed", config.boltSpeed);
    readValue(node, "boltLifetime", config.boltLifetime);
    readValue(node, "boltDamage", config.boltDamage);
    readValue(node, "boltKnockback", config.boltKnockback);
    readValue(node, "shootInterval", config.shootInterval);
    readValue(node, "autoFire", config.autoFire);
    readValue(node, "shellSpeed", config.shellSpeed);
    readValue(node, "shellLifetime", config.shellLifetime);
    readValue(node, "shellDamage", config.shellDamage);
    readValue(node, "shellKnockback", config.shellKnockback);
    readValue(node, "shellExplosionRadius", config.shellExplosionRadius);
}

void readAbilities(const json& node, AbilityConfig& config) {
    readValue(node, "speedBoostDuration", config.speedBoostDuration);
    readValue(node, "speedBoostMultiplier", config.speedBoostMultiplier);
    readValue(node, "healthPackAmount", config.healthPackAmount);

    auto it = node.find("rarityWeights");
    if (it != node.end() && it->is_array()) {
        const size_t count = std::min(it->size(), config.rarityWeights.size());
        for (size_t i = 0; i < count; ++i) {
            config.rarityWeights[i] = (*it)[i].get<uint32_t>();
        }
    }
}

void readPickups(const json& node, PickupConfig& config) {
    readValue(node, "spawnIntervalSec", config.spawnIntervalSec);
    readValue(node, "maxPickups", config.maxPickups);
    readValue(node, "minDistance", config.minDistance);
    readValue(node, "boundaryMargin", config.boundaryMargin);
    readValue(node, "baseHeight", config.baseHeight);
    readValue(node, "heightVariance", config.heightVariance);
    readValue(node, "pickupRadius", config.pickupRadius);
}

void readObjective(const json& node, ObjectiveConfig& config) {
    readValue(node, "baseMinRadiusFactor", config.baseMinRadiusFactor);
    readValue(node, "baseMaxRadiusFactor", config.baseMaxRadiusFactor);
    readValue(node, "baseBoundaryMargin", config.baseBoundaryMargin);
    readValue(node, "fallbackRadiusFactor", config.fallbackRadiusFactor);
    readValue(node, "baseZoneRadius", config.baseZoneRadius);
    readValue(node, "flagZoneRadius", config.flagZoneRadius);
    readValue(node, "zoneHeight", config.zoneHeight);
}

void readBots(const json& node, BotConfig& config) {
    readValue(node, "wanderExtent", config.wanderExtent);
    readValue(node, "wanderMinHeight", config.wanderMinHeight);
    readValue(node, "wanderMaxHeight", config.wanderMaxHeight);
    readValue(node, "targetMinInterval", config.targetMinInterval);
    readValue(node, "targetMaxInterval", config.targetMaxInterval);
    readValue(node, "turnGain", config.turnGain);
    readValue(node, "reverseThrust", config.reverseThrust);
    readValue(node, "fireInterval", config.fireInterval);
    readValue(node, "fireChance", config.fireChance);
    readValue(node, "useAbilities", config.useAbilities);

    const json& reach = section(node, "reachability");
    readValue(reach, "threshold", config.reachability.threshold);
    readValue(reach, "maxGravity", config.reachability.maxGravity);
    readValue(reach, "safetyMargin", config.reachability.safetyMargin);
}

void readPhysics(const json& node, PhysicsConfig& config) {
    readValue(node, "groundPlane", config.groundPlane);
    readValue(node, "bodyCollisions", config.bodyCollisions);
    readValue(node, "cellSize", config.cellSize);
    readVec3(node, "gravity", config.gravity);
}

} // anonymous namespace

// ============================================================================
// Defaults
// ============================================================================

std::vector<Obstacle> defaultObstacles() {
    constexpr float pi = glm::pi<float>();
    // x, z, yaw
    const float layout[][3] = {
        {30.0f, 20.0f, pi / 4.0f},   {-25.0f, 30.0f, pi / 6.0f},
        {40.0f, -20.0f, pi / 3.0f},  {-35.0f, -25.0f, -pi / 4.0f},
        {60.0f, 50.0f, pi / 5.0f},   {-50.0f, 60.0f, -pi / 6.0f},
        {70.0f, -40.0f, pi / 2.0f},  {-60.0f, -50.0f, -pi / 3.0f},
        {90.0f, 80.0f, pi / 4.0f},   {-80.0f, 90.0f, -pi / 5.0f},
        {100.0f, -70.0f, pi / 3.0f}, {-90.0f, -80.0f, -pi / 4.0f},
        {0.0f, 50.0f, pi / 6.0f},    {50.0f, 0.0f, -pi / 4.0f},
        {-50.0f, 0.0f, pi / 3.0f},   {0.0f, -50.0f, -pi / 6.0f}
    };

    const float half = Constants::OBSTACLE_SIZE * 0.5f;
    std::vector<Obstacle> obstacles;
    obstacles.reserve(std::size(layout));
    for (const auto& entry : layout) {
        Obstacle obstacle;
        obstacle.center = glm::vec3(entry[0], half, entry[1]);
        obstacle.halfExtents = glm::vec3(half);
        obstacle.yaw = entry[2];
        obstacles.push_back(obstacle);
    }
    return obstacles;
}

std::vector<JumpPad> defaultJumpPads() {
    const glm::vec3 positions[] = {
        {60.0f, 0.0f, 0.0f}, {-60.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 60.0f}, {0.0f, 0.0f, -60.0f}
    };

    std::vector<JumpPad> pads;
    uint32_t id = 1;
    for (const glm::vec3& position : positions) {
        JumpPad pad;
        pad.id = id++;
        pad.position = position;
        pads.push_back(pad);
    }
    return pads;
}

ArenaConfig ArenaConfig::defaults() {
    ArenaConfig config;
    config.obstacles = defaultObstacles();
    config.jumpPads = defaultJumpPads();
    config.sanitize();
    return config;
}

// ============================================================================
// Sanitize
// ============================================================================

void ArenaConfig::sanitize() {
    tickRateHz = std::clamp<uint32_t>(tickRateHz, 1, 240);
    maxPlayers = std::clamp<uint32_t>(maxPlayers, 1,
                                      static_cast<uint32_t>(SharedConstants::PLAYER_COLORS.size()));
    arenaRadius = std::max(finiteOr(arenaRadius, Constants::ARENA_RADIUS), 50.0f);
    spawnHeightOffset = std::max(finiteOr(spawnHeightOffset, Constants::SPAWN_HEIGHT_OFFSET), 0.0f);
    maxDecals = std::max<size_t>(maxDecals, 1);

    // One arena radius for everybody
    pickups.arenaRadius = arenaRadius;
    objective.arenaRadius = arenaRadius;
    physics.arenaRadius = arenaRadius;

    movement.maxSpeed = std::max(movement.maxSpeed, 0.0f);
    movement.acceleration = std::max(movement.acceleration, 0.0f);
    movement.deceleration = std::max(movement.deceleration, 0.0f);
    movement.inputSmoothTime = std::max(movement.inputSmoothTime, 0.0f);
    movement.lateralDamping = std::clamp(movement.lateralDamping, 0.0f, 1.0f);
    if (movement.minVerticalVelocity > movement.maxVerticalVelocity) {
        std::swap(movement.minVerticalVelocity, movement.maxVerticalVelocity);
    }

    projectiles.boltDamage = std::max(projectiles.boltDamage, 0);
    projectiles.shellDamage = std::max(projectiles.shellDamage, 0);
    projectiles.boltLifetime = std::max(projectiles.boltLifetime, 0.0f);
    projectiles.shellLifetime = std::max(projectiles.shellLifetime, 0.0f);
    projectiles.shellExplosionRadius = std::max(projectiles.shellExplosionRadius, 0.0f);
    projectiles.shootInterval = std::max(projectiles.shootInterval, 0.0f);

    health.maxHealth = std::max(health.maxHealth, 1);
    health.respawnDelaySec = std::max(health.respawnDelaySec, 0.0f);

    abilities.speedBoostDuration = std::max(abilities.speedBoostDuration, 0.0f);
    abilities.speedBoostMultiplier = std::max(abilities.speedBoostMultiplier, 0.0f);
    abilities.healthPackAmount = std::max(abilities.healthPackAmount, 0);

    pickups.spawnIntervalSec = std::max(pickups.spawnIntervalSec, 0.1f);
    pickups.minDistance = std::clamp(pickups.minDistance, 0.0f, arenaRadius);
    pickups.pickupRadius = std::max(pickups.pickupRadius, 0.1f);

    objective.baseMinRadiusFactor = std::clamp(objective.baseMinRadiusFactor, 0.0f, 1.0f);
    objective.baseMaxRadiusFactor = std::clamp(objective.baseMaxRadiusFactor,
                                               objective.baseMinRadiusFactor, 1.0f);
    objective.fallbackRadiusFactor = std::clamp(objective.fallbackRadiusFactor, 0.0f, 1.0f);

    if (bots.targetMinInterval > bots.targetMaxInterval) {
        std::swap(bots.targetMinInterval, bots.targetMaxInterval);
    }
    if (bots.wanderMinHeight > bots.wanderMaxHeight) {
        std::swap(bots.wanderMinHeight, bots.wanderMaxHeight);
    }
    bots.fireChance = std::clamp(bots.fireChance, 0.0f, 1.0f);

    physics.cellSize = std::max(physics.cellSize, 1.0f);

    for (JumpPad& pad : jumpPads) {
        pad.radius = std::max(pad.radius, 0.1f);
        pad.cooldownSec = std::max(pad.cooldownSec, 0.0f);
    }
}

// ============================================================================
// JSON
// ============================================================================

ArenaConfig arenaConfigFromJson(const json& root) {
    ArenaConfig config = ArenaConfig::defaults();

    readValue(root, "seed", config.seed);
    readValue(root, "tickRateHz", config.tickRateHz);
    readValue(root, "maxPlayers", config.maxPlayers);
    readValue(root, "arenaRadius", config.arenaRadius);
    readValue(root, "spawnHeightOffset", config.spawnHeightOffset);
    readValue(root, "maxDecals", config.maxDecals);

    readMovement(section(root, "movement"), config.movement);
    readProjectiles(section(root, "projectiles"), config.projectiles);
    readValue(section(root, "health"), "maxHealth", config.health.maxHealth);
    readValue(section(root, "health"), "respawnDelaySec", config.health.respawnDelaySec);
    readAbilities(section(root, "abilities"), config.abilities);
    readPickups(section(root, "pickups"), config.pickups);
    readObjective(section(root, "objective"), config.objective);
    readBots(section(root, "bots"), config.bots);
    readPhysics(section(root, "physics"), config.physics);

    auto obstacles = root.find("obstacles");
    if (obstacles != root.end() && obstacles->is_array()) {
        config.obstacles.clear();
        for (const json& node : *obstacles) {
            Obstacle obstacle;
            readVec3(node, "center", obstacle.center);
            readVec3(node, "halfExtents", obstacle.halfExtents);
            readValue(node, "yaw", obstacle.yaw);
            config.obstacles.push_back(obstacle);
        }
    }

    auto pads = root.find("jumpPads");
    if (pads != root.end() && pads->is_array()) {
        config.jumpPads.clear();
        uint32_t nextId = 1;
        for (const json& node : *pads) {
            JumpPad pad;
            pad.id = nextId++;
            readValue(node, "id", pad.id);
            readVec3(node, "position", pad.position);
            readValue(node, "radius", pad.radius);
            readValue(node, "launchVelocity", pad.launchVelocity);
            readValue(node, "cooldownSec", pad.cooldownSec);
            config.jumpPads.push_back(pad);
        }
    }

    config.sanitize();
    return config;
}

bool loadArenaConfig(const std::string& path, ArenaConfig& out) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "[CONFIG] Cannot open " << path << std::endl;
        return false;
    }

    try {
        json root;
        stream >> root;
        if (!root.is_object()) {
            std::cerr << "[CONFIG] " << path << ": top level must be an object" << std::endl;
            return false;
        }
        out = arenaConfigFromJson(root);
    } catch (const json::exception& e) {
        std::cerr << "[CONFIG] Invalid " << path << ": " << e.what() << std::endl;
        return false;
    }

    std::cout << "[CONFIG] Loaded " << path << " (seed " << out.seed
              << ", " << out.obstacles.size() << " obstacles, "
              << out.jumpPads.size() << " jump pads)" << std::endl;
    return true;
}

} // namespace SkyClash
