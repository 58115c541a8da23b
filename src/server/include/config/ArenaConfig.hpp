#pragma once

#include "abilities/AbilityRegistry.hpp"
#include "abilities/PickupSpawner.hpp"
#include "ai/BotController.hpp"
#include "combat/HealthSystem.hpp"
#include "combat/ProjectileSystem.hpp"
#include "ecs/CoreTypes.hpp"
#include "objective/CaptureTheFlag.hpp"
#include "physics/KinematicPhysicsWorld.hpp"
#include "physics/MovementSystem.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

// [SIM_AGENT] Arena configuration
// Every subsystem keeps its own config struct with compiled-in defaults.
// ArenaConfig bundles them so a whole match can be tuned from one JSON file.

namespace SkyClash {

struct ArenaConfig {
    uint32_t seed{Constants::DEFAULT_SEED};
    uint32_t tickRateHz{Constants::TICK_RATE_HZ};
    uint32_t maxPlayers{Constants::MAX_PLAYERS};
    float arenaRadius{Constants::ARENA_RADIUS};    // Copied into the sub-configs by sanitize()
    float spawnHeightOffset{Constants::SPAWN_HEIGHT_OFFSET};
    size_t maxDecals{Constants::MAX_DECALS};

    MovementConfig movement;
    ProjectileConfig projectiles;
    HealthConfig health;
    AbilityConfig abilities;
    PickupConfig pickups;
    ObjectiveConfig objective;
    BotConfig bots;
    PhysicsConfig physics;

    std::vector<Obstacle> obstacles;
    std::vector<JumpPad> jumpPads;

    // Clamps out-of-range values and propagates the arena radius
    void sanitize();

    // Defaults plus the stock obstacle layout and jump pads
    [[nodiscard]] static ArenaConfig defaults();
};

[[nodiscard]] std::vector<Obstacle> defaultObstacles();
[[nodiscard]] std::vector<JumpPad> defaultJumpPads();

// Overlays the keys present in json onto the defaults, then sanitizes.
// Throws nlohmann::json::exception on type mismatches.
[[nodiscard]] ArenaConfig arenaConfigFromJson(const nlohmann::json& json);

// False (with a [CONFIG] log line) if the file is missing or malformed; out is
// left untouched in that case.
bool loadArenaConfig(const std::string& path, ArenaConfig& out);

} // namespace SkyClash
