#pragma once

#include "Constants.hpp"
#include "constants/GameConstants.hpp"
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

// [SIM_AGENT] Core ECS types and components
// Components are plain structs owned by the registry and updated in place by the tick

namespace SkyClash {

using EntityID = entt::entity;
using Registry = entt::registry;

// ============================================================================
// TEAMS
// ============================================================================

enum class TeamId : uint8_t {
    SOLARIS = 0,
    NEBULON = 1
};

inline constexpr TeamId ALL_TEAMS[] = {TeamId::SOLARIS, TeamId::NEBULON};

[[nodiscard]] inline constexpr size_t teamIndex(TeamId team) {
    return static_cast<size_t>(team);
}

[[nodiscard]] inline constexpr TeamId opposingTeam(TeamId team) {
    return team == TeamId::SOLARIS ? TeamId::NEBULON : TeamId::SOLARIS;
}

[[nodiscard]] inline constexpr std::string_view teamLabel(TeamId team) {
    return SharedConstants::TEAM_LABELS[teamIndex(team)];
}

// ============================================================================
// INPUT COMPONENT
// ============================================================================

// [NETWORK_AGENT] Controller snapshot, identical for humans and bots
struct ControllerInput {
    glm::vec2 vector{0.0f};    // x = turn (positive steers right), y = thrust
    bool action{false};        // Fire trigger
    bool ability{false};       // Ability trigger
    uint32_t timestampMs{0};

    [[nodiscard]] ControllerInput clamped() const {
        ControllerInput out = *this;
        out.vector = glm::clamp(vector, glm::vec2(-1.0f), glm::vec2(1.0f));
        if (!std::isfinite(out.vector.x)) out.vector.x = 0.0f;
        if (!std::isfinite(out.vector.y)) out.vector.y = 0.0f;
        return out;
    }
};

// ============================================================================
// MOVEMENT COMPONENTS
// ============================================================================

// [PHYSICS_AGENT] Integrator state carried between ticks
struct ShipMotion {
    glm::vec2 smoothedInput{0.0f};
    float yaw{0.0f};            // Radians around +Y, 0 faces -Z
    float pitch{0.0f};          // Radians, positive is nose up
    float yawVelocity{0.0f};
    float pitchVelocity{0.0f};

    [[nodiscard]] glm::quat rotation() const {
        return glm::angleAxis(yaw, glm::vec3(0.0f, 1.0f, 0.0f)) *
               glm::angleAxis(pitch, glm::vec3(1.0f, 0.0f, 0.0f));
    }

    // Horizontal forward axis (pitch ignored)
    [[nodiscard]] glm::vec3 flatForward() const {
        return glm::vec3(-std::sin(yaw), 0.0f, -std::cos(yaw));
    }
};

// [ABILITY_AGENT] Stat modifiers consumed by the movement integrator
struct PlayerStats {
    float speedMultiplier{1.0f};
    float accelerationMultiplier{1.0f};
};

// ============================================================================
// COMBAT COMPONENTS
// ============================================================================

// [COMBAT_AGENT] Health with edge-triggered death flag
struct HealthState {
    int32_t health{Constants::MAX_HEALTH};
    int32_t maxHealth{Constants::MAX_HEALTH};
    bool isDead{false};
    EntityID lastAttacker{entt::null};
    uint32_t lastDamageTimeMs{0};
    uint32_t respawnAtMs{0};

    [[nodiscard]] float healthPercent() const {
        return static_cast<float>(health) / static_cast<float>(maxHealth) * 100.0f;
    }
};

// [COMBAT_AGENT] Fire trigger edge tracking
struct WeaponState {
    bool lastTrigger{false};
    uint32_t lastShotMs{0};
};

enum class ProjectileKind : uint8_t {
    BOLT = 0,   // Hit-scan, single target
    SHELL = 1   // Area damage with falloff
};

// [COMBAT_AGENT] In-flight projectile
struct Projectile {
    ProjectileKind kind{ProjectileKind::BOLT};
    glm::vec3 position{0.0f};
    glm::vec3 direction{0.0f, 0.0f, -1.0f};
    EntityID owner{entt::null};
    uint32_t spawnTimeMs{0};
    float age{0.0f};
    float lifetime{Constants::BOLT_LIFETIME};
};

struct Decal {
    glm::vec3 position{0.0f};
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
    uint32_t spawnTimeMs{0};
};

// ============================================================================
// ABILITY COMPONENTS
// ============================================================================

// [ABILITY_AGENT] Single ability slot: empty, equipped-inactive or equipped-active
struct AbilitySlot {
    std::optional<std::string> abilityId;
    std::optional<uint32_t> activatedAtMs;
    float durationSec{0.0f};

    [[nodiscard]] bool empty() const { return !abilityId.has_value(); }
    [[nodiscard]] bool activated() const { return activatedAtMs.has_value(); }
};

// [ABILITY_AGENT] Collectible in the arena
struct Pickup {
    std::string abilityId;
    glm::vec3 position{0.0f};
    uint32_t spawnTimeMs{0};
    uint32_t sensorId{0};
};

// ============================================================================
// PLAYER COMPONENTS
// ============================================================================

// [SIM_AGENT] Controller slot identity
struct PlayerInfo {
    std::string controllerId;
    std::string displayName;
    std::string color;
    bool isBot{false};
    uint32_t joinTimeMs{0};
};

struct TeamMember {
    TeamId team{TeamId::SOLARIS};
};

// [SIM_AGENT] Derived transform for camera-follow consumers
struct CachedTransform {
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
};

// ============================================================================
// ARENA GEOMETRY
// ============================================================================

// [PHYSICS_AGENT] Static oriented box
struct Obstacle {
    glm::vec3 center{0.0f};
    glm::vec3 halfExtents{Constants::OBSTACLE_SIZE * 0.5f};
    float yaw{0.0f};
};

// [PHYSICS_AGENT] Launch pad on the ground
struct JumpPad {
    uint32_t id{0};
    glm::vec3 position{0.0f};
    float radius{Constants::JUMP_PAD_RADIUS};
    float launchVelocity{Constants::JUMP_PAD_FORCE};
    float cooldownSec{Constants::JUMP_PAD_COOLDOWN};
};

// ============================================================================
// TAG COMPONENTS
// ============================================================================

struct PlayerTag {};
struct BotTag {};
struct ProjectileTag {};
struct PickupTag {};

} // namespace SkyClash
