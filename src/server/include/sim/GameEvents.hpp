#pragma once

#include "ecs/CoreTypes.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

// [SIM_AGENT] Presentation events
// Emitted synchronously from inside tick(). Audio, haptics and HUD layers
// subscribe; the simulation never waits on them.

namespace SkyClash {

enum class GameEventType : uint8_t {
    PLAYER_JOINED = 0,
    PLAYER_LEFT,
    ABILITY_COLLECTED,
    ABILITY_ACTIVATED,
    ABILITY_EXPIRED,
    FLAG_PICKED_UP,
    FLAG_RETURNED,
    FLAG_DROPPED,
    FLAG_CAPTURED,
    PROJECTILE_FIRED,
    PROJECTILE_HIT,
    PLAYER_DIED,
    PLAYER_RESPAWNED,
    JUMP_PAD_LAUNCH
};

struct GameEvent {
    GameEventType type{GameEventType::PLAYER_JOINED};
    EntityID subject{entt::null};     // Acting player
    EntityID other{entt::null};       // Victim, killer or shooter depending on type
    std::optional<TeamId> team;
    glm::vec3 position{0.0f};
    int32_t amount{0};                // Damage, score or projectile count
    std::string detail;               // Ability id, controller id
    uint32_t timeMs{0};
};

using GameEventCallback = std::function<void(const GameEvent& event)>;

[[nodiscard]] inline std::string_view gameEventLabel(GameEventType type) {
    switch (type) {
        case GameEventType::PLAYER_JOINED: return "player_joined";
        case GameEventType::PLAYER_LEFT: return "player_left";
        case GameEventType::ABILITY_COLLECTED: return "ability_collected";
        case GameEventType::ABILITY_ACTIVATED: return "ability_activated";
        case GameEventType::ABILITY_EXPIRED: return "ability_expired";
        case GameEventType::FLAG_PICKED_UP: return "flag_picked_up";
        case GameEventType::FLAG_RETURNED: return "flag_returned";
        case GameEventType::FLAG_DROPPED: return "flag_dropped";
        case GameEventType::FLAG_CAPTURED: return "flag_captured";
        case GameEventType::PROJECTILE_FIRED: return "projectile_fired";
        case GameEventType::PROJECTILE_HIT: return "projectile_hit";
        case GameEventType::PLAYER_DIED: return "player_died";
        case GameEventType::PLAYER_RESPAWNED: return "player_respawned";
        case GameEventType::JUMP_PAD_LAUNCH: return "jump_pad_launch";
    }
    return "unknown";
}

} // namespace SkyClash
