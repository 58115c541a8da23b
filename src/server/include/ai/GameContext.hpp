#pragma once

#include "ecs/CoreTypes.hpp"
#include "objective/CaptureTheFlag.hpp"
#include "physics/PhysicsBackend.hpp"
#include <optional>
#include <string>
#include <vector>

// [AI_AGENT] Read-only world facade for bot decisions
// Built fresh for every decision and thrown away afterwards. Every getter
// reads live state; nothing is cached and nothing can be mutated through it.

namespace SkyClash {

struct PlayerSnapshot {
    EntityID entity{entt::null};
    std::string controllerId;
    TeamId team{TeamId::SOLARIS};
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    glm::vec3 velocity{0.0f};
    int32_t health{0};
    bool isDead{false};
    bool carryingFlag{false};
};

struct SelfSnapshot : PlayerSnapshot {
    std::optional<std::string> heldAbility;
    bool abilityActivated{false};
};

struct PickupSnapshot {
    EntityID entity{entt::null};
    std::string abilityId;
    glm::vec3 position{0.0f};
};

class GameContext {
public:
    GameContext(const Registry& registry, const PhysicsBackend& physics,
                const CaptureTheFlag& objective, const std::vector<JumpPad>& jumpPads,
                EntityID self);

    // Empty until the bot has a body and a team
    [[nodiscard]] std::optional<SelfSnapshot> getSelf() const;

    // Every other player with a body
    [[nodiscard]] std::vector<PlayerSnapshot> getPlayers() const;
    [[nodiscard]] std::vector<PlayerSnapshot> getEnemies() const;
    [[nodiscard]] std::vector<PlayerSnapshot> getAllies() const;

    [[nodiscard]] const std::vector<Obstacle>& getObstacles() const;
    [[nodiscard]] std::vector<PickupSnapshot> getPickups() const;

    [[nodiscard]] const CaptureTheFlag::FlagStates& getFlags() const;
    [[nodiscard]] const glm::vec3& getBasePosition(TeamId team) const;
    [[nodiscard]] std::optional<TeamId> getEnemyTeam() const;

    [[nodiscard]] const std::vector<JumpPad>& getJumpPads() const { return jumpPads_; }
    [[nodiscard]] std::optional<JumpPad> findNearestJumpPad(const glm::vec3& position) const;

    [[nodiscard]] EntityID getSelfEntity() const { return self_; }

private:
    [[nodiscard]] std::optional<PlayerSnapshot> snapshotOf(EntityID entity) const;

    const Registry& registry_;
    const PhysicsBackend& physics_;
    const CaptureTheFlag& objective_;
    const std::vector<JumpPad>& jumpPads_;
    EntityID self_;
};

} // namespace SkyClash
