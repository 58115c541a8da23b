// [AI_AGENT] Read-only world facade implementation

#include "ai/GameContext.hpp"
#include <limits>

namespace SkyClash {

GameContext::GameContext(const Registry& registry, const PhysicsBackend& physics,
                         const CaptureTheFlag& objective, const std::vector<JumpPad>& jumpPads,
                         EntityID self)
    : registry_(registry)
    , physics_(physics)
    , objective_(objective)
    , jumpPads_(jumpPads)
    , self_(self) {}

std::optional<PlayerSnapshot> GameContext::snapshotOf(EntityID entity) const {
    if (!registry_.valid(entity)) {
        return std::nullopt;
    }
    const PlayerInfo* info = registry_.try_get<PlayerInfo>(entity);
    const auto team = objective_.getTeam(entity);
    const auto body = physics_.getBodyState(entity);
    if (!info || !team || !body) {
        return std::nullopt;
    }

    PlayerSnapshot snapshot;
    snapshot.entity = entity;
    snapshot.controllerId = info->controllerId;
    snapshot.team = *team;
    snapshot.position = body->position;
    snapshot.rotation = body->rotation;
    snapshot.velocity = body->linearVelocity;
    if (const HealthState* health = registry_.try_get<HealthState>(entity)) {
        snapshot.health = health->health;
        snapshot.isDead = health->isDead;
    }
    snapshot.carryingFlag = objective_.getCarriedFlag(entity).has_value();
    return snapshot;
}

std::optional<SelfSnapshot> GameContext::getSelf() const {
    auto base = snapshotOf(self_);
    if (!base) {
        return std::nullopt;
    }

    SelfSnapshot self;
    static_cast<PlayerSnapshot&>(self) = *base;
    if (const AbilitySlot* slot = registry_.try_get<AbilitySlot>(self_)) {
        self.heldAbility = slot->abilityId;
        self.abilityActivated = slot->activated();
    }
    return self;
}

std::vector<PlayerSnapshot> GameContext::getPlayers() const {
    std::vector<PlayerSnapshot> players;
    for (EntityID entity : registry_.view<const PlayerTag>()) {
        if (entity == self_) {
            continue;
        }
        if (auto snapshot = snapshotOf(entity)) {
            players.push_back(std::move(*snapshot));
        }
    }
    return players;
}

std::vector<PlayerSnapshot> GameContext::getEnemies() const {
    std::vector<PlayerSnapshot> enemies;
    const auto enemyTeam = getEnemyTeam();
    if (!enemyTeam) {
        return enemies;
    }
    for (PlayerSnapshot& player : getPlayers()) {
        if (player.team == *enemyTeam) {
            enemies.push_back(std::move(player));
        }
    }
    return enemies;
}

std::vector<PlayerSnapshot> GameContext::getAllies() const {
    std::vector<PlayerSnapshot> allies;
    const auto team = objective_.getTeam(self_);
    if (!team) {
        return allies;
    }
    for (PlayerSnapshot& player : getPlayers()) {
        if (player.team == *team) {
            allies.push_back(std::move(player));
        }
    }
    return allies;
}

const std::vector<Obstacle>& GameContext::getObstacles() const {
    return physics_.getObstacles();
}

std::vector<PickupSnapshot> GameContext::getPickups() const {
    std::vector<PickupSnapshot> pickups;
    auto view = registry_.view<const Pickup>();
    for (EntityID entity : view) {
        const Pickup& pickup = view.get<const Pickup>(entity);
        pickups.push_back(PickupSnapshot{entity, pickup.abilityId, pickup.position});
    }
    return pickups;
}

const CaptureTheFlag::FlagStates& GameContext::getFlags() const {
    return objective_.getFlags();
}

const glm::vec3& GameContext::getBasePosition(TeamId team) const {
    return objective_.getBasePosition(team);
}

std::optional<TeamId> GameContext::getEnemyTeam() const {
    const auto team = objective_.getTeam(self_);
    if (!team) {
        return std::nullopt;
    }
    return opposingTeam(*team);
}

std::optional<JumpPad> GameContext::findNearestJumpPad(const glm::vec3& position) const {
    std::optional<JumpPad> nearest;
    float bestDistance = std::numeric_limits<float>::max();
    for (const JumpPad& pad : jumpPads_) {
        const float distance = glm::distance(position, pad.position);
        if (distance < bestDistance) {
            bestDistance = distance;
            nearest = pad;
        }
    }
    return nearest;
}

} // namespace SkyClash
