// [CTF_AGENT] Capture-the-flag state machine implementation

#include "objective/CaptureTheFlag.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <glm/gtc/constants.hpp>

namespace SkyClash {

CaptureTheFlag::CaptureTheFlag(const ObjectiveConfig& config, std::mt19937& rng)
    : config_(config)
    , rng_(rng)
{
    resetMatch();
}

void CaptureTheFlag::resetMatch() {
    bases_ = generateBasePositions(config_, rng_);
    scores_ = Scores{};

    FlagStates flags{};
    for (TeamId team : ALL_TEAMS) {
        flags[teamIndex(team)] = homeFlag(team);
    }
    flags_ = flags;
}

FlagState CaptureTheFlag::homeFlag(TeamId team) const {
    FlagState flag;
    flag.team = team;
    flag.status = FlagStatus::AT_BASE;
    flag.position = bases_[teamIndex(team)];
    flag.carrier = entt::null;
    return flag;
}

// ============================================================================
// Teams
// ============================================================================

TeamId CaptureTheFlag::assignPlayer(EntityID player) {
    auto it = members_.find(player);
    if (it != members_.end()) {
        return it->second;
    }

    TeamId chosen = TeamId::SOLARIS;
    for (TeamId team : ALL_TEAMS) {
        if (getTeamSize(team) < getTeamSize(chosen)) {
            chosen = team;
        }
    }

    members_.emplace(player, chosen);
    return chosen;
}

ObjectiveResult CaptureTheFlag::removePlayer(EntityID player) {
    ObjectiveResult result = ObjectiveResult::NONE;
    if (auto carried = getCarriedFlag(player)) {
        FlagStates flags = flags_;
        flags[teamIndex(*carried)] = homeFlag(*carried);
        flags_ = flags;
        result = ObjectiveResult::RETURNED;
    }
    members_.erase(player);
    return result;
}

std::optional<TeamId> CaptureTheFlag::getTeam(EntityID player) const {
    auto it = members_.find(player);
    if (it == members_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t CaptureTheFlag::getTeamSize(TeamId team) const {
    return static_cast<size_t>(std::count_if(members_.begin(), members_.end(),
        [team](const auto& entry) { return entry.second == team; }));
}

std::optional<TeamId> CaptureTheFlag::getCarriedFlag(EntityID carrier) const {
    for (const FlagState& flag : flags_) {
        if (flag.status == FlagStatus::CARRIED && flag.carrier == carrier) {
            return flag.team;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Flag transitions
// ============================================================================

ObjectiveResult CaptureTheFlag::handleBaseEntry(EntityID player, TeamId baseTeam) {
    const auto team = getTeam(player);
    if (!team) {
        return ObjectiveResult::NONE;
    }

    if (baseTeam != *team) {
        // Enemy base: only a flag sitting at that base can be grabbed here
        if (getFlag(baseTeam).status == FlagStatus::AT_BASE) {
            return tryPickupFlag(player, baseTeam);
        }
        return ObjectiveResult::NONE;
    }

    const TeamId enemy = opposingTeam(*team);
    const FlagState& enemyFlag = getFlag(enemy);

    if (enemyFlag.status == FlagStatus::CARRIED && enemyFlag.carrier == player) {
        scores_[teamIndex(*team)] += 1;
        bases_ = generateBasePositions(config_, rng_);

        // homeFlag reads bases_, so both flags land on the new pair
        FlagStates flags = flags_;
        flags[teamIndex(enemy)] = homeFlag(enemy);
        if (flags[teamIndex(*team)].status == FlagStatus::AT_BASE) {
            flags[teamIndex(*team)] = homeFlag(*team);
        }
        flags_ = flags;

        std::cout << "[CTF] Team " << teamLabel(*team) << " captured the "
                  << teamLabel(enemy) << " flag (" << getScore(TeamId::SOLARIS) << " - "
                  << getScore(TeamId::NEBULON) << ")" << std::endl;
        return ObjectiveResult::CAPTURED;
    }

    if (getFlag(*team).status == FlagStatus::DROPPED) {
        FlagStates flags = flags_;
        flags[teamIndex(*team)] = homeFlag(*team);
        flags_ = flags;
        return ObjectiveResult::RETURNED;
    }

    return ObjectiveResult::NONE;
}

ObjectiveResult CaptureTheFlag::tryPickupFlag(EntityID player, TeamId flagTeam) {
    const auto team = getTeam(player);
    if (!team) {
        return ObjectiveResult::NONE;
    }

    const FlagState& flag = getFlag(flagTeam);
    if (flag.status == FlagStatus::CARRIED) {
        return ObjectiveResult::NONE;
    }

    FlagStates flags = flags_;
    if (flagTeam == *team) {
        if (flag.status != FlagStatus::DROPPED) {
            return ObjectiveResult::NONE;
        }
        flags[teamIndex(flagTeam)] = homeFlag(flagTeam);
        flags_ = flags;
        return ObjectiveResult::RETURNED;
    }

    FlagState carried = flag;
    carried.status = FlagStatus::CARRIED;
    carried.carrier = player;
    flags[teamIndex(flagTeam)] = carried;
    flags_ = flags;
    return ObjectiveResult::PICKED_UP;
}

ObjectiveResult CaptureTheFlag::dropFlag(EntityID player, std::optional<glm::vec3> position) {
    const auto carried = getCarriedFlag(player);
    if (!carried) {
        return ObjectiveResult::NONE;
    }

    FlagStates flags = flags_;
    if (!position) {
        flags[teamIndex(*carried)] = homeFlag(*carried);
        flags_ = flags;
        return ObjectiveResult::RETURNED;
    }

    FlagState dropped;
    dropped.team = *carried;
    dropped.status = FlagStatus::DROPPED;
    dropped.position = *position;
    dropped.carrier = entt::null;
    flags[teamIndex(*carried)] = dropped;
    flags_ = flags;
    return ObjectiveResult::DROPPED;
}

void CaptureTheFlag::manualScore(TeamId team) {
    scores_[teamIndex(team)] += 1;
    bases_ = generateBasePositions(config_, rng_);

    // Flags out in the field stay where they are
    FlagStates flags = flags_;
    for (TeamId flagTeam : ALL_TEAMS) {
        if (flags[teamIndex(flagTeam)].status == FlagStatus::AT_BASE) {
            flags[teamIndex(flagTeam)] = homeFlag(flagTeam);
        }
    }
    flags_ = flags;

    std::cout << "[CTF] Team " << teamLabel(team) << " awarded a point ("
              << getScore(TeamId::SOLARIS) << " - " << getScore(TeamId::NEBULON) << ")"
              << std::endl;
}

void CaptureTheFlag::syncCarrierPosition(EntityID carrier, const glm::vec3& position) {
    if (auto carried = getCarriedFlag(carrier)) {
        FlagStates flags = flags_;
        flags[teamIndex(*carried)].position = position;
        flags_ = flags;
    }
}

// ============================================================================
// Base placement
// ============================================================================

CaptureTheFlag::BasePositions CaptureTheFlag::generateBasePositions(const ObjectiveConfig& config,
                                                                    std::mt19937& rng) {
    const float radius = config.arenaRadius;
    const float minRadius = radius * config.baseMinRadiusFactor;
    const float maxRadius = radius * config.baseMaxRadiusFactor;
    const float limit = radius - config.baseBoundaryMargin;

    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    // Each base draws its own distance, clamped inside the boundary margin
    auto drawDistance = [&]() {
        return std::min(minRadius + unit(rng) * std::max(0.0f, maxRadius - minRadius), limit);
    };

    const float angle = unit(rng) * glm::two_pi<float>();
    const float distance = drawDistance();
    const float oppositeDistance = drawDistance();

    const glm::vec3 first(std::cos(angle) * distance, 0.0f, std::sin(angle) * distance);
    const glm::vec3 second(std::cos(angle + glm::pi<float>()) * oppositeDistance, 0.0f,
                           std::sin(angle + glm::pi<float>()) * oppositeDistance);

    BasePositions bases{first, second};
    if (unit(rng) < 0.5f) {
        std::swap(bases[0], bases[1]);
    }

    if (!validateBasePositions(bases, config)) {
        std::cerr << "[CTF] Generated base positions failed validation, using fallback pair"
                  << std::endl;
        return fallbackBasePositions(config);
    }
    return bases;
}

bool CaptureTheFlag::validateBasePositions(const BasePositions& bases,
                                           const ObjectiveConfig& config) {
    constexpr float TOLERANCE = 0.01f;
    const float limit = config.arenaRadius - config.baseBoundaryMargin + TOLERANCE;

    for (const glm::vec3& base : bases) {
        if (!std::isfinite(base.x) || !std::isfinite(base.y) || !std::isfinite(base.z)) {
            return false;
        }
        if (glm::length(glm::vec2(base.x, base.z)) > limit) {
            return false;
        }
    }

    // Opposite sides of the centre
    const glm::vec2 a(bases[0].x, bases[0].z);
    const glm::vec2 b(bases[1].x, bases[1].z);
    if (glm::length(a) < TOLERANCE || glm::length(b) < TOLERANCE) {
        return false;
    }
    return glm::dot(glm::normalize(a), glm::normalize(b)) < -0.99f;
}

CaptureTheFlag::BasePositions CaptureTheFlag::fallbackBasePositions(const ObjectiveConfig& config) {
    const float offset = config.arenaRadius * config.fallbackRadiusFactor;
    return BasePositions{glm::vec3(offset, 0.0f, 0.0f), glm::vec3(-offset, 0.0f, 0.0f)};
}

} // namespace SkyClash
