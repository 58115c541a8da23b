#pragma once

#include "ecs/CoreTypes.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <glm/glm.hpp>

// [CTF_AGENT] Two-team capture-the-flag state machine
// Every transition is idempotent: a second touch on a carried flag, or a
// second capture in the same physics step, is rejected with NONE.

namespace SkyClash {

enum class FlagStatus : uint8_t {
    AT_BASE = 0,
    CARRIED = 1,
    DROPPED = 2
};

struct FlagState {
    TeamId team{TeamId::SOLARIS};
    FlagStatus status{FlagStatus::AT_BASE};
    glm::vec3 position{0.0f};
    EntityID carrier{entt::null};   // Set iff status == CARRIED
};

enum class ObjectiveResult : uint8_t {
    NONE = 0,
    PICKED_UP,
    RETURNED,
    CAPTURED,
    DROPPED
};

// [CTF_AGENT] Objective configuration
struct ObjectiveConfig {
    float arenaRadius = Constants::ARENA_RADIUS;
    float baseMinRadiusFactor = Constants::BASE_MIN_RADIUS_FACTOR;
    float baseMaxRadiusFactor = Constants::BASE_MAX_RADIUS_FACTOR;
    float baseBoundaryMargin = Constants::BASE_BOUNDARY_MARGIN;
    float fallbackRadiusFactor = Constants::BASE_FALLBACK_RADIUS_FACTOR;
    float baseZoneRadius = Constants::BASE_ZONE_RADIUS;
    float flagZoneRadius = Constants::FLAG_ZONE_RADIUS;
    float zoneHeight = Constants::ZONE_HEIGHT;
};

class CaptureTheFlag {
public:
    using BasePositions = std::array<glm::vec3, SharedConstants::TEAM_COUNT>;
    using FlagStates = std::array<FlagState, SharedConstants::TEAM_COUNT>;
    using Scores = std::array<uint32_t, SharedConstants::TEAM_COUNT>;

public:
    CaptureTheFlag(const ObjectiveConfig& config, std::mt19937& rng);

    // New random bases, both flags home, scores zeroed. Team membership is kept.
    void resetMatch();

    // Team with the fewest members, ties in SOLARIS, NEBULON order.
    // Returns the existing team for an already assigned player.
    TeamId assignPlayer(EntityID player);

    // Releases a carried flag back to base, then forgets the player
    ObjectiveResult removePlayer(EntityID player);

    [[nodiscard]] std::optional<TeamId> getTeam(EntityID player) const;
    [[nodiscard]] size_t getTeamSize(TeamId team) const;
    [[nodiscard]] bool isRegistered(EntityID player) const { return members_.count(player) > 0; }

    // Player touched baseTeam's base zone
    ObjectiveResult handleBaseEntry(EntityID player, TeamId baseTeam);

    // Player touched flagTeam's flag: own team returns a dropped flag,
    // opposing team picks it up. Rejected while carried.
    ObjectiveResult tryPickupFlag(EntityID player, TeamId flagTeam);

    // Carrier lets go. With a position the flag lies there, without it goes home.
    ObjectiveResult dropFlag(EntityID player, std::optional<glm::vec3> position);

    // Point without a capture. Bases still relocate; only flags at base follow.
    void manualScore(TeamId team);

    // Keeps a carried flag's position on its carrier
    void syncCarrierPosition(EntityID carrier, const glm::vec3& position);

    [[nodiscard]] const FlagState& getFlag(TeamId team) const { return flags_[teamIndex(team)]; }
    [[nodiscard]] const FlagStates& getFlags() const { return flags_; }
    [[nodiscard]] uint32_t getScore(TeamId team) const { return scores_[teamIndex(team)]; }
    [[nodiscard]] const Scores& getScores() const { return scores_; }
    [[nodiscard]] const glm::vec3& getBasePosition(TeamId team) const { return bases_[teamIndex(team)]; }
    [[nodiscard]] const BasePositions& getBasePositions() const { return bases_; }
    [[nodiscard]] std::optional<TeamId> getCarriedFlag(EntityID carrier) const;
    [[nodiscard]] const ObjectiveConfig& getConfig() const { return config_; }

    // Random pair on opposite sides of the centre; falls back when invalid
    [[nodiscard]] static BasePositions generateBasePositions(const ObjectiveConfig& config,
                                                             std::mt19937& rng);
    [[nodiscard]] static bool validateBasePositions(const BasePositions& bases,
                                                    const ObjectiveConfig& config);
    [[nodiscard]] static BasePositions fallbackBasePositions(const ObjectiveConfig& config);

private:
    [[nodiscard]] FlagState homeFlag(TeamId team) const;

    ObjectiveConfig config_;
    std::mt19937& rng_;
    std::map<EntityID, TeamId> members_;
    BasePositions bases_{};
    FlagStates flags_{};
    Scores scores_{};
};

} // namespace SkyClash
