#pragma once

#include "ai/GameContext.hpp"
#include "ai/ReachabilityChecker.hpp"
#include "ecs/CoreTypes.hpp"
#include <cstdint>
#include <optional>
#include <random>

// [AI_AGENT] Wander-and-shoot bot
// Produces the same ControllerInput a handheld controller sends, so the
// simulation consumes bot and human input through one path.

namespace SkyClash {

// [AI_AGENT] Bot tuning
struct BotConfig {
    float wanderExtent = Constants::BOT_WANDER_EXTENT;        // x,z in [-extent, extent]
    float wanderMinHeight = Constants::BOT_WANDER_MIN_HEIGHT;
    float wanderMaxHeight = Constants::BOT_WANDER_MAX_HEIGHT;
    float targetMinInterval = Constants::BOT_TARGET_MIN_INTERVAL;
    float targetMaxInterval = Constants::BOT_TARGET_MAX_INTERVAL;
    float turnGain = Constants::BOT_TURN_GAIN;
    float reverseThrust = Constants::BOT_REVERSE_THRUST;
    float fireInterval = Constants::BOT_FIRE_INTERVAL;
    float fireChance = Constants::BOT_FIRE_CHANCE;
    bool useAbilities = true;
    ReachabilityConfig reachability;
};

class BotController {
public:
    explicit BotController(const BotConfig& config = BotConfig{});

    // One decision. Zero input when the bot has no body, team or is dead.
    ControllerInput update(const GameContext& context, uint32_t currentTimeMs, std::mt19937& rng);

    // Steering towards a point from the given pose
    [[nodiscard]] glm::vec2 steerTowards(const glm::vec3& position, const glm::quat& rotation,
                                         const glm::vec3& target) const;

    [[nodiscard]] const std::optional<glm::vec3>& getWanderTarget() const { return wanderTarget_; }
    void setWanderTarget(const glm::vec3& target, uint32_t nextChangeMs);

    // Where the bot is steering this tick (wander target or a jump pad detour)
    [[nodiscard]] const std::optional<glm::vec3>& getSteerTarget() const { return steerTarget_; }

    [[nodiscard]] const BotConfig& getConfig() const { return config_; }

private:
    void rollWanderTarget(uint32_t currentTimeMs, std::mt19937& rng);

    BotConfig config_;
    ReachabilityChecker reachability_;
    std::optional<glm::vec3> wanderTarget_;
    std::optional<glm::vec3> steerTarget_;
    uint32_t nextTargetChangeMs_{0};
    uint32_t lastFireMs_{0};
};

} // namespace SkyClash
