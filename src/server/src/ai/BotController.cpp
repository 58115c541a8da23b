// [AI_AGENT] Wander-and-shoot bot implementation

#include "ai/BotController.hpp"
#include <algorithm>
#include <glm/gtc/quaternion.hpp>

namespace SkyClash {

BotController::BotController(const BotConfig& config)
    : config_(config)
    , reachability_(config.reachability) {}

void BotController::setWanderTarget(const glm::vec3& target, uint32_t nextChangeMs) {
    wanderTarget_ = target;
    nextTargetChangeMs_ = nextChangeMs;
}

void BotController::rollWanderTarget(uint32_t currentTimeMs, std::mt19937& rng) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    glm::vec3 target;
    target.x = (unit(rng) - 0.5f) * 2.0f * config_.wanderExtent;
    target.z = (unit(rng) - 0.5f) * 2.0f * config_.wanderExtent;
    target.y = config_.wanderMinHeight + unit(rng) * (config_.wanderMaxHeight - config_.wanderMinHeight);

    const float interval = config_.targetMinInterval
        + unit(rng) * (config_.targetMaxInterval - config_.targetMinInterval);
    setWanderTarget(target, currentTimeMs + static_cast<uint32_t>(interval * 1000.0f));
}

glm::vec2 BotController::steerTowards(const glm::vec3& position, const glm::quat& rotation,
                                      const glm::vec3& target) const {
    const glm::vec3 toTarget = target - position;
    const float distance = glm::length(toTarget);
    if (distance < 1e-4f) {
        return glm::vec2(0.0f);
    }

    // Local frame: -Z is ahead, +X is starboard
    const glm::vec3 local = glm::inverse(rotation) * toTarget;

    const float turn = std::clamp(local.x / distance * config_.turnGain, -1.0f, 1.0f);
    const float thrust = local.z < 0.0f ? 1.0f : config_.reverseThrust;
    return glm::vec2(turn, thrust);
}

ControllerInput BotController::update(const GameContext& context, uint32_t currentTimeMs,
                                      std::mt19937& rng) {
    ControllerInput input;
    input.timestampMs = currentTimeMs;
    steerTarget_.reset();

    const auto self = context.getSelf();
    if (!self || self->isDead) {
        return input;
    }

    if (!wanderTarget_ || currentTimeMs > nextTargetChangeMs_) {
        rollWanderTarget(currentTimeMs, rng);
    }

    glm::vec3 target = *wanderTarget_;
    if (!reachability_.isReachable(self->position, target)) {
        if (auto pad = reachability_.findJumpPadForTarget(self->position, target,
                                                          context.getJumpPads())) {
            target = pad->position;
        }
    }
    steerTarget_ = target;
    input.vector = steerTowards(self->position, self->rotation, target);

    const uint32_t fireIntervalMs = static_cast<uint32_t>(config_.fireInterval * 1000.0f);
    if (currentTimeMs - lastFireMs_ > fireIntervalMs) {
        std::uniform_real_distribution<float> unit(0.0f, 1.0f);
        if (unit(rng) < config_.fireChance) {
            input.action = true;
            lastFireMs_ = currentTimeMs;
        }
    }

    if (config_.useAbilities && self->heldAbility && !self->abilityActivated) {
        input.ability = true;
    }

    return input;
}

} // namespace SkyClash
