// [AI_AGENT] Height reachability implementation

#include "ai/ReachabilityChecker.hpp"
#include <limits>

namespace SkyClash {

ReachabilityChecker::ReachabilityChecker(const ReachabilityConfig& config)
    : config_(config) {}

bool ReachabilityChecker::isReachable(const glm::vec3& from, const glm::vec3& to) const {
    const float heightDiff = to.y - from.y;
    if (heightDiff <= config_.threshold) {
        return true;
    }
    return from.y > config_.airborneHeight && from.y >= to.y;
}

float ReachabilityChecker::estimateMaxHeight(float launchSpeed, float baseHeight) const {
    if (config_.maxGravity <= 0.0f) {
        return std::numeric_limits<float>::max();
    }
    return (launchSpeed * launchSpeed) / (2.0f * config_.maxGravity) + baseHeight;
}

bool ReachabilityChecker::canPadReach(const JumpPad& pad, float targetHeight) const {
    return estimateMaxHeight(pad.launchVelocity, pad.position.y)
        >= targetHeight + config_.safetyMargin;
}

std::optional<JumpPad> ReachabilityChecker::findJumpPadForTarget(
    const glm::vec3& from, const glm::vec3& to, const std::vector<JumpPad>& pads) const {

    std::optional<JumpPad> best;
    float bestScore = std::numeric_limits<float>::max();

    for (const JumpPad& pad : pads) {
        if (!canPadReach(pad, to.y)) {
            continue;
        }
        const float score = (glm::distance(from, pad.position) + glm::distance(pad.position, to)) * 0.5f;
        if (score < bestScore) {
            bestScore = score;
            best = pad;
        }
    }
    return best;
}

} // namespace SkyClash
