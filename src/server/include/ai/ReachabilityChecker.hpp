#pragma once

#include "ecs/CoreTypes.hpp"
#include <optional>
#include <vector>
#include <glm/glm.hpp>

// [AI_AGENT] Height reachability for hovering ships
// A ship can climb only a limited height on its own; taller targets need a
// jump pad whose ballistic apex clears the target with a safety margin.

namespace SkyClash {

struct ReachabilityConfig {
    float threshold = Constants::REACHABILITY_THRESHOLD;      // Max climb without help
    float maxGravity = Constants::REACHABILITY_MAX_GRAVITY;
    float safetyMargin = Constants::REACHABILITY_SAFETY_MARGIN;
    float airborneHeight = Constants::HOVER_HEIGHT + Constants::AIR_MODE_THRESHOLD;
};

class ReachabilityChecker {
public:
    explicit ReachabilityChecker(const ReachabilityConfig& config = ReachabilityConfig{});

    // Reachable when the climb is small, or when already flying at or above the target
    [[nodiscard]] bool isReachable(const glm::vec3& from, const glm::vec3& to) const;

    // Apex of a launch with the given vertical speed from baseHeight
    [[nodiscard]] float estimateMaxHeight(float launchSpeed, float baseHeight) const;

    [[nodiscard]] bool canPadReach(const JumpPad& pad, float targetHeight) const;

    // Pad able to lift a ship to the target, minimising the mean of the
    // bot-to-pad and pad-to-target distances. Empty if none qualifies.
    [[nodiscard]] std::optional<JumpPad> findJumpPadForTarget(
        const glm::vec3& from, const glm::vec3& to, const std::vector<JumpPad>& pads) const;

    [[nodiscard]] const ReachabilityConfig& getConfig() const { return config_; }

private:
    ReachabilityConfig config_;
};

} // namespace SkyClash
