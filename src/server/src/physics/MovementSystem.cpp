// [PHYSICS_AGENT] Ship movement integrator implementation

#include "physics/MovementSystem.hpp"
#include <algorithm>
#include <cmath>
#include <glm/gtc/constants.hpp>

namespace SkyClash {

MovementSystem::MovementSystem(const MovementConfig& config) : config_(config) {}

void MovementSystem::update(Registry& registry, PhysicsBackend& physics, float dt) {
    if (dt <= 0.0f) {
        return;
    }

    auto view = registry.view<ShipMotion, ControllerInput, PlayerStats, HealthState>();
    view.each([&](EntityID entity, ShipMotion& motion, const ControllerInput& input,
                  const PlayerStats& stats, const HealthState& health) {
        if (health.isDead) {
            return;
        }
        auto body = physics.getBodyState(entity);
        if (!body) {
            return;
        }

        const MovementResult result = applyInput(motion, input, *body, stats, dt);
        physics.setLinearVelocity(entity, result.linearVelocity);
        physics.setRotation(entity, result.rotation);
        physics.setAngularVelocity(entity, glm::vec3(0.0f));
    });
}

MovementSystem::MovementResult MovementSystem::applyInput(ShipMotion& motion,
                                                          const ControllerInput& input,
                                                          const BodyState& body,
                                                          const PlayerStats& stats,
                                                          float dt) const {
    MovementResult result;
    const ControllerInput in = input.clamped();

    // 1. Input smoothing
    const float alpha = smoothingAlpha(dt, config_.inputSmoothTime);
    motion.smoothedInput += (in.vector - motion.smoothedInput) * alpha;

    const float height = body.position.y;
    result.airborne = isAirborne(height);

    float thrust = motion.smoothedInput.y;
    if (result.airborne && config_.airAutoThrust) {
        thrust = 1.0f;
    }

    // 2. Forward speed, lateral drift removed
    const glm::vec3 forward = motion.flatForward();
    const glm::vec3 horizontal(body.linearVelocity.x, 0.0f, body.linearVelocity.z);
    const float currentSpeed = glm::dot(horizontal, forward);
    const glm::vec3 lateral = horizontal - forward * currentSpeed;

    const float targetSpeed = thrust * config_.maxSpeed * stats.speedMultiplier;
    const float newSpeed = stepForwardSpeed(currentSpeed, targetSpeed, dt,
                                            stats.accelerationMultiplier);
    const float lateralKeep = 1.0f - std::clamp(config_.lateralDamping, 0.0f, 1.0f);

    glm::vec3 velocity = forward * newSpeed + lateral * lateralKeep;
    result.forwardSpeed = newSpeed;

    // 3. Yaw (positive turn input steers right, i.e. negative yaw rate)
    const float targetYawVelocity = -motion.smoothedInput.x * config_.maxAngularVelocity;
    motion.yawVelocity = stepAngularVelocity(motion.yawVelocity, targetYawVelocity, dt);
    motion.yaw = std::remainder(motion.yaw + motion.yawVelocity * dt, glm::two_pi<float>());

    // 4. Pitch follows the flight path in the air and levels out on the ground
    const float targetPitch = targetPitchVelocity(motion, height, body.linearVelocity.y,
                                                  currentSpeed, result.airborne);
    motion.pitchVelocity = stepAngularVelocity(motion.pitchVelocity, targetPitch, dt);
    if (result.airborne) {
        motion.pitch = std::clamp(motion.pitch + motion.pitchVelocity * dt,
                                  -config_.maxPitch, config_.maxPitch);
    } else {
        const float reset = Constants::PITCH_RESET_SPEED * dt;
        if (std::abs(motion.pitch) <= reset) {
            motion.pitch = 0.0f;
        } else {
            motion.pitch -= motion.pitch > 0.0f ? reset : -reset;
        }
    }

    // 5. Vertical
    velocity.y = computeVerticalVelocity(height, body.linearVelocity.y, motion.pitch,
                                         result.airborne, dt);

    result.linearVelocity = velocity;
    result.rotation = motion.rotation();
    return result;
}

float MovementSystem::smoothingAlpha(float dt, float tau) {
    if (tau <= 0.0f) {
        return 1.0f;
    }
    return 1.0f - std::exp(-dt / tau);
}

float MovementSystem::stepForwardSpeed(float current, float target, float dt,
                                       float accelerationMultiplier) const {
    const float diff = target - current;

    // Reversing direction always counts as accelerating
    const bool accelerating = std::abs(target) > std::abs(current) || target * current < 0.0f;
    const float rate = accelerating ? config_.acceleration * accelerationMultiplier
                                    : config_.deceleration;
    const float maxChange = std::min(rate * dt, config_.maxVelocityChangePerFrame);

    if (std::abs(diff) <= maxChange) {
        return target;
    }
    return current + (diff > 0.0f ? maxChange : -maxChange);
}

float MovementSystem::stepAngularVelocity(float current, float target, float dt) const {
    const float diff = target - current;
    const float maxChange = std::min(config_.angularAcceleration * dt,
                                     config_.maxAngularChangePerFrame);
    if (std::abs(diff) <= maxChange) {
        return target;
    }
    return current + (diff > 0.0f ? maxChange : -maxChange);
}

float MovementSystem::computeVerticalVelocity(float height, float verticalVelocity,
                                              float pitch, bool airborne, float dt) const {
    // Jump pad launch: leave it to the backend
    if (verticalVelocity > config_.launchVelocityThreshold) {
        return verticalVelocity;
    }

    if (airborne) {
        const float pitchNorm = config_.maxPitch > 0.0f ? pitch / config_.maxPitch : 0.0f;
        float gravity = config_.baseGravity;
        if (pitchNorm < 0.0f) {
            gravity -= pitchNorm * config_.maxDiveGravity;
        } else {
            gravity += pitchNorm * config_.maxLift;
        }
        return std::clamp(verticalVelocity + gravity * dt,
                          config_.minVerticalVelocity, config_.maxVerticalVelocity);
    }

    // Hover spring
    const float diff = height - config_.hoverHeight;
    if (std::abs(diff) <= 0.01f) {
        return 0.0f;
    }
    float corrected = std::clamp(verticalVelocity - diff * config_.hoverRestoreForce * dt,
                                 -Constants::HOVER_MAX_CORRECTION,
                                 Constants::HOVER_MAX_CORRECTION);
    if (diff < 0.0f) {
        corrected = std::max(corrected, 0.0f);
    }
    return corrected;
}

float MovementSystem::targetPitchVelocity(const ShipMotion& motion, float height,
                                          float verticalVelocity, float forwardSpeed,
                                          bool airborne) const {
    if (!airborne) {
        return 0.0f;
    }

    const float safeSpeed = std::max(std::abs(forwardSpeed), 1.0f);
    float targetAngle = std::atan2(verticalVelocity, safeSpeed) * Constants::PITCH_AMPLIFIER;
    targetAngle = std::clamp(targetAngle, -config_.maxPitch, config_.maxPitch);

    // Landing assist
    const float aboveHover = height - config_.hoverHeight;
    if (aboveHover <= Constants::LEVELING_COMPLETE_HEIGHT) {
        targetAngle = 0.0f;
    } else if (aboveHover <= Constants::LEVELING_START_HEIGHT) {
        const float t = (aboveHover - Constants::LEVELING_COMPLETE_HEIGHT) /
                        (Constants::LEVELING_START_HEIGHT - Constants::LEVELING_COMPLETE_HEIGHT);
        targetAngle *= t * t * (3.0f - 2.0f * t);
    }

    return std::clamp((targetAngle - motion.pitch) * Constants::PITCH_RESPONSE,
                      -config_.maxAngularVelocity, config_.maxAngularVelocity);
}

void MovementSystem::resetMotion(ShipMotion& motion, float yaw) {
    motion = ShipMotion{};
    motion.yaw = yaw;
}

} // namespace SkyClash
