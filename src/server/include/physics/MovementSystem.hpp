#pragma once

#include "ecs/CoreTypes.hpp"
#include "physics/PhysicsBackend.hpp"
#include <cstdint>

// [PHYSICS_AGENT] Ship movement integrator
// Turns smoothed controller input into bounded linear and angular velocity.
// Positions are integrated by the physics backend, never here.

namespace SkyClash {

// [PHYSICS_AGENT] Movement tuning
struct MovementConfig {
    // Forward axis
    float maxSpeed = Constants::PLAYER_MAX_SPEED;
    float acceleration = Constants::PLAYER_ACCELERATION;
    float deceleration = Constants::PLAYER_DECELERATION;
    float maxVelocityChangePerFrame = Constants::MAX_VELOCITY_CHANGE_PER_FRAME;
    float lateralDamping = Constants::LATERAL_DAMPING;

    // Yaw and pitch
    float maxAngularVelocity = Constants::PLAYER_MAX_ANGULAR_VELOCITY;
    float angularAcceleration = Constants::PLAYER_ANGULAR_ACCELERATION;
    float maxAngularChangePerFrame = Constants::MAX_ANGULAR_VELOCITY_CHANGE_PER_FRAME;
    float inputSmoothTime = Constants::PLAYER_INPUT_SMOOTH_TIME;

    // Hover and flight
    float hoverHeight = Constants::HOVER_HEIGHT;
    float airModeThreshold = Constants::AIR_MODE_THRESHOLD;
    float hoverRestoreForce = Constants::HOVER_RESTORE_FORCE;
    float baseGravity = Constants::BASE_GRAVITY;
    float maxDiveGravity = Constants::MAX_DIVE_GRAVITY;
    float maxLift = Constants::MAX_LIFT;
    float maxPitch = Constants::MAX_PITCH_ANGLE;
    float minVerticalVelocity = Constants::MIN_VERTICAL_VELOCITY;
    float maxVerticalVelocity = Constants::MAX_VERTICAL_VELOCITY;
    float launchVelocityThreshold = Constants::LAUNCH_VELOCITY_THRESHOLD;
    bool airAutoThrust = true;
};

class MovementSystem {
public:
    struct MovementResult {
        glm::vec3 linearVelocity{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
        float forwardSpeed{0.0f};
        bool airborne{false};
    };

public:
    explicit MovementSystem(const MovementConfig& config = MovementConfig{});

    // Processes every living ship with ShipMotion + ControllerInput + PlayerStats.
    // Ships without a physics body are skipped and picked up again next tick.
    void update(Registry& registry, PhysicsBackend& physics, float dt);

    // Pure per-ship step; mutates motion state and returns what to write back
    MovementResult applyInput(ShipMotion& motion, const ControllerInput& input,
                              const BodyState& body, const PlayerStats& stats, float dt) const;

    // alpha = 1 - e^(-dt/tau)
    [[nodiscard]] static float smoothingAlpha(float dt, float tau);

    // One tick of forward speed towards target, acceleration or deceleration limited
    [[nodiscard]] float stepForwardSpeed(float current, float target, float dt,
                                         float accelerationMultiplier = 1.0f) const;

    // One tick of angular velocity towards target
    [[nodiscard]] float stepAngularVelocity(float current, float target, float dt) const;

    [[nodiscard]] bool isAirborne(float height) const {
        return height > config_.hoverHeight + config_.airModeThreshold;
    }

    // Vertical velocity after hover spring or air gravity for this tick
    [[nodiscard]] float computeVerticalVelocity(float height, float verticalVelocity,
                                                float pitch, bool airborne, float dt) const;

    // Resets integrator state, e.g. on respawn
    static void resetMotion(ShipMotion& motion, float yaw = 0.0f);

    [[nodiscard]] const MovementConfig& getConfig() const { return config_; }
    void setConfig(const MovementConfig& config) { config_ = config; }

private:
    [[nodiscard]] float targetPitchVelocity(const ShipMotion& motion, float height,
                                            float verticalVelocity, float forwardSpeed,
                                            bool airborne) const;

    MovementConfig config_;
};

} // namespace SkyClash
