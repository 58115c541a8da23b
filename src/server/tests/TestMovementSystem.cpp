// [PHYSICS_AGENT] Movement integrator unit tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "physics/KinematicPhysicsWorld.hpp"
#include "physics/MovementSystem.hpp"
#include <algorithm>
#include <cmath>
#include <glm/glm.hpp>

using namespace SkyClash;
using Catch::Approx;

namespace {

constexpr float DT = 1.0f / 60.0f;

// Hovering ship at rest, facing -Z
BodyState hoveringBody() {
    BodyState body;
    body.position = glm::vec3(0.0f, Constants::HOVER_HEIGHT, 0.0f);
    return body;
}

ControllerInput thrustInput(float turn, float thrust) {
    ControllerInput input;
    input.vector = glm::vec2(turn, thrust);
    return input;
}

// Runs n ticks feeding the result back as the next body state
MovementSystem::MovementResult run(const MovementSystem& movement, ShipMotion& motion,
                                   BodyState& body, const ControllerInput& input,
                                   const PlayerStats& stats, int ticks) {
    MovementSystem::MovementResult result;
    for (int i = 0; i < ticks; ++i) {
        result = movement.applyInput(motion, input, body, stats, DT);
        body.linearVelocity = result.linearVelocity;
        body.rotation = result.rotation;
    }
    return result;
}

} // namespace

TEST_CASE("MovementSystem forward speed", "[movement]") {
    MovementConfig config;
    config.inputSmoothTime = 0.0f;  // Raw input, isolates the acceleration limit
    MovementSystem movement(config);
    PlayerStats stats;

    SECTION("Thrust shorter than time to max speed follows accel * T") {
        ShipMotion motion;
        BodyState body = hoveringBody();

        const float T = 0.25f;
        const int ticks = static_cast<int>(std::lround(T / DT));
        auto result = run(movement, motion, body, thrustInput(0.0f, 1.0f), stats, ticks);

        const float expected = std::min(config.maxSpeed, config.acceleration * T);
        REQUIRE(result.forwardSpeed == Approx(expected).margin(0.05f));
        // Facing -Z
        REQUIRE(result.linearVelocity.z < 0.0f);
        REQUIRE(std::abs(result.linearVelocity.x) < 1e-3f);
    }

    SECTION("Speed never exceeds max") {
        ShipMotion motion;
        BodyState body = hoveringBody();

        float peak = 0.0f;
        for (int i = 0; i < 180; ++i) {
            auto result = run(movement, motion, body, thrustInput(0.0f, 1.0f), stats, 1);
            peak = std::max(peak, result.forwardSpeed);
        }
        REQUIRE(peak <= config.maxSpeed + 1e-4f);
        REQUIRE(peak == Approx(config.maxSpeed));
    }

    SECTION("Speed multiplier raises the cap") {
        ShipMotion motion;
        BodyState body = hoveringBody();
        PlayerStats boosted;
        boosted.speedMultiplier = 1.5f;

        auto result = run(movement, motion, body, thrustInput(0.0f, 1.0f), boosted, 240);
        REQUIRE(result.forwardSpeed == Approx(config.maxSpeed * 1.5f));
    }

    SECTION("Releasing thrust decelerates to a stop") {
        ShipMotion motion;
        BodyState body = hoveringBody();
        run(movement, motion, body, thrustInput(0.0f, 1.0f), stats, 120);

        auto result = run(movement, motion, body, thrustInput(0.0f, 0.0f), stats, 120);
        REQUIRE(result.forwardSpeed == Approx(0.0f).margin(1e-4f));
    }

    SECTION("Per-frame change is bounded") {
        REQUIRE(movement.stepForwardSpeed(0.0f, 35.0f, 1.0f) == Approx(config.maxVelocityChangePerFrame));
        REQUIRE(movement.stepForwardSpeed(10.0f, 0.0f, DT) == Approx(10.0f - config.deceleration * DT));
        REQUIRE(movement.stepForwardSpeed(5.0f, 5.5f, DT) == Approx(5.5f));
    }
}

TEST_CASE("MovementSystem steering", "[movement]") {
    MovementSystem movement;
    PlayerStats stats;

    SECTION("Positive turn steers right") {
        ShipMotion motion;
        BodyState body = hoveringBody();
        run(movement, motion, body, thrustInput(1.0f, 0.0f), stats, 30);

        REQUIRE(motion.yawVelocity < 0.0f);
        // Forward rotated towards +X
        REQUIRE(motion.flatForward().x > 0.0f);
    }

    SECTION("Yaw rate is bounded") {
        ShipMotion motion;
        BodyState body = hoveringBody();
        run(movement, motion, body, thrustInput(-1.0f, 0.0f), stats, 300);

        REQUIRE(std::abs(motion.yawVelocity) <= movement.getConfig().maxAngularVelocity + 1e-4f);
    }

    SECTION("Lateral drift is removed") {
        ShipMotion motion;
        BodyState body = hoveringBody();
        body.linearVelocity = glm::vec3(10.0f, 0.0f, 0.0f);  // Sideways

        auto result = movement.applyInput(motion, thrustInput(0.0f, 0.0f), body, stats, DT);
        REQUIRE(std::abs(result.linearVelocity.x) < 1e-4f);
    }
}

TEST_CASE("MovementSystem input smoothing", "[movement]") {
    REQUIRE(MovementSystem::smoothingAlpha(DT, 0.0f) == 1.0f);

    const float alpha = MovementSystem::smoothingAlpha(DT, Constants::PLAYER_INPUT_SMOOTH_TIME);
    REQUIRE(alpha > 0.0f);
    REQUIRE(alpha < 1.0f);
    REQUIRE(alpha == Approx(1.0f - std::exp(-DT / Constants::PLAYER_INPUT_SMOOTH_TIME)));

    MovementSystem movement;
    ShipMotion motion;
    BodyState body = hoveringBody();
    movement.applyInput(motion, thrustInput(0.0f, 1.0f), body, PlayerStats{}, DT);
    REQUIRE(motion.smoothedInput.y == Approx(alpha));
}

TEST_CASE("MovementSystem vertical physics", "[movement]") {
    MovementSystem movement;

    SECTION("Hover spring pushes a low ship up") {
        const float vy = movement.computeVerticalVelocity(3.0f, 0.0f, 0.0f, false, DT);
        REQUIRE(vy > 0.0f);
    }

    SECTION("Ship at hover height is held") {
        REQUIRE(movement.computeVerticalVelocity(Constants::HOVER_HEIGHT, 0.0f, 0.0f, false, DT) == 0.0f);
    }

    SECTION("Airborne ship falls under gravity") {
        REQUIRE(movement.isAirborne(20.0f));
        REQUIRE_FALSE(movement.isAirborne(Constants::HOVER_HEIGHT));

        const float vy = movement.computeVerticalVelocity(20.0f, 0.0f, 0.0f, true, DT);
        REQUIRE(vy == Approx(Constants::BASE_GRAVITY * DT));
    }

    SECTION("Nose down dives faster") {
        const float level = movement.computeVerticalVelocity(20.0f, 0.0f, 0.0f, true, DT);
        const float dive = movement.computeVerticalVelocity(20.0f, 0.0f, -Constants::MAX_PITCH_ANGLE, true, DT);
        REQUIRE(dive < level);
    }

    SECTION("Launch velocity is left alone") {
        REQUIRE(movement.computeVerticalVelocity(5.0f, 25.0f, 0.0f, false, DT) == 25.0f);
    }

    SECTION("Terminal velocity clamps") {
        const float vy = movement.computeVerticalVelocity(50.0f, -100.0f, 0.0f, true, DT);
        REQUIRE(vy == Approx(Constants::MIN_VERTICAL_VELOCITY));
    }
}

TEST_CASE("MovementSystem registry update", "[movement]") {
    Registry registry;
    KinematicPhysicsWorld physics;
    MovementSystem movement;

    const EntityID ship = registry.create();
    registry.emplace<ShipMotion>(ship);
    registry.emplace<PlayerStats>(ship);
    registry.emplace<HealthState>(ship);
    ControllerInput input;
    input.vector = glm::vec2(0.0f, 1.0f);
    registry.emplace<ControllerInput>(ship, input);

    SECTION("Ship without a body is skipped") {
        movement.update(registry, physics, DT);
        REQUIRE(registry.get<ShipMotion>(ship).smoothedInput.y == 0.0f);
    }

    SECTION("Living ship gets velocity written back") {
        BodyDesc desc;
        desc.position = glm::vec3(0.0f, Constants::HOVER_HEIGHT, 0.0f);
        physics.createBody(ship, desc);

        for (int i = 0; i < 30; ++i) {
            movement.update(registry, physics, DT);
            physics.step(DT);
        }
        auto body = physics.getBodyState(ship);
        REQUIRE(body);
        REQUIRE(body->linearVelocity.z < 0.0f);
        REQUIRE(body->position.z < 0.0f);
    }

    SECTION("Dead ship is frozen") {
        BodyDesc desc;
        desc.position = glm::vec3(0.0f, Constants::HOVER_HEIGHT, 0.0f);
        physics.createBody(ship, desc);
        registry.get<HealthState>(ship).isDead = true;

        movement.update(registry, physics, DT);
        REQUIRE(physics.getBodyState(ship)->linearVelocity == glm::vec3(0.0f));
    }
}
