// [AI_AGENT] Reachability checker tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ai/ReachabilityChecker.hpp"
#include <vector>

using namespace SkyClash;
using Catch::Approx;

namespace {

JumpPad makePad(uint32_t id, const glm::vec3& position, float launchVelocity = Constants::JUMP_PAD_FORCE) {
    JumpPad pad;
    pad.id = id;
    pad.position = position;
    pad.launchVelocity = launchVelocity;
    return pad;
}

} // namespace

TEST_CASE("Reachability by height", "[ai][reachability]") {
    ReachabilityChecker checker;
    const glm::vec3 hovering(0.0f, Constants::HOVER_HEIGHT, 0.0f);

    SECTION("Small climbs are reachable") {
        REQUIRE(checker.isReachable(hovering, glm::vec3(50.0f, 13.0f, 0.0f)));
        REQUIRE(checker.isReachable(hovering, glm::vec3(50.0f, 0.0f, 0.0f)));
    }

    SECTION("Tall targets are not reachable from the hover band") {
        REQUIRE_FALSE(checker.isReachable(hovering, glm::vec3(50.0f, 25.0f, 0.0f)));
    }

    SECTION("Flying ships can reach anything at or below them") {
        const glm::vec3 flying(0.0f, 40.0f, 0.0f);
        REQUIRE(checker.isReachable(flying, glm::vec3(10.0f, 40.0f, 0.0f)));
        REQUIRE(checker.isReachable(flying, glm::vec3(10.0f, 30.0f, 0.0f)));
        REQUIRE_FALSE(checker.isReachable(glm::vec3(0.0f, 10.0f, 0.0f), glm::vec3(0.0f, 30.0f, 0.0f)));
    }
}

TEST_CASE("Jump pad apex", "[ai][reachability]") {
    ReachabilityChecker checker;

    // v^2 / (2g) + base
    REQUIRE(checker.estimateMaxHeight(30.0f, 0.0f) == Approx(30.0f));
    REQUIRE(checker.estimateMaxHeight(30.0f, 2.0f) == Approx(32.0f));
    REQUIRE(checker.estimateMaxHeight(0.0f, 4.0f) == Approx(4.0f));

    const JumpPad pad = makePad(1, glm::vec3(0.0f), 30.0f);
    REQUIRE(checker.canPadReach(pad, 25.0f));       // 30 >= 25 + 5
    REQUIRE_FALSE(checker.canPadReach(pad, 25.5f));
}

TEST_CASE("Jump pad selection", "[ai][reachability]") {
    ReachabilityChecker checker;
    const glm::vec3 from(0.0f, Constants::HOVER_HEIGHT, 0.0f);
    const glm::vec3 target(100.0f, 15.0f, 0.0f);

    SECTION("No pads") {
        REQUIRE_FALSE(checker.findJumpPadForTarget(from, target, {}).has_value());
    }

    SECTION("Shortest detour wins") {
        const std::vector<JumpPad> pads{
            makePad(1, glm::vec3(-60.0f, 0.0f, 0.0f)),
            makePad(2, glm::vec3(60.0f, 0.0f, 0.0f)),
            makePad(3, glm::vec3(0.0f, 0.0f, 60.0f))
        };
        auto pad = checker.findJumpPadForTarget(from, target, pads);
        REQUIRE(pad.has_value());
        REQUIRE(pad->id == 2);
    }

    SECTION("Pads too weak for the target are skipped") {
        const std::vector<JumpPad> pads{
            makePad(1, glm::vec3(60.0f, 0.0f, 0.0f), 5.0f),
            makePad(2, glm::vec3(-60.0f, 0.0f, 0.0f))
        };
        auto pad = checker.findJumpPadForTarget(from, target, pads);
        REQUIRE(pad.has_value());
        REQUIRE(pad->id == 2);

        REQUIRE_FALSE(checker.findJumpPadForTarget(from, glm::vec3(0.0f, 40.0f, 0.0f), pads).has_value());
    }
}

TEST_CASE("Reachability honours configuration", "[ai][reachability]") {
    ReachabilityConfig config;
    config.threshold = 30.0f;
    config.maxGravity = 0.0f;
    ReachabilityChecker checker(config);

    REQUIRE(checker.isReachable(glm::vec3(0.0f, 5.0f, 0.0f), glm::vec3(0.0f, 30.0f, 0.0f)));
    // Without gravity every pad reaches any height
    REQUIRE(checker.canPadReach(makePad(1, glm::vec3(0.0f), 1.0f), 1000.0f));
}
