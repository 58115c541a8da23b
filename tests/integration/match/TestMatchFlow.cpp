/**
 * SkyClash - Match Flow Integration Test
 * [TESTING_AGENT] Runs whole matches through ArenaSimulation
 *
 * This test suite validates:
 * - Bot-only matches stay consistent over minutes of play
 * - Flag state and scores agree with the emitted events
 * - Humans and bots share one arena through join, play and leave
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/benchmark/catch_benchmark.hpp>
#include "sim/ArenaSimulation.hpp"
#include <array>
#include <cmath>
#include <map>
#include <string>
#include <vector>

using namespace SkyClash;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

constexpr float DT = 1.0f / 60.0f;

class MatchFixture {
public:
    explicit MatchFixture(uint32_t seed = Constants::DEFAULT_SEED) {
        ArenaConfig config = ArenaConfig::defaults();
        config.seed = seed;
        arena = std::make_unique<ArenaSimulation>(config);
        arena->setOnEvent([this](const GameEvent& event) {
            ++eventCounts[event.type];
            if (event.type == GameEventType::FLAG_CAPTURED && event.team) {
                ++capturesByTeam[teamIndex(*event.team)];
            }
        });
    }

    void fillWithBots(int count) {
        for (int i = 0; i < count; ++i) {
            REQUIRE(arena->addBot() != entt::null);
        }
    }

    // Checks the world after every tick
    void runChecked(int ticks) {
        for (int i = 0; i < ticks; ++i) {
            arena->tick(DT);
            checkWorld();
        }
    }

    size_t count(GameEventType type) const {
        auto it = eventCounts.find(type);
        return it == eventCounts.end() ? 0 : it->second;
    }

    std::unique_ptr<ArenaSimulation> arena;
    std::map<GameEventType, size_t> eventCounts;
    std::array<uint32_t, SharedConstants::TEAM_COUNT> capturesByTeam{};

private:
    void checkWorld() {
        const Registry& registry = arena->getRegistry();
        const PhysicsBackend& physics = arena->getPhysics();
        const float wall = arena->getConfig().arenaRadius;

        auto players = registry.view<const PlayerTag, const HealthState>();
        for (EntityID player : players) {
            const HealthState& health = players.get<const HealthState>(player);
            REQUIRE(health.health >= 0);
            REQUIRE(health.health <= health.maxHealth);
            // Lethal hits are resolved at the start of the next tick
            if (health.isDead) {
                REQUIRE(health.health == 0);
            }
            REQUIRE(physics.isBodyEnabled(player) == !health.isDead);

            auto body = physics.getBodyState(player);
            REQUIRE(body.has_value());
            REQUIRE(std::isfinite(body->position.x));
            REQUIRE(std::isfinite(body->position.y));
            REQUIRE(std::isfinite(body->position.z));
            REQUIRE(body->position.y >= 0.0f);
            REQUIRE(glm::length(glm::vec2(body->position.x, body->position.z)) <= wall + 1e-2f);
        }

        std::map<EntityID, int> carried;
        for (TeamId team : ALL_TEAMS) {
            const FlagState& flag = arena->getFlags()[teamIndex(team)];
            if (flag.status == FlagStatus::CARRIED) {
                REQUIRE(registry.valid(flag.carrier));
                REQUIRE_FALSE(registry.get<HealthState>(flag.carrier).isDead);
                REQUIRE(arena->getObjective().getTeam(flag.carrier) == opposingTeam(team));
                ++carried[flag.carrier];
            } else {
                REQUIRE(flag.carrier == entt::null);
            }
            REQUIRE(arena->getScore(team) == capturesByTeam[teamIndex(team)]);
        }
        for (const auto& [carrier, flags] : carried) {
            REQUIRE(flags == 1);
        }

        REQUIRE(arena->getDecals().size() <= arena->getConfig().maxDecals);
        REQUIRE(arena->getPickupSpawner().getCount(registry) <= arena->getConfig().pickups.maxPickups);
    }
};

} // namespace

// ============================================================================
// Bot Matches
// ============================================================================

TEST_CASE("Four bots play a two minute match", "[integration][match]") {
    MatchFixture match;
    match.fillWithBots(4);
    REQUIRE(match.arena->getPlayerCount() == 4);

    match.runChecked(60 * 120);

    REQUIRE(match.arena->getCurrentTimeMs() == 120000);
    REQUIRE(match.count(GameEventType::PLAYER_JOINED) == 4);

    // Bots fire at random and pickups keep arriving
    REQUIRE(match.count(GameEventType::PROJECTILE_FIRED) > 0);
    REQUIRE(match.arena->getPickupSpawner().getCount(match.arena->getRegistry()) > 0);

    // Every death is followed by a respawn within the delay
    const size_t deaths = match.count(GameEventType::PLAYER_DIED);
    const size_t respawns = match.count(GameEventType::PLAYER_RESPAWNED);
    REQUIRE(respawns <= deaths);
    REQUIRE(deaths - respawns <= 4);
}

TEST_CASE("Matches replay exactly from a seed", "[integration][match]") {
    MatchFixture first(99);
    MatchFixture second(99);
    first.fillWithBots(3);
    second.fillWithBots(3);

    first.runChecked(60 * 20);
    second.runChecked(60 * 20);

    REQUIRE(first.eventCounts == second.eventCounts);

    auto a = first.arena->getRegistry().view<const PlayerTag, const PlayerInfo>();
    for (EntityID player : a) {
        const std::string& id = a.get<const PlayerInfo>(player).controllerId;
        const EntityID twin = second.arena->findPlayer(id);
        REQUIRE(twin != entt::null);
        REQUIRE(first.arena->getPhysics().getBodyState(player)->position ==
                second.arena->getPhysics().getBodyState(twin)->position);
    }
}

// ============================================================================
// Mixed Matches
// ============================================================================

TEST_CASE("Humans and bots share a match", "[integration][match]") {
    MatchFixture match(2024);
    const EntityID human = match.arena->addPlayer("phone-1", "Pilot");
    match.fillWithBots(3);
    const TeamId enemy = opposingTeam(*match.arena->getObjective().getTeam(human));

    // Fly straight for a few seconds, tapping the trigger
    for (uint32_t frame = 0; frame < 300; ++frame) {
        ControllerInput input;
        input.vector = glm::vec2(0.0f, 1.0f);
        input.action = (frame % 20) == 0;
        input.timestampMs = frame;
        REQUIRE(match.arena->submitInput("phone-1", input));
        match.runChecked(1);
    }
    REQUIRE(match.count(GameEventType::PROJECTILE_FIRED) > 0);

    // Scripted flag run: grab the enemy flag and bring it home
    PhysicsBackend& physics = match.arena->getPhysics();
    const auto hover = glm::vec3(0.0f, Constants::HOVER_HEIGHT, 0.0f);
    const uint32_t scoreBefore = match.arena->getScore(opposingTeam(enemy));

    if (match.arena->getFlags()[teamIndex(enemy)].status == FlagStatus::AT_BASE &&
        !match.arena->getRegistry().get<HealthState>(human).isDead) {
        physics.setTranslation(human, match.arena->getBasePosition(enemy) + hover);
        match.runChecked(1);
        REQUIRE(match.arena->getObjective().getCarriedFlag(human) == enemy);

        physics.setTranslation(human, match.arena->getBasePosition(opposingTeam(enemy)) + hover);
        match.runChecked(1);
        REQUIRE(match.arena->getScore(opposingTeam(enemy)) == scoreBefore + 1);
    }

    // Leaving mid-match keeps the world consistent
    REQUIRE(match.arena->removePlayer("phone-1"));
    REQUIRE_FALSE(match.arena->submitInput("phone-1", ControllerInput{}));
    match.runChecked(600);
    REQUIRE(match.arena->getPlayerCount() == 3);
    REQUIRE(match.count(GameEventType::PLAYER_LEFT) == 1);
}

// ============================================================================
// Performance
// ============================================================================

TEST_CASE("Full arena tick cost", "[integration][!benchmark]") {
    MatchFixture match;
    match.fillWithBots(4);
    match.runChecked(60);

    BENCHMARK("tick with four bots") {
        match.arena->tick(DT);
        return match.arena->getCurrentTick();
    };
}
