// [SIM_AGENT] Arena configuration tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config/ArenaConfig.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

using namespace SkyClash;
using Catch::Approx;
using json = nlohmann::json;

namespace {

// Writes text to a fresh file under the temp directory and removes it on scope exit
class TempFile {
public:
    TempFile(const std::string& name, const std::string& contents)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(path_);
        out << contents;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("Default arena config", "[config]") {
    const ArenaConfig config = ArenaConfig::defaults();

    REQUIRE(config.seed == Constants::DEFAULT_SEED);
    REQUIRE(config.tickRateHz == Constants::TICK_RATE_HZ);
    REQUIRE(config.maxPlayers == Constants::MAX_PLAYERS);
    REQUIRE(config.obstacles.size() == 16);
    REQUIRE(config.jumpPads.size() == 4);

    for (const Obstacle& obstacle : config.obstacles) {
        REQUIRE(obstacle.center.y == Approx(Constants::OBSTACLE_SIZE * 0.5f));
        REQUIRE(glm::length(glm::vec2(obstacle.center.x, obstacle.center.z)) < config.arenaRadius);
    }

    for (size_t i = 0; i < config.jumpPads.size(); ++i) {
        REQUIRE(config.jumpPads[i].id == i + 1);
        REQUIRE(config.jumpPads[i].launchVelocity == Approx(Constants::JUMP_PAD_FORCE));
    }

    REQUIRE(config.pickups.arenaRadius == config.arenaRadius);
    REQUIRE(config.objective.arenaRadius == config.arenaRadius);
    REQUIRE(config.physics.arenaRadius == config.arenaRadius);
}

TEST_CASE("JSON overlays the defaults", "[config]") {
    const json root = json::parse(R"({
        "seed": 42,
        "arenaRadius": 150.0,
        "movement": { "maxSpeed": 50.0, "inputSmoothTime": 0.0 },
        "projectiles": { "boltDamage": 10 },
        "health": { "maxHealth": 200, "respawnDelaySec": 3.5 },
        "abilities": { "rarityWeights": [1, 2, 3] },
        "pickups": { "maxPickups": 5 },
        "bots": { "fireChance": 0.5, "reachability": { "threshold": 12.0 } },
        "physics": { "gravity": [0.0, -9.8, 0.0] },
        "jumpPads": [ { "position": [10.0, 0.0, 10.0], "launchVelocity": 40.0 } ],
        "unknownKey": true
    })");

    const ArenaConfig config = arenaConfigFromJson(root);

    REQUIRE(config.seed == 42);
    REQUIRE(config.arenaRadius == Approx(150.0f));
    REQUIRE(config.movement.maxSpeed == Approx(50.0f));
    REQUIRE(config.movement.inputSmoothTime == 0.0f);
    REQUIRE(config.projectiles.boltDamage == 10);
    REQUIRE(config.health.maxHealth == 200);
    REQUIRE(config.health.respawnDelaySec == Approx(3.5f));
    REQUIRE(config.abilities.rarityWeights[0] == 1);
    REQUIRE(config.abilities.rarityWeights[2] == 3);
    REQUIRE(config.abilities.rarityWeights[3] == Constants::RARITY_WEIGHT_EPIC);
    REQUIRE(config.pickups.maxPickups == 5);
    REQUIRE(config.bots.fireChance == Approx(0.5f));
    REQUIRE(config.bots.reachability.threshold == Approx(12.0f));
    REQUIRE(config.physics.gravity.y == Approx(-9.8f));

    // Untouched sections keep their defaults
    REQUIRE(config.movement.acceleration == Approx(Constants::PLAYER_ACCELERATION));
    REQUIRE(config.obstacles.size() == 16);

    // Radius propagated to the sub-configs
    REQUIRE(config.objective.arenaRadius == Approx(150.0f));
    REQUIRE(config.physics.arenaRadius == Approx(150.0f));

    // Replaced pad list, ids assigned in order
    REQUIRE(config.jumpPads.size() == 1);
    REQUIRE(config.jumpPads[0].id == 1);
    REQUIRE(config.jumpPads[0].launchVelocity == Approx(40.0f));
    REQUIRE(config.jumpPads[0].position.x == Approx(10.0f));
}

TEST_CASE("Out-of-range values are sanitized", "[config]") {
    ArenaConfig config = ArenaConfig::defaults();
    config.maxPlayers = 12;
    config.tickRateHz = 0;
    config.arenaRadius = 5.0f;
    config.maxDecals = 0;
    config.movement.lateralDamping = 4.0f;
    config.health.maxHealth = -5;
    config.bots.fireChance = 2.0f;
    config.bots.targetMinInterval = 9.0f;
    config.bots.targetMaxInterval = 3.0f;
    config.sanitize();

    REQUIRE(config.maxPlayers == 4);
    REQUIRE(config.tickRateHz == 1);
    REQUIRE(config.arenaRadius == Approx(50.0f));
    REQUIRE(config.pickups.arenaRadius == Approx(50.0f));
    REQUIRE(config.maxDecals == 1);
    REQUIRE(config.movement.lateralDamping == 1.0f);
    REQUIRE(config.health.maxHealth == 1);
    REQUIRE(config.bots.fireChance == 1.0f);
    REQUIRE(config.bots.targetMinInterval == Approx(3.0f));
    REQUIRE(config.bots.targetMaxInterval == Approx(9.0f));
}

TEST_CASE("Wrong JSON types throw", "[config]") {
    const json root = json::parse(R"({ "seed": "not a number" })");
    REQUIRE_THROWS_AS(arenaConfigFromJson(root), json::exception);
}

TEST_CASE("Loading config files", "[config]") {
    ArenaConfig config = ArenaConfig::defaults();
    config.seed = 7;

    SECTION("Missing file leaves the config alone") {
        REQUIRE_FALSE(loadArenaConfig("/nonexistent/skyclash/arena.json", config));
        REQUIRE(config.seed == 7);
    }

    SECTION("Malformed file") {
        TempFile file("skyclash_test_malformed.json", "{ \"seed\": ");
        REQUIRE_FALSE(loadArenaConfig(file.path(), config));
        REQUIRE(config.seed == 7);
    }

    SECTION("Top level must be an object") {
        TempFile file("skyclash_test_array.json", "[1, 2, 3]");
        REQUIRE_FALSE(loadArenaConfig(file.path(), config));
    }

    SECTION("Valid file") {
        TempFile file("skyclash_test_valid.json", R"({ "seed": 99, "maxPlayers": 2 })");
        REQUIRE(loadArenaConfig(file.path(), config));
        REQUIRE(config.seed == 99);
        REQUIRE(config.maxPlayers == 2);
    }
}
