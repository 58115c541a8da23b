// [COMBAT_AGENT] Health and death tracking tests

#include <catch2/catch_test_macros.hpp>
#include "combat/HealthSystem.hpp"
#include <vector>

using namespace SkyClash;

TEST_CASE("HealthSystem damage", "[combat]") {
    Registry registry;
    HealthSystem health;

    const EntityID ship = registry.create();
    const EntityID attacker = registry.create();
    health.initialize(registry, ship);

    SECTION("Starts at full health") {
        REQUIRE(health.getHealth(registry, ship) == Constants::MAX_HEALTH);
        REQUIRE_FALSE(health.isDead(registry, ship));
    }

    SECTION("Damage is subtracted and the attacker recorded") {
        REQUIRE(health.reduceHealth(registry, ship, 30, attacker, 1200));
        REQUIRE(health.getHealth(registry, ship) == 70);

        const auto& state = registry.get<HealthState>(ship);
        REQUIRE(state.lastAttacker == attacker);
        REQUIRE(state.lastDamageTimeMs == 1200);
    }

    SECTION("Health never drops below zero") {
        health.reduceHealth(registry, ship, 500);
        REQUIRE(health.getHealth(registry, ship) == 0);
    }

    SECTION("Negative damage does not heal") {
        health.reduceHealth(registry, ship, 20);
        health.reduceHealth(registry, ship, -50);
        REQUIRE(health.getHealth(registry, ship) == 80);
    }

    SECTION("Entity without health is ignored") {
        REQUIRE_FALSE(health.reduceHealth(registry, attacker, 10));
        REQUIRE_FALSE(health.getHealth(registry, attacker).has_value());
    }

    SECTION("Damage callback fires for positive damage only") {
        std::vector<int32_t> seen;
        health.setOnDamage([&](EntityID, EntityID, int32_t damage) { seen.push_back(damage); });

        health.reduceHealth(registry, ship, 15, attacker);
        health.reduceHealth(registry, ship, 0, attacker);
        REQUIRE(seen == std::vector<int32_t>{15});
    }
}

TEST_CASE("HealthSystem heal and set", "[combat]") {
    Registry registry;
    HealthSystem health;
    const EntityID ship = registry.create();
    health.initialize(registry, ship);

    health.reduceHealth(registry, ship, 60);
    REQUIRE(health.heal(registry, ship, Constants::HEALTH_PACK_AMOUNT));
    REQUIRE(health.getHealth(registry, ship) == 65);

    // Clamped to max
    health.heal(registry, ship, 1000);
    REQUIRE(health.getHealth(registry, ship) == Constants::MAX_HEALTH);

    REQUIRE(health.setHealth(registry, ship, -10));
    REQUIRE(health.getHealth(registry, ship) == 0);
}

TEST_CASE("HealthSystem death is edge triggered", "[combat]") {
    Registry registry;
    HealthSystem health;

    const EntityID ship = registry.create();
    const EntityID attacker = registry.create();
    health.initialize(registry, ship);

    int deaths = 0;
    EntityID lastKiller = entt::null;
    health.setOnDeath([&](EntityID, EntityID killer) {
        ++deaths;
        lastKiller = killer;
    });

    SECTION("Living ship is not dead") {
        REQUIRE_FALSE(health.checkDeath(registry, ship));
        REQUIRE(deaths == 0);
    }

    SECTION("Lethal damage reports exactly one death") {
        health.reduceHealth(registry, ship, Constants::MAX_HEALTH, attacker);

        REQUIRE(health.checkDeath(registry, ship));
        REQUIRE_FALSE(health.checkDeath(registry, ship));
        REQUIRE(health.collectDeaths(registry).empty());

        REQUIRE(deaths == 1);
        REQUIRE(lastKiller == attacker);
        REQUIRE(health.isDead(registry, ship));
    }

    SECTION("Dead ships take no further damage or healing") {
        health.reduceHealth(registry, ship, Constants::MAX_HEALTH);
        health.checkDeath(registry, ship);

        REQUIRE_FALSE(health.reduceHealth(registry, ship, 10));
        REQUIRE_FALSE(health.heal(registry, ship, 10));
        REQUIRE(health.getHealth(registry, ship) == 0);
    }

    SECTION("collectDeaths returns only the newly dead") {
        const EntityID other = registry.create();
        health.initialize(registry, other);

        health.reduceHealth(registry, ship, 200);
        health.reduceHealth(registry, other, 50);

        auto died = health.collectDeaths(registry);
        REQUIRE(died.size() == 1);
        REQUIRE(died[0] == ship);
    }

    SECTION("Respawn restores full health") {
        health.reduceHealth(registry, ship, Constants::MAX_HEALTH, attacker);
        health.checkDeath(registry, ship);
        registry.get<HealthState>(ship).respawnAtMs = 5000;

        health.respawn(registry, ship);

        const auto& state = registry.get<HealthState>(ship);
        REQUIRE(state.health == state.maxHealth);
        REQUIRE_FALSE(state.isDead);
        REQUIRE(state.lastAttacker == entt::null);
        REQUIRE(state.respawnAtMs == 0);

        // A second death is reported again
        health.reduceHealth(registry, ship, Constants::MAX_HEALTH);
        REQUIRE(health.checkDeath(registry, ship));
        REQUIRE(deaths == 2);
    }
}

TEST_CASE("HealthSystem honours configured max health", "[combat]") {
    Registry registry;
    HealthConfig config;
    config.maxHealth = 250;
    HealthSystem health(config);

    const EntityID ship = registry.create();
    health.initialize(registry, ship);

    REQUIRE(health.getHealth(registry, ship) == 250);
    health.heal(registry, ship, 100);
    REQUIRE(health.getHealth(registry, ship) == 250);
}
