// [ABILITY_AGENT] Ability registry, lifecycle and pickup spawner tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "abilities/AbilityRegistry.hpp"
#include "abilities/AbilitySystem.hpp"
#include "abilities/BuiltinAbilities.hpp"
#include "abilities/PickupSpawner.hpp"
#include "physics/KinematicPhysicsWorld.hpp"
#include <map>
#include <random>
#include <string>
#include <vector>

using namespace SkyClash;
using Catch::Approx;

namespace {

struct AbilityFixture {
    Registry registry;
    KinematicPhysicsWorld physics;
    HealthSystem health;
    ProjectileSystem projectiles{ProjectileConfig{}, health};
    AbilityRegistry abilities;
    AbilitySystem system{abilities};
    EntityID player{entt::null};

    AbilityFixture() {
        registerBuiltinAbilities(abilities, health, projectiles, physics);

        player = registry.create();
        registry.emplace<PlayerTag>(player);
        registry.emplace<PlayerStats>(player);
        health.initialize(registry, player);
        system.initialize(registry, player);

        BodyDesc desc;
        desc.position = glm::vec3(0.0f, Constants::HOVER_HEIGHT, 0.0f);
        physics.createBody(player, desc);
    }
};

} // namespace

TEST_CASE("AbilityRegistry registration", "[abilities]") {
    AbilityRegistry abilities;

    REQUIRE(abilities.registerAbility(AbilityDefinition{"shield", "Shield", 3.0f, Rarity::EPIC}));
    REQUIRE(abilities.contains("shield"));
    REQUIRE(abilities.size() == 1);

    SECTION("Duplicate and empty ids are rejected") {
        REQUIRE_FALSE(abilities.registerAbility(AbilityDefinition{"shield", "Other", 1.0f}));
        REQUIRE_FALSE(abilities.registerAbility(AbilityDefinition{"", "Nameless", 1.0f}));
        REQUIRE(abilities.size() == 1);
        REQUIRE(abilities.findDefinition("shield")->name == "Shield");
    }

    SECTION("Negative durations become instant") {
        abilities.registerAbility(AbilityDefinition{"blink", "Blink", -2.0f});
        REQUIRE(abilities.findDefinition("blink")->isInstant());
    }

    SECTION("Unknown ids") {
        REQUIRE(abilities.findDefinition("missing") == nullptr);
        REQUIRE(abilities.findHooks("missing") == nullptr);
    }
}

TEST_CASE("AbilityRegistry rarity roll", "[abilities]") {
    std::mt19937 rng(7);

    SECTION("Empty registry rolls nothing") {
        AbilityRegistry abilities;
        REQUIRE(abilities.roll(rng) == nullptr);
    }

    SECTION("Only registered abilities come out, weighted by rarity") {
        AbilityRegistry abilities;
        abilities.registerAbility(AbilityDefinition{"common", "Common", 0.0f, Rarity::COMMON});
        abilities.registerAbility(AbilityDefinition{"legendary", "Legendary", 0.0f, Rarity::LEGENDARY});

        std::map<std::string, int> counts;
        for (int i = 0; i < 3100; ++i) {
            const AbilityDefinition* rolled = abilities.roll(rng);
            REQUIRE(rolled != nullptr);
            ++counts[rolled->id];
        }
        REQUIRE(counts.size() <= 2);
        // 30:1 weighting
        REQUIRE(counts["common"] > counts["legendary"] * 10);
    }

    SECTION("Zero weights fall back to a uniform pick") {
        AbilityConfig config;
        config.rarityWeights.fill(0);
        AbilityRegistry abilities(config);
        abilities.registerAbility(AbilityDefinition{"a", "A", 0.0f});
        abilities.registerAbility(AbilityDefinition{"b", "B", 0.0f});

        for (int i = 0; i < 20; ++i) {
            const AbilityDefinition* rolled = abilities.roll(rng);
            REQUIRE(rolled != nullptr);
            REQUIRE((rolled->id == "a" || rolled->id == "b"));
        }
    }

    REQUIRE(rarityLabel(Rarity::EPIC) == "epic");
}

TEST_CASE("Ability slot lifecycle", "[abilities]") {
    AbilityFixture f;

    SECTION("Collect fills an empty slot") {
        REQUIRE(f.system.collect(f.registry, f.player, AbilityIds::SPEED_BOOST));
        REQUIRE(f.system.getHeldAbility(f.registry, f.player) == std::string(AbilityIds::SPEED_BOOST));
        REQUIRE_FALSE(f.system.isActive(f.registry, f.player, 0));
        REQUIRE(f.system.getRemaining(f.registry, f.player, 0) == 0.0f);
    }

    SECTION("Collecting while holding keeps the held ability") {
        f.system.collect(f.registry, f.player, AbilityIds::SPEED_BOOST);
        REQUIRE_FALSE(f.system.collect(f.registry, f.player, AbilityIds::HEALTH_PACK));
        REQUIRE(f.system.getHeldAbility(f.registry, f.player) == std::string(AbilityIds::SPEED_BOOST));
    }

    SECTION("Unknown abilities cannot be collected") {
        REQUIRE_FALSE(f.system.collect(f.registry, f.player, "teleport"));
        REQUIRE_FALSE(f.system.getHeldAbility(f.registry, f.player).has_value());
    }

    SECTION("Activation requires the held id") {
        f.system.collect(f.registry, f.player, AbilityIds::SPEED_BOOST);
        REQUIRE_FALSE(f.system.activate(f.registry, f.player, AbilityIds::HEALTH_PACK, 0));
        REQUIRE_FALSE(f.system.activateHeld(f.registry, f.registry.create(), 0));
    }

    SECTION("Clearing an empty slot is a no-op") {
        REQUIRE_FALSE(f.system.clear(f.registry, f.player, 0));
    }

    SECTION("Clearing before activation skips the deactivate hook") {
        f.system.collect(f.registry, f.player, AbilityIds::SPEED_BOOST);
        f.registry.get<PlayerStats>(f.player).speedMultiplier = 2.0f;

        REQUIRE(f.system.clear(f.registry, f.player, 0));
        REQUIRE(f.registry.get<PlayerStats>(f.player).speedMultiplier == 2.0f);
    }
}

TEST_CASE("Speed boost runs for its duration", "[abilities]") {
    AbilityFixture f;
    std::vector<std::string> expired;
    f.system.setOnExpired([&](EntityID, const std::string& id) { expired.push_back(id); });

    f.system.collect(f.registry, f.player, AbilityIds::SPEED_BOOST);
    REQUIRE(f.system.activateHeld(f.registry, f.player, 1000));

    auto& stats = f.registry.get<PlayerStats>(f.player);
    REQUIRE(stats.speedMultiplier == Approx(Constants::SPEED_BOOST_MULTIPLIER));
    REQUIRE(f.system.isActive(f.registry, f.player, 1000));
    REQUIRE(f.system.getRemaining(f.registry, f.player, 3000) == Approx(3.0f));

    // Second activation is ignored
    REQUIRE_FALSE(f.system.activateHeld(f.registry, f.player, 2000));

    // Still running just before the end
    REQUIRE(f.system.clearExpired(f.registry, 5999) == 0);
    REQUIRE(stats.speedMultiplier == Approx(Constants::SPEED_BOOST_MULTIPLIER));

    // Expired: slot emptied and the multiplier restored
    REQUIRE_FALSE(f.system.isActive(f.registry, f.player, 6000));
    REQUIRE(f.system.clearExpired(f.registry, 6000) == 1);
    REQUIRE(f.registry.get<PlayerStats>(f.player).speedMultiplier == 1.0f);
    REQUIRE_FALSE(f.system.getHeldAbility(f.registry, f.player).has_value());
    REQUIRE(expired == std::vector<std::string>{std::string(AbilityIds::SPEED_BOOST)});

    // A fresh pickup can be collected again
    REQUIRE(f.system.collect(f.registry, f.player, AbilityIds::SPEED_BOOST));
}

TEST_CASE("Instant abilities free the slot", "[abilities]") {
    AbilityFixture f;

    SECTION("Health pack heals once") {
        f.health.reduceHealth(f.registry, f.player, 50);
        f.system.collect(f.registry, f.player, AbilityIds::HEALTH_PACK);

        REQUIRE(f.system.activateHeld(f.registry, f.player, 100));
        REQUIRE(f.health.getHealth(f.registry, f.player) == 50 + Constants::HEALTH_PACK_AMOUNT);
        REQUIRE_FALSE(f.system.getHeldAbility(f.registry, f.player).has_value());
        REQUIRE(f.system.clearExpired(f.registry, 200) == 0);
    }

    SECTION("Rocket launches a shell") {
        f.system.collect(f.registry, f.player, AbilityIds::ROCKET);
        REQUIRE(f.system.activateHeld(f.registry, f.player, 100));

        REQUIRE(f.projectiles.getActiveCount(f.registry) == 1);
        auto view = f.registry.view<Projectile>();
        REQUIRE(view.get<Projectile>(*view.begin()).kind == ProjectileKind::SHELL);
        REQUIRE_FALSE(f.system.getHeldAbility(f.registry, f.player).has_value());
    }
}

TEST_CASE("Custom abilities plug into the lifecycle", "[abilities]") {
    Registry registry;
    AbilityRegistry abilities;
    AbilitySystem system(abilities);

    int activations = 0;
    int deactivations = 0;
    abilities.registerAbility(
        AbilityDefinition{"cloak", "Cloak", 2.0f, Rarity::EPIC},
        AbilityHooks{[&](Registry&, EntityID, uint32_t) { ++activations; },
                     [&](Registry&, EntityID, uint32_t) { ++deactivations; }});

    const EntityID player = registry.create();
    system.initialize(registry, player);

    system.collect(registry, player, "cloak");
    system.activate(registry, player, "cloak", 0);
    REQUIRE(system.clear(registry, player, 500));
    REQUIRE_FALSE(system.clear(registry, player, 600));

    REQUIRE(activations == 1);
    REQUIRE(deactivations == 1);
}

TEST_CASE("Pickup spawner", "[abilities][pickups]") {
    AbilityFixture f;
    std::mt19937 rng(1234);

    PickupConfig config;
    config.maxPickups = 3;
    PickupSpawner spawner(config, f.abilities);

    SECTION("Positions stay inside the annulus") {
        for (int i = 0; i < 200; ++i) {
            const glm::vec3 p = spawner.randomPosition(rng);
            const float distance = glm::length(glm::vec2(p.x, p.z));
            REQUIRE(distance >= config.minDistance - 1e-3f);
            REQUIRE(distance <= config.arenaRadius - config.boundaryMargin + 1e-3f);
            REQUIRE(p.y >= config.baseHeight);
            REQUIRE(p.y <= config.baseHeight + config.heightVariance);
        }
    }

    SECTION("Spawns on the interval up to the cap") {
        REQUIRE(spawner.update(f.registry, f.physics, 1000, rng) == entt::null);

        uint32_t now = 0;
        for (uint32_t i = 0; i < 5; ++i) {
            now += 3000;
            spawner.update(f.registry, f.physics, now, rng);
        }
        REQUIRE(spawner.getCount(f.registry) == config.maxPickups);
        REQUIRE(f.physics.getSensorCount() == config.maxPickups);

        for (EntityID entity : f.registry.view<Pickup>()) {
            REQUIRE(f.abilities.contains(f.registry.get<Pickup>(entity).abilityId));
        }
    }

    SECTION("Sensor key maps back to the pickup") {
        const EntityID pickup = spawner.spawnPickup(f.registry, f.physics,
                                                    std::string(AbilityIds::HEALTH_PACK),
                                                    glm::vec3(30.0f, 5.0f, 0.0f), 0);
        const uint32_t key = static_cast<uint32_t>(entt::to_integral(pickup));
        REQUIRE(PickupSpawner::entityFromSensorKey(key) == pickup);

        spawner.removePickup(f.registry, f.physics, pickup);
        REQUIRE_FALSE(f.registry.valid(pickup));
        REQUIRE(f.physics.getSensorCount() == 0);
    }
}
