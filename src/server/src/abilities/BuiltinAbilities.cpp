// [ABILITY_AGENT] Built-in ability hooks

#include "abilities/BuiltinAbilities.hpp"
#include <string>

namespace SkyClash {

void registerBuiltinAbilities(AbilityRegistry& abilities, HealthSystem& health,
                              ProjectileSystem& projectiles, const PhysicsBackend& physics) {
    const AbilityConfig& config = abilities.getConfig();

    // Speed boost: multiplier consumed by the movement integrator
    const float multiplier = config.speedBoostMultiplier;
    abilities.registerAbility(
        AbilityDefinition{std::string(AbilityIds::SPEED_BOOST), "Speed Boost",
                          config.speedBoostDuration, Rarity::UNCOMMON},
        AbilityHooks{
            [multiplier](Registry& registry, EntityID player, uint32_t) {
                registry.get_or_emplace<PlayerStats>(player).speedMultiplier = multiplier;
            },
            [](Registry& registry, EntityID player, uint32_t) {
                if (PlayerStats* stats = registry.try_get<PlayerStats>(player)) {
                    stats->speedMultiplier = 1.0f;
                }
            }});

    // Health pack: one-shot heal
    const int32_t healAmount = config.healthPackAmount;
    abilities.registerAbility(
        AbilityDefinition{std::string(AbilityIds::HEALTH_PACK), "Health Pack", 0.0f,
                          Rarity::COMMON},
        AbilityHooks{
            [&health, healAmount](Registry& registry, EntityID player, uint32_t) {
                health.heal(registry, player, healAmount);
            },
            nullptr});

    // Rocket: launches a shell from the ship's nose
    abilities.registerAbility(
        AbilityDefinition{std::string(AbilityIds::ROCKET), "Rocket", 0.0f, Rarity::RARE},
        AbilityHooks{
            [&projectiles, &physics](Registry& registry, EntityID player, uint32_t currentTimeMs) {
                projectiles.spawnShell(registry, physics, player, currentTimeMs);
            },
            nullptr});
}

} // namespace SkyClash
