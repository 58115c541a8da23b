#pragma once

#include "abilities/AbilityRegistry.hpp"
#include "combat/HealthSystem.hpp"
#include "combat/ProjectileSystem.hpp"
#include "physics/PhysicsBackend.hpp"
#include <string_view>

// [ABILITY_AGENT] Abilities shipped with the arena

namespace SkyClash {
namespace AbilityIds {

inline constexpr std::string_view SPEED_BOOST = "speed_boost";
inline constexpr std::string_view HEALTH_PACK = "health_pack";
inline constexpr std::string_view ROCKET = "rocket";

} // namespace AbilityIds

// Registers speed_boost, health_pack and rocket. Hooks keep references to the
// given systems, which must outlive the registry.
void registerBuiltinAbilities(AbilityRegistry& abilities, HealthSystem& health,
                              ProjectileSystem& projectiles, const PhysicsBackend& physics);

} // namespace SkyClash
