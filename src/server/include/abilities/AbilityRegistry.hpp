#pragma once

#include "ecs/CoreTypes.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <random>
#include <string>
#include <string_view>
#include <vector>

// [ABILITY_AGENT] Open registry of ability definitions and their side effects
// New abilities are added by registering an id with optional hooks; the
// lifecycle manager never needs to change.

namespace SkyClash {

enum class Rarity : uint8_t {
    COMMON = 0,
    UNCOMMON = 1,
    RARE = 2,
    EPIC = 3,
    LEGENDARY = 4
};

inline constexpr size_t RARITY_COUNT = 5;

// [ABILITY_AGENT] Ability tuning
struct AbilityConfig {
    float speedBoostDuration = Constants::SPEED_BOOST_DURATION;
    float speedBoostMultiplier = Constants::SPEED_BOOST_MULTIPLIER;
    int32_t healthPackAmount = Constants::HEALTH_PACK_AMOUNT;

    // Spawn weight per rarity, indexed by Rarity
    std::array<uint32_t, RARITY_COUNT> rarityWeights{
        Constants::RARITY_WEIGHT_COMMON,
        Constants::RARITY_WEIGHT_UNCOMMON,
        Constants::RARITY_WEIGHT_RARE,
        Constants::RARITY_WEIGHT_EPIC,
        Constants::RARITY_WEIGHT_LEGENDARY
    };
};

struct AbilityDefinition {
    std::string id;
    std::string name;
    float durationSec{0.0f};    // 0 = instant, slot frees itself on activation
    Rarity rarity{Rarity::COMMON};

    [[nodiscard]] bool isInstant() const { return durationSec <= 0.0f; }
};

using AbilityHook = std::function<void(Registry& registry, EntityID player, uint32_t currentTimeMs)>;

struct AbilityHooks {
    AbilityHook onActivate;     // Optional
    AbilityHook onDeactivate;   // Optional
};

class AbilityRegistry {
public:
    explicit AbilityRegistry(const AbilityConfig& config = AbilityConfig{});

    // False for an empty or duplicate id. Negative durations are clamped to 0.
    bool registerAbility(AbilityDefinition definition, AbilityHooks hooks = AbilityHooks{});

    [[nodiscard]] const AbilityDefinition* findDefinition(std::string_view id) const;
    [[nodiscard]] const AbilityHooks* findHooks(std::string_view id) const;
    [[nodiscard]] bool contains(std::string_view id) const { return findDefinition(id) != nullptr; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] std::vector<std::string> getIds() const;

    // Weighted pick: each ability weighs its rarity's weight. Null if nothing is registered.
    [[nodiscard]] const AbilityDefinition* roll(std::mt19937& rng) const;

    [[nodiscard]] uint32_t getRarityWeight(Rarity rarity) const;
    [[nodiscard]] const AbilityConfig& getConfig() const { return config_; }

private:
    struct Entry {
        AbilityDefinition definition;
        AbilityHooks hooks;
    };

    AbilityConfig config_;
    std::map<std::string, Entry, std::less<>> entries_;
};

[[nodiscard]] std::string_view rarityLabel(Rarity rarity);

} // namespace SkyClash
