// [ABILITY_AGENT] Ability registry implementation

#include "abilities/AbilityRegistry.hpp"
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <iostream>

namespace SkyClash {

std::string_view rarityLabel(Rarity rarity) {
    switch (rarity) {
        case Rarity::COMMON: return "common";
        case Rarity::UNCOMMON: return "uncommon";
        case Rarity::RARE: return "rare";
        case Rarity::EPIC: return "epic";
        case Rarity::LEGENDARY: return "legendary";
    }
    return "common";
}

AbilityRegistry::AbilityRegistry(const AbilityConfig& config) : config_(config) {}

bool AbilityRegistry::registerAbility(AbilityDefinition definition, AbilityHooks hooks) {
    if (definition.id.empty()) {
        return false;
    }
    if (entries_.count(definition.id) > 0) {
        std::cerr << "[ABILITY] Duplicate ability id '" << definition.id << "' ignored" << std::endl;
        return false;
    }

    definition.durationSec = std::max(0.0f, definition.durationSec);
    std::string id = definition.id;
    entries_.emplace(std::move(id), Entry{std::move(definition), std::move(hooks)});
    return true;
}

const AbilityDefinition* AbilityRegistry::findDefinition(std::string_view id) const {
    auto it = entries_.find(id);
    return it != entries_.end() ? &it->second.definition : nullptr;
}

const AbilityHooks* AbilityRegistry::findHooks(std::string_view id) const {
    auto it = entries_.find(id);
    return it != entries_.end() ? &it->second.hooks : nullptr;
}

std::vector<std::string> AbilityRegistry::getIds() const {
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

uint32_t AbilityRegistry::getRarityWeight(Rarity rarity) const {
    const size_t index = static_cast<size_t>(rarity);
    return index < config_.rarityWeights.size() ? config_.rarityWeights[index] : 0;
}

const AbilityDefinition* AbilityRegistry::roll(std::mt19937& rng) const {
    uint64_t totalWeight = 0;
    for (const auto& [id, entry] : entries_) {
        totalWeight += getRarityWeight(entry.definition.rarity);
    }
    if (totalWeight == 0) {
        // All weights zeroed: fall back to a uniform pick
        if (entries_.empty()) {
            return nullptr;
        }
        std::uniform_int_distribution<size_t> pick(0, entries_.size() - 1);
        return &std::next(entries_.begin(), static_cast<std::ptrdiff_t>(pick(rng)))->second.definition;
    }

    std::uniform_int_distribution<uint64_t> dist(0, totalWeight - 1);
    uint64_t ticket = dist(rng);
    for (const auto& [id, entry] : entries_) {
        const uint32_t weight = getRarityWeight(entry.definition.rarity);
        if (ticket < weight) {
            return &entry.definition;
        }
        ticket -= weight;
    }
    return &entries_.rbegin()->second.definition;
}

} // namespace SkyClash
