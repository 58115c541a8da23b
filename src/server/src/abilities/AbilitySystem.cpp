// [ABILITY_AGENT] Ability lifecycle manager implementation

#include "abilities/AbilitySystem.hpp"
#include <algorithm>
#include <vector>

namespace SkyClash {

AbilitySystem::AbilitySystem(const AbilityRegistry& abilities) : abilities_(abilities) {}

void AbilitySystem::initialize(Registry& registry, EntityID player) const {
    registry.emplace_or_replace<AbilitySlot>(player);
}

bool AbilitySystem::collect(Registry& registry, EntityID player, std::string_view abilityId) {
    AbilitySlot* slot = registry.try_get<AbilitySlot>(player);
    if (!slot || !slot->empty()) {
        return false;
    }

    const AbilityDefinition* definition = abilities_.findDefinition(abilityId);
    if (!definition) {
        return false;
    }

    AbilitySlot equipped;
    equipped.abilityId = definition->id;
    equipped.durationSec = definition->durationSec;
    *slot = std::move(equipped);
    return true;
}

bool AbilitySystem::activate(Registry& registry, EntityID player, std::string_view abilityId,
                             uint32_t currentTimeMs) {
    AbilitySlot* slot = registry.try_get<AbilitySlot>(player);
    if (!slot || slot->empty() || *slot->abilityId != abilityId || slot->activated()) {
        return false;
    }

    const AbilityDefinition* definition = abilities_.findDefinition(abilityId);
    if (!definition) {
        return false;
    }

    AbilitySlot active = *slot;
    active.activatedAtMs = currentTimeMs;
    active.durationSec = definition->durationSec;
    *slot = std::move(active);

    const AbilityHooks* hooks = abilities_.findHooks(abilityId);
    if (hooks && hooks->onActivate) {
        hooks->onActivate(registry, player, currentTimeMs);
    }

    if (definition->isInstant()) {
        // Hooks may have touched the registry; look the slot up again
        if (AbilitySlot* current = registry.try_get<AbilitySlot>(player)) {
            *current = AbilitySlot{};
        }
    }
    return true;
}

bool AbilitySystem::activateHeld(Registry& registry, EntityID player, uint32_t currentTimeMs) {
    const AbilitySlot* slot = registry.try_get<AbilitySlot>(player);
    if (!slot || slot->empty() || slot->activated()) {
        return false;
    }
    const std::string id = *slot->abilityId;
    return activate(registry, player, id, currentTimeMs);
}

bool AbilitySystem::clear(Registry& registry, EntityID player, uint32_t currentTimeMs) {
    AbilitySlot* slot = registry.try_get<AbilitySlot>(player);
    if (!slot || slot->empty()) {
        return false;
    }

    const std::string id = *slot->abilityId;
    const bool wasActivated = slot->activated();
    *slot = AbilitySlot{};

    const AbilityHooks* hooks = abilities_.findHooks(id);
    if (wasActivated && hooks && hooks->onDeactivate) {
        hooks->onDeactivate(registry, player, currentTimeMs);
    }
    return true;
}

size_t AbilitySystem::clearExpired(Registry& registry, uint32_t currentTimeMs) {
    std::vector<EntityID> expired;
    auto view = registry.view<AbilitySlot>();
    for (EntityID entity : view) {
        const AbilitySlot& slot = view.get<AbilitySlot>(entity);
        if (slot.activated() && remainingSeconds(slot, currentTimeMs) <= 0.0f) {
            expired.push_back(entity);
        }
    }

    for (EntityID entity : expired) {
        const std::optional<std::string> abilityId = getHeldAbility(registry, entity);
        if (clear(registry, entity, currentTimeMs) && onExpired_ && abilityId) {
            onExpired_(entity, *abilityId);
        }
    }
    return expired.size();
}

float AbilitySystem::remainingSeconds(const AbilitySlot& slot, uint32_t currentTimeMs) {
    if (!slot.activatedAtMs) {
        return 0.0f;
    }
    const uint32_t start = *slot.activatedAtMs;
    const float elapsed = currentTimeMs > start
        ? static_cast<float>(currentTimeMs - start) / 1000.0f
        : 0.0f;
    return std::max(0.0f, slot.durationSec - elapsed);
}

bool AbilitySystem::isActive(const Registry& registry, EntityID player,
                             uint32_t currentTimeMs) const {
    const AbilitySlot* slot = registry.try_get<AbilitySlot>(player);
    return slot && !slot->empty() && slot->activated() &&
           remainingSeconds(*slot, currentTimeMs) > 0.0f;
}

float AbilitySystem::getRemaining(const Registry& registry, EntityID player,
                                  uint32_t currentTimeMs) const {
    const AbilitySlot* slot = registry.try_get<AbilitySlot>(player);
    return slot ? remainingSeconds(*slot, currentTimeMs) : 0.0f;
}

std::optional<std::string> AbilitySystem::getHeldAbility(const Registry& registry,
                                                         EntityID player) const {
    const AbilitySlot* slot = registry.try_get<AbilitySlot>(player);
    if (!slot) {
        return std::nullopt;
    }
    return slot->abilityId;
}

} // namespace SkyClash
