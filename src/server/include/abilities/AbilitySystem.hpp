#pragma once

#include "abilities/AbilityRegistry.hpp"
#include "ecs/CoreTypes.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

// [ABILITY_AGENT] Ability lifecycle manager
// One slot per player: empty -> equipped-inactive -> equipped-active.
// Expiry is computed from timestamps on query; the slot is only emptied by an
// explicit clear (the host runs clearExpired once per tick).

namespace SkyClash {

class AbilitySystem {
public:
    using ExpiredCallback = std::function<void(EntityID player, const std::string& abilityId)>;

public:
    explicit AbilitySystem(const AbilityRegistry& abilities);

    // Adds an empty AbilitySlot
    void initialize(Registry& registry, EntityID player) const;

    // empty -> equipped-inactive. Rejected while any ability is held.
    bool collect(Registry& registry, EntityID player, std::string_view abilityId);

    // equipped-inactive with matching id -> equipped-active, onActivate runs once.
    // Instant abilities return to empty straight away without onDeactivate.
    bool activate(Registry& registry, EntityID player, std::string_view abilityId,
                  uint32_t currentTimeMs);

    // Activates whatever is held (controller ability trigger)
    bool activateHeld(Registry& registry, EntityID player, uint32_t currentTimeMs);

    // Resets to empty; onDeactivate runs once if the ability had been activated.
    // No-op on an empty slot.
    bool clear(Registry& registry, EntityID player, uint32_t currentTimeMs);

    // Clears every activated ability whose remaining time reached zero
    size_t clearExpired(Registry& registry, uint32_t currentTimeMs);

    [[nodiscard]] bool isActive(const Registry& registry, EntityID player,
                                uint32_t currentTimeMs) const;

    // Seconds left, 0 when not activated
    [[nodiscard]] float getRemaining(const Registry& registry, EntityID player,
                                     uint32_t currentTimeMs) const;

    [[nodiscard]] std::optional<std::string> getHeldAbility(const Registry& registry,
                                                            EntityID player) const;

    [[nodiscard]] static float remainingSeconds(const AbilitySlot& slot, uint32_t currentTimeMs);

    void setOnExpired(ExpiredCallback callback) { onExpired_ = std::move(callback); }

private:
    const AbilityRegistry& abilities_;
    ExpiredCallback onExpired_;
};

} // namespace SkyClash
