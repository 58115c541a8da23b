// [NETWORK_AGENT] Input latching implementation

#include "sim/InputBuffer.hpp"

namespace SkyClash {

bool InputBuffer::submit(const std::string& controllerId, const ControllerInput& input) {
    auto it = entries_.find(controllerId);
    if (it == entries_.end()) {
        it = entries_.emplace(controllerId, Entry{}).first;
    } else if (input.timestampMs < it->second.latest.timestampMs) {
        return false;  // Out of order
    }

    Entry& entry = it->second;
    entry.latest = input.clamped();
    entry.actionLatched = entry.actionLatched || input.action;
    entry.abilityLatched = entry.abilityLatched || input.ability;
    return true;
}

ControllerInput InputBuffer::pop(std::string_view controllerId) {
    auto it = entries_.find(controllerId);
    if (it == entries_.end()) {
        return ControllerInput{};
    }

    Entry& entry = it->second;
    ControllerInput out = entry.latest;
    out.action = entry.actionLatched;
    out.ability = entry.abilityLatched;

    entry.actionLatched = entry.latest.action;
    entry.abilityLatched = entry.latest.ability;
    return out;
}

bool InputBuffer::contains(std::string_view controllerId) const {
    return entries_.find(controllerId) != entries_.end();
}

void InputBuffer::remove(std::string_view controllerId) {
    auto it = entries_.find(controllerId);
    if (it != entries_.end()) {
        entries_.erase(it);
    }
}

} // namespace SkyClash
