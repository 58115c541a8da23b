#pragma once

#include "ecs/CoreTypes.hpp"
#include <map>
#include <string>
#include <string_view>

// [NETWORK_AGENT] Latest-snapshot input store with trigger latching
// Controllers can send faster than the tick runs. The vector is last-write-wins,
// but a press seen in any snapshot survives until the tick consumes it once.

namespace SkyClash {

class InputBuffer {
public:
    // Stores the snapshot. Snapshots older than the latest one are dropped.
    bool submit(const std::string& controllerId, const ControllerInput& input);

    // Latest snapshot with latched triggers; the latch then falls back to the
    // raw state of that snapshot so a held button keeps reading pressed.
    ControllerInput pop(std::string_view controllerId);

    [[nodiscard]] bool contains(std::string_view controllerId) const;
    void remove(std::string_view controllerId);
    void clear() { entries_.clear(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    struct Entry {
        ControllerInput latest;
        bool actionLatched{false};
        bool abilityLatched{false};
    };

    std::map<std::string, Entry, std::less<>> entries_;
};

} // namespace SkyClash
