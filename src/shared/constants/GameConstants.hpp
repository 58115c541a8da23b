#pragma once

// [ALL-AGENTS] Shared constants between the simulation host and controller apps
// Anything a controller needs to render or validate input lives here.

#include <array>
#include <cstdint>
#include <string_view>

namespace SkyClash {
namespace SharedConstants {

// Tick rates
inline constexpr uint32_t SERVER_TICK_RATE = 60;
inline constexpr uint32_t CONTROLLER_INPUT_RATE = 60;

// Controller input ranges (vector components are clamped to this)
inline constexpr float INPUT_AXIS_MIN = -1.0f;
inline constexpr float INPUT_AXIS_MAX = 1.0f;

// Teams, in tie-break order
inline constexpr uint32_t TEAM_COUNT = 2;
inline constexpr std::array<std::string_view, TEAM_COUNT> TEAM_LABELS = {"solaris", "nebulon"};
inline constexpr std::array<std::string_view, TEAM_COUNT> TEAM_COLORS = {"#f97316", "#38bdf8"};

// Player accent colors, assigned in join order
inline constexpr std::array<std::string_view, 4> PLAYER_COLORS = {
    "#38bdf8", "#a78bfa", "#f472b6", "#34d399"
};

// Bot controller ids are "bot-" followed by this many characters
inline constexpr uint32_t BOT_ID_SUFFIX_LENGTH = 6;

} // namespace SharedConstants
} // namespace SkyClash
