#pragma once

#include <cstdint>
#include <cstddef>

// [ALL-AGENTS] Global constants for the SkyClash arena simulation
// All magic numbers MUST be defined here, not scattered in code.
// Runtime-tunable values are copied into the config structs as defaults.

namespace SkyClash {
namespace Constants {

// ============================================================================
// SIMULATION CONSTANTS
// ============================================================================

// [SIM_AGENT] Tick rate and timing
inline constexpr uint32_t TICK_RATE_HZ = 60;
inline constexpr float DT_SECONDS = 1.0f / TICK_RATE_HZ;
inline constexpr float MAX_TICK_DT_SECONDS = 0.1f;  // Clamp long frames

// [SIM_AGENT] Player slots
inline constexpr uint32_t MAX_PLAYERS = 4;
inline constexpr float RESPAWN_DELAY_SECONDS = 2.0f;
inline constexpr float SPAWN_HEIGHT_OFFSET = 5.0f;
inline constexpr size_t MAX_DECALS = 128;

// ============================================================================
// ARENA CONSTANTS
// ============================================================================

// [PHYSICS_AGENT] Arena bounds (meters)
inline constexpr float ARENA_RADIUS = 200.0f;
inline constexpr float OBSTACLE_SIZE = 8.0f;

// [PHYSICS_AGENT] Ship hull and body
inline constexpr float SHIP_HULL_RADIUS = 1.5f;
inline constexpr float SHIP_MASS = 20.0f;
inline constexpr float SHIP_LINEAR_DAMPING = 0.0f;

// [PHYSICS_AGENT] Spatial hashing
inline constexpr float SPATIAL_HASH_CELL_SIZE = 10.0f;  // meters

// ============================================================================
// MOVEMENT CONSTANTS
// ============================================================================

// [PHYSICS_AGENT] Forward speed
inline constexpr float PLAYER_MAX_SPEED = 35.0f;            // m/s
inline constexpr float PLAYER_ACCELERATION = 60.0f;         // m/s^2
inline constexpr float PLAYER_DECELERATION = 80.0f;         // m/s^2
inline constexpr float MAX_VELOCITY_CHANGE_PER_FRAME = 2.0f;
inline constexpr float LATERAL_DAMPING = 1.0f;              // Fraction removed per tick

// [PHYSICS_AGENT] Turning
inline constexpr float PLAYER_MAX_ANGULAR_VELOCITY = 4.0f;  // rad/s
inline constexpr float PLAYER_ANGULAR_ACCELERATION = 10.0f; // rad/s^2
inline constexpr float MAX_ANGULAR_VELOCITY_CHANGE_PER_FRAME = 0.3f;

// [PHYSICS_AGENT] Input smoothing time constant
inline constexpr float PLAYER_INPUT_SMOOTH_TIME = 0.15f;    // seconds

// [PHYSICS_AGENT] Hover and air physics
inline constexpr float HOVER_HEIGHT = 5.0f;
inline constexpr float AIR_MODE_THRESHOLD = 0.5f;
inline constexpr float HOVER_RESTORE_FORCE = 20.0f;
inline constexpr float BASE_GRAVITY = -5.0f;
inline constexpr float MAX_DIVE_GRAVITY = -15.0f;
inline constexpr float MAX_LIFT = 3.0f;
inline constexpr float MAX_PITCH_ANGLE = 0.785398f;         // PI / 4
inline constexpr float PITCH_RESPONSE = 2.0f;
inline constexpr float PITCH_AMPLIFIER = 1.2f;
inline constexpr float PITCH_RESET_SPEED = 5.0f;
inline constexpr float LEVELING_START_HEIGHT = 6.0f;     // Above hover height
inline constexpr float LEVELING_COMPLETE_HEIGHT = 1.0f;
inline constexpr float HOVER_MAX_CORRECTION = 10.0f;
inline constexpr float MIN_VERTICAL_VELOCITY = -40.0f;
inline constexpr float MAX_VERTICAL_VELOCITY = 30.0f;
inline constexpr float LAUNCH_VELOCITY_THRESHOLD = 10.0f;

// ============================================================================
// COMBAT CONSTANTS
// ============================================================================

// [COMBAT_AGENT] Health
inline constexpr int32_t MAX_HEALTH = 100;
inline constexpr int32_t HEALTH_PACK_AMOUNT = 25;

// [COMBAT_AGENT] Bolt (hit-scan laser)
inline constexpr float BOLT_SPEED = 150.0f;
inline constexpr float BOLT_LIFETIME = 2.0f;
inline constexpr int32_t BOLT_DAMAGE = 20;
inline constexpr float BOLT_KNOCKBACK = 300.0f;
inline constexpr float BOLT_GUN_OFFSET_X = 1.5f;
inline constexpr float BOLT_GUN_OFFSET_Z = -0.95f;
inline constexpr float BOLT_FORWARD_OFFSET = 3.5f;
inline constexpr float BOLT_UP_OFFSET = 0.5f;
inline constexpr float SHOOT_INTERVAL = 0.2f;               // Held-trigger refire

// [COMBAT_AGENT] Shell (area rocket)
inline constexpr float SHELL_SPEED = 80.0f;
inline constexpr float SHELL_LIFETIME = 5.0f;
inline constexpr int32_t SHELL_DAMAGE = 50;
inline constexpr float SHELL_KNOCKBACK = 500.0f;
inline constexpr float SHELL_EXPLOSION_RADIUS = 5.0f;
inline constexpr float SHELL_FORWARD_OFFSET = 4.0f;
inline constexpr float SHELL_UP_OFFSET = 0.5f;

// [COMBAT_AGENT] Impact decals
inline constexpr float DECAL_SURFACE_OFFSET = 0.01f;

// ============================================================================
// ABILITY CONSTANTS
// ============================================================================

// [ABILITY_AGENT] Speed boost
inline constexpr float SPEED_BOOST_DURATION = 5.0f;
inline constexpr float SPEED_BOOST_MULTIPLIER = 1.5f;

// [ABILITY_AGENT] Rarity weights
inline constexpr uint32_t RARITY_WEIGHT_COMMON = 30;
inline constexpr uint32_t RARITY_WEIGHT_UNCOMMON = 40;
inline constexpr uint32_t RARITY_WEIGHT_RARE = 30;
inline constexpr uint32_t RARITY_WEIGHT_EPIC = 4;
inline constexpr uint32_t RARITY_WEIGHT_LEGENDARY = 1;

// [ABILITY_AGENT] Collectible spawning
inline constexpr float PICKUP_SPAWN_INTERVAL = 3.0f;
inline constexpr uint32_t MAX_PICKUPS = 20;
inline constexpr float PICKUP_MIN_DISTANCE = 20.0f;
inline constexpr float PICKUP_BOUNDARY_MARGIN = 10.0f;
inline constexpr float PICKUP_BASE_HEIGHT = 5.0f;
inline constexpr float PICKUP_HEIGHT_VARIANCE = 2.0f;
inline constexpr float PICKUP_RADIUS = 2.0f;

// ============================================================================
// OBJECTIVE CONSTANTS
// ============================================================================

// [CTF_AGENT] Base placement (fractions of arena radius)
inline constexpr float BASE_MIN_RADIUS_FACTOR = 0.65f;
inline constexpr float BASE_MAX_RADIUS_FACTOR = 0.85f;
inline constexpr float BASE_BOUNDARY_MARGIN = 15.0f;
inline constexpr float BASE_FALLBACK_RADIUS_FACTOR = 0.7f;
inline constexpr float BASE_ZONE_RADIUS = 6.0f;
inline constexpr float FLAG_ZONE_RADIUS = 2.5f;
inline constexpr float ZONE_HEIGHT = 12.0f;

// ============================================================================
// BOT CONSTANTS
// ============================================================================

// [AI_AGENT] Wander behaviour
inline constexpr float BOT_WANDER_EXTENT = 100.0f;
inline constexpr float BOT_WANDER_MIN_HEIGHT = 10.0f;
inline constexpr float BOT_WANDER_MAX_HEIGHT = 30.0f;
inline constexpr float BOT_TARGET_MIN_INTERVAL = 5.0f;
inline constexpr float BOT_TARGET_MAX_INTERVAL = 10.0f;
inline constexpr float BOT_TURN_GAIN = 5.0f;
inline constexpr float BOT_REVERSE_THRUST = 0.5f;
inline constexpr float BOT_FIRE_INTERVAL = 0.5f;
inline constexpr float BOT_FIRE_CHANCE = 0.05f;

// [AI_AGENT] Reachability
inline constexpr float REACHABILITY_THRESHOLD = 8.0f;
inline constexpr float REACHABILITY_MAX_GRAVITY = 15.0f;
inline constexpr float REACHABILITY_SAFETY_MARGIN = 5.0f;

// [AI_AGENT] Jump pads
inline constexpr float JUMP_PAD_FORCE = 25.0f;
inline constexpr float JUMP_PAD_RADIUS = 4.0f;
inline constexpr float JUMP_PAD_COOLDOWN = 0.5f;

// ============================================================================
// HOST CONSTANTS
// ============================================================================

inline constexpr const char* VERSION = "0.4.0";
inline constexpr uint32_t DEFAULT_BOT_COUNT = 3;
inline constexpr float DEFAULT_MATCH_DURATION_SECONDS = 120.0f;
inline constexpr uint32_t DEFAULT_SEED = 1337;

} // namespace Constants
} // namespace SkyClash
