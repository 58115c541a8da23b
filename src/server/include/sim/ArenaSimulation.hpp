#pragma once

#include "abilities/AbilityRegistry.hpp"
#include "abilities/AbilitySystem.hpp"
#include "abilities/PickupSpawner.hpp"
#include "ai/BotController.hpp"
#include "ai/GameContext.hpp"
#include "combat/HealthSystem.hpp"
#include "combat/ProjectileSystem.hpp"
#include "config/ArenaConfig.hpp"
#include "ecs/CoreTypes.hpp"
#include "objective/CaptureTheFlag.hpp"
#include "physics/MovementSystem.hpp"
#include "physics/PhysicsBackend.hpp"
#include "sim/GameEvents.hpp"
#include "sim/InputBuffer.hpp"
#include <array>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>

// [SIM_AGENT] Authoritative arena simulation
// Owns the registry and every subsystem for one match. Driven by tick(dt) from
// a single thread; presentation layers read state through the const accessors
// and listen to the event callback.

namespace SkyClash {

class ArenaSimulation {
public:
    // A null physics backend selects the built-in KinematicPhysicsWorld
    explicit ArenaSimulation(const ArenaConfig& config = ArenaConfig::defaults(),
                             std::unique_ptr<PhysicsBackend> physics = nullptr);
    ~ArenaSimulation();

    ArenaSimulation(const ArenaSimulation&) = delete;
    ArenaSimulation& operator=(const ArenaSimulation&) = delete;

    // Joins a human controller. Returns the existing entity for a known id and
    // entt::null when the arena is full.
    EntityID addPlayer(const std::string& controllerId, const std::string& displayName = "");

    // Joins a bot with a generated "bot-xxxxxx" id
    EntityID addBot();

    // Releases the flag, removes the body, projectiles and all records
    bool removePlayer(const std::string& controllerId);

    // Latest snapshot wins; triggers are latched until the next tick
    bool submitInput(const std::string& controllerId, const ControllerInput& input);

    // One frame. dt is clamped to MAX_TICK_DT_SECONDS.
    void tick(float dt);

    // Read-only view of the world for one bot
    [[nodiscard]] GameContext makeContext(EntityID self) const;

    [[nodiscard]] EntityID findPlayer(const std::string& controllerId) const;
    [[nodiscard]] size_t getPlayerCount() const { return controllers_.size(); }
    [[nodiscard]] std::optional<CachedTransform> getCachedTransform(const std::string& controllerId) const;

    [[nodiscard]] const CaptureTheFlag::FlagStates& getFlags() const { return objective_.getFlags(); }
    [[nodiscard]] uint32_t getScore(TeamId team) const { return objective_.getScore(team); }
    [[nodiscard]] const glm::vec3& getBasePosition(TeamId team) const { return objective_.getBasePosition(team); }
    [[nodiscard]] const std::deque<Decal>& getDecals() const { return decals_; }

    [[nodiscard]] uint32_t getCurrentTimeMs() const { return currentTimeMs_; }
    [[nodiscard]] uint64_t getCurrentTick() const { return currentTick_; }

    // Subsystems
    [[nodiscard]] Registry& getRegistry() { return registry_; }
    [[nodiscard]] const Registry& getRegistry() const { return registry_; }
    [[nodiscard]] PhysicsBackend& getPhysics() { return *physics_; }
    [[nodiscard]] const PhysicsBackend& getPhysics() const { return *physics_; }
    [[nodiscard]] CaptureTheFlag& getObjective() { return objective_; }
    [[nodiscard]] const CaptureTheFlag& getObjective() const { return objective_; }
    [[nodiscard]] HealthSystem& getHealthSystem() { return health_; }
    [[nodiscard]] ProjectileSystem& getProjectileSystem() { return projectiles_; }
    [[nodiscard]] AbilitySystem& getAbilitySystem() { return abilities_; }
    [[nodiscard]] AbilityRegistry& getAbilityRegistry() { return abilityRegistry_; }
    [[nodiscard]] PickupSpawner& getPickupSpawner() { return pickups_; }
    [[nodiscard]] BotController* getBotController(EntityID bot);

    [[nodiscard]] const ArenaConfig& getConfig() const { return config_; }
    [[nodiscard]] std::mt19937& getRng() { return rng_; }

    void setOnEvent(GameEventCallback callback) { onEvent_ = std::move(callback); }

private:
    // Tick phases
    void gatherInputs();
    void updateDeaths();
    void updateAbilityTriggers();
    void updateWeapons();
    void syncObjectiveSensors();
    void syncCarriedFlags();
    void dispatchIntersections();
    void refreshCameraCache();

    // Intersection handlers
    void onFlagContact(EntityID player, TeamId flagTeam);
    void onBaseContact(EntityID player, TeamId baseTeam);
    void onPickupContact(EntityID player, uint32_t sensorKey);
    void onJumpPadContact(EntityID player, uint32_t padId);

    void onPlayerDied(EntityID victim, EntityID killer);
    void respawnPlayer(EntityID player);
    void placeAtBase(EntityID player);

    void emitObjective(ObjectiveResult result, EntityID player, TeamId flagTeam);
    void emit(GameEventType type, EntityID subject, EntityID other = entt::null,
              std::optional<TeamId> team = std::nullopt, const glm::vec3& position = glm::vec3(0.0f),
              int32_t amount = 0, std::string detail = {});

    [[nodiscard]] std::string generateBotId();
    [[nodiscard]] std::string describe(EntityID player) const;

private:
    ArenaConfig config_;
    std::mt19937 rng_;
    Registry registry_;
    std::unique_ptr<PhysicsBackend> physics_;

    HealthSystem health_;
    ProjectileSystem projectiles_;
    AbilityRegistry abilityRegistry_;
    AbilitySystem abilities_;
    PickupSpawner pickups_;
    MovementSystem movement_;
    CaptureTheFlag objective_;

    InputBuffer inputs_;
    std::map<std::string, EntityID> controllers_;
    std::map<EntityID, BotController> bots_;

    std::array<uint32_t, SharedConstants::TEAM_COUNT> flagSensors_{};
    std::array<uint32_t, SharedConstants::TEAM_COUNT> baseSensors_{};
    std::map<std::pair<EntityID, uint32_t>, uint32_t> padReadyAtMs_;   // (player, pad) -> ms

    std::deque<Decal> decals_;
    GameEventCallback onEvent_;

    double elapsedSec_{0.0};
    uint32_t currentTimeMs_{0};
    uint64_t currentTick_{0};
    uint32_t colorCursor_{0};
};

} // namespace SkyClash
