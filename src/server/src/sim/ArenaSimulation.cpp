// [SIM_AGENT] Arena simulation implementation

#include "sim/ArenaSimulation.hpp"
#include "abilities/BuiltinAbilities.hpp"
#include "physics/KinematicPhysicsWorld.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <vector>

namespace SkyClash {

ArenaSimulation::ArenaSimulation(const ArenaConfig& config, std::unique_ptr<PhysicsBackend> physics)
    : config_(config)
    , rng_(config.seed)
    , physics_(std::move(physics))
    , health_(config_.health)
    , projectiles_(config_.projectiles, health_)
    , abilityRegistry_(config_.abilities)
    , abilities_(abilityRegistry_)
    , pickups_(config_.pickups, abilityRegistry_)
    , movement_(config_.movement)
    , objective_(config_.objective, rng_)
{
    if (!physics_) {
        physics_ = std::make_unique<KinematicPhysicsWorld>(config_.physics);
    }

    registerBuiltinAbilities(abilityRegistry_, health_, projectiles_, *physics_);

    for (const Obstacle& obstacle : config_.obstacles) {
        physics_->addObstacle(obstacle);
    }

    // Flag and base zones follow the objective; created once, moved every tick
    const ObjectiveConfig& objective = config_.objective;
    for (TeamId team : ALL_TEAMS) {
        const uint32_t key = static_cast<uint32_t>(teamIndex(team));
        flagSensors_[teamIndex(team)] = physics_->addSensor(SensorDesc{
            SensorKind::FLAG, key, objective_.getFlag(team).position,
            objective.flagZoneRadius, objective.zoneHeight});
        baseSensors_[teamIndex(team)] = physics_->addSensor(SensorDesc{
            SensorKind::BASE, key, objective_.getBasePosition(team),
            objective.baseZoneRadius, objective.zoneHeight});
    }

    // Tall enough that a hovering ship passes through
    const float padHeight = config_.movement.hoverHeight + config_.movement.airModeThreshold + 1.0f;
    for (const JumpPad& pad : config_.jumpPads) {
        physics_->addSensor(SensorDesc{SensorKind::JUMP_PAD, pad.id, pad.position, pad.radius, padHeight});
    }

    health_.setOnDeath([this](EntityID victim, EntityID killer) {
        onPlayerDied(victim, killer);
    });

    projectiles_.setOnHit([this](const ProjectileHit& hit) {
        emit(GameEventType::PROJECTILE_HIT, hit.owner, hit.target, std::nullopt, hit.point,
             hit.damage, hit.kind == ProjectileKind::SHELL ? "shell" : "bolt");
    });

    projectiles_.setOnImpact([this](const Decal& decal) {
        decals_.push_back(decal);
        while (decals_.size() > config_.maxDecals) {
            decals_.pop_front();
        }
    });

    abilities_.setOnExpired([this](EntityID player, const std::string& abilityId) {
        emit(GameEventType::ABILITY_EXPIRED, player, entt::null, std::nullopt, glm::vec3(0.0f), 0,
             abilityId);
    });

    std::cout << "[ARENA] Initialized: radius " << config_.arenaRadius << ", "
              << config_.obstacles.size() << " obstacles, " << config_.jumpPads.size()
              << " jump pads, " << abilityRegistry_.size() << " abilities, seed "
              << config_.seed << std::endl;
}

ArenaSimulation::~ArenaSimulation() = default;

// ============================================================================
// Join / leave
// ============================================================================

EntityID ArenaSimulation::addPlayer(const std::string& controllerId, const std::string& displayName) {
    auto existing = controllers_.find(controllerId);
    if (existing != controllers_.end()) {
        return existing->second;
    }
    if (controllers_.size() >= config_.maxPlayers) {
        std::cout << "[ARENA] Rejected " << controllerId << ": arena full ("
                  << config_.maxPlayers << " players)" << std::endl;
        return entt::null;
    }

    const EntityID entity = registry_.create();

    PlayerInfo info;
    info.controllerId = controllerId;
    info.displayName = displayName.empty() ? controllerId : displayName;
    info.color = std::string(SharedConstants::PLAYER_COLORS[colorCursor_ % SharedConstants::PLAYER_COLORS.size()]);
    info.joinTimeMs = currentTimeMs_;
    ++colorCursor_;
    registry_.emplace<PlayerInfo>(entity, std::move(info));
    registry_.emplace<PlayerTag>(entity);

    const TeamId team = objective_.assignPlayer(entity);
    registry_.emplace<TeamMember>(entity, TeamMember{team});

    health_.initialize(registry_, entity);
    abilities_.initialize(registry_, entity);
    registry_.emplace<PlayerStats>(entity);
    registry_.emplace<ShipMotion>(entity);
    registry_.emplace<WeaponState>(entity);
    registry_.emplace<ControllerInput>(entity);

    BodyDesc body;
    body.position = objective_.getBasePosition(team) + glm::vec3(0.0f, config_.spawnHeightOffset, 0.0f);
    physics_->createBody(entity, body);
    placeAtBase(entity);

    controllers_.emplace(controllerId, entity);

    std::cout << "[ARENA] Player " << controllerId << " joined team " << teamLabel(team)
              << " (" << controllers_.size() << "/" << config_.maxPlayers << ")" << std::endl;
    emit(GameEventType::PLAYER_JOINED, entity, entt::null, team, body.position, 0, controllerId);
    return entity;
}

EntityID ArenaSimulation::addBot() {
    if (controllers_.size() >= config_.maxPlayers) {
        std::cout << "[ARENA] Cannot add bot: arena full" << std::endl;
        return entt::null;
    }

    const std::string id = generateBotId();
    const EntityID entity = addPlayer(id, id);
    if (entity == entt::null) {
        return entity;
    }

    registry_.get<PlayerInfo>(entity).isBot = true;
    registry_.emplace<BotTag>(entity);
    bots_.emplace(entity, BotController(config_.bots));
    return entity;
}

bool ArenaSimulation::removePlayer(const std::string& controllerId) {
    auto it = controllers_.find(controllerId);
    if (it == controllers_.end()) {
        return false;
    }
    const EntityID entity = it->second;

    const auto team = objective_.getTeam(entity);
    const auto carried = objective_.getCarriedFlag(entity);
    const ObjectiveResult result = objective_.removePlayer(entity);
    if (carried) {
        emitObjective(result, entity, *carried);
    }

    abilities_.clear(registry_, entity, currentTimeMs_);
    projectiles_.removeOwnedBy(registry_, entity);
    physics_->destroyBody(entity);
    inputs_.remove(controllerId);
    bots_.erase(entity);

    for (auto pad = padReadyAtMs_.begin(); pad != padReadyAtMs_.end();) {
        pad = pad->first.first == entity ? padReadyAtMs_.erase(pad) : std::next(pad);
    }

    emit(GameEventType::PLAYER_LEFT, entity, entt::null, team, glm::vec3(0.0f), 0, controllerId);
    std::cout << "[ARENA] Player " << controllerId << " left ("
              << controllers_.size() - 1 << "/" << config_.maxPlayers << ")" << std::endl;

    controllers_.erase(it);
    registry_.destroy(entity);
    return true;
}

bool ArenaSimulation::submitInput(const std::string& controllerId, const ControllerInput& input) {
    if (controllers_.find(controllerId) == controllers_.end()) {
        return false;
    }
    return inputs_.submit(controllerId, input);
}

// ============================================================================
// Tick
// ============================================================================

void ArenaSimulation::tick(float dt) {
    if (!(dt > 0.0f)) {
        return;
    }
    dt = std::min(dt, Constants::MAX_TICK_DT_SECONDS);

    // 1. Clock
    elapsedSec_ += dt;
    currentTimeMs_ = static_cast<uint32_t>(std::llround(elapsedSec_ * 1000.0));
    ++currentTick_;

    // 2-5. Input, deaths, abilities, weapons
    gatherInputs();
    updateDeaths();
    updateAbilityTriggers();
    updateWeapons();

    // 6-7. Velocities and projectiles
    movement_.update(registry_, *physics_, dt);
    projectiles_.update(registry_, *physics_, dt, currentTimeMs_);

    // 8-9. Physics, then react to what it found
    syncObjectiveSensors();
    physics_->step(dt);
    syncCarriedFlags();
    dispatchIntersections();

    // 10-12. Housekeeping
    abilities_.clearExpired(registry_, currentTimeMs_);
    pickups_.update(registry_, *physics_, currentTimeMs_, rng_);
    refreshCameraCache();
}

void ArenaSimulation::gatherInputs() {
    for (const auto& [controllerId, entity] : controllers_) {
        ControllerInput input;
        auto bot = bots_.find(entity);
        if (bot != bots_.end()) {
            input = bot->second.update(makeContext(entity), currentTimeMs_, rng_);
        } else {
            input = inputs_.pop(controllerId);
        }
        registry_.emplace_or_replace<ControllerInput>(entity, input.clamped());
    }
}

void ArenaSimulation::updateDeaths() {
    // Death callbacks run inside collectDeaths
    health_.collectDeaths(registry_);

    std::vector<EntityID> ready;
    auto view = registry_.view<const PlayerTag, const HealthState>();
    for (EntityID entity : view) {
        const HealthState& health = view.get<const HealthState>(entity);
        if (health.isDead && currentTimeMs_ >= health.respawnAtMs) {
            ready.push_back(entity);
        }
    }
    for (EntityID entity : ready) {
        respawnPlayer(entity);
    }
}

void ArenaSimulation::updateAbilityTriggers() {
    auto view = registry_.view<const PlayerTag, const ControllerInput, const HealthState>();
    std::vector<EntityID> triggered;
    for (EntityID entity : view) {
        if (view.get<const ControllerInput>(entity).ability &&
            !view.get<const HealthState>(entity).isDead) {
            triggered.push_back(entity);
        }
    }

    for (EntityID entity : triggered) {
        const auto held = abilities_.getHeldAbility(registry_, entity);
        if (held && abilities_.activateHeld(registry_, entity, currentTimeMs_)) {
            glm::vec3 position(0.0f);
            if (auto body = physics_->getBodyState(entity)) {
                position = body->position;
            }
            emit(GameEventType::ABILITY_ACTIVATED, entity, entt::null, objective_.getTeam(entity),
                 position, 0, *held);
        }
    }
}

void ArenaSimulation::updateWeapons() {
    std::vector<std::pair<EntityID, bool>> triggers;
    auto view = registry_.view<const PlayerTag, const ControllerInput, const HealthState>();
    for (EntityID entity : view) {
        if (!view.get<const HealthState>(entity).isDead) {
            triggers.emplace_back(entity, view.get<const ControllerInput>(entity).action);
        }
    }

    for (const auto& [entity, pressed] : triggers) {
        if (projectiles_.handleTrigger(registry_, *physics_, entity, pressed, currentTimeMs_)) {
            emit(GameEventType::PROJECTILE_FIRED, entity, entt::null, objective_.getTeam(entity),
                 glm::vec3(0.0f), 2, "bolt");
        }
    }
}

void ArenaSimulation::syncObjectiveSensors() {
    for (TeamId team : ALL_TEAMS) {
        physics_->moveSensor(flagSensors_[teamIndex(team)], objective_.getFlag(team).position);
        physics_->moveSensor(baseSensors_[teamIndex(team)], objective_.getBasePosition(team));
    }
}

void ArenaSimulation::syncCarriedFlags() {
    for (const FlagState& flag : objective_.getFlags()) {
        if (flag.status != FlagStatus::CARRIED) {
            continue;
        }
        if (auto body = physics_->getBodyState(flag.carrier)) {
            objective_.syncCarrierPosition(flag.carrier, body->position);
        }
    }
}

void ArenaSimulation::dispatchIntersections() {
    const std::vector<IntersectionEvent> events = physics_->drainIntersectionEvents();
    for (const IntersectionEvent& event : events) {
        const EntityID player = event.body;
        if (!registry_.valid(player) || !registry_.all_of<PlayerTag>(player)) {
            continue;
        }
        // Lethal hits from this tick's projectiles are only flagged dead next tick
        const auto health = health_.getHealth(registry_, player);
        if (health_.isDead(registry_, player) || (health && *health <= 0)) {
            continue;
        }

        switch (event.kind) {
            case SensorKind::FLAG:
                if (event.key < SharedConstants::TEAM_COUNT) {
                    onFlagContact(player, static_cast<TeamId>(event.key));
                }
                break;
            case SensorKind::BASE:
                if (event.key < SharedConstants::TEAM_COUNT) {
                    onBaseContact(player, static_cast<TeamId>(event.key));
                }
                break;
            case SensorKind::PICKUP:
                onPickupContact(player, event.key);
                break;
            case SensorKind::JUMP_PAD:
                onJumpPadContact(player, event.key);
                break;
        }
    }
}

void ArenaSimulation::refreshCameraCache() {
    auto view = registry_.view<const PlayerTag>();
    for (EntityID entity : view) {
        if (auto body = physics_->getBodyState(entity)) {
            registry_.emplace_or_replace<CachedTransform>(entity,
                                                          CachedTransform{body->position, body->rotation});
        }
    }
}

// ============================================================================
// Intersection handlers
// ============================================================================

void ArenaSimulation::onFlagContact(EntityID player, TeamId flagTeam) {
    emitObjective(objective_.tryPickupFlag(player, flagTeam), player, flagTeam);
}

void ArenaSimulation::onBaseContact(EntityID player, TeamId baseTeam) {
    const ObjectiveResult result = objective_.handleBaseEntry(player, baseTeam);
    // Scoring at one's own base concerns the enemy flag
    const TeamId flagTeam = result == ObjectiveResult::CAPTURED ? opposingTeam(baseTeam) : baseTeam;
    emitObjective(result, player, flagTeam);
}

void ArenaSimulation::onPickupContact(EntityID player, uint32_t sensorKey) {
    const EntityID pickup = PickupSpawner::entityFromSensorKey(sensorKey);
    if (!registry_.valid(pickup)) {
        return;
    }
    const Pickup* data = registry_.try_get<Pickup>(pickup);
    if (!data) {
        return;
    }

    if (!abilities_.collect(registry_, player, data->abilityId)) {
        return;  // Slot occupied, pickup stays
    }

    const std::string abilityId = data->abilityId;
    const glm::vec3 position = data->position;
    pickups_.removePickup(registry_, *physics_, pickup);
    emit(GameEventType::ABILITY_COLLECTED, player, entt::null, objective_.getTeam(player), position,
         0, abilityId);
}

void ArenaSimulation::onJumpPadContact(EntityID player, uint32_t padId) {
    auto pad = std::find_if(config_.jumpPads.begin(), config_.jumpPads.end(),
                            [padId](const JumpPad& candidate) { return candidate.id == padId; });
    if (pad == config_.jumpPads.end()) {
        return;
    }

    const auto key = std::make_pair(player, padId);
    auto ready = padReadyAtMs_.find(key);
    if (ready != padReadyAtMs_.end() && currentTimeMs_ < ready->second) {
        return;
    }

    auto body = physics_->getBodyState(player);
    if (!body) {
        return;
    }
    glm::vec3 velocity = body->linearVelocity;
    velocity.y = pad->launchVelocity;
    physics_->setLinearVelocity(player, velocity);

    padReadyAtMs_[key] = currentTimeMs_ + static_cast<uint32_t>(pad->cooldownSec * 1000.0f);
    emit(GameEventType::JUMP_PAD_LAUNCH, player, entt::null, objective_.getTeam(player),
         pad->position, static_cast<int32_t>(pad->id));
}

// ============================================================================
// Death and respawn
// ============================================================================

void ArenaSimulation::onPlayerDied(EntityID victim, EntityID killer) {
    glm::vec3 position(0.0f);
    if (auto body = physics_->getBodyState(victim)) {
        position = body->position;
    }

    const auto carried = objective_.getCarriedFlag(victim);
    if (carried) {
        glm::vec3 dropAt = position - glm::vec3(0.0f, config_.movement.hoverHeight, 0.0f);
        dropAt.y = std::max(dropAt.y, 0.0f);
        emitObjective(objective_.dropFlag(victim, dropAt), victim, *carried);
    }

    physics_->setLinearVelocity(victim, glm::vec3(0.0f));
    physics_->setAngularVelocity(victim, glm::vec3(0.0f));
    physics_->setBodyEnabled(victim, false);

    if (HealthState* health = registry_.try_get<HealthState>(victim)) {
        health->respawnAtMs = currentTimeMs_
            + static_cast<uint32_t>(health_.getConfig().respawnDelaySec * 1000.0f);
    }

    std::cout << "[ARENA] " << describe(victim) << " was destroyed";
    if (killer != entt::null && registry_.valid(killer)) {
        std::cout << " by " << describe(killer);
    }
    std::cout << std::endl;

    emit(GameEventType::PLAYER_DIED, victim, killer, objective_.getTeam(victim), position);
}

void ArenaSimulation::respawnPlayer(EntityID player) {
    health_.respawn(registry_, player);
    placeAtBase(player);
    physics_->setBodyEnabled(player, true);

    glm::vec3 position(0.0f);
    if (auto body = physics_->getBodyState(player)) {
        position = body->position;
    }
    emit(GameEventType::PLAYER_RESPAWNED, player, entt::null, objective_.getTeam(player), position);
}

void ArenaSimulation::placeAtBase(EntityID player) {
    const auto team = objective_.getTeam(player);
    if (!team) {
        return;
    }
    const glm::vec3 base = objective_.getBasePosition(*team);
    const glm::vec3 spawn = base + glm::vec3(0.0f, config_.spawnHeightOffset, 0.0f);

    // Face the arena centre
    const float yaw = (std::abs(base.x) + std::abs(base.z) > 1e-4f) ? std::atan2(base.x, base.z) : 0.0f;

    ShipMotion& motion = registry_.get_or_emplace<ShipMotion>(player);
    MovementSystem::resetMotion(motion, yaw);

    physics_->setTranslation(player, spawn);
    physics_->setRotation(player, motion.rotation());
    physics_->setLinearVelocity(player, glm::vec3(0.0f));
    physics_->setAngularVelocity(player, glm::vec3(0.0f));
}

// ============================================================================
// Events
// ============================================================================

void ArenaSimulation::emitObjective(ObjectiveResult result, EntityID player, TeamId flagTeam) {
    const glm::vec3 position = objective_.getFlag(flagTeam).position;
    switch (result) {
        case ObjectiveResult::NONE:
            return;
        case ObjectiveResult::PICKED_UP:
            std::cout << "[CTF] " << describe(player) << " took the " << teamLabel(flagTeam)
                      << " flag" << std::endl;
            emit(GameEventType::FLAG_PICKED_UP, player, entt::null, flagTeam, position);
            return;
        case ObjectiveResult::RETURNED:
            emit(GameEventType::FLAG_RETURNED, player, entt::null, flagTeam, position);
            return;
        case ObjectiveResult::DROPPED:
            emit(GameEventType::FLAG_DROPPED, player, entt::null, flagTeam, position);
            return;
        case ObjectiveResult::CAPTURED: {
            const TeamId scorer = opposingTeam(flagTeam);
            emit(GameEventType::FLAG_CAPTURED, player, entt::null, scorer, position,
                 static_cast<int32_t>(objective_.getScore(scorer)), std::string(teamLabel(flagTeam)));
            return;
        }
    }
}

void ArenaSimulation::emit(GameEventType type, EntityID subject, EntityID other,
                           std::optional<TeamId> team, const glm::vec3& position,
                           int32_t amount, std::string detail) {
    if (!onEvent_) {
        return;
    }
    GameEvent event;
    event.type = type;
    event.subject = subject;
    event.other = other;
    event.team = team;
    event.position = position;
    event.amount = amount;
    event.detail = std::move(detail);
    event.timeMs = currentTimeMs_;
    onEvent_(event);
}

// ============================================================================
// Queries
// ============================================================================

GameContext ArenaSimulation::makeContext(EntityID self) const {
    return GameContext(registry_, *physics_, objective_, config_.jumpPads, self);
}

EntityID ArenaSimulation::findPlayer(const std::string& controllerId) const {
    auto it = controllers_.find(controllerId);
    return it != controllers_.end() ? it->second : entt::null;
}

std::optional<CachedTransform> ArenaSimulation::getCachedTransform(const std::string& controllerId) const {
    const EntityID entity = findPlayer(controllerId);
    if (entity == entt::null) {
        return std::nullopt;
    }
    if (const CachedTransform* cached = registry_.try_get<CachedTransform>(entity)) {
        return *cached;
    }
    return std::nullopt;
}

BotController* ArenaSimulation::getBotController(EntityID bot) {
    auto it = bots_.find(bot);
    return it != bots_.end() ? &it->second : nullptr;
}

std::string ArenaSimulation::generateBotId() {
    static constexpr char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

    std::string id;
    do {
        id = "bot-";
        for (uint32_t i = 0; i < SharedConstants::BOT_ID_SUFFIX_LENGTH; ++i) {
            id += alphabet[pick(rng_)];
        }
    } while (controllers_.count(id) > 0);
    return id;
}

std::string ArenaSimulation::describe(EntityID player) const {
    if (const PlayerInfo* info = registry_.try_get<PlayerInfo>(player)) {
        return info->displayName;
    }
    return "entity " + std::to_string(entt::to_integral(player));
}

} // namespace SkyClash
