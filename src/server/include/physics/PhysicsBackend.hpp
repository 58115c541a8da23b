#pragma once

#include "ecs/CoreTypes.hpp"
#include <cstdint>
#include <optional>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

// [PHYSICS_AGENT] Rigid-body collaborator interface
// The simulation core never integrates positions itself. It writes velocities,
// reads body state back, casts segments for projectiles and reacts to sensor
// intersections reported after each step.

namespace SkyClash {

struct BodyDesc {
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    float radius{Constants::SHIP_HULL_RADIUS};
    float mass{Constants::SHIP_MASS};
    float linearDamping{Constants::SHIP_LINEAR_DAMPING};
};

struct BodyState {
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    glm::vec3 linearVelocity{0.0f};
    glm::vec3 angularVelocity{0.0f};
};

struct RayHit {
    EntityID entity{entt::null};   // null for static geometry
    glm::vec3 point{0.0f};
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
    float distance{0.0f};
};

enum class SensorKind : uint8_t {
    FLAG = 0,
    BASE = 1,
    PICKUP = 2,
    JUMP_PAD = 3
};

// Vertical cylinder standing on center.y
struct SensorDesc {
    SensorKind kind{SensorKind::PICKUP};
    uint32_t key{0};               // Team index, pickup entity or pad id
    glm::vec3 center{0.0f};
    float radius{1.0f};
    float height{1.0f};
};

struct IntersectionEvent {
    EntityID body{entt::null};
    SensorKind kind{SensorKind::PICKUP};
    uint32_t key{0};
    uint32_t sensorId{0};
};

class PhysicsBackend {
public:
    virtual ~PhysicsBackend() = default;

    // Bodies (one per ship, keyed by the owning entity)
    virtual bool createBody(EntityID entity, const BodyDesc& desc) = 0;
    virtual void destroyBody(EntityID entity) = 0;
    [[nodiscard]] virtual bool hasBody(EntityID entity) const = 0;
    virtual void setBodyEnabled(EntityID entity, bool enabled) = 0;
    [[nodiscard]] virtual bool isBodyEnabled(EntityID entity) const = 0;

    [[nodiscard]] virtual std::optional<BodyState> getBodyState(EntityID entity) const = 0;
    virtual void setTranslation(EntityID entity, const glm::vec3& position) = 0;
    virtual void setRotation(EntityID entity, const glm::quat& rotation) = 0;
    virtual void setLinearVelocity(EntityID entity, const glm::vec3& velocity) = 0;
    virtual void setAngularVelocity(EntityID entity, const glm::vec3& velocity) = 0;
    virtual void applyImpulse(EntityID entity, const glm::vec3& impulse) = 0;

    // Segment casts. Disabled bodies are never hit.
    [[nodiscard]] virtual std::optional<RayHit> castRayAgainstBodies(
        const glm::vec3& from, const glm::vec3& to, EntityID exclude) const = 0;
    [[nodiscard]] virtual std::optional<RayHit> castRayAgainstStatic(
        const glm::vec3& from, const glm::vec3& to) const = 0;

    // Static geometry
    virtual void addObstacle(const Obstacle& obstacle) = 0;
    [[nodiscard]] virtual const std::vector<Obstacle>& getObstacles() const = 0;

    // Sensors report an event when an enabled body starts overlapping them
    virtual uint32_t addSensor(const SensorDesc& desc) = 0;
    virtual void moveSensor(uint32_t sensorId, const glm::vec3& center) = 0;
    virtual void removeSensor(uint32_t sensorId) = 0;

    // Integrates positions and queues intersection events
    virtual void step(float dt) = 0;

    // Events from the last step(s); callers mutate game state only after draining
    [[nodiscard]] virtual std::vector<IntersectionEvent> drainIntersectionEvents() = 0;
};

} // namespace SkyClash
