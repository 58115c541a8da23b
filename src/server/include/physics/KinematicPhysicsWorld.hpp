#pragma once

#include "physics/PhysicsBackend.hpp"
#include "physics/SpatialHash.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <utility>
#include <vector>

// [PHYSICS_AGENT] Lightweight kinematic backend
// Sphere bodies, a ground plane, oriented box obstacles, a circular arena wall
// and cylinder sensors. Enough for the headless host and the test suite; real
// deployments can plug a full rigid-body engine in behind PhysicsBackend.

namespace SkyClash {

struct PhysicsConfig {
    float arenaRadius = Constants::ARENA_RADIUS;
    bool groundPlane = true;
    glm::vec3 gravity{0.0f};           // Ships supply their own vertical physics
    bool bodyCollisions = true;
    float cellSize = Constants::SPATIAL_HASH_CELL_SIZE;
};

class KinematicPhysicsWorld : public PhysicsBackend {
public:
    explicit KinematicPhysicsWorld(const PhysicsConfig& config = PhysicsConfig{});

    bool createBody(EntityID entity, const BodyDesc& desc) override;
    void destroyBody(EntityID entity) override;
    [[nodiscard]] bool hasBody(EntityID entity) const override;
    void setBodyEnabled(EntityID entity, bool enabled) override;
    [[nodiscard]] bool isBodyEnabled(EntityID entity) const override;

    [[nodiscard]] std::optional<BodyState> getBodyState(EntityID entity) const override;
    void setTranslation(EntityID entity, const glm::vec3& position) override;
    void setRotation(EntityID entity, const glm::quat& rotation) override;
    void setLinearVelocity(EntityID entity, const glm::vec3& velocity) override;
    void setAngularVelocity(EntityID entity, const glm::vec3& velocity) override;
    void applyImpulse(EntityID entity, const glm::vec3& impulse) override;

    [[nodiscard]] std::optional<RayHit> castRayAgainstBodies(
        const glm::vec3& from, const glm::vec3& to, EntityID exclude) const override;
    [[nodiscard]] std::optional<RayHit> castRayAgainstStatic(
        const glm::vec3& from, const glm::vec3& to) const override;

    void addObstacle(const Obstacle& obstacle) override;
    [[nodiscard]] const std::vector<Obstacle>& getObstacles() const override { return obstacles_; }

    uint32_t addSensor(const SensorDesc& desc) override;
    void moveSensor(uint32_t sensorId, const glm::vec3& center) override;
    void removeSensor(uint32_t sensorId) override;

    void step(float dt) override;
    [[nodiscard]] std::vector<IntersectionEvent> drainIntersectionEvents() override;

    [[nodiscard]] size_t getBodyCount() const { return bodies_.size(); }
    [[nodiscard]] size_t getSensorCount() const { return sensors_.size(); }
    [[nodiscard]] const PhysicsConfig& getConfig() const { return config_; }

private:
    struct Body {
        BodyState state;
        float radius{Constants::SHIP_HULL_RADIUS};
        float inverseMass{1.0f / Constants::SHIP_MASS};
        float linearDamping{0.0f};
        bool enabled{true};
    };

    struct Sensor {
        SensorDesc desc;
    };

    void integrate(Body& body, float dt) const;
    void resolveStatic(Body& body) const;
    void resolveBodyPairs();
    void detectSensorOverlaps();

    [[nodiscard]] static bool sensorOverlaps(const Sensor& sensor, const Body& body);

    PhysicsConfig config_;
    std::map<EntityID, Body> bodies_;
    std::map<uint32_t, Sensor> sensors_;
    std::vector<Obstacle> obstacles_;
    uint32_t nextSensorId_{1};

    SpatialHash bodyHash_;
    std::set<std::pair<EntityID, uint32_t>> overlaps_;
    std::vector<IntersectionEvent> pendingEvents_;
};

// [PHYSICS_AGENT] Geometry helpers shared with the tests
namespace Geometry {

// Rotates v around +Y by angle radians
[[nodiscard]] glm::vec3 rotateY(const glm::vec3& v, float angle);

// Segment [from, to] against a sphere; t in [0, 1]
[[nodiscard]] std::optional<float> segmentSphere(const glm::vec3& from, const glm::vec3& to,
                                                 const glm::vec3& center, float radius);

// Segment against an oriented box; returns t and the world-space surface normal
[[nodiscard]] std::optional<std::pair<float, glm::vec3>> segmentObstacle(
    const glm::vec3& from, const glm::vec3& to, const Obstacle& box);

} // namespace Geometry

} // namespace SkyClash
