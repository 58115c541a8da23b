// [PHYSICS_AGENT] Kinematic backend implementation

#include "physics/KinematicPhysicsWorld.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

namespace SkyClash {

namespace {
constexpr float EPSILON = 1e-6f;
}

// ============================================================================
// Geometry
// ============================================================================

namespace Geometry {

glm::vec3 rotateY(const glm::vec3& v, float angle) {
    const float c = std::cos(angle);
    const float s = std::sin(angle);
    return glm::vec3(v.x * c + v.z * s, v.y, -v.x * s + v.z * c);
}

std::optional<float> segmentSphere(const glm::vec3& from, const glm::vec3& to,
                                   const glm::vec3& center, float radius) {
    const glm::vec3 d = to - from;
    const glm::vec3 f = from - center;
    const float c = glm::dot(f, f) - radius * radius;
    if (c <= 0.0f) {
        return 0.0f;  // Segment starts inside
    }

    const float a = glm::dot(d, d);
    if (a < EPSILON) {
        return std::nullopt;
    }
    const float b = 2.0f * glm::dot(f, d);
    const float disc = b * b - 4.0f * a * c;
    if (disc < 0.0f) {
        return std::nullopt;
    }

    const float t = (-b - std::sqrt(disc)) / (2.0f * a);
    if (t < 0.0f || t > 1.0f) {
        return std::nullopt;
    }
    return t;
}

std::optional<std::pair<float, glm::vec3>> segmentObstacle(
    const glm::vec3& from, const glm::vec3& to, const Obstacle& box) {
    // Slab test in the box's local frame
    const glm::vec3 o = rotateY(from - box.center, -box.yaw);
    const glm::vec3 d = rotateY(to - box.center, -box.yaw) - o;

    float tMin = 0.0f;
    float tMax = 1.0f;
    int entryAxis = -1;
    float entrySign = 0.0f;

    for (int axis = 0; axis < 3; ++axis) {
        const float h = box.halfExtents[axis];
        if (std::abs(d[axis]) < EPSILON) {
            if (o[axis] < -h || o[axis] > h) {
                return std::nullopt;
            }
            continue;
        }

        const float inv = 1.0f / d[axis];
        float t1 = (-h - o[axis]) * inv;
        float t2 = (h - o[axis]) * inv;
        float sign = -1.0f;  // Entering through the negative face
        if (t1 > t2) {
            std::swap(t1, t2);
            sign = 1.0f;
        }
        if (t1 > tMin) {
            tMin = t1;
            entryAxis = axis;
            entrySign = sign;
        }
        tMax = std::min(tMax, t2);
        if (tMin > tMax) {
            return std::nullopt;
        }
    }

    if (entryAxis < 0) {
        return std::nullopt;  // Started inside the box
    }

    glm::vec3 localNormal(0.0f);
    localNormal[entryAxis] = entrySign;
    return std::make_pair(tMin, rotateY(localNormal, box.yaw));
}

} // namespace Geometry

// ============================================================================
// KinematicPhysicsWorld
// ============================================================================

KinematicPhysicsWorld::KinematicPhysicsWorld(const PhysicsConfig& config)
    : config_(config)
    , bodyHash_(config.cellSize) {}

bool KinematicPhysicsWorld::createBody(EntityID entity, const BodyDesc& desc) {
    if (bodies_.count(entity) > 0) {
        return false;
    }

    Body body;
    body.state.position = desc.position;
    body.state.rotation = desc.rotation;
    body.radius = desc.radius;
    body.inverseMass = desc.mass > 0.0f ? 1.0f / desc.mass : 0.0f;
    body.linearDamping = std::max(0.0f, desc.linearDamping);
    bodies_.emplace(entity, body);
    return true;
}

void KinematicPhysicsWorld::destroyBody(EntityID entity) {
    bodies_.erase(entity);
    for (auto it = overlaps_.begin(); it != overlaps_.end();) {
        it = it->first == entity ? overlaps_.erase(it) : std::next(it);
    }
}

bool KinematicPhysicsWorld::hasBody(EntityID entity) const {
    return bodies_.count(entity) > 0;
}

void KinematicPhysicsWorld::setBodyEnabled(EntityID entity, bool enabled) {
    auto it = bodies_.find(entity);
    if (it != bodies_.end()) {
        it->second.enabled = enabled;
    }
}

bool KinematicPhysicsWorld::isBodyEnabled(EntityID entity) const {
    auto it = bodies_.find(entity);
    return it != bodies_.end() && it->second.enabled;
}

std::optional<BodyState> KinematicPhysicsWorld::getBodyState(EntityID entity) const {
    auto it = bodies_.find(entity);
    if (it == bodies_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

void KinematicPhysicsWorld::setTranslation(EntityID entity, const glm::vec3& position) {
    auto it = bodies_.find(entity);
    if (it != bodies_.end()) {
        it->second.state.position = position;
    }
}

void KinematicPhysicsWorld::setRotation(EntityID entity, const glm::quat& rotation) {
    auto it = bodies_.find(entity);
    if (it != bodies_.end()) {
        it->second.state.rotation = glm::normalize(rotation);
    }
}

void KinematicPhysicsWorld::setLinearVelocity(EntityID entity, const glm::vec3& velocity) {
    auto it = bodies_.find(entity);
    if (it != bodies_.end()) {
        it->second.state.linearVelocity = velocity;
    }
}

void KinematicPhysicsWorld::setAngularVelocity(EntityID entity, const glm::vec3& velocity) {
    auto it = bodies_.find(entity);
    if (it != bodies_.end()) {
        it->second.state.angularVelocity = velocity;
    }
}

void KinematicPhysicsWorld::applyImpulse(EntityID entity, const glm::vec3& impulse) {
    auto it = bodies_.find(entity);
    if (it != bodies_.end() && it->second.enabled) {
        it->second.state.linearVelocity += impulse * it->second.inverseMass;
    }
}

std::optional<RayHit> KinematicPhysicsWorld::castRayAgainstBodies(
    const glm::vec3& from, const glm::vec3& to, EntityID exclude) const {
    std::optional<RayHit> best;
    float bestT = std::numeric_limits<float>::max();

    for (const auto& [entity, body] : bodies_) {
        if (entity == exclude || !body.enabled) {
            continue;
        }
        auto t = Geometry::segmentSphere(from, to, body.state.position, body.radius);
        if (!t || *t >= bestT) {
            continue;
        }

        bestT = *t;
        RayHit hit;
        hit.entity = entity;
        hit.point = from + (to - from) * bestT;
        const glm::vec3 outward = hit.point - body.state.position;
        const float len = glm::length(outward);
        hit.normal = len > EPSILON ? outward / len : glm::vec3(0.0f, 1.0f, 0.0f);
        hit.distance = glm::length(to - from) * bestT;
        best = hit;
    }

    return best;
}

std::optional<RayHit> KinematicPhysicsWorld::castRayAgainstStatic(
    const glm::vec3& from, const glm::vec3& to) const {
    std::optional<RayHit> best;
    float bestT = std::numeric_limits<float>::max();

    auto consider = [&](float t, const glm::vec3& normal) {
        if (t >= bestT) {
            return;
        }
        bestT = t;
        RayHit hit;
        hit.point = from + (to - from) * t;
        hit.normal = normal;
        hit.distance = glm::length(to - from) * t;
        best = hit;
    };

    if (config_.groundPlane && from.y >= 0.0f && to.y < 0.0f) {
        consider(from.y / (from.y - to.y), glm::vec3(0.0f, 1.0f, 0.0f));
    }

    for (const Obstacle& obstacle : obstacles_) {
        if (auto hit = Geometry::segmentObstacle(from, to, obstacle)) {
            consider(hit->first, hit->second);
        }
    }

    return best;
}

void KinematicPhysicsWorld::addObstacle(const Obstacle& obstacle) {
    obstacles_.push_back(obstacle);
}

uint32_t KinematicPhysicsWorld::addSensor(const SensorDesc& desc) {
    const uint32_t id = nextSensorId_++;
    sensors_.emplace(id, Sensor{desc});
    return id;
}

void KinematicPhysicsWorld::moveSensor(uint32_t sensorId, const glm::vec3& center) {
    auto it = sensors_.find(sensorId);
    if (it != sensors_.end()) {
        it->second.desc.center = center;
    }
}

void KinematicPhysicsWorld::removeSensor(uint32_t sensorId) {
    sensors_.erase(sensorId);
    for (auto it = overlaps_.begin(); it != overlaps_.end();) {
        it = it->second == sensorId ? overlaps_.erase(it) : std::next(it);
    }
}

// ============================================================================
// Stepping
// ============================================================================

void KinematicPhysicsWorld::step(float dt) {
    if (dt <= 0.0f) {
        return;
    }

    for (auto& [entity, body] : bodies_) {
        if (!body.enabled) {
            continue;
        }
        integrate(body, dt);
        resolveStatic(body);
    }

    bodyHash_.clear();
    for (const auto& [entity, body] : bodies_) {
        if (body.enabled) {
            bodyHash_.insert(entity, body.state.position);
        }
    }

    if (config_.bodyCollisions) {
        resolveBodyPairs();
    }
    detectSensorOverlaps();
}

void KinematicPhysicsWorld::integrate(Body& body, float dt) const {
    BodyState& s = body.state;
    s.linearVelocity += config_.gravity * dt;
    if (body.linearDamping > 0.0f) {
        s.linearVelocity *= 1.0f / (1.0f + dt * body.linearDamping);
    }
    s.position += s.linearVelocity * dt;

    const float angularSpeed = glm::length(s.angularVelocity);
    if (angularSpeed > EPSILON) {
        s.rotation = glm::normalize(
            glm::angleAxis(angularSpeed * dt, s.angularVelocity / angularSpeed) * s.rotation);
    }
}

void KinematicPhysicsWorld::resolveStatic(Body& body) const {
    BodyState& s = body.state;

    auto removeInward = [&s](const glm::vec3& normal) {
        const float vn = glm::dot(s.linearVelocity, normal);
        if (vn < 0.0f) {
            s.linearVelocity -= normal * vn;
        }
    };

    if (config_.groundPlane && s.position.y < body.radius) {
        s.position.y = body.radius;
        removeInward(glm::vec3(0.0f, 1.0f, 0.0f));
    }

    // Arena wall
    const glm::vec2 flat(s.position.x, s.position.z);
    const float flatDist = glm::length(flat);
    const float wall = config_.arenaRadius - body.radius;
    if (flatDist > wall && flatDist > EPSILON) {
        const glm::vec2 dir = flat / flatDist;
        s.position.x = dir.x * wall;
        s.position.z = dir.y * wall;
        removeInward(glm::vec3(-dir.x, 0.0f, -dir.y));
    }

    for (const Obstacle& box : obstacles_) {
        const glm::vec3 local = Geometry::rotateY(s.position - box.center, -box.yaw);
        const glm::vec3 closest = glm::clamp(local, -box.halfExtents, box.halfExtents);
        const glm::vec3 delta = local - closest;
        const float dist = glm::length(delta);
        if (dist >= body.radius) {
            continue;
        }

        glm::vec3 localNormal;
        float push;
        if (dist > EPSILON) {
            localNormal = delta / dist;
            push = body.radius - dist;
        } else {
            // Centre inside the box: leave through the nearest face
            const glm::vec3 depth = box.halfExtents - glm::abs(local);
            int axis = 0;
            if (depth.y < depth[axis]) axis = 1;
            if (depth.z < depth[axis]) axis = 2;
            localNormal = glm::vec3(0.0f);
            localNormal[axis] = local[axis] >= 0.0f ? 1.0f : -1.0f;
            push = depth[axis] + body.radius;
        }

        const glm::vec3 normal = Geometry::rotateY(localNormal, box.yaw);
        s.position += normal * push;
        removeInward(normal);
    }
}

void KinematicPhysicsWorld::resolveBodyPairs() {
    for (auto& [entityA, bodyA] : bodies_) {
        if (!bodyA.enabled) {
            continue;
        }
        const auto nearby = bodyHash_.query(bodyA.state.position, bodyA.radius * 2.0f);
        const std::vector<EntityID> candidates(nearby.begin(), nearby.end());

        for (EntityID entityB : candidates) {
            if (!(entityA < entityB)) {
                continue;
            }
            auto it = bodies_.find(entityB);
            if (it == bodies_.end() || !it->second.enabled) {
                continue;
            }
            Body& bodyB = it->second;

            // Soft separation, each body moves half the overlap
            glm::vec3 delta = bodyA.state.position - bodyB.state.position;
            const float dist = glm::length(delta);
            const float minDist = bodyA.radius + bodyB.radius;
            if (dist >= minDist) {
                continue;
            }
            const glm::vec3 dir = dist > EPSILON ? delta / dist : glm::vec3(1.0f, 0.0f, 0.0f);
            const float overlap = (minDist - dist) * 0.5f;
            bodyA.state.position += dir * overlap;
            bodyB.state.position -= dir * overlap;
        }
    }
}

bool KinematicPhysicsWorld::sensorOverlaps(const Sensor& sensor, const Body& body) {
    const SensorDesc& d = sensor.desc;
    const glm::vec3& p = body.state.position;
    const float dx = p.x - d.center.x;
    const float dz = p.z - d.center.z;
    const float reach = d.radius + body.radius;
    if (dx * dx + dz * dz > reach * reach) {
        return false;
    }
    return p.y + body.radius >= d.center.y && p.y - body.radius <= d.center.y + d.height;
}

void KinematicPhysicsWorld::detectSensorOverlaps() {
    std::set<std::pair<EntityID, uint32_t>> current;

    for (const auto& [sensorId, sensor] : sensors_) {
        const auto nearby = bodyHash_.query(sensor.desc.center,
                                            sensor.desc.radius + Constants::SHIP_HULL_RADIUS * 2.0f);
        for (EntityID entity : nearby) {
            auto it = bodies_.find(entity);
            if (it == bodies_.end() || !it->second.enabled) {
                continue;
            }
            if (!sensorOverlaps(sensor, it->second)) {
                continue;
            }

            auto key = std::make_pair(entity, sensorId);
            current.insert(key);
            if (overlaps_.count(key) == 0) {
                pendingEvents_.push_back(
                    IntersectionEvent{entity, sensor.desc.kind, sensor.desc.key, sensorId});
            }
        }
    }

    overlaps_ = std::move(current);
}

std::vector<IntersectionEvent> KinematicPhysicsWorld::drainIntersectionEvents() {
    std::vector<IntersectionEvent> events;
    events.swap(pendingEvents_);
    return events;
}

} // namespace SkyClash
