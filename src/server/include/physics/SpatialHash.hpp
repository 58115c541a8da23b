#pragma once

#include "ecs/CoreTypes.hpp"
#include <vector>
#include <unordered_map>
#include <cstdint>
#include <span>
#include <cstddef>
#include <glm/glm.hpp>

// [PHYSICS_AGENT] Spatial hash over the XZ plane
// Broad phase for body-vs-body and body-vs-sensor tests in the kinematic world

namespace SkyClash {

class SpatialHash {
public:
    static constexpr float DEFAULT_CELL_SIZE = Constants::SPATIAL_HASH_CELL_SIZE;

    struct CellCoord {
        int32_t x{0};
        int32_t z{0};

        bool operator==(const CellCoord& other) const {
            return x == other.x && z == other.z;
        }
    };

    struct CellHash {
        size_t operator()(const CellCoord& c) const {
            uint64_t key = (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) |
                           static_cast<uint32_t>(c.z);
            return std::hash<uint64_t>{}(key);
        }
    };

    struct Cell {
        std::vector<EntityID> entities;
    };

public:
    SpatialHash();
    explicit SpatialHash(float cellSize);

    // Empties every cell but keeps the allocated buckets
    void clear();

    void insert(EntityID entity, float x, float z);
    void insert(EntityID entity, const glm::vec3& position);

    // Candidates in every cell touched by the query circle. Callers do the exact test.
    // Returns a span into an internal buffer, invalidated by the next query.
    [[nodiscard]] std::span<const EntityID> query(float x, float z, float radius) const;
    [[nodiscard]] std::span<const EntityID> query(const glm::vec3& position, float radius) const;

    [[nodiscard]] CellCoord getCellCoord(float x, float z) const;
    [[nodiscard]] const Cell* getCell(const CellCoord& coord) const;

    void remove(EntityID entity);
    void update(EntityID entity, float oldX, float oldZ, float newX, float newZ);

    [[nodiscard]] size_t getCellCount() const { return grid_.size(); }
    [[nodiscard]] size_t getTotalEntityCount() const;
    [[nodiscard]] float getCellSize() const { return cellSize_; }

private:
    float cellSize_{DEFAULT_CELL_SIZE};
    float invCellSize_{1.0f / DEFAULT_CELL_SIZE};
    std::unordered_map<CellCoord, Cell, CellHash> grid_;
    mutable std::vector<EntityID> queryBuffer_;
};

} // namespace SkyClash
