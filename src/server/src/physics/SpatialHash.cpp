// [PHYSICS_AGENT] Spatial hash implementation

#include "physics/SpatialHash.hpp"
#include <cmath>
#include <algorithm>

namespace SkyClash {

SpatialHash::SpatialHash() : SpatialHash(DEFAULT_CELL_SIZE) {}

SpatialHash::SpatialHash(float cellSize)
    : cellSize_(cellSize > 0.0f ? cellSize : DEFAULT_CELL_SIZE)
    , invCellSize_(1.0f / cellSize_)
{
    queryBuffer_.reserve(64);
}

void SpatialHash::clear() {
    for (auto& [coord, cell] : grid_) {
        cell.entities.clear();
    }
}

SpatialHash::CellCoord SpatialHash::getCellCoord(float x, float z) const {
    return {
        static_cast<int32_t>(std::floor(x * invCellSize_)),
        static_cast<int32_t>(std::floor(z * invCellSize_))
    };
}

const SpatialHash::Cell* SpatialHash::getCell(const CellCoord& coord) const {
    auto it = grid_.find(coord);
    return it != grid_.end() ? &it->second : nullptr;
}

void SpatialHash::insert(EntityID entity, float x, float z) {
    Cell& cell = grid_[getCellCoord(x, z)];
    if (std::find(cell.entities.begin(), cell.entities.end(), entity) == cell.entities.end()) {
        cell.entities.push_back(entity);
    }
}

void SpatialHash::insert(EntityID entity, const glm::vec3& position) {
    insert(entity, position.x, position.z);
}

void SpatialHash::remove(EntityID entity) {
    // Full scan; prefer update() when the old position is known
    for (auto& [coord, cell] : grid_) {
        auto it = std::remove(cell.entities.begin(), cell.entities.end(), entity);
        if (it != cell.entities.end()) {
            cell.entities.erase(it, cell.entities.end());
            return;
        }
    }
}

void SpatialHash::update(EntityID entity, float oldX, float oldZ, float newX, float newZ) {
    CellCoord oldCoord = getCellCoord(oldX, oldZ);
    CellCoord newCoord = getCellCoord(newX, newZ);
    if (oldCoord == newCoord) {
        return;
    }

    auto oldIt = grid_.find(oldCoord);
    if (oldIt != grid_.end()) {
        auto& entities = oldIt->second.entities;
        entities.erase(std::remove(entities.begin(), entities.end(), entity), entities.end());
    }
    insert(entity, newX, newZ);
}

std::span<const EntityID> SpatialHash::query(float x, float z, float radius) const {
    queryBuffer_.clear();

    const CellCoord minCell = getCellCoord(x - radius, z - radius);
    const CellCoord maxCell = getCellCoord(x + radius, z + radius);

    for (int32_t cx = minCell.x; cx <= maxCell.x; ++cx) {
        for (int32_t cz = minCell.z; cz <= maxCell.z; ++cz) {
            if (const Cell* cell = getCell({cx, cz})) {
                queryBuffer_.insert(queryBuffer_.end(),
                                    cell->entities.begin(), cell->entities.end());
            }
        }
    }

    return std::span<const EntityID>(queryBuffer_);
}

std::span<const EntityID> SpatialHash::query(const glm::vec3& position, float radius) const {
    return query(position.x, position.z, radius);
}

size_t SpatialHash::getTotalEntityCount() const {
    size_t count = 0;
    for (const auto& [coord, cell] : grid_) {
        count += cell.entities.size();
    }
    return count;
}

} // namespace SkyClash
