/**
 * @file SpatialAccess.hpp
 * @brief Dimension-independent contract for per-category proximity indices
 *
 * ISpatialAccess is the interface hosts and the MaintenanceDriver talk to.
 * Positions cross it as glm::vec3 world coordinates; a 2D implementation
 * projects them onto the XY plane (see CoordinateAdapter).
 *
 * @section access_usage Basic Usage
 *
 * @code{.cpp}
 * auto access = Vicinity::CreateSpatialAccess(config);
 * access->Recreate(snapshot);
 *
 * if (auto nearest = access->NearestNeighbour(position)) {
 *     Target(nearest->entity);
 * }
 *
 * // Skip the first result when querying from a tracked entity's own position
 * for (const auto& entry : access->KNearestNeighbour(position, 5)) {
 *     if (entry.entity == self) continue;
 *     Consider(entry.entity);
 * }
 * @endcode
 *
 * @section access_contract Caller Contract
 *
 * The index never deduplicates. Updating an entity's position means
 * RemoveEntity() (or RemovePoint()) followed by AddPoint(); calling AddPoint()
 * twice for one entity leaves two entries until a removal or Recreate()
 * reconciles them. Recreate() with duplicate entities keeps all of them.
 */

#pragma once

#include "TrackedPoint.hpp"
#include <glm/glm.hpp>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace Vicinity {

/**
 * @brief A (position, entity) pair exchanged with the host
 */
struct SpatialEntry {
    glm::vec3 position{0.0f};
    EntityId entity = 0;

    [[nodiscard]] bool operator==(const SpatialEntry& other) const noexcept {
        return entity == other.entity && position == other.position;
    }
};

/**
 * @brief Uniform query and mutation contract over 2D and 3D indices
 */
class ISpatialAccess {
public:
    virtual ~ISpatialAccess() = default;

    // =========================================================================
    // Queries
    // =========================================================================

    /**
     * @brief Squared distance between two positions in the index's space
     *
     * 2D indices ignore the z component.
     */
    [[nodiscard]] virtual float DistanceSquared(const glm::vec3& a, const glm::vec3& b) const = 0;

    /**
     * @brief Closest tracked point to loc, or nullopt if the index is empty
     *
     * On ties any of the closest points may be returned.
     */
    [[nodiscard]] virtual std::optional<SpatialEntry> NearestNeighbour(const glm::vec3& loc) const = 0;

    /**
     * @brief Up to k points ordered by non-decreasing distance from loc
     *
     * If loc is the position of a tracked entity, that entity is included;
     * skip the first result if that is undesired.
     */
    [[nodiscard]] virtual std::vector<SpatialEntry> KNearestNeighbour(const glm::vec3& loc, size_t k) const = 0;

    /**
     * @brief All points whose distance to loc is <= radius, unordered
     */
    [[nodiscard]] virtual std::vector<SpatialEntry> WithinDistance(const glm::vec3& loc, float radius) const = 0;

    // =========================================================================
    // Mutation
    // =========================================================================

    /**
     * @brief Replace the whole index content by bulk loading all entries
     */
    virtual void Recreate(const std::vector<SpatialEntry>& all) = 0;

    /**
     * @brief Insert one point
     */
    virtual void AddPoint(const SpatialEntry& entry) = 0;

    /**
     * @brief Remove the entry matching both position and entity
     * @return true if an entry was found and removed
     */
    virtual bool RemovePoint(const SpatialEntry& entry) = 0;

    /**
     * @brief Remove every entry for entity, whatever position is stored
     * @return true if anything was removed
     */
    virtual bool RemoveEntity(EntityId entity) = 0;

    // =========================================================================
    // Information
    // =========================================================================

    [[nodiscard]] virtual size_t Size() const = 0;

    /**
     * @brief Squared displacement below which movement is not propagated
     */
    [[nodiscard]] virtual float GetMinMovedThreshold() const = 0;

    /**
     * @brief Moved entities per frame above which the index is rebuilt
     */
    [[nodiscard]] virtual size_t GetRecreateAfterCount() const = 0;

    [[nodiscard]] virtual int GetDimensions() const noexcept = 0;
    [[nodiscard]] virtual std::string_view GetTypeName() const noexcept = 0;

    /**
     * @brief Levels from root to leaves of the backing tree, for diagnostics
     */
    [[nodiscard]] virtual int GetTreeDepth() const = 0;

    /**
     * @brief Copy of every stored entry, in tree order
     */
    [[nodiscard]] virtual std::vector<SpatialEntry> GetAll() const = 0;
};

} // namespace Vicinity
