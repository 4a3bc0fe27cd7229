#pragma once

#include "SpatialAccess.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace Vicinity {

/**
 * @brief One entity's movement as reported by the host for a frame
 */
struct MovementObservation {
    EntityId entity = 0;
    glm::vec3 oldPosition{0.0f};
    glm::vec3 newPosition{0.0f};
};

/**
 * @brief Supplies the full current (position, entity) set of a category
 */
using SnapshotSupplier = std::function<std::vector<SpatialEntry>()>;

/**
 * @brief Outcome of one ApplyFrame() call
 */
struct FrameReport {
    size_t observed = 0;
    size_t ignored = 0;        // Below the movement threshold
    size_t moved = 0;          // At or above the movement threshold
    size_t patched = 0;        // Applied as RemoveEntity + AddPoint
    bool recreated = false;    // Whole index rebuilt instead of patched
};

/**
 * @brief Cumulative maintenance counters for profiling
 */
struct MaintenanceStats {
    uint64_t frames = 0;
    uint64_t observations = 0;
    uint64_t ignored = 0;
    uint64_t patches = 0;
    uint64_t rebuilds = 0;

    void Reset() noexcept {
        frames = 0;
        observations = 0;
        ignored = 0;
        patches = 0;
        rebuilds = 0;
    }
};

/**
 * @brief Per-category policy choosing between point patches and bulk rebuilds
 *
 * For every frame the driver measures each observation's squared
 * displacement from the entity's committed position (the position last
 * written into the index, or the observation's old position if the driver
 * has no record). Displacements below the index's min moved threshold are
 * ignored. If more entities moved than the index's recreate-after count, the
 * frame applies no patches and performs exactly one Recreate() from the full
 * snapshot; otherwise every moved entity is patched with RemoveEntity()
 * followed by AddPoint().
 *
 * The driver does not own the index.
 */
class MaintenanceDriver {
public:
    explicit MaintenanceDriver(ISpatialAccess& access);

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Start tracking an entity at position
     *
     * Tracking an entity that is already tracked moves its single index
     * entry to position.
     */
    void Track(EntityId entity, const glm::vec3& position);

    /**
     * @brief Stop tracking an entity and remove it from the index
     * @return true if the index held an entry for it
     */
    bool Untrack(EntityId entity);

    /**
     * @brief Replace the index content with snapshot and commit every position
     *
     * Use this for the initial load of a category instead of calling
     * ISpatialAccess::Recreate() directly, which leaves the driver without
     * committed positions.
     */
    void Load(std::vector<SpatialEntry> snapshot);

    [[nodiscard]] bool IsTracked(EntityId entity) const;
    [[nodiscard]] std::optional<glm::vec3> GetCommittedPosition(EntityId entity) const;
    [[nodiscard]] size_t GetTrackedCount() const noexcept { return m_committed.size(); }

    // =========================================================================
    // Per-frame maintenance
    // =========================================================================

    /**
     * @brief Apply one frame of movement observations
     * @param observations Entities whose position changed this frame
     * @param snapshot Full current snapshot, called only when rebuilding. If
     *        empty, the snapshot is assembled from committed positions
     *        updated with this frame's observations.
     */
    FrameReport ApplyFrame(std::span<const MovementObservation> observations,
                           const SnapshotSupplier& snapshot = {});

    [[nodiscard]] const MaintenanceStats& GetStats() const noexcept { return m_stats; }
    void ResetStats() noexcept { m_stats.Reset(); }

    [[nodiscard]] ISpatialAccess& GetAccess() noexcept { return *m_access; }
    [[nodiscard]] const ISpatialAccess& GetAccess() const noexcept { return *m_access; }

private:
    std::vector<SpatialEntry> BuildSnapshot(std::span<const MovementObservation> observations) const;

    ISpatialAccess* m_access;
    std::unordered_map<EntityId, glm::vec3> m_committed;
    MaintenanceStats m_stats;
};

} // namespace Vicinity
