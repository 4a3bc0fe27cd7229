#include "spatial/MaintenanceDriver.hpp"
#include "core/Logger.hpp"

namespace Vicinity {

MaintenanceDriver::MaintenanceDriver(ISpatialAccess& access)
    : m_access(&access) {}

void MaintenanceDriver::Track(EntityId entity, const glm::vec3& position) {
    if (m_committed.contains(entity) && !m_access->RemoveEntity(entity)) {
        VICINITY_LOG_WARN("Entity {} was tracked but missing from {} index", entity, m_access->GetTypeName());
    }
    m_access->AddPoint(SpatialEntry{position, entity});
    m_committed[entity] = position;
}

bool MaintenanceDriver::Untrack(EntityId entity) {
    m_committed.erase(entity);
    return m_access->RemoveEntity(entity);
}

bool MaintenanceDriver::IsTracked(EntityId entity) const {
    return m_committed.contains(entity);
}

std::optional<glm::vec3> MaintenanceDriver::GetCommittedPosition(EntityId entity) const {
    auto it = m_committed.find(entity);
    if (it == m_committed.end()) {
        return std::nullopt;
    }
    return it->second;
}

FrameReport MaintenanceDriver::ApplyFrame(std::span<const MovementObservation> observations,
                                          const SnapshotSupplier& snapshot) {
    FrameReport report;
    report.observed = observations.size();

    const float threshold = m_access->GetMinMovedThreshold();

    // Classify everything first so a rebuild frame applies no patches at all
    std::vector<const MovementObservation*> moved;
    moved.reserve(observations.size());
    for (const auto& observation : observations) {
        auto it = m_committed.find(observation.entity);
        const glm::vec3& from = it != m_committed.end() ? it->second : observation.oldPosition;

        if (m_access->DistanceSquared(from, observation.newPosition) < threshold) {
            ++report.ignored;
            continue;
        }
        moved.push_back(&observation);
    }
    report.moved = moved.size();

    if (moved.size() > m_access->GetRecreateAfterCount()) {
        VICINITY_LOG_DEBUG("{} entities moved (limit {}), rebuilding {} index",
                           moved.size(), m_access->GetRecreateAfterCount(), m_access->GetTypeName());
        Load(snapshot ? snapshot() : BuildSnapshot(observations));
        report.recreated = true;
        ++m_stats.rebuilds;
    } else {
        for (const auto* observation : moved) {
            if (!m_access->RemoveEntity(observation->entity)) {
                VICINITY_LOG_TRACE("Entity {} was not indexed yet, inserting", observation->entity);
            }
            m_access->AddPoint(SpatialEntry{observation->newPosition, observation->entity});
            m_committed[observation->entity] = observation->newPosition;
            ++report.patched;
        }
        if (report.patched > 0) {
            VICINITY_LOG_TRACE("Patched {} entities in {} index", report.patched, m_access->GetTypeName());
        }
    }

    ++m_stats.frames;
    m_stats.observations += report.observed;
    m_stats.ignored += report.ignored;
    m_stats.patches += report.patched;
    return report;
}

std::vector<SpatialEntry> MaintenanceDriver::BuildSnapshot(
    std::span<const MovementObservation> observations) const {
    std::unordered_map<EntityId, glm::vec3> current = m_committed;
    for (const auto& observation : observations) {
        current[observation.entity] = observation.newPosition;
    }

    std::vector<SpatialEntry> snapshot;
    snapshot.reserve(current.size());
    for (const auto& [entity, position] : current) {
        snapshot.push_back(SpatialEntry{position, entity});
    }
    return snapshot;
}

void MaintenanceDriver::Load(std::vector<SpatialEntry> snapshot) {
    m_committed.clear();
    for (const auto& entry : snapshot) {
        m_committed[entry.entity] = entry.position;
    }
    m_access->Recreate(snapshot);
}

} // namespace Vicinity
