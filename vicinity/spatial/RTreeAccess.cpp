#include "spatial/RTreeAccess.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace Vicinity {

template<glm::length_t Dim>
RTreeAccess<Dim>::RTreeAccess()
    : RTreeAccess(SpatialAccessConfig()) {}

template<glm::length_t Dim>
RTreeAccess<Dim>::RTreeAccess(const SpatialAccessConfig& config)
    : RTreeAccess(config.minMovedThreshold, config.recreateAfterCount, config.tree) {}

template<glm::length_t Dim>
RTreeAccess<Dim>::RTreeAccess(float minMovedThreshold, size_t recreateAfterCount,
                              const RTreeConfig& treeConfig)
    : m_tree(treeConfig)
    , m_minMovedThreshold(minMovedThreshold >= 0.0f ? minMovedThreshold : 0.0f)
    , m_recreateAfterCount(recreateAfterCount) {}

template<glm::length_t Dim>
float RTreeAccess<Dim>::DistanceSquared(const glm::vec3& a, const glm::vec3& b) const {
    Coord d = Adapter::FromWorld(a) - Adapter::FromWorld(b);
    return glm::dot(d, d);
}

template<glm::length_t Dim>
std::optional<SpatialEntry> RTreeAccess<Dim>::NearestNeighbour(const glm::vec3& loc) const {
    auto nearest = m_tree.NearestNeighbour(Adapter::FromWorld(loc));
    if (!nearest) {
        return std::nullopt;
    }
    return ToEntry(*nearest);
}

template<glm::length_t Dim>
std::vector<SpatialEntry> RTreeAccess<Dim>::KNearestNeighbour(const glm::vec3& loc, size_t k) const {
    std::vector<SpatialEntry> results;
    if (k == 0) {
        return results;
    }
    results.reserve(std::min(k, m_tree.Size()));

    for (const auto& point : m_tree.NearestNeighbours(Adapter::FromWorld(loc))) {
        results.push_back(ToEntry(point));
        if (results.size() == k) {
            break;
        }
    }
    return results;
}

template<glm::length_t Dim>
std::vector<SpatialEntry> RTreeAccess<Dim>::WithinDistance(const glm::vec3& loc, float radius) const {
    std::vector<SpatialEntry> results;
    if (radius < 0.0f) {
        return results;
    }

    auto points = m_tree.LocateWithinDistance(Adapter::FromWorld(loc), radius * radius);
    results.reserve(points.size());
    for (const auto& point : points) {
        results.push_back(ToEntry(point));
    }
    return results;
}

template<glm::length_t Dim>
void RTreeAccess<Dim>::Recreate(const std::vector<SpatialEntry>& all) {
    std::vector<Point> points;
    points.reserve(all.size());
    for (const auto& entry : all) {
        points.push_back(ToPoint(entry));
    }

    m_tree = Tree::BulkLoad(std::move(points), m_tree.GetConfig());
    VICINITY_LOG_TRACE("{} recreated with {} points", GetTypeName(), m_tree.Size());
}

template<glm::length_t Dim>
void RTreeAccess<Dim>::AddPoint(const SpatialEntry& entry) {
    m_tree.Insert(ToPoint(entry));
}

template<glm::length_t Dim>
bool RTreeAccess<Dim>::RemovePoint(const SpatialEntry& entry) {
    return m_tree.Remove(ToPoint(entry));
}

template<glm::length_t Dim>
bool RTreeAccess<Dim>::RemoveEntity(EntityId entity) {
    // The stored coordinate is unknown here, so this scans the whole tree
    return m_tree.RemoveIf([entity](const Point& point) {
        return point.GetEntity() == entity;
    }) > 0;
}

template<glm::length_t Dim>
std::string_view RTreeAccess<Dim>::GetTypeName() const noexcept {
    if constexpr (Dim == 2) {
        return "RTreeAccess2D";
    } else {
        return "RTreeAccess3D";
    }
}

template<glm::length_t Dim>
std::vector<SpatialEntry> RTreeAccess<Dim>::GetAll() const {
    std::vector<SpatialEntry> entries;
    entries.reserve(m_tree.Size());
    m_tree.ForEach([&entries](const Point& point) {
        entries.push_back(ToEntry(point));
    });
    return entries;
}

template class RTreeAccess<2>;
template class RTreeAccess<3>;

std::unique_ptr<ISpatialAccess> CreateSpatialAccess(const SpatialAccessConfig& config) {
    switch (config.dimensions) {
        case 2:
            return std::make_unique<RTreeAccess2D>(config);

        case 3:
        default:
            return std::make_unique<RTreeAccess3D>(config);
    }
}

} // namespace Vicinity
