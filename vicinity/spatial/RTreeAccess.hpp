#pragma once

#include "SpatialAccess.hpp"
#include "SpatialAccessConfig.hpp"
#include "RTree.hpp"
#include <memory>

namespace Vicinity {

/**
 * @brief ISpatialAccess backed by an RTree of the given dimensionality
 *
 * Owns one tree plus the two maintenance parameters of its category. The
 * parameters are fixed at construction.
 *
 * @tparam Dim 2 (XY plane projection) or 3
 */
template<glm::length_t Dim>
class RTreeAccess final : public ISpatialAccess {
public:
    using Tree = RTree<Dim>;
    using Point = typename Tree::Point;
    using Coord = typename Tree::Coord;
    using Adapter = CoordinateAdapter<Dim>;

    RTreeAccess();
    explicit RTreeAccess(const SpatialAccessConfig& config);
    RTreeAccess(float minMovedThreshold, size_t recreateAfterCount,
                const RTreeConfig& treeConfig = RTreeConfig());

    ~RTreeAccess() override = default;

    // Non-copyable, movable
    RTreeAccess(const RTreeAccess&) = delete;
    RTreeAccess& operator=(const RTreeAccess&) = delete;
    RTreeAccess(RTreeAccess&&) noexcept = default;
    RTreeAccess& operator=(RTreeAccess&&) noexcept = default;

    [[nodiscard]] float DistanceSquared(const glm::vec3& a, const glm::vec3& b) const override;
    [[nodiscard]] std::optional<SpatialEntry> NearestNeighbour(const glm::vec3& loc) const override;
    [[nodiscard]] std::vector<SpatialEntry> KNearestNeighbour(const glm::vec3& loc, size_t k) const override;
    [[nodiscard]] std::vector<SpatialEntry> WithinDistance(const glm::vec3& loc, float radius) const override;

    void Recreate(const std::vector<SpatialEntry>& all) override;
    void AddPoint(const SpatialEntry& entry) override;
    bool RemovePoint(const SpatialEntry& entry) override;
    bool RemoveEntity(EntityId entity) override;

    [[nodiscard]] size_t Size() const override { return m_tree.Size(); }
    [[nodiscard]] float GetMinMovedThreshold() const override { return m_minMovedThreshold; }
    [[nodiscard]] size_t GetRecreateAfterCount() const override { return m_recreateAfterCount; }
    [[nodiscard]] int GetDimensions() const noexcept override { return static_cast<int>(Dim); }
    [[nodiscard]] std::string_view GetTypeName() const noexcept override;
    [[nodiscard]] int GetTreeDepth() const override { return m_tree.GetDepth(); }
    [[nodiscard]] std::vector<SpatialEntry> GetAll() const override;

    /**
     * @brief Direct access to the tree, e.g. for lazy nearest neighbour iteration
     */
    [[nodiscard]] const Tree& GetTree() const noexcept { return m_tree; }

    [[nodiscard]] static Point ToPoint(const SpatialEntry& entry) noexcept {
        return Point(Adapter::FromWorld(entry.position), entry.entity);
    }

    [[nodiscard]] static SpatialEntry ToEntry(const Point& point) noexcept {
        return SpatialEntry{Adapter::ToWorld(point.GetPosition()), point.GetEntity()};
    }

private:
    Tree m_tree;
    float m_minMovedThreshold = 1.0f;
    size_t m_recreateAfterCount = 100;
};

using RTreeAccess2D = RTreeAccess<2>;
using RTreeAccess3D = RTreeAccess<3>;

extern template class RTreeAccess<2>;
extern template class RTreeAccess<3>;

/**
 * @brief Create the index matching config.dimensions
 */
[[nodiscard]] std::unique_ptr<ISpatialAccess> CreateSpatialAccess(const SpatialAccessConfig& config);

} // namespace Vicinity
