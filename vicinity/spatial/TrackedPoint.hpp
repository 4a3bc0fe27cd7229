#pragma once

#include "Envelope.hpp"
#include <glm/glm.hpp>
#include <array>
#include <cstdint>

namespace Vicinity {

/**
 * @brief Opaque identifier of a host entity
 */
using EntityId = uint64_t;

/**
 * @brief Maps host (3D world) coordinates onto an index's coordinate space
 *
 * The 3D specialization is the identity. The 2D specialization projects onto
 * the XY plane: z is dropped on the way in and comes back as 0. This is a
 * lossy projection by contract, not an error.
 */
template<glm::length_t Dim>
struct CoordinateAdapter;

template<>
struct CoordinateAdapter<3> {
    [[nodiscard]] static glm::vec3 FromWorld(const glm::vec3& world) noexcept { return world; }
    [[nodiscard]] static glm::vec3 ToWorld(const glm::vec3& local) noexcept { return local; }
};

template<>
struct CoordinateAdapter<2> {
    [[nodiscard]] static glm::vec2 FromWorld(const glm::vec3& world) noexcept {
        return glm::vec2(world.x, world.y);
    }
    [[nodiscard]] static glm::vec3 ToWorld(const glm::vec2& local) noexcept {
        return glm::vec3(local.x, local.y, 0.0f);
    }
};

/**
 * @brief Immutable binding of a coordinate to an entity, stored in the R-tree
 *
 * Two points are the same index element when both position and entity match.
 * Removal by entity alone is handled by the tree with a predicate scan.
 */
template<glm::length_t Dim>
class TrackedPoint {
public:
    using Coord = glm::vec<Dim, float, glm::defaultp>;

    TrackedPoint() = default;
    TrackedPoint(const Coord& position, EntityId entity) noexcept
        : m_position(position), m_entity(entity) {}

    [[nodiscard]] const Coord& GetPosition() const noexcept { return m_position; }
    [[nodiscard]] EntityId GetEntity() const noexcept { return m_entity; }

    /**
     * @brief Coordinate as a fixed-size array
     */
    [[nodiscard]] std::array<float, Dim> AsArray() const noexcept {
        std::array<float, Dim> result{};
        for (glm::length_t i = 0; i < Dim; ++i) {
            result[static_cast<size_t>(i)] = m_position[i];
        }
        return result;
    }

    [[nodiscard]] Envelope<Dim> GetEnvelope() const noexcept {
        return Envelope<Dim>::FromPoint(m_position);
    }

    [[nodiscard]] float DistanceSquared(const Coord& query) const noexcept {
        Coord d = m_position - query;
        return glm::dot(d, d);
    }

    [[nodiscard]] bool operator==(const TrackedPoint& other) const noexcept {
        return m_entity == other.m_entity && m_position == other.m_position;
    }

private:
    Coord m_position{0.0f};
    EntityId m_entity = 0;
};

using TrackedPoint2D = TrackedPoint<2>;
using TrackedPoint3D = TrackedPoint<3>;

} // namespace Vicinity
