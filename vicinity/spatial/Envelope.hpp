#pragma once

#include <glm/glm.hpp>
#include <limits>

namespace Vicinity {

/**
 * @brief Axis-aligned bounding box in 2 or 3 dimensions
 *
 * Used as the node envelope of the R-tree. A default-constructed envelope is
 * empty (min > max) and expands to the first point or envelope merged in.
 *
 * @tparam Dim Number of coordinate axes (2 or 3)
 */
template<glm::length_t Dim>
struct Envelope {
    using Coord = glm::vec<Dim, float, glm::defaultp>;

    Coord min{std::numeric_limits<float>::max()};
    Coord max{std::numeric_limits<float>::lowest()};

    Envelope() noexcept = default;

    Envelope(const Coord& minPoint, const Coord& maxPoint) noexcept
        : min(minPoint), max(maxPoint) {}

    /**
     * @brief Create an envelope degenerate to a single point
     */
    [[nodiscard]] static Envelope FromPoint(const Coord& point) noexcept {
        return Envelope(point, point);
    }

    /**
     * @brief Smallest envelope containing both inputs
     */
    [[nodiscard]] static Envelope Merge(const Envelope& a, const Envelope& b) noexcept {
        return Envelope(glm::min(a.min, b.min), glm::max(a.max, b.max));
    }

    [[nodiscard]] bool IsValid() const noexcept {
        for (glm::length_t i = 0; i < Dim; ++i) {
            if (min[i] > max[i]) return false;
        }
        return true;
    }

    /**
     * @brief Area in 2D, volume in 3D
     */
    [[nodiscard]] float GetContent() const noexcept {
        if (!IsValid()) return 0.0f;
        float content = 1.0f;
        for (glm::length_t i = 0; i < Dim; ++i) {
            content *= max[i] - min[i];
        }
        return content;
    }

    /**
     * @brief Sum of the edge lengths, used to break ties between flat envelopes
     */
    [[nodiscard]] float GetMargin() const noexcept {
        if (!IsValid()) return 0.0f;
        float margin = 0.0f;
        for (glm::length_t i = 0; i < Dim; ++i) {
            margin += max[i] - min[i];
        }
        return margin;
    }

    void Expand(const Coord& point) noexcept {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    void Expand(const Envelope& other) noexcept {
        min = glm::min(min, other.min);
        max = glm::max(max, other.max);
    }

    [[nodiscard]] bool Contains(const Coord& point) const noexcept {
        for (glm::length_t i = 0; i < Dim; ++i) {
            if (point[i] < min[i] || point[i] > max[i]) return false;
        }
        return true;
    }

    [[nodiscard]] bool Contains(const Envelope& other) const noexcept {
        for (glm::length_t i = 0; i < Dim; ++i) {
            if (other.min[i] < min[i] || other.max[i] > max[i]) return false;
        }
        return true;
    }

    [[nodiscard]] bool Intersects(const Envelope& other) const noexcept {
        for (glm::length_t i = 0; i < Dim; ++i) {
            if (other.max[i] < min[i] || other.min[i] > max[i]) return false;
        }
        return true;
    }

    /**
     * @brief Squared distance from a point to the envelope (0 when inside)
     */
    [[nodiscard]] float DistanceSquared(const Coord& point) const noexcept {
        Coord closest = glm::clamp(point, min, max);
        Coord d = point - closest;
        return glm::dot(d, d);
    }

    /**
     * @brief Growth in content needed to include another envelope
     */
    [[nodiscard]] float GetEnlargement(const Envelope& other) const noexcept {
        return Merge(*this, other).GetContent() - GetContent();
    }
};

using Envelope2D = Envelope<2>;
using Envelope3D = Envelope<3>;

} // namespace Vicinity
