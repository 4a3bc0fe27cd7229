#pragma once

#include "RTree.hpp"
#include <cstddef>
#include <string_view>

namespace Vicinity {

class Config;

/**
 * @brief Construction-time settings of one category's index
 *
 * minMovedThreshold is compared against squared displacement, so 1.0 means
 * one world unit and 4.0 means two.
 */
struct SpatialAccessConfig {
    int dimensions = 3;
    float minMovedThreshold = 1.0f;
    size_t recreateAfterCount = 100;
    RTreeConfig tree;

    /**
     * @brief Read a category section, falling back to "spatial.default"
     * @param config Loaded configuration
     * @param section Key of the category, e.g. "spatial.categories.units"
     */
    [[nodiscard]] static SpatialAccessConfig FromConfig(const Config& config, std::string_view section);

    /**
     * @brief Clamp out-of-range values, logging a warning for each
     */
    void Sanitize();
};

} // namespace Vicinity
