#include "spatial/SpatialAccessConfig.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <string>

namespace Vicinity {

namespace {

constexpr std::string_view kDefaultSection = "spatial.default";

template<typename T>
T GetWithFallback(const Config& config, std::string_view section, std::string_view key, const T& fallback) {
    std::string defaultKey = std::string(kDefaultSection) + "." + std::string(key);
    T value = config.Get<T>(defaultKey, fallback);

    std::string sectionKey = std::string(section) + "." + std::string(key);
    return config.Get<T>(sectionKey, value);
}

} // namespace

SpatialAccessConfig SpatialAccessConfig::FromConfig(const Config& config, std::string_view section) {
    SpatialAccessConfig result;

    result.dimensions = GetWithFallback<int>(config, section, "dimensions", result.dimensions);
    result.minMovedThreshold = GetWithFallback<float>(
        config, section, "min_moved_threshold", result.minMovedThreshold);

    // Read as signed so negative values can be reported instead of wrapping
    const auto recreateAfter = GetWithFallback<long long>(
        config, section, "recreate_after_count", static_cast<long long>(result.recreateAfterCount));
    const auto maxEntries = GetWithFallback<long long>(
        config, section, "max_entries_per_node", static_cast<long long>(result.tree.maxEntriesPerNode));
    const auto minEntries = GetWithFallback<long long>(
        config, section, "min_entries_per_node", static_cast<long long>(result.tree.minEntriesPerNode));

    if (recreateAfter < 0) {
        VICINITY_LOG_WARN("{}: recreate_after_count {} is negative, using 0", section, recreateAfter);
    }
    result.recreateAfterCount = recreateAfter < 0 ? 0 : static_cast<size_t>(recreateAfter);
    result.tree.maxEntriesPerNode = maxEntries < 0 ? 0 : static_cast<size_t>(maxEntries);
    result.tree.minEntriesPerNode = minEntries < 0 ? 0 : static_cast<size_t>(minEntries);

    result.Sanitize();
    return result;
}

void SpatialAccessConfig::Sanitize() {
    if (dimensions != 2 && dimensions != 3) {
        VICINITY_LOG_WARN("Unsupported dimensions {}, using 3", dimensions);
        dimensions = 3;
    }

    if (!(minMovedThreshold >= 0.0f)) {
        VICINITY_LOG_WARN("min_moved_threshold {} is not >= 0, using 0", minMovedThreshold);
        minMovedThreshold = 0.0f;
    }

    if (tree.maxEntriesPerNode < 3) {
        VICINITY_LOG_WARN("max_entries_per_node {} is below 3, using 3", tree.maxEntriesPerNode);
        tree.maxEntriesPerNode = 3;
    }

    const size_t minLimit = tree.maxEntriesPerNode / 2;
    if (tree.minEntriesPerNode < 1 || tree.minEntriesPerNode > minLimit) {
        size_t clamped = tree.minEntriesPerNode < 1 ? 1 : minLimit;
        VICINITY_LOG_WARN("min_entries_per_node {} outside [1, {}], using {}",
                          tree.minEntriesPerNode, minLimit, clamped);
        tree.minEntriesPerNode = clamped;
    }
}

} // namespace Vicinity
