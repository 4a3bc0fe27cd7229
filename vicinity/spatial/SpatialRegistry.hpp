#pragma once

#include "SpatialAccess.hpp"
#include "SpatialAccessConfig.hpp"
#include "MaintenanceDriver.hpp"
#include "RTreeAccess.hpp"
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace Vicinity {

class Config;

/**
 * @brief Owns one index and one maintenance driver per tracked category
 *
 * A category is any C++ type used as a tag, typically the host's component
 * type (e.g. struct Enemy). Categories share no index state, so each can run its
 * own policy and distinct categories can be maintained on distinct threads.
 * The registry itself is not synchronized.
 *
 * @code{.cpp}
 * Vicinity::SpatialRegistry registry;
 * registry.Register<Enemy>(Vicinity::SpatialAccessConfig{.dimensions = 2});
 *
 * registry.ApplyFrame<Enemy>(observations, [&] { return world.EnemySnapshot(); });
 * auto nearby = registry.GetAccess<Enemy>()->WithinDistance(playerPos, 10.0f);
 * @endcode
 */
class SpatialRegistry {
public:
    SpatialRegistry() = default;
    ~SpatialRegistry() = default;

    // Non-copyable, movable
    SpatialRegistry(const SpatialRegistry&) = delete;
    SpatialRegistry& operator=(const SpatialRegistry&) = delete;
    SpatialRegistry(SpatialRegistry&&) noexcept = default;
    SpatialRegistry& operator=(SpatialRegistry&&) noexcept = default;

    // =========================================================================
    // Registration
    // =========================================================================

    /**
     * @brief Create an empty index for TCategory, replacing any previous one
     */
    template<typename TCategory>
    ISpatialAccess& Register(const SpatialAccessConfig& config, std::string name = typeid(TCategory).name()) {
        return Emplace(typeid(TCategory), std::move(name), CreateSpatialAccess(config));
    }

    /**
     * @brief Register a caller-provided index for TCategory
     */
    template<typename TCategory>
    ISpatialAccess& Register(std::unique_ptr<ISpatialAccess> access, std::string name = typeid(TCategory).name()) {
        return Emplace(typeid(TCategory), std::move(name), std::move(access));
    }

    /**
     * @brief Register TCategory with settings from "spatial.categories.<name>"
     */
    template<typename TCategory>
    ISpatialAccess& RegisterFromConfig(const Config& config, std::string_view name) {
        std::string section = "spatial.categories." + std::string(name);
        return Register<TCategory>(SpatialAccessConfig::FromConfig(config, section), std::string(name));
    }

    template<typename TCategory>
    bool Unregister() {
        return m_categories.erase(std::type_index(typeid(TCategory))) > 0;
    }

    template<typename TCategory>
    [[nodiscard]] bool IsRegistered() const {
        return m_categories.contains(std::type_index(typeid(TCategory)));
    }

    // =========================================================================
    // Access
    // =========================================================================

    /**
     * @brief Index of TCategory, or nullptr if not registered
     */
    template<typename TCategory>
    [[nodiscard]] ISpatialAccess* GetAccess() {
        Category* category = Find(typeid(TCategory));
        return category ? category->access.get() : nullptr;
    }

    template<typename TCategory>
    [[nodiscard]] const ISpatialAccess* GetAccess() const {
        const Category* category = Find(typeid(TCategory));
        return category ? category->access.get() : nullptr;
    }

    /**
     * @brief Maintenance driver of TCategory, or nullptr if not registered
     */
    template<typename TCategory>
    [[nodiscard]] MaintenanceDriver* GetDriver() {
        Category* category = Find(typeid(TCategory));
        return category ? category->driver.get() : nullptr;
    }

    /**
     * @brief Run one frame of maintenance for TCategory
     *
     * Returns an empty report if the category is not registered.
     */
    template<typename TCategory>
    FrameReport ApplyFrame(std::span<const MovementObservation> observations,
                           const SnapshotSupplier& snapshot = {}) {
        return ApplyFrameFor(typeid(TCategory), observations, snapshot);
    }

    // =========================================================================
    // Information
    // =========================================================================

    [[nodiscard]] size_t GetCategoryCount() const noexcept { return m_categories.size(); }

    /**
     * @brief Sum of Size() over all categories
     */
    [[nodiscard]] size_t GetTotalPointCount() const;

    [[nodiscard]] std::vector<std::string> GetCategoryNames() const;

    void Clear();

private:
    struct Category {
        std::string name;
        std::unique_ptr<ISpatialAccess> access;
        std::unique_ptr<MaintenanceDriver> driver;
    };

    ISpatialAccess& Emplace(std::type_index type, std::string name, std::unique_ptr<ISpatialAccess> access);
    FrameReport ApplyFrameFor(std::type_index type, std::span<const MovementObservation> observations,
                              const SnapshotSupplier& snapshot);

    Category* Find(std::type_index type);
    const Category* Find(std::type_index type) const;

    std::unordered_map<std::type_index, Category> m_categories;
};

} // namespace Vicinity
