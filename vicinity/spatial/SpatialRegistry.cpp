#include "spatial/SpatialRegistry.hpp"
#include "core/Logger.hpp"

namespace Vicinity {

ISpatialAccess& SpatialRegistry::Emplace(std::type_index type, std::string name,
                                         std::unique_ptr<ISpatialAccess> access) {
    if (!access) {
        VICINITY_LOG_WARN("Null index registered for category {}, using a default 3D index", name);
        access = CreateSpatialAccess(SpatialAccessConfig());
    }

    if (m_categories.contains(type)) {
        VICINITY_LOG_WARN("Category {} already registered, replacing its index", name);
    }

    Category category;
    category.name = std::move(name);
    category.access = std::move(access);
    category.driver = std::make_unique<MaintenanceDriver>(*category.access);

    VICINITY_LOG_DEBUG("Registered category {} ({}, min moved {}, recreate after {})",
                       category.name, category.access->GetTypeName(),
                       category.access->GetMinMovedThreshold(),
                       category.access->GetRecreateAfterCount());

    auto& stored = m_categories[type];
    stored = std::move(category);
    return *stored.access;
}

FrameReport SpatialRegistry::ApplyFrameFor(std::type_index type,
                                           std::span<const MovementObservation> observations,
                                           const SnapshotSupplier& snapshot) {
    Category* category = Find(type);
    if (!category) {
        VICINITY_LOG_WARN("ApplyFrame for unregistered category {}", type.name());
        return FrameReport{};
    }
    return category->driver->ApplyFrame(observations, snapshot);
}

size_t SpatialRegistry::GetTotalPointCount() const {
    size_t total = 0;
    for (const auto& [type, category] : m_categories) {
        total += category.access->Size();
    }
    return total;
}

std::vector<std::string> SpatialRegistry::GetCategoryNames() const {
    std::vector<std::string> names;
    names.reserve(m_categories.size());
    for (const auto& [type, category] : m_categories) {
        names.push_back(category.name);
    }
    return names;
}

void SpatialRegistry::Clear() {
    m_categories.clear();
}

SpatialRegistry::Category* SpatialRegistry::Find(std::type_index type) {
    auto it = m_categories.find(type);
    return it != m_categories.end() ? &it->second : nullptr;
}

const SpatialRegistry::Category* SpatialRegistry::Find(std::type_index type) const {
    auto it = m_categories.find(type);
    return it != m_categories.end() ? &it->second : nullptr;
}

} // namespace Vicinity
