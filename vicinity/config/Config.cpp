#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <iomanip>
#include <vector>

namespace Vicinity {

namespace {

std::vector<std::string> SplitKey(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // namespace

bool Config::Load(const std::filesystem::path& filepath) {
    m_filepath = filepath;

    if (!std::filesystem::exists(filepath)) {
        VICINITY_LOG_WARN("Config file not found: {}. Creating default.", filepath.string());
        if (!CreateDefault(filepath)) {
            return false;
        }
    }

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            VICINITY_LOG_ERROR("Failed to open config file: {}", filepath.string());
            return false;
        }

        m_data = nlohmann::json::parse(file);
        VICINITY_LOG_INFO("Loaded configuration from: {}", filepath.string());
        return true;
    } catch (const nlohmann::json::exception& e) {
        VICINITY_LOG_ERROR("Failed to parse config file: {}", e.what());
        return false;
    }
}

bool Config::LoadFromString(std::string_view text) {
    try {
        m_data = nlohmann::json::parse(text);
        return true;
    } catch (const nlohmann::json::exception& e) {
        VICINITY_LOG_ERROR("Failed to parse config text: {}", e.what());
        return false;
    }
}

bool Config::Save(const std::filesystem::path& filepath) {
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        VICINITY_LOG_WARN("No config file path set, cannot save");
        return false;
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            VICINITY_LOG_ERROR("Failed to open config file for writing: {}", path.string());
            return false;
        }

        file << std::setw(4) << m_data << std::endl;
        VICINITY_LOG_INFO("Saved configuration to: {}", path.string());
        return true;
    } catch (const std::exception& e) {
        VICINITY_LOG_ERROR("Failed to save config file: {}", e.what());
        return false;
    }
}

bool Config::Reload() {
    if (m_filepath.empty()) {
        VICINITY_LOG_WARN("No config file path set, cannot reload");
        return false;
    }
    return Load(m_filepath);
}

bool Config::Has(std::string_view key) const {
    return NavigateToKey(key) != nullptr;
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object() || !current->contains(p)) {
            return nullptr;
        }
        current = &(*current)[p];
    }
    return current;
}

nlohmann::json Config::MakeDefault() {
    nlohmann::json config;

    // Policy applied to categories without their own section
    config["spatial"]["default"]["dimensions"] = 3;
    config["spatial"]["default"]["min_moved_threshold"] = 1.0;
    config["spatial"]["default"]["recreate_after_count"] = 100;
    config["spatial"]["default"]["max_entries_per_node"] = 6;
    config["spatial"]["default"]["min_entries_per_node"] = 3;
    config["spatial"]["categories"] = nlohmann::json::object();

    // Logging
    config["logging"]["level"] = "info";
    config["logging"]["file"] = "";
    config["logging"]["console"] = true;

    return config;
}

bool Config::CreateDefault(const std::filesystem::path& filepath) {
    try {
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open()) {
            VICINITY_LOG_ERROR("Failed to create default config: {}", filepath.string());
            return false;
        }

        file << std::setw(4) << MakeDefault() << std::endl;
        VICINITY_LOG_INFO("Created default configuration at: {}", filepath.string());
        return true;
    } catch (const std::exception& e) {
        VICINITY_LOG_ERROR("Failed to create default config: {}", e.what());
        return false;
    }
}

} // namespace Vicinity
