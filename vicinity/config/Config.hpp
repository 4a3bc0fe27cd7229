#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>

namespace Vicinity {

/**
 * @brief JSON-based configuration for spatial index settings
 *
 * Values are addressed by dot-separated key paths such as
 * "spatial.categories.units.min_moved_threshold". Hosts own their Config
 * objects, e.g. one per world.
 */
class Config {
public:
    Config() = default;
    ~Config() = default;

    Config(const Config&) = default;
    Config& operator=(const Config&) = default;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to configuration file
     * @return true if loaded successfully
     *
     * A missing file is created with default values first.
     */
    bool Load(const std::filesystem::path& filepath);

    /**
     * @brief Parse configuration from a JSON document in memory
     * @return true if the text was valid JSON
     */
    bool LoadFromString(std::string_view text);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool Save(const std::filesystem::path& filepath = "");

    /**
     * @brief Reload configuration from disk
     * @return true if reloaded successfully
     */
    bool Reload();

    /**
     * @brief Get a configuration value with type safety
     * @tparam T The expected type
     * @param key Dot-separated key path (e.g., "spatial.default.dimensions")
     * @param defaultValue Value to return if key not found or has the wrong type
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    /**
     * @brief Check if a key exists
     */
    [[nodiscard]] bool Has(std::string_view key) const;

    /**
     * @brief Get the underlying JSON object for direct access
     */
    [[nodiscard]] const nlohmann::json& GetJson() const { return m_data; }

    /**
     * @brief Build the default configuration document
     */
    [[nodiscard]] static nlohmann::json MakeDefault();

    /**
     * @brief Create default configuration file
     */
    static bool CreateDefault(const std::filesystem::path& filepath);

private:
    nlohmann::json m_data;
    std::filesystem::path m_filepath;

    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            if (node->is_array() && node->size() >= 2) {
                return glm::vec2((*node)[0].get<float>(), (*node)[1].get<float>());
            }
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            if (node->is_array() && node->size() >= 3) {
                return glm::vec3(
                    (*node)[0].get<float>(),
                    (*node)[1].get<float>(),
                    (*node)[2].get<float>()
                );
            }
        } else {
            return node->get<T>();
        }
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
    return defaultValue;
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    auto* node = NavigateToKey(key, true);
    if (node) {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            *node = nlohmann::json::array({value.x, value.y});
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            *node = nlohmann::json::array({value.x, value.y, value.z});
        } else {
            *node = value;
        }
    }
}

} // namespace Vicinity
