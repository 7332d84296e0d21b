#pragma once

#include "core/common/CacheErrors.h"

#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata {
namespace config {

/**
 * @brief Strata JSON configuration reader
 *
 * Values are addressed by dotted key paths ("circuit_breaker.timeout_ms").
 * A missing or null key yields the caller's default; a key that is present
 * with the wrong type is a configuration error, never a silent default.
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration from a JSON file
     *
     * @return false if the file is missing or is not a JSON object
     */
    bool loadFromFile(const std::filesystem::path& file_path);

    /**
     * @brief Load configuration from a JSON string
     *
     * @return false if the string is not a JSON object
     */
    bool loadFromString(const std::string& json_str);

    const nlohmann::json& getJson() const { return config_; }

    /// @brief File path or "<string>", used in error messages
    const std::string& source() const { return source_; }

    /**
     * @brief Typed value at a dotted key path
     *
     * @throws strata::core::ConfigError if the key exists with an incompatible type
     */
    template<typename T>
    T getValue(const std::string& key_path, const T& default_value = T{}) const;

    /**
     * @brief Duration at a dotted key path
     *
     * A number is read in @p unit. A string carries its own unit suffix
     * ("250ms", "30s", "5m", "2h"), so "timeout_ms": "1m" is one minute.
     *
     * @throws strata::core::ConfigError on a negative value, an unknown suffix or a non-duration type
     */
    template<typename Unit>
    std::chrono::milliseconds getDuration(const std::string& key_path,
                                          std::chrono::milliseconds default_value) const;

    bool hasKey(const std::string& key_path) const;

    /**
     * @brief Configuration section by key path
     *
     * @throws strata::core::ConfigError if key not found
     */
    nlohmann::json getSection(const std::string& key_path) const;

    /**
     * @brief Keys of a section that are not in @p known
     *
     * Used to report misspelled settings. Empty when the section is absent.
     */
    std::vector<std::string> unknownKeys(const std::string& section,
                                         const std::set<std::string>& known) const;

    bool isLoaded() const { return !config_.empty(); }

    void clear();

private:
    nlohmann::json config_;
    std::string source_;

    const nlohmann::json* navigateToKey(const std::string& key_path) const;
    core::ConfigError typeError(const std::string& key_path, const nlohmann::json& value,
                                const std::string& expected) const;

    // "250ms" / "30s" / "5m" / "2h" -> milliseconds
    std::chrono::milliseconds parseDurationString(const std::string& key_path,
                                                  const std::string& text) const;
};

template<typename T>
T ConfigLoader::getValue(const std::string& key_path, const T& default_value) const {
    const nlohmann::json* value = navigateToKey(key_path);
    if (value == nullptr || value->is_null()) {
        return default_value;
    }

    try {
        return value->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw typeError(key_path, *value, e.what());
    }
}

template<typename Unit>
std::chrono::milliseconds ConfigLoader::getDuration(const std::string& key_path,
                                                    std::chrono::milliseconds default_value) const {
    const nlohmann::json* value = navigateToKey(key_path);
    if (value == nullptr || value->is_null()) {
        return default_value;
    }

    if (value->is_string()) {
        return parseDurationString(key_path, value->get<std::string>());
    }
    if (value->is_number_integer()) {
        const auto count = value->get<int64_t>();
        if (count < 0) {
            throw core::ConfigError(source_ + ": " + key_path + " must not be negative");
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(Unit(count));
    }
    throw typeError(key_path, *value, "integer or duration string");
}

} // namespace config
} // namespace strata
