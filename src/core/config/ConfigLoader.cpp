#include "ConfigLoader.h"
#include <spdlog/spdlog.h>
#include <cctype>
#include <fstream>
#include <sstream>

namespace strata {
namespace config {

using core::ConfigError;

bool ConfigLoader::loadFromFile(const std::filesystem::path& file_path) {
    clear();
    source_ = file_path.string();

    std::ifstream file(file_path);
    if (!file.is_open()) {
        spdlog::error("[ConfigLoader] Configuration file not found or unreadable: {}", source_);
        return false;
    }

    try {
        nlohmann::json parsed;
        file >> parsed;
        if (!parsed.is_object()) {
            spdlog::error("[ConfigLoader] {} must contain a JSON object, got {}", source_, parsed.type_name());
            return false;
        }
        config_ = std::move(parsed);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("[ConfigLoader] Failed to parse JSON configuration from {}: {}", source_, e.what());
        return false;
    }

    spdlog::info("[ConfigLoader] Configuration loaded from: {}", source_);
    return true;
}

bool ConfigLoader::loadFromString(const std::string& json_str) {
    clear();
    source_ = "<string>";

    try {
        nlohmann::json parsed = nlohmann::json::parse(json_str);
        if (!parsed.is_object()) {
            spdlog::error("[ConfigLoader] Configuration string must be a JSON object, got {}", parsed.type_name());
            return false;
        }
        config_ = std::move(parsed);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("[ConfigLoader] Failed to parse JSON string: {}", e.what());
        return false;
    }
    return true;
}

void ConfigLoader::clear() {
    config_ = nlohmann::json();
    source_.clear();
}

bool ConfigLoader::hasKey(const std::string& key_path) const {
    return navigateToKey(key_path) != nullptr;
}

nlohmann::json ConfigLoader::getSection(const std::string& key_path) const {
    const nlohmann::json* value = navigateToKey(key_path);
    if (value == nullptr) {
        throw ConfigError(source_ + ": configuration key not found: " + key_path);
    }
    return *value;
}

std::vector<std::string> ConfigLoader::unknownKeys(const std::string& section,
                                                   const std::set<std::string>& known) const {
    std::vector<std::string> unknown;
    const nlohmann::json* node = navigateToKey(section);
    if (node == nullptr || !node->is_object()) {
        return unknown;
    }

    for (auto it = node->begin(); it != node->end(); ++it) {
        if (known.count(it.key()) == 0) {
            unknown.push_back(section + "." + it.key());
        }
    }
    return unknown;
}

const nlohmann::json* ConfigLoader::navigateToKey(const std::string& key_path) const {
    if (config_.empty() || key_path.empty()) {
        return nullptr;
    }

    const nlohmann::json* current = &config_;
    std::stringstream ss(key_path);
    std::string key;
    while (std::getline(ss, key, '.')) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(key);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

ConfigError ConfigLoader::typeError(const std::string& key_path, const nlohmann::json& value,
                                    const std::string& expected) const {
    return ConfigError(source_ + ": " + key_path + " has unexpected " + value.type_name() +
                       " value " + value.dump() + " (" + expected + ")");
}

std::chrono::milliseconds ConfigLoader::parseDurationString(const std::string& key_path,
                                                            const std::string& text) const {
    size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos == 0 || pos > 18) {
        throw ConfigError(source_ + ": " + key_path + " is not a duration: '" + text + "'");
    }

    const int64_t count = std::stoll(text.substr(0, pos));
    const std::string suffix = text.substr(pos);
    if (suffix == "ms") {
        return std::chrono::milliseconds(count);
    }
    if (suffix == "s") {
        return std::chrono::seconds(count);
    }
    if (suffix == "m") {
        return std::chrono::minutes(count);
    }
    if (suffix == "h") {
        return std::chrono::hours(count);
    }
    throw ConfigError(source_ + ": " + key_path + " has unknown duration unit '" + suffix +
                      "' (use ms, s, m or h)");
}

} // namespace config
} // namespace strata
