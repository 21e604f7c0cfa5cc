#include "common/settings.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

Settings::Settings(const std::string& path) {
    load(path);
}

bool Settings::load(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    path_ = path;
    values_ = json::object();

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::info("No configuration file at " + path + ", using defaults");
        return false;
    }

    try {
        json parsed = json::parse(file);
        if (!parsed.is_object()) {
            Logger::error("Configuration file " + path + " is not a JSON object");
            return false;
        }
        values_ = std::move(parsed);
    } catch (const json::exception& e) {
        Logger::error("Failed to parse configuration file " + path + ": " + e.what());
        return false;
    }

    Logger::debug("Loaded " + std::to_string(values_.size()) + " setting(s) from " + path);
    return true;
}

bool Settings::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty()) {
        Logger::error("Cannot save settings: no configuration path");
        return false;
    }

    try {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::error("Failed to create configuration directory: " + std::string(e.what()));
        return false;
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        Logger::error("Failed to open configuration file for writing: " + path_);
        return false;
    }
    file << values_.dump(4);
    return file.good();
}

std::string Settings::getPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return path_;
}

std::optional<std::string> Settings::getString(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        auto value = it->get<std::string>();
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
    return it->dump();
}

int Settings::getInt(const std::string& key, int defaultValue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return defaultValue;
    }
    if (it->is_number_integer()) {
        return it->get<int>();
    }
    if (it->is_string()) {
        try {
            return std::stoi(it->get<std::string>());
        } catch (const std::exception&) {
            Logger::warning("Setting '" + key + "' is not an integer, using " + std::to_string(defaultValue));
        }
    }
    return defaultValue;
}

void Settings::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

void Settings::set(const std::string& key, int value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

bool Settings::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.contains(key);
}
