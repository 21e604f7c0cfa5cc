#pragma once

#include <string>
#include <optional>
#include <mutex>
#include <nlohmann/json.hpp>

// Flat key/value configuration kept in a JSON file.
class Settings {
public:
    Settings() = default;
    explicit Settings(const std::string& path);

    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;

    // A missing or malformed file leaves the settings empty; returns false in that case.
    bool load(const std::string& path);
    bool save() const;
    std::string getPath() const;

    std::optional<std::string> getString(const std::string& key) const;
    int getInt(const std::string& key, int defaultValue) const;
    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, int value);
    bool contains(const std::string& key) const;

private:
    std::string path_;
    nlohmann::json values_ = nlohmann::json::object();
    mutable std::mutex mutex_;
};

// Keys understood by the engine
namespace settings_keys {
constexpr const char* kStagingPath = "staging_path";
constexpr const char* kStorePath = "store_path";
constexpr const char* kLogPath = "log_path";
constexpr const char* kLogLevel = "log_level";
constexpr const char* kPollIntervalSeconds = "poll_interval_seconds";
constexpr const char* kShutdownGraceSeconds = "shutdown_grace_seconds";
constexpr const char* kSmtpUrl = "smtp_url";
constexpr const char* kSmtpUsername = "smtp_username";
constexpr const char* kSmtpPassword = "smtp_password";
constexpr const char* kSmtpFrom = "smtp_from";
constexpr const char* kGoogleDriveToken = "gdrive_access_token";
constexpr const char* kOneDriveToken = "onedrive_access_token";
} // namespace settings_keys
