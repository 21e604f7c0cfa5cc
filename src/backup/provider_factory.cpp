#include "backup/provider_factory.hpp"
#include "backup/cloud/google_drive_provider.hpp"
#include "backup/cloud/onedrive_provider.hpp"
#include "backup/local_provider.hpp"
#include "common/logger.hpp"
#include "common/settings.hpp"
#include <cstdlib>
#include <stdexcept>

std::string resolveAccessToken(ProviderKind kind, const Settings& settings) {
    const char* envName = nullptr;
    const char* settingKey = nullptr;
    switch (kind) {
        case ProviderKind::GoogleDrive:
            envName = "ZIPVAULT_GDRIVE_TOKEN";
            settingKey = settings_keys::kGoogleDriveToken;
            break;
        case ProviderKind::OneDrive:
            envName = "ZIPVAULT_ONEDRIVE_TOKEN";
            settingKey = settings_keys::kOneDriveToken;
            break;
        case ProviderKind::Local:
            return "";
    }

    const char* fromEnv = std::getenv(envName);
    if (fromEnv && *fromEnv) {
        return fromEnv;
    }
    return settings.getString(settingKey).value_or("");
}

std::unique_ptr<TransferProvider> createTransferProvider(ProviderKind kind, const Settings& settings) {
    Logger::debug("Creating transfer provider of type: " + providerTag(kind));

    switch (kind) {
        case ProviderKind::Local:
            return std::make_unique<LocalTransferProvider>();
        case ProviderKind::GoogleDrive: {
            const std::string token = resolveAccessToken(kind, settings);
            if (token.empty()) {
                Logger::warning("No Google Drive token configured; uploads will fail to authenticate");
            }
            return std::make_unique<GoogleDriveProvider>(token);
        }
        case ProviderKind::OneDrive: {
            const std::string token = resolveAccessToken(kind, settings);
            if (token.empty()) {
                Logger::warning("No OneDrive token configured; uploads will fail to authenticate");
            }
            return std::make_unique<OneDriveProvider>(token);
        }
    }

    Logger::error("Unsupported transfer provider type: " + providerTag(kind));
    throw std::runtime_error("Unsupported transfer provider type: " + providerTag(kind));
}
