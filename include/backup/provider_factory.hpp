#pragma once

#include "backup/transfer_provider.hpp"
#include "common/destination.hpp"
#include <functional>
#include <memory>
#include <string>

class Settings;

using ProviderFactory = std::function<std::unique_ptr<TransferProvider>(ProviderKind)>;

// Builds the provider for a destination's stored tag. Cloud tokens come from
// ZIPVAULT_GDRIVE_TOKEN / ZIPVAULT_ONEDRIVE_TOKEN, falling back to settings.
std::unique_ptr<TransferProvider> createTransferProvider(ProviderKind kind, const Settings& settings);

// Access token for a cloud provider, empty if none is configured.
std::string resolveAccessToken(ProviderKind kind, const Settings& settings);
