#include "common/destination.hpp"
#include "common/utils.hpp"

std::string providerTag(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Local:       return "local";
        case ProviderKind::GoogleDrive: return "gdrive";
        case ProviderKind::OneDrive:    return "onedrive";
    }
    return "local";
}

std::optional<ProviderKind> parseProviderTag(const std::string& tag) {
    std::string lower = utils::toLower(utils::trim(tag));
    if (lower.empty() || lower == "local") {
        return ProviderKind::Local;
    }
    if (lower == "gdrive") {
        return ProviderKind::GoogleDrive;
    }
    if (lower == "onedrive") {
        return ProviderKind::OneDrive;
    }
    return std::nullopt;
}
