#pragma once

#include <string>
#include <optional>
#include <cstdint>

enum class ProviderKind {
    Local,
    GoogleDrive,
    OneDrive
};

// Stored provider tags: "local", "gdrive", "onedrive".
std::string providerTag(ProviderKind kind);
std::optional<ProviderKind> parseProviderTag(const std::string& tag);

inline bool isCloudProvider(ProviderKind kind) {
    return kind != ProviderKind::Local;
}

// A job's view of its destination: where archives go and who carries them there.
struct DestinationRef {
    int64_t id{0};
    std::string name;
    std::string location;  // directory for local, folder name or path for cloud
    ProviderKind provider{ProviderKind::Local};
};
