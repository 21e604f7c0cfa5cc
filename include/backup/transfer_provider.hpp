#pragma once

#include "common/destination.hpp"
#include <cstdint>
#include <optional>
#include <string>

// Digest a backend reports for a stored file. algorithm is lower-case:
// "md5", "sha256", or a backend-specific name such as "quickxor".
struct RemoteHash {
    std::string algorithm;
    std::string value;
};

// A place archives are shipped to and fetched from. Failures are reported
// through return values and getLastError().
class TransferProvider {
public:
    virtual ~TransferProvider() = default;

    virtual ProviderKind getKind() const = 0;

    virtual bool authenticate() = 0;
    virtual bool isAuthenticated() const = 0;
    virtual std::optional<uint64_t> getFreeSpace() = 0;

    // Returns the remote id of the stored file.
    virtual std::optional<std::string> upload(const std::string& localPath, const std::string& remoteFolder) = 0;
    virtual bool download(const std::string& remoteId, const std::string& localPath) = 0;
    virtual std::optional<RemoteHash> getRemoteHash(const std::string& remoteId) = 0;
    virtual bool deleteRemote(const std::string& remoteId) = 0;

    virtual std::string getDisplayName() const = 0;
    virtual std::string getLastError() const = 0;
};
