#pragma once

#include "backup/conflict_resolver.hpp"
#include "common/cancellation.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class JobStore;

struct PackResult {
    std::string action;   // "created", "overwritten", "renamed" or "cancelled"
    std::optional<std::string> archivePath;
    int64_t fileCount{0};
    int64_t totalBytes{0};
    std::vector<std::string> sourceFiles;
};

class Packager {
public:
    virtual ~Packager() = default;

    // Archives sourcePath into "<outputRoot>/<source name>.zip", asking the
    // conflict resolver when that file exists. Throws JobCancelledError when
    // the token fires mid-way and PackagingError on I/O failures.
    virtual PackResult pack(const std::string& sourcePath,
                            const std::string& outputRoot,
                            ConflictPolicy policy,
                            const CancellationTokenPtr& cancelToken,
                            const ConflictPrompt& prompt = nullptr) = 0;
};

class Extractor {
public:
    virtual ~Extractor() = default;

    // Writes the named entries below destinationDir and returns the paths written.
    virtual std::vector<std::string> extract(const std::string& archivePath,
                                             const std::vector<std::string>& entryNames,
                                             const std::string& destinationDir,
                                             const CancellationTokenPtr& cancelToken) = 0;
};

// Zip archives through libarchive. When a store is given every packed file
// is added to its catalogue once the archive is complete.
class ZipArchiver : public Packager, public Extractor {
public:
    explicit ZipArchiver(JobStore* store = nullptr);

    PackResult pack(const std::string& sourcePath,
                    const std::string& outputRoot,
                    ConflictPolicy policy,
                    const CancellationTokenPtr& cancelToken,
                    const ConflictPrompt& prompt = nullptr) override;

    std::vector<std::string> extract(const std::string& archivePath,
                                     const std::vector<std::string>& entryNames,
                                     const std::string& destinationDir,
                                     const CancellationTokenPtr& cancelToken) override;

    // Entry names stored in an archive, in archive order.
    static std::vector<std::string> listEntries(const std::string& archivePath);

private:
    JobStore* store_;
};
