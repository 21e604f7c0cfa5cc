#pragma once

#include "backup/job_config.hpp"
#include "common/destination.hpp"
#include "common/job_status.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Persistent jobs, destinations, archive catalogue and restore history.
// Implementations must be safe for concurrent callers.
class JobStore {
public:
    virtual ~JobStore() = default;

    // Jobs
    virtual std::vector<JobDescriptor> listJobs() const = 0;
    // Jobs with a next run at or before now whose status is Idle.
    virtual std::vector<JobDescriptor> listDue(TimePoint now) const = 0;
    virtual std::optional<JobDescriptor> getJob(const std::string& name) const = 0;
    virtual std::optional<JobDescriptor> getJobById(int64_t id) const = 0;
    virtual int64_t addJob(const JobDescriptor& job) = 0;
    virtual bool updateJob(const JobDescriptor& job) = 0;
    virtual bool deleteJob(const std::string& name) = 0;

    // Idle (or a finished Once job's Completed) -> Pending in one step. False
    // if the job is gone or a run already holds it.
    virtual bool claimForRun(int64_t id) = 0;

    // Overwrites all four run fields; empty optionals clear them.
    virtual bool updateStatus(int64_t id,
                              JobStatus status,
                              std::optional<TimePoint> lastRunAt,
                              std::optional<JobStatus> lastRunOutcome,
                              std::optional<TimePoint> nextRunAt) = 0;

    // Destinations
    virtual int64_t addDestination(const DestinationRef& destination) = 0;
    virtual bool updateDestination(const DestinationRef& destination) = 0;
    virtual bool deleteDestination(const std::string& name) = 0;
    virtual std::vector<DestinationRef> listDestinations() const = 0;
    virtual std::optional<DestinationRef> getDestination(const std::string& name) const = 0;
    virtual std::optional<DestinationRef> getDestinationById(int64_t id) const = 0;

    // Archive catalogue
    virtual void recordArchivedFile(const ArchivedFile& file) = 0;
    virtual std::vector<ArchivedFile> getFilesInArchive(const std::string& archivePath) const = 0;
    // Returns the number of catalogue rows moved.
    virtual size_t updateArchiveLocation(const std::string& oldPath, const std::string& newUri) = 0;
    // Case-insensitive match on entry name, original path or description,
    // newest first. An empty query lists the newest entries.
    virtual std::vector<ArchivedFile> searchFiles(const std::string& query, size_t limit = 200) const = 0;
    virtual std::vector<DuplicateFile> findDuplicateFiles() const = 0;

    // Restore history
    virtual int64_t addRestoreHistory(const RestoreHistoryEntry& entry) = 0;
    virtual bool updateRestoreHistory(int64_t id, const std::string& status, TimePoint finishedAt) = 0;
    virtual std::vector<RestoreHistoryEntry> listRestoreHistory() const = 0;
};

// JobStore kept as a single JSON document. Every call takes the same mutex;
// each mutation rewrites the file through a temporary and a rename. An empty
// path keeps everything in memory.
class JsonJobStore : public JobStore {
public:
    explicit JsonJobStore(const std::string& path = "");
    ~JsonJobStore() override = default;

    JsonJobStore(const JsonJobStore&) = delete;
    JsonJobStore& operator=(const JsonJobStore&) = delete;

    std::string getPath() const { return path_; }

    std::vector<JobDescriptor> listJobs() const override;
    std::vector<JobDescriptor> listDue(TimePoint now) const override;
    std::optional<JobDescriptor> getJob(const std::string& name) const override;
    std::optional<JobDescriptor> getJobById(int64_t id) const override;
    int64_t addJob(const JobDescriptor& job) override;
    bool updateJob(const JobDescriptor& job) override;
    bool deleteJob(const std::string& name) override;
    bool claimForRun(int64_t id) override;
    bool updateStatus(int64_t id,
                      JobStatus status,
                      std::optional<TimePoint> lastRunAt,
                      std::optional<JobStatus> lastRunOutcome,
                      std::optional<TimePoint> nextRunAt) override;

    int64_t addDestination(const DestinationRef& destination) override;
    bool updateDestination(const DestinationRef& destination) override;
    bool deleteDestination(const std::string& name) override;
    std::vector<DestinationRef> listDestinations() const override;
    std::optional<DestinationRef> getDestination(const std::string& name) const override;
    std::optional<DestinationRef> getDestinationById(int64_t id) const override;

    void recordArchivedFile(const ArchivedFile& file) override;
    std::vector<ArchivedFile> getFilesInArchive(const std::string& archivePath) const override;
    size_t updateArchiveLocation(const std::string& oldPath, const std::string& newUri) override;
    std::vector<ArchivedFile> searchFiles(const std::string& query, size_t limit = 200) const override;
    std::vector<DuplicateFile> findDuplicateFiles() const override;

    int64_t addRestoreHistory(const RestoreHistoryEntry& entry) override;
    bool updateRestoreHistory(int64_t id, const std::string& status, TimePoint finishedAt) override;
    std::vector<RestoreHistoryEntry> listRestoreHistory() const override;

private:
    void load();
    void persist() const;
    JobDescriptor resolve(const JobDescriptor& job) const;

    std::string path_;
    std::map<int64_t, JobDescriptor> jobs_;
    std::map<int64_t, DestinationRef> destinations_;
    std::vector<ArchivedFile> archivedFiles_;
    std::vector<RestoreHistoryEntry> restoreHistory_;
    int64_t nextJobId_{1};
    int64_t nextDestinationId_{1};
    int64_t nextFileId_{1};
    int64_t nextRestoreId_{1};
    mutable std::mutex mutex_;
};
