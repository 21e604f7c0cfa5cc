#pragma once

#include "backup/backup_job.hpp"
#include "backup/job_config.hpp"
#include "common/job.hpp"
#include "common/job_status.hpp"
#include <cstdint>
#include <string>
#include <vector>

class OrchestrationContext;

// Brings catalogued entries back out of their archives. Archives held by a
// cloud provider are downloaded into the staging path first and removed
// again once extracted.
class RestoreJob {
public:
    RestoreJob(OrchestrationContext& context, const RestoreRequest& request, RunOptions options = {});

    RestoreJob(const RestoreJob&) = delete;
    RestoreJob& operator=(const RestoreJob&) = delete;

    void prepare();
    JobStatus run();

    const std::string& getRunId() const { return runId_; }
    const std::string& getJobName() const { return jobName_; }
    const std::string& getMessage() const { return message_; }
    int64_t getHistoryId() const { return historyId_; }
    const std::vector<std::string>& getWrittenFiles() const { return writtenFiles_; }

private:
    void execute();
    void restoreFromArchive(const std::string& archivePath,
                            const std::vector<std::string>& entryNames,
                            const std::string& stagingPath);
    void finish(JobStatus finalStatus);
    void sendSummary(JobStatus finalStatus);
    void transition(JobStatus status, const std::string& message);
    void checkCancelled(const std::string& reason) const;

    OrchestrationContext& context_;
    RestoreRequest request_;
    RunOptions options_;
    std::string jobName_;
    std::string runId_;
    bool prepared_{false};
    TimePoint runStart_;
    int64_t historyId_{-1};
    std::vector<std::string> writtenFiles_;
    std::string message_;
};

std::string startRestoreJob(OrchestrationContext& context, const RestoreRequest& request, RunOptions options = {});
