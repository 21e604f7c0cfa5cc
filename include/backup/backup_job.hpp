#pragma once

#include "backup/conflict_resolver.hpp"
#include "backup/job_config.hpp"
#include "backup/zip_archiver.hpp"
#include "common/cancellation.hpp"
#include "common/job.hpp"
#include "common/job_status.hpp"
#include <functional>
#include <string>

class OrchestrationContext;
class TransferProvider;

// Caller-side knobs shared by both executors.
struct RunOptions {
    CancellationTokenPtr cancelToken;       // created when empty
    std::function<void()> refreshCallback;  // posted through the event notifier at exit
    ConflictPrompt prompt;                  // answers ConflictPolicy::Ask
};

// Drives one backup run from Pending to Completed or Failed:
// package, then for cloud destinations upload, verify and relocate the
// catalogue. Every outcome is contained in run(); nothing is thrown out.
class BackupJob {
public:
    BackupJob(OrchestrationContext& context,
              const JobDescriptor& descriptor,
              ConflictPolicy policy = ConflictPolicy::Rename,
              RunOptions options = {});

    BackupJob(const BackupJob&) = delete;
    BackupJob& operator=(const BackupJob&) = delete;

    // Registers the run and persists Pending. run() calls it if the caller
    // did not, so launchers can make the run visible before its thread starts.
    void prepare();

    // Blocks until the run is over and returns the final registry status.
    JobStatus run();

    const std::string& getRunId() const { return runId_; }
    const std::string& getMessage() const { return message_; }
    const PackResult& getPackResult() const { return packResult_; }
    const JobDescriptor& getDescriptor() const { return descriptor_; }

private:
    void execute();
    std::string resolveOutputRoot() const;
    void packageSource(const std::string& outputRoot);
    void shipToCloud(const std::string& archivePath);
    void verifyUpload(TransferProvider& provider, const std::string& remoteId, const std::string& archivePath);
    void removeSourceFiles();
    void finish(JobStatus finalStatus);
    void sendSummary(JobStatus finalStatus);
    void transition(JobStatus status, const std::string& message);
    void checkCancelled(const std::string& reason) const;

    OrchestrationContext& context_;
    JobDescriptor descriptor_;
    ConflictPolicy policy_;
    RunOptions options_;
    std::string runId_;
    bool prepared_{false};
    TimePoint runStart_;
    PackResult packResult_;
    std::string catalogueKey_;   // archive path, or remote URI once uploaded
    std::string message_;
};

// Prepares the run on the calling thread, then executes it on a thread owned
// by the context's RunTracker. Returns the run id.
std::string startBackupJob(OrchestrationContext& context,
                           const JobDescriptor& descriptor,
                           ConflictPolicy policy = ConflictPolicy::Rename,
                           RunOptions options = {});
