#pragma once

#include "backup/backup_job.hpp"
#include "backup/conflict_resolver.hpp"
#include "backup/job_config.hpp"
#include "common/job.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

class OrchestrationContext;

// Background loop that promotes due jobs to runs. Each pass reads the due
// jobs from the store, claims each one and starts it on its own thread; the
// loop never waits for a run to finish.
class BackupScheduler {
public:
    explicit BackupScheduler(OrchestrationContext& context);
    ~BackupScheduler();

    BackupScheduler(const BackupScheduler&) = delete;
    BackupScheduler& operator=(const BackupScheduler&) = delete;

    // Thread control
    void start();
    // Stops polling, cancels in-flight runs and waits up to the grace period for them.
    void stop();
    bool isRunning() const { return running_; }

    // One evaluation pass. Returns the number of runs started.
    size_t checkSchedules();

    // Manual run under the same store claim a scheduler pass takes. Throws
    // std::runtime_error for unknown jobs and for jobs already running or
    // claimed, SourceMissingError when the source is gone. Returns the run id.
    std::string runNow(const std::string& jobName,
                       ConflictPolicy policy = ConflictPolicy::Rename,
                       RunOptions options = {});

    // Jobs left mid-run by a previous process go back to Idle with a Failed outcome.
    size_t recoverInterruptedJobs();

    void setPollInterval(std::chrono::milliseconds interval) { pollInterval_ = interval; }
    std::chrono::milliseconds getPollInterval() const { return pollInterval_; }
    void setGracePeriod(std::chrono::milliseconds grace) { gracePeriod_ = grace; }
    std::chrono::milliseconds getGracePeriod() const { return gracePeriod_; }

private:
    void schedulerLoop();
    bool startIfDue(const JobDescriptor& job, TimePoint now);
    void markSourceMissing(const JobDescriptor& job, TimePoint now);

    OrchestrationContext& context_;
    std::thread schedulerThread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::mutex waitMutex_;
    std::condition_variable wakeCondition_;
    std::chrono::milliseconds pollInterval_;
    std::chrono::milliseconds gracePeriod_;
};
