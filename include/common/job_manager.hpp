#pragma once

#include "common/job.hpp"
#include "common/event_notifier.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Table of runs executing right now. Every mutation goes through one mutex;
// listeners are notified after it is released.
class JobManager {
public:
    explicit JobManager(EventNotifier& notifier);
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    // Returns the run id: runId if given, otherwise a fresh random one.
    // The new record starts in Pending.
    std::string registerJob(const JobPayload& payload,
                            JobKind kind,
                            CancellationTokenPtr cancelToken,
                            const std::string& runId = "");

    // Unknown ids are ignored; removal is safe to repeat.
    void unregisterJob(const std::string& runId);

    // No-op if the run already finished.
    void setStatus(const std::string& runId, JobStatus status);

    bool requestCancel(const std::string& runId);
    void requestCancelAll();

    // Point-in-time copy, ordered by start time.
    std::vector<RunningJobRecord> listRunning() const;
    std::optional<RunningJobRecord> getRecord(const std::string& runId) const;
    bool isJobRunning(int64_t jobId) const;
    size_t runningCount() const;

private:
    EventNotifier& notifier_;
    std::unordered_map<std::string, RunningJobRecord> runningJobs_;
    mutable std::mutex mutex_;
};
