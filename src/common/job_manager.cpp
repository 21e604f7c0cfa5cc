#include "common/job_manager.hpp"
#include "common/logger.hpp"
#include <algorithm>

JobManager::JobManager(EventNotifier& notifier)
    : notifier_(notifier) {
}

JobManager::~JobManager() {
    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining = runningJobs_.size();
    }
    if (remaining > 0) {
        Logger::warning("Job registry destroyed with " + std::to_string(remaining) + " run(s) still registered");
    }
}

std::string JobManager::registerJob(const JobPayload& payload,
                                    JobKind kind,
                                    CancellationTokenPtr cancelToken,
                                    const std::string& runId) {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = runId.empty() ? generateRunId() : runId;
        while (runId.empty() && runningJobs_.count(id) > 0) {
            id = generateRunId();
        }

        RunningJobRecord record;
        record.runId = id;
        record.kind = kind;
        record.payload = payload;
        record.startTime = std::chrono::system_clock::now();
        record.cancelToken = cancelToken ? std::move(cancelToken) : makeCancellationToken();
        record.status = JobStatus::Pending;
        runningJobs_[id] = std::move(record);
    }

    Logger::debug("Registered " + toString(kind) + " run " + id + " for '" + payload.name + "'");
    notifier_.publish();
    return id;
}

void JobManager::unregisterJob(const std::string& runId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runningJobs_.erase(runId);
    }
    notifier_.publish();
}

void JobManager::setStatus(const std::string& runId, JobStatus status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runningJobs_.find(runId);
        if (it != runningJobs_.end()) {
            it->second.status = status;
        }
    }
    notifier_.publish();
}

bool JobManager::requestCancel(const std::string& runId) {
    std::string name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runningJobs_.find(runId);
        if (it == runningJobs_.end()) {
            return false;
        }
        it->second.cancelToken->cancel();
        name = it->second.payload.name;
    }

    Logger::info("Cancellation requested for run " + runId + " ('" + name + "')");
    return true;
}

void JobManager::requestCancelAll() {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& pair : runningJobs_) {
            pair.second.cancelToken->cancel();
        }
        count = runningJobs_.size();
    }

    if (count > 0) {
        Logger::info("Cancellation requested for all " + std::to_string(count) + " run(s)");
    }
}

std::vector<RunningJobRecord> JobManager::listRunning() const {
    std::vector<RunningJobRecord> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(runningJobs_.size());
        for (const auto& pair : runningJobs_) {
            result.push_back(pair.second);
        }
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.startTime < b.startTime;
    });
    return result;
}

std::optional<RunningJobRecord> JobManager::getRecord(const std::string& runId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runningJobs_.find(runId);
    if (it == runningJobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JobManager::isJobRunning(int64_t jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(runningJobs_.begin(), runningJobs_.end(), [jobId](const auto& pair) {
        return pair.second.kind == JobKind::Backup && pair.second.payload.jobId == jobId;
    });
}

size_t JobManager::runningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runningJobs_.size();
}
