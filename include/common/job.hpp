#pragma once

#include "common/cancellation.hpp"
#include "common/destination.hpp"
#include "common/job_status.hpp"
#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

using TimePoint = std::chrono::system_clock::time_point;

enum class JobKind {
    Backup,
    Restore
};

std::string toString(JobKind kind);

// What a run is working on. For backups jobId is the persisted job; restores have none.
struct JobPayload {
    std::optional<int64_t> jobId;
    std::string name;
    std::string sourcePath;
    DestinationRef destination;
};

// One in-flight run as seen by the registry. Copies handed out by
// JobManager::listRunning share the cancel token with the live record.
struct RunningJobRecord {
    std::string runId;
    JobKind kind{JobKind::Backup};
    JobPayload payload;
    TimePoint startTime;
    CancellationTokenPtr cancelToken;
    JobStatus status{JobStatus::Pending};
};

// 32 lowercase hex characters from a random source.
std::string generateRunId();
