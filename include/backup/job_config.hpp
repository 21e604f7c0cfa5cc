#pragma once

#include "backup/schedule.hpp"
#include "common/destination.hpp"
#include "common/job.hpp"
#include "common/job_status.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// A persisted backup job as the store hands it out.
struct JobDescriptor {
    int64_t id{0};
    std::string name;
    std::string sourcePath;
    DestinationRef destination;
    bool moveFiles{false};
    ScheduleSpec schedule;
    bool sendEmail{false};
    std::string recipient;
    JobStatus status{JobStatus::Idle};
    std::optional<TimePoint> lastRunAt;
    std::optional<JobStatus> lastRunOutcome;   // Completed or Failed
    std::optional<TimePoint> nextRunAt;
    TimePoint createdAt;
};

// One file catalogued inside an archive.
struct ArchivedFile {
    int64_t id{0};
    std::string originalPath;
    std::string entryName;
    std::string archivePath;   // local path, or "<provider>://<remote id>" once uploaded
    int64_t fileSize{-1};
    std::optional<TimePoint> modifiedAt;
    int64_t compressedSize{-1};
    std::string location;
    std::string description;
    TimePoint recordedAt;
};

struct RestoreFileRef {
    std::string archivePath;
    std::string entryName;
};

struct RestoreRequest {
    std::string name;
    std::string destinationPath;
    std::vector<RestoreFileRef> files;
    std::string recipient;   // empty disables the summary email
};

struct RestoreHistoryEntry {
    int64_t id{0};
    std::string jobName;
    std::string destinationPath;
    std::string status;
    TimePoint startedAt;
    std::optional<TimePoint> finishedAt;
    std::vector<std::string> filesRestored;
};

// Entry name that appears in more than one archive, with every archive holding it.
struct DuplicateFile {
    std::string entryName;
    std::vector<std::string> archivePaths;
};
