#pragma once

#include <string>
#include <optional>

// Lifecycle vocabulary shared by the registry, the store and the executors.
enum class JobStatus {
    Idle,
    Pending,
    Packaging,
    AwaitingTransfer,
    Transferring,
    Verifying,
    NotifyingSender,
    Completed,
    Failed
};

std::string toString(JobStatus status);

// Accepts the display names produced by toString, case-insensitively.
// An empty string is the rest state and parses as Idle.
std::optional<JobStatus> parseJobStatus(const std::string& text);

inline bool isTerminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}
