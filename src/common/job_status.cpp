#include "common/job_status.hpp"
#include "common/utils.hpp"
#include <array>
#include <utility>

namespace {

const std::array<std::pair<JobStatus, const char*>, 9> kStatusNames = {{
    {JobStatus::Idle, "Idle"},
    {JobStatus::Pending, "Pending"},
    {JobStatus::Packaging, "Packaging"},
    {JobStatus::AwaitingTransfer, "Awaiting Transfer"},
    {JobStatus::Transferring, "Transferring"},
    {JobStatus::Verifying, "Verifying"},
    {JobStatus::NotifyingSender, "Notifying Sender"},
    {JobStatus::Completed, "Completed"},
    {JobStatus::Failed, "Failed"},
}};

} // namespace

std::string toString(JobStatus status) {
    for (const auto& entry : kStatusNames) {
        if (entry.first == status) {
            return entry.second;
        }
    }
    return "Unknown";
}

std::optional<JobStatus> parseJobStatus(const std::string& text) {
    std::string wanted = utils::toLower(utils::trim(text));
    if (wanted.empty()) {
        return JobStatus::Idle;
    }

    for (const auto& entry : kStatusNames) {
        if (utils::toLower(entry.second) == wanted) {
            return entry.first;
        }
    }
    return std::nullopt;
}
