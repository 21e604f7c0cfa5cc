#include "storage/job_store.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr int kStoreVersion = 1;

json optionalTime(const std::optional<TimePoint>& time) {
    return time ? json(formatIso8601(*time)) : json(nullptr);
}

std::optional<TimePoint> readTime(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) {
        return std::nullopt;
    }
    return parseIso8601(it->get<std::string>());
}

std::string readString(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

json toJson(const DestinationRef& destination) {
    return {
        {"id", destination.id},
        {"name", destination.name},
        {"location", destination.location},
        {"provider", providerTag(destination.provider)}
    };
}

DestinationRef destinationFromJson(const json& node) {
    DestinationRef destination;
    destination.id = node.value("id", int64_t{0});
    destination.name = readString(node, "name");
    destination.location = readString(node, "location");
    const std::string tag = readString(node, "provider");
    auto provider = parseProviderTag(tag);
    if (!provider) {
        Logger::warning("Destination '" + destination.name + "' has unknown provider '" + tag + "', treating as local");
    }
    destination.provider = provider.value_or(ProviderKind::Local);
    return destination;
}

json toJson(const JobDescriptor& job) {
    return {
        {"id", job.id},
        {"name", job.name},
        {"source_path", job.sourcePath},
        {"destination_id", job.destination.id},
        {"move_files", job.moveFiles},
        {"schedule", toString(job.schedule.kind)},
        {"schedule_hour", job.schedule.hour},
        {"schedule_minute", job.schedule.minute},
        {"schedule_date", job.schedule.date},
        {"schedule_day_of_week", job.schedule.kind == ScheduleKind::Weekly
                                     ? json(weekdayName(job.schedule.dayOfWeek)) : json(nullptr)},
        {"send_email", job.sendEmail},
        {"recipient", job.recipient},
        {"status", toString(job.status)},
        {"last_run_at", optionalTime(job.lastRunAt)},
        {"last_run_status", job.lastRunOutcome ? json(toString(*job.lastRunOutcome)) : json(nullptr)},
        {"next_run_at", optionalTime(job.nextRunAt)},
        {"created_at", formatIso8601(job.createdAt)}
    };
}

JobDescriptor jobFromJson(const json& node) {
    JobDescriptor job;
    job.id = node.value("id", int64_t{0});
    job.name = readString(node, "name");
    job.sourcePath = readString(node, "source_path");
    job.destination.id = node.value("destination_id", int64_t{0});
    job.moveFiles = node.value("move_files", false);
    job.schedule.kind = parseScheduleKind(readString(node, "schedule")).value_or(ScheduleKind::Manual);
    job.schedule.hour = node.value("schedule_hour", 0);
    job.schedule.minute = node.value("schedule_minute", 0);
    job.schedule.date = readString(node, "schedule_date");
    job.schedule.dayOfWeek = parseWeekday(readString(node, "schedule_day_of_week")).value_or(0);
    job.sendEmail = node.value("send_email", false);
    job.recipient = readString(node, "recipient");

    const std::string status = readString(node, "status");
    auto parsed = parseJobStatus(status);
    if (!parsed) {
        Logger::warning("Job '" + job.name + "' has unknown status '" + status + "'");
    }
    job.status = parsed.value_or(JobStatus::Failed);

    job.lastRunAt = readTime(node, "last_run_at");
    const std::string outcome = readString(node, "last_run_status");
    if (!outcome.empty()) {
        job.lastRunOutcome = parseJobStatus(outcome);
    }
    job.nextRunAt = readTime(node, "next_run_at");
    job.createdAt = readTime(node, "created_at").value_or(TimePoint{});
    return job;
}

json toJson(const ArchivedFile& file) {
    return {
        {"id", file.id},
        {"original_path", file.originalPath},
        {"arcname", file.entryName},
        {"zip_path", file.archivePath},
        {"file_size", file.fileSize},
        {"mtime", optionalTime(file.modifiedAt)},
        {"compressed_size", file.compressedSize},
        {"location", file.location},
        {"description", file.description},
        {"recorded_at", formatIso8601(file.recordedAt)}
    };
}

ArchivedFile archivedFileFromJson(const json& node) {
    ArchivedFile file;
    file.id = node.value("id", int64_t{0});
    file.originalPath = readString(node, "original_path");
    file.entryName = readString(node, "arcname");
    file.archivePath = readString(node, "zip_path");
    file.fileSize = node.value("file_size", int64_t{-1});
    file.modifiedAt = readTime(node, "mtime");
    file.compressedSize = node.value("compressed_size", int64_t{-1});
    file.location = readString(node, "location");
    file.description = readString(node, "description");
    file.recordedAt = readTime(node, "recorded_at").value_or(TimePoint{});
    return file;
}

json toJson(const RestoreHistoryEntry& entry) {
    return {
        {"id", entry.id},
        {"job_name", entry.jobName},
        {"destination_path", entry.destinationPath},
        {"status", entry.status},
        {"start_time", formatIso8601(entry.startedAt)},
        {"end_time", optionalTime(entry.finishedAt)},
        {"files_restored", entry.filesRestored}
    };
}

RestoreHistoryEntry restoreEntryFromJson(const json& node) {
    RestoreHistoryEntry entry;
    entry.id = node.value("id", int64_t{0});
    entry.jobName = readString(node, "job_name");
    entry.destinationPath = readString(node, "destination_path");
    entry.status = readString(node, "status");
    entry.startedAt = readTime(node, "start_time").value_or(TimePoint{});
    entry.finishedAt = readTime(node, "end_time");
    auto it = node.find("files_restored");
    if (it != node.end() && it->is_array()) {
        entry.filesRestored = it->get<std::vector<std::string>>();
    }
    return entry;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return utils::toLower(haystack).find(needle) != std::string::npos;
}

} // namespace

JsonJobStore::JsonJobStore(const std::string& path)
    : path_(path) {
    if (!path_.empty()) {
        load();
    }
}

void JsonJobStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::exists(path_)) {
        Logger::info("Job store " + path_ + " does not exist yet, starting empty");
        return;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open job store: " + path_);
    }

    json doc;
    try {
        file >> doc;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse job store " + path_ + ": " + e.what());
    }

    for (const auto& node : doc.value("destinations", json::array())) {
        auto destination = destinationFromJson(node);
        nextDestinationId_ = std::max(nextDestinationId_, destination.id + 1);
        destinations_[destination.id] = destination;
    }
    for (const auto& node : doc.value("jobs", json::array())) {
        auto job = jobFromJson(node);
        nextJobId_ = std::max(nextJobId_, job.id + 1);
        jobs_[job.id] = job;
    }
    for (const auto& node : doc.value("zipped_files", json::array())) {
        auto archived = archivedFileFromJson(node);
        nextFileId_ = std::max(nextFileId_, archived.id + 1);
        archivedFiles_.push_back(archived);
    }
    for (const auto& node : doc.value("restore_history", json::array())) {
        auto entry = restoreEntryFromJson(node);
        nextRestoreId_ = std::max(nextRestoreId_, entry.id + 1);
        restoreHistory_.push_back(entry);
    }

    Logger::info("Loaded job store " + path_ + ": " + std::to_string(jobs_.size()) + " job(s), " +
                 std::to_string(destinations_.size()) + " destination(s), " +
                 std::to_string(archivedFiles_.size()) + " catalogued file(s)");
}

// Caller holds mutex_.
void JsonJobStore::persist() const {
    if (path_.empty()) {
        return;
    }

    json doc;
    doc["version"] = kStoreVersion;
    doc["destinations"] = json::array();
    for (const auto& pair : destinations_) {
        doc["destinations"].push_back(toJson(pair.second));
    }
    doc["jobs"] = json::array();
    for (const auto& pair : jobs_) {
        doc["jobs"].push_back(toJson(pair.second));
    }
    doc["zipped_files"] = json::array();
    for (const auto& file : archivedFiles_) {
        doc["zipped_files"].push_back(toJson(file));
    }
    doc["restore_history"] = json::array();
    for (const auto& entry : restoreHistory_) {
        doc["restore_history"].push_back(toJson(entry));
    }

    const fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }
    const fs::path temp = target.string() + ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open job store for writing: " + temp.string());
        }
        file << doc.dump(4);
        if (!file.good()) {
            throw std::runtime_error("Failed to write job store: " + temp.string());
        }
    }
    fs::rename(temp, target);
}

// Caller holds mutex_.
JobDescriptor JsonJobStore::resolve(const JobDescriptor& job) const {
    JobDescriptor result = job;
    auto it = destinations_.find(job.destination.id);
    if (it != destinations_.end()) {
        result.destination = it->second;
    } else {
        result.destination = DestinationRef{};
        result.destination.id = job.destination.id;
    }
    return result;
}

std::vector<JobDescriptor> JsonJobStore::listJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobDescriptor> result;
    result.reserve(jobs_.size());
    for (const auto& pair : jobs_) {
        result.push_back(resolve(pair.second));
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.createdAt > b.createdAt;
    });
    return result;
}

std::vector<JobDescriptor> JsonJobStore::listDue(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobDescriptor> result;
    for (const auto& pair : jobs_) {
        const auto& job = pair.second;
        if (job.nextRunAt && job.status == JobStatus::Idle && *job.nextRunAt <= now) {
            result.push_back(resolve(job));
        }
    }
    return result;
}

std::optional<JobDescriptor> JsonJobStore::getJob(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& pair : jobs_) {
        if (pair.second.name == name) {
            return resolve(pair.second);
        }
    }
    return std::nullopt;
}

std::optional<JobDescriptor> JsonJobStore::getJobById(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return resolve(it->second);
}

int64_t JsonJobStore::addJob(const JobDescriptor& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (job.name.empty()) {
        throw std::invalid_argument("Job name must not be empty");
    }
    for (const auto& pair : jobs_) {
        if (pair.second.name == job.name) {
            throw std::invalid_argument("A job named '" + job.name + "' already exists");
        }
    }

    JobDescriptor stored = job;
    stored.id = nextJobId_++;
    if (stored.createdAt == TimePoint{}) {
        stored.createdAt = std::chrono::system_clock::now();
    }
    jobs_[stored.id] = stored;
    persist();

    Logger::info("Added job '" + stored.name + "' with id " + std::to_string(stored.id));
    return stored.id;
}

bool JsonJobStore::updateJob(const JobDescriptor& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job.id);
    if (it == jobs_.end()) {
        Logger::warning("Cannot update job id " + std::to_string(job.id) + ": not found");
        return false;
    }
    for (const auto& pair : jobs_) {
        if (pair.first != job.id && pair.second.name == job.name) {
            throw std::invalid_argument("A job named '" + job.name + "' already exists");
        }
    }

    JobDescriptor stored = job;
    stored.createdAt = it->second.createdAt;
    it->second = stored;
    persist();
    return true;
}

bool JsonJobStore::deleteJob(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = jobs_.begin(); it != jobs_.end(); ++it) {
        if (it->second.name == name) {
            jobs_.erase(it);
            persist();
            Logger::info("Deleted job '" + name + "'");
            return true;
        }
    }
    return false;
}

bool JsonJobStore::claimForRun(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() ||
        (it->second.status != JobStatus::Idle && it->second.status != JobStatus::Completed)) {
        return false;
    }
    it->second.status = JobStatus::Pending;
    persist();
    return true;
}

bool JsonJobStore::updateStatus(int64_t id,
                                JobStatus status,
                                std::optional<TimePoint> lastRunAt,
                                std::optional<JobStatus> lastRunOutcome,
                                std::optional<TimePoint> nextRunAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        Logger::warning("Cannot update status of job id " + std::to_string(id) + ": not found");
        return false;
    }

    it->second.status = status;
    it->second.lastRunAt = lastRunAt;
    it->second.lastRunOutcome = lastRunOutcome;
    it->second.nextRunAt = nextRunAt;
    persist();

    Logger::debug("Job id " + std::to_string(id) + " status is now " + toString(status));
    return true;
}

int64_t JsonJobStore::addDestination(const DestinationRef& destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destination.name.empty()) {
        throw std::invalid_argument("Destination name must not be empty");
    }
    for (const auto& pair : destinations_) {
        if (pair.second.name == destination.name) {
            throw std::invalid_argument("A destination named '" + destination.name + "' already exists");
        }
    }

    DestinationRef stored = destination;
    stored.id = nextDestinationId_++;
    destinations_[stored.id] = stored;
    persist();

    Logger::info("Added " + providerTag(stored.provider) + " destination '" + stored.name + "'");
    return stored.id;
}

bool JsonJobStore::updateDestination(const DestinationRef& destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = destinations_.find(destination.id);
    if (it == destinations_.end()) {
        return false;
    }
    for (const auto& pair : destinations_) {
        if (pair.first != destination.id && pair.second.name == destination.name) {
            throw std::invalid_argument("A destination named '" + destination.name + "' already exists");
        }
    }
    it->second = destination;
    persist();
    return true;
}

bool JsonJobStore::deleteDestination(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(destinations_.begin(), destinations_.end(),
                           [&name](const auto& pair) { return pair.second.name == name; });
    if (it == destinations_.end()) {
        return false;
    }

    const int64_t id = it->first;
    for (const auto& pair : jobs_) {
        if (pair.second.destination.id == id) {
            Logger::error("Destination '" + name + "' is used by job '" + pair.second.name + "'");
            return false;
        }
    }

    destinations_.erase(it);
    persist();
    return true;
}

std::vector<DestinationRef> JsonJobStore::listDestinations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DestinationRef> result;
    for (const auto& pair : destinations_) {
        result.push_back(pair.second);
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.name < b.name;
    });
    return result;
}

std::optional<DestinationRef> JsonJobStore::getDestination(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& pair : destinations_) {
        if (pair.second.name == name) {
            return pair.second;
        }
    }
    return std::nullopt;
}

std::optional<DestinationRef> JsonJobStore::getDestinationById(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = destinations_.find(id);
    if (it == destinations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void JsonJobStore::recordArchivedFile(const ArchivedFile& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    ArchivedFile stored = file;
    stored.id = nextFileId_++;
    if (stored.recordedAt == TimePoint{}) {
        stored.recordedAt = std::chrono::system_clock::now();
    }
    archivedFiles_.push_back(stored);
    persist();
}

std::vector<ArchivedFile> JsonJobStore::getFilesInArchive(const std::string& archivePath) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ArchivedFile> result;
    std::copy_if(archivedFiles_.begin(), archivedFiles_.end(), std::back_inserter(result),
                 [&archivePath](const ArchivedFile& file) { return file.archivePath == archivePath; });
    return result;
}

size_t JsonJobStore::updateArchiveLocation(const std::string& oldPath, const std::string& newUri) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t moved = 0;
    for (auto& file : archivedFiles_) {
        if (file.archivePath == oldPath) {
            file.archivePath = newUri;
            ++moved;
        }
    }
    if (moved > 0) {
        persist();
    }
    Logger::info("Moved " + std::to_string(moved) + " catalogue entries from " + oldPath + " to " + newUri);
    return moved;
}

std::vector<ArchivedFile> JsonJobStore::searchFiles(const std::string& query, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string needle = utils::toLower(query);

    std::vector<ArchivedFile> result;
    for (const auto& file : archivedFiles_) {
        if (needle.empty() ||
            containsIgnoreCase(file.entryName, needle) ||
            containsIgnoreCase(file.originalPath, needle) ||
            containsIgnoreCase(file.description, needle)) {
            result.push_back(file);
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.recordedAt > b.recordedAt;
    });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

std::vector<DuplicateFile> JsonJobStore::findDuplicateFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::vector<std::string>> byName;
    for (const auto& file : archivedFiles_) {
        byName[file.entryName].push_back(file.archivePath);
    }

    std::vector<DuplicateFile> result;
    for (auto& pair : byName) {
        if (pair.second.size() > 1) {
            result.push_back(DuplicateFile{pair.first, std::move(pair.second)});
        }
    }
    return result;
}

int64_t JsonJobStore::addRestoreHistory(const RestoreHistoryEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    RestoreHistoryEntry stored = entry;
    stored.id = nextRestoreId_++;
    restoreHistory_.push_back(stored);
    persist();
    return stored.id;
}

bool JsonJobStore::updateRestoreHistory(int64_t id, const std::string& status, TimePoint finishedAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(restoreHistory_.begin(), restoreHistory_.end(),
                           [id](const RestoreHistoryEntry& entry) { return entry.id == id; });
    if (it == restoreHistory_.end()) {
        return false;
    }
    it->status = status;
    it->finishedAt = finishedAt;
    persist();
    return true;
}

std::vector<RestoreHistoryEntry> JsonJobStore::listRestoreHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RestoreHistoryEntry> result = restoreHistory_;
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.startedAt > b.startedAt;
    });
    return result;
}
