#include "test_support.hpp"
#include "backup/schedule.hpp"
#include "common/file_hash.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace testing_support {

TempDir::TempDir() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    std::ostringstream name;
    name << "zipvault_test_" << std::hex << dis(gen);
    path_ = fs::temp_directory_path() / name.str();
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void writeFile(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

TimePoint utcTime(int year, int month, int day, int hour, int minute, int second) {
    char text[32];
    std::snprintf(text, sizeof(text), "%04d-%02d-%02dT%02d:%02d:%02dZ", year, month, day, hour, minute, second);
    return parseIso8601(text).value();
}

bool FakeNotifier::notify(const std::string& subject, const std::string& body, const std::string& recipient) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_) {
        lastError_ = "simulated SMTP failure";
        return false;
    }
    sent_.push_back(SentMail{subject, body, recipient});
    return true;
}

std::vector<SentMail> FakeNotifier::sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

FakeProvider::FakeProvider(ProviderKind kind, std::shared_ptr<FakeCloud> cloud)
    : kind_(kind)
    , cloud_(std::move(cloud)) {
}

bool FakeProvider::authenticate() {
    if (cloud_->failAuthentication) {
        lastError_ = "token rejected";
        return false;
    }
    authenticated_ = true;
    return true;
}

std::optional<std::string> FakeProvider::upload(const std::string& localPath, const std::string& remoteFolder) {
    std::lock_guard<std::mutex> lock(cloud_->mutex);
    if (cloud_->failUpload) {
        lastError_ = "simulated outage";
        return std::nullopt;
    }

    const std::string id = "file-" + std::to_string(++cloud_->uploads);
    const fs::path stored = cloud_->root / id;
    fs::create_directories(cloud_->root);
    fs::copy_file(localPath, stored, fs::copy_options::overwrite_existing);
    cloud_->files[id] = stored;
    cloud_->uploadFolders.push_back(remoteFolder);
    return id;
}

bool FakeProvider::download(const std::string& remoteId, const std::string& localPath) {
    std::lock_guard<std::mutex> lock(cloud_->mutex);
    auto it = cloud_->files.find(remoteId);
    if (it == cloud_->files.end()) {
        lastError_ = "no such file: " + remoteId;
        return false;
    }
    fs::create_directories(fs::path(localPath).parent_path());
    fs::copy_file(it->second, localPath, fs::copy_options::overwrite_existing);
    return true;
}

std::optional<RemoteHash> FakeProvider::getRemoteHash(const std::string& remoteId) {
    std::lock_guard<std::mutex> lock(cloud_->mutex);
    auto it = cloud_->files.find(remoteId);
    if (it == cloud_->files.end()) {
        return std::nullopt;
    }

    switch (cloud_->hashMode) {
        case HashMode::Md5:
            return RemoteHash{"md5", calculateFileDigest(it->second.string(), "md5").value_or("")};
        case HashMode::Sha256Upper: {
            std::string value = calculateFileDigest(it->second.string(), "sha256").value_or("");
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return RemoteHash{"SHA256", value};
        }
        case HashMode::Mismatch:
            return RemoteHash{"md5", "00000000000000000000000000000000"};
        case HashMode::None:
            break;
    }
    return std::nullopt;
}

bool FakeProvider::deleteRemote(const std::string& remoteId) {
    std::lock_guard<std::mutex> lock(cloud_->mutex);
    if (cloud_->failDelete) {
        lastError_ = "delete refused";
        return false;
    }
    cloud_->files.erase(remoteId);
    cloud_->deleted.push_back(remoteId);
    return true;
}

PackResult BlockingPackager::pack(const std::string& sourcePath,
                                  const std::string& outputRoot,
                                  ConflictPolicy policy,
                                  const CancellationTokenPtr& cancelToken,
                                  const ConflictPrompt& prompt) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        ++entered_;
        condition_.notify_all();
        condition_.wait(lock, [this] { return released_; });
    }
    return archiver_.pack(sourcePath, outputRoot, policy, cancelToken, prompt);
}

bool BlockingPackager::waitForEntered(int count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return condition_.wait_for(lock, timeout, [this, count] { return entered_ >= count; });
}

void BlockingPackager::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
    }
    condition_.notify_all();
}

StatusRecorder::StatusRecorder(OrchestrationContext& context, const std::string& jobName)
    : context_(context)
    , jobName_(jobName)
    , key_("status-recorder:" + jobName) {
    context_.getEventNotifier().addListener(key_, [this]() { capture(); });
}

StatusRecorder::~StatusRecorder() {
    context_.getEventNotifier().removeListener(key_);
}

std::vector<JobStatus> StatusRecorder::sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

void StatusRecorder::capture() {
    for (const auto& record : context_.getJobManager().listRunning()) {
        if (record.payload.name != jobName_) {
            continue;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (sequence_.empty() || sequence_.back() != record.status) {
            sequence_.push_back(record.status);
        }
    }
}

void OrchestrationTest::SetUp() {
    now_ = std::chrono::system_clock::now();
    settings_.set(settings_keys::kStagingPath, (temp_ / "staging").string());

    mailer_ = std::make_shared<FakeNotifier>();
    cloud_ = std::make_shared<FakeCloud>(temp_ / "cloud");

    context_ = std::make_unique<OrchestrationContext>(store_, settings_);
    context_->setEmailNotifier(mailer_);
    auto cloud = cloud_;
    context_->setProviderFactory([cloud](ProviderKind kind) -> std::unique_ptr<TransferProvider> {
        return std::make_unique<FakeProvider>(kind, cloud);
    });
    context_->setClock([this]() { return now(); });
}

void OrchestrationTest::TearDown() {
    context_.reset();
}

void OrchestrationTest::setNow(TimePoint now) {
    std::lock_guard<std::mutex> lock(clockMutex_);
    now_ = now;
}

TimePoint OrchestrationTest::now() const {
    std::lock_guard<std::mutex> lock(clockMutex_);
    return now_;
}

int64_t OrchestrationTest::addDestination(const std::string& name, ProviderKind provider, const std::string& location) {
    DestinationRef destination;
    destination.name = name;
    destination.provider = provider;
    destination.location = location;
    return store_.addDestination(destination);
}

JobDescriptor OrchestrationTest::addJob(const std::string& name,
                                        const std::string& sourcePath,
                                        const std::string& destinationName,
                                        const ScheduleSpec& schedule) {
    JobDescriptor job;
    job.name = name;
    job.sourcePath = sourcePath;
    job.destination = store_.getDestination(destinationName).value();
    job.schedule = schedule;
    job.nextRunAt = computeNextRun(schedule, now());
    store_.addJob(job);
    return store_.getJob(name).value();
}

fs::path OrchestrationTest::makeSource(const std::string& name) {
    const fs::path source = temp_ / name;
    writeFile(source / "a.txt", "alpha alpha alpha");
    writeFile(source / "sub" / "b.txt", std::string(4096, 'b'));
    return source;
}

bool OrchestrationTest::waitForRuns(std::chrono::milliseconds timeout) {
    return context_->getRunTracker().waitForIdle(timeout);
}

} // namespace testing_support
