#include "backup/backup_cli.hpp"
#include "backup/backup_scheduler.hpp"
#include "backup/restore_job.hpp"
#include "backup/schedule.hpp"
#include "backup/station_checker.hpp"
#include "backup/zip_archiver.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/orchestration_context.hpp"
#include "common/settings.hpp"
#include "common/utils.hpp"
#include "storage/job_store.hpp"
#include <cstdio>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t g_stopSignal = 0;

void handleStopSignal(int) {
    g_stopSignal = 1;
}

std::string formatOptionalTime(const std::optional<TimePoint>& time) {
    return time ? formatIso8601(*time) : std::string("-");
}

// "HH:MM" into hour and minute.
bool parseClockTime(const std::string& text, int& hour, int& minute) {
    const auto colon = text.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    try {
        hour = std::stoi(text.substr(0, colon));
        minute = std::stoi(text.substr(colon + 1));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

std::string describeSchedule(const ScheduleSpec& spec) {
    char clock[8];
    std::snprintf(clock, sizeof(clock), "%02d:%02d", spec.hour, spec.minute);
    switch (spec.kind) {
        case ScheduleKind::Manual:
            return "Manual";
        case ScheduleKind::Daily:
            return std::string("Daily at ") + clock;
        case ScheduleKind::Hourly:
            return "Hourly at :" + std::string(clock + 3);
        case ScheduleKind::Once:
            return "Once on " + spec.date + " " + clock;
        case ScheduleKind::Weekly:
            return "Weekly on " + weekdayName(spec.dayOfWeek) + " at " + clock;
    }
    return toString(spec.kind);
}

} // namespace

BackupCLI::BackupCLI(OrchestrationContext& context)
    : context_(context) {
}

void BackupCLI::printUsage() {
    std::cout << "Usage: zipvault [--config <file>] <command> [arguments]\n"
              << "Commands:\n"
              << "  serve                                   Run the scheduler until interrupted\n"
              << "  run <job>                               Run a job now and wait for it\n"
              << "  list                                    List jobs and their state\n"
              << "  add-destination <name> <provider> <location>\n"
              << "                                          provider: local, gdrive or onedrive\n"
              << "  add-job <name> <source> <destination> [options]\n"
              << "      --schedule <Manual|Daily|Hourly|Once|Weekly>\n"
              << "      --time HH:MM  --date YYYY-MM-DD  --day <weekday>\n"
              << "      --email <address>  --move\n"
              << "  delete-job <name>                       Remove a job\n"
              << "  restore <destination-dir> <archive> <entry>... [--email <address>]\n"
              << "  search <query>                          Search the archive catalogue\n"
              << "  duplicates                              Entries stored in more than one archive\n"
              << "  history                                 Restore history\n"
              << "  check                                   Packing and shipping self-test\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help    Show this help message\n"
              << "  -v, --version Show version information\n";
}

int BackupCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: No command specified\n";
        printUsage();
        return 1;
    }

    const std::string& command = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());
    Logger::debug("Dispatching command: " + command);

    try {
        if (command == "serve") {
            return handleServeCommand(rest);
        } else if (command == "run") {
            return handleRunCommand(rest);
        } else if (command == "list") {
            return handleListCommand(rest);
        } else if (command == "add-destination") {
            return handleAddDestinationCommand(rest);
        } else if (command == "add-job") {
            return handleAddJobCommand(rest);
        } else if (command == "delete-job") {
            return handleDeleteJobCommand(rest);
        } else if (command == "restore") {
            return handleRestoreCommand(rest);
        } else if (command == "search") {
            return handleSearchCommand(rest);
        } else if (command == "duplicates") {
            return handleDuplicatesCommand(rest);
        } else if (command == "history") {
            return handleHistoryCommand(rest);
        } else if (command == "check") {
            return handleCheckCommand(rest);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        Logger::error("Command '" + command + "' failed: " + e.what());
        return 1;
    }

    std::cerr << "Error: Unknown command: " << command << "\n";
    Logger::error("Unknown command: " + command);
    printUsage();
    return 1;
}

int BackupCLI::handleServeCommand(const std::vector<std::string>&) {
    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    BackupScheduler scheduler(context_);
    scheduler.start();
    std::cout << "Scheduler running. Press Ctrl+C to stop.\n";

    while (!g_stopSignal) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Logger::info("Stop signal received");
    scheduler.stop();
    return 0;
}

int BackupCLI::handleRunCommand(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Error: run needs exactly one job name\n";
        printUsage();
        return 1;
    }

    BackupScheduler scheduler(context_);
    const std::string runId = scheduler.runNow(args[0]);
    std::cout << "Started job '" << args[0] << "' (run " << runId << ")\n";
    waitForRuns();

    auto job = context_.getStore().getJob(args[0]);
    const JobStatus outcome = job && job->lastRunOutcome ? *job->lastRunOutcome : JobStatus::Failed;
    std::cout << "Job '" << args[0] << "' finished with status: " << toString(outcome) << "\n";
    return outcome == JobStatus::Completed ? 0 : 1;
}

int BackupCLI::handleListCommand(const std::vector<std::string>&) {
    auto jobs = context_.getStore().listJobs();
    if (jobs.empty()) {
        std::cout << "No jobs configured\n";
        return 0;
    }

    for (const auto& job : jobs) {
        std::cout << "Job: " << job.name << "\n"
                  << "  Source:      " << job.sourcePath << "\n"
                  << "  Destination: " << job.destination.name << " (" << providerTag(job.destination.provider)
                  << ": " << job.destination.location << ")\n"
                  << "  Schedule:    " << describeSchedule(job.schedule) << "\n"
                  << "  Status:      " << toString(job.status) << "\n"
                  << "  Last run:    " << formatOptionalTime(job.lastRunAt)
                  << (job.lastRunOutcome ? " (" + toString(*job.lastRunOutcome) + ")" : std::string()) << "\n"
                  << "  Next run:    " << formatOptionalTime(job.nextRunAt) << "\n";
    }
    return 0;
}

int BackupCLI::handleAddDestinationCommand(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        std::cerr << "Error: add-destination needs <name> <provider> <location>\n";
        printUsage();
        return 1;
    }

    auto provider = parseProviderTag(args[1]);
    if (!provider) {
        std::cerr << "Error: Unknown provider '" << args[1] << "'\n";
        return 1;
    }

    DestinationRef destination;
    destination.name = args[0];
    destination.provider = *provider;
    destination.location = args[2];
    const int64_t id = context_.getStore().addDestination(destination);
    std::cout << "Added destination '" << destination.name << "' (id " << id << ")\n";
    return 0;
}

int BackupCLI::handleAddJobCommand(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        std::cerr << "Error: add-job needs <name> <source> <destination>\n";
        printUsage();
        return 1;
    }

    JobStore& store = context_.getStore();
    auto destination = store.getDestination(args[2]);
    if (!destination) {
        std::cerr << "Error: Unknown destination '" << args[2] << "'\n";
        return 1;
    }

    JobDescriptor job;
    job.name = args[0];
    job.sourcePath = args[1];
    job.destination = *destination;

    for (size_t i = 3; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool hasValue = i + 1 < args.size();
        if (arg == "--move") {
            job.moveFiles = true;
        } else if (arg == "--schedule" && hasValue) {
            auto kind = parseScheduleKind(args[++i]);
            if (!kind) {
                std::cerr << "Error: Unknown schedule '" << args[i] << "'\n";
                return 1;
            }
            job.schedule.kind = *kind;
        } else if (arg == "--time" && hasValue) {
            if (!parseClockTime(args[++i], job.schedule.hour, job.schedule.minute)) {
                std::cerr << "Error: Invalid time '" << args[i] << "', expected HH:MM\n";
                return 1;
            }
        } else if (arg == "--date" && hasValue) {
            job.schedule.date = args[++i];
        } else if (arg == "--day" && hasValue) {
            auto day = parseWeekday(args[++i]);
            if (!day) {
                std::cerr << "Error: Unknown weekday '" << args[i] << "'\n";
                return 1;
            }
            job.schedule.dayOfWeek = *day;
        } else if (arg == "--email" && hasValue) {
            job.sendEmail = true;
            job.recipient = args[++i];
        } else {
            std::cerr << "Error: Unknown or incomplete option '" << arg << "'\n";
            printUsage();
            return 1;
        }
    }

    const std::string problem = validateSchedule(job.schedule);
    if (!problem.empty()) {
        std::cerr << "Error: " << problem << "\n";
        return 1;
    }

    const TimePoint now = context_.now();
    job.createdAt = now;
    job.nextRunAt = computeNextRun(job.schedule, now);
    const int64_t id = store.addJob(job);

    std::cout << "Added job '" << job.name << "' (id " << id << "), "
              << describeSchedule(job.schedule) << ", next run " << formatOptionalTime(job.nextRunAt) << "\n";
    return 0;
}

int BackupCLI::handleDeleteJobCommand(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Error: delete-job needs exactly one job name\n";
        return 1;
    }
    if (!context_.getStore().deleteJob(args[0])) {
        std::cerr << "Error: Job not found: " << args[0] << "\n";
        return 1;
    }
    std::cout << "Deleted job '" << args[0] << "'\n";
    return 0;
}

int BackupCLI::handleRestoreCommand(const std::vector<std::string>& args) {
    RestoreRequest request;
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--email" && i + 1 < args.size()) {
            request.recipient = args[++i];
        } else {
            positional.push_back(args[i]);
        }
    }

    if (positional.size() < 3) {
        std::cerr << "Error: restore needs <destination-dir> <archive> <entry>...\n";
        printUsage();
        return 1;
    }

    request.destinationPath = positional[0];
    for (size_t i = 2; i < positional.size(); ++i) {
        request.files.push_back(RestoreFileRef{positional[1], positional[i]});
    }

    RestoreJob job(context_, request);
    const JobStatus status = job.run();
    std::cout << "Restore job '" << job.getJobName() << "' finished with status: " << toString(status)
              << " (" << job.getMessage() << ")\n";
    for (const auto& path : job.getWrittenFiles()) {
        std::cout << "  " << path << "\n";
    }
    return status == JobStatus::Completed ? 0 : 1;
}

int BackupCLI::handleSearchCommand(const std::vector<std::string>& args) {
    const std::string query = args.empty() ? "" : args[0];
    auto files = context_.getStore().searchFiles(query);
    if (files.empty()) {
        std::cout << "No matching files\n";
        return 0;
    }

    for (const auto& file : files) {
        std::cout << std::left << std::setw(40) << file.entryName << " "
                  << std::setw(10) << utils::formatSize(file.fileSize) << " "
                  << file.archivePath << "\n";
    }
    return 0;
}

int BackupCLI::handleDuplicatesCommand(const std::vector<std::string>&) {
    auto duplicates = context_.getStore().findDuplicateFiles();
    if (duplicates.empty()) {
        std::cout << "No duplicate files found\n";
        return 0;
    }

    for (const auto& duplicate : duplicates) {
        std::cout << duplicate.entryName << " (" << duplicate.archivePaths.size() << " archives)\n";
        for (const auto& archive : duplicate.archivePaths) {
            std::cout << "  " << archive << "\n";
        }
    }
    return 0;
}

int BackupCLI::handleHistoryCommand(const std::vector<std::string>&) {
    auto history = context_.getStore().listRestoreHistory();
    if (history.empty()) {
        std::cout << "No restores recorded\n";
        return 0;
    }

    for (const auto& entry : history) {
        std::cout << formatIso8601(entry.startedAt) << "  " << entry.jobName << "  " << entry.status
                  << "  -> " << entry.destinationPath << " (" << entry.filesRestored.size() << " file(s))\n";
    }
    return 0;
}

int BackupCLI::handleCheckCommand(const std::vector<std::string>&) {
    const std::string tempDir = context_.getSettings().getString(settings_keys::kStagingPath)
        .value_or((fs::temp_directory_path() / "zipvault_check").string());

    // Scratch archives stay out of the catalogue.
    ZipArchiver scratchArchiver;
    const bool packing = station_checker::checkPacking(scratchArchiver, tempDir);
    const bool shipping = station_checker::checkShipping(context_, tempDir);

    std::cout << "Packing:  " << (packing ? "OK" : "FAILED") << "\n"
              << "Shipping: " << (shipping ? "OK" : "FAILED") << "\n";
    return packing && shipping ? 0 : 1;
}

void BackupCLI::waitForRuns() const {
    while (!context_.getRunTracker().waitForIdle(std::chrono::seconds(1))) {
        for (const auto& record : context_.getJobManager().listRunning()) {
            Logger::debug("Waiting for '" + record.payload.name + "' (" + toString(record.status) + ")");
        }
    }
}
