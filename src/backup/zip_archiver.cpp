#include "backup/zip_archiver.hpp"
#include "backup/job_config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "storage/job_store.hpp"
#include <algorithm>
#include <archive.h>
#include <archive_entry.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>

namespace fs = std::filesystem;

namespace {

constexpr size_t kCopyBufferSize = 64 * 1024;

using ArchiveWriter = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
using ArchiveReader = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

struct SourceFile {
    fs::path path;
    std::string entryName;
    int64_t size{0};
};

TimePoint toSystemTime(fs::file_time_type fileTime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        fileTime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

std::string archiveBaseName(const fs::path& source) {
    fs::path clean = source.lexically_normal();
    if (!clean.has_filename()) {
        clean = clean.parent_path();
    }
    std::string name = clean.filename().string();
    return name.empty() ? "archive" : name;
}

// Regular files only; symlinks are neither archived nor followed.
std::vector<SourceFile> collectFiles(const fs::path& source) {
    std::vector<SourceFile> files;

    if (!fs::is_directory(source)) {
        files.push_back({source, archiveBaseName(source), static_cast<int64_t>(fs::file_size(source))});
        return files;
    }

    for (auto it = fs::recursive_directory_iterator(source, fs::directory_options::skip_permission_denied);
         it != fs::recursive_directory_iterator(); ++it) {
        if (it->is_symlink()) {
            Logger::debug("Skipping symlink " + it->path().string());
            continue;
        }
        if (!it->is_regular_file()) {
            continue;
        }
        files.push_back({it->path(),
                         it->path().lexically_relative(source).generic_string(),
                         static_cast<int64_t>(it->file_size())});
    }

    std::sort(files.begin(), files.end(), [](const SourceFile& a, const SourceFile& b) {
        return a.entryName < b.entryName;
    });
    return files;
}

std::string errorText(struct archive* a) {
    const char* text = archive_error_string(a);
    return text ? text : "unknown error";
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        Logger::warning("Failed to remove " + path.string() + ": " + ec.message());
    }
}

// Adds one file and returns the number of bytes it took up in the archive.
int64_t writeEntry(struct archive* a, const SourceFile& file) {
    std::ifstream in(file.path, std::ios::binary);
    if (!in.is_open()) {
        throw PackagingError("Failed to open " + file.path.string() + " for reading");
    }

    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, file.entryName.c_str());
    archive_entry_set_size(entry, file.size);
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, static_cast<int>(fs::status(file.path).permissions() & fs::perms::all));
    archive_entry_set_mtime(entry, std::chrono::system_clock::to_time_t(
        toSystemTime(fs::last_write_time(file.path))), 0);

    const int64_t before = archive_filter_bytes(a, -1);
    if (archive_write_header(a, entry) != ARCHIVE_OK) {
        std::string error = errorText(a);
        archive_entry_free(entry);
        throw PackagingError("Failed to add " + file.entryName + ": " + error);
    }
    archive_entry_free(entry);

    std::vector<char> buffer(kCopyBufferSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize count = in.gcount();
        if (count <= 0) {
            break;
        }
        if (archive_write_data(a, buffer.data(), static_cast<size_t>(count)) < 0) {
            throw PackagingError("Failed to write " + file.entryName + ": " + errorText(a));
        }
    }
    if (in.bad()) {
        throw PackagingError("Failed while reading " + file.path.string());
    }

    if (archive_write_finish_entry(a) != ARCHIVE_OK) {
        throw PackagingError("Failed to finish " + file.entryName + ": " + errorText(a));
    }
    return archive_filter_bytes(a, -1) - before;
}

} // namespace

ZipArchiver::ZipArchiver(JobStore* store)
    : store_(store) {
}

PackResult ZipArchiver::pack(const std::string& sourcePath,
                             const std::string& outputRoot,
                             ConflictPolicy policy,
                             const CancellationTokenPtr& cancelToken,
                             const ConflictPrompt& prompt) {
    const fs::path source(sourcePath);
    if (!fs::exists(source)) {
        throw SourceMissingError("Source path does not exist: " + sourcePath);
    }

    std::vector<SourceFile> files;
    try {
        fs::create_directories(outputRoot);
        files = collectFiles(source);
    } catch (const fs::filesystem_error& e) {
        throw PackagingError(std::string("Failed to prepare archive: ") + e.what());
    }

    const std::string initial = (fs::path(outputRoot) / (archiveBaseName(source) + ".zip")).string();
    const bool existed = fs::exists(initial);
    auto resolved = resolveConflict(initial, policy, prompt);

    PackResult result;
    if (!resolved) {
        result.action = "cancelled";
        return result;
    }
    if (*resolved != initial) {
        result.action = "renamed";
    } else {
        result.action = existed ? "overwritten" : "created";
    }

    const fs::path finalPath(*resolved);
    const fs::path partPath = finalPath.string() + ".part";
    Logger::info("Creating archive " + finalPath.string() + " from " + sourcePath +
                 " (" + std::to_string(files.size()) + " file(s))");

    std::vector<ArchivedFile> records;
    ArchiveWriter writer(archive_write_new(), &archive_write_free);
    try {
        struct archive* a = writer.get();
        archive_write_set_format_zip(a);
        archive_write_zip_set_compression_deflate(a);
        // Unbuffered output so archive_filter_bytes tracks every finished entry.
        archive_write_set_bytes_per_block(a, 0);

        if (archive_write_open_filename(a, partPath.c_str()) != ARCHIVE_OK) {
            throw PackagingError("Failed to open archive file " + partPath.string() + ": " +
                                 errorText(a));
        }

        for (const auto& file : files) {
            if (cancelToken && cancelToken->isCancelled()) {
                throw JobCancelledError("Packaging of " + sourcePath + " was cancelled");
            }

            const int64_t stored = writeEntry(a, file);

            ArchivedFile record;
            record.originalPath = file.path.string();
            record.entryName = file.entryName;
            record.archivePath = finalPath.string();
            record.fileSize = file.size;
            record.modifiedAt = toSystemTime(fs::last_write_time(file.path));
            record.compressedSize = stored;
            record.location = outputRoot;
            records.push_back(record);

            result.fileCount++;
            result.totalBytes += file.size;
            result.sourceFiles.push_back(file.path.string());
        }

        if (archive_write_close(a) != ARCHIVE_OK) {
            throw PackagingError("Failed to finalise archive " + partPath.string() + ": " +
                                 errorText(a));
        }
        writer.reset();
        fs::rename(partPath, finalPath);
    } catch (const std::exception&) {
        writer.reset();
        removeQuietly(partPath);
        throw;
    }

    if (store_) {
        for (const auto& record : records) {
            store_->recordArchivedFile(record);
        }
    }

    result.archivePath = finalPath.string();
    Logger::info("Archive " + finalPath.string() + " " + result.action + ": " +
                 std::to_string(result.fileCount) + " file(s), " +
                 std::to_string(result.totalBytes) + " byte(s)");
    return result;
}

std::vector<std::string> ZipArchiver::extract(const std::string& archivePath,
                                              const std::vector<std::string>& entryNames,
                                              const std::string& destinationDir,
                                              const CancellationTokenPtr& cancelToken) {
    std::set<std::string> wanted;
    for (auto name : entryNames) {
        std::replace(name.begin(), name.end(), '\\', '/');
        wanted.insert(name);
    }

    fs::create_directories(destinationDir);
    const fs::path root = fs::weakly_canonical(fs::path(destinationDir));

    ArchiveReader reader(archive_read_new(), &archive_read_free);
    struct archive* a = reader.get();
    archive_read_support_format_zip(a);
    if (archive_read_open_filename(a, archivePath.c_str(), 10240) != ARCHIVE_OK) {
        throw PackagingError("Failed to open archive " + archivePath + ": " + errorText(a));
    }

    std::vector<std::string> written;
    std::set<std::string> found;
    std::vector<char> buffer(kCopyBufferSize);
    struct archive_entry* entry = nullptr;
    int status = ARCHIVE_OK;

    while ((status = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        const char* rawName = archive_entry_pathname(entry);
        const std::string name = rawName ? rawName : "";
        if (wanted.count(name) == 0) {
            archive_read_data_skip(a);
            continue;
        }

        if (cancelToken && cancelToken->isCancelled()) {
            throw JobCancelledError("Extraction from " + archivePath + " was cancelled");
        }

        const fs::path target = (root / fs::path(name)).lexically_normal();
        const fs::path relative = target.lexically_relative(root);
        if (fs::path(name).is_absolute() || relative.empty() || *relative.begin() == "..") {
            throw PackagingError("Entry '" + name + "' would be written outside " + root.string());
        }

        if (archive_entry_filetype(entry) == AE_IFDIR) {
            fs::create_directories(target);
        } else {
            fs::create_directories(target.parent_path());
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw PackagingError("Failed to create " + target.string());
            }

            la_ssize_t count = 0;
            while ((count = archive_read_data(a, buffer.data(), buffer.size())) > 0) {
                out.write(buffer.data(), count);
            }
            if (count < 0) {
                throw PackagingError("Failed to read '" + name + "' from " + archivePath + ": " +
                                     errorText(a));
            }
            if (!out.good()) {
                throw PackagingError("Failed to write " + target.string());
            }
        }

        Logger::debug("Extracted '" + name + "' to " + target.string());
        found.insert(name);
        written.push_back(target.string());
    }

    if (status != ARCHIVE_EOF) {
        throw PackagingError("Failed to read archive " + archivePath + ": " + errorText(a));
    }

    std::string missing;
    for (const auto& name : wanted) {
        if (found.count(name) == 0) {
            missing += (missing.empty() ? "" : ", ") + name;
        }
    }
    if (!missing.empty()) {
        throw PackagingError("Not found in " + archivePath + ": " + missing);
    }

    Logger::info("Extracted " + std::to_string(written.size()) + " file(s) from " + archivePath +
                 " to " + root.string());
    return written;
}

std::vector<std::string> ZipArchiver::listEntries(const std::string& archivePath) {
    ArchiveReader reader(archive_read_new(), &archive_read_free);
    struct archive* a = reader.get();
    archive_read_support_format_zip(a);
    if (archive_read_open_filename(a, archivePath.c_str(), 10240) != ARCHIVE_OK) {
        throw PackagingError("Failed to open archive " + archivePath + ": " + errorText(a));
    }

    std::vector<std::string> names;
    struct archive_entry* entry = nullptr;
    while (archive_read_next_header(a, &entry) == ARCHIVE_OK) {
        names.push_back(archive_entry_pathname(entry));
        archive_read_data_skip(a);
    }
    return names;
}
