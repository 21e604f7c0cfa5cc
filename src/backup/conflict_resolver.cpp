#include "backup/conflict_resolver.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace {

std::string findFreeName(const fs::path& path) {
    const fs::path parent = path.parent_path();
    const std::string stem = path.stem().string();
    const std::string extension = path.extension().string();

    for (int count = 1; count <= kMaxRenameAttempts; ++count) {
        fs::path candidate = parent / (stem + "_" + std::to_string(count) + extension);
        if (!fs::exists(candidate)) {
            return candidate.string();
        }
    }
    throw PackagingError("No free name for " + path.string() + " after " +
                         std::to_string(kMaxRenameAttempts) + " attempts");
}

} // namespace

std::string toString(ConflictPolicy policy) {
    switch (policy) {
        case ConflictPolicy::Overwrite: return "overwrite";
        case ConflictPolicy::Rename: return "rename";
        case ConflictPolicy::Cancel: return "cancel";
        case ConflictPolicy::Ask: return "ask";
    }
    return "ask";
}

std::optional<ConflictPolicy> parseConflictPolicy(const std::string& text) {
    const std::string value = utils::toLower(utils::trim(text));
    if (value == "overwrite" || value == "o") return ConflictPolicy::Overwrite;
    if (value == "rename" || value == "r") return ConflictPolicy::Rename;
    if (value == "cancel" || value == "c") return ConflictPolicy::Cancel;
    if (value == "ask") return ConflictPolicy::Ask;
    return std::nullopt;
}

std::optional<std::string> resolveConflict(const std::string& path,
                                           ConflictPolicy policy,
                                           const ConflictPrompt& prompt) {
    if (!fs::exists(path)) {
        return path;
    }

    if (policy == ConflictPolicy::Ask) {
        if (!prompt) {
            Logger::warning("'" + path + "' exists and nobody can be asked, cancelling");
            return std::nullopt;
        }
        policy = prompt(path);
    }

    switch (policy) {
        case ConflictPolicy::Overwrite:
            Logger::info("Overwriting existing archive " + path);
            return path;
        case ConflictPolicy::Rename: {
            std::string renamed = findFreeName(fs::path(path));
            Logger::info("'" + path + "' exists, writing " + renamed + " instead");
            return renamed;
        }
        case ConflictPolicy::Cancel:
        case ConflictPolicy::Ask:
            break;
    }

    Logger::info("Archive " + path + " exists, write declined");
    return std::nullopt;
}
