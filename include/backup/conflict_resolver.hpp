#pragma once

#include <functional>
#include <optional>
#include <string>

enum class ConflictPolicy {
    Overwrite,
    Rename,
    Cancel,
    Ask
};

std::string toString(ConflictPolicy policy);
std::optional<ConflictPolicy> parseConflictPolicy(const std::string& text);

// Asked with the existing path when the policy is Ask. Answering Ask again counts as Cancel.
using ConflictPrompt = std::function<ConflictPolicy(const std::string&)>;

constexpr int kMaxRenameAttempts = 10000;

// Picks the path an archive should be written to. A path that does not exist
// is returned unchanged. Rename probes "<stem>_1<ext>", "<stem>_2<ext>", ...
// and throws PackagingError after kMaxRenameAttempts taken names. An empty
// result means the write was declined.
std::optional<std::string> resolveConflict(const std::string& path,
                                           ConflictPolicy policy,
                                           const ConflictPrompt& prompt = nullptr);
