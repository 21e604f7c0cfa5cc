#pragma once

#include <optional>
#include <string>

// Lower-case hex digest of a file. algorithm is "md5", "sha1" or "sha256"
// (case-insensitive). Empty on unknown algorithms or I/O errors.
std::optional<std::string> calculateFileDigest(const std::string& filePath, const std::string& algorithm);

bool isSupportedDigest(const std::string& algorithm);
