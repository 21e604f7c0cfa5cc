#pragma once

#include <string>

class OrchestrationContext;
class Packager;

// Self-tests for the two halves of a backup: packing a file into an archive
// and shipping a file to each configured cloud destination.
namespace station_checker {

// Archives a small scratch file under tempDir and confirms the archive exists.
// Both files are removed afterwards.
bool checkPacking(Packager& packager, const std::string& tempDir);

// Uploads a small scratch file to every cloud destination in the store and
// deletes the remote copy again. No cloud destinations counts as success; a
// failed remote delete is only a warning.
bool checkShipping(OrchestrationContext& context, const std::string& tempDir);

} // namespace station_checker
