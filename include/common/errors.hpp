#pragma once

#include <stdexcept>
#include <string>

// Failures raised inside a single run. The executor catches all of them at its
// top level; none of them leave the run's thread.
class JobError : public std::runtime_error {
public:
    explicit JobError(const std::string& message) : std::runtime_error(message) {}
};

// Explicit stop request or a declined overwrite. Not an error for reporting purposes.
class JobCancelledError : public JobError {
public:
    explicit JobCancelledError(const std::string& message) : JobError(message) {}
};

class ConfigurationError : public JobError {
public:
    explicit ConfigurationError(const std::string& message) : JobError(message) {}
};

class PackagingError : public JobError {
public:
    explicit PackagingError(const std::string& message) : JobError(message) {}
};

class TransferError : public JobError {
public:
    explicit TransferError(const std::string& message) : JobError(message) {}
};

class SourceMissingError : public JobError {
public:
    explicit SourceMissingError(const std::string& message) : JobError(message) {}
};
