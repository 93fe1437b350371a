#pragma once

#include <stdexcept>
#include <string>

// Base class for every fatal error raised while publishing a VM.
class UploadError : public std::runtime_error {
public:
    explicit UploadError(const std::string& message) : std::runtime_error(message) {}
};

// Missing or incompatible external runtime, SDK or export helper.
class EnvironmentError : public UploadError {
public:
    explicit EnvironmentError(const std::string& message) : UploadError(message) {}
};

// Invalid or missing option, detected before any remote state exists.
class ConfigurationError : public UploadError {
public:
    explicit ConfigurationError(const std::string& message) : UploadError(message) {}
};

// A helper exited non-zero or its result lacked an expected field.
class RemoteRejection : public UploadError {
public:
    explicit RemoteRejection(const std::string& message) : UploadError(message) {}
};

// A child process could not be started, or would not stop.
class ProcessError : public UploadError {
public:
    explicit ProcessError(const std::string& message) : UploadError(message) {}
};
