// filename: errors.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <stdexcept>
#include <string>

namespace ensemble {

struct EnsembleError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Startup settings are unusable. Fatal before any worker starts.
struct ConfigValidationError : EnsembleError {
    using EnsembleError::EnsembleError;
};

// Run directory already exists at execution time.
struct DirectoryConflict : EnsembleError {
    using EnsembleError::EnsembleError;
};

struct SerializationError : EnsembleError {
    using EnsembleError::EnsembleError;
};

// A file or program required by a run is missing or cannot be started.
struct ResourceUnavailable : EnsembleError {
    using EnsembleError::EnsembleError;
};

struct ExternalProcessFailure : EnsembleError {
    ExternalProcessFailure(const std::string& message, int exitCode)
        : EnsembleError(message), exitCode_(exitCode) {}

    [[nodiscard]] int exit_code() const { return exitCode_; }

private:
    int exitCode_{0};
};

}  // namespace ensemble
