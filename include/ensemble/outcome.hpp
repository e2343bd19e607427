// filename: outcome.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ensemble {

enum class RunStatus {
    Succeeded,
    DirectoryConflict,
    SerializationError,
    ResourceUnavailable,
    ExternalProcessFailure,
    InternalFault
};

const char* toString(RunStatus status);

struct RunOutcome {
    std::filesystem::path directory;
    RunStatus status{RunStatus::Succeeded};
    int exitCode{0};
    std::filesystem::path stdoutPath;
    std::filesystem::path stderrPath;
    std::string message;
    double elapsedSeconds{0.0};
    std::size_t worker{0};

    [[nodiscard]] bool succeeded() const { return status == RunStatus::Succeeded; }
};

/**
 * @brief Process-wide record of every finished run. Safe to use from all workers.
 */
class OutcomeLedger {
public:
    void record(RunOutcome outcome);

    [[nodiscard]] std::vector<RunOutcome> outcomes() const;
    [[nodiscard]] std::size_t succeededCount() const;
    [[nodiscard]] std::size_t failedCount() const;

    nlohmann::json toJson(std::size_t runsGenerated, std::size_t runsSkipped) const;
    void writeJson(const std::filesystem::path& path, std::size_t runsGenerated,
                   std::size_t runsSkipped) const;

private:
    mutable std::mutex mutex_;
    std::vector<RunOutcome> outcomes_;
};

}  // namespace ensemble
