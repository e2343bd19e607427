// filename: outcome.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/outcome.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace ensemble {

const char* toString(RunStatus status) {
    switch (status) {
        case RunStatus::Succeeded: return "succeeded";
        case RunStatus::DirectoryConflict: return "directory_conflict";
        case RunStatus::SerializationError: return "serialization_error";
        case RunStatus::ResourceUnavailable: return "resource_unavailable";
        case RunStatus::ExternalProcessFailure: return "external_process_failure";
        case RunStatus::InternalFault: return "internal_fault";
    }
    return "unknown";
}

void OutcomeLedger::record(RunOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(std::move(outcome));
}

std::vector<RunOutcome> OutcomeLedger::outcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

std::size_t OutcomeLedger::succeededCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        outcomes_.begin(), outcomes_.end(), [](const RunOutcome& o) { return o.succeeded(); }));
}

std::size_t OutcomeLedger::failedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        outcomes_.begin(), outcomes_.end(), [](const RunOutcome& o) { return !o.succeeded(); }));
}

nlohmann::json OutcomeLedger::toJson(std::size_t runsGenerated, std::size_t runsSkipped) const {
    std::vector<RunOutcome> snapshot = outcomes();
    std::sort(snapshot.begin(), snapshot.end(),
              [](const RunOutcome& a, const RunOutcome& b) { return a.directory < b.directory; });

    nlohmann::json runs = nlohmann::json::array();
    std::size_t succeeded = 0;
    for (const auto& outcome : snapshot) {
        if (outcome.succeeded()) {
            ++succeeded;
        }
        runs.push_back({
            {"directory", outcome.directory.string()},
            {"status", toString(outcome.status)},
            {"exit_code", outcome.exitCode},
            {"stdout", outcome.stdoutPath.string()},
            {"stderr", outcome.stderrPath.string()},
            {"message", outcome.message},
            {"elapsed_seconds", outcome.elapsedSeconds},
            {"worker", outcome.worker},
        });
    }

    return {
        {"runs_generated", runsGenerated},
        {"runs_skipped", runsSkipped},
        {"succeeded", succeeded},
        {"failed", snapshot.size() - succeeded},
        {"runs", runs},
    };
}

void OutcomeLedger::writeJson(const std::filesystem::path& path, std::size_t runsGenerated,
                              std::size_t runsSkipped) const {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open outcome ledger: " + path.string());
    }
    ofs << toJson(runsGenerated, runsSkipped).dump(4) << '\n';
    ofs.close();
    if (!ofs) {
        throw std::runtime_error("Failed while writing outcome ledger to " + path.string());
    }
}

}  // namespace ensemble
