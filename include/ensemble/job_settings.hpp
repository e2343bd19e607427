// filename: job_settings.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "ensemble/scheduler_env.hpp"
#include "ensemble/sweep.hpp"

namespace ensemble {

/**
 * @brief Orchestrator bootstrap settings, read once at startup.
 */
struct JobSettings {
    std::string gsExe;  // path, or a bare command name found on PATH
    std::filesystem::path gsJson;
    std::filesystem::path adios2Xml;
    std::filesystem::path ensembleRoot;
    SweepSpec sweep{};
    std::optional<std::filesystem::path> outcomeLedger;
    bool quiet{false};
};

/**
 * @brief Load and validate the startup settings file.
 *
 * Requires gs_exe, gs_json, adios2_xml and ensemble_root, each naming an
 * existing path (gs_exe may instead be a command on PATH). Optional keys:
 * sweep, outcome_ledger, quiet. Throws ConfigValidationError on any violation.
 */
JobSettings loadJobSettings(const std::filesystem::path& path, const SchedulerEnvironment& env);

JobSettings parseJobSettings(const nlohmann::json& json, const SchedulerEnvironment& env);

}  // namespace ensemble
