// filename: executor.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "ensemble/job_settings.hpp"
#include "ensemble/outcome.hpp"
#include "ensemble/run_config.hpp"
#include "ensemble/scheduler_env.hpp"

namespace ensemble {

constexpr const char* kSettingsFileName = "settings-files.json";
constexpr const char* kDescriptorFileName = "adios2.xml";
constexpr const char* kStdoutFileName = "stdout.txt";
constexpr const char* kStderrFileName = "stderr.txt";

/**
 * @brief Materialises one run directory and launches the simulation in it.
 *
 * Every per-run failure is reported through the returned RunOutcome; nothing
 * is retried.
 */
class RunExecutor {
public:
    RunExecutor(const JobSettings& settings, const SchedulerEnvironment& env,
                std::size_t rankCount = visibleCpuCount());

    RunOutcome execute(const WorkItem& item, std::size_t worker = 0) const;

    /// Launcher prefix followed by the simulation executable and its settings file.
    [[nodiscard]] std::vector<std::string> runCommand() const;

private:
    void createRunDirectory(const std::filesystem::path& directory) const;
    void writeSettings(const WorkItem& item) const;
    void copyDescriptor(const std::filesystem::path& directory) const;
    [[nodiscard]] std::vector<std::string> resolvedCommand() const;

    const JobSettings& settings_;
    const SchedulerEnvironment& env_;
    std::size_t rankCount_;
};

}  // namespace ensemble
