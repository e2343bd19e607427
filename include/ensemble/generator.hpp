// filename: generator.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

#include "ensemble/run_config.hpp"
#include "ensemble/sweep.hpp"

namespace ensemble {

/**
 * @brief Lazy enumeration of the F x k grid, F-major.
 *
 * Grid points whose run directory already exists are skipped, which lets a
 * partially finished ensemble be resumed by rerunning the orchestrator. The
 * existence check and the later directory creation are not atomic, so two
 * orchestrators sharing an ensemble root can race; the loser sees a
 * DirectoryConflict. Filesystem errors during the check propagate.
 */
class RunDescriptorGenerator {
public:
    RunDescriptorGenerator(RunConfig runTemplate, SweepSpec spec, std::filesystem::path ensembleRoot);

    /// Next work item, or nullopt once the grid is exhausted.
    std::optional<WorkItem> next();

    [[nodiscard]] bool exhausted() const;
    [[nodiscard]] std::size_t generatedCount() const { return generated_; }
    [[nodiscard]] std::size_t skippedCount() const { return skipped_; }

private:
    RunConfig template_;
    SweepSpec spec_;
    std::filesystem::path root_;
    std::size_t fIndex_{0};
    std::size_t kIndex_{0};
    std::size_t generated_{0};
    std::size_t skipped_{0};
};

/// Drains a fresh generator into a vector.
std::vector<WorkItem> generateRuns(const RunConfig& runTemplate, const SweepSpec& spec,
                                   const std::filesystem::path& ensembleRoot);

}  // namespace ensemble
