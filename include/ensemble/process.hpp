// filename: process.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ensemble {

struct ProcessResult {
    int exitCode{0};
    bool signalled{false};
    int signal{0};

    [[nodiscard]] bool success() const { return !signalled && exitCode == 0; }
};

/**
 * @brief Run @p argv to completion inside @p workingDirectory.
 *
 * argv[0] must be a resolved path. Standard output and error are written to
 * the given files, truncating them. Blocks until the child exits; there is no
 * timeout. Throws ResourceUnavailable when the output files cannot be opened
 * or the program cannot be started.
 */
ProcessResult runProcess(const std::vector<std::string>& argv,
                         const std::filesystem::path& workingDirectory,
                         const std::filesystem::path& stdoutPath,
                         const std::filesystem::path& stderrPath);

}  // namespace ensemble
