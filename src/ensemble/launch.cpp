// filename: launch.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/launch.hpp"

#include <stdexcept>

namespace ensemble {

std::vector<std::string> buildLaunchCommand(std::size_t rankCount, bool hasClusterScheduler) {
    if (rankCount == 0) {
        throw std::invalid_argument("buildLaunchCommand: rank count must be positive");
    }
    const std::string ranks = std::to_string(rankCount);
    if (hasClusterScheduler) {
        return {"srun", "-n", ranks, "-N", "1"};
    }
    return {"mpirun", "-np", ranks};
}

std::string joinCommand(const std::vector<std::string>& command) {
    std::string text;
    for (const auto& part : command) {
        if (!text.empty()) {
            text += ' ';
        }
        text += part;
    }
    return text;
}

}  // namespace ensemble
