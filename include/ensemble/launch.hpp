// filename: launch.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ensemble {

/**
 * @brief Launcher prefix for one node-parallel run.
 *
 * With a cluster scheduler the ranks are confined to a single node
 * (srun -n N -N 1); otherwise mpirun -np N is used with no node affinity.
 * The caller appends the executable and its arguments.
 */
std::vector<std::string> buildLaunchCommand(std::size_t rankCount, bool hasClusterScheduler);

std::string joinCommand(const std::vector<std::string>& command);

}  // namespace ensemble
