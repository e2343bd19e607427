// filename: orchestrator.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <cstddef>

#include "ensemble/job_settings.hpp"
#include "ensemble/scheduler_env.hpp"
#include "ensemble/supervisor.hpp"

namespace ensemble {

struct EnsembleSummary {
    std::size_t nodeCount{0};
    std::size_t runsGenerated{0};
    std::size_t runsSkipped{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    SupervisorReport supervisor{};
};

/**
 * @brief Run the whole sweep: one worker per node, every missing grid point
 *        launched once. Individual run failures do not raise.
 */
EnsembleSummary runEnsemble(const JobSettings& settings, const SchedulerEnvironment& env);

}  // namespace ensemble
