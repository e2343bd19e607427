// filename: orchestrator.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/orchestrator.hpp"

#include "ensemble/executor.hpp"
#include "ensemble/generator.hpp"
#include "ensemble/log.hpp"
#include "ensemble/outcome.hpp"
#include "ensemble/run_config.hpp"

#include <stdexcept>
#include <string>

namespace ensemble {

EnsembleSummary runEnsemble(const JobSettings& settings, const SchedulerEnvironment& env) {
    EnsembleSummary summary{};
    summary.nodeCount = resolveNodeCount(env);

    const RunConfig runTemplate = loadRunTemplate(settings.gsJson);
    RunDescriptorGenerator generator(runTemplate, settings.sweep, settings.ensembleRoot);

    const RunExecutor executor(settings, env);
    OutcomeLedger ledger;
    WorkerPoolSupervisor supervisor(
        summary.nodeCount,
        [&executor](const WorkItem& item, std::size_t worker) { return executor.execute(item, worker); },
        ledger);

    summary.supervisor = supervisor.run(generator);
    summary.runsGenerated = generator.generatedCount();
    summary.runsSkipped = generator.skippedCount();
    summary.succeeded = ledger.succeededCount();
    summary.failed = ledger.failedCount();

    log::info("orchestrator", "Ensemble summary: " + std::to_string(summary.succeeded) + " succeeded, " +
                                  std::to_string(summary.failed) + " failed, " +
                                  std::to_string(summary.runsSkipped) + " skipped");

    if (settings.outcomeLedger) {
        try {
            ledger.writeJson(*settings.outcomeLedger, summary.runsGenerated, summary.runsSkipped);
            log::info("orchestrator", "Outcome ledger written to " + settings.outcomeLedger->string());
        } catch (const std::exception& ex) {
            log::error("orchestrator", ex.what());
        }
    }
    return summary;
}

}  // namespace ensemble
