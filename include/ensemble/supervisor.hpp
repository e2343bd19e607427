// filename: supervisor.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ensemble/generator.hpp"
#include "ensemble/outcome.hpp"
#include "ensemble/run_config.hpp"
#include "ensemble/work_queue.hpp"

namespace ensemble {

enum class WorkerState { Idle, Running, Terminated };

const char* toString(WorkerState state);

using RunHandler = std::function<RunOutcome(const WorkItem& item, std::size_t worker)>;
using WorkSource = std::function<std::optional<WorkItem>()>;

struct SupervisorReport {
    std::size_t workers{0};
    std::size_t itemsEnqueued{0};
    std::size_t itemsDispatched{0};
    std::size_t tokensConsumed{0};
    std::size_t workersJoined{0};
    std::vector<WorkerState> finalStates;
};

/**
 * @brief Runs one worker per allocated node against a shared work queue.
 *
 * Workers start first and block on the queue. All work is enqueued before
 * the termination tokens, one token per worker, so no worker stops while
 * work is unclaimed. run() returns only after every worker has joined.
 */
class WorkerPoolSupervisor {
public:
    WorkerPoolSupervisor(std::size_t workerCount, RunHandler handler, OutcomeLedger& ledger);

    SupervisorReport run(const WorkSource& source);
    SupervisorReport run(RunDescriptorGenerator& generator);

    [[nodiscard]] std::vector<WorkerState> workerStates() const;

private:
    void workerLoop(std::size_t index);
    void recordFault(const WorkItem& item, std::size_t index, const std::string& what);

    std::size_t workerCount_;
    RunHandler handler_;
    OutcomeLedger& ledger_;
    WorkQueue<QueueMessage> queue_;
    std::vector<std::atomic<WorkerState>> states_;
    std::atomic<std::size_t> dispatched_{0};
    std::atomic<std::size_t> tokensConsumed_{0};
};

}  // namespace ensemble
