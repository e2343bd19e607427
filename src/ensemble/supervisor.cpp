// filename: supervisor.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/supervisor.hpp"

#include "ensemble/log.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>

namespace ensemble {

namespace {

constexpr const char* kCategory = "orchestrator";

}  // namespace

const char* toString(WorkerState state) {
    switch (state) {
        case WorkerState::Idle: return "idle";
        case WorkerState::Running: return "running";
        case WorkerState::Terminated: return "terminated";
    }
    return "unknown";
}

WorkerPoolSupervisor::WorkerPoolSupervisor(std::size_t workerCount, RunHandler handler,
                                           OutcomeLedger& ledger)
    : workerCount_(workerCount), handler_(std::move(handler)), ledger_(ledger),
      states_(workerCount) {
    if (workerCount_ == 0) {
        throw std::invalid_argument("WorkerPoolSupervisor: worker count must be positive");
    }
    if (!handler_) {
        throw std::invalid_argument("WorkerPoolSupervisor: missing run handler");
    }
    for (std::size_t i = 0; i < workerCount_; ++i) {
        states_[i].store(WorkerState::Idle);
    }
}

std::vector<WorkerState> WorkerPoolSupervisor::workerStates() const {
    std::vector<WorkerState> states;
    states.reserve(workerCount_);
    for (std::size_t i = 0; i < workerCount_; ++i) {
        states.push_back(states_[i].load());
    }
    return states;
}

void WorkerPoolSupervisor::recordFault(const WorkItem& item, std::size_t index, const std::string& what) {
    log::error(kCategory, "Worker " + std::to_string(index) + " fault on " + item.directory.string() + ": " + what);
    RunOutcome outcome{};
    outcome.directory = item.directory;
    outcome.status = RunStatus::InternalFault;
    outcome.message = what;
    outcome.worker = index;
    ledger_.record(std::move(outcome));
}

void WorkerPoolSupervisor::workerLoop(std::size_t index) {
    while (true) {
        QueueMessage message = queue_.pop();
        if (std::holds_alternative<TerminationToken>(message)) {
            tokensConsumed_.fetch_add(1);
            states_[index].store(WorkerState::Terminated);
            return;
        }

        const WorkItem item = std::get<WorkItem>(std::move(message));
        states_[index].store(WorkerState::Running);
        dispatched_.fetch_add(1);
        try {
            ledger_.record(handler_(item, index));
        } catch (const std::exception& ex) {
            recordFault(item, index, ex.what());
        } catch (...) {
            recordFault(item, index, "unknown exception");
        }
        states_[index].store(WorkerState::Idle);
    }
}

SupervisorReport WorkerPoolSupervisor::run(const WorkSource& source) {
    SupervisorReport report{};
    report.workers = workerCount_;

    std::vector<std::thread> workers;
    workers.reserve(workerCount_);
    for (std::size_t i = 0; i < workerCount_; ++i) {
        workers.emplace_back([this, i]() { workerLoop(i); });
    }
    log::info(kCategory, "Started " + std::to_string(workers.size()) + " workers");

    std::exception_ptr generationError;
    try {
        while (auto item = source()) {
            queue_.push(std::move(*item));
            ++report.itemsEnqueued;
        }
        log::info(kCategory, "Orchestrator created " + std::to_string(report.itemsEnqueued) + " runs");
    } catch (...) {
        generationError = std::current_exception();
    }

    for (std::size_t i = 0; i < workerCount_; ++i) {
        queue_.push(TerminationToken{});
    }
    for (auto& worker : workers) {
        worker.join();
        ++report.workersJoined;
    }

    if (generationError) {
        std::rethrow_exception(generationError);
    }

    report.itemsDispatched = dispatched_.load();
    report.tokensConsumed = tokensConsumed_.load();
    report.finalStates = workerStates();
    return report;
}

SupervisorReport WorkerPoolSupervisor::run(RunDescriptorGenerator& generator) {
    return run([&generator]() { return generator.next(); });
}

}  // namespace ensemble
