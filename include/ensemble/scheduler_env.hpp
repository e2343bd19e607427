// filename: scheduler_env.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ensemble {

constexpr const char* kSchedulerPrefix = "SLURM";
constexpr const char* kNodeCountVariable = "SLURM_JOB_NUM_NODES";

/**
 * @brief Read-only view of the environment the orchestrator runs in.
 */
struct SchedulerEnvironment {
    virtual ~SchedulerEnvironment() = default;
    virtual std::optional<std::string> lookup(const std::string& name) const = 0;
    virtual std::vector<std::string> names() const = 0;
};

class ProcessEnvironment : public SchedulerEnvironment {
public:
    std::optional<std::string> lookup(const std::string& name) const override;
    std::vector<std::string> names() const override;
};

class MapEnvironment : public SchedulerEnvironment {
public:
    MapEnvironment() = default;
    explicit MapEnvironment(std::map<std::string, std::string> values) : values_(std::move(values)) {}

    void set(const std::string& name, const std::string& value) { values_[name] = value; }

    std::optional<std::string> lookup(const std::string& name) const override;
    std::vector<std::string> names() const override;

private:
    std::map<std::string, std::string> values_;
};

/// True when any variable in the scheduler's namespace is present.
bool hasClusterScheduler(const SchedulerEnvironment& env);

/// Allocated node count; 1 when the scheduler does not report one.
std::size_t resolveNodeCount(const SchedulerEnvironment& env);

std::size_t visibleCpuCount();

/**
 * @brief Resolve a program the way execvp would, using the PATH of @p env.
 *
 * Names containing a slash are checked directly.
 */
std::optional<std::filesystem::path> findExecutable(const std::string& program,
                                                    const SchedulerEnvironment& env);

}  // namespace ensemble
