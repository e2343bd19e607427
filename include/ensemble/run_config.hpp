// filename: run_config.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <filesystem>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace ensemble {

/**
 * @brief Parameter set of a single simulation run.
 *
 * The two sweep keys are typed fields. Every other template key is carried in
 * @c passthrough in its original order and is written back unchanged.
 */
struct RunConfig {
    static constexpr const char* kFeedKey = "F";
    static constexpr const char* kKillKey = "k";

    double F{0.0};
    double k{0.0};
    nlohmann::ordered_json passthrough = nlohmann::ordered_json::object();

    /// Template keys with F and k overwritten in place (appended when absent).
    [[nodiscard]] nlohmann::ordered_json toJson() const;

    [[nodiscard]] RunConfig withSweepValues(double f, double kValue) const;
};

/// Throws ConfigValidationError when the file is unreadable or not a JSON object.
RunConfig loadRunTemplate(const std::filesystem::path& path);

RunConfig runConfigFromJson(const nlohmann::ordered_json& json);

struct WorkItem {
    std::filesystem::path directory;
    RunConfig config;
};

struct TerminationToken {};

using QueueMessage = std::variant<WorkItem, TerminationToken>;

}  // namespace ensemble
