// filename: run_config.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/run_config.hpp"

#include "ensemble/errors.hpp"

#include <fstream>

namespace ensemble {

namespace {

double optionalNumber(const nlohmann::ordered_json& json, const char* key) {
    const auto it = json.find(key);
    if (it == json.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

}  // namespace

nlohmann::ordered_json RunConfig::toJson() const {
    nlohmann::ordered_json json = passthrough.is_object() ? passthrough : nlohmann::ordered_json::object();
    json[kFeedKey] = F;
    json[kKillKey] = k;
    return json;
}

RunConfig RunConfig::withSweepValues(double f, double kValue) const {
    RunConfig copy = *this;
    copy.F = f;
    copy.k = kValue;
    return copy;
}

RunConfig runConfigFromJson(const nlohmann::ordered_json& json) {
    if (!json.is_object()) {
        throw ConfigValidationError("Parameter template must be a JSON object");
    }
    RunConfig config{};
    config.passthrough = json;
    config.F = optionalNumber(json, RunConfig::kFeedKey);
    config.k = optionalNumber(json, RunConfig::kKillKey);
    return config;
}

RunConfig loadRunTemplate(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigValidationError("Failed to open parameter template: " + path.string());
    }

    nlohmann::ordered_json json;
    try {
        input >> json;
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigValidationError("Parameter template " + path.string() + " is not valid JSON: " + ex.what());
    }
    return runConfigFromJson(json);
}

}  // namespace ensemble
