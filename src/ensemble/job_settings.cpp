// filename: job_settings.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/job_settings.hpp"

#include "ensemble/errors.hpp"
#include "ensemble/run_config.hpp"

#include <cmath>
#include <fstream>
#include <string>
#include <vector>

namespace ensemble {

namespace {

const std::vector<std::string>& requiredKeys() {
    static const std::vector<std::string> keys = {"gs_exe", "gs_json", "adios2_xml", "ensemble_root"};
    return keys;
}

std::string requireString(const nlohmann::json& json, const std::string& key) {
    const auto& node = json.at(key);
    if (!node.is_string()) {
        throw ConfigValidationError("Settings key " + key + " must be a string");
    }
    const std::string value = node.get<std::string>();
    if (value.empty()) {
        throw ConfigValidationError("Settings key " + key + " must be a non-empty string");
    }
    return value;
}

std::filesystem::path requireExistingPath(const nlohmann::json& json, const std::string& key) {
    const std::filesystem::path path(requireString(json, key));
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw ConfigValidationError("Path for " + key + " does not exist: " + path.string());
    }
    return std::filesystem::absolute(path);
}

double requireFinite(const nlohmann::json& node, const std::string& field) {
    if (!node.is_number()) {
        throw ConfigValidationError(field + " must be a number");
    }
    const double value = node.get<double>();
    if (!std::isfinite(value)) {
        throw ConfigValidationError(field + " must be finite");
    }
    return value;
}

void parseAxis(const nlohmann::json& sweep, const std::string& name, SweepAxis& axis) {
    if (!sweep.contains(name)) {
        return;
    }
    const auto& node = sweep.at(name);
    if (!node.is_object()) {
        throw ConfigValidationError("sweep." + name + " must be an object");
    }
    const std::string prefix = "sweep." + name + ".";
    if (node.contains("base")) {
        axis.base = requireFinite(node.at("base"), prefix + "base");
    }
    if (node.contains("step")) {
        axis.step = requireFinite(node.at("step"), prefix + "step");
    }
    if (node.contains("count")) {
        const auto& count = node.at("count");
        if (!count.is_number_integer() || count.get<long long>() < 0) {
            throw ConfigValidationError(prefix + "count must be a non-negative integer");
        }
        axis.count = count.get<std::size_t>();
    }
}

}  // namespace

JobSettings parseJobSettings(const nlohmann::json& json, const SchedulerEnvironment& env) {
    if (!json.is_object()) {
        throw ConfigValidationError("Settings must be a JSON object");
    }
    for (const auto& key : requiredKeys()) {
        if (!json.contains(key)) {
            throw ConfigValidationError("Settings are missing required key: " + key);
        }
    }

    JobSettings settings{};

    const std::string exe = requireString(json, "gs_exe");
    std::error_code ec;
    if (std::filesystem::exists(exe, ec)) {
        settings.gsExe = std::filesystem::absolute(exe).string();
    } else if (exe.find('/') == std::string::npos && findExecutable(exe, env)) {
        settings.gsExe = exe;
    } else {
        throw ConfigValidationError("Path for gs_exe does not exist: " + exe);
    }

    settings.gsJson = requireExistingPath(json, "gs_json");
    settings.adios2Xml = requireExistingPath(json, "adios2_xml");
    settings.ensembleRoot = requireExistingPath(json, "ensemble_root");
    if (!std::filesystem::is_directory(settings.ensembleRoot, ec)) {
        throw ConfigValidationError("ensemble_root is not a directory: " + settings.ensembleRoot.string());
    }

    if (json.contains("sweep")) {
        const auto& sweep = json.at("sweep");
        if (!sweep.is_object()) {
            throw ConfigValidationError("sweep must be an object");
        }
        parseAxis(sweep, RunConfig::kFeedKey, settings.sweep.F);
        parseAxis(sweep, RunConfig::kKillKey, settings.sweep.k);
    }

    if (json.contains("outcome_ledger")) {
        const std::filesystem::path ledger = std::filesystem::absolute(requireString(json, "outcome_ledger"));
        if (!std::filesystem::is_directory(ledger.parent_path(), ec)) {
            throw ConfigValidationError("Directory for outcome_ledger does not exist: " +
                                        ledger.parent_path().string());
        }
        settings.outcomeLedger = ledger;
    }

    if (json.contains("quiet")) {
        const auto& quiet = json.at("quiet");
        if (!quiet.is_boolean()) {
            throw ConfigValidationError("quiet must be a boolean");
        }
        settings.quiet = quiet.get<bool>();
    }

    return settings;
}

JobSettings loadJobSettings(const std::filesystem::path& path, const SchedulerEnvironment& env) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigValidationError("Failed to open settings file: " + path.string());
    }

    nlohmann::json json;
    try {
        input >> json;
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigValidationError("Settings file " + path.string() + " is not valid JSON: " + ex.what());
    }
    return parseJobSettings(json, env);
}

}  // namespace ensemble
