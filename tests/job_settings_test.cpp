#include "ensemble/errors.hpp"
#include "ensemble/job_settings.hpp"
#include "ensemble/run_config.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

bool expectRejected(const std::string& label, const nlohmann::json& json, const ensemble::SchedulerEnvironment& env) {
    try {
        (void)ensemble::parseJobSettings(json, env);
    } catch (const ensemble::ConfigValidationError&) {
        return true;
    }
    std::cerr << "job_settings_test: " << label << " should be rejected\n";
    return false;
}

}  // namespace

int main() {
    using namespace ensemble;
    namespace fs = std::filesystem;

    const fs::path dir = testsupport::scratchDir("settings");
    const fs::path bin = dir / "bin";
    fs::create_directories(bin);
    fs::create_directories(dir / "ensemble");
    testsupport::writeScript(dir / "gray-scott", "exit 0\n");
    testsupport::writeScript(bin / "gs_on_path", "exit 0\n");
    testsupport::writeText(dir / "settings.json", R"({"L": 64, "F": 0.02, "k": 0.048})");
    testsupport::writeText(dir / "adios2.xml", "<adios-config/>\n");

    const MapEnvironment env = testsupport::environmentWithPath(bin);

    const nlohmann::json valid = {
        {"gs_exe", (dir / "gray-scott").string()},
        {"gs_json", (dir / "settings.json").string()},
        {"adios2_xml", (dir / "adios2.xml").string()},
        {"ensemble_root", (dir / "ensemble").string()},
    };

    const JobSettings settings = parseJobSettings(valid, env);
    if (settings.gsExe != fs::absolute(dir / "gray-scott").string() || settings.sweep.F.count != 10 ||
        settings.sweep.k.count != 10 || settings.sweep.F.base != 0.01 || settings.sweep.k.step != 0.05 ||
        settings.outcomeLedger.has_value() || settings.quiet) {
        std::cerr << "job_settings_test: defaults were not applied\n";
        return 1;
    }

    for (const char* key : {"gs_exe", "gs_json", "adios2_xml", "ensemble_root"}) {
        nlohmann::json missing = valid;
        missing.erase(key);
        if (!expectRejected(std::string("missing ") + key, missing, env)) {
            return 1;
        }
        nlohmann::json badPath = valid;
        badPath[key] = (dir / "does-not-exist").string();
        if (!expectRejected(std::string("nonexistent ") + key, badPath, env)) {
            return 1;
        }
    }

    nlohmann::json onPath = valid;
    onPath["gs_exe"] = "gs_on_path";
    if (parseJobSettings(onPath, env).gsExe != "gs_on_path") {
        std::cerr << "job_settings_test: commands on PATH should be accepted as-is\n";
        return 1;
    }
    onPath["gs_exe"] = "gs_not_anywhere";
    if (!expectRejected("unknown command", onPath, env)) {
        return 1;
    }

    nlohmann::json notDirectory = valid;
    notDirectory["ensemble_root"] = (dir / "adios2.xml").string();
    if (!expectRejected("file as ensemble root", notDirectory, env)) {
        return 1;
    }

    nlohmann::json sweep = valid;
    sweep["sweep"] = {{"F", {{"base", 0.02}, {"step", 0.005}, {"count", 4}}}, {"k", {{"count", 3}}}};
    sweep["quiet"] = true;
    sweep["outcome_ledger"] = (dir / "outcomes.json").string();
    const JobSettings custom = parseJobSettings(sweep, env);
    if (custom.sweep.F.base != 0.02 || custom.sweep.F.step != 0.005 || custom.sweep.F.count != 4 ||
        custom.sweep.k.base != 0.05 || custom.sweep.k.count != 3 || !custom.quiet ||
        !custom.outcomeLedger || *custom.outcomeLedger != fs::absolute(dir / "outcomes.json")) {
        std::cerr << "job_settings_test: sweep overrides were not applied\n";
        return 1;
    }

    nlohmann::json negative = valid;
    negative["sweep"] = {{"k", {{"count", -1}}}};
    nlohmann::json textual = valid;
    textual["sweep"] = {{"F", {{"base", "0.01"}}}};
    nlohmann::json badLedger = valid;
    badLedger["outcome_ledger"] = (dir / "missing" / "outcomes.json").string();
    nlohmann::json badQuiet = valid;
    badQuiet["quiet"] = "yes";
    if (!expectRejected("negative count", negative, env) || !expectRejected("string base", textual, env) ||
        !expectRejected("ledger in missing directory", badLedger, env) ||
        !expectRejected("non-boolean quiet", badQuiet, env) ||
        !expectRejected("non-object settings", nlohmann::json::array(), env)) {
        return 1;
    }

    testsupport::writeText(dir / "orchestrator.json", valid.dump(2));
    if (loadJobSettings(dir / "orchestrator.json", env).adios2Xml != fs::absolute(dir / "adios2.xml")) {
        std::cerr << "job_settings_test: loading from file failed\n";
        return 1;
    }
    testsupport::writeText(dir / "broken.json", "{\"gs_exe\": ");
    try {
        (void)loadJobSettings(dir / "broken.json", env);
        std::cerr << "job_settings_test: malformed settings should be rejected\n";
        return 1;
    } catch (const ConfigValidationError&) {
    }

    // The shipped example resolves against the source tree; echo stands in for the simulation.
    {
        const JobSettings example = loadJobSettings("inputs/example/orchestrator.json", env);
        if (example.gsExe != "echo" || !fs::is_directory(example.ensembleRoot) ||
            example.outcomeLedger != fs::absolute("inputs/example/ensemble/outcomes.json") ||
            example.sweep.F.count != 10 || example.sweep.k.count != 10) {
            std::cerr << "job_settings_test: example settings did not load as shipped\n";
            return 1;
        }
        const RunConfig exampleTemplate = loadRunTemplate(example.gsJson);
        if (exampleTemplate.passthrough.empty()) {
            std::cerr << "job_settings_test: example simulation settings are empty\n";
            return 1;
        }
    }

    const RunConfig runTemplate = loadRunTemplate(dir / "settings.json");
    if (runTemplate.F != 0.02 || runTemplate.k != 0.048 || runTemplate.passthrough.at("L").get<int>() != 64) {
        std::cerr << "job_settings_test: template values were not read\n";
        return 1;
    }
    testsupport::writeText(dir / "array.json", "[1, 2]");
    try {
        (void)loadRunTemplate(dir / "array.json");
        std::cerr << "job_settings_test: non-object template should be rejected\n";
        return 1;
    } catch (const ConfigValidationError&) {
    }

    fs::remove_all(dir);
    return 0;
}
