// filename: main.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/errors.hpp"
#include "ensemble/job_settings.hpp"
#include "ensemble/log.hpp"
#include "ensemble/orchestrator.hpp"
#include "ensemble/scheduler_env.hpp"

#include <exception>
#include <iostream>

namespace {

void printUsage() {
    std::cerr << "Usage: gs_ensemble SETTINGS.json\n"
                 "  SETTINGS.json names gs_exe, gs_json, adios2_xml and ensemble_root.\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        printUsage();
        return 1;
    }

    const ensemble::ProcessEnvironment env;

    ensemble::JobSettings settings;
    try {
        settings = ensemble::loadJobSettings(argv[1], env);
    } catch (const ensemble::ConfigValidationError& ex) {
        std::cerr << "Invalid settings: " << ex.what() << "\n";
        return 1;
    }
    ensemble::log::setQuiet(settings.quiet);

    try {
        ensemble::runEnsemble(settings, env);
    } catch (const std::exception& ex) {
        std::cerr << "Orchestrator failed: " << ex.what() << "\n";
        return 1;
    }

    std::cout << "DONE" << std::endl;
    return 0;
}
