// filename: sweep_preview.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/ensemble.hpp"

#include <cstddef>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: sweep_preview SETTINGS.json\n";
        return 1;
    }

    const ensemble::ProcessEnvironment env;
    ensemble::JobSettings settings;
    std::size_t nodeCount = 1;
    try {
        settings = ensemble::loadJobSettings(argv[1], env);
        nodeCount = ensemble::resolveNodeCount(env);
    } catch (const ensemble::ConfigValidationError& ex) {
        std::cerr << "Invalid settings: " << ex.what() << "\n";
        return 1;
    }

    const ensemble::SweepSpec& sweep = settings.sweep;
    std::size_t pending = 0;
    std::size_t existing = 0;
    try {
        for (std::size_t i = 0; i < sweep.F.count; ++i) {
            for (std::size_t j = 0; j < sweep.k.count; ++j) {
                const ensemble::GridPoint point = ensemble::gridPointAt(sweep, settings.ensembleRoot, i, j);
                const bool exists = std::filesystem::exists(point.directory);
                (exists ? existing : pending) += 1;
                std::cout << std::setw(8) << (exists ? "skip" : "run") << "  F=" << std::setw(6)
                          << ensemble::formatSweepValue(point.f) << "  k=" << std::setw(6)
                          << ensemble::formatSweepValue(point.k) << "  " << point.directory.string() << '\n';
            }
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Failed to inspect ensemble root: " << ex.what() << "\n";
        return 1;
    }

    const std::vector<std::string> command =
        ensemble::buildLaunchCommand(ensemble::visibleCpuCount(), ensemble::hasClusterScheduler(env));
    std::cout << "Launcher: " << ensemble::joinCommand(command) << ' ' << settings.gsExe << ' '
              << ensemble::kSettingsFileName << '\n';
    std::cout << "Workers: " << nodeCount << '\n';
    std::cout << pending << " run(s) pending, " << existing << " already present, "
              << sweep.pointCount() << " grid point(s) total\n";
    return 0;
}
