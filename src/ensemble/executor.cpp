// filename: executor.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/executor.hpp"

#include "ensemble/errors.hpp"
#include "ensemble/launch.hpp"
#include "ensemble/log.hpp"
#include "ensemble/process.hpp"

#include <chrono>
#include <cmath>
#include <fstream>

namespace ensemble {

namespace {

constexpr const char* kCategory = "executor";

}  // namespace

RunExecutor::RunExecutor(const JobSettings& settings, const SchedulerEnvironment& env,
                         std::size_t rankCount)
    : settings_(settings), env_(env), rankCount_(rankCount) {}

std::vector<std::string> RunExecutor::runCommand() const {
    std::vector<std::string> command = buildLaunchCommand(rankCount_, hasClusterScheduler(env_));
    command.push_back(settings_.gsExe);
    command.push_back(kSettingsFileName);
    return command;
}

void RunExecutor::createRunDirectory(const std::filesystem::path& directory) const {
    const std::filesystem::path parent = directory.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    if (!std::filesystem::create_directory(directory)) {
        throw DirectoryConflict("Run directory already exists: " + directory.string());
    }
}

void RunExecutor::writeSettings(const WorkItem& item) const {
    if (!std::isfinite(item.config.F) || !std::isfinite(item.config.k)) {
        throw SerializationError("Sweep values must be finite");
    }

    std::string text;
    try {
        text = item.config.toJson().dump(4);
    } catch (const nlohmann::json::exception& ex) {
        throw SerializationError(std::string("Failed to serialise run configuration: ") + ex.what());
    }

    const std::filesystem::path path = item.directory / kSettingsFileName;
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw SerializationError("Failed to open " + path.string());
    }
    ofs << text;
    ofs.close();
    if (!ofs) {
        throw SerializationError("Failed while writing " + path.string());
    }
}

void RunExecutor::copyDescriptor(const std::filesystem::path& directory) const {
    if (!std::filesystem::is_regular_file(settings_.adios2Xml)) {
        throw ResourceUnavailable("Descriptor file is missing: " + settings_.adios2Xml.string());
    }
    std::filesystem::copy_file(settings_.adios2Xml, directory / kDescriptorFileName);
}

std::vector<std::string> RunExecutor::resolvedCommand() const {
    if (!findExecutable(settings_.gsExe, env_)) {
        throw ResourceUnavailable("Simulation executable is unavailable: " + settings_.gsExe);
    }
    std::vector<std::string> command = runCommand();
    const auto launcher = findExecutable(command.front(), env_);
    if (!launcher) {
        throw ResourceUnavailable("Launcher " + command.front() + " was not found on PATH");
    }
    command.front() = launcher->string();
    return command;
}

RunOutcome RunExecutor::execute(const WorkItem& item, std::size_t worker) const {
    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();

    RunOutcome outcome{};
    outcome.directory = item.directory;
    outcome.worker = worker;
    outcome.stdoutPath = item.directory / kStdoutFileName;
    outcome.stderrPath = item.directory / kStderrFileName;

    const auto fail = [&](RunStatus status, const std::string& message) {
        outcome.status = status;
        outcome.message = message;
        log::error(kCategory, "Run " + item.directory.string() + " failed: " + message);
    };

    try {
        createRunDirectory(item.directory);
        writeSettings(item);
        copyDescriptor(item.directory);

        const std::vector<std::string> command = resolvedCommand();
        log::info(kCategory, "Worker " + std::to_string(worker) + " launching " + item.directory.string() +
                                 " as " + joinCommand(runCommand()));

        const ProcessResult result =
            runProcess(command, item.directory, outcome.stdoutPath, outcome.stderrPath);
        outcome.exitCode = result.exitCode;
        if (result.signalled) {
            throw ExternalProcessFailure("terminated by signal " + std::to_string(result.signal),
                                         result.exitCode);
        }
        if (!result.success()) {
            throw ExternalProcessFailure("exit code " + std::to_string(result.exitCode), result.exitCode);
        }
    } catch (const DirectoryConflict& ex) {
        fail(RunStatus::DirectoryConflict, ex.what());
    } catch (const SerializationError& ex) {
        fail(RunStatus::SerializationError, ex.what());
    } catch (const ResourceUnavailable& ex) {
        fail(RunStatus::ResourceUnavailable, ex.what());
    } catch (const ExternalProcessFailure& ex) {
        outcome.exitCode = ex.exit_code();
        fail(RunStatus::ExternalProcessFailure, ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        fail(RunStatus::ResourceUnavailable, ex.what());
    }

    outcome.elapsedSeconds = std::chrono::duration<double>(Clock::now() - start).count();
    return outcome;
}

}  // namespace ensemble
