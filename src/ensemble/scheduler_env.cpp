// filename: scheduler_env.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/scheduler_env.hpp"

#include "ensemble/errors.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace ensemble {

namespace {

bool isExecutableFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

}  // namespace

std::optional<std::string> ProcessEnvironment::lookup(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::vector<std::string> ProcessEnvironment::names() const {
    std::vector<std::string> result;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string text(*entry);
        const std::size_t eq = text.find('=');
        result.push_back(text.substr(0, eq));
    }
    return result;
}

std::optional<std::string> MapEnvironment::lookup(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> MapEnvironment::names() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& entry : values_) {
        result.push_back(entry.first);
    }
    return result;
}

bool hasClusterScheduler(const SchedulerEnvironment& env) {
    const std::string prefix(kSchedulerPrefix);
    for (const auto& name : env.names()) {
        if (name.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

std::size_t resolveNodeCount(const SchedulerEnvironment& env) {
    const auto value = env.lookup(kNodeCountVariable);
    if (!value || value->empty()) {
        return 1;
    }

    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(*value, &consumed);
    } catch (const std::exception&) {
        throw ConfigValidationError(std::string(kNodeCountVariable) + " is not an integer: " + *value);
    }
    if (consumed != value->size()) {
        throw ConfigValidationError(std::string(kNodeCountVariable) + " is not an integer: " + *value);
    }
    if (parsed < 1) {
        throw ConfigValidationError(std::string(kNodeCountVariable) + " must be at least 1");
    }
    return static_cast<std::size_t>(parsed);
}

std::size_t visibleCpuCount() {
    const unsigned int hw = std::thread::hardware_concurrency();
    return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

std::optional<std::filesystem::path> findExecutable(const std::string& program,
                                                    const SchedulerEnvironment& env) {
    if (program.empty()) {
        return std::nullopt;
    }
    if (program.find('/') != std::string::npos) {
        const std::filesystem::path path(program);
        if (isExecutableFile(path)) {
            return std::filesystem::absolute(path);
        }
        return std::nullopt;
    }

    const auto searchPath = env.lookup("PATH");
    if (!searchPath) {
        return std::nullopt;
    }
    std::stringstream ss(*searchPath);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        const std::filesystem::path candidate =
            (dir.empty() ? std::filesystem::path(".") : std::filesystem::path(dir)) / program;
        if (isExecutableFile(candidate)) {
            return std::filesystem::absolute(candidate);
        }
    }
    return std::nullopt;
}

}  // namespace ensemble
