// filename: log.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace ensemble {
namespace log {

namespace {

std::mutex& streamMutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<bool> quietFlag{false};
std::ostream* outStream = nullptr;
std::ostream* errStream = nullptr;

enum class Channel { Out, Err };

void writeLine(Channel channel, const char* level, const std::string& category, const std::string& message) {
    std::lock_guard<std::mutex> lock(streamMutex());
    // Redirection may change concurrently, so the target is resolved under the lock.
    std::ostream* target = channel == Channel::Out ? outStream : errStream;
    std::ostream& os = target ? *target : (channel == Channel::Out ? std::cout : std::cerr);
    os << '[' << category << ']';
    if (level != nullptr) {
        os << ' ' << level;
    }
    os << ' ' << message << '\n';
    os.flush();
}

}  // namespace

void info(const std::string& category, const std::string& message) {
    if (quietFlag.load()) {
        return;
    }
    writeLine(Channel::Out, nullptr, category, message);
}

void warn(const std::string& category, const std::string& message) {
    writeLine(Channel::Err, "warning:", category, message);
}

void error(const std::string& category, const std::string& message) {
    writeLine(Channel::Err, "error:", category, message);
}

void setQuiet(bool quiet) {
    quietFlag.store(quiet);
}

bool quiet() {
    return quietFlag.load();
}

void setStreams(std::ostream* out, std::ostream* err) {
    std::lock_guard<std::mutex> lock(streamMutex());
    outStream = out;
    errStream = err;
}

}  // namespace log
}  // namespace ensemble
