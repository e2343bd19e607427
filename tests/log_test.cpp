#include "ensemble/log.hpp"

#include <atomic>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

// Returns the number of lines, or -1 if any line is not a whole log record.
long countRecords(const std::string& text, const std::string& suffix) {
    std::istringstream lines(text);
    std::string line;
    long count = 0;
    while (std::getline(lines, line)) {
        if (line.rfind("[worker] ", 0) != 0 || line.size() < suffix.size() ||
            line.compare(line.size() - suffix.size(), suffix.size(), suffix) != 0) {
            return -1;
        }
        ++count;
    }
    return count;
}

}  // namespace

int main() {
    using namespace ensemble;

    std::ostringstream out;
    std::ostringstream err;
    log::setStreams(&out, &err);
    log::info("worker", "Started 2 workers");
    log::warn("worker", "retrying");
    log::error("worker", "failed");
    log::setStreams(nullptr, nullptr);
    if (out.str() != "[worker] Started 2 workers\n" ||
        err.str() != "[worker] warning: retrying\n[worker] error: failed\n") {
        std::cerr << "log_test: unexpected record format\n" << out.str() << err.str();
        return 1;
    }

    log::setQuiet(true);
    std::ostringstream silenced;
    log::setStreams(&silenced, nullptr);
    log::info("worker", "hidden");
    log::setStreams(nullptr, nullptr);
    log::setQuiet(false);
    if (!silenced.str().empty()) {
        std::cerr << "log_test: quiet mode should drop info records\n";
        return 1;
    }

    // Writers on several threads while the main thread keeps switching targets.
    constexpr std::size_t kThreads = 4;
    constexpr std::size_t kPerThread = 500;
    std::ostringstream outA;
    std::ostringstream outB;
    std::ostringstream errA;
    std::ostringstream errB;
    log::setStreams(&outA, &errA);

    std::atomic<std::size_t> finished{0};
    std::vector<std::thread> writers;
    for (std::size_t t = 0; t < kThreads; ++t) {
        writers.emplace_back([t, &finished]() {
            for (std::size_t i = 0; i < kPerThread; ++i) {
                log::info("worker", "run " + std::to_string(t) + "-" + std::to_string(i) + " done");
                log::error("worker", "run " + std::to_string(t) + "-" + std::to_string(i) + " done");
            }
            finished.fetch_add(1);
        });
    }
    bool useA = false;
    while (finished.load() < kThreads) {
        if (useA) {
            log::setStreams(&outA, &errA);
        } else {
            log::setStreams(&outB, &errB);
        }
        useA = !useA;
        std::this_thread::yield();
    }
    for (auto& writer : writers) {
        writer.join();
    }
    log::setStreams(nullptr, nullptr);

    const long infoA = countRecords(outA.str(), " done");
    const long infoB = countRecords(outB.str(), " done");
    const long errorA = countRecords(errA.str(), " done");
    const long errorB = countRecords(errB.str(), " done");
    if (infoA < 0 || infoB < 0 || errorA < 0 || errorB < 0) {
        std::cerr << "log_test: interleaved or truncated record under concurrent redirection\n";
        return 1;
    }
    const long expected = static_cast<long>(kThreads * kPerThread);
    if (infoA + infoB != expected || errorA + errorB != expected) {
        std::cerr << "log_test: expected " << expected << " records per channel, got " << infoA + infoB << " and "
                  << errorA + errorB << '\n';
        return 1;
    }

    return 0;
}
