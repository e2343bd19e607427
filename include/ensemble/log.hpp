// filename: log.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <ostream>
#include <string>

namespace ensemble {
namespace log {

// Every line is written whole under a process-wide lock so that concurrent
// workers never interleave output.
void info(const std::string& category, const std::string& message);
void warn(const std::string& category, const std::string& message);
void error(const std::string& category, const std::string& message);

void setQuiet(bool quiet);
[[nodiscard]] bool quiet();

// Redirects output; passing nullptr restores std::cout / std::cerr.
void setStreams(std::ostream* out, std::ostream* err);

}  // namespace log
}  // namespace ensemble
