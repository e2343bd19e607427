// filename: ensemble.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include "errors.hpp"
#include "executor.hpp"
#include "generator.hpp"
#include "job_settings.hpp"
#include "launch.hpp"
#include "orchestrator.hpp"
#include "supervisor.hpp"
#include "work_queue.hpp"
