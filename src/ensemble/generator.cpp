// filename: generator.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/generator.hpp"

#include "ensemble/log.hpp"

#include <utility>

namespace ensemble {

RunDescriptorGenerator::RunDescriptorGenerator(RunConfig runTemplate, SweepSpec spec,
                                               std::filesystem::path ensembleRoot)
    : template_(std::move(runTemplate)), spec_(spec), root_(std::move(ensembleRoot)) {}

bool RunDescriptorGenerator::exhausted() const {
    return spec_.k.count == 0 || fIndex_ >= spec_.F.count;
}

std::optional<WorkItem> RunDescriptorGenerator::next() {
    while (!exhausted()) {
        const GridPoint point = gridPointAt(spec_, root_, fIndex_, kIndex_);
        if (++kIndex_ >= spec_.k.count) {
            kIndex_ = 0;
            ++fIndex_;
        }

        if (std::filesystem::exists(point.directory)) {
            log::info("orchestrator", "Skipping " + point.directory.string() + " as it already exists");
            ++skipped_;
            continue;
        }

        ++generated_;
        return WorkItem{point.directory, template_.withSweepValues(point.f, point.k)};
    }
    return std::nullopt;
}

std::vector<WorkItem> generateRuns(const RunConfig& runTemplate, const SweepSpec& spec,
                                   const std::filesystem::path& ensembleRoot) {
    RunDescriptorGenerator generator(runTemplate, spec, ensembleRoot);
    std::vector<WorkItem> items;
    while (auto item = generator.next()) {
        items.push_back(std::move(*item));
    }
    return items;
}

}  // namespace ensemble
